#include <strata/query/scalar.hpp>

#include <type_traits>

namespace strata {

namespace {

using namespace encoding;

auto page_belongs_to(const EncodedPage& page, ColumnType type) noexcept -> bool {
    switch (type) {
        case ColumnType::Number:
            return std::holds_alternative<FloatPage>(page);
        case ColumnType::String:
            return std::holds_alternative<DictPage>(page);
        case ColumnType::Boolean:
            return std::holds_alternative<BoolPage>(page);
        case ColumnType::DateTime:
        case ColumnType::Currency:
        case ColumnType::Percentage:
            return std::holds_alternative<IntPage>(page);
    }
    return false;
}

auto int_value(const IntPage& page, std::uint64_t offset) noexcept -> std::int64_t {
    return static_cast<std::int64_t>(static_cast<std::uint64_t>(page.min) + offset);
}

}  // namespace

auto scalar_as_f64(const Scalar& scalar) noexcept -> std::optional<double> {
    if (const auto* f = std::get_if<double>(&scalar)) {
        return *f;
    }
    if (const auto* i = std::get_if<std::int64_t>(&scalar)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

auto PageCursor::open(std::size_t col, ColumnType type, const EncodedPage& page)
    -> QueryResult<PageCursor> {
    if (!page_belongs_to(page, type)) {
        return std::unexpected(QueryError::unsupported_column_type(col, type, "page decode"));
    }
    const auto& validity = page_validity(page);
    const Bitmap* bits = validity ? &*validity : nullptr;
    State state = std::visit(
        [](const auto& p) -> State {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, IntPage>) {
                return IntState{.page = &p, .offsets = SequenceCursor<std::uint64_t>(p.offsets)};
            } else if constexpr (std::is_same_v<T, FloatPage>) {
                return FloatState{.page = &p};
            } else if constexpr (std::is_same_v<T, BoolPage>) {
                return BoolState{.page = &p};
            } else {
                return DictState{.page = &p, .indices = SequenceCursor<std::uint32_t>(p.indices)};
            }
        },
        page);
    return PageCursor(state, bits, page_len(page));
}

auto PageCursor::next() noexcept -> Scalar {
    const std::size_t row = pos_++;
    // Sequence cursors advance on every row, null or not.
    Scalar out = std::visit(
        [row](auto& s) -> Scalar {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, IntState>) {
                return int_value(*s.page, s.offsets.next());
            } else if constexpr (std::is_same_v<T, FloatState>) {
                return s.page->values[row];
            } else if constexpr (std::is_same_v<T, BoolState>) {
                return bool_bit(s.page->data, row);
            } else {
                return DictIndex{s.indices.next()};
            }
        },
        state_);
    if (validity_ != nullptr && !validity_->get(row)) {
        return std::monostate{};
    }
    return out;
}

auto scalar_at(std::size_t col, ColumnType type, const EncodedPage& page, std::size_t idx)
    -> QueryResult<Scalar> {
    if (!page_belongs_to(page, type)) {
        return std::unexpected(QueryError::unsupported_column_type(col, type, "page decode"));
    }
    if (idx >= page_len(page)) {
        return std::unexpected(QueryError::row_out_of_bounds(idx, page_len(page)));
    }
    const auto& validity = page_validity(page);
    if (validity && !validity->get(idx)) {
        return Scalar{};
    }
    return std::visit(
        [idx](const auto& p) -> Scalar {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, IntPage>) {
                return int_value(p, sequence_at(p.offsets, idx));
            } else if constexpr (std::is_same_v<T, FloatPage>) {
                return p.values[idx];
            } else if constexpr (std::is_same_v<T, BoolPage>) {
                return bool_bit(p.data, idx);
            } else {
                return DictIndex{sequence_at(p.indices, idx)};
            }
        },
        page);
}

}  // namespace strata
