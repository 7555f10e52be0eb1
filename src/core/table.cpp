#include <strata/core/table.hpp>

#include <fmt/format.h>
#include <robin_hood.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace strata {

namespace {

using namespace encoding;

/// Validity of the page being filled.
class PageValidity {
   public:
    void push(bool valid) {
        bits_.push(valid);
        has_null_ = has_null_ || !valid;
    }

    /// Hand out the finished page's bitmap, omitted when every row is valid.
    auto take() -> std::optional<Bitmap> {
        std::optional<Bitmap> out;
        if (has_null_) {
            out = std::move(bits_);
        }
        bits_ = Bitmap{};
        has_null_ = false;
        return out;
    }

   private:
    Bitmap bits_;
    bool has_null_ = false;
};

struct IntColumnBuilder {
    ColumnType type;
    std::vector<std::int64_t> values;
    PageValidity validity;
    std::uint64_t nulls = 0;
    std::optional<std::int64_t> min;
    std::optional<std::int64_t> max;
    double sum = 0.0;
    robin_hood::unordered_flat_set<std::int64_t> distinct;

    void append(const Value& value) {
        const bool valid = !is_null(value) && value_type(value) == type;
        validity.push(valid);
        if (!valid) {
            ++nulls;
            values.push_back(0);
            return;
        }
        const std::int64_t raw = integer_payload(value);
        values.push_back(raw);
        min = min ? std::min(*min, raw) : raw;
        max = max ? std::max(*max, raw) : raw;
        sum += static_cast<double>(raw);
        distinct.insert(raw);
    }

    auto flush() -> EncodedPage {
        IntPage page;
        page.len = values.size();
        std::optional<std::int64_t> page_min;
        auto bits = validity.take();
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (!bits || bits->get(i)) {
                page_min = page_min ? std::min(*page_min, values[i]) : values[i];
            }
        }
        page.min = page_min.value_or(0);
        std::vector<std::uint64_t> offsets;
        offsets.reserve(values.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            const bool valid = !bits || bits->get(i);
            offsets.push_back(valid ? static_cast<std::uint64_t>(values[i]) -
                                          static_cast<std::uint64_t>(page.min)
                                    : 0);
        }
        page.offsets = encode_sequence<std::uint64_t>(offsets);
        page.validity = std::move(bits);
        values.clear();
        return page;
    }

    auto stats() const -> ColumnStats {
        ColumnStats out{.null_count = nulls, .distinct_count = distinct.size()};
        if (min) {
            out.min = make_integer_value(type, *min);
            out.max = make_integer_value(type, *max);
            out.sum = sum;
        }
        return out;
    }
};

struct FloatColumnBuilder {
    std::vector<double> values;
    PageValidity validity;
    std::uint64_t nulls = 0;
    std::uint64_t non_null = 0;
    std::optional<double> min;
    std::optional<double> max;
    double sum = 0.0;
    robin_hood::unordered_flat_set<std::uint64_t> distinct;

    void append(const Value& value) {
        const auto* number = std::get_if<double>(&value);
        validity.push(number != nullptr);
        if (number == nullptr) {
            ++nulls;
            values.push_back(0.0);
            return;
        }
        const double v = *number;
        values.push_back(v);
        ++non_null;
        sum += v;
        distinct.insert(canonical_f64_bits(v));
        if (!std::isnan(v)) {
            min = min ? std::min(*min, v) : v;
            max = max ? std::max(*max, v) : v;
        }
    }

    auto flush() -> EncodedPage {
        FloatPage page{.values = std::move(values), .validity = validity.take()};
        values = {};
        return page;
    }

    auto stats() const -> ColumnStats {
        ColumnStats out{.null_count = nulls, .distinct_count = distinct.size()};
        if (min) {
            out.min = *min;
            out.max = *max;
        }
        if (non_null > 0) {
            out.sum = sum;
        }
        return out;
    }
};

struct BoolColumnBuilder {
    std::vector<std::uint8_t> data;
    std::size_t len = 0;
    PageValidity validity;
    std::uint64_t nulls = 0;
    std::uint64_t trues = 0;
    std::uint64_t falses = 0;

    void append(const Value& value) {
        const auto* flag = std::get_if<bool>(&value);
        validity.push(flag != nullptr);
        if ((len & 7) == 0) {
            data.push_back(0);
        }
        if (flag == nullptr) {
            ++nulls;
        } else if (*flag) {
            data.back() |= static_cast<std::uint8_t>(1U << (len & 7));
            ++trues;
        } else {
            ++falses;
        }
        ++len;
    }

    auto flush() -> EncodedPage {
        BoolPage page{.len = len, .data = std::move(data), .validity = validity.take()};
        data = {};
        len = 0;
        return page;
    }

    auto stats() const -> ColumnStats {
        ColumnStats out{
            .null_count = nulls,
            .distinct_count = static_cast<std::uint64_t>((trues > 0 ? 1 : 0) + (falses > 0 ? 1 : 0)),
            .sum = static_cast<double>(trues),
        };
        if (trues + falses > 0) {
            out.min = falses == 0;
            out.max = trues > 0;
        }
        return out;
    }
};

struct DictColumnBuilder {
    std::shared_ptr<Dictionary> dictionary = std::make_shared<Dictionary>();
    robin_hood::unordered_flat_map<std::string, std::uint32_t> lookup;
    std::vector<std::uint32_t> indices;
    PageValidity validity;
    std::uint64_t nulls = 0;
    std::optional<std::string> min;
    std::optional<std::string> max;

    void append(const Value& value) {
        const auto* text = std::get_if<std::string>(&value);
        validity.push(text != nullptr);
        if (text == nullptr) {
            ++nulls;
            indices.push_back(0);
            return;
        }
        auto [it, inserted] =
            lookup.try_emplace(*text, static_cast<std::uint32_t>(dictionary->size()));
        if (inserted) {
            dictionary->push_back(*text);
            if (!min || *text < *min) {
                min = *text;
            }
            if (!max || *text > *max) {
                max = *text;
            }
        }
        indices.push_back(it->second);
    }

    auto flush() -> EncodedPage {
        DictPage page{.len = indices.size(),
                      .indices = encode_sequence<std::uint32_t>(indices),
                      .validity = validity.take()};
        indices.clear();
        return page;
    }

    auto stats() const -> ColumnStats {
        ColumnStats out{.null_count = nulls, .distinct_count = dictionary->size()};
        if (min) {
            out.min = *min;
            out.max = *max;
        }
        return out;
    }
};

using ColumnBuilder =
    std::variant<IntColumnBuilder, FloatColumnBuilder, BoolColumnBuilder, DictColumnBuilder>;

auto make_column_builder(ColumnType type) -> ColumnBuilder {
    switch (type) {
        case ColumnType::Number:
            return FloatColumnBuilder{};
        case ColumnType::String:
            return DictColumnBuilder{};
        case ColumnType::Boolean:
            return BoolColumnBuilder{};
        case ColumnType::DateTime:
        case ColumnType::Currency:
        case ColumnType::Percentage:
            break;
    }
    return IntColumnBuilder{.type = type};
}

auto page_matches_type(const EncodedPage& page, ColumnType type) -> bool {
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

/// Every row of `len` must be readable from `seq`.
template <typename T>
auto check_sequence(const Sequence<T>& seq, std::size_t len) -> std::expected<void, std::string> {
    if (const auto* packed = std::get_if<BitPacked<T>>(&seq)) {
        if (packed->bit_width > sizeof(T) * 8) {
            return std::unexpected(fmt::format("bit width {} exceeds {} bits",
                                               packed->bit_width, sizeof(T) * 8));
        }
        if (packed->len != len) {
            return std::unexpected(
                fmt::format("packs {} values for {} rows", packed->len, len));
        }
        if (packed->data.size() < (len * packed->bit_width + 7) / 8) {
            return std::unexpected(fmt::format("has {} packed bytes for {} rows of {} bits",
                                               packed->data.size(), len, packed->bit_width));
        }
        return {};
    }
    const auto& rle = std::get<RunLength<T>>(seq);
    if (rle.values.size() != rle.ends.size()) {
        return std::unexpected(fmt::format("has {} run values and {} run ends",
                                           rle.values.size(), rle.ends.size()));
    }
    std::uint32_t start = 0;
    for (const auto end : rle.ends) {
        if (end <= start) {
            return std::unexpected("run ends must be strictly increasing");
        }
        start = end;
    }
    if (sequence_len(seq) != len) {
        return std::unexpected(
            fmt::format("runs cover {} rows, page has {}", sequence_len(seq), len));
    }
    return {};
}

/// Payload size and dictionary indices of a page whose kind and validity
/// already check out.
auto check_payload(const EncodedPage& page, std::size_t len, const Dictionary* dictionary)
    -> std::expected<void, std::string> {
    return std::visit(
        [&](const auto& p) -> std::expected<void, std::string> {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, IntPage>) {
                return check_sequence(p.offsets, len);
            } else if constexpr (std::is_same_v<T, FloatPage>) {
                return {};
            } else if constexpr (std::is_same_v<T, BoolPage>) {
                if (p.data.size() < (len + 7) / 8) {
                    return std::unexpected(
                        fmt::format("has {} payload bytes for {} rows", p.data.size(), len));
                }
                return {};
            } else {
                if (auto ok = check_sequence(p.indices, len); !ok) {
                    return ok;
                }
                // Without a dictionary the engines report MissingDictionary.
                if (dictionary == nullptr) {
                    return {};
                }
                const auto indices = decode_sequence(p.indices);
                for (std::size_t i = 0; i < len; ++i) {
                    const bool valid = !p.validity || p.validity->get(i);
                    if (valid && indices[i] >= dictionary->size()) {
                        return std::unexpected(fmt::format(
                            "row {} has dictionary index {} of {} entries", i, indices[i],
                            dictionary->size()));
                    }
                }
                return {};
            }
        },
        page);
}

}  // namespace

// ─── Table ──────────────────────────────────────────────────────────────────

auto Table::from_encoded(std::vector<EncodedColumn> columns, TableOptions options)
    -> std::expected<Table, std::string> {
    if (options.page_size_rows == 0) {
        return std::unexpected("page_size_rows must be positive");
    }
    Table table;
    table.options_ = options;
    for (std::size_t c = 0; c < columns.size(); ++c) {
        auto& column = columns[c];
        std::size_t rows = 0;
        for (std::size_t p = 0; p < column.pages.size(); ++p) {
            const auto& page = column.pages[p];
            if (!page_matches_type(page, column.schema.type)) {
                return std::unexpected(fmt::format("column '{}': page {} does not match type {}",
                                                   column.schema.name, p,
                                                   to_string(column.schema.type)));
            }
            const std::size_t len = page_len(page);
            const bool last = p + 1 == column.pages.size();
            if ((!last && len != options.page_size_rows) || len > options.page_size_rows ||
                len == 0) {
                return std::unexpected(fmt::format(
                    "column '{}': page {} has {} rows (page size is {})", column.schema.name, p,
                    len, options.page_size_rows));
            }
            const auto& validity = page_validity(page);
            if (validity && validity->size() != len) {
                return std::unexpected(fmt::format(
                    "column '{}': page {} validity has {} bits for {} rows", column.schema.name,
                    p, validity->size(), len));
            }
            if (auto ok = check_payload(page, len, column.dictionary.get()); !ok) {
                return std::unexpected(
                    fmt::format("column '{}': page {} {}", column.schema.name, p, ok.error()));
            }
            rows += len;
        }
        if (c == 0) {
            table.rows_ = rows;
        } else if (rows != table.rows_) {
            return std::unexpected(fmt::format("column '{}' has {} rows, expected {}",
                                               column.schema.name, rows, table.rows_));
        }
        table.schema_.push_back(column.schema);
        table.columns_.push_back(Column{
            .pages = std::make_shared<const std::vector<EncodedPage>>(std::move(column.pages)),
            .stats = std::move(column.stats),
            .dictionary = std::move(column.dictionary),
        });
    }
    return table;
}

auto Table::page_count() const noexcept -> std::size_t {
    return columns_.empty() ? 0 : columns_.front().pages->size();
}

auto Table::stats(std::size_t col) const -> const ColumnStats* {
    const auto& stats = columns_.at(col).stats;
    return stats ? &*stats : nullptr;
}

auto Table::get_cell(std::size_t row, std::size_t col) const -> Value {
    if (col >= columns_.size() || row >= rows_) {
        throw std::out_of_range(fmt::format("cell ({}, {}) out of range for {}x{} table", row,
                                            col, rows_, columns_.size()));
    }
    const auto& column = columns_[col];
    const auto& page = (*column.pages)[row / options_.page_size_rows];
    const std::size_t idx = row % options_.page_size_rows;
    const auto& validity = page_validity(page);
    if (validity && !validity->get(idx)) {
        return Null{};
    }
    const ColumnType type = schema_[col].type;
    return std::visit(
        [&](const auto& p) -> Value {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, IntPage>) {
                const auto offset = sequence_at(p.offsets, idx);
                return make_integer_value(
                    type, static_cast<std::int64_t>(static_cast<std::uint64_t>(p.min) + offset));
            } else if constexpr (std::is_same_v<T, FloatPage>) {
                return p.values[idx];
            } else if constexpr (std::is_same_v<T, BoolPage>) {
                return bool_bit(p.data, idx);
            } else {
                if (!column.dictionary) {
                    throw std::out_of_range(
                        fmt::format("column '{}' has no dictionary", schema_[col].name));
                }
                return column.dictionary->at(sequence_at(p.indices, idx));
            }
        },
        page);
}

// ─── TableBuilder ───────────────────────────────────────────────────────────

struct TableBuilder::State {
    std::vector<ColumnSchema> schema;
    TableOptions options;
    std::vector<ColumnBuilder> builders;
    std::vector<std::vector<EncodedPage>> pages;
    std::size_t rows = 0;
    std::size_t page_rows = 0;

    State(std::vector<ColumnSchema> s, TableOptions o) : schema(std::move(s)), options(o) {
        reset();
    }

    void reset() {
        builders.clear();
        pages.assign(schema.size(), {});
        for (const auto& column : schema) {
            builders.push_back(make_column_builder(column.type));
        }
        rows = 0;
        page_rows = 0;
    }

    void flush_page() {
        for (std::size_t c = 0; c < builders.size(); ++c) {
            pages[c].push_back(std::visit([](auto& b) { return b.flush(); }, builders[c]));
        }
        page_rows = 0;
    }
};

TableBuilder::TableBuilder(std::vector<ColumnSchema> schema, TableOptions options) {
    if (options.page_size_rows == 0) {
        throw std::invalid_argument("TableBuilder: page_size_rows must be positive");
    }
    state_ = std::make_unique<State>(std::move(schema), options);
}

TableBuilder::~TableBuilder() = default;
TableBuilder::TableBuilder(TableBuilder&&) noexcept = default;
auto TableBuilder::operator=(TableBuilder&&) noexcept -> TableBuilder& = default;

void TableBuilder::append_row(std::span<const Value> row) {
    auto& state = *state_;
    if (row.size() != state.schema.size()) {
        throw std::invalid_argument(fmt::format("TableBuilder: row has {} values, schema has {}",
                                                row.size(), state.schema.size()));
    }
    for (std::size_t c = 0; c < row.size(); ++c) {
        std::visit([&](auto& b) { b.append(row[c]); }, state.builders[c]);
    }
    ++state.rows;
    if (++state.page_rows == state.options.page_size_rows) {
        state.flush_page();
    }
}

auto TableBuilder::row_count() const noexcept -> std::size_t {
    return state_->rows;
}

auto TableBuilder::finish() -> Table {
    auto& state = *state_;
    if (state.page_rows > 0) {
        state.flush_page();
    }
    Table table;
    table.options_ = state.options;
    table.rows_ = state.rows;
    table.schema_ = state.schema;
    for (std::size_t c = 0; c < state.builders.size(); ++c) {
        Table::Column column{
            .pages = std::make_shared<const std::vector<EncodedPage>>(std::move(state.pages[c])),
            .stats = std::visit([](const auto& b) { return b.stats(); }, state.builders[c]),
        };
        if (const auto* dict = std::get_if<DictColumnBuilder>(&state.builders[c])) {
            column.dictionary = dict->dictionary;
        }
        table.columns_.push_back(std::move(column));
    }
    state.reset();
    return table;
}

}  // namespace strata
