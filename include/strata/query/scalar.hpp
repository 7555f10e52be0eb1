#pragma once

#include <strata/core/encoding.hpp>
#include <strata/core/types.hpp>
#include <strata/query/error.hpp>

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

namespace strata {

/// Index into a String column's dictionary.
struct DictIndex {
    std::uint32_t value = 0;
    auto operator<=>(const DictIndex&) const = default;
};

/// Encoding-agnostic decoded cell: Null, Int64, Float64, Bool or DictIndex.
/// DateTime/Currency/Percentage decode to Int64, Number to Float64.
using Scalar = std::variant<std::monostate, std::int64_t, double, bool, DictIndex>;

[[nodiscard]] inline auto is_null(const Scalar& scalar) noexcept -> bool {
    return std::holds_alternative<std::monostate>(scalar);
}

/// Numeric view of a scalar: Float64 as is, Int64 converted. Null otherwise.
[[nodiscard]] auto scalar_as_f64(const Scalar& scalar) noexcept -> std::optional<double>;

/// Sequential reader over a bit-packed or run-length encoded sequence.
template <typename T>
class SequenceCursor {
   public:
    explicit SequenceCursor(const encoding::Sequence<T>& seq) noexcept : seq_(&seq) {}

    auto next() noexcept -> T {
        if (const auto* packed = std::get_if<encoding::BitPacked<T>>(seq_)) {
            return static_cast<T>(encoding::unpack_bits_at(packed->data, packed->bit_width, pos_++));
        }
        const auto& rle = std::get<encoding::RunLength<T>>(*seq_);
        while (pos_ >= rle.ends[run_]) {
            ++run_;
        }
        ++pos_;
        return rle.values[run_];
    }

   private:
    const encoding::Sequence<T>* seq_;
    std::size_t pos_ = 0;
    std::size_t run_ = 0;
};

/// Decodes one encoded page into a stream of scalars.
///
/// The cursor borrows the page; the page must outlive it.
class PageCursor {
   public:
    /// Fails with UnsupportedColumnType when the page kind does not belong to
    /// `type`.
    [[nodiscard]] static auto open(std::size_t col, ColumnType type,
                                   const encoding::EncodedPage& page) -> QueryResult<PageCursor>;

    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return len_ - pos_; }

    /// Next scalar. Only valid while `remaining() > 0`.
    auto next() noexcept -> Scalar;

   private:
    struct IntState {
        const encoding::IntPage* page;
        SequenceCursor<std::uint64_t> offsets;
    };
    struct FloatState {
        const encoding::FloatPage* page;
    };
    struct BoolState {
        const encoding::BoolPage* page;
    };
    struct DictState {
        const encoding::DictPage* page;
        SequenceCursor<std::uint32_t> indices;
    };
    using State = std::variant<IntState, FloatState, BoolState, DictState>;

    PageCursor(State state, const Bitmap* validity, std::size_t len) noexcept
        : state_(state), validity_(validity), len_(len) {}

    State state_;
    const Bitmap* validity_;
    std::size_t len_;
    std::size_t pos_ = 0;
};

/// Random access decode of row `idx` of `page`.
[[nodiscard]] auto scalar_at(std::size_t col, ColumnType type, const encoding::EncodedPage& page,
                             std::size_t idx) -> QueryResult<Scalar>;

}  // namespace strata
