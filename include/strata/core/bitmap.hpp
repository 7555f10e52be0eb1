#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace strata {

/// A packed, growable bit vector.
///
/// Used both as the row mask produced by filter evaluation and as the
/// validity bitmap of an encoded page (true = valid, false = null). Bits past
/// `size()` in the last word are always zero.
class Bitmap {
   public:
    Bitmap() = default;

    /// A bitmap of `len` bits, every bit equal to `value`.
    Bitmap(std::size_t len, bool value);

    [[nodiscard]] static auto all_false(std::size_t len) -> Bitmap { return Bitmap(len, false); }
    [[nodiscard]] static auto all_true(std::size_t len) -> Bitmap { return Bitmap(len, true); }

    /// Build from a list of booleans.
    [[nodiscard]] static auto from_bools(const std::vector<bool>& bits) -> Bitmap;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return len_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return len_ == 0; }

    [[nodiscard]] auto get(std::size_t idx) const noexcept -> bool {
        return ((words_[idx >> 6] >> (idx & 63)) & 1U) != 0;
    }

    void set(std::size_t idx, bool value) noexcept {
        const std::uint64_t bit = std::uint64_t{1} << (idx & 63);
        if (value) {
            words_[idx >> 6] |= bit;
        } else {
            words_[idx >> 6] &= ~bit;
        }
    }

    void reserve(std::size_t bits) { words_.reserve((bits + 63) / 64); }

    void push(bool value);

    /// Append `count` copies of `value`.
    void extend_constant(bool value, std::size_t count);

    [[nodiscard]] auto count_ones() const noexcept -> std::size_t;
    [[nodiscard]] auto count_zeros() const noexcept -> std::size_t { return len_ - count_ones(); }

    /// True when every bit is set. An empty bitmap is all-true.
    [[nodiscard]] auto all_set() const noexcept -> bool;

    /// True when no bit is set.
    [[nodiscard]] auto none_set() const noexcept -> bool;

    /// Index of the first set bit at or after `from`, or `size()` if none.
    [[nodiscard]] auto next_one(std::size_t from) const noexcept -> std::size_t;

    /// Ascending indices of all set bits.
    [[nodiscard]] auto to_indices() const -> std::vector<std::size_t>;

    // In-place boolean algebra. Operands must have equal length.
    void and_inplace(const Bitmap& other) noexcept;
    void or_inplace(const Bitmap& other) noexcept;
    void and_not_inplace(const Bitmap& other) noexcept;
    void not_inplace() noexcept;

    [[nodiscard]] auto words() const noexcept -> const std::vector<std::uint64_t>& {
        return words_;
    }

    friend auto operator==(const Bitmap& lhs, const Bitmap& rhs) -> bool = default;

   private:
    void clear_tail() noexcept;

    std::vector<std::uint64_t> words_;
    std::size_t len_ = 0;
};

}  // namespace strata
