#include <strata/core/bitmap.hpp>

#include <algorithm>
#include <bit>

namespace strata {

Bitmap::Bitmap(std::size_t len, bool value)
    : words_((len + 63) / 64, value ? ~std::uint64_t{0} : std::uint64_t{0}), len_(len) {
    clear_tail();
}

auto Bitmap::from_bools(const std::vector<bool>& bits) -> Bitmap {
    Bitmap out;
    out.reserve(bits.size());
    for (bool bit : bits) {
        out.push(bit);
    }
    return out;
}

void Bitmap::push(bool value) {
    if ((len_ & 63) == 0) {
        words_.push_back(0);
    }
    if (value) {
        words_.back() |= std::uint64_t{1} << (len_ & 63);
    }
    ++len_;
}

void Bitmap::extend_constant(bool value, std::size_t count) {
    if (count == 0) {
        return;
    }
    // Fill the partial tail word bit by bit, then whole words.
    while (count > 0 && (len_ & 63) != 0) {
        push(value);
        --count;
    }
    const std::size_t whole = count / 64;
    words_.insert(words_.end(), whole, value ? ~std::uint64_t{0} : std::uint64_t{0});
    len_ += whole * 64;
    count -= whole * 64;
    for (; count > 0; --count) {
        push(value);
    }
}

auto Bitmap::count_ones() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (auto word : words_) {
        total += static_cast<std::size_t>(std::popcount(word));
    }
    return total;
}

auto Bitmap::all_set() const noexcept -> bool {
    return count_ones() == len_;
}

auto Bitmap::none_set() const noexcept -> bool {
    return std::ranges::all_of(words_, [](std::uint64_t word) { return word == 0; });
}

auto Bitmap::next_one(std::size_t from) const noexcept -> std::size_t {
    if (from >= len_) {
        return len_;
    }
    std::size_t word_idx = from >> 6;
    std::uint64_t word = words_[word_idx] & (~std::uint64_t{0} << (from & 63));
    while (true) {
        if (word != 0) {
            return (word_idx << 6) + static_cast<std::size_t>(std::countr_zero(word));
        }
        ++word_idx;
        if (word_idx >= words_.size()) {
            return len_;
        }
        word = words_[word_idx];
    }
}

auto Bitmap::to_indices() const -> std::vector<std::size_t> {
    std::vector<std::size_t> out;
    out.reserve(count_ones());
    for (std::size_t w = 0; w < words_.size(); ++w) {
        std::uint64_t word = words_[w];
        while (word != 0) {
            out.push_back((w << 6) + static_cast<std::size_t>(std::countr_zero(word)));
            word &= word - 1;
        }
    }
    return out;
}

void Bitmap::and_inplace(const Bitmap& other) noexcept {
    const std::size_t n = std::min(words_.size(), other.words_.size());
    for (std::size_t i = 0; i < n; ++i) {
        words_[i] &= other.words_[i];
    }
}

void Bitmap::or_inplace(const Bitmap& other) noexcept {
    const std::size_t n = std::min(words_.size(), other.words_.size());
    for (std::size_t i = 0; i < n; ++i) {
        words_[i] |= other.words_[i];
    }
    clear_tail();
}

void Bitmap::and_not_inplace(const Bitmap& other) noexcept {
    const std::size_t n = std::min(words_.size(), other.words_.size());
    for (std::size_t i = 0; i < n; ++i) {
        words_[i] &= ~other.words_[i];
    }
}

void Bitmap::not_inplace() noexcept {
    for (auto& word : words_) {
        word = ~word;
    }
    clear_tail();
}

void Bitmap::clear_tail() noexcept {
    const std::size_t used = len_ & 63;
    if (used != 0 && !words_.empty()) {
        words_.back() &= (std::uint64_t{1} << used) - 1;
    }
}

}  // namespace strata
