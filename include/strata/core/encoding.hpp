#pragma once

#include <strata/core/bitmap.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace strata::encoding {

/// Number of bits needed to store `max_value` (0 for 0).
[[nodiscard]] auto bit_width_for(std::uint64_t max_value) noexcept -> std::uint8_t;

/// Pack `values` LSB-first at a fixed `bit_width`.
[[nodiscard]] auto pack_bits(std::span<const std::uint64_t> values, std::uint8_t bit_width)
    -> std::vector<std::uint8_t>;

/// Read the `idx`-th packed value.
[[nodiscard]] auto unpack_bits_at(std::span<const std::uint8_t> data, std::uint8_t bit_width,
                                  std::size_t idx) noexcept -> std::uint64_t;

/// Fixed-width bit-packed sequence.
template <typename T>
struct BitPacked {
    std::uint8_t bit_width = 0;
    std::size_t len = 0;
    std::vector<std::uint8_t> data;
};

/// Run-length encoded sequence: run i covers rows [ends[i-1], ends[i]).
template <typename T>
struct RunLength {
    std::vector<T> values;
    std::vector<std::uint32_t> ends;
};

template <typename T>
using Sequence = std::variant<BitPacked<T>, RunLength<T>>;

template <typename T>
[[nodiscard]] auto sequence_len(const Sequence<T>& seq) noexcept -> std::size_t {
    if (const auto* packed = std::get_if<BitPacked<T>>(&seq)) {
        return packed->len;
    }
    const auto& rle = std::get<RunLength<T>>(seq);
    return rle.ends.empty() ? 0 : rle.ends.back();
}

/// Random access into a sequence. `idx` must be below `sequence_len`.
template <typename T>
[[nodiscard]] auto sequence_at(const Sequence<T>& seq, std::size_t idx) noexcept -> T {
    if (const auto* packed = std::get_if<BitPacked<T>>(&seq)) {
        return static_cast<T>(unpack_bits_at(packed->data, packed->bit_width, idx));
    }
    const auto& rle = std::get<RunLength<T>>(seq);
    auto it = std::upper_bound(rle.ends.begin(), rle.ends.end(), static_cast<std::uint32_t>(idx));
    return rle.values[static_cast<std::size_t>(it - rle.ends.begin())];
}

template <typename T>
[[nodiscard]] auto decode_sequence(const Sequence<T>& seq) -> std::vector<T> {
    std::vector<T> out;
    out.reserve(sequence_len(seq));
    if (const auto* packed = std::get_if<BitPacked<T>>(&seq)) {
        for (std::size_t i = 0; i < packed->len; ++i) {
            out.push_back(static_cast<T>(unpack_bits_at(packed->data, packed->bit_width, i)));
        }
        return out;
    }
    const auto& rle = std::get<RunLength<T>>(seq);
    std::uint32_t start = 0;
    for (std::size_t run = 0; run < rle.values.size(); ++run) {
        out.insert(out.end(), rle.ends[run] - start, rle.values[run]);
        start = rle.ends[run];
    }
    return out;
}

/// Encode `values`, picking whichever of bit-packing and RLE is smaller.
template <typename T>
[[nodiscard]] auto encode_sequence(std::span<const T> values) -> Sequence<T> {
    RunLength<T> rle;
    std::uint64_t max_value = 0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        max_value = std::max<std::uint64_t>(max_value, values[i]);
        if (rle.values.empty() || rle.values.back() != values[i]) {
            rle.values.push_back(values[i]);
            rle.ends.push_back(static_cast<std::uint32_t>(i + 1));
        } else {
            rle.ends.back() = static_cast<std::uint32_t>(i + 1);
        }
    }
    const std::uint8_t width = bit_width_for(max_value);
    const std::size_t packed_bytes = (values.size() * width + 7) / 8;
    const std::size_t rle_bytes = rle.values.size() * (sizeof(T) + sizeof(std::uint32_t));
    if (rle_bytes < packed_bytes) {
        return rle;
    }
    std::vector<std::uint64_t> wide(values.begin(), values.end());
    return BitPacked<T>{.bit_width = width, .len = values.size(), .data = pack_bits(wide, width)};
}

// ─── Encoded pages ──────────────────────────────────────────────────────────
// Every page carries an optional validity bitmap; it is omitted when the page
// has no nulls. Null slots hold an arbitrary payload value.

/// DateTime / Currency / Percentage: value = min + offset.
struct IntPage {
    std::int64_t min = 0;
    std::size_t len = 0;
    Sequence<std::uint64_t> offsets;
    std::optional<Bitmap> validity;
};

/// Number: raw doubles.
struct FloatPage {
    std::vector<double> values;
    std::optional<Bitmap> validity;
};

/// Boolean: LSB-first packed bits.
struct BoolPage {
    std::size_t len = 0;
    std::vector<std::uint8_t> data;
    std::optional<Bitmap> validity;
};

/// String: indices into the column dictionary.
struct DictPage {
    std::size_t len = 0;
    Sequence<std::uint32_t> indices;
    std::optional<Bitmap> validity;
};

using EncodedPage = std::variant<IntPage, FloatPage, BoolPage, DictPage>;

[[nodiscard]] auto page_len(const EncodedPage& page) noexcept -> std::size_t;
[[nodiscard]] auto page_validity(const EncodedPage& page) noexcept -> const std::optional<Bitmap>&;

/// Bit `row` of a packed boolean payload.
[[nodiscard]] inline auto bool_bit(std::span<const std::uint8_t> data, std::size_t row) noexcept
    -> bool {
    return ((data[row >> 3] >> (row & 7)) & 1U) != 0;
}

}  // namespace strata::encoding
