#include <strata/core/encoding.hpp>

#include <algorithm>
#include <bit>
#include <type_traits>

namespace strata::encoding {

auto bit_width_for(std::uint64_t max_value) noexcept -> std::uint8_t {
    return static_cast<std::uint8_t>(std::bit_width(max_value));
}

auto pack_bits(std::span<const std::uint64_t> values, std::uint8_t bit_width)
    -> std::vector<std::uint8_t> {
    std::vector<std::uint8_t> out((values.size() * bit_width + 7) / 8, 0);
    if (bit_width == 0) {
        return out;
    }
    std::size_t bit = 0;
    for (auto value : values) {
        unsigned written = 0;
        while (written < bit_width) {
            const unsigned offset = static_cast<unsigned>(bit & 7);
            const unsigned take = std::min<unsigned>(8 - offset, bit_width - written);
            const auto chunk = static_cast<std::uint8_t>((value >> written) & ((1U << take) - 1));
            out[bit >> 3] |= static_cast<std::uint8_t>(chunk << offset);
            written += take;
            bit += take;
        }
    }
    return out;
}

auto unpack_bits_at(std::span<const std::uint8_t> data, std::uint8_t bit_width,
                    std::size_t idx) noexcept -> std::uint64_t {
    if (bit_width == 0) {
        return 0;
    }
    std::uint64_t out = 0;
    std::size_t bit = idx * bit_width;
    unsigned read = 0;
    while (read < bit_width) {
        const unsigned offset = static_cast<unsigned>(bit & 7);
        const unsigned take = std::min<unsigned>(8 - offset, bit_width - read);
        const std::uint64_t chunk = (data[bit >> 3] >> offset) & ((1U << take) - 1);
        out |= chunk << read;
        read += take;
        bit += take;
    }
    return out;
}

auto page_len(const EncodedPage& page) noexcept -> std::size_t {
    return std::visit(
        [](const auto& p) -> std::size_t {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, FloatPage>) {
                return p.values.size();
            } else {
                return p.len;
            }
        },
        page);
}

auto page_validity(const EncodedPage& page) noexcept -> const std::optional<Bitmap>& {
    return std::visit([](const auto& p) -> const std::optional<Bitmap>& { return p.validity; },
                      page);
}

}  // namespace strata::encoding
