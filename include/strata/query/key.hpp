#pragma once

#include <strata/query/scalar.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace strata {

enum class KeyTag : std::uint8_t {
    Null,
    Int,
    Float,
    Bool,
    Dict,
};

/// Canonical, hashable form of a scalar. Two scalars group or join together
/// iff their keys compare equal.
struct KeyValue {
    KeyTag tag = KeyTag::Null;
    std::uint64_t bits = 0;

    auto operator==(const KeyValue&) const -> bool = default;
};

[[nodiscard]] auto make_key(const Scalar& scalar) noexcept -> KeyValue;

/// Canonical bits of a non-null scalar, used for distinct-value sets.
[[nodiscard]] auto distinct_bits(const Scalar& scalar) noexcept -> std::optional<std::uint64_t>;

/// Stafford variant 13 finalizer.
[[nodiscard]] constexpr auto mix64(std::uint64_t x) noexcept -> std::uint64_t {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

struct KeyValueHash {
    auto operator()(const KeyValue& key) const noexcept -> std::size_t {
        const auto tag = static_cast<std::uint64_t>(key.tag);
        return static_cast<std::size_t>(mix64(key.bits ^ (tag << 56)));
    }
};

struct CompositeKeyHash {
    auto operator()(const std::vector<KeyValue>& keys) const noexcept -> std::size_t {
        std::size_t seed = 0;
        for (const auto& key : keys) {
            seed ^= KeyValueHash{}(key) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};

}  // namespace strata
