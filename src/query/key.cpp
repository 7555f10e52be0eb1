#include <strata/query/key.hpp>

#include <type_traits>

namespace strata {

auto make_key(const Scalar& scalar) noexcept -> KeyValue {
    return std::visit(
        [](const auto& v) -> KeyValue {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return KeyValue{};
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return KeyValue{.tag = KeyTag::Int, .bits = static_cast<std::uint64_t>(v)};
            } else if constexpr (std::is_same_v<T, double>) {
                return KeyValue{.tag = KeyTag::Float, .bits = canonical_f64_bits(v)};
            } else if constexpr (std::is_same_v<T, bool>) {
                return KeyValue{.tag = KeyTag::Bool, .bits = v ? 1U : 0U};
            } else {
                return KeyValue{.tag = KeyTag::Dict, .bits = v.value};
            }
        },
        scalar);
}

auto distinct_bits(const Scalar& scalar) noexcept -> std::optional<std::uint64_t> {
    if (is_null(scalar)) {
        return std::nullopt;
    }
    return make_key(scalar).bits;
}

}  // namespace strata
