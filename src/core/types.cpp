#include <strata/core/types.hpp>

#include <fmt/format.h>

#include <type_traits>

namespace strata {

auto to_string(ColumnType type) noexcept -> std::string_view {
    switch (type) {
        case ColumnType::Number:
            return "Number";
        case ColumnType::String:
            return "String";
        case ColumnType::Boolean:
            return "Boolean";
        case ColumnType::DateTime:
            return "DateTime";
        case ColumnType::Currency:
            return "Currency";
        case ColumnType::Percentage:
            return "Percentage";
    }
    return "Unknown";
}

auto integer_payload(const Value& value) noexcept -> std::int64_t {
    return std::visit(
        [](const auto& v) -> std::int64_t {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, DateTime> || std::is_same_v<T, Currency> ||
                          std::is_same_v<T, Percentage>) {
                return v.value;
            } else {
                return 0;
            }
        },
        value);
}

auto make_integer_value(ColumnType type, std::int64_t raw) -> Value {
    switch (type) {
        case ColumnType::DateTime:
            return DateTime{raw};
        case ColumnType::Currency:
            return Currency{raw};
        case ColumnType::Percentage:
            return Percentage{raw};
        default:
            return Null{};
    }
}

auto value_type(const Value& value) noexcept -> ColumnType {
    return std::visit(
        [](const auto& v) -> ColumnType {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return ColumnType::Boolean;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return ColumnType::String;
            } else if constexpr (std::is_same_v<T, DateTime>) {
                return ColumnType::DateTime;
            } else if constexpr (std::is_same_v<T, Currency>) {
                return ColumnType::Currency;
            } else if constexpr (std::is_same_v<T, Percentage>) {
                return ColumnType::Percentage;
            } else {
                return ColumnType::Number;
            }
        },
        value);
}

auto format_value(const Value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return "null";
            } else if constexpr (std::is_same_v<T, double>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else {
                return fmt::format("{}", v.value);
            }
        },
        value);
}

}  // namespace strata
