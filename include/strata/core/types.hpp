#pragma once

#include <bit>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace strata {

/// Logical type of a column.
enum class ColumnType : std::uint8_t {
    Number,
    String,
    Boolean,
    DateTime,
    Currency,
    Percentage,
};

[[nodiscard]] auto to_string(ColumnType type) noexcept -> std::string_view;

/// True for the types stored as "minimum + offset" integer pages.
[[nodiscard]] constexpr auto is_integer_like(ColumnType type) noexcept -> bool {
    return type == ColumnType::DateTime || type == ColumnType::Currency ||
           type == ColumnType::Percentage;
}

/// True for the types accepted by numeric aggregations (Avg, Var, ...).
[[nodiscard]] constexpr auto is_numeric(ColumnType type) noexcept -> bool {
    return type == ColumnType::Number || is_integer_like(type);
}

struct Null {
    auto operator<=>(const Null&) const = default;
};

/// Milliseconds since the Unix epoch.
struct DateTime {
    std::int64_t value = 0;
    auto operator<=>(const DateTime&) const = default;
};

/// Fixed-point amount, scaled by the column's convention.
struct Currency {
    std::int64_t value = 0;
    auto operator<=>(const Currency&) const = default;
};

/// Fixed-point ratio, scaled by the column's convention.
struct Percentage {
    std::int64_t value = 0;
    auto operator<=>(const Percentage&) const = default;
};

/// A single decoded cell.
using Value = std::variant<Null, double, bool, std::string, DateTime, Currency, Percentage>;

[[nodiscard]] inline auto is_null(const Value& value) noexcept -> bool {
    return std::holds_alternative<Null>(value);
}

/// Integer payload of a DateTime/Currency/Percentage value.
[[nodiscard]] auto integer_payload(const Value& value) noexcept -> std::int64_t;

/// Wrap an integer payload in the Value alternative matching `type`.
[[nodiscard]] auto make_integer_value(ColumnType type, std::int64_t raw) -> Value;

/// Column type a non-null value would be stored as.
[[nodiscard]] auto value_type(const Value& value) noexcept -> ColumnType;

[[nodiscard]] auto format_value(const Value& value) -> std::string;

/// Bit pattern of `value` with -0.0 folded onto +0.0 and every NaN folded onto
/// one quiet NaN. Two doubles are the same key iff these bits are equal.
[[nodiscard]] inline auto canonical_f64_bits(double value) noexcept -> std::uint64_t {
    if (value == 0.0) {
        return 0;
    }
    if (value != value) {
        return 0x7ff8000000000000ULL;
    }
    return std::bit_cast<std::uint64_t>(value);
}

struct ColumnSchema {
    std::string name;
    ColumnType type = ColumnType::Number;

    auto operator==(const ColumnSchema&) const -> bool = default;
};

}  // namespace strata
