#pragma once

#include <strata/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace strata {

enum class QueryErrorKind : std::uint8_t {
    EmptyKeys,
    ColumnOutOfBounds,
    RowOutOfBounds,
    UnsupportedColumnType,
    MismatchedJoinKeyCount,
    MismatchedJoinKeyTypes,
    MissingDictionary,
    InternalInvariant,
};

/// Structured failure of a filter, group-by or join call.
///
/// Only the fields relevant to `kind` are populated.
struct QueryError {
    QueryErrorKind kind = QueryErrorKind::InternalInvariant;
    std::size_t col = 0;
    std::size_t column_count = 0;
    std::size_t row = 0;
    std::size_t row_count = 0;
    std::optional<ColumnType> column_type;
    std::string operation;
    std::size_t left_keys = 0;
    std::size_t right_keys = 0;
    ColumnType left_type = ColumnType::Number;
    ColumnType right_type = ColumnType::Number;
    std::string message;

    [[nodiscard]] static auto empty_keys() -> QueryError;
    [[nodiscard]] static auto column_out_of_bounds(std::size_t col, std::size_t column_count)
        -> QueryError;
    [[nodiscard]] static auto row_out_of_bounds(std::size_t row, std::size_t row_count)
        -> QueryError;
    [[nodiscard]] static auto unsupported_column_type(std::size_t col,
                                                      std::optional<ColumnType> column_type,
                                                      std::string operation) -> QueryError;
    [[nodiscard]] static auto mismatched_join_key_count(std::size_t left, std::size_t right)
        -> QueryError;
    [[nodiscard]] static auto mismatched_join_key_types(ColumnType left, ColumnType right)
        -> QueryError;
    [[nodiscard]] static auto missing_dictionary(std::size_t col) -> QueryError;
    [[nodiscard]] static auto internal_invariant(std::string message) -> QueryError;

    /// Human-readable description.
    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using QueryResult = std::expected<T, QueryError>;

/// ColumnOutOfBounds unless `col < table_columns`.
[[nodiscard]] inline auto check_column(std::size_t col, std::size_t table_columns)
    -> QueryResult<void> {
    if (col >= table_columns) {
        return std::unexpected(QueryError::column_out_of_bounds(col, table_columns));
    }
    return {};
}

}  // namespace strata
