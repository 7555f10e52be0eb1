#include <strata/query/error.hpp>

#include <fmt/format.h>

#include <utility>

namespace strata {

auto QueryError::empty_keys() -> QueryError {
    return QueryError{.kind = QueryErrorKind::EmptyKeys};
}

auto QueryError::column_out_of_bounds(std::size_t col, std::size_t column_count) -> QueryError {
    return QueryError{
        .kind = QueryErrorKind::ColumnOutOfBounds, .col = col, .column_count = column_count};
}

auto QueryError::row_out_of_bounds(std::size_t row, std::size_t row_count) -> QueryError {
    return QueryError{.kind = QueryErrorKind::RowOutOfBounds, .row = row, .row_count = row_count};
}

auto QueryError::unsupported_column_type(std::size_t col, std::optional<ColumnType> column_type,
                                         std::string operation) -> QueryError {
    return QueryError{
        .kind = QueryErrorKind::UnsupportedColumnType,
        .col = col,
        .column_type = column_type,
        .operation = std::move(operation),
    };
}

auto QueryError::mismatched_join_key_count(std::size_t left, std::size_t right) -> QueryError {
    return QueryError{
        .kind = QueryErrorKind::MismatchedJoinKeyCount, .left_keys = left, .right_keys = right};
}

auto QueryError::mismatched_join_key_types(ColumnType left, ColumnType right) -> QueryError {
    return QueryError{
        .kind = QueryErrorKind::MismatchedJoinKeyTypes, .left_type = left, .right_type = right};
}

auto QueryError::missing_dictionary(std::size_t col) -> QueryError {
    return QueryError{.kind = QueryErrorKind::MissingDictionary, .col = col};
}

auto QueryError::internal_invariant(std::string message) -> QueryError {
    return QueryError{.kind = QueryErrorKind::InternalInvariant, .message = std::move(message)};
}

auto QueryError::format() const -> std::string {
    switch (kind) {
        case QueryErrorKind::EmptyKeys:
            return "at least one key column is required";
        case QueryErrorKind::ColumnOutOfBounds:
            return fmt::format("column index {} out of bounds (table has {} columns)", col,
                               column_count);
        case QueryErrorKind::RowOutOfBounds:
            return fmt::format("row index {} out of bounds (table has {} rows)", row, row_count);
        case QueryErrorKind::UnsupportedColumnType:
            if (column_type) {
                return fmt::format("unsupported column type {} for {} (column {})",
                                   to_string(*column_type), operation, col);
            }
            return fmt::format("unsupported input for {}", operation);
        case QueryErrorKind::MismatchedJoinKeyCount:
            return fmt::format(
                "join requires the same number of key columns on both sides (left_keys={}, "
                "right_keys={})",
                left_keys, right_keys);
        case QueryErrorKind::MismatchedJoinKeyTypes:
            return fmt::format("join key types must match (left={}, right={})",
                               to_string(left_type), to_string(right_type));
        case QueryErrorKind::MissingDictionary:
            return fmt::format("string column {} has no dictionary", col);
        case QueryErrorKind::InternalInvariant:
            return fmt::format("internal invariant violated: {}", message);
    }
    return "unknown query error";
}

}  // namespace strata
