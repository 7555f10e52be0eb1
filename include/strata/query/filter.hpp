#pragma once

#include <strata/core/bitmap.hpp>
#include <strata/core/table.hpp>
#include <strata/query/error.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata {

/// Supported comparison operators for filter predicates.
enum class CompareOp : std::uint8_t {
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,
};

[[nodiscard]] auto to_string(CompareOp op) noexcept -> std::string_view;

/// Filter predicate tree. Built once by the caller and only read afterwards.
struct FilterExpr;
using FilterExprPtr = std::unique_ptr<FilterExpr>;

/// Literal on the right-hand side of a comparison.
using FilterLiteral = std::variant<double, bool, std::string>;

/// Logical AND of two predicates.
struct FilterAnd {
    FilterExprPtr left, right;
};
/// Logical OR of two predicates.
struct FilterOr {
    FilterExprPtr left, right;
};
/// Logical NOT of a predicate.
struct FilterNot {
    FilterExprPtr operand;
};
/// `column <op> literal`. NULL cells never satisfy a comparison.
struct FilterCmp {
    std::size_t col = 0;
    CompareOp op = CompareOp::Eq;
    FilterLiteral value;
};
/// ASCII case-insensitive string equality (Eq / Ne only).
struct FilterCmpCaseInsensitive {
    std::size_t col = 0;
    CompareOp op = CompareOp::Eq;
    std::string value;
};
struct FilterIsNull {
    std::size_t col = 0;
};
struct FilterIsNotNull {
    std::size_t col = 0;
};

struct FilterExpr {
    std::variant<FilterAnd, FilterOr, FilterNot, FilterCmp, FilterCmpCaseInsensitive,
                 FilterIsNull, FilterIsNotNull>
        node;
};

// ─── Predicate builders ─────────────────────────────────────────────────────

[[nodiscard]] auto filter_number(std::size_t col, CompareOp op, double value) -> FilterExprPtr;
[[nodiscard]] auto filter_bool(std::size_t col, CompareOp op, bool value) -> FilterExprPtr;
[[nodiscard]] auto filter_string(std::size_t col, CompareOp op, std::string value)
    -> FilterExprPtr;
[[nodiscard]] auto filter_string_ci(std::size_t col, CompareOp op, std::string value)
    -> FilterExprPtr;
[[nodiscard]] auto filter_is_null(std::size_t col) -> FilterExprPtr;
[[nodiscard]] auto filter_is_not_null(std::size_t col) -> FilterExprPtr;
[[nodiscard]] auto filter_and(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr;
[[nodiscard]] auto filter_or(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr;
[[nodiscard]] auto filter_not(FilterExprPtr operand) -> FilterExprPtr;

/// True when the tree contains a FilterNot anywhere.
[[nodiscard]] auto contains_not(const FilterExpr& expr) noexcept -> bool;

// ─── Evaluation ─────────────────────────────────────────────────────────────

/// Three-valued result: a row is TRUE, UNKNOWN, or (implicitly) FALSE when it
/// is in neither mask. The two masks never overlap.
struct TriMask {
    Bitmap true_mask;
    Bitmap unknown_mask;

    [[nodiscard]] auto false_mask() const -> Bitmap;
};

/// Two-valued evaluation: NULL comparisons are false, NOT flips bits.
/// Only correct for NOT-free predicates; `filter_mask` picks the evaluator.
[[nodiscard]] auto evaluate_two_valued(const Table& table, const FilterExpr& expr)
    -> QueryResult<Bitmap>;

/// Kleene (SQL) three-valued evaluation.
[[nodiscard]] auto evaluate_three_valued(const Table& table, const FilterExpr& expr)
    -> QueryResult<TriMask>;

/// Row mask of rows where `expr` is TRUE.
[[nodiscard]] auto filter_mask(const Table& table, const FilterExpr& expr) -> QueryResult<Bitmap>;

/// Ascending indices of rows where `expr` is TRUE.
[[nodiscard]] auto filter_indices(const Table& table, const FilterExpr& expr)
    -> QueryResult<std::vector<std::size_t>>;

/// New table holding the rows set in `mask`, in order, with the same schema.
[[nodiscard]] auto filter_table(const Table& table, const Bitmap& mask) -> QueryResult<Table>;

/// `filter_table(table, filter_mask(table, expr))`.
[[nodiscard]] auto filter(const Table& table, const FilterExpr& expr) -> QueryResult<Table>;

}  // namespace strata
