#pragma once

#include <strata/core/table.hpp>
#include <strata/query/error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace strata {

enum class JoinType : std::uint8_t {
    Inner,
    Left,
    Right,
    FullOuter,
};

/// Parallel row-index arrays: pair i is (left_indices[i], right_indices[i]).
/// An absent optional index marks the unmatched side of an outer join row.
template <typename L, typename R>
struct JoinResult {
    std::vector<L> left_indices;
    std::vector<R> right_indices;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return left_indices.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return left_indices.empty(); }
};

using RowIndex = std::size_t;
using OptRowIndex = std::optional<std::size_t>;

using InnerJoinResult = JoinResult<RowIndex, RowIndex>;
using LeftJoinResult = JoinResult<RowIndex, OptRowIndex>;
using RightJoinResult = JoinResult<OptRowIndex, RowIndex>;
using OuterJoinResult = JoinResult<OptRowIndex, OptRowIndex>;

// Every join builds its hash table over the right table and probes with the
// left one. Matches are emitted in left-row order; rows of the right table
// matching the same left row come out most recent first. Unmatched right rows
// (Right / FullOuter) follow the probe pass in ascending order. NULL in any
// key column never matches.

// ─── Single key ─────────────────────────────────────────────────────────────

[[nodiscard]] auto hash_join(const Table& left, const Table& right, std::size_t left_on,
                             std::size_t right_on) -> QueryResult<InnerJoinResult>;
[[nodiscard]] auto hash_left_join(const Table& left, const Table& right, std::size_t left_on,
                                  std::size_t right_on) -> QueryResult<LeftJoinResult>;
[[nodiscard]] auto hash_right_join(const Table& left, const Table& right, std::size_t left_on,
                                   std::size_t right_on) -> QueryResult<RightJoinResult>;
[[nodiscard]] auto hash_full_outer_join(const Table& left, const Table& right,
                                        std::size_t left_on, std::size_t right_on)
    -> QueryResult<OuterJoinResult>;
[[nodiscard]] auto hash_join_with_type(const Table& left, const Table& right, std::size_t left_on,
                                       std::size_t right_on, JoinType type)
    -> QueryResult<OuterJoinResult>;

// ─── Composite key ──────────────────────────────────────────────────────────

[[nodiscard]] auto hash_join_multi(const Table& left, const Table& right,
                                   std::span<const std::size_t> left_on,
                                   std::span<const std::size_t> right_on)
    -> QueryResult<InnerJoinResult>;
[[nodiscard]] auto hash_left_join_multi(const Table& left, const Table& right,
                                        std::span<const std::size_t> left_on,
                                        std::span<const std::size_t> right_on)
    -> QueryResult<LeftJoinResult>;
[[nodiscard]] auto hash_right_join_multi(const Table& left, const Table& right,
                                         std::span<const std::size_t> left_on,
                                         std::span<const std::size_t> right_on)
    -> QueryResult<RightJoinResult>;
[[nodiscard]] auto hash_full_outer_join_multi(const Table& left, const Table& right,
                                              std::span<const std::size_t> left_on,
                                              std::span<const std::size_t> right_on)
    -> QueryResult<OuterJoinResult>;
[[nodiscard]] auto hash_join_with_type_multi(const Table& left, const Table& right,
                                             std::span<const std::size_t> left_on,
                                             std::span<const std::size_t> right_on, JoinType type)
    -> QueryResult<OuterJoinResult>;

}  // namespace strata
