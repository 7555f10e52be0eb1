#include <strata/query/hash_join.hpp>
#include <strata/query/key.hpp>
#include <strata/query/scalar.hpp>

#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <string_view>
#include <utility>

namespace strata {

namespace {

constexpr std::size_t kNoRow = std::numeric_limits<std::size_t>::max();

/// One key-column pair. For string keys with distinct dictionaries, `remap`
/// translates right dictionary indices into the left dictionary's space.
struct KeyPlan {
    std::size_t left_col;
    std::size_t right_col;
    ColumnType type;
    std::optional<std::vector<std::optional<std::uint32_t>>> remap;
};

enum class Side : std::uint8_t { Left, Right };

auto build_remap(const Dictionary& left, const Dictionary& right)
    -> std::vector<std::optional<std::uint32_t>> {
    robin_hood::unordered_flat_map<std::string_view, std::uint32_t> index;
    index.reserve(left.size());
    for (std::size_t i = 0; i < left.size(); ++i) {
        index.try_emplace(left[i], static_cast<std::uint32_t>(i));
    }
    std::vector<std::optional<std::uint32_t>> remap;
    remap.reserve(right.size());
    for (const auto& value : right) {
        auto it = index.find(value);
        remap.push_back(it == index.end() ? std::nullopt
                                          : std::optional<std::uint32_t>(it->second));
    }
    return remap;
}

auto plan_join_keys(const Table& left, const Table& right,
                    std::span<const std::size_t> left_on, std::span<const std::size_t> right_on)
    -> QueryResult<std::vector<KeyPlan>> {
    if (left_on.size() != right_on.size()) {
        return std::unexpected(
            QueryError::mismatched_join_key_count(left_on.size(), right_on.size()));
    }
    if (left_on.empty()) {
        return std::unexpected(QueryError::empty_keys());
    }
    std::vector<KeyPlan> plans;
    plans.reserve(left_on.size());
    for (std::size_t k = 0; k < left_on.size(); ++k) {
        const std::size_t lcol = left_on[k];
        const std::size_t rcol = right_on[k];
        if (auto ok = check_column(lcol, left.column_count()); !ok) {
            return std::unexpected(ok.error());
        }
        if (auto ok = check_column(rcol, right.column_count()); !ok) {
            return std::unexpected(ok.error());
        }
        const ColumnType ltype = left.column_type(lcol);
        const ColumnType rtype = right.column_type(rcol);
        if (ltype != rtype) {
            return std::unexpected(QueryError::mismatched_join_key_types(ltype, rtype));
        }
        KeyPlan plan{.left_col = lcol, .right_col = rcol, .type = ltype};
        if (ltype == ColumnType::String) {
            const auto& ldict = left.dictionary(lcol);
            const auto& rdict = right.dictionary(rcol);
            if (!ldict) {
                return std::unexpected(QueryError::missing_dictionary(lcol));
            }
            if (!rdict) {
                return std::unexpected(QueryError::missing_dictionary(rcol));
            }
            if (ldict == rdict) {
                spdlog::debug("join: key {} shares its dictionary, no remap", k);
            } else {
                plan.remap = build_remap(*ldict, *rdict);
            }
        }
        plans.push_back(std::move(plan));
    }
    return plans;
}

/// Product of the right-side distinct counts, capped at the right row count.
auto capacity_hint(const Table& right, std::span<const KeyPlan> plans)
    -> std::optional<std::size_t> {
    const std::size_t rows = right.row_count();
    std::size_t product = 1;
    for (const auto& plan : plans) {
        const auto* stats = right.stats(plan.right_col);
        if (stats == nullptr || !stats->distinct_count) {
            return std::nullopt;
        }
        const auto distinct = static_cast<std::size_t>(*stats->distinct_count);
        if (distinct != 0 && product > rows / distinct) {
            return rows;
        }
        product *= distinct;
    }
    return std::min(product, rows);
}

/// Walk `table` page by page and call `f(row, key, complete)` for every row.
/// `complete` is false when a key component is NULL or, on the right side,
/// a dictionary value has no counterpart on the left.
template <typename F>
auto for_each_key_row(const Table& table, std::span<const KeyPlan> plans, Side side, F&& f)
    -> QueryResult<void> {
    std::vector<KeyValue> key(plans.size());
    std::vector<PageCursor> cursors;
    cursors.reserve(plans.size());
    std::size_t row = 0;
    for (std::size_t page = 0; page < table.page_count(); ++page) {
        cursors.clear();
        for (const auto& plan : plans) {
            const std::size_t col = side == Side::Left ? plan.left_col : plan.right_col;
            auto cursor = PageCursor::open(col, plan.type, table.pages(col)[page]);
            if (!cursor) {
                return std::unexpected(cursor.error());
            }
            cursors.push_back(std::move(*cursor));
        }
        const std::size_t len = cursors.front().remaining();
        for (std::size_t i = 0; i < len; ++i, ++row) {
            bool complete = true;
            for (std::size_t k = 0; k < plans.size(); ++k) {
                Scalar scalar = cursors[k].next();
                if (is_null(scalar)) {
                    complete = false;
                    continue;
                }
                if (side == Side::Right && plans[k].remap) {
                    const auto& remap = *plans[k].remap;
                    const std::uint32_t idx = std::get<DictIndex>(scalar).value;
                    if (idx >= remap.size() || !remap[idx]) {
                        complete = false;
                        continue;
                    }
                    scalar = DictIndex{*remap[idx]};
                }
                key[k] = make_key(scalar);
            }
            f(row, key, complete);
        }
    }
    return {};
}

/// Chained hash join: build over `right`, probe with `left`.
///
/// `on_match(l, r)` runs for every matching pair, `on_left(l)` for left rows
/// without a match, and, when `track_right` is set, `on_right(r)` for right
/// rows never matched, in ascending order after the probe.
template <typename OnMatch, typename OnLeft, typename OnRight>
auto join_core(const Table& left, const Table& right, std::span<const std::size_t> left_on,
               std::span<const std::size_t> right_on, bool track_right, OnMatch&& on_match,
               OnLeft&& on_left, OnRight&& on_right) -> QueryResult<void> {
    auto plans = plan_join_keys(left, right, left_on, right_on);
    if (!plans) {
        return std::unexpected(plans.error());
    }
    const std::size_t right_rows = right.row_count();

    // key -> most recently inserted right row; next[row] continues the chain.
    robin_hood::unordered_flat_map<std::vector<KeyValue>, std::size_t, CompositeKeyHash> heads;
    if (auto hint = capacity_hint(right, *plans)) {
        spdlog::debug("join: reserving {} build slots from distinct counts", *hint);
        heads.reserve(*hint);
    }
    std::vector<std::size_t> next(right_rows, kNoRow);
    auto built = for_each_key_row(right, *plans, Side::Right,
                                  [&](std::size_t row, const std::vector<KeyValue>& key,
                                      bool complete) {
                                      if (!complete) {
                                          return;
                                      }
                                      auto [it, inserted] = heads.try_emplace(key, row);
                                      if (!inserted) {
                                          next[row] = it->second;
                                          it->second = row;
                                      }
                                  });
    if (!built) {
        return built;
    }

    std::vector<std::uint8_t> matched(track_right ? right_rows : 0, 0);
    auto probed = for_each_key_row(left, *plans, Side::Left,
                                   [&](std::size_t row, const std::vector<KeyValue>& key,
                                       bool complete) {
                                       if (!complete) {
                                           on_left(row);
                                           return;
                                       }
                                       auto it = heads.find(key);
                                       if (it == heads.end()) {
                                           on_left(row);
                                           return;
                                       }
                                       for (std::size_t r = it->second; r != kNoRow; r = next[r]) {
                                           on_match(row, r);
                                           if (track_right) {
                                               matched[r] = 1;
                                           }
                                       }
                                   });
    if (!probed) {
        return probed;
    }

    if (track_right) {
        for (std::size_t r = 0; r < right_rows; ++r) {
            if (matched[r] == 0) {
                on_right(r);
            }
        }
    }
    return {};
}

auto single(const std::size_t& col) -> std::span<const std::size_t> {
    return {&col, 1};
}

}  // namespace

// ─── Composite key ──────────────────────────────────────────────────────────

auto hash_join_multi(const Table& left, const Table& right, std::span<const std::size_t> left_on,
                     std::span<const std::size_t> right_on) -> QueryResult<InnerJoinResult> {
    InnerJoinResult out;
    auto ok = join_core(
        left, right, left_on, right_on, false,
        [&](std::size_t l, std::size_t r) {
            out.left_indices.push_back(l);
            out.right_indices.push_back(r);
        },
        [](std::size_t) {}, [](std::size_t) {});
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto hash_left_join_multi(const Table& left, const Table& right,
                          std::span<const std::size_t> left_on,
                          std::span<const std::size_t> right_on) -> QueryResult<LeftJoinResult> {
    LeftJoinResult out;
    auto ok = join_core(
        left, right, left_on, right_on, false,
        [&](std::size_t l, std::size_t r) {
            out.left_indices.push_back(l);
            out.right_indices.emplace_back(r);
        },
        [&](std::size_t l) {
            out.left_indices.push_back(l);
            out.right_indices.emplace_back(std::nullopt);
        },
        [](std::size_t) {});
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto hash_right_join_multi(const Table& left, const Table& right,
                           std::span<const std::size_t> left_on,
                           std::span<const std::size_t> right_on) -> QueryResult<RightJoinResult> {
    RightJoinResult out;
    auto ok = join_core(
        left, right, left_on, right_on, true,
        [&](std::size_t l, std::size_t r) {
            out.left_indices.emplace_back(l);
            out.right_indices.push_back(r);
        },
        [](std::size_t) {},
        [&](std::size_t r) {
            out.left_indices.emplace_back(std::nullopt);
            out.right_indices.push_back(r);
        });
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto hash_join_with_type_multi(const Table& left, const Table& right,
                               std::span<const std::size_t> left_on,
                               std::span<const std::size_t> right_on, JoinType type)
    -> QueryResult<OuterJoinResult> {
    const bool keep_left = type == JoinType::Left || type == JoinType::FullOuter;
    const bool keep_right = type == JoinType::Right || type == JoinType::FullOuter;
    OuterJoinResult out;
    auto ok = join_core(
        left, right, left_on, right_on, keep_right,
        [&](std::size_t l, std::size_t r) {
            out.left_indices.emplace_back(l);
            out.right_indices.emplace_back(r);
        },
        [&](std::size_t l) {
            if (keep_left) {
                out.left_indices.emplace_back(l);
                out.right_indices.emplace_back(std::nullopt);
            }
        },
        [&](std::size_t r) {
            out.left_indices.emplace_back(std::nullopt);
            out.right_indices.emplace_back(r);
        });
    if (!ok) {
        return std::unexpected(ok.error());
    }
    return out;
}

auto hash_full_outer_join_multi(const Table& left, const Table& right,
                                std::span<const std::size_t> left_on,
                                std::span<const std::size_t> right_on)
    -> QueryResult<OuterJoinResult> {
    return hash_join_with_type_multi(left, right, left_on, right_on, JoinType::FullOuter);
}

// ─── Single key ─────────────────────────────────────────────────────────────

auto hash_join(const Table& left, const Table& right, std::size_t left_on, std::size_t right_on)
    -> QueryResult<InnerJoinResult> {
    return hash_join_multi(left, right, single(left_on), single(right_on));
}

auto hash_left_join(const Table& left, const Table& right, std::size_t left_on,
                    std::size_t right_on) -> QueryResult<LeftJoinResult> {
    return hash_left_join_multi(left, right, single(left_on), single(right_on));
}

auto hash_right_join(const Table& left, const Table& right, std::size_t left_on,
                     std::size_t right_on) -> QueryResult<RightJoinResult> {
    return hash_right_join_multi(left, right, single(left_on), single(right_on));
}

auto hash_full_outer_join(const Table& left, const Table& right, std::size_t left_on,
                          std::size_t right_on) -> QueryResult<OuterJoinResult> {
    return hash_full_outer_join_multi(left, right, single(left_on), single(right_on));
}

auto hash_join_with_type(const Table& left, const Table& right, std::size_t left_on,
                         std::size_t right_on, JoinType type) -> QueryResult<OuterJoinResult> {
    return hash_join_with_type_multi(left, right, single(left_on), single(right_on), type);
}

}  // namespace strata
