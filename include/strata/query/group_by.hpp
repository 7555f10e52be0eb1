#pragma once

#include <strata/core/bitmap.hpp>
#include <strata/core/table.hpp>
#include <strata/query/error.hpp>
#include <strata/query/key.hpp>
#include <strata/query/scalar.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata {

/// Supported aggregation operators.
enum class AggOp : std::uint8_t {
    Count,
    CountNumbers,
    Sum,
    Avg,
    DistinctCount,
    Var,
    VarP,
    StdDev,
    StdDevP,
    Min,
    Max,
};

[[nodiscard]] auto to_string(AggOp op) noexcept -> std::string_view;

/// Aggregation specification: apply `op` to `column`, store as `name`.
///
/// Count without a column counts rows; every other operator needs a column.
/// An unnamed output is named after its input column, e.g. `sum_price`.
struct AggSpec {
    AggOp op = AggOp::Count;
    std::optional<std::size_t> column;
    std::optional<std::string> name;

    [[nodiscard]] auto with_name(std::string output_name) && -> AggSpec;
};

[[nodiscard]] auto count_rows() -> AggSpec;
[[nodiscard]] auto count_non_null(std::size_t col) -> AggSpec;
[[nodiscard]] auto count_numbers(std::size_t col) -> AggSpec;
[[nodiscard]] auto sum(std::size_t col) -> AggSpec;
[[nodiscard]] auto avg(std::size_t col) -> AggSpec;
[[nodiscard]] auto distinct_count(std::size_t col) -> AggSpec;
[[nodiscard]] auto var(std::size_t col) -> AggSpec;
[[nodiscard]] auto var_p(std::size_t col) -> AggSpec;
[[nodiscard]] auto std_dev(std::size_t col) -> AggSpec;
[[nodiscard]] auto std_dev_p(std::size_t col) -> AggSpec;
[[nodiscard]] auto min(std::size_t col) -> AggSpec;
[[nodiscard]] auto max(std::size_t col) -> AggSpec;

// ─── Result columns ─────────────────────────────────────────────────────────

/// Finished output column. `validity` is false for NULL rows.
struct IntResult {
    std::vector<std::int64_t> values;
    Bitmap validity;
};
struct FloatResult {
    std::vector<double> values;
    Bitmap validity;
};
struct BoolResult {
    Bitmap values;
    Bitmap validity;
};
struct DictResult {
    std::vector<std::uint32_t> values;
    Bitmap validity;
    DictionaryPtr dictionary;
};

using ResultColumn = std::variant<IntResult, FloatResult, BoolResult, DictResult>;

/// Output of a group-by: key columns (caller order) then aggregation columns
/// (caller order), one row per group in first-seen order.
class GroupByResult {
   public:
    GroupByResult() = default;
    GroupByResult(std::vector<ColumnSchema> schema, std::vector<ResultColumn> columns,
                  std::size_t rows)
        : schema_(std::move(schema)), columns_(std::move(columns)), rows_(rows) {}

    [[nodiscard]] auto schema() const noexcept -> const std::vector<ColumnSchema>& {
        return schema_;
    }
    [[nodiscard]] auto row_count() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto column_count() const noexcept -> std::size_t { return columns_.size(); }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<ResultColumn>& {
        return columns_;
    }

    /// Decode one cell. Throws std::out_of_range for bad indices.
    [[nodiscard]] auto value_at(std::size_t row, std::size_t col) const -> Value;

    /// Column-major grid: `to_values()[col][row]`.
    [[nodiscard]] auto to_values() const -> std::vector<std::vector<Value>>;

    /// Encode into a fresh table with this result's schema.
    [[nodiscard]] auto to_table(TableOptions options = {}) const -> Table;

   private:
    std::vector<ColumnSchema> schema_;
    std::vector<ResultColumn> columns_;
    std::size_t rows_ = 0;
};

// ─── Accumulators ───────────────────────────────────────────────────────────
// One state per aggregation, one slot per group.

struct CountState {
    std::vector<std::uint64_t> counts;
};
struct CountNumbersState {
    std::vector<std::uint64_t> counts;
};
struct SumState {
    std::vector<double> sums;
    std::vector<std::uint64_t> counts;
};
struct AvgState {
    std::vector<double> sums;
    std::vector<std::uint64_t> counts;
};
struct DistinctKey {
    std::uint32_t group = 0;
    std::uint64_t bits = 0;
    auto operator==(const DistinctKey&) const -> bool = default;
};
struct DistinctKeyHash {
    auto operator()(const DistinctKey& key) const noexcept -> std::size_t {
        return static_cast<std::size_t>(mix64(key.bits ^ mix64(key.group)));
    }
};
struct DistinctCountState {
    std::vector<std::uint64_t> counts;
    robin_hood::unordered_flat_set<DistinctKey, DistinctKeyHash> seen;
};
/// Welford running mean and sum of squared deviations.
struct VarianceState {
    bool population = false;
    bool root = false;
    std::vector<std::uint64_t> counts;
    std::vector<double> means;
    std::vector<double> m2;
};
struct MinMaxState {
    bool is_max = false;
    std::vector<Scalar> best;
};

using AggState = std::variant<CountState, CountNumbersState, SumState, AvgState,
                              DistinctCountState, VarianceState, MinMaxState>;

// ─── Engine ─────────────────────────────────────────────────────────────────

/// Streaming hash group-by over an encoded table.
///
/// Created bound to a table and a key/aggregation plan; any number of
/// consume_* calls fold rows in; `finish()` consumes the engine. Group ids,
/// and therefore output rows, follow first-seen order. The engine keeps a
/// shared, read-only handle on the table. Not thread-safe.
class GroupByEngine {
   public:
    /// Validate the plan against `table`. Fails on empty keys, out-of-range
    /// columns, missing dictionaries and operator/type mismatches.
    [[nodiscard]] static auto create(const Table& table, std::span<const std::size_t> keys,
                                     std::span<const AggSpec> aggs)
        -> QueryResult<GroupByEngine>;

    /// Fold the listed rows, in order. An out-of-range row stops the call with
    /// RowOutOfBounds; rows before it stay folded.
    auto consume_rows(std::span<const std::size_t> rows) -> QueryResult<void>;

    /// Fold the rows set in `mask`.
    auto consume_mask(const Bitmap& mask) -> QueryResult<void>;

    /// Fold pages [start, end); `end` is clamped to the page count.
    auto consume_chunks(std::size_t start, std::size_t end) -> QueryResult<void>;

    auto consume_all() -> QueryResult<void>;

    [[nodiscard]] auto group_count() const noexcept -> std::size_t { return group_rows_; }

    /// Finalize. Terminal: the engine is consumed.
    [[nodiscard]] auto finish() && -> GroupByResult;

   private:
    struct KeyColumn {
        std::size_t col;
        ColumnType type;
        DictionaryPtr dictionary;
        std::vector<Scalar> values;  // one per group
    };
    /// Aggregations sharing one input column, decoded once per row.
    struct AggColumnPlan {
        std::size_t col;
        ColumnType type;
        std::vector<std::size_t> aggs;
        std::optional<std::size_t> key_pos;
    };

    GroupByEngine() = default;

    auto load_row(std::size_t row) -> QueryResult<void>;
    void fold_row();

    Table table_;
    std::vector<KeyColumn> keys_;
    std::vector<ColumnSchema> output_schema_;
    std::vector<ColumnType> agg_types_;
    std::vector<AggState> states_;
    std::vector<AggColumnPlan> plans_;
    std::vector<std::size_t> row_counters_;  // Count aggregations without a column
    robin_hood::unordered_flat_map<std::vector<KeyValue>, std::uint32_t, CompositeKeyHash> groups_;
    std::size_t group_rows_ = 0;

    // Per-row scratch, reused across rows.
    std::vector<Scalar> key_scalars_;
    std::vector<KeyValue> key_values_;
    std::vector<Scalar> plan_scalars_;
};

[[nodiscard]] auto group_by(const Table& table, std::span<const std::size_t> keys,
                            std::span<const AggSpec> aggs) -> QueryResult<GroupByResult>;

[[nodiscard]] auto group_by_rows(const Table& table, std::span<const std::size_t> keys,
                                 std::span<const AggSpec> aggs, std::span<const std::size_t> rows)
    -> QueryResult<GroupByResult>;

[[nodiscard]] auto group_by_mask(const Table& table, std::span<const std::size_t> keys,
                                 std::span<const AggSpec> aggs, const Bitmap& mask)
    -> QueryResult<GroupByResult>;

}  // namespace strata
