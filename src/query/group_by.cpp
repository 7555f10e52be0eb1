#include <strata/query/group_by.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace strata {

namespace {

auto default_output_name(const Table& table, const AggSpec& spec) -> std::string {
    if (!spec.column) {
        return spec.op == AggOp::Count ? "count" : "agg";
    }
    const auto& name = table.schema()[*spec.column].name;
    return fmt::format("{}_{}", to_string(spec.op), name);
}

auto accepts(AggOp op, ColumnType type) noexcept -> bool {
    switch (op) {
        case AggOp::Count:
        case AggOp::DistinctCount:
            return true;
        case AggOp::Sum:
        case AggOp::Min:
        case AggOp::Max:
            return type != ColumnType::String;
        case AggOp::CountNumbers:
        case AggOp::Avg:
        case AggOp::Var:
        case AggOp::VarP:
        case AggOp::StdDev:
        case AggOp::StdDevP:
            return is_numeric(type);
    }
    return false;
}

auto make_state(AggOp op) -> AggState {
    switch (op) {
        case AggOp::Count:
            return CountState{};
        case AggOp::CountNumbers:
            return CountNumbersState{};
        case AggOp::Sum:
            return SumState{};
        case AggOp::Avg:
            return AvgState{};
        case AggOp::DistinctCount:
            return DistinctCountState{};
        case AggOp::Var:
            return VarianceState{.population = false, .root = false};
        case AggOp::VarP:
            return VarianceState{.population = true, .root = false};
        case AggOp::StdDev:
            return VarianceState{.population = false, .root = true};
        case AggOp::StdDevP:
            return VarianceState{.population = true, .root = true};
        case AggOp::Min:
            return MinMaxState{.is_max = false};
        case AggOp::Max:
            break;
    }
    return MinMaxState{.is_max = true};
}

/// IEEE 754 totalOrder as a signed integer: -NaN < -inf < ... < -0 < +0 < ...
/// < +inf < +NaN.
auto total_order_key(double v) noexcept -> std::int64_t {
    auto bits = std::bit_cast<std::int64_t>(v);
    bits ^= static_cast<std::int64_t>(static_cast<std::uint64_t>(bits >> 63) >> 1);
    return bits;
}

/// True when `candidate` should replace `current` (both non-null, same kind).
auto improves(const Scalar& candidate, const Scalar& current, bool is_max) noexcept -> bool {
    if (const auto* f = std::get_if<double>(&candidate)) {
        const auto a = total_order_key(*f);
        const auto b = total_order_key(std::get<double>(current));
        return is_max ? a > b : a < b;
    }
    if (const auto* i = std::get_if<std::int64_t>(&candidate)) {
        const auto b = std::get<std::int64_t>(current);
        return is_max ? *i > b : *i < b;
    }
    if (const auto* flag = std::get_if<bool>(&candidate)) {
        // Min is AND, Max is OR.
        return is_max ? *flag && !std::get<bool>(current) : !*flag && std::get<bool>(current);
    }
    return false;
}

void push_group(AggState& state) {
    std::visit(
        [](auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, SumState> || std::is_same_v<T, AvgState>) {
                s.sums.push_back(0.0);
                s.counts.push_back(0);
            } else if constexpr (std::is_same_v<T, VarianceState>) {
                s.counts.push_back(0);
                s.means.push_back(0.0);
                s.m2.push_back(0.0);
            } else if constexpr (std::is_same_v<T, MinMaxState>) {
                s.best.emplace_back();
            } else {
                s.counts.push_back(0);
            }
        },
        state);
}

void update(AggState& state, std::uint32_t group, const Scalar& value) {
    if (is_null(value)) {
        return;
    }
    std::visit(
        [&](auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, CountState>) {
                ++s.counts[group];
            } else if constexpr (std::is_same_v<T, CountNumbersState>) {
                if (scalar_as_f64(value)) {
                    ++s.counts[group];
                }
            } else if constexpr (std::is_same_v<T, SumState>) {
                std::optional<double> x = scalar_as_f64(value);
                if (const auto* flag = std::get_if<bool>(&value)) {
                    x = *flag ? 1.0 : 0.0;
                }
                if (x) {
                    s.sums[group] += *x;
                    ++s.counts[group];
                }
            } else if constexpr (std::is_same_v<T, AvgState>) {
                if (auto x = scalar_as_f64(value)) {
                    s.sums[group] += *x;
                    ++s.counts[group];
                }
            } else if constexpr (std::is_same_v<T, DistinctCountState>) {
                if (auto bits = distinct_bits(value)) {
                    if (s.seen.insert(DistinctKey{.group = group, .bits = *bits}).second) {
                        ++s.counts[group];
                    }
                }
            } else if constexpr (std::is_same_v<T, VarianceState>) {
                if (auto x = scalar_as_f64(value)) {
                    const std::uint64_t n = s.counts[group] + 1;
                    const double delta = *x - s.means[group];
                    s.means[group] += delta / static_cast<double>(n);
                    const double delta2 = *x - s.means[group];
                    s.m2[group] += delta * delta2;
                    s.counts[group] = n;
                }
            } else {
                auto& best = s.best[group];
                if (is_null(best) || improves(value, best, s.is_max)) {
                    best = value;
                }
            }
        },
        state);
}

auto counts_column(const std::vector<std::uint64_t>& counts) -> ResultColumn {
    FloatResult out{.validity = Bitmap::all_true(counts.size())};
    out.values.reserve(counts.size());
    for (auto c : counts) {
        out.values.push_back(static_cast<double>(c));
    }
    return out;
}

/// Typed output column from one scalar per group (NULL = monostate).
auto scalars_column(ColumnType type, const std::vector<Scalar>& values, DictionaryPtr dictionary)
    -> ResultColumn {
    Bitmap validity;
    validity.reserve(values.size());
    for (const auto& v : values) {
        validity.push(!is_null(v));
    }
    switch (type) {
        case ColumnType::Number: {
            FloatResult out;
            out.values.reserve(values.size());
            for (const auto& v : values) {
                out.values.push_back(is_null(v) ? 0.0 : std::get<double>(v));
            }
            out.validity = std::move(validity);
            return out;
        }
        case ColumnType::Boolean: {
            BoolResult out;
            out.values.reserve(values.size());
            for (const auto& v : values) {
                out.values.push(!is_null(v) && std::get<bool>(v));
            }
            out.validity = std::move(validity);
            return out;
        }
        case ColumnType::String: {
            DictResult out{.dictionary = std::move(dictionary)};
            out.values.reserve(values.size());
            for (const auto& v : values) {
                out.values.push_back(is_null(v) ? 0 : std::get<DictIndex>(v).value);
            }
            out.validity = std::move(validity);
            return out;
        }
        case ColumnType::DateTime:
        case ColumnType::Currency:
        case ColumnType::Percentage:
            break;
    }
    IntResult out;
    out.values.reserve(values.size());
    for (const auto& v : values) {
        out.values.push_back(is_null(v) ? 0 : std::get<std::int64_t>(v));
    }
    out.validity = std::move(validity);
    return out;
}

auto finish_state(AggState& state, ColumnType input_type) -> ResultColumn {
    return std::visit(
        [&](auto& s) -> ResultColumn {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, CountState> || std::is_same_v<T, CountNumbersState> ||
                          std::is_same_v<T, DistinctCountState>) {
                return counts_column(s.counts);
            } else if constexpr (std::is_same_v<T, SumState>) {
                FloatResult out{.values = std::move(s.sums)};
                for (auto c : s.counts) {
                    out.validity.push(c > 0);
                }
                return out;
            } else if constexpr (std::is_same_v<T, AvgState>) {
                FloatResult out;
                for (std::size_t g = 0; g < s.counts.size(); ++g) {
                    const bool valid = s.counts[g] > 0;
                    out.values.push_back(valid ? s.sums[g] / static_cast<double>(s.counts[g])
                                               : 0.0);
                    out.validity.push(valid);
                }
                return out;
            } else if constexpr (std::is_same_v<T, VarianceState>) {
                FloatResult out;
                const std::uint64_t min_count = s.population ? 1 : 2;
                for (std::size_t g = 0; g < s.counts.size(); ++g) {
                    const auto n = s.counts[g];
                    if (n < min_count) {
                        out.values.push_back(0.0);
                        out.validity.push(false);
                        continue;
                    }
                    const double divisor = static_cast<double>(s.population ? n : n - 1);
                    const double variance = s.m2[g] / divisor;
                    out.values.push_back(s.root ? std::sqrt(variance) : variance);
                    out.validity.push(true);
                }
                return out;
            } else {
                return scalars_column(input_type, s.best, nullptr);
            }
        },
        state);
}

}  // namespace

auto to_string(AggOp op) noexcept -> std::string_view {
    switch (op) {
        case AggOp::Count:
            return "count";
        case AggOp::CountNumbers:
            return "count_numbers";
        case AggOp::Sum:
            return "sum";
        case AggOp::Avg:
            return "avg";
        case AggOp::DistinctCount:
            return "distinct_count";
        case AggOp::Var:
            return "var";
        case AggOp::VarP:
            return "var_p";
        case AggOp::StdDev:
            return "std_dev";
        case AggOp::StdDevP:
            return "std_dev_p";
        case AggOp::Min:
            return "min";
        case AggOp::Max:
            return "max";
    }
    return "agg";
}

// ─── AggSpec builders ───────────────────────────────────────────────────────

auto AggSpec::with_name(std::string output_name) && -> AggSpec {
    name = std::move(output_name);
    return std::move(*this);
}

auto count_rows() -> AggSpec {
    return AggSpec{.op = AggOp::Count};
}

auto count_non_null(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::Count, .column = col};
}

auto count_numbers(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::CountNumbers, .column = col};
}

auto sum(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::Sum, .column = col};
}

auto avg(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::Avg, .column = col};
}

auto distinct_count(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::DistinctCount, .column = col};
}

auto var(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::Var, .column = col};
}

auto var_p(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::VarP, .column = col};
}

auto std_dev(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::StdDev, .column = col};
}

auto std_dev_p(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::StdDevP, .column = col};
}

auto min(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::Min, .column = col};
}

auto max(std::size_t col) -> AggSpec {
    return AggSpec{.op = AggOp::Max, .column = col};
}

// ─── GroupByResult ──────────────────────────────────────────────────────────

auto GroupByResult::value_at(std::size_t row, std::size_t col) const -> Value {
    if (row >= rows_ || col >= columns_.size()) {
        throw std::out_of_range(fmt::format("cell ({}, {}) out of range for {}x{} result", row,
                                            col, rows_, columns_.size()));
    }
    const ColumnType type = schema_[col].type;
    return std::visit(
        [&](const auto& column) -> Value {
            using T = std::decay_t<decltype(column)>;
            if (!column.validity.get(row)) {
                return Null{};
            }
            if constexpr (std::is_same_v<T, IntResult>) {
                return make_integer_value(type, column.values[row]);
            } else if constexpr (std::is_same_v<T, FloatResult>) {
                return column.values[row];
            } else if constexpr (std::is_same_v<T, BoolResult>) {
                return column.values.get(row);
            } else {
                if (!column.dictionary) {
                    throw std::out_of_range(
                        fmt::format("result column {} has no dictionary", col));
                }
                return column.dictionary->at(column.values[row]);
            }
        },
        columns_[col]);
}

auto GroupByResult::to_values() const -> std::vector<std::vector<Value>> {
    std::vector<std::vector<Value>> grid(columns_.size());
    for (std::size_t c = 0; c < columns_.size(); ++c) {
        grid[c].reserve(rows_);
        for (std::size_t r = 0; r < rows_; ++r) {
            grid[c].push_back(value_at(r, c));
        }
    }
    return grid;
}

auto GroupByResult::to_table(TableOptions options) const -> Table {
    TableBuilder builder(schema_, options);
    std::vector<Value> row(columns_.size());
    for (std::size_t r = 0; r < rows_; ++r) {
        for (std::size_t c = 0; c < columns_.size(); ++c) {
            row[c] = value_at(r, c);
        }
        builder.append_row(row);
    }
    return builder.finish();
}

// ─── GroupByEngine ──────────────────────────────────────────────────────────

auto GroupByEngine::create(const Table& table, std::span<const std::size_t> keys,
                           std::span<const AggSpec> aggs) -> QueryResult<GroupByEngine> {
    if (keys.empty()) {
        return std::unexpected(QueryError::empty_keys());
    }
    GroupByEngine engine;
    engine.table_ = table;
    const std::size_t rows = table.row_count();

    for (std::size_t col : keys) {
        if (auto ok = check_column(col, table.column_count()); !ok) {
            return std::unexpected(ok.error());
        }
        const ColumnType type = table.column_type(col);
        DictionaryPtr dictionary;
        if (type == ColumnType::String) {
            dictionary = table.dictionary(col);
            if (!dictionary) {
                return std::unexpected(QueryError::missing_dictionary(col));
            }
        }
        engine.keys_.push_back(KeyColumn{.col = col, .type = type, .dictionary = dictionary});
        engine.output_schema_.push_back(table.schema()[col]);
    }

    for (std::size_t i = 0; i < aggs.size(); ++i) {
        const auto& spec = aggs[i];
        if (spec.column) {
            if (auto ok = check_column(*spec.column, table.column_count()); !ok) {
                return std::unexpected(ok.error());
            }
        }
        std::string name = spec.name.value_or(default_output_name(table, spec));
        if (!spec.column) {
            if (spec.op != AggOp::Count) {
                return std::unexpected(QueryError::unsupported_column_type(
                    0, std::nullopt, fmt::format("{} without input column", to_string(spec.op))));
            }
            engine.row_counters_.push_back(i);
            engine.agg_types_.push_back(ColumnType::Number);
            engine.states_.push_back(CountState{});
            engine.output_schema_.push_back(ColumnSchema{std::move(name), ColumnType::Number});
            continue;
        }
        const std::size_t col = *spec.column;
        const ColumnType type = table.column_type(col);
        if (!accepts(spec.op, type)) {
            return std::unexpected(
                QueryError::unsupported_column_type(col, type, std::string(to_string(spec.op))));
        }
        AggState state = make_state(spec.op);
        if (auto* distinct = std::get_if<DistinctCountState>(&state)) {
            if (const auto* stats = table.stats(col); stats != nullptr && stats->distinct_count) {
                distinct->seen.reserve(
                    std::min<std::size_t>(static_cast<std::size_t>(*stats->distinct_count), rows));
            }
        }
        engine.states_.push_back(std::move(state));
        engine.agg_types_.push_back(type);
        const bool keeps_type = spec.op == AggOp::Min || spec.op == AggOp::Max;
        engine.output_schema_.push_back(
            ColumnSchema{std::move(name), keeps_type ? type : ColumnType::Number});

        auto plan = std::ranges::find_if(engine.plans_,
                                         [col](const AggColumnPlan& p) { return p.col == col; });
        if (plan == engine.plans_.end()) {
            std::optional<std::size_t> key_pos;
            if (auto key = std::ranges::find(keys, col); key != keys.end()) {
                key_pos = static_cast<std::size_t>(key - keys.begin());
            }
            engine.plans_.push_back(AggColumnPlan{.col = col, .type = type, .key_pos = key_pos});
            plan = std::prev(engine.plans_.end());
        }
        plan->aggs.push_back(i);
    }

    if (const auto* stats = table.stats(keys.front()); stats != nullptr && stats->distinct_count) {
        const auto hint = std::min<std::size_t>(static_cast<std::size_t>(*stats->distinct_count),
                                                rows);
        spdlog::debug("group by: reserving {} groups from distinct count of column {}", hint,
                      keys.front());
        engine.groups_.reserve(hint);
    }

    engine.key_scalars_.resize(engine.keys_.size());
    engine.key_values_.resize(engine.keys_.size());
    engine.plan_scalars_.resize(engine.plans_.size());
    return engine;
}

auto GroupByEngine::load_row(std::size_t row) -> QueryResult<void> {
    const std::size_t page = row / table_.page_size_rows();
    const std::size_t idx = row % table_.page_size_rows();
    for (std::size_t k = 0; k < keys_.size(); ++k) {
        const auto& key = keys_[k];
        auto scalar = scalar_at(key.col, key.type, table_.pages(key.col)[page], idx);
        if (!scalar) {
            return std::unexpected(scalar.error());
        }
        key_scalars_[k] = *scalar;
    }
    for (std::size_t p = 0; p < plans_.size(); ++p) {
        const auto& plan = plans_[p];
        if (plan.key_pos) {
            plan_scalars_[p] = key_scalars_[*plan.key_pos];
            continue;
        }
        auto scalar = scalar_at(plan.col, plan.type, table_.pages(plan.col)[page], idx);
        if (!scalar) {
            return std::unexpected(scalar.error());
        }
        plan_scalars_[p] = *scalar;
    }
    return {};
}

void GroupByEngine::fold_row() {
    for (std::size_t k = 0; k < keys_.size(); ++k) {
        key_values_[k] = make_key(key_scalars_[k]);
    }
    std::uint32_t group = 0;
    if (auto it = groups_.find(key_values_); it != groups_.end()) {
        group = it->second;
    } else {
        group = static_cast<std::uint32_t>(group_rows_++);
        groups_.emplace(key_values_, group);
        for (std::size_t k = 0; k < keys_.size(); ++k) {
            keys_[k].values.push_back(key_scalars_[k]);
        }
        for (auto& state : states_) {
            push_group(state);
        }
    }
    for (std::size_t idx : row_counters_) {
        ++std::get<CountState>(states_[idx]).counts[group];
    }
    for (std::size_t p = 0; p < plans_.size(); ++p) {
        for (std::size_t agg : plans_[p].aggs) {
            update(states_[agg], group, plan_scalars_[p]);
        }
    }
}

auto GroupByEngine::consume_rows(std::span<const std::size_t> rows) -> QueryResult<void> {
    const std::size_t row_count = table_.row_count();
    for (std::size_t row : rows) {
        if (row >= row_count) {
            return std::unexpected(QueryError::row_out_of_bounds(row, row_count));
        }
        if (auto loaded = load_row(row); !loaded) {
            return loaded;
        }
        fold_row();
    }
    return {};
}

auto GroupByEngine::consume_mask(const Bitmap& mask) -> QueryResult<void> {
    if (mask.size() != table_.row_count()) {
        return std::unexpected(
            QueryError::internal_invariant("group-by mask length must match table"));
    }
    if (mask.all_set()) {
        return consume_all();
    }
    for (std::size_t row = mask.next_one(0); row < mask.size(); row = mask.next_one(row + 1)) {
        if (auto loaded = load_row(row); !loaded) {
            return loaded;
        }
        fold_row();
    }
    return {};
}

auto GroupByEngine::consume_chunks(std::size_t start, std::size_t end) -> QueryResult<void> {
    end = std::min(end, table_.page_count());
    std::vector<PageCursor> key_cursors;
    std::vector<std::optional<PageCursor>> plan_cursors;
    for (std::size_t page = start; page < end; ++page) {
        key_cursors.clear();
        plan_cursors.clear();
        for (const auto& key : keys_) {
            auto cursor = PageCursor::open(key.col, key.type, table_.pages(key.col)[page]);
            if (!cursor) {
                return std::unexpected(cursor.error());
            }
            key_cursors.push_back(std::move(*cursor));
        }
        for (const auto& plan : plans_) {
            if (plan.key_pos) {
                plan_cursors.emplace_back();
                continue;
            }
            auto cursor = PageCursor::open(plan.col, plan.type, table_.pages(plan.col)[page]);
            if (!cursor) {
                return std::unexpected(cursor.error());
            }
            plan_cursors.emplace_back(std::move(*cursor));
        }

        const std::size_t len = key_cursors.front().remaining();
        for (std::size_t i = 0; i < len; ++i) {
            for (std::size_t k = 0; k < keys_.size(); ++k) {
                key_scalars_[k] = key_cursors[k].next();
            }
            for (std::size_t p = 0; p < plans_.size(); ++p) {
                plan_scalars_[p] = plans_[p].key_pos ? key_scalars_[*plans_[p].key_pos]
                                                     : plan_cursors[p]->next();
            }
            fold_row();
        }
    }
    return {};
}

auto GroupByEngine::consume_all() -> QueryResult<void> {
    return consume_chunks(0, table_.page_count());
}

auto GroupByEngine::finish() && -> GroupByResult {
    std::vector<ResultColumn> columns;
    columns.reserve(keys_.size() + states_.size());
    for (const auto& key : keys_) {
        columns.push_back(scalars_column(key.type, key.values, key.dictionary));
    }
    for (std::size_t i = 0; i < states_.size(); ++i) {
        columns.push_back(finish_state(states_[i], agg_types_[i]));
    }
    spdlog::debug("group by: {} groups over {} rows", group_rows_, table_.row_count());
    return GroupByResult(std::move(output_schema_), std::move(columns), group_rows_);
}

// ─── One-shot helpers ───────────────────────────────────────────────────────

auto group_by(const Table& table, std::span<const std::size_t> keys,
              std::span<const AggSpec> aggs) -> QueryResult<GroupByResult> {
    auto engine = GroupByEngine::create(table, keys, aggs);
    if (!engine) {
        return std::unexpected(engine.error());
    }
    if (auto ok = engine->consume_all(); !ok) {
        return std::unexpected(ok.error());
    }
    return std::move(*engine).finish();
}

auto group_by_rows(const Table& table, std::span<const std::size_t> keys,
                   std::span<const AggSpec> aggs, std::span<const std::size_t> rows)
    -> QueryResult<GroupByResult> {
    auto engine = GroupByEngine::create(table, keys, aggs);
    if (!engine) {
        return std::unexpected(engine.error());
    }
    if (auto ok = engine->consume_rows(rows); !ok) {
        return std::unexpected(ok.error());
    }
    return std::move(*engine).finish();
}

auto group_by_mask(const Table& table, std::span<const std::size_t> keys,
                   std::span<const AggSpec> aggs, const Bitmap& mask)
    -> QueryResult<GroupByResult> {
    auto engine = GroupByEngine::create(table, keys, aggs);
    if (!engine) {
        return std::unexpected(engine.error());
    }
    if (auto ok = engine->consume_mask(mask); !ok) {
        return std::unexpected(ok.error());
    }
    return std::move(*engine).finish();
}

}  // namespace strata
