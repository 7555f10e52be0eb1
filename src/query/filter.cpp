#include <strata/query/filter.hpp>
#include <strata/query/scalar.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <type_traits>
#include <utility>

namespace strata {

namespace {

using namespace encoding;

auto is_ordering(CompareOp op) noexcept -> bool {
    return op == CompareOp::Lt || op == CompareOp::Le || op == CompareOp::Gt ||
           op == CompareOp::Ge;
}

auto unsupported(std::size_t col, ColumnType type, std::string_view what, CompareOp op)
    -> std::unexpected<QueryError> {
    return std::unexpected(
        QueryError::unsupported_column_type(col, type, fmt::format("{} ({})", what, to_string(op))));
}

auto all_null_per_stats(const Table& table, std::size_t col) -> bool {
    const auto* stats = table.stats(col);
    return stats != nullptr && stats->null_count && *stats->null_count == table.row_count();
}

/// Rows whose cell in `col` is NULL.
auto null_mask(const Table& table, std::size_t col) -> QueryResult<Bitmap> {
    if (auto ok = check_column(col, table.column_count()); !ok) {
        return std::unexpected(ok.error());
    }
    const std::size_t rows = table.row_count();
    if (const auto* stats = table.stats(col); stats != nullptr && stats->null_count) {
        if (*stats->null_count == 0) {
            return Bitmap::all_false(rows);
        }
        if (*stats->null_count == rows) {
            return Bitmap::all_true(rows);
        }
    }
    const auto& pages = table.pages(col);
    const bool any_validity = std::ranges::any_of(
        pages, [](const EncodedPage& page) { return page_validity(page).has_value(); });
    if (!any_validity) {
        return Bitmap::all_false(rows);
    }
    Bitmap out;
    out.reserve(rows);
    for (const auto& page : pages) {
        const std::size_t len = page_len(page);
        const auto& validity = page_validity(page);
        if (!validity) {
            out.extend_constant(false, len);
        } else if (validity->none_set()) {
            out.extend_constant(true, len);
        } else if (validity->all_set()) {
            out.extend_constant(false, len);
        } else {
            for (std::size_t i = 0; i < len; ++i) {
                out.push(!validity->get(i));
            }
        }
    }
    return out;
}

auto not_null_mask(const Table& table, std::size_t col) -> QueryResult<Bitmap> {
    auto mask = null_mask(table, col);
    if (mask) {
        mask->not_inplace();
    }
    return mask;
}

// ─── Numeric comparison ─────────────────────────────────────────────────────

/// Invoke `f` with a `double -> bool` predicate implementing `v <op> rhs`.
template <typename F>
auto with_f64_predicate(CompareOp op, double rhs, F&& f) {
    const bool nan = std::isnan(rhs);
    switch (op) {
        case CompareOp::Eq:
            if (nan) {
                return f([](double v) { return std::isnan(v); });
            }
            return f([rhs](double v) { return v == rhs; });
        case CompareOp::Ne:
            if (nan) {
                return f([](double v) { return !std::isnan(v); });
            }
            return f([rhs](double v) { return !(v == rhs); });
        case CompareOp::Lt:
            return f([rhs](double v) { return v < rhs; });
        case CompareOp::Le:
            return f([rhs](double v) { return v <= rhs; });
        case CompareOp::Gt:
            return f([rhs](double v) { return v > rhs; });
        case CompareOp::Ge:
            break;
    }
    return f([rhs](double v) { return v >= rhs; });
}

auto eval_number(const Table& table, std::size_t col, CompareOp op, double rhs)
    -> QueryResult<Bitmap> {
    if (auto ok = check_column(col, table.column_count()); !ok) {
        return std::unexpected(ok.error());
    }
    const ColumnType type = table.column_type(col);
    if (type != ColumnType::Number) {
        return unsupported(col, type, "numeric comparison", op);
    }
    const std::size_t rows = table.row_count();
    if (std::isnan(rhs) && is_ordering(op)) {
        return Bitmap::all_false(rows);
    }
    if (all_null_per_stats(table, col)) {
        return Bitmap::all_false(rows);
    }
    const auto* stats = table.stats(col);
    if (stats != nullptr && !std::isnan(rhs) && stats->min && stats->max) {
        const auto* min = std::get_if<double>(&*stats->min);
        const auto* max = std::get_if<double>(&*stats->max);
        if (min != nullptr && max != nullptr) {
            const bool outside = rhs < *min || rhs > *max;
            bool none = false;
            switch (op) {
                case CompareOp::Eq:
                    none = outside;
                    break;
                case CompareOp::Ne:
                    if (outside) {
                        spdlog::debug("filter: column {} <> {} answered from min/max", col, rhs);
                        return not_null_mask(table, col);
                    }
                    break;
                case CompareOp::Lt:
                    none = *min >= rhs;
                    break;
                case CompareOp::Le:
                    none = *min > rhs;
                    break;
                case CompareOp::Gt:
                    none = *max <= rhs;
                    break;
                case CompareOp::Ge:
                    none = *max < rhs;
                    break;
            }
            if (none) {
                spdlog::debug("filter: column {} {} {} answered from min/max", col,
                              to_string(op), rhs);
                return Bitmap::all_false(rows);
            }
        }
    }

    return with_f64_predicate(op, rhs, [&](auto pred) -> QueryResult<Bitmap> {
        Bitmap out;
        out.reserve(rows);
        for (const auto& page : table.pages(col)) {
            const auto* floats = std::get_if<FloatPage>(&page);
            if (floats == nullptr) {
                return unsupported(col, type, "numeric comparison", op);
            }
            const auto& values = floats->values;
            const auto& validity = floats->validity;
            if (validity && validity->none_set()) {
                out.extend_constant(false, values.size());
                continue;
            }
            if (!validity || validity->all_set()) {
                for (double v : values) {
                    out.push(pred(v));
                }
                continue;
            }
            for (std::size_t i = 0; i < values.size(); ++i) {
                out.push(validity->get(i) && pred(values[i]));
            }
        }
        return out;
    });
}

// ─── Boolean comparison ─────────────────────────────────────────────────────

auto eval_bool(const Table& table, std::size_t col, CompareOp op, bool rhs)
    -> QueryResult<Bitmap> {
    if (auto ok = check_column(col, table.column_count()); !ok) {
        return std::unexpected(ok.error());
    }
    const ColumnType type = table.column_type(col);
    if (type != ColumnType::Boolean || is_ordering(op)) {
        return unsupported(col, type, "boolean comparison", op);
    }
    const std::size_t rows = table.row_count();
    // Rows match when their bit equals `want`.
    const bool want = op == CompareOp::Eq ? rhs : !rhs;
    if (all_null_per_stats(table, col)) {
        return Bitmap::all_false(rows);
    }
    const auto* stats = table.stats(col);
    if (stats != nullptr && stats->sum && std::isfinite(*stats->sum) && stats->null_count &&
        *stats->null_count <= rows) {
        // The true count comes from a float sum: rounded, then clamped to
        // [0, non_null + 1] so an oversized sum matches neither shortcut.
        const auto non_null = rows - static_cast<std::size_t>(*stats->null_count);
        const double rounded = std::clamp(std::round(*stats->sum), 0.0,
                                          static_cast<double>(non_null) + 1.0);
        const auto true_count = static_cast<std::size_t>(rounded);
        const std::size_t none_at = want ? 0 : non_null;
        const std::size_t all_at = want ? non_null : 0;
        if (true_count == none_at) {
            spdlog::debug("filter: boolean column {} answered from true count", col);
            return Bitmap::all_false(rows);
        }
        if (true_count == all_at) {
            spdlog::debug("filter: boolean column {} answered from true count", col);
            return not_null_mask(table, col);
        }
    }

    Bitmap out;
    out.reserve(rows);
    for (const auto& page : table.pages(col)) {
        const auto* bools = std::get_if<BoolPage>(&page);
        if (bools == nullptr) {
            return unsupported(col, type, "boolean comparison", op);
        }
        const std::size_t len = bools->len;
        const auto& validity = bools->validity;
        if (validity && validity->none_set()) {
            out.extend_constant(false, len);
            continue;
        }
        if (!validity || validity->all_set()) {
            const std::size_t full_bytes = len / 8;
            for (std::size_t b = 0; b < full_bytes; ++b) {
                const std::uint8_t byte = bools->data[b];
                if (byte == 0x00) {
                    out.extend_constant(!want, 8);
                } else if (byte == 0xFF) {
                    out.extend_constant(want, 8);
                } else {
                    for (unsigned bit = 0; bit < 8; ++bit) {
                        out.push((((byte >> bit) & 1U) != 0) == want);
                    }
                }
            }
            for (std::size_t i = full_bytes * 8; i < len; ++i) {
                out.push(bool_bit(bools->data, i) == want);
            }
            continue;
        }
        for (std::size_t i = 0; i < len; ++i) {
            out.push(validity->get(i) && bool_bit(bools->data, i) == want);
        }
    }
    return out;
}

// ─── String comparison ──────────────────────────────────────────────────────

/// Scan the dictionary pages of `col`, setting a row when `matches(index)`.
/// Fully valid run-length pages emit whole runs at once.
template <typename Matches>
auto scan_dict_pages(const Table& table, std::size_t col, CompareOp op, std::string_view what,
                     Matches&& matches) -> QueryResult<Bitmap> {
    const ColumnType type = table.column_type(col);
    Bitmap out;
    out.reserve(table.row_count());
    for (const auto& page : table.pages(col)) {
        const auto* dict = std::get_if<DictPage>(&page);
        if (dict == nullptr) {
            return unsupported(col, type, what, op);
        }
        const auto& validity = dict->validity;
        if (validity && validity->none_set()) {
            out.extend_constant(false, dict->len);
            continue;
        }
        const bool all_valid = !validity || validity->all_set();
        if (const auto* rle = std::get_if<RunLength<std::uint32_t>>(&dict->indices);
            rle != nullptr && all_valid) {
            std::uint32_t start = 0;
            for (std::size_t run = 0; run < rle->values.size(); ++run) {
                out.extend_constant(matches(rle->values[run]), rle->ends[run] - start);
                start = rle->ends[run];
            }
            continue;
        }
        SequenceCursor<std::uint32_t> cursor(dict->indices);
        for (std::size_t i = 0; i < dict->len; ++i) {
            const std::uint32_t idx = cursor.next();
            out.push((all_valid || validity->get(i)) && matches(idx));
        }
    }
    return out;
}

auto check_string_column(const Table& table, std::size_t col, CompareOp op,
                         std::string_view what) -> QueryResult<const Dictionary*> {
    if (auto ok = check_column(col, table.column_count()); !ok) {
        return std::unexpected(ok.error());
    }
    const ColumnType type = table.column_type(col);
    if (type != ColumnType::String || is_ordering(op)) {
        return unsupported(col, type, what, op);
    }
    const auto& dict = table.dictionary(col);
    if (!dict) {
        return std::unexpected(QueryError::missing_dictionary(col));
    }
    return dict.get();
}

auto eval_string(const Table& table, std::size_t col, CompareOp op, const std::string& rhs)
    -> QueryResult<Bitmap> {
    auto dict = check_string_column(table, col, op, "string comparison");
    if (!dict) {
        return std::unexpected(dict.error());
    }
    const std::size_t rows = table.row_count();
    const bool eq = op == CompareOp::Eq;
    if (all_null_per_stats(table, col)) {
        return Bitmap::all_false(rows);
    }
    if (const auto* stats = table.stats(col); stats != nullptr && stats->min && stats->max) {
        const auto* min = std::get_if<std::string>(&*stats->min);
        const auto* max = std::get_if<std::string>(&*stats->max);
        if (min != nullptr && max != nullptr && (rhs < *min || rhs > *max)) {
            spdlog::debug("filter: string column {} answered from min/max", col);
            return eq ? QueryResult<Bitmap>(Bitmap::all_false(rows)) : not_null_mask(table, col);
        }
    }

    const auto& entries = **dict;
    std::optional<std::uint32_t> target;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i] == rhs) {
            target = static_cast<std::uint32_t>(i);
            break;
        }
    }
    if (!target) {
        return eq ? QueryResult<Bitmap>(Bitmap::all_false(rows)) : not_null_mask(table, col);
    }
    const std::uint32_t wanted = *target;
    return scan_dict_pages(table, col, op, "string comparison",
                           [wanted, eq](std::uint32_t idx) { return (idx == wanted) == eq; });
}

auto equals_ignore_ascii_case(std::string_view a, std::string_view b) noexcept -> bool {
    auto lower = [](unsigned char ch) -> unsigned char {
        return (ch >= 'A' && ch <= 'Z') ? static_cast<unsigned char>(ch - 'A' + 'a') : ch;
    };
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [&](char x, char y) {
               return lower(static_cast<unsigned char>(x)) == lower(static_cast<unsigned char>(y));
           });
}

auto eval_string_ci(const Table& table, std::size_t col, CompareOp op, const std::string& rhs)
    -> QueryResult<Bitmap> {
    auto dict = check_string_column(table, col, op, "case-insensitive comparison");
    if (!dict) {
        return std::unexpected(dict.error());
    }
    const std::size_t rows = table.row_count();
    const bool eq = op == CompareOp::Eq;
    if (all_null_per_stats(table, col)) {
        return Bitmap::all_false(rows);
    }

    const auto& entries = **dict;
    std::vector<std::uint8_t> members(entries.size(), 0);
    std::size_t matched = 0;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (equals_ignore_ascii_case(entries[i], rhs)) {
            members[i] = 1;
            ++matched;
        }
    }
    if (matched == 0) {
        return eq ? QueryResult<Bitmap>(Bitmap::all_false(rows)) : not_null_mask(table, col);
    }
    if (matched == entries.size()) {
        return eq ? not_null_mask(table, col) : QueryResult<Bitmap>(Bitmap::all_false(rows));
    }
    return scan_dict_pages(table, col, op, "case-insensitive comparison",
                           [&members, eq](std::uint32_t idx) {
                               const bool member = idx < members.size() && members[idx] != 0;
                               return member == eq;
                           });
}

auto eval_cmp(const Table& table, const FilterCmp& cmp) -> QueryResult<Bitmap> {
    return std::visit(
        [&](const auto& literal) -> QueryResult<Bitmap> {
            using T = std::decay_t<decltype(literal)>;
            if constexpr (std::is_same_v<T, double>) {
                return eval_number(table, cmp.col, cmp.op, literal);
            } else if constexpr (std::is_same_v<T, bool>) {
                return eval_bool(table, cmp.col, cmp.op, literal);
            } else {
                return eval_string(table, cmp.col, cmp.op, literal);
            }
        },
        cmp.value);
}

auto null_operand() -> std::unexpected<QueryError> {
    return std::unexpected(QueryError::internal_invariant("filter node has a null operand"));
}

// ─── Evaluators ─────────────────────────────────────────────────────────────

auto eval_two(const Table& table, const FilterExpr& expr) -> QueryResult<Bitmap> {
    return std::visit(
        [&](const auto& node) -> QueryResult<Bitmap> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, FilterAnd>) {
                if (!node.left || !node.right) {
                    return null_operand();
                }
                auto left = eval_two(table, *node.left);
                if (!left || left->none_set()) {
                    return left;
                }
                auto right = eval_two(table, *node.right);
                if (!right) {
                    return right;
                }
                left->and_inplace(*right);
                return left;
            } else if constexpr (std::is_same_v<T, FilterOr>) {
                if (!node.left || !node.right) {
                    return null_operand();
                }
                auto left = eval_two(table, *node.left);
                if (!left || left->all_set()) {
                    return left;
                }
                auto right = eval_two(table, *node.right);
                if (!right) {
                    return right;
                }
                left->or_inplace(*right);
                return left;
            } else if constexpr (std::is_same_v<T, FilterNot>) {
                if (!node.operand) {
                    return null_operand();
                }
                auto inner = eval_two(table, *node.operand);
                if (inner) {
                    inner->not_inplace();
                }
                return inner;
            } else if constexpr (std::is_same_v<T, FilterCmp>) {
                return eval_cmp(table, node);
            } else if constexpr (std::is_same_v<T, FilterCmpCaseInsensitive>) {
                return eval_string_ci(table, node.col, node.op, node.value);
            } else if constexpr (std::is_same_v<T, FilterIsNull>) {
                return null_mask(table, node.col);
            } else {
                return not_null_mask(table, node.col);
            }
        },
        expr.node);
}

/// Comparison leaf: TRUE where the comparison holds, UNKNOWN where the cell
/// is NULL.
auto tri_from_comparison(const Table& table, std::size_t col, QueryResult<Bitmap> truths)
    -> QueryResult<TriMask> {
    if (!truths) {
        return std::unexpected(truths.error());
    }
    auto unknown = null_mask(table, col);
    if (!unknown) {
        return std::unexpected(unknown.error());
    }
    return TriMask{.true_mask = std::move(*truths), .unknown_mask = std::move(*unknown)};
}

auto tri_known(QueryResult<Bitmap> truths) -> QueryResult<TriMask> {
    if (!truths) {
        return std::unexpected(truths.error());
    }
    const std::size_t len = truths->size();
    return TriMask{.true_mask = std::move(*truths), .unknown_mask = Bitmap::all_false(len)};
}

/// Recompute the unknown mask as "neither true nor false".
void set_unknown(TriMask& mask, const Bitmap& false_mask) {
    mask.unknown_mask = Bitmap::all_true(mask.true_mask.size());
    mask.unknown_mask.and_not_inplace(mask.true_mask);
    mask.unknown_mask.and_not_inplace(false_mask);
}

auto eval_three(const Table& table, const FilterExpr& expr) -> QueryResult<TriMask> {
    return std::visit(
        [&](const auto& node) -> QueryResult<TriMask> {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, FilterAnd>) {
                if (!node.left || !node.right) {
                    return null_operand();
                }
                auto left = eval_three(table, *node.left);
                if (!left) {
                    return left;
                }
                // FALSE everywhere: the right side cannot change the result.
                if (left->true_mask.none_set() && left->unknown_mask.none_set()) {
                    return left;
                }
                auto right = eval_three(table, *node.right);
                if (!right) {
                    return right;
                }
                Bitmap false_mask = left->false_mask();
                false_mask.or_inplace(right->false_mask());
                left->true_mask.and_inplace(right->true_mask);
                set_unknown(*left, false_mask);
                return left;
            } else if constexpr (std::is_same_v<T, FilterOr>) {
                if (!node.left || !node.right) {
                    return null_operand();
                }
                auto left = eval_three(table, *node.left);
                if (!left || left->true_mask.all_set()) {
                    return left;
                }
                auto right = eval_three(table, *node.right);
                if (!right) {
                    return right;
                }
                Bitmap false_mask = left->false_mask();
                false_mask.and_inplace(right->false_mask());
                left->true_mask.or_inplace(right->true_mask);
                set_unknown(*left, false_mask);
                return left;
            } else if constexpr (std::is_same_v<T, FilterNot>) {
                if (!node.operand) {
                    return null_operand();
                }
                auto inner = eval_three(table, *node.operand);
                if (inner) {
                    inner->true_mask = inner->false_mask();
                }
                return inner;
            } else if constexpr (std::is_same_v<T, FilterCmp>) {
                return tri_from_comparison(table, node.col, eval_cmp(table, node));
            } else if constexpr (std::is_same_v<T, FilterCmpCaseInsensitive>) {
                return tri_from_comparison(table, node.col,
                                           eval_string_ci(table, node.col, node.op, node.value));
            } else if constexpr (std::is_same_v<T, FilterIsNull>) {
                return tri_known(null_mask(table, node.col));
            } else {
                return tri_known(not_null_mask(table, node.col));
            }
        },
        expr.node);
}

}  // namespace

auto to_string(CompareOp op) noexcept -> std::string_view {
    switch (op) {
        case CompareOp::Eq:
            return "=";
        case CompareOp::Ne:
            return "<>";
        case CompareOp::Lt:
            return "<";
        case CompareOp::Le:
            return "<=";
        case CompareOp::Gt:
            return ">";
        case CompareOp::Ge:
            return ">=";
    }
    return "?";
}

// ─── Builders ───────────────────────────────────────────────────────────────

auto filter_number(std::size_t col, CompareOp op, double value) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterCmp{col, op, value}});
}

auto filter_bool(std::size_t col, CompareOp op, bool value) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterCmp{col, op, value}});
}

auto filter_string(std::size_t col, CompareOp op, std::string value) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterCmp{col, op, std::move(value)}});
}

auto filter_string_ci(std::size_t col, CompareOp op, std::string value) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(
        FilterExpr{FilterCmpCaseInsensitive{col, op, std::move(value)}});
}

auto filter_is_null(std::size_t col) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterIsNull{col}});
}

auto filter_is_not_null(std::size_t col) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterIsNotNull{col}});
}

auto filter_and(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterAnd{std::move(l), std::move(r)}});
}

auto filter_or(FilterExprPtr l, FilterExprPtr r) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterOr{std::move(l), std::move(r)}});
}

auto filter_not(FilterExprPtr operand) -> FilterExprPtr {
    return std::make_unique<FilterExpr>(FilterExpr{FilterNot{std::move(operand)}});
}

auto contains_not(const FilterExpr& expr) noexcept -> bool {
    return std::visit(
        [](const auto& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, FilterNot>) {
                return true;
            } else if constexpr (std::is_same_v<T, FilterAnd> || std::is_same_v<T, FilterOr>) {
                return (node.left && contains_not(*node.left)) ||
                       (node.right && contains_not(*node.right));
            } else {
                return false;
            }
        },
        expr.node);
}

// ─── Evaluation ─────────────────────────────────────────────────────────────

auto TriMask::false_mask() const -> Bitmap {
    Bitmap out = Bitmap::all_true(true_mask.size());
    out.and_not_inplace(true_mask);
    out.and_not_inplace(unknown_mask);
    return out;
}

auto evaluate_two_valued(const Table& table, const FilterExpr& expr) -> QueryResult<Bitmap> {
    return eval_two(table, expr);
}

auto evaluate_three_valued(const Table& table, const FilterExpr& expr) -> QueryResult<TriMask> {
    return eval_three(table, expr);
}

auto filter_mask(const Table& table, const FilterExpr& expr) -> QueryResult<Bitmap> {
    if (!contains_not(expr)) {
        return eval_two(table, expr);
    }
    auto tri = eval_three(table, expr);
    if (!tri) {
        return std::unexpected(tri.error());
    }
    return std::move(tri->true_mask);
}

auto filter_indices(const Table& table, const FilterExpr& expr)
    -> QueryResult<std::vector<std::size_t>> {
    auto mask = filter_mask(table, expr);
    if (!mask) {
        return std::unexpected(mask.error());
    }
    if (mask->none_set()) {
        return std::vector<std::size_t>{};
    }
    if (mask->all_set()) {
        std::vector<std::size_t> all(mask->size());
        std::iota(all.begin(), all.end(), std::size_t{0});
        return all;
    }
    return mask->to_indices();
}

auto filter_table(const Table& table, const Bitmap& mask) -> QueryResult<Table> {
    if (mask.size() != table.row_count()) {
        return std::unexpected(
            QueryError::internal_invariant("filter mask length must match table"));
    }
    for (std::size_t c = 0; c < table.column_count(); ++c) {
        if (table.column_type(c) == ColumnType::String && !table.dictionary(c)) {
            return std::unexpected(QueryError::missing_dictionary(c));
        }
    }
    const std::size_t selected = mask.count_ones();
    if (selected == table.row_count()) {
        return table;
    }
    TableBuilder builder(table.schema(), table.options());
    std::vector<Value> row(table.column_count());
    for (std::size_t r = mask.next_one(0); r < mask.size(); r = mask.next_one(r + 1)) {
        for (std::size_t c = 0; c < row.size(); ++c) {
            row[c] = table.get_cell(r, c);
        }
        builder.append_row(row);
    }
    return builder.finish();
}

auto filter(const Table& table, const FilterExpr& expr) -> QueryResult<Table> {
    auto mask = filter_mask(table, expr);
    if (!mask) {
        return std::unexpected(mask.error());
    }
    return filter_table(table, *mask);
}

}  // namespace strata
