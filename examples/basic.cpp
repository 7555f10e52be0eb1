#include <strata/strata.hpp>

#include <fmt/core.h>

#include <string>
#include <vector>

auto main() -> int {
    using strata::ColumnType;
    using strata::Null;
    using strata::Value;

    // Build a small trades table
    strata::TableBuilder builder({
        {.name = "symbol", .type = ColumnType::String},
        {.name = "price", .type = ColumnType::Number},
        {.name = "qty", .type = ColumnType::Currency},
    });
    builder.append_row({Value{std::string{"AAPL"}}, Value{100.5}, Value{strata::Currency{10}}});
    builder.append_row({Value{std::string{"MSFT"}}, Value{200.3}, Value{strata::Currency{5}}});
    builder.append_row({Value{std::string{"AAPL"}}, Value{Null{}}, Value{strata::Currency{7}}});
    builder.append_row({Value{std::string{"GOOG"}}, Value{175.8}, Value{strata::Currency{3}}});
    builder.append_row({Value{std::string{"MSFT"}}, Value{320.1}, Value{strata::Currency{8}}});
    const strata::Table trades = builder.finish();

    fmt::print("=== Table ===\n");
    fmt::print("trades: {} rows, {} columns, {} pages\n", trades.row_count(),
               trades.column_count(), trades.page_count());

    // Filter: NOT (price > 150). The NULL price stays out of the result.
    fmt::print("\n=== Filter ===\n");
    auto predicate = strata::filter_not(strata::filter_number(1, strata::CompareOp::Gt, 150.0));
    auto rows = strata::filter_indices(trades, *predicate);
    if (!rows) {
        fmt::print("filter failed: {}\n", rows.error().format());
        return 1;
    }
    for (auto row : *rows) {
        fmt::print("row {}: {} {}\n", row, strata::format_value(trades.get_cell(row, 0)),
                   strata::format_value(trades.get_cell(row, 1)));
    }

    // Group by symbol
    fmt::print("\n=== Group by ===\n");
    const std::vector<std::size_t> keys{0};
    const std::vector<strata::AggSpec> aggs{
        strata::count_rows(),
        strata::avg(1),
        strata::sum(2).with_name("total_qty"),
    };
    auto grouped = strata::group_by(trades, keys, aggs);
    if (!grouped) {
        fmt::print("group_by failed: {}\n", grouped.error().format());
        return 1;
    }
    for (std::size_t row = 0; row < grouped->row_count(); ++row) {
        for (std::size_t col = 0; col < grouped->column_count(); ++col) {
            fmt::print("{}={} ", grouped->schema()[col].name,
                       strata::format_value(grouped->value_at(row, col)));
        }
        fmt::print("\n");
    }

    // Left join against a reference table
    fmt::print("\n=== Join ===\n");
    strata::TableBuilder ref_builder({{.name = "symbol", .type = ColumnType::String},
                                      {.name = "sector", .type = ColumnType::String}});
    ref_builder.append_row({Value{std::string{"AAPL"}}, Value{std::string{"tech"}}});
    ref_builder.append_row({Value{std::string{"GOOG"}}, Value{std::string{"ads"}}});
    const strata::Table sectors = ref_builder.finish();

    auto joined = strata::hash_left_join(trades, sectors, 0, 0);
    if (!joined) {
        fmt::print("join failed: {}\n", joined.error().format());
        return 1;
    }
    for (std::size_t i = 0; i < joined->size(); ++i) {
        const auto left = joined->left_indices[i];
        const auto right = joined->right_indices[i];
        fmt::print("{} -> {}\n", strata::format_value(trades.get_cell(left, 0)),
                   right ? strata::format_value(sectors.get_cell(*right, 1)) : "null");
    }

    return 0;
}
