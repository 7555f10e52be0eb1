#include <strata/query/filter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace strata;

namespace {

constexpr std::size_t kPrice = 0;
constexpr std::size_t kFlag = 1;
constexpr std::size_t kName = 2;
constexpr std::size_t kTime = 3;

const double kNaN = std::numeric_limits<double>::quiet_NaN();

using Rows = std::vector<std::size_t>;
using Rows32 = std::vector<std::uint32_t>;

auto str(const char* s) -> Value {
    return Value{std::string{s}};
}

// Seven rows over three pages; every column has one NULL.
auto sample_table() -> Table {
    TableBuilder builder(
        {
            {.name = "price", .type = ColumnType::Number},
            {.name = "flag", .type = ColumnType::Boolean},
            {.name = "name", .type = ColumnType::String},
            {.name = "ts", .type = ColumnType::DateTime},
        },
        TableOptions{.page_size_rows = 3});
    builder.append_row({Value{1.0}, Value{true}, str("apple"), Value{DateTime{10}}});
    builder.append_row({Value{Null{}}, Value{false}, str("Banana"), Value{DateTime{20}}});
    builder.append_row({Value{-0.0}, Value{Null{}}, Value{Null{}}, Value{DateTime{30}}});
    builder.append_row({Value{5.0}, Value{true}, str("apple"), Value{DateTime{40}}});
    builder.append_row({Value{kNaN}, Value{false}, str("cherry"), Value{Null{}}});
    builder.append_row({Value{3.0}, Value{true}, str("banana"), Value{DateTime{60}}});
    builder.append_row({Value{0.0}, Value{true}, str("apple"), Value{DateTime{70}}});
    return builder.finish();
}

auto rows_where(const Table& table, const FilterExpr& expr) -> Rows {
    auto rows = filter_indices(table, expr);
    REQUIRE(rows.has_value());
    return *rows;
}

auto error_of(const Table& table, const FilterExpr& expr) -> QueryError {
    auto mask = filter_mask(table, expr);
    REQUIRE_FALSE(mask.has_value());
    return mask.error();
}

auto float_column(std::string name, std::vector<encoding::EncodedPage> pages) -> EncodedColumn {
    return EncodedColumn{
        .schema = {.name = std::move(name), .type = ColumnType::Number},
        .pages = std::move(pages),
    };
}

}  // namespace

TEST_CASE("filter: numeric comparisons", "[filter]") {
    auto table = sample_table();

    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Gt, 2.0)) == Rows{3, 5});
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Ge, 3.0)) == Rows{3, 5});
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Le, 1.0)) == Rows{0, 2, 6});
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Ne, 5.0)) == Rows{0, 2, 4, 5, 6});
}

TEST_CASE("filter: zero literal matches both signs", "[filter]") {
    auto table = sample_table();
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Eq, 0.0)) == Rows{2, 6});
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Eq, -0.0)) == Rows{2, 6});
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Lt, 0.0)).empty());
}

TEST_CASE("filter: NaN literal", "[filter]") {
    auto table = sample_table();
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Eq, kNaN)) == Rows{4});
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Ne, kNaN)) == Rows{0, 2, 3, 5, 6});
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Lt, kNaN)).empty());
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Ge, kNaN)).empty());
}

TEST_CASE("filter: literal outside the column range", "[filter]") {
    auto table = sample_table();
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Gt, 100.0)).empty());
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Eq, -50.0)).empty());
    // Every non-null value differs, NaN included.
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Ne, 100.0)) ==
            Rows{0, 2, 3, 4, 5, 6});
    REQUIRE(rows_where(table, *filter_number(kPrice, CompareOp::Lt, 100.0)) == Rows{0, 2, 3, 5, 6});
}

TEST_CASE("filter: numeric columns without statistics", "[filter]") {
    std::vector<EncodedColumn> columns;
    columns.push_back(float_column(
        "x", {encoding::FloatPage{.values = {1.0, 9.0}, .validity = Bitmap::all_false(2)},
              encoding::FloatPage{.values = {4.0, 8.0}},
              encoding::FloatPage{.values = {7.0}, .validity = Bitmap::all_true(1)}}));
    auto table = Table::from_encoded(std::move(columns), TableOptions{.page_size_rows = 2});
    REQUIRE(table.has_value());

    REQUIRE(rows_where(*table, *filter_number(0, CompareOp::Gt, 5.0)) == Rows{3, 4});
    REQUIRE(rows_where(*table, *filter_number(0, CompareOp::Gt, 100.0)).empty());
    REQUIRE(rows_where(*table, *filter_is_null(0)) == Rows{0, 1});
    REQUIRE(rows_where(*table, *filter_is_not_null(0)) == Rows{2, 3, 4});
}

TEST_CASE("filter: boolean comparisons", "[filter]") {
    auto table = sample_table();
    REQUIRE(rows_where(table, *filter_bool(kFlag, CompareOp::Eq, true)) == Rows{0, 3, 5, 6});
    REQUIRE(rows_where(table, *filter_bool(kFlag, CompareOp::Eq, false)) == Rows{1, 4});
    REQUIRE(rows_where(table, *filter_bool(kFlag, CompareOp::Ne, true)) == Rows{1, 4});

    auto err = error_of(table, *filter_bool(kFlag, CompareOp::Lt, true));
    REQUIRE(err.kind == QueryErrorKind::UnsupportedColumnType);
    REQUIRE(err.operation == "boolean comparison (<)");
}

TEST_CASE("filter: boolean scan over whole bytes", "[filter]") {
    TableBuilder builder({{.name = "b", .type = ColumnType::Boolean}});
    // 8 true, 8 false, then alternating.
    for (int i = 0; i < 8; ++i) {
        builder.append_row({Value{true}});
    }
    for (int i = 0; i < 8; ++i) {
        builder.append_row({Value{false}});
    }
    for (int i = 0; i < 5; ++i) {
        builder.append_row({Value{i % 2 == 0}});
    }
    auto table = builder.finish();

    auto mask = filter_mask(table, *filter_bool(0, CompareOp::Eq, true));
    REQUIRE(mask.has_value());
    REQUIRE(mask->size() == 21);
    REQUIRE(mask->count_ones() == 11);
    REQUIRE(mask->get(7));
    REQUIRE_FALSE(mask->get(8));
    REQUIRE(mask->get(16));
    REQUIRE_FALSE(mask->get(17));
    REQUIRE(mask->get(20));
}

TEST_CASE("filter: boolean true count is trusted permissively", "[filter]") {
    auto bool_table = [](double true_count) {
        std::vector<EncodedColumn> columns;
        columns.push_back(EncodedColumn{
            .schema = {.name = "b", .type = ColumnType::Boolean},
            .pages = {encoding::BoolPage{.len = 4, .data = {0b0110}}},
            .stats = ColumnStats{.null_count = 0, .sum = true_count},
        });
        auto table = Table::from_encoded(std::move(columns));
        REQUIRE(table.has_value());
        return *table;
    };

    SECTION("consistent statistics fall through to the scan") {
        auto table = bool_table(2.0);
        REQUIRE(rows_where(table, *filter_bool(0, CompareOp::Eq, true)) == Rows{1, 2});
    }
    SECTION("a negative sum clamps to zero true rows") {
        auto table = bool_table(-3.7);
        REQUIRE(rows_where(table, *filter_bool(0, CompareOp::Eq, true)).empty());
        REQUIRE(rows_where(table, *filter_bool(0, CompareOp::Eq, false)) == Rows{0, 1, 2, 3});
    }
    SECTION("a fractional sum is rounded") {
        auto table = bool_table(3.6);
        REQUIRE(rows_where(table, *filter_bool(0, CompareOp::Eq, true)) == Rows{0, 1, 2, 3});
    }
    SECTION("a count above the row count disables the shortcut") {
        auto table = bool_table(9.0);
        REQUIRE(rows_where(table, *filter_bool(0, CompareOp::Eq, true)) == Rows{1, 2});
    }
    SECTION("a huge sum is clamped and falls through to the scan") {
        auto table = bool_table(1e300);
        REQUIRE(rows_where(table, *filter_bool(0, CompareOp::Eq, true)) == Rows{1, 2});
        REQUIRE(rows_where(table, *filter_bool(0, CompareOp::Ne, true)) == Rows{0, 3});
    }
    SECTION("a non-finite sum is ignored") {
        auto nan = bool_table(std::numeric_limits<double>::quiet_NaN());
        REQUIRE(rows_where(nan, *filter_bool(0, CompareOp::Eq, true)) == Rows{1, 2});
        REQUIRE(rows_where(nan, *filter_bool(0, CompareOp::Eq, false)) == Rows{0, 3});
        auto inf = bool_table(-std::numeric_limits<double>::infinity());
        REQUIRE(rows_where(inf, *filter_bool(0, CompareOp::Eq, true)) == Rows{1, 2});
    }
}

TEST_CASE("filter: string equality", "[filter]") {
    auto table = sample_table();
    REQUIRE(rows_where(table, *filter_string(kName, CompareOp::Eq, "apple")) == Rows{0, 3, 6});
    REQUIRE(rows_where(table, *filter_string(kName, CompareOp::Ne, "apple")) == Rows{1, 4, 5});
    // In range, absent from the dictionary.
    REQUIRE(rows_where(table, *filter_string(kName, CompareOp::Eq, "avocado")).empty());
    REQUIRE(rows_where(table, *filter_string(kName, CompareOp::Ne, "avocado")) ==
            Rows{0, 1, 3, 4, 5, 6});
    // Past the lexicographic maximum.
    REQUIRE(rows_where(table, *filter_string(kName, CompareOp::Eq, "zucchini")).empty());

    auto err = error_of(table, *filter_string(kName, CompareOp::Gt, "apple"));
    REQUIRE(err.kind == QueryErrorKind::UnsupportedColumnType);
}

TEST_CASE("filter: string equality over run-length pages", "[filter]") {
    TableBuilder builder({{.name = "s", .type = ColumnType::String}});
    for (int i = 0; i < 300; ++i) {
        builder.append_row({str(i < 100 ? "x" : (i < 250 ? "y" : "x"))});
    }
    auto table = builder.finish();
    const auto& page = std::get<encoding::DictPage>(table.pages(0)[0]);
    REQUIRE(std::holds_alternative<encoding::RunLength<std::uint32_t>>(page.indices));

    auto mask = filter_mask(table, *filter_string(0, CompareOp::Eq, "x"));
    REQUIRE(mask.has_value());
    REQUIRE(mask->count_ones() == 150);
    REQUIRE(mask->get(99));
    REQUIRE_FALSE(mask->get(100));
    REQUIRE(mask->get(250));
}

TEST_CASE("filter: case-insensitive string equality", "[filter]") {
    auto table = sample_table();
    REQUIRE(rows_where(table, *filter_string_ci(kName, CompareOp::Eq, "BANANA")) == Rows{1, 5});
    REQUIRE(rows_where(table, *filter_string_ci(kName, CompareOp::Ne, "banana")) == Rows{0, 3, 4, 6});
    REQUIRE(rows_where(table, *filter_string_ci(kName, CompareOp::Eq, "kiwi")).empty());
    REQUIRE(rows_where(table, *filter_string_ci(kName, CompareOp::Ne, "kiwi")) ==
            Rows{0, 1, 3, 4, 5, 6});

    SECTION("every dictionary entry matches") {
        TableBuilder builder({{.name = "s", .type = ColumnType::String}});
        builder.append_row({str("Yes")});
        builder.append_row({Value{Null{}}});
        builder.append_row({str("YES")});
        auto yes = builder.finish();
        REQUIRE(rows_where(yes, *filter_string_ci(0, CompareOp::Eq, "yes")) == Rows{0, 2});
        REQUIRE(rows_where(yes, *filter_string_ci(0, CompareOp::Ne, "yes")).empty());
    }
}

TEST_CASE("filter: null tests", "[filter]") {
    auto table = sample_table();
    REQUIRE(rows_where(table, *filter_is_null(kPrice)) == Rows{1});
    REQUIRE(rows_where(table, *filter_is_null(kTime)) == Rows{4});
    REQUIRE(rows_where(table, *filter_is_not_null(kName)) == Rows{0, 1, 3, 4, 5, 6});

    TableBuilder builder({{.name = "x", .type = ColumnType::Number}});
    builder.append_row({Value{Null{}}});
    builder.append_row({Value{Null{}}});
    auto all_null = builder.finish();
    REQUIRE(rows_where(all_null, *filter_is_null(0)) == Rows{0, 1});
    REQUIRE(rows_where(all_null, *filter_number(0, CompareOp::Ne, 1.0)).empty());
}

TEST_CASE("filter: AND / OR", "[filter]") {
    auto table = sample_table();
    auto both = filter_and(filter_number(kPrice, CompareOp::Gt, 0.5),
                           filter_string(kName, CompareOp::Eq, "apple"));
    REQUIRE(rows_where(table, *both) == Rows{0, 3});

    auto either = filter_or(filter_is_null(kFlag), filter_string(kName, CompareOp::Eq, "cherry"));
    REQUIRE(rows_where(table, *either) == Rows{2, 4});

    // When the left side decides, the right side is never evaluated and its
    // bad column index goes unnoticed.
    auto short_and = filter_and(filter_number(kPrice, CompareOp::Gt, 100.0),
                                filter_number(99, CompareOp::Gt, 0.0));
    REQUIRE(rows_where(table, *short_and).empty());
    auto short_or = filter_or(filter_or(filter_is_null(kPrice), filter_is_not_null(kPrice)),
                              filter_number(99, CompareOp::Gt, 0.0));
    REQUIRE(rows_where(table, *short_or).size() == table.row_count());

    auto evaluated = filter_or(filter_is_not_null(kPrice), filter_number(99, CompareOp::Gt, 0.0));
    REQUIRE(error_of(table, *evaluated).kind == QueryErrorKind::ColumnOutOfBounds);
}

TEST_CASE("filter: NOT uses three-valued logic", "[filter]") {
    auto table = sample_table();

    SECTION("NULL stays excluded under negation") {
        auto expr = filter_not(filter_number(kPrice, CompareOp::Gt, 2.0));
        REQUIRE(rows_where(table, *expr) == Rows{0, 2, 4, 6});

        auto two = evaluate_two_valued(table, *expr);
        REQUIRE(two.has_value());
        REQUIRE(two->to_indices() == Rows{0, 1, 2, 4, 6});
    }

    SECTION("tri-state masks of a comparison") {
        auto tri = evaluate_three_valued(table, *filter_number(kPrice, CompareOp::Gt, 2.0));
        REQUIRE(tri.has_value());
        REQUIRE(tri->true_mask.to_indices() == Rows{3, 5});
        REQUIRE(tri->unknown_mask.to_indices() == Rows{1});
        REQUIRE(tri->false_mask().to_indices() == Rows{0, 2, 4, 6});
    }

    SECTION("NOT over OR") {
        auto expr = filter_not(filter_or(filter_number(kPrice, CompareOp::Gt, 2.0),
                                         filter_bool(kFlag, CompareOp::Eq, true)));
        auto tri = evaluate_three_valued(table, *expr);
        REQUIRE(tri.has_value());
        REQUIRE(tri->true_mask.to_indices() == Rows{4});
        REQUIRE(tri->unknown_mask.to_indices() == Rows{1, 2});
    }

    SECTION("false wins over unknown in AND") {
        auto expr = filter_not(filter_and(filter_number(kPrice, CompareOp::Gt, 2.0),
                                          filter_bool(kFlag, CompareOp::Eq, true)));
        REQUIRE(rows_where(table, *expr) == Rows{0, 1, 2, 4, 6});
    }

    SECTION("double negation") {
        auto expr = filter_not(filter_not(filter_is_null(kName)));
        REQUIRE(rows_where(table, *expr) == Rows{2});
    }
}

TEST_CASE("filter: two-valued and three-valued agree without NOT", "[filter]") {
    auto table = sample_table();
    std::vector<FilterExprPtr> predicates;
    predicates.push_back(filter_number(kPrice, CompareOp::Ge, 1.0));
    predicates.push_back(filter_number(kPrice, CompareOp::Ne, kNaN));
    predicates.push_back(filter_bool(kFlag, CompareOp::Ne, false));
    predicates.push_back(filter_string_ci(kName, CompareOp::Eq, "apple"));
    predicates.push_back(filter_and(filter_is_not_null(kTime),
                                    filter_string(kName, CompareOp::Ne, "apple")));
    predicates.push_back(filter_or(filter_number(kPrice, CompareOp::Lt, 2.0),
                                   filter_and(filter_bool(kFlag, CompareOp::Eq, true),
                                              filter_is_null(kName))));

    for (const auto& predicate : predicates) {
        REQUIRE_FALSE(contains_not(*predicate));
        auto two = evaluate_two_valued(table, *predicate);
        auto three = evaluate_three_valued(table, *predicate);
        REQUIRE(two.has_value());
        REQUIRE(three.has_value());
        REQUIRE(*two == three->true_mask);
    }
    REQUIRE(contains_not(*filter_and(filter_is_null(0), filter_not(filter_is_null(1)))));
}

TEST_CASE("filter: filter_table keeps schema and order", "[filter]") {
    auto table = sample_table();

    SECTION("selected rows") {
        auto mask = Bitmap::from_bools({true, false, false, true, false, true, false});
        auto out = filter_table(table, mask);
        REQUIRE(out.has_value());
        REQUIRE(out->row_count() == mask.count_ones());
        REQUIRE(out->schema() == table.schema());
        REQUIRE(out->get_cell(0, kPrice) == Value{1.0});
        REQUIRE(out->get_cell(1, kPrice) == Value{5.0});
        REQUIRE(out->get_cell(2, kName) == str("banana"));
    }

    SECTION("all rows") {
        auto out = filter_table(table, Bitmap::all_true(table.row_count()));
        REQUIRE(out.has_value());
        REQUIRE(out->row_count() == table.row_count());
        for (std::size_t r = 0; r < table.row_count(); ++r) {
            for (std::size_t c = 0; c < table.column_count(); ++c) {
                REQUIRE(format_value(out->get_cell(r, c)) == format_value(table.get_cell(r, c)));
            }
        }
    }

    SECTION("no rows") {
        auto out = filter_table(table, Bitmap::all_false(table.row_count()));
        REQUIRE(out.has_value());
        REQUIRE(out->row_count() == 0);
        REQUIRE(out->schema() == table.schema());
    }

    SECTION("mask length must match") {
        auto out = filter_table(table, Bitmap::all_true(3));
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == QueryErrorKind::InternalInvariant);
    }

    SECTION("predicate entry point") {
        auto out = filter(table, *filter_string(kName, CompareOp::Eq, "apple"));
        REQUIRE(out.has_value());
        REQUIRE(out->row_count() == 3);
        REQUIRE(out->get_cell(1, kTime) == Value{DateTime{40}});
    }
}

TEST_CASE("filter: errors", "[filter]") {
    auto table = sample_table();

    SECTION("column out of bounds") {
        auto err = error_of(table, *filter_number(9, CompareOp::Eq, 1.0));
        REQUIRE(err.kind == QueryErrorKind::ColumnOutOfBounds);
        REQUIRE(err.col == 9);
        REQUIRE(err.column_count == 4);
        REQUIRE(err.format() == "column index 9 out of bounds (table has 4 columns)");
    }

    SECTION("literal kind does not fit the column") {
        auto err = error_of(table, *filter_string(kPrice, CompareOp::Eq, "1"));
        REQUIRE(err.kind == QueryErrorKind::UnsupportedColumnType);
        REQUIRE(err.column_type == ColumnType::Number);

        auto on_time = error_of(table, *filter_number(kTime, CompareOp::Gt, 1.0));
        REQUIRE(on_time.kind == QueryErrorKind::UnsupportedColumnType);
        REQUIRE(on_time.operation == "numeric comparison (>)");
    }

    SECTION("null operand") {
        FilterExpr expr{FilterAnd{filter_is_null(0), nullptr}};
        auto err = error_of(table, expr);
        REQUIRE(err.kind == QueryErrorKind::InternalInvariant);
    }

    SECTION("string column without a dictionary") {
        std::vector<EncodedColumn> columns;
        columns.push_back(EncodedColumn{
            .schema = {.name = "s", .type = ColumnType::String},
            .pages = {encoding::DictPage{
                .len = 2, .indices = encoding::encode_sequence<std::uint32_t>(Rows32{0, 0})}},
        });
        auto bare = Table::from_encoded(std::move(columns));
        REQUIRE(bare.has_value());
        auto err = error_of(*bare, *filter_string(0, CompareOp::Eq, "a"));
        REQUIRE(err.kind == QueryErrorKind::MissingDictionary);

        auto copy = filter_table(*bare, Bitmap::all_true(2));
        REQUIRE_FALSE(copy.has_value());
        REQUIRE(copy.error().kind == QueryErrorKind::MissingDictionary);
    }
}
