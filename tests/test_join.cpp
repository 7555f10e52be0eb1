#include <strata/query/hash_join.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace strata;

namespace {

using Pair = std::pair<std::size_t, std::size_t>;
using OptPair = std::pair<std::optional<std::size_t>, std::optional<std::size_t>>;
using Cols = std::vector<std::size_t>;

auto number_keys(const std::vector<std::optional<double>>& keys, std::size_t page_size = 65'536)
    -> Table {
    TableBuilder builder({{.name = "id", .type = ColumnType::Number}},
                         TableOptions{.page_size_rows = page_size});
    for (const auto& key : keys) {
        builder.append_row({key ? Value{*key} : Value{Null{}}});
    }
    return builder.finish();
}

auto string_keys(const std::vector<std::string>& keys) -> Table {
    TableBuilder builder({{.name = "name", .type = ColumnType::String}});
    for (const auto& key : keys) {
        builder.append_row({Value{key}});
    }
    return builder.finish();
}

template <typename L, typename R>
auto pairs(const JoinResult<L, R>& result) -> std::vector<std::pair<L, R>> {
    REQUIRE(result.left_indices.size() == result.right_indices.size());
    std::vector<std::pair<L, R>> out;
    for (std::size_t i = 0; i < result.size(); ++i) {
        out.emplace_back(result.left_indices[i], result.right_indices[i]);
    }
    return out;
}

constexpr std::nullopt_t kNone = std::nullopt;

}  // namespace

TEST_CASE("join: the four join types", "[join]") {
    auto left = number_keys({1.0, 2.0});
    auto right = number_keys({1.0, 3.0});

    SECTION("inner") {
        auto result = hash_join(left, right, 0, 0);
        REQUIRE(result.has_value());
        REQUIRE(pairs(*result) == std::vector<Pair>{{0, 0}});
    }
    SECTION("left") {
        auto result = hash_left_join(left, right, 0, 0);
        REQUIRE(result.has_value());
        REQUIRE(result->left_indices == std::vector<std::size_t>{0, 1});
        REQUIRE(result->right_indices ==
                std::vector<std::optional<std::size_t>>{std::size_t{0}, kNone});
    }
    SECTION("right") {
        auto result = hash_right_join(left, right, 0, 0);
        REQUIRE(result.has_value());
        REQUIRE(result->left_indices ==
                std::vector<std::optional<std::size_t>>{std::size_t{0}, kNone});
        REQUIRE(result->right_indices == std::vector<std::size_t>{0, 1});
    }
    SECTION("full outer") {
        auto result = hash_full_outer_join(left, right, 0, 0);
        REQUIRE(result.has_value());
        REQUIRE(pairs(*result) == std::vector<OptPair>{{0, 0}, {1, kNone}, {kNone, 1}});
    }
    SECTION("runtime join type") {
        auto inner = hash_join_with_type(left, right, 0, 0, JoinType::Inner);
        REQUIRE(inner.has_value());
        REQUIRE(pairs(*inner) == std::vector<OptPair>{{0, 0}});

        auto outer = hash_join_with_type(left, right, 0, 0, JoinType::FullOuter);
        REQUIRE(outer.has_value());
        REQUIRE(pairs(*outer) == std::vector<OptPair>{{0, 0}, {1, kNone}, {kNone, 1}});

        auto right_only = hash_join_with_type(left, right, 0, 0, JoinType::Right);
        REQUIRE(right_only.has_value());
        REQUIRE(pairs(*right_only) == std::vector<OptPair>{{0, 0}, {kNone, 1}});
    }
}

TEST_CASE("join: duplicate keys emit every pair", "[join]") {
    auto left = number_keys({5.0, 7.0, 5.0});
    auto right = number_keys({5.0, 9.0, 5.0, 5.0});
    auto result = hash_join(left, right, 0, 0);
    REQUIRE(result.has_value());
    // Right rows for one left row come out most recent first.
    REQUIRE(pairs(*result) ==
            std::vector<Pair>{{0, 3}, {0, 2}, {0, 0}, {2, 3}, {2, 2}, {2, 0}});

    auto outer = hash_full_outer_join(left, right, 0, 0);
    REQUIRE(outer.has_value());
    REQUIRE(outer->size() == 8);
    REQUIRE(pairs(*outer)[3] == OptPair{1, kNone});
    REQUIRE(pairs(*outer).back() == OptPair{kNone, 1});
}

TEST_CASE("join: NULL keys never match", "[join]") {
    auto left = number_keys({std::nullopt, 1.0});
    auto right = number_keys({std::nullopt, 1.0});

    auto inner = hash_join(left, right, 0, 0);
    REQUIRE(inner.has_value());
    REQUIRE(pairs(*inner) == std::vector<Pair>{{1, 1}});

    auto outer = hash_full_outer_join(left, right, 0, 0);
    REQUIRE(outer.has_value());
    REQUIRE(pairs(*outer) == std::vector<OptPair>{{0, kNone}, {1, 1}, {kNone, 0}});
}

TEST_CASE("join: float keys are canonicalized", "[join]") {
    auto left = number_keys({-0.0, std::numeric_limits<double>::quiet_NaN(), 2.0});
    auto right = number_keys({std::numeric_limits<double>::quiet_NaN(), 0.0});
    auto result = hash_join(left, right, 0, 0);
    REQUIRE(result.has_value());
    REQUIRE(pairs(*result) == std::vector<Pair>{{0, 1}, {1, 0}});
}

TEST_CASE("join: string keys across separate dictionaries", "[join]") {
    auto left = string_keys({"x", "y", "z"});
    auto right = string_keys({"z", "x", "w"});
    REQUIRE(left.dictionary(0) != right.dictionary(0));

    auto inner = hash_join(left, right, 0, 0);
    REQUIRE(inner.has_value());
    REQUIRE(pairs(*inner) == std::vector<Pair>{{0, 1}, {2, 0}});

    auto outer = hash_right_join(left, right, 0, 0);
    REQUIRE(outer.has_value());
    REQUIRE(pairs(*outer) ==
            std::vector<std::pair<std::optional<std::size_t>, std::size_t>>{
                {0, 1}, {2, 0}, {kNone, 2}});

    // Equal contents in distinct dictionary objects still go through the remap.
    auto twin = string_keys({"x", "y", "z"});
    auto same_values = hash_join(left, twin, 0, 0);
    REQUIRE(same_values.has_value());
    REQUIRE(pairs(*same_values) == std::vector<Pair>{{0, 0}, {1, 1}, {2, 2}});
}

TEST_CASE("join: shared dictionary self join", "[join]") {
    auto table = string_keys({"a", "b", "a"});
    auto result = hash_join(table, table, 0, 0);
    REQUIRE(result.has_value());
    REQUIRE(pairs(*result) == std::vector<Pair>{{0, 2}, {0, 0}, {1, 1}, {2, 2}, {2, 0}});
}

TEST_CASE("join: composite keys", "[join]") {
    TableBuilder lb({{.name = "day", .type = ColumnType::DateTime},
                     {.name = "sym", .type = ColumnType::String}},
                    TableOptions{.page_size_rows = 2});
    lb.append_row({Value{DateTime{1}}, Value{std::string{"a"}}});
    lb.append_row({Value{DateTime{1}}, Value{std::string{"b"}}});
    lb.append_row({Value{DateTime{2}}, Value{std::string{"a"}}});
    lb.append_row({Value{Null{}}, Value{std::string{"a"}}});
    auto left = lb.finish();

    TableBuilder rb({{.name = "sym", .type = ColumnType::String},
                     {.name = "day", .type = ColumnType::DateTime}});
    rb.append_row({Value{std::string{"a"}}, Value{DateTime{2}}});
    rb.append_row({Value{std::string{"b"}}, Value{DateTime{1}}});
    rb.append_row({Value{std::string{"a"}}, Value{DateTime{3}}});
    auto right = rb.finish();

    const Cols left_on{0, 1};
    const Cols right_on{1, 0};

    auto inner = hash_join_multi(left, right, left_on, right_on);
    REQUIRE(inner.has_value());
    REQUIRE(pairs(*inner) == std::vector<Pair>{{1, 1}, {2, 0}});

    auto left_join = hash_left_join_multi(left, right, left_on, right_on);
    REQUIRE(left_join.has_value());
    REQUIRE(pairs(*left_join) ==
            std::vector<std::pair<std::size_t, std::optional<std::size_t>>>{
                {0, kNone}, {1, 1}, {2, 0}, {3, kNone}});

    auto right_join = hash_right_join_multi(left, right, left_on, right_on);
    REQUIRE(right_join.has_value());
    REQUIRE(right_join->size() == 3);

    auto full = hash_full_outer_join_multi(left, right, left_on, right_on);
    REQUIRE(full.has_value());
    REQUIRE(full->size() == 5);

    auto typed = hash_join_with_type_multi(left, right, left_on, right_on, JoinType::Left);
    REQUIRE(typed.has_value());
    REQUIRE(typed->size() == 4);
}

TEST_CASE("join: inner size equals the matching pair count", "[join]") {
    std::vector<std::optional<double>> lkeys;
    for (int i = 0; i < 50; ++i) {
        lkeys.push_back(i % 11 == 0 ? std::nullopt : std::optional<double>(i % 7));
    }
    std::vector<std::optional<double>> rkeys;
    for (int i = 0; i < 30; ++i) {
        rkeys.push_back(i % 13 == 0 ? std::nullopt : std::optional<double>(i % 5));
    }
    auto left = number_keys(lkeys, 4);
    auto right = number_keys(rkeys, 3);

    std::size_t expected = 0;
    for (const auto& l : lkeys) {
        for (const auto& r : rkeys) {
            if (l && r && *l == *r) {
                ++expected;
            }
        }
    }

    auto result = hash_join(left, right, 0, 0);
    REQUIRE(result.has_value());
    REQUIRE(result->size() == expected);
    for (std::size_t i = 0; i < result->size(); ++i) {
        REQUIRE(left.get_cell(result->left_indices[i], 0) ==
                right.get_cell(result->right_indices[i], 0));
    }
    // Left-row order is preserved.
    for (std::size_t i = 1; i < result->size(); ++i) {
        REQUIRE(result->left_indices[i - 1] <= result->left_indices[i]);
    }
}

TEST_CASE("join: validation errors", "[join]") {
    auto numbers = number_keys({1.0});
    auto strings = string_keys({"a"});

    SECTION("key counts differ") {
        const Cols two{0, 0};
        const Cols one{0};
        auto result = hash_join_multi(numbers, numbers, two, one);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == QueryErrorKind::MismatchedJoinKeyCount);
        REQUIRE(result.error().left_keys == 2);
        REQUIRE(result.error().right_keys == 1);
    }
    SECTION("no keys") {
        const Cols none;
        auto result = hash_left_join_multi(numbers, numbers, none, none);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == QueryErrorKind::EmptyKeys);
    }
    SECTION("key types differ") {
        auto result = hash_join(numbers, strings, 0, 0);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == QueryErrorKind::MismatchedJoinKeyTypes);
        REQUIRE(result.error().left_type == ColumnType::Number);
        REQUIRE(result.error().right_type == ColumnType::String);
    }
    SECTION("column out of bounds") {
        auto result = hash_full_outer_join(numbers, numbers, 0, 3);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == QueryErrorKind::ColumnOutOfBounds);
        REQUIRE(result.error().col == 3);
        REQUIRE(result.error().column_count == 1);
    }
    SECTION("string key without a dictionary") {
        std::vector<EncodedColumn> columns;
        columns.push_back(EncodedColumn{
            .schema = {.name = "name", .type = ColumnType::String},
            .pages = {encoding::DictPage{
                .len = 1,
                .indices = encoding::encode_sequence<std::uint32_t>(std::vector<std::uint32_t>{0})}},
        });
        auto bare = Table::from_encoded(std::move(columns));
        REQUIRE(bare.has_value());
        auto result = hash_right_join(strings, *bare, 0, 0);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == QueryErrorKind::MissingDictionary);
    }
}

TEST_CASE("join: empty inputs", "[join]") {
    auto empty = number_keys({});
    auto some = number_keys({1.0, 2.0});

    auto inner = hash_join(empty, some, 0, 0);
    REQUIRE(inner.has_value());
    REQUIRE(inner->empty());

    auto right = hash_right_join(empty, some, 0, 0);
    REQUIRE(right.has_value());
    REQUIRE(right->right_indices == std::vector<std::size_t>{0, 1});

    auto left = hash_left_join(some, empty, 0, 0);
    REQUIRE(left.has_value());
    REQUIRE(left->size() == 2);
}
