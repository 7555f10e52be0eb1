#pragma once

#include <strata/core/encoding.hpp>
#include <strata/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace strata {

using encoding::EncodedPage;

/// Ordered distinct strings of a String column; pages store indices into it.
using Dictionary = std::vector<std::string>;
using DictionaryPtr = std::shared_ptr<const Dictionary>;

struct TableOptions {
    std::size_t page_size_rows = 65'536;
};

/// Column-level statistics. Every field may be absent.
struct ColumnStats {
    std::optional<std::uint64_t> null_count;
    std::optional<std::uint64_t> distinct_count;
    std::optional<Value> min;
    std::optional<Value> max;
    /// Number/integer-like: sum of values. Boolean: number of true values.
    std::optional<double> sum;
};

/// One column handed to `Table::from_encoded`.
struct EncodedColumn {
    ColumnSchema schema;
    std::vector<EncodedPage> pages;
    std::optional<ColumnStats> stats;
    DictionaryPtr dictionary;
};

/// An immutable, paged, encoded columnar table.
///
/// Copies are cheap: pages and dictionaries are shared between copies and
/// never mutated, so any number of readers may use one table concurrently.
class Table {
   public:
    Table() = default;

    /// Assemble a table from pre-encoded columns. Every column must have the
    /// same row count, every page but the last must hold exactly
    /// `options.page_size_rows` rows, and page kinds must match column types.
    [[nodiscard]] static auto from_encoded(std::vector<EncodedColumn> columns,
                                           TableOptions options = {})
        -> std::expected<Table, std::string>;

    [[nodiscard]] auto schema() const noexcept -> const std::vector<ColumnSchema>& {
        return schema_;
    }
    [[nodiscard]] auto options() const noexcept -> const TableOptions& { return options_; }
    [[nodiscard]] auto page_size_rows() const noexcept -> std::size_t {
        return options_.page_size_rows;
    }
    [[nodiscard]] auto row_count() const noexcept -> std::size_t { return rows_; }
    [[nodiscard]] auto column_count() const noexcept -> std::size_t { return columns_.size(); }
    [[nodiscard]] auto page_count() const noexcept -> std::size_t;

    [[nodiscard]] auto column_type(std::size_t col) const -> ColumnType {
        return schema_.at(col).type;
    }

    /// Encoded pages of column `col`, in row order.
    [[nodiscard]] auto pages(std::size_t col) const -> const std::vector<EncodedPage>& {
        return *columns_.at(col).pages;
    }

    /// Statistics for `col`, or nullptr when none were recorded.
    [[nodiscard]] auto stats(std::size_t col) const -> const ColumnStats*;

    /// Shared dictionary of a String column, or null.
    [[nodiscard]] auto dictionary(std::size_t col) const -> const DictionaryPtr& {
        return columns_.at(col).dictionary;
    }

    /// Decode a single cell. Throws std::out_of_range for bad indices.
    [[nodiscard]] auto get_cell(std::size_t row, std::size_t col) const -> Value;

   private:
    struct Column {
        std::shared_ptr<const std::vector<EncodedPage>> pages;
        std::optional<ColumnStats> stats;
        DictionaryPtr dictionary;
    };

    friend class TableBuilder;

    std::vector<ColumnSchema> schema_;
    std::vector<Column> columns_;
    std::size_t rows_ = 0;
    TableOptions options_;
};

/// Row-wise builder that encodes pages and collects statistics.
///
/// A value whose alternative does not match its column's type is stored as
/// NULL.
class TableBuilder {
   public:
    explicit TableBuilder(std::vector<ColumnSchema> schema, TableOptions options = {});
    ~TableBuilder();
    TableBuilder(TableBuilder&&) noexcept;
    auto operator=(TableBuilder&&) noexcept -> TableBuilder&;

    /// Append one row. Throws std::invalid_argument if the row width does not
    /// match the schema.
    void append_row(std::span<const Value> row);
    void append_row(std::initializer_list<Value> row) {
        append_row(std::span<const Value>(row.begin(), row.size()));
    }

    [[nodiscard]] auto row_count() const noexcept -> std::size_t;

    /// Flush the last page and produce the table. The builder is left empty.
    [[nodiscard]] auto finish() -> Table;

   private:
    struct State;
    std::unique_ptr<State> state_;
};

}  // namespace strata
