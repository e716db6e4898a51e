#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ui/Console.hpp"

namespace gbranches {

/**
 * @brief Titled, box-drawn table
 *
 * Cells hold plain text; styling is applied at render time so widths can be
 * computed and cells truncated without cutting escape sequences. When the
 * table is wider than the console the widest columns are narrowed and their
 * cells end in an ellipsis.
 */
class Table {
public:
    struct Cell {
        std::string text;
        std::optional<Style> style;   // Overrides the column style

        Cell(const char* t) : text(t) {}
        Cell(std::string t) : text(std::move(t)) {}
        Cell(std::string t, Style s) : text(std::move(t)), style(s) {}
    };

    explicit Table(std::string title);

    void addColumn(const std::string& header, Style style);
    void addRow(std::vector<Cell> cells);

    size_t rowCount() const { return rows.size(); }
    std::string render(const Console& console) const;

private:
    struct Column {
        std::string header;
        Style style;
    };

    std::vector<size_t> fitWidths(size_t available) const;

    std::string title;
    std::vector<Column> columns;
    std::vector<std::vector<Cell>> rows;
};

}
