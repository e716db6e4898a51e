#include "ui/Table.hpp"

#include <algorithm>

namespace gbranches {

namespace {

constexpr size_t MIN_COLUMN_WIDTH = 4;

// Cut text to exactly width columns, marking the cut with an ellipsis
std::string ellipsize(const std::string& text, size_t width) {
    if (visibleWidth(text) <= width) return text;
    if (width == 0) return std::string();
    std::string out;
    size_t count = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) != 0x80) {
            if (count == width - 1) break;
            ++count;
        }
        out += text[i];
    }
    return out + "…";
}

std::string rule(const std::vector<size_t>& widths, const char* left, const char* fill,
                 const char* mid, const char* right) {
    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        line += repeat(fill, widths[i] + 2);
        line += (i + 1 < widths.size()) ? mid : right;
    }
    return line;
}

}

Table::Table(std::string title) : title(std::move(title)) {}

void Table::addColumn(const std::string& header, Style style) {
    columns.push_back(Column{header, style});
}

void Table::addRow(std::vector<Cell> cells) {
    cells.resize(columns.size(), Cell(std::string()));
    rows.push_back(std::move(cells));
}

std::vector<size_t> Table::fitWidths(size_t available) const {
    std::vector<size_t> widths;
    for (size_t c = 0; c < columns.size(); ++c) {
        size_t w = visibleWidth(columns[c].header);
        for (const auto& row : rows) w = std::max(w, visibleWidth(row[c].text));
        widths.push_back(w);
    }

    size_t overhead = 3 * columns.size() + 1;
    auto total = [&]() {
        size_t sum = overhead;
        for (size_t w : widths) sum += w;
        return sum;
    };
    while (!widths.empty() && total() > available) {
        auto widest = std::max_element(widths.begin(), widths.end());
        if (*widest <= MIN_COLUMN_WIDTH) break;
        --*widest;
    }
    return widths;
}

std::string Table::render(const Console& console) const {
    if (columns.empty()) return std::string();
    std::vector<size_t> widths = fitWidths(static_cast<size_t>(std::max(console.width(), 0)));

    std::string out;
    std::string topRule = rule(widths, "┏", "━", "┳", "┓");
    if (!title.empty()) {
        size_t tableWidth = visibleWidth(topRule);
        std::string shownTitle = ellipsize(title, tableWidth);
        size_t pad = (tableWidth - visibleWidth(shownTitle)) / 2;
        out += std::string(pad, ' ') + console.styled(shownTitle, Style{Color::Default, true, false}) + "\n";
    }

    out += topRule + "\n";
    std::string header = "┃";
    for (size_t c = 0; c < columns.size(); ++c) {
        std::string text = padRight(ellipsize(columns[c].header, widths[c]), widths[c]);
        header += " " + console.styled(text, Style{Color::Default, true, false}) + " ┃";
    }
    out += header + "\n";
    out += rule(widths, "┡", "━", "╇", "┩") + "\n";

    for (const auto& row : rows) {
        std::string line = "│";
        for (size_t c = 0; c < columns.size(); ++c) {
            const Cell& cell = row[c];
            std::string text = padRight(ellipsize(cell.text, widths[c]), widths[c]);
            line += " " + console.styled(text, cell.style ? *cell.style : columns[c].style) + " │";
        }
        out += line + "\n";
    }
    out += rule(widths, "└", "─", "┴", "┘") + "\n";
    return out;
}

}
