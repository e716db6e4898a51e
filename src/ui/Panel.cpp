#include "ui/Panel.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace gbranches {

namespace {

constexpr size_t MIN_PANEL_WIDTH = 10;

}

Panel::Panel(std::string body, std::string title, Color border)
    : body(std::move(body)), title(std::move(title)), border(border) {}

std::string Panel::render(const Console& console) const {
    size_t width = std::max(static_cast<size_t>(std::max(console.width(), 0)), MIN_PANEL_WIDTH);
    size_t inner = width - 4;
    Style frame{border, false, false};

    std::string text = body;
    while (!text.empty() && text.back() == '\n') text.pop_back();

    // ╭──── Title ────╮
    std::string top;
    size_t fill = width - 2;
    if (!title.empty() && visibleWidth(title) + 2 <= fill) {
        std::string label = " " + title + " ";
        size_t left = (fill - visibleWidth(label)) / 2;
        size_t right = fill - visibleWidth(label) - left;
        top = console.styled("╭" + repeat("─", left), frame) + label + console.styled(repeat("─", right) + "╮", frame);
    } else {
        top = console.styled("╭" + repeat("─", fill) + "╮", frame);
    }

    std::string out = top + "\n";
    for (const auto& line : wrapVisible(text, inner)) {
        out += console.styled("│", frame) + " " + padRight(line, inner) + " " + console.styled("│", frame) + "\n";
    }
    out += console.styled("╰" + repeat("─", fill) + "╯", frame) + "\n";
    return out;
}

}
