#include "ui/Console.hpp"

#include <cstdlib>
#include <cstring>

#include <sys/ioctl.h>
#include <unistd.h>

namespace gbranches {

namespace {

const char* const RESET = "\033[0m";

int colorCode(Color color) {
    switch (color) {
        case Color::Red: return 31;
        case Color::Green: return 32;
        case Color::Yellow: return 33;
        case Color::Blue: return 34;
        case Color::Magenta: return 35;
        case Color::Cyan: return 36;
        case Color::White: return 37;
        case Color::Default: break;
    }
    return 0;
}

bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}

TerminalInfo TerminalInfo::detect() {
    TerminalInfo info;
    info.isTerminal = isatty(STDOUT_FILENO) == 1;
    const char* term = std::getenv("TERM");
    bool dumb = term && std::strcmp(term, "dumb") == 0;
    info.colors = info.isTerminal && !dumb && std::getenv("NO_COLOR") == nullptr;

    struct winsize w;
    if (info.isTerminal && ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0) {
        if (w.ws_col > 0) info.columns = w.ws_col;
        if (w.ws_row > 0) info.rows = w.ws_row;
    }
    return info;
}

Console::Console(std::ostream& out, TerminalInfo info) : out(out), info(info) {}

std::string Console::styled(const std::string& text, const Style& style) const {
    if (!info.colors) return text;
    std::string codes;
    auto add = [&codes](int code) {
        if (!codes.empty()) codes += ';';
        codes += std::to_string(code);
    };
    if (style.bold) add(1);
    if (style.dim) add(2);
    if (style.color != Color::Default) add(colorCode(style.color));
    if (codes.empty()) return text;
    return "\033[" + codes + "m" + text + RESET;
}

void Console::print(const std::string& text) { out << text << "\n"; }

void Console::print(const std::string& text, const Style& style) { out << styled(text, style) << "\n"; }

void Console::flush() { out.flush(); }

size_t visibleWidth(const std::string& text) {
    size_t width = 0;
    bool inEscape = false;
    for (char c : text) {
        if (c == '\033') {
            inEscape = true;
        } else if (inEscape) {
            if (c == 'm') inEscape = false;
        } else if (!isContinuationByte(c)) {
            ++width;
        }
    }
    return width;
}

std::vector<std::string> wrapVisible(const std::string& text, size_t width) {
    std::vector<std::string> lines;
    std::string current;
    std::string activeStyle;
    size_t column = 0;
    if (width == 0) width = 1;

    auto breakLine = [&]() {
        if (!activeStyle.empty()) current += RESET;
        lines.push_back(current);
        current = activeStyle;
        column = 0;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\033') {
            size_t end = text.find('m', i);
            if (end == std::string::npos) end = text.size() - 1;
            std::string seq = text.substr(i, end - i + 1);
            activeStyle = (seq == RESET) ? std::string() : seq;
            current += seq;
            i = end;
            continue;
        }
        if (c == '\n') {
            breakLine();
            continue;
        }
        if (!isContinuationByte(c)) {
            if (column == width) breakLine();
            ++column;
        }
        current += c;
    }
    lines.push_back(current);
    return lines;
}

std::string padRight(const std::string& text, size_t width) {
    size_t visible = visibleWidth(text);
    if (visible >= width) return text;
    return text + std::string(width - visible, ' ');
}

std::string repeat(const std::string& glyph, size_t count) {
    std::string out;
    out.reserve(glyph.size() * count);
    for (size_t i = 0; i < count; ++i) out += glyph;
    return out;
}

}
