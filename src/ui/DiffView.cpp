#include "ui/DiffView.hpp"

#include <sstream>

namespace gbranches {

namespace {

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

const Style HEADER{Color::Default, true, false};
const Style HUNK{Color::Cyan, false, false};

bool isFileHeader(const std::string& line) {
    return startsWith(line, "diff ") || startsWith(line, "index ") || startsWith(line, "--- ") ||
           startsWith(line, "+++ ") || startsWith(line, "new file") || startsWith(line, "deleted file") ||
           startsWith(line, "similarity") || startsWith(line, "rename ") || startsWith(line, "Binary files") ||
           startsWith(line, "old mode") || startsWith(line, "new mode");
}

// Style of a line inside a hunk body
Style hunkLineStyle(const std::string& line) {
    if (startsWith(line, "+")) return Style{Color::Green, false, false};
    if (startsWith(line, "-")) return Style{Color::Red, false, false};
    if (startsWith(line, "\\")) return Style{Color::Default, false, true};
    return Style{};
}

}

DiffView::DiffView(const std::string& patch) {
    std::istringstream in(patch);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
}

std::string DiffView::render(const Console& console) const {
    size_t gutter = std::to_string(lines.size()).size();
    Style numberStyle{Color::Default, false, true};
    std::string out;
    bool inHunk = false;
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        Style style;
        if (startsWith(line, "diff ")) {
            inHunk = false;
            style = HEADER;
        } else if (startsWith(line, "@@")) {
            inHunk = true;
            style = HUNK;
        } else if (inHunk) {
            style = hunkLineStyle(line);
        } else if (isFileHeader(line)) {
            style = HEADER;
        }
        std::string number = std::to_string(i + 1);
        number = std::string(gutter - number.size(), ' ') + number;
        out += console.styled(number, numberStyle) + " │ " + console.styled(line, style) + "\n";
    }
    return out;
}

}
