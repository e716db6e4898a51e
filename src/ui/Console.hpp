#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace gbranches {

enum class Color { Default, Red, Green, Yellow, Blue, Magenta, Cyan, White };

struct Style {
    Color color{Color::Default};
    bool bold{false};
    bool dim{false};
};

/**
 * @brief What the output side of the process is connected to
 *
 * The default describes a plain, colourless 80x24 sink (pipes, tests).
 */
struct TerminalInfo {
    bool colors{false};
    bool isTerminal{false};
    int columns{80};
    int rows{24};

    /**
     * @brief Inspect stdout
     *
     * Colours are enabled only for a terminal, and never when NO_COLOR is set
     * or TERM is "dumb".
     */
    static TerminalInfo detect();
};

/**
 * @brief Styled text sink used by every renderer
 */
class Console {
public:
    Console(std::ostream& out, TerminalInfo info);

    std::ostream& stream() { return out; }
    const TerminalInfo& terminal() const { return info; }
    int width() const { return info.columns; }
    int height() const { return info.rows; }

    /// Wrap text in the ANSI sequence for style (unchanged when colours are off)
    std::string styled(const std::string& text, const Style& style) const;

    void print(const std::string& text = "");
    void print(const std::string& text, const Style& style);
    void flush();

private:
    std::ostream& out;
    TerminalInfo info;
};

/// Display width of text: UTF-8 code points, ANSI escape sequences excluded
size_t visibleWidth(const std::string& text);

/**
 * @brief Split styled text into lines no wider than width
 *
 * Existing newlines are honoured. An active style is closed at each break
 * and reopened on the next line.
 */
std::vector<std::string> wrapVisible(const std::string& text, size_t width);

/// Pad text with spaces on the right up to width visible columns
std::string padRight(const std::string& text, size_t width);

/// Repeat a (possibly multi-byte) glyph count times
std::string repeat(const std::string& glyph, size_t count);

}
