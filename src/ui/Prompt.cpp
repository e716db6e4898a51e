#include "ui/Prompt.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <iostream>

#include <poll.h>
#include <unistd.h>

#include "core/BranchRecord.hpp"

namespace gbranches {

namespace {

constexpr int ESCAPE_TIMEOUT_MS = 50;

const Style QUESTION_MARK{Color::Green, true, false};
const Style BOLD{Color::Default, true, false};
const Style HINT{Color::Default, false, true};
const Style ANSWER{Color::Cyan, false, false};
const Style WARNING{Color::Yellow, false, false};

std::string trimLower(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    std::string out = s.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool readByte(unsigned char& c) {
    while (true) {
        ssize_t n = ::read(STDIN_FILENO, &c, 1);
        if (n == 1) return true;
        if (n < 0 && errno == EINTR) continue;
        return false;
    }
}

bool inputPending(int timeoutMs) {
    struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
    return poll(&pfd, 1, timeoutMs) > 0;
}

}

RawMode::RawMode() {
    if (isatty(STDIN_FILENO) != 1 || tcgetattr(STDIN_FILENO, &saved) != 0) return;
    struct termios raw = saved;
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO | ISIG));
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    enabled = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
}

RawMode::~RawMode() {
    if (enabled) tcsetattr(STDIN_FILENO, TCSANOW, &saved);
}

KeyPress readKey() {
    unsigned char c = 0;
    if (!readByte(c)) return {Key::Cancel, 0};

    switch (c) {
        case '\r':
        case '\n':
            return {Key::Enter, 0};
        case 3:   // Ctrl-C
        case 4:   // Ctrl-D
            return {Key::Cancel, 0};
        case 27: {
            // A lone Esc cancels; ESC [ A / ESC O A and friends are arrows
            if (!inputPending(ESCAPE_TIMEOUT_MS)) return {Key::Cancel, 0};
            unsigned char intro = 0;
            unsigned char code = 0;
            if (!readByte(intro) || (intro != '[' && intro != 'O')) return {Key::Other, 0};
            if (!readByte(code)) return {Key::Other, 0};
            if (code == 'A') return {Key::Up, 0};
            if (code == 'B') return {Key::Down, 0};
            return {Key::Other, 0};
        }
        default:
            return {Key::Char, static_cast<char>(c)};
    }
}

SelectPrompt::SelectPrompt(std::string message, std::vector<std::string> choices)
    : message(std::move(message)), choices(std::move(choices)) {}

PromptResult<size_t> SelectPrompt::run(Console& console, PromptInput input) const {
    if (choices.empty()) return PromptResult<size_t>::cancelled();
    if (input.rawKeys) return runRaw(console);
    return runLines(console, input.in);
}

void SelectPrompt::printAnswer(Console& console, size_t index) const {
    console.stream() << console.styled("✓", QUESTION_MARK) << " " << console.styled(message, BOLD) << " "
                     << console.styled(choices[index], ANSWER) << "\n";
    console.flush();
}

PromptResult<size_t> SelectPrompt::runRaw(Console& console) const {
    RawMode raw;
    if (!raw.active()) return runLines(console, std::cin);

    std::ostream& out = console.stream();
    size_t visible = std::min(choices.size(), static_cast<size_t>(std::max(console.height() - 2, 1)));
    size_t textWidth = static_cast<size_t>(std::max(console.width() - 6, 8));
    size_t cursor = 0;
    size_t top = 0;
    bool drawn = false;

    auto erase = [&]() {
        if (drawn) out << "\r\033[" << (visible + 1) << "A\033[J";
    };
    auto draw = [&]() {
        erase();
        out << console.styled("?", QUESTION_MARK) << " " << console.styled(message, BOLD)
            << console.styled(" (Use arrow keys)", HINT) << "\n";
        for (size_t i = top; i < top + visible; ++i) {
            std::string text = truncateText(choices[i], textWidth);
            if (i == cursor) {
                out << console.styled("❯ " + text, ANSWER) << "\n";
            } else {
                out << "  " << text << "\n";
            }
        }
        out.flush();
        drawn = true;
    };
    auto finish = [&]() {
        erase();
        out << "\033[?25h";
    };

    out << "\033[?25l";
    while (true) {
        draw();
        KeyPress press = readKey();
        if (press.key == Key::Char) {
            if (press.ch == 'k') press.key = Key::Up;
            else if (press.ch == 'j') press.key = Key::Down;
            else if (press.ch == 'q') press.key = Key::Cancel;
        }

        switch (press.key) {
            case Key::Up:
                cursor = cursor == 0 ? choices.size() - 1 : cursor - 1;
                break;
            case Key::Down:
                cursor = (cursor + 1) % choices.size();
                break;
            case Key::Enter:
                finish();
                printAnswer(console, cursor);
                return cursor;
            case Key::Cancel:
                finish();
                out.flush();
                return PromptResult<size_t>::cancelled();
            case Key::Char:
            case Key::Other:
                break;
        }
        if (cursor < top) top = cursor;
        if (cursor >= top + visible) top = cursor - visible + 1;
    }
}

PromptResult<size_t> SelectPrompt::runLines(Console& console, std::istream& in) const {
    std::ostream& out = console.stream();
    out << console.styled("?", QUESTION_MARK) << " " << console.styled(message, BOLD) << "\n";
    size_t numberWidth = std::to_string(choices.size()).size();
    for (size_t i = 0; i < choices.size(); ++i) {
        std::string number = std::to_string(i + 1);
        out << "  " << std::string(numberWidth - number.size(), ' ') << number << ") " << choices[i] << "\n";
    }

    while (true) {
        out << "Enter a number (q to cancel): ";
        out.flush();
        std::string line;
        if (!std::getline(in, line)) {
            out << "\n";
            return PromptResult<size_t>::cancelled();
        }
        std::string answer = trimLower(line);
        if (answer == "q") return PromptResult<size_t>::cancelled();

        bool numeric = !answer.empty() && answer.size() <= 9 &&
                       std::all_of(answer.begin(), answer.end(), [](unsigned char c) { return std::isdigit(c); });
        if (numeric) {
            size_t choice = static_cast<size_t>(std::stoul(answer));
            if (choice >= 1 && choice <= choices.size()) {
                printAnswer(console, choice - 1);
                return choice - 1;
            }
        }
        out << console.styled("Please enter a number between 1 and " + std::to_string(choices.size()) + ".", WARNING)
            << "\n";
    }
}

ConfirmPrompt::ConfirmPrompt(std::string message, bool defaultAnswer)
    : message(std::move(message)), defaultAnswer(defaultAnswer) {}

std::string ConfirmPrompt::question(const Console& console) const {
    return console.styled("?", QUESTION_MARK) + " " + console.styled(message, BOLD) +
           console.styled(defaultAnswer ? " (Y/n)" : " (y/N)", HINT) + " ";
}

PromptResult<bool> ConfirmPrompt::run(Console& console, PromptInput input) const {
    if (input.rawKeys) return runRaw(console);
    return runLines(console, input.in);
}

PromptResult<bool> ConfirmPrompt::runRaw(Console& console) const {
    RawMode raw;
    if (!raw.active()) return runLines(console, std::cin);

    std::ostream& out = console.stream();
    out << question(console);
    out.flush();
    while (true) {
        KeyPress press = readKey();
        bool answer = defaultAnswer;
        if (press.key == Key::Cancel) {
            out << "\n";
            out.flush();
            return PromptResult<bool>::cancelled();
        }
        if (press.key == Key::Char) {
            char c = static_cast<char>(std::tolower(static_cast<unsigned char>(press.ch)));
            if (c != 'y' && c != 'n') continue;
            answer = c == 'y';
        } else if (press.key != Key::Enter) {
            continue;
        }
        out << console.styled(answer ? "Yes" : "No", ANSWER) << "\n";
        out.flush();
        return answer;
    }
}

PromptResult<bool> ConfirmPrompt::runLines(Console& console, std::istream& in) const {
    std::ostream& out = console.stream();
    while (true) {
        out << question(console);
        out.flush();
        std::string line;
        if (!std::getline(in, line)) {
            out << "\n";
            return PromptResult<bool>::cancelled();
        }
        std::string answer = trimLower(line);
        if (answer.empty()) return defaultAnswer;
        if (answer == "y" || answer == "yes") return true;
        if (answer == "n" || answer == "no") return false;
        out << console.styled("Please answer y or n.", WARNING) << "\n";
    }
}

}
