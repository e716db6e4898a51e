#pragma once

#include <istream>
#include <string>
#include <utility>
#include <vector>

#include <termios.h>

#include "ui/Console.hpp"

namespace gbranches {

/**
 * @brief Outcome of a prompt: an answer, or the user backing out
 *
 * Cancellation (Esc, q, Ctrl-C, Ctrl-D, end of input) is an ordinary result,
 * not an error.
 */
template <typename T>
class PromptResult {
public:
    PromptResult(const T& value) : cancelled_(false), value_(value) {}
    PromptResult(T&& value) : cancelled_(false), value_(std::move(value)) {}

    static PromptResult cancelled() { return PromptResult(); }

    bool isCancelled() const { return cancelled_; }
    explicit operator bool() const { return !cancelled_; }
    const T& value() const { return value_; }

private:
    PromptResult() : cancelled_(true), value_() {}

    bool cancelled_;
    T value_;
};

/**
 * @brief Where prompt answers come from
 *
 * rawKeys selects single-key input straight from the terminal on stdin;
 * otherwise answers are read line by line from in.
 */
struct PromptInput {
    std::istream& in;
    bool rawKeys{false};
};

/**
 * @brief RAII switch of the stdin terminal to non-canonical, no-echo mode
 *
 * ISIG is cleared too, so Ctrl-C is delivered as a key.
 */
class RawMode {
public:
    RawMode();
    ~RawMode();
    RawMode(const RawMode&) = delete;
    RawMode& operator=(const RawMode&) = delete;

    bool active() const { return enabled; }

private:
    struct termios saved {};
    bool enabled{false};
};

enum class Key { Up, Down, Enter, Cancel, Char, Other };

struct KeyPress {
    Key key{Key::Other};
    char ch{0};
};

/// Block for one key press on stdin (raw mode must be active)
KeyPress readKey();

/**
 * @brief Single-select list
 *
 * Raw keys: Up/Down or k/j move, Enter chooses, Esc/q/Ctrl-C/Ctrl-D cancel.
 * Line mode: the choices are numbered and the answer is a number; "q" or end
 * of input cancels.
 */
class SelectPrompt {
public:
    SelectPrompt(std::string message, std::vector<std::string> choices);

    /// @return Index of the chosen entry
    PromptResult<size_t> run(Console& console, PromptInput input) const;

private:
    PromptResult<size_t> runRaw(Console& console) const;
    PromptResult<size_t> runLines(Console& console, std::istream& in) const;
    void printAnswer(Console& console, size_t index) const;

    std::string message;
    std::vector<std::string> choices;
};

/**
 * @brief Yes/no question with a default answer
 *
 * Raw keys: y/n answer, Enter takes the default, Esc/Ctrl-C/Ctrl-D cancel.
 * Line mode: "y"/"yes", "n"/"no", empty line for the default; end of input
 * cancels.
 */
class ConfirmPrompt {
public:
    ConfirmPrompt(std::string message, bool defaultAnswer);

    PromptResult<bool> run(Console& console, PromptInput input) const;

private:
    PromptResult<bool> runRaw(Console& console) const;
    PromptResult<bool> runLines(Console& console, std::istream& in) const;
    std::string question(const Console& console) const;

    std::string message;
    bool defaultAnswer;
};

}
