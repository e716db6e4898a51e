#pragma once

#include <string>

#include "ui/Console.hpp"

namespace gbranches {

/**
 * @brief Show long rendered output through $PAGER
 *
 * Text is paged only when the console is a terminal and the text is taller
 * than it; otherwise, or when the pager cannot be started, it is printed
 * inline. The pager command defaults to Constants::DEFAULT_PAGER.
 */
class Pager {
public:
    /// @return true when the text went through the pager process
    static bool show(Console& console, const std::string& text);

    /// Pager command line from $PAGER, falling back to the default
    static std::string command();
};

}
