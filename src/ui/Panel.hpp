#pragma once

#include <string>

#include "ui/Console.hpp"

namespace gbranches {

/**
 * @brief Full-width box around a block of (possibly styled) text
 *
 * The title sits in the top border; long lines wrap inside the box.
 */
class Panel {
public:
    Panel(std::string body, std::string title, Color border);

    std::string render(const Console& console) const;

private:
    std::string body;
    std::string title;
    Color border;
};

}
