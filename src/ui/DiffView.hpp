#pragma once

#include <string>
#include <vector>

#include "ui/Console.hpp"

namespace gbranches {

/**
 * @brief Line-numbered, colourised rendering of a unified patch
 *
 *   diff/index/---/+++  bold
 *   @@ ... @@           cyan
 *   +line               green
 *   -line               red
 */
class DiffView {
public:
    explicit DiffView(const std::string& patch);

    size_t lineCount() const { return lines.size(); }
    std::string render(const Console& console) const;

private:
    std::vector<std::string> lines;
};

}
