#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace gbranches {

struct Options {
    bool includeRemote{false};                  // -r, --remote
    bool autoSwitch{false};                     // -s, --switch
    std::optional<std::filesystem::path> path;  // -p, --path (canonical)
    bool help{false};                           // -h, --help
};

/**
 * @brief Parse command-line arguments (program name excluded)
 * @return Options, or InvalidArgs for unknown flags and bad --path values
 *
 * Accepts "--path PATH", "--path=PATH", "-p PATH", "-pPATH" and clustered
 * short flags ("-rs"). The path must name an existing directory.
 */
Expected<Options> parseOptions(const std::vector<std::string>& args);

}
