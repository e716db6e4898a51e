#pragma once

#include <cstddef>

/**
 * @brief Display and git constants used throughout the codebase
 *
 * Centralizes magic numbers and sentinel strings.
 */
namespace gbranches {

namespace Constants {
    // Hash display
    constexpr size_t SHORT_HASH_LENGTH = 7;        // Abbreviated commit id shown to users

    // Message truncation
    constexpr size_t TABLE_MESSAGE_WIDTH = 60;     // Commit summary width in the branch table
    constexpr size_t SELECT_MESSAGE_WIDTH = 50;    // Commit summary width in the select prompt

    // Sentinels
    constexpr const char* DETACHED_HEAD = "HEAD (detached)";
    constexpr const char* NO_CHANGES = "No changes in this commit";

    // Reference namespace
    constexpr const char* LOCAL_REF_PREFIX = "refs/heads/";

    // Pager used when $PAGER is unset
    constexpr const char* DEFAULT_PAGER = "less -R";
}
}
