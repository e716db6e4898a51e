#pragma once

#include <cstdint>
#include <string>

namespace gbranches {

/**
 * @brief Committer timestamp together with the timezone it was recorded in
 */
struct CommitTime {
    int64_t seconds{0};       // Seconds since the Unix epoch (UTC)
    int offsetMinutes{0};     // Timezone offset from UTC, in minutes
};

/**
 * @brief Display-relevant snapshot of one branch
 *
 * Built fresh from live repository state on every listing and never
 * modified afterwards.
 *
 * Local branches:   name = "feature/x",        remoteName = ""
 * Remote branches:  name = "origin/feature/x", remoteName = "origin"
 */
struct BranchRecord {
    std::string name;
    std::string commitHash;   // Full hex object id
    CommitTime commitTime;
    std::string summary;      // First line of the commit message
    bool isCurrent{false};
    bool isRemote{false};
    std::string remoteName;

    /// "* name" for the current branch, "  name" otherwise
    std::string displayName() const;

    /// First Constants::SHORT_HASH_LENGTH characters of the commit hash
    std::string shortHash() const;

    /// Commit time as "YYYY-MM-DD HH:MM:SS" in the commit's own timezone
    std::string formattedDate() const;

    /**
     * @brief Branch name without the remote prefix
     *
     * "origin/feature/x" -> "feature/x". Local records return name unchanged.
     */
    std::string localName() const;
};

/**
 * @brief Remove a "<remote>/" prefix from a remote-tracking branch name
 *
 * When remoteName is empty or does not prefix the name, everything up to the
 * first '/' is removed instead.
 */
std::string stripRemotePrefix(const std::string& name, const std::string& remoteName);

/**
 * @brief Reduce a raw commit message to its first non-blank line, trimmed
 */
std::string summarizeMessage(const std::string& message);

/// Leading maxChars UTF-8 code points of text
std::string firstCodepoints(const std::string& text, size_t maxChars);

/**
 * @brief Shorten text to at most maxChars characters, appending "..." when cut
 *
 * Counts UTF-8 code points, never splitting a multi-byte sequence.
 */
std::string truncateText(const std::string& text, size_t maxChars);

}
