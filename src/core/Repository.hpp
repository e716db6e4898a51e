#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <git2.h>

#include "core/BranchRecord.hpp"
#include "core/GitHandles.hpp"
#include "util/Expected.hpp"

namespace gbranches {

/**
 * @brief Branch-level facade over a libgit2 repository handle
 *
 * Owns the git_repository handle for its whole lifetime. Every operation
 * reports failures through Expected:
 *   - RepositoryNotFound  no .git found at the path or any ancestor
 *   - NoBranchesFound     a listing came back empty
 *   - OperationFailed     anything libgit2 refused (bad ref, conflicts, ...)
 *
 * Requires an active git::LibGit2Session.
 */
class Repository {
public:
    Repository() = default;

    /**
     * @brief Discover and open a repository
     * @param path Starting directory; the current directory when empty
     * @return Open repository, or RepositoryNotFound
     *
     * Walks up from the starting directory until git metadata is found.
     */
    static Expected<Repository> open(const std::optional<std::filesystem::path>& path);

    /// Working directory of the repository (the git dir for bare repositories)
    const std::filesystem::path& root() const { return rootPath; }

    /**
     * @brief Name of the branch HEAD points to
     * @return Short branch name, Constants::DETACHED_HEAD when detached,
     *         or OperationFailed
     *
     * An unborn branch (no commits yet) still reports its name.
     */
    Expected<std::string> currentBranchName() const;

    /**
     * @brief List branches, newest tip commit first
     * @param includeRemote Also list remote-tracking branches
     * @return Records sorted by commit time descending, NoBranchesFound when
     *         empty, or OperationFailed
     *
     * Branches whose tip cannot be read are logged and left out.
     * Symbolic remote refs such as origin/HEAD are never listed.
     */
    Expected<std::vector<BranchRecord>> listBranches(bool includeRemote) const;

    /**
     * @brief Patch introduced by the tip commit of a branch
     * @param branchName Local name, remote-tracking name or revision
     * @return Patch text, Constants::NO_CHANGES when empty, or OperationFailed
     *
     * Diffs the first parent against the tip; root commits are diffed
     * against the empty tree.
     */
    Expected<std::string> lastCommitDiff(const std::string& branchName) const;

    /**
     * @brief Switch the working tree and HEAD to a branch
     * @param branchName Local branch, or remote-tracking branch ("origin/foo")
     * @return Success or OperationFailed
     *
     * A remote-tracking name switches to the local branch with the same short
     * name, creating it with its upstream set when it does not exist. The
     * checkout is safe: local modifications that would be overwritten abort it
     * before anything is written, and a branch created for the attempt is
     * removed again.
     */
    Expected<void> checkout(const std::string& branchName);

private:
    Repository(git::RepositoryPtr handle, std::filesystem::path root);

    Expected<void> collectBranches(git_branch_t type, const std::string& currentName,
                                   std::vector<BranchRecord>& out) const;
    Expected<BranchRecord> readBranch(git_reference* ref, git_branch_t type,
                                      const std::string& currentName) const;
    std::string remoteNameOf(git_reference* ref, const std::string& shortName) const;
    Expected<git::CommitPtr> resolveCommit(const std::string& branchName) const;
    Expected<void> checkoutTracking(git_reference* remoteRef, const std::string& branchName);
    Expected<void> switchTo(git_reference* localRef, const std::string& branchName);

    git::RepositoryPtr handle{};
    std::filesystem::path rootPath{};
};

}
