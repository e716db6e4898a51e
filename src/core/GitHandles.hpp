#pragma once

#include <memory>
#include <string>

#include <git2.h>

namespace gbranches {

/**
 * @brief Owning handles for libgit2 objects
 *
 * Each alias pairs a libgit2 object type with its git_*_free function so
 * every acquired object is released on scope exit, including error paths.
 */
namespace git {

template <typename T, void (*Free)(T*)>
struct Deleter {
    void operator()(T* p) const { if (p) Free(p); }
};

using RepositoryPtr     = std::unique_ptr<git_repository, Deleter<git_repository, git_repository_free>>;
using ReferencePtr      = std::unique_ptr<git_reference, Deleter<git_reference, git_reference_free>>;
using CommitPtr         = std::unique_ptr<git_commit, Deleter<git_commit, git_commit_free>>;
using TreePtr           = std::unique_ptr<git_tree, Deleter<git_tree, git_tree_free>>;
using ObjectPtr         = std::unique_ptr<git_object, Deleter<git_object, git_object_free>>;
using DiffPtr           = std::unique_ptr<git_diff, Deleter<git_diff, git_diff_free>>;
using BranchIteratorPtr = std::unique_ptr<git_branch_iterator, Deleter<git_branch_iterator, git_branch_iterator_free>>;

/**
 * @brief RAII scope for libgit2's global state
 *
 * libgit2 counts init/shutdown pairs, so nested sessions are safe.
 */
class LibGit2Session {
public:
    LibGit2Session();
    ~LibGit2Session();
    LibGit2Session(const LibGit2Session&) = delete;
    LibGit2Session& operator=(const LibGit2Session&) = delete;
};

/// Message of the last libgit2 error on this thread, or a generic fallback
std::string lastErrorMessage();

/// Hex form of an object id
std::string oidToHex(const git_oid* oid);

}

}
