#include "core/Repository.hpp"

#include <algorithm>
#include <utility>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace gbranches {

namespace {

Error operationFailed(const std::string& context) {
    return Error{ErrorCode::OperationFailed, context + ": " + git::lastErrorMessage()};
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// origin/HEAD and friends point at another remote ref rather than a commit
bool isPointerRef(git_reference* ref) {
    if (git_reference_type(ref) == GIT_REFERENCE_SYMBOLIC) return true;
    return endsWith(git_reference_name(ref), "/HEAD");
}

int appendPatchLine(const git_diff_delta*, const git_diff_hunk*, const git_diff_line* line, void* payload) {
    std::string& out = *static_cast<std::string*>(payload);
    switch (line->origin) {
        case GIT_DIFF_LINE_CONTEXT:
        case GIT_DIFF_LINE_ADDITION:
        case GIT_DIFF_LINE_DELETION:
            out.push_back(line->origin);
            break;
        default:
            break;
    }
    out.append(line->content, line->content_len);
    return 0;
}

}

Repository::Repository(git::RepositoryPtr repoHandle, fs::path root)
    : handle(std::move(repoHandle)), rootPath(std::move(root)) {}

Expected<Repository> Repository::open(const std::optional<fs::path>& path) {
    std::string start = path ? path->string() : std::string(".");
    git_repository* raw = nullptr;
    int rc = git_repository_open_ext(&raw, start.c_str(), 0, nullptr);
    git::RepositoryPtr repo(raw);
    if (rc == GIT_ENOTFOUND) {
        Logger::instance().debug("Repository discovery failed: " + git::lastErrorMessage());
        return Error{ErrorCode::RepositoryNotFound,
                     "Not a git repository: " + (path ? path->string() : std::string("current directory"))};
    }
    if (rc < 0) return operationFailed("Failed to open repository " + start);

    const char* workdir = git_repository_workdir(repo.get());
    fs::path root = workdir ? fs::path(workdir) : fs::path(git_repository_path(repo.get()));
    Logger::instance().debug("Opened repository at " + root.string());
    return Repository(std::move(repo), root);
}

Expected<std::string> Repository::currentBranchName() const {
    int detached = git_repository_head_detached(handle.get());
    if (detached < 0) return operationFailed("Failed to get current branch");
    if (detached == 1) return std::string(Constants::DETACHED_HEAD);

    git_reference* raw = nullptr;
    int rc = git_repository_head(&raw, handle.get());
    git::ReferencePtr head(raw);
    if (rc == 0) return std::string(git_reference_shorthand(head.get()));
    if (rc != GIT_EUNBORNBRANCH) return operationFailed("Failed to get current branch");

    // No commits yet: HEAD still names the branch it will create
    if (git_reference_lookup(&raw, handle.get(), "HEAD") < 0) return operationFailed("Failed to get current branch");
    git::ReferencePtr symbolic(raw);
    const char* target = git_reference_symbolic_target(symbolic.get());
    if (!target) {
        return Error{ErrorCode::OperationFailed, "Failed to get current branch: HEAD is not symbolic"};
    }
    std::string name(target);
    std::string prefix(Constants::LOCAL_REF_PREFIX);
    if (name.rfind(prefix, 0) == 0) name = name.substr(prefix.size());
    return name;
}

Expected<std::vector<BranchRecord>> Repository::listBranches(bool includeRemote) const {
    auto currentRes = currentBranchName();
    if (!currentRes) {
        return Error{ErrorCode::OperationFailed, "Failed to fetch branches: " + currentRes.error().message};
    }
    const std::string& currentName = currentRes.value();

    std::vector<BranchRecord> branches;
    auto localRes = collectBranches(GIT_BRANCH_LOCAL, currentName, branches);
    if (!localRes) return localRes.error();
    if (includeRemote) {
        auto remoteRes = collectBranches(GIT_BRANCH_REMOTE, currentName, branches);
        if (!remoteRes) return remoteRes.error();
    }

    if (branches.empty()) {
        return Error{ErrorCode::NoBranchesFound, "No branches found in repository"};
    }

    std::stable_sort(branches.begin(), branches.end(), [](const BranchRecord& a, const BranchRecord& b) {
        return a.commitTime.seconds > b.commitTime.seconds;
    });
    Logger::instance().debug("Listed " + std::to_string(branches.size()) + " branches");
    return branches;
}

Expected<void> Repository::collectBranches(git_branch_t type, const std::string& currentName,
                                           std::vector<BranchRecord>& out) const {
    git_branch_iterator* rawIt = nullptr;
    if (git_branch_iterator_new(&rawIt, handle.get(), type) < 0) {
        return operationFailed("Failed to fetch branches");
    }
    git::BranchIteratorPtr it(rawIt);

    while (true) {
        git_reference* rawRef = nullptr;
        git_branch_t refType;
        int rc = git_branch_next(&rawRef, &refType, it.get());
        if (rc == GIT_ITEROVER) break;
        if (rc < 0) return operationFailed("Failed to fetch branches");
        git::ReferencePtr ref(rawRef);

        if (refType == GIT_BRANCH_REMOTE && isPointerRef(ref.get())) {
            Logger::instance().debug(std::string("Skipping pointer ref ") + git_reference_name(ref.get()));
            continue;
        }

        auto record = readBranch(ref.get(), refType, currentName);
        if (!record) {
            Logger::instance().warn("Skipping branch " + std::string(git_reference_name(ref.get())) + ": " +
                                    record.error().message);
            continue;
        }
        out.push_back(std::move(record.value()));
    }
    return {};
}

Expected<BranchRecord> Repository::readBranch(git_reference* ref, git_branch_t type,
                                              const std::string& currentName) const {
    const char* name = nullptr;
    if (git_branch_name(&name, ref) < 0) return operationFailed("Failed to read branch name");

    git_object* peeled = nullptr;
    if (git_reference_peel(&peeled, ref, GIT_OBJECT_COMMIT) < 0) {
        return operationFailed("Failed to resolve tip commit");
    }
    git::CommitPtr commit(reinterpret_cast<git_commit*>(peeled));

    BranchRecord record;
    record.name = name;
    record.commitHash = git::oidToHex(git_commit_id(commit.get()));
    record.commitTime = CommitTime{static_cast<int64_t>(git_commit_time(commit.get())),
                                   git_commit_time_offset(commit.get())};
    const char* message = git_commit_message(commit.get());
    record.summary = summarizeMessage(message ? message : "");
    record.isRemote = type == GIT_BRANCH_REMOTE;
    record.isCurrent = !record.isRemote && record.name == currentName;
    if (record.isRemote) record.remoteName = remoteNameOf(ref, record.name);
    return record;
}

std::string Repository::remoteNameOf(git_reference* ref, const std::string& shortName) const {
    git_buf buf = GIT_BUF_INIT;
    if (git_branch_remote_name(&buf, handle.get(), git_reference_name(ref)) == 0) {
        std::string remote(buf.ptr, buf.size);
        git_buf_dispose(&buf);
        return remote;
    }
    git_buf_dispose(&buf);
    // Not matched by any configured fetch refspec
    auto slash = shortName.find('/');
    return slash == std::string::npos ? std::string() : shortName.substr(0, slash);
}

Expected<git::CommitPtr> Repository::resolveCommit(const std::string& branchName) const {
    git_reference* rawRef = nullptr;
    int rc = git_branch_lookup(&rawRef, handle.get(), branchName.c_str(), GIT_BRANCH_LOCAL);
    if (rc == GIT_ENOTFOUND) {
        rc = git_branch_lookup(&rawRef, handle.get(), branchName.c_str(), GIT_BRANCH_REMOTE);
    }

    git_object* peeled = nullptr;
    if (rc == 0) {
        git::ReferencePtr ref(rawRef);
        rc = git_reference_peel(&peeled, ref.get(), GIT_OBJECT_COMMIT);
    } else if (rc == GIT_ENOTFOUND || rc == GIT_EINVALIDSPEC) {
        git_object* rawRev = nullptr;
        rc = git_revparse_single(&rawRev, handle.get(), branchName.c_str());
        git::ObjectPtr rev(rawRev);
        if (rc == 0) rc = git_object_peel(&peeled, rev.get(), GIT_OBJECT_COMMIT);
    }
    if (rc < 0) return Error{ErrorCode::OperationFailed, git::lastErrorMessage()};
    return git::CommitPtr(reinterpret_cast<git_commit*>(peeled));
}

Expected<std::string> Repository::lastCommitDiff(const std::string& branchName) const {
    const std::string context = "Failed to get diff for " + branchName;
    auto commitRes = resolveCommit(branchName);
    if (!commitRes) return Error{ErrorCode::OperationFailed, context + ": " + commitRes.error().message};
    git_commit* tip = commitRes.value().get();

    git::TreePtr parentTree;
    if (git_commit_parentcount(tip) > 0) {
        git_commit* rawParent = nullptr;
        if (git_commit_parent(&rawParent, tip, 0) < 0) return operationFailed(context);
        git::CommitPtr parent(rawParent);
        git_tree* rawTree = nullptr;
        if (git_commit_tree(&rawTree, parent.get()) < 0) return operationFailed(context);
        parentTree.reset(rawTree);
    }

    git_tree* rawTipTree = nullptr;
    if (git_commit_tree(&rawTipTree, tip) < 0) return operationFailed(context);
    git::TreePtr tipTree(rawTipTree);

    // A null old tree means the empty tree, which covers root commits
    git_diff* rawDiff = nullptr;
    git_diff_options opts = GIT_DIFF_OPTIONS_INIT;
    if (git_diff_tree_to_tree(&rawDiff, handle.get(), parentTree.get(), tipTree.get(), &opts) < 0) {
        return operationFailed(context);
    }
    git::DiffPtr diff(rawDiff);

    std::string patch;
    if (git_diff_print(diff.get(), GIT_DIFF_FORMAT_PATCH, appendPatchLine, &patch) < 0) {
        return operationFailed(context);
    }
    Logger::instance().debug("Diff for " + branchName + ": " + std::to_string(git_diff_num_deltas(diff.get())) +
                             " file(s)");
    if (patch.empty()) return std::string(Constants::NO_CHANGES);
    return patch;
}

Expected<void> Repository::checkout(const std::string& branchName) {
    git_reference* raw = nullptr;
    int rc = git_branch_lookup(&raw, handle.get(), branchName.c_str(), GIT_BRANCH_REMOTE);
    if (rc == 0) {
        git::ReferencePtr remote(raw);
        return checkoutTracking(remote.get(), branchName);
    }
    if (rc != GIT_ENOTFOUND) return operationFailed("Failed to checkout " + branchName);

    rc = git_branch_lookup(&raw, handle.get(), branchName.c_str(), GIT_BRANCH_LOCAL);
    if (rc < 0) return operationFailed("Failed to checkout " + branchName);
    git::ReferencePtr local(raw);
    return switchTo(local.get(), branchName);
}

Expected<void> Repository::checkoutTracking(git_reference* remoteRef, const std::string& branchName) {
    const std::string context = "Failed to checkout " + branchName;
    std::string localName = stripRemotePrefix(branchName, remoteNameOf(remoteRef, branchName));

    git_reference* rawLocal = nullptr;
    int rc = git_branch_lookup(&rawLocal, handle.get(), localName.c_str(), GIT_BRANCH_LOCAL);
    if (rc == 0) {
        git::ReferencePtr existing(rawLocal);
        Logger::instance().debug("Reusing local branch " + localName + " for " + branchName);
        return switchTo(existing.get(), branchName);
    }
    if (rc != GIT_ENOTFOUND) return operationFailed(context);

    git_object* peeled = nullptr;
    if (git_reference_peel(&peeled, remoteRef, GIT_OBJECT_COMMIT) < 0) return operationFailed(context);
    git::CommitPtr target(reinterpret_cast<git_commit*>(peeled));

    if (git_branch_create(&rawLocal, handle.get(), localName.c_str(), target.get(), 0) < 0) {
        return operationFailed(context);
    }
    git::ReferencePtr created(rawLocal);
    Logger::instance().debug("Created local branch " + localName + " tracking " + branchName);

    Expected<void> result;
    if (git_branch_set_upstream(created.get(), branchName.c_str()) < 0) {
        result = operationFailed(context);
    } else {
        result = switchTo(created.get(), branchName);
    }
    if (!result && git_branch_delete(created.get()) < 0) {
        Logger::instance().warn("Could not remove branch " + localName + ": " + git::lastErrorMessage());
    }
    return result;
}

Expected<void> Repository::switchTo(git_reference* localRef, const std::string& branchName) {
    const std::string context = "Failed to checkout " + branchName;
    git_object* rawTarget = nullptr;
    if (git_reference_peel(&rawTarget, localRef, GIT_OBJECT_COMMIT) < 0) return operationFailed(context);
    git::ObjectPtr target(rawTarget);

    git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
    opts.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(handle.get(), target.get(), &opts) < 0) return operationFailed(context);
    if (git_repository_set_head(handle.get(), git_reference_name(localRef)) < 0) return operationFailed(context);

    Logger::instance().debug(std::string("HEAD now at ") + git_reference_name(localRef));
    return {};
}

}
