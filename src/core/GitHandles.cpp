#include "core/GitHandles.hpp"

#include <stdexcept>

namespace gbranches::git {

LibGit2Session::LibGit2Session() {
    if (git_libgit2_init() < 0)
        throw std::runtime_error("Failed to initialize libgit2");
}

LibGit2Session::~LibGit2Session() {
    git_libgit2_shutdown();
}

std::string lastErrorMessage() {
    const git_error* err = git_error_last();
    if (err && err->message) return err->message;
    return "unknown libgit2 error";
}

std::string oidToHex(const git_oid* oid) {
    char buf[GIT_OID_HEXSZ + 1] = {0};
    git_oid_tostr(buf, sizeof(buf), oid);
    return buf;
}

}
