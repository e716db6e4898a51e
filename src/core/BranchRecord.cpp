#include "core/BranchRecord.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "core/Constants.hpp"

namespace gbranches {

namespace {

size_t codepointCount(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

// Byte offset of the n-th code point (or s.size() if there are fewer)
size_t byteOffsetOf(const std::string& s, size_t n) {
    size_t seen = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) {
            if (seen == n) return i;
            ++seen;
        }
    }
    return s.size();
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

}

std::string BranchRecord::displayName() const {
    return (isCurrent ? "* " : "  ") + name;
}

std::string BranchRecord::shortHash() const {
    return commitHash.substr(0, Constants::SHORT_HASH_LENGTH);
}

std::string BranchRecord::formattedDate() const {
    std::time_t local = static_cast<std::time_t>(commitTime.seconds + int64_t{commitTime.offsetMinutes} * 60);
    std::tm tm{};
    gmtime_r(&local, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string BranchRecord::localName() const {
    if (!isRemote) return name;
    return stripRemotePrefix(name, remoteName);
}

std::string stripRemotePrefix(const std::string& name, const std::string& remoteName) {
    if (!remoteName.empty() && name.rfind(remoteName + "/", 0) == 0) {
        return name.substr(remoteName.size() + 1);
    }
    auto slash = name.find('/');
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

std::string summarizeMessage(const std::string& message) {
    std::string body = trim(message);
    auto newline = body.find('\n');
    if (newline == std::string::npos) return body;
    return trim(body.substr(0, newline));
}

std::string firstCodepoints(const std::string& text, size_t maxChars) {
    return text.substr(0, byteOffsetOf(text, maxChars));
}

std::string truncateText(const std::string& text, size_t maxChars) {
    if (codepointCount(text) <= maxChars) return text;
    return firstCodepoints(text, maxChars) + "...";
}

}
