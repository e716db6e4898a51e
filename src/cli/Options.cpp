#include "cli/Options.hpp"

namespace fs = std::filesystem;

namespace gbranches {

namespace {

Expected<fs::path> validateDirectory(const std::string& value) {
    if (value.empty()) {
        return Error{ErrorCode::InvalidArgs, "Option '--path' / '-p' requires a directory"};
    }
    std::error_code ec;
    fs::path p(value);
    if (!fs::exists(p, ec)) {
        return Error{ErrorCode::InvalidArgs,
                     "Invalid value for '--path' / '-p': Directory '" + value + "' does not exist."};
    }
    if (!fs::is_directory(p, ec)) {
        return Error{ErrorCode::InvalidArgs,
                     "Invalid value for '--path' / '-p': Directory '" + value + "' is a file."};
    }
    fs::path resolved = fs::canonical(p, ec);
    if (ec) resolved = fs::absolute(p);
    return resolved;
}

}

Expected<Options> parseOptions(const std::vector<std::string>& args) {
    Options opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--remote") {
            opts.includeRemote = true;
        } else if (arg == "--switch") {
            opts.autoSwitch = true;
        } else if (arg == "--help") {
            opts.help = true;
        } else if (arg == "--path" || arg.rfind("--path=", 0) == 0) {
            std::string value;
            if (arg == "--path") {
                if (i + 1 >= args.size()) {
                    return Error{ErrorCode::InvalidArgs, "Option '--path' requires an argument."};
                }
                value = args[++i];
            } else {
                value = arg.substr(7);
            }
            auto dir = validateDirectory(value);
            if (!dir) return dir.error();
            opts.path = dir.value();
        } else if (arg.size() > 1 && arg[0] == '-' && arg[1] != '-') {
            // Short flags, possibly clustered; -p consumes the rest or the next argument
            for (size_t k = 1; k < arg.size(); ++k) {
                char flag = arg[k];
                if (flag == 'r') {
                    opts.includeRemote = true;
                } else if (flag == 's') {
                    opts.autoSwitch = true;
                } else if (flag == 'h') {
                    opts.help = true;
                } else if (flag == 'p') {
                    std::string value = arg.substr(k + 1);
                    if (value.empty()) {
                        if (i + 1 >= args.size()) {
                            return Error{ErrorCode::InvalidArgs, "Option '-p' requires an argument."};
                        }
                        value = args[++i];
                    }
                    auto dir = validateDirectory(value);
                    if (!dir) return dir.error();
                    opts.path = dir.value();
                    break;
                } else {
                    return Error{ErrorCode::InvalidArgs, std::string("No such option: -") + flag};
                }
            }
        } else if (arg.rfind("--", 0) == 0) {
            return Error{ErrorCode::InvalidArgs, "No such option: " + arg};
        } else {
            return Error{ErrorCode::InvalidArgs, "Got unexpected extra argument (" + arg + ")"};
        }
    }
    return opts;
}

}
