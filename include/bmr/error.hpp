#pragma once

#include <string>
#include <vector>

namespace bmr {

struct BmrError {
    enum Code {
        IO,
        Parse,
        Config,
        Manifest,
        Version,
        InvalidArg,
        MalformedRemoteSpec,
        NoInstallationFound,
        CloneFailed,
        UpdateFailed,
        CacheCorrupt,
        PathTraversalRejected,
        ResourceNotFound,
        ModuleNotFound
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // One entry per attempt (path or spec tried, with the reason), in order
    std::vector<std::string> context;

    BmrError() = default;
    BmrError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    BmrError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    BmrError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    BmrError& with_context(std::string entry) {
        context.push_back(std::move(entry));
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace bmr
