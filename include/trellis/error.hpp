#pragma once

#include <string>

namespace trellis {

struct TrellisError {
    enum Code {
        IO,
        Parse,
        Version,
        InvalidArg,
        Config,
        NoWorkspaceConfigured,
        NoValidWorkspaceRoot,
        PathNotInWorkspace,
        ProjectRootNotFound,
        ProjectRootNotADirectory,
        NoManifestFound,
        ManifestSyntax,
        LockSyntax,
        LockUnreadable,
        VcsQuery
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    TrellisError() = default;
    TrellisError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TrellisError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    TrellisError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace trellis
