#pragma once

#include <trellis/result.hpp>
#include <trellis/version.hpp>
#include <string>
#include <vector>
#include <optional>

namespace trellis {

struct LockedProject {
    std::string name;                     // project root
    std::optional<std::string> source;    // alternate fetch location
    std::optional<std::string> branch;    // at most one of branch/version
    std::optional<std::string> version;
    std::string revision;                 // full commit id
    std::vector<std::string> packages;    // packages used from the project

    // The locked version bound to its revision
    Version locked_version() const;

    bool operator==(const LockedProject& o) const;
};

struct LockFile {
    std::string memo;                     // opaque input digest, never recomputed here
    std::vector<LockedProject> projects;

    // Parse from TOML string. Structural problems are reported as LockSyntax.
    static Result<LockFile> parse(const std::string& toml_str);

    // Parse a Trellis.lock file from disk. A file that exists but cannot be
    // read is reported as LockUnreadable.
    static Result<LockFile> load(const std::string& path);

    // Write Trellis.lock to disk (projects sorted by name)
    Status save(const std::string& path) const;

    // Find a locked project by name (nullptr if not found)
    const LockedProject* find(const std::string& name) const;
};

} // namespace trellis
