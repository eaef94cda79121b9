#pragma once

#include <trellis/result.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace trellis {

// Constraint on one dependency. The fields are carried verbatim; their
// syntax is interpreted by the solver, not here.
struct ProjectProperties {
    std::optional<std::string> source;    // alternate fetch location
    std::optional<std::string> branch;
    std::optional<std::string> version;   // semver range or tag
    std::optional<std::string> revision;  // commit id

    bool operator==(const ProjectProperties& o) const;
};

// Trellis.toml
struct Manifest {
    // keyed by project root, e.g. "github.com/pkg/errors"
    std::map<std::string, ProjectProperties> dependencies;
    std::map<std::string, ProjectProperties> overrides;
    std::vector<std::string> ignored;

    // Parse from TOML string. Structural problems are reported as
    // ManifestSyntax; unknown fields are ignored.
    static Result<Manifest> parse(const std::string& toml_str);

    // Parse from file path; the error carries the file name
    static Result<Manifest> load(const std::string& path);
};

} // namespace trellis
