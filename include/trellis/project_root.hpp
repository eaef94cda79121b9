#pragma once

#include <trellis/result.hpp>
#include <string>
#include <vector>

namespace trellis {

// Workspace-independent project name, e.g. "github.com/org/repo".
// Canonical form: '/'-separated, no leading or trailing separator, and no
// empty, "." or ".." segments. Backslashes are accepted and normalized.
class ProjectRoot {
public:
    static Result<ProjectRoot> parse(const std::string& raw);

    const std::string& str() const;
    std::vector<std::string> segments() const;

    bool operator==(const ProjectRoot& o) const;
    bool operator!=(const ProjectRoot& o) const;
    bool operator<(const ProjectRoot& o) const;

private:
    std::string value_;
};

} // namespace trellis
