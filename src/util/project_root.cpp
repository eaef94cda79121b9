#include <trellis/project_root.hpp>
#include <algorithm>
#include <sstream>

namespace trellis {

Result<ProjectRoot> ProjectRoot::parse(const std::string& raw) {
    if (raw.empty()) {
        return TrellisError{TrellisError::InvalidArg, "empty project root"};
    }

    std::string normalized = raw;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    if (normalized.front() == '/' || normalized.back() == '/') {
        return TrellisError{TrellisError::InvalidArg,
            "invalid project root '" + raw + "'",
            "project roots have no leading or trailing separator"};
    }

    std::istringstream stream(normalized);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (segment.empty() || segment == "." || segment == "..") {
            return TrellisError{TrellisError::InvalidArg,
                "invalid segment '" + segment + "' in project root '" + raw + "'"};
        }
    }

    ProjectRoot root;
    root.value_ = std::move(normalized);
    return Result<ProjectRoot>::ok(std::move(root));
}

const std::string& ProjectRoot::str() const { return value_; }

std::vector<std::string> ProjectRoot::segments() const {
    std::vector<std::string> out;
    std::istringstream stream(value_);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        out.push_back(segment);
    }
    return out;
}

bool ProjectRoot::operator==(const ProjectRoot& o) const {
    return value_ == o.value_;
}

bool ProjectRoot::operator!=(const ProjectRoot& o) const {
    return !(*this == o);
}

bool ProjectRoot::operator<(const ProjectRoot& o) const {
    return value_ < o.value_;
}

} // namespace trellis
