#pragma once

#include <trellis/result.hpp>
#include <trellis/config.hpp>
#include <trellis/project.hpp>
#include <trellis/project_root.hpp>
#include <trellis/vcs.hpp>
#include <trellis/version.hpp>
#include <filesystem>

namespace trellis {

// The workspace every operation runs against. Immutable once built; share it
// freely between threads.
class Context {
public:
    explicit Context(std::filesystem::path workspace_root,
                     int vcs_timeout_seconds = 60);

    // Pick the first configured workspace path that is an existing directory
    static Result<Context> create(const Config& cfg);

    // create() with the global config file overlaid by the environment
    static Result<Context> from_environment();

    const std::filesystem::path& workspace_root() const { return workspace_root_; }

    // <workspace>/src
    std::filesystem::path source_root() const;

    int vcs_timeout() const { return vcs_timeout_seconds_; }

    // Project root for an absolute path strictly below <workspace>/src
    Result<ProjectRoot> split_absolute_project_root(const std::filesystem::path& path) const;

    // Existing directory <workspace>/src/<root>
    Result<std::filesystem::path> absolute_project_root(const ProjectRoot& root) const;

    // What is checked out at <workspace>/src/<root>
    Result<Version> version_in_workspace(const ProjectRoot& root) const;
    Result<Version> version_in_workspace(const ProjectRoot& root,
                                         const VcsInspector& vcs) const;

    // Load the project at `hint` (absolute), or discover it upward from the
    // current working directory when `hint` is empty.
    Result<Project> load_project(const std::filesystem::path& hint = {}) const;

private:
    std::filesystem::path workspace_root_;
    int vcs_timeout_seconds_;
};

} // namespace trellis
