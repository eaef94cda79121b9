#include <trellis/context.hpp>
#include <trellis/log.hpp>

namespace trellis {

namespace fs = std::filesystem;

// Path components with the empty trailing component of "a/b/" dropped
static std::vector<fs::path> components(const fs::path& p) {
    std::vector<fs::path> out;
    for (const auto& part : p.lexically_normal()) {
        if (!part.empty()) out.push_back(part);
    }
    return out;
}

// '/'-joined remainder of `path` below `base`, empty unless `path` is a
// proper descendant of `base`
static std::string relative_below(const fs::path& base, const fs::path& path) {
    auto b = components(base);
    auto p = components(path);
    if (p.size() <= b.size()) return "";

    for (size_t i = 0; i < b.size(); ++i) {
        if (b[i] != p[i]) return "";
    }

    std::string rel;
    for (size_t i = b.size(); i < p.size(); ++i) {
        if (!rel.empty()) rel += '/';
        rel += p[i].generic_string();
    }
    return rel;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Context::Context(fs::path workspace_root, int vcs_timeout_seconds)
    : vcs_timeout_seconds_(vcs_timeout_seconds) {
    workspace_root_ = workspace_root.lexically_normal();
    if (workspace_root_.has_relative_path() && workspace_root_.filename().empty()) {
        workspace_root_ = workspace_root_.parent_path();
    }
}

Result<Context> Context::create(const Config& cfg) {
    if (cfg.workspace_paths.empty()) {
        return TrellisError{TrellisError::NoWorkspaceConfigured,
            "no workspace configured",
            "set TRELLIS_PATH or workspace.paths in " + global_config_path()};
    }

    std::string tried;
    for (const auto& candidate : cfg.workspace_paths) {
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) {
            fs::path abs = fs::absolute(candidate, ec);
            if (!ec) {
                log::debug("using workspace root %s", abs.string().c_str());
                return Result<Context>::ok(Context(abs, cfg.vcs_timeout_seconds));
            }
        }
        log::trace("skipping workspace candidate %s", candidate.c_str());
        if (!tried.empty()) tried += ", ";
        tried += candidate;
    }

    return TrellisError{TrellisError::NoValidWorkspaceRoot,
        "none of the configured workspace roots is an existing directory: " + tried};
}

Result<Context> Context::from_environment() {
    std::optional<Config> global;
    auto gpath = global_config_path();
    std::error_code ec;
    if (!gpath.empty() && fs::exists(gpath, ec)) {
        auto gc = Config::load(gpath);
        if (gc.is_err()) return std::move(gc).error();
        global = std::move(gc).value();
    }

    auto env = Config::from_env();
    if (env.is_err()) return std::move(env).error();

    Config cfg = Config::effective(global, env.value());
    if (cfg.log_level_set) log::set_level(cfg.log_level);

    return Context::create(cfg);
}

fs::path Context::source_root() const {
    return workspace_root_ / "src";
}

// ---------------------------------------------------------------------------
// Path/root translation
// ---------------------------------------------------------------------------

Result<ProjectRoot> Context::split_absolute_project_root(const fs::path& path) const {
    fs::path src = source_root();

    if (!path.is_absolute()) {
        return TrellisError{TrellisError::PathNotInWorkspace,
            path.string() + " is not an absolute path"};
    }

    std::string rel = relative_below(src, path);
    if (rel.empty()) {
        // Retry on resolved paths in case a symlink sits on either side
        std::error_code ec1, ec2;
        fs::path real_src = fs::weakly_canonical(src, ec1);
        fs::path real_path = fs::weakly_canonical(path, ec2);
        if (!ec1 && !ec2) rel = relative_below(real_src, real_path);
    }

    if (rel.empty()) {
        return TrellisError{TrellisError::PathNotInWorkspace,
            path.string() + " is not within " + src.string(),
            "projects must live below the workspace's src directory"};
    }

    auto root = ProjectRoot::parse(rel);
    if (root.is_err()) {
        return TrellisError{TrellisError::PathNotInWorkspace,
            "cannot derive a project root from " + path.string() + ": " +
            root.error().message};
    }
    return root;
}

Result<fs::path> Context::absolute_project_root(const ProjectRoot& root) const {
    fs::path path = (source_root() / root.str()).lexically_normal();

    std::error_code ec;
    auto st = fs::status(path, ec);
    if (!fs::exists(st)) {
        return TrellisError{TrellisError::ProjectRootNotFound,
            "no project at " + path.string()};
    }
    if (!fs::is_directory(st)) {
        return TrellisError{TrellisError::ProjectRootNotADirectory,
            path.string() + " is not a directory"};
    }

    return Result<fs::path>::ok(std::move(path));
}

// ---------------------------------------------------------------------------
// Installed versions
// ---------------------------------------------------------------------------

Result<Version> Context::version_in_workspace(const ProjectRoot& root) const {
    GitInspector git(vcs_timeout_seconds_);
    return version_in_workspace(root, git);
}

Result<Version> Context::version_in_workspace(const ProjectRoot& root,
                                              const VcsInspector& vcs) const {
    auto dir = absolute_project_root(root);
    if (dir.is_err()) return std::move(dir).error();

    auto state = vcs.inspect(dir.value());
    if (state.is_err()) return std::move(state).error();

    auto version = classify_checkout(state.value());
    if (version.is_ok()) {
        log::debug("%s is at %s %s", root.str().c_str(),
                   version.value().type_name(),
                   version.value().to_string().c_str());
    }
    return version;
}

// ---------------------------------------------------------------------------
// Project loading
// ---------------------------------------------------------------------------

Result<Project> Context::load_project(const fs::path& hint) const {
    fs::path root_dir;

    if (hint.empty()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (ec) {
            return TrellisError{TrellisError::IO,
                "cannot determine working directory: " + ec.message()};
        }
        auto manifest_path = find_manifest(cwd);
        if (manifest_path.is_err()) return std::move(manifest_path).error();
        root_dir = manifest_path.value().parent_path();
    } else {
        if (!hint.is_absolute()) {
            return TrellisError{TrellisError::InvalidArg,
                "project path must be absolute: " + hint.string()};
        }
        root_dir = hint.lexically_normal();
        if (root_dir.has_relative_path() && root_dir.filename().empty()) {
            root_dir = root_dir.parent_path();
        }
        if (!has_manifest(root_dir)) {
            return TrellisError{TrellisError::NoManifestFound,
                std::string("no ") + kManifestName + " in " + root_dir.string()};
        }
    }

    log::debug("loading project at %s", root_dir.string().c_str());

    Project proj;
    proj.root_dir = root_dir;
    proj.manifest_path = root_dir / kManifestName;
    proj.lock_path = root_dir / kLockName;

    auto manifest = Manifest::load(proj.manifest_path.string());
    if (manifest.is_err()) return std::move(manifest).error();
    proj.manifest = std::move(manifest).value();

    if (has_lock(root_dir)) {
        auto lock = LockFile::load(proj.lock_path.string());
        if (lock.is_err()) return std::move(lock).error();
        proj.lock = std::move(lock).value();
    } else {
        log::debug("no %s at %s", kLockName, root_dir.string().c_str());
    }

    // Finding the files is not enough; the project must belong to the workspace
    auto root = split_absolute_project_root(root_dir);
    if (root.is_err()) return std::move(root).error();
    proj.root = std::move(root).value();

    return Result<Project>::ok(std::move(proj));
}

} // namespace trellis
