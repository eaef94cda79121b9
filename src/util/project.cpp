#include <trellis/project.hpp>
#include <trellis/log.hpp>

namespace trellis {

namespace fs = std::filesystem;

Result<fs::path> find_manifest(const fs::path& start_dir, const fs::path& boundary) {
    std::error_code ec;
    fs::path dir = fs::canonical(start_dir, ec);
    if (ec) {
        dir = fs::absolute(start_dir, ec);
        if (ec) {
            return TrellisError{TrellisError::IO,
                "cannot resolve path: " + start_dir.string()};
        }
    }

    fs::path stop;
    if (!boundary.empty()) {
        stop = fs::weakly_canonical(boundary, ec);
        if (ec) stop = boundary.lexically_normal();
    }

    while (true) {
        fs::path candidate = dir / kManifestName;
        log::trace("looking for %s", candidate.string().c_str());
        if (fs::exists(candidate, ec)) {
            return Result<fs::path>::ok(candidate);
        }

        fs::path parent = dir.parent_path();
        if (parent == dir || (!stop.empty() && dir == stop)) {
            return TrellisError{TrellisError::NoManifestFound,
                std::string("no ") + kManifestName + " found in " +
                start_dir.string() + " or any parent directory",
                "run from inside a project, or pass its root directory"};
        }
        dir = parent;
    }
}

bool has_manifest(const fs::path& dir) {
    std::error_code ec;
    return fs::exists(dir / kManifestName, ec);
}

bool has_lock(const fs::path& dir) {
    std::error_code ec;
    return fs::exists(dir / kLockName, ec);
}

} // namespace trellis
