#pragma once

#include <trellis/result.hpp>
#include <trellis/manifest.hpp>
#include <trellis/lockfile.hpp>
#include <trellis/project_root.hpp>
#include <filesystem>
#include <optional>

namespace trellis {

inline constexpr const char* kManifestName = "Trellis.toml";
inline constexpr const char* kLockName = "Trellis.lock";

struct Project {
    std::filesystem::path root_dir;       // dir containing Trellis.toml
    ProjectRoot root;                     // import identifier within the workspace
    Manifest manifest;
    std::filesystem::path manifest_path;  // full path to Trellis.toml
    std::optional<LockFile> lock;         // unset when there is no Trellis.lock
    std::filesystem::path lock_path;      // where the lock is or would be
};

// Walk up from start_dir to find the nearest Trellis.toml, return its path.
// The search also stops after checking `boundary` when it is non-empty.
Result<std::filesystem::path> find_manifest(const std::filesystem::path& start_dir,
                                            const std::filesystem::path& boundary = {});

// Check if dir contains a Trellis.toml
bool has_manifest(const std::filesystem::path& dir);

// Check if dir contains a Trellis.lock (of any file type)
bool has_lock(const std::filesystem::path& dir);

} // namespace trellis
