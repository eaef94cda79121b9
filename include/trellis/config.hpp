#pragma once

#include <trellis/result.hpp>
#include <trellis/log.hpp>
#include <string>
#include <vector>
#include <optional>

namespace trellis {

// Layered configuration: global config file < environment.
// Later layers override earlier ones field by field.
struct Config {
    // Candidate workspace roots, in priority order
    std::vector<std::string> workspace_paths;
    log::Level log_level = log::Warn;
    int vcs_timeout_seconds = 60;

    // Track which fields were explicitly set (for merge)
    bool workspace_paths_set = false;
    bool log_level_set = false;
    bool vcs_timeout_set = false;

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Read TRELLIS_PATH and TRELLIS_LOG
    static Result<Config> from_env();

    // Merge another config on top (other's set values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> environment
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& env);
};

// Split a platform path list (':' on POSIX, ';' on Windows), dropping
// empty entries.
std::vector<std::string> split_path_list(const std::string& list);

// Discover the global config file path: ~/.trellis/config.toml
std::string global_config_path();

} // namespace trellis
