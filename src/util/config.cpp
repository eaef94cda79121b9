#include <trellis/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdint>
#include <cstdlib>

namespace trellis {

#ifdef _WIN32
static constexpr char kPathListSeparator = ';';
#else
static constexpr char kPathListSeparator = ':';
#endif

static Result<log::Level> level_from_string(const std::string& s) {
    auto lvl = log::parse_level(s);
    if (!lvl) {
        return TrellisError{TrellisError::Config,
            "unknown log level '" + s + "'",
            "expected one of: trace, debug, info, warn, error"};
    }
    return Result<log::Level>::ok(*lvl);
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return TrellisError{TrellisError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [workspace] section
    if (auto ws = doc["workspace"].as_table()) {
        if (auto arr = (*ws)["paths"].as_array()) {
            for (const auto& elem : *arr) {
                if (auto s = elem.value<std::string>()) {
                    cfg.workspace_paths.push_back(std::string(*s));
                } else {
                    return TrellisError{TrellisError::Config,
                        "workspace.paths must contain only strings"};
                }
            }
            cfg.workspace_paths_set = true;
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = level_from_string(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
    }

    // [vcs] section
    if (auto vcs = doc["vcs"].as_table()) {
        if (auto v = (*vcs)["timeout"].value<int64_t>()) {
            if (*v <= 0) {
                return TrellisError{TrellisError::Config,
                    "vcs.timeout must be positive, got " + std::to_string(*v)};
            }
            cfg.vcs_timeout_seconds = static_cast<int>(*v);
            cfg.vcs_timeout_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return TrellisError{TrellisError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) cfg.error().file = path;
    return cfg;
}

Result<Config> Config::from_env() {
    Config cfg;

    if (const char* paths = std::getenv("TRELLIS_PATH")) {
        cfg.workspace_paths = split_path_list(paths);
        cfg.workspace_paths_set = true;
    }

    if (const char* level = std::getenv("TRELLIS_LOG")) {
        if (*level != '\0') {
            auto lvl = level_from_string(level);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

void Config::merge(const Config& other) {
    if (other.workspace_paths_set) {
        workspace_paths = other.workspace_paths;
        workspace_paths_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.vcs_timeout_set) {
        vcs_timeout_seconds = other.vcs_timeout_seconds;
        vcs_timeout_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& env) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (env.has_value()) result.merge(env.value());
    return result;
}

std::vector<std::string> split_path_list(const std::string& list) {
    std::vector<std::string> out;
    std::istringstream stream(list);
    std::string entry;
    while (std::getline(stream, entry, kPathListSeparator)) {
        if (!entry.empty()) out.push_back(entry);
    }
    return out;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.trellis/config.toml";
}

} // namespace trellis
