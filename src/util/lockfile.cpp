#include <trellis/lockfile.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace trellis {

namespace fs = std::filesystem;

Version LockedProject::locked_version() const {
    if (branch) return Version::branch(*branch).is(revision);
    if (version) return Version::tag(*version).is(revision);
    return Version::revision(revision);
}

bool LockedProject::operator==(const LockedProject& o) const {
    return name == o.name && source == o.source && branch == o.branch &&
           version == o.version && revision == o.revision &&
           packages == o.packages;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static TrellisError lock_error(std::string msg) {
    return TrellisError{TrellisError::LockSyntax, std::move(msg)};
}

static Status read_locked_project(size_t index, const toml::table& tbl,
                                  LockedProject& lp) {
    std::string where = "projects[" + std::to_string(index) + "]";

    auto name = tbl["name"].value<std::string>();
    if (!name || name->empty()) {
        return lock_error(where + " is missing 'name'");
    }
    lp.name = std::string(*name);

    auto rev = tbl["revision"].value<std::string>();
    if (!rev || rev->empty()) {
        return lock_error("locked project '" + lp.name + "' is missing 'revision'");
    }
    lp.revision = std::string(*rev);

    for (const char* key : {"source", "branch", "version"}) {
        const toml::node* node = tbl.get(key);
        if (!node) continue;
        auto s = node->value<std::string>();
        if (!s) {
            return lock_error("'" + std::string(key) + "' of locked project '" +
                              lp.name + "' must be a string");
        }
        std::string val(*s);
        if (std::string(key) == "source") lp.source = std::move(val);
        else if (std::string(key) == "branch") lp.branch = std::move(val);
        else lp.version = std::move(val);
    }

    if (lp.branch && lp.version) {
        return lock_error("locked project '" + lp.name +
                          "' has both 'branch' and 'version'");
    }

    if (const toml::node* node = tbl.get("packages")) {
        auto arr = node->as_array();
        if (!arr) {
            return lock_error("'packages' of locked project '" + lp.name +
                              "' must be an array");
        }
        for (const auto& elem : *arr) {
            auto s = elem.value<std::string>();
            if (!s) {
                return lock_error("'packages' of locked project '" + lp.name +
                                  "' must contain only strings");
            }
            lp.packages.push_back(std::string(*s));
        }
    }

    return ok_status();
}

Result<LockFile> LockFile::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        const auto& begin = e.source().begin;
        return TrellisError{TrellisError::LockSyntax,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(begin.line)};
    }

    LockFile lf;

    auto memo = doc["memo"].value<std::string>();
    if (!memo) {
        return lock_error("lock is missing 'memo'");
    }
    lf.memo = std::string(*memo);

    // `projects = []` and [[projects]] are both arrays
    const toml::node* node = doc.get("projects");
    if (!node) {
        return lock_error("lock is missing 'projects'");
    }
    auto arr = node->as_array();
    if (!arr) {
        return lock_error("'projects' must be an array of tables");
    }

    for (size_t i = 0; i < arr->size(); ++i) {
        auto tbl = arr->get(i)->as_table();
        if (!tbl) {
            return lock_error("projects[" + std::to_string(i) + "] must be a table");
        }
        LockedProject lp;
        TRELLIS_TRY(read_locked_project(i, *tbl, lp));
        lf.projects.push_back(std::move(lp));
    }

    return Result<LockFile>::ok(std::move(lf));
}

Result<LockFile> LockFile::load(const std::string& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        return TrellisError{TrellisError::IO,
            "lock file not found: " + path, "", path, 0};
    }
    if (!fs::is_regular_file(st)) {
        return TrellisError{TrellisError::LockUnreadable,
            "lock path is not a regular file: " + path, "", path, 0};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return TrellisError{TrellisError::LockUnreadable,
            "cannot open lock file: " + path,
            "check that no other process holds it exclusively", path, 0};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return TrellisError{TrellisError::LockUnreadable,
            "error reading lock file: " + path, "", path, 0};
    }

    return LockFile::parse(ss.str()).map_error([&](TrellisError e) {
        e.file = path;
        return e;
    });
}

// ---------------------------------------------------------------------------
// Saving
// ---------------------------------------------------------------------------

Status LockFile::save(const std::string& path) const {
    std::vector<LockedProject> sorted = projects;
    std::sort(sorted.begin(), sorted.end(),
        [](const LockedProject& a, const LockedProject& b) {
            return a.name < b.name;
        });

    toml::array arr;
    for (const auto& lp : sorted) {
        toml::table tbl;
        tbl.insert("name", lp.name);
        if (lp.source) tbl.insert("source", *lp.source);
        if (lp.branch) tbl.insert("branch", *lp.branch);
        if (lp.version) tbl.insert("version", *lp.version);
        tbl.insert("revision", lp.revision);
        if (!lp.packages.empty()) {
            toml::array pkgs;
            for (const auto& p : lp.packages) pkgs.push_back(p);
            tbl.insert("packages", std::move(pkgs));
        }
        arr.push_back(std::move(tbl));
    }

    toml::table doc;
    doc.insert("memo", memo);
    doc.insert("projects", std::move(arr));

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return TrellisError{TrellisError::IO,
            "cannot write lock file: " + path};
    }
    file << doc << "\n";
    if (!file) {
        return TrellisError{TrellisError::IO,
            "error writing lock file: " + path};
    }

    return ok_status();
}

const LockedProject* LockFile::find(const std::string& name) const {
    for (const auto& lp : projects) {
        if (lp.name == name) return &lp;
    }
    return nullptr;
}

} // namespace trellis
