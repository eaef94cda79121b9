#include <trellis/manifest.hpp>
#include <toml++/toml.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace trellis {

bool ProjectProperties::operator==(const ProjectProperties& o) const {
    return source == o.source && branch == o.branch &&
           version == o.version && revision == o.revision;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Constraint values are opaque: strings are kept as written, other scalars
// keep their TOML spelling. Tables and arrays have no text form.
static std::optional<std::string> scalar_text(const toml::node& node) {
    if (auto s = node.value<std::string>()) return std::string(*s);
    if (auto i = node.as_integer()) return std::to_string(i->get());
    if (auto f = node.as_floating_point()) {
        std::ostringstream os;
        os << f->get();
        return os.str();
    }
    if (auto b = node.as_boolean()) return std::string(b->get() ? "true" : "false");
    return std::nullopt;
}

static Status read_field(const std::string& owner, const toml::table& tbl,
                         const char* key, std::optional<std::string>& out) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();

    out = scalar_text(*node);
    if (!out) {
        return TrellisError{TrellisError::ManifestSyntax,
            "'" + std::string(key) + "' of '" + owner + "' must be a scalar value"};
    }
    return ok_status();
}

static Status read_properties(const std::string& name, const toml::node& node,
                              ProjectProperties& props) {
    // "github.com/pkg/errors" = "^0.8.0" is shorthand for { version = ... }
    if (!node.is_table()) {
        props.version = scalar_text(node);
        if (!props.version) {
            return TrellisError{TrellisError::ManifestSyntax,
                "constraint for '" + name + "' must be a value or a table"};
        }
        return ok_status();
    }

    const auto& tbl = *node.as_table();
    TRELLIS_TRY(read_field(name, tbl, "source", props.source));
    TRELLIS_TRY(read_field(name, tbl, "branch", props.branch));
    TRELLIS_TRY(read_field(name, tbl, "version", props.version));
    TRELLIS_TRY(read_field(name, tbl, "revision", props.revision));
    return ok_status();
}

static Status read_constraints(const toml::table& doc, const char* section,
                               std::map<std::string, ProjectProperties>& out) {
    const toml::node* node = doc.get(section);
    if (!node) return ok_status();

    auto tbl = node->as_table();
    if (!tbl) {
        return TrellisError{TrellisError::ManifestSyntax,
            "'" + std::string(section) + "' must be a table"};
    }

    for (const auto& [key, val] : *tbl) {
        std::string name(key);
        ProjectProperties props;
        TRELLIS_TRY(read_properties(name, val, props));
        out.emplace(std::move(name), std::move(props));
    }
    return ok_status();
}

static Status read_ignored(const toml::table& doc, std::vector<std::string>& out) {
    const toml::node* node = doc.get("ignored");
    if (!node) return ok_status();

    auto arr = node->as_array();
    if (!arr) {
        return TrellisError{TrellisError::ManifestSyntax,
            "'ignored' must be an array of strings"};
    }
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) {
            return TrellisError{TrellisError::ManifestSyntax,
                "'ignored' must be an array of strings"};
        }
        out.push_back(std::string(*s));
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Manifest::parse
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        const auto& begin = e.source().begin;
        return TrellisError{TrellisError::ManifestSyntax,
            std::string("TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(begin.line)};
    }

    Manifest m;
    TRELLIS_TRY(read_constraints(doc, "dependencies", m.dependencies));
    TRELLIS_TRY(read_constraints(doc, "overrides", m.overrides));
    TRELLIS_TRY(read_ignored(doc, m.ignored));

    return Result<Manifest>::ok(std::move(m));
}

// ---------------------------------------------------------------------------
// Manifest::load
// ---------------------------------------------------------------------------

Result<Manifest> Manifest::load(const std::string& path) {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) {
        return TrellisError{TrellisError::IO,
            "manifest path is a directory: " + path, "", path, 0};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return TrellisError{TrellisError::IO,
            "cannot open manifest file: " + path, "", path, 0};
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return TrellisError{TrellisError::IO,
            "error reading manifest file: " + path, "", path, 0};
    }

    return Manifest::parse(ss.str()).map_error([&](TrellisError e) {
        e.file = path;
        return e;
    });
}

} // namespace trellis
