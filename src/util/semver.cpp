#include <trellis/semver.hpp>
#include <cctype>

namespace trellis {

static bool parse_component(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    out = std::stoi(s);
    return true;
}

Result<SemVer> SemVer::parse(const std::string& s) {
    if (s.empty()) {
        return TrellisError{TrellisError::Version, "empty version string"};
    }

    std::string core = s;
    SemVer v;

    // Build metadata ("+build.5") is accepted and dropped
    size_t plus = core.find('+');
    if (plus != std::string::npos) {
        if (plus + 1 == core.size()) {
            return TrellisError{TrellisError::Version,
                "empty build metadata after '+' in '" + s + "'"};
        }
        core = core.substr(0, plus);
    }

    size_t dash = core.find('-');
    if (dash != std::string::npos) {
        v.label = core.substr(dash + 1);
        core = core.substr(0, dash);
        if (v.label.empty()) {
            return TrellisError{TrellisError::Version,
                "empty label after '-' in '" + s + "'"};
        }
    }

    size_t dot1 = core.find('.');
    size_t dot2 = dot1 == std::string::npos ? std::string::npos
                                            : core.find('.', dot1 + 1);
    if (dot1 == std::string::npos || dot2 == std::string::npos) {
        return TrellisError{TrellisError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor.micro[-label][+build]"};
    }

    if (!parse_component(core.substr(0, dot1), v.major)) {
        return TrellisError{TrellisError::Version,
            "invalid major version in '" + s + "'"};
    }
    if (!parse_component(core.substr(dot1 + 1, dot2 - dot1 - 1), v.minor)) {
        return TrellisError{TrellisError::Version,
            "invalid minor version in '" + s + "'"};
    }
    if (!parse_component(core.substr(dot2 + 1), v.micro)) {
        return TrellisError{TrellisError::Version,
            "invalid micro version in '" + s + "'"};
    }

    return Result<SemVer>::ok(std::move(v));
}

Result<SemVer> SemVer::parse_tag(const std::string& tag) {
    if (!tag.empty() && (tag[0] == 'v' || tag[0] == 'V')) {
        return parse(tag.substr(1));
    }
    return parse(tag);
}

std::string SemVer::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(micro);
    if (!label.empty()) {
        s += "-" + label;
    }
    return s;
}

bool SemVer::operator==(const SemVer& o) const {
    return major == o.major && minor == o.minor &&
           micro == o.micro && label == o.label;
}

bool SemVer::operator!=(const SemVer& o) const { return !(*this == o); }

bool SemVer::operator<(const SemVer& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (micro != o.micro) return micro < o.micro;
    // Pre-release (non-empty label) < release (empty label)
    if (label.empty() && !o.label.empty()) return false;
    if (!label.empty() && o.label.empty()) return true;
    return label < o.label;
}

bool SemVer::operator<=(const SemVer& o) const { return !(o < *this); }
bool SemVer::operator>(const SemVer& o) const { return o < *this; }
bool SemVer::operator>=(const SemVer& o) const { return !(*this < o); }

} // namespace trellis
