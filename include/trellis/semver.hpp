#pragma once

#include <trellis/result.hpp>
#include <string>

namespace trellis {

// Semantic version: major.minor.micro[-label]. Build metadata after '+'
// is accepted by parse but not kept, so it never affects ordering.
struct SemVer {
    int major = 0;
    int minor = 0;
    int micro = 0;
    std::string label;  // e.g., "alpha", "rc1", empty for release

    static Result<SemVer> parse(const std::string& s);

    // Like parse, but accepts a leading 'v' or 'V' as used in VCS tags
    static Result<SemVer> parse_tag(const std::string& tag);

    std::string to_string() const;

    bool operator==(const SemVer& o) const;
    bool operator!=(const SemVer& o) const;
    bool operator<(const SemVer& o) const;
    bool operator<=(const SemVer& o) const;
    bool operator>(const SemVer& o) const;
    bool operator>=(const SemVer& o) const;
};

} // namespace trellis
