#pragma once

#include <string>
#include <optional>

namespace trellis {

// A version as the dependency model sees it: an immutable revision, or a
// symbolic branch/tag optionally bound to the revision it resolves to.
class Version {
public:
    enum Kind { Revision, Branch, Tag };

    static Version revision(std::string rev);
    static Version branch(std::string name);
    static Version tag(std::string name);

    // Bind a symbolic version to a concrete revision. For a bare revision
    // this yields Version::revision(rev).
    Version is(std::string rev) const;

    Kind kind() const { return kind_; }

    // Branch or tag name; the revision itself for a bare revision
    const std::string& name() const { return name_; }

    // The concrete revision: the binding for branches/tags, the value for a
    // bare revision. Empty for unbound symbolic versions.
    std::optional<std::string> bound_revision() const;
    bool is_bound() const;

    // True when both sides carry a revision and the revisions match
    bool same_revision(const Version& o) const;

    std::string to_string() const;
    const char* type_name() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;

private:
    Version(Kind k, std::string name) : kind_(k), name_(std::move(name)) {}

    Kind kind_;
    std::string name_;
    std::optional<std::string> rev_;
};

} // namespace trellis
