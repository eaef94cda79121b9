#include <trellis/version.hpp>

namespace trellis {

Version Version::revision(std::string rev) {
    return Version(Revision, std::move(rev));
}

Version Version::branch(std::string name) {
    return Version(Branch, std::move(name));
}

Version Version::tag(std::string name) {
    return Version(Tag, std::move(name));
}

Version Version::is(std::string rev) const {
    if (kind_ == Revision) {
        return Version::revision(std::move(rev));
    }
    Version bound = *this;
    bound.rev_ = std::move(rev);
    return bound;
}

std::optional<std::string> Version::bound_revision() const {
    if (kind_ == Revision) return name_;
    return rev_;
}

bool Version::is_bound() const {
    return kind_ == Revision || rev_.has_value();
}

bool Version::same_revision(const Version& o) const {
    auto a = bound_revision();
    auto b = o.bound_revision();
    return a.has_value() && b.has_value() && *a == *b;
}

std::string Version::to_string() const {
    // Revisions print bare; bound symbolic versions print only their name,
    // matching how they are written in manifests and locks.
    return name_;
}

const char* Version::type_name() const {
    switch (kind_) {
        case Revision: return "revision";
        case Branch:   return "branch";
        case Tag:      return "version";
    }
    return "unknown";
}

bool Version::operator==(const Version& o) const {
    // A bound version never equals an unbound one; use same_revision() or
    // compare name() to match loosely
    return kind_ == o.kind_ && name_ == o.name_ && rev_ == o.rev_;
}

bool Version::operator!=(const Version& o) const {
    return !(*this == o);
}

} // namespace trellis
