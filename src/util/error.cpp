#include <trellis/error.hpp>

namespace trellis {

const char* TrellisError::code_name(Code c) {
    switch (c) {
        case IO:                       return "IO";
        case Parse:                    return "Parse";
        case Version:                  return "Version";
        case InvalidArg:               return "InvalidArg";
        case Config:                   return "Config";
        case NoWorkspaceConfigured:    return "NoWorkspaceConfigured";
        case NoValidWorkspaceRoot:     return "NoValidWorkspaceRoot";
        case PathNotInWorkspace:       return "PathNotInWorkspace";
        case ProjectRootNotFound:      return "ProjectRootNotFound";
        case ProjectRootNotADirectory: return "ProjectRootNotADirectory";
        case NoManifestFound:          return "NoManifestFound";
        case ManifestSyntax:           return "ManifestSyntax";
        case LockSyntax:               return "LockSyntax";
        case LockUnreadable:           return "LockUnreadable";
        case VcsQuery:                 return "VcsQuery";
    }
    return "Unknown";
}

std::string TrellisError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace trellis
