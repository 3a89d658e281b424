#include <bmr/error.hpp>

namespace bmr {

const char* BmrError::code_name(Code c) {
    switch (c) {
        case IO:                    return "IO";
        case Parse:                 return "Parse";
        case Config:                return "Config";
        case Manifest:              return "Manifest";
        case Version:               return "Version";
        case InvalidArg:            return "InvalidArg";
        case MalformedRemoteSpec:   return "MalformedRemoteSpec";
        case NoInstallationFound:   return "NoInstallationFound";
        case CloneFailed:           return "CloneFailed";
        case UpdateFailed:          return "UpdateFailed";
        case CacheCorrupt:          return "CacheCorrupt";
        case PathTraversalRejected: return "PathTraversalRejected";
        case ResourceNotFound:      return "ResourceNotFound";
        case ModuleNotFound:        return "ModuleNotFound";
    }
    return "Unknown";
}

std::string BmrError::format() const {
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

    if (!context.empty()) {
        result += "\n  checked:";
        for (const auto& entry : context) {
            result += "\n    - ";
            result += entry;
        }
    }

    return result;
}

} // namespace bmr
