#include <sift/error.hpp>

namespace sift {

const char* SiftError::code_name(Code c) {
    switch (c) {
        case IO:          return "IO";
        case Parse:       return "Parse";
        case Config:      return "Config";
        case Database:    return "Database";
        case NotFound:    return "NotFound";
        case Corrupt:     return "Corrupt";
        case Stale:       return "Stale";
        case Unavailable: return "Unavailable";
        case Embedding:   return "Embedding";
        case InvalidArg:  return "InvalidArg";
    }
    return "Unknown";
}

std::string SiftError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!hint.empty()) {
        out += "\n  hint: ";
        out += hint;
    }

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
        if (line > 0) {
            out += ":" + std::to_string(line);
        }
    }
    return out;
}

} // namespace sift
