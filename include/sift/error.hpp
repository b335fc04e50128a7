#pragma once

#include <string>

namespace sift {

struct SiftError {
    enum Code {
        IO,
        Parse,
        Config,
        Database,
        NotFound,
        Corrupt,
        Stale,
        Unavailable,
        Embedding,
        InvalidArg
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SiftError() = default;
    SiftError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SiftError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SiftError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Cache-miss class errors: the caller rebuilds instead of failing.
    bool is_cache_miss() const {
        return code == NotFound || code == Corrupt || code == Stale;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace sift
