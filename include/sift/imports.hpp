#pragma once

#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace sift {

// Import specifiers as written in the file, by language:
//   Python      dotted module, leading dots for relative ("..pkg.mod")
//   JS/TS       module string ("./util", "react")
//   C/C++       quoted include ("net/socket.h")
//   Rust        module name from `mod name;`
//   Java/Kotlin fully qualified class ("com.acme.Widget")
std::vector<std::string> import_specifiers(const std::string& path, const std::string& content);

// Maps import specifiers to files of one repository snapshot. Anything that
// does not land on a known file is dropped.
class ImportResolver {
public:
    explicit ImportResolver(const std::vector<std::string>& files);

    // Sorted, de-duplicated repo paths imported by `path`, never `path` itself.
    std::vector<std::string> resolve(const std::string& path, const std::string& content) const;

    bool exists(const std::string& rel) const { return files_.count(rel) > 0; }

private:
    std::optional<std::string> resolve_python(const std::string& dir, const std::string& spec) const;
    std::optional<std::string> resolve_js(const std::string& dir, const std::string& spec) const;
    std::optional<std::string> resolve_include(const std::string& dir, const std::string& spec) const;
    std::optional<std::string> resolve_rust(const std::string& path, const std::string& spec) const;
    std::optional<std::string> resolve_jvm(const std::string& path, const std::string& spec) const;

    std::optional<std::string> first_existing(const std::vector<std::string>& candidates) const;
    // Shortest (then smallest) known path equal to or ending in "/" + suffix.
    std::optional<std::string> by_suffix(const std::string& suffix) const;

    std::set<std::string> files_;
    std::unordered_map<std::string, std::vector<std::string>> by_name_;
};

} // namespace sift
