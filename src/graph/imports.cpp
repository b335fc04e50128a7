#include <sift/imports.hpp>
#include <sift/text.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <regex>

namespace fs = std::filesystem;

namespace sift {

namespace {

enum class Lang { None, Python, Js, CFamily, Rust, Jvm };

Lang lang_of(const std::string& path) {
    std::string ext = to_lower(fs::path(path).extension().string());
    if (ext == ".py" || ext == ".pyi") return Lang::Python;
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs" ||
        ext == ".ts" || ext == ".tsx" || ext == ".vue" || ext == ".svelte") return Lang::Js;
    if (ext == ".c" || ext == ".h" || ext == ".cc" || ext == ".cpp" || ext == ".cxx" ||
        ext == ".hh" || ext == ".hpp" || ext == ".hxx" || ext == ".m" || ext == ".mm")
        return Lang::CFamily;
    if (ext == ".rs") return Lang::Rust;
    if (ext == ".java" || ext == ".kt" || ext == ".kts") return Lang::Jvm;
    return Lang::None;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::vector<std::string> split_commas(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= s.size()) {
        size_t comma = s.find(',', start);
        if (comma == std::string::npos) comma = s.size();
        std::string part = trim(s.substr(start, comma - start));
        // Drop "as alias".
        size_t as = part.find(" as ");
        if (as != std::string::npos) part = trim(part.substr(0, as));
        if (!part.empty()) out.push_back(part);
        start = comma + 1;
    }
    return out;
}

void python_specs(const std::string& content, std::vector<std::string>& out) {
    static const std::regex import_re(R"(^\s*import\s+([\w.,\s]+?)\s*(?:#.*)?$)");
    static const std::regex from_re(R"(^\s*from\s+(\.*[\w.]*)\s+import\s+\(?([^)#]*))");

    for (const auto& line : split_lines(content)) {
        if (line.size() > kMaxPatternLine) continue;
        std::smatch m;
        if (std::regex_search(line, m, from_re)) {
            std::string module = m[1].str();
            if (module.empty()) continue;
            out.push_back(module);
            for (const auto& name : split_commas(m[2].str())) {
                if (name == "*") continue;
                bool dots_only = module.find_first_not_of('.') == std::string::npos;
                out.push_back(dots_only ? module + name : module + "." + name);
            }
        } else if (std::regex_search(line, m, import_re)) {
            for (const auto& mod : split_commas(m[1].str())) out.push_back(mod);
        }
    }
}

bool js_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

size_t skip_space(const std::string& s, size_t i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return i;
}

// Reads a '...' or "..." literal at i and moves i past it. A literal never
// spans lines.
bool read_quoted(const std::string& s, size_t& i, std::string& out) {
    if (i >= s.size() || (s[i] != '\'' && s[i] != '"')) return false;
    const char stops[] = {s[i], '\n', '\0'};
    size_t end = s.find_first_of(stops, i + 1);
    if (end == std::string::npos || s[end] != s[i] || end == i + 1) return false;
    out = s.substr(i + 1, end - i - 1);
    i = end + 1;
    return true;
}

// Statement after import/export: the literal after a `from` keyword, if one
// comes before any ';' or string.
bool from_clause(const std::string& s, size_t i, std::string& out) {
    constexpr size_t kMaxClause = 2048;
    size_t limit = std::min(s.size(), i + kMaxClause);
    while (i < limit) {
        char c = s[i];
        if (c == ';' || c == '\'' || c == '"') return false;
        if (!js_ident_char(c)) {
            ++i;
            continue;
        }
        size_t b = i;
        while (i < s.size() && js_ident_char(s[i])) ++i;
        if (s.compare(b, i - b, "from") != 0) continue;
        size_t q = skip_space(s, i);
        if (read_quoted(s, q, out)) return true;
    }
    return false;
}

// Single pass over the whole file; minified bundles are one long line.
void js_specs(const std::string& s, std::vector<std::string>& out) {
    size_t i = 0;
    while (i < s.size()) {
        if (!js_ident_char(s[i])) {
            ++i;
            continue;
        }
        size_t b = i;
        while (i < s.size() && js_ident_char(s[i])) ++i;
        if (b > 0 && s[b - 1] == '.') continue;

        std::string word = s.substr(b, i - b);
        std::string spec;
        if (word == "require" || word == "import") {
            size_t j = skip_space(s, i);
            if (j < s.size() && s[j] == '(') {
                j = skip_space(s, j + 1);
                if (read_quoted(s, j, spec)) {
                    j = skip_space(s, j);
                    if (j < s.size() && s[j] == ')') out.push_back(spec);
                }
                continue;
            }
            if (word == "require") continue;
            if (read_quoted(s, j, spec)) {
                out.push_back(spec);
                i = j;
                continue;
            }
        } else if (word != "export") {
            continue;
        }
        if (from_clause(s, i, spec)) out.push_back(spec);
    }
}

void include_specs(const std::string& content, std::vector<std::string>& out) {
    static const std::regex re(R"re(^\s*#\s*(?:include|import)\s*"([^"]+)")re");
    for (const auto& line : split_lines(content)) {
        if (line.size() > kMaxPatternLine) continue;
        std::smatch m;
        if (std::regex_search(line, m, re)) out.push_back(m[1].str());
    }
}

void rust_specs(const std::string& content, std::vector<std::string>& out) {
    static const std::regex re(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?mod\s+([A-Za-z_]\w*)\s*;)");
    for (const auto& line : split_lines(content)) {
        if (line.size() > kMaxPatternLine) continue;
        std::smatch m;
        if (std::regex_search(line, m, re)) out.push_back(m[1].str());
    }
}

void jvm_specs(const std::string& content, std::vector<std::string>& out) {
    static const std::regex re(R"(^\s*import\s+(?:static\s+)?([A-Za-z_][\w.]*)(\.\*)?\s*;?\s*$)");
    for (const auto& line : split_lines(content)) {
        if (line.size() > kMaxPatternLine) continue;
        std::smatch m;
        if (!std::regex_search(line, m, re)) continue;
        if (m[2].matched) continue;     // package wildcard names no single file
        out.push_back(m[1].str());
    }
}

// Lexically normalized repo-relative path, or "" when it escapes the root.
std::string normalize(const fs::path& p) {
    std::string s = p.lexically_normal().generic_string();
    if (s.empty() || s == "." || s.rfind("..", 0) == 0 || s[0] == '/') return "";
    return s;
}

std::string join(const std::string& dir, const std::string& rel) {
    return normalize(dir.empty() ? fs::path(rel) : fs::path(dir) / rel);
}

std::string replace_dots(std::string s) {
    std::replace(s.begin(), s.end(), '.', '/');
    return s;
}

} // namespace

std::vector<std::string> import_specifiers(const std::string& path, const std::string& content) {
    std::vector<std::string> out;
    switch (lang_of(path)) {
        case Lang::Python:  python_specs(content, out); break;
        case Lang::Js:      js_specs(content, out); break;
        case Lang::CFamily: include_specs(content, out); break;
        case Lang::Rust:    rust_specs(content, out); break;
        case Lang::Jvm:     jvm_specs(content, out); break;
        case Lang::None:    break;
    }
    return out;
}

ImportResolver::ImportResolver(const std::vector<std::string>& files)
    : files_(files.begin(), files.end()) {
    for (const auto& f : files_) {
        by_name_[fs::path(f).filename().string()].push_back(f);
    }
}

std::vector<std::string> ImportResolver::resolve(const std::string& path,
                                                 const std::string& content) const {
    std::string dir = fs::path(path).parent_path().generic_string();
    Lang lang = lang_of(path);

    std::set<std::string> found;
    for (const auto& spec : import_specifiers(path, content)) {
        std::optional<std::string> hit;
        switch (lang) {
            case Lang::Python:  hit = resolve_python(dir, spec); break;
            case Lang::Js:      hit = resolve_js(dir, spec); break;
            case Lang::CFamily: hit = resolve_include(dir, spec); break;
            case Lang::Rust:    hit = resolve_rust(path, spec); break;
            case Lang::Jvm:     hit = resolve_jvm(path, spec); break;
            case Lang::None:    break;
        }
        if (hit && *hit != path) found.insert(*hit);
    }
    return std::vector<std::string>(found.begin(), found.end());
}

std::optional<std::string> ImportResolver::first_existing(
        const std::vector<std::string>& candidates) const {
    for (const auto& c : candidates) {
        if (!c.empty() && exists(c)) return c;
    }
    return std::nullopt;
}

std::optional<std::string> ImportResolver::by_suffix(const std::string& suffix) const {
    auto it = by_name_.find(fs::path(suffix).filename().string());
    if (it == by_name_.end()) return std::nullopt;
    std::optional<std::string> best;
    for (const auto& f : it->second) {
        bool match = f == suffix ||
            (f.size() > suffix.size() &&
             f.compare(f.size() - suffix.size(), suffix.size(), suffix) == 0 &&
             f[f.size() - suffix.size() - 1] == '/');
        if (!match) continue;
        if (!best || f.size() < best->size() || (f.size() == best->size() && f < *best)) {
            best = f;
        }
    }
    return best;
}

std::optional<std::string> ImportResolver::resolve_python(const std::string& dir,
                                                          const std::string& spec) const {
    size_t level = spec.find_first_not_of('.');
    if (level == std::string::npos) level = spec.size();
    std::string rest = replace_dots(spec.substr(level));

    auto module_files = [&](const std::string& base) {
        std::vector<std::string> c;
        if (rest.empty()) {
            c.push_back(join(base, "__init__.py"));
        } else {
            c.push_back(join(base, rest + ".py"));
            c.push_back(join(base, rest + ".pyi"));
            c.push_back(join(base, rest + "/__init__.py"));
        }
        return c;
    };

    if (level > 0) {
        fs::path base(dir);
        for (size_t i = 1; i < level; ++i) base = base.parent_path();
        return first_existing(module_files(base.generic_string()));
    }

    if (auto hit = first_existing(module_files(""))) return hit;
    if (auto hit = first_existing(module_files(dir))) return hit;
    if (auto hit = by_suffix(rest + ".py")) return hit;
    return by_suffix(rest + "/__init__.py");
}

std::optional<std::string> ImportResolver::resolve_js(const std::string& dir,
                                                      const std::string& spec) const {
    if (spec.empty() || (spec[0] != '.' && spec[0] != '/')) return std::nullopt;

    std::string base = spec[0] == '/' ? normalize(spec.substr(1)) : join(dir, spec);
    if (base.empty()) return std::nullopt;

    static const char* const exts[] = {".ts", ".tsx", ".js", ".jsx", ".mjs", ".cjs",
                                       ".vue", ".svelte"};
    std::vector<std::string> c{base};
    for (const char* e : exts) c.push_back(base + e);
    for (const char* e : exts) c.push_back(base + "/index" + e);
    return first_existing(c);
}

std::optional<std::string> ImportResolver::resolve_include(const std::string& dir,
                                                           const std::string& spec) const {
    if (auto hit = first_existing({join(dir, spec), normalize(spec)})) return hit;
    return by_suffix(normalize(spec));
}

std::optional<std::string> ImportResolver::resolve_rust(const std::string& path,
                                                        const std::string& spec) const {
    fs::path p(path);
    std::string dir = p.parent_path().generic_string();
    std::string stem = p.stem().string();

    std::vector<std::string> c;
    if (stem == "mod" || stem == "lib" || stem == "main") {
        c.push_back(join(dir, spec + ".rs"));
        c.push_back(join(dir, spec + "/mod.rs"));
    } else {
        c.push_back(join(dir, stem + "/" + spec + ".rs"));
        c.push_back(join(dir, stem + "/" + spec + "/mod.rs"));
        c.push_back(join(dir, spec + ".rs"));
        c.push_back(join(dir, spec + "/mod.rs"));
    }
    return first_existing(c);
}

std::optional<std::string> ImportResolver::resolve_jvm(const std::string& path,
                                                       const std::string& spec) const {
    std::string ext = to_lower(fs::path(path).extension().string());
    std::string rel = replace_dots(spec);
    std::vector<std::string> exts = ext == ".java"
        ? std::vector<std::string>{".java", ".kt"}
        : std::vector<std::string>{".kt", ".java"};

    // Try the full name, then without the last segment (static member import).
    for (int attempt = 0; attempt < 2; ++attempt) {
        for (const auto& e : exts) {
            if (auto hit = by_suffix(rel + e)) return hit;
        }
        size_t slash = rel.rfind('/');
        if (slash == std::string::npos) break;
        rel = rel.substr(0, slash);
    }
    return std::nullopt;
}

} // namespace sift
