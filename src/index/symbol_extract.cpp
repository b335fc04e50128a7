#include <sift/symbol_index.hpp>
#include <sift/text.hpp>

#include <filesystem>
#include <regex>

namespace sift {

namespace {

struct Rule {
    std::regex re;
    int name_group;
    std::string kind;           // empty: taken from group 1
};

enum class BlockStyle { Indent, Brace, Keyword };

struct Language {
    std::vector<Rule> rules;
    BlockStyle block;
};

Rule rule(const char* pattern, int name_group, const char* kind) {
    return Rule{std::regex(pattern, std::regex::ECMAScript | std::regex::optimize),
                name_group, kind};
}

const Language* language_for(const std::string& path) {
    static const Language python{{
        rule(R"(^\s*(?:async\s+)?def\s+([A-Za-z_]\w*)\s*\()", 1, "function"),
        rule(R"(^\s*class\s+([A-Za-z_]\w*))", 1, "class"),
    }, BlockStyle::Indent};

    static const Language js{{
        rule(R"(^\s*(?:export\s+)?(?:default\s+)?(?:async\s+)?function\s*\*?\s*([A-Za-z_$][\w$]*)\s*\()", 1, "function"),
        rule(R"(^\s*(?:export\s+)?(?:default\s+)?(?:abstract\s+)?class\s+([A-Za-z_$][\w$]*))", 1, "class"),
        rule(R"(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(?:async\s*)?(?:\([^)]*\)|[A-Za-z_$][\w$]*)\s*=>)", 1, "function"),
        rule(R"(^\s*(?:export\s+)?interface\s+([A-Za-z_$][\w$]*))", 1, "interface"),
        rule(R"(^\s*(?:export\s+)?type\s+([A-Za-z_$][\w$]*)\s*=)", 1, "type"),
    }, BlockStyle::Brace};

    static const Language go{{
        rule(R"(^func\s+(?:\([^)]*\)\s*)?([A-Za-z_]\w*)\s*[\[(])", 1, "function"),
        rule(R"(^type\s+([A-Za-z_]\w*)\s+struct\b)", 1, "struct"),
        rule(R"(^type\s+([A-Za-z_]\w*)\s+interface\b)", 1, "interface"),
    }, BlockStyle::Brace};

    static const Language rust{{
        rule(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?(?:const\s+)?(?:async\s+)?(?:unsafe\s+)?fn\s+([A-Za-z_]\w*))", 1, "function"),
        rule(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?struct\s+([A-Za-z_]\w*))", 1, "struct"),
        rule(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?enum\s+([A-Za-z_]\w*))", 1, "enum"),
        rule(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?trait\s+([A-Za-z_]\w*))", 1, "trait"),
    }, BlockStyle::Brace};

    static const Language cfamily{{
        rule(R"(^\s*(?:template\s*<[^>]*>\s*)?(?:class|struct)\s+(?:\w+\s+)?([A-Za-z_]\w*)\s*(?:final\s*)?(?::[^;]*)?\{?\s*$)", 1, "class"),
        rule(R"(^\s*(?:typedef\s+)?enum\s+(?:class\s+|struct\s+)?([A-Za-z_]\w*))", 1, "enum"),
        rule(R"(^(?:[A-Za-z_][\w:<>,\*&]*\s+)+[\*&]*([A-Za-z_][\w:~]*)\s*\([^;]*$)", 1, "function"),
    }, BlockStyle::Brace};

    static const Language jvm{{
        rule(R"(^\s*(?:(?:public|private|protected|internal|static|final|abstract|sealed|data|open|partial)\s+)*(class|interface|enum|record|object)\s+([A-Za-z_]\w*))", 2, ""),
        rule(R"(^\s+(?:(?:public|private|protected|static|final|abstract|synchronized|override|virtual|async)\s+)+[\w<>\[\],.?]+\s+([A-Za-z_]\w*)\s*\()", 1, "method"),
        rule(R"(^\s*(?:(?:public|private|protected|internal|override|suspend|inline|open)\s+)*fun\s+(?:<[^>]*>\s*)?(?:[\w.]+\.)?([A-Za-z_]\w*)\s*\()", 1, "function"),
    }, BlockStyle::Brace};

    static const Language ruby{{
        rule(R"(^\s*def\s+(?:self\.)?([A-Za-z_]\w*[?!]?))", 1, "method"),
        rule(R"(^\s*(class|module)\s+([A-Z]\w*))", 2, ""),
    }, BlockStyle::Keyword};

    std::string ext = to_lower(std::filesystem::path(path).extension().string());
    if (ext == ".py" || ext == ".pyi") return &python;
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs" ||
        ext == ".ts" || ext == ".tsx") return &js;
    if (ext == ".go") return &go;
    if (ext == ".rs") return &rust;
    if (ext == ".c" || ext == ".h" || ext == ".cc" || ext == ".cpp" || ext == ".cxx" ||
        ext == ".hh" || ext == ".hpp" || ext == ".hxx") return &cfamily;
    if (ext == ".java" || ext == ".kt" || ext == ".kts" || ext == ".cs" ||
        ext == ".scala") return &jvm;
    if (ext == ".rb") return &ruby;
    return nullptr;
}

bool is_control_keyword(const std::string& name) {
    static const char* const kw[] = {
        "if", "for", "while", "switch", "return", "else", "do", "catch",
        "sizeof", "defined", "new", "delete", "case"
    };
    for (const char* k : kw) {
        if (name == k) return true;
    }
    return false;
}

size_t indent_of(const std::string& line) {
    size_t i = 0;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) ++i;
    return i;
}

bool is_blank(const std::string& line) {
    return indent_of(line) == line.size();
}

// All indices are 0-based here; callers convert.
size_t indent_block_end(const std::vector<std::string>& lines, size_t start) {
    size_t base = indent_of(lines[start]);
    size_t last = start;
    for (size_t i = start + 1; i < lines.size(); ++i) {
        if (is_blank(lines[i])) continue;
        if (indent_of(lines[i]) <= base) break;
        last = i;
    }
    return last;
}

size_t brace_block_end(const std::vector<std::string>& lines, size_t start) {
    int depth = 0;
    bool opened = false;
    for (size_t i = start; i < lines.size(); ++i) {
        for (char c : lines[i]) {
            if (c == '{') { depth++; opened = true; }
            else if (c == '}') depth--;
        }
        if (opened && depth <= 0) return i;
        if (!opened && i > start + 2) break;   // declaration without a body
    }
    return start;
}

size_t keyword_block_end(const std::vector<std::string>& lines, size_t start) {
    size_t base = indent_of(lines[start]);
    for (size_t i = start + 1; i < lines.size(); ++i) {
        const std::string& l = lines[i];
        if (indent_of(l) == base && l.compare(base, 3, "end") == 0) return i;
    }
    return start;
}

} // namespace

std::string make_pointer_id(const std::string& path, const std::string& name, int line) {
    return path + "#" + name + ":" + std::to_string(line);
}

std::vector<Symbol> extract_symbols(const std::string& path, const std::string& content) {
    std::vector<Symbol> out;
    const Language* lang = language_for(path);
    if (!lang) return out;

    std::vector<std::string> lines = split_lines(content);
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        if (is_blank(line) || line.size() > kMaxPatternLine) continue;

        for (const auto& r : lang->rules) {
            std::smatch m;
            if (!std::regex_search(line, m, r.re)) continue;

            std::string name = m[static_cast<size_t>(r.name_group)].str();
            if (name.empty() || is_control_keyword(name)) continue;
            std::string kind = r.kind.empty() ? m[1].str() : r.kind;

            size_t end = i;
            switch (lang->block) {
                case BlockStyle::Indent:  end = indent_block_end(lines, i); break;
                case BlockStyle::Brace:   end = brace_block_end(lines, i); break;
                case BlockStyle::Keyword: end = keyword_block_end(lines, i); break;
            }

            Symbol sym;
            sym.path = path;
            sym.name = std::move(name);
            sym.kind = std::move(kind);
            sym.start_line = static_cast<int>(i) + 1;
            sym.end_line = static_cast<int>(end) + 1;
            sym.pointer_id = make_pointer_id(path, sym.name, sym.start_line);
            out.push_back(std::move(sym));
            break;
        }
    }
    return out;
}

} // namespace sift
