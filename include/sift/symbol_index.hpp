#pragma once

#include <sift/database.hpp>
#include <sift/result.hpp>

#include <string>
#include <vector>

namespace sift {

struct Symbol {
    std::string pointer_id;     // "<path>#<name>:<start_line>"
    std::string path;
    std::string name;
    std::string kind;           // function, class, struct, ...
    int start_line = 0;         // 1-based
    int end_line = 0;
};

std::string make_pointer_id(const std::string& path, const std::string& name, int line);

// Best-effort definition scan chosen by file extension. Unknown languages
// yield nothing.
std::vector<Symbol> extract_symbols(const std::string& path, const std::string& content);

struct SymbolHit {
    Symbol symbol;
    double score = 0.0;
};

// Definitions per file in the `symbols` table, replaced whole on re-index.
class SymbolIndex {
public:
    explicit SymbolIndex(Database& db) : db_(db) {}

    // True when an older table was dropped and files must be re-indexed.
    Result<bool> open();

    Status replace(const std::string& path, const std::vector<Symbol>& symbols);
    Status remove(const std::string& path);

    // Symbols whose lowercase name contains a query token. Score is the best
    // token match: 1.0 exact, 0.6 prefix, 0.3 substring. Ordered by score
    // descending then pointer id.
    Result<std::vector<SymbolHit>> lookup(const std::vector<std::string>& tokens, size_t limit);

    Result<std::vector<Symbol>> symbols_in(const std::string& path);

private:
    Database& db_;
};

} // namespace sift
