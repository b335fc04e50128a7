#pragma once

#include <sift/ann.hpp>
#include <sift/dense_index.hpp>
#include <sift/embedding.hpp>
#include <sift/lexical_index.hpp>
#include <sift/result.hpp>
#include <sift/symbol_index.hpp>

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sift {

enum class HitKind { Pointer, File };

const char* hit_kind_name(HitKind kind);

// Source tags carried in Hit::sources.
constexpr const char* kSourcePointer = "pointer";
constexpr const char* kSourceFts = "fts";
constexpr const char* kSourceVector = "vector";

struct Hit {
    std::string path;
    double score = 0.0;
    HitKind kind = HitKind::File;
    std::set<std::string> sources;
    std::optional<std::string> pointer_id;
    std::optional<std::string> symbol;
    std::optional<int> start_line;
    std::optional<int> end_line;
    std::optional<std::string> snippet;

    // pointer_id when present, else path.
    const std::string& key() const { return pointer_id ? *pointer_id : path; }
};

enum class SearchStatus { Ok, EmptyQuery, IndexMissing };

const char* search_status_name(SearchStatus s);

struct SearchResponse {
    SearchStatus status = SearchStatus::Ok;
    std::vector<Hit> hits;
    std::vector<std::string> degraded;  // sources that failed and were skipped
    bool used_ann = false;
};

// Which passes a query runs: fts is symbols plus full text, vector is the
// dense pass alone, hybrid is all three.
enum class SearchMode { Fts, Vector, Hybrid };

const char* search_mode_name(SearchMode mode);
bool parse_search_mode(const std::string& name, SearchMode& out);

struct SearchOptions {
    SearchMode mode = SearchMode::Hybrid;
    size_t limit = 10;
    int context_lines = 9;
    int candidate_multiplier = 4;
};

// max(limit * multiplier, 20)
size_t candidate_cap(size_t limit, int multiplier);

struct Grounding {
    int start_line = 1;
    int end_line = 1;
    std::string snippet;
};

// Line window of half-width `context_lines`. Centered on `anchor_line` when
// given, else on the first line containing a token, else the file head.
Grounding ground(const std::string& content, const std::vector<std::string>& tokens,
                 int context_lines, std::optional<int> anchor_line = std::nullopt);

// Divides every score by the best one; non-positive bests map all hits to 1.
void normalize_scores(std::vector<Hit>& hits);

// Merges hits sharing key(): max score, union of sources, the first non-empty
// snippet (with its lines) wins. First-seen order is kept.
std::vector<Hit> merge_hits(const std::vector<Hit>& hits);

// Exact symbol +1.0, prefix +0.6, substring +0.3, and +0.1 per token found in
// the path, at most +0.3.
double rerank_bonus(const Hit& hit, const std::vector<std::string>& tokens);

// Stable sort by score, add bonuses, stable sort again, truncate.
void rerank(std::vector<Hit>& hits, const std::vector<std::string>& tokens, size_t limit);

// Read-side collaborators for one query. Null members are skipped.
struct RetrievalSources {
    SymbolIndex* symbols = nullptr;
    LexicalIndex* lexical = nullptr;
    const DenseIndex* dense = nullptr;
    AnnCache* ann = nullptr;
    EmbeddingAdapter* embedder = nullptr;
    // Current file content for grounding; falls back to the lexical copy.
    std::function<Result<std::string>(const std::string&)> read_file;
};

class HybridRetriever {
public:
    HybridRetriever(RetrievalSources sources, SearchOptions opts);

    SearchResponse search(const std::string& query);

private:
    Result<std::vector<Hit>> pointer_pass(const std::vector<std::string>& tokens, size_t cap);
    Result<std::vector<Hit>> lexical_pass(const std::string& query,
                                          const std::vector<std::string>& tokens, size_t cap);
    Result<std::vector<Hit>> dense_pass(const std::string& query,
                                        const std::vector<std::string>& tokens, size_t cap,
                                        bool& used_ann);

    std::optional<std::string> file_content(const std::string& path);

    RetrievalSources src_;
    SearchOptions opts_;
};

} // namespace sift
