#include <sift/retrieval.hpp>
#include <sift/log.hpp>
#include <sift/text.hpp>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <unordered_map>

namespace sift {

const char* hit_kind_name(HitKind kind) {
    return kind == HitKind::Pointer ? "pointer" : "file";
}

const char* search_status_name(SearchStatus s) {
    switch (s) {
        case SearchStatus::Ok:           return "ok";
        case SearchStatus::EmptyQuery:   return "empty_query";
        case SearchStatus::IndexMissing: return "index_missing";
    }
    return "unknown";
}

const char* search_mode_name(SearchMode mode) {
    switch (mode) {
        case SearchMode::Fts:    return "fts";
        case SearchMode::Vector: return "vector";
        case SearchMode::Hybrid: return "hybrid";
    }
    return "unknown";
}

bool parse_search_mode(const std::string& name, SearchMode& out) {
    std::string lower = to_lower(name);
    for (SearchMode m : {SearchMode::Fts, SearchMode::Vector, SearchMode::Hybrid}) {
        if (lower == search_mode_name(m)) {
            out = m;
            return true;
        }
    }
    return false;
}

size_t candidate_cap(size_t limit, int multiplier) {
    size_t m = multiplier > 0 ? static_cast<size_t>(multiplier) : 1;
    return std::max<size_t>(limit * m, 20);
}

Grounding ground(const std::string& content, const std::vector<std::string>& tokens,
                 int context_lines, std::optional<int> anchor_line) {
    Grounding g;
    std::vector<std::string> lines = split_lines(content);
    if (lines.empty()) return g;

    int n = static_cast<int>(lines.size());
    int ctx = std::max(context_lines, 0);
    int center = 0;     // 1-based; 0 means the head

    if (anchor_line && *anchor_line >= 1) {
        center = std::min(*anchor_line, n);
    } else {
        for (int i = 0; i < n && center == 0; ++i) {
            for (const auto& tok : tokens) {
                if (find_ci(lines[static_cast<size_t>(i)], tok) != std::string::npos) {
                    center = i + 1;
                    break;
                }
            }
        }
    }

    if (center == 0) {
        g.start_line = 1;
        g.end_line = std::min(n, 2 * ctx + 1);
    } else {
        g.start_line = std::max(1, center - ctx);
        g.end_line = std::min(n, center + ctx);
    }

    for (int i = g.start_line; i <= g.end_line; ++i) {
        if (i > g.start_line) g.snippet += '\n';
        g.snippet += lines[static_cast<size_t>(i - 1)];
    }
    return g;
}

void normalize_scores(std::vector<Hit>& hits) {
    double best = 0.0;
    for (const auto& h : hits) best = std::max(best, h.score);
    for (auto& h : hits) {
        if (best <= 0.0) {
            h.score = 1.0;
        } else {
            // Keep every hit strictly positive so the max-merge never drops it.
            h.score = std::max(h.score / best, 1e-6);
        }
    }
}

std::vector<Hit> merge_hits(const std::vector<Hit>& hits) {
    std::vector<Hit> out;
    std::unordered_map<std::string, size_t> pos;
    for (const auto& h : hits) {
        auto it = pos.find(h.key());
        if (it == pos.end()) {
            pos.emplace(h.key(), out.size());
            out.push_back(h);
            continue;
        }
        Hit& m = out[it->second];
        m.score = std::max(m.score, h.score);
        m.sources.insert(h.sources.begin(), h.sources.end());
        if (!m.symbol && h.symbol) m.symbol = h.symbol;
        bool have = m.snippet && !m.snippet->empty();
        if (!have && h.snippet && !h.snippet->empty()) {
            m.snippet = h.snippet;
            m.start_line = h.start_line;
            m.end_line = h.end_line;
        }
    }
    return out;
}

double rerank_bonus(const Hit& hit, const std::vector<std::string>& tokens) {
    double bonus = 0.0;
    if (hit.symbol) {
        std::string sym = to_lower(*hit.symbol);
        double best = 0.0;
        for (const auto& tok : tokens) {
            if (sym == tok) best = std::max(best, 1.0);
            else if (sym.compare(0, tok.size(), tok) == 0) best = std::max(best, 0.6);
            else if (sym.find(tok) != std::string::npos) best = std::max(best, 0.3);
        }
        bonus += best;
    }

    std::string path = to_lower(hit.path);
    double path_bonus = 0.0;
    for (const auto& tok : tokens) {
        if (path.find(tok) != std::string::npos) path_bonus += 0.1;
    }
    bonus += std::min(path_bonus, 0.3);
    return bonus;
}

void rerank(std::vector<Hit>& hits, const std::vector<std::string>& tokens, size_t limit) {
    auto by_score = [](const Hit& a, const Hit& b) { return a.score > b.score; };
    std::stable_sort(hits.begin(), hits.end(), by_score);
    for (auto& h : hits) h.score += rerank_bonus(h, tokens);
    std::stable_sort(hits.begin(), hits.end(), by_score);
    if (hits.size() > limit) hits.resize(limit);
}

HybridRetriever::HybridRetriever(RetrievalSources sources, SearchOptions opts)
    : src_(std::move(sources)), opts_(opts) {}

std::optional<std::string> HybridRetriever::file_content(const std::string& path) {
    if (src_.read_file) {
        auto r = src_.read_file(path);
        if (r.is_ok()) return std::move(r).value();
        log::debug("ground: %s: %s", path.c_str(), r.error().message.c_str());
    }
    if (src_.lexical) {
        auto r = src_.lexical->content(path);
        if (r.is_ok()) return std::move(r).value();
        log::debug("ground: %s: %s", path.c_str(), r.error().message.c_str());
    }
    return std::nullopt;
}

Result<std::vector<Hit>> HybridRetriever::pointer_pass(const std::vector<std::string>& tokens,
                                                       size_t cap) {
    auto found = src_.symbols->lookup(tokens, cap);
    if (found.is_err()) return std::move(found).error();

    std::vector<Hit> hits;
    for (const auto& sh : found.value()) {
        Hit h;
        h.path = sh.symbol.path;
        h.score = sh.score;
        h.kind = HitKind::Pointer;
        h.sources.insert(kSourcePointer);
        h.pointer_id = sh.symbol.pointer_id;
        h.symbol = sh.symbol.name;
        if (auto content = file_content(h.path)) {
            Grounding g = ground(*content, tokens, opts_.context_lines, sh.symbol.start_line);
            h.start_line = g.start_line;
            h.end_line = g.end_line;
            h.snippet = std::move(g.snippet);
        } else {
            h.start_line = sh.symbol.start_line;
            h.end_line = sh.symbol.end_line;
        }
        hits.push_back(std::move(h));
    }
    return Result<std::vector<Hit>>::ok(std::move(hits));
}

Result<std::vector<Hit>> HybridRetriever::lexical_pass(const std::string& query,
                                                       const std::vector<std::string>& tokens,
                                                       size_t cap) {
    auto found = src_.lexical->search(query, cap);
    if (found.is_err()) return std::move(found).error();

    std::vector<Hit> hits;
    for (const auto& lh : found.value()) {
        Hit h;
        h.path = lh.path;
        h.score = lh.score;
        h.sources.insert(kSourceFts);
        if (auto content = file_content(h.path)) {
            Grounding g = ground(*content, tokens, opts_.context_lines);
            h.start_line = g.start_line;
            h.end_line = g.end_line;
            h.snippet = std::move(g.snippet);
        } else if (!lh.snippet.empty()) {
            h.snippet = lh.snippet;
        }
        hits.push_back(std::move(h));
    }
    return Result<std::vector<Hit>>::ok(std::move(hits));
}

Result<std::vector<Hit>> HybridRetriever::dense_pass(const std::string& query,
                                                     const std::vector<std::string>& tokens,
                                                     size_t cap, bool& used_ann) {
    auto qv = src_.embedder->embed_query(query);
    if (qv.is_err()) return std::move(qv).error();

    std::vector<DenseHit> found = dense_search(*src_.dense, src_.ann, qv.value(), cap, &used_ann);

    // Best chunk per file, in first-seen (best score) order.
    std::vector<Hit> hits;
    std::map<std::string, size_t> by_path;
    std::map<std::string, size_t> best_offset;
    for (const auto& dh : found) {
        if (dh.score <= 0.0f) continue;
        std::string path = chunk_source(dh.chunk_id);
        if (by_path.count(path)) continue;
        by_path.emplace(path, hits.size());

        size_t off = 0;
        size_t at = dh.chunk_id.rfind("::off");
        if (at != std::string::npos) {
            off = static_cast<size_t>(std::strtoull(dh.chunk_id.c_str() + at + 5, nullptr, 10));
        }
        best_offset[path] = off;

        Hit h;
        h.path = path;
        h.score = dh.score;
        h.sources.insert(kSourceVector);
        hits.push_back(std::move(h));
    }

    for (auto& h : hits) {
        auto content = file_content(h.path);
        if (!content) continue;
        Grounding g = ground(*content, tokens, opts_.context_lines);
        bool token_found = false;
        for (const auto& tok : tokens) {
            if (find_ci(*content, tok) != std::string::npos) { token_found = true; break; }
        }
        if (!token_found) {
            // No lexical anchor: center on the matching chunk instead of the head.
            size_t off = std::min(best_offset[h.path], content->size());
            int line = 1 + static_cast<int>(std::count(content->begin(),
                content->begin() + static_cast<long>(off), '\n'));
            g = ground(*content, tokens, opts_.context_lines, line);
        }
        h.start_line = g.start_line;
        h.end_line = g.end_line;
        h.snippet = std::move(g.snippet);
    }
    return Result<std::vector<Hit>>::ok(std::move(hits));
}

SearchResponse HybridRetriever::search(const std::string& query) {
    SearchResponse resp;
    std::vector<std::string> tokens = unique_tokens(query);
    if (tokens.empty()) {
        resp.status = SearchStatus::EmptyQuery;
        return resp;
    }
    bool lexical_side = opts_.mode != SearchMode::Vector;
    bool dense_side = opts_.mode != SearchMode::Fts;
    SymbolIndex* symbols = lexical_side ? src_.symbols : nullptr;
    LexicalIndex* lexical = lexical_side ? src_.lexical : nullptr;
    const DenseIndex* dense = dense_side ? src_.dense : nullptr;
    if (!symbols && !lexical && !dense) {
        resp.status = SearchStatus::IndexMissing;
        return resp;
    }

    size_t cap = candidate_cap(opts_.limit, opts_.candidate_multiplier);
    std::vector<Hit> all;
    auto take = [&](const char* name, Result<std::vector<Hit>> pass) {
        if (pass.is_err()) {
            log::warn("search: %s source failed: %s", name, pass.error().message.c_str());
            resp.degraded.push_back(name);
            return;
        }
        std::vector<Hit>& hits = pass.value();
        normalize_scores(hits);
        for (auto& h : hits) all.push_back(std::move(h));
    };

    if (symbols) take(kSourcePointer, pointer_pass(tokens, cap));
    if (lexical) take(kSourceFts, lexical_pass(query, tokens, cap));
    if (dense && src_.embedder && !dense->empty()) {
        take(kSourceVector, dense_pass(query, tokens, cap, resp.used_ann));
    }

    resp.hits = merge_hits(all);
    rerank(resp.hits, tokens, opts_.limit);
    return resp;
}

} // namespace sift
