#include <sift/dense_index.hpp>
#include <sift/log.hpp>
#include <sift/sha256.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sift {

namespace {

constexpr size_t kEmbedBatch = 64;

} // namespace

std::string chunk_source(const std::string& chunk_id) {
    size_t pos = chunk_id.rfind("::off");
    return pos == std::string::npos ? chunk_id : chunk_id.substr(0, pos);
}

DenseIndex::DenseIndex(std::string provider, std::string model, int dim, std::string backend)
    : provider_(std::move(provider)), model_(std::move(model)), dim_(dim),
      backend_(std::move(backend)) {}

Result<DenseIndex> DenseIndex::load(const fs::path& path, const EmbeddingAdapter& adapter,
                                    const std::string& backend) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return SiftError(SiftError::NotFound, "no dense index at " + path.string());
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return SiftError(SiftError::IO, "cannot open " + path.string());
    }

    json doc;
    try {
        in >> doc;
    } catch (const json::exception& e) {
        return SiftError(SiftError::Corrupt,
            std::string("dense index is not valid JSON: ") + e.what(), "", path.string(), 0);
    }

    DenseIndex index(adapter.provider(), adapter.model(), adapter.dim(), backend);
    try {
        if (doc.at("version").get<int>() != kFormatVersion) {
            return SiftError(SiftError::Stale, "dense index format version changed");
        }
        if (doc.at("provider").get<std::string>() != adapter.provider() ||
            doc.at("model").get<std::string>() != adapter.model() ||
            doc.at("dim").get<int>() != adapter.dim()) {
            return SiftError(SiftError::Stale,
                "dense index was built by " + doc.at("provider").get<std::string>() + "/" +
                doc.at("model").get<std::string>());
        }

        const json& vectors = doc.at("vectors");
        const json& hashes = doc.at("hashes");
        const json* sources = doc.contains("sources") ? &doc.at("sources") : nullptr;
        for (auto it = vectors.begin(); it != vectors.end(); ++it) {
            Entry e;
            e.vector = it.value().get<Vector>();
            if (static_cast<int>(e.vector.size()) != adapter.dim()) {
                return SiftError(SiftError::Corrupt,
                    "vector " + it.key() + " has the wrong dimension", "", path.string(), 0);
            }
            l2_normalize(e.vector);
            e.hash = hashes.at(it.key()).get<std::string>();
            e.source = sources && sources->contains(it.key())
                ? sources->at(it.key()).get<std::string>()
                : chunk_source(it.key());
            index.entries_.emplace(it.key(), std::move(e));
        }
    } catch (const json::exception& e) {
        return SiftError(SiftError::Corrupt,
            std::string("malformed dense index: ") + e.what(), "", path.string(), 0);
    }
    return Result<DenseIndex>::ok(std::move(index));
}

Status DenseIndex::save(const fs::path& path) const {
    json vectors = json::object();
    json hashes = json::object();
    json sources = json::object();
    for (const auto& [id, e] : entries_) {
        vectors[id] = e.vector;
        hashes[id] = e.hash;
        sources[id] = e.source;
    }
    json doc = {
        {"version", kFormatVersion},
        {"provider", provider_},
        {"model", model_},
        {"dim", dim_},
        {"backend", backend_},
        {"vectors", std::move(vectors)},
        {"hashes", std::move(hashes)},
        {"sources", std::move(sources)},
    };

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return SiftError(SiftError::IO, "cannot write " + tmp.string());
        }
        out << doc.dump();
        if (!out.good()) {
            return SiftError(SiftError::IO, "write failed for " + tmp.string());
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        return SiftError(SiftError::IO, "cannot replace " + path.string(), ec.message());
    }
    return ok_status();
}

Status DenseIndex::embed_pending(
        const std::map<std::string, std::pair<std::string, std::string>>& pending,
        EmbeddingAdapter& adapter) {
    std::vector<std::string> ids;
    std::vector<std::string> texts;
    auto flush = [&]() -> Status {
        if (ids.empty()) return ok_status();
        auto vecs = adapter.embed_texts(texts);
        if (vecs.is_err()) return std::move(vecs).error();
        if (vecs.value().size() != ids.size()) {
            return SiftError(SiftError::Embedding, "adapter returned the wrong number of vectors");
        }
        for (size_t i = 0; i < ids.size(); ++i) {
            Vector& v = vecs.value()[i];
            if (static_cast<int>(v.size()) != dim_) {
                return SiftError(SiftError::Embedding, "adapter returned a vector of the wrong size");
            }
            l2_normalize(v);
            Entry& e = entries_[ids[i]];
            e.vector = std::move(v);
            e.hash = sha256_hex(texts[i]);
            e.source = pending.at(ids[i]).second;
        }
        ids.clear();
        texts.clear();
        return ok_status();
    };

    for (const auto& [id, text_source] : pending) {
        ids.push_back(id);
        texts.push_back(text_source.first);
        if (ids.size() == kEmbedBatch) SIFT_TRY(flush());
    }
    return flush();
}

Result<DenseUpdateStats> DenseIndex::build_or_update(
        const std::map<std::string, std::string>& chunks, EmbeddingAdapter& adapter) {
    DenseUpdateStats stats;
    std::map<std::string, std::pair<std::string, std::string>> pending;

    for (const auto& [id, text] : chunks) {
        auto it = entries_.find(id);
        if (it != entries_.end() && it->second.hash == sha256_hex(text)) {
            stats.reused++;
            continue;
        }
        pending.emplace(id, std::make_pair(text, chunk_source(id)));
    }

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (chunks.count(it->first)) {
            ++it;
        } else {
            it = entries_.erase(it);
            stats.pruned++;
        }
    }

    SIFT_TRY(embed_pending(pending, adapter));
    stats.embedded = pending.size();
    return Result<DenseUpdateStats>::ok(stats);
}

Result<DenseUpdateStats> DenseIndex::update_sources(const std::vector<Chunk>& chunks,
                                                   const std::set<std::string>& touched_sources,
                                                   EmbeddingAdapter& adapter) {
    DenseUpdateStats stats;
    std::set<std::string> live;
    std::map<std::string, std::pair<std::string, std::string>> pending;

    for (const auto& c : chunks) {
        if (!touched_sources.count(c.source)) continue;
        live.insert(c.chunk_id);
        auto it = entries_.find(c.chunk_id);
        if (it != entries_.end() && it->second.hash == sha256_hex(c.content)) {
            stats.reused++;
            continue;
        }
        pending[c.chunk_id] = std::make_pair(c.content, c.source);
    }

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (touched_sources.count(it->second.source) && !live.count(it->first)) {
            it = entries_.erase(it);
            stats.pruned++;
        } else {
            ++it;
        }
    }

    SIFT_TRY(embed_pending(pending, adapter));
    stats.embedded = pending.size();
    return Result<DenseUpdateStats>::ok(stats);
}

size_t DenseIndex::remove_sources(const std::set<std::string>& sources) {
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (sources.count(it->second.source)) {
            it = entries_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<DenseHit> DenseIndex::scan(const Vector& query, size_t topk) const {
    Vector q = query;
    l2_normalize(q);
    std::vector<DenseHit> hits;
    hits.reserve(entries_.size());
    for (const auto& [id, e] : entries_) {
        hits.push_back({id, dot(q, e.vector)});
    }
    // entries_ is id-ordered, so a stable sort breaks ties by chunk id.
    std::stable_sort(hits.begin(), hits.end(), [](const DenseHit& a, const DenseHit& b) {
        return a.score > b.score;
    });
    if (hits.size() > topk) hits.resize(topk);
    return hits;
}

std::string DenseIndex::fingerprint() const {
    std::map<std::string, std::string> pairs;
    for (const auto& [id, e] : entries_) pairs.emplace(id, e.hash);
    return sift::fingerprint(pairs);
}

} // namespace sift
