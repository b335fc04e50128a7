#include <sift/ann.hpp>
#include <sift/log.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sift {

#ifdef SIFT_HAVE_HNSWLIB
std::unique_ptr<AnnBackend> make_hnsw_backend();
#endif

bool hnsw_compiled_in() {
#ifdef SIFT_HAVE_HNSWLIB
    return true;
#else
    return false;
#endif
}

const char* ann_backend_name(AnnBackendKind kind) {
    switch (kind) {
        case AnnBackendKind::Scan:        return "scan";
        case AnnBackendKind::Hnsw:        return "hnsw";
        case AnnBackendKind::Unavailable: return "unavailable";
    }
    return "unknown";
}

AnnBackendChoice resolve_ann_backend(const std::string& name) {
    AnnBackendChoice choice;
    if (name.empty() || name == "scan") {
        choice.kind = AnnBackendKind::Scan;
    } else if (name == "hnsw") {
        if (hnsw_compiled_in()) {
            choice.kind = AnnBackendKind::Hnsw;
        } else {
            choice.kind = AnnBackendKind::Unavailable;
            choice.reason = "hnswlib was not found when sift was built";
        }
    } else {
        choice.kind = AnnBackendKind::Unavailable;
        choice.reason = "unknown ANN backend '" + name + "'";
    }
    return choice;
}

std::unique_ptr<AnnBackend> make_ann_backend(AnnBackendKind kind) {
#ifdef SIFT_HAVE_HNSWLIB
    if (kind == AnnBackendKind::Hnsw) return make_hnsw_backend();
#endif
    (void)kind;
    return nullptr;
}

AnnCache::AnnCache(fs::path artifact, std::unique_ptr<AnnBackend> backend)
    : artifact_(std::move(artifact)), backend_(std::move(backend)) {}

fs::path AnnCache::meta_path() const {
    fs::path p = artifact_;
    p += ".meta.json";
    return p;
}

Result<AnnCacheMeta> AnnCache::read_meta() const {
    fs::path mp = meta_path();
    std::error_code ec;
    if (!fs::is_regular_file(mp, ec)) {
        return SiftError(SiftError::NotFound, "no ANN meta at " + mp.string());
    }
    std::ifstream in(mp);
    if (!in.is_open()) {
        return SiftError(SiftError::IO, "cannot open " + mp.string());
    }

    AnnCacheMeta meta;
    try {
        json doc = json::parse(in);
        meta.backend = doc.at("backend").get<std::string>();
        meta.dim = doc.at("dim").get<int>();
        meta.metric = doc.value("metric", std::string("ip"));
        meta.fingerprint = doc.at("fingerprint").get<std::string>();
        meta.id_map = doc.at("id_map").get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        return SiftError(SiftError::Corrupt,
            std::string("malformed ANN meta: ") + e.what(), "", mp.string(), 0);
    }
    return Result<AnnCacheMeta>::ok(std::move(meta));
}

Status AnnCache::write_meta(const AnnCacheMeta& meta) const {
    json doc = {
        {"backend", meta.backend},
        {"dim", meta.dim},
        {"metric", meta.metric},
        {"fingerprint", meta.fingerprint},
        {"id_map", meta.id_map},
    };
    fs::path mp = meta_path();
    fs::path tmp = mp;
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
    std::error_code ec;
    fs::rename(tmp, mp, ec);
    if (ec) {
        return SiftError(SiftError::IO, "cannot replace " + mp.string(), ec.message());
    }
    return ok_status();
}

bool AnnCache::is_fresh(const DenseIndex& index) const {
    if (!backend_) return false;
    auto meta = read_meta();
    if (meta.is_err()) return false;
    std::error_code ec;
    return meta.value().backend == backend_->name() &&
           meta.value().dim == index.dim() &&
           meta.value().fingerprint == index.fingerprint() &&
           fs::is_regular_file(artifact_, ec);
}

Result<bool> AnnCache::refresh(const DenseIndex& index) {
    if (!backend_) {
        return SiftError(SiftError::Unavailable, "no ANN backend configured");
    }
    if (is_fresh(index)) return Result<bool>::ok(false);

    AnnCacheMeta meta;
    meta.backend = backend_->name();
    meta.dim = index.dim();
    meta.fingerprint = index.fingerprint();

    std::vector<const Vector*> vectors;
    vectors.reserve(index.size());
    for (const auto& [id, entry] : index.entries()) {
        meta.id_map.push_back(id);
        vectors.push_back(&entry.vector);
    }

    std::error_code ec;
    fs::create_directories(artifact_.parent_path(), ec);
    // Drop the meta first so a failed rebuild reads as NotFound, not fresh.
    fs::remove(meta_path(), ec);

    SIFT_TRY(backend_->build(vectors, index.dim()));
    SIFT_TRY(backend_->save(artifact_.string()));
    SIFT_TRY(write_meta(meta));
    loaded_ = true;
    loaded_fingerprint_ = meta.fingerprint;

    log::info("ann: rebuilt %s index over %zu vectors", backend_->name(), index.size());
    return Result<bool>::ok(true);
}

Result<std::vector<DenseHit>> AnnCache::try_retrieve(const DenseIndex& index,
                                                     const Vector& query, size_t topk) {
    if (!backend_) {
        return SiftError(SiftError::Unavailable, "no ANN backend configured");
    }
    auto meta = read_meta();
    if (meta.is_err()) return std::move(meta).error();
    const AnnCacheMeta& m = meta.value();

    if (m.backend != backend_->name()) {
        return SiftError(SiftError::Stale,
            "ANN artifact was built by '" + m.backend + "'");
    }
    if (m.dim != index.dim() || m.fingerprint != index.fingerprint()) {
        return SiftError(SiftError::Stale, "ANN artifact does not match the dense index");
    }

    if (!loaded_ || loaded_fingerprint_ != m.fingerprint) {
        std::error_code ec;
        if (!fs::is_regular_file(artifact_, ec)) {
            return SiftError(SiftError::NotFound, "no ANN artifact at " + artifact_.string());
        }
        auto r = backend_->load(artifact_.string(), m.dim, m.id_map.size());
        if (r.is_err()) {
            SiftError e = std::move(r).error();
            e.code = SiftError::Corrupt;
            return e;
        }
        loaded_ = true;
        loaded_fingerprint_ = m.fingerprint;
    }

    Vector q = query;
    l2_normalize(q);
    auto found = backend_->search(q, topk);
    if (found.is_err()) return std::move(found).error();

    std::vector<DenseHit> hits;
    for (const auto& [label, score] : found.value()) {
        if (label >= m.id_map.size()) {
            return SiftError(SiftError::Corrupt, "ANN label outside the id map");
        }
        hits.push_back({m.id_map[label], score});
    }
    std::stable_sort(hits.begin(), hits.end(), [](const DenseHit& a, const DenseHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.chunk_id < b.chunk_id;
    });
    return Result<std::vector<DenseHit>>::ok(std::move(hits));
}

std::vector<DenseHit> dense_search(const DenseIndex& index, AnnCache* cache,
                                   const Vector& query, size_t topk, bool* used_ann) {
    if (used_ann) *used_ann = false;
    if (cache && cache->available()) {
        auto hits = cache->try_retrieve(index, query, topk);
        if (hits.is_ok()) {
            if (used_ann) *used_ann = true;
            return std::move(hits).value();
        }
        log::debug("ann: %s, scanning", hits.error().message.c_str());
    }
    return index.scan(query, topk);
}

} // namespace sift
