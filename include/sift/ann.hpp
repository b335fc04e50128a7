#pragma once

#include <sift/dense_index.hpp>
#include <sift/embedding.hpp>
#include <sift/result.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sift {

enum class AnnBackendKind { Scan, Hnsw, Unavailable };

const char* ann_backend_name(AnnBackendKind kind);

struct AnnBackendChoice {
    AnnBackendKind kind = AnnBackendKind::Scan;
    std::string reason;         // why a requested backend is Unavailable
};

// Resolves the configured backend name once. "hnsw" is Unavailable when the
// library was not compiled in; unknown names are Unavailable too.
AnnBackendChoice resolve_ann_backend(const std::string& name);

bool hnsw_compiled_in();

// Approximate nearest-neighbour index over normalized vectors. Labels are
// positions in the vector list given to build().
class AnnBackend {
public:
    virtual ~AnnBackend() = default;

    virtual const char* name() const = 0;

    virtual Status build(const std::vector<const Vector*>& vectors, int dim) = 0;

    // (label, inner-product similarity), best first.
    virtual Result<std::vector<std::pair<size_t, float>>> search(const Vector& query,
                                                                 size_t k) const = 0;

    virtual Status save(const std::string& path) const = 0;
    virtual Status load(const std::string& path, int dim, size_t count) = 0;
};

// nullptr unless kind is Hnsw and hnswlib is compiled in.
std::unique_ptr<AnnBackend> make_ann_backend(AnnBackendKind kind);

struct AnnCacheMeta {
    std::string backend;
    int dim = 0;
    std::string metric = "ip";
    std::string fingerprint;
    std::vector<std::string> id_map;    // label -> chunk id
};

// ANN artifact plus "<artifact>.meta.json". The artifact is valid only while
// the meta's backend and fingerprint match the live dense index.
class AnnCache {
public:
    AnnCache(std::filesystem::path artifact, std::unique_ptr<AnnBackend> backend);

    bool available() const { return backend_ != nullptr; }
    std::filesystem::path meta_path() const;

    // NotFound without a meta file, Corrupt when it cannot be parsed.
    Result<AnnCacheMeta> read_meta() const;

    bool is_fresh(const DenseIndex& index) const;

    // Rebuilds the artifact when it is missing or stale. Returns true when a
    // rebuild happened; Unavailable without a backend.
    Result<bool> refresh(const DenseIndex& index);

    // Top-k through the artifact. Fails with Unavailable, NotFound, Stale or
    // Corrupt; the caller then scans the dense index instead.
    Result<std::vector<DenseHit>> try_retrieve(const DenseIndex& index, const Vector& query,
                                               size_t topk);

private:
    Status write_meta(const AnnCacheMeta& meta) const;

    std::filesystem::path artifact_;
    std::unique_ptr<AnnBackend> backend_;
    bool loaded_ = false;
    std::string loaded_fingerprint_;
};

// ANN when possible, otherwise an exact scan. `used_ann` reports which.
std::vector<DenseHit> dense_search(const DenseIndex& index, AnnCache* cache,
                                   const Vector& query, size_t topk, bool* used_ann = nullptr);

} // namespace sift
