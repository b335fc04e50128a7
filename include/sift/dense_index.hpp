#pragma once

#include <sift/chunker.hpp>
#include <sift/embedding.hpp>
#include <sift/result.hpp>

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sift {

struct DenseHit {
    std::string chunk_id;
    float score = 0.0f;
};

struct DenseUpdateStats {
    size_t embedded = 0;
    size_t reused = 0;
    size_t pruned = 0;
};

// "<source>::off<N>" -> "<source>"; ids without the suffix are their own source.
std::string chunk_source(const std::string& chunk_id);

// chunk_id -> (vector, content hash, source) for one embedding model,
// persisted as JSON. Entries are kept in chunk id order.
class DenseIndex {
public:
    static constexpr int kFormatVersion = 1;

    struct Entry {
        Vector vector;
        std::string hash;
        std::string source;
    };

    DenseIndex(std::string provider, std::string model, int dim, std::string backend);

    // NotFound when the file is absent, Corrupt when it cannot be parsed and
    // Stale when it was built by a different provider, model or dim.
    static Result<DenseIndex> load(const std::filesystem::path& path,
                                   const EmbeddingAdapter& adapter,
                                   const std::string& backend);

    // Writes to a temporary file and renames it over `path`.
    Status save(const std::filesystem::path& path) const;

    // Makes the index hold exactly `chunks`: unchanged hashes keep their
    // vectors, changed or new chunks are embedded, other ids are pruned.
    Result<DenseUpdateStats> build_or_update(const std::map<std::string, std::string>& chunks,
                                             EmbeddingAdapter& adapter);

    // Same, limited to chunks whose source is in `touched_sources`; entries of
    // other sources are left alone.
    Result<DenseUpdateStats> update_sources(const std::vector<Chunk>& chunks,
                                            const std::set<std::string>& touched_sources,
                                            EmbeddingAdapter& adapter);

    // Drops every entry of the given sources.
    size_t remove_sources(const std::set<std::string>& sources);

    // Exhaustive cosine search (stored vectors and the query are unit length).
    // Ties go to the smaller chunk id.
    std::vector<DenseHit> scan(const Vector& query, size_t topk) const;

    // SHA-256 over the sorted (chunk_id, content_hash) pairs.
    std::string fingerprint() const;

    const std::map<std::string, Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::string& provider() const { return provider_; }
    const std::string& model() const { return model_; }
    int dim() const { return dim_; }
    const std::string& backend() const { return backend_; }

private:
    // Embeds `pending` (id -> text) in batches and stores the results.
    Status embed_pending(const std::map<std::string, std::pair<std::string, std::string>>& pending,
                         EmbeddingAdapter& adapter);

    std::string provider_;
    std::string model_;
    int dim_;
    std::string backend_;
    std::map<std::string, Entry> entries_;
};

} // namespace sift
