#pragma once

#include <sift/config.hpp>
#include <sift/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace sift {

using Vector = std::vector<float>;

// In-place L2 normalization; an all-zero vector is left as is.
void l2_normalize(Vector& v);
float dot(const Vector& a, const Vector& b);

// Source of embedding vectors. Implementations return vectors of exactly
// dim() components, or an Embedding error. The dense index L2-normalizes
// stored vectors and queries itself, so magnitudes never affect ranking.
class EmbeddingAdapter {
public:
    virtual ~EmbeddingAdapter() = default;

    virtual const std::string& provider() const = 0;
    virtual const std::string& model() const = 0;
    virtual int dim() const = 0;

    virtual Result<std::vector<Vector>> embed_texts(const std::vector<std::string>& texts) = 0;
    virtual Result<Vector> embed_query(const std::string& query) = 0;
};

// Offline adapter: signed feature hashing of query tokens (FNV-1a, 64-bit)
// into dim buckets. Deterministic across runs and platforms.
class HashEmbedder : public EmbeddingAdapter {
public:
    static constexpr const char* kProvider = "stub_hash";

    HashEmbedder(std::string model, int dim);

    const std::string& provider() const override { return provider_; }
    const std::string& model() const override { return model_; }
    int dim() const override { return dim_; }

    Result<std::vector<Vector>> embed_texts(const std::vector<std::string>& texts) override;
    Result<Vector> embed_query(const std::string& query) override;

    Vector embed(const std::string& text) const;

private:
    std::string provider_ = kProvider;
    std::string model_;
    int dim_;
};

uint64_t fnv1a64(const std::string& s);

// Unavailable for providers this build does not know.
Result<std::unique_ptr<EmbeddingAdapter>> make_embedding_adapter(const DenseConfig& cfg);

} // namespace sift
