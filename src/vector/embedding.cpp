#include <sift/embedding.hpp>
#include <sift/text.hpp>

#include <cmath>

namespace sift {

void l2_normalize(Vector& v) {
    double sum = 0.0;
    for (float x : v) sum += static_cast<double>(x) * x;
    if (sum <= 0.0) return;
    float inv = static_cast<float>(1.0 / std::sqrt(sum));
    for (float& x : v) x *= inv;
}

float dot(const Vector& a, const Vector& b) {
    size_t n = a.size() < b.size() ? a.size() : b.size();
    float acc = 0.0f;
    for (size_t i = 0; i < n; ++i) acc += a[i] * b[i];
    return acc;
}

uint64_t fnv1a64(const std::string& s) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

HashEmbedder::HashEmbedder(std::string model, int dim)
    : model_(std::move(model)), dim_(dim) {}

Vector HashEmbedder::embed(const std::string& text) const {
    Vector v(static_cast<size_t>(dim_), 0.0f);
    for (const auto& tok : tokenize(text)) {
        uint64_t h = fnv1a64(tok);
        size_t bucket = static_cast<size_t>(h % static_cast<uint64_t>(dim_));
        v[bucket] += (h >> 63) ? -1.0f : 1.0f;
    }
    l2_normalize(v);
    return v;
}

Result<std::vector<Vector>> HashEmbedder::embed_texts(const std::vector<std::string>& texts) {
    std::vector<Vector> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(embed(t));
    return Result<std::vector<Vector>>::ok(std::move(out));
}

Result<Vector> HashEmbedder::embed_query(const std::string& query) {
    return Result<Vector>::ok(embed(query));
}

Result<std::unique_ptr<EmbeddingAdapter>> make_embedding_adapter(const DenseConfig& cfg) {
    if (cfg.dim <= 0) {
        return SiftError(SiftError::Config, "dense.dim must be positive");
    }
    if (cfg.provider == HashEmbedder::kProvider) {
        std::unique_ptr<EmbeddingAdapter> a = std::make_unique<HashEmbedder>(cfg.model, cfg.dim);
        return Result<std::unique_ptr<EmbeddingAdapter>>::ok(std::move(a));
    }
    return SiftError(SiftError::Unavailable,
        "embedding provider '" + cfg.provider + "' is not available in this build",
        "use dense.provider = \"stub_hash\" or disable [dense]");
}

} // namespace sift
