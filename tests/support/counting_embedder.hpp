#pragma once

#include <sift/embedding.hpp>

namespace sift_test {

// HashEmbedder that counts how many texts it was asked to embed, and can be
// told to fail.
class CountingEmbedder : public sift::EmbeddingAdapter {
public:
    explicit CountingEmbedder(int dim = 64) : inner_("hash-" + std::to_string(dim), dim) {}

    const std::string& provider() const override { return inner_.provider(); }
    const std::string& model() const override { return inner_.model(); }
    int dim() const override { return inner_.dim(); }

    sift::Result<std::vector<sift::Vector>> embed_texts(
            const std::vector<std::string>& texts) override {
        if (fail) return sift::SiftError(sift::SiftError::Embedding, "embedder offline");
        embedded += texts.size();
        return inner_.embed_texts(texts);
    }

    sift::Result<sift::Vector> embed_query(const std::string& query) override {
        if (fail) return sift::SiftError(sift::SiftError::Embedding, "embedder offline");
        return inner_.embed_query(query);
    }

    size_t embedded = 0;
    bool fail = false;

private:
    sift::HashEmbedder inner_;
};

} // namespace sift_test
