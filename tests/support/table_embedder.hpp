#pragma once

#include <sift/embedding.hpp>

#include <map>

namespace sift_test {

// Returns fixed, unnormalized vectors from a lookup table. Unknown texts are
// an Embedding error.
class TableEmbedder : public sift::EmbeddingAdapter {
public:
    explicit TableEmbedder(int dim) : dim_(dim) {}

    const std::string& provider() const override { return provider_; }
    const std::string& model() const override { return model_; }
    int dim() const override { return dim_; }

    sift::Result<std::vector<sift::Vector>> embed_texts(
            const std::vector<std::string>& texts) override {
        std::vector<sift::Vector> out;
        for (const auto& t : texts) {
            auto v = embed_query(t);
            if (v.is_err()) return std::move(v).error();
            out.push_back(std::move(v).value());
        }
        return sift::Result<std::vector<sift::Vector>>::ok(std::move(out));
    }

    sift::Result<sift::Vector> embed_query(const std::string& query) override {
        auto it = table.find(query);
        if (it == table.end()) {
            return sift::SiftError(sift::SiftError::Embedding, "no vector for '" + query + "'");
        }
        return sift::Result<sift::Vector>::ok(it->second);
    }

    std::map<std::string, sift::Vector> table;

private:
    std::string provider_ = "table";
    std::string model_ = "raw";
    int dim_;
};

} // namespace sift_test
