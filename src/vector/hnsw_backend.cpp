#include <sift/ann.hpp>
#include <hnswlib/hnswlib.h>

#include <algorithm>
#include <stdexcept>

namespace sift {

namespace {

constexpr size_t kM = 16;
constexpr size_t kEfConstruction = 200;
constexpr size_t kEfSearch = 50;

// hnswlib over inner-product space; with normalized vectors the reported
// distance is 1 - cosine.
class HnswBackend : public AnnBackend {
public:
    const char* name() const override { return "hnsw"; }

    Status build(const std::vector<const Vector*>& vectors, int dim) override {
        try {
            space_ = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dim));
            index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(
                space_.get(), std::max<size_t>(vectors.size(), 1), kM, kEfConstruction);
            for (size_t i = 0; i < vectors.size(); ++i) {
                index_->addPoint(vectors[i]->data(), static_cast<hnswlib::labeltype>(i));
            }
            index_->setEf(kEfSearch);
        } catch (const std::exception& e) {
            index_.reset();
            return SiftError(SiftError::Unavailable, std::string("hnsw build failed: ") + e.what());
        }
        return ok_status();
    }

    Result<std::vector<std::pair<size_t, float>>> search(const Vector& query,
                                                         size_t k) const override {
        using Out = std::vector<std::pair<size_t, float>>;
        if (!index_) return SiftError(SiftError::NotFound, "hnsw index not built");
        size_t n = index_->getCurrentElementCount();
        if (n == 0 || k == 0) return Result<Out>::ok({});

        Out out;
        try {
            index_->setEf(std::max(kEfSearch, k));
            auto pq = index_->searchKnn(query.data(), std::min(k, n));
            while (!pq.empty()) {
                out.emplace_back(static_cast<size_t>(pq.top().second), 1.0f - pq.top().first);
                pq.pop();
            }
        } catch (const std::exception& e) {
            return SiftError(SiftError::Unavailable, std::string("hnsw search failed: ") + e.what());
        }
        std::reverse(out.begin(), out.end());     // the queue pops the farthest first
        return Result<Out>::ok(std::move(out));
    }

    Status save(const std::string& path) const override {
        if (!index_) return SiftError(SiftError::NotFound, "hnsw index not built");
        try {
            index_->saveIndex(path);
        } catch (const std::exception& e) {
            return SiftError(SiftError::IO, std::string("hnsw save failed: ") + e.what());
        }
        return ok_status();
    }

    Status load(const std::string& path, int dim, size_t count) override {
        try {
            space_ = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dim));
            index_ = std::make_unique<hnswlib::HierarchicalNSW<float>>(space_.get(), path);
            index_->setEf(kEfSearch);
        } catch (const std::exception& e) {
            index_.reset();
            return SiftError(SiftError::Corrupt, std::string("hnsw load failed: ") + e.what());
        }
        if (index_->getCurrentElementCount() != count) {
            index_.reset();
            return SiftError(SiftError::Corrupt, "hnsw artifact size does not match its meta");
        }
        return ok_status();
    }

private:
    std::unique_ptr<hnswlib::InnerProductSpace> space_;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> index_;
};

} // namespace

std::unique_ptr<AnnBackend> make_hnsw_backend() {
    return std::make_unique<HnswBackend>();
}

} // namespace sift
