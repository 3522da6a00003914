#include "similarity_resolver.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

const char* source_name(RecommendationSource source) {
    switch (source) {
        case RecommendationSource::SimilarityMap: return "similarity_map";
        case RecommendationSource::AnnIndex: return "ann_index";
        case RecommendationSource::None: break;
    }
    return "none";
}

SimilarityResolver::SimilarityResolver(const ProductCatalog& catalog,
                                       const SimilarityMap* similarity_map,
                                       ItemIndex* ann_index)
    : catalog_(catalog), similarity_map_(similarity_map), ann_index_(ann_index) {}

std::vector<std::string> SimilarityResolver::get_similar(const std::string& id, int k) const {
    return resolve(id, k).ids;
}

SimilarResult SimilarityResolver::resolve(const std::string& id, int k) const {
    if (k < 0) {
        throw std::invalid_argument("k must be non-negative, got: " + std::to_string(k));
    }

    SimilarResult result;
    if (k == 0) {
        return result;
    }

    if (similarity_map_) {
        auto it = similarity_map_->find(id);
        if (it != similarity_map_->end()) {
            const auto& neighbors = it->second;
            size_t n = std::min(static_cast<size_t>(k), neighbors.size());
            result.ids.assign(neighbors.begin(), neighbors.begin() + n);
            result.source = RecommendationSource::SimilarityMap;
            return result;
        }
    }

    return resolve_by_ann(id, k);
}

SimilarResult SimilarityResolver::resolve_by_ann(const std::string& id, int k) const {
    SimilarResult result;
    if (!ann_index_) {
        return result;
    }

    auto ordinal = catalog_.ordinal_of(id);
    if (!ordinal) {
        return result;
    }

    result.source = RecommendationSource::AnnIndex;

    // One extra slot: the query item is usually its own nearest neighbor
    const int request = k < std::numeric_limits<int>::max() ? k + 1 : k;
    std::vector<int> neighbors = ann_index_->neighbors_by_item(*ordinal, request);

    for (int neighbor : neighbors) {
        const std::string* neighbor_id = catalog_.id_at(neighbor);
        if (!neighbor_id || *neighbor_id == id) {
            continue;
        }
        result.ids.push_back(*neighbor_id);
        if (static_cast<int>(result.ids.size()) == k) {
            break;
        }
    }
    return result;
}
