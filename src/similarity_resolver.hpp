#pragma once

#include "catalog.hpp"
#include "item_index.hpp"
#include <string>
#include <unordered_map>
#include <vector>

// id -> neighbor ids, most similar first, self already excluded.
using SimilarityMap = std::unordered_map<std::string, std::vector<std::string>>;

enum class RecommendationSource { None, SimilarityMap, AnnIndex };

const char* source_name(RecommendationSource source);

struct SimilarResult {
    std::vector<std::string> ids;
    RecommendationSource source = RecommendationSource::None;
};

// SimilarityResolver - neighbor ids for a product, preferring the exact
// precomputed map and falling back to the ANN index.
// Holds non-owning pointers; either source may be null.
class SimilarityResolver {
public:
    SimilarityResolver(const ProductCatalog& catalog,
                       const SimilarityMap* similarity_map,
                       ItemIndex* ann_index);

    // Up to k ids, never `id` itself. Throws std::invalid_argument if k < 0.
    std::vector<std::string> get_similar(const std::string& id, int k) const;

    // Same as get_similar, also reporting which source answered.
    SimilarResult resolve(const std::string& id, int k) const;

    bool has_similarity_map() const { return similarity_map_ != nullptr; }
    bool has_ann_index() const { return ann_index_ != nullptr; }

private:
    SimilarResult resolve_by_ann(const std::string& id, int k) const;

    const ProductCatalog& catalog_;
    const SimilarityMap* similarity_map_;
    ItemIndex* ann_index_;
};
