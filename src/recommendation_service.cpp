#include "recommendation_service.hpp"

namespace {

const std::vector<ProductRecord>& require_catalog(const ArtifactBundle& bundle) {
    const auto& table = bundle.catalog_table;
    if (!table.loaded()) {
        throw ArtifactError("product catalog " + std::string(status_name(table.status)) + ": " +
                            table.path + " (" + table.detail + ")");
    }
    return table.value;
}

} // namespace

RecommendationService::RecommendationService(const ArtifactBundle& bundle, int candidate_limit)
    : bundle_(bundle),
      catalog_(require_catalog(bundle)),
      resolver_(catalog_, bundle.similarity_map_ptr(), bundle.ann_index_ptr()),
      candidate_limit_(candidate_limit) {}

std::vector<ProductRecord> RecommendationService::find_candidates(const std::string& query) const {
    return catalog_.search(query, candidate_limit_);
}

std::vector<ProductRecord> RecommendationService::find_candidates(const std::string& query,
                                                                  int limit) const {
    return catalog_.search(query, limit);
}

std::vector<ProductRecord> RecommendationService::recommend(const std::string& id, int k) const {
    return recommend(id, k, nullptr);
}

std::vector<ProductRecord> RecommendationService::recommend(const std::string& id, int k,
                                                            RecommendationSource* source) const {
    SimilarResult similar = resolver_.resolve(id, k);
    if (source) {
        *source = similar.source;
    }

    std::vector<ProductRecord> records;
    records.reserve(similar.ids.size());
    for (const auto& neighbor_id : similar.ids) {
        const ProductRecord* record = catalog_.lookup(neighbor_id);
        if (record) {
            records.push_back(*record);
        } else {
            // Stale reference, label it with its id
            records.emplace_back(neighbor_id, catalog_.get_title(neighbor_id));
        }
    }
    return records;
}

SourceSummary RecommendationService::sources() const {
    SourceSummary summary;
    summary.catalog_size = catalog_.size();
    if (const SimilarityMap* map = bundle_.similarity_map_ptr()) {
        summary.similarity_map = true;
        summary.similarity_map_entries = map->size();
    }
    if (const ItemIndex* index = bundle_.ann_index_ptr()) {
        summary.ann_index = true;
        summary.ann_items = index->get_count();
    }
    summary.dimension = bundle_.embedding_dimension.value;
    return summary;
}
