#pragma once

#include "artifact_io.hpp"
#include "catalog.hpp"
#include "similarity_resolver.hpp"
#include <string>
#include <vector>

// Summary of the recommendation sources a service runs with.
struct SourceSummary {
    size_t catalog_size = 0;
    bool similarity_map = false;
    size_t similarity_map_entries = 0;
    bool ann_index = false;
    size_t ann_items = 0;
    int dimension = 0;
};

// RecommendationService - composes the catalog and the resolver over a
// loaded artifact bundle. The bundle must outlive the service.
class RecommendationService {
public:
    // Throws ArtifactError naming the catalog file when the bundle has none.
    explicit RecommendationService(const ArtifactBundle& bundle, int candidate_limit = 30);

    // Products matching the query; an empty query gives the head of the catalog.
    std::vector<ProductRecord> find_candidates(const std::string& query) const;
    std::vector<ProductRecord> find_candidates(const std::string& query, int limit) const;

    // Similar products, resolved to catalog records. Ids unknown to the
    // catalog come back as {id, id}.
    std::vector<ProductRecord> recommend(const std::string& id, int k) const;

    // recommend() plus the source that answered.
    std::vector<ProductRecord> recommend(const std::string& id, int k,
                                         RecommendationSource* source) const;

    std::string title_of(const std::string& id) const { return catalog_.get_title(id); }

    const ProductCatalog& catalog() const { return catalog_; }
    const SimilarityResolver& resolver() const { return resolver_; }
    SourceSummary sources() const;
    int candidate_limit() const { return candidate_limit_; }

private:
    const ArtifactBundle& bundle_;
    ProductCatalog catalog_;
    SimilarityResolver resolver_;
    int candidate_limit_;
};
