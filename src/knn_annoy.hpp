#pragma once

#include "item_index.hpp"
#include <memory>
#include <string>

#include <annoylib.h>
#include <kissrandom.h>

// AnnoyItemIndex - approximate nearest neighbor backend over a pre-built
// Annoy index file (angular metric).
class AnnoyItemIndex : public ItemIndex {
public:
    using Index = Annoy::AnnoyIndex<int, float, Annoy::Angular, Annoy::Kiss32Random,
                                    Annoy::AnnoyIndexSingleThreadedBuildPolicy>;

    // Memory-maps the index at index_path. `dim` must match the dimension the
    // index was built with. Returns nullptr and fills `error` on failure.
    static std::unique_ptr<AnnoyItemIndex> load(const std::string& index_path, int dim,
                                                std::string* error);

    std::vector<int> neighbors_by_item(int ordinal, int n) override;
    size_t get_count() const override { return count_; }
    int get_dim() const override { return dim_; }
    std::string get_backend_name() const override { return "annoy"; }

private:
    explicit AnnoyItemIndex(int dim) : index_(dim), dim_(dim) {}

    Index index_;
    int dim_ = 0;
    size_t count_ = 0;
};
