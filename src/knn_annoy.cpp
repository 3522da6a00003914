#include "knn_annoy.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace {

// Annoy reports errors through a strdup'ed C string.
std::string take_annoy_error(char* err) {
    std::string message = err ? err : "unknown annoy error";
    std::free(err);
    return message;
}

} // namespace

std::unique_ptr<AnnoyItemIndex> AnnoyItemIndex::load(const std::string& index_path, int dim,
                                                     std::string* error) {
    if (dim <= 0) {
        if (error) *error = "invalid dimension " + std::to_string(dim);
        return nullptr;
    }

    std::error_code ec;
    if (!std::filesystem::exists(index_path, ec)) {
        if (error) *error = "index file does not exist: " + index_path;
        return nullptr;
    }

    std::unique_ptr<AnnoyItemIndex> index(new AnnoyItemIndex(dim));

    char* err = nullptr;
    if (!index->index_.load(index_path.c_str(), false, &err)) {
        std::string message = take_annoy_error(err);
        if (error) *error = "failed to load " + index_path + " (dim=" + std::to_string(dim) + "): " + message;
        return nullptr;
    }

    index->count_ = static_cast<size_t>(index->index_.get_n_items());
    return index;
}

std::vector<int> AnnoyItemIndex::neighbors_by_item(int ordinal, int n) {
    std::vector<int> result;
    if (n <= 0 || ordinal < 0 || static_cast<size_t>(ordinal) >= count_) {
        return result;
    }

    const size_t wanted = std::min(static_cast<size_t>(n), count_);
    index_.get_nns_by_item(ordinal, wanted, -1, &result, nullptr);
    return result;
}
