#include "catalog.hpp"
#include <cctype>
#include <stdexcept>

namespace {

const char* kUnknownProductLabel = "(unknown product)";

} // namespace

std::string fold_case(const std::string& text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

ProductCatalog::ProductCatalog(const std::vector<ProductRecord>& records)
    : records_(records) {
    id_to_ordinal_.reserve(records_.size());
    folded_titles_.reserve(records_.size());

    for (size_t i = 0; i < records_.size(); i++) {
        const auto& record = records_[i];
        if (!id_to_ordinal_.emplace(record.id, static_cast<int>(i)).second) {
            throw std::invalid_argument("duplicate product id in catalog: " + record.id);
        }
        folded_titles_.push_back(fold_case(record.title));
    }
}

std::string ProductCatalog::get_title(const std::string& id) const {
    const ProductRecord* record = lookup(id);
    if (record && !record->title.empty()) {
        return record->title;
    }
    return id.empty() ? std::string(kUnknownProductLabel) : id;
}

const ProductRecord* ProductCatalog::lookup(const std::string& id) const {
    auto it = id_to_ordinal_.find(id);
    if (it == id_to_ordinal_.end()) {
        return nullptr;
    }
    return &records_[static_cast<size_t>(it->second)];
}

std::vector<ProductRecord> ProductCatalog::search(const std::string& query, int limit) const {
    if (limit < 0) {
        throw std::invalid_argument("search limit must be non-negative, got: " + std::to_string(limit));
    }

    std::vector<ProductRecord> results;
    const size_t max_results = static_cast<size_t>(limit);

    // No query yet: head of the catalog
    if (query.empty()) {
        for (size_t i = 0; i < records_.size() && results.size() < max_results; i++) {
            results.push_back(records_[i]);
        }
        return results;
    }

    const std::string needle = fold_case(query);
    for (size_t i = 0; i < records_.size() && results.size() < max_results; i++) {
        const auto& title = folded_titles_[i];
        if (!title.empty() && title.find(needle) != std::string::npos) {
            results.push_back(records_[i]);
        }
    }
    return results;
}

std::optional<int> ProductCatalog::ordinal_of(const std::string& id) const {
    auto it = id_to_ordinal_.find(id);
    if (it == id_to_ordinal_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::string* ProductCatalog::id_at(int ordinal) const {
    if (ordinal < 0 || static_cast<size_t>(ordinal) >= records_.size()) {
        return nullptr;
    }
    return &records_[static_cast<size_t>(ordinal)].id;
}
