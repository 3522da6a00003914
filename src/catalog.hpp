#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

struct ProductRecord {
    std::string id;
    std::string title;
    nlohmann::json attributes = nlohmann::json::object();  // every other column, untouched

    ProductRecord() = default;
    ProductRecord(std::string id, std::string title)
        : id(std::move(id)), title(std::move(title)) {}
};

// ProductCatalog - id and text-search access over a loaded product table.
// The catalog does not own the records; the table must outlive it.
// Row order is the ordinal order the embedding index was built with.
class ProductCatalog {
public:
    // Throws std::invalid_argument if two records share an id.
    explicit ProductCatalog(const std::vector<ProductRecord>& records);
    ProductCatalog(std::vector<ProductRecord>&&) = delete;

    // Stored title, or the id itself when the id is unknown or untitled.
    // Never empty.
    std::string get_title(const std::string& id) const;

    // nullptr when the id is unknown.
    const ProductRecord* lookup(const std::string& id) const;

    // Case-insensitive substring match on titles, in catalog order, at most
    // `limit` records. An empty query returns the first `limit` records.
    std::vector<ProductRecord> search(const std::string& query, int limit) const;

    std::optional<int> ordinal_of(const std::string& id) const;

    // Reverse of ordinal_of. nullptr when out of range.
    const std::string* id_at(int ordinal) const;

    size_t size() const { return records_.size(); }
    const std::vector<ProductRecord>& records() const { return records_; }

private:
    const std::vector<ProductRecord>& records_;
    std::unordered_map<std::string, int> id_to_ordinal_;
    std::vector<std::string> folded_titles_;
};

// ASCII lower-casing used for title matching.
std::string fold_case(const std::string& text);
