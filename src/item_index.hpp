#pragma once

#include <cstddef>
#include <string>
#include <vector>

// Abstract nearest-neighbor backend addressed by item ordinal.
// Ordinals are the row positions of the catalog the index was built from.
class ItemIndex {
public:
    virtual ~ItemIndex() = default;

    // Up to n ordinals nearest to the item at `ordinal`, closest first.
    // The item itself is normally part of the result.
    virtual std::vector<int> neighbors_by_item(int ordinal, int n) = 0;
    virtual size_t get_count() const = 0;
    virtual int get_dim() const = 0;
    virtual std::string get_backend_name() const = 0;
};
