#pragma once

#include "catalog.hpp"
#include "item_index.hpp"
#include "similarity_resolver.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

// Raised when an artifact the service cannot run without is unusable.
class ArtifactError : public std::runtime_error {
public:
    explicit ArtifactError(const std::string& message) : std::runtime_error(message) {}
};

enum class LoadStatus { Loaded, Absent, Malformed };

const char* status_name(LoadStatus status);

template <typename T>
struct ArtifactResult {
    LoadStatus status = LoadStatus::Absent;
    T value{};
    std::string path;     // file the value came from, or the file looked for
    std::string detail;   // diagnostic for Absent / Malformed

    bool loaded() const { return status == LoadStatus::Loaded; }

    static ArtifactResult absent(const std::string& path, const std::string& detail = "not found") {
        ArtifactResult r;
        r.status = LoadStatus::Absent;
        r.path = path;
        r.detail = detail;
        return r;
    }

    static ArtifactResult malformed(const std::string& path, const std::string& detail) {
        ArtifactResult r;
        r.status = LoadStatus::Malformed;
        r.path = path;
        r.detail = detail;
        return r;
    }
};

struct ArtifactConfig {
    std::string base_dir = "models";
    std::string catalog_file = "product_meta_small.json";
    std::string catalog_fallback_file = "product_meta_small.jsonl";
    std::string similarity_map_file = "similarity_map_small.json";
    std::string dimension_hint_file = "svd_model_small.json";
    std::string ann_index_file = "annoy_index_small.ann";

    // Used when the dimension hint is missing or unreadable.
    int default_dimension = 32;

    std::string path_of(const std::string& file) const;
    std::string compressed_ann_index_file() const { return ann_index_file + ".gz"; }
};

// Accepted on-disk catalog layouts.
struct ColumnTable {
    nlohmann::json columns;   // {"col": [v0, v1, ...], ...}
};
struct RowRecords {
    nlohmann::json rows;      // [{"col": v, ...}, ...]
};
using CatalogDocument = std::variant<ColumnTable, RowRecords>;

// Accepted dimension hint layouts.
struct BareReducer {
    nlohmann::json model;     // {"n_components": 32, ...}
};
struct WrappedReducer {
    std::string key;
    nlohmann::json model;     // {"svd": {"n_components": 32, ...}}
};
using ReducerDocument = std::variant<BareReducer, WrappedReducer>;

// Throws std::invalid_argument for shapes that are neither layout.
CatalogDocument decode_catalog_document(const nlohmann::json& doc);
ReducerDocument decode_reducer_document(const nlohmann::json& doc);

// Normalizes a decoded catalog into records. Ids are synthesized from the row
// ordinal only when no row has a product_id; titles are synthesized per row.
// Throws std::invalid_argument on bad rows, rows missing an id that other
// rows carry, or duplicate ids.
std::vector<ProductRecord> normalize_catalog(const CatalogDocument& doc);

// Component count of a decoded hint. Throws std::invalid_argument when it
// is missing or not a positive integer.
int reducer_components(const ReducerDocument& doc);

// Primary JSON table, falling back to a JSON Lines file.
ArtifactResult<std::vector<ProductRecord>> load_catalog_table(const std::string& path,
                                                              const std::string& fallback_path);

ArtifactResult<SimilarityMap> load_similarity_map(const std::string& path);

// On any status but Loaded the value is default_dimension.
ArtifactResult<int> resolve_embedding_dimension(const std::string& path, int default_dimension);

enum class DecompressStatus { AlreadyPresent, Decompressed, NoSource, Failed };

// Gunzips compressed_path into canonical_path unless canonical_path exists.
// Writes to a temporary file and renames it into place; serialized within
// the process. On Failed, `error` holds the reason.
DecompressStatus ensure_decompressed(const std::string& canonical_path,
                                     const std::string& compressed_path,
                                     std::string* error = nullptr);

// Loads the Annoy index, decompressing it first when only the .gz exists.
// An index whose item count differs from expected_count is Malformed.
ArtifactResult<std::unique_ptr<ItemIndex>> load_ann_index(const std::string& canonical_path,
                                                          const std::string& compressed_path,
                                                          int dim,
                                                          size_t expected_count);

// Everything loaded from one artifact directory. Owns the loaded objects;
// the catalog and resolver built over it hold references.
struct ArtifactBundle {
    ArtifactResult<std::vector<ProductRecord>> catalog_table;
    ArtifactResult<SimilarityMap> similarity_map;
    ArtifactResult<int> embedding_dimension;
    ArtifactResult<std::unique_ptr<ItemIndex>> ann_index;

    bool has_catalog() const { return catalog_table.loaded(); }
    const SimilarityMap* similarity_map_ptr() const {
        return similarity_map.loaded() ? &similarity_map.value : nullptr;
    }
    ItemIndex* ann_index_ptr() const {
        return ann_index.loaded() ? ann_index.value.get() : nullptr;
    }
};

// Loads every artifact, isolating failures per artifact. Never throws for
// missing or malformed files; callers check has_catalog().
ArtifactBundle load_artifacts(const ArtifactConfig& config);
