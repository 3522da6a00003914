#include "artifact_io.hpp"
#include "knn_annoy.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <sstream>

#include <zlib.h>

namespace {

const char* kIdColumn = "product_id";
const char* kTitleColumn = "title";
const char* kComponentsKey = "n_components";
const char* kReducerWrapperKeys[] = {"svd", "model"};

bool file_exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open " + path);
    }
    return nlohmann::json::parse(file);
}

// One JSON object per line; blank lines are skipped.
nlohmann::json read_json_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("failed to open " + path);
    }

    nlohmann::json rows = nlohmann::json::array();
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        line_no++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        try {
            rows.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": " + e.what());
        }
    }
    return rows;
}

// Ids are compared as strings; numeric ids are accepted and stringified.
std::string id_string(const nlohmann::json& value, const std::string& where) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    throw std::invalid_argument(where + ": product id must be a string or number");
}

std::string title_string(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : std::string();
}

ProductRecord make_record(const nlohmann::json& row, size_t ordinal, bool synthesize_id) {
    const std::string where = "row " + std::to_string(ordinal);
    if (!row.is_object()) {
        throw std::invalid_argument(where + ": expected an object");
    }

    ProductRecord record;
    auto id_it = row.find(kIdColumn);
    if (id_it != row.end()) {
        record.id = id_string(*id_it, where);
    } else if (synthesize_id) {
        record.id = std::to_string(ordinal);
    } else {
        throw std::invalid_argument(where + ": missing " + kIdColumn + " while other rows have one");
    }

    auto title_it = row.find(kTitleColumn);
    if (title_it != row.end()) {
        record.title = title_string(*title_it);
    } else {
        record.title = "Product " + std::to_string(ordinal);
    }

    for (auto it = row.begin(); it != row.end(); ++it) {
        if (it.key() != kIdColumn && it.key() != kTitleColumn) {
            record.attributes[it.key()] = it.value();
        }
    }
    return record;
}

std::vector<nlohmann::json> rows_of(const ColumnTable& table) {
    size_t row_count = 0;
    bool first = true;
    for (auto it = table.columns.begin(); it != table.columns.end(); ++it) {
        if (first) {
            row_count = it.value().size();
            first = false;
        } else if (it.value().size() != row_count) {
            throw std::invalid_argument("column '" + it.key() + "' has " +
                                        std::to_string(it.value().size()) + " values, expected " +
                                        std::to_string(row_count));
        }
    }

    std::vector<nlohmann::json> rows(row_count, nlohmann::json::object());
    for (auto it = table.columns.begin(); it != table.columns.end(); ++it) {
        for (size_t i = 0; i < row_count; i++) {
            rows[i][it.key()] = it.value()[i];
        }
    }
    return rows;
}

std::vector<nlohmann::json> rows_of(const RowRecords& records) {
    return std::vector<nlohmann::json>(records.rows.begin(), records.rows.end());
}

ArtifactResult<std::vector<ProductRecord>> load_catalog_document(const std::string& path,
                                                                 bool json_lines) {
    using Result = ArtifactResult<std::vector<ProductRecord>>;
    if (!file_exists(path)) {
        return Result::absent(path);
    }

    try {
        nlohmann::json doc = json_lines ? read_json_lines(path) : read_json_file(path);
        Result result;
        result.status = LoadStatus::Loaded;
        result.path = path;
        result.value = normalize_catalog(decode_catalog_document(doc));
        return result;
    } catch (const std::exception& e) {
        return Result::malformed(path, e.what());
    }
}

std::mutex& decompress_mutex() {
    static std::mutex m;
    return m;
}

struct GzCloser {
    void operator()(gzFile file) const { gzclose(file); }
};
using GzHandle = std::unique_ptr<gzFile_s, GzCloser>;

bool gunzip_file(const std::string& src, const std::string& dst, std::string* error) {
    GzHandle in(gzopen(src.c_str(), "rb"));
    if (!in) {
        *error = "failed to open " + src;
        return false;
    }

    std::ofstream out(dst, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        *error = "failed to create " + dst;
        return false;
    }

    std::vector<char> buffer(1 << 16);
    int n = 0;
    while ((n = gzread(in.get(), buffer.data(), static_cast<unsigned>(buffer.size()))) > 0) {
        out.write(buffer.data(), n);
        if (!out) {
            *error = "failed to write " + dst;
            return false;
        }
    }

    int errnum = Z_OK;
    const char* message = gzerror(in.get(), &errnum);
    if (n < 0 || (errnum != Z_OK && errnum != Z_STREAM_END)) {
        *error = "corrupt gzip stream in " + src + ": " + (message ? message : "unknown error");
        return false;
    }

    out.close();
    if (!out) {
        *error = "failed to flush " + dst;
        return false;
    }
    return true;
}

std::string temp_path_for(const std::string& path) {
    std::random_device rd;
    std::stringstream ss;
    ss << path << ".tmp." << std::hex << rd() << rd();
    return ss.str();
}

} // namespace

const char* status_name(LoadStatus status) {
    switch (status) {
        case LoadStatus::Loaded: return "loaded";
        case LoadStatus::Absent: return "absent";
        case LoadStatus::Malformed: return "malformed";
    }
    return "unknown";
}

std::string ArtifactConfig::path_of(const std::string& file) const {
    return (std::filesystem::path(base_dir) / file).string();
}

CatalogDocument decode_catalog_document(const nlohmann::json& doc) {
    if (doc.is_array()) {
        return RowRecords{doc};
    }
    if (doc.is_object()) {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (!it.value().is_array()) {
                throw std::invalid_argument("column '" + it.key() + "' is not an array");
            }
        }
        return ColumnTable{doc};
    }
    throw std::invalid_argument("catalog must be an array of rows or an object of columns");
}

std::vector<ProductRecord> normalize_catalog(const CatalogDocument& doc) {
    std::vector<nlohmann::json> rows = std::visit(
        [](const auto& shape) { return rows_of(shape); }, doc);

    // Ordinal ids only when no row carries an id; mixing them could collide.
    bool synthesize_id = std::none_of(rows.begin(), rows.end(), [](const nlohmann::json& row) {
        return row.is_object() && row.contains(kIdColumn);
    });

    std::vector<ProductRecord> records;
    records.reserve(rows.size());
    std::unordered_map<std::string, size_t> seen;
    for (size_t i = 0; i < rows.size(); i++) {
        ProductRecord record = make_record(rows[i], i, synthesize_id);
        auto inserted = seen.emplace(record.id, i);
        if (!inserted.second) {
            throw std::invalid_argument("duplicate product id '" + record.id + "' at rows " +
                                        std::to_string(inserted.first->second) + " and " +
                                        std::to_string(i));
        }
        records.push_back(std::move(record));
    }
    return records;
}

ReducerDocument decode_reducer_document(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("dimension hint must be a JSON object");
    }
    if (doc.contains(kComponentsKey)) {
        return BareReducer{doc};
    }
    for (const char* key : kReducerWrapperKeys) {
        auto it = doc.find(key);
        if (it != doc.end() && it->is_object()) {
            return WrappedReducer{key, *it};
        }
    }
    throw std::invalid_argument(std::string("dimension hint has no '") + kComponentsKey +
                                "' and no wrapped model");
}

int reducer_components(const ReducerDocument& doc) {
    const nlohmann::json& model = std::visit(
        [](const auto& shape) -> const nlohmann::json& { return shape.model; }, doc);

    auto it = model.find(kComponentsKey);
    if (it == model.end()) {
        throw std::invalid_argument(std::string("wrapped model has no '") + kComponentsKey + "'");
    }
    if (!it->is_number_integer() || it->get<long long>() <= 0 ||
        it->get<long long>() > 1000000) {
        throw std::invalid_argument(std::string("'") + kComponentsKey +
                                    "' must be a positive integer, got " + it->dump());
    }
    return it->get<int>();
}

ArtifactResult<std::vector<ProductRecord>> load_catalog_table(const std::string& path,
                                                              const std::string& fallback_path) {
    using Result = ArtifactResult<std::vector<ProductRecord>>;

    Result primary = load_catalog_document(path, false);
    if (primary.loaded()) {
        return primary;
    }

    Result fallback = load_catalog_document(fallback_path, true);
    if (fallback.loaded()) {
        if (primary.status == LoadStatus::Malformed) {
            LOG_WARN("Catalog " + path + " is malformed (" + primary.detail +
                     "), using " + fallback_path);
        }
        return fallback;
    }

    if (primary.status == LoadStatus::Malformed) {
        return primary;
    }
    if (fallback.status == LoadStatus::Malformed) {
        return fallback;
    }
    return Result::absent(path, "neither " + path + " nor " + fallback_path + " exists");
}

ArtifactResult<SimilarityMap> load_similarity_map(const std::string& path) {
    using Result = ArtifactResult<SimilarityMap>;
    if (!file_exists(path)) {
        return Result::absent(path);
    }

    try {
        nlohmann::json doc = read_json_file(path);
        if (!doc.is_object()) {
            return Result::malformed(path, "expected an object of id -> [ids]");
        }

        Result result;
        result.path = path;
        result.value.reserve(doc.size());
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (!it.value().is_array()) {
                return Result::malformed(path, "neighbors of '" + it.key() + "' are not an array");
            }
            std::vector<std::string> neighbors;
            neighbors.reserve(it.value().size());
            for (const auto& neighbor : it.value()) {
                neighbors.push_back(id_string(neighbor, "neighbors of '" + it.key() + "'"));
            }
            result.value.emplace(it.key(), std::move(neighbors));
        }
        result.status = LoadStatus::Loaded;
        return result;
    } catch (const std::exception& e) {
        return Result::malformed(path, e.what());
    }
}

ArtifactResult<int> resolve_embedding_dimension(const std::string& path, int default_dimension) {
    using Result = ArtifactResult<int>;
    Result result;
    if (!file_exists(path)) {
        result = Result::absent(path);
    } else {
        try {
            result.value = reducer_components(decode_reducer_document(read_json_file(path)));
            result.status = LoadStatus::Loaded;
            result.path = path;
            return result;
        } catch (const std::exception& e) {
            result = Result::malformed(path, e.what());
        }
    }
    result.value = default_dimension;
    return result;
}

DecompressStatus ensure_decompressed(const std::string& canonical_path,
                                     const std::string& compressed_path,
                                     std::string* error) {
    std::lock_guard<std::mutex> lk(decompress_mutex());

    if (file_exists(canonical_path)) {
        return DecompressStatus::AlreadyPresent;
    }
    if (!file_exists(compressed_path)) {
        return DecompressStatus::NoSource;
    }

    std::string message;
    const std::string temp_path = temp_path_for(canonical_path);
    if (!gunzip_file(compressed_path, temp_path, &message)) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        if (error) *error = message;
        return DecompressStatus::Failed;
    }

    // Another process may have won the race; the content is identical either way
    std::error_code ec;
    std::filesystem::rename(temp_path, canonical_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        if (error) *error = "failed to move " + temp_path + " into place: " + ec.message();
        return DecompressStatus::Failed;
    }
    return DecompressStatus::Decompressed;
}

ArtifactResult<std::unique_ptr<ItemIndex>> load_ann_index(const std::string& canonical_path,
                                                          const std::string& compressed_path,
                                                          int dim,
                                                          size_t expected_count) {
    using Result = ArtifactResult<std::unique_ptr<ItemIndex>>;

    std::string error;
    DecompressStatus decompress = ensure_decompressed(canonical_path, compressed_path, &error);
    switch (decompress) {
        case DecompressStatus::NoSource:
            return Result::absent(canonical_path,
                                  "neither " + canonical_path + " nor " + compressed_path + " exists");
        case DecompressStatus::Failed:
            return Result::malformed(compressed_path, error);
        case DecompressStatus::Decompressed:
            LOG_INFO("Decompressed " + compressed_path + " -> " + canonical_path);
            break;
        case DecompressStatus::AlreadyPresent:
            LOG_DEBUG("Using existing index " + canonical_path);
            break;
    }

    std::unique_ptr<AnnoyItemIndex> index = AnnoyItemIndex::load(canonical_path, dim, &error);
    if (!index) {
        return Result::malformed(canonical_path, error);
    }
    if (index->get_count() != expected_count) {
        return Result::malformed(canonical_path,
                                 "index holds " + std::to_string(index->get_count()) +
                                 " items but the catalog has " + std::to_string(expected_count));
    }

    Result result;
    result.status = LoadStatus::Loaded;
    result.path = canonical_path;
    result.value = std::move(index);
    return result;
}

namespace {

template <typename T>
void log_artifact(const std::string& name, const ArtifactResult<T>& result) {
    switch (result.status) {
        case LoadStatus::Loaded:
            LOG_INFO("Loaded " + name + " from " + result.path);
            break;
        case LoadStatus::Absent:
            LOG_WARN(name + " absent: " + result.detail);
            break;
        case LoadStatus::Malformed:
            LOG_WARN(name + " malformed, ignoring " + result.path + ": " + result.detail);
            break;
    }
}

} // namespace

ArtifactBundle load_artifacts(const ArtifactConfig& config) {
    ArtifactBundle bundle;

    bundle.catalog_table = load_catalog_table(config.path_of(config.catalog_file),
                                              config.path_of(config.catalog_fallback_file));
    if (bundle.catalog_table.status == LoadStatus::Loaded) {
        LOG_INFO("Loaded catalog from " + bundle.catalog_table.path + ": " +
                 std::to_string(bundle.catalog_table.value.size()) + " products");
    } else {
        LOG_ERROR("Catalog " + std::string(status_name(bundle.catalog_table.status)) + ": " +
                  bundle.catalog_table.detail);
    }

    bundle.similarity_map = load_similarity_map(config.path_of(config.similarity_map_file));
    log_artifact("similarity map", bundle.similarity_map);

    bundle.embedding_dimension = resolve_embedding_dimension(
        config.path_of(config.dimension_hint_file), config.default_dimension);
    if (!bundle.embedding_dimension.loaded()) {
        log_artifact("dimension hint", bundle.embedding_dimension);
        LOG_INFO("Using default embedding dimension " + std::to_string(config.default_dimension));
    } else {
        LOG_INFO("Embedding dimension " + std::to_string(bundle.embedding_dimension.value) +
                 " from " + bundle.embedding_dimension.path);
    }

    const std::string ann_path = config.path_of(config.ann_index_file);
    if (bundle.has_catalog()) {
        bundle.ann_index = load_ann_index(ann_path,
                                          config.path_of(config.compressed_ann_index_file()),
                                          bundle.embedding_dimension.value,
                                          bundle.catalog_table.value.size());
    } else {
        bundle.ann_index = ArtifactResult<std::unique_ptr<ItemIndex>>::absent(
            ann_path, "skipped, no catalog to address it");
    }
    log_artifact("ANN index", bundle.ann_index);

    return bundle;
}
