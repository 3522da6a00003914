// =============================================================================
// Artifact loading tests
// =============================================================================

#include <gtest/gtest.h>
#include <thread>
#include "artifact_io.hpp"
#include "test_helpers.hpp"

class ArtifactIoTest : public ::testing::Test {
protected:
    TempDir dir_;

    ArtifactConfig config() const {
        ArtifactConfig c;
        c.base_dir = dir_.str();
        return c;
    }

    // Three items, 4-dimensional, matching shoe_catalog()'s order.
    void write_index(const std::string& name) const {
        build_annoy_index(dir_.file(name),
                          {{1.0f, 0.0f, 0.0f, 0.0f},
                           {0.0f, 1.0f, 0.0f, 0.0f},
                           {0.9f, 0.1f, 0.0f, 0.0f}},
                          4);
    }
};

// -----------------------------------------------------------------------------
// Catalog table
// -----------------------------------------------------------------------------

TEST_F(ArtifactIoTest, CatalogFromColumns) {
    write_file(dir_.file("meta.json"), R"({
        "product_id": ["A", "B", "C"],
        "title": ["Red Shoe", "Blue Shoe", "Red Hat"],
        "image_url": ["a.png", null, "c.png"]
    })");

    auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
    ASSERT_EQ(result.status, LoadStatus::Loaded) << result.detail;
    ASSERT_EQ(result.value.size(), 3u);
    EXPECT_EQ(result.value[0].id, "A");
    EXPECT_EQ(result.value[2].title, "Red Hat");
    EXPECT_EQ(result.value[0].attributes["image_url"], "a.png");
    EXPECT_TRUE(result.value[1].attributes["image_url"].is_null());
    EXPECT_FALSE(result.value[0].attributes.contains("title"));
}

TEST_F(ArtifactIoTest, CatalogFromRows) {
    write_file(dir_.file("meta.json"), R"([
        {"product_id": 101, "title": "Desk Lamp", "brand": "Lumo"},
        {"product_id": "B2", "title": null}
    ])");

    auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
    ASSERT_EQ(result.status, LoadStatus::Loaded) << result.detail;
    ASSERT_EQ(result.value.size(), 2u);
    EXPECT_EQ(result.value[0].id, "101");
    EXPECT_EQ(result.value[0].attributes["brand"], "Lumo");
    EXPECT_EQ(result.value[1].id, "B2");
    EXPECT_EQ(result.value[1].title, "");
}

TEST_F(ArtifactIoTest, CatalogSynthesizesMissingColumns) {
    write_file(dir_.file("meta.json"), R"({"price": [1.5, 2.5]})");

    auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
    ASSERT_EQ(result.status, LoadStatus::Loaded) << result.detail;
    ASSERT_EQ(result.value.size(), 2u);
    EXPECT_EQ(result.value[0].id, "0");
    EXPECT_EQ(result.value[1].id, "1");
    EXPECT_EQ(result.value[0].title, "Product 0");
    EXPECT_EQ(result.value[1].title, "Product 1");
}

TEST_F(ArtifactIoTest, CatalogRejectsPartlyMissingIds) {
    // An ordinal id for row 1 would collide with the explicit id 1 in row 0
    write_file(dir_.file("meta.jsonl"),
               "{\"product_id\": 1, \"title\": \"Desk Lamp\"}\n"
               "{\"title\": \"Floor Lamp\"}\n");

    auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
    ASSERT_EQ(result.status, LoadStatus::Malformed);
    EXPECT_NE(result.detail.find("row 1"), std::string::npos) << result.detail;
    EXPECT_NE(result.detail.find("product_id"), std::string::npos) << result.detail;
}

TEST_F(ArtifactIoTest, CatalogSynthesizesIdsForEveryRowWithoutOne) {
    write_file(dir_.file("meta.jsonl"),
               "{\"title\": \"Desk Lamp\"}\n"
               "{\"title\": \"Floor Lamp\"}\n");

    auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
    ASSERT_EQ(result.status, LoadStatus::Loaded) << result.detail;
    ASSERT_EQ(result.value.size(), 2u);
    EXPECT_EQ(result.value[0].id, "0");
    EXPECT_EQ(result.value[1].id, "1");
}

TEST_F(ArtifactIoTest, CatalogFallsBackToJsonLines) {
    write_file(dir_.file("meta.jsonl"),
               "{\"product_id\": \"A\", \"title\": \"Red Shoe\"}\n"
               "\n"
               "{\"product_id\": \"B\", \"title\": \"Blue Shoe\"}\n");

    auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
    ASSERT_EQ(result.status, LoadStatus::Loaded) << result.detail;
    EXPECT_EQ(result.path, dir_.file("meta.jsonl"));
    ASSERT_EQ(result.value.size(), 2u);
    EXPECT_EQ(result.value[1].title, "Blue Shoe");
}

TEST_F(ArtifactIoTest, MalformedPrimaryUsesFallback) {
    write_file(dir_.file("meta.json"), "{not json");
    write_file(dir_.file("meta.jsonl"), "{\"product_id\": \"A\", \"title\": \"Red Shoe\"}\n");

    auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
    ASSERT_EQ(result.status, LoadStatus::Loaded);
    EXPECT_EQ(result.value.size(), 1u);
}

TEST_F(ArtifactIoTest, CatalogAbsentWhenNeitherFileExists) {
    auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
    EXPECT_EQ(result.status, LoadStatus::Absent);
    EXPECT_NE(result.detail.find("meta.jsonl"), std::string::npos);
}

TEST_F(ArtifactIoTest, CatalogMalformedShapes) {
    const char* bad[] = {
        R"("just a string")",
        R"({"product_id": ["A", "B"], "title": ["only one"]})",
        R"({"product_id": "A"})",
        R"([{"product_id": "A"}, 7])",
        R"([{"product_id": "A", "title": "x"}, {"product_id": "A", "title": "y"}])",
        R"([{"product_id": {"nested": true}, "title": "x"}])",
    };
    for (const char* doc : bad) {
        write_file(dir_.file("meta.json"), doc);
        auto result = load_catalog_table(dir_.file("meta.json"), dir_.file("meta.jsonl"));
        EXPECT_EQ(result.status, LoadStatus::Malformed) << doc;
        EXPECT_FALSE(result.detail.empty());
    }
}

TEST_F(ArtifactIoTest, DecodeCatalogDocumentTagsShape) {
    auto rows = decode_catalog_document(nlohmann::json::array());
    EXPECT_TRUE(std::holds_alternative<RowRecords>(rows));

    auto columns = decode_catalog_document(nlohmann::json::parse(R"({"title": []})"));
    EXPECT_TRUE(std::holds_alternative<ColumnTable>(columns));

    EXPECT_THROW(decode_catalog_document(nlohmann::json(3)), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// Similarity map
// -----------------------------------------------------------------------------

TEST_F(ArtifactIoTest, SimilarityMapLoads) {
    write_file(dir_.file("sim.json"), R"({"A": ["C", "B"], "B": [1, 2], "C": []})");

    auto result = load_similarity_map(dir_.file("sim.json"));
    ASSERT_EQ(result.status, LoadStatus::Loaded) << result.detail;
    EXPECT_EQ(result.value.at("A"), (std::vector<std::string>{"C", "B"}));
    EXPECT_EQ(result.value.at("B"), (std::vector<std::string>{"1", "2"}));
    EXPECT_TRUE(result.value.at("C").empty());
}

TEST_F(ArtifactIoTest, SimilarityMapAbsentAndMalformed) {
    EXPECT_EQ(load_similarity_map(dir_.file("sim.json")).status, LoadStatus::Absent);

    write_file(dir_.file("sim.json"), R"(["A", "B"])");
    EXPECT_EQ(load_similarity_map(dir_.file("sim.json")).status, LoadStatus::Malformed);

    write_file(dir_.file("sim.json"), R"({"A": "B"})");
    EXPECT_EQ(load_similarity_map(dir_.file("sim.json")).status, LoadStatus::Malformed);

    write_file(dir_.file("sim.json"), "\x80\x04garbage");
    EXPECT_EQ(load_similarity_map(dir_.file("sim.json")).status, LoadStatus::Malformed);
}

// -----------------------------------------------------------------------------
// Embedding dimension
// -----------------------------------------------------------------------------

TEST_F(ArtifactIoTest, DimensionFromBareModel) {
    write_file(dir_.file("svd.json"), R"({"n_components": 48, "algorithm": "randomized"})");
    auto result = resolve_embedding_dimension(dir_.file("svd.json"), 32);
    EXPECT_EQ(result.status, LoadStatus::Loaded);
    EXPECT_EQ(result.value, 48);
}

TEST_F(ArtifactIoTest, DimensionFromWrappedModel) {
    write_file(dir_.file("svd.json"), R"({"svd": {"n_components": 16}, "fitted_on": "2024-01-01"})");
    auto result = resolve_embedding_dimension(dir_.file("svd.json"), 32);
    EXPECT_EQ(result.status, LoadStatus::Loaded);
    EXPECT_EQ(result.value, 16);

    write_file(dir_.file("svd.json"), R"({"model": {"n_components": 24}})");
    EXPECT_EQ(resolve_embedding_dimension(dir_.file("svd.json"), 32).value, 24);

    auto decoded = decode_reducer_document(nlohmann::json::parse(R"({"model": {"n_components": 8}})"));
    ASSERT_TRUE(std::holds_alternative<WrappedReducer>(decoded));
    EXPECT_EQ(std::get<WrappedReducer>(decoded).key, "model");
}

TEST_F(ArtifactIoTest, DimensionFallsBackToDefault) {
    auto missing = resolve_embedding_dimension(dir_.file("svd.json"), 32);
    EXPECT_EQ(missing.status, LoadStatus::Absent);
    EXPECT_EQ(missing.value, 32);

    const char* bad[] = {
        R"({"n_components": 0})",
        R"({"n_components": "32"})",
        R"({"n_components": 12.5})",
        R"({"svd": {"components": 12}})",
        R"({"other": 1})",
        R"([32])",
        "not json",
    };
    for (const char* doc : bad) {
        write_file(dir_.file("svd.json"), doc);
        auto result = resolve_embedding_dimension(dir_.file("svd.json"), 64);
        EXPECT_EQ(result.status, LoadStatus::Malformed) << doc;
        EXPECT_EQ(result.value, 64) << doc;
    }
}

// -----------------------------------------------------------------------------
// ANN index and decompression
// -----------------------------------------------------------------------------

TEST_F(ArtifactIoTest, DecompressionIsIdempotent) {
    write_index("source.ann");
    gzip_file(dir_.file("source.ann"), dir_.file("items.ann.gz"));

    const std::string canonical = dir_.file("items.ann");
    std::string error;
    EXPECT_EQ(ensure_decompressed(canonical, canonical + ".gz", &error), DecompressStatus::Decompressed)
        << error;
    const std::string first = read_file(canonical);
    EXPECT_EQ(first, read_file(dir_.file("source.ann")));

    EXPECT_EQ(ensure_decompressed(canonical, canonical + ".gz", &error), DecompressStatus::AlreadyPresent);
    EXPECT_EQ(read_file(canonical), first);

    // No temporary files left behind
    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir_.str())) {
        (void)entry;
        entries++;
    }
    EXPECT_EQ(entries, 3u);
}

TEST_F(ArtifactIoTest, ConcurrentDecompressionWritesOnce) {
    write_index("source.ann");
    gzip_file(dir_.file("source.ann"), dir_.file("items.ann.gz"));

    const std::string canonical = dir_.file("items.ann");
    DecompressStatus statuses[2];
    std::string errors[2];
    std::thread first([&] { statuses[0] = ensure_decompressed(canonical, canonical + ".gz", &errors[0]); });
    std::thread second([&] { statuses[1] = ensure_decompressed(canonical, canonical + ".gz", &errors[1]); });
    first.join();
    second.join();

    int decompressed = 0;
    int present = 0;
    for (int i = 0; i < 2; i++) {
        if (statuses[i] == DecompressStatus::Decompressed) decompressed++;
        if (statuses[i] == DecompressStatus::AlreadyPresent) present++;
    }
    EXPECT_EQ(decompressed, 1) << errors[0] << errors[1];
    EXPECT_EQ(present, 1);
    EXPECT_EQ(read_file(canonical), read_file(dir_.file("source.ann")));

    for (const auto& entry : std::filesystem::directory_iterator(dir_.str())) {
        EXPECT_EQ(entry.path().filename().string().find(".tmp."), std::string::npos)
            << entry.path();
    }
}

TEST_F(ArtifactIoTest, DecompressionWithoutSource) {
    EXPECT_EQ(ensure_decompressed(dir_.file("items.ann"), dir_.file("items.ann.gz")),
              DecompressStatus::NoSource);
    EXPECT_FALSE(std::filesystem::exists(dir_.file("items.ann")));
}

TEST_F(ArtifactIoTest, CorruptGzipFailsCleanly) {
    write_index("source.ann");
    gzip_file(dir_.file("source.ann"), dir_.file("full.gz"));
    std::string gz = read_file(dir_.file("full.gz"));
    write_file(dir_.file("items.ann.gz"), gz.substr(0, gz.size() / 2));

    std::string error;
    EXPECT_EQ(ensure_decompressed(dir_.file("items.ann"), dir_.file("items.ann.gz"), &error),
              DecompressStatus::Failed);
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(std::filesystem::exists(dir_.file("items.ann")));
}

TEST_F(ArtifactIoTest, AnnLoadsTwiceFromCompressedSource) {
    write_index("source.ann");
    gzip_file(dir_.file("source.ann"), dir_.file("items.ann.gz"));
    const std::string canonical = dir_.file("items.ann");

    auto first = load_ann_index(canonical, canonical + ".gz", 4, 3);
    ASSERT_EQ(first.status, LoadStatus::Loaded) << first.detail;
    EXPECT_EQ(first.value->get_count(), 3u);
    const std::string bytes = read_file(canonical);

    auto second = load_ann_index(canonical, canonical + ".gz", 4, 3);
    ASSERT_EQ(second.status, LoadStatus::Loaded) << second.detail;
    EXPECT_EQ(read_file(canonical), bytes);

    std::vector<int> neighbors = second.value->neighbors_by_item(0, 2);
    ASSERT_EQ(neighbors.size(), 2u);
    EXPECT_EQ(neighbors[0], 0);
    EXPECT_EQ(neighbors[1], 2);
}

TEST_F(ArtifactIoTest, AnnAbsentAndMismatched) {
    const std::string canonical = dir_.file("items.ann");
    EXPECT_EQ(load_ann_index(canonical, canonical + ".gz", 4, 3).status, LoadStatus::Absent);

    write_index("items.ann");
    auto wrong_count = load_ann_index(canonical, canonical + ".gz", 4, 5);
    EXPECT_EQ(wrong_count.status, LoadStatus::Malformed);
    EXPECT_EQ(wrong_count.value, nullptr);

    write_file(canonical, "definitely not an annoy index");
    EXPECT_EQ(load_ann_index(canonical, canonical + ".gz", 4, 3).status, LoadStatus::Malformed);
}

// -----------------------------------------------------------------------------
// Whole bundle
// -----------------------------------------------------------------------------

TEST_F(ArtifactIoTest, BundleWithEveryArtifact) {
    ArtifactConfig c = config();
    write_file(dir_.file(c.catalog_file), R"([
        {"product_id": "A", "title": "Red Shoe"},
        {"product_id": "B", "title": "Blue Shoe"},
        {"product_id": "C", "title": "Red Hat"}
    ])");
    write_file(dir_.file(c.similarity_map_file), R"({"A": ["C", "B"]})");
    write_file(dir_.file(c.dimension_hint_file), R"({"svd": {"n_components": 4}})");
    write_index("source.ann");
    gzip_file(dir_.file("source.ann"), dir_.file(c.compressed_ann_index_file()));

    ArtifactBundle bundle = load_artifacts(c);
    EXPECT_TRUE(bundle.has_catalog());
    EXPECT_NE(bundle.similarity_map_ptr(), nullptr);
    EXPECT_EQ(bundle.embedding_dimension.value, 4);
    ASSERT_NE(bundle.ann_index_ptr(), nullptr);
    EXPECT_EQ(bundle.ann_index_ptr()->get_dim(), 4);
    EXPECT_TRUE(std::filesystem::exists(dir_.file(c.ann_index_file)));
}

TEST_F(ArtifactIoTest, BundleIsolatesBrokenOptionalArtifacts) {
    ArtifactConfig c = config();
    write_file(dir_.file(c.catalog_file), R"({"product_id": ["A"], "title": ["Red Shoe"]})");
    write_file(dir_.file(c.similarity_map_file), "[[[");
    write_file(dir_.file(c.dimension_hint_file), R"({"n_components": -3})");

    ArtifactBundle bundle = load_artifacts(c);
    EXPECT_TRUE(bundle.has_catalog());
    EXPECT_EQ(bundle.similarity_map.status, LoadStatus::Malformed);
    EXPECT_EQ(bundle.similarity_map_ptr(), nullptr);
    EXPECT_EQ(bundle.embedding_dimension.status, LoadStatus::Malformed);
    EXPECT_EQ(bundle.embedding_dimension.value, c.default_dimension);
    EXPECT_EQ(bundle.ann_index.status, LoadStatus::Absent);
    EXPECT_EQ(bundle.ann_index_ptr(), nullptr);
}

TEST_F(ArtifactIoTest, BundleWithoutCatalog) {
    ArtifactConfig c = config();
    write_file(dir_.file(c.similarity_map_file), R"({"A": ["B"]})");

    ArtifactBundle bundle = load_artifacts(c);
    EXPECT_FALSE(bundle.has_catalog());
    EXPECT_EQ(bundle.catalog_table.status, LoadStatus::Absent);
    EXPECT_TRUE(bundle.similarity_map.loaded());
}
