#include <gtest/gtest.h>
#include "TestBundle.hpp"
#include "data/MetadataStore.hpp"
#include "models/Errors.hpp"

using namespace Durak;
using DurakTest::TempBundle;

class MetadataStoreTest : public ::testing::Test {
protected:
    TempBundle bundle;
    MetadataStore store;
};

TEST_F(MetadataStoreTest, LoadsValidDocument) {
    auto path = bundle.writeMetadata({{"base", {{"file", "base.txt"}}}});

    auto document = store.load(path);
    ASSERT_NE(document, nullptr);
    EXPECT_EQ(document->resourceCount(), 1u);
    EXPECT_TRUE(document->hasResource("base"));
    EXPECT_FALSE(document->hasResource("other"));
    EXPECT_EQ(document->baseDir, MetadataStore::canonicalKey(path).parent_path());
}

TEST_F(MetadataStoreTest, CachesPerResolvedPath) {
    auto path = bundle.writeMetadata({{"base", {{"file", "base.txt"}}}});
    bundle.write("sub/placeholder.txt", "");

    auto first = store.load(path);
    auto viaDotDot = store.load(bundle.path() / "sub" / ".." / "metadata.json");

    EXPECT_EQ(first.get(), viaDotDot.get());
    EXPECT_EQ(store.cachedCount(), 1u);
}

TEST_F(MetadataStoreTest, CachedDocumentIsNotReRead) {
    auto path = bundle.writeMetadata({{"base", {{"file", "base.txt"}}}});
    auto first = store.load(path);

    bundle.write("metadata.json", "not json anymore");
    auto second = store.load(path);

    EXPECT_EQ(first.get(), second.get());
}

TEST_F(MetadataStoreTest, MissingFileIsSchemaError) {
    EXPECT_THROW(store.load(bundle.path() / "missing.json"), SchemaError);
}

TEST_F(MetadataStoreTest, InvalidJsonIsSchemaError) {
    auto path = bundle.write("metadata.json", "{\"sets\": ");
    try {
        store.load(path);
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_NE(std::string(e.what()).find("not valid JSON"), std::string::npos);
    }
}

TEST_F(MetadataStoreTest, NonObjectDocumentIsSchemaError) {
    auto path = bundle.write("metadata.json", "[1, 2, 3]");
    EXPECT_THROW(store.load(path), SchemaError);
}

TEST_F(MetadataStoreTest, MissingOrEmptySetsIsSchemaError) {
    EXPECT_THROW(store.load(bundle.write("a.json", "{}")), SchemaError);
    EXPECT_THROW(store.load(bundle.write("b.json", "{\"sets\": {}}")), SchemaError);
    EXPECT_THROW(store.load(bundle.write("c.json", "{\"sets\": [\"base\"]}")), SchemaError);
}

TEST_F(MetadataStoreTest, FailedLoadIsNotCached) {
    auto path = bundle.write("metadata.json", "{}");
    EXPECT_THROW(store.load(path), SchemaError);
    EXPECT_EQ(store.cachedCount(), 0u);

    bundle.writeMetadata({{"base", {{"file", "base.txt"}}}});
    EXPECT_NO_THROW(store.load(path));
}
