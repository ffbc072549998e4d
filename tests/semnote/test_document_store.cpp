#include <gtest/gtest.h>
#include <semnote/store/document_store.hpp>
#include <filesystem>

using namespace semnote;
using namespace semnote::store;
namespace fs = std::filesystem;

class DocumentStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "semnote_store_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        fs::remove_all(test_dir_);
    }

    StoreOptions options(int dimension = 4) {
        StoreOptions opts;
        opts.database_path = (test_dir_ / "index.db").string();
        opts.index.dimension = dimension;
        return opts;
    }

    std::unique_ptr<DocumentStore> open_store(int dimension = 4) {
        auto result = DocumentStore::open(options(dimension));
        EXPECT_TRUE(result.ok()) << result.error().to_string();
        return std::move(result.value());
    }

    // Runs SQL through a second connection to the same database file
    void exec_external(const std::string& sql) {
        auto db = Database::open((test_dir_ / "index.db").string());
        ASSERT_TRUE(db.ok()) << db.error().to_string();
        auto done = db.value()->exec(sql);
        ASSERT_TRUE(done.ok()) << done.error().to_string();
    }

    static size_t documents(DocumentStore& store) { return store.count_documents().value(); }
    static size_t embeddings(DocumentStore& store) { return store.count_embeddings().value(); }

    fs::path test_dir_;
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(DocumentStoreTest, OpenAndClose) {
    auto store = open_store();
    EXPECT_TRUE(store->is_open());
    EXPECT_EQ(store->dimension(), 4);
    EXPECT_EQ(documents(*store), 0u);
    EXPECT_EQ(embeddings(*store), 0u);
    EXPECT_TRUE(fs::exists(test_dir_ / "index.db"));

    store->close();
    EXPECT_FALSE(store->is_open());

    auto count = store->count_documents();
    ASSERT_FALSE(count.ok());
    EXPECT_EQ(count.error().code(), ErrorCode::STORE_NOT_OPEN);
}

TEST_F(DocumentStoreTest, OpenCreatesParentDirectory) {
    StoreOptions opts = options();
    opts.database_path = (test_dir_ / "nested" / "dir" / "index.db").string();

    auto result = DocumentStore::open(opts);
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    EXPECT_TRUE(fs::exists(test_dir_ / "nested" / "dir" / "index.db"));
}

TEST_F(DocumentStoreTest, OpenRejectsBadOptions) {
    StoreOptions no_path = options();
    no_path.database_path.clear();
    auto a = DocumentStore::open(no_path);
    ASSERT_FALSE(a.ok());
    EXPECT_EQ(a.error().code(), ErrorCode::INVALID_ARGUMENT);

    auto b = DocumentStore::open(options(0));
    ASSERT_FALSE(b.ok());
    EXPECT_EQ(b.error().code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DocumentStoreTest, InMemoryDatabase) {
    StoreOptions opts = options();
    opts.database_path = ":memory:";

    auto result = DocumentStore::open(opts);
    ASSERT_TRUE(result.ok()) << result.error().to_string();
    auto id = result.value()->insert_document("n", 0, "text", {1, 0, 0, 0});
    EXPECT_TRUE(id.ok());
}

// ============================================================================
// Inserts
// ============================================================================

TEST_F(DocumentStoreTest, InsertDocument) {
    auto store = open_store();

    auto id = store->insert_document("n1", 0, "Hello world.", {1, 0, 0, 0});
    ASSERT_TRUE(id.ok()) << id.error().to_string();
    EXPECT_NE(id.value(), INVALID_DOC_ID);

    EXPECT_EQ(documents(*store), 1u);
    EXPECT_EQ(embeddings(*store), 1u);
    EXPECT_TRUE(store->vector_index().contains(id.value()));

    auto records = store->documents_for_note("n1");
    ASSERT_TRUE(records.ok());
    ASSERT_EQ(records->size(), 1u);
    EXPECT_EQ(records.value()[0].doc_id, id.value());
    EXPECT_EQ(records.value()[0].note_id, "n1");
    EXPECT_EQ(records.value()[0].start_offset, 0);
    EXPECT_EQ(records.value()[0].text, "Hello world.");
}

TEST_F(DocumentStoreTest, DocIdsAreUnique) {
    auto store = open_store();

    auto a = store->insert_document("n1", 0, "a", {1, 0, 0, 0});
    auto b = store->insert_document("n1", 5, "b", {0, 1, 0, 0});
    auto c = store->insert_document("n2", 0, "c", {0, 0, 1, 0});
    ASSERT_TRUE(a.ok() && b.ok() && c.ok());

    EXPECT_NE(a.value(), b.value());
    EXPECT_NE(b.value(), c.value());
    EXPECT_NE(a.value(), c.value());
}

TEST_F(DocumentStoreTest, InsertWrongDimensionWritesNothing) {
    auto store = open_store();

    auto id = store->insert_document("n1", 0, "text", {1, 0, 0});
    ASSERT_FALSE(id.ok());
    EXPECT_EQ(id.error().code(), ErrorCode::DIMENSION_MISMATCH);
    EXPECT_TRUE(id.error().is_store_error());

    EXPECT_EQ(documents(*store), 0u);
    EXPECT_EQ(embeddings(*store), 0u);
    EXPECT_EQ(store->vector_index().size(), 0u);
}

// ============================================================================
// Clearing notes
// ============================================================================

TEST_F(DocumentStoreTest, ClearNoteRemovesDocumentsAndEmbeddings) {
    auto store = open_store();

    store->insert_document("n1", 0, "a", {1, 0, 0, 0});
    store->insert_document("n1", 3, "b", {0, 1, 0, 0});
    auto other = store->insert_document("n2", 0, "c", {0, 0, 1, 0});
    ASSERT_TRUE(other.ok());

    auto removed = store->clear_note("n1");
    ASSERT_TRUE(removed.ok()) << removed.error().to_string();
    EXPECT_EQ(removed.value(), 2u);

    EXPECT_EQ(documents(*store), 1u);
    EXPECT_EQ(embeddings(*store), 1u);
    EXPECT_EQ(store->vector_index().size(), 1u);
    EXPECT_TRUE(store->vector_index().contains(other.value()));

    auto remaining = store->documents_for_note("n1");
    ASSERT_TRUE(remaining.ok());
    EXPECT_TRUE(remaining->empty());
}

TEST_F(DocumentStoreTest, ClearNoteIsIdempotent) {
    auto store = open_store();
    store->insert_document("n1", 0, "a", {1, 0, 0, 0});

    auto first = store->clear_note("n1");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value(), 1u);

    auto second = store->clear_note("n1");
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.value(), 0u);

    auto unknown = store->clear_note("never-indexed");
    ASSERT_TRUE(unknown.ok());
    EXPECT_EQ(unknown.value(), 0u);
}

TEST_F(DocumentStoreTest, ClearedSlotsAreReused) {
    auto store = open_store();

    for (int round = 0; round < 3; ++round) {
        auto cleared = store->clear_note("n1");
        ASSERT_TRUE(cleared.ok());
        for (int i = 0; i < 5; ++i) {
            auto id = store->insert_document("n1", i, "doc", {1, float(i), 0, 0});
            ASSERT_TRUE(id.ok()) << id.error().to_string();
        }
    }

    EXPECT_EQ(documents(*store), 5u);
    EXPECT_EQ(store->vector_index().size(), 5u);
}

// ============================================================================
// Similarity queries
// ============================================================================

TEST_F(DocumentStoreTest, TopKOrderedByDistance) {
    auto store = open_store();

    auto near = store->insert_document("n1", 0, "near", {1.0f, 0.1f, 0, 0});
    auto mid = store->insert_document("n2", 0, "mid", {1.0f, 1.0f, 0, 0});
    auto far = store->insert_document("n3", 0, "far", {0, 0, 1.0f, 0});
    ASSERT_TRUE(near.ok() && mid.ok() && far.ok());

    auto results = store->top_k_similar({1, 0, 0, 0}, 3);
    ASSERT_TRUE(results.ok()) << results.error().to_string();
    ASSERT_EQ(results->size(), 3u);

    EXPECT_EQ(results.value()[0].doc_id, near.value());
    EXPECT_EQ(results.value()[0].note_id, "n1");
    EXPECT_EQ(results.value()[0].text, "near");
    EXPECT_EQ(results.value()[1].doc_id, mid.value());
    EXPECT_EQ(results.value()[2].doc_id, far.value());

    EXPECT_LE(results.value()[0].distance, results.value()[1].distance);
    EXPECT_LE(results.value()[1].distance, results.value()[2].distance);
}

TEST_F(DocumentStoreTest, CosineDistanceValues) {
    auto store = open_store();

    store->insert_document("same", 0, "same", {2, 0, 0, 0});
    store->insert_document("orthogonal", 0, "orthogonal", {0, 3, 0, 0});
    store->insert_document("opposite", 0, "opposite", {-1, 0, 0, 0});

    auto results = store->top_k_similar({1, 0, 0, 0}, 3);
    ASSERT_TRUE(results.ok());
    ASSERT_EQ(results->size(), 3u);

    EXPECT_NEAR(results.value()[0].distance, 0.0f, 1e-5);
    EXPECT_NEAR(results.value()[1].distance, 1.0f, 1e-5);
    EXPECT_NEAR(results.value()[2].distance, 2.0f, 1e-5);
}

TEST_F(DocumentStoreTest, TopKTiesBrokenByDocId) {
    auto store = open_store();

    auto first = store->insert_document("b", 0, "x", {0, 1, 0, 0});
    auto second = store->insert_document("a", 0, "y", {0, 1, 0, 0});
    auto third = store->insert_document("c", 0, "z", {0, 1, 0, 0});
    ASSERT_TRUE(first.ok() && second.ok() && third.ok());

    auto results = store->top_k_similar({0, 1, 0, 0}, 2);
    ASSERT_TRUE(results.ok());
    ASSERT_EQ(results->size(), 2u);
    EXPECT_EQ(results.value()[0].doc_id, first.value());
    EXPECT_EQ(results.value()[1].doc_id, second.value());
}

TEST_F(DocumentStoreTest, TopKReturnsFewerWhenStoreIsSmall) {
    auto store = open_store();
    store->insert_document("n1", 0, "a", {1, 0, 0, 0});
    store->insert_document("n1", 2, "b", {0, 1, 0, 0});

    auto results = store->top_k_similar({1, 1, 1, 1}, 10);
    ASSERT_TRUE(results.ok());
    EXPECT_EQ(results->size(), 2u);
}

TEST_F(DocumentStoreTest, TopKOnEmptyStore) {
    auto store = open_store();

    auto results = store->top_k_similar({1, 0, 0, 0}, 5);
    ASSERT_TRUE(results.ok());
    EXPECT_TRUE(results->empty());

    store->insert_document("n1", 0, "a", {1, 0, 0, 0});
    auto none = store->top_k_similar({1, 0, 0, 0}, 0);
    ASSERT_TRUE(none.ok());
    EXPECT_TRUE(none->empty());
}

TEST_F(DocumentStoreTest, TopKRejectsWrongDimension) {
    auto store = open_store();
    store->insert_document("n1", 0, "a", {1, 0, 0, 0});

    auto results = store->top_k_similar({1, 0}, 5);
    ASSERT_FALSE(results.ok());
    EXPECT_EQ(results.error().code(), ErrorCode::DIMENSION_MISMATCH);
}

TEST_F(DocumentStoreTest, ClearedDocumentsAreNotReturned) {
    auto store = open_store();
    store->insert_document("gone", 0, "gone", {1, 0, 0, 0});
    auto kept = store->insert_document("kept", 0, "kept", {0, 1, 0, 0});
    ASSERT_TRUE(store->clear_note("gone").ok());

    auto results = store->top_k_similar({1, 0, 0, 0}, 5);
    ASSERT_TRUE(results.ok());
    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ(results.value()[0].doc_id, kept.value());
}

TEST_F(DocumentStoreTest, ApproximateSearchAboveThreshold) {
    StoreOptions opts = options(8);
    opts.index.exact_search_threshold = 0;
    opts.index.initial_capacity = 4;

    auto opened = DocumentStore::open(opts);
    ASSERT_TRUE(opened.ok()) << opened.error().to_string();
    auto& store = *opened.value();

    std::vector<DocId> ids;
    for (int i = 0; i < 40; ++i) {
        Embedding v(8, 0.0f);
        v[static_cast<size_t>(i % 8)] = 1.0f;
        v[static_cast<size_t>((i / 8) % 8)] += 0.5f;
        auto id = store.insert_document("n" + std::to_string(i), 0, "doc", v);
        ASSERT_TRUE(id.ok()) << id.error().to_string();
        ids.push_back(id.value());
    }
    EXPECT_GE(store.vector_index().capacity(), 40u);

    Embedding query(8, 0.0f);
    query[3] = 1.0f;
    query[2] += 0.5f;  // Same direction as i = 19

    auto results = store.top_k_similar(query, 5);
    ASSERT_TRUE(results.ok()) << results.error().to_string();
    ASSERT_EQ(results->size(), 5u);
    EXPECT_EQ(results.value()[0].note_id, "n19");
    for (size_t i = 1; i < results->size(); ++i) {
        EXPECT_LE(results.value()[i - 1].distance, results.value()[i].distance);
    }
}

// ============================================================================
// Failed writes and index resync
// ============================================================================

TEST_F(DocumentStoreTest, InsertRollsBackWhenEmbeddingWriteFails) {
    auto store = open_store();
    exec_external(
        "CREATE TRIGGER fail_embedding BEFORE INSERT ON embeddings "
        "BEGIN SELECT RAISE(ABORT, 'embedding write refused'); END;");

    auto id = store->insert_document("n1", 0, "text", {1, 0, 0, 0});
    ASSERT_FALSE(id.ok());
    EXPECT_TRUE(id.error().is_store_error()) << id.error().to_string();
    EXPECT_EQ(id.error().code(), ErrorCode::TRANSACTION_ABORTED);

    EXPECT_EQ(documents(*store), 0u);
    EXPECT_EQ(embeddings(*store), 0u);
    EXPECT_EQ(store->vector_index().size(), 0u);
    EXPECT_TRUE(store->documents_for_note("n1").value().empty());
}

TEST_F(DocumentStoreTest, ClearNoteRollsBackWhenDocumentDeleteFails) {
    auto store = open_store();
    auto id = store->insert_document("n1", 0, "text", {1, 0, 0, 0});
    ASSERT_TRUE(id.ok()) << id.error().to_string();
    exec_external(
        "CREATE TRIGGER fail_delete BEFORE DELETE ON documents "
        "BEGIN SELECT RAISE(ABORT, 'document delete refused'); END;");

    auto cleared = store->clear_note("n1");
    ASSERT_FALSE(cleared.ok());
    EXPECT_TRUE(cleared.error().is_store_error()) << cleared.error().to_string();

    EXPECT_EQ(documents(*store), 1u);
    EXPECT_EQ(embeddings(*store), 1u);
    EXPECT_EQ(store->vector_index().size(), 1u);

    auto results = store->top_k_similar({1, 0, 0, 0}, 5);
    ASSERT_TRUE(results.ok()) << results.error().to_string();
    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ(results.value()[0].doc_id, id.value());
}

TEST_F(DocumentStoreTest, ClearNoteSucceedsWhenIndexRebuildFails) {
    auto store = open_store();
    auto kept = store->insert_document("kept", 0, "kept", {0, 1, 0, 0});
    ASSERT_TRUE(kept.ok()) << kept.error().to_string();

    // Rows written behind the store's back: "external" is missing from the
    // in-memory index and "broken" has a two-component vector
    exec_external(
        "INSERT INTO documents (note_id, start_offset, content) VALUES ('external', 0, 'e');"
        "INSERT INTO embeddings (doc_id, vector) "
        "VALUES (last_insert_rowid(), X'0000803F000000000000000000000000');"
        "INSERT INTO documents (note_id, start_offset, content) VALUES ('broken', 0, 'b');"
        "INSERT INTO embeddings (doc_id, vector) "
        "VALUES (last_insert_rowid(), X'0000803F0000803F');");

    auto cleared = store->clear_note("external");
    ASSERT_TRUE(cleared.ok()) << cleared.error().to_string();
    EXPECT_EQ(cleared.value(), 1u);
    EXPECT_TRUE(store->documents_for_note("external").value().empty());
    EXPECT_EQ(documents(*store), 2u);

    auto stale = store->top_k_similar({0, 1, 0, 0}, 5);
    ASSERT_FALSE(stale.ok());
    EXPECT_EQ(stale.error().code(), ErrorCode::CORRUPTION);

    exec_external(
        "DELETE FROM embeddings WHERE doc_id IN "
        "(SELECT doc_id FROM documents WHERE note_id = 'broken');"
        "DELETE FROM documents WHERE note_id = 'broken';");

    auto results = store->top_k_similar({0, 1, 0, 0}, 5);
    ASSERT_TRUE(results.ok()) << results.error().to_string();
    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ(results.value()[0].doc_id, kept.value());
    EXPECT_EQ(store->vector_index().size(), 1u);
}

// ============================================================================
// Reset and persistence
// ============================================================================

TEST_F(DocumentStoreTest, ResetDropsEverything) {
    auto store = open_store();
    store->insert_document("n1", 0, "a", {1, 0, 0, 0});
    store->insert_document("n2", 0, "b", {0, 1, 0, 0});

    auto reset = store->reset();
    ASSERT_TRUE(reset.ok()) << reset.error().to_string();

    EXPECT_EQ(documents(*store), 0u);
    EXPECT_EQ(embeddings(*store), 0u);
    EXPECT_EQ(store->vector_index().size(), 0u);

    auto results = store->top_k_similar({1, 0, 0, 0}, 5);
    ASSERT_TRUE(results.ok());
    EXPECT_TRUE(results->empty());

    // Store is usable after reset
    auto id = store->insert_document("n3", 0, "c", {0, 0, 1, 0});
    ASSERT_TRUE(id.ok()) << id.error().to_string();
    EXPECT_EQ(documents(*store), 1u);
}

TEST_F(DocumentStoreTest, PersistsAcrossReopen) {
    DocId id;
    {
        auto store = open_store();
        auto inserted = store->insert_document("n1", 7, "persisted", {0, 0, 1, 0});
        ASSERT_TRUE(inserted.ok());
        id = inserted.value();
        store->insert_document("n2", 0, "other", {1, 0, 0, 0});
    }

    auto store = open_store();
    EXPECT_EQ(documents(*store), 2u);
    EXPECT_EQ(store->vector_index().size(), 2u);

    auto results = store->top_k_similar({0, 0, 1, 0}, 1);
    ASSERT_TRUE(results.ok());
    ASSERT_EQ(results->size(), 1u);
    EXPECT_EQ(results.value()[0].doc_id, id);
    EXPECT_EQ(results.value()[0].start_offset, 7);
    EXPECT_EQ(results.value()[0].text, "persisted");

    auto notes = store->list_note_ids();
    ASSERT_TRUE(notes.ok());
    EXPECT_EQ(notes.value(), (std::vector<NoteId>{"n1", "n2"}));
}

TEST_F(DocumentStoreTest, DimensionMismatchOnReopen) {
    {
        auto store = open_store(4);
        ASSERT_TRUE(store->insert_document("n1", 0, "a", {1, 0, 0, 0}).ok());
    }

    auto reopened = DocumentStore::open(options(8));
    ASSERT_FALSE(reopened.ok());
    EXPECT_EQ(reopened.error().code(), ErrorCode::DIMENSION_MISMATCH);

    // Data is untouched
    auto store = open_store(4);
    EXPECT_EQ(documents(*store), 1u);
}

TEST_F(DocumentStoreTest, DimensionChangeWithRebuild) {
    {
        auto store = open_store(4);
        ASSERT_TRUE(store->insert_document("n1", 0, "a", {1, 0, 0, 0}).ok());
    }

    StoreOptions opts = options(8);
    opts.rebuild_on_dimension_change = true;
    auto reopened = DocumentStore::open(opts);
    ASSERT_TRUE(reopened.ok()) << reopened.error().to_string();

    auto& store = *reopened.value();
    EXPECT_EQ(documents(store), 0u);
    EXPECT_EQ(store.dimension(), 8);
    EXPECT_TRUE(store.insert_document("n1", 0, "a", Embedding(8, 1.0f)).ok());
}

TEST_F(DocumentStoreTest, DimensionChangeOnEmptyStore) {
    {
        auto store = open_store(4);
    }

    auto store = open_store(16);
    EXPECT_EQ(store->dimension(), 16);
    EXPECT_TRUE(store->insert_document("n1", 0, "a", Embedding(16, 1.0f)).ok());
}
