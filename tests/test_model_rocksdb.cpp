// Index-Model auf dem persistenten RocksDB-Backend

#include <gtest/gtest.h>
#include "index/model.h"
#include "storage/rocksdb_store.h"

#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace kvindex {

class ModelRocksDBTest : public ::testing::Test {
protected:
    void SetUp() override {
        testPath_ = "./data/test_model_rocksdb";
        fs::remove_all(testPath_);

        RocksDBStore::Config cfg;
        cfg.db_path = testPath_;
        cfg.enable_wal = false; // Tests brauchen keine synchronen Writes
        cfg.block_cache_size_mb = 8;
        db_ = std::make_unique<RocksDBStore>(cfg);
        ASSERT_TRUE(db_->open());

        model_ = makeModel();
    }

    void TearDown() override {
        model_.reset();
        db_.reset();
        fs::remove_all(testPath_);
    }

    std::unique_ptr<Model> makeModel() {
        Index score = Index::byEquality("score");
        score.order.type = OrderType::DESCENDING;
        Index email = Index::byEquality("email");
        email.order.type = OrderType::UNORDERED;
        email.unique = true;
        auto [st, model] = Model::create(*db_, "players", std::vector<Index>{score, email});
        EXPECT_TRUE(st.ok) << st.toString();
        return std::move(model);
    }

    std::string testPath_;
    std::unique_ptr<RocksDBStore> db_;
    std::unique_ptr<Model> model_;
};

TEST_F(ModelRocksDBTest, ListDescending) {
    ASSERT_TRUE(model_->saveJson({{"id", "p1"}, {"score", 10}, {"email", "p1@x.com"}}).ok);
    ASSERT_TRUE(model_->saveJson({{"id", "p2"}, {"score", 250}, {"email", "p2@x.com"}}).ok);
    ASSERT_TRUE(model_->saveJson({{"id", "p3"}, {"score", 99}, {"email", "p3@x.com"}}).ok);

    auto [st, docs] = model_->listJson(Query::all("score", OrderType::DESCENDING));
    ASSERT_TRUE(st.ok) << st.toString();
    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[0]["id"].get<std::string>(), "p2");
    EXPECT_EQ(docs[1]["id"].get<std::string>(), "p3");
    EXPECT_EQ(docs[2]["id"].get<std::string>(), "p1");

    auto [lst, top] = model_->listJson(Query::all("score", OrderType::DESCENDING).withLimit(1));
    ASSERT_TRUE(lst.ok);
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0]["id"].get<std::string>(), "p2");
}

TEST_F(ModelRocksDBTest, UpdateAndUniqueness) {
    ASSERT_TRUE(model_->saveJson({{"id", "p1"}, {"score", 10}, {"email", "a@x.com"}}).ok);
    ASSERT_TRUE(model_->saveJson({{"id", "p1"}, {"score", 20}, {"email", "a@x.com"}}).ok);

    auto [oldSt, none] = model_->listJson(model_->indexes()[0].toQuery(Value{int64_t{10}}));
    ASSERT_TRUE(oldSt.ok);
    EXPECT_TRUE(none.empty());

    auto st = model_->saveJson({{"id", "p2"}, {"score", 5}, {"email", "a@x.com"}});
    EXPECT_EQ(st.code, ErrorCode::UniqueConstraintViolation);
}

TEST_F(ModelRocksDBTest, DeleteRemovesEverything) {
    ASSERT_TRUE(model_->saveJson({{"id", "p1"}, {"score", 10}, {"email", "a@x.com"}}).ok);
    ASSERT_TRUE(model_->erase(model_->identityQuery(std::string("p1"))).ok);

    auto [st, recs] = db_->scanPrefix("players:");
    ASSERT_TRUE(st.ok);
    EXPECT_TRUE(recs.empty());
}

TEST_F(ModelRocksDBTest, SurvivesReopen) {
    ASSERT_TRUE(model_->saveJson({{"id", "p1"}, {"score", 10}, {"email", "a@x.com"}}).ok);
    db_->flush();

    model_.reset();
    db_->close();
    EXPECT_FALSE(db_->isOpen());
    ASSERT_TRUE(db_->open());
    model_ = makeModel();

    auto [st, doc] = model_->readJson(model_->identityQuery(std::string("p1")));
    ASSERT_TRUE(st.ok) << st.toString();
    EXPECT_EQ(doc["score"].get<int64_t>(), 10);
}

TEST_F(ModelRocksDBTest, ClosedStoreIsStoreError) {
    db_->close();
    auto st = model_->saveJson({{"id", "p1"}, {"score", 10}, {"email", "a@x.com"}});
    EXPECT_EQ(st.code, ErrorCode::StoreError);

    auto [rst, doc] = model_->readJson(model_->identityQuery(std::string("p1")));
    EXPECT_EQ(rst.code, ErrorCode::StoreError);
}

} // namespace kvindex
