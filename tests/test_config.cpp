#include <gtest/gtest.h>
#include "utils/config.h"
#include "index/model.h"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace kvindex {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = "./data/test_config";
        fs::remove_all(testDir_);
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        fs::remove_all(testDir_);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const std::string path = testDir_ + "/" + name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    std::string testDir_;
};

TEST_F(ConfigTest, LoadFromYaml) {
    const std::string path = writeFile("kvindex.yaml", R"(
logging:
  level: debug
  pattern: "%v"
storage:
  backend: memory
  db_path: ./data/ignored
  bloom_bits_per_key: 12
  enable_wal: false
models:
  - namespace: users
    id_field: uuid
    debug: true
    indexes:
      - field: email
        order: unordered
        unique: true
      - field: age
        order: desc
      - field: author
        order_field: created
        order: ascending
        string_pad_length: 32
        base32: true
)");

    auto [st, cfg] = Config::loadFromYaml(path);
    ASSERT_TRUE(st.ok) << st.toString();

    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.pattern, "%v");
    EXPECT_EQ(cfg.storage.backend, "memory");
    EXPECT_EQ(cfg.storage.bloom_bits_per_key, 12);
    EXPECT_FALSE(cfg.storage.enable_wal);
    EXPECT_EQ(cfg.storage.memtable_size_mb, 64u);

    const auto* users = cfg.findModel("users");
    ASSERT_NE(users, nullptr);
    EXPECT_EQ(users->id_field, "uuid");
    EXPECT_TRUE(users->debug);
    EXPECT_EQ(cfg.findModel("posts"), nullptr);

    auto indexes = Config::buildIndexes(*users);
    ASSERT_EQ(indexes.size(), 3u);
    EXPECT_EQ(indexes[0].field_name, "email");
    EXPECT_EQ(indexes[0].order.type, OrderType::UNORDERED);
    EXPECT_TRUE(indexes[0].unique);
    EXPECT_EQ(indexes[1].order.type, OrderType::DESCENDING);
    EXPECT_EQ(indexes[1].string_order_pad_length, 16);
    EXPECT_EQ(indexes[2].orderFieldName(), "created");
    EXPECT_TRUE(indexes[2].hasSeparateOrderField());
    EXPECT_EQ(indexes[2].string_order_pad_length, 32);
    EXPECT_TRUE(indexes[2].base32_encode);

    Index id = Config::buildIdIndex(*users);
    EXPECT_EQ(id.field_name, "uuid");
    EXPECT_EQ(id.order.type, OrderType::UNORDERED);
}

TEST_F(ConfigTest, MissingSectionsUseDefaults) {
    const std::string path = writeFile("empty.yaml", "models: []\n");
    auto [st, cfg] = Config::loadFromYaml(path);
    ASSERT_TRUE(st.ok) << st.toString();
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_EQ(cfg.storage.backend, "rocksdb");
    EXPECT_EQ(cfg.storage.db_path, "./data/kvindex");
    EXPECT_TRUE(cfg.models.empty());
}

TEST_F(ConfigTest, UnknownOrderIsInvalid) {
    const std::string path = writeFile("bad_order.yaml", R"(
models:
  - namespace: users
    indexes:
      - field: age
        order: sideways
)");
    auto [st, cfg] = Config::loadFromYaml(path);
    EXPECT_EQ(st.code, ErrorCode::InvalidArgument);
    EXPECT_NE(st.message.find("sideways"), std::string::npos);
}

TEST_F(ConfigTest, EmptyFieldIsInvalid) {
    const std::string path = writeFile("no_field.yaml", R"(
models:
  - namespace: users
    indexes:
      - order: ascending
)");
    auto [st, cfg] = Config::loadFromYaml(path);
    EXPECT_EQ(st.code, ErrorCode::InvalidArgument);
}

// author und author-nach-created teilen sich "byOrderedAuthor"
TEST_F(ConfigTest, CollidingIndexNamesAreInvalid) {
    const std::string path = writeFile("collision.yaml", R"(
models:
  - namespace: posts
    indexes:
      - field: author
      - field: author
        order_field: created
)");
    auto [st, cfg] = Config::loadFromYaml(path);
    EXPECT_EQ(st.code, ErrorCode::InvalidArgument);
    EXPECT_NE(st.message.find("byOrderedAuthor"), std::string::npos);
    EXPECT_NE(st.message.find("posts"), std::string::npos);
}

// Ein deklarierter unordered-Index auf dem Identitätsfeld kollidiert mit byId
TEST_F(ConfigTest, IndexCollidingWithIdentityIsInvalid) {
    json j = {{"models", json::array({
        {{"namespace", "users"}, {"indexes", json::array({{{"field", "id"}, {"order", "unordered"}}})}}
    })}};
    auto [st, cfg] = Config::fromJson(j);
    EXPECT_EQ(st.code, ErrorCode::InvalidArgument);
    EXPECT_NE(st.message.find("byId"), std::string::npos);
}

TEST_F(ConfigTest, PadLengthZeroIsValidNegativeIsNot) {
    json j = {{"storage", {{"backend", "memory"}}},
              {"models", json::array({
                  {{"namespace", "users"}, {"indexes", json::array({{{"field", "name"}, {"string_pad_length", 0}}})}}
              })}};
    auto [st, cfg] = Config::fromJson(j);
    EXPECT_TRUE(st.ok) << st.toString();

    j["models"][0]["indexes"][0]["string_pad_length"] = -1;
    auto [st2, cfg2] = Config::fromJson(j);
    EXPECT_EQ(st2.code, ErrorCode::InvalidArgument);
    EXPECT_NE(st2.message.find("negative"), std::string::npos);
}

TEST_F(ConfigTest, MissingFileIsInvalid) {
    auto [st, cfg] = Config::loadFromYaml(testDir_ + "/does_not_exist.yaml");
    EXPECT_EQ(st.code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, MalformedYamlIsInvalid) {
    const std::string path = writeFile("broken.yaml", "models: [ { namespace: users\n");
    auto [st, cfg] = Config::loadFromYaml(path);
    EXPECT_EQ(st.code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, JsonRoundTrip) {
    json j = {
        {"storage", {{"backend", "memory"}}},
        {"models", json::array({
            {{"namespace", "posts"}, {"indexes", json::array({
                {{"field", "author"}, {"order_field", "created"}, {"order", "descending"}}
            })}}
        })}
    };

    auto [st, cfg] = Config::fromJson(j);
    ASSERT_TRUE(st.ok) << st.toString();
    ASSERT_EQ(cfg.models.size(), 1u);
    EXPECT_EQ(cfg.models[0].ns, "posts");
    EXPECT_EQ(cfg.models[0].id_field, "id");

    json out = cfg.toJson();
    EXPECT_EQ(out["storage"]["backend"].get<std::string>(), "memory");
    EXPECT_EQ(out["models"][0]["indexes"][0]["order"].get<std::string>(), "descending");
    EXPECT_EQ(out["models"][0]["indexes"][0]["order_field"].get<std::string>(), "created");

    auto [st2, again] = Config::fromJson(out);
    ASSERT_TRUE(st2.ok) << st2.toString();
    EXPECT_EQ(again.models[0].indexes[0].order, OrderType::DESCENDING);
}

TEST_F(ConfigTest, JsonTypeErrorIsInvalid) {
    json j = {{"models", json::array({{{"namespace", "x"}, {"debug", "not a bool"}}})}};
    auto [st, cfg] = Config::fromJson(j);
    EXPECT_EQ(st.code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, UnknownBackendIsInvalid) {
    json j = {{"storage", {{"backend", "cassandra"}}}};
    auto [st, cfg] = Config::fromJson(j);
    EXPECT_EQ(st.code, ErrorCode::InvalidArgument);
}

// Konfiguration -> Store -> Model
TEST_F(ConfigTest, OpenStoreAndBuildModel) {
    json j = {
        {"storage", {{"backend", "memory"}}},
        {"models", json::array({
            {{"namespace", "users"}, {"indexes", json::array({{{"field", "age"}}})}}
        })}
    };
    auto [st, cfg] = Config::fromJson(j);
    ASSERT_TRUE(st.ok) << st.toString();

    auto [openSt, store] = cfg.openStore();
    ASSERT_TRUE(openSt.ok) << openSt.toString();
    ASSERT_NE(store.get(), nullptr);

    const auto* users = cfg.findModel("users");
    ASSERT_NE(users, nullptr);
    Model::Options opts;
    opts.debug = users->debug;
    opts.id_index = Config::buildIdIndex(*users);
    auto [createSt, model] = Model::create(*store, users->ns, Config::buildIndexes(*users), opts);
    ASSERT_TRUE(createSt.ok) << createSt.toString();

    ASSERT_TRUE(model->saveJson({{"id", "1"}, {"age", 30}}).ok);
    auto [rst, doc] = model->readJson(Query::equals("age", int64_t{30}));
    ASSERT_TRUE(rst.ok) << rst.toString();
}

TEST_F(ConfigTest, OpenRocksDBStore) {
    Config cfg;
    cfg.storage.db_path = testDir_ + "/db";
    auto [st, store] = cfg.openStore();
    ASSERT_TRUE(st.ok) << st.toString();
    ASSERT_TRUE(store->write("k", {'v'}).ok);
    auto [rst, recs] = store->read("k");
    ASSERT_TRUE(rst.ok);
    EXPECT_EQ(recs.size(), 1u);
}

TEST_F(ConfigTest, ApplyLogging) {
    Config cfg;
    cfg.logging.level = "warn";
    cfg.logging.file = testDir_ + "/kvindex.log";
    cfg.applyLogging();
    EXPECT_TRUE(utils::Logger::isInitialized());
    KVINDEX_WARN("config test {}", 1);
    utils::Logger::shutdown();
    EXPECT_TRUE(fs::exists(cfg.logging.file));
}

TEST(LoggerTest, LevelNames) {
    using utils::Logger;
    EXPECT_EQ(Logger::levelFromString("DEBUG"), Logger::Level::Debug);
    EXPECT_EQ(Logger::levelFromString("warning"), Logger::Level::Warn);
    EXPECT_EQ(Logger::levelFromString("unknown"), Logger::Level::Info);
    EXPECT_STREQ(Logger::levelToString(Logger::Level::Critical), "critical");
}

// Ohne init() bleibt alles stumm, auch setPattern legt keinen Logger an
TEST(LoggerTest, NoOpUntilInitialised) {
    using utils::Logger;
    Logger::shutdown();
    Logger::setPattern("%v");
    EXPECT_FALSE(Logger::isInitialized());
    KVINDEX_ERROR("not printed {}", 42);
    EXPECT_FALSE(Logger::isInitialized());
}

TEST(StatusTest, ToString) {
    EXPECT_EQ(Status::OK().toString(), "OK");
    auto st = Status::Error(ErrorCode::NoMatchingIndex, "field=age");
    EXPECT_FALSE(st.ok);
    EXPECT_TRUE(st.is(ErrorCode::NoMatchingIndex));
    EXPECT_EQ(st.toString(), "NoMatchingIndex: field=age");
    EXPECT_STREQ(errorCodeToString(ErrorCode::UnsupportedDeleteQuery), "UnsupportedDeleteQuery");
}

} // namespace kvindex
