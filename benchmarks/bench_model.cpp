#include <benchmark/benchmark.h>
#include "index/model.h"
#include "storage/memory_store.h"
#include <random>
#include <stdexcept>

namespace {
    std::string makeRandomString(size_t len) {
        static const char charset[] = "abcdefghijklmnopqrstuvwxyz0123456789";
        static std::mt19937 rng{42};
        static std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);
        std::string s;
        s.reserve(len);
        for (size_t i = 0; i < len; ++i) s += charset[dist(rng)];
        return s;
    }

    nlohmann::json makePerson(size_t i) {
        return {
            {"id", "person_" + std::to_string(i)},
            {"email", makeRandomString(12) + "@example.com"},
            {"age", static_cast<int64_t>(25 + (i % 50))},
            {"name", makeRandomString(10)},
            {"bio", makeRandomString(200)}
        };
    }
}

class ModelFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State&) override {
        store_ = std::make_unique<kvindex::MemoryStore>();

        // Indizes: unique E-Mail, Alter auf-/absteigend, Name absteigend (base32)
        kvindex::Index email = kvindex::Index::byEquality("email");
        email.order.type = kvindex::OrderType::UNORDERED;
        email.unique = true;
        kvindex::Index age = kvindex::Index::byEquality("age");
        kvindex::Index ageDesc = kvindex::Index::byEquality("age");
        ageDesc.order.type = kvindex::OrderType::DESCENDING;
        kvindex::Index name = kvindex::Index::byEquality("name");
        name.order.type = kvindex::OrderType::DESCENDING;
        name.base32_encode = true;

        auto [st, model] = kvindex::Model::create(*store_, "Person",
            std::vector<kvindex::Index>{email, age, ageDesc, name});
        if (!st.ok) throw std::runtime_error(st.toString());
        model_ = std::move(model);

        // Warmup: 1000 Records
        for (size_t i = 0; i < 1000; ++i) {
            auto st = model_->saveJson(makePerson(i));
            if (!st.ok) throw std::runtime_error(st.toString());
        }
    }

    void TearDown(const ::benchmark::State&) override {
        model_.reset();
        store_.reset();
    }

protected:
    std::unique_ptr<kvindex::MemoryStore> store_;
    std::unique_ptr<kvindex::Model> model_;
};

// --- Write Benchmarks ---

BENCHMARK_DEFINE_F(ModelFixture, InsertWithAllIndexes)(benchmark::State& state) {
    size_t counter = 1000;
    for (auto _ : state) {
        auto st = model_->saveJson(makePerson(counter++));
        benchmark::DoNotOptimize(st);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(ModelFixture, InsertWithAllIndexes)->Unit(benchmark::kMicrosecond);

// Update auf gleicher Identität: Stale-Key-Bereinigung für alle Indizes
BENCHMARK_DEFINE_F(ModelFixture, UpdateChangedFields)(benchmark::State& state) {
    size_t counter = 0;
    for (auto _ : state) {
        auto doc = makePerson(counter % 1000);
        doc["age"] = static_cast<int64_t>(counter % 97);
        auto st = model_->saveJson(doc);
        benchmark::DoNotOptimize(st);
        ++counter;
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(ModelFixture, UpdateChangedFields)->Unit(benchmark::kMicrosecond);

// --- Read Benchmarks ---

BENCHMARK_DEFINE_F(ModelFixture, ReadByIdentity)(benchmark::State& state) {
    size_t counter = 0;
    for (auto _ : state) {
        auto [st, doc] = model_->readJson(model_->identityQuery(std::string("person_") + std::to_string(counter++ % 1000)));
        benchmark::DoNotOptimize(doc);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(ModelFixture, ReadByIdentity)->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(ModelFixture, ListAgeDescendingTop100)(benchmark::State& state) {
    for (auto _ : state) {
        auto [st, docs] = model_->listJson(
            kvindex::Query::all("age", kvindex::OrderType::DESCENDING).withLimit(100));
        benchmark::DoNotOptimize(docs);
    }
    state.SetItemsProcessed(state.iterations() * 100);
}
BENCHMARK_REGISTER_F(ModelFixture, ListAgeDescendingTop100)->Unit(benchmark::kMicrosecond);

BENCHMARK_DEFINE_F(ModelFixture, ListByAgeValue)(benchmark::State& state) {
    for (auto _ : state) {
        auto [st, docs] = model_->listJson(kvindex::Query::equals("age", int64_t{42}));
        benchmark::DoNotOptimize(docs);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK_REGISTER_F(ModelFixture, ListByAgeValue)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
