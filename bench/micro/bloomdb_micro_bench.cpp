#include <benchmark/benchmark.h>
#include "bloomdb/index/column_index.hpp"
#include "bloomdb/query/evaluator.hpp"
#include "bloomdb/storage/index_store.hpp"
#include "bloomdb/file_index.hpp"
#include <map>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace bloomdb;

static std::vector<value> make_strings(std::size_t n, std::size_t distinct) {
    std::mt19937_64 rng(42);
    std::vector<value> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) out.emplace_back("v" + std::to_string(rng() % distinct));
    return out;
}

static void BM_BloomInsert(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto values = make_strings(n, n);
    for (auto _ : state) {
        auto bf = index::BloomFilter::with_capacity(n, 0.01);
        for (const auto& v : values) bf.insert(v);
        benchmark::DoNotOptimize(bf.inserted());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(n));
}
BENCHMARK(BM_BloomInsert)->Arg(1 << 10)->Arg(1 << 16);

static void BM_BloomContains(benchmark::State& state) {
    const std::size_t n = 1 << 16;
    auto values = make_strings(n, n);
    auto bf = index::BloomFilter::with_capacity(n, 0.01);
    for (const auto& v : values) bf.insert(v);
    const value absent{std::string("absent")};
    for (auto _ : state) {
        benchmark::DoNotOptimize(bf.contains(absent));
    }
}
BENCHMARK(BM_BloomContains);

// Distinct count below and above the default range threshold.
static void BM_ColumnBuild(benchmark::State& state) {
    const auto distinct = static_cast<std::size_t>(state.range(0));
    std::vector<value> ints;
    ints.reserve(100000);
    for (std::size_t i = 0; i < 100000; ++i) ints.emplace_back(static_cast<std::int64_t>(i % distinct));
    auto builder = index::ColumnIndexBuilder::create({});
    if (!builder) { state.SkipWithError("builder creation failed"); return; }
    for (auto _ : state) {
        auto idx = builder->build(ints);
        benchmark::DoNotOptimize(idx.has_value());
    }
}
BENCHMARK(BM_ColumnBuild)->Arg(100)->Arg(50000);

static void BM_IndexDecode(benchmark::State& state) {
    auto builder = index::ColumnIndexBuilder::create({});
    if (!builder) { state.SkipWithError("builder creation failed"); return; }
    std::map<std::string, index::ColumnIndex> cols;
    for (int c = 0; c < 8; ++c) {
        auto idx = builder->build(make_strings(5000, 900));
        if (!idx) { state.SkipWithError("build failed"); return; }
        cols.emplace("col" + std::to_string(c), std::move(*idx));
    }
    const FileIndex fi("bench.csv", builder->config(), std::move(cols));
    const storage::IndexStore store{};
    auto bytes = store.encode(fi);
    if (!bytes) { state.SkipWithError("encode failed"); return; }
    for (auto _ : state) {
        auto dec = storage::IndexStore::decode(*bytes);
        benchmark::DoNotOptimize(dec.has_value());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(bytes->size()));
}
BENCHMARK(BM_IndexDecode);

static void BM_EvaluateRule(benchmark::State& state) {
    auto builder = index::ColumnIndexBuilder::create({});
    if (!builder) { state.SkipWithError("builder creation failed"); return; }
    std::vector<std::shared_ptr<const FileIndex>> files;
    for (int f = 0; f < 64; ++f) {
        std::map<std::string, index::ColumnIndex> cols;
        auto status = builder->build(make_strings(200, 50));
        std::vector<value> amounts;
        for (std::int64_t i = 0; i < 5000; ++i) amounts.emplace_back(i * (f + 1));
        auto amount = builder->build(amounts);
        if (!status || !amount) { state.SkipWithError("build failed"); return; }
        cols.emplace("status", std::move(*status));
        cols.emplace("amount", std::move(*amount));
        files.push_back(std::make_shared<const FileIndex>("f" + std::to_string(f) + ".csv", builder->config(), std::move(cols)));
    }
    const auto q = query::make_and({
        query::make_leaf("status", value{std::string("v7")}),
        query::make_or({query::make_leaf("amount", value{std::int64_t{4999}}),
                        query::make_leaf("region", value{std::string("eu")})})});
    for (auto _ : state) {
        auto hits = query::candidate_files(q, files);
        benchmark::DoNotOptimize(hits.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(files.size()));
}
BENCHMARK(BM_EvaluateRule);

BENCHMARK_MAIN();
