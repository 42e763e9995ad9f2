#include <benchmark/benchmark.h>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <unistd.h>

#include "vecsync/embedding/embedding_provider.h"
#include "vecsync/index/vector_index.h"
#include "vecsync/query/query_optimizer.h"

namespace vecsync {
namespace bench {
namespace {

constexpr size_t kDimension = 384;

std::filesystem::path BenchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("vecsync_bench_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

std::unique_ptr<index::VectorIndex> OpenIndex(const std::filesystem::path& dir) {
    core::IndexConfig config;
    config.dimension = kDimension;
    config.index_path = (dir / "faiss.index").string();
    config.id_map_path = (dir / "id_map.json").string();
    auto opened = index::VectorIndex::open(config, common::Logger::null());
    if (!opened.ok()) {
        return nullptr;
    }
    return opened.take_value();
}

core::Vector RandomVector(std::mt19937& gen) {
    std::normal_distribution<float> dist(0.0f, 1.0f);
    core::Vector v(kDimension);
    for (auto& x : v) {
        x = dist(gen);
    }
    return v;
}

core::FileMetadata Meta(size_t i) {
    core::FileMetadata m;
    m.path = "/bench/docs/file" + std::to_string(i) + ".txt";
    m.filename = "file" + std::to_string(i) + ".txt";
    m.file_type = "txt";
    m.size_bytes = 1024;
    return m;
}

// Every add persists both artifacts, so this measures the write path end to end.
static void BM_IndexAdd(benchmark::State& state) {
    const auto dir = BenchDir("add");
    auto index = OpenIndex(dir);
    if (!index) {
        state.SkipWithError("cannot open index");
        return;
    }
    const size_t preload = static_cast<size_t>(state.range(0));
    std::mt19937 gen(42);
    for (size_t i = 0; i < preload; ++i) {
        if (!index->add(i + 1, RandomVector(gen), Meta(i)).ok()) {
            state.SkipWithError("preload failed");
            return;
        }
    }

    size_t next = preload + 1;
    for (auto _ : state) {
        auto result = index->add(next, RandomVector(gen), Meta(next));
        benchmark::DoNotOptimize(result.ok());
        ++next;
    }
    std::filesystem::remove_all(dir);
}
BENCHMARK(BM_IndexAdd)->Arg(0)->Arg(1000)->Unit(benchmark::kMillisecond);

static void BM_IndexSearch(benchmark::State& state) {
    const auto dir = BenchDir("search");
    auto index = OpenIndex(dir);
    if (!index) {
        state.SkipWithError("cannot open index");
        return;
    }
    std::mt19937 gen(7);
    for (int64_t i = 0; i < state.range(0); ++i) {
        if (!index->add(static_cast<core::RecordID>(i + 1), RandomVector(gen),
                        Meta(static_cast<size_t>(i))).ok()) {
            state.SkipWithError("preload failed");
            return;
        }
    }
    const auto query = RandomVector(gen);

    for (auto _ : state) {
        auto hits = index->search(query, 10);
        benchmark::DoNotOptimize(hits.value().data());
    }
    state.SetItemsProcessed(state.iterations());
    std::filesystem::remove_all(dir);
}
BENCHMARK(BM_IndexSearch)->Arg(100)->Arg(1000)->Arg(5000)->Unit(benchmark::kMicrosecond);

static void BM_HashingEmbed(benchmark::State& state) {
    embedding::HashingEmbeddingProvider provider(kDimension);
    std::string text;
    for (int64_t i = 0; i < state.range(0); ++i) {
        text += "token" + std::to_string(i % 500) + " ";
    }
    for (auto _ : state) {
        auto v = provider.embed(text);
        benchmark::DoNotOptimize(v.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_HashingEmbed)->Arg(10)->Arg(1000)->Arg(100000);

static void BM_QueryOptimize(benchmark::State& state) {
    query::KeywordQueryOptimizer optimizer;
    const std::string q = "give me the document that talks about Review and Evaluation of Clinical Data please";
    for (auto _ : state) {
        auto out = optimizer.optimize(q);
        benchmark::DoNotOptimize(out.data());
    }
}
BENCHMARK(BM_QueryOptimize);

} // namespace
} // namespace bench
} // namespace vecsync

BENCHMARK_MAIN();
