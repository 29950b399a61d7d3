// Performance benchmarks for picstash allocation and upload
//
// 1. MICROBENCHMARKS: identifier generation, record encoding (no I/O)
// 2. MACROBENCHMARKS: claims and uploads against RocksDB and the image
//    directory

#include <benchmark/benchmark.h>

#include <picstash/allocator.hpp>
#include <picstash/id_generator.hpp>
#include <picstash/image_service.hpp>
#include <picstash/object_store.hpp>
#include <picstash/registry.hpp>
#include <picstash/rocks_registry.hpp>
#include <picstash/test_utils.hpp>

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace {

class RegistryBenchmark : public benchmark::Fixture {
 protected:
  void SetUp(const benchmark::State& state) override {
    std::error_code ec;
    std::filesystem::path temp_base = std::filesystem::temp_directory_path(ec);
    if (ec || temp_base.empty()) temp_base = ".";

    test_dir_ = temp_base / ("picstash_bench_" + RandomSuffix());
    std::filesystem::create_directories(test_dir_, ec);

    auto s = picstash::RocksRegistry::Open((test_dir_ / "db").string(), &registry_);
    if (!s.ok()) {
      registry_.reset();
      return;
    }
    objects_ = std::make_unique<picstash::FileObjectStore>(test_dir_ / "images");
  }

  void TearDown(const benchmark::State& state) override {
    objects_.reset();
    registry_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  std::string RandomSuffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 999999);
    return std::to_string(dis(gen));
  }

  std::filesystem::path test_dir_;
  std::unique_ptr<picstash::RocksRegistry> registry_;
  std::unique_ptr<picstash::FileObjectStore> objects_;
};

// =============================================================================
// MICROBENCHMARKS
// =============================================================================

static void BM_GenerateIdentifier(benchmark::State& state) {
  const size_t length = static_cast<size_t>(state.range(0));
  for (auto _ : state) {
    auto id = picstash::GenerateIdentifier(length);
    benchmark::DoNotOptimize(id);
  }
}
BENCHMARK(BM_GenerateIdentifier)->Arg(4)->Arg(6)->Arg(12);

static void BM_ImageRecord_Serialize(benchmark::State& state) {
  picstash::ImageRecord rec;
  rec.id = "aB3xY9";
  rec.extension = ".png";
  rec.source = "https://example.com/some/long/path/to/original.png";
  rec.created_at_us = 1234567890123456ULL;

  for (auto _ : state) {
    auto serialized = rec.Serialize();
    benchmark::DoNotOptimize(serialized);
  }
}
BENCHMARK(BM_ImageRecord_Serialize);

static void BM_Allocate_MemoryRegistry(benchmark::State& state) {
  picstash::testing::MemoryRegistry registry;
  picstash::Allocator allocator(&registry);
  std::string id;
  for (auto _ : state) {
    auto s = allocator.Allocate(".png", &id);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK(BM_Allocate_MemoryRegistry);

// =============================================================================
// MACROBENCHMARKS
// =============================================================================

BENCHMARK_DEFINE_F(RegistryBenchmark, Claim)(benchmark::State& state) {
  if (!registry_) {
    state.SkipWithError("registry open failed");
    return;
  }
  for (auto _ : state) {
    auto s = registry_->Claim(picstash::GenerateIdentifier(8), ".png");
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK_REGISTER_F(RegistryBenchmark, Claim);

BENCHMARK_DEFINE_F(RegistryBenchmark, Upload)(benchmark::State& state) {
  if (!registry_) {
    state.SkipWithError("registry open failed");
    return;
  }
  picstash::ImageService service(registry_.get(), objects_.get());
  const std::string bytes(static_cast<size_t>(state.range(0)), 'x');

  picstash::UploadResult result;
  for (auto _ : state) {
    auto s = service.Upload(".png", bytes, &result);
    benchmark::DoNotOptimize(s);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(RegistryBenchmark, Upload)->Range(1 << 10, 1 << 20);

BENCHMARK_DEFINE_F(RegistryBenchmark, GetSources)(benchmark::State& state) {
  if (!registry_) {
    state.SkipWithError("registry open failed");
    return;
  }
  picstash::ImageService service(registry_.get(), objects_.get());
  std::vector<std::string> ids;
  for (int64_t i = 0; i < state.range(0); ++i) {
    picstash::UploadResult result;
    if (service.Upload(".png", "x", &result).ok()) ids.push_back(result.id);
  }

  std::vector<std::optional<std::string>> out;
  for (auto _ : state) {
    auto s = service.GetSources(ids, &out);
    benchmark::DoNotOptimize(s);
  }
}
BENCHMARK_REGISTER_F(RegistryBenchmark, GetSources)->Arg(10)->Arg(100);

}  // namespace

BENCHMARK_MAIN();
