// Tests for the RocksDB-backed registry

#include <gtest/gtest.h>

#include <picstash/rocks_registry.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <random>
#include <thread>
#include <vector>

namespace picstash {
namespace {

class RocksRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() /
                ("picstash_registry_test_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown() override {
    registry_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  Status OpenRegistry(const RegistryOptions& opt = RegistryOptions{}) {
    registry_.reset();
    return RocksRegistry::Open((test_dir_ / "db").string(), &registry_, opt);
  }

  std::filesystem::path test_dir_;
  std::unique_ptr<RocksRegistry> registry_;
};

TEST_F(RocksRegistryTest, ClaimThenDuplicate) {
  ASSERT_TRUE(OpenRegistry().ok());

  ASSERT_TRUE(registry_->Claim("abc", ".png").ok());
  auto s = registry_->Claim("abc", ".jpg");
  EXPECT_TRUE(s.IsDuplicateCandidate()) << s.ToString();

  // The losing claim changed nothing.
  ImageRecord rec;
  ASSERT_TRUE(registry_->Get("abc", &rec).ok());
  EXPECT_EQ(rec.extension, ".png");
  EXPECT_FALSE(rec.HasSource());
  EXPECT_GT(rec.created_at_us, 0u);
}

TEST_F(RocksRegistryTest, EmptyIdRejected) {
  ASSERT_TRUE(OpenRegistry().ok());
  EXPECT_TRUE(registry_->Claim("", ".png").IsInvalidArgument());
}

TEST_F(RocksRegistryTest, EraseAndNotFound) {
  ASSERT_TRUE(OpenRegistry().ok());

  EXPECT_TRUE(registry_->Erase("nope").IsNotFound());
  ASSERT_TRUE(registry_->Claim("abc", ".png").ok());
  ASSERT_TRUE(registry_->Erase("abc").ok());

  ImageRecord rec;
  EXPECT_TRUE(registry_->Get("abc", &rec).IsNotFound());

  // Released ids can be claimed again.
  EXPECT_TRUE(registry_->Claim("abc", ".gif").ok());
}

TEST_F(RocksRegistryTest, SetSourceReturnsPrevious) {
  ASSERT_TRUE(OpenRegistry().ok());
  ASSERT_TRUE(registry_->Claim("abc", ".png").ok());

  std::string previous = "sentinel";
  ASSERT_TRUE(registry_->SetSource("abc", "https://a.example/1", &previous).ok());
  EXPECT_TRUE(previous.empty());

  ASSERT_TRUE(registry_->SetSource("abc", "https://a.example/2", &previous).ok());
  EXPECT_EQ(previous, "https://a.example/1");

  ImageRecord rec;
  ASSERT_TRUE(registry_->Get("abc", &rec).ok());
  EXPECT_EQ(rec.source, "https://a.example/2");
  EXPECT_EQ(rec.extension, ".png");
}

TEST_F(RocksRegistryTest, SetSourceOnUnknownIdCreatesNothing) {
  ASSERT_TRUE(OpenRegistry().ok());

  EXPECT_TRUE(registry_->SetSource("ghost", "https://x", nullptr).IsNotFound());
  uint64_t count = 99;
  ASSERT_TRUE(registry_->Count(&count).ok());
  EXPECT_EQ(count, 0u);
}

TEST_F(RocksRegistryTest, MultiGetPreservesOrder) {
  ASSERT_TRUE(OpenRegistry().ok());
  ASSERT_TRUE(registry_->Claim("a1", ".png").ok());
  ASSERT_TRUE(registry_->Claim("b2", ".jpg").ok());
  ASSERT_TRUE(registry_->SetSource("b2", "https://b", nullptr).ok());

  std::vector<std::optional<ImageRecord>> out;
  ASSERT_TRUE(registry_->MultiGet({"b2", "zz", "a1", "b2"}, &out).ok());
  ASSERT_EQ(out.size(), 4u);
  ASSERT_TRUE(out[0].has_value());
  EXPECT_EQ(out[0]->source, "https://b");
  EXPECT_FALSE(out[1].has_value());
  ASSERT_TRUE(out[2].has_value());
  EXPECT_EQ(out[2]->extension, ".png");
  ASSERT_TRUE(out[3].has_value());

  ASSERT_TRUE(registry_->MultiGet({}, &out).ok());
  EXPECT_TRUE(out.empty());
}

TEST_F(RocksRegistryTest, ForEachAndCount) {
  ASSERT_TRUE(OpenRegistry().ok());
  for (const char* id : {"a", "b", "c", "d"}) {
    ASSERT_TRUE(registry_->Claim(id, ".png").ok());
  }

  uint64_t count = 0;
  ASSERT_TRUE(registry_->Count(&count).ok());
  EXPECT_EQ(count, 4u);

  int seen = 0;
  ASSERT_TRUE(registry_->ForEach([&seen](const ImageRecord&) { return ++seen < 2; }).ok());
  EXPECT_EQ(seen, 2);
}

TEST_F(RocksRegistryTest, StatusCountsSortedNumerically) {
  ASSERT_TRUE(OpenRegistry().ok());
  for (int code : {404, 200, 200, 1000, 200, 503}) {
    ASSERT_TRUE(registry_->IncrementStatusCount(code).ok());
  }
  EXPECT_TRUE(registry_->IncrementStatusCount(-1).IsInvalidArgument());

  std::vector<StatusCount> counts;
  ASSERT_TRUE(registry_->ListStatusCounts(&counts).ok());
  ASSERT_EQ(counts.size(), 4u);
  EXPECT_EQ(counts[0].status_code, 200);
  EXPECT_EQ(counts[0].count, 3u);
  EXPECT_EQ(counts[1].status_code, 404);
  EXPECT_EQ(counts[2].status_code, 503);
  EXPECT_EQ(counts[3].status_code, 1000);
}

TEST_F(RocksRegistryTest, StatusCountsDoNotCountAsImages) {
  ASSERT_TRUE(OpenRegistry().ok());
  ASSERT_TRUE(registry_->IncrementStatusCount(200).ok());

  uint64_t count = 0;
  ASSERT_TRUE(registry_->Count(&count).ok());
  EXPECT_EQ(count, 0u);
}

TEST_F(RocksRegistryTest, PersistsAcrossReopen) {
  ASSERT_TRUE(OpenRegistry().ok());
  ASSERT_TRUE(registry_->Claim("keep", ".webp").ok());
  ASSERT_TRUE(registry_->SetSource("keep", "https://k", nullptr).ok());
  ASSERT_TRUE(registry_->IncrementStatusCount(201).ok());
  ASSERT_TRUE(registry_->Flush().ok());

  ASSERT_TRUE(OpenRegistry().ok());
  ImageRecord rec;
  ASSERT_TRUE(registry_->Get("keep", &rec).ok());
  EXPECT_EQ(rec.extension, ".webp");
  EXPECT_EQ(rec.source, "https://k");

  std::vector<StatusCount> counts;
  ASSERT_TRUE(registry_->ListStatusCounts(&counts).ok());
  ASSERT_EQ(counts.size(), 1u);
  EXPECT_EQ(counts[0].count, 1u);
}

TEST_F(RocksRegistryTest, ClosedRegistryIsUnavailable) {
  ASSERT_TRUE(OpenRegistry().ok());
  registry_->Close();
  registry_->Close();  // idempotent

  ImageRecord rec;
  EXPECT_TRUE(registry_->Claim("a", ".png").IsRegistryUnavailable());
  EXPECT_TRUE(registry_->Get("a", &rec).IsRegistryUnavailable());
  EXPECT_TRUE(registry_->Erase("a").IsRegistryUnavailable());
  EXPECT_TRUE(registry_->IncrementStatusCount(200).IsRegistryUnavailable());
}

TEST_F(RocksRegistryTest, CloseWaitsForInFlightCalls) {
  ASSERT_TRUE(OpenRegistry().ok());
  ASSERT_TRUE(registry_->Claim("live", ".png").ok());

  std::atomic<bool> stop{false};
  std::atomic<int> calls{0};
  std::atomic<int> unexpected{0};
  std::vector<std::thread> readers;
  for (int t = 0; t < 6; ++t) {
    readers.emplace_back([&, t] {
      ImageRecord rec;
      std::vector<std::optional<ImageRecord>> recs;
      while (!stop.load()) {
        Status s = (t % 2 == 0) ? registry_->Get("live", &rec)
                                : registry_->MultiGet({"live", "gone"}, &recs);
        if (!s.ok() && !s.IsNotFound() && !s.IsRegistryUnavailable()) unexpected++;
        calls++;
      }
    });
  }

  while (calls.load() < 200) std::this_thread::yield();
  registry_->Close();

  // Nothing can reach the closed database any more.
  ImageRecord rec;
  EXPECT_TRUE(registry_->Get("live", &rec).IsRegistryUnavailable());
  EXPECT_TRUE(registry_->Claim("new", ".png").IsRegistryUnavailable());

  stop = true;
  for (auto& th : readers) th.join();
  EXPECT_EQ(unexpected.load(), 0);
}

TEST_F(RocksRegistryTest, OpenRejectsBadOptions) {
  RegistryOptions opt;
  opt.max_concurrent_ops = 0;
  EXPECT_TRUE(OpenRegistry(opt).IsInvalidArgument());
}

TEST_F(RocksRegistryTest, SecondOpenOfSamePathFails) {
  ASSERT_TRUE(OpenRegistry().ok());
  std::unique_ptr<RocksRegistry> other;
  auto s = RocksRegistry::Open((test_dir_ / "db").string(), &other);
  EXPECT_TRUE(s.IsRegistryUnavailable()) << s.ToString();
}

TEST_F(RocksRegistryTest, ConcurrentClaimsOfSameIdHaveOneWinner) {
  ASSERT_TRUE(OpenRegistry().ok());

  for (int round = 0; round < 20; ++round) {
    const std::string id = "race" + std::to_string(round);
    std::atomic<int> winners{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> others{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
      threads.emplace_back([&] {
        auto s = registry_->Claim(id, ".png");
        if (s.ok()) {
          winners++;
        } else if (s.IsDuplicateCandidate()) {
          duplicates++;
        } else {
          others++;
        }
      });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(winners.load(), 1) << id;
    EXPECT_EQ(duplicates.load(), 7) << id;
    EXPECT_EQ(others.load(), 0) << id;
  }
}

TEST_F(RocksRegistryTest, EmitsCacheMetrics) {
  struct Sink : MetricsSink {
    void Counter(std::string_view, uint64_t) override {}
    void Histogram(std::string_view, uint64_t) override {}
    void Gauge(std::string_view name, double) override { names.emplace_back(name); }
    std::vector<std::string> names;
  };
  auto sink = std::make_shared<Sink>();

  RegistryOptions opt;
  opt.metrics = sink;
  ASSERT_TRUE(OpenRegistry(opt).ok());
  registry_->EmitCacheMetrics();

  EXPECT_NE(std::find(sink->names.begin(), sink->names.end(), "picstash.registry.free_slots"),
            sink->names.end());
}

}  // namespace
}  // namespace picstash
