// Crash harness for registry/object-store consistency
// Simulates crashes between the steps of upload and delete, then checks
// that a reopen plus Sweep restores the pairing invariants.

#include <gtest/gtest.h>

#include <picstash/image_service.hpp>
#include <picstash/object_store.hpp>
#include <picstash/rocks_registry.hpp>
#include <picstash/test_utils.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include <thread>
#include <vector>

namespace {

using picstash::FileObjectStore;
using picstash::ImageRecord;
using picstash::ImageService;
using picstash::ObjectEntry;
using picstash::RocksRegistry;
using picstash::ServiceOptions;
using picstash::SweepStats;
using picstash::UploadResult;
using picstash::testing::FakeClock;

class CrashTest : public ::testing::Test {
 protected:
  void SetUp() override {
    test_dir_ = std::filesystem::temp_directory_path() /
                ("picstash_crash_test_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(test_dir_);
  }

  void TearDown() override {
    service_.reset();
    objects_.reset();
    registry_.reset();
    std::error_code ec;
    std::filesystem::remove_all(test_dir_, ec);
  }

  void Open() {
    service_.reset();
    objects_.reset();
    registry_.reset();
    auto s = RocksRegistry::Open((test_dir_ / "db").string(), &registry_);
    ASSERT_TRUE(s.ok()) << s.ToString();
    objects_ = std::make_unique<FileObjectStore>(test_dir_ / "images");
    clock_ = std::make_shared<FakeClock>();
    ServiceOptions opt;
    opt.clock = clock_;
    service_ = std::make_unique<ImageService>(registry_.get(), objects_.get(), opt);
  }

  // Recovery sweep, run as if the restart came two hours after the crash.
  picstash::Status SweepAfterRestart(SweepStats* stats) {
    clock_->SetTimeUs(picstash::internal::WallClockMicros() + 2 * 3600ULL * 1000000ULL);
    return service_->Sweep(3600, stats);
  }

  // Simulate crash: drop everything without Close()
  void Crash() {
    service_.reset();
    objects_.reset();
    registry_.reset();
  }

  struct InvariantResult {
    bool passed = true;
    std::vector<std::string> violations;

    void AddViolation(const std::string& msg) {
      passed = false;
      violations.push_back(msg);
    }
  };

  InvariantResult CheckInvariants() {
    InvariantResult result;

    // Invariant 1: every record has its object
    std::set<std::string> record_files;
    auto s = registry_->ForEach([&](const ImageRecord& rec) {
      record_files.insert(rec.Filename());
      if (!objects_->Exists(rec.id, rec.extension)) {
        result.AddViolation("record without object: " + rec.Filename());
      }
      return true;
    });
    if (!s.ok()) {
      result.AddViolation("ForEach failed: " + s.ToString());
      return result;
    }

    // Invariant 2: every object has its record
    std::vector<ObjectEntry> entries;
    s = objects_->List(&entries);
    if (!s.ok()) {
      result.AddViolation("List failed: " + s.ToString());
      return result;
    }
    for (const auto& e : entries) {
      if (!record_files.count(e.filename)) {
        result.AddViolation("object without record: " + e.filename);
      }
    }
    return result;
  }

  std::string FirstViolation(const InvariantResult& r) {
    return r.violations.empty() ? "none" : r.violations[0];
  }

  std::filesystem::path test_dir_;
  std::unique_ptr<RocksRegistry> registry_;
  std::unique_ptr<FileObjectStore> objects_;
  std::unique_ptr<ImageService> service_;
  std::shared_ptr<FakeClock> clock_;
};

TEST_F(CrashTest, CommittedUploadsSurviveUncleanClose) {
  std::vector<std::string> ids;
  {
    Open();
    for (int i = 0; i < 50; ++i) {
      UploadResult r;
      ASSERT_TRUE(service_->Upload(".png", "bytes" + std::to_string(i), &r).ok());
      ids.push_back(r.id);
    }
    Crash();
  }

  Open();
  auto inv = CheckInvariants();
  EXPECT_TRUE(inv.passed) << FirstViolation(inv);

  uint64_t count = 0;
  ASSERT_TRUE(registry_->Count(&count).ok());
  EXPECT_EQ(count, 50u);

  std::string bytes;
  ASSERT_TRUE(objects_->Read(ids[7], ".png", &bytes).ok());
  EXPECT_EQ(bytes, "bytes7");
}

TEST_F(CrashTest, CrashBetweenClaimAndWrite) {
  {
    Open();
    // Claim succeeded, process died before the object was written.
    ASSERT_TRUE(registry_->Claim("dangling", ".png").ok());
    UploadResult r;
    ASSERT_TRUE(service_->Upload(".png", "ok", &r).ok());
    Crash();
  }

  Open();
  EXPECT_FALSE(CheckInvariants().passed);

  SweepStats stats;
  ASSERT_TRUE(SweepAfterRestart(&stats).ok());
  EXPECT_EQ(stats.orphan_records_removed, 1u);
  EXPECT_EQ(stats.orphan_objects_removed, 0u);

  auto inv = CheckInvariants();
  EXPECT_TRUE(inv.passed) << FirstViolation(inv);

  // The id is free again.
  EXPECT_TRUE(registry_->Claim("dangling", ".png").ok());
}

TEST_F(CrashTest, CrashMidWriteLeavesOnlyTemporary) {
  {
    Open();
    // A torn write: the temporary exists, the final name never appeared.
    ASSERT_TRUE(registry_->Claim("torn", ".jpg").ok());
    std::ofstream(test_dir_ / "images" / ".tmp-torn.jpg-AbCdEfGh") << "half";
    Crash();
  }

  Open();
  SweepStats stats;
  ASSERT_TRUE(SweepAfterRestart(&stats).ok());
  EXPECT_EQ(stats.orphan_records_removed, 1u);
  EXPECT_EQ(stats.orphan_objects_removed, 1u);

  auto inv = CheckInvariants();
  EXPECT_TRUE(inv.passed) << FirstViolation(inv);
}

TEST_F(CrashTest, CrashDuringDeleteAfterObjectRemoved) {
  std::string id;
  {
    Open();
    UploadResult r;
    ASSERT_TRUE(service_->Upload(".gif", "gif", &r).ok());
    id = r.id;
    // Delete removes the object first; die before the record goes.
    ASSERT_TRUE(objects_->Remove(r.id, r.extension).ok());
    Crash();
  }

  Open();
  // Retrying the delete finishes the job.
  ASSERT_TRUE(service_->Delete(id).ok());
  auto inv = CheckInvariants();
  EXPECT_TRUE(inv.passed) << FirstViolation(inv);
}

TEST_F(CrashTest, StrayObjectWithoutRecordIsSwept) {
  {
    Open();
    ASSERT_TRUE(objects_->Write("stray1", ".png", "x").ok());
    Crash();
  }

  Open();
  SweepStats stats;
  ASSERT_TRUE(SweepAfterRestart(&stats).ok());
  EXPECT_EQ(stats.orphan_objects_removed, 1u);
  EXPECT_FALSE(objects_->Exists("stray1", ".png"));
}

TEST_F(CrashTest, CrashWithConcurrentUploaders) {
  std::atomic<int> stored{0};
  {
    Open();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([&] {
        for (int i = 0; i < 25; ++i) {
          UploadResult r;
          if (service_->Upload(".webp", "w", &r).ok()) stored++;
        }
      });
    }
    for (auto& th : threads) th.join();
    Crash();
  }

  Open();
  auto inv = CheckInvariants();
  EXPECT_TRUE(inv.passed) << FirstViolation(inv);

  uint64_t count = 0;
  ASSERT_TRUE(registry_->Count(&count).ok());
  EXPECT_EQ(count, static_cast<uint64_t>(stored.load()));
  EXPECT_EQ(stored.load(), 100);
}

TEST_F(CrashTest, MultipleCrashCycles) {
  for (int cycle = 0; cycle < 5; ++cycle) {
    Open();
    for (int i = 0; i < 10; ++i) {
      UploadResult r;
      ASSERT_TRUE(service_->Upload(".png", "c", &r).ok());
    }
    ASSERT_TRUE(registry_->Claim("cycle" + std::to_string(cycle), ".png").ok());
    Crash();

    Open();
    SweepStats stats;
    ASSERT_TRUE(SweepAfterRestart(&stats).ok());
    EXPECT_EQ(stats.orphan_records_removed, 1u) << "cycle " << cycle;
    auto inv = CheckInvariants();
    EXPECT_TRUE(inv.passed) << "cycle " << cycle << ": " << FirstViolation(inv);
    Crash();
  }

  Open();
  uint64_t count = 0;
  ASSERT_TRUE(registry_->Count(&count).ok());
  EXPECT_EQ(count, 50u);
}

}  // namespace
