// Unit tests for picstash/internal.hpp utilities and the core value types
// Tests: timestamps, LE encoding, slot pool, Status, ImageRecord encoding

#include <gtest/gtest.h>

#include <picstash/internal.hpp>
#include <picstash/registry.hpp>
#include <picstash/status.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace picstash::internal {
namespace {

// =============================================================================
// Timestamp Tests
// =============================================================================

TEST(TimestampTest, NowMicrosMonotonic) {
  uint64_t t1 = NowMicros();
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  uint64_t t2 = NowMicros();
  EXPECT_GT(t2, t1);
}

TEST(TimestampTest, WallClockMicrosReasonable) {
  // After 2020-01-01 in microseconds.
  EXPECT_GT(WallClockMicros(), 1577836800ULL * 1000000ULL);
}

// =============================================================================
// Encoding Tests
// =============================================================================

TEST(EncodingTest, U64LittleEndianLayout) {
  std::string s = EncodeU64LE(0x0102030405060708ULL);
  ASSERT_EQ(s.size(), 8u);
  EXPECT_EQ(static_cast<uint8_t>(s[0]), 0x08);
  EXPECT_EQ(static_cast<uint8_t>(s[7]), 0x01);

  uint64_t v = 0;
  ASSERT_TRUE(DecodeU64LE(s, &v));
  EXPECT_EQ(v, 0x0102030405060708ULL);
}

TEST(EncodingTest, DecodeRejectsWrongSize) {
  uint64_t v = 0;
  EXPECT_FALSE(DecodeU64LE("short", &v));
  uint32_t w = 0;
  EXPECT_FALSE(DecodeU32LE("12345", &w));
}

TEST(EncodingTest, U32LittleEndian) {
  std::string s;
  AppendU32LE(&s, 0xA1B2C3D4u);
  ASSERT_EQ(s.size(), 4u);
  EXPECT_EQ(static_cast<uint8_t>(s[0]), 0xD4);

  uint32_t v = 0;
  ASSERT_TRUE(DecodeU32LE(s, &v));
  EXPECT_EQ(v, 0xA1B2C3D4u);
}

// =============================================================================
// SlotPool Tests
// =============================================================================

TEST(SlotPoolTest, AcquireUpToCapacity) {
  SlotPool pool(2);
  EXPECT_TRUE(pool.AcquireFor(std::chrono::milliseconds(10)));
  EXPECT_TRUE(pool.AcquireFor(std::chrono::milliseconds(10)));
  EXPECT_EQ(pool.Available(), 0);

  // Third caller times out instead of waiting forever.
  EXPECT_FALSE(pool.AcquireFor(std::chrono::milliseconds(20)));

  pool.Release();
  EXPECT_TRUE(pool.AcquireFor(std::chrono::milliseconds(10)));
}

TEST(SlotPoolTest, NonPositiveSizeMeansOne) {
  SlotPool pool(0);
  EXPECT_EQ(pool.Available(), 1);
}

TEST(SlotPoolTest, GuardReleasesOnScopeExit) {
  SlotPool pool(1);
  {
    SlotGuard guard(&pool, std::chrono::milliseconds(10));
    EXPECT_TRUE(guard.acquired());
    EXPECT_EQ(pool.Available(), 0);

    SlotGuard second(&pool, std::chrono::milliseconds(10));
    EXPECT_FALSE(second.acquired());
  }
  EXPECT_EQ(pool.Available(), 1);
}

TEST(SlotPoolTest, WaiterWakesOnRelease) {
  SlotPool pool(1);
  ASSERT_TRUE(pool.AcquireFor(std::chrono::milliseconds(10)));

  std::atomic<bool> got{false};
  std::thread waiter([&] { got = pool.AcquireFor(std::chrono::seconds(5)); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  pool.Release();
  waiter.join();
  EXPECT_TRUE(got.load());
}

TEST(SlotPoolTest, ConcurrentHoldersNeverExceedCapacity) {
  SlotPool pool(3);
  std::atomic<int> inside{0};
  std::atomic<int> max_inside{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 50; ++i) {
        SlotGuard guard(&pool, std::chrono::seconds(5));
        ASSERT_TRUE(guard.acquired());
        int now = ++inside;
        int prev = max_inside.load();
        while (now > prev && !max_inside.compare_exchange_weak(prev, now)) {}
        std::this_thread::yield();
        --inside;
      }
    });
  }
  for (auto& th : threads) th.join();

  EXPECT_LE(max_inside.load(), 3);
  EXPECT_EQ(pool.Available(), 3);
}

}  // namespace
}  // namespace picstash::internal

namespace picstash {
namespace {

// =============================================================================
// Status Tests
// =============================================================================

TEST(StatusTest, DefaultIsOk) {
  Status s;
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(s.ToString(), "OK");
}

TEST(StatusTest, KindsAreDistinct) {
  EXPECT_TRUE(Status::NotFound("x").IsNotFound());
  EXPECT_FALSE(Status::NotFound("x").IsRegistryUnavailable());
  EXPECT_TRUE(Status::DuplicateCandidate().IsDuplicateCandidate());
  EXPECT_TRUE(Status::AllocationExhausted().IsAllocationExhausted());
  EXPECT_TRUE(Status::InvalidExtension().IsInvalidExtension());
  EXPECT_FALSE(Status::InvalidExtension().IsInvalidArgument());
}

TEST(StatusTest, ToStringCarriesMessage) {
  auto s = Status::RegistryUnavailable("lock timeout");
  EXPECT_FALSE(s.ok());
  EXPECT_NE(s.ToString().find("lock timeout"), std::string::npos);
  EXPECT_EQ(s.message(), "lock timeout");
}

TEST(StatusTest, CodeNames) {
  EXPECT_EQ(Status::CodeName(Status::Code::kNotFound), "not_found");
  EXPECT_EQ(Status::CodeName(Status::Code::kRegistryUnavailable), "registry_unavailable");
  EXPECT_EQ(Status::CodeName(Status::Code::kInvalidExtension), "invalid_extension");
  EXPECT_EQ(Status::CodeName(Status::Code::kAllocationExhausted), "allocation_exhausted");
}

// =============================================================================
// ImageRecord Encoding Tests
// =============================================================================

TEST(ImageRecordTest, SerializeDeserialize) {
  ImageRecord rec;
  rec.id = "aB3xY9";
  rec.extension = ".png";
  rec.source = "https://example.com/cat.png";
  rec.created_at_us = 1234567890123456ULL;

  ImageRecord out;
  ASSERT_TRUE(ImageRecord::Deserialize(rec.id, rec.Serialize(), &out));
  EXPECT_EQ(out.id, rec.id);
  EXPECT_EQ(out.extension, ".png");
  EXPECT_EQ(out.source, rec.source);
  EXPECT_EQ(out.created_at_us, rec.created_at_us);
  EXPECT_TRUE(out.HasSource());
  EXPECT_EQ(out.Filename(), "aB3xY9.png");
}

TEST(ImageRecordTest, EmptySourceMeansNoAttribution) {
  ImageRecord rec;
  rec.id = "abc";
  rec.extension = ".gif";

  ImageRecord out;
  ASSERT_TRUE(ImageRecord::Deserialize(rec.id, rec.Serialize(), &out));
  EXPECT_FALSE(out.HasSource());
}

TEST(ImageRecordTest, DeserializeRejectsTruncated) {
  ImageRecord rec;
  rec.id = "abc";
  rec.extension = ".png";
  rec.source = "https://example.com";
  std::string data = rec.Serialize();

  ImageRecord out;
  EXPECT_FALSE(ImageRecord::Deserialize("abc", data.substr(0, data.size() - 1), &out));
  EXPECT_FALSE(ImageRecord::Deserialize("abc", "", &out));
  EXPECT_FALSE(ImageRecord::Deserialize("abc", data + "x", &out));
}

}  // namespace
}  // namespace picstash
