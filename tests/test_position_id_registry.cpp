#include <gtest/gtest.h>
#include <boundary/position_id_registry.hpp>
#include <log.hpp>

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using boundary::BoundaryConfig;
using boundary::PositionIdRegistry;
using tradeid::core::IdentifierErrc;
using namespace tradeid::log;

namespace {

struct CaptureSink : ISink {
  std::vector<LogRecord> records;
  void write(const LogRecord& r) noexcept override { records.push_back(r); }
};

class RegistryTest : public ::testing::Test {
protected:
  void SetUp() override { LogManager::Instance().ClearSinks(); }
  PositionIdRegistry reg;
};

} // namespace

TEST_F(RegistryTest, AcquireBorrowRelease) {
  auto h = reg.Acquire("P-123456789");
  ASSERT_TRUE(h.HasValue());
  EXPECT_NE(h.Value(), PositionIdRegistry::kInvalidHandle);
  EXPECT_EQ(reg.Size(), 1u);

  auto view = reg.Borrow(h.Value());
  ASSERT_TRUE(view.HasValue());
  EXPECT_EQ(view.Value()->ToString(), "P-123456789");

  // borrowed storage does not move while the handle is live
  auto again = reg.Borrow(h.Value());
  ASSERT_TRUE(again.HasValue());
  EXPECT_EQ(view.Value()->CStr(), again.Value()->CStr());

  EXPECT_TRUE(reg.Release(h.Value()).HasValue());
  EXPECT_EQ(reg.Size(), 0u);
}

TEST_F(RegistryTest, EqualsAndHashFollowTheText) {
  auto a = reg.Acquire("P-123456789");
  auto b = reg.Acquire("P-123456789");
  auto c = reg.Acquire("P-234567890");
  ASSERT_TRUE(a && b && c);
  EXPECT_NE(*a, *b);

  auto ab = reg.Equals(*a, *b);
  ASSERT_TRUE(ab.HasValue());
  EXPECT_TRUE(ab.Value());

  auto ac = reg.Equals(*a, *c);
  ASSERT_TRUE(ac.HasValue());
  EXPECT_FALSE(ac.Value());

  auto aa = reg.Equals(*a, *a);
  ASSERT_TRUE(aa.HasValue());
  EXPECT_TRUE(aa.Value());

  auto ha = reg.Hash(*a);
  auto hb = reg.Hash(*b);
  ASSERT_TRUE(ha && hb);
  EXPECT_EQ(ha.Value(), hb.Value());
  EXPECT_EQ(ha.Value(), identifiers::PositionId("P-123456789").Hash());
}

TEST_F(RegistryTest, ReleaseIsTerminal) {
  auto h = reg.Acquire("001");
  ASSERT_TRUE(h.HasValue());
  auto other = reg.Acquire("002");
  ASSERT_TRUE(other.HasValue());

  EXPECT_TRUE(reg.Release(*h).HasValue());
  EXPECT_FALSE(reg.Contains(*h));

  auto b = reg.Borrow(*h);
  ASSERT_FALSE(b.HasValue());
  EXPECT_EQ(b.Error().value, IdentifierErrc::kInvalidHandle);

  auto e = reg.Equals(*h, *other);
  ASSERT_FALSE(e.HasValue());
  EXPECT_EQ(e.Error().value, IdentifierErrc::kInvalidHandle);

  auto hs = reg.Hash(*h);
  ASSERT_FALSE(hs.HasValue());
  EXPECT_EQ(hs.Error().value, IdentifierErrc::kInvalidHandle);

  auto twice = reg.Release(*h);
  ASSERT_FALSE(twice.HasValue());
  EXPECT_EQ(twice.Error().value, IdentifierErrc::kInvalidHandle);

  // the unrelated identifier is untouched
  EXPECT_TRUE(reg.Contains(*other));
  EXPECT_EQ(reg.Size(), 1u);
}

TEST_F(RegistryTest, InvalidHandleZeroIsNeverIssued) {
  EXPECT_FALSE(reg.Borrow(PositionIdRegistry::kInvalidHandle).HasValue());
  EXPECT_FALSE(reg.Release(PositionIdRegistry::kInvalidHandle).HasValue());
}

TEST_F(RegistryTest, HandlesAreNotReusedAfterRelease) {
  auto first = reg.Acquire("P-1");
  ASSERT_TRUE(first.HasValue());
  ASSERT_TRUE(reg.Release(*first).HasValue());

  auto second = reg.Acquire("P-1");
  ASSERT_TRUE(second.HasValue());
  EXPECT_NE(*first, *second);
  EXPECT_FALSE(reg.Borrow(*first).HasValue());
}

TEST_F(RegistryTest, NullTextIsRejected) {
  auto r = reg.Acquire(nullptr);
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, IdentifierErrc::kNullArgument);
  EXPECT_EQ(reg.Size(), 0u);
}

TEST_F(RegistryTest, MalformedUtf8IsRejected) {
  for (const char* bad : {"\xC3\x28", "\xC0\xAF", "\xED\xA0\x80", "P-\xE2\x82", "\xF5\x80\x80\x80", "\xFF"}) {
    auto r = reg.Acquire(bad);
    ASSERT_FALSE(r.HasValue()) << "accepted: " << bad;
    EXPECT_EQ(r.Error().value, IdentifierErrc::kInvalidText);
  }
  EXPECT_EQ(reg.Size(), 0u);

  for (const char* good : {"", "P-123", "P-\xC3\xBC", "\xE2\x82\xAC", "\xF0\x9F\x98\x80", "\xF4\x8F\xBF\xBF"}) {
    EXPECT_TRUE(reg.Acquire(good).HasValue()) << "rejected: " << good;
  }
}

TEST(Utf8, ValidatorBoundaries) {
  EXPECT_TRUE(boundary::IsValidUtf8("", 0));
  EXPECT_TRUE(boundary::IsValidUtf8("\xDF\xBF", 2));
  EXPECT_FALSE(boundary::IsValidUtf8("\xC1\xBF", 2));          // overlong
  EXPECT_FALSE(boundary::IsValidUtf8("\xE0\x9F\xBF", 3));      // overlong
  EXPECT_TRUE(boundary::IsValidUtf8("\xED\x9F\xBF", 3));       // U+D7FF
  EXPECT_FALSE(boundary::IsValidUtf8("\xF4\x90\x80\x80", 4));  // > U+10FFFF
  EXPECT_FALSE(boundary::IsValidUtf8("\xE2\x28\xA1", 3));
}

TEST(RegistryConfig, ValidationCanBeDisabled) {
  BoundaryConfig cfg;
  cfg.validate_utf8 = false;
  PositionIdRegistry reg(cfg);

  auto r = reg.Acquire("\xFF\xFE");
  ASSERT_TRUE(r.HasValue());
  EXPECT_EQ(reg.Borrow(*r).Value()->Value(), std::string("\xFF\xFE"));
}

TEST(RegistryConfig, CapacityLimitsLiveIdentifiers) {
  BoundaryConfig cfg;
  cfg.max_live_ids = 2;
  PositionIdRegistry reg(cfg);

  auto a = reg.Acquire("P-1");
  auto b = reg.Acquire("P-2");
  ASSERT_TRUE(a && b);

  auto c = reg.Acquire("P-3");
  ASSERT_FALSE(c.HasValue());
  EXPECT_EQ(c.Error().value, IdentifierErrc::kCapacityExceeded);

  ASSERT_TRUE(reg.Release(*a).HasValue());
  EXPECT_TRUE(reg.Acquire("P-3").HasValue());
}

TEST(RegistryConfig, ConfigureRaisesLimitForLaterCalls) {
  BoundaryConfig cfg;
  cfg.max_live_ids = 1;
  PositionIdRegistry reg(cfg);
  ASSERT_TRUE(reg.Acquire("P-1").HasValue());
  ASSERT_FALSE(reg.Acquire("P-2").HasValue());

  cfg.max_live_ids = 0;
  reg.Configure(cfg);
  EXPECT_TRUE(reg.Acquire("P-2").HasValue());
  EXPECT_EQ(reg.Size(), 2u);
}

TEST_F(RegistryTest, AdoptTakesOwnershipOfExistingValue) {
  identifiers::PositionId id("P-555");
  auto h = reg.Adopt(std::move(id));
  ASSERT_TRUE(h.HasValue());

  auto view = reg.Borrow(*h);
  ASSERT_TRUE(view.HasValue());
  EXPECT_EQ(view.Value()->ToString(), "P-555");
  EXPECT_TRUE(reg.Release(*h).HasValue());
}

TEST_F(RegistryTest, RejectedCallsAreLoggedAsWarnings) {
  auto sink = std::make_shared<CaptureSink>();
  LogManager::Instance().SetGlobalIds("ECU1", "TRID");
  LogManager::Instance().SetDefaultLevel(LogLevel::kWarn);
  LogManager::Instance().AddSink(sink);
  reg.Configure(BoundaryConfig{});  // re-snapshot sinks
  sink->records.clear();            // drop the configure notice, if any

  auto h = reg.Acquire("P-9");
  ASSERT_TRUE(h.HasValue());
  EXPECT_TRUE(sink->records.empty());  // verbose traffic filtered at kWarn

  ASSERT_TRUE(reg.Release(*h).HasValue());
  ASSERT_FALSE(reg.Release(*h).HasValue());

  ASSERT_EQ(sink->records.size(), 1u);
  const auto& r = sink->records.back();
  EXPECT_EQ(r.ctx_id, "PSID");
  EXPECT_EQ(r.level, LogLevel::kWarn);
  EXPECT_NE(r.message.find(std::to_string(*h)), std::string::npos);

  LogManager::Instance().ClearSinks();
}

TEST_F(RegistryTest, SinksMayCallBackIntoTheTable) {
  struct ReentrantSink : ISink {
    const PositionIdRegistry* reg = nullptr;
    std::vector<std::size_t> sizes;
    void write(const LogRecord&) noexcept override { sizes.push_back(reg->Size()); }
  };
  auto sink = std::make_shared<ReentrantSink>();
  sink->reg = &reg;
  LogManager::Instance().SetDefaultLevel(LogLevel::kVerbose);
  LogManager::Instance().AddSink(sink);
  reg.Configure(BoundaryConfig{});  // logs at info

  auto h = reg.Acquire("P-1");      // verbose
  ASSERT_TRUE(h.HasValue());
  ASSERT_TRUE(reg.Release(*h).HasValue());  // verbose
  EXPECT_FALSE(reg.Release(*h).HasValue()); // warn
  EXPECT_FALSE(reg.Borrow(*h).HasValue());
  EXPECT_FALSE(reg.Hash(*h).HasValue());
  EXPECT_FALSE(reg.Equals(*h, *h).HasValue());
  EXPECT_FALSE(reg.Acquire(nullptr).HasValue());
  EXPECT_FALSE(reg.Acquire("\xFF").HasValue());

  LogManager::Instance().ClearSinks();
  LogManager::Instance().SetDefaultLevel(LogLevel::kInfo);

  const std::vector<std::size_t> expected{0, 1, 0, 0, 0, 0, 0, 0, 0};
  EXPECT_EQ(sink->sizes, expected);
}

TEST(RegistryConfig, CapacityWarningMayCallBackIntoTheTable) {
  struct ReentrantSink : ISink {
    const PositionIdRegistry* reg = nullptr;
    std::vector<std::size_t> sizes;
    void write(const LogRecord&) noexcept override { sizes.push_back(reg->Size()); }
  };
  LogManager::Instance().ClearSinks();
  LogManager::Instance().SetDefaultLevel(LogLevel::kWarn);
  auto sink = std::make_shared<ReentrantSink>();
  LogManager::Instance().AddSink(sink);

  BoundaryConfig cfg;
  cfg.max_live_ids = 1;
  PositionIdRegistry reg(cfg);
  sink->reg = &reg;

  ASSERT_TRUE(reg.Acquire("P-1").HasValue());
  auto r = reg.Acquire("P-2");
  ASSERT_FALSE(r.HasValue());
  EXPECT_EQ(r.Error().value, IdentifierErrc::kCapacityExceeded);

  LogManager::Instance().ClearSinks();
  LogManager::Instance().SetDefaultLevel(LogLevel::kInfo);
  ASSERT_EQ(sink->sizes.size(), 1u);
  EXPECT_EQ(sink->sizes[0], 1u);
}

TEST_F(RegistryTest, ConcurrentAcquireReleaseKeepsTableConsistent) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 200;
  std::vector<std::vector<PositionIdRegistry::Handle>> issued(kThreads);
  std::vector<std::thread> workers;

  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const std::string text = "P-" + std::to_string(t) + "-" + std::to_string(i);
        auto h = reg.Acquire(text.c_str());
        if (!h) continue;
        issued[t].push_back(*h);
        auto eq = reg.Equals(*h, *h);
        if (!eq || !*eq) issued[t].push_back(PositionIdRegistry::kInvalidHandle);
      }
    });
  }
  for (auto& w : workers) w.join();

  std::vector<PositionIdRegistry::Handle> all;
  for (const auto& v : issued) all.insert(all.end(), v.begin(), v.end());
  ASSERT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
  std::sort(all.begin(), all.end());
  EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
  EXPECT_EQ(reg.Size(), all.size());

  for (auto h : all) EXPECT_TRUE(reg.Release(h).HasValue());
  EXPECT_EQ(reg.Size(), 0u);
}
