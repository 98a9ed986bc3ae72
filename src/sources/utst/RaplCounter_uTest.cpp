/**
 * @file RaplCounter_uTest.cpp
 * @brief Unit tests for wattmeter::sources powercap counters.
 *
 * Notes:
 *  - A fake powercap tree is built under the system temp path.
 *  - The last test touches the real /sys/class/powercap and tolerates its absence.
 */

#include "src/sources/inc/RaplCounter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

using wattmeter::sampling::CounterReadResult;
using wattmeter::sampling::SampleResult;
using wattmeter::sampling::SourceError;
using wattmeter::sources::discoverRaplDomains;
using wattmeter::sources::makeRaplPowerSource;
using wattmeter::sources::RaplCounter;
using wattmeter::sources::RaplDomain;
using wattmeter::sources::readRaplDomain;

class RaplCounterTest : public ::testing::Test {
protected:
  fs::path root_{};

  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("wattmeter_powercap_" + std::to_string(::getpid()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void writeAttr(const fs::path& dir, const std::string& attr, const std::string& value) {
    fs::create_directories(dir);
    std::ofstream(dir / attr) << value << "\n";
  }

  fs::path makeZone(const std::string& zone, const std::string& name, std::uint64_t energy,
                    std::uint64_t range) {
    const fs::path DIR = root_ / zone;
    writeAttr(DIR, "name", name);
    writeAttr(DIR, "energy_uj", std::to_string(energy));
    writeAttr(DIR, "max_energy_range_uj", std::to_string(range));
    return DIR;
  }
};

/* ----------------------------- Discovery ----------------------------- */

/** @test Zones with counters are found and sorted; others are skipped. */
TEST_F(RaplCounterTest, DiscoversZones) {
  makeZone("intel-rapl:1", "package-1", 10, 1000);
  makeZone("intel-rapl:0", "package-0", 10, 1000);
  makeZone("intel-rapl:0:0", "core", 10, 1000);
  makeZone("dtpm", "dtpm", 10, 1000);                 // wrong prefix
  writeAttr(root_ / "intel-rapl", "enabled", "1");    // control type, no counter
  writeAttr(root_ / "intel-rapl:2", "energy_uj", "5"); // no wrap range

  const auto DOMAINS = discoverRaplDomains(root_.string());
  ASSERT_EQ(DOMAINS.size(), 3U);
  EXPECT_EQ(DOMAINS[0].zone, "intel-rapl:0");
  EXPECT_EQ(DOMAINS[1].zone, "intel-rapl:0:0");
  EXPECT_EQ(DOMAINS[2].zone, "intel-rapl:1");
  EXPECT_EQ(DOMAINS[0].name, "package-0");
  EXPECT_EQ(DOMAINS[0].maxEnergyRangeUj, 1000U);
  EXPECT_EQ(DOMAINS[1].monitorName(), "rapl:core");
}

/** @test A missing root yields no domains. */
TEST_F(RaplCounterTest, MissingRoot) {
  EXPECT_TRUE(discoverRaplDomains((root_ / "absent").string()).empty());
}

/** @test readRaplDomain() rejects a zero wrap range. */
TEST_F(RaplCounterTest, ZeroRangeRejected) {
  const fs::path DIR = makeZone("intel-rapl:0", "package-0", 1, 0);
  EXPECT_FALSE(readRaplDomain(DIR.string()).has_value());
}

/* ----------------------------- Counter ----------------------------- */

/** @test Counter reads carry value, config, and metadata. */
TEST_F(RaplCounterTest, ReadsCounter) {
  const fs::path DIR = makeZone("intel-rapl:0", "package-0", 123456, 262143328850ULL);
  const auto DOMAIN = readRaplDomain(DIR.string());
  ASSERT_TRUE(DOMAIN.has_value());

  RaplCounter counter(*DOMAIN);
  const CounterReadResult R = counter.readCounter();
  ASSERT_TRUE(R.ok()) << R.detail;
  EXPECT_EQ(R.sample.value, 123456U);
  EXPECT_EQ(std::get<std::string>(R.metadata.at("domain")), "package-0");
  EXPECT_EQ(counter.counterConfig().wrapMax, 262143328850ULL);
  EXPECT_DOUBLE_EQ(counter.counterConfig().joulesPerUnit, 1e-6);
}

/** @test A vanished counter file is PERMANENT; garbage content is TRANSIENT. */
TEST_F(RaplCounterTest, ReadErrorsClassified) {
  const fs::path DIR = makeZone("intel-rapl:0", "package-0", 1, 1000);
  const auto DOMAIN = readRaplDomain(DIR.string());
  ASSERT_TRUE(DOMAIN.has_value());
  RaplCounter counter(*DOMAIN);

  writeAttr(DIR, "energy_uj", "busy");
  EXPECT_EQ(counter.readCounter().error, SourceError::TRANSIENT);

  fs::remove(DIR / "energy_uj");
  EXPECT_EQ(counter.readCounter().error, SourceError::PERMANENT);
}

/** @test The power source reports UNAVAILABLE first, then watts from the delta. */
TEST_F(RaplCounterTest, PowerSourceDerivesWatts) {
  const fs::path DIR = makeZone("intel-rapl:0", "package-0", 1'000'000, 1'000'000'000);
  const auto DOMAIN = readRaplDomain(DIR.string());
  ASSERT_TRUE(DOMAIN.has_value());
  auto source = makeRaplPowerSource(*DOMAIN);
  EXPECT_EQ(source->kind(), "rapl");

  EXPECT_EQ(source->read().error, SourceError::UNAVAILABLE);

  std::this_thread::sleep_for(std::chrono::milliseconds{100});
  writeAttr(DIR, "energy_uj", "2000000"); // +1 J

  const SampleResult R = source->read();
  ASSERT_TRUE(R.ok()) << R.detail;
  // 1 J over ~0.1 s; sleep overshoot only lowers the figure
  EXPECT_GT(R.powerWatts, 1.0);
  EXPECT_LE(R.powerWatts, 10.5);
  EXPECT_NEAR(std::get<double>(R.metadata.at("energy_joules")), 1.0, 1e-9);
}

/** @test The power source handles a wrap. */
TEST_F(RaplCounterTest, PowerSourceHandlesWrap) {
  const fs::path DIR = makeZone("intel-rapl:0", "package-0", 900, 1000);
  const auto DOMAIN = readRaplDomain(DIR.string());
  ASSERT_TRUE(DOMAIN.has_value());
  auto source = makeRaplPowerSource(*DOMAIN);

  (void)source->read();
  std::this_thread::sleep_for(std::chrono::milliseconds{10});
  writeAttr(DIR, "energy_uj", "100");

  const SampleResult R = source->read();
  ASSERT_TRUE(R.ok()) << R.detail;
  EXPECT_TRUE(std::get<bool>(R.metadata.at("counter_wrapped")));
  EXPECT_NEAR(std::get<double>(R.metadata.at("energy_joules")), 200e-6, 1e-12);
}

/* ----------------------------- Live System ----------------------------- */

/** @test Discovery on the running system never fails. */
TEST(RaplCounterLiveTest, DiscoveryDoesNotFail) {
  const auto DOMAINS = discoverRaplDomains();
  if (DOMAINS.empty()) {
    GTEST_LOG_(INFO) << "No powercap domains on this system";
  }
  for (const RaplDomain& D : DOMAINS) {
    EXPECT_GT(D.maxEnergyRangeUj, 0U);
    EXPECT_FALSE(D.toString().empty());
  }
}
