/**
 * @file EnergyCounterAdapter_uTest.cpp
 * @brief Unit tests for wattmeter::sampling::EnergyCounterAdapter.
 *
 * Notes:
 *  - A scripted counter supplies values and read times; no hardware involved.
 */

#include "src/sampling/inc/EnergyCounterAdapter.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

using wattmeter::sampling::CounterReadResult;
using wattmeter::sampling::counterDelta;
using wattmeter::sampling::EnergyCounter;
using wattmeter::sampling::EnergyCounterAdapter;
using wattmeter::sampling::EnergyCounterConfig;
using wattmeter::sampling::SampleResult;
using wattmeter::sampling::SourceError;

namespace {

using Steady = std::chrono::steady_clock;

/// Counter that replays queued reads.
class ScriptedCounter final : public EnergyCounter {
public:
  ScriptedCounter(std::uint64_t wrapMax, double joulesPerUnit) {
    config_.wrapMax = wrapMax;
    config_.joulesPerUnit = joulesPerUnit;
  }

  /// Queue a successful read at base + @p ms.
  void pushValue(std::uint64_t value, long long ms) {
    CounterReadResult r{};
    r.sample.value = value;
    r.sample.readTime = base_ + std::chrono::milliseconds{ms};
    r.metadata["domain"] = std::string("package-0");
    script_.push_back(r);
  }

  void pushError(SourceError error) {
    CounterReadResult r{};
    r.error = error;
    r.detail = "scripted failure";
    script_.push_back(r);
  }

  CounterReadResult readCounter() override {
    CounterReadResult r = script_.front();
    script_.pop_front();
    return r;
  }

  EnergyCounterConfig counterConfig() const noexcept override { return config_; }
  std::string_view kind() const noexcept override { return "scripted"; }

private:
  const Steady::time_point base_{Steady::now()};
  EnergyCounterConfig config_{};
  std::deque<CounterReadResult> script_{};
};

/// Adapter plus a raw handle to its counter.
struct Rig {
  ScriptedCounter* counter{nullptr};
  std::unique_ptr<EnergyCounterAdapter> adapter{};
};

Rig makeRig(std::uint64_t wrapMax, double joulesPerUnit = 1.0) {
  auto counter = std::make_unique<ScriptedCounter>(wrapMax, joulesPerUnit);
  Rig rig{};
  rig.counter = counter.get();
  rig.adapter = std::make_unique<EnergyCounterAdapter>(std::move(counter));
  return rig;
}

} // namespace

/* ----------------------------- counterDelta ----------------------------- */

/** @test Increasing values difference directly. */
TEST(CounterDeltaTest, NoWrap) {
  EXPECT_EQ(counterDelta(1000, 1500, 1600), 500U);
  EXPECT_EQ(counterDelta(7, 7, 1600), 0U);
}

/** @test A decrease is corrected as one wrap. */
TEST(CounterDeltaTest, Wrap) {
  EXPECT_EQ(counterDelta(1500, 200, 1600), 300U);
  EXPECT_EQ(counterDelta(1600, 0, 1600), 0U);
  EXPECT_EQ(counterDelta(UINT64_MAX - 10, 5, UINT64_MAX), 15U);
}

/* ----------------------------- Adapter ----------------------------- */

/** @test First read stores a baseline and reports UNAVAILABLE. */
TEST(EnergyCounterAdapterTest, FirstReadUnavailable) {
  Rig rig = makeRig(1600);
  rig.counter->pushValue(1000, 0);

  EXPECT_FALSE(rig.adapter->hasBaseline());
  const SampleResult R = rig.adapter->read();
  EXPECT_EQ(R.error, SourceError::UNAVAILABLE);
  EXPECT_TRUE(rig.adapter->hasBaseline());
}

/** @test Counter 1000, 1500, 200 (wrap 1600) at 1 s steps gives 500 W then 300 W. */
TEST(EnergyCounterAdapterTest, DerivesPowerAcrossWrap) {
  Rig rig = makeRig(1600);
  rig.counter->pushValue(1000, 0);
  rig.counter->pushValue(1500, 1000);
  rig.counter->pushValue(200, 2000);

  EXPECT_EQ(rig.adapter->read().error, SourceError::UNAVAILABLE);

  const SampleResult FIRST = rig.adapter->read();
  ASSERT_TRUE(FIRST.ok()) << FIRST.detail;
  EXPECT_NEAR(FIRST.powerWatts, 500.0, 1e-9);
  EXPECT_FALSE(std::get<bool>(FIRST.metadata.at("counter_wrapped")));

  const SampleResult SECOND = rig.adapter->read();
  ASSERT_TRUE(SECOND.ok()) << SECOND.detail;
  EXPECT_NEAR(SECOND.powerWatts, 300.0, 1e-9);
  EXPECT_TRUE(std::get<bool>(SECOND.metadata.at("counter_wrapped")));
  EXPECT_NEAR(std::get<double>(SECOND.metadata.at("energy_joules")), 300.0, 1e-9);
  EXPECT_NEAR(std::get<double>(SECOND.metadata.at("interval_s")), 1.0, 1e-9);
}

/** @test Unit conversion applies joulesPerUnit. */
TEST(EnergyCounterAdapterTest, MicrojouleUnits) {
  Rig rig = makeRig(262143328850ULL, 1e-6);
  rig.counter->pushValue(0, 0);
  rig.counter->pushValue(25'000'000, 500); // 25 J over 0.5 s

  (void)rig.adapter->read();
  const SampleResult R = rig.adapter->read();
  ASSERT_TRUE(R.ok());
  EXPECT_NEAR(R.powerWatts, 50.0, 1e-9);
}

/** @test Accessor metadata is passed through. */
TEST(EnergyCounterAdapterTest, PassesMetadataThrough) {
  Rig rig = makeRig(1600);
  rig.counter->pushValue(0, 0);
  rig.counter->pushValue(10, 100);
  (void)rig.adapter->read();
  const SampleResult R = rig.adapter->read();
  ASSERT_TRUE(R.ok());
  EXPECT_EQ(std::get<std::string>(R.metadata.at("domain")), "package-0");
}

/** @test Accessor errors propagate unchanged and keep the baseline. */
TEST(EnergyCounterAdapterTest, AccessorErrorPropagates) {
  Rig rig = makeRig(1600);
  rig.counter->pushValue(100, 0);
  rig.counter->pushError(SourceError::TRANSIENT);
  rig.counter->pushValue(300, 2000);

  (void)rig.adapter->read();
  EXPECT_EQ(rig.adapter->read().error, SourceError::TRANSIENT);

  const SampleResult R = rig.adapter->read();
  ASSERT_TRUE(R.ok());
  EXPECT_NEAR(R.powerWatts, 100.0, 1e-9); // 200 units over 2 s from the kept baseline
}

/** @test Zero elapsed time is TRANSIENT and re-baselines. */
TEST(EnergyCounterAdapterTest, NonPositiveIntervalTransient) {
  Rig rig = makeRig(1600);
  rig.counter->pushValue(100, 1000);
  rig.counter->pushValue(200, 1000);
  rig.counter->pushValue(400, 2000);

  (void)rig.adapter->read();
  EXPECT_EQ(rig.adapter->read().error, SourceError::TRANSIENT);

  const SampleResult R = rig.adapter->read();
  ASSERT_TRUE(R.ok());
  EXPECT_NEAR(R.powerWatts, 200.0, 1e-9);
}

/** @test A value above the wrap range is PERMANENT. */
TEST(EnergyCounterAdapterTest, ValueAboveWrapMaxPermanent) {
  Rig rig = makeRig(1600);
  rig.counter->pushValue(1601, 0);
  EXPECT_EQ(rig.adapter->read().error, SourceError::PERMANENT);
}

/** @test Invalid counter config is PERMANENT. */
TEST(EnergyCounterAdapterTest, InvalidConfigPermanent) {
  Rig rig = makeRig(0);
  EXPECT_EQ(rig.adapter->read().error, SourceError::PERMANENT);
}

/** @test A missing counter is PERMANENT. */
TEST(EnergyCounterAdapterTest, NullCounterPermanent) {
  EnergyCounterAdapter adapter(nullptr);
  EXPECT_EQ(adapter.read().error, SourceError::PERMANENT);
}

/** @test reset() forgets the baseline. */
TEST(EnergyCounterAdapterTest, ResetForgetsBaseline) {
  Rig rig = makeRig(1600);
  rig.counter->pushValue(100, 0);
  rig.counter->pushValue(200, 1000);

  (void)rig.adapter->read();
  rig.adapter->reset();
  EXPECT_FALSE(rig.adapter->hasBaseline());
  EXPECT_EQ(rig.adapter->read().error, SourceError::UNAVAILABLE);
}
