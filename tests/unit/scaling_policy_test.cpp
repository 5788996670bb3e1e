#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

#include "internal/policy/scaling_policy.hpp"
#include "internal/util/errors.hpp"

namespace {

using fleet::model::QueueMetrics;
using fleet::model::ScalingAction;
using fleet::model::ScalingConfig;
using fleet::policy::ScalingPolicy;

ScalingConfig NoThresholds() {
  ScalingConfig cfg;
  cfg.min_runners          = 0;
  cfg.max_runners          = 10;
  cfg.jobs_per_runner      = 2;
  cfg.scale_up_threshold   = 0;
  cfg.scale_down_threshold = 0;
  cfg.cooldown             = std::chrono::seconds(300);
  return cfg;
}

QueueMetrics Pending(int pending) {
  QueueMetrics m;
  m.pending = pending;
  m.queued  = pending;
  m.total   = pending;
  return m;
}

const auto kNow = fleet::util::FromUnixMillis(1'700'000'000'000);

void TestScaleUpRoundsUp() {
  const auto d = ScalingPolicy::Decide(Pending(5), 0, NoThresholds(), std::nullopt, kNow);
  assert(d.action == ScalingAction::kScaleUp);
  assert(d.target_runner_count == 3);
  assert(d.current_runner_count == 0);
  assert(d.reason.find("5 pending") != std::string::npos);
}

void TestScaleDownToMin() {
  const auto d = ScalingPolicy::Decide(Pending(0), 3, NoThresholds(), std::nullopt, kNow);
  assert(d.action == ScalingAction::kScaleDown);
  assert(d.target_runner_count == 0);
}

void TestCooldownHoldsSecondDecision() {
  const auto cfg   = NoThresholds();
  const auto first = ScalingPolicy::Decide(Pending(5), 0, cfg, std::nullopt, kNow);
  assert(first.action == ScalingAction::kScaleUp);

  const auto second = ScalingPolicy::Decide(Pending(5), 0, cfg, kNow, kNow + std::chrono::seconds(10));
  assert(second.action == ScalingAction::kMaintain);
  assert(second.target_runner_count == 0);
  assert(second.reason.find("cooldown") != std::string::npos);
  assert(second.reason.find("290s") != std::string::npos);

  const auto expired = ScalingPolicy::Decide(Pending(5), 0, cfg, kNow, kNow + std::chrono::seconds(300));
  assert(expired.action == ScalingAction::kScaleUp);
}

void TestTargetClampsToMax() {
  const auto d = ScalingPolicy::Decide(Pending(100), 0, NoThresholds(), std::nullopt, kNow);
  assert(d.action == ScalingAction::kScaleUp);
  assert(d.target_runner_count == 10);
}

void TestTargetClampsToMin() {
  auto cfg        = NoThresholds();
  cfg.min_runners = 2;
  const auto d    = ScalingPolicy::Decide(Pending(0), 2, cfg, std::nullopt, kNow);
  assert(d.action == ScalingAction::kMaintain);
  assert(d.target_runner_count == 2);

  const auto up = ScalingPolicy::Decide(Pending(0), 0, cfg, std::nullopt, kNow);
  assert(up.action == ScalingAction::kScaleUp);
  assert(up.target_runner_count == 2);
}

void TestDeadBandMaintains() {
  auto cfg                 = NoThresholds();
  cfg.scale_up_threshold   = 2;
  cfg.scale_down_threshold = 1;

  // target 3 is not more than current 1 + 2
  auto d = ScalingPolicy::Decide(Pending(6), 1, cfg, std::nullopt, kNow);
  assert(d.action == ScalingAction::kMaintain);
  assert(d.target_runner_count == 3);
  assert(d.reason.find("within thresholds") != std::string::npos);

  d = ScalingPolicy::Decide(Pending(8), 1, cfg, std::nullopt, kNow);
  assert(d.action == ScalingAction::kScaleUp);
  assert(d.target_runner_count == 4);

  // target 2 is not below current 3 - 1
  d = ScalingPolicy::Decide(Pending(4), 3, cfg, std::nullopt, kNow);
  assert(d.action == ScalingAction::kMaintain);

  d = ScalingPolicy::Decide(Pending(2), 3, cfg, std::nullopt, kNow);
  assert(d.action == ScalingAction::kScaleDown);
  assert(d.target_runner_count == 1);
}

void TestDecideIsDeterministic() {
  const auto cfg = NoThresholds();
  const auto a   = ScalingPolicy::Decide(Pending(7), 1, cfg, kNow - std::chrono::hours(1), kNow);
  const auto b   = ScalingPolicy::Decide(Pending(7), 1, cfg, kNow - std::chrono::hours(1), kNow);
  assert(a.action == b.action);
  assert(a.target_runner_count == b.target_runner_count);
  assert(a.reason == b.reason);
}

void TestInvalidInputsRejected() {
  auto cfg            = NoThresholds();
  cfg.jobs_per_runner = 0;
  bool threw          = false;
  try {
    ScalingPolicy::Decide(Pending(1), 0, cfg, std::nullopt, kNow);
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ScalingPolicy::Decide(Pending(1), -1, NoThresholds(), std::nullopt, kNow);
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    ScalingPolicy::DecideManual(-3, 0, NoThresholds(), std::nullopt, kNow);
  } catch (const fleet::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestManualScaleClampsWithoutDeadBand() {
  auto cfg               = NoThresholds();
  cfg.scale_up_threshold = 5;

  auto d = ScalingPolicy::DecideManual(2, 1, cfg, std::nullopt, kNow);
  assert(d.action == ScalingAction::kScaleUp);
  assert(d.target_runner_count == 2);
  assert(d.reason.find("manual") != std::string::npos);

  d = ScalingPolicy::DecideManual(50, 1, cfg, std::nullopt, kNow);
  assert(d.target_runner_count == 10);

  d = ScalingPolicy::DecideManual(0, 4, cfg, std::nullopt, kNow);
  assert(d.action == ScalingAction::kScaleDown);
  assert(d.target_runner_count == 0);

  d = ScalingPolicy::DecideManual(4, 4, cfg, std::nullopt, kNow);
  assert(d.action == ScalingAction::kMaintain);

  d = ScalingPolicy::DecideManual(8, 4, cfg, kNow, kNow + std::chrono::seconds(1));
  assert(d.action == ScalingAction::kMaintain);
  assert(d.reason.find("cooldown") != std::string::npos);
}

} // namespace

int main() {
  TestScaleUpRoundsUp();
  TestScaleDownToMin();
  TestCooldownHoldsSecondDecision();
  TestTargetClampsToMax();
  TestTargetClampsToMin();
  TestDeadBandMaintains();
  TestDecideIsDeterministic();
  TestInvalidInputsRejected();
  TestManualScaleClampsWithoutDeadBand();

  std::cout << "runner_fleet_unit_scaling_policy: pass\n";
  return 0;
}
