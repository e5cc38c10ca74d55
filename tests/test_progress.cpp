/**
 * @file test_progress.cpp
 * @brief Tests for progress deltas and the overall progress score
 */

#include "test_helpers.hpp"
#include <posture_analyzer/progress_tracker.hpp>

using namespace posture_analyzer;
using test_support::check;
using test_support::checkNear;

namespace {

MetricSnapshot snapshot(const std::string& date,
                        std::optional<double> weight,
                        std::optional<double> posture,
                        std::optional<double> shoulder) {
    MetricSnapshot s;
    s.date = date;
    s.weight_kg = weight;
    s.posture_score = posture;
    s.shoulder_slope_deg = shoulder;
    return s;
}

void testWeightLossAndPostureGain() {
    ProgressDeltaCalculator calc{Config()};
    auto p = calc.compute(snapshot("2024-01-01", 80.0, 6.0, 4.5),
                          snapshot("2024-02-01", 77.0, 7.0, -1.25));

    check(p.period_start == "2024-01-01", __LINE__);
    check(p.period_end == "2024-02-01", __LINE__);
    checkNear(*p.weight_change, -3.0, 1e-9, __LINE__);
    checkNear(*p.posture_score_change, 1.0, 1e-9, __LINE__);
    checkNear(*p.shoulder_improvement, 3.25, 1e-9, __LINE__);
    checkNear(p.overall_score, 7.0, 1e-9, __LINE__);
}

void testWeightGainIsNotPenalized() {
    ProgressDeltaCalculator calc{Config()};
    checkNear(calc.overallScore(2.0, 0.0), 5.0, 1e-12, __LINE__);
    checkNear(calc.overallScore(2.0, std::nullopt), 5.0, 1e-12, __LINE__);
}

void testContributionsAreCapped() {
    ProgressDeltaCalculator calc{Config()};
    checkNear(calc.overallScore(-10.0, 10.0), 10.0, 1e-12, __LINE__);
    checkNear(calc.overallScore(-10.0, std::nullopt), 7.5, 1e-12, __LINE__);
}

void testScoreClampedAtMinimum() {
    ProgressDeltaCalculator calc{Config()};
    checkNear(calc.overallScore(std::nullopt, -20.0), 1.0, 1e-12, __LINE__);
    checkNear(calc.overallScore(std::nullopt, -3.0), 3.5, 1e-12, __LINE__);
}

void testMissingValuesLeaveDeltasUnset() {
    ProgressDeltaCalculator calc{Config()};
    auto p = calc.compute(snapshot("2024-01-01", std::nullopt, 6.0, std::nullopt),
                          snapshot("2024-02-01", 75.0, std::nullopt, 2.0));

    check(!p.weight_change.has_value(), __LINE__);
    check(!p.posture_score_change.has_value(), __LINE__);
    check(!p.shoulder_improvement.has_value(), __LINE__);
    checkNear(p.overall_score, 5.0, 1e-12, __LINE__);
}

void testDeltasAreRounded() {
    ProgressDeltaCalculator calc{Config()};
    auto p = calc.compute(snapshot("a", 80.04, 6.01, 3.333),
                          snapshot("b", 78.0, 6.33, 1.111));

    checkNear(*p.weight_change, -2.0, 1e-9, __LINE__);
    checkNear(*p.posture_score_change, 0.3, 1e-9, __LINE__);
    checkNear(*p.shoulder_improvement, 2.22, 1e-9, __LINE__);
}

} // namespace

int main() {
    return test_support::runAll("PROGRESS", {
        {"weight loss and posture gain", testWeightLossAndPostureGain},
        {"weight gain is not penalized", testWeightGainIsNotPenalized},
        {"contributions are capped", testContributionsAreCapped},
        {"score clamped at minimum", testScoreClampedAtMinimum},
        {"missing values leave deltas unset", testMissingValuesLeaveDeltasUnset},
        {"deltas are rounded", testDeltasAreRounded}
    });
}
