/**
 * @file test_scoring_and_recommendations.cpp
 * @brief Tests for the posture score and the recommendation rules
 */

#include "test_helpers.hpp"
#include <posture_analyzer/posture_scorer.hpp>
#include <posture_analyzer/recommendation_engine.hpp>

using namespace posture_analyzer;
using test_support::check;
using test_support::checkNear;

namespace {

PairAlignmentMetrics pair(double slope_deg, bool imbalance) {
    PairAlignmentMetrics m;
    m.slope_deg = slope_deg;
    m.height_diff_px = imbalance ? 20.0 : 0.0;
    m.span_px = 200.0;
    m.has_imbalance = imbalance;
    m.confidence = 0.9;
    return m;
}

HeadMetrics head(double tilt_deg, bool forward) {
    HeadMetrics m;
    m.tilt_deg = tilt_deg;
    m.offset_x_px = forward ? 40.0 : 0.0;
    m.offset_y_px = -150.0;
    m.forward_head = forward;
    m.confidence = 0.9;
    return m;
}

KneeMetrics knee(double indicator, bool valgus) {
    KneeMetrics m;
    m.valgus_indicator = indicator;
    m.has_valgus = valgus;
    m.knee_distance_px = 60.0;
    m.ankle_distance_px = 120.0;
    m.hip_distance_px = 120.0;
    m.confidence = 0.9;
    return m;
}

PostureMetrics allFlagsRaised() {
    PostureMetrics m;
    m.shoulder = pair(10.0, true);
    m.head = head(20.0, true);
    m.hip = pair(6.0, true);
    m.knee = knee(40.0, true);
    return m;
}

// ============================================================================
// Score
// ============================================================================

void testPerfectPostureScoresMax() {
    PostureScorer scorer{Config()};
    PostureMetrics m;
    m.shoulder = pair(0.0, false);
    m.hip = pair(0.0, false);
    m.head = head(0.0, false);
    m.knee = knee(0.0, false);
    checkNear(*scorer.score(m), 10.0, 1e-12, __LINE__);
}

void testFlagPenaltyStacksOnSlope() {
    PostureScorer scorer{Config()};
    PostureMetrics m;

    m.shoulder = pair(10.0, false);
    checkNear(*scorer.score(m), 8.0, 1e-9, __LINE__);

    m.shoulder = pair(10.0, true);
    checkNear(*scorer.score(m), 7.0, 1e-9, __LINE__);

    auto p = scorer.penalties(m);
    checkNear(p.at("shoulder_slope"), 2.0, 1e-12, __LINE__);
    checkNear(p.at("shoulder_imbalance"), 1.0, 1e-12, __LINE__);
    check(p.count("hip_slope") == 0, __LINE__);
}

void testPenaltiesAreCapped() {
    PostureScorer scorer{Config()};
    PostureMetrics m;
    m.shoulder = pair(-45.0, false);
    m.hip = pair(45.0, false);
    m.head = head(-45.0, false);
    m.knee = knee(100.0, false);

    auto p = scorer.penalties(m);
    checkNear(p.at("shoulder_slope"), 2.5, 1e-12, __LINE__);
    checkNear(p.at("hip_slope"), 2.0, 1e-12, __LINE__);
    checkNear(p.at("head_tilt"), 1.5, 1e-12, __LINE__);
    checkNear(p.at("knee_valgus"), 1.5, 1e-12, __LINE__);
    checkNear(*scorer.score(m), 2.5, 1e-9, __LINE__);
}

void testScoreStaysWithinBounds() {
    PostureScorer scorer{Config()};
    PostureMetrics m;
    m.shoulder = pair(90.0, true);
    m.hip = pair(90.0, true);
    m.head = head(90.0, true);
    m.knee = knee(100.0, true);

    double s = *scorer.score(m);
    check(s >= 1.0 && s <= 10.0, __LINE__);
    checkNear(s, 1.0, 1e-12, __LINE__);
}

void testScoreRoundedToOneDecimal() {
    PostureScorer scorer{Config()};
    PostureMetrics m;
    m.shoulder = pair(2.86, false);  // penalty 0.572
    checkNear(*scorer.score(m), 9.4, 1e-9, __LINE__);
}

void testScoreIsDeterministic() {
    PostureScorer scorer{Config()};
    auto m = allFlagsRaised();
    check(*scorer.score(m) == *scorer.score(m), __LINE__);
}

void testEmptyMetricsAreUnscored() {
    PostureScorer scorer{Config()};
    check(!scorer.score(PostureMetrics()).has_value(), __LINE__);
}

void testCombineViews() {
    checkNear(*PostureScorer::combineViews(8.0, 6.0), 7.0, 1e-12, __LINE__);
    checkNear(*PostureScorer::combineViews(7.5, 7.2), 7.35, 1e-12, __LINE__);
    checkNear(*PostureScorer::combineViews(8.0, std::nullopt), 8.0, 1e-12, __LINE__);
    checkNear(*PostureScorer::combineViews(std::nullopt, 4.0), 4.0, 1e-12, __LINE__);
    check(!PostureScorer::combineViews(std::nullopt, std::nullopt).has_value(), __LINE__);
}

// ============================================================================
// Recommendations
// ============================================================================

void testRuleOrderAndContent() {
    RecommendationEngine engine;
    auto recs = engine.generate(allFlagsRaised());

    check(recs.size() == 4, __LINE__);
    check(recs[0].title == "Shoulder imbalance correction", __LINE__);
    check(recs[0].priority == Priority::HIGH, __LINE__);
    check(recs[0].category == RecommendationCategory::POSTURE, __LINE__);
    check(recs[0].description.find("10.0") != std::string::npos, __LINE__);
    check(recs[0].action_steps.size() == 4, __LINE__);

    check(recs[1].title == "Forward head posture correction", __LINE__);
    check(recs[1].priority == Priority::MEDIUM, __LINE__);

    check(recs[2].title == "Pelvic position correction", __LINE__);
    check(recs[2].priority == Priority::MEDIUM, __LINE__);

    check(recs[3].title == "Knee valgus correction", __LINE__);
    check(recs[3].category == RecommendationCategory::EXERCISE, __LINE__);
    check(recs[3].priority == Priority::HIGH, __LINE__);

    for (const auto& rec : recs) {
        check(!rec.is_fallback, __LINE__);
        check(!rec.is_completed, __LINE__);
    }
}

void testNormalRangeFallback() {
    RecommendationEngine engine;
    PostureMetrics m;
    m.shoulder = pair(1.0, false);
    m.head = head(2.0, false);

    auto recs = engine.generate(m);
    check(recs.size() == 1, __LINE__);
    check(recs[0].is_fallback, __LINE__);
    check(recs[0].priority == Priority::LOW, __LINE__);
    check(recs[0].title == "Posture within normal range", __LINE__);
    check(recs[0].action_steps.size() == 3, __LINE__);
}

void testNoDetectionFallback() {
    auto rec = makeFallbackRecommendation(FallbackReason::NO_DETECTION);
    check(rec.is_fallback, __LINE__);
    check(rec.category == RecommendationCategory::POSTURE, __LINE__);
    check(rec.priority == Priority::LOW, __LINE__);
    check(rec.title == "Basic recommendation", __LINE__);
    check(rec.action_steps.size() == 2, __LINE__);
}

void testCapKeepsRuleOrder() {
    RecommendationEngine engine;
    auto recs = engine.generate(allFlagsRaised());
    auto capped = capRecommendations(recs, 3);

    check(capped.size() == 3, __LINE__);
    check(capped[0].title == recs[0].title, __LINE__);
    check(capped[2].title == recs[2].title, __LINE__);
    check(capRecommendations(recs, 10).size() == 4, __LINE__);
}

void testRecommendationLifecycle() {
    auto rec = makeFallbackRecommendation(FallbackReason::NORMAL_RANGE);
    rec.expires_at = 1000.0;

    check(rec.isActive(999.0), __LINE__);
    check(rec.isExpired(1000.0), __LINE__);
    check(!rec.isActive(1000.0), __LINE__);

    auto done = makeFallbackRecommendation(FallbackReason::NORMAL_RANGE);
    done.markCompleted(500.0);
    check(done.is_completed, __LINE__);
    check(*done.completed_at == 500.0, __LINE__);
    check(!done.isActive(600.0), __LINE__);

    auto open = makeFallbackRecommendation(FallbackReason::NO_DETECTION);
    auto active = activeRecommendations({rec, done, open}, 1200.0);
    check(active.size() == 1, __LINE__);
    check(active[0].title == "Basic recommendation", __LINE__);
}

} // namespace

int main() {
    return test_support::runAll("SCORING AND RECOMMENDATIONS", {
        {"perfect posture scores max", testPerfectPostureScoresMax},
        {"flag penalty stacks on slope", testFlagPenaltyStacksOnSlope},
        {"penalties are capped", testPenaltiesAreCapped},
        {"score stays within bounds", testScoreStaysWithinBounds},
        {"score rounded to one decimal", testScoreRoundedToOneDecimal},
        {"score is deterministic", testScoreIsDeterministic},
        {"empty metrics are unscored", testEmptyMetricsAreUnscored},
        {"combine views", testCombineViews},
        {"rule order and content", testRuleOrderAndContent},
        {"normal range fallback", testNormalRangeFallback},
        {"no detection fallback", testNoDetectionFallback},
        {"cap keeps rule order", testCapKeepsRuleOrder},
        {"recommendation lifecycle", testRecommendationLifecycle}
    });
}
