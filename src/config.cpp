/**
 * @file config.cpp
 * @brief JSON loading and dumping for Config
 */

#include "posture_analyzer/config.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace posture_analyzer {

namespace {

template <typename T>
void overrideIfPresent(const nlohmann::json& j, const char* key, T& field) {
    if (j.contains(key)) {
        field = j.at(key).get<T>();
    }
}

} // namespace

Config configFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config JSON must be an object");
    }

    Config cfg;

    overrideIfPresent(j, "shoulder_imbalance_px", cfg.shoulder_imbalance_px);
    overrideIfPresent(j, "hip_imbalance_px", cfg.hip_imbalance_px);
    overrideIfPresent(j, "forward_head_px", cfg.forward_head_px);
    overrideIfPresent(j, "knee_valgus_threshold", cfg.knee_valgus_threshold);

    overrideIfPresent(j, "score_max", cfg.score_max);
    overrideIfPresent(j, "score_min", cfg.score_min);
    overrideIfPresent(j, "no_detection_score", cfg.no_detection_score);
    overrideIfPresent(j, "shoulder_slope_divisor", cfg.shoulder_slope_divisor);
    overrideIfPresent(j, "shoulder_penalty_cap", cfg.shoulder_penalty_cap);
    overrideIfPresent(j, "hip_slope_divisor", cfg.hip_slope_divisor);
    overrideIfPresent(j, "hip_penalty_cap", cfg.hip_penalty_cap);
    overrideIfPresent(j, "head_tilt_divisor", cfg.head_tilt_divisor);
    overrideIfPresent(j, "head_penalty_cap", cfg.head_penalty_cap);
    overrideIfPresent(j, "knee_valgus_divisor", cfg.knee_valgus_divisor);
    overrideIfPresent(j, "knee_penalty_cap", cfg.knee_penalty_cap);
    overrideIfPresent(j, "flag_penalty", cfg.flag_penalty);

    overrideIfPresent(j, "max_recommendations_per_analysis", cfg.max_recommendations_per_analysis);

    overrideIfPresent(j, "body_fat_min_pct", cfg.body_fat_min_pct);
    overrideIfPresent(j, "body_fat_max_pct", cfg.body_fat_max_pct);
    overrideIfPresent(j, "muscle_factor", cfg.muscle_factor);
    overrideIfPresent(j, "visceral_min", cfg.visceral_min);
    overrideIfPresent(j, "visceral_max", cfg.visceral_max);
    overrideIfPresent(j, "visceral_breakpoint_male", cfg.visceral_breakpoint_male);
    overrideIfPresent(j, "visceral_breakpoint_female", cfg.visceral_breakpoint_female);
    overrideIfPresent(j, "apple_whr", cfg.apple_whr);
    overrideIfPresent(j, "pear_whr", cfg.pear_whr);

    overrideIfPresent(j, "beginner_max_activity", cfg.beginner_max_activity);
    overrideIfPresent(j, "intermediate_max_activity", cfg.intermediate_max_activity);
    overrideIfPresent(j, "advanced_extra_sets", cfg.advanced_extra_sets);

    overrideIfPresent(j, "progress_base_score", cfg.progress_base_score);
    overrideIfPresent(j, "weight_loss_factor", cfg.weight_loss_factor);
    overrideIfPresent(j, "weight_loss_cap", cfg.weight_loss_cap);
    overrideIfPresent(j, "posture_change_factor", cfg.posture_change_factor);
    overrideIfPresent(j, "posture_change_cap", cfg.posture_change_cap);

    overrideIfPresent(j, "verbose", cfg.verbose);

    validateConfig(cfg);
    return cfg;
}

void validateConfig(const Config& cfg) {
    if (cfg.score_min > cfg.score_max) {
        throw std::runtime_error("Config: score_min must not exceed score_max");
    }
    if (cfg.max_recommendations_per_analysis < 1) {
        throw std::runtime_error("Config: max_recommendations_per_analysis must be >= 1");
    }
    if (cfg.body_fat_min_pct > cfg.body_fat_max_pct) {
        throw std::runtime_error("Config: body_fat_min_pct must not exceed body_fat_max_pct");
    }
    if (cfg.visceral_min > cfg.visceral_max) {
        throw std::runtime_error("Config: visceral_min must not exceed visceral_max");
    }
    if (cfg.pear_whr > cfg.apple_whr) {
        throw std::runtime_error("Config: pear_whr must not exceed apple_whr");
    }
    if (cfg.beginner_max_activity > cfg.intermediate_max_activity) {
        throw std::runtime_error(
            "Config: beginner_max_activity must not exceed intermediate_max_activity");
    }
}

nlohmann::json configToJson(const Config& cfg) {
    nlohmann::json j;
    j["shoulder_imbalance_px"] = cfg.shoulder_imbalance_px;
    j["hip_imbalance_px"] = cfg.hip_imbalance_px;
    j["forward_head_px"] = cfg.forward_head_px;
    j["knee_valgus_threshold"] = cfg.knee_valgus_threshold;

    j["score_max"] = cfg.score_max;
    j["score_min"] = cfg.score_min;
    j["no_detection_score"] = cfg.no_detection_score;
    j["shoulder_slope_divisor"] = cfg.shoulder_slope_divisor;
    j["shoulder_penalty_cap"] = cfg.shoulder_penalty_cap;
    j["hip_slope_divisor"] = cfg.hip_slope_divisor;
    j["hip_penalty_cap"] = cfg.hip_penalty_cap;
    j["head_tilt_divisor"] = cfg.head_tilt_divisor;
    j["head_penalty_cap"] = cfg.head_penalty_cap;
    j["knee_valgus_divisor"] = cfg.knee_valgus_divisor;
    j["knee_penalty_cap"] = cfg.knee_penalty_cap;
    j["flag_penalty"] = cfg.flag_penalty;

    j["max_recommendations_per_analysis"] = cfg.max_recommendations_per_analysis;

    j["body_fat_min_pct"] = cfg.body_fat_min_pct;
    j["body_fat_max_pct"] = cfg.body_fat_max_pct;
    j["muscle_factor"] = cfg.muscle_factor;
    j["visceral_min"] = cfg.visceral_min;
    j["visceral_max"] = cfg.visceral_max;
    j["visceral_breakpoint_male"] = cfg.visceral_breakpoint_male;
    j["visceral_breakpoint_female"] = cfg.visceral_breakpoint_female;
    j["apple_whr"] = cfg.apple_whr;
    j["pear_whr"] = cfg.pear_whr;

    j["beginner_max_activity"] = cfg.beginner_max_activity;
    j["intermediate_max_activity"] = cfg.intermediate_max_activity;
    j["advanced_extra_sets"] = cfg.advanced_extra_sets;

    j["progress_base_score"] = cfg.progress_base_score;
    j["weight_loss_factor"] = cfg.weight_loss_factor;
    j["weight_loss_cap"] = cfg.weight_loss_cap;
    j["posture_change_factor"] = cfg.posture_change_factor;
    j["posture_change_cap"] = cfg.posture_change_cap;

    j["verbose"] = cfg.verbose;
    return j;
}

Config loadConfig(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Config file not found: " + path);
    }

    std::ifstream file(path);
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse config " + path + ": " + e.what());
    }

    try {
        return configFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid value in config " + path + ": " + e.what());
    }
}

} // namespace posture_analyzer
