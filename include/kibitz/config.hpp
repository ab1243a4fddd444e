#pragma once

/// @file config.hpp
/// Engine configuration with documented defaults.

#include <string>

namespace kibitz {

struct EngineConfig {
    /// Path to a model artifact. Empty = heuristic-only.
    std::string model_path;

    double ml_weight = 0.70;
    double heuristic_weight = 0.30;

    /// Candidates returned by suggest_moves when the caller does not say.
    int default_top_k = 3;

    /// Mover-relative evaluation drop below which a move is a blunder.
    double blunder_threshold = -2.0;

    /// Throws std::invalid_argument for non-finite or negative weights,
    /// weights summing to zero, a non-finite threshold or a non-positive k.
    void validate() const;

    /// Defaults overlaid with KIBITZ_MODEL_PATH, KIBITZ_ML_WEIGHT,
    /// KIBITZ_HEURISTIC_WEIGHT, KIBITZ_TOP_K and KIBITZ_BLUNDER_THRESHOLD.
    /// Throws std::invalid_argument when a variable does not parse.
    [[nodiscard]] static EngineConfig from_env();
};

}  // namespace kibitz
