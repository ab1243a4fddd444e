#pragma once

/// @file learned.hpp
/// Learned evaluator: a model artifact applied to extracted features.
///
/// Never throws. A missing model, an incompatible schema or a failed
/// prediction all come back as an empty optional so the caller can fall
/// back to the heuristic.

#include <kibitz/features.hpp>
#include <kibitz/model.hpp>
#include <kibitz/position.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kibitz {

class LearnedEvaluator {
   public:
    /// No model: every prediction is unavailable.
    LearnedEvaluator() = default;

    /// Use `model` if its schema matches the extractor. A mismatch or a
    /// null model is logged and leaves the evaluator unavailable.
    explicit LearnedEvaluator(std::shared_ptr<const ModelArtifact> model) noexcept;

    /// Load the artifact at `path`. Load failures are logged and leave the
    /// evaluator unavailable.
    [[nodiscard]] static LearnedEvaluator from_file(const std::string& path) noexcept;

    [[nodiscard]] bool available() const noexcept { return model_ != nullptr; }

    /// Why the model is unavailable; empty when available.
    [[nodiscard]] std::string_view unavailable_reason() const noexcept;

    [[nodiscard]] const std::shared_ptr<const ModelArtifact>& model() const noexcept {
        return model_;
    }

    /// White-relative prediction, or empty when unavailable or when the
    /// model fails or returns a non-finite value.
    [[nodiscard]] std::optional<double> predict(const features::FeatureVector& x) const noexcept;

    /// Extract features from `pos` and predict.
    [[nodiscard]] std::optional<double> evaluate(const Position& pos) const noexcept;

   private:
    void mark_unavailable(std::string_view prefix, std::string_view detail = {}) noexcept;

    std::shared_ptr<const ModelArtifact> model_;
    std::string reason_;
};

}  // namespace kibitz
