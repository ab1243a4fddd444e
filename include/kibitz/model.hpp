#pragma once

/// @file model.hpp
/// Trained model artifacts consumed by the learned evaluator.
///
/// Artifacts are loaded once and then shared read-only, so concurrent
/// callers may predict without locking.

#include <kibitz/features.hpp>

#include <Eigen/Dense>

#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kibitz {

/// A trained regression model over a feature schema.
class ModelArtifact {
   public:
    virtual ~ModelArtifact() = default;

    /// White-relative score in pawns. May throw; the learned evaluator
    /// treats any exception as "unavailable".
    [[nodiscard]] virtual double predict(const features::FeatureVector& x) const = 0;

    /// Name of the feature schema the model was trained on.
    [[nodiscard]] virtual const std::string& schema() const noexcept = 0;

    /// Expected input features, in order.
    [[nodiscard]] virtual const std::vector<std::string>& feature_names() const noexcept = 0;
};

/// Throws FeatureSchemaMismatch unless `model` expects exactly the
/// extractor's schema: same name, same feature count, names in order.
void check_schema(const ModelArtifact& model);

// ── Linear model ────────────────────────────────────────────────────────────

/// y = intercept + w . x
///
/// Text format, one directive per line, '#' starts a comment:
///
///     format kibitz-linear 1
///     schema kibitz.features.v1
///     intercept -0.02
///     weight material_balance 0.97
///     weight material_white 0.0
///     ...
class LinearModel final : public ModelArtifact {
   public:
    static constexpr std::string_view kFormatName = "kibitz-linear";
    static constexpr int kFormatVersion = 1;

    /// Throws ModelError when names and weights differ in length or a
    /// coefficient is not finite.
    LinearModel(std::string schema, std::vector<std::string> feature_names,
                Eigen::VectorXd weights, double intercept);

    /// Parse the text format. `origin` names the source in error messages.
    /// Throws ModelError.
    [[nodiscard]] static LinearModel parse(std::istream& in, std::string_view origin);

    [[nodiscard]] double predict(const features::FeatureVector& x) const override;
    [[nodiscard]] const std::string& schema() const noexcept override { return schema_; }
    [[nodiscard]] const std::vector<std::string>& feature_names() const noexcept override {
        return feature_names_;
    }

    [[nodiscard]] const Eigen::VectorXd& weights() const noexcept { return weights_; }
    [[nodiscard]] double intercept() const noexcept { return intercept_; }

   private:
    std::string schema_;
    std::vector<std::string> feature_names_;
    Eigen::VectorXd weights_;
    double intercept_ = 0.0;
};

/// Read a model artifact from disk. Throws ModelError when the file is
/// missing, unreadable or malformed. The schema is not checked here.
[[nodiscard]] std::shared_ptr<const ModelArtifact> load_model(const std::filesystem::path& path);

}  // namespace kibitz
