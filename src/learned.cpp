/// @file learned.cpp
/// Learned evaluator with failure-to-unavailable conversion.

#include <kibitz/learned.hpp>

#include <kibitz/errors.hpp>
#include <kibitz/log.hpp>

#include <cmath>
#include <exception>
#include <utility>

namespace kibitz {

namespace {

constexpr std::string_view kLog = "Model";
constexpr std::string_view kNoModel = "no model configured";

}  // namespace

LearnedEvaluator::LearnedEvaluator(std::shared_ptr<const ModelArtifact> model) noexcept {
    if (!model) {
        mark_unavailable(kNoModel);
        return;
    }
    try {
        check_schema(*model);
        model_ = std::move(model);
        reason_.clear();
    } catch (const FeatureSchemaMismatch& e) {
        log::warn(kLog, "feature schema mismatch: ", e.what());
        mark_unavailable("feature schema mismatch: ", e.what());
    } catch (const std::exception& e) {
        log::warn(kLog, "model rejected: ", e.what());
        mark_unavailable(e.what());
    }
}

LearnedEvaluator LearnedEvaluator::from_file(const std::string& path) noexcept {
    LearnedEvaluator learned;
    if (path.empty())
        return learned;
    try {
        LearnedEvaluator loaded(load_model(path));
        if (loaded.available()) {
            log::info(kLog, "loaded ", path, " (", loaded.model_->feature_names().size(),
                      " features, schema ", loaded.model_->schema(), ")");
        }
        return loaded;
    } catch (const ModelError& e) {
        log::warn(kLog, "model unavailable: ", e.what());
        learned.mark_unavailable(e.what());
    } catch (const std::exception& e) {
        log::warn(kLog, "model unavailable: ", path, ": ", e.what());
        learned.mark_unavailable(e.what());
    }
    return learned;
}

void LearnedEvaluator::mark_unavailable(std::string_view prefix, std::string_view detail) noexcept {
    model_.reset();
    try {
        reason_.assign(prefix).append(detail);
    } catch (const std::exception&) {
        reason_.clear();
    }
}

std::string_view LearnedEvaluator::unavailable_reason() const noexcept {
    if (model_)
        return {};
    if (reason_.empty())
        return kNoModel;
    return reason_;
}

std::optional<double> LearnedEvaluator::predict(const features::FeatureVector& x) const noexcept {
    if (!model_)
        return std::nullopt;
    try {
        const double y = model_->predict(x);
        if (!std::isfinite(y)) {
            log::warn(kLog, "prediction is not finite; using heuristic");
            return std::nullopt;
        }
        return y;
    } catch (const std::exception& e) {
        log::warn(kLog, "prediction failed: ", e.what());
    } catch (...) {
        log::warn(kLog, "prediction failed with a non-standard exception");
    }
    return std::nullopt;
}

std::optional<double> LearnedEvaluator::evaluate(const Position& pos) const noexcept {
    if (!model_)
        return std::nullopt;
    try {
        return predict(features::extract(pos));
    } catch (const std::exception& e) {
        log::warn(kLog, "feature extraction failed: ", e.what());
    }
    return std::nullopt;
}

}  // namespace kibitz
