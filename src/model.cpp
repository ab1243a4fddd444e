/// @file model.cpp
/// Linear model parsing and inference.

#include <kibitz/model.hpp>

#include <kibitz/errors.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace kibitz {

namespace {

[[noreturn]] void fail(std::string_view origin, int line_no, const std::string& what) {
    std::ostringstream os;
    os << origin << ':' << line_no << ": " << what;
    throw ModelError(os.str());
}

double parse_number(std::string_view origin, int line_no, const std::string& token) {
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (token.empty() || end != token.c_str() + token.size()) {
        fail(origin, line_no, "expected a number, got '" + token + "'");
    }
    if (!std::isfinite(value)) {
        fail(origin, line_no, "coefficient is not finite: '" + token + "'");
    }
    return value;
}

}  // namespace

// ── Schema check ────────────────────────────────────────────────────────────

void check_schema(const ModelArtifact& model) {
    if (model.schema() != features::kSchemaName) {
        throw FeatureSchemaMismatch("model schema '" + model.schema() + "' but extractor produces '" +
                                    std::string(features::kSchemaName) + "'");
    }
    const auto& names = model.feature_names();
    if (names.size() != features::kNames.size()) {
        throw FeatureSchemaMismatch("model expects " + std::to_string(names.size()) +
                                    " features, extractor produces " +
                                    std::to_string(features::kNames.size()));
    }
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i] != features::kNames[i]) {
            throw FeatureSchemaMismatch("feature " + std::to_string(i) + " is '" + names[i] +
                                        "', expected '" + std::string(features::kNames[i]) + "'");
        }
    }
}

// ── LinearModel ─────────────────────────────────────────────────────────────

LinearModel::LinearModel(std::string schema, std::vector<std::string> feature_names,
                         Eigen::VectorXd weights, double intercept)
    : schema_(std::move(schema)),
      feature_names_(std::move(feature_names)),
      weights_(std::move(weights)),
      intercept_(intercept) {
    if (static_cast<Eigen::Index>(feature_names_.size()) != weights_.size()) {
        throw ModelError("linear model has " + std::to_string(feature_names_.size()) +
                         " feature names but " + std::to_string(weights_.size()) + " weights");
    }
    if (!std::isfinite(intercept_) || !weights_.allFinite()) {
        throw ModelError("linear model has non-finite coefficients");
    }
}

double LinearModel::predict(const features::FeatureVector& x) const {
    if (weights_.size() != static_cast<Eigen::Index>(x.size())) {
        throw FeatureSchemaMismatch("linear model expects " + std::to_string(weights_.size()) +
                                    " inputs, got " + std::to_string(x.size()));
    }
    const Eigen::Map<const Eigen::VectorXd> input(x.data(), static_cast<Eigen::Index>(x.size()));
    return intercept_ + weights_.dot(input);
}

LinearModel LinearModel::parse(std::istream& in, std::string_view origin) {
    std::string schema;
    std::vector<std::string> names;
    std::vector<double> coefficients;
    std::unordered_set<std::string> seen;
    bool have_format = false;
    bool have_intercept = false;
    double intercept = 0.0;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (auto hash = line.find('#'); hash != std::string::npos)
            line.erase(hash);

        std::istringstream ls(line);
        std::string directive;
        if (!(ls >> directive))
            continue;  // blank

        if (!have_format && directive != "format")
            fail(origin, line_no, "first directive must be 'format'");

        std::vector<std::string> args;
        for (std::string tok; ls >> tok;) args.push_back(std::move(tok));

        if (directive == "format") {
            if (have_format)
                fail(origin, line_no, "duplicate 'format'");
            if (args.size() != 2 || args[0] != kFormatName ||
                args[1] != std::to_string(kFormatVersion)) {
                fail(origin, line_no,
                     "unsupported format, expected '" + std::string(kFormatName) + ' ' +
                         std::to_string(kFormatVersion) + "'");
            }
            have_format = true;
        } else if (directive == "schema") {
            if (args.size() != 1)
                fail(origin, line_no, "'schema' takes one argument");
            if (!schema.empty())
                fail(origin, line_no, "duplicate 'schema'");
            schema = args[0];
        } else if (directive == "intercept") {
            if (args.size() != 1)
                fail(origin, line_no, "'intercept' takes one argument");
            if (have_intercept)
                fail(origin, line_no, "duplicate 'intercept'");
            intercept = parse_number(origin, line_no, args[0]);
            have_intercept = true;
        } else if (directive == "weight") {
            if (args.size() != 2)
                fail(origin, line_no, "'weight' takes a feature name and a value");
            if (!seen.insert(args[0]).second)
                fail(origin, line_no, "duplicate weight for '" + args[0] + "'");
            coefficients.push_back(parse_number(origin, line_no, args[1]));
            names.push_back(args[0]);
        } else {
            fail(origin, line_no, "unknown directive '" + directive + "'");
        }
    }

    if (in.bad())
        throw ModelError(std::string(origin) + ": read error");
    if (!have_format)
        throw ModelError(std::string(origin) + ": empty model file");
    if (schema.empty())
        throw ModelError(std::string(origin) + ": missing 'schema'");
    if (!have_intercept)
        throw ModelError(std::string(origin) + ": missing 'intercept'");
    if (names.empty())
        throw ModelError(std::string(origin) + ": no weights");

    Eigen::VectorXd weights(static_cast<Eigen::Index>(coefficients.size()));
    for (std::size_t i = 0; i < coefficients.size(); ++i) {
        weights[static_cast<Eigen::Index>(i)] = coefficients[i];
    }
    return LinearModel(std::move(schema), std::move(names), std::move(weights), intercept);
}

// ── Loading ─────────────────────────────────────────────────────────────────

std::shared_ptr<const ModelArtifact> load_model(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ModelError("model file not found: " + path.string());
    }
    std::ifstream in(path);
    if (!in) {
        throw ModelError("cannot open model file: " + path.string());
    }
    return std::make_shared<const LinearModel>(LinearModel::parse(in, path.string()));
}

}  // namespace kibitz
