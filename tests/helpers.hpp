#pragma once

/// @file helpers.hpp
/// Shared test utilities: colour-mirrored FENs, model files in a temporary
/// directory and a capturing log sink.

#include <kibitz/features.hpp>
#include <kibitz/log.hpp>
#include <kibitz/model.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <random>
#include <fstream>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kibitz::test {

/// The same position with colours swapped and the board flipped vertically.
inline std::string mirror_fen(const std::string& fen) {
    std::istringstream in(fen);
    std::string placement, side, castling, ep, halfmove = "0", fullmove = "1";
    in >> placement >> side >> castling >> ep >> halfmove >> fullmove;

    std::vector<std::string> ranks;
    std::stringstream ps(placement);
    for (std::string rank; std::getline(ps, rank, '/');) ranks.push_back(rank);
    std::reverse(ranks.begin(), ranks.end());

    auto swap_case = [](char ch) {
        return std::isupper(static_cast<unsigned char>(ch))
                   ? static_cast<char>(std::tolower(static_cast<unsigned char>(ch)))
                   : static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    };

    std::string flipped;
    for (std::size_t i = 0; i < ranks.size(); ++i) {
        if (i > 0)
            flipped += '/';
        for (char ch : ranks[i]) flipped += swap_case(ch);
    }

    std::string rights;
    if (castling != "-") {
        for (char ch : std::string("KQkq")) {
            if (castling.find(swap_case(ch)) != std::string::npos)
                rights += ch;
        }
    }
    if (rights.empty())
        rights = "-";

    if (ep != "-")
        ep[1] = ep[1] == '3' ? '6' : '3';

    return flipped + (side == "w" ? " b " : " w ") + rights + ' ' + ep + ' ' + halfmove + ' ' +
           fullmove;
}

/// Text of a linear model over the extractor schema: the given intercept,
/// `material_balance` weighted by `material_weight`, every other weight 0.
inline std::string linear_model_text(double intercept, double material_weight) {
    std::ostringstream os;
    os << "# test model\n";
    os << "format kibitz-linear 1\n";
    os << "schema " << features::kSchemaName << '\n';
    os << "intercept " << intercept << '\n';
    for (std::string_view name : features::kNames) {
        os << "weight " << name << ' ' << (name == "material_balance" ? material_weight : 0.0)
           << '\n';
    }
    return os.str();
}

/// Model over the extractor schema whose prediction is any callable.
class StubModel final : public ModelArtifact {
   public:
    using Fn = std::function<double(const features::FeatureVector&)>;

    explicit StubModel(Fn fn)
        : fn_(std::move(fn)),
          schema_(features::kSchemaName),
          names_(features::kNames.begin(), features::kNames.end()) {}

    double predict(const features::FeatureVector& x) const override { return fn_(x); }
    const std::string& schema() const noexcept override { return schema_; }
    const std::vector<std::string>& feature_names() const noexcept override { return names_; }

    static std::shared_ptr<const ModelArtifact> make(Fn fn) {
        return std::make_shared<const StubModel>(std::move(fn));
    }

    /// Predicts `value` for every position.
    static std::shared_ptr<const ModelArtifact> constant(double value) {
        return make([value](const features::FeatureVector&) { return value; });
    }

   private:
    Fn fn_;
    std::string schema_;
    std::vector<std::string> names_;
};

/// A directory under the system temp path, removed on destruction.
class TempDir {
   public:
    TempDir() {
        const auto base = std::filesystem::temp_directory_path();
        std::random_device rd;
        do {
            path_ = base / ("kibitz_test_" + std::to_string(rd()));
        } while (!std::filesystem::create_directory(path_));
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// Write `contents` to `name` inside the directory and return its path.
    std::filesystem::path write(const std::string& name, const std::string& contents) const {
        const auto file = path_ / name;
        std::ofstream out(file);
        out << contents;
        return file;
    }

   private:
    std::filesystem::path path_;
};

/// Installs a sink that records every log line while alive.
class CapturedLog {
   public:
    CapturedLog() {
        saved_level_ = log::level();
        log::set_level(log::Level::Debug);
        saved_sink_ = log::set_sink(
            [this](log::Level lvl, std::string_view component, std::string_view message) {
                lines_.push_back(std::string(log::level_name(lvl)) + " [" +
                                 std::string(component) + "] " + std::string(message));
            });
    }
    ~CapturedLog() {
        log::set_sink(std::move(saved_sink_));
        log::set_level(saved_level_);
    }
    CapturedLog(const CapturedLog&) = delete;
    CapturedLog& operator=(const CapturedLog&) = delete;

    [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }

    [[nodiscard]] bool contains(std::string_view needle) const {
        return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
            return line.find(needle) != std::string::npos;
        });
    }

   private:
    std::vector<std::string> lines_;
    log::Level saved_level_ = log::Level::Info;
    log::Sink saved_sink_;
};

}  // namespace kibitz::test
