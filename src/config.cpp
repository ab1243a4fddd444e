/// @file config.cpp
/// EngineConfig validation and environment overlay.

#include <kibitz/config.hpp>

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace kibitz {

namespace {

double parse_double(const char* name, std::string_view text) {
    const std::string copy(text);
    char* end = nullptr;
    const double value = std::strtod(copy.c_str(), &end);
    if (copy.empty() || end != copy.c_str() + copy.size()) {
        throw std::invalid_argument(std::string(name) + ": not a number: '" + copy + "'");
    }
    return value;
}

int parse_int(const char* name, std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw std::invalid_argument(std::string(name) + ": not an integer: '" + std::string(text) +
                                    "'");
    }
    return value;
}

}  // namespace

void EngineConfig::validate() const {
    if (!std::isfinite(ml_weight) || ml_weight < 0.0) {
        throw std::invalid_argument("ml_weight must be finite and non-negative");
    }
    if (!std::isfinite(heuristic_weight) || heuristic_weight < 0.0) {
        throw std::invalid_argument("heuristic_weight must be finite and non-negative");
    }
    if (ml_weight + heuristic_weight <= 0.0) {
        throw std::invalid_argument("ml_weight + heuristic_weight must be positive");
    }
    if (default_top_k <= 0) {
        throw std::invalid_argument("default_top_k must be positive");
    }
    if (!std::isfinite(blunder_threshold)) {
        throw std::invalid_argument("blunder_threshold must be finite");
    }
}

EngineConfig EngineConfig::from_env() {
    EngineConfig cfg;
    if (const char* v = std::getenv("KIBITZ_MODEL_PATH"))
        cfg.model_path = v;
    if (const char* v = std::getenv("KIBITZ_ML_WEIGHT"))
        cfg.ml_weight = parse_double("KIBITZ_ML_WEIGHT", v);
    if (const char* v = std::getenv("KIBITZ_HEURISTIC_WEIGHT"))
        cfg.heuristic_weight = parse_double("KIBITZ_HEURISTIC_WEIGHT", v);
    if (const char* v = std::getenv("KIBITZ_TOP_K"))
        cfg.default_top_k = parse_int("KIBITZ_TOP_K", v);
    if (const char* v = std::getenv("KIBITZ_BLUNDER_THRESHOLD"))
        cfg.blunder_threshold = parse_double("KIBITZ_BLUNDER_THRESHOLD", v);
    return cfg;
}

}  // namespace kibitz
