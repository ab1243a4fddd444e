#pragma once

/// @file engine.hpp
/// High-level engine facade: evaluation, move suggestions, blunder checks
/// and game review over one shared, read-only model.
///
/// Every method is const and a pure function of its arguments, so a single
/// Engine may serve concurrent callers.

#include <kibitz/advisor.hpp>
#include <kibitz/blended.hpp>
#include <kibitz/blunder.hpp>
#include <kibitz/config.hpp>
#include <kibitz/game_state.hpp>

#include <memory>
#include <string>
#include <vector>

namespace kibitz {

/// Everything a presentation layer shows for one position.
struct AnalysisReport {
    std::string fen;
    EvaluationResult evaluation;
    GameState state = GameState::Normal;
    bool is_check = false;
    bool is_checkmate = false;
    bool is_stalemate = false;
    bool is_insufficient_material = false;
    std::vector<MoveCandidate> suggestions;
};

/// One reviewed ply of a game.
struct PlyReview {
    int ply = 0;  ///< 1-based, counted from the start position.
    Color mover = Color::White;
    std::string san;
    BlunderReport report;
};

class Engine {
   public:
    /// Validate `config` and load the model it names. A missing or
    /// incompatible model puts the engine in heuristic-only mode.
    explicit Engine(EngineConfig config = {});

    /// Use an already loaded model; `config.model_path` is ignored.
    Engine(EngineConfig config, std::shared_ptr<const ModelArtifact> model);

    [[nodiscard]] EvaluationResult evaluate(const Position& pos) const;

    /// Top `default_top_k` moves, best first.
    [[nodiscard]] std::vector<MoveCandidate> suggest_moves(const Position& pos) const;

    /// Top `k` moves, best first. Throws std::invalid_argument for k <= 0.
    [[nodiscard]] std::vector<MoveCandidate> suggest_moves(const Position& pos, int k) const;

    /// Uses the configured threshold.
    [[nodiscard]] BlunderReport check_blunder(const Position& before, Move move,
                                              const Position& after) const;
    [[nodiscard]] BlunderReport check_blunder(const Position& before, Move move,
                                              const Position& after, double threshold) const;

    [[nodiscard]] GameState classify_state(const Position& pos) const;

    [[nodiscard]] AnalysisReport analyze(const Position& pos) const;
    [[nodiscard]] AnalysisReport analyze(const Position& pos, int k) const;

    /// Replay `moves` (UCI or SAN) from `start`, judging each ply. Throws
    /// IllegalMove at the first move that is not legal.
    [[nodiscard]] std::vector<PlyReview> review_line(const Position& start,
                                                     const std::vector<std::string>& moves) const;
    [[nodiscard]] std::vector<PlyReview> review_line(const Position& start,
                                                     const std::vector<std::string>& moves,
                                                     double threshold) const;

    /// Every legal move of `pos` that would be a blunder.
    [[nodiscard]] std::vector<BlunderReport> find_blunders(const Position& pos) const;
    [[nodiscard]] std::vector<BlunderReport> find_blunders(const Position& pos,
                                                           double threshold) const;

    [[nodiscard]] bool model_available() const noexcept { return evaluator_.model_available(); }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const BlendedEvaluator& evaluator() const noexcept { return evaluator_; }

   private:
    void install(LearnedEvaluator learned);

    EngineConfig config_;
    BlendedEvaluator evaluator_;
};

}  // namespace kibitz
