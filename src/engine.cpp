/// @file engine.cpp
/// Engine facade implementation.

#include <kibitz/engine.hpp>

#include <kibitz/init.hpp>
#include <kibitz/log.hpp>
#include <kibitz/rules.hpp>

#include <utility>

namespace kibitz {

namespace {

constexpr std::string_view kLog = "Engine";

/// Validates before anything is loaded.
EngineConfig checked(EngineConfig config) {
    config.validate();
    return config;
}

}  // namespace

// ── Construction ────────────────────────────────────────────────────────────

Engine::Engine(EngineConfig config) : config_(checked(std::move(config))) {
    init();
    install(LearnedEvaluator::from_file(config_.model_path));
}

Engine::Engine(EngineConfig config, std::shared_ptr<const ModelArtifact> model)
    : config_(checked(std::move(config))) {
    init();
    install(LearnedEvaluator(std::move(model)));
}

void Engine::install(LearnedEvaluator learned) {
    if (!learned.available()) {
        log::info(kLog, "heuristic-only mode (", learned.unavailable_reason(), ")");
    }
    evaluator_ = BlendedEvaluator(std::move(learned),
                                  BlendWeights{config_.ml_weight, config_.heuristic_weight});
}

// ── Evaluation ──────────────────────────────────────────────────────────────

EvaluationResult Engine::evaluate(const Position& pos) const {
    return evaluator_.evaluate(pos);
}

std::vector<MoveCandidate> Engine::suggest_moves(const Position& pos) const {
    return suggest_moves(pos, config_.default_top_k);
}

std::vector<MoveCandidate> Engine::suggest_moves(const Position& pos, int k) const {
    return advisor::suggest(evaluator_, pos, k);
}

GameState Engine::classify_state(const Position& pos) const {
    return kibitz::classify_state(pos);
}

// ── Blunders ────────────────────────────────────────────────────────────────

BlunderReport Engine::check_blunder(const Position& before, Move move,
                                    const Position& after) const {
    return check_blunder(before, move, after, config_.blunder_threshold);
}

BlunderReport Engine::check_blunder(const Position& before, Move move, const Position& after,
                                    double threshold) const {
    return blunder::check(evaluator_, before, move, after, threshold, config_.default_top_k);
}

std::vector<BlunderReport> Engine::find_blunders(const Position& pos) const {
    return find_blunders(pos, config_.blunder_threshold);
}

std::vector<BlunderReport> Engine::find_blunders(const Position& pos, double threshold) const {
    return blunder::scan(evaluator_, pos, threshold, config_.default_top_k);
}

// ── Reports ─────────────────────────────────────────────────────────────────

AnalysisReport Engine::analyze(const Position& pos) const {
    return analyze(pos, config_.default_top_k);
}

AnalysisReport Engine::analyze(const Position& pos, int k) const {
    AnalysisReport report;
    report.fen = rules::to_portable_notation(pos);
    report.state = kibitz::classify_state(pos);
    report.evaluation = evaluator_.evaluate(pos, report.state);
    report.is_check = rules::is_check(pos);
    report.is_checkmate = report.state == GameState::Checkmate;
    report.is_stalemate = report.state == GameState::Stalemate;
    report.is_insufficient_material = rules::has_insufficient_material(pos);
    report.suggestions = advisor::suggest(evaluator_, pos, k);
    return report;
}

std::vector<PlyReview> Engine::review_line(const Position& start,
                                           const std::vector<std::string>& moves) const {
    return review_line(start, moves, config_.blunder_threshold);
}

std::vector<PlyReview> Engine::review_line(const Position& start,
                                           const std::vector<std::string>& moves,
                                           double threshold) const {
    std::vector<PlyReview> review;
    review.reserve(moves.size());
    Position pos = start;
    int ply = 0;
    for (const std::string& text : moves) {
        const Move m = rules::parse_move(pos, text);
        Position next = pos.apply(m);

        PlyReview entry;
        entry.ply = ++ply;
        entry.mover = pos.side_to_move();
        entry.san = rules::move_to_san(pos, m);
        entry.report =
            blunder::check(evaluator_, pos, m, next, threshold, config_.default_top_k);
        review.push_back(std::move(entry));

        pos = std::move(next);
    }
    return review;
}

}  // namespace kibitz
