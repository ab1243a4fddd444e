/// @file test_engine.cpp
/// End-to-end tests for the Engine facade.

#include <kibitz/engine.hpp>
#include <kibitz/errors.hpp>
#include <kibitz/rules.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "helpers.hpp"

namespace kibitz {

namespace {

const std::vector<std::string> kScholarsMate = {"e4", "e5", "Bc4", "Nc6", "Qh5", "Nf6", "Qxf7#"};

constexpr const char* kQueenEnding = "k7/8/1K6/8/8/8/8/2Q5 w - - 0 1";

}  // namespace

class EngineTest : public ::testing::Test {
   protected:
    Engine engine_;
};

// ── Construction ────────────────────────────────────────────────────────────

TEST_F(EngineTest, HeuristicOnlyByDefault) {
    EXPECT_FALSE(engine_.model_available());
    EXPECT_EQ(engine_.evaluate(Position::initial()).source, Source::Heuristic);
}

TEST(EngineSetup, BrokenModelPathFallsBack) {
    test::CapturedLog log;
    EngineConfig cfg;
    cfg.model_path = "/nonexistent/kibitz/eval.model";
    const Engine engine(cfg);

    EXPECT_FALSE(engine.model_available());
    EXPECT_TRUE(log.contains("WARN [Model] model unavailable"));
    EXPECT_TRUE(log.contains("[Engine] heuristic-only mode"));

    const auto result = engine.evaluate(Position::initial());
    EXPECT_EQ(result.source, Source::Heuristic);
    EXPECT_EQ(result.classification, Classification::Equal);
    EXPECT_EQ(engine.suggest_moves(Position::initial()).size(), 3u);
}

TEST(EngineSetup, LoadsModelFromConfig) {
    test::TempDir dir;
    EngineConfig cfg;
    cfg.model_path = dir.write("eval.model", test::linear_model_text(0.0, 1.0)).string();
    const Engine engine(cfg);

    ASSERT_TRUE(engine.model_available());
    const auto result = engine.evaluate(Position::from_fen("4k3/8/8/8/8/8/8/R3K3 w - - 0 1"));
    EXPECT_EQ(result.source, Source::Blended);
    EXPECT_GT(result.score, 3.0);
}

TEST(EngineSetup, SharedModel) {
    EngineConfig cfg;
    cfg.ml_weight = 1.0;
    cfg.heuristic_weight = 0.0;
    const Engine engine(cfg, test::StubModel::constant(1.5));

    const auto result = engine.evaluate(Position::initial());
    EXPECT_EQ(result.source, Source::Blended);
    EXPECT_DOUBLE_EQ(result.score, 1.5);
    EXPECT_EQ(result.classification, Classification::SlightAdvantage);
}

TEST(EngineSetup, InvalidConfigThrows) {
    EngineConfig cfg;
    cfg.default_top_k = 0;
    EXPECT_THROW(Engine{cfg}, std::invalid_argument);

    cfg = EngineConfig{};
    cfg.ml_weight = -1.0;
    EXPECT_THROW((Engine{cfg, test::StubModel::constant(0.0)}), std::invalid_argument);
}

// ── Queries ─────────────────────────────────────────────────────────────────

TEST_F(EngineTest, StartingPosition) {
    const Position start = Position::initial();
    const auto result = engine_.evaluate(start);
    EXPECT_EQ(result.classification, Classification::Equal);
    EXPECT_EQ(result.favors(), std::nullopt);
    EXPECT_EQ(engine_.classify_state(start), GameState::Normal);

    const auto moves = engine_.suggest_moves(start);
    ASSERT_EQ(moves.size(), 3u);
    EXPECT_GE(moves[0].resulting_score, moves[1].resulting_score);
    EXPECT_GE(moves[1].resulting_score, moves[2].resulting_score);
    EXPECT_EQ(engine_.suggest_moves(start, 7).size(), 7u);
}

TEST(EngineSetup, ConfiguredTopK) {
    EngineConfig cfg;
    cfg.default_top_k = 5;
    const Engine engine(cfg);
    EXPECT_EQ(engine.suggest_moves(Position::initial()).size(), 5u);
    EXPECT_EQ(engine.analyze(Position::initial()).suggestions.size(), 5u);
}

TEST_F(EngineTest, Deterministic) {
    const Engine other;
    const auto pos = Position::from_fen(
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1");
    EXPECT_EQ(engine_.evaluate(pos), other.evaluate(pos));

    const auto a = engine_.suggest_moves(pos, 5);
    const auto b = other.suggest_moves(pos, 5);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].uci, b[i].uci);
        EXPECT_EQ(a[i].resulting_score, b[i].resulting_score);
    }
}

TEST_F(EngineTest, ScholarsMate) {
    const auto review = engine_.review_line(Position::initial(), kScholarsMate);
    ASSERT_EQ(review.size(), kScholarsMate.size());
    EXPECT_EQ(review.back().san, "Qxf7#");

    Position pos = Position::initial();
    for (const auto& text : kScholarsMate) pos = rules::apply(pos, rules::parse_move(pos, text));

    EXPECT_EQ(engine_.classify_state(pos), GameState::Checkmate);
    EXPECT_TRUE(engine_.suggest_moves(pos).empty());

    const auto result = engine_.evaluate(pos);
    EXPECT_EQ(result.classification, Classification::Mate);
    EXPECT_EQ(result.score, kMateScore);
    EXPECT_EQ(result.favors(), Color::White);
}

TEST_F(EngineTest, AnalyzeStart) {
    const auto report = engine_.analyze(Position::initial());
    EXPECT_EQ(report.fen, kStartingFen);
    EXPECT_EQ(report.state, GameState::Normal);
    EXPECT_FALSE(report.is_check);
    EXPECT_FALSE(report.is_checkmate);
    EXPECT_FALSE(report.is_stalemate);
    EXPECT_FALSE(report.is_insufficient_material);
    EXPECT_EQ(report.evaluation, engine_.evaluate(Position::initial()));
    EXPECT_EQ(report.suggestions.size(), 3u);
    EXPECT_EQ(engine_.analyze(Position::initial(), 1).suggestions.size(), 1u);
}

TEST_F(EngineTest, AnalyzeFinishedGames) {
    const auto mate = engine_.analyze(Position::from_fen(
        "r1bqkb1r/pppp1Qpp/2n2n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 0 4"));
    EXPECT_EQ(mate.state, GameState::Checkmate);
    EXPECT_TRUE(mate.is_check);
    EXPECT_TRUE(mate.is_checkmate);
    EXPECT_EQ(mate.evaluation.classification, Classification::Mate);
    EXPECT_TRUE(mate.suggestions.empty());

    const auto stalemate = engine_.analyze(Position::from_fen("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"));
    EXPECT_TRUE(stalemate.is_stalemate);
    EXPECT_FALSE(stalemate.is_check);
    EXPECT_EQ(stalemate.evaluation.score, 0.0);
    EXPECT_TRUE(stalemate.suggestions.empty());

    const auto dead = engine_.analyze(Position::from_fen("4k3/8/8/8/8/8/8/4KB2 w - - 0 1"));
    EXPECT_TRUE(dead.is_insufficient_material);
    EXPECT_EQ(dead.state, GameState::InsufficientMaterial);
}

// ── Blunders ────────────────────────────────────────────────────────────────

TEST_F(EngineTest, CheckBlunder) {
    const Position before = Position::from_fen(kQueenEnding);
    const Move m = Move::from_uci("c1c7");
    const auto report = engine_.check_blunder(before, m, rules::apply(before, m));
    EXPECT_TRUE(report.is_blunder);
    EXPECT_EQ(report.threshold, engine_.config().blunder_threshold);
    EXPECT_LE(report.alternatives.size(), 3u);

    // A looser threshold lets it through.
    const auto lenient = engine_.check_blunder(before, m, rules::apply(before, m), -100.0);
    EXPECT_FALSE(lenient.is_blunder);
}

TEST_F(EngineTest, FindBlunders) {
    const auto blunders = engine_.find_blunders(Position::from_fen(kQueenEnding));
    EXPECT_FALSE(blunders.empty());
    EXPECT_TRUE(engine_.find_blunders(Position::initial()).empty());
    EXPECT_TRUE(engine_.find_blunders(Position::from_fen(kQueenEnding), -100.0).empty());
}

TEST_F(EngineTest, ReviewLineFlagsBlunder) {
    const auto review = engine_.review_line(Position::from_fen(kQueenEnding), {"Qc7"});
    ASSERT_EQ(review.size(), 1u);
    EXPECT_EQ(review[0].san, "Qc7");
    EXPECT_TRUE(review[0].report.is_blunder);
    EXPECT_FALSE(review[0].report.alternatives.empty());
}

TEST_F(EngineTest, ReviewLineNumbersPlies) {
    const auto review = engine_.review_line(Position::initial(), {"e2e4", "e7e5", "g1f3"});
    ASSERT_EQ(review.size(), 3u);
    EXPECT_EQ(review[0].ply, 1);
    EXPECT_EQ(review[0].mover, Color::White);
    EXPECT_EQ(review[0].san, "e4");
    EXPECT_EQ(review[1].mover, Color::Black);
    EXPECT_EQ(review[2].san, "Nf3");
    EXPECT_EQ(review[2].ply, 3);
    for (const auto& ply : review) EXPECT_FALSE(ply.report.is_blunder);
}

TEST_F(EngineTest, ReviewLineRejectsIllegalMove) {
    EXPECT_THROW((void)engine_.review_line(Position::initial(), {"e4", "e4"}), IllegalMove);
    EXPECT_THROW((void)engine_.review_line(Position::initial(), {"Ke2"}), IllegalMove);
}

TEST(EngineSetup, ConcurrentCallersShareTheLoadedModel) {
    test::TempDir dir;
    EngineConfig cfg;
    cfg.model_path = dir.write("eval.model", test::linear_model_text(0.0, 1.0)).string();
    const Engine engine(cfg);
    ASSERT_TRUE(engine.model_available());

    const auto pos = Position::from_fen(
        "r1bqkb1r/pppp1ppp/2n2n2/4p3/2B1P3/5N2/PPPP1PPP/RNBQK2R w KQkq - 4 4");
    const auto expected = engine.suggest_moves(pos, 5);
    ASSERT_EQ(expected.size(), 5u);

    std::vector<std::vector<MoveCandidate>> results(4);
    std::vector<std::thread> workers;
    for (auto& out : results) {
        workers.emplace_back([&, out_ptr = &out] { *out_ptr = engine.suggest_moves(pos, 5); });
    }
    for (auto& t : workers) t.join();

    for (const auto& r : results) {
        ASSERT_EQ(r.size(), expected.size());
        for (std::size_t i = 0; i < r.size(); ++i) {
            EXPECT_EQ(r[i].uci, expected[i].uci);
            EXPECT_DOUBLE_EQ(r[i].resulting_score, expected[i].resulting_score);
            EXPECT_EQ(r[i].source, Source::Blended);
        }
    }
}

}  // namespace kibitz
