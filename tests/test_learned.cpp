/// @file test_learned.cpp
/// Tests for the learned evaluator and its failure handling.

#include <kibitz/init.hpp>
#include <kibitz/learned.hpp>
#include <kibitz/log.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include "helpers.hpp"

namespace kibitz {

class LearnedTest : public ::testing::Test {
   public:
    static void SetUpTestSuite() { init(); }
};

TEST_F(LearnedTest, DefaultIsUnavailable) {
    const LearnedEvaluator learned;
    EXPECT_FALSE(learned.available());
    EXPECT_EQ(learned.unavailable_reason(), "no model configured");
    EXPECT_EQ(learned.evaluate(Position::initial()), std::nullopt);
}

TEST_F(LearnedTest, EmptyPathIsUnavailable) {
    const auto learned = LearnedEvaluator::from_file("");
    EXPECT_FALSE(learned.available());
    EXPECT_EQ(learned.model(), nullptr);
}

TEST_F(LearnedTest, LoadsFromFile) {
    test::TempDir dir;
    const auto path = dir.write("eval.model", test::linear_model_text(0.25, 1.0));
    test::CapturedLog log;
    const auto learned = LearnedEvaluator::from_file(path.string());
    ASSERT_TRUE(learned.available());
    EXPECT_TRUE(learned.unavailable_reason().empty());
    EXPECT_TRUE(log.contains("[Model] loaded"));

    const auto y = learned.evaluate(Position::initial());
    ASSERT_TRUE(y.has_value());
    EXPECT_DOUBLE_EQ(*y, 0.25);
}

TEST_F(LearnedTest, MissingFileIsLoggedNotThrown) {
    test::TempDir dir;
    test::CapturedLog log;
    const auto learned = LearnedEvaluator::from_file((dir.path() / "absent.model").string());
    EXPECT_FALSE(learned.available());
    EXPECT_NE(learned.unavailable_reason().find("not found"), std::string::npos);
    EXPECT_TRUE(log.contains("WARN [Model] model unavailable"));
}

TEST_F(LearnedTest, SchemaMismatchIsUnavailable) {
    test::TempDir dir;
    const auto path = dir.write("old.model",
                                "format kibitz-linear 1\n"
                                "schema kibitz.features.v0\n"
                                "intercept 0\n"
                                "weight material_balance 1\n");
    test::CapturedLog log;
    const auto learned = LearnedEvaluator::from_file(path.string());
    EXPECT_FALSE(learned.available());
    EXPECT_NE(learned.unavailable_reason().find("schema mismatch"), std::string::npos);
    EXPECT_TRUE(log.contains("feature schema mismatch"));
}

TEST_F(LearnedTest, NullModelIsUnavailable) {
    const LearnedEvaluator learned(std::shared_ptr<const ModelArtifact>{});
    EXPECT_FALSE(learned.available());
}

TEST_F(LearnedTest, NonFinitePredictionIsUnavailable) {
    test::CapturedLog log;
    const LearnedEvaluator learned(
        test::StubModel::constant(std::numeric_limits<double>::quiet_NaN()));
    ASSERT_TRUE(learned.available());
    EXPECT_EQ(learned.evaluate(Position::initial()), std::nullopt);
    EXPECT_TRUE(log.contains("not finite"));
}

TEST_F(LearnedTest, ThrowingModelIsUnavailable) {
    test::CapturedLog log;
    const LearnedEvaluator learned(test::StubModel::make(
        [](const features::FeatureVector&) -> double { throw std::runtime_error("boom"); }));
    EXPECT_EQ(learned.evaluate(Position::initial()), std::nullopt);
    EXPECT_TRUE(log.contains("prediction failed: boom"));
}

TEST_F(LearnedTest, FailingLogSinkStillDegrades) {
    test::TempDir dir;
    test::CapturedLog restore;
    log::set_sink([](log::Level, std::string_view, std::string_view) {
        throw std::runtime_error("sink down");
    });

    const auto missing = LearnedEvaluator::from_file((dir.path() / "absent.model").string());
    EXPECT_FALSE(missing.available());

    const LearnedEvaluator throwing(test::StubModel::make(
        [](const features::FeatureVector&) -> double { throw std::runtime_error("boom"); }));
    EXPECT_EQ(throwing.evaluate(Position::initial()), std::nullopt);
}

TEST_F(LearnedTest, PredictsFromFeatures) {
    const LearnedEvaluator learned(test::StubModel::make(
        [](const features::FeatureVector& x) { return x[features::MaterialBalance] + 0.5; }));
    const auto y = learned.evaluate(Position::from_fen("4k3/8/8/8/8/8/8/R3K3 w - - 0 1"));
    ASSERT_TRUE(y.has_value());
    EXPECT_DOUBLE_EQ(*y, 5.5);
}

}  // namespace kibitz
