/// @file pybind_module.cpp
/// pybind11 bindings for the kibitz engine.
///
/// Exposes the `_kibitz` Python module with an `Engine` class.
/// Communication uses FEN strings (Position) and UCI/SAN strings (Move);
/// results come back as plain dicts and lists.

#include <kibitz/engine.hpp>
#include <kibitz/errors.hpp>
#include <kibitz/init.hpp>
#include <kibitz/rules.hpp>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

py::dict to_dict(const kibitz::EvaluationResult& r) {
    py::dict d;
    d["score"] = r.score;
    d["classification"] = std::string(kibitz::to_string(r.classification));
    d["source"] = std::string(kibitz::to_string(r.source));
    if (auto side = r.favors()) {
        d["favors"] = *side == kibitz::Color::White ? "white" : "black";
    } else {
        d["favors"] = py::none();
    }
    return d;
}

py::dict to_dict(const kibitz::MoveCandidate& c) {
    py::dict d;
    d["move"] = c.uci;
    d["san"] = c.san;
    d["resulting_score"] = c.resulting_score;
    d["delta_from_current"] = c.delta_from_current;
    d["source"] = std::string(kibitz::to_string(c.source));
    return d;
}

py::list to_list(const std::vector<kibitz::MoveCandidate>& candidates) {
    py::list out;
    for (const auto& c : candidates) out.append(to_dict(c));
    return out;
}

py::dict to_dict(const kibitz::BlunderReport& r) {
    py::dict d;
    d["move"] = r.move.uci();
    d["is_blunder"] = r.is_blunder;
    d["eval_before"] = r.eval_before;
    d["eval_after"] = r.eval_after;
    d["threshold"] = r.threshold;
    d["alternatives"] = to_list(r.alternatives);
    return d;
}

}  // namespace

PYBIND11_MODULE(_kibitz, m) {
    m.doc() = "Chess position evaluation and move advice (pybind11)";

    // Attack tables are ready as soon as the module is imported.
    kibitz::init();

    py::register_exception<kibitz::InvalidPosition>(m, "InvalidPosition", PyExc_ValueError);
    py::register_exception<kibitz::IllegalMove>(m, "IllegalMove", PyExc_ValueError);

    // ── Engine class ────────────────────────────────────────────────────
    py::class_<kibitz::Engine>(m, "Engine")
        .def(py::init([](const std::string& model_path, double ml_weight,
                         double heuristic_weight, int top_k, double blunder_threshold) {
                 kibitz::EngineConfig cfg;
                 cfg.model_path = model_path;
                 cfg.ml_weight = ml_weight;
                 cfg.heuristic_weight = heuristic_weight;
                 cfg.default_top_k = top_k;
                 cfg.blunder_threshold = blunder_threshold;
                 return kibitz::Engine(std::move(cfg));
             }),
             py::arg("model_path") = "", py::arg("ml_weight") = 0.70,
             py::arg("heuristic_weight") = 0.30, py::arg("top_k") = 3,
             py::arg("blunder_threshold") = kibitz::kDefaultBlunderThreshold,
             "Create an engine. An empty or unusable *model_path* means heuristic-only.")

        .def_static(
            "from_env", []() { return kibitz::Engine(kibitz::EngineConfig::from_env()); },
            "Create an engine configured from KIBITZ_* environment variables.")

        .def_property_readonly("model_available", &kibitz::Engine::model_available)

        .def(
            "evaluate",
            [](const kibitz::Engine& self, const std::string& fen) {
                const auto pos = kibitz::Position::from_fen(fen);
                kibitz::EvaluationResult result;
                {
                    py::gil_scoped_release release;
                    result = self.evaluate(pos);
                }
                return to_dict(result);
            },
            py::arg("fen"),
            "Evaluate *fen*. Returns ``{score, classification, source, favors}``; "
            "score is in pawns from White's side.")

        .def(
            "suggest_moves",
            [](const kibitz::Engine& self, const std::string& fen, std::optional<int> k) {
                const auto pos = kibitz::Position::from_fen(fen);
                std::vector<kibitz::MoveCandidate> moves;
                {
                    py::gil_scoped_release release;
                    moves = k ? self.suggest_moves(pos, *k) : self.suggest_moves(pos);
                }
                return to_list(moves);
            },
            py::arg("fen"), py::arg("k") = py::none(),
            "Best moves first. Empty when the game is over.")

        .def(
            "check_blunder",
            [](const kibitz::Engine& self, const std::string& fen_before, const std::string& move,
               std::optional<std::string> fen_after, std::optional<double> threshold) {
                const auto before = kibitz::Position::from_fen(fen_before);
                const kibitz::Move m = kibitz::rules::parse_move(before, move);
                const auto after =
                    fen_after ? kibitz::Position::from_fen(*fen_after) : before.apply(m);
                kibitz::BlunderReport report;
                {
                    py::gil_scoped_release release;
                    report = threshold ? self.check_blunder(before, m, after, *threshold)
                                       : self.check_blunder(before, m, after);
                }
                return to_dict(report);
            },
            py::arg("fen_before"), py::arg("move"), py::arg("fen_after") = py::none(),
            py::arg("threshold") = py::none(),
            "Judge *move* (UCI or SAN) played from *fen_before*.")

        .def(
            "classify_state",
            [](const kibitz::Engine& self, const std::string& fen) {
                return std::string(kibitz::to_string(
                    self.classify_state(kibitz::Position::from_fen(fen))));
            },
            py::arg("fen"))

        .def(
            "analyze",
            [](const kibitz::Engine& self, const std::string& fen, std::optional<int> k) {
                const auto pos = kibitz::Position::from_fen(fen);
                kibitz::AnalysisReport report;
                {
                    py::gil_scoped_release release;
                    report = k ? self.analyze(pos, *k) : self.analyze(pos);
                }
                py::dict d;
                d["fen"] = report.fen;
                d["evaluation"] = to_dict(report.evaluation);
                d["state"] = std::string(kibitz::to_string(report.state));
                d["is_check"] = report.is_check;
                d["is_checkmate"] = report.is_checkmate;
                d["is_stalemate"] = report.is_stalemate;
                d["is_insufficient_material"] = report.is_insufficient_material;
                d["suggestions"] = to_list(report.suggestions);
                return d;
            },
            py::arg("fen"), py::arg("k") = py::none())

        .def(
            "review_line",
            [](const kibitz::Engine& self, const std::string& fen,
               const std::vector<std::string>& moves, std::optional<double> threshold) {
                const auto start = kibitz::Position::from_fen(fen);
                std::vector<kibitz::PlyReview> review;
                {
                    py::gil_scoped_release release;
                    review = threshold ? self.review_line(start, moves, *threshold)
                                       : self.review_line(start, moves);
                }
                py::list out;
                for (const auto& ply : review) {
                    py::dict d = to_dict(ply.report);
                    d["ply"] = ply.ply;
                    d["mover"] = ply.mover == kibitz::Color::White ? "white" : "black";
                    d["san"] = ply.san;
                    out.append(d);
                }
                return out;
            },
            py::arg("fen"), py::arg("moves"), py::arg("threshold") = py::none(),
            "Replay *moves* from *fen* and judge every ply.")

        .def(
            "find_blunders",
            [](const kibitz::Engine& self, const std::string& fen,
               std::optional<double> threshold) {
                const auto pos = kibitz::Position::from_fen(fen);
                std::vector<kibitz::BlunderReport> blunders;
                {
                    py::gil_scoped_release release;
                    blunders = threshold ? self.find_blunders(pos, *threshold)
                                         : self.find_blunders(pos);
                }
                py::list out;
                for (const auto& r : blunders) out.append(to_dict(r));
                return out;
            },
            py::arg("fen"), py::arg("threshold") = py::none());
}
