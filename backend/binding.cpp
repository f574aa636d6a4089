#include <cstdint>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>       // std::vector members and return values
#include <pybind11/operators.h> // py::self == py::self
#include "gambit.hpp"

namespace py = pybind11;

namespace {

// The engine signals "no move" with the null move; Python gets None.
py::object moveOrNone(const gambit::Move& m) {
    if (m.isNull()) return py::none();
    return py::cast(m);
}

} // namespace

PYBIND11_MODULE(gambitcore, m) {
    m.doc() = "Python bindings for the gambit chess rules engine and alpha-beta opponent";

    // Errors
    auto chess_error = py::register_exception<gambit::ChessError>(m, "ChessError");
    py::register_exception<gambit::InvalidSquare>(m, "InvalidSquare", chess_error.ptr());
    py::register_exception<gambit::IllegalMove>(m, "IllegalMove", chess_error.ptr());
    py::register_exception<gambit::NoActiveSelection>(m, "NoActiveSelection", chess_error.ptr());
    py::register_exception<gambit::EmptyHistory>(m, "EmptyHistory", chess_error.ptr());

    // Enums
    py::enum_<gambit::Color>(m, "Color", "Side colors")
        .value("WHITE", gambit::Color::WHITE)
        .value("BLACK", gambit::Color::BLACK)
        .export_values();

    py::enum_<gambit::PieceType>(m, "PieceType", "Piece kinds")
        .value("PAWN",          gambit::PieceType::PAWN)
        .value("KNIGHT",        gambit::PieceType::KNIGHT)
        .value("BISHOP",        gambit::PieceType::BISHOP)
        .value("ROOK",          gambit::PieceType::ROOK)
        .value("QUEEN",         gambit::PieceType::QUEEN)
        .value("KING",          gambit::PieceType::KING)
        .value("NO_PIECE_TYPE", gambit::PieceType::NO_PIECE_TYPE)
        .export_values();

    py::enum_<gambit::MoveKind>(m, "MoveKind", "Kinds of move")
        .value("NORMAL",     gambit::MoveKind::NORMAL)
        .value("CAPTURE",    gambit::MoveKind::CAPTURE)
        .value("CASTLE",     gambit::MoveKind::CASTLE)
        .value("PROMOTION",  gambit::MoveKind::PROMOTION)
        .value("EN_PASSANT", gambit::MoveKind::EN_PASSANT);

    py::enum_<gambit::GameStatus>(m, "GameStatus", "Status of the side to move")
        .value("ACTIVE",    gambit::GameStatus::ACTIVE)
        .value("CHECK",     gambit::GameStatus::CHECK)
        .value("CHECKMATE", gambit::GameStatus::CHECKMATE)
        .value("STALEMATE", gambit::GameStatus::STALEMATE)
        .value("DRAW",      gambit::GameStatus::DRAW);

    py::enum_<gambit::DrawReason>(m, "DrawReason", "Why a game was drawn")
        .value("NONE",                  gambit::DrawReason::NONE)
        .value("INSUFFICIENT_MATERIAL", gambit::DrawReason::INSUFFICIENT_MATERIAL)
        .value("FIFTY_MOVE",            gambit::DrawReason::FIFTY_MOVE)
        .value("THREEFOLD_REPETITION",  gambit::DrawReason::THREEFOLD_REPETITION);

    py::enum_<gambit::Difficulty>(m, "Difficulty", "AI strength levels")
        .value("BEGINNER", gambit::Difficulty::BEGINNER)
        .value("EASY",     gambit::Difficulty::EASY)
        .value("MEDIUM",   gambit::Difficulty::MEDIUM)
        .value("HARD",     gambit::Difficulty::HARD)
        .value("EXPERT",   gambit::Difficulty::EXPERT);

    py::enum_<gambit::StrategyKind>(m, "StrategyKind", "How a computer player picks its move")
        .value("RANDOM",     gambit::StrategyKind::RANDOM)
        .value("MINIMAX",    gambit::StrategyKind::MINIMAX)
        .value("ALPHA_BETA", gambit::StrategyKind::ALPHA_BETA);

    py::enum_<gambit::GameMode>(m, "GameMode", "Who controls each side")
        .value("HUMAN_VS_HUMAN", gambit::GameMode::HUMAN_VS_HUMAN)
        .value("HUMAN_VS_AI",    gambit::GameMode::HUMAN_VS_AI)
        .value("AI_VS_AI",       gambit::GameMode::AI_VS_AI);

    // Value types
    py::class_<gambit::Square>(m, "Square", "Board coordinate, row 0 = rank 8, col 0 = file a")
        .def(py::init<int, int>(), py::arg("row"), py::arg("col"))
        .def_readonly("row", &gambit::Square::row)
        .def_readonly("col", &gambit::Square::col)
        .def("algebraic", &gambit::Square::algebraic)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__repr__", [](const gambit::Square& s) { return "Square(" + s.algebraic() + ")"; });

    py::class_<gambit::Piece>(m, "Piece", "A piece and where it stands")
        .def_readonly("type", &gambit::Piece::type)
        .def_readonly("color", &gambit::Piece::color)
        .def_readonly("square", &gambit::Piece::square)
        .def_readonly("has_moved", &gambit::Piece::hasMoved)
        .def("empty", &gambit::Piece::empty)
        .def("symbol", [](const gambit::Piece& p) { return std::string(1, p.symbol()); });

    py::class_<gambit::Move>(m, "Move", "A fully specified move")
        .def_readonly("from_square", &gambit::Move::from)
        .def_readonly("to_square", &gambit::Move::to)
        .def_readonly("piece", &gambit::Move::piece)
        .def_readonly("kind", &gambit::Move::kind)
        .def_readonly("captured", &gambit::Move::captured)
        .def_readonly("promotion", &gambit::Move::promotion)
        .def("uci", [](const gambit::Move& mv) { return gambit::moveToString(mv); })
        .def("algebraic", [](const gambit::Move& mv) { return gambit::moveToAlgebraic(mv); })
        .def(py::self == py::self)
        .def("__repr__", [](const gambit::Move& mv) { return "Move(" + gambit::moveToAlgebraic(mv) + ")"; });

    py::class_<gambit::ApplyResult>(m, "ApplyResult")
        .def_readonly("move", &gambit::ApplyResult::move)
        .def_property_readonly("captured", [](const gambit::ApplyResult& r) -> py::object {
            if (r.captured.empty()) return py::none();
            return py::cast(r.captured);
        })
        .def_readonly("is_check", &gambit::ApplyResult::isCheck)
        .def_readonly("is_checkmate", &gambit::ApplyResult::isCheckmate)
        .def_readonly("is_stalemate", &gambit::ApplyResult::isStalemate)
        .def_readonly("is_draw", &gambit::ApplyResult::isDraw)
        .def_readonly("status", &gambit::ApplyResult::status);

    py::class_<gambit::SelectionResult>(m, "SelectionResult")
        .def_readonly("selected", &gambit::SelectionResult::selected)
        .def_readonly("legal_moves", &gambit::SelectionResult::legalMoves)
        .def_readonly("move_made", &gambit::SelectionResult::moveMade)
        .def_readonly("applied", &gambit::SelectionResult::applied);

    py::class_<gambit::Snapshot>(m, "Snapshot", "Read-only view for rendering")
        .def_readonly("pieces", &gambit::Snapshot::pieces)
        .def_readonly("side_to_move", &gambit::Snapshot::sideToMove)
        .def_readonly("is_check", &gambit::Snapshot::isCheck)
        .def_readonly("status", &gambit::Snapshot::status)
        .def_readonly("draw_reason", &gambit::Snapshot::drawReason)
        .def_readonly("captured_by_white", &gambit::Snapshot::capturedByWhite)
        .def_readonly("captured_by_black", &gambit::Snapshot::capturedByBlack)
        .def_readonly("move_history", &gambit::Snapshot::moveHistory)
        .def_readonly("has_selection", &gambit::Snapshot::hasSelection)
        .def_readonly("selected", &gambit::Snapshot::selected);

    py::class_<gambit::SearchStats>(m, "SearchStats")
        .def_readonly("nodes", &gambit::SearchStats::nodes)
        .def_readonly("completed_depth", &gambit::SearchStats::completedDepth)
        .def_readonly("best_score", &gambit::SearchStats::bestScore)
        .def_readonly("elapsed_seconds", &gambit::SearchStats::elapsedSeconds)
        .def_readonly("timed_out", &gambit::SearchStats::timedOut);

    py::class_<gambit::SessionConfig>(m, "SessionConfig")
        .def(py::init<>())
        .def_readwrite("mode", &gambit::SessionConfig::mode)
        .def_readwrite("human_color", &gambit::SessionConfig::humanColor)
        .def_readwrite("white_level", &gambit::SessionConfig::whiteLevel)
        .def_readwrite("black_level", &gambit::SessionConfig::blackLevel)
        .def_readwrite("auto_queen_promotion", &gambit::SessionConfig::autoQueenPromotion);

    // Session
    py::class_<gambit::GameSession>(m, "GameSession", "One game driven by a turn orchestrator")
        .def(py::init<const gambit::SessionConfig&>(), py::arg("config") = gambit::SessionConfig())
        .def("select", [](gambit::GameSession& s, int row, int col) {
                 return s.select(gambit::Square(row, col));
             },
             py::arg("row"), py::arg("col"),
             "Click on a square: select an own piece, play to a legal destination, or clear.")
        .def("move_selected_to", [](gambit::GameSession& s, int row, int col) {
                 return s.moveSelectedTo(gambit::Square(row, col));
             },
             py::arg("row"), py::arg("col"))
        .def("apply", &gambit::GameSession::apply, py::arg("move"),
             "Apply a legal move and report the resulting status.")
        .def("undo", &gambit::GameSession::undo, "Revert the last move; False if there is none.")
        .def("request_ai_move", [](gambit::GameSession& s, double time_budget) {
                 gambit::Move mv;
                 {
                     py::gil_scoped_release release;
                     mv = s.requestAiMove(time_budget);
                 }
                 return moveOrNone(mv);
             },
             py::arg("time_budget") = -1.0,
             "Search for the side to move; None when it has no legal move.")
        .def("legal_moves", [](const gambit::GameSession& s) { return s.state().legalMoves(); })
        .def("legal_moves_for", [](const gambit::GameSession& s, gambit::Color side) {
                 return gambit::legalMoves(s.state().board(), side);
             },
             py::arg("side"), "Legal moves of `side` in the current position.")
        .def("legal_moves_from", [](const gambit::GameSession& s, int row, int col) {
                 return s.state().legalMovesFrom(gambit::Square(row, col));
             },
             py::arg("row"), py::arg("col"), "Legal moves of the piece on (row, col); empty if not the mover's.")
        .def("set_strategy", &gambit::GameSession::setStrategy, py::arg("side"), py::arg("kind"))
        .def("strategy_kind", &gambit::GameSession::strategyKind, py::arg("side"))
        .def("snapshot", &gambit::GameSession::snapshot)
        .def("is_ai_turn", &gambit::GameSession::isAiTurn)
        .def("last_search", &gambit::GameSession::lastSearch, py::arg("side"),
             py::return_value_policy::copy)
        .def("clear_selection", &gambit::GameSession::clearSelection)
        .def("reset", &gambit::GameSession::reset)
        .def("pretty", [](const gambit::GameSession& s) { return s.state().board().pretty(); });

    m.def("set_log_level", [](int level) {
              gambit::setLogLevel(static_cast<gambit::LogLevel>(level));
          },
          py::arg("level"), "0 = error, 1 = warn, 2 = info, 3 = debug");
}
