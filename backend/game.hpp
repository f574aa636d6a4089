/*
 * Game-level state and the surface a turn orchestrator (GUI, CLI, Python)
 * drives: square selection, move application, undo, AI moves, snapshots.
 */

#ifndef GAMBIT_GAME_HPP
#define GAMBIT_GAME_HPP

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "board.hpp"
#include "engine.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "rules.hpp"
#include "strategy.hpp"
#include "types.hpp"

namespace gambit {

// ───────────────────────── GameState ────────────────────────────────
class GameState {
public:
    GameState() : GameState(Board::startingPosition()) {}

    explicit GameState(const Board& initial) : current_board(initial) {
        key_history.push_back(current_board.positionKey());
        refreshStatus();
    }

    const Board& board() const { return current_board; }
    Color sideToMove() const { return current_board.sideToMove; }

    std::vector<Move> legalMoves() const {
        return gambit::legalMoves(current_board, current_board.sideToMove);
    }

    std::vector<Move> legalMovesFrom(Square from) const {
        const Piece& piece = current_board.get(from);
        if (piece.empty() || piece.color != current_board.sideToMove) return {};
        return gambit::legalMovesFrom(current_board, from);
    }

    bool isLegal(const Move& m) const {
        if (!m.from.valid() || !m.to.valid()) return false;
        const std::vector<Move> moves = legalMovesFrom(m.from);
        return std::find(moves.begin(), moves.end(), m) != moves.end();
    }

    // Returns the captured piece (empty if none). Throws IllegalMove and
    // leaves the game untouched when `m` is not in the legal move set.
    Piece applyMove(const Move& m) {
        if (!m.from.valid()) throw InvalidSquare(m.from.row, m.from.col);
        if (!m.to.valid()) throw InvalidSquare(m.to.row, m.to.col);
        if (status_report.isGameOver() || !isLegal(m)) {
            throw IllegalMove(m);
        }

        undo_stack.push_back(current_board.makeMove(m));
        move_history.push_back(m);
        key_history.push_back(current_board.positionKey());
        refreshStatus();
        return undo_stack.back().captured;
    }

    Move undoMove() {
        if (undo_stack.empty()) {
            throw EmptyHistory();
        }
        current_board.unmakeMove(undo_stack.back());
        undo_stack.pop_back();
        Move last = move_history.back();
        move_history.pop_back();
        key_history.pop_back();
        refreshStatus();
        return last;
    }

    const std::vector<Move>& history() const { return move_history; }

    // Pieces taken by `by`, in the order they were captured.
    std::vector<PieceType> capturedBy(Color by) const {
        std::vector<PieceType> out;
        for (const UndoInfo& u : undo_stack) {
            if (u.moved.color == by && !u.captured.empty()) out.push_back(u.captured.type);
        }
        return out;
    }

    int repetitionCount() const {
        const uint64_t key = key_history.back();
        return static_cast<int>(std::count(key_history.begin(), key_history.end(), key));
    }

    const StatusReport& statusReport() const { return status_report; }
    GameStatus status() const { return status_report.status; }
    DrawReason drawReason() const { return status_report.drawReason; }
    bool inCheck() const { return status_report.inCheck; }
    bool isGameOver() const { return status_report.isGameOver(); }

private:
    Board current_board;
    std::vector<Move> move_history;
    std::vector<UndoInfo> undo_stack;
    std::vector<uint64_t> key_history;
    StatusReport status_report;

    void refreshStatus() {
        status_report = computeStatus(current_board, repetitionCount());
    }
};

// ───────────────────────── Session ──────────────────────────────────
enum class GameMode { HUMAN_VS_HUMAN, HUMAN_VS_AI, AI_VS_AI };

struct SessionConfig {
    GameMode mode = GameMode::HUMAN_VS_AI;
    Color humanColor = WHITE; // only read in HUMAN_VS_AI
    Difficulty whiteLevel = Difficulty::MEDIUM;
    Difficulty blackLevel = Difficulty::MEDIUM;
    bool autoQueenPromotion = true;
};

struct ApplyResult {
    Move move;
    Piece captured;
    bool isCheck = false;
    bool isCheckmate = false;
    bool isStalemate = false;
    bool isDraw = false;
    GameStatus status = GameStatus::ACTIVE;
};

struct SelectionResult {
    bool selected = false;
    std::vector<Move> legalMoves;
    bool moveMade = false;
    ApplyResult applied;
};

struct Snapshot {
    std::vector<Piece> pieces;
    Color sideToMove = WHITE;
    bool isCheck = false;
    GameStatus status = GameStatus::ACTIVE;
    DrawReason drawReason = DrawReason::NONE;
    std::vector<PieceType> capturedByWhite;
    std::vector<PieceType> capturedByBlack;
    std::vector<std::string> moveHistory;
    bool hasSelection = false;
    Square selected;
};

class GameSession {
public:
    explicit GameSession(const SessionConfig& cfg = SessionConfig())
        : config(cfg),
          white_ai(makeStrategy(searchConfigFor(cfg.whiteLevel))),
          black_ai(makeStrategy(searchConfigFor(cfg.blackLevel))) {}

    GameSession(const SessionConfig& cfg, const Board& initial)
        : config(cfg),
          game(initial),
          white_ai(makeStrategy(searchConfigFor(cfg.whiteLevel))),
          black_ai(makeStrategy(searchConfigFor(cfg.blackLevel))) {}

    const GameState& state() const { return game; }
    const SessionConfig& sessionConfig() const { return config; }

    // First click on an own piece selects it; a click on one of its legal
    // destinations plays the move; a click on another own piece re-selects;
    // anything else clears the selection.
    SelectionResult select(Square sq) {
        if (!sq.valid()) throw InvalidSquare(sq.row, sq.col);

        SelectionResult result;
        if (game.isGameOver()) {
            clearSelection();
            return result;
        }

        if (has_selection) {
            if (destinationMove(sq) != nullptr) {
                result.applied = moveSelectedTo(sq);
                result.moveMade = true;
                return result;
            }
            clearSelection();
        }

        const Piece& piece = game.board().get(sq);
        if (!piece.empty() && piece.color == game.sideToMove()) {
            has_selection = true;
            selected = sq;
            selected_moves = game.legalMovesFrom(sq);
            result.selected = true;
            result.legalMoves = selected_moves;
        }
        return result;
    }

    ApplyResult moveSelectedTo(Square dest) {
        if (!dest.valid()) throw InvalidSquare(dest.row, dest.col);
        if (!has_selection) throw NoActiveSelection();

        const Move* m = destinationMove(dest);
        if (m == nullptr) {
            throw IllegalMove(selected.algebraic() + dest.algebraic() + " is not a legal destination");
        }
        const Move chosen = *m;
        clearSelection();
        return apply(chosen);
    }

    ApplyResult apply(const Move& m) {
        ApplyResult result;
        result.move = m;
        result.captured = game.applyMove(m);
        clearSelection();

        const StatusReport& report = game.statusReport();
        result.status = report.status;
        result.isCheck = report.inCheck;
        result.isCheckmate = report.status == GameStatus::CHECKMATE;
        result.isStalemate = report.status == GameStatus::STALEMATE;
        result.isDraw = report.status == GameStatus::DRAW;

        if (report.isGameOver()) {
            logLine(LogLevel::INFO, std::string("game over: ") + statusName(report.status) +
                                        " after " + moveToAlgebraic(m));
        }
        return result;
    }

    bool undo() {
        clearSelection();
        try {
            game.undoMove();
        } catch (const EmptyHistory&) {
            return false;
        }
        return true;
    }

    // Searches on a private copy of the board; the game is never touched.
    // A negative budget uses the thinking time of the side's difficulty.
    Move requestAiMove(double time_budget = -1.0) {
        if (game.isGameOver()) return Move::none();
        const Color side = game.sideToMove();
        const SearchConfig cfg = searchConfigFor(levelFor(side));
        Board scratch = game.board();
        return strategyFor(side).chooseMove(scratch, time_budget < 0.0 ? cfg.thinkingTime : time_budget);
    }

    // Replaces the move chooser of `side`; depth, time and weights still
    // follow the side's difficulty.
    void setStrategy(Color side, StrategyKind kind) {
        SearchConfig cfg = searchConfigFor(levelFor(side));
        cfg.strategy = kind;
        (side == WHITE ? white_ai : black_ai) = makeStrategy(cfg);
    }

    StrategyKind strategyKind(Color side) const {
        return (side == WHITE ? white_ai : black_ai)->kind();
    }

    bool isAiTurn() const {
        switch (config.mode) {
            case GameMode::HUMAN_VS_HUMAN: return false;
            case GameMode::AI_VS_AI:       return true;
            case GameMode::HUMAN_VS_AI:    return game.sideToMove() != config.humanColor;
        }
        return false;
    }

    const SearchStats& lastSearch(Color side) const {
        return (side == WHITE ? white_ai : black_ai)->lastSearch();
    }

    Snapshot snapshot() const {
        Snapshot snap;
        snap.pieces = game.board().allPieces();
        snap.sideToMove = game.sideToMove();
        snap.isCheck = game.inCheck();
        snap.status = game.status();
        snap.drawReason = game.drawReason();
        snap.capturedByWhite = game.capturedBy(WHITE);
        snap.capturedByBlack = game.capturedBy(BLACK);
        for (const Move& m : game.history()) snap.moveHistory.push_back(moveToAlgebraic(m));
        snap.hasSelection = has_selection;
        snap.selected = selected;
        return snap;
    }

    bool hasSelection() const { return has_selection; }
    Square selectedSquare() const { return selected; }

    void clearSelection() {
        has_selection = false;
        selected_moves.clear();
    }

    void reset() {
        clearSelection();
        game = GameState();
    }

private:
    SessionConfig config;
    GameState game;
    std::unique_ptr<MoveStrategy> white_ai;
    std::unique_ptr<MoveStrategy> black_ai;

    bool has_selection = false;
    Square selected;
    std::vector<Move> selected_moves;

    MoveStrategy& strategyFor(Color c) { return c == WHITE ? *white_ai : *black_ai; }
    Difficulty levelFor(Color c) const { return c == WHITE ? config.whiteLevel : config.blackLevel; }

    // Several promotion moves share a destination; prefer the queen when
    // auto-promotion is on, otherwise the first generated.
    const Move* destinationMove(Square dest) const {
        const Move* found = nullptr;
        for (const Move& m : selected_moves) {
            if (m.to != dest) continue;
            if (found == nullptr) found = &m;
            if (config.autoQueenPromotion && m.promotion == QUEEN) return &m;
        }
        return found;
    }
};

} // namespace gambit

#endif // GAMBIT_GAME_HPP
