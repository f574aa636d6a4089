#ifndef GAMBIT_RULES_HPP
#define GAMBIT_RULES_HPP

#include <vector>

#include "board.hpp"
#include "movegen.hpp"
#include "types.hpp"

namespace gambit {

// ───────────────────────── Outcome enums ────────────────────────────
enum class GameStatus { ACTIVE, CHECK, CHECKMATE, STALEMATE, DRAW };

enum class DrawReason { NONE, INSUFFICIENT_MATERIAL, FIFTY_MOVE, THREEFOLD_REPETITION };

struct StatusReport {
    GameStatus status = GameStatus::ACTIVE;
    DrawReason drawReason = DrawReason::NONE;
    bool inCheck = false;

    bool isGameOver() const {
        return status == GameStatus::CHECKMATE || status == GameStatus::STALEMATE ||
               status == GameStatus::DRAW;
    }
};

inline bool isInCheck(const Board& b, Color side) {
    const int king_sq = b.kingIndex(side);
    if (king_sq < 0) return false;
    return isSquareAttacked(b, Square::fromIndex(king_sq), opposite(side));
}

// ───────────────────────── Legal move filter ────────────────────────
// Each candidate is played on `b` and taken back; `b` is unchanged on return.
inline void legalMoves(Board& b, Color side, std::vector<Move>& moves) {
    std::vector<Move> candidates;
    candidates.reserve(64);
    generatePseudoLegal(b, side, candidates);

    moves.clear();
    for (const Move& m : candidates) {
        UndoInfo u = b.makeMove(m);
        const bool leaves_king_attacked = isInCheck(b, side);
        b.unmakeMove(u);
        if (!leaves_king_attacked) moves.push_back(m);
    }
}

inline std::vector<Move> legalMoves(const Board& b, Color side) {
    Board scratch = b;
    std::vector<Move> moves;
    legalMoves(scratch, side, moves);
    return moves;
}

inline std::vector<Move> legalMovesFrom(const Board& b, Square from) {
    const Piece& piece = b.get(from);
    std::vector<Move> moves;
    if (piece.empty()) return moves;

    Board scratch = b;
    std::vector<Move> candidates;
    pseudoLegalMoves(scratch, from, candidates);
    for (const Move& m : candidates) {
        UndoInfo u = scratch.makeMove(m);
        const bool leaves_king_attacked = isInCheck(scratch, piece.color);
        scratch.unmakeMove(u);
        if (!leaves_king_attacked) moves.push_back(m);
    }
    return moves;
}

inline bool hasLegalMoves(Board& b, Color side) {
    std::vector<Move> candidates;
    candidates.reserve(64);
    generatePseudoLegal(b, side, candidates);
    for (const Move& m : candidates) {
        UndoInfo u = b.makeMove(m);
        const bool leaves_king_attacked = isInCheck(b, side);
        b.unmakeMove(u);
        if (!leaves_king_attacked) return true;
    }
    return false;
}

// Bare kings, or a single knight or bishop against a bare king.
inline bool isInsufficientMaterial(const Board& b) {
    int white_count = 0, black_count = 0, minors = 0;
    for (int sq = 0; sq < 64; ++sq) {
        const Piece& p = b.pieceAt(sq);
        if (p.empty()) continue;
        (p.color == WHITE ? white_count : black_count)++;
        if (p.type == BISHOP || p.type == KNIGHT) minors++;
    }
    if (white_count == 1 && black_count == 1) return true;
    if (white_count + black_count == 3 && minors == 1) return true;
    return false;
}

// Status of `b` for its side to move. `repetitions` is how often the
// current position has occurred in the game, when the caller tracks it.
inline StatusReport computeStatus(const Board& b, int repetitions = 1) {
    StatusReport report;
    Board scratch = b;
    const Color side = b.sideToMove;
    report.inCheck = isInCheck(scratch, side);

    if (!hasLegalMoves(scratch, side)) {
        report.status = report.inCheck ? GameStatus::CHECKMATE : GameStatus::STALEMATE;
        return report;
    }

    if (isInsufficientMaterial(b)) {
        report.drawReason = DrawReason::INSUFFICIENT_MATERIAL;
    } else if (b.halfmoveClock >= 100) {
        report.drawReason = DrawReason::FIFTY_MOVE;
    } else if (repetitions >= 3) {
        report.drawReason = DrawReason::THREEFOLD_REPETITION;
    }

    if (report.drawReason != DrawReason::NONE) {
        report.status = GameStatus::DRAW;
    } else {
        report.status = report.inCheck ? GameStatus::CHECK : GameStatus::ACTIVE;
    }
    return report;
}

inline const char* statusName(GameStatus s) {
    switch (s) {
        case GameStatus::ACTIVE:    return "active";
        case GameStatus::CHECK:     return "check";
        case GameStatus::CHECKMATE: return "checkmate";
        case GameStatus::STALEMATE: return "stalemate";
        case GameStatus::DRAW:      return "draw";
    }
    return "active";
}

} // namespace gambit

#endif // GAMBIT_RULES_HPP
