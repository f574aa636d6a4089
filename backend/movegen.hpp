/*
 * Pseudo-legal move generation, one routine per piece type, plus the
 * attack query the legality filter and castling rely on.
 *
 * Pseudo-legal moves respect geometry and blocking but may leave the
 * mover's king in check; rules.hpp filters them.
 */

#ifndef GAMBIT_MOVEGEN_HPP
#define GAMBIT_MOVEGEN_HPP

#include <vector>

#include "board.hpp"
#include "types.hpp"

namespace gambit {

namespace movegen {
    constexpr int KNIGHT_OFFSETS[8][2] = {
        {-2, -1}, {-2, 1}, {-1, -2}, {-1, 2}, {1, -2}, {1, 2}, {2, -1}, {2, 1}
    };
    constexpr int KING_OFFSETS[8][2] = {
        {-1, -1}, {-1, 0}, {-1, 1}, {0, -1}, {0, 1}, {1, -1}, {1, 0}, {1, 1}
    };
    constexpr int DIAGONALS[4][2] = {{-1, -1}, {-1, 1}, {1, -1}, {1, 1}};
    constexpr int ORTHOGONALS[4][2] = {{-1, 0}, {1, 0}, {0, -1}, {0, 1}};

    constexpr PieceType PROMOTION_ORDER[4] = {QUEEN, ROOK, BISHOP, KNIGHT};

    inline bool slideHits(const Board& b, int row, int col, int dr, int dc, Color by,
                          PieceType first, PieceType second) {
        int r = row + dr, c = col + dc;
        while (on_board_rc(r, c)) {
            const Piece& p = b.pieceAt(r, c);
            if (!p.empty()) {
                return p.color == by && (p.type == first || p.type == second);
            }
            r += dr;
            c += dc;
        }
        return false;
    }
} // namespace movegen

// ───────────────────────── Attack query ─────────────────────────────
// Looks outward from the target square instead of generating the
// attacker's moves, so it never touches castling generation.
inline bool isSquareAttacked(const Board& b, Square sq, Color by) {
    const int r = sq.row, c = sq.col;

    // A pawn of `by` attacks from one row behind its direction of travel.
    const int pr = r - pawnDirection(by);
    for (int dc = -1; dc <= 1; dc += 2) {
        if (on_board_rc(pr, c + dc)) {
            const Piece& p = b.pieceAt(pr, c + dc);
            if (p.type == PAWN && p.color == by) return true;
        }
    }

    for (const auto& o : movegen::KNIGHT_OFFSETS) {
        if (!on_board_rc(r + o[0], c + o[1])) continue;
        const Piece& p = b.pieceAt(r + o[0], c + o[1]);
        if (p.type == KNIGHT && p.color == by) return true;
    }

    for (const auto& o : movegen::KING_OFFSETS) {
        if (!on_board_rc(r + o[0], c + o[1])) continue;
        const Piece& p = b.pieceAt(r + o[0], c + o[1]);
        if (p.type == KING && p.color == by) return true;
    }

    for (const auto& d : movegen::DIAGONALS) {
        if (movegen::slideHits(b, r, c, d[0], d[1], by, BISHOP, QUEEN)) return true;
    }
    for (const auto& d : movegen::ORTHOGONALS) {
        if (movegen::slideHits(b, r, c, d[0], d[1], by, ROOK, QUEEN)) return true;
    }
    return false;
}

// ───────────────────────── Per-piece generators ─────────────────────
inline void add_pawn_moves(const Board& b, const Piece& pawn, std::vector<Move>& moves) {
    const Square from = pawn.square;
    const int dir = pawnDirection(pawn.color);
    const int promo_row = homeRow(opposite(pawn.color));
    const int r1 = from.row + dir;
    if (!on_board_rc(r1, from.col)) return;

    auto push = [&](Square to, MoveKind kind, PieceType captured) {
        if (to.row == promo_row) {
            for (PieceType promo : movegen::PROMOTION_ORDER) {
                moves.emplace_back(from, to, PAWN, MoveKind::PROMOTION, captured, promo);
            }
        } else {
            moves.emplace_back(from, to, PAWN, kind, captured);
        }
    };

    if (b.pieceAt(r1, from.col).empty()) {
        push(Square(r1, from.col), MoveKind::NORMAL, NO_PIECE_TYPE);

        const int r2 = r1 + dir;
        if (from.row == pawnStartRow(pawn.color) && b.pieceAt(r2, from.col).empty()) {
            moves.emplace_back(from, Square(r2, from.col), PAWN);
        }
    }

    for (int dc = -1; dc <= 1; dc += 2) {
        const int c = from.col + dc;
        if (!on_board_rc(r1, c)) continue;
        const Square to(r1, c);
        const Piece& target = b.pieceAt(r1, c);
        if (!target.empty()) {
            if (target.color != pawn.color) push(to, MoveKind::CAPTURE, target.type);
        } else if (to.index() == b.epSquare) {
            const Piece& passed = b.pieceAt(from.row, c);
            if (passed.type == PAWN && passed.color != pawn.color) {
                moves.emplace_back(from, to, PAWN, MoveKind::EN_PASSANT, PAWN);
            }
        }
    }
}

inline void add_step_moves(const Board& b, const Piece& piece, const int (*offsets)[2], int count,
                           std::vector<Move>& moves) {
    const Square from = piece.square;
    for (int i = 0; i < count; ++i) {
        const int r = from.row + offsets[i][0];
        const int c = from.col + offsets[i][1];
        if (!on_board_rc(r, c)) continue;
        const Piece& target = b.pieceAt(r, c);
        if (target.empty()) {
            moves.emplace_back(from, Square(r, c), piece.type);
        } else if (target.color != piece.color) {
            moves.emplace_back(from, Square(r, c), piece.type, MoveKind::CAPTURE, target.type);
        }
    }
}

inline void add_sliding_moves(const Board& b, const Piece& piece, const int (*dirs)[2], int count,
                              std::vector<Move>& moves) {
    const Square from = piece.square;
    for (int i = 0; i < count; ++i) {
        int r = from.row + dirs[i][0];
        int c = from.col + dirs[i][1];
        while (on_board_rc(r, c)) {
            const Piece& target = b.pieceAt(r, c);
            if (target.empty()) {
                moves.emplace_back(from, Square(r, c), piece.type);
            } else {
                if (target.color != piece.color) {
                    moves.emplace_back(from, Square(r, c), piece.type, MoveKind::CAPTURE, target.type);
                }
                break;
            }
            r += dirs[i][0];
            c += dirs[i][1];
        }
    }
}

inline void add_castle_moves(const Board& b, const Piece& king, std::vector<Move>& moves) {
    const Color us = king.color;
    const Color them = opposite(us);
    const int row = homeRow(us);
    if (king.hasMoved || king.square != Square(row, 4)) return;
    if (isSquareAttacked(b, king.square, them)) return;

    if (b.canStillCastle(us, 7) &&
        b.pieceAt(row, 5).empty() && b.pieceAt(row, 6).empty() &&
        !isSquareAttacked(b, Square(row, 5), them) && !isSquareAttacked(b, Square(row, 6), them)) {
        moves.emplace_back(king.square, Square(row, 6), KING, MoveKind::CASTLE);
    }
    if (b.canStillCastle(us, 0) &&
        b.pieceAt(row, 1).empty() && b.pieceAt(row, 2).empty() && b.pieceAt(row, 3).empty() &&
        !isSquareAttacked(b, Square(row, 3), them) && !isSquareAttacked(b, Square(row, 2), them)) {
        moves.emplace_back(king.square, Square(row, 2), KING, MoveKind::CASTLE);
    }
}

// Appends the pseudo-legal moves of the piece on `from` (nothing if empty).
inline void pseudoLegalMoves(const Board& b, Square from, std::vector<Move>& moves,
                             bool include_castling = true) {
    const Piece& piece = b.pieceAt(from.index());
    switch (piece.type) {
        case PAWN:
            add_pawn_moves(b, piece, moves);
            break;
        case KNIGHT:
            add_step_moves(b, piece, movegen::KNIGHT_OFFSETS, 8, moves);
            break;
        case BISHOP:
            add_sliding_moves(b, piece, movegen::DIAGONALS, 4, moves);
            break;
        case ROOK:
            add_sliding_moves(b, piece, movegen::ORTHOGONALS, 4, moves);
            break;
        case QUEEN:
            add_sliding_moves(b, piece, movegen::ORTHOGONALS, 4, moves);
            add_sliding_moves(b, piece, movegen::DIAGONALS, 4, moves);
            break;
        case KING:
            add_step_moves(b, piece, movegen::KING_OFFSETS, 8, moves);
            if (include_castling) add_castle_moves(b, piece, moves);
            break;
        case NO_PIECE_TYPE:
            break;
    }
}

inline void generatePseudoLegal(const Board& b, Color side, std::vector<Move>& moves,
                                bool include_castling = true) {
    moves.clear();
    for (int sq = 0; sq < 64; ++sq) {
        const Piece& p = b.pieceAt(sq);
        if (p.empty() || p.color != side) continue;
        pseudoLegalMoves(b, p.square, moves, include_castling);
    }
}

inline int countPseudoLegal(const Board& b, Color side) {
    std::vector<Move> moves;
    moves.reserve(64);
    generatePseudoLegal(b, side, moves, false);
    return static_cast<int>(moves.size());
}

} // namespace gambit

#endif // GAMBIT_MOVEGEN_HPP
