/*
 * Static evaluation. Every term is computed as White minus Black in
 * centipawns, scaled by its weight, and the total is flipped to the
 * requested perspective. No term looks at anything but the board.
 */

#ifndef GAMBIT_EVALUATOR_HPP
#define GAMBIT_EVALUATOR_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>

#include "board.hpp"
#include "movegen.hpp"
#include "types.hpp"

namespace gambit {

struct EvaluationConfig {
    double material = 1.0;
    double piecePosition = 0.0;
    double pawnStructure = 0.0;
    double centerControl = 0.0;
    double kingSafety = 0.0;
    double mobility = 0.0;
};

// ───────────────────────── Piece-square tables ─────────────────────
// Row 0 is rank 8 as seen by White; Black reads the table mirrored.
namespace pst {
    using Table = std::array<std::array<int, 8>, 8>;

    constexpr Table PAWN_TABLE = {{
        {  0,  0,  0,  0,  0,  0,  0,  0},
        { 50, 50, 50, 50, 50, 50, 50, 50},
        { 10, 10, 20, 30, 30, 20, 10, 10},
        {  5,  5, 10, 25, 25, 10,  5,  5},
        {  0,  0,  0, 20, 20,  0,  0,  0},
        {  5, -5,-10,  0,  0,-10, -5,  5},
        {  5, 10, 10,-20,-20, 10, 10,  5},
        {  0,  0,  0,  0,  0,  0,  0,  0}
    }};

    constexpr Table KNIGHT_TABLE = {{
        {-50,-40,-30,-30,-30,-30,-40,-50},
        {-40,-20,  0,  0,  0,  0,-20,-40},
        {-30,  0, 10, 15, 15, 10,  0,-30},
        {-30,  5, 15, 20, 20, 15,  5,-30},
        {-30,  0, 15, 20, 20, 15,  0,-30},
        {-30,  5, 10, 15, 15, 10,  5,-30},
        {-40,-20,  0,  5,  5,  0,-20,-40},
        {-50,-40,-30,-30,-30,-30,-40,-50}
    }};

    constexpr Table BISHOP_TABLE = {{
        {-20,-10,-10,-10,-10,-10,-10,-20},
        {-10,  0,  0,  0,  0,  0,  0,-10},
        {-10,  0,  5, 10, 10,  5,  0,-10},
        {-10,  5,  5, 10, 10,  5,  5,-10},
        {-10,  0, 10, 10, 10, 10,  0,-10},
        {-10, 10, 10, 10, 10, 10, 10,-10},
        {-10,  5,  0,  0,  0,  0,  5,-10},
        {-20,-10,-10,-10,-10,-10,-10,-20}
    }};

    constexpr Table ROOK_TABLE = {{
        {  0,  0,  0,  0,  0,  0,  0,  0},
        {  5, 10, 10, 10, 10, 10, 10,  5},
        { -5,  0,  0,  0,  0,  0,  0, -5},
        { -5,  0,  0,  0,  0,  0,  0, -5},
        { -5,  0,  0,  0,  0,  0,  0, -5},
        { -5,  0,  0,  0,  0,  0,  0, -5},
        { -5,  0,  0,  0,  0,  0,  0, -5},
        {  0,  0,  0,  5,  5,  0,  0,  0}
    }};

    constexpr Table QUEEN_TABLE = {{
        {-20,-10,-10, -5, -5,-10,-10,-20},
        {-10,  0,  0,  0,  0,  0,  0,-10},
        {-10,  0,  5,  5,  5,  5,  0,-10},
        { -5,  0,  5,  5,  5,  5,  0, -5},
        {  0,  0,  5,  5,  5,  5,  0, -5},
        {-10,  5,  5,  5,  5,  5,  0,-10},
        {-10,  0,  5,  0,  0,  0,  0,-10},
        {-20,-10,-10, -5, -5,-10,-10,-20}
    }};

    constexpr Table KING_TABLE = {{
        {-30,-40,-40,-50,-50,-40,-40,-30},
        {-30,-40,-40,-50,-50,-40,-40,-30},
        {-30,-40,-40,-50,-50,-40,-40,-30},
        {-30,-40,-40,-50,-50,-40,-40,-30},
        {-20,-30,-30,-40,-40,-30,-30,-20},
        {-10,-20,-20,-20,-20,-20,-20,-10},
        { 20, 20,  0,  0,  0,  0, 20, 20},
        { 20, 30, 10,  0,  0, 10, 30, 20}
    }};

    inline const Table& tableFor(PieceType t) {
        switch (t) {
            case PAWN:   return PAWN_TABLE;
            case KNIGHT: return KNIGHT_TABLE;
            case BISHOP: return BISHOP_TABLE;
            case ROOK:   return ROOK_TABLE;
            case QUEEN:  return QUEEN_TABLE;
            default:     return KING_TABLE;
        }
    }
} // namespace pst

// ───────────────────────── Evaluator ────────────────────────────────
class Evaluator {
public:
    static constexpr int ISOLATED_PAWN_PENALTY = 20;
    static constexpr int DOUBLED_PAWN_PENALTY = 10;
    static constexpr int CENTER_SQUARE_BONUS = 10;
    static constexpr int KING_PROTECTOR_BONUS = 10;
    static constexpr int KING_CORNER_PENALTY = 2;
    static constexpr int MOBILITY_BONUS = 10;
    static constexpr int ENDGAME_PIECE_COUNT = 12;

    explicit Evaluator(const EvaluationConfig& cfg = EvaluationConfig()) : config(cfg) {}

    const EvaluationConfig& weights() const { return config; }

    int evaluate(const Board& b, Color perspective) const {
        double total = config.material * materialBalance(b);
        if (config.piecePosition != 0.0) total += config.piecePosition * piecePositionBalance(b);
        if (config.pawnStructure != 0.0) total += config.pawnStructure * pawnStructureBalance(b);
        if (config.centerControl != 0.0) total += config.centerControl * centerControlBalance(b);
        if (config.kingSafety != 0.0)    total += config.kingSafety * kingSafetyBalance(b);
        if (config.mobility != 0.0)      total += config.mobility * mobilityBalance(b);

        const int score = static_cast<int>(std::lround(total));
        return perspective == WHITE ? score : -score;
    }

    static int materialBalance(const Board& b) {
        int score = 0;
        for (int sq = 0; sq < 64; ++sq) {
            const Piece& p = b.pieceAt(sq);
            if (p.empty()) continue;
            score += sign(p.color) * PIECE_VALUE[p.type];
        }
        return score;
    }

    static int piecePositionBalance(const Board& b) {
        int score = 0;
        for (int sq = 0; sq < 64; ++sq) {
            const Piece& p = b.pieceAt(sq);
            if (p.empty()) continue;
            const int row = p.color == WHITE ? p.square.row : 7 - p.square.row;
            score += sign(p.color) * pst::tableFor(p.type)[row][p.square.col];
        }
        return score;
    }

    static int pawnStructureBalance(const Board& b) {
        int score = 0;
        for (Color c : {WHITE, BLACK}) {
            std::array<int, 8> per_file{};
            for (int sq = 0; sq < 64; ++sq) {
                const Piece& p = b.pieceAt(sq);
                if (p.type == PAWN && p.color == c) per_file[sq & 7]++;
            }
            int doubled = 0, isolated = 0;
            for (int f = 0; f < 8; ++f) {
                if (per_file[f] == 0) continue;
                if (per_file[f] > 1) doubled += per_file[f] - 1;
                const bool left = f > 0 && per_file[f - 1] > 0;
                const bool right = f < 7 && per_file[f + 1] > 0;
                if (!left && !right) isolated += per_file[f];
            }
            score += sign(c) * -(ISOLATED_PAWN_PENALTY * isolated + DOUBLED_PAWN_PENALTY * doubled);
        }
        return score;
    }

    static int centerControlBalance(const Board& b) {
        static const int center[4][2] = {{3, 3}, {3, 4}, {4, 3}, {4, 4}};
        int score = 0;
        for (const auto& rc : center) {
            const Piece& p = b.pieceAt(rc[0], rc[1]);
            if (!p.empty()) score += sign(p.color) * CENTER_SQUARE_BONUS;
        }
        return score;
    }

    // Middlegame only: reward friendly neighbours, penalise drifting from a corner.
    static int kingSafetyBalance(const Board& b) {
        if (b.pieceCount() <= ENDGAME_PIECE_COUNT) return 0;
        int score = 0;
        for (Color c : {WHITE, BLACK}) {
            const int king_sq = b.kingIndex(c);
            if (king_sq < 0) continue;
            const Square k = Square::fromIndex(king_sq);

            int protectors = 0;
            for (const auto& o : movegen::KING_OFFSETS) {
                if (!on_board_rc(k.row + o[0], k.col + o[1])) continue;
                const Piece& p = b.pieceAt(k.row + o[0], k.col + o[1]);
                if (!p.empty() && p.color == c) protectors++;
            }
            const int corner_distance = std::min(
                std::min(k.row + k.col, k.row + (7 - k.col)),
                std::min((7 - k.row) + k.col, (7 - k.row) + (7 - k.col)));

            score += sign(c) * (KING_PROTECTOR_BONUS * protectors - KING_CORNER_PENALTY * corner_distance);
        }
        return score;
    }

    static int mobilityBalance(const Board& b) {
        return MOBILITY_BONUS * (countPseudoLegal(b, WHITE) - countPseudoLegal(b, BLACK));
    }

private:
    EvaluationConfig config;

    static int sign(Color c) { return c == WHITE ? 1 : -1; }
};

} // namespace gambit

#endif // GAMBIT_EVALUATOR_HPP
