/*
 * Core value types shared by the board, the rules and the search:
 * colors, piece types, squares, pieces and moves.
 */

#ifndef GAMBIT_TYPES_HPP
#define GAMBIT_TYPES_HPP

#include <array>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <string>

namespace gambit {

// ───────────────────────── Colors & piece types ─────────────────────
enum Color { WHITE, BLACK };

enum PieceType {
    PAWN, KNIGHT, BISHOP, ROOK, QUEEN, KING, // 0-5
    NO_PIECE_TYPE // 6
};

inline Color opposite(Color c) { return c == WHITE ? BLACK : WHITE; }

constexpr std::array<int, 6> PIECE_VALUE = {
    100, 320, 330, 500, 900, 20000
};

constexpr std::array<char, 7> PIECE_CHAR_REPR = {
    'P', 'N', 'B', 'R', 'Q', 'K', ' '
};

inline const char* colorName(Color c) { return c == WHITE ? "white" : "black"; }

inline const char* pieceTypeName(PieceType t) {
    switch (t) {
        case PAWN:   return "pawn";
        case KNIGHT: return "knight";
        case BISHOP: return "bishop";
        case ROOK:   return "rook";
        case QUEEN:  return "queen";
        case KING:   return "king";
        default:     return "none";
    }
}

// ───────────────────────── Square (row 0 = rank 8, col 0 = file a) ──
struct Square {
    int row = 0;
    int col = 0;

    Square() = default;
    Square(int r, int c) : row(r), col(c) {}

    static Square fromIndex(int idx) { return Square(idx >> 3, idx & 7); }

    int index() const { return row * 8 + col; }
    bool valid() const { return row >= 0 && row < 8 && col >= 0 && col < 8; }

    std::string algebraic() const {
        if (!valid()) return "??";
        std::string s;
        s += static_cast<char>('a' + col);
        s += static_cast<char>('8' - row);
        return s;
    }

    bool operator==(const Square& o) const { return row == o.row && col == o.col; }
    bool operator!=(const Square& o) const { return !(*this == o); }
};

inline bool on_board_rc(int r, int c) { return r >= 0 && r < 8 && c >= 0 && c < 8; }

// Back rank of a color and the rank its pawns start on.
inline int homeRow(Color c) { return c == WHITE ? 7 : 0; }
inline int pawnStartRow(Color c) { return c == WHITE ? 6 : 1; }
inline int pawnDirection(Color c) { return c == WHITE ? -1 : 1; }

// ───────────────────────── Piece ────────────────────────────────────
struct Piece {
    PieceType type = NO_PIECE_TYPE;
    Color color = WHITE;
    Square square;
    bool hasMoved = false;

    Piece() = default;
    Piece(PieceType t, Color c, Square sq, bool moved = false)
        : type(t), color(c), square(sq), hasMoved(moved) {}

    bool empty() const { return type == NO_PIECE_TYPE; }

    char symbol() const {
        if (empty()) return '.';
        char ch = PIECE_CHAR_REPR[type];
        return color == WHITE ? ch : static_cast<char>(ch - 'A' + 'a');
    }

    bool operator==(const Piece& o) const {
        if (empty() || o.empty()) return empty() == o.empty();
        return type == o.type && color == o.color && square == o.square && hasMoved == o.hasMoved;
    }
    bool operator!=(const Piece& o) const { return !(*this == o); }
};

// ───────────────────────── Move ─────────────────────────────────────
enum class MoveKind { NORMAL, CAPTURE, CASTLE, PROMOTION, EN_PASSANT };

inline const char* moveKindName(MoveKind k) {
    switch (k) {
        case MoveKind::NORMAL:     return "normal";
        case MoveKind::CAPTURE:    return "capture";
        case MoveKind::CASTLE:     return "castle";
        case MoveKind::PROMOTION:  return "promotion";
        case MoveKind::EN_PASSANT: return "en_passant";
    }
    return "normal";
}

// A move fully describes one transition; together with the UndoInfo the
// board hands back it also describes the inverse.
struct Move {
    Square from;
    Square to;
    PieceType piece = NO_PIECE_TYPE;
    MoveKind kind = MoveKind::NORMAL;
    PieceType captured = NO_PIECE_TYPE;
    PieceType promotion = NO_PIECE_TYPE;

    Move() = default;
    Move(Square f, Square t, PieceType p, MoveKind k = MoveKind::NORMAL,
         PieceType cap = NO_PIECE_TYPE, PieceType promo = NO_PIECE_TYPE)
        : from(f), to(t), piece(p), kind(k), captured(cap), promotion(promo) {}

    static Move none() { return Move(); }

    bool isNull() const { return from == to; }
    bool isCapture() const { return captured != NO_PIECE_TYPE; }
    bool isCastle() const { return kind == MoveKind::CASTLE; }
    bool isPromotion() const { return kind == MoveKind::PROMOTION; }
    bool isEnPassant() const { return kind == MoveKind::EN_PASSANT; }

    bool operator==(const Move& o) const {
        return from == o.from && to == o.to && piece == o.piece && kind == o.kind &&
               captured == o.captured && promotion == o.promotion;
    }
    bool operator!=(const Move& o) const { return !(*this == o); }
};

inline std::string moveToString(const Move& m) {
    if (m.isNull()) return "0000"; // Null move representation
    std::string s = m.from.algebraic() + m.to.algebraic();
    switch (m.promotion) {
        case QUEEN:  s += 'q'; break;
        case ROOK:   s += 'r'; break;
        case BISHOP: s += 'b'; break;
        case KNIGHT: s += 'n'; break;
        default: break;
    }
    return s;
}

// Long algebraic form: Ng1f3, e4xd5, O-O, e7e8=Q.
inline std::string moveToAlgebraic(const Move& m) {
    if (m.isNull()) return "--";
    if (m.isCastle()) return m.to.col > m.from.col ? "O-O" : "O-O-O";

    std::stringstream ss;
    if (m.piece != PAWN && m.piece != NO_PIECE_TYPE) ss << PIECE_CHAR_REPR[m.piece];
    ss << m.from.algebraic() << (m.isCapture() ? "x" : "") << m.to.algebraic();
    if (m.promotion != NO_PIECE_TYPE) ss << '=' << PIECE_CHAR_REPR[m.promotion];
    return ss.str();
}

} // namespace gambit

#endif // GAMBIT_TYPES_HPP
