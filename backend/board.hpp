/*
 * Mailbox position model: 64 slots, each holding zero or one Piece.
 * Moves are applied in place and reverted from the UndoInfo delta that
 * makeMove hands back, so the search can reuse a single Board.
 */

#ifndef GAMBIT_BOARD_HPP
#define GAMBIT_BOARD_HPP

#include <array>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace gambit {

// ───────────────────────── Zobrist Hashing ───────────────────
struct ZobristKeys {
    std::array<std::array<uint64_t, 64>, 12> piece_square_keys;
    uint64_t black_to_move_key;
    std::array<uint64_t, 16> castling_keys;
    std::array<uint64_t, 8> ep_file_keys;

    ZobristKeys() {
        std::mt19937_64 rng(0xDEADBEEFCAFEFULL);
        std::uniform_int_distribution<uint64_t> dist(0, std::numeric_limits<uint64_t>::max());

        for (auto& per_piece : piece_square_keys) {
            for (auto& key : per_piece) key = dist(rng);
        }
        black_to_move_key = dist(rng);
        for (auto& key : castling_keys) key = dist(rng);
        for (auto& key : ep_file_keys) key = dist(rng);
    }
};

inline const ZobristKeys& getZobristKeys() {
    static ZobristKeys keys_instance;
    return keys_instance;
}

// Everything makeMove overwrites, kept so unmakeMove can put it back.
struct UndoInfo {
    Move move;
    Piece moved;    // mover as it stood on the origin square
    Piece captured; // empty unless something was taken
    Piece rook;     // castling rook before it moved
    int prevEpSquare = -1;
    int prevHalfmoveClock = 0;
    int prevFullmoveNumber = 1;
    Color prevSideToMove = WHITE;
};

// ───────────────────────── Board ──────────────────────────────────
class Board {
public:
    static constexpr uint8_t WK_CASTLE_MASK = 0b0001;
    static constexpr uint8_t WQ_CASTLE_MASK = 0b0010;
    static constexpr uint8_t BK_CASTLE_MASK = 0b0100;
    static constexpr uint8_t BQ_CASTLE_MASK = 0b1000;

    Color sideToMove = WHITE;
    int epSquare = -1; // square a double-pushed pawn just passed over
    int halfmoveClock = 0;
    int fullmoveNumber = 1;

    Board() = default;

    static Board startingPosition() {
        static const PieceType back_rank[8] = {ROOK, KNIGHT, BISHOP, QUEEN, KING, BISHOP, KNIGHT, ROOK};
        Board b;
        for (int c = 0; c < 8; ++c) {
            b.put(Square(homeRow(BLACK), c), Piece(back_rank[c], BLACK, Square()));
            b.put(Square(pawnStartRow(BLACK), c), Piece(PAWN, BLACK, Square()));
            b.put(Square(pawnStartRow(WHITE), c), Piece(PAWN, WHITE, Square()));
            b.put(Square(homeRow(WHITE), c), Piece(back_rank[c], WHITE, Square()));
        }
        return b;
    }

    static bool isWithinBounds(int row, int col) { return on_board_rc(row, col); }
    static bool isWithinBounds(Square sq) { return sq.valid(); }

    // Unchecked slot access for the generators and the search.
    const Piece& pieceAt(int idx) const { return mailbox[idx]; }
    const Piece& pieceAt(int row, int col) const { return mailbox[row * 8 + col]; }

    const Piece& get(Square sq) const {
        requireSquare(sq);
        return mailbox[sq.index()];
    }

    void place(Square sq, const Piece& piece) {
        requireSquare(sq);
        if (!mailbox[sq.index()].empty()) {
            throw ChessError("Square " + sq.algebraic() + " is already occupied");
        }
        put(sq, piece);
    }

    Piece remove(Square sq) {
        requireSquare(sq);
        Piece old = mailbox[sq.index()];
        mailbox[sq.index()] = Piece();
        return old;
    }

    void clear() {
        mailbox.fill(Piece());
        sideToMove = WHITE;
        epSquare = -1;
        halfmoveClock = 0;
        fullmoveNumber = 1;
    }

    int kingIndex(Color c) const {
        for (int i = 0; i < 64; ++i) {
            if (mailbox[i].type == KING && mailbox[i].color == c) return i;
        }
        return -1;
    }

    std::vector<Piece> pieces(Color c) const {
        std::vector<Piece> out;
        for (const Piece& p : mailbox) {
            if (!p.empty() && p.color == c) out.push_back(p);
        }
        return out;
    }

    std::vector<Piece> allPieces() const {
        std::vector<Piece> out;
        for (const Piece& p : mailbox) {
            if (!p.empty()) out.push_back(p);
        }
        return out;
    }

    int pieceCount() const {
        int n = 0;
        for (const Piece& p : mailbox) n += p.empty() ? 0 : 1;
        return n;
    }

    // Castling availability follows from the has-moved flags of king and rooks.
    uint8_t castlingRights() const {
        uint8_t rights = 0;
        if (canStillCastle(WHITE, 7)) rights |= WK_CASTLE_MASK;
        if (canStillCastle(WHITE, 0)) rights |= WQ_CASTLE_MASK;
        if (canStillCastle(BLACK, 7)) rights |= BK_CASTLE_MASK;
        if (canStillCastle(BLACK, 0)) rights |= BQ_CASTLE_MASK;
        return rights;
    }

    bool canStillCastle(Color c, int rook_col) const {
        const Piece& king = pieceAt(homeRow(c), 4);
        const Piece& rook = pieceAt(homeRow(c), rook_col);
        return king.type == KING && king.color == c && !king.hasMoved &&
               rook.type == ROOK && rook.color == c && !rook.hasMoved;
    }

    UndoInfo makeMove(const Move& m) {
        requireSquare(m.from);
        requireSquare(m.to);
        Piece mover = mailbox[m.from.index()];
        if (mover.empty()) {
            throw IllegalMove("No piece on " + m.from.algebraic());
        }

        UndoInfo u;
        u.move = m;
        u.moved = mover;
        u.prevEpSquare = epSquare;
        u.prevHalfmoveClock = halfmoveClock;
        u.prevFullmoveNumber = fullmoveNumber;
        u.prevSideToMove = sideToMove;

        mailbox[m.from.index()] = Piece();

        if (m.kind == MoveKind::EN_PASSANT) {
            Square passed(m.from.row, m.to.col);
            u.captured = mailbox[passed.index()];
            mailbox[passed.index()] = Piece();
        } else if (!mailbox[m.to.index()].empty()) {
            u.captured = mailbox[m.to.index()];
        }

        mover.square = m.to;
        mover.hasMoved = true;
        if (m.kind == MoveKind::PROMOTION && m.promotion != NO_PIECE_TYPE) {
            mover.type = m.promotion;
        }
        mailbox[m.to.index()] = mover;

        if (m.kind == MoveKind::CASTLE) {
            const bool king_side = m.to.col > m.from.col;
            Square rook_from(m.from.row, king_side ? 7 : 0);
            Square rook_to(m.from.row, king_side ? 5 : 3);
            Piece rook = mailbox[rook_from.index()];
            u.rook = rook;
            mailbox[rook_from.index()] = Piece();
            rook.square = rook_to;
            rook.hasMoved = true;
            mailbox[rook_to.index()] = rook;
        }

        epSquare = -1;
        if (u.moved.type == PAWN && std::abs(m.to.row - m.from.row) == 2) {
            epSquare = Square((m.from.row + m.to.row) / 2, m.from.col).index();
        }

        if (u.moved.type == PAWN || !u.captured.empty()) {
            halfmoveClock = 0;
        } else {
            halfmoveClock++;
        }
        if (u.moved.color == BLACK) {
            fullmoveNumber++;
        }
        sideToMove = opposite(u.moved.color);
        return u;
    }

    void unmakeMove(const UndoInfo& u) {
        const Move& m = u.move;
        mailbox[m.to.index()] = Piece();
        mailbox[m.from.index()] = u.moved;
        if (!u.captured.empty()) {
            mailbox[u.captured.square.index()] = u.captured;
        }
        if (m.kind == MoveKind::CASTLE && !u.rook.empty()) {
            const bool king_side = m.to.col > m.from.col;
            mailbox[Square(m.from.row, king_side ? 5 : 3).index()] = Piece();
            mailbox[u.rook.square.index()] = u.rook;
        }
        epSquare = u.prevEpSquare;
        halfmoveClock = u.prevHalfmoveClock;
        fullmoveNumber = u.prevFullmoveNumber;
        sideToMove = u.prevSideToMove;
    }

    uint64_t positionKey() const {
        const auto& keys = getZobristKeys();
        uint64_t h = 0;
        for (int sq = 0; sq < 64; ++sq) {
            const Piece& p = mailbox[sq];
            if (p.empty()) continue;
            h ^= keys.piece_square_keys[p.color * 6 + p.type][sq];
        }
        if (sideToMove == BLACK) {
            h ^= keys.black_to_move_key;
        }
        h ^= keys.castling_keys[castlingRights() & 0xF];
        if (enPassantCapturePossible()) {
            h ^= keys.ep_file_keys[epSquare & 7];
        }
        return h;
    }

    // True when a pawn of the side to move stands next to the pawn that
    // just double-pushed. Pins are not considered.
    bool enPassantCapturePossible() const {
        if (epSquare == -1) return false;
        const Square target = Square::fromIndex(epSquare);
        const int from_row = target.row - pawnDirection(sideToMove);
        for (int dc = -1; dc <= 1; dc += 2) {
            if (!on_board_rc(from_row, target.col + dc)) continue;
            const Piece& p = pieceAt(from_row, target.col + dc);
            if (p.type == PAWN && p.color == sideToMove) return true;
        }
        return false;
    }

    std::string pretty() const {
        std::stringstream ss;
        ss << "  +-----------------+\n";
        for (int r = 0; r < 8; ++r) {
            ss << 8 - r << " | ";
            for (int c = 0; c < 8; ++c) {
                ss << pieceAt(r, c).symbol() << " ";
            }
            ss << "|\n";
        }
        ss << "  +-----------------+\n";
        ss << "    a b c d e f g h\n";
        ss << (sideToMove == WHITE ? "White" : "Black") << " to move.\n";
        ss << "EP Square: " << (epSquare != -1 ? Square::fromIndex(epSquare).algebraic() : "-") << "\n";
        uint8_t rights = castlingRights();
        ss << "Castling: ";
        if (rights & WK_CASTLE_MASK) ss << "K";
        if (rights & WQ_CASTLE_MASK) ss << "Q";
        if (rights & BK_CASTLE_MASK) ss << "k";
        if (rights & BQ_CASTLE_MASK) ss << "q";
        if (rights == 0) ss << "-";
        ss << "\n";
        ss << "Halfmoves: " << halfmoveClock << ", Fullmoves: " << fullmoveNumber << "\n";
        return ss.str();
    }

    bool operator==(const Board& o) const {
        return mailbox == o.mailbox && sideToMove == o.sideToMove && epSquare == o.epSquare &&
               halfmoveClock == o.halfmoveClock && fullmoveNumber == o.fullmoveNumber;
    }
    bool operator!=(const Board& o) const { return !(*this == o); }

private:
    std::array<Piece, 64> mailbox{};

    void put(Square sq, Piece piece) {
        piece.square = sq;
        mailbox[sq.index()] = piece;
    }

    static void requireSquare(Square sq) {
        if (!sq.valid()) throw InvalidSquare(sq.row, sq.col);
    }
};

} // namespace gambit

#endif // GAMBIT_BOARD_HPP
