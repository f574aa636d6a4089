#include <gtest/gtest.h>

#include "test_util.hpp"

using namespace gambit;
using gambit::test::put;
using gambit::test::sq;
using gambit::test::withKings;

TEST(BoardTest, StartingPositionLayout) {
    const Board b = Board::startingPosition();
    EXPECT_EQ(b.pieceCount(), 32);
    EXPECT_EQ(b.sideToMove, WHITE);
    EXPECT_EQ(b.epSquare, -1);
    EXPECT_EQ(b.castlingRights(), 0xF);

    EXPECT_EQ(b.get(sq("e1")).type, KING);
    EXPECT_EQ(b.get(sq("e1")).color, WHITE);
    EXPECT_EQ(b.get(sq("d8")).type, QUEEN);
    EXPECT_EQ(b.get(sq("d8")).color, BLACK);
    EXPECT_EQ(b.get(sq("a2")).type, PAWN);
    EXPECT_EQ(b.get(sq("h7")).color, BLACK);
    EXPECT_TRUE(b.get(sq("e4")).empty());
    EXPECT_EQ(b.kingIndex(WHITE), sq("e1").index());
    EXPECT_EQ(b.pieces(BLACK).size(), 16u);
}

TEST(BoardTest, SquareNaming) {
    EXPECT_EQ(Square(7, 0).algebraic(), "a1");
    EXPECT_EQ(Square(0, 7).algebraic(), "h8");
    EXPECT_EQ(sq("e4"), Square(4, 4));
    EXPECT_FALSE(Square(8, 0).valid());
    EXPECT_FALSE(Board::isWithinBounds(-1, 3));
    EXPECT_TRUE(Board::isWithinBounds(0, 0));
}

TEST(BoardTest, OutOfBoundsAccessThrows) {
    Board b = Board::startingPosition();
    EXPECT_THROW(b.get(Square(8, 0)), InvalidSquare);
    EXPECT_THROW(b.get(Square(0, -1)), InvalidSquare);
    EXPECT_THROW(b.remove(Square(9, 9)), InvalidSquare);

    // Large coordinates must not wrap back onto the board.
    EXPECT_FALSE(Square(259, 4).valid());
    EXPECT_FALSE(Square(4, -256).valid());
    EXPECT_THROW(b.get(Square(259, 4)), InvalidSquare);
    EXPECT_THROW(b.get(Square(4, -256)), InvalidSquare);
}

TEST(BoardTest, PlaceOnOccupiedSquareThrows) {
    Board b = Board::startingPosition();
    EXPECT_THROW(b.place(sq("e2"), Piece(QUEEN, WHITE, Square())), ChessError);
}

TEST(BoardTest, MakeFromEmptySquareThrows) {
    Board b = Board::startingPosition();
    const Board before = b;
    EXPECT_THROW(b.makeMove(Move(sq("e4"), sq("e5"), PAWN)), IllegalMove);
    EXPECT_EQ(b, before);
}

TEST(BoardTest, DoublePushSetsEnPassantSquare) {
    Board b = Board::startingPosition();
    const Board before = b;
    UndoInfo u = b.makeMove(Move(sq("e2"), sq("e4"), PAWN));

    EXPECT_EQ(b.epSquare, sq("e3").index());
    EXPECT_EQ(b.sideToMove, BLACK);
    EXPECT_EQ(b.halfmoveClock, 0);
    EXPECT_TRUE(b.get(sq("e4")).hasMoved);
    EXPECT_TRUE(b.get(sq("e2")).empty());

    b.unmakeMove(u);
    EXPECT_EQ(b, before);
}

TEST(BoardTest, ClocksAdvance) {
    Board b = Board::startingPosition();
    b.makeMove(Move(sq("g1"), sq("f3"), KNIGHT));
    EXPECT_EQ(b.halfmoveClock, 1);
    EXPECT_EQ(b.fullmoveNumber, 1);
    b.makeMove(Move(sq("g8"), sq("f6"), KNIGHT));
    EXPECT_EQ(b.halfmoveClock, 2);
    EXPECT_EQ(b.fullmoveNumber, 2);
}

TEST(BoardTest, KingsideCastleMovesRookAndRestores) {
    Board b = withKings("e1", "e8");
    put(b, "h1", ROOK, WHITE);
    const Board before = b;

    UndoInfo u = b.makeMove(Move(sq("e1"), sq("g1"), KING, MoveKind::CASTLE));
    EXPECT_EQ(b.get(sq("g1")).type, KING);
    EXPECT_EQ(b.get(sq("f1")).type, ROOK);
    EXPECT_TRUE(b.get(sq("h1")).empty());
    EXPECT_TRUE(b.get(sq("e1")).empty());
    EXPECT_EQ(b.castlingRights() & Board::WK_CASTLE_MASK, 0);

    b.unmakeMove(u);
    EXPECT_EQ(b, before);
    EXPECT_EQ(b.castlingRights() & Board::WK_CASTLE_MASK, Board::WK_CASTLE_MASK);
}

TEST(BoardTest, QueensideCastleForBlack) {
    Board b = withKings("e1", "e8", BLACK);
    put(b, "a8", ROOK, BLACK);
    const Board before = b;

    UndoInfo u = b.makeMove(Move(sq("e8"), sq("c8"), KING, MoveKind::CASTLE));
    EXPECT_EQ(b.get(sq("c8")).type, KING);
    EXPECT_EQ(b.get(sq("d8")).type, ROOK);
    EXPECT_TRUE(b.get(sq("a8")).empty());

    b.unmakeMove(u);
    EXPECT_EQ(b, before);
}

TEST(BoardTest, EnPassantRemovesPassedPawn) {
    Board b = withKings("e1", "e8", BLACK);
    put(b, "e5", PAWN, WHITE, true);
    put(b, "d7", PAWN, BLACK);
    b.makeMove(Move(sq("d7"), sq("d5"), PAWN));
    const Board before = b;

    UndoInfo u = b.makeMove(Move(sq("e5"), sq("d6"), PAWN, MoveKind::EN_PASSANT, PAWN));
    EXPECT_EQ(u.captured.type, PAWN);
    EXPECT_EQ(u.captured.square, sq("d5"));
    EXPECT_TRUE(b.get(sq("d5")).empty());
    EXPECT_EQ(b.get(sq("d6")).type, PAWN);
    EXPECT_EQ(b.get(sq("d6")).color, WHITE);

    b.unmakeMove(u);
    EXPECT_EQ(b, before);
    EXPECT_EQ(b.epSquare, sq("d6").index());
}

TEST(BoardTest, PromotionReplacesPawnAndRestores) {
    Board b = withKings("e1", "h8");
    put(b, "a7", PAWN, WHITE, true);
    put(b, "b8", ROOK, BLACK);
    const Board before = b;

    UndoInfo u = b.makeMove(Move(sq("a7"), sq("b8"), PAWN, MoveKind::PROMOTION, ROOK, KNIGHT));
    EXPECT_EQ(b.get(sq("b8")).type, KNIGHT);
    EXPECT_EQ(b.get(sq("b8")).color, WHITE);
    EXPECT_EQ(u.captured.type, ROOK);
    EXPECT_EQ(b.pieceCount(), 3);

    b.unmakeMove(u);
    EXPECT_EQ(b, before);
    EXPECT_EQ(b.get(sq("a7")).type, PAWN);
}

TEST(BoardTest, PositionKeyTracksSideToMove) {
    Board b = Board::startingPosition();
    const uint64_t start_key = b.positionKey();

    UndoInfo u = b.makeMove(Move(sq("g1"), sq("f3"), KNIGHT));
    EXPECT_NE(b.positionKey(), start_key);
    b.unmakeMove(u);
    EXPECT_EQ(b.positionKey(), start_key);

    b.sideToMove = BLACK;
    EXPECT_NE(b.positionKey(), start_key);
}

TEST(BoardTest, PositionKeyIgnoresUncapturableEnPassant) {
    Board quiet = withKings("e1", "e8");
    put(quiet, "e2", PAWN, WHITE);
    quiet.makeMove(Move(sq("e2"), sq("e4"), PAWN));
    ASSERT_NE(quiet.epSquare, -1);
    EXPECT_FALSE(quiet.enPassantCapturePossible());

    Board same = withKings("e1", "e8", BLACK);
    put(same, "e4", PAWN, WHITE, true);
    EXPECT_EQ(quiet.positionKey(), same.positionKey());

    Board capturable = withKings("e1", "e8");
    put(capturable, "e2", PAWN, WHITE);
    put(capturable, "d4", PAWN, BLACK, true);
    capturable.makeMove(Move(sq("e2"), sq("e4"), PAWN));
    EXPECT_TRUE(capturable.enPassantCapturePossible());

    Board no_ep = withKings("e1", "e8", BLACK);
    put(no_ep, "e4", PAWN, WHITE, true);
    put(no_ep, "d4", PAWN, BLACK, true);
    EXPECT_NE(capturable.positionKey(), no_ep.positionKey());
}

TEST(BoardTest, PrettyPrintsRanks) {
    const std::string text = Board::startingPosition().pretty();
    EXPECT_NE(text.find("8 | r n b q k b n r |"), std::string::npos);
    EXPECT_NE(text.find("1 | R N B Q K B N R |"), std::string::npos);
    EXPECT_NE(text.find("White to move."), std::string::npos);
    EXPECT_NE(text.find("Castling: KQkq"), std::string::npos);
}

TEST(MoveTest, Notation) {
    EXPECT_EQ(moveToString(Move(sq("e2"), sq("e4"), PAWN)), "e2e4");
    EXPECT_EQ(moveToString(Move(sq("e7"), sq("e8"), PAWN, MoveKind::PROMOTION, NO_PIECE_TYPE, QUEEN)), "e7e8q");
    EXPECT_EQ(moveToString(Move::none()), "0000");

    EXPECT_EQ(moveToAlgebraic(Move(sq("g1"), sq("f3"), KNIGHT)), "Ng1f3");
    EXPECT_EQ(moveToAlgebraic(Move(sq("e4"), sq("d5"), PAWN, MoveKind::CAPTURE, PAWN)), "e4xd5");
    EXPECT_EQ(moveToAlgebraic(Move(sq("e1"), sq("g1"), KING, MoveKind::CASTLE)), "O-O");
    EXPECT_EQ(moveToAlgebraic(Move(sq("e8"), sq("c8"), KING, MoveKind::CASTLE)), "O-O-O");
    EXPECT_EQ(moveToAlgebraic(Move(sq("e7"), sq("e8"), PAWN, MoveKind::PROMOTION, NO_PIECE_TYPE, QUEEN)), "e7e8=Q");
    EXPECT_TRUE(Move::none().isNull());
}
