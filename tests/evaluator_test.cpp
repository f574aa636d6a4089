#include <gtest/gtest.h>

#include "test_util.hpp"

using namespace gambit;
using gambit::test::put;
using gambit::test::sq;
using gambit::test::withKings;

namespace {

EvaluationConfig allTerms() {
    EvaluationConfig cfg;
    cfg.piecePosition = 0.5;
    cfg.pawnStructure = 0.3;
    cfg.centerControl = 0.1;
    cfg.kingSafety = 0.4;
    cfg.mobility = 0.3;
    return cfg;
}

} // namespace

TEST(EvaluatorTest, StartingPositionIsBalanced) {
    const Board b = Board::startingPosition();
    EXPECT_EQ(Evaluator().evaluate(b, WHITE), 0);
    EXPECT_EQ(Evaluator(allTerms()).evaluate(b, WHITE), 0);
    EXPECT_EQ(Evaluator(allTerms()).evaluate(b, BLACK), 0);
    EXPECT_EQ(Evaluator::mobilityBalance(b), 0);
    EXPECT_EQ(Evaluator::kingSafetyBalance(b), 0);
    EXPECT_EQ(Evaluator::piecePositionBalance(b), 0);
}

TEST(EvaluatorTest, MaterialSignFollowsPerspective) {
    Board b = Board::startingPosition();
    b.remove(sq("d8"));
    const Evaluator eval;
    EXPECT_EQ(eval.evaluate(b, WHITE), 900);
    EXPECT_EQ(eval.evaluate(b, BLACK), -900);
}

TEST(EvaluatorTest, PerspectivesAreNegations) {
    Board b = Board::startingPosition();
    b.makeMove(Move(sq("e2"), sq("e4"), PAWN));
    b.makeMove(Move(sq("g8"), sq("f6"), KNIGHT));
    b.remove(sq("b1"));
    const Evaluator eval(allTerms());
    EXPECT_EQ(eval.evaluate(b, WHITE), -eval.evaluate(b, BLACK));
    EXPECT_LT(eval.evaluate(b, WHITE), 0);
}

TEST(EvaluatorTest, DoubledAndIsolatedPawns) {
    Board b = withKings("e1", "e8");
    put(b, "a2", PAWN, WHITE);
    put(b, "a3", PAWN, WHITE);
    // Two isolated pawns, one of them doubled.
    EXPECT_EQ(Evaluator::pawnStructureBalance(b), -50);

    put(b, "b2", PAWN, WHITE);
    EXPECT_EQ(Evaluator::pawnStructureBalance(b), -10);
}

TEST(EvaluatorTest, CenterOccupancy) {
    Board b = withKings("e1", "e8");
    put(b, "d4", KNIGHT, WHITE);
    EXPECT_EQ(Evaluator::centerControlBalance(b), 10);
    put(b, "e5", PAWN, BLACK);
    EXPECT_EQ(Evaluator::centerControlBalance(b), 0);
}

TEST(EvaluatorTest, PieceSquareTablesMirrorForBlack) {
    Board white_knight = withKings("e1", "e8");
    put(white_knight, "c3", KNIGHT, WHITE);
    Board black_knight = withKings("e1", "e8");
    put(black_knight, "c6", KNIGHT, BLACK);

    const int w = Evaluator::piecePositionBalance(white_knight);
    const int b = Evaluator::piecePositionBalance(black_knight);
    EXPECT_EQ(w, -b);
    EXPECT_GT(w - Evaluator::piecePositionBalance(withKings("e1", "e8")), 0);
}

TEST(EvaluatorTest, KingSafetyOnlyInMiddlegame) {
    Board b = withKings("g1", "e8");
    put(b, "f2", PAWN, WHITE);
    put(b, "g2", PAWN, WHITE);
    put(b, "h2", PAWN, WHITE);
    EXPECT_EQ(Evaluator::kingSafetyBalance(b), 0);
}

TEST(EvaluatorTest, MobilityCountsPseudoLegalMoves) {
    Board b = withKings("a1", "h8");
    put(b, "d4", QUEEN, WHITE);
    // King a1: 3, queen d4: 26 (including the capture on h8); king h8: 3
    EXPECT_EQ(Evaluator::mobilityBalance(b), 10 * (29 - 3));
}
