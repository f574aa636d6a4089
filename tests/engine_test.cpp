#include <algorithm>
#include <vector>

#include <gtest/gtest.h>

#include "test_util.hpp"

using namespace gambit;
using gambit::test::findMove;
using gambit::test::put;
using gambit::test::sq;
using gambit::test::withKings;

namespace {

bool contains(const std::vector<Move>& moves, const Move& m) {
    return std::find(moves.begin(), moves.end(), m) != moves.end();
}

} // namespace

TEST(EngineTest, PerftFromStart) {
    Engine engine;
    Board b = Board::startingPosition();
    const Board before = b;
    EXPECT_EQ(engine.perft(b, 0), 1u);
    EXPECT_EQ(engine.perft(b, 1), 20u);
    EXPECT_EQ(engine.perft(b, 2), 400u);
    EXPECT_EQ(engine.perft(b, 3), 8902u);
    EXPECT_EQ(b, before);
}

TEST(EngineTest, DifficultyLevels) {
    EXPECT_EQ(searchConfigFor(Difficulty::BEGINNER).maxDepth, 1);
    EXPECT_EQ(searchConfigFor(Difficulty::EASY).maxDepth, 2);
    EXPECT_EQ(searchConfigFor(Difficulty::MEDIUM).maxDepth, 3);
    EXPECT_EQ(searchConfigFor(Difficulty::HARD).maxDepth, 4);
    EXPECT_EQ(searchConfigFor(Difficulty::EXPERT).maxDepth, 5);
    EXPECT_DOUBLE_EQ(searchConfigFor(Difficulty::BEGINNER).thinkingTime, 1.0);
    EXPECT_DOUBLE_EQ(searchConfigFor(Difficulty::EXPERT).thinkingTime, 3.0);
    EXPECT_DOUBLE_EQ(searchConfigFor(Difficulty::BEGINNER).weights.mobility, 0.0);
    EXPECT_GT(searchConfigFor(Difficulty::EXPERT).weights.mobility, 0.0);

    EXPECT_EQ(searchConfigFor(Difficulty::BEGINNER).strategy, StrategyKind::RANDOM);
    EXPECT_EQ(searchConfigFor(Difficulty::EASY).strategy, StrategyKind::MINIMAX);
    EXPECT_EQ(searchConfigFor(Difficulty::MEDIUM).strategy, StrategyKind::ALPHA_BETA);
    EXPECT_EQ(searchConfigFor(Difficulty::EXPERT).strategy, StrategyKind::ALPHA_BETA);
}

TEST(EngineTest, TakesHangingQueen) {
    Board b = withKings("e1", "e8");
    put(b, "e4", PAWN, WHITE, true);
    put(b, "d5", QUEEN, BLACK);

    Engine engine(1);
    const Move best = engine.findBestMove(b);
    EXPECT_EQ(best.from, sq("e4"));
    EXPECT_EQ(best.to, sq("d5"));
    EXPECT_EQ(best.captured, QUEEN);
}

TEST(EngineTest, FindsMateInOne) {
    Board b = withKings("f6", "h8");
    put(b, "a7", QUEEN, WHITE);

    Engine engine(3);
    const Move best = engine.findBestMove(b);
    EXPECT_EQ(best.from, sq("a7"));
    EXPECT_EQ(best.to, sq("g7"));
    EXPECT_GE(engine.lastSearch().bestScore, Engine::MATE_SCORE - 10);

    b.makeMove(best);
    EXPECT_EQ(computeStatus(b).status, GameStatus::CHECKMATE);
}

TEST(EngineTest, DefendsAgainstMate) {
    // Black to move must stop Qxf7 mate.
    Board b = Board::startingPosition();
    const char* line[][2] = {{"e2", "e4"}, {"e7", "e5"}, {"f1", "c4"}, {"b8", "c6"}, {"d1", "h5"}};
    for (const auto& mv : line) b.makeMove(findMove(legalMoves(b, b.sideToMove), mv[0], mv[1]));

    Engine engine(2);
    const Move best = engine.findBestMove(b);
    b.makeMove(best);
    const Move mate = findMove(legalMoves(b, WHITE), "h5", "f7");
    if (!mate.isNull()) {
        b.makeMove(mate);
        EXPECT_NE(computeStatus(b).status, GameStatus::CHECKMATE) << moveToString(best);
    }
}

TEST(EngineTest, SearchLeavesBoardUntouched) {
    Board b = Board::startingPosition();
    b.makeMove(Move(sq("e2"), sq("e4"), PAWN));
    const Board before = b;

    Engine engine(searchConfigFor(Difficulty::MEDIUM));
    const Move best = engine.findBestMove(b, 3, 0.0);
    EXPECT_EQ(b, before);
    EXPECT_TRUE(contains(legalMoves(b, BLACK), best));
    EXPECT_GT(engine.getNodesVisited(), 0);
    EXPECT_EQ(engine.lastSearch().completedDepth, 3);
    EXPECT_FALSE(engine.lastSearch().timedOut);
}

TEST(EngineTest, NoMoveWhenStalemated) {
    Board b = withKings("g6", "h8", BLACK);
    put(b, "f7", QUEEN, WHITE);
    Engine engine(3);
    EXPECT_TRUE(engine.findBestMove(b).isNull());
}

TEST(EngineTest, NoMoveWhenMated) {
    Board b = withKings("f6", "h8", BLACK);
    put(b, "g7", QUEEN, WHITE);
    Engine engine(3);
    EXPECT_TRUE(engine.findBestMove(b).isNull());
    EXPECT_EQ(engine.searchScore(b, 2, true), -Engine::MATE_SCORE);
}

TEST(EngineTest, StalematingCaptureScoresAsDraw) {
    // Qxb6 wins the rook but leaves Black without a move.
    Board b = withKings("h1", "a8");
    put(b, "b1", QUEEN, WHITE);
    put(b, "b6", ROOK, BLACK);
    const Move stalemating = findMove(legalMoves(b, WHITE), "b1", "b6");
    ASSERT_FALSE(stalemating.isNull());

    for (int depth = 1; depth <= 2; ++depth) {
        Engine engine(depth);
        const Move best = engine.findBestMove(b);
        EXPECT_NE(best, stalemating) << "depth " << depth;
        EXPECT_GT(engine.lastSearch().bestScore, 0) << "depth " << depth;
    }

    b.makeMove(stalemating);
    EXPECT_EQ(computeStatus(b).status, GameStatus::STALEMATE);
    Engine engine(1);
    EXPECT_EQ(engine.searchScore(b, 0, true), 0);
    EXPECT_EQ(engine.searchScore(b, 3, false), 0);
}

TEST(EngineTest, MateAtHorizonBeatsMaterial) {
    Board mated = withKings("f6", "h8", BLACK);
    put(mated, "g7", QUEEN, WHITE);
    Engine engine(1);
    EXPECT_EQ(engine.searchScore(mated, 0, true), -Engine::MATE_SCORE);
}

TEST(EngineTest, MinimaxRootPicksSameMove) {
    Board b = Board::startingPosition();
    const char* line[][2] = {{"e2", "e4"}, {"d7", "d5"}, {"b1", "c3"}};
    for (const auto& mv : line) b.makeMove(findMove(legalMoves(b, b.sideToMove), mv[0], mv[1]));

    Engine pruned(2);
    Engine plain(2);
    const Move with_pruning = pruned.findBestMove(b, 2, 0.0, true);
    const Move without_pruning = plain.findBestMove(b, 2, 0.0, false);
    EXPECT_EQ(with_pruning, without_pruning);
    EXPECT_EQ(pruned.lastSearch().bestScore, plain.lastSearch().bestScore);
    EXPECT_LT(pruned.getNodesVisited(), plain.getNodesVisited());
}

TEST(EngineTest, EqualScoresKeepGenerationOrder) {
    Board b = withKings("e1", "e8");
    put(b, "a1", ROOK, WHITE);
    Engine engine(1);
    EXPECT_EQ(engine.findBestMove(b), legalMoves(b, WHITE).front());
}

TEST(EngineTest, PruningMatchesMinimax) {
    Board start = Board::startingPosition();
    Engine plain(searchConfigFor(Difficulty::EXPERT));
    Engine pruned(searchConfigFor(Difficulty::EXPERT));
    EXPECT_EQ(pruned.searchScore(start, 3, true), plain.searchScore(start, 3, false));
    EXPECT_LT(pruned.getNodesVisited(), plain.getNodesVisited());

    Board tactical = Board::startingPosition();
    const char* line[][2] = {{"e2", "e4"}, {"d7", "d5"}, {"b1", "c3"}, {"d5", "e4"}, {"c3", "e4"}, {"d8", "d4"}};
    for (const auto& mv : line) {
        tactical.makeMove(findMove(legalMoves(tactical, tactical.sideToMove), mv[0], mv[1]));
    }
    const Board before = tactical;
    Engine material_only(3);
    Engine reference(3);
    EXPECT_EQ(material_only.searchScore(tactical, 3, true), reference.searchScore(tactical, 3, false));
    EXPECT_EQ(tactical, before);
}

TEST(EngineTest, TimeBudgetStillReturnsMove) {
    Board b = Board::startingPosition();
    Engine engine(searchConfigFor(Difficulty::EXPERT));
    const Move best = engine.findBestMove(b, 5, 0.05);
    EXPECT_FALSE(best.isNull());
    EXPECT_TRUE(contains(legalMoves(b, WHITE), best));
    EXPECT_GE(engine.lastSearch().completedDepth, 1);
    EXPECT_LE(engine.lastSearch().completedDepth, 5);
}
