/*
 * Adversarial search: negamax with alpha-beta pruning under iterative
 * deepening, bounded by a ply limit and a wall-clock budget.
 *
 * The search plays every candidate on the Board it is handed and takes it
 * back before the next one, so the Board is identical before and after.
 */

#ifndef GAMBIT_ENGINE_HPP
#define GAMBIT_ENGINE_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <sstream>
#include <vector>

#include "board.hpp"
#include "evaluator.hpp"
#include "log.hpp"
#include "rules.hpp"
#include "types.hpp"

namespace gambit {

// ───────────────────────── Difficulty & config ─────────────────────
enum class Difficulty { BEGINNER = 1, EASY, MEDIUM, HARD, EXPERT };

// How a computer player picks its move; see strategy.hpp.
enum class StrategyKind { RANDOM, MINIMAX, ALPHA_BETA };

struct SearchConfig {
    int maxDepth = 3;
    double thinkingTime = 2.0; // seconds, <= 0 means unbounded
    EvaluationConfig weights;
    StrategyKind strategy = StrategyKind::ALPHA_BETA;
    uint32_t seed = 0x5EED;    // RANDOM only
};

inline SearchConfig searchConfigFor(Difficulty level) {
    SearchConfig cfg;
    switch (level) {
        case Difficulty::BEGINNER:
            cfg.maxDepth = 1;
            cfg.thinkingTime = 1.0;
            cfg.strategy = StrategyKind::RANDOM;
            break;
        case Difficulty::EASY:
            cfg.maxDepth = 2;
            cfg.thinkingTime = 1.0;
            cfg.weights.piecePosition = 0.3;
            cfg.strategy = StrategyKind::MINIMAX;
            break;
        case Difficulty::MEDIUM:
            cfg.maxDepth = 3;
            cfg.thinkingTime = 2.0;
            cfg.weights.piecePosition = 0.3;
            cfg.weights.pawnStructure = 0.2;
            cfg.weights.centerControl = 0.1;
            break;
        case Difficulty::HARD:
            cfg.maxDepth = 4;
            cfg.thinkingTime = 3.0;
            cfg.weights.piecePosition = 0.5;
            cfg.weights.pawnStructure = 0.3;
            cfg.weights.centerControl = 0.1;
            cfg.weights.kingSafety = 0.4;
            break;
        case Difficulty::EXPERT:
            cfg.maxDepth = 5;
            cfg.thinkingTime = 3.0;
            cfg.weights.piecePosition = 0.5;
            cfg.weights.pawnStructure = 0.3;
            cfg.weights.centerControl = 0.1;
            cfg.weights.kingSafety = 0.4;
            cfg.weights.mobility = 0.3;
            break;
    }
    return cfg;
}

struct SearchStats {
    long nodes = 0;
    int completedDepth = 0;
    int bestScore = 0;
    double elapsedSeconds = 0.0;
    bool timedOut = false;
};

// ───────────────────────── Engine class ─────────────────────────────
class Engine {
public:
    static constexpr int MATE_SCORE = 100000;
    static constexpr int INF = std::numeric_limits<int>::max() / 2;

    // Move ordering score constants
    static constexpr int SCORE_PROMOTION_TO_QUEEN = 1900000;
    static constexpr int SCORE_PROMOTION_OTHER    = 1750000;
    static constexpr int SCORE_CAPTURE_BASE       = 1000000;

    explicit Engine(int depth = 3) : Engine(SearchConfig{depth, 0.0, EvaluationConfig()}) {}

    explicit Engine(const SearchConfig& cfg) : config(cfg), evaluator(cfg.weights) {}

    const SearchConfig& searchConfig() const { return config; }
    const Evaluator& getEvaluator() const { return evaluator; }

    Move findBestMove(Board& root) {
        return findBestMove(root, config.maxDepth, config.thinkingTime);
    }

    // Returns the null move only when the side to move has no legal move.
    // Without pruning every subtree is searched in full (plain minimax).
    Move findBestMove(Board& root, int depth, double time_budget, bool pruning = true) {
        using clock = std::chrono::steady_clock;
        const auto start = clock::now();
        auto time_up = [&]() {
            if (time_budget <= 0.0) return false;
            return std::chrono::duration<double>(clock::now() - start).count() >= time_budget;
        };

        stats = SearchStats();
        std::vector<Move> root_moves;
        legalMoves(root, root.sideToMove, root_moves);
        if (root_moves.empty()) {
            logLine(LogLevel::INFO, "search: no legal moves for " + std::string(colorName(root.sideToMove)));
            return Move::none();
        }

        Move overall_best_move = Move::none();
        depth = std::max(depth, 1);

        for (int current_iter_depth = 1; current_iter_depth <= depth; ++current_iter_depth) {
            Move current_iter_best_root_move = Move::none();
            int best_score_this_iter_at_root = -INF;
            int alpha = -INF;
            const int beta = INF;
            bool aborted = false;

            for (const Move& m : root_moves) {
                // Depth 1 always completes so a move is available on expiry.
                if (current_iter_depth > 1 && time_up()) {
                    aborted = true;
                    break;
                }
                UndoInfo u = root.makeMove(m);
                const int score = pruning ? -negamax(root, current_iter_depth - 1, 1, -beta, -alpha)
                                          : -minimax(root, current_iter_depth - 1, 1);
                root.unmakeMove(u);

                if (score > best_score_this_iter_at_root) {
                    best_score_this_iter_at_root = score;
                    current_iter_best_root_move = m;
                }
                if (score > alpha) {
                    alpha = score;
                }
            }

            if (aborted) {
                stats.timedOut = true;
                break;
            }
            overall_best_move = current_iter_best_root_move;
            stats.completedDepth = current_iter_depth;
            stats.bestScore = best_score_this_iter_at_root;

            if (time_up()) {
                stats.timedOut = current_iter_depth < depth;
                break;
            }
        }

        stats.elapsedSeconds = std::chrono::duration<double>(clock::now() - start).count();
        if (logEnabled(LogLevel::INFO)) {
            std::stringstream ss;
            ss << "search: best " << moveToString(overall_best_move) << " score " << stats.bestScore
               << " depth " << stats.completedDepth << " nodes " << stats.nodes
               << " time " << stats.elapsedSeconds << "s" << (stats.timedOut ? " (timed out)" : "");
            logLine(LogLevel::INFO, ss.str());
        }
        return overall_best_move;
    }

    // Root score from the side to move's point of view, with or without
    // pruning. Both variants must agree; only the node count differs.
    int searchScore(Board& root, int depth, bool pruning) {
        stats = SearchStats();
        const int score = pruning ? negamax(root, depth, 0, -INF, INF) : minimax(root, depth, 0);
        stats.completedDepth = depth;
        stats.bestScore = score;
        return score;
    }

    uint64_t perft(Board& b, int depth) {
        if (depth <= 0) return 1;
        std::vector<Move> moves;
        legalMoves(b, b.sideToMove, moves);

        uint64_t total_nodes = 0;
        for (const Move& m : moves) {
            UndoInfo u = b.makeMove(m);
            const uint64_t nodes_for_move = depth == 1 ? 1 : perft_recursive(b, depth - 1);
            b.unmakeMove(u);
            total_nodes += nodes_for_move;
            if (logEnabled(LogLevel::DEBUG)) {
                logLine(LogLevel::DEBUG, moveToString(m) + ": " + std::to_string(nodes_for_move));
            }
        }
        logLine(LogLevel::DEBUG, "perft " + std::to_string(depth) + " total nodes: " + std::to_string(total_nodes));
        return total_nodes;
    }

    const SearchStats& lastSearch() const { return stats; }

    long getNodesVisited() const { return stats.nodes; }

private:
    SearchConfig config;
    Evaluator evaluator;
    SearchStats stats;

    uint64_t perft_recursive(Board& b, int depth) {
        std::vector<Move> moves;
        legalMoves(b, b.sideToMove, moves);
        if (depth == 1) {
            return static_cast<uint64_t>(moves.size());
        }
        uint64_t nodes = 0;
        for (const Move& m : moves) {
            UndoInfo u = b.makeMove(m);
            nodes += perft_recursive(b, depth - 1);
            b.unmakeMove(u);
        }
        return nodes;
    }

    // A leaf without legal moves is mate or stalemate, never a static score.
    int leafScore(Board& b, int ply) {
        const Color side = b.sideToMove;
        if (!hasLegalMoves(b, side)) {
            return terminalScore(b, ply);
        }
        return evaluator.evaluate(b, side);
    }

    int terminalScore(Board& b, int ply) const {
        return isInCheck(b, b.sideToMove) ? -MATE_SCORE + ply : 0;
    }

    int scoreMove(const Move& m) const {
        if (m.promotion == QUEEN) return SCORE_PROMOTION_TO_QUEEN;
        if (m.promotion != NO_PIECE_TYPE) return SCORE_PROMOTION_OTHER;
        if (m.isCapture()) {
            return SCORE_CAPTURE_BASE + PIECE_VALUE[m.captured] - PIECE_VALUE[m.piece] / 10;
        }
        return 0;
    }

    int negamax(Board& b, int remaining_depth, int ply, int alpha, int beta) {
        stats.nodes++;
        if (remaining_depth <= 0) {
            return leafScore(b, ply);
        }

        std::vector<Move> moves;
        legalMoves(b, b.sideToMove, moves);
        if (moves.empty()) {
            return terminalScore(b, ply);
        }

        std::stable_sort(moves.begin(), moves.end(), [&](const Move& x, const Move& y) {
            return scoreMove(x) > scoreMove(y);
        });

        int best_score_for_node = -INF;
        for (const Move& m : moves) {
            UndoInfo u = b.makeMove(m);
            const int score = -negamax(b, remaining_depth - 1, ply + 1, -beta, -alpha);
            b.unmakeMove(u);

            if (score > best_score_for_node) {
                best_score_for_node = score;
            }
            if (score > alpha) {
                alpha = score;
            }
            if (alpha >= beta) {
                break;
            }
        }
        return best_score_for_node;
    }

    int minimax(Board& b, int remaining_depth, int ply) {
        stats.nodes++;
        if (remaining_depth <= 0) {
            return leafScore(b, ply);
        }

        std::vector<Move> moves;
        legalMoves(b, b.sideToMove, moves);
        if (moves.empty()) {
            return terminalScore(b, ply);
        }

        int best_score_for_node = -INF;
        for (const Move& m : moves) {
            UndoInfo u = b.makeMove(m);
            best_score_for_node = std::max(best_score_for_node, -minimax(b, remaining_depth - 1, ply + 1));
            b.unmakeMove(u);
        }
        return best_score_for_node;
    }
};

} // namespace gambit

#endif // GAMBIT_ENGINE_HPP
