/*
 * Interchangeable move choosers for computer players. A session holds one
 * per computer side and may swap it between moves.
 */

#ifndef GAMBIT_STRATEGY_HPP
#define GAMBIT_STRATEGY_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "board.hpp"
#include "engine.hpp"
#include "log.hpp"
#include "rules.hpp"
#include "types.hpp"

namespace gambit {

inline const char* strategyName(StrategyKind k) {
    switch (k) {
        case StrategyKind::RANDOM:     return "random";
        case StrategyKind::MINIMAX:    return "minimax";
        case StrategyKind::ALPHA_BETA: return "alpha-beta";
    }
    return "alpha-beta";
}

class MoveStrategy {
public:
    virtual ~MoveStrategy() = default;

    // Picks a move for the side to move of `root` and hands the board back
    // unchanged. The null move means there is no legal move.
    virtual Move chooseMove(Board& root, double time_budget) = 0;
    virtual StrategyKind kind() const = 0;
    virtual const SearchStats& lastSearch() const = 0;
};

// ───────────────────────── Weighted random ──────────────────────────
// Every legal move can be drawn; captures, promotions, checks and moves
// into the center are drawn more often.
class RandomStrategy : public MoveStrategy {
public:
    static constexpr int BASE_WEIGHT = 2;
    static constexpr int CAPTURE_WEIGHT = 6;
    static constexpr int PROMOTION_WEIGHT = 8;
    static constexpr int CHECK_WEIGHT = 4;
    static constexpr int CENTER_WEIGHT = 1;

    explicit RandomStrategy(uint32_t seed) : rng(seed) {}

    Move chooseMove(Board& root, double /*time_budget*/) override {
        const auto start = std::chrono::steady_clock::now();
        stats = SearchStats();

        std::vector<Move> moves;
        legalMoves(root, root.sideToMove, moves);
        stats.nodes = static_cast<long>(moves.size());
        if (moves.empty()) return Move::none();

        std::vector<int> weights;
        weights.reserve(moves.size());
        for (const Move& m : moves) weights.push_back(moveWeight(root, m));

        std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
        const Move chosen = moves[pick(rng)];

        stats.elapsedSeconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        logLine(LogLevel::INFO, "random: picked " + moveToString(chosen) + " of " +
                                    std::to_string(moves.size()));
        return chosen;
    }

    StrategyKind kind() const override { return StrategyKind::RANDOM; }
    const SearchStats& lastSearch() const override { return stats; }

    static int moveWeight(Board& b, const Move& m) {
        int weight = BASE_WEIGHT;
        if (m.isCapture()) weight += CAPTURE_WEIGHT;
        if (m.isPromotion()) weight += PROMOTION_WEIGHT;
        if (m.to.row >= 2 && m.to.row <= 5 && m.to.col >= 2 && m.to.col <= 5) weight += CENTER_WEIGHT;

        UndoInfo u = b.makeMove(m);
        const bool gives_check = isInCheck(b, b.sideToMove);
        b.unmakeMove(u);
        if (gives_check) weight += CHECK_WEIGHT;
        return weight;
    }

private:
    std::mt19937 rng;
    SearchStats stats;
};

// ───────────────────────── Tree search ──────────────────────────────
// Minimax and alpha-beta share the engine; only pruning differs.
class SearchStrategy : public MoveStrategy {
public:
    SearchStrategy(const SearchConfig& cfg, bool pruning)
        : engine(cfg), use_pruning(pruning) {}

    Move chooseMove(Board& root, double time_budget) override {
        return engine.findBestMove(root, engine.searchConfig().maxDepth, time_budget, use_pruning);
    }

    StrategyKind kind() const override {
        return use_pruning ? StrategyKind::ALPHA_BETA : StrategyKind::MINIMAX;
    }
    const SearchStats& lastSearch() const override { return engine.lastSearch(); }

private:
    Engine engine;
    bool use_pruning;
};

inline std::unique_ptr<MoveStrategy> makeStrategy(const SearchConfig& cfg) {
    switch (cfg.strategy) {
        case StrategyKind::RANDOM:
            return std::unique_ptr<MoveStrategy>(new RandomStrategy(cfg.seed));
        case StrategyKind::MINIMAX:
            return std::unique_ptr<MoveStrategy>(new SearchStrategy(cfg, false));
        case StrategyKind::ALPHA_BETA:
            break;
    }
    return std::unique_ptr<MoveStrategy>(new SearchStrategy(cfg, true));
}

} // namespace gambit

#endif // GAMBIT_STRATEGY_HPP
