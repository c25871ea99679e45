#pragma once

#include "boardstate.hpp"

#include <atomic>
#include <mutex>

struct SearchStats
{
    Direction direction = Direction::Up;
    double score = 0.0;
    bool no_op = true;
    long moves_evaled = 0;
    long cache_hits = 0;
    std::size_t cache_size = 0;
    int max_depth = 0;
    int depth_limit = 0;
    double elapsed_ms = 0.0;
};

// Board -> expected score memo shared by the branches of one direction's
// search. Racing writers may compute the same entry twice; last write wins.
class TranspositionCache
{
public:
    bool lookup(Board board, double &out) const;
    void store(Board board, double value);
    std::size_t size() const;

private:
    mutable std::mutex mtx;
    std::unordered_map<Board, double, BoardHash> table;
};

// Private state of one top-level direction's search.
struct SearchScope
{
    explicit SearchScope(int depth_limit_) : depth_limit(depth_limit_) {}

    void note_depth(int depth);

    TranspositionCache cache;
    std::atomic<long> moves_evaled{0};
    std::atomic<long> cache_hits{0};
    std::atomic<int> max_depth{0};
    const int depth_limit;
};

class ExpectimaxEngine
{
public:
    ExpectimaxEngine(double prob_threshold = 1e-4, int cache_depth = 6);

    Direction select_move(const BoardState &root);

    // Expected score of playing d on root; 0 when d changes nothing.
    double score_move(const BoardState &root, Direction d) const;

    int depth_limit_for(const BoardState &board) const;

    void set_prob_threshold(double v);
    void set_cache_depth(int v);
    void set_min_depth_limit(int v);
    void set_cache_enabled(bool v);
    void set_parallel(bool v);
    void set_parallel_depth(int v);
    void set_verbose(bool v);

    double get_prob_threshold() const { return prob_threshold; }
    int get_cache_depth() const { return cache_depth; }
    int get_min_depth_limit() const { return min_depth_limit; }
    bool get_cache_enabled() const { return cache_enabled; }
    bool get_parallel() const { return parallel; }
    int get_parallel_depth() const { return parallel_depth; }
    bool get_verbose() const { return verbose; }

    const std::vector<SearchStats> &last_stats() const { return last_search; }
    std::size_t total_searches() const { return searches; }
    double total_search_time() const { return total_search_ms; }
    long total_moves_evaled() const { return total_moves; }

    void clear_stats();

private:
    static constexpr double PROB_PLACE_2 = 0.9;
    static constexpr double PROB_PLACE_4 = 0.1;

    SearchStats score_toplevel_move(const BoardState &root, Direction d) const;
    double score_chance_node(SearchScope &scope, Board b, int depth, double cprob) const;
    double score_move_node(SearchScope &scope, Board b, int depth, double cprob) const;
    double score_placements_parallel(SearchScope &scope, const std::vector<TilePlacement> &placements, int depth, double cprob) const;
    void log_search(const BoardState &root, Direction best, double elapsed_ms) const;

    double prob_threshold;
    int cache_depth;
    int min_depth_limit = 3;
    bool cache_enabled = true;
    bool parallel = true;
    int parallel_depth = 1;
    bool verbose = true;

    std::vector<SearchStats> last_search;
    std::size_t searches = 0;
    double total_search_ms = 0.0;
    long total_moves = 0;
};
