#include "expectimax.hpp"
#include "evaluator.hpp"

#include <chrono>
#include <future>
#include <limits>
#include <thread>

bool TranspositionCache::lookup(Board board, double &out) const
{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = table.find(board);
    if (it == table.end())
        return false;
    out = it->second;
    return true;
}

void TranspositionCache::store(Board board, double value)
{
    std::lock_guard<std::mutex> lock(mtx);
    table[board] = value;
}

std::size_t TranspositionCache::size() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return table.size();
}

void SearchScope::note_depth(int depth)
{
    int seen = max_depth.load(std::memory_order_relaxed);
    while (depth > seen && !max_depth.compare_exchange_weak(seen, depth, std::memory_order_relaxed))
    {
    }
}

ExpectimaxEngine::ExpectimaxEngine(double prob_threshold, int cache_depth)
    : prob_threshold(prob_threshold),
      cache_depth(cache_depth)
{
    // silence when running as test
    verbose = (std::getenv("PYTEST_CURRENT_TEST") == nullptr);
    RowTables::instance();
}

Direction ExpectimaxEngine::select_move(const BoardState &root)
{
    const auto t_start = std::chrono::high_resolution_clock::now();

    std::vector<SearchStats> results;
    results.reserve(ALL_DIRECTIONS.size());
    if (parallel)
    {
        std::vector<std::future<SearchStats>> pending;
        pending.reserve(ALL_DIRECTIONS.size());
        for (Direction d : ALL_DIRECTIONS)
            pending.push_back(std::async(std::launch::async, [this, &root, d]
                                         { return score_toplevel_move(root, d); }));
        for (auto &f : pending)
            results.push_back(f.get());
    }
    else
    {
        for (Direction d : ALL_DIRECTIONS)
            results.push_back(score_toplevel_move(root, d));
    }

    // no-op directions only win when nothing else can be played
    Direction best = Direction::Up;
    bool found = false;
    double best_score = 0.0;
    for (const auto &r : results)
    {
        if (r.no_op)
            continue;
        if (!found || r.score > best_score)
        {
            found = true;
            best_score = r.score;
            best = r.direction;
        }
    }

    const auto t_end = std::chrono::high_resolution_clock::now();
    const double elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();

    last_search = std::move(results);
    searches++;
    total_search_ms += elapsed_ms;
    for (const auto &s : last_search)
        total_moves += s.moves_evaled;

    if (verbose)
        log_search(root, best, elapsed_ms);
    return best;
}

double ExpectimaxEngine::score_move(const BoardState &root, Direction d) const
{
    return score_toplevel_move(root, d).score;
}

int ExpectimaxEngine::depth_limit_for(const BoardState &board) const
{
    return std::max(min_depth_limit, board.distinct_tile_count() - 2);
}

SearchStats ExpectimaxEngine::score_toplevel_move(const BoardState &root, Direction d) const
{
    const auto t_start = std::chrono::high_resolution_clock::now();

    SearchStats stats;
    stats.direction = d;

    BoardState next = root.make_move(d);
    if (next == root)
        return stats;

    SearchScope scope(depth_limit_for(next));
    stats.no_op = false;
    stats.score = score_chance_node(scope, next.packed(), 0, 1.0);

    const auto t_end = std::chrono::high_resolution_clock::now();
    stats.elapsed_ms = std::chrono::duration<double, std::milli>(t_end - t_start).count();
    stats.moves_evaled = scope.moves_evaled.load();
    stats.cache_hits = scope.cache_hits.load();
    stats.cache_size = scope.cache.size();
    stats.max_depth = scope.max_depth.load();
    stats.depth_limit = scope.depth_limit;
    return stats;
}

double ExpectimaxEngine::score_chance_node(SearchScope &scope, Board b, int depth, double cprob) const
{
    if (cprob < prob_threshold || depth >= scope.depth_limit)
    {
        scope.note_depth(depth);
        return ai2048_ext_internal::score_board(b);
    }

    const bool use_cache = cache_enabled && depth < cache_depth;
    if (use_cache)
    {
        double cached = 0.0;
        if (scope.cache.lookup(b, cached))
        {
            scope.cache_hits.fetch_add(1, std::memory_order_relaxed);
            return cached;
        }
    }

    BoardState state(b);
    std::vector<TilePlacement> placements = state.tile_placements();
    if (placements.empty())
    {
        scope.note_depth(depth);
        return ai2048_ext_internal::score_board(b);
    }

    const double num_open = (double)placements.size();
    cprob /= num_open;

    double total = 0.0;
    if (parallel && depth < parallel_depth)
    {
        total = score_placements_parallel(scope, placements, depth, cprob);
    }
    else
    {
        for (const auto &p : placements)
        {
            total += score_move_node(scope, p.place2.packed(), depth, cprob * PROB_PLACE_2) * PROB_PLACE_2;
            total += score_move_node(scope, p.place4.packed(), depth, cprob * PROB_PLACE_4) * PROB_PLACE_4;
        }
    }
    total /= num_open;

    if (use_cache)
        scope.cache.store(b, total);
    return total;
}

double ExpectimaxEngine::score_placements_parallel(SearchScope &scope, const std::vector<TilePlacement> &placements, int depth, double cprob) const
{
    // slot 2*i holds the "2" branch of placement i, slot 2*i+1 the "4" branch
    const std::size_t num_tasks = placements.size() * 2;
    std::vector<double> partial(num_tasks, 0.0);

    unsigned hw = std::thread::hardware_concurrency();
    const std::size_t thread_count = std::min<std::size_t>(num_tasks, hw == 0 ? 4 : hw);

    auto worker = [this, &scope, &placements, &partial, depth, cprob, thread_count](std::size_t first)
    {
        for (std::size_t t = first; t < partial.size(); t += thread_count)
        {
            const TilePlacement &p = placements[t / 2];
            if (t % 2 == 0)
                partial[t] = score_move_node(scope, p.place2.packed(), depth, cprob * PROB_PLACE_2);
            else
                partial[t] = score_move_node(scope, p.place4.packed(), depth, cprob * PROB_PLACE_4);
        }
    };

    std::vector<std::future<void>> pending;
    pending.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i)
        pending.push_back(std::async(std::launch::async, worker, i));
    for (auto &f : pending)
        f.get();

    // reduce in placement order so the sum does not depend on scheduling
    double total = 0.0;
    for (std::size_t i = 0; i < num_tasks; i += 2)
    {
        total += partial[i] * PROB_PLACE_2;
        total += partial[i + 1] * PROB_PLACE_4;
    }
    return total;
}

// Max over the legal moves only; a board with none left is worth 0.
double ExpectimaxEngine::score_move_node(SearchScope &scope, Board b, int depth, double cprob) const
{
    double best = -std::numeric_limits<double>::infinity();
    bool any_legal = false;
    for (Direction d : ALL_DIRECTIONS)
    {
        Board next = execute_move(b, d);
        scope.moves_evaled.fetch_add(1, std::memory_order_relaxed);
        if (next == b)
            continue;
        any_legal = true;
        best = std::max(best, score_chance_node(scope, next, depth + 1, cprob));
    }
    return any_legal ? best : 0.0;
}

void ExpectimaxEngine::log_search(const BoardState &root, Direction best, double elapsed_ms) const
{
    std::cerr << std::fixed << std::setprecision(2)
              << "Expectimax select_move: board=0x" << std::hex << std::setw(16) << std::setfill('0') << root.packed()
              << std::dec << std::setfill(' ')
              << " heuristic=" << root.heuristic_score()
              << " best=" << direction_name(best)
              << " time_ms=" << elapsed_ms
              << std::endl;
    for (const auto &s : last_search)
    {
        std::cerr << "  move=" << direction_name(s.direction);
        if (s.no_op)
        {
            std::cerr << " no-op" << std::endl;
            continue;
        }
        std::cerr << " result=" << s.score
                  << " evaled=" << s.moves_evaled
                  << " cache_hits=" << s.cache_hits
                  << " cache_size=" << s.cache_size
                  << " time_ms=" << s.elapsed_ms
                  << " max_depth=" << s.max_depth
                  << " depth_limit=" << s.depth_limit
                  << std::endl;
    }
}

void ExpectimaxEngine::set_prob_threshold(double v)
{
    prob_threshold = v;
}

void ExpectimaxEngine::set_cache_depth(int v)
{
    cache_depth = v;
}

void ExpectimaxEngine::set_min_depth_limit(int v)
{
    min_depth_limit = std::max(1, v);
}

void ExpectimaxEngine::set_cache_enabled(bool v)
{
    cache_enabled = v;
}

void ExpectimaxEngine::set_parallel(bool v)
{
    parallel = v;
}

void ExpectimaxEngine::set_parallel_depth(int v)
{
    parallel_depth = std::max(0, v);
}

void ExpectimaxEngine::set_verbose(bool v)
{
    verbose = v;
}

void ExpectimaxEngine::clear_stats()
{
    last_search.clear();
    searches = 0;
    total_search_ms = 0.0;
    total_moves = 0;
}
