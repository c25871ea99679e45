#include "expectimax.hpp"

#include <gtest/gtest.h>

namespace
{
    Grid grid_of(std::initializer_list<std::array<int, BOARD_SIZE>> rows)
    {
        Grid g{};
        int r = 0;
        for (const auto &row : rows)
            g[r++] = row;
        return g;
    }

    BoardState lone_tile()
    {
        return BoardState::from_exponents(grid_of({{1, 0, 0, 0},
                                                   {0, 0, 0, 0},
                                                   {0, 0, 0, 0},
                                                   {0, 0, 0, 0}}));
    }

    BoardState staircase()
    {
        return BoardState::from_exponents(grid_of({{1, 2, 3, 4},
                                                   {0, 1, 2, 3},
                                                   {0, 0, 1, 2},
                                                   {0, 0, 0, 1}}));
    }

    // Small exhaustive configuration: no probability pruning, two plies.
    ExpectimaxEngine exhaustive_engine()
    {
        ExpectimaxEngine engine(0.0, 6);
        engine.set_min_depth_limit(2);
        engine.set_parallel(false);
        engine.set_verbose(false);
        return engine;
    }
} // namespace

TEST(Expectimax, DepthLimitFollowsDistinctTiles)
{
    ExpectimaxEngine engine;
    engine.set_verbose(false);
    EXPECT_EQ(engine.depth_limit_for(lone_tile()), 3);
    BoardState wide = BoardState::from_exponents(grid_of({{1, 2, 3, 4},
                                                          {5, 6, 7, 8},
                                                          {0, 0, 0, 0},
                                                          {0, 0, 0, 0}}));
    EXPECT_EQ(engine.depth_limit_for(wide), 6);
    engine.set_min_depth_limit(7);
    EXPECT_EQ(engine.depth_limit_for(wide), 7);
}

TEST(Expectimax, NoOpDirectionsScoreZero)
{
    ExpectimaxEngine engine = exhaustive_engine();
    BoardState s = lone_tile();
    EXPECT_EQ(engine.score_move(s, Direction::Up), 0.0);
    EXPECT_EQ(engine.score_move(s, Direction::Left), 0.0);
    EXPECT_GT(engine.score_move(s, Direction::Down), 0.0);
    EXPECT_GT(engine.score_move(s, Direction::Right), 0.0);

    Direction d = engine.select_move(s);
    EXPECT_TRUE(d == Direction::Down || d == Direction::Right);
}

TEST(Expectimax, StuckBoardReturnsFirstDirection)
{
    ExpectimaxEngine engine = exhaustive_engine();
    BoardState stuck = BoardState::from_exponents(grid_of({{1, 2, 1, 2},
                                                           {2, 1, 2, 1},
                                                           {1, 2, 1, 2},
                                                           {2, 1, 2, 1}}));
    EXPECT_EQ(engine.select_move(stuck), Direction::Up);
    ASSERT_EQ(engine.last_stats().size(), 4u);
    for (const auto &s : engine.last_stats())
    {
        EXPECT_TRUE(s.no_op);
        EXPECT_EQ(s.score, 0.0);
    }
}

TEST(Expectimax, NegativeScoresStillBeatNoOps)
{
    ExpectimaxEngine engine(1e-2);
    engine.set_verbose(false);
    // large tiles away from the edges push every row score below zero
    BoardState s = BoardState::from_exponents(grid_of({{3, 10, 9, 3},
                                                       {4, 11, 8, 4},
                                                       {3, 12, 7, 3},
                                                       {4, 13, 6, 0}}));
    ASSERT_LT(s.heuristic_score(), 0.0f);
    ASSERT_EQ(s.make_move(Direction::Up), s);
    ASSERT_EQ(s.make_move(Direction::Left), s);

    Direction d = engine.select_move(s);
    EXPECT_NE(s.make_move(d), s);
    EXPECT_TRUE(d == Direction::Down || d == Direction::Right);

    const std::vector<SearchStats> &stats = engine.last_stats();
    EXPECT_TRUE(stats[(int)Direction::Up].no_op);
    EXPECT_TRUE(stats[(int)Direction::Left].no_op);
    EXPECT_FALSE(stats[(int)Direction::Down].no_op);
    EXPECT_FALSE(stats[(int)Direction::Right].no_op);
}

TEST(Expectimax, PicksOnlyLegalDirections)
{
    ExpectimaxEngine engine;
    engine.set_verbose(false);
    BoardState s = BoardState::from_exponents(grid_of({{3, 3, 1, 2},
                                                       {2, 1, 2, 1},
                                                       {1, 2, 1, 2},
                                                       {2, 1, 2, 1}}));
    Direction d = engine.select_move(s);
    EXPECT_TRUE(d == Direction::Left || d == Direction::Right);
    EXPECT_NE(s.make_move(d), s);
}

TEST(Expectimax, RepeatedSequentialSearchIsDeterministic)
{
    ExpectimaxEngine engine;
    engine.set_parallel(false);
    engine.set_verbose(false);
    BoardState s = staircase();

    Direction first = engine.select_move(s);
    std::vector<SearchStats> first_stats = engine.last_stats();
    Direction second = engine.select_move(s);

    EXPECT_EQ(first, second);
    ASSERT_EQ(first_stats.size(), engine.last_stats().size());
    for (size_t i = 0; i < first_stats.size(); ++i)
    {
        EXPECT_EQ(first_stats[i].score, engine.last_stats()[i].score);
        EXPECT_EQ(first_stats[i].moves_evaled, engine.last_stats()[i].moves_evaled);
    }
}

TEST(Expectimax, CacheDoesNotChangeScores)
{
    ExpectimaxEngine cached = exhaustive_engine();
    ExpectimaxEngine uncached = exhaustive_engine();
    uncached.set_cache_enabled(false);

    BoardState s = lone_tile();
    for (Direction d : ALL_DIRECTIONS)
        EXPECT_DOUBLE_EQ(cached.score_move(s, d), uncached.score_move(s, d));

    cached.select_move(s);
    uncached.select_move(s);
    long hits = 0;
    long cached_moves = 0;
    long uncached_moves = 0;
    for (const auto &st : cached.last_stats())
    {
        hits += st.cache_hits;
        cached_moves += st.moves_evaled;
    }
    for (const auto &st : uncached.last_stats())
    {
        EXPECT_EQ(st.cache_hits, 0);
        EXPECT_EQ(st.cache_size, 0u);
        uncached_moves += st.moves_evaled;
    }
    EXPECT_GT(hits, 0);
    EXPECT_LT(cached_moves, uncached_moves);
}

TEST(Expectimax, BoardReachedTwiceAtSameDepthHitsCache)
{
    ExpectimaxEngine engine = exhaustive_engine();
    BoardState s = lone_tile();
    engine.select_move(s);

    // After Right the tile sits at (0,3). A 2 placed at (0,0) or at (0,2)
    // followed by Right both give a lone 4 at (0,3) one ply deeper.
    const SearchStats &right = engine.last_stats()[(int)Direction::Right];
    ASSERT_FALSE(right.no_op);
    EXPECT_GT(right.cache_hits, 0);
}

TEST(TranspositionCache, KeyedOnBoardOnly)
{
    TranspositionCache cache;
    double out = 0.0;
    EXPECT_FALSE(cache.lookup(0x1000ULL, out));
    cache.store(0x1000ULL, 12.5);
    cache.store(0x2000ULL, -3.0);
    ASSERT_TRUE(cache.lookup(0x1000ULL, out));
    EXPECT_EQ(out, 12.5);
    cache.store(0x1000ULL, 7.0);
    ASSERT_TRUE(cache.lookup(0x1000ULL, out));
    EXPECT_EQ(out, 7.0);
    EXPECT_EQ(cache.size(), 2u);
}

TEST(Expectimax, ParallelMatchesSequential)
{
    ExpectimaxEngine sequential = exhaustive_engine();
    ExpectimaxEngine parallel = exhaustive_engine();
    parallel.set_parallel(true);

    BoardState s = lone_tile();
    Direction a = sequential.select_move(s);
    Direction b = parallel.select_move(s);
    EXPECT_EQ(a, b);
    for (size_t i = 0; i < ALL_DIRECTIONS.size(); ++i)
    {
        double x = sequential.last_stats()[i].score;
        double y = parallel.last_stats()[i].score;
        EXPECT_NEAR(x, y, std::abs(x) * 1e-12);
    }
}

TEST(Expectimax, StatsAreRecorded)
{
    ExpectimaxEngine engine;
    engine.set_verbose(false);
    BoardState s = staircase();
    engine.select_move(s);

    ASSERT_EQ(engine.last_stats().size(), 4u);
    EXPECT_EQ(engine.total_searches(), 1u);
    EXPECT_GT(engine.total_moves_evaled(), 0);
    for (size_t i = 0; i < engine.last_stats().size(); ++i)
    {
        const SearchStats &st = engine.last_stats()[i];
        EXPECT_EQ(st.direction, ALL_DIRECTIONS[i]);
        if (st.no_op)
            continue;
        EXPECT_EQ(st.depth_limit, engine.depth_limit_for(s.make_move(st.direction)));
        EXPECT_LE(st.max_depth, st.depth_limit);
        EXPECT_GT(st.moves_evaled, 0);
    }

    engine.clear_stats();
    EXPECT_TRUE(engine.last_stats().empty());
    EXPECT_EQ(engine.total_searches(), 0u);
}

TEST(Expectimax, InvalidDirectionThrows)
{
    ExpectimaxEngine engine;
    engine.set_verbose(false);
    EXPECT_THROW(engine.score_move(lone_tile(), (Direction)4), std::invalid_argument);
}
