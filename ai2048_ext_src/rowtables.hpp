#pragma once

#include "common.hpp"

struct RowTransformEntry
{
    Row right_delta = 0;
    Row left_delta = 0;
    float score = 0.0f;
};

// Heuristic weights. Rows are scored once at table build time, so these never
// show up on the search path.
static constexpr float SCORE_BASELINE = 200000.0f;
static constexpr float SCORE_EMPTY_WEIGHT = 270.0f;
static constexpr float SCORE_MERGES_WEIGHT = 700.0f;
static constexpr float SCORE_MONOTONICITY_POWER = 4.0f;
static constexpr float SCORE_MONOTONICITY_WEIGHT = 47.0f;
static constexpr float SCORE_SUM_POWER = 3.5f;
static constexpr float SCORE_SUM_WEIGHT = 11.0f;

// Packs a grid of exponents, grid[r][c], into a board.
// Throws std::invalid_argument for an exponent outside [0, 15].
Board pack_exponents(const std::array<std::array<int, BOARD_SIZE>, BOARD_SIZE> &grid);
std::array<std::array<int, BOARD_SIZE>, BOARD_SIZE> unpack_exponents(Board b);

constexpr int nibble_shift(int r, int c)
{
    return 4 * (NUM_CELLS - 1 - (r * BOARD_SIZE + c));
}

constexpr int exponent_at(Board b, int r, int c)
{
    return (int)((b >> nibble_shift(r, c)) & NIBBLE_MASK);
}

constexpr Row row_at(Board b, int r)
{
    return (Row)((b >> (16 * (BOARD_SIZE - 1 - r))) & ROW_MASK);
}

constexpr Row reverse_row(Row row)
{
    return (Row)((row >> 12) | ((row >> 4) & 0x00F0) | ((row << 4) & 0x0F00) | (row << 12));
}

// Swaps rows and columns. Self-inverse.
constexpr Board transpose_board(Board x)
{
    Board a1 = x & 0xF0F00F0FF0F00F0FULL;
    Board a2 = x & 0x0000F0F00000F0F0ULL;
    Board a3 = x & 0x0F0F00000F0F0000ULL;
    Board a = a1 | (a2 << 12) | (a3 >> 12);
    Board b1 = a & 0xFF00FF0000FF00FFULL;
    Board b2 = a & 0x00FF00FF00000000ULL;
    Board b3 = a & 0x00000000FF00FF00ULL;
    return b1 | (b2 >> 24) | (b3 << 24);
}

class RowTables
{
public:
    // Builds the tables on first use; later calls return the same read-only
    // instance. Safe to call from any thread.
    static const RowTables &instance();

    const RowTransformEntry &operator[](Row row) const { return entries[row]; }

    Row move_right(Row row) const { return (Row)(row ^ entries[row].right_delta); }
    Row move_left(Row row) const { return (Row)(row ^ entries[row].left_delta); }
    float score(Row row) const { return entries[row].score; }

    Board apply_right(Board b) const;
    Board apply_left(Board b) const;

    static Row slide_right(Row row);
    static float score_row(Row row);

    RowTables(const RowTables &) = delete;
    RowTables &operator=(const RowTables &) = delete;

private:
    RowTables();

    std::vector<RowTransformEntry> entries;
};
