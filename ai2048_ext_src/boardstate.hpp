#pragma once

#include "rowtables.hpp"

struct TilePlacement;

using Grid = std::array<std::array<int, BOARD_SIZE>, BOARD_SIZE>;

class BoardState
{
public:
    BoardState() : board(0) {}
    explicit BoardState(Board packed) : board(packed) {}

    // Grid of displayed tile values (0 for empty, otherwise 2..32768).
    // Throws std::invalid_argument for anything that is not a power of two
    // with exponent in [1, 15].
    static BoardState from_grid(const Grid &values);
    static BoardState from_exponents(const Grid &exponents);

    Board packed() const { return board; }

    int exponent_at(int r, int c) const;
    int value_at(int r, int c) const;
    Grid to_grid() const;
    std::array<Row, BOARD_SIZE> rows() const;

    BoardState make_move(Direction d) const;
    BoardState transpose() const { return BoardState(transpose_board(board)); }

    int empty_count() const;
    int distinct_tile_count() const;
    int max_tile() const;
    bool has_legal_move() const;

    std::vector<TilePlacement> tile_placements() const;

    float heuristic_score() const;

    bool operator==(const BoardState &o) const { return board == o.board; }
    bool operator!=(const BoardState &o) const { return board != o.board; }

private:
    Board board;
};

// Successors of one empty cell: the same cell filled with a 2 or with a 4.
struct TilePlacement
{
    int cell;
    BoardState place2;
    BoardState place4;
};

struct BoardStateHash
{
    std::size_t operator()(const BoardState &s) const noexcept
    {
        return BoardHash{}(s.packed());
    }
};

// Counts zero nibbles by folding each nibble onto its low bit.
inline int count_empty(Board x)
{
    x |= (x >> 2) & 0x3333333333333333ULL;
    x |= (x >> 1);
    x = ~x & 0x1111111111111111ULL;
    return pop_count(x);
}

Board execute_move(Board b, Direction d);
