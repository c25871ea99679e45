#include "boardstate.hpp"
#include "evaluator.hpp"

Board execute_move(Board b, Direction d)
{
    const RowTables &tables = RowTables::instance();
    switch (d)
    {
    case Direction::Right:
        return tables.apply_right(b);
    case Direction::Left:
        return tables.apply_left(b);
    case Direction::Down:
        return transpose_board(tables.apply_right(transpose_board(b)));
    case Direction::Up:
        return transpose_board(tables.apply_left(transpose_board(b)));
    default:
    {
        std::ostringstream os;
        os << "Invalid direction value " << (int)d;
        throw std::invalid_argument(os.str());
    }
    }
}

BoardState BoardState::from_grid(const Grid &values)
{
    Grid exponents{};
    for (int r = 0; r < BOARD_SIZE; ++r)
    {
        for (int c = 0; c < BOARD_SIZE; ++c)
        {
            int v = values[r][c];
            if (v == 0)
            {
                exponents[r][c] = 0;
                continue;
            }
            if (v < 2 || (v & (v - 1)) != 0)
            {
                std::ostringstream os;
                os << "Tile value " << v << " at (" << r << "," << c << ") is not a power of two";
                throw std::invalid_argument(os.str());
            }
            int e = 0;
            while ((1 << e) < v)
                e++;
            if (e > MAX_EXPONENT)
            {
                std::ostringstream os;
                os << "Tile value " << v << " at (" << r << "," << c << ") exceeds 2^" << MAX_EXPONENT;
                throw std::invalid_argument(os.str());
            }
            exponents[r][c] = e;
        }
    }
    return BoardState(pack_exponents(exponents));
}

BoardState BoardState::from_exponents(const Grid &exponents)
{
    return BoardState(pack_exponents(exponents));
}

int BoardState::exponent_at(int r, int c) const
{
    if (r < 0 || r >= BOARD_SIZE || c < 0 || c >= BOARD_SIZE)
        throw std::out_of_range("Cell index out of range");
    return ::exponent_at(board, r, c);
}

int BoardState::value_at(int r, int c) const
{
    int e = exponent_at(r, c);
    return e == 0 ? 0 : (1 << e);
}

Grid BoardState::to_grid() const
{
    Grid grid{};
    for (int r = 0; r < BOARD_SIZE; ++r)
        for (int c = 0; c < BOARD_SIZE; ++c)
            grid[r][c] = value_at(r, c);
    return grid;
}

std::array<Row, BOARD_SIZE> BoardState::rows() const
{
    std::array<Row, BOARD_SIZE> out{};
    for (int r = 0; r < BOARD_SIZE; ++r)
        out[r] = row_at(board, r);
    return out;
}

BoardState BoardState::make_move(Direction d) const
{
    return BoardState(execute_move(board, d));
}

int BoardState::empty_count() const
{
    return count_empty(board);
}

int BoardState::distinct_tile_count() const
{
    std::uint16_t seen = 0;
    Board b = board;
    while (b)
    {
        seen |= (std::uint16_t)(1u << (b & NIBBLE_MASK));
        b >>= 4;
    }
    // empty cells are not a tile
    seen >>= 1;
    return pop_count(seen);
}

int BoardState::max_tile() const
{
    int best = 0;
    for (Board b = board; b; b >>= 4)
        best = std::max(best, (int)(b & NIBBLE_MASK));
    return best == 0 ? 0 : (1 << best);
}

bool BoardState::has_legal_move() const
{
    for (Direction d : ALL_DIRECTIONS)
        if (execute_move(board, d) != board)
            return true;
    return false;
}

std::vector<TilePlacement> BoardState::tile_placements() const
{
    std::vector<TilePlacement> out;
    out.reserve((size_t)empty_count());
    for (int cell = 0; cell < NUM_CELLS; ++cell)
    {
        int shift = 4 * (NUM_CELLS - 1 - cell);
        if (((board >> shift) & NIBBLE_MASK) != 0)
            continue;
        out.push_back({cell, BoardState(board | (Board)1 << shift), BoardState(board | (Board)2 << shift)});
    }
    return out;
}

float BoardState::heuristic_score() const
{
    return ai2048_ext_internal::score_board(board);
}
