#include "rowtables.hpp"

#include <memory>
#include <mutex>

Board pack_exponents(const std::array<std::array<int, BOARD_SIZE>, BOARD_SIZE> &grid)
{
    Board b = 0;
    for (int r = 0; r < BOARD_SIZE; ++r)
    {
        for (int c = 0; c < BOARD_SIZE; ++c)
        {
            int e = grid[r][c];
            if (e < 0 || e > MAX_EXPONENT)
            {
                std::ostringstream os;
                os << "Tile exponent " << e << " at (" << r << "," << c << ") does not fit in 4 bits";
                throw std::invalid_argument(os.str());
            }
            b |= (Board)e << nibble_shift(r, c);
        }
    }
    return b;
}

std::array<std::array<int, BOARD_SIZE>, BOARD_SIZE> unpack_exponents(Board b)
{
    std::array<std::array<int, BOARD_SIZE>, BOARD_SIZE> grid{};
    for (int r = 0; r < BOARD_SIZE; ++r)
        for (int c = 0; c < BOARD_SIZE; ++c)
            grid[r][c] = exponent_at(b, r, c);
    return grid;
}

const RowTables &RowTables::instance()
{
    static std::once_flag once;
    static std::unique_ptr<RowTables> tables;
    // the constructor is private, so std::make_unique cannot reach it
    std::call_once(once, []
                   { tables.reset(new RowTables()); });
    return *tables;
}

RowTables::RowTables()
    : entries(NUM_ROWS)
{
    for (int i = 0; i < NUM_ROWS; ++i)
    {
        Row row = (Row)i;
        Row right = slide_right(row);
        Row left = reverse_row(slide_right(reverse_row(row)));

        RowTransformEntry &e = entries[i];
        e.right_delta = (Row)(row ^ right);
        e.left_delta = (Row)(row ^ left);
        e.score = score_row(row);
    }
}

Row RowTables::slide_right(Row row)
{
    int line[4] = {
        (row >> 12) & 0xF,
        (row >> 8) & 0xF,
        (row >> 4) & 0xF,
        row & 0xF};

    for (int i = 3; i > 0; --i)
    {
        // nearest occupied cell to the left of i
        int j = i - 1;
        while (j >= 0 && line[j] == 0)
            --j;
        if (j < 0)
            break;

        if (line[i] == 0)
        {
            line[i] = line[j];
            line[j] = 0;
            // the cell just filled may still merge with its next neighbour
            ++i;
        }
        else if (line[i] == line[j] && line[i] != MAX_EXPONENT)
        {
            line[i]++;
            line[j] = 0;
        }
    }

    return (Row)((line[0] << 12) | (line[1] << 8) | (line[2] << 4) | line[3]);
}

float RowTables::score_row(Row row)
{
    int line[4] = {
        (row >> 12) & 0xF,
        (row >> 8) & 0xF,
        (row >> 4) & 0xF,
        row & 0xF};

    float sum = 0.0f;
    int empty = 0;
    int merges = 0;
    for (int i = 0; i < 4; ++i)
    {
        int rank = line[i];
        sum += std::pow((float)rank, SCORE_SUM_POWER);
        if (rank == 0)
            empty++;
        else if (i > 0 && line[i - 1] == rank)
            merges++;
    }

    float monotonicity_left = 0.0f;
    float monotonicity_right = 0.0f;
    for (int i = 1; i < 4; ++i)
    {
        float prev = std::pow((float)line[i - 1], SCORE_MONOTONICITY_POWER);
        float cur = std::pow((float)line[i], SCORE_MONOTONICITY_POWER);
        if (line[i - 1] > line[i])
            monotonicity_left += prev - cur;
        else
            monotonicity_right += cur - prev;
    }

    return SCORE_BASELINE + SCORE_EMPTY_WEIGHT * empty + SCORE_MERGES_WEIGHT * merges -
           SCORE_MONOTONICITY_WEIGHT * std::min(monotonicity_left, monotonicity_right) -
           SCORE_SUM_WEIGHT * sum;
}

Board RowTables::apply_right(Board b) const
{
    Board out = b;
    for (int offset = 0; offset < 64; offset += 16)
        out ^= (Board)entries[(b >> offset) & ROW_MASK].right_delta << offset;
    return out;
}

Board RowTables::apply_left(Board b) const
{
    Board out = b;
    for (int offset = 0; offset < 64; offset += 16)
        out ^= (Board)entries[(b >> offset) & ROW_MASK].left_delta << offset;
    return out;
}
