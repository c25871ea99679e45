#pragma once

#include "rowtables.hpp"

namespace ai2048_ext_internal
{
    // Static score of a board: four row lookups plus four column lookups.
    float score_board(Board b);

    float score_rows(const RowTables &tables, Board b);
} // namespace ai2048_ext_internal
