#include "evaluator.hpp"

namespace ai2048_ext_internal
{
    float score_rows(const RowTables &tables, Board b)
    {
        return tables.score((Row)(b & ROW_MASK)) +
               tables.score((Row)((b >> 16) & ROW_MASK)) +
               tables.score((Row)((b >> 32) & ROW_MASK)) +
               tables.score((Row)((b >> 48) & ROW_MASK));
    }

    float score_board(Board b)
    {
        const RowTables &tables = RowTables::instance();
        return score_rows(tables, b) + score_rows(tables, transpose_board(b));
    }
} // namespace ai2048_ext_internal
