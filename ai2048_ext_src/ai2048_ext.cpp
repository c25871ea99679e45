#include "expectimax.hpp"

#include <climits>

#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

namespace
{
    Grid grid_from_py(const std::vector<std::vector<long long>> &rows)
    {
        if (rows.size() != (size_t)BOARD_SIZE)
            throw std::invalid_argument("Grid must have 4 rows");
        Grid grid{};
        for (int r = 0; r < BOARD_SIZE; ++r)
        {
            if (rows[r].size() != (size_t)BOARD_SIZE)
                throw std::invalid_argument("Grid rows must have 4 cells");
            for (int c = 0; c < BOARD_SIZE; ++c)
            {
                long long v = rows[r][c];
                if (v < INT_MIN || v > INT_MAX)
                {
                    std::ostringstream os;
                    os << "Tile value " << v << " at (" << r << "," << c << ") is out of range";
                    throw std::invalid_argument(os.str());
                }
                grid[r][c] = (int)v;
            }
        }
        return grid;
    }

    py::dict stats_to_dict(const SearchStats &s)
    {
        py::dict d;
        d["direction"] = direction_name(s.direction);
        d["score"] = s.score;
        d["no_op"] = s.no_op;
        d["moves_evaled"] = s.moves_evaled;
        d["cache_hits"] = s.cache_hits;
        d["cache_size"] = s.cache_size;
        d["max_depth"] = s.max_depth;
        d["depth_limit"] = s.depth_limit;
        d["elapsed_ms"] = s.elapsed_ms;
        return d;
    }
} // namespace

PYBIND11_MODULE(ai2048_ext, m)
{
    py::enum_<Direction>(m, "Direction")
        .value("Up", Direction::Up)
        .value("Down", Direction::Down)
        .value("Left", Direction::Left)
        .value("Right", Direction::Right);

    py::class_<TilePlacement>(m, "TilePlacement")
        .def_readonly("cell", &TilePlacement::cell)
        .def_readonly("place2", &TilePlacement::place2)
        .def_readonly("place4", &TilePlacement::place4);

    py::class_<BoardState>(m, "BoardState")
        .def(py::init<>())
        .def_static("from_grid", [](const std::vector<std::vector<long long>> &values)
                    { return BoardState::from_grid(grid_from_py(values)); }, py::arg("values"))
        .def_static("from_exponents", [](const std::vector<std::vector<long long>> &exponents)
                    { return BoardState::from_exponents(grid_from_py(exponents)); }, py::arg("exponents"))
        .def_static("from_packed", [](Board packed)
                    { return BoardState(packed); }, py::arg("packed"))
        .def_property_readonly("packed", &BoardState::packed)
        .def("exponent_at", &BoardState::exponent_at, py::arg("row"), py::arg("col"))
        .def("value_at", &BoardState::value_at, py::arg("row"), py::arg("col"))
        .def("to_grid", &BoardState::to_grid)
        .def("rows", &BoardState::rows)
        .def("make_move", &BoardState::make_move, py::arg("direction"))
        .def("transpose", &BoardState::transpose)
        .def("empty_count", &BoardState::empty_count)
        .def("distinct_tile_count", &BoardState::distinct_tile_count)
        .def("max_tile", &BoardState::max_tile)
        .def("has_legal_move", &BoardState::has_legal_move)
        .def("tile_placements", &BoardState::tile_placements)
        .def("heuristic_score", &BoardState::heuristic_score)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__hash__", [](const BoardState &s)
             { return BoardStateHash{}(s); })
        .def("__repr__", [](const BoardState &s)
             {
            std::ostringstream os;
            os << "ai2048_ext.BoardState(0x" << std::hex << std::setw(16) << std::setfill('0') << s.packed() << ")";
            return os.str(); });

    py::class_<ExpectimaxEngine>(m, "ExpectimaxEngine")
        .def(py::init<double, int>(), py::arg("prob_threshold") = 1e-4, py::arg("cache_depth") = 6)
        .def("select_move", &ExpectimaxEngine::select_move, py::arg("board"), py::call_guard<py::gil_scoped_release>())
        .def("score_move", &ExpectimaxEngine::score_move, py::arg("board"), py::arg("direction"), py::call_guard<py::gil_scoped_release>())
        .def("depth_limit_for", &ExpectimaxEngine::depth_limit_for, py::arg("board"))
        .def("set_prob_threshold", &ExpectimaxEngine::set_prob_threshold)
        .def("set_cache_depth", &ExpectimaxEngine::set_cache_depth)
        .def("set_min_depth_limit", &ExpectimaxEngine::set_min_depth_limit)
        .def("set_cache_enabled", &ExpectimaxEngine::set_cache_enabled)
        .def("set_parallel", &ExpectimaxEngine::set_parallel)
        .def("set_parallel_depth", &ExpectimaxEngine::set_parallel_depth)
        .def("set_verbose", &ExpectimaxEngine::set_verbose, py::arg("verbose"))
        .def("clear_stats", &ExpectimaxEngine::clear_stats)
        .def("get_profile_stats", [](const ExpectimaxEngine &e)
             {
            py::list moves;
            for (const auto &s : e.last_stats())
                moves.append(stats_to_dict(s));
            py::dict d;
            d["searches"] = e.total_searches();
            d["total_search_time_ms"] = e.total_search_time();
            d["total_moves_evaled"] = e.total_moves_evaled();
            d["last_search"] = moves;
            return d; });
}
