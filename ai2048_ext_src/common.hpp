#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// 16 nibbles, row-major, most significant nibble is cell (0,0)
using Board = std::uint64_t;
// 4 nibbles, most significant nibble is the leftmost cell
using Row = std::uint16_t;

static constexpr int BOARD_SIZE = 4;
static constexpr int NUM_CELLS = BOARD_SIZE * BOARD_SIZE;
static constexpr int NUM_ROWS = 65536;
static constexpr int MAX_EXPONENT = 15;

static constexpr Board ROW_MASK = 0xFFFFULL;
static constexpr Board NIBBLE_MASK = 0xFULL;

// Order matters: ties in move selection go to the first direction listed.
enum class Direction : int
{
    Up = 0,
    Down = 1,
    Left = 2,
    Right = 3
};

static constexpr std::array<Direction, 4> ALL_DIRECTIONS = {
    Direction::Up, Direction::Down, Direction::Left, Direction::Right};

inline const char *direction_name(Direction d)
{
    switch (d)
    {
    case Direction::Up:
        return "Up";
    case Direction::Down:
        return "Down";
    case Direction::Left:
        return "Left";
    case Direction::Right:
        return "Right";
    default:
        return "?";
    }
}

constexpr std::uint64_t splitmix64(std::uint64_t x)
{
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

// Boards compare by value; the same bit pattern is the same position.
struct BoardHash
{
    std::size_t operator()(const Board &b) const noexcept
    {
        return (std::size_t)splitmix64(b);
    }
};

inline int pop_count(std::uint64_t x)
{
#if defined(__GNUC__) || defined(__clang__)
    return __builtin_popcountll(x);
#else
    int count = 0;
    while (x)
    {
        x &= (x - 1);
        count++;
    }
    return count;
#endif
}
