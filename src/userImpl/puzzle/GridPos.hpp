#ifndef C6E0B9A4_35F1_4A2D_8D7C_0B4E92F1A6D3
#define C6E0B9A4_35F1_4A2D_8D7C_0B4E92F1A6D3

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

namespace grid_pos {

/**
 * @brief 盤面上の整数座標(y=0 が最下段)
 * @param x 列
 * @param y 行
 */
struct GridPos {
    int x{0};
    int y{0};

    friend constexpr bool operator==(const GridPos&, const GridPos&) = default;

    friend constexpr GridPos operator+(GridPos a, GridPos b) noexcept {
        return GridPos{a.x + b.x, a.y + b.y};
    }
};

inline std::string to_string(const GridPos& p) {
    return "(" + std::to_string(p.x) + ", " + std::to_string(p.y) + ")";
}

// 4 方向。並び順は右回り(Up -> Right -> Down -> Left)
enum class Direction { Up, Right, Down, Left };

// 向きの単位ベクトル。y=0 が最下段なので Up は +y
constexpr GridPos unit_vector(Direction d) noexcept {
    switch (d) {
        case Direction::Up:
            return GridPos{0, 1};
        case Direction::Right:
            return GridPos{1, 0};
        case Direction::Down:
            return GridPos{0, -1};
        case Direction::Left:
            return GridPos{-1, 0};
    }
    return GridPos{0, 0};
}

// dir: -1 で左回転、+1 で右回転
constexpr Direction rotate(Direction current, int dir) noexcept {
    if (dir == 0) return current;
    const int idx = (static_cast<int>(current) + (dir > 0 ? 1 : 3)) % 4;
    return static_cast<Direction>(idx);
}

constexpr std::string_view to_string(Direction d) noexcept {
    switch (d) {
        case Direction::Up:
            return "Up";
        case Direction::Right:
            return "Right";
        case Direction::Down:
            return "Down";
        case Direction::Left:
            return "Left";
    }
    return "Unknown";
}

// 大文字小文字を区別せずに比較
inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

inline std::optional<Direction> parse_direction(std::string_view text) noexcept {
    for (const auto d : {Direction::Up, Direction::Right, Direction::Down, Direction::Left}) {
        if (iequals(text, to_string(d))) return d;
    }
    return std::nullopt;
}

}  // namespace grid_pos

#endif /* C6E0B9A4_35F1_4A2D_8D7C_0B4E92F1A6D3 */
