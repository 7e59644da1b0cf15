#ifndef A9D5C217_4E8B_4F03_B6A2_58E1F7C93D40
#define A9D5C217_4E8B_4F03_B6A2_58E1F7C93D40

#include <cstdint>
#include <optional>
#include <string_view>

#include "userImpl/puzzle/GridPos.hpp"

namespace tile {

using grid_pos::GridPos;

// タイル種別
enum class TileKind : std::uint8_t { Floor, Wall, Air, Start, End, Switch, Bridge, WeakFloor };

constexpr std::string_view to_string(TileKind k) noexcept {
    switch (k) {
        case TileKind::Floor:
            return "Floor";
        case TileKind::Wall:
            return "Wall";
        case TileKind::Air:
            return "Air";
        case TileKind::Start:
            return "Start";
        case TileKind::End:
            return "End";
        case TileKind::Switch:
            return "Switch";
        case TileKind::Bridge:
            return "Bridge";
        case TileKind::WeakFloor:
            return "WeakFloor";
    }
    return "Unknown";
}

// レベルファイルの種別文字列(大文字小文字は無視)
inline std::optional<TileKind> parse_kind(std::string_view text) noexcept {
    for (const auto k : {TileKind::Floor, TileKind::Wall, TileKind::Air, TileKind::Start,
                         TileKind::End, TileKind::Switch, TileKind::Bridge, TileKind::WeakFloor}) {
        if (grid_pos::iequals(text, to_string(k))) return k;
    }
    return std::nullopt;
}

/**
 * @brief 種別ごとのパラメータ(定義テーブルやタイルレコードから読み込む部分)
 * @param switch_id Switch の識別子(Bridge から参照される)
 * @param controlled_by_switch_id Bridge を制御する Switch の識別子
 * @param initially_active ロード直後(スイッチ同期前)の Bridge 状態
 * @param activates_when_switch_on Switch が ON のとき通行可になるか
 * @param initial_steps WeakFloor が耐えられる着地回数
 */
struct TileParams {
    int switch_id{0};
    int controlled_by_switch_id{0};
    bool initially_active{true};
    bool activates_when_switch_on{true};
    int initial_steps{0};
};

/**
 * @brief 盤面の 1 セル
 *
 * 実行時状態(is_on / is_active / steps_remaining)は Board だけが書き換える。
 */
struct Tile {
    TileKind kind{TileKind::Floor};
    GridPos position{};
    TileParams params{};

    bool is_on{false};       // Switch
    bool is_active{false};   // Bridge
    int steps_remaining{0};  // WeakFloor
};

}  // namespace tile

#endif /* A9D5C217_4E8B_4F03_B6A2_58E1F7C93D40 */
