#ifndef B4F81D6A_2C97_4E3B_A0D5_6F93E28C1B47
#define B4F81D6A_2C97_4E3B_A0D5_6F93E28C1B47

#include <SDL2/SDL_log.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tl/expected.hpp>
#include <variant>
#include <vector>

#include "core/EnttWithStacktrace.hpp"
#include "userImpl/puzzle/LevelParser.hpp"
#include "userImpl/puzzle/Tile.hpp"

namespace board {

using grid_pos::Direction;
using grid_pos::GridPos;
using tile::Tile;
using tile::TileKind;

// セルへ入ろうとした結果
enum class MoveResult { Success, Blocked, Fall };

// 着地の副作用の結果
enum class LandingOutcome {
    Safe,           // そのまま続行
    BecameUnsafe,   // 足元の WeakFloor が崩れた(落下扱い)
    LevelComplete,  // End に到達した
};

constexpr std::string_view to_string(MoveResult r) noexcept {
    switch (r) {
        case MoveResult::Success:
            return "Success";
        case MoveResult::Blocked:
            return "Blocked";
        case MoveResult::Fall:
            return "Fall";
    }
    return "Unknown";
}

/**
 * @brief 盤面(タイルの格子と、移動判定・着地の副作用)
 *
 * タイルの実行時状態はこのクラスの操作を通してのみ変化する。
 * 変化したタイルは tile_changed シグナルで通知する。
 * リスタート時は差分更新せず、ソースから作り直すこと。
 */
class Board {
   public:
    using TileChanged = void(GridPos, const Tile&);

    // リテラル形式のレベルから盤面を構築
    static tl::expected<Board, std::string> create(const level::LevelData& data) {
        if (data.width <= 0 || data.height <= 0) {
            return tl::make_unexpected("level is empty (" + std::to_string(data.width) + "x" +
                                       std::to_string(data.height) + ")");
        }

        Board b{data.width, data.height};
        b.diagnostics_ = data.diagnostics;

        int start_count = 0;
        for (const auto& rec : data.tiles) {
            const auto kind = tile::parse_kind(rec.type);
            if (!kind) {
                return tl::make_unexpected("unknown tile type '" + rec.type + "' at " +
                                           grid_pos::to_string(rec.position));
            }
            if (!b.in_bounds(rec.position)) {
                return tl::make_unexpected("tile " + grid_pos::to_string(rec.position) +
                                           " is outside the board");
            }
            auto& slot = b.cells_[b.index(rec.position)];
            if (slot) {
                return tl::make_unexpected("duplicate tile at " +
                                           grid_pos::to_string(rec.position));
            }

            Tile t{};
            t.kind = *kind;
            t.position = rec.position;
            t.params = rec.params;

            switch (t.kind) {
                case TileKind::Start:
                    b.start_ = t.position;
                    ++start_count;
                    break;
                case TileKind::Switch:
                    t.is_on = false;
                    break;
                case TileKind::Bridge:
                    t.is_active = t.params.initially_active;
                    break;
                case TileKind::WeakFloor:
                    if (t.params.initial_steps <= 0) {
                        const std::string msg = "WeakFloor at " +
                                                grid_pos::to_string(t.position) +
                                                " has non-positive initialSteps, using 1";
                        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s", msg.c_str());
                        b.diagnostics_.push_back(msg);
                        t.params.initial_steps = 1;
                    }
                    t.steps_remaining = t.params.initial_steps;
                    break;
                default:
                    break;
            }
            slot = t;
        }

        if (start_count == 0) {
            return tl::make_unexpected("No 'Start' tile found");
        }
        if (start_count > 1) {
            return tl::make_unexpected("level has " + std::to_string(start_count) +
                                       " 'Start' tiles, expected exactly one");
        }

        if (!data.start_direction.empty()) {
            if (const auto d = grid_pos::parse_direction(data.start_direction)) {
                b.start_facing_ = *d;
            } else {
                const std::string msg =
                    "Unknown startDirection '" + data.start_direction + "', defaulting to Up";
                SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s", msg.c_str());
                b.diagnostics_.push_back(msg);
            }
        }

        // 初期状態の Bridge をスイッチの状態(すべて OFF)に合わせる
        for (int x = 0; x < b.width_; ++x) {
            for (int y = 0; y < b.height_; ++y) {
                const auto& cell = b.cells_[b.index(GridPos{x, y})];
                if (cell && cell->kind == TileKind::Switch) {
                    b.switch_sync(*cell);
                }
            }
        }

        return b;
    }

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] GridPos start_position() const noexcept { return start_; }
    [[nodiscard]] Direction start_facing() const noexcept { return start_facing_; }
    [[nodiscard]] const std::vector<std::string>& diagnostics() const noexcept {
        return diagnostics_;
    }

    [[nodiscard]] bool in_bounds(GridPos p) const noexcept {
        return p.x >= 0 && p.x < width_ && p.y >= 0 && p.y < height_;
    }

    // 盤面外やタイルのないセルは nullopt
    [[nodiscard]] std::optional<Tile> tile_at(GridPos p) const {
        if (!in_bounds(p)) return std::nullopt;
        return cells_[index(p)];
    }

    // 状態は変えない。WeakFloor は常に入れる(崩れるのは着地の副作用)
    [[nodiscard]] MoveResult check_move(GridPos target) const {
        if (!in_bounds(target)) return MoveResult::Fall;
        const auto& cell = cells_[index(target)];
        if (!cell) return MoveResult::Fall;

        switch (cell->kind) {
            case TileKind::Wall:
                return MoveResult::Blocked;
            case TileKind::Air:
                return MoveResult::Fall;
            case TileKind::Bridge:
                return cell->is_active ? MoveResult::Success : MoveResult::Fall;
            default:
                return MoveResult::Success;
        }
    }

    /**
     * プレイヤーが position に着地した(位置更新後に 1 回だけ呼ぶ)
     * @return WeakFloor が崩れたら BecameUnsafe、End なら LevelComplete
     */
    LandingOutcome on_player_landed(GridPos position) {
        if (!in_bounds(position)) return LandingOutcome::Safe;
        auto& cell = cells_[index(position)];
        if (!cell) return LandingOutcome::Safe;
        Tile& t = *cell;

        switch (t.kind) {
            case TileKind::Switch:
                t.is_on = !t.is_on;
                SDL_Log("Switch %d at %s turned %s.", t.params.switch_id,
                        grid_pos::to_string(t.position).c_str(), t.is_on ? "ON" : "OFF");
                tile_changed_.publish(t.position, t);
                switch_sync(t);
                return LandingOutcome::Safe;

            case TileKind::WeakFloor:
                if (t.steps_remaining <= 0) return LandingOutcome::Safe;
                --t.steps_remaining;
                SDL_Log("Stepped on Weak Floor at %s. Steps remaining: %d",
                        grid_pos::to_string(t.position).c_str(), t.steps_remaining);
                if (t.steps_remaining == 0) {
                    SDL_Log("Weak Floor broke!");
                    t.kind = TileKind::Air;
                    tile_changed_.publish(t.position, t);
                    return LandingOutcome::BecameUnsafe;
                }
                tile_changed_.publish(t.position, t);
                return LandingOutcome::Safe;

            case TileKind::End:
                return LandingOutcome::LevelComplete;

            default:
                // 非アクティブな Bridge などは check_move で弾かれる想定なので何もしない
                return LandingOutcome::Safe;
        }
    }

    /**
     * switch_tile に紐づく Bridge をすべて再計算する
     * is_active = (switch.is_on == activates_when_switch_on)。変化したものだけ通知する。
     */
    void switch_sync(const Tile& switch_tile) {
        const int id = switch_tile.params.switch_id;
        const bool on = switch_tile.is_on;
        for (auto& cell : cells_) {
            if (!cell || cell->kind != TileKind::Bridge) continue;
            if (cell->params.controlled_by_switch_id != id) continue;

            const bool next = (on == cell->params.activates_when_switch_on);
            if (cell->is_active == next) continue;
            cell->is_active = next;
            tile_changed_.publish(cell->position, *cell);
        }
    }

    // tile_changed(position, 変化後のタイル)
    [[nodiscard]] auto on_tile_changed() noexcept { return entt::sink{tile_changed_}; }

   private:
    Board(int width, int height)
        : width_(width),
          height_(height),
          cells_(static_cast<std::size_t>(width) * static_cast<std::size_t>(height)) {}

    [[nodiscard]] std::size_t index(GridPos p) const noexcept {
        return static_cast<std::size_t>(p.y) * static_cast<std::size_t>(width_) +
               static_cast<std::size_t>(p.x);
    }

    int width_;
    int height_;
    GridPos start_{};
    Direction start_facing_{Direction::Up};
    std::vector<std::optional<Tile>> cells_;  // row-major
    std::vector<std::string> diagnostics_;
    entt::sigh<TileChanged> tile_changed_;
};

/**
 * どちらの形のレベルからでも盤面を作る
 * 盤面は毎回新しく作る(リスタートでも使い回さない)
 */
inline tl::expected<Board, std::string> load(const level::LevelSource& source) {
    if (const auto* literal = std::get_if<level::LevelData>(&source)) {
        return Board::create(*literal);
    }
    const auto parsed = level::parse_compact(std::get<level::CompactLevel>(source));
    if (!parsed) {
        return tl::make_unexpected(parsed.error());
    }
    return Board::create(*parsed);
}

}  // namespace board

#endif /* B4F81D6A_2C97_4E3B_A0D5_6F93E28C1B47 */
