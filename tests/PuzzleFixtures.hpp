#ifndef A7E20C4D_9F31_4B86_8A5E_1D63F7B90C28
#define A7E20C4D_9F31_4B86_8A5E_1D63F7B90C28

#include <string>
#include <utility>
#include <vector>

#include "userImpl/puzzle/Board.hpp"
#include "userImpl/puzzle/Interpreter.hpp"
#include "userImpl/puzzle/LevelParser.hpp"
#include "userImpl/puzzle/Program.hpp"

namespace fixtures {

using grid_pos::GridPos;
using interpreter::PlayerPose;
using program::Command;
using program::StepKind;

inline level::TileRecord rec(std::string type, int x, int y, tile::TileParams params = {}) {
    return level::TileRecord{std::move(type), GridPos{x, y}, params};
}

// 1 行だけのリテラルレベル(types[i] が (i, 0) に並ぶ。空文字列はタイルなし)
inline level::LevelData row_level(const std::vector<std::string>& types,
                                  std::string start_direction = "Right") {
    level::LevelData data{};
    data.width = static_cast<int>(types.size());
    data.height = 1;
    data.start_direction = std::move(start_direction);
    for (int x = 0; x < data.width; ++x) {
        if (!types[x].empty()) data.tiles.push_back(rec(types[x], x, 0));
    }
    return data;
}

inline tile::TileParams switch_params(int id) {
    tile::TileParams p{};
    p.switch_id = id;
    return p;
}

inline tile::TileParams bridge_params(int controlled_by, bool initially_active,
                                      bool activates_when_on) {
    tile::TileParams p{};
    p.controlled_by_switch_id = controlled_by;
    p.initially_active = initially_active;
    p.activates_when_switch_on = activates_when_on;
    return p;
}

inline tile::TileParams weak_params(int steps) {
    tile::TileParams p{};
    p.initial_steps = steps;
    return p;
}

inline Command F() { return Command::step(StepKind::MoveForward); }
inline Command L() { return Command::step(StepKind::TurnLeft); }
inline Command R() { return Command::step(StepKind::TurnRight); }

/**
 * @brief インタプリタ/セッションのシグナルを記録する
 * on_sequence_started などを持つ型ならどちらにも attach できる
 */
struct Recorder {
    int started{0};
    int completed{0};
    int failed{0};
    std::vector<int> steps;
    std::vector<PlayerPose> moves;
    std::vector<GridPos> blocked;

    void on_started() { ++started; }
    void on_step(int count) { steps.push_back(count); }
    void on_completed() { ++completed; }
    void on_failed() { ++failed; }
    void on_moved(const PlayerPose& pose) { moves.push_back(pose); }
    void on_blocked(GridPos target) { blocked.push_back(target); }

    template <class Source>
    void attach(Source& src) {
        src.on_sequence_started().template connect<&Recorder::on_started>(*this);
        src.on_step_taken().template connect<&Recorder::on_step>(*this);
        src.on_sequence_completed().template connect<&Recorder::on_completed>(*this);
        src.on_sequence_failed().template connect<&Recorder::on_failed>(*this);
        src.on_player_moved().template connect<&Recorder::on_moved>(*this);
        src.on_move_blocked().template connect<&Recorder::on_blocked>(*this);
    }
};

// tile_changed の記録
struct TileLog {
    std::vector<std::pair<GridPos, tile::Tile>> changes;

    void on_changed(GridPos pos, const tile::Tile& t) { changes.emplace_back(pos, t); }

    template <class Source>
    void attach(Source& src) {
        src.on_tile_changed().template connect<&TileLog::on_changed>(*this);
    }
};

}  // namespace fixtures

#endif /* A7E20C4D_9F31_4B86_8A5E_1D63F7B90C28 */
