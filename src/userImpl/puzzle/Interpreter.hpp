#ifndef F7C2A94B_5D06_4E81_B3A9_0E6D17C4F258
#define F7C2A94B_5D06_4E81_B3A9_0E6D17C4F258

#include <SDL2/SDL_log.h>

#include <cstddef>
#include <functional>
#include <string_view>
#include <utility>
#include <vector>

#include "core/EnttWithStacktrace.hpp"
#include "userImpl/puzzle/Board.hpp"
#include "userImpl/puzzle/Program.hpp"

namespace interpreter {

using board::Board;
using board::LandingOutcome;
using board::MoveResult;
using grid_pos::Direction;
using grid_pos::GridPos;
using program::Command;
using program::Program;
using program::StepKind;

// Idle -> Running -> {Completed, Failed}。Running からはいつでも Halted へ
enum class RunState { Idle, Running, Completed, Failed, Halted };

constexpr std::string_view to_string(RunState s) noexcept {
    switch (s) {
        case RunState::Idle:
            return "Idle";
        case RunState::Running:
            return "Running";
        case RunState::Completed:
            return "Completed";
        case RunState::Failed:
            return "Failed";
        case RunState::Halted:
            return "Halted";
    }
    return "Unknown";
}

/**
 * @brief プレイヤーの姿勢
 * @param position 盤面座標
 * @param facing 向き
 */
struct PlayerPose {
    GridPos position{};
    Direction facing{Direction::Up};
};

/**
 * @brief 埋め込み側が渡す外部トリガ(どちらも省略可)
 * @param request_restart 落下/ゴール外での終了時に呼ぶ
 * @param request_next_level 成功終了時に呼ぶ
 */
struct Hooks {
    std::function<void()> request_restart;
    std::function<void()> request_next_level;
};

/**
 * @brief コマンドプログラムを盤面上で 1 ステップずつ実行する
 *
 * ループは深さ優先で展開する。展開途中の位置は Frame のスタックで持ち、
 * Step を 1 つ実行するたびに step_delay 秒だけ停止する(唯一の中断点)。
 * 停止中の再開は update(dt) が行う。halt() と落下はスタックを捨てるので、
 * 何段の入れ子であっても残りのコマンドは二度と実行されない。
 */
class Interpreter {
   public:
    Interpreter(Board& board, PlayerPose start, double step_delay_sec, Hooks hooks = {})
        : board_(&board),
          pose_(start),
          step_delay_sec_(step_delay_sec > 0.0 ? step_delay_sec : 0.0),
          hooks_(std::move(hooks)) {}

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    /**
     * 実行を開始する
     * 最初の Step はこの呼び出しの中で実行される。
     * @return 既に Running なら何もせず false
     */
    bool run(Program commands) {
        if (state_ == RunState::Running) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "run() ignored: a command sequence is already running");
            return false;
        }

        program_ = std::move(commands);
        frames_.clear();
        frames_.push_back(Frame{&program_, 0, 1});
        pending_success_ = false;
        wait_sec_ = 0.0;
        state_ = RunState::Running;

        SDL_Log("--- SEQUENCE START ---");
        sequence_started_.publish();

        advance();
        return true;
    }

    // Running を即座に抜け、停止中の継続をすべて破棄する。何度呼んでもよい
    void halt() {
        if (state_ != RunState::Running) return;
        frames_.clear();
        state_ = RunState::Halted;
        SDL_Log("--- SEQUENCE HALTED ---");
    }

    // 停止時間を進め、期限が来たら次の Step まで展開する
    void update(double dt) {
        if (state_ != RunState::Running) return;
        wait_sec_ -= dt;
        while (state_ == RunState::Running && wait_sec_ <= 0.0) {
            advance();
        }
    }

    // --- プレイヤー動作 ---

    MoveResult move_forward() {
        const GridPos target = pose_.position + grid_pos::unit_vector(pose_.facing);
        const MoveResult result = board_->check_move(target);

        switch (result) {
            case MoveResult::Success: {
                pose_.position = target;
                SDL_Log("Moved Forward to: %s", grid_pos::to_string(target).c_str());
                player_moved_.publish(pose_);

                const LandingOutcome landed = board_->on_player_landed(pose_.position);
                if (landed == LandingOutcome::BecameUnsafe) {
                    SDL_Log("Move failed. The floor gave way.");
                    fail();
                } else if (landed == LandingOutcome::LevelComplete) {
                    // 判定は実行終了時に最終位置で行う
                    pending_success_ = true;
                }
                break;
            }
            case MoveResult::Blocked:
                SDL_Log("Move failed. Blocked by a wall.");
                move_blocked_.publish(target);
                break;
            case MoveResult::Fall:
                SDL_Log("Move failed. Fell off the edge, into air, or onto an inactive bridge.");
                fail();
                break;
        }
        return result;
    }

    void turn_left() {
        pose_.facing = grid_pos::rotate(pose_.facing, -1);
        player_moved_.publish(pose_);
    }

    void turn_right() {
        pose_.facing = grid_pos::rotate(pose_.facing, +1);
        player_moved_.publish(pose_);
    }

    // --- 参照 ---

    [[nodiscard]] RunState state() const noexcept { return state_; }
    [[nodiscard]] bool is_running() const noexcept { return state_ == RunState::Running; }
    [[nodiscard]] const PlayerPose& pose() const noexcept { return pose_; }
    [[nodiscard]] int steps_taken() const noexcept { return steps_taken_; }
    [[nodiscard]] bool pending_success() const noexcept { return pending_success_; }

    // --- シグナル ---

    [[nodiscard]] auto on_sequence_started() noexcept { return entt::sink{sequence_started_}; }
    [[nodiscard]] auto on_step_taken() noexcept { return entt::sink{step_taken_}; }
    [[nodiscard]] auto on_sequence_completed() noexcept {
        return entt::sink{sequence_completed_};
    }
    [[nodiscard]] auto on_sequence_failed() noexcept { return entt::sink{sequence_failed_}; }
    [[nodiscard]] auto on_player_moved() noexcept { return entt::sink{player_moved_}; }
    [[nodiscard]] auto on_move_blocked() noexcept { return entt::sink{move_blocked_}; }

   private:
    /**
     * @brief 展開途中のコマンドリスト 1 段分
     * @param body 実行中の子リスト(program_ 内を指す)
     * @param next 次に実行する要素
     * @param passes_left 残りの周回数(今の周を含む)
     */
    struct Frame {
        const std::vector<Command>* body;
        std::size_t next;
        int passes_left;
    };

    // Step を 1 つ実行するか、実行が終わるまで展開を進める
    void advance() {
        while (state_ == RunState::Running) {
            if (frames_.empty()) {
                finish();
                return;
            }

            Frame& frame = frames_.back();
            if (frame.next >= frame.body->size()) {
                // 子リストを 1 周した
                if (--frame.passes_left > 0) {
                    frame.next = 0;
                } else {
                    frames_.pop_back();
                }
                continue;
            }

            const Command& command = (*frame.body)[frame.next++];
            if (command.is_loop()) {
                SDL_Log("--- Starting Loop (x%d) ---", command.repeat_count());
                frames_.push_back(Frame{&command.children(), 0, command.repeat_count()});
                continue;
            }

            execute_step(command.step_kind());
            wait_sec_ += step_delay_sec_;
            return;
        }
    }

    void execute_step(StepKind kind) {
        ++steps_taken_;
        step_taken_.publish(steps_taken_);

        switch (kind) {
            case StepKind::MoveForward:
                move_forward();
                break;
            case StepKind::TurnLeft:
                turn_left();
                break;
            case StepKind::TurnRight:
                turn_right();
                break;
        }
    }

    // 全コマンドを消化した。End の上にいなければ失敗
    void finish() {
        const auto final_tile = board_->tile_at(pose_.position);
        if (final_tile && final_tile->kind == tile::TileKind::End) {
            state_ = RunState::Completed;
            SDL_Log("--- SEQUENCE COMPLETE (Success) ---");
            sequence_completed_.publish();
            if (hooks_.request_next_level) hooks_.request_next_level();
            return;
        }
        SDL_Log("--- SEQUENCE FAILED (Not on End tile) ---");
        fail();
    }

    // Running 中の落下/ゴール外終了だけが失敗になる
    void fail() {
        if (state_ != RunState::Running) return;
        frames_.clear();
        state_ = RunState::Failed;
        sequence_failed_.publish();
        if (hooks_.request_restart) hooks_.request_restart();
    }

    Board* board_;
    PlayerPose pose_;
    double step_delay_sec_;
    Hooks hooks_;

    RunState state_{RunState::Idle};
    Program program_;
    std::vector<Frame> frames_;
    double wait_sec_{0.0};
    int steps_taken_{0};  // レベル単位で数える(run をまたいで累積)
    bool pending_success_{false};

    entt::sigh<void()> sequence_started_;
    entt::sigh<void(int)> step_taken_;
    entt::sigh<void()> sequence_completed_;
    entt::sigh<void()> sequence_failed_;
    entt::sigh<void(const PlayerPose&)> player_moved_;
    entt::sigh<void(GridPos)> move_blocked_;
};

}  // namespace interpreter

#endif /* F7C2A94B_5D06_4E81_B3A9_0E6D17C4F258 */
