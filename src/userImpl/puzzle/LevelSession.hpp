#ifndef A6E39D1F_8B52_4C07_9F4A_D2B85E1037C6
#define A6E39D1F_8B52_4C07_9F4A_D2B85E1037C6

#include <SDL2/SDL_log.h>

#include <cstddef>
#include <memory>
#include <string>
#include <tl/expected.hpp>
#include <utility>
#include <vector>

#include "core/EnttWithStacktrace.hpp"
#include "userImpl/puzzle/Board.hpp"
#include "userImpl/puzzle/Interpreter.hpp"
#include "userImpl/puzzle/LevelParser.hpp"

namespace session {

using grid_pos::GridPos;
using interpreter::PlayerPose;

/**
 * @brief セッション中の進捗(保存はしない)
 * @param levels_passed クリアした最大レベル番号(1 始まり)
 * @param total_steps クリア時のステップ数の合計
 */
struct Progress {
    int levels_passed{0};
    int total_steps{0};
};

/**
 * @brief レベル列の管理(ロード/リスタート/次レベル)
 *
 * 盤面とインタプリタを所有し、インタプリタにリスタート/次レベルのトリガを渡す。
 * トリガは記録するだけで、実際の差し替えは transition_delay 秒後の update() で行う
 * (インタプリタ自身の呼び出しの中で盤面を壊さないため)。
 * 盤面が作り直されても購読が切れないよう、シグナルはすべてここから再発行する。
 */
class LevelSession {
   public:
    LevelSession(std::vector<level::LevelSource> levels, double step_delay_sec,
                 double transition_delay_sec)
        : levels_(std::move(levels)),
          step_delay_sec_(step_delay_sec),
          transition_delay_sec_(transition_delay_sec) {}

    LevelSession(const LevelSession&) = delete;
    LevelSession& operator=(const LevelSession&) = delete;

    /**
     * index 番目のレベルを新しく作り直してロードする
     * 実行中のインタプリタは停止する。失敗した場合は以前の盤面が残る。
     */
    tl::expected<void, std::string> load_level(std::size_t index) {
        if (index >= levels_.size()) {
            return tl::make_unexpected("level index " + std::to_string(index) +
                                       " is out of range");
        }
        SDL_Log("Loading Level %zu...", index);

        if (interpreter_) interpreter_->halt();

        auto loaded = board::load(levels_[index]);
        if (!loaded) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Level %zu failed to load: %s", index,
                         loaded.error().c_str());
            return tl::make_unexpected(loaded.error());
        }

        // インタプリタは盤面を参照しているので先に捨てる
        interpreter_.reset();
        board_ = std::make_unique<board::Board>(std::move(loaded.value()));
        board_->on_tile_changed().connect<&LevelSession::forward_tile_changed>(*this);

        const PlayerPose spawn{board_->start_position(), board_->start_facing()};
        interpreter::Hooks hooks{
            .request_restart = [this] { schedule(Pending::Restart); },
            .request_next_level = [this] { handle_level_completed(); },
        };
        interpreter_ = std::make_unique<interpreter::Interpreter>(*board_, spawn, step_delay_sec_,
                                                                 std::move(hooks));
        connect_interpreter();

        index_ = index;
        pending_ = Pending::None;
        SDL_Log("Level loaded successfully.");
        level_loaded_.publish(index_);
        return {};
    }

    /**
     * 現在のレベルを即座に作り直す
     * 次レベルへの遷移待ちの間は受け付けない
     */
    tl::expected<void, std::string> restart() {
        if (pending_ == Pending::NextLevel) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "restart() ignored: waiting for the next level");
            return tl::make_unexpected("level is already cleared; next level is pending");
        }
        SDL_Log("Restarting current level...");
        return load_level(index_);
    }

    /**
     * コマンドプログラムを実行する
     * @return 盤面がない/実行中/遷移待ちの場合は false
     */
    bool run(program::Program commands) {
        if (!interpreter_) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "run() ignored: no level is loaded");
            return false;
        }
        if (pending_ != Pending::None) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "run() ignored: waiting for the level transition");
            return false;
        }
        return interpreter_->run(std::move(commands));
    }

    void halt() {
        if (interpreter_) interpreter_->halt();
    }

    // 遷移待ちを進めてから、インタプリタの停止時間を進める
    void update(double dt) {
        if (pending_ != Pending::None) {
            pending_sec_ -= dt;
            if (pending_sec_ <= 0.0) apply_pending();
        }
        if (interpreter_) interpreter_->update(dt);
    }

    // --- 参照 ---

    [[nodiscard]] std::size_t level_index() const noexcept { return index_; }
    [[nodiscard]] std::size_t level_count() const noexcept { return levels_.size(); }
    [[nodiscard]] const board::Board* board() const noexcept { return board_.get(); }
    [[nodiscard]] const interpreter::Interpreter* interpreter() const noexcept {
        return interpreter_.get();
    }
    [[nodiscard]] const Progress& progress() const noexcept { return progress_; }
    [[nodiscard]] bool is_transitioning() const noexcept { return pending_ != Pending::None; }
    [[nodiscard]] bool all_cleared() const noexcept { return all_cleared_; }

    // --- シグナル ---

    [[nodiscard]] auto on_sequence_started() noexcept { return entt::sink{sequence_started_}; }
    [[nodiscard]] auto on_step_taken() noexcept { return entt::sink{step_taken_}; }
    [[nodiscard]] auto on_sequence_completed() noexcept {
        return entt::sink{sequence_completed_};
    }
    [[nodiscard]] auto on_sequence_failed() noexcept { return entt::sink{sequence_failed_}; }
    [[nodiscard]] auto on_player_moved() noexcept { return entt::sink{player_moved_}; }
    [[nodiscard]] auto on_move_blocked() noexcept { return entt::sink{move_blocked_}; }
    [[nodiscard]] auto on_tile_changed() noexcept { return entt::sink{tile_changed_}; }
    [[nodiscard]] auto on_level_loaded() noexcept { return entt::sink{level_loaded_}; }
    // level_completed(steps_taken, level_index)
    [[nodiscard]] auto on_level_completed() noexcept { return entt::sink{level_completed_}; }
    // all_levels_completed(total_steps)
    [[nodiscard]] auto on_all_levels_completed() noexcept {
        return entt::sink{all_levels_completed_};
    }

   private:
    enum class Pending { None, Restart, NextLevel };

    void schedule(Pending what) {
        pending_ = what;
        pending_sec_ = transition_delay_sec_;
    }

    void handle_level_completed() {
        const int steps = interpreter_ ? interpreter_->steps_taken() : 0;
        const int passed = static_cast<int>(index_) + 1;
        if (passed > progress_.levels_passed) progress_.levels_passed = passed;
        progress_.total_steps += steps;

        SDL_Log("Player reached the end in %d steps! Loading next level.", steps);
        level_completed_.publish(steps, index_);
        schedule(Pending::NextLevel);
    }

    void apply_pending() {
        const Pending what = pending_;
        pending_ = Pending::None;

        if (what == Pending::Restart) {
            if (const auto r = restart(); !r) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Restart failed: %s",
                             r.error().c_str());
            }
            return;
        }

        const std::size_t next = index_ + 1;
        if (next >= levels_.size()) {
            SDL_Log("CONGRATULATIONS! You've completed all levels!");
            all_cleared_ = true;
            all_levels_completed_.publish(progress_.total_steps);
            return;
        }
        if (const auto r = load_level(next); !r) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Next level failed: %s", r.error().c_str());
        }
    }

    void connect_interpreter() {
        interpreter_->on_sequence_started().connect<&LevelSession::forward_started>(*this);
        interpreter_->on_step_taken().connect<&LevelSession::forward_step_taken>(*this);
        interpreter_->on_sequence_completed().connect<&LevelSession::forward_completed>(*this);
        interpreter_->on_sequence_failed().connect<&LevelSession::forward_failed>(*this);
        interpreter_->on_player_moved().connect<&LevelSession::forward_player_moved>(*this);
        interpreter_->on_move_blocked().connect<&LevelSession::forward_move_blocked>(*this);
    }

    void forward_started() { sequence_started_.publish(); }
    void forward_step_taken(int count) { step_taken_.publish(count); }
    void forward_completed() { sequence_completed_.publish(); }
    void forward_failed() { sequence_failed_.publish(); }
    void forward_player_moved(const PlayerPose& pose) { player_moved_.publish(pose); }
    void forward_move_blocked(GridPos target) { move_blocked_.publish(target); }
    void forward_tile_changed(GridPos pos, const tile::Tile& t) { tile_changed_.publish(pos, t); }

    std::vector<level::LevelSource> levels_;
    double step_delay_sec_;
    double transition_delay_sec_;

    std::size_t index_{0};
    // interpreter_ は board_ を参照するので、board_ より後に宣言して先に破棄する
    std::unique_ptr<board::Board> board_;
    std::unique_ptr<interpreter::Interpreter> interpreter_;

    Pending pending_{Pending::None};
    double pending_sec_{0.0};
    Progress progress_{};
    bool all_cleared_{false};

    entt::sigh<void()> sequence_started_;
    entt::sigh<void(int)> step_taken_;
    entt::sigh<void()> sequence_completed_;
    entt::sigh<void()> sequence_failed_;
    entt::sigh<void(const PlayerPose&)> player_moved_;
    entt::sigh<void(GridPos)> move_blocked_;
    entt::sigh<void(GridPos, const tile::Tile&)> tile_changed_;
    entt::sigh<void(std::size_t)> level_loaded_;
    entt::sigh<void(int, std::size_t)> level_completed_;
    entt::sigh<void(int)> all_levels_completed_;
};

}  // namespace session

#endif /* A6E39D1F_8B52_4C07_9F4A_D2B85E1037C6 */
