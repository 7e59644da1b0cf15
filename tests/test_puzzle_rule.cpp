// tests/test_puzzle_rule.cpp

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "core/Input.hpp"
#include "core/SceneFramework.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/puzzle/PuzzleRule.hpp"

using global_setting::FontPtr;
using global_setting::GlobalSetting;
using grid_pos::GridPos;
using interpreter::RunState;
using program::ProgramDraft;
using puzzle_rule::TileFlash;
using puzzle_rule::World;
using scene_fw::Env;

namespace {

constexpr double kStepDelay = 0.5;
constexpr double kTransition = 0.5;

// テスト用のレベルファイルを一時ディレクトリに書き出す
std::string write_level(const std::string& name, const std::string& json) {
    const auto path = std::filesystem::temp_directory_path() / ("robopath_test_" + name);
    std::ofstream out(path);
    out << json;
    return path.string();
}

std::vector<std::string> level_files() {
    return {
        write_level("a.json", R"({ "startDirection": "Right", "layout": ["#.", "SE"] })"),
        write_level("b.json", R"({ "layout": ["E", "S"] })"),
    };
}

// フォントはロジックに不要なので nullptr でよい
std::shared_ptr<const GlobalSetting> makeSetting(std::vector<std::string> files) {
    auto s = std::make_shared<GlobalSetting>(320, 240, 32, 60, 60, kStepDelay, kTransition,
                                             std::move(files), FontPtr{});
    return std::shared_ptr<const GlobalSetting>(std::move(s));
}

// 押下フレームの入力
input::Input press(std::initializer_list<SDL_Keycode> keys) {
    input::Input in{};
    for (const auto k : keys) {
        input::apply_key(in, k, true);
    }
    return in;
}

void step(World& w, const GlobalSetting& gs, const input::Input& in, double dt) {
    const Env<GlobalSetting> env{in, gs, dt};
    puzzle_rule::step_world(w, env);
}

const ProgramDraft& draft_of(const World& w) {
    return w.registry->get<ProgramDraft>(w.board_singleton);
}

}  // namespace

// ------------------------------------------------------------
// 1. 生成: 設定のレベルファイルを読み、最初のレベルをロード
// ------------------------------------------------------------
TEST(PuzzleRule, MakeWorldLoadsFirstLevel) {
    auto gs = makeSetting(level_files());
    auto worldExp = puzzle_rule::make_world(*gs);
    ASSERT_TRUE(worldExp.has_value()) << worldExp.error();
    World w = *worldExp;

    ASSERT_NE(w.session, nullptr);
    EXPECT_EQ(w.session->level_count(), 2u);
    ASSERT_NE(w.session->board(), nullptr);
    EXPECT_EQ(w.session->board()->width(), 2);
    EXPECT_TRUE(program::draft::empty(draft_of(w)));
}

TEST(PuzzleRule, MakeWorldReportsBadConfiguration) {
    EXPECT_FALSE(puzzle_rule::make_world(*makeSetting({})).has_value());

    const auto missing = std::filesystem::temp_directory_path() / "robopath_test_missing.json";
    std::filesystem::remove(missing);
    EXPECT_FALSE(puzzle_rule::make_world(*makeSetting({missing.string()})).has_value());

    const auto no_start = write_level("no_start.json", R"({ "layout": [".E"] })");
    const auto bad = puzzle_rule::make_world(*makeSetting({no_start}));
    ASSERT_FALSE(bad.has_value());
    EXPECT_NE(bad.error().find("Start"), std::string::npos);
}

// ------------------------------------------------------------
// 2. キー入力で下書きを組み立てる
// ------------------------------------------------------------
TEST(PuzzleRule, KeysEditDraft) {
    auto gs = makeSetting(level_files());
    auto worldExp = puzzle_rule::make_world(*gs);
    ASSERT_TRUE(worldExp.has_value());
    World w = *worldExp;

    step(w, *gs, press({SDLK_w}), 0.0);
    step(w, *gs, press({SDLK_3}), 0.0);
    step(w, *gs, press({SDLK_LEFTBRACKET}), 0.0);
    step(w, *gs, press({SDLK_a}), 0.0);
    step(w, *gs, press({SDLK_d}), 0.0);
    EXPECT_EQ(program::draft::to_string(draft_of(w)), "F [x3 L R");

    step(w, *gs, press({SDLK_BACKSPACE}), 0.0);
    step(w, *gs, press({SDLK_RIGHTBRACKET}), 0.0);
    EXPECT_EQ(program::draft::to_string(draft_of(w)), "F [x3 L]");

    // 何も押さなければ変わらない
    step(w, *gs, input::Input{}, 0.0);
    EXPECT_EQ(program::draft::to_string(draft_of(w)), "F [x3 L]");
}

// HUD には展開後の歩数を出す。開いたループも閉じたものとして数える
TEST(PuzzleRule, ProgramLineShowsExpandedStepCount) {
    ProgramDraft d{};
    EXPECT_EQ(puzzle_rule::program_line(d), "Program:    (next loop x2)");

    program::draft::append_step(d, program::StepKind::MoveForward);
    program::draft::set_repeat(d, 3);
    program::draft::open_loop(d);
    program::draft::append_step(d, program::StepKind::TurnLeft);
    program::draft::append_step(d, program::StepKind::MoveForward);
    EXPECT_EQ(puzzle_rule::program_line(d), "Program: F [x3 L F   = 7 steps   (next loop x3)");
}

TEST(PuzzleRule, PipelineRunsStagesInFrameOrder) {
    std::vector<std::string> names;
    for (const auto& st : puzzle_rule::puzzle_pipeline()) names.emplace_back(st.name);
    EXPECT_EQ(names, (std::vector<std::string>{"input", "run_control", "flash_decay",
                                               "session_tick", "draft_sync"}));
}

// ------------------------------------------------------------
// 3. ENTER で実行し、時間経過で次のレベルへ進む
// ------------------------------------------------------------
TEST(PuzzleRule, RunKeyExecutesDraftAndAdvancesLevel) {
    auto gs = makeSetting(level_files());
    auto worldExp = puzzle_rule::make_world(*gs);
    ASSERT_TRUE(worldExp.has_value());
    World w = *worldExp;

    // レベル a: 右向きに 1 歩で End
    step(w, *gs, press({SDLK_w}), 0.0);
    step(w, *gs, press({SDLK_RETURN}), 0.0);
    ASSERT_NE(w.session->interpreter(), nullptr);
    EXPECT_EQ(w.session->interpreter()->steps_taken(), 1);
    EXPECT_EQ(w.session->interpreter()->state(), RunState::Running);

    step(w, *gs, input::Input{}, kStepDelay);
    EXPECT_EQ(w.session->interpreter()->state(), RunState::Completed);
    EXPECT_TRUE(w.session->is_transitioning());

    step(w, *gs, input::Input{}, kTransition);
    EXPECT_EQ(w.session->level_index(), 1u);
    // レベルが変わったら下書きは空になる
    EXPECT_TRUE(program::draft::empty(draft_of(w)));
    EXPECT_EQ(draft_of(w).level_index, 1u);
    EXPECT_FALSE(puzzle_rule::is_all_cleared(w));

    // レベル b: 上向きに 1 歩で End → 全クリア
    step(w, *gs, press({SDLK_w}), 0.0);
    step(w, *gs, press({SDLK_RETURN}), 0.0);
    step(w, *gs, input::Input{}, kStepDelay);
    step(w, *gs, input::Input{}, kTransition);
    EXPECT_TRUE(puzzle_rule::is_all_cleared(w));
    EXPECT_EQ(puzzle_rule::progress(w).levels_passed, 2);
    EXPECT_EQ(puzzle_rule::progress(w).total_steps, 2);
}

TEST(PuzzleRule, EmptyDraftIsNotRun) {
    auto gs = makeSetting(level_files());
    auto worldExp = puzzle_rule::make_world(*gs);
    ASSERT_TRUE(worldExp.has_value());
    World w = *worldExp;

    step(w, *gs, press({SDLK_RETURN}), 0.0);
    EXPECT_EQ(w.session->interpreter()->state(), RunState::Idle);
    EXPECT_FALSE(w.registry->all_of<puzzle_rule::RunRequest>(w.board_singleton));
}

// ------------------------------------------------------------
// 4. ESC で停止、R でリスタート(下書きは残る)
// ------------------------------------------------------------
TEST(PuzzleRule, HaltAndRestartKeys) {
    auto gs = makeSetting(level_files());
    auto worldExp = puzzle_rule::make_world(*gs);
    ASSERT_TRUE(worldExp.has_value());
    World w = *worldExp;

    step(w, *gs, press({SDLK_a}), 0.0);
    step(w, *gs, press({SDLK_a}), 0.0);
    step(w, *gs, press({SDLK_RETURN}), 0.0);
    EXPECT_TRUE(w.session->interpreter()->is_running());

    step(w, *gs, press({SDLK_ESCAPE}), 0.0);
    EXPECT_EQ(w.session->interpreter()->state(), RunState::Halted);

    step(w, *gs, press({SDLK_r}), 0.0);
    EXPECT_EQ(w.session->interpreter()->state(), RunState::Idle);
    EXPECT_EQ(program::draft::to_string(draft_of(w)), "L L");
}

// ------------------------------------------------------------
// 5. 壁に阻まれたセルと変化したタイルは強調表示され、時間で消える
// ------------------------------------------------------------
TEST(PuzzleRule, FeedbackFlashesDecay) {
    const auto file = write_level("flash.json", R"({
        "startDirection": "Right",
        "definitions": [ { "key": "w2", "type": "WeakFloor", "initialSteps": 2 } ],
        "layout": ["E.", "Sw2#"]
    })");
    auto gs = makeSetting({file});
    auto worldExp = puzzle_rule::make_world(*gs);
    ASSERT_TRUE(worldExp.has_value()) << worldExp.error();
    World w = *worldExp;

    auto flash_cells = [&w](puzzle_rule::FlashKind kind) {
        std::vector<GridPos> cells;
        for (auto [e, flash] : w.registry->view<TileFlash>().each()) {
            (void)e;
            if (flash.kind == kind) cells.push_back(flash.cell);
        }
        return cells;
    };

    // 1 歩目: WeakFloor に乗って残り回数が変わる
    step(w, *gs, press({SDLK_w}), 0.0);
    step(w, *gs, press({SDLK_w}), 0.0);
    step(w, *gs, press({SDLK_RETURN}), 0.0);
    EXPECT_EQ(flash_cells(puzzle_rule::FlashKind::Changed), (std::vector<GridPos>{{1, 0}}));
    EXPECT_TRUE(flash_cells(puzzle_rule::FlashKind::Blocked).empty());

    // 2 歩目: 壁に阻まれる。1 歩目の強調表示は時間切れで消えている
    step(w, *gs, input::Input{}, kStepDelay);
    EXPECT_TRUE(flash_cells(puzzle_rule::FlashKind::Changed).empty());
    EXPECT_EQ(flash_cells(puzzle_rule::FlashKind::Blocked), (std::vector<GridPos>{{2, 0}}));

    step(w, *gs, input::Input{}, gs->tileFlashSec + 0.01);
    EXPECT_EQ(w.registry->view<TileFlash>().size(), 0u);
}
