#ifndef D3F86A1E_27C4_4B90_9E5D_0A84C6B3F172
#define D3F86A1E_27C4_4B90_9E5D_0A84C6B3F172

#include <SDL2/SDL.h>
#include <SDL2/SDL_render.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <tl/expected.hpp>
#include <vector>

#include "core/EnttWithStacktrace.hpp"
#include "core/Input.hpp"
#include "core/SceneFramework.hpp"
#include "core/Systems.hpp"
#include "core/Text.hpp"
#include "userImpl/GameKey.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/puzzle/LevelParser.hpp"
#include "userImpl/puzzle/LevelSession.hpp"
#include "userImpl/puzzle/ProgramDraft.hpp"

namespace puzzle_rule {

// =============================
// エイリアス
// =============================
using ecs::CommandList;
using ecs::Pipeline;
using ecs::ReadOnlyView;
using ecs::WriteCommands;
using global_setting::GlobalSetting;
using grid_pos::Direction;
using grid_pos::GridPos;
using program::ProgramDraft;
using scene_fw::Env;
using tile::TileKind;

// =============================
// ECS コンポーネント
// =============================

// 実行要求(押下フレームのみ)
struct RunRequest {};
// 停止要求(押下フレームのみ)
struct HaltRequest {};
// リスタート要求(押下フレームのみ)
struct RestartRequest {};

enum class FlashKind : std::uint8_t { Changed, Blocked };

/**
 * @brief セルの強調表示(1 エンティティ 1 セル)
 * @param cell 盤面座標
 * @param sec 残り時間(秒)
 */
struct TileFlash {
    GridPos cell{};
    double sec{0.0};
    FlashKind kind{FlashKind::Changed};
};

/**
 * @brief セッションのシグナルを ECS へ流し込むリスナ
 *
 * 変化したタイルや、壁に阻まれた移動先を TileFlash として登録する。
 */
struct FeedbackListener {
    std::shared_ptr<entt::registry> registry;
    double flash_sec{0.35};

    void on_tile_changed(GridPos pos, const tile::Tile&) { spawn(pos, FlashKind::Changed); }
    void on_move_blocked(GridPos target) { spawn(target, FlashKind::Blocked); }

   private:
    void spawn(GridPos pos, FlashKind kind) {
        const auto e = registry->create();
        registry->emplace<TileFlash>(e, pos, flash_sec, kind);
    }
};

/**
 * @brief ワールドハンドル(シーンから利用)
 * @param registry ECS レジストリ
 * @param board_singleton 下書きや要求タグをぶら下げるエンティティ
 * @param listener シグナル購読者(session より先に宣言して後に破棄する)
 * @param session レベル列と盤面・インタプリタ
 */
struct World {
    std::shared_ptr<entt::registry> registry;
    entt::entity board_singleton{entt::null};
    std::shared_ptr<FeedbackListener> listener;
    std::shared_ptr<session::LevelSession> session;
};

/**
 * @brief 共通リソース
 * @param input 入力
 * @param env 環境情報
 * @param board_e シングルトンエンティティ
 * @param session 副作用コマンドの適用先
 */
struct PuzzleResources {
    const input::Input& input;
    const Env<GlobalSetting>& env;
    entt::entity board_e{entt::null};
    session::LevelSession* session{nullptr};
};

// =============================
// Systems(純粋版)
// =============================

/**
 * @brief 入力処理システム(純粋)
 * 下書きの編集はここで確定させ、実行/停止/リスタートは要求タグとして積む
 */
inline CommandList inputSystem_pure(ReadOnlyView<ProgramDraft> ro,
                                    WriteCommands<ProgramDraft, RunRequest, HaltRequest,
                                                  RestartRequest>
                                        wr,
                                    const PuzzleResources& res) {
    CommandList out;
    if (!ro.valid(res.board_e)) return out;
    const auto* current = ro.try_get<ProgramDraft>(res.board_e);
    if (!current) return out;

    using game_key::GameKey;
    const auto& in = res.input;

    ProgramDraft next = *current;
    bool edited = false;

    if (game_key::pressed(in, GameKey::FORWARD)) {
        program::draft::append_step(next, program::StepKind::MoveForward);
        edited = true;
    }
    if (game_key::pressed(in, GameKey::TURN_LEFT)) {
        program::draft::append_step(next, program::StepKind::TurnLeft);
        edited = true;
    }
    if (game_key::pressed(in, GameKey::TURN_RIGHT)) {
        program::draft::append_step(next, program::StepKind::TurnRight);
        edited = true;
    }
    if (const auto digit = game_key::pressed_digit(in)) {
        program::draft::set_repeat(next, *digit);
        edited = true;
    }
    if (game_key::pressed(in, GameKey::LOOP_OPEN)) {
        program::draft::open_loop(next);
        edited = true;
    }
    if (game_key::pressed(in, GameKey::LOOP_CLOSE)) {
        edited = program::draft::close_loop(next) || edited;
    }
    if (game_key::pressed(in, GameKey::ERASE)) {
        edited = program::draft::erase_last(next) || edited;
    }

    if (edited) {
        out.emplace_back(wr.emplace_or_replace<ProgramDraft>(res.board_e, std::move(next)));
    }

    if (game_key::pressed(in, GameKey::RUN)) {
        out.emplace_back(wr.emplace_or_replace<RunRequest>(res.board_e));
    }
    if (game_key::pressed(in, GameKey::HALT)) {
        out.emplace_back(wr.emplace_or_replace<HaltRequest>(res.board_e));
    }
    if (game_key::pressed(in, GameKey::RESTART)) {
        out.emplace_back(wr.emplace_or_replace<RestartRequest>(res.board_e));
    }
    return out;
}

/**
 * @brief 要求タグを解決してセッションへ反映するシステム(純粋)
 * 停止 → リスタート → 実行 の順に適用する
 */
inline CommandList runControlSystem_pure(
    ReadOnlyView<ProgramDraft, RunRequest, HaltRequest, RestartRequest> ro,
    WriteCommands<RunRequest, HaltRequest, RestartRequest> wr, const PuzzleResources& res) {
    CommandList out;
    if (!ro.valid(res.board_e) || res.session == nullptr) return out;
    session::LevelSession* const s = res.session;

    if (ro.has<HaltRequest>(res.board_e)) {
        out.emplace_back(wr.effect([s] { s->halt(); }));
        out.emplace_back(wr.remove<HaltRequest>(res.board_e));
    }

    if (ro.has<RestartRequest>(res.board_e)) {
        out.emplace_back(wr.effect([s] {
            if (const auto r = s->restart(); !r) {
                SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Restart failed: %s",
                             r.error().c_str());
            }
        }));
        out.emplace_back(wr.remove<RestartRequest>(res.board_e));
    }

    if (ro.has<RunRequest>(res.board_e)) {
        if (const auto* d = ro.try_get<ProgramDraft>(res.board_e)) {
            auto commands = program::draft::build(*d);
            if (commands.empty()) {
                SDL_Log("Nothing to run: the program is empty");
            } else {
                out.emplace_back(wr.effect([s, commands = std::move(commands)] {
                    if (!s->run(commands)) {
                        SDL_Log("Run request was not accepted");
                    }
                }));
            }
        }
        out.emplace_back(wr.remove<RunRequest>(res.board_e));
    }
    return out;
}

/**
 * @brief セッションの時間を進めるシステム
 * インタプリタの停止時間とレベル遷移の待ち時間はここでしか進まない
 */
inline CommandList sessionTickSystem_pure(ReadOnlyView<> /*ro*/, WriteCommands<> wr,
                                          const PuzzleResources& res) {
    CommandList out;
    if (res.session == nullptr) return out;
    session::LevelSession* const s = res.session;
    const double dt = res.env.dt;
    out.emplace_back(wr.effect([s, dt] { s->update(dt); }));
    return out;
}

/**
 * @brief レベルが変わったら下書きと強調表示を捨てるシステム(純粋)
 * 同じレベルのリスタートでは下書きを残す
 */
inline CommandList draftSyncSystem_pure(ReadOnlyView<ProgramDraft, TileFlash> ro,
                                        WriteCommands<ProgramDraft, TileFlash> wr,
                                        const PuzzleResources& res) {
    CommandList out;
    if (!ro.valid(res.board_e) || res.session == nullptr) return out;
    const auto* d = ro.try_get<ProgramDraft>(res.board_e);
    const std::size_t level = res.session->level_index();
    if (d && d->level_index == level) return out;

    ProgramDraft fresh{};
    fresh.level_index = level;
    fresh.next_repeat = res.env.setting.defaultLoopRepeat;
    out.emplace_back(wr.emplace_or_replace<ProgramDraft>(res.board_e, std::move(fresh)));

    for (auto e : ro.view<TileFlash>()) {
        out.emplace_back(wr.destroy(e));
    }
    return out;
}

// 強調表示の残り時間を減らし、切れたものを消す
inline CommandList flashDecaySystem_pure(ReadOnlyView<TileFlash> ro, WriteCommands<TileFlash> wr,
                                         const PuzzleResources& res) {
    CommandList out;
    auto v = ro.view<TileFlash>();
    for (auto e : v) {
        TileFlash next = v.template get<TileFlash>(e);
        next.sec -= res.env.dt;
        if (next.sec <= 0.0) {
            out.emplace_back(wr.destroy(e));
        } else {
            out.emplace_back(wr.emplace_or_replace<TileFlash>(e, next));
        }
    }
    return out;
}

// =============================
// 外部公開 API
// =============================

// レベルファイルをすべて読み込み、最初のレベルをロードしたワールドを作る
inline tl::expected<World, std::string> make_world(const GlobalSetting& cfg) {
    if (cfg.levelFiles.empty()) {
        return tl::make_unexpected("no level files are configured");
    }

    std::vector<level::LevelSource> levels;
    levels.reserve(cfg.levelFiles.size());
    for (const auto& path : cfg.levelFiles) {
        auto decoded = level::load_file(path);
        if (!decoded) {
            return tl::make_unexpected(decoded.error());
        }
        levels.push_back(std::move(decoded.value()));
    }

    World world{};
    world.registry = std::make_shared<entt::registry>();
    auto& registry = *world.registry;

    world.board_singleton = registry.create();
    ProgramDraft draft{};
    draft.next_repeat = cfg.defaultLoopRepeat;
    registry.emplace<ProgramDraft>(world.board_singleton, std::move(draft));

    world.listener =
        std::make_shared<FeedbackListener>(FeedbackListener{world.registry, cfg.tileFlashSec});
    world.session = std::make_shared<session::LevelSession>(std::move(levels), cfg.stepDelaySec,
                                                            cfg.transitionDelaySec);
    world.session->on_tile_changed().connect<&FeedbackListener::on_tile_changed>(*world.listener);
    world.session->on_move_blocked().connect<&FeedbackListener::on_move_blocked>(*world.listener);

    if (const auto loaded = world.session->load_level(0); !loaded) {
        return tl::make_unexpected("first level failed to load: " + loaded.error());
    }
    return world;
}

// フレーム内の実行順。強調表示の減衰はセッションの更新より前に行う
inline const Pipeline<PuzzleResources>& puzzle_pipeline() {
    static const Pipeline<PuzzleResources> pipeline{
        ecs::stage<PuzzleResources>("input", inputSystem_pure),
        ecs::stage<PuzzleResources>("run_control", runControlSystem_pure),
        ecs::stage<PuzzleResources>("flash_decay", flashDecaySystem_pure),
        ecs::stage<PuzzleResources>("session_tick", sessionTickSystem_pure),
        ecs::stage<PuzzleResources>("draft_sync", draftSyncSystem_pure),
    };
    return pipeline;
}

// 1フレーム更新
inline void step_world(const World& w, const Env<GlobalSetting>& env) {
    if (!w.registry || !w.session) return;
    auto& world = *w.registry;
    if (!world.valid(w.board_singleton)) return;

    PuzzleResources res{env.input, env, w.board_singleton, w.session.get()};
    ecs::run_pipeline(world, res, puzzle_pipeline());
}

inline bool is_all_cleared(const World& w) { return w.session && w.session->all_cleared(); }

inline session::Progress progress(const World& w) {
    return w.session ? w.session->progress() : session::Progress{};
}

// =============================
// 描画
// =============================

/**
 * @brief 盤面の画面配置
 * @param cell 1 セルの一辺(ピクセル)
 * @param origin_x 盤面左端
 * @param origin_y 盤面上端
 */
struct BoardLayout {
    int cell{};
    int origin_x{};
    int origin_y{};
    int rows{};

    // 盤面座標は y=0 が最下段なので上下を反転する
    [[nodiscard]] SDL_Rect rect(GridPos p) const noexcept {
        return SDL_Rect{origin_x + p.x * cell, origin_y + (rows - 1 - p.y) * cell, cell, cell};
    }
};

inline BoardLayout layout_for(const board::Board& b, const GlobalSetting& cfg) {
    const int area_w = cfg.canvasWidth;
    const int area_h = cfg.boardAreaHeight();
    int cell = cfg.cellSize;
    cell = std::min(cell, area_w / std::max(1, b.width()));
    cell = std::min(cell, area_h / std::max(1, b.height()));
    cell = std::max(cell, 4);

    BoardLayout l{};
    l.cell = cell;
    l.rows = b.height();
    l.origin_x = (area_w - cell * b.width()) / 2;
    l.origin_y = (area_h - cell * b.height()) / 2;
    return l;
}

inline SDL_Color tile_color(const tile::Tile& t) {
    switch (t.kind) {
        case TileKind::Floor:
            return {200, 200, 200, 255};
        case TileKind::Wall:
            return {70, 70, 80, 255};
        case TileKind::Start:
            return {160, 220, 160, 255};
        case TileKind::End:
            return {240, 200, 60, 255};
        case TileKind::Switch:
            return t.is_on ? SDL_Color{60, 200, 90, 255} : SDL_Color{200, 70, 70, 255};
        case TileKind::Bridge:
            return t.is_active ? SDL_Color{150, 105, 60, 255} : SDL_Color{150, 105, 60, 60};
        case TileKind::WeakFloor:
            return {215, 170, 120, 255};
        case TileKind::Air:
            break;
    }
    return {0, 0, 0, 0};
}

inline void render_board(const board::Board& b, const BoardLayout& l, SDL_Renderer* const renderer,
                         const GlobalSetting& cfg) {
    for (int x = 0; x < b.width(); ++x) {
        for (int y = 0; y < b.height(); ++y) {
            const auto t = b.tile_at(GridPos{x, y});
            if (!t || t->kind == TileKind::Air) continue;

            SDL_Rect rect = l.rect(t->position);
            const SDL_Color c = tile_color(*t);
            SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);
            SDL_RenderFillRect(renderer, &rect);

            // 枠線
            SDL_SetRenderDrawColor(renderer, 40, 40, 40, 255);
            SDL_RenderDrawRect(renderer, &rect);

            // WeakFloor は残り回数を表示
            if (t->kind == TileKind::WeakFloor) {
                text::render_text(renderer, cfg.get_font(), std::to_string(t->steps_remaining),
                                  rect.x + rect.w / 2, rect.y + rect.h / 2,
                                  SDL_Color{60, 40, 20, 255}, text::Anchor::Center);
            }
        }
    }
}

inline void render_flashes(const World& world, const BoardLayout& l, SDL_Renderer* const renderer,
                           const GlobalSetting& cfg) {
    auto& registry = *world.registry;
    const double span = cfg.tileFlashSec > 0.0 ? cfg.tileFlashSec : 1.0;
    for (auto [e, flash] : registry.view<TileFlash>().each()) {
        (void)e;
        const double ratio = std::clamp(flash.sec / span, 0.0, 1.0);
        const auto alpha = static_cast<Uint8>(180.0 * ratio);
        if (flash.kind == FlashKind::Blocked) {
            SDL_SetRenderDrawColor(renderer, 230, 40, 40, alpha);
        } else {
            SDL_SetRenderDrawColor(renderer, 255, 255, 120, alpha);
        }
        SDL_Rect rect = l.rect(flash.cell);
        SDL_RenderFillRect(renderer, &rect);
    }
}

inline void render_player(const interpreter::PlayerPose& pose, const BoardLayout& l,
                          SDL_Renderer* const renderer) {
    const SDL_Rect cell = l.rect(pose.position);
    const int inset = l.cell / 5;
    SDL_Rect body{cell.x + inset, cell.y + inset, cell.w - inset * 2, cell.h - inset * 2};
    SDL_SetRenderDrawColor(renderer, 50, 90, 220, 255);
    SDL_RenderFillRect(renderer, &body);

    // 向きの目印(画面上は y が逆向き)
    const GridPos v = grid_pos::unit_vector(pose.facing);
    const int marker = std::max(2, l.cell / 6);
    const int cx = cell.x + cell.w / 2 + v.x * (cell.w / 2 - inset - marker);
    const int cy = cell.y + cell.h / 2 - v.y * (cell.h / 2 - inset - marker);
    SDL_Rect eye{cx - marker / 2, cy - marker / 2, marker, marker};
    SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
    SDL_RenderFillRect(renderer, &eye);
}

// HUD の下書き行。開いたままのループは閉じたものとして歩数を数える
inline std::string program_line(const ProgramDraft& d) {
    std::string line = "Program: " + program::draft::to_string(d);
    if (!program::draft::empty(d)) {
        line += "   = " + std::to_string(program::count_steps(program::draft::build(d))) + " steps";
    }
    line += "   (next loop x" + std::to_string(d.next_repeat) + ")";
    return line;
}

inline void render_hud(const World& world, SDL_Renderer* const renderer, const GlobalSetting& cfg) {
    const auto& s = *world.session;
    TTF_Font* font = cfg.get_font();

    const int top = cfg.boardAreaHeight();
    SDL_Rect panel{0, top, cfg.canvasWidth, cfg.hudHeight};
    SDL_SetRenderDrawColor(renderer, 30, 30, 40, 255);
    SDL_RenderFillRect(renderer, &panel);

    const SDL_Color white{235, 235, 235, 255};
    const int line = std::max(12, cfg.hudHeight / 4);

    std::string status = "Level " + std::to_string(s.level_index() + 1) + "/" +
                         std::to_string(s.level_count());
    if (const auto* interp = s.interpreter()) {
        status += "   Steps " + std::to_string(interp->steps_taken());
        status += "   " + std::string(interpreter::to_string(interp->state()));
    }
    if (s.is_transitioning()) status += "   ...";
    text::render_text(renderer, font, status, 8, top + 4, white);

    if (const auto* d = world.registry->try_get<ProgramDraft>(world.board_singleton)) {
        text::render_text(renderer, font, program_line(*d), 8, top + 4 + line, white);
    }

    text::render_text(renderer, font,
                      "W/A/D step  [ ] loop  1-9 repeat  BS erase  ENTER run  ESC halt  R restart",
                      8, top + 4 + line * 2, SDL_Color{160, 160, 170, 255});
}

// 描画(副作用：直接描画)
inline void render_world(const World& world, SDL_Renderer* const renderer,
                         const Env<GlobalSetting>& env) {
    if (!world.registry || !world.session) return;
    const auto& cfg = env.setting;

    // 背景クリア(Air の色)
    SDL_SetRenderDrawColor(renderer, 18, 18, 28, 255);
    SDL_RenderClear(renderer);

    if (const auto* b = world.session->board()) {
        const BoardLayout l = layout_for(*b, cfg);
        render_board(*b, l, renderer, cfg);
        render_flashes(world, l, renderer, cfg);
        if (const auto* interp = world.session->interpreter()) {
            render_player(interp->pose(), l, renderer);
        }
    }

    render_hud(world, renderer, cfg);
    SDL_RenderPresent(renderer);
}

}  // namespace puzzle_rule

#endif /* D3F86A1E_27C4_4B90_9E5D_0A84C6B3F172 */
