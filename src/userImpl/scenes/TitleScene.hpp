#ifndef A2C7E918_5B04_4F6D_8D13_E94B0F27C685
#define A2C7E918_5B04_4F6D_8D13_E94B0F27C685

#include <SDL2/SDL.h>

#include <memory>
#include <string>
#include <tl/expected.hpp>

#include "core/SceneFramework.hpp"
#include "core/Text.hpp"
#include "userImpl/GameKey.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/puzzle/PuzzleRule.hpp"
#include "userImpl/scenes/MyScenesCore.hpp"

namespace my_scenes {

using scene_fw::Env;

// 初期シーン生成
inline tl::expected<Scene, std::string> make_initial(
    const std::shared_ptr<const global_setting::GlobalSetting>& gs) {
    if (!gs) {
        return tl::make_unexpected("setting is null");
    }
    return Scene{TitleSceneData{}};
}

// ENTER でレベル 1 から開始
inline Scene update(const TitleSceneData& s, const Env<global_setting::GlobalSetting>& env) {
    if (!game_key::pressed(env.input, game_key::GameKey::RUN)) {
        return Scene{s};
    }

    auto world = puzzle_rule::make_world(env.setting);
    if (!world) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "world initialization failed: %s",
                     world.error().c_str());
        return Scene{TitleSceneData{world.error()}};
    }
    return Scene{PuzzleSceneData{std::move(world.value())}};
}

inline void render(const TitleSceneData& s, SDL_Renderer* const renderer,
                   const Env<global_setting::GlobalSetting>& env) {
    SDL_SetRenderDrawColor(renderer, 18, 18, 28, 255);
    SDL_RenderClear(renderer);

    const auto& setting = env.setting;
    const int cx = setting.canvasWidth / 2;
    const int cy = setting.canvasHeight / 2;
    TTF_Font* font = setting.get_font();

    text::render_text(renderer, font, "ROBO PATH", cx, cy - 40, SDL_Color{240, 200, 60, 255},
                      text::Anchor::Center);
    text::render_text(renderer, font, "Press ENTER to start", cx, cy + 10,
                      SDL_Color{235, 235, 235, 255}, text::Anchor::Center);
    if (!s.last_error.empty()) {
        text::render_text(renderer, font, s.last_error, cx, cy + 60, SDL_Color{230, 80, 80, 255},
                          text::Anchor::Center);
    }

    SDL_RenderPresent(renderer);
}

}  // namespace my_scenes

#endif /* A2C7E918_5B04_4F6D_8D13_E94B0F27C685 */
