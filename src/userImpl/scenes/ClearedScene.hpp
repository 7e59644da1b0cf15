#ifndef E6D18A3F_C25B_4E07_91A4_8B3F0E6C7D52
#define E6D18A3F_C25B_4E07_91A4_8B3F0E6C7D52

#include <SDL2/SDL.h>

#include <string>

#include "core/SceneFramework.hpp"
#include "core/Text.hpp"
#include "userImpl/GameKey.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/scenes/MyScenesCore.hpp"

namespace my_scenes {

using scene_fw::Env;

// ENTER でタイトルへ戻る
inline Scene update(const ClearedSceneData& s, const Env<global_setting::GlobalSetting>& env) {
    if (game_key::pressed(env.input, game_key::GameKey::RUN)) {
        return Scene{TitleSceneData{}};
    }
    return Scene{s};
}

// クリア画面の描画
inline void render(const ClearedSceneData& s, SDL_Renderer* const renderer,
                   const Env<global_setting::GlobalSetting>& env) {
    SDL_SetRenderDrawColor(renderer, 20, 60, 35, 255);
    SDL_RenderClear(renderer);

    const auto& setting = env.setting;
    const int cx = setting.canvasWidth / 2;
    const int cy = setting.canvasHeight / 2;
    TTF_Font* font = setting.get_font();
    const SDL_Color white{255, 255, 255, 255};

    text::render_text(renderer, font, "All levels cleared!", cx, cy - 40, white,
                      text::Anchor::Center);
    text::render_text(renderer, font,
                      "Levels " + std::to_string(s.progress.levels_passed) + "   Total steps " +
                          std::to_string(s.progress.total_steps),
                      cx, cy + 5, white, text::Anchor::Center);
    text::render_text(renderer, font, "Press ENTER to return to title", cx, cy + 50,
                      SDL_Color{200, 220, 200, 255}, text::Anchor::Center);

    SDL_RenderPresent(renderer);
}

}  // namespace my_scenes

#endif /* E6D18A3F_C25B_4E07_91A4_8B3F0E6C7D52 */
