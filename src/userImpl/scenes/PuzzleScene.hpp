#ifndef C93B5E47_0A2D_4C81_A6F4_37E1D8B0C25A
#define C93B5E47_0A2D_4C81_A6F4_37E1D8B0C25A

#include <SDL2/SDL.h>

#include <utility>

#include "core/SceneFramework.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/puzzle/PuzzleRule.hpp"
#include "userImpl/scenes/MyScenesCore.hpp"

namespace my_scenes {

using scene_fw::Env;

// 更新
inline Scene update(const PuzzleSceneData& s, const Env<global_setting::GlobalSetting>& env) {
    PuzzleSceneData u = s;
    puzzle_rule::step_world(u.world, env);
    if (puzzle_rule::is_all_cleared(u.world)) {
        return Scene{ClearedSceneData{puzzle_rule::progress(u.world)}};
    }
    return Scene{std::move(u)};
}

// 描画
inline void render(const PuzzleSceneData& s, SDL_Renderer* const renderer,
                   const Env<global_setting::GlobalSetting>& env) {
    puzzle_rule::render_world(s.world, renderer, env);
}

}  // namespace my_scenes

#endif /* C93B5E47_0A2D_4C81_A6F4_37E1D8B0C25A */
