#ifndef B05E7D92_4F1A_4A68_C3E0_D27A96B18F4C
#define B05E7D92_4F1A_4A68_C3E0_D27A96B18F4C

#include <SDL2/SDL.h>

#include <memory>
#include <string>
#include <tl/expected.hpp>
#include <variant>

#include "core/SceneFramework.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/scenes/ClearedScene.hpp"
#include "userImpl/scenes/MyScenesCore.hpp"
#include "userImpl/scenes/PuzzleScene.hpp"
#include "userImpl/scenes/TitleScene.hpp"

namespace my_scenes {

using scene_fw::Env;

// フレームワーク連携
struct Impl {
    using Scene = my_scenes::Scene;

    static tl::expected<Scene, std::string> make_initial(
        const std::shared_ptr<const global_setting::GlobalSetting>& gs) {
        return my_scenes::make_initial(gs);
    }

    static Scene step(Scene current, const Env<global_setting::GlobalSetting>& env) {
        return std::visit([&](auto const& ss) -> Scene { return update(ss, env); }, current);
    }

    static void draw(const Scene& current, SDL_Renderer* const r,
                     const Env<global_setting::GlobalSetting>& env) {
        std::visit([&](auto const& ss) { render(ss, r, env); }, current);
    }
};

}  // namespace my_scenes

#endif /* B05E7D92_4F1A_4A68_C3E0_D27A96B18F4C */
