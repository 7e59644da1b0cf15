#include <SDL2/SDL.h>  // SDL_Window, SDL_Renderer の型が必要
#include <SDL2/SDL_ttf.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/Game.hpp"
#include "userImpl/GlobalSetting.hpp"
#include "userImpl/scenes/MyScenes.hpp"

int main(int argc, char* argv[]) {
    using Setting = global_setting::GlobalSetting;
    using Impl = my_scenes::Impl;

    // ウィンドウサイズはここで決める
    constexpr int cell_size = 56;
    constexpr int hud_height = 120;
    constexpr int canvas_width = 800;
    constexpr int canvas_height = 600;
    constexpr int fps = 60;
    constexpr double step_delay_sec = 0.5;
    constexpr double transition_delay_sec = 0.6;
    constexpr int font_size = 20;

    // 引数でレベルファイルを指定できる(省略時は同梱のレベル)
    std::vector<std::string> level_files;
    for (int i = 1; i < argc; ++i) {
        level_files.emplace_back(argv[i]);
    }
    if (level_files.empty()) {
        level_files = {"assets/levels/level1.json", "assets/levels/level2.json",
                       "assets/levels/level3.json", "assets/levels/level4.json"};
    }

    // SDL 初期化 / window / renderer 生成後に呼ばれる Setting のファクトリ
    const auto factory = [=](SDL_Window* window,
                             SDL_Renderer* renderer) -> std::shared_ptr<const Setting> {
        (void)window;
        (void)renderer;

        // フォントがなくても遊べる(文字が出ないだけ)
        global_setting::FontPtr font{
            TTF_OpenFont("assets/Noto_Sans_JP/static/NotoSansJP-Regular.ttf", font_size),
            global_setting::TtfFontDeleter{}};
        if (!font) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to load font: %s", TTF_GetError());
        }

        auto s = std::make_shared<Setting>(canvas_width, canvas_height, cell_size, hud_height, fps,
                                           step_delay_sec, transition_delay_sec, level_files,
                                           std::move(font));

        // const 共有ポインタとして返す
        return std::shared_ptr<const Setting>(std::move(s));
    };

    // ユーザーは Impl 型を渡すだけ
    return app::run_game<Setting, Impl>(factory, "Robo Path", canvas_width, canvas_height, fps);
}
