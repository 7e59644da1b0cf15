#ifndef C85F2A07_E3D4_4B19_A6C8_9D01B74E3F52
#define C85F2A07_E3D4_4B19_A6C8_9D01B74E3F52

#include <SDL2/SDL_ttf.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace global_setting {

struct TtfFontDeleter {
    void operator()(TTF_Font* font) const noexcept {
        if (font) {
            TTF_CloseFont(font);
        }
    }
};

// SDL_ttf フォントを参照カウント付きで共有する
using FontPtr = std::shared_ptr<TTF_Font>;

struct GlobalSetting {
    const int canvasWidth;                // キャンバス幅(ピクセル)
    const int canvasHeight;               // キャンバス高さ(ピクセル)
    const int cellSize;                   // 盤面 1 セルの一辺(ピクセル)
    const int hudHeight;                  // 下部 HUD 領域の高さ(ピクセル)
    const int frameRate;                  // フレームレート(FPS)
    const double stepDelaySec;            // コマンド 1 ステップごとの停止時間(秒)
    const double transitionDelaySec;      // 失敗/クリア後にレベルを差し替えるまでの時間(秒)
    const std::vector<std::string> levelFiles;  // レベル JSON のパス(先頭から順に遊ぶ)
    const double tileFlashSec = 0.35;     // 状態が変わったタイルの強調表示時間(秒)
    const int defaultLoopRepeat = 2;      // 数字キー未指定時のループ回数

    // フォントキャッシュ(null 可)
    FontPtr font;

    GlobalSetting(int canvas_w, int canvas_h, int cell_size, int hud_h, int fps,
                  double step_delay_sec, double transition_delay_sec,
                  std::vector<std::string> level_files, FontPtr font_)
        : canvasWidth(canvas_w),
          canvasHeight(canvas_h),
          cellSize(cell_size),
          hudHeight(hud_h),
          frameRate(fps),
          stepDelaySec(step_delay_sec),
          transitionDelaySec(transition_delay_sec),
          levelFiles(std::move(level_files)),
          font(std::move(font_)) {}

    // 盤面を描ける領域の高さ
    [[nodiscard]] int boardAreaHeight() const noexcept { return canvasHeight - hudHeight; }

    TTF_Font* get_font() const noexcept { return font.get(); }
};

}  // namespace global_setting

#endif /* C85F2A07_E3D4_4B19_A6C8_9D01B74E3F52 */
