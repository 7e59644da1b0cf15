#ifndef B8D41F07_62A3_4C9E_A5B0_7E19C3D8F264
#define B8D41F07_62A3_4C9E_A5B0_7E19C3D8F264

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <memory>
#include <string>

using SurfacePtr = std::unique_ptr<SDL_Surface, decltype(&SDL_FreeSurface)>;
using TexturePtr = std::unique_ptr<SDL_Texture, decltype(&SDL_DestroyTexture)>;

namespace text {

// 文字列の配置基準
enum class Anchor { TopLeft, Center };

/**
 * UTF-8 文字列を 1 行描画します
 * @param renderer 描画先
 * @param font SDL_ttf フォント(null なら何もしない)
 * @param utf8 描画する文字列
 * @param x 基準 X 座標(ピクセル)
 * @param y 基準 Y 座標(ピクセル)
 * @param color 文字色
 * @param anchor (x, y) を左上とみなすか中心とみなすか
 * @return 描画した場合は true
 */
inline bool render_text(SDL_Renderer* const renderer, TTF_Font* font, const std::string& utf8,
                        int x, int y, SDL_Color color, Anchor anchor = Anchor::TopLeft) {
    if (!font || utf8.empty()) return false;

    SurfacePtr surface(TTF_RenderUTF8_Blended(font, utf8.c_str(), color), SDL_FreeSurface);
    if (!surface) return false;

    TexturePtr texture(SDL_CreateTextureFromSurface(renderer, surface.get()), SDL_DestroyTexture);
    if (!texture) return false;

    int tex_w = 0;
    int tex_h = 0;
    SDL_QueryTexture(texture.get(), nullptr, nullptr, &tex_w, &tex_h);

    SDL_Rect dst{
        .x = anchor == Anchor::Center ? x - tex_w / 2 : x,
        .y = anchor == Anchor::Center ? y - tex_h / 2 : y,
        .w = tex_w,
        .h = tex_h,
    };
    SDL_RenderCopy(renderer, texture.get(), nullptr, &dst);
    return true;
}

}  // namespace text

#endif /* B8D41F07_62A3_4C9E_A5B0_7E19C3D8F264 */
