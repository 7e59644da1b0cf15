#ifndef E0B47C93_6A2F_4D85_B1E3_75C9A08D2F16
#define E0B47C93_6A2F_4D85_B1E3_75C9A08D2F16

#include <SDL2/SDL_keycode.h>

#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace game_key {

enum class GameKey {
    FORWARD,
    TURN_LEFT,
    TURN_RIGHT,
    LOOP_OPEN,
    LOOP_CLOSE,
    ERASE,
    RUN,
    HALT,
    RESTART,
};

// SDL_Keycode ⇄ GameKey の対応を1か所に定義
inline const std::vector<std::pair<SDL_Keycode, GameKey>> KEY_MAP = {
    {SDLK_w, GameKey::FORWARD},          {SDLK_UP, GameKey::FORWARD},
    {SDLK_a, GameKey::TURN_LEFT},        {SDLK_LEFT, GameKey::TURN_LEFT},
    {SDLK_d, GameKey::TURN_RIGHT},       {SDLK_RIGHT, GameKey::TURN_RIGHT},
    {SDLK_LEFTBRACKET, GameKey::LOOP_OPEN}, {SDLK_RIGHTBRACKET, GameKey::LOOP_CLOSE},
    {SDLK_BACKSPACE, GameKey::ERASE},    {SDLK_RETURN, GameKey::RUN},
    {SDLK_ESCAPE, GameKey::HALT},        {SDLK_r, GameKey::RESTART}};

// ループ回数を選ぶ数字キー(添字 + 1 が回数)
inline constexpr std::array<SDL_Keycode, 9> DIGIT_KEYS = {
    SDLK_1, SDLK_2, SDLK_3, SDLK_4, SDLK_5, SDLK_6, SDLK_7, SDLK_8, SDLK_9};

// 逆方向: GameKey → SDL_Keycode(同じ GameKey に複数あればすべて)
inline std::vector<SDL_Keycode> to_sdl_keys(GameKey game_key) {
    std::vector<SDL_Keycode> out;
    for (const auto& [sdl, key] : KEY_MAP) {
        if (key == game_key) out.push_back(sdl);
    }
    return out;
}

// 押下された数字キーを 1..9 で返す
template <class InputT>
std::optional<int> pressed_digit(const InputT& in) {
    const auto hit = in.first_pressed(DIGIT_KEYS.begin(), DIGIT_KEYS.end());
    if (!hit) return std::nullopt;
    for (std::size_t i = 0; i < DIGIT_KEYS.size(); ++i) {
        if (DIGIT_KEYS[i] == *hit) return static_cast<int>(i) + 1;
    }
    return std::nullopt;
}

// いずれかの割り当てキーが押された瞬間か
template <class InputT>
bool pressed(const InputT& in, GameKey game_key) {
    for (const auto k : to_sdl_keys(game_key)) {
        if (in.pressed(k)) return true;
    }
    return false;
}

}  // namespace game_key

#endif /* E0B47C93_6A2F_4D85_B1E3_75C9A08D2F16 */
