#ifndef D74C2E19_A80B_4F5D_B3E6_1C9F48A2D750
#define D74C2E19_A80B_4F5D_B3E6_1C9F48A2D750

#include <SDL2/SDL.h>

#include <memory>
#include <optional>
#include <unordered_map>

namespace input {

/**
 * 1 キー分の状態
 * - is_pressed / is_released はそのフレームだけ立つエッジ
 * - is_held は押されている間ずっと立つ
 */
struct InputState {
    bool is_pressed = false;
    bool is_released = false;
    bool is_held = false;
};

/**
 * 1 フレーム分の入力(SDL_Keycode 単位)
 * 抽象キーへの対応付けは game_key 側で行う。
 */
struct Input {
    std::unordered_map<SDL_Keycode, InputState> key_states;

    [[nodiscard]] bool pressed(SDL_Keycode k) const { return find(k).is_pressed; }
    [[nodiscard]] bool released(SDL_Keycode k) const { return find(k).is_released; }
    [[nodiscard]] bool held(SDL_Keycode k) const { return find(k).is_held; }

    // [begin, end) の並び順で、最初に押下されたキー
    template <typename It>
    [[nodiscard]] std::optional<SDL_Keycode> first_pressed(It begin, It end) const {
        for (; begin != end; ++begin) {
            if (pressed(*begin)) return *begin;
        }
        return std::nullopt;
    }

   private:
    const InputState& find(SDL_Keycode k) const {
        static const InputState kNone{};
        const auto it = key_states.find(k);
        return it != key_states.end() ? it->second : kNone;
    }
};

// 前フレームの保持状態だけを引き継ぎ、エッジを落とす
inline Input carry_over(const Input& previous) {
    Input next = previous;
    for (auto& [_, state] : next.key_states) {
        state.is_pressed = false;
        state.is_released = false;
    }
    return next;
}

/**
 * キーの上下を 1 つ反映する
 * キーリピートによる連続 KEYDOWN は押下エッジにしない
 */
inline void apply_key(Input& in, SDL_Keycode code, bool down) {
    InputState& state = in.key_states[code];
    if (down) {
        if (!state.is_held) state.is_pressed = true;
        state.is_held = true;
    } else if (state.is_held) {
        state.is_held = false;
        state.is_released = true;
    }
}

/**
 * SDL のイベントキューを吸い出して次フレームの入力を作る
 * @param previous 直前フレームの入力(null なら空から始める)
 * @param quit_requested SDL_QUIT を受け取ったら true
 */
inline std::shared_ptr<const Input> poll(const std::shared_ptr<const Input>& previous,
                                         bool& quit_requested) {
    auto next = std::make_shared<Input>(previous ? carry_over(*previous) : Input{});

    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_QUIT:
                quit_requested = true;
                break;
            case SDL_KEYDOWN:
            case SDL_KEYUP:
                apply_key(*next, event.key.keysym.sym, event.type == SDL_KEYDOWN);
                break;
            default:
                break;
        }
    }
    return next;
}

}  // namespace input

#endif /* D74C2E19_A80B_4F5D_B3E6_1C9F48A2D750 */
