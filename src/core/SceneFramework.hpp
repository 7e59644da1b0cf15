#ifndef A0F63B58_1D2E_4C7A_9B84_E6C5D3027F91
#define A0F63B58_1D2E_4C7A_9B84_E6C5D3027F91

#include <SDL2/SDL.h>

#include <concepts>
#include <memory>
#include <string>
#include <tl/expected.hpp>

#include "core/Input.hpp"

namespace scene_fw {

/**
 * @brief シーンに渡すフレーム環境
 * @param input このフレームの入力
 * @param setting 起動時に作った不変の設定
 * @param dt 経過秒(上限で切り詰め済み)
 */
template <class Setting>
struct Env {
    const input::Input& input;
    const Setting& setting;
    double dt;
};

// 初期シーンを作れる
template <class Impl, class Setting>
concept MakesInitialScene = requires(std::shared_ptr<const Setting> setting) {
    {
        Impl::make_initial(setting)
    } -> std::same_as<tl::expected<typename Impl::Scene, std::string>>;
};

// 値としてシーンを受け取り、次のシーンを返す
template <class Impl, class Setting>
concept StepsScene = requires(typename Impl::Scene s, const Env<Setting>& env) {
    { Impl::step(std::move(s), env) } -> std::same_as<typename Impl::Scene>;
};

template <class Impl, class Setting>
concept DrawsScene =
    requires(const typename Impl::Scene& s, SDL_Renderer* const r, const Env<Setting>& env) {
        { Impl::draw(s, r, env) } -> std::same_as<void>;
    };

// Game が要求するシーン実装
template <class Impl, class Setting>
concept SceneAPI = std::movable<typename Impl::Scene> && MakesInitialScene<Impl, Setting> &&
                   StepsScene<Impl, Setting> && DrawsScene<Impl, Setting>;

}  // namespace scene_fw

#endif /* A0F63B58_1D2E_4C7A_9B84_E6C5D3027F91 */
