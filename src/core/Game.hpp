#ifndef F19E7A36_C4B2_4D08_8E5F_A3D7B61C0E24
#define F19E7A36_C4B2_4D08_8E5F_A3D7B61C0E24

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <tl/expected.hpp>
#include <utility>

#include "core/Input.hpp"
#include "core/SceneFramework.hpp"

namespace app {

// =============================
// SDL の寿命管理
// =============================

/**
 * @brief SDL 本体と SDL_ttf の初期化を握るハンドル
 * 破棄時に逆順で終了する。プロセス中に 1 つだけ作る。
 */
class SdlContext {
   public:
    static tl::expected<std::unique_ptr<SdlContext>, std::string> open() {
        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
            return tl::make_unexpected(std::string{"SDL_Init failed: "} + SDL_GetError());
        }
        if (TTF_WasInit() == 0 && TTF_Init() == -1) {
            std::string reason = std::string{"TTF_Init failed: "} + TTF_GetError();
            SDL_Quit();
            return tl::make_unexpected(std::move(reason));
        }
        return std::unique_ptr<SdlContext>(new SdlContext());
    }

    ~SdlContext() {
        if (TTF_WasInit() != 0) TTF_Quit();
        SDL_Quit();
    }

    SdlContext(const SdlContext&) = delete;
    SdlContext& operator=(const SdlContext&) = delete;

   private:
    SdlContext() = default;
};

struct WindowDeleter {
    void operator()(SDL_Window* w) const noexcept {
        if (w) SDL_DestroyWindow(w);
    }
};
struct RendererDeleter {
    void operator()(SDL_Renderer* r) const noexcept {
        if (r) SDL_DestroyRenderer(r);
    }
};

/**
 * @brief ウィンドウとレンダラの組
 * renderer は window より先に破棄する(メンバの宣言順)
 */
struct Display {
    std::unique_ptr<SDL_Window, WindowDeleter> window;
    std::unique_ptr<SDL_Renderer, RendererDeleter> renderer;

    static tl::expected<Display, std::string> open(const std::string& title, int width,
                                                   int height) {
        Display d;
        d.window.reset(SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED,
                                        SDL_WINDOWPOS_CENTERED, width, height, SDL_WINDOW_SHOWN));
        if (!d.window) {
            return tl::make_unexpected(std::string{"SDL_CreateWindow failed: "} + SDL_GetError());
        }
        d.renderer.reset(SDL_CreateRenderer(d.window.get(), -1, SDL_RENDERER_ACCELERATED));
        if (!d.renderer) {
            return tl::make_unexpected(std::string{"SDL_CreateRenderer failed: "} +
                                       SDL_GetError());
        }
        // 強調表示は半透明で重ねる
        SDL_SetRenderDrawBlendMode(d.renderer.get(), SDL_BLENDMODE_BLEND);
        return d;
    }
};

// =============================
// フレーム統計
// =============================

// 一定間隔ごとに平均フレーム時間をログへ出す
struct FrameStats {
    double report_interval_sec{10.0};
    double elapsed_sec{0.0};
    std::uint32_t frames{0};

    void record(double frame_sec) {
        elapsed_sec += frame_sec;
        ++frames;
        if (elapsed_sec < report_interval_sec) return;

        const double avg_ms = frames > 0 ? elapsed_sec * 1000.0 / frames : 0.0;
        SDL_Log("FPS: %.2f  (%.2f ms/frame)", frames / elapsed_sec, avg_ms);
        elapsed_sec = 0.0;
        frames = 0;
    }
};

// =============================
// Game 本体
// =============================

/**
 * @brief 入力ポーリング → シーン更新 → 描画 を回すだけのホスト
 *
 * ゲームのロジックはすべて SceneImpl に委譲する(制御の反転)。
 * SDL の初期化に失敗した場合は create() がエラーを返す。
 */
template <class Setting, class SceneImpl>
    requires scene_fw::SceneAPI<SceneImpl, Setting>
class Game final {
   public:
    // window / renderer ができた後に Setting を作る(フォントなど SDL 依存の資源を含むため)
    using SettingFactory =
        std::function<std::shared_ptr<const Setting>(SDL_Window*, SDL_Renderer*)>;

    // これより長いフレームは切り詰める(ウィンドウ移動などで止まった後の dt)
    static constexpr double kMaxFrameSec = 0.25;

    static tl::expected<std::unique_ptr<Game>, std::string> create(
        const SettingFactory& make_setting, const std::string& title, int width, int height) {
        auto sdl = SdlContext::open();
        if (!sdl) return tl::make_unexpected(sdl.error());

        auto display = Display::open(title, width, height);
        if (!display) return tl::make_unexpected(display.error());

        auto setting = make_setting(display->window.get(), display->renderer.get());
        if (!setting) return tl::make_unexpected(std::string{"setting factory returned null"});

        auto scene = SceneImpl::make_initial(setting);
        if (!scene) return tl::make_unexpected("initial scene: " + scene.error());

        return std::unique_ptr<Game>(new Game(std::move(sdl.value()), std::move(display.value()),
                                              std::move(setting), std::move(scene.value())));
    }

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    [[nodiscard]] bool running() const noexcept { return running_; }

    void tick(double frame_sec) {
        poll_input();

        const scene_fw::Env<Setting> env{*input_, *setting_,
                                         std::clamp(frame_sec, 0.0, kMaxFrameSec)};
        scene_ = SceneImpl::step(std::move(scene_), env);
        SceneImpl::draw(scene_, display_.renderer.get(), env);

        stats_.record(frame_sec);
    }

   private:
    Game(std::unique_ptr<SdlContext> sdl, Display display, std::shared_ptr<const Setting> setting,
         typename SceneImpl::Scene scene)
        : sdl_(std::move(sdl)),
          display_(std::move(display)),
          setting_(std::move(setting)),
          scene_(std::move(scene)),
          input_(std::make_shared<const input::Input>()) {}

    // イベントを読むのはここだけ。q とウィンドウのクローズで終了
    void poll_input() {
        bool quit = false;
        input_ = input::poll(input_, quit);
        if (quit || input_->pressed(SDLK_q)) running_ = false;
    }

    // 破棄は宣言の逆順: シーン → Setting(フォント) → Display → SDL/TTF
    std::unique_ptr<SdlContext> sdl_;
    Display display_;
    std::shared_ptr<const Setting> setting_;
    typename SceneImpl::Scene scene_;
    std::shared_ptr<const input::Input> input_;
    FrameStats stats_{};
    bool running_{true};
};

/**
 * main から呼ぶ入口
 * fps を上限にフレームを回し、終了時に 0、初期化に失敗したら 1 を返す。
 */
template <class Setting, class SceneImpl>
    requires scene_fw::SceneAPI<SceneImpl, Setting>
int run_game(typename Game<Setting, SceneImpl>::SettingFactory make_setting,
             const std::string& title, int width, int height, int fps) {
    auto game = Game<Setting, SceneImpl>::create(make_setting, title, width, height);
    if (!game) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "Startup failed: %s", game.error().c_str());
        return 1;
    }

    const Uint32 budget_ms = fps > 0 ? static_cast<Uint32>(1000 / fps) : 0;
    Uint32 last = SDL_GetTicks();
    while ((*game)->running()) {
        const Uint32 now = SDL_GetTicks();
        (*game)->tick((now - last) / 1000.0);
        last = now;

        // VSync が効かない環境向けに残り時間だけ眠る
        const Uint32 spent = SDL_GetTicks() - now;
        if (spent < budget_ms) SDL_Delay(budget_ms - spent);
    }
    return 0;
}

}  // namespace app

#endif /* F19E7A36_C4B2_4D08_8E5F_A3D7B61C0E24 */
