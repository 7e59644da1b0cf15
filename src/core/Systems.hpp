#ifndef E5A29C41_0B7D_4F36_8C1E_93A4D6F2B805
#define E5A29C41_0B7D_4F36_8C1E_93A4D6F2B805

#include <cstddef>
#include <functional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "core/EnttWithStacktrace.hpp"

namespace ecs {

namespace detail {

// T が Allowed... に含まれるか
template <class T, class... Allowed>
inline constexpr bool allowed_v = (std::is_same_v<T, Allowed> || ...);

}  // namespace detail

/**
 * @brief System が返す遅延副作用
 *
 * System は const registry しか見ないので、書き込みはすべてこれに包んで返す。
 * ステージの実行後にまとめて適用される。
 */
struct Command {
    std::function<void(entt::registry&)> apply;
};

using CommandList = std::vector<Command>;

namespace cmd {

// 引数はここで値として確定させ、適用時に move する
template <class T, class... Args>
Command emplace_or_replace(entt::entity e, Args&&... args) {
    return Command{[e, values = std::tuple<std::decay_t<Args>...>{std::forward<Args>(args)...}](
                       entt::registry& r) mutable {
        std::apply([&](auto&... xs) { r.emplace_or_replace<T>(e, std::move(xs)...); }, values);
    }};
}

template <class T>
Command remove(entt::entity e) {
    return Command{[e](entt::registry& r) {
        if (r.valid(e)) r.remove<T>(e);
    }};
}

inline Command destroy(entt::entity e) {
    return Command{[e](entt::registry& r) {
        if (r.valid(e)) r.destroy(e);
    }};
}

// registry の外(セッションなど)への副作用
inline Command effect(std::function<void()> fn) {
    return Command{[fn = std::move(fn)](entt::registry&) { fn(); }};
}

}  // namespace cmd

// 宣言したコンポーネントだけを読めるビュー
template <class... Reads>
struct ReadOnlyView {
    const entt::registry& reg;

    // 付いていなければ nullptr
    template <class T>
    const T* try_get(entt::entity e) const {
        static_assert(detail::allowed_v<T, Reads...>, "component is not declared as readable");
        return reg.try_get<const T>(e);
    }

    // 空のタグ型にも使える
    template <class T>
    bool has(entt::entity e) const {
        static_assert(detail::allowed_v<T, Reads...>, "component is not declared as readable");
        return reg.all_of<T>(e);
    }

    template <class... Ts>
    auto view() const {
        static_assert((detail::allowed_v<Ts, Reads...> && ...),
                      "view contains a component that is not declared as readable");
        return reg.view<const Ts...>();
    }

    bool valid(entt::entity e) const { return reg.valid(e); }
};

// 宣言したコンポーネントだけを書き換えるコマンドを作る
template <class... Writes>
struct WriteCommands {
    template <class T, class... Args>
    Command emplace_or_replace(entt::entity e, Args&&... args) const {
        static_assert(detail::allowed_v<T, Writes...>, "component is not declared as writable");
        return cmd::emplace_or_replace<T>(e, std::forward<Args>(args)...);
    }

    template <class T>
    Command remove(entt::entity e) const {
        static_assert(detail::allowed_v<T, Writes...>, "component is not declared as writable");
        return cmd::remove<T>(e);
    }

    Command destroy(entt::entity e) const { return cmd::destroy(e); }

    Command effect(std::function<void()> fn) const { return cmd::effect(std::move(fn)); }
};

// ------------------------------
// ステージとパイプライン
// ------------------------------

// const registry + Resources -> CommandList
template <class Resources>
using PureSystem = std::function<CommandList(const entt::registry&, const Resources&)>;

/**
 * @brief パイプラインの 1 段
 * 前段のコマンドは適用済みの registry を見る
 */
template <class Resources>
struct Stage {
    std::string_view name;
    PureSystem<Resources> run;
};

template <class Resources>
using Pipeline = std::vector<Stage<Resources>>;

/**
 * System 関数をステージに包む
 *   func: CommandList(ReadOnlyView<Reads...>, WriteCommands<Writes...>, const Resources&)
 */
template <class Resources, class... Reads, class... Writes>
Stage<Resources> stage(std::string_view name,
                       CommandList (*func)(ReadOnlyView<Reads...>, WriteCommands<Writes...>,
                                           const Resources&)) {
    return Stage<Resources>{name, [func](const entt::registry& reg, const Resources& res) {
                                return func(ReadOnlyView<Reads...>{reg}, WriteCommands<Writes...>{},
                                            res);
                            }};
}

// 段ごとに System を走らせ、返ったコマンドをその場で適用する
// @return 適用したコマンド数
template <class Resources>
std::size_t run_pipeline(entt::registry& world, const Resources& res,
                         const Pipeline<Resources>& pipeline) {
    std::size_t applied = 0;
    for (const auto& st : pipeline) {
        CommandList commands = st.run(std::as_const(world), res);
        for (auto& c : commands) c.apply(world);
        applied += commands.size();
    }
    return applied;
}

}  // namespace ecs

#endif /* E5A29C41_0B7D_4F36_8C1E_93A4D6F2B805 */
