#ifndef D0A36E85_B14F_4C29_97E1_3F8C5B20A6D9
#define D0A36E85_B14F_4C29_97E1_3F8C5B20A6D9

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace program {

// 1 ステップで実行される動作
enum class StepKind { MoveForward, TurnLeft, TurnRight };

constexpr std::string_view to_string(StepKind k) noexcept {
    switch (k) {
        case StepKind::MoveForward:
            return "F";
        case StepKind::TurnLeft:
            return "L";
        case StepKind::TurnRight:
            return "R";
    }
    return "?";
}

/**
 * @brief プログラム木のノード(Step か Loop)
 *
 * 生成後は不変。Loop の repeat_count は生成時に 1 以上へ丸める
 * (0 以下を指定しても子リストは 1 回実行される)。
 * 入れ子の深さに制限はない。
 */
class Command {
   public:
    static Command step(StepKind kind) { return Command{kind}; }

    static Command loop(int repeat_count, std::vector<Command> children) {
        return Command{Loop{std::max(1, repeat_count), std::move(children)}};
    }

    [[nodiscard]] bool is_loop() const noexcept { return std::holds_alternative<Loop>(node_); }

    // is_loop() == false のときのみ
    [[nodiscard]] StepKind step_kind() const { return std::get<StepKind>(node_); }

    // is_loop() == true のときのみ
    [[nodiscard]] int repeat_count() const { return std::get<Loop>(node_).repeat_count; }
    [[nodiscard]] const std::vector<Command>& children() const {
        return std::get<Loop>(node_).children;
    }

   private:
    struct Loop {
        int repeat_count;
        std::vector<Command> children;
    };

    explicit Command(StepKind kind) : node_(kind) {}
    explicit Command(Loop loop) : node_(std::move(loop)) {}

    std::variant<StepKind, Loop> node_;
};

using Program = std::vector<Command>;

// 失敗せずに最後まで走った場合のステップ数
inline std::int64_t count_steps(const Program& commands) {
    std::int64_t total = 0;
    for (const auto& c : commands) {
        if (c.is_loop()) {
            total += static_cast<std::int64_t>(c.repeat_count()) * count_steps(c.children());
        } else {
            ++total;
        }
    }
    return total;
}

// 表示用: "F L [x3 F R]"
inline std::string to_string(const Program& commands) {
    std::string out;
    for (const auto& c : commands) {
        if (!out.empty()) out += ' ';
        if (c.is_loop()) {
            out += "[x" + std::to_string(c.repeat_count());
            const std::string body = to_string(c.children());
            if (!body.empty()) out += " " + body;
            out += "]";
        } else {
            out += to_string(c.step_kind());
        }
    }
    return out;
}

}  // namespace program

#endif /* D0A36E85_B14F_4C29_97E1_3F8C5B20A6D9 */
