#ifndef B17F4D2C_93E8_4A05_8C6B_2E0A5D91F374
#define B17F4D2C_93E8_4A05_8C6B_2E0A5D91F374

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "userImpl/puzzle/Program.hpp"

namespace program {

/**
 * @brief 編集中でまだ閉じていないループ
 * @param repeat 周回数(数字キーで変更できる)
 * @param body 入力済みの子コマンド
 */
struct OpenLoop {
    int repeat{1};
    Program body;
};

/**
 * @brief キー入力で組み立て中のプログラム
 *
 * 閉じたループは Command として top か親ループの body に入る。
 * open の末尾が最も内側のループ。
 */
struct ProgramDraft {
    Program top;
    std::vector<OpenLoop> open;
    int next_repeat{2};              // 次に開くループの周回数
    std::size_t level_index{0};      // どのレベル用の下書きか
};

namespace draft {

// 追記先(最内の開いたループか top)
inline Program& insertion_point(ProgramDraft& d) {
    return d.open.empty() ? d.top : d.open.back().body;
}

inline void append_step(ProgramDraft& d, StepKind kind) {
    insertion_point(d).push_back(Command::step(kind));
}

inline void open_loop(ProgramDraft& d) { d.open.push_back(OpenLoop{d.next_repeat, {}}); }

/**
 * 最内のループを閉じて親へ追加する
 * 中身が空のループは追加せずに捨てる。
 * @return 開いたループがなければ false
 */
inline bool close_loop(ProgramDraft& d) {
    if (d.open.empty()) return false;
    OpenLoop loop = std::move(d.open.back());
    d.open.pop_back();
    if (!loop.body.empty()) {
        insertion_point(d).push_back(Command::loop(loop.repeat, std::move(loop.body)));
    }
    return true;
}

// ループが開いていればその周回数、なければ次に開くループの周回数を変える
inline void set_repeat(ProgramDraft& d, int repeat) {
    if (d.open.empty()) {
        d.next_repeat = repeat;
    } else {
        d.open.back().repeat = repeat;
    }
}

/**
 * 最後に入力したものを 1 つ消す
 * 最内ループが空ならループそのものを消す。
 * @return 消すものがなければ false
 */
inline bool erase_last(ProgramDraft& d) {
    if (!d.open.empty()) {
        auto& body = d.open.back().body;
        if (body.empty()) {
            d.open.pop_back();
        } else {
            body.pop_back();
        }
        return true;
    }
    if (d.top.empty()) return false;
    d.top.pop_back();
    return true;
}

// 開いたままのループをすべて閉じた実行用プログラム
inline Program build(ProgramDraft d) {
    while (close_loop(d)) {
    }
    return std::move(d.top);
}

// 表示用: 開いたループは "[x3 F" のように閉じ括弧なしで出す
inline std::string to_string(const ProgramDraft& d) {
    std::string out = program::to_string(d.top);
    for (const auto& loop : d.open) {
        if (!out.empty()) out += ' ';
        out += "[x" + std::to_string(loop.repeat);
        const std::string body = program::to_string(loop.body);
        if (!body.empty()) out += " " + body;
    }
    return out;
}

[[nodiscard]] inline bool empty(const ProgramDraft& d) noexcept {
    return d.top.empty() && d.open.empty();
}

}  // namespace draft

}  // namespace program

#endif /* B17F4D2C_93E8_4A05_8C6B_2E0A5D91F374 */
