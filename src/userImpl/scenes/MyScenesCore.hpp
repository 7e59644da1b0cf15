#ifndef F4A0C65B_1E87_4D3A_B92F_6C0D85E7A913
#define F4A0C65B_1E87_4D3A_B92F_6C0D85E7A913

#include <memory>
#include <string>
#include <variant>

#include "userImpl/GlobalSetting.hpp"
#include "userImpl/puzzle/LevelSession.hpp"
#include "userImpl/puzzle/PuzzleRule.hpp"

namespace my_scenes {

// タイトル画面(ワールド生成に失敗した場合は理由を表示する)
struct TitleSceneData {
    std::string last_error;
};

// シーン純粋データ(World を抱えるだけ)
struct PuzzleSceneData {
    puzzle_rule::World world;
};

// 全レベルクリア画面
struct ClearedSceneData {
    session::Progress progress;
};

using Scene = std::variant<TitleSceneData, PuzzleSceneData, ClearedSceneData>;

}  // namespace my_scenes

#endif /* F4A0C65B_1E87_4D3A_B92F_6C0D85E7A913 */
