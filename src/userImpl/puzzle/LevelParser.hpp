#ifndef E2B7F40C_9A13_4D6E_8F25_C10D6A3B7E98
#define E2B7F40C_9A13_4D6E_8F25_C10D6A3B7E98

#include <SDL2/SDL_log.h>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <tl/expected.hpp>
#include <variant>
#include <vector>

#include "userImpl/puzzle/Tile.hpp"

namespace level {

using grid_pos::GridPos;
using tile::TileParams;

/**
 * @brief コンパクト形式の定義テーブル 1 行
 * @param key レイアウト文字列中のキー(1 文字以上、例: "W3")
 * @param type タイル種別文字列(大文字小文字は無視)
 * @param params 種別ごとのパラメータ
 */
struct TileDefinition {
    std::string key;
    std::string type;
    TileParams params{};
};

/**
 * @brief リテラル形式のタイルレコード
 */
struct TileRecord {
    std::string type;
    GridPos position{};
    TileParams params{};
};

/**
 * @brief コンパクト形式のレベル
 * @param layout 行文字列(画面と同じく上の行が先頭)
 * @param definitions 複数文字キーの定義
 * @param start_direction プレイヤー初期向き(空なら Up)
 */
struct CompactLevel {
    std::vector<std::string> layout;
    std::vector<TileDefinition> definitions;
    std::string start_direction;
};

/**
 * @brief リテラル形式のレベル(タイルレコードの格子)
 * @param diagnostics 生成時に出た致命的でない警告
 */
struct LevelData {
    int width{0};
    int height{0};
    std::vector<TileRecord> tiles;
    std::string start_direction;
    std::vector<std::string> diagnostics;
};

// どちらの形でもロードできる
using LevelSource = std::variant<LevelData, CompactLevel>;

// 定義に一致しなかった 1 文字の解釈。' ' は Air だが実体化しない
inline std::optional<std::string_view> symbol_type(char symbol) noexcept {
    switch (symbol) {
        case '.':
            return "Floor";
        case '#':
            return "Wall";
        case 'S':
            return "Start";
        case 'E':
            return "End";
        case ' ':
            return "Air";
        default:
            return std::nullopt;
    }
}

/**
 * コンパクト形式をリテラル形式へ展開します
 *
 * 行は逆順に読み、y=0 が最下段になる。各位置で定義キーの最長一致を探し、
 * 一致すれば 1 セル進めて文字位置はキー長だけ進める。
 *
 * @return 空キー/重複キーがある場合はエラー。行が 0 のときは 0x0 のレベルを返す
 */
inline tl::expected<LevelData, std::string> parse_compact(const CompactLevel& compact) {
    // 同じキーが 2 つあると最長一致が一意に決まらないので入力エラーにする
    std::set<std::string_view> seen;
    for (const auto& def : compact.definitions) {
        if (def.key.empty()) {
            return tl::make_unexpected("definition key must not be empty");
        }
        if (!seen.insert(def.key).second) {
            return tl::make_unexpected("ambiguous definition key '" + def.key + "'");
        }
    }

    LevelData out{};
    out.start_direction = compact.start_direction;
    if (compact.layout.empty()) {
        return out;
    }

    out.height = static_cast<int>(compact.layout.size());
    int max_grid_width = 0;

    for (int y = 0; y < out.height; ++y) {
        const std::string_view row = compact.layout[out.height - 1 - y];
        int grid_x = 0;
        std::size_t string_x = 0;

        while (string_x < row.size()) {
            const std::string_view rest = row.substr(string_x);
            const TileDefinition* matched = nullptr;
            for (const auto& def : compact.definitions) {
                if (rest.starts_with(def.key) &&
                    (matched == nullptr || def.key.size() > matched->key.size())) {
                    matched = &def;
                }
            }

            if (matched != nullptr) {
                out.tiles.push_back(TileRecord{matched->type, GridPos{grid_x, y}, matched->params});
                ++grid_x;
                string_x += matched->key.size();
            } else {
                const char symbol = row[string_x];
                if (const auto type = symbol_type(symbol)) {
                    if (*type != "Air") {
                        out.tiles.push_back(TileRecord{std::string(*type), GridPos{grid_x, y}, {}});
                    }
                } else {
                    std::ostringstream msg;
                    msg << "Unrecognized symbol '" << symbol << "' at string index " << string_x
                        << " for grid pos (" << grid_x << "," << y << ")";
                    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "%s", msg.str().c_str());
                    out.diagnostics.push_back(msg.str());
                }
                ++grid_x;
                ++string_x;
            }

            max_grid_width = std::max(max_grid_width, grid_x);
        }
    }
    out.width = max_grid_width;
    return out;
}

// =============================
// JSON 読み込み
// =============================

namespace detail {

using json = nlohmann::json;

inline TileParams params_from_json(const json& j) {
    TileParams p{};
    p.switch_id = j.value("switchId", 0);
    p.controlled_by_switch_id = j.value("controlledBySwitchId", 0);
    p.initially_active = j.value("isBridgeInitiallyActive", true);
    p.activates_when_switch_on = j.value("activateOnSwitchOn", true);
    p.initial_steps = j.value("initialSteps", 0);
    return p;
}

inline CompactLevel compact_from_json(const json& j) {
    CompactLevel c{};
    c.layout = j.at("layout").get<std::vector<std::string>>();
    if (j.contains("definitions")) {
        for (const auto& d : j.at("definitions")) {
            c.definitions.push_back(
                TileDefinition{d.at("key").get<std::string>(), d.at("type").get<std::string>(),
                               params_from_json(d)});
        }
    }
    c.start_direction = j.value("startDirection", std::string{});
    return c;
}

inline LevelData literal_from_json(const json& j) {
    LevelData l{};
    l.width = j.at("width").get<int>();
    l.height = j.at("height").get<int>();
    for (const auto& t : j.at("tiles")) {
        const auto& pos = t.at("position");
        l.tiles.push_back(TileRecord{t.at("type").get<std::string>(),
                                     GridPos{pos.at("x").get<int>(), pos.at("y").get<int>()},
                                     params_from_json(t)});
    }
    l.start_direction = j.value("startDirection", std::string{});
    return l;
}

}  // namespace detail

/**
 * JSON テキストをレベルへ変換します
 * "layout" を持てばコンパクト形式、"tiles" を持てばリテラル形式として読む。
 */
inline tl::expected<LevelSource, std::string> decode_json(std::string_view text) {
    using detail::json;
    const json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return tl::make_unexpected("level is not valid JSON");
    }
    if (!j.is_object()) {
        return tl::make_unexpected("level JSON must be an object");
    }

    try {
        if (j.contains("layout")) {
            return LevelSource{detail::compact_from_json(j)};
        }
        if (j.contains("tiles")) {
            return LevelSource{detail::literal_from_json(j)};
        }
    } catch (const json::exception& e) {
        return tl::make_unexpected(std::string("malformed level JSON: ") + e.what());
    }
    return tl::make_unexpected("level JSON has neither 'layout' nor 'tiles'");
}

inline tl::expected<LevelSource, std::string> load_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return tl::make_unexpected("could not open level file " + path.string());
    }
    std::ostringstream buf;
    buf << in.rdbuf();

    auto decoded = decode_json(buf.str());
    if (!decoded) {
        return tl::make_unexpected(path.string() + ": " + decoded.error());
    }
    return decoded;
}

}  // namespace level

#endif /* E2B7F40C_9A13_4D6E_8F25_C10D6A3B7E98 */
