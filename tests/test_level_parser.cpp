// tests/test_level_parser.cpp

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <variant>

#include "userImpl/puzzle/Board.hpp"
#include "userImpl/puzzle/LevelParser.hpp"

using grid_pos::GridPos;
using level::CompactLevel;
using level::LevelData;
using level::TileDefinition;
using level::TileRecord;

// (x, y) にあるレコードを探す
static const TileRecord* find_at(const LevelData& data, int x, int y) {
    const auto it = std::find_if(data.tiles.begin(), data.tiles.end(), [&](const TileRecord& r) {
        return r.position == GridPos{x, y};
    });
    return it == data.tiles.end() ? nullptr : &*it;
}

// ------------------------------------------------------------
// 1. 行は逆順に読み、先頭行が最上段になる
// ------------------------------------------------------------
TEST(LevelParser, RowsAreReadBottomUp) {
    CompactLevel c{};
    c.layout = {"E", "S"};

    const auto parsed = level::parse_compact(c);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(parsed->width, 1);
    EXPECT_EQ(parsed->height, 2);

    const auto* start = find_at(*parsed, 0, 0);
    const auto* end = find_at(*parsed, 0, 1);
    ASSERT_NE(start, nullptr);
    ASSERT_NE(end, nullptr);
    EXPECT_EQ(start->type, "Start");
    EXPECT_EQ(end->type, "End");
}

// ------------------------------------------------------------
// 2. 複数文字キーは 1 セルだけ進む
// ------------------------------------------------------------
TEST(LevelParser, MultiCharacterKeyConsumesOneCell) {
    tile::TileParams p{};
    p.initial_steps = 3;
    CompactLevel c{};
    c.definitions = {TileDefinition{"W3", "WeakFloor", p}};
    c.layout = {"SW3.E"};

    const auto parsed = level::parse_compact(c);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(parsed->width, 4);
    ASSERT_EQ(parsed->tiles.size(), 4u);

    const auto* weak = find_at(*parsed, 1, 0);
    ASSERT_NE(weak, nullptr);
    EXPECT_EQ(weak->type, "WeakFloor");
    EXPECT_EQ(weak->params.initial_steps, 3);

    ASSERT_NE(find_at(*parsed, 2, 0), nullptr);
    EXPECT_EQ(find_at(*parsed, 2, 0)->type, "Floor");
    ASSERT_NE(find_at(*parsed, 3, 0), nullptr);
    EXPECT_EQ(find_at(*parsed, 3, 0)->type, "End");
}

// ------------------------------------------------------------
// 3. 最長一致のキーが選ばれ、定義は記号表より優先される
// ------------------------------------------------------------
TEST(LevelParser, LongestKeyWinsOverShorterPrefix) {
    CompactLevel c{};
    c.definitions = {TileDefinition{"s", "Switch", {}}, TileDefinition{"s12", "Bridge", {}},
                     TileDefinition{"E", "Wall", {}}};
    c.layout = {"s12sE"};

    const auto parsed = level::parse_compact(c);
    ASSERT_TRUE(parsed.has_value()) << parsed.error();
    EXPECT_EQ(parsed->width, 3);
    EXPECT_EQ(find_at(*parsed, 0, 0)->type, "Bridge");
    EXPECT_EQ(find_at(*parsed, 1, 0)->type, "Switch");
    EXPECT_EQ(find_at(*parsed, 2, 0)->type, "Wall");
}

// ------------------------------------------------------------
// 4. 空白は Air だがタイルは作らない。幅は数える
// ------------------------------------------------------------
TEST(LevelParser, SpaceIsAirAndNotMaterialized) {
    CompactLevel c{};
    c.layout = {"S  E"};

    const auto parsed = level::parse_compact(c);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->width, 4);
    EXPECT_EQ(parsed->tiles.size(), 2u);
    EXPECT_EQ(find_at(*parsed, 1, 0), nullptr);
    EXPECT_EQ(find_at(*parsed, 2, 0), nullptr);
}

// ------------------------------------------------------------
// 5. 未知の記号は警告としてスキップ
// ------------------------------------------------------------
TEST(LevelParser, UnknownSymbolIsSkippedWithDiagnostic) {
    CompactLevel c{};
    c.layout = {"S?E"};

    const auto parsed = level::parse_compact(c);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->width, 3);
    EXPECT_EQ(parsed->tiles.size(), 2u);
    ASSERT_EQ(parsed->diagnostics.size(), 1u);
    EXPECT_NE(parsed->diagnostics.front().find('?'), std::string::npos);
}

// ------------------------------------------------------------
// 6. 行の長さが違っても幅は最大値
// ------------------------------------------------------------
TEST(LevelParser, WidthIsLongestRow) {
    CompactLevel c{};
    c.layout = {"..E..", "S"};

    const auto parsed = level::parse_compact(c);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->width, 5);
    EXPECT_EQ(parsed->height, 2);
}

// ------------------------------------------------------------
// 7. 同じキー/空キーは入力エラー
// ------------------------------------------------------------
TEST(LevelParser, DuplicateKeyIsRejected) {
    CompactLevel c{};
    c.definitions = {TileDefinition{"b1", "Bridge", {}}, TileDefinition{"b1", "Switch", {}}};
    c.layout = {"Sb1E"};

    const auto parsed = level::parse_compact(c);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_NE(parsed.error().find("b1"), std::string::npos);
}

TEST(LevelParser, EmptyKeyIsRejected) {
    CompactLevel c{};
    c.definitions = {TileDefinition{"", "Floor", {}}};
    c.layout = {"SE"};

    EXPECT_FALSE(level::parse_compact(c).has_value());
}

// ------------------------------------------------------------
// 8. 行がなければ 0x0。盤面の生成で弾かれる
// ------------------------------------------------------------
TEST(LevelParser, ZeroRowsGiveEmptyLevelThatBoardRejects) {
    CompactLevel c{};
    const auto parsed = level::parse_compact(c);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->width, 0);
    EXPECT_EQ(parsed->height, 0);

    const auto b = board::load(level::LevelSource{c});
    EXPECT_FALSE(b.has_value());
}

// ------------------------------------------------------------
// 9. JSON: コンパクト形式
// ------------------------------------------------------------
TEST(LevelJson, DecodesCompactLevel) {
    const auto decoded = level::decode_json(R"({
        "startDirection": "Right",
        "definitions": [
            { "key": "b1", "type": "Bridge", "controlledBySwitchId": 1,
              "isBridgeInitiallyActive": false, "activateOnSwitchOn": false }
        ],
        "layout": ["Sb1E"]
    })");
    ASSERT_TRUE(decoded.has_value()) << decoded.error();
    const auto* compact = std::get_if<CompactLevel>(&*decoded);
    ASSERT_NE(compact, nullptr);
    EXPECT_EQ(compact->start_direction, "Right");
    ASSERT_EQ(compact->definitions.size(), 1u);

    const auto& def = compact->definitions.front();
    EXPECT_EQ(def.key, "b1");
    EXPECT_EQ(def.params.controlled_by_switch_id, 1);
    EXPECT_FALSE(def.params.initially_active);
    EXPECT_FALSE(def.params.activates_when_switch_on);
}

// ------------------------------------------------------------
// 10. JSON: リテラル形式と省略時の既定値
// ------------------------------------------------------------
TEST(LevelJson, DecodesLiteralLevelWithDefaults) {
    const auto decoded = level::decode_json(R"({
        "width": 2, "height": 1,
        "tiles": [
            { "type": "Start", "position": { "x": 0, "y": 0 } },
            { "type": "Bridge", "position": { "x": 1, "y": 0 } }
        ]
    })");
    ASSERT_TRUE(decoded.has_value()) << decoded.error();
    const auto* literal = std::get_if<LevelData>(&*decoded);
    ASSERT_NE(literal, nullptr);
    EXPECT_EQ(literal->width, 2);
    ASSERT_EQ(literal->tiles.size(), 2u);

    const auto& bridge = literal->tiles[1];
    EXPECT_EQ(bridge.position, (GridPos{1, 0}));
    EXPECT_EQ(bridge.params.switch_id, 0);
    EXPECT_EQ(bridge.params.controlled_by_switch_id, 0);
    EXPECT_TRUE(bridge.params.initially_active);
    EXPECT_TRUE(bridge.params.activates_when_switch_on);
    EXPECT_EQ(bridge.params.initial_steps, 0);
    EXPECT_TRUE(literal->start_direction.empty());
}

// ------------------------------------------------------------
// 11. JSON: 壊れた入力はエラー値で返る(例外は漏れない)
// ------------------------------------------------------------
TEST(LevelJson, MalformedInputIsReportedAsError) {
    EXPECT_FALSE(level::decode_json("{ not json").has_value());
    EXPECT_FALSE(level::decode_json("[1, 2, 3]").has_value());
    EXPECT_FALSE(level::decode_json(R"({ "name": "nothing" })").has_value());

    // 必須フィールド欠落
    const auto missing = level::decode_json(R"({ "width": 1, "height": 1,
        "tiles": [ { "type": "Start" } ] })");
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("malformed"), std::string::npos);

    // 型違い
    EXPECT_FALSE(level::decode_json(R"({ "layout": "S.E" })").has_value());
}

TEST(LevelJson, MissingFileIsReportedAsError) {
    const auto path = std::filesystem::temp_directory_path() / "robopath_no_such_level.json";
    std::filesystem::remove(path);
    const auto loaded = level::load_file(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().find("robopath_no_such_level.json"), std::string::npos);
}
