// tests/test_input.cpp

#include <gtest/gtest.h>

#include <array>

#include "core/Input.hpp"

using input::apply_key;
using input::carry_over;
using input::Input;

TEST(Input, UnknownKeyIsIdle) {
    const Input in{};
    EXPECT_FALSE(in.pressed(SDLK_a));
    EXPECT_FALSE(in.held(SDLK_a));
    EXPECT_FALSE(in.released(SDLK_a));
}

TEST(Input, KeyDownSetsPressedAndHeld) {
    Input in{};
    apply_key(in, SDLK_w, true);
    EXPECT_TRUE(in.pressed(SDLK_w));
    EXPECT_TRUE(in.held(SDLK_w));
}

// 押しっぱなしは次フレームで押下エッジが消える
TEST(Input, CarryOverKeepsHeldAndDropsEdges) {
    Input first{};
    apply_key(first, SDLK_w, true);

    const Input second = carry_over(first);
    EXPECT_FALSE(second.pressed(SDLK_w));
    EXPECT_TRUE(second.held(SDLK_w));
}

// キーリピートの KEYDOWN は押下として数えない
TEST(Input, RepeatedKeyDownIsNotANewPress) {
    Input first{};
    apply_key(first, SDLK_RETURN, true);

    Input second = carry_over(first);
    apply_key(second, SDLK_RETURN, true);
    EXPECT_FALSE(second.pressed(SDLK_RETURN));
    EXPECT_TRUE(second.held(SDLK_RETURN));
}

TEST(Input, KeyUpAfterHoldIsReleased) {
    Input first{};
    apply_key(first, SDLK_a, true);

    Input second = carry_over(first);
    apply_key(second, SDLK_a, false);
    EXPECT_TRUE(second.released(SDLK_a));
    EXPECT_FALSE(second.held(SDLK_a));

    // 押されていないキーの KEYUP は無視
    Input third{};
    apply_key(third, SDLK_d, false);
    EXPECT_FALSE(third.released(SDLK_d));
}

TEST(Input, FirstPressedFollowsCandidateOrder) {
    Input in{};
    apply_key(in, SDLK_d, true);
    apply_key(in, SDLK_a, true);

    const std::array<SDL_Keycode, 3> order{SDLK_w, SDLK_a, SDLK_d};
    const auto hit = in.first_pressed(order.begin(), order.end());
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, SDLK_a);

    const std::array<SDL_Keycode, 1> none{SDLK_r};
    EXPECT_FALSE(in.first_pressed(none.begin(), none.end()).has_value());
}
