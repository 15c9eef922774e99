#include <gtest/gtest.h>
#include "emission_controller.hpp"

using namespace signrec;

// First label of a session always fires
TEST(EmissionControllerTest, FirstLabelEmits) {
    EmissionController ec;
    EXPECT_FALSE(ec.last_emitted().has_value());
    EXPECT_TRUE(ec.should_emit("A"));
    ASSERT_TRUE(ec.last_emitted().has_value());
    EXPECT_EQ(*ec.last_emitted(), "A");
}

// Holding the same gesture fires once
TEST(EmissionControllerTest, RepeatSuppressed) {
    EmissionController ec;
    EXPECT_TRUE(ec.should_emit("A"));
    EXPECT_FALSE(ec.should_emit("A"));
    EXPECT_FALSE(ec.should_emit("A"));
    EXPECT_TRUE(ec.should_emit("B"));
    EXPECT_TRUE(ec.should_emit("A"));
}

TEST(EmissionControllerTest, EmptyLabelNeverEmits) {
    EmissionController ec;
    EXPECT_FALSE(ec.should_emit(""));
    EXPECT_FALSE(ec.last_emitted().has_value());
}

// After a session reset the same gesture can fire again
TEST(EmissionControllerTest, ResetForgetsLastLabel) {
    EmissionController ec;
    ec.should_emit("A");
    ec.reset();
    EXPECT_TRUE(ec.should_emit("A"));
}
