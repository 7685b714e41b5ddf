#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "OscTypes.h"

using namespace X32Sync;

TEST(OscTypes, TypeTags) {
    OscArgs args{int32_t(1), 0.5f, std::string("Kick"), Blob{1, 2}, int64_t(7), 2.0, true, false};
    EXPECT_EQ(typeTagsOf(args), "ifsbhdTF");
    EXPECT_EQ(typeTagOf(std::any('x')), '?');
}

TEST(OscTypes, ArgsToString) {
    EXPECT_EQ(argsToString({}), "[]");
    EXPECT_EQ(argsToString({int32_t(1), std::string("Kick")}), "[1, \"Kick\"]");
}

TEST(OscTypes, IdenticalRequiresSameTypes) {
    EXPECT_TRUE(argsIdentical({int32_t(1)}, {int32_t(1)}));
    EXPECT_FALSE(argsIdentical({int32_t(1)}, {1.0f}));
    EXPECT_FALSE(argsIdentical({int32_t(1)}, {int32_t(1), int32_t(1)}));
    EXPECT_TRUE(argsIdentical({std::string("a"), 0.25f}, {std::string("a"), 0.25f}));
}

TEST(ArgsMatch, IdenticalValuesMatch) {
    EXPECT_TRUE(argsMatch({}, {}));
    EXPECT_TRUE(argsMatch({std::string("Vox")}, {std::string("Vox")}));
    EXPECT_TRUE(argsMatch({int32_t(1), int32_t(2)}, {int32_t(1), int32_t(2)}));
}

TEST(ArgsMatch, FloatsEqualAfterRounding) {
    // Device quantization: 0.75 written, 0.7498 read back
    EXPECT_TRUE(argsMatch({0.75f}, {0.74998f}));
    EXPECT_TRUE(argsMatch({0.12344f}, {0.12341f}));
    EXPECT_FALSE(argsMatch({0.75f}, {0.7490f}));
    EXPECT_FALSE(argsMatch({0.1234f}, {0.1235f}));
}

TEST(ArgsMatch, NumericTypesCompareByValue) {
    EXPECT_TRUE(argsMatch({int32_t(1)}, {1.0f}));
    EXPECT_TRUE(argsMatch({1.0}, {int32_t(1)}));
    EXPECT_FALSE(argsMatch({int32_t(1)}, {int32_t(0)}));
}

TEST(ArgsMatch, NanMatchesNan) {
    float nan = std::numeric_limits<float>::quiet_NaN();
    EXPECT_TRUE(argsMatch({nan}, {nan}));
    EXPECT_TRUE(argsMatch({nan}, {-nan}));
    EXPECT_FALSE(argsMatch({nan}, {0.0f}));
    EXPECT_FALSE(argsMatch({0.0f}, {nan}));
}

TEST(ArgsMatch, MultipleValuesNeedExactMatch) {
    EXPECT_FALSE(argsMatch({0.75f, 0.5f}, {0.74998f, 0.5f}));
    EXPECT_FALSE(argsMatch({0.5f}, {}));
    EXPECT_FALSE(argsMatch({std::string("1")}, {int32_t(1)}));
}

TEST(ArgsMatch, DecimalDigitsAreConfigurable) {
    EXPECT_TRUE(argsMatch({0.71f}, {0.7149f}, 2));
    EXPECT_FALSE(argsMatch({0.71f}, {0.7149f}, 4));
}
