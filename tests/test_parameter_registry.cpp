#include <gtest/gtest.h>

#include <algorithm>
#include <set>

#include "Exceptions.h"
#include "ParameterRegistry.h"

using namespace X32Sync;

TEST(FloatParameter, ValidatesRange) {
    FloatParameter level;
    EXPECT_TRUE(level.validate(0.0f));
    EXPECT_TRUE(level.validate(1.0f));
    EXPECT_TRUE(level.validate(0.5));
    EXPECT_TRUE(level.validate(int32_t(1)));
    EXPECT_FALSE(level.validate(1.5f));
    EXPECT_FALSE(level.validate(-0.1f));
    EXPECT_FALSE(level.validate(std::string("0.5")));
}

TEST(FloatParameter, SerializesAsFloat) {
    FloatParameter level;
    OscArgs args = level.serialize(0.5);
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(typeTagOf(args[0]), 'f');
    EXPECT_FLOAT_EQ(std::any_cast<float>(args[0]), 0.5f);

    std::any value = level.deserialize({0.25f});
    EXPECT_FLOAT_EQ(std::any_cast<float>(value), 0.25f);
    EXPECT_THROW(level.deserialize({}), UnexpectedReplyException);
    EXPECT_THROW(level.deserialize({std::string("x")}), UnexpectedReplyException);
}

TEST(IntParameter, AcceptsIntegralValues) {
    IntParameter onOff(0, 1);
    EXPECT_TRUE(onOff.validate(int32_t(0)));
    EXPECT_TRUE(onOff.validate(1.0f));
    EXPECT_TRUE(onOff.validate(true));
    EXPECT_FALSE(onOff.validate(0.5f));
    EXPECT_FALSE(onOff.validate(int32_t(2)));

    OscArgs args = onOff.serialize(true);
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(std::any_cast<int32_t>(args[0]), 1);
    EXPECT_EQ(std::any_cast<int32_t>(onOff.deserialize({int32_t(0)})), 0);
}

TEST(StringParameter, EnforcesMaximumLength) {
    StringParameter name(12);
    EXPECT_TRUE(name.validate(std::string("Kick")));
    EXPECT_TRUE(name.validate(std::string()));
    EXPECT_FALSE(name.validate(std::string("Thirteen char")));
    EXPECT_FALSE(name.validate(int32_t(3)));
    EXPECT_EQ(std::any_cast<std::string>(name.deserialize({std::string("Vox")})), "Vox");
}

TEST(ParameterRegistry, UnknownPathThrows) {
    ParameterRegistry registry = ParameterRegistry::x32();
    EXPECT_FALSE(registry.has("/ch/33/mix/fader"));
    EXPECT_THROW(registry.get("/ch/33/mix/fader"), UnknownParameterException);
    EXPECT_THROW(registry.serialize("/nope", 1.0f), UnknownParameterException);
}

TEST(ParameterRegistry, InvalidValueThrows) {
    ParameterRegistry registry = ParameterRegistry::x32();
    EXPECT_THROW(registry.serialize("/ch/01/mix/fader", 1.5f), InvalidValueException);
    EXPECT_THROW(registry.serialize("/ch/01/mix/on", 3), InvalidValueException);

    try {
        registry.serialize("/ch/01/mix/fader", 2.0f);
        FAIL() << "Expected InvalidValueException";
    } catch (const InvalidValueException& e) {
        EXPECT_EQ(e.path(), "/ch/01/mix/fader");
        EXPECT_EQ(e.code(), SyncException::ErrorCode::InvalidValue);
    }
}

TEST(ParameterRegistry, RejectsDuplicates) {
    ParameterRegistry registry;
    registry.add("/a", std::make_shared<FloatParameter>());
    EXPECT_THROW(registry.add("/a", std::make_shared<FloatParameter>()), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ParameterRegistry, X32Catalog) {
    ParameterRegistry registry = ParameterRegistry::x32();

    // 32 channels x 22, 16 buses x 4, 6 matrices x 3, 8 DCAs x 3, main x 4
    EXPECT_EQ(registry.size(), 32u * 22u + 16u * 4u + 6u * 3u + 8u * 3u + 4u);

    EXPECT_TRUE(registry.has("/ch/01/mix/fader"));
    EXPECT_TRUE(registry.has("/ch/32/eq/4/q"));
    EXPECT_TRUE(registry.has("/bus/16/config/name"));
    EXPECT_TRUE(registry.has("/dca/8/fader"));
    EXPECT_TRUE(registry.has("/main/st/mix/fader"));

    std::set<std::string> unique(registry.paths().begin(), registry.paths().end());
    EXPECT_EQ(unique.size(), registry.size());
    EXPECT_EQ(registry.paths().front(), "/ch/01/config/name");
}

TEST(ParameterRegistry, FaderClassification) {
    EXPECT_TRUE(ParameterRegistry::isFader("/ch/01/mix/fader"));
    EXPECT_TRUE(ParameterRegistry::isFader("/dca/1/fader"));
    EXPECT_FALSE(ParameterRegistry::isFader("/ch/01/mix/on"));
    EXPECT_FALSE(ParameterRegistry::isFader("/fader/x"));
    EXPECT_FALSE(ParameterRegistry::isFader("fader"));
}

TEST(ParameterRegistry, NeutralFaderValueIsZero) {
    ParameterRegistry registry = ParameterRegistry::x32();
    std::any neutral = registry.get("/main/st/mix/fader").neutralValue();
    EXPECT_FLOAT_EQ(std::any_cast<float>(neutral), 0.0f);
}
