#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>

#include "Exceptions.h"
#include "OscTypes.h"
#include "SnapshotDocument.h"
#include "StateSnapshot.h"

using namespace X32Sync;

namespace {
StateSnapshot sampleSnapshot() {
    StateSnapshot snapshot;
    snapshot.setParameter("/ch/01/config/name", std::string("Kick"));
    snapshot.setParameter("/ch/01/mix/on", int32_t(1));
    snapshot.setParameter("/ch/01/mix/fader", 0.7498f);
    snapshot.setParameter("/main/st/mix/fader", 0.0f);
    return snapshot;
}
}  // namespace

TEST(StateSnapshot, BasicOperations) {
    StateSnapshot snapshot = sampleSnapshot();
    EXPECT_EQ(snapshot.size(), 4u);
    EXPECT_TRUE(snapshot.hasParameter("/ch/01/mix/on"));
    EXPECT_THROW(snapshot.getParameter("/ch/02/mix/on"), std::out_of_range);

    std::vector<std::string> paths = snapshot.getParameterPaths();
    EXPECT_TRUE(std::is_sorted(paths.begin(), paths.end()));

    EXPECT_TRUE(snapshot.removeParameter("/ch/01/mix/on"));
    EXPECT_FALSE(snapshot.removeParameter("/ch/01/mix/on"));
    EXPECT_NE(snapshot, sampleSnapshot());
}

TEST(SnapshotDocument, RoundTripKeepsTypes) {
    StateSnapshot original = sampleSnapshot();
    std::string text = SnapshotDocument::toJsonString(original);
    EXPECT_NE(text.find("\"x32_state\""), std::string::npos);

    StateSnapshot loaded = SnapshotDocument::fromJsonString(text);
    EXPECT_EQ(loaded, original);
    EXPECT_EQ(loaded.getParameter("/ch/01/mix/on").type(), typeid(int32_t));
    EXPECT_EQ(loaded.getParameter("/ch/01/mix/fader").type(), typeid(float));
    EXPECT_EQ(loaded.getParameter("/main/st/mix/fader").type(), typeid(float));
}

TEST(SnapshotDocument, ReadsHandWrittenDocument) {
    StateSnapshot snapshot = SnapshotDocument::fromJsonString(
        R"({"x32_state": {"/ch/01/mix/fader": 0.75, "/ch/01/mix/on": 1, "/ch/01/eq/on": true,
            "/ch/01/config/name": "Kick"}})");

    EXPECT_FLOAT_EQ(snapshot.getParameterAs<float>("/ch/01/mix/fader"), 0.75f);
    EXPECT_EQ(snapshot.getParameterAs<int32_t>("/ch/01/mix/on"), 1);
    EXPECT_EQ(snapshot.getParameterAs<int32_t>("/ch/01/eq/on"), 1);
    EXPECT_EQ(snapshot.getParameterAs<std::string>("/ch/01/config/name"), "Kick");
}

TEST(SnapshotDocument, EmptyStateIsValid) {
    StateSnapshot snapshot = SnapshotDocument::fromJsonString(R"({"x32_state": {}})");
    EXPECT_TRUE(snapshot.empty());
}

TEST(SnapshotDocument, RejectsBadShapes) {
    EXPECT_THROW(SnapshotDocument::fromJsonString("not json"), DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString(""), DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString("[]"), DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString(R"({"state": {}})"), DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString(R"({"x32_state": []})"), DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString(R"({"x32_state": {}, "extra": 1})"), DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString(R"({"x32_state": {"/a": null}})"), DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString(R"({"x32_state": {"/a": [1, 2]}})"), DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString(R"({"x32_state": {"/a": 4294967296}})"), DocumentException);
}

TEST(SnapshotDocument, RejectsUnstorableValues) {
    StateSnapshot snapshot;
    snapshot.setParameter("/a", Blob{1, 2, 3});
    EXPECT_THROW(SnapshotDocument::toJsonString(snapshot), DocumentException);
}

TEST(SnapshotDocument, NonFiniteFloatsSurviveSaveAndLoad) {
    StateSnapshot snapshot;
    snapshot.setParameter("/ch/01/mix/fader", std::nanf(""));
    snapshot.setParameter("/ch/01/mix/on", int32_t(1));
    snapshot.setParameter("/ch/02/mix/fader", std::numeric_limits<float>::infinity());
    snapshot.setParameter("/ch/03/mix/fader", -std::numeric_limits<float>::infinity());

    std::string text = SnapshotDocument::toJsonString(snapshot);
    EXPECT_EQ(text.find("null"), std::string::npos);

    StateSnapshot loaded = SnapshotDocument::fromJsonString(text);
    ASSERT_EQ(loaded.size(), 4u);
    EXPECT_EQ(loaded.getParameter("/ch/01/mix/fader").type(), typeid(float));
    EXPECT_TRUE(std::isnan(loaded.getParameterAs<float>("/ch/01/mix/fader")));
    EXPECT_EQ(loaded.getParameterAs<int32_t>("/ch/01/mix/on"), 1);
    EXPECT_EQ(loaded.getParameterAs<float>("/ch/02/mix/fader"), std::numeric_limits<float>::infinity());
    EXPECT_EQ(loaded.getParameterAs<float>("/ch/03/mix/fader"), -std::numeric_limits<float>::infinity());
    EXPECT_TRUE(argsMatch({snapshot.getParameter("/ch/01/mix/fader")}, {loaded.getParameter("/ch/01/mix/fader")}));

    EXPECT_THROW(SnapshotDocument::fromJsonString(R"({"x32_state": {"/a": {"float": "big"}}})"),
                 DocumentException);
    EXPECT_THROW(SnapshotDocument::fromJsonString(R"({"x32_state": {"/a": {"float": "nan", "x": 1}}})"),
                 DocumentException);
}

TEST(SnapshotDocument, StreamsAndFiles) {
    std::stringstream stream;
    SnapshotDocument::save(stream, sampleSnapshot());
    EXPECT_EQ(SnapshotDocument::load(stream), sampleSnapshot());

    std::string path = ::testing::TempDir() + "x32sync_snapshot_test.json";
    SnapshotDocument::saveToFile(path, sampleSnapshot());
    EXPECT_EQ(SnapshotDocument::loadFromFile(path), sampleSnapshot());
    std::remove(path.c_str());

    EXPECT_THROW(SnapshotDocument::loadFromFile(::testing::TempDir() + "missing/x32sync.json"),
                 DocumentException);
}
