// File: tests/problems/sequence_builder_test.cpp
#include "problems/sequence_builder.hpp"
#include "core/encoding.hpp"
#include <gtest/gtest.h>

namespace algoseq {
namespace {

TEST(SequenceBuilderTest, MarkersAndItemsAreUnmasked) {
    SequenceBuilder builder(2, 3);
    builder.AddMarker(ControlMarker::STORE);
    builder.AddItem(Frame{1.0f, 0.0f, 1.0f});

    Sample sample = builder.Build(SampleMetadata{});
    ASSERT_EQ(2u, sample.Length());
    EXPECT_EQ((Frame{1.0f, 0.0f, 0.0f, 0.0f, 0.0f}), sample.inputs[0]);
    EXPECT_EQ((Frame{0.0f, 0.0f, 1.0f, 0.0f, 1.0f}), sample.inputs[1]);
    EXPECT_EQ(ZeroFrame(3), sample.targets[0]);
    EXPECT_EQ(ZeroFrame(3), sample.targets[1]);
    EXPECT_EQ(0u, sample.CountMasked());
}

TEST(SequenceBuilderTest, MarkerPayload) {
    SequenceBuilder builder(2, 3);
    builder.AddMarker(ControlMarker::RECALL, EncodeSymbol(3, 3));

    Sample sample = builder.Build(SampleMetadata{});
    EXPECT_EQ((Frame{0.0f, 1.0f, 0.0f, 1.0f, 1.0f}), sample.inputs[0]);
}

TEST(SequenceBuilderTest, ItemsCanCarryAMarker) {
    SequenceBuilder builder(4, 2);
    builder.AddItems(FrameSequence{{1.0f, 1.0f}, {0.0f, 1.0f}}, ControlMarker::FORGET);

    Sample sample = builder.Build(SampleMetadata{});
    EXPECT_EQ((std::vector<size_t>{0, 1}), sample.FindMarkers(ControlMarker::FORGET, 4));
}

TEST(SequenceBuilderTest, RecallFramesAreMaskedWithBlankInput) {
    SequenceBuilder builder(2, 2);
    FrameSequence expected{{1.0f, 0.0f}, {0.0f, 1.0f}};
    builder.AddRecall(expected);

    Sample sample = builder.Build(SampleMetadata{});
    ASSERT_EQ(2u, sample.Length());
    EXPECT_EQ(2u, sample.CountMasked());
    EXPECT_EQ(expected, sample.MaskedTargets());
    EXPECT_EQ(ZeroFrame(4), sample.inputs[0]);
    EXPECT_EQ(ZeroFrame(4), sample.inputs[1]);
}

TEST(SequenceBuilderTest, BuildSetsFrameCountAndResets) {
    SequenceBuilder builder(2, 2);
    builder.AddMarker(ControlMarker::STORE);
    builder.AddItem(Frame{1.0f, 1.0f});
    EXPECT_EQ(2u, builder.NumFrames());

    SampleMetadata metadata;
    metadata.sequence_length = 1;
    metadata.variant = "SerialRecall";
    Sample sample = builder.Build(metadata);

    EXPECT_EQ(2u, sample.metadata.num_frames);
    EXPECT_EQ(1u, sample.metadata.sequence_length);
    EXPECT_EQ("SerialRecall", sample.metadata.variant);
    EXPECT_EQ(0u, builder.NumFrames());
}

TEST(SequenceBuilderTest, RejectsWrongWidth) {
    SequenceBuilder builder(2, 3);
    EXPECT_THROW(builder.AddItem(Frame{1.0f}), std::invalid_argument);
    EXPECT_THROW(builder.AddRecall(FrameSequence{Frame(4, 0.0f)}), std::invalid_argument);
}

} // namespace
} // namespace algoseq
