#include "fakes.hpp"
#include <diagram_registry/registry.hpp>
#include <gtest/gtest.h>

namespace {

// Images go through the lifecycle so its live count tracks the registry.
diagram_model::Diagram make_diagram(diagram_model::BufferId buffer, int row, diagram_registry::ImageLifecycle& images) {
    diagram_model::Diagram d;
    d.buffer_id = buffer;
    d.renderer_id = "mermaid";
    d.range.start_row = row;
    d.range.end_row = row + 3;
    d.image = images.materialize("/tmp/x.png", buffer, 1000, diagram_registry::ImageAnchor{row, 0});
    return d;
}

class RegistryTest : public ::testing::Test {
protected:
    fakes::FakeImageBackend backend;
    diagram_registry::ImageLifecycle images{backend};
    diagram_registry::DiagramRegistry registry{images};
};

TEST_F(RegistryTest, ClearOnEmptyBufferIsNoOp) {
    EXPECT_EQ(registry.clear(1), 0u);
    EXPECT_EQ(registry.clear(1), 0u);
    EXPECT_TRUE(registry.empty());
}

TEST_F(RegistryTest, RecordRejectsDiagramWithoutImage) {
    diagram_model::Diagram d;
    d.buffer_id = 1;
    EXPECT_FALSE(registry.record(d));
    EXPECT_TRUE(registry.empty());
}

TEST_F(RegistryTest, RecordKeepsInsertionOrder) {
    ASSERT_TRUE(registry.record(make_diagram(1, 10, images)));
    ASSERT_TRUE(registry.record(make_diagram(2, 3, images)));
    ASSERT_TRUE(registry.record(make_diagram(1, 2, images)));

    ASSERT_EQ(registry.size(), 3u);
    EXPECT_EQ(registry.diagrams()[0].range.start_row, 10);
    EXPECT_EQ(registry.diagrams()[1].buffer_id, 2);
    EXPECT_EQ(registry.diagrams()[2].range.start_row, 2);

    const auto in_one = registry.for_buffer(1);
    ASSERT_EQ(in_one.size(), 2u);
    EXPECT_EQ(in_one[0]->range.start_row, 10);
    EXPECT_EQ(in_one[1]->range.start_row, 2);
}

TEST_F(RegistryTest, SameBufferAndRangeReplacesAndDisposesPrevious) {
    ASSERT_TRUE(registry.record(make_diagram(1, 4, images)));
    ASSERT_TRUE(registry.record(make_diagram(1, 4, images)));

    EXPECT_EQ(registry.size(), 1u);
    ASSERT_EQ(backend.created.size(), 2u);
    EXPECT_EQ(backend.created[0]->clear_calls, 1);
    EXPECT_EQ(backend.created[1]->clear_calls, 0);
    EXPECT_EQ(registry.find(1, registry.diagrams()[0].range)->image, backend.created[1]);
    EXPECT_EQ(images.live_images(), 1u);
}

TEST_F(RegistryTest, ClearDisposesOnlyThatBuffer) {
    ASSERT_TRUE(registry.record(make_diagram(1, 1, images)));
    ASSERT_TRUE(registry.record(make_diagram(2, 1, images)));
    ASSERT_TRUE(registry.record(make_diagram(1, 8, images)));

    EXPECT_EQ(registry.clear(1), 2u);
    ASSERT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.diagrams()[0].buffer_id, 2);
    EXPECT_EQ(backend.created[0]->clear_calls, 1);
    EXPECT_EQ(backend.created[1]->clear_calls, 0);
    EXPECT_EQ(backend.created[2]->clear_calls, 1);
    EXPECT_EQ(images.live_images(), 1u);

    registry.clear_all();
    EXPECT_EQ(images.live_images(), 0u);
}

TEST_F(RegistryTest, SecondClearLeavesIdenticalState) {
    ASSERT_TRUE(registry.record(make_diagram(1, 1, images)));
    ASSERT_TRUE(registry.record(make_diagram(2, 5, images)));

    registry.clear(1);
    const auto after_first = registry.diagrams().size();
    const auto first_image = registry.diagrams()[0].image;

    EXPECT_EQ(registry.clear(1), 0u);
    ASSERT_EQ(registry.diagrams().size(), after_first);
    EXPECT_EQ(registry.diagrams()[0].image, first_image);
    EXPECT_EQ(backend.created[0]->clear_calls, 1);
}

TEST(ImageLifecycleTest, MaterializeUsesInlinePaddedPlacementWithoutPainting) {
    fakes::FakeImageBackend backend;
    diagram_registry::ImageLifecycle images(backend);

    auto image = images.materialize("/tmp/a.png", 3, 1000, diagram_registry::ImageAnchor{7, 2});
    ASSERT_NE(image, nullptr);
    ASSERT_EQ(backend.created.size(), 1u);
    const auto& created = *backend.created[0];
    EXPECT_EQ(created.path, "/tmp/a.png");
    EXPECT_EQ(created.placement.buffer, 3);
    EXPECT_EQ(created.placement.window, 1000);
    EXPECT_EQ(created.placement.anchor.row, 7);
    EXPECT_EQ(created.placement.anchor.col, 2);
    EXPECT_TRUE(created.placement.inline_image);
    EXPECT_TRUE(created.placement.with_virtual_padding);
    EXPECT_EQ(created.render_calls, 0);
}

TEST(ImageLifecycleTest, DisposeAcceptsNullAndUnpaintedImages) {
    fakes::FakeImageBackend backend;
    diagram_registry::ImageLifecycle images(backend);

    images.dispose(nullptr);
    auto image = images.materialize("/tmp/a.png", 1, 1, diagram_registry::ImageAnchor{});
    images.dispose(image);
    EXPECT_EQ(backend.created[0]->clear_calls, 1);
    EXPECT_EQ(images.live_images(), 0u);
}

TEST(ImageLifecycleTest, BackendFailureYieldsNull) {
    fakes::FakeImageBackend backend;
    backend.fail = true;
    diagram_registry::ImageLifecycle images(backend);
    EXPECT_EQ(images.materialize("/tmp/a.png", 1, 1, diagram_registry::ImageAnchor{}), nullptr);
    EXPECT_EQ(images.live_images(), 0u);
}

} // namespace
