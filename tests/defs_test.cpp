#include "gtest/gtest.h"
#include <canvas/defs.hpp>
#include <svg_scene/element.hpp>

using svg_scene::Element;

TEST(DefsTest, AppendsDefsElement) {
    Element svg("svg");
    canvas::Defs defs(svg);
    ASSERT_EQ(svg.child_count(), 1u);
    EXPECT_EQ(svg.children().front()->tag(), "defs");
    EXPECT_EQ(&defs.element(), svg.children().front().get());
    EXPECT_EQ(defs.size(), 0u);
}

TEST(DefsTest, AddAndLookup) {
    Element svg("svg");
    canvas::Defs defs(svg);

    Element* added = defs.add("fill-a", std::make_unique<Element>("linearGradient"));
    ASSERT_NE(added, nullptr);
    EXPECT_EQ(added->attr("id"), "fill-a");
    EXPECT_TRUE(defs.has("fill-a"));
    EXPECT_EQ(defs.get("fill-a"), added);
    EXPECT_EQ(defs.get("fill-b"), nullptr);
    EXPECT_EQ(svg.find_by_id("fill-a"), added);
}

TEST(DefsTest, RejectsDuplicatesAndEmptyIds) {
    Element svg("svg");
    canvas::Defs defs(svg);

    ASSERT_NE(defs.add("clip", std::make_unique<Element>("clipPath")), nullptr);
    EXPECT_EQ(defs.add("clip", std::make_unique<Element>("pattern")), nullptr);
    EXPECT_EQ(defs.add("", std::make_unique<Element>("pattern")), nullptr);
    EXPECT_EQ(defs.add("marker", nullptr), nullptr);
    EXPECT_EQ(defs.size(), 1u);
    EXPECT_EQ(defs.get("clip")->tag(), "clipPath");
    EXPECT_EQ(defs.element().child_count(), 1u);
}
