#include "gtest/gtest.h"
#include <canvas/overlay.hpp>

namespace {

// Mirrors what a wheel event without Ctrl does to the overlay.
void show_zoom_hint(canvas::HintOverlay& overlay) {
    overlay.show("zoom hint", 300, [&overlay] { overlay.hide(700, 800); });
}

} // namespace

TEST(HintOverlayTest, StartsHidden) {
    canvas::TaskScheduler scheduler;
    canvas::HintOverlay overlay(scheduler);
    EXPECT_FALSE(overlay.visible());
    EXPECT_DOUBLE_EQ(overlay.opacity(), 0.0);
    EXPECT_EQ(overlay.text(), "");
}

TEST(HintOverlayTest, WheelHintTimeline) {
    canvas::TaskScheduler scheduler;
    canvas::HintOverlay overlay(scheduler);

    show_zoom_hint(overlay);
    EXPECT_TRUE(overlay.visible());
    EXPECT_EQ(overlay.text(), "zoom hint");

    overlay.tick(0.3f);
    EXPECT_DOUBLE_EQ(overlay.opacity(), 1.0);

    scheduler.advance_to(300);
    scheduler.advance_to(999);
    overlay.tick(0.5f);
    EXPECT_DOUBLE_EQ(overlay.opacity(), 1.0);

    scheduler.advance_to(1000);
    overlay.tick(0.4f);
    EXPECT_GT(overlay.opacity(), 0.0);
    EXPECT_LT(overlay.opacity(), 1.0);
    EXPECT_TRUE(overlay.visible());

    overlay.tick(0.4f);
    EXPECT_DOUBLE_EQ(overlay.opacity(), 0.0);
    scheduler.advance_to(1799);
    EXPECT_TRUE(overlay.visible());
    scheduler.advance_to(1800);
    EXPECT_FALSE(overlay.visible());
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST(HintOverlayTest, NewShowSupersedesPendingHide) {
    canvas::TaskScheduler scheduler;
    canvas::HintOverlay overlay(scheduler);

    show_zoom_hint(overlay);
    overlay.tick(0.3f);
    scheduler.advance_to(500);
    show_zoom_hint(overlay);

    // The first hint would have started fading here.
    scheduler.advance_to(1000);
    overlay.tick(0.1f);
    EXPECT_DOUBLE_EQ(overlay.opacity(), 1.0);

    scheduler.advance_to(2000);
    EXPECT_TRUE(overlay.visible());
    scheduler.advance_to(2300);
    EXPECT_FALSE(overlay.visible());
}

TEST(HintOverlayTest, ImmediateShowAndHide) {
    canvas::TaskScheduler scheduler;
    canvas::HintOverlay overlay(scheduler);

    overlay.show("move hint");
    EXPECT_TRUE(overlay.visible());
    EXPECT_DOUBLE_EQ(overlay.opacity(), 1.0);

    overlay.hide();
    EXPECT_FALSE(overlay.visible());
    EXPECT_DOUBLE_EQ(overlay.opacity(), 0.0);
}

TEST(HintOverlayTest, HideWithoutDelayFadesAtOnce) {
    canvas::TaskScheduler scheduler;
    canvas::HintOverlay overlay(scheduler);

    overlay.show("move hint");
    overlay.hide(0, 800);
    EXPECT_TRUE(overlay.visible());
    overlay.tick(0.8f);
    EXPECT_DOUBLE_EQ(overlay.opacity(), 0.0);
    scheduler.advance_to(800);
    EXPECT_FALSE(overlay.visible());
}

TEST(HintOverlayTest, DestructionCancelsPendingSteps) {
    canvas::TaskScheduler scheduler;
    {
        canvas::HintOverlay overlay(scheduler);
        show_zoom_hint(overlay);
        EXPECT_EQ(scheduler.pending(), 1u);
    }
    EXPECT_EQ(scheduler.pending(), 0u);
}
