#include <gtest/gtest.h>
#include "OrreryView.h"
#include "Scenario.h"

#include <cmath>

TEST(OrreryView, ProjectsCameraToCenter) {
  int cx = -1, cy = -1;
  ASSERT_TRUE(projectToCell(Vector3F{0.0f, 0.0f, 0.0f}, 10.0, 80, 24, cx, cy));
  EXPECT_EQ(cx, 40);
  EXPECT_EQ(cy, 12);
  // Columns are half as tall as rows, so x spans two columns per row-unit.
  ASSERT_TRUE(projectToCell(Vector3F{10.0f, 0.0f, -20.0f}, 10.0, 80, 24, cx, cy));
  EXPECT_EQ(cx, 42);
  EXPECT_EQ(cy, 10);
  EXPECT_FALSE(projectToCell(Vector3F{1000.0f, 0.0f, 0.0f}, 10.0, 80, 24, cx, cy));
  EXPECT_FALSE(projectToCell(Vector3F{0.0f, 0.0f, 0.0f}, 0.0, 80, 24, cx, cy));
}

TEST(OrreryView, FormatsSimulationTime) {
  EXPECT_EQ(formatSimTime(0.0), "0 d 00:00:00");
  EXPECT_EQ(formatSimTime(90061.9), "1 d 01:01:01");
  EXPECT_EQ(formatSimTime(-5.0), "0 d 00:00:00");
}

TEST(OrreryView, FormatsHugeSimulationTimesWithoutOverflow) {
  EXPECT_EQ(formatSimTime(9.0e18), "104166666666666 d 16:00:00");
  EXPECT_EQ(formatSimTime(1.0e30), "104166666666666 d 16:00:00");
  EXPECT_EQ(formatSimTime(HUGE_VAL), "104166666666666 d 16:00:00");
}

TEST(OrreryView, FocusAndZoom) {
  OrreryView view(nullptr);
  auto bodies = makeSolarScenario(GravityParams());
  EXPECT_EQ(view.camera(bodies), bodies[0].world);
  view.cycleFocus(bodies.size());
  EXPECT_EQ(view.camera(bodies), bodies[1].world);
  view.setFocus(2, bodies.size());
  view.cycleFocus(bodies.size());
  EXPECT_EQ(view.focus(), 0u);
  view.setFocus(9, bodies.size());
  EXPECT_EQ(view.focus(), 0u);

  double m = view.metersPerCell();
  view.zoomIn();
  EXPECT_DOUBLE_EQ(view.metersPerCell(), m / 2.0);
  view.zoomOut();
  view.zoomOut();
  EXPECT_DOUBLE_EQ(view.metersPerCell(), m * 2.0);
}
