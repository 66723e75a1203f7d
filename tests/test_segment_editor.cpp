/*
 * Unit tests for drag-to-modify: matching a press to a waypoint segment
 */

#include <gtest/gtest.h>
#include "core/RouteSegmentEditor.hpp"

static std::vector<Waypoint> make_waypoints(const std::vector<Coordinate> &coords) {
    std::vector<Waypoint> out;
    for (size_t i = 0; i < coords.size(); ++i) {
        Waypoint w;
        w.id = "w" + std::to_string(i);
        w.coord = coords[i];
        w.order = static_cast<uint32_t>(i);
        out.push_back(w);
    }
    return out;
}

static const Polyline kLine{{0.0, 0.0}, {0.0, 0.001}, {0.0, 0.002}, {0.0, 0.003}};

// ============================================================================
// Test Suite: SegmentEditor_Find
// ============================================================================

TEST(SegmentEditor_Find, PressOnFirstSegment) {
    auto wps = make_waypoints({{0.0, 0.0}, {0.0, 0.0015}, {0.0, 0.003}});
    SegmentMatch m = RouteSegmentEditor::findSegmentForInsertion({0.0001, 0.0005}, wps, kLine);
    ASSERT_TRUE(m.found());
    EXPECT_EQ(m.segment_index, 0);
    EXPECT_EQ(m.insert_at_index, 1);
    EXPECT_EQ(m.nearest_geometry_index, 0);
    EXPECT_NEAR(m.distance_to_route, 11.1, 0.2);
    EXPECT_NEAR(m.nearest_coordinate.latitude, 0.0, 1e-12);
    EXPECT_NEAR(m.nearest_coordinate.longitude, 0.0005, 1e-9);
}

TEST(SegmentEditor_Find, PressOnSecondSegment) {
    auto wps = make_waypoints({{0.0, 0.0}, {0.0, 0.0015}, {0.0, 0.003}});
    SegmentMatch m = RouteSegmentEditor::findSegmentForInsertion({-0.0001, 0.0025}, wps, kLine);
    ASSERT_TRUE(m.found());
    EXPECT_EQ(m.segment_index, 1);
    EXPECT_EQ(m.insert_at_index, 2);
    EXPECT_EQ(m.nearest_geometry_index, 2);
}

TEST(SegmentEditor_Find, PressOnWaypointPicksLaterSegment) {
    auto wps = make_waypoints({{0.0, 0.0}, {0.0, 0.0015}, {0.0, 0.003}});
    SegmentMatch m = RouteSegmentEditor::findSegmentForInsertion({0.0, 0.0015}, wps, kLine);
    ASSERT_TRUE(m.found());
    EXPECT_EQ(m.segment_index, 1);
}

TEST(SegmentEditor_Find, TooFarFromRoute) {
    auto wps = make_waypoints({{0.0, 0.0}, {0.0, 0.003}});
    // ~111 m north of the line
    SegmentMatch m = RouteSegmentEditor::findSegmentForInsertion({0.001, 0.001}, wps, kLine);
    EXPECT_FALSE(m.found());
    EXPECT_EQ(m.insert_at_index, -1);
}

TEST(SegmentEditor_Find, CustomThreshold) {
    auto wps = make_waypoints({{0.0, 0.0}, {0.0, 0.003}});
    SegmentMatch m = RouteSegmentEditor::findSegmentForInsertion({0.001, 0.001}, wps, kLine, 150.0);
    EXPECT_TRUE(m.found());
}

TEST(SegmentEditor_Find, BeforeFirstWaypointClampsToFirstSegment) {
    auto wps = make_waypoints({{0.0, 0.001}, {0.0, 0.0015}, {0.0, 0.002}});
    SegmentMatch m = RouteSegmentEditor::findSegmentForInsertion({0.0, 0.0002}, wps, kLine);
    ASSERT_TRUE(m.found());
    EXPECT_EQ(m.segment_index, 0);
}

TEST(SegmentEditor_Find, AfterLastWaypointClampsToLastSegment) {
    auto wps = make_waypoints({{0.0, 0.001}, {0.0, 0.0015}, {0.0, 0.002}});
    SegmentMatch m = RouteSegmentEditor::findSegmentForInsertion({0.0, 0.0028}, wps, kLine);
    ASSERT_TRUE(m.found());
    EXPECT_EQ(m.segment_index, 1);
    EXPECT_EQ(m.insert_at_index, 2);
}

TEST(SegmentEditor_Find, NeedsTwoWaypointsAndTwoPoints) {
    auto one = make_waypoints({{0.0, 0.0}});
    auto two = make_waypoints({{0.0, 0.0}, {0.0, 0.003}});
    EXPECT_FALSE(RouteSegmentEditor::findSegmentForInsertion({0.0, 0.001}, one, kLine).found());
    EXPECT_FALSE(RouteSegmentEditor::findSegmentForInsertion({0.0, 0.001}, two, {{0.0, 0.0}}).found());
}

// ============================================================================
// Test Suite: SegmentEditor_Flow
// ============================================================================

static void plan_three_points(RoutePlanner &p) {
    p.startPlanning(PlanningMode::Freeform);
    p.addWaypoint({0.0, 0.0});
    p.addWaypoint({0.0, 0.001});
    p.addWaypoint({0.0, 0.002});
    ASSERT_TRUE(p.calculateRoute().ok());
}

TEST(SegmentEditor_Flow, PressThenConfirmInsertsVia) {
    RoutePlanner planner;
    plan_three_points(planner);
    RouteSegmentEditor editor(planner);

    SegmentMatch m = editor.handlePress({0.0001, 0.0015});
    ASSERT_TRUE(m.found());
    EXPECT_TRUE(editor.hasPending());
    const size_t history_before = planner.history().size();

    ASSERT_TRUE(editor.confirm().ok());
    EXPECT_FALSE(editor.hasPending());
    ASSERT_EQ(planner.waypoints().size(), 4u);
    EXPECT_EQ(planner.waypoints()[2].kind, WaypointKind::Via);
    EXPECT_NEAR(planner.waypoints()[2].coord.longitude, 0.0015, 1e-9);
    EXPECT_NEAR(planner.waypoints()[2].coord.latitude, 0.0, 1e-12);
    EXPECT_EQ(planner.history().size(), history_before + 1);
}

TEST(SegmentEditor_Flow, CancelDiscardsPending) {
    RoutePlanner planner;
    plan_three_points(planner);
    RouteSegmentEditor editor(planner);

    editor.handlePress({0.0, 0.0005});
    editor.cancel();
    EXPECT_FALSE(editor.hasPending());
    EXPECT_EQ(editor.confirm().error, RouteError::InvalidIndex);
    EXPECT_EQ(planner.waypoints().size(), 3u);
}

TEST(SegmentEditor_Flow, MissLeavesNothingPending) {
    RoutePlanner planner;
    plan_three_points(planner);
    RouteSegmentEditor editor(planner, 20.0);

    EXPECT_FALSE(editor.handlePress({0.0005, 0.001}).found());
    EXPECT_FALSE(editor.hasPending());
}
