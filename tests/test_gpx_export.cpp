/*
 * Tests for GPX export
 */

#include <gtest/gtest.h>
#include "core/GpxExport.hpp"

namespace {

size_t count_of(const std::string &hay, const std::string &needle) {
    size_t n = 0;
    for (size_t pos = hay.find(needle); pos != std::string::npos;
         pos = hay.find(needle, pos + needle.size()))
        ++n;
    return n;
}

RouteRecord sample_route() {
    RouteRecord r;
    r.id = "1714555800000-abc";
    r.name = "Tom & Jerry's <loop>";
    r.description = "Along the river";
    r.mode = PlanningMode::Freeform;

    Waypoint a;
    a.id = "a";
    a.coord = {51.5, -0.12};
    a.name = "Home";
    a.kind = WaypointKind::Start;
    Waypoint b;
    b.id = "b";
    b.coord = {51.51, -0.11};
    b.kind = WaypointKind::Via;
    Waypoint c;
    c.id = "c";
    c.coord = {51.52, -0.10};
    c.kind = WaypointKind::End;
    r.waypoints = {a, b, c};
    r.geometry = {{51.5, -0.12}, {51.505, -0.115}, {51.51, -0.11},
                  {51.52, -0.10}};
    return r;
}

} // namespace

// ============================================================================
// Test Suite: escapeXml
// ============================================================================

TEST(GpxExport, EscapesXmlEntities) {
    EXPECT_EQ(escapeXml("a&b"), "a&amp;b");
    EXPECT_EQ(escapeXml("<x>"), "&lt;x&gt;");
    EXPECT_EQ(escapeXml("\"q\" 'a'"), "&quot;q&quot; &apos;a&apos;");
    EXPECT_EQ(escapeXml("plain"), "plain");
}

// ============================================================================
// Test Suite: routeToGpx
// ============================================================================

TEST(GpxExport, DocumentStructure) {
    const std::string gpx = routeToGpx(sample_route(), "2024-05-01T09:30:00.000Z");

    EXPECT_EQ(gpx.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>", 0), 0u);
    EXPECT_NE(gpx.find("creator=\"routenav\""), std::string::npos);
    EXPECT_NE(gpx.find("<time>2024-05-01T09:30:00.000Z</time>"), std::string::npos);
    EXPECT_NE(gpx.find("<keywords>bike, cycling, tour, freeform</keywords>"),
              std::string::npos);
    EXPECT_NE(gpx.find("<desc>Along the river</desc>"), std::string::npos);
    EXPECT_EQ(count_of(gpx, "<trk>"), 1u);
    EXPECT_EQ(count_of(gpx, "<trkseg>"), 1u);
    EXPECT_EQ(count_of(gpx, "<trkpt "), 4u);
    EXPECT_NE(gpx.rfind("</gpx>"), std::string::npos);
}

TEST(GpxExport, NameIsEscaped) {
    const std::string gpx = routeToGpx(sample_route(), "t");
    EXPECT_NE(gpx.find("<name>Tom &amp; Jerry&apos;s &lt;loop&gt;</name>"),
              std::string::npos);
    EXPECT_EQ(gpx.find("<loop>"), std::string::npos);
}

TEST(GpxExport, WaypointsCarrySymbols) {
    const std::string gpx = routeToGpx(sample_route(), "t");
    EXPECT_EQ(count_of(gpx, "<wpt "), 3u);
    EXPECT_EQ(count_of(gpx, "<sym>Flag, Green</sym>"), 1u);
    EXPECT_EQ(count_of(gpx, "<sym>Flag, Red</sym>"), 1u);
    EXPECT_EQ(count_of(gpx, "<sym>Waypoint</sym>"), 1u);
    EXPECT_NE(gpx.find("<desc>start waypoint</desc>"), std::string::npos);
    EXPECT_NE(gpx.find("<name>Home</name>"), std::string::npos);
}

TEST(GpxExport, CoordinatesUseSevenDecimals) {
    const std::string gpx = routeToGpx(sample_route(), "t");
    EXPECT_NE(gpx.find("<trkpt lat=\"51.5050000\" lon=\"-0.1150000\"/>"),
              std::string::npos);
}

TEST(GpxExport, EmptyDescriptionOmitted) {
    RouteRecord r = sample_route();
    r.description.clear();
    r.waypoints.clear();
    const std::string gpx = routeToGpx(r, "t");
    EXPECT_EQ(count_of(gpx, "<desc>"), 0u);
    EXPECT_EQ(count_of(gpx, "<wpt "), 0u);
}

// ============================================================================
// Test Suite: gpxFileName
// ============================================================================

TEST(GpxExport, FileNameSanitized) {
    EXPECT_EQ(gpxFileName("My Route #1", 1714555800000LL),
              "My_Route__1_1714555800000.gpx");
    EXPECT_EQ(gpxFileName("ok-name_2", 5), "ok-name_2_5.gpx");
}

TEST(GpxExport, FileNameTruncated) {
    const std::string name = gpxFileName(std::string(80, 'x'), 1);
    EXPECT_EQ(name, std::string(50, 'x') + "_1.gpx");
}
