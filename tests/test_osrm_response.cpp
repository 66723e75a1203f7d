/*
 * Tests for the OSRM client's request path and response parsing (no network)
 */

#include <gtest/gtest.h>
#include <stdexcept>
#include "infra/OsrmRoutingClient.hpp"

namespace {

const char *kOkBody = R"({
  "code": "Ok",
  "routes": [{
    "distance": 1234.5,
    "duration": 300.2,
    "weight_name": "cyclability",
    "weight": 310.0,
    "geometry": {
      "type": "LineString",
      "coordinates": [[-0.12, 51.5], [-0.115, 51.505], [-0.11, 51.51]]
    },
    "legs": [{
      "distance": 1234.5,
      "duration": 300.2,
      "summary": "Mall",
      "steps": [
        {"distance": 600.0, "duration": 150.0, "name": "The Mall",
         "maneuver": {"type": "depart", "location": [-0.12, 51.5]}},
        {"distance": 634.5, "duration": 150.2, "name": "",
         "maneuver": {"type": "turn", "modifier": "left",
                      "location": [-0.115, 51.505]}},
        {"distance": 0.0, "duration": 0.0, "name": "",
         "maneuver": {"type": "arrive", "instruction": "You have arrived",
                      "location": [-0.11, 51.51]}}
      ]
    }]
  }],
  "waypoints": [
    {"name": "The Mall", "location": [-0.12, 51.5], "distance": 2.1},
    {"name": "", "location": [-0.11, 51.51], "distance": 0.4}
  ]
})";

} // namespace

// ============================================================================
// Test Suite: buildRoutePath
// ============================================================================

TEST(OsrmRequest, PathOrdersLonLat) {
    std::vector<Coordinate> pts = {{51.5, -0.12}, {51.51, -0.11}};
    EXPECT_EQ(OsrmRoutingClient::buildRoutePath(pts, "bike"),
              "/route/v1/bike/-0.120000,51.500000;-0.110000,51.510000"
              "?overview=full&geometries=geojson&steps=true&alternatives=false");
}

TEST(OsrmRequest, TooFewPointsThrows) {
    OsrmRoutingClient client(RoutingParams{});
    std::vector<Coordinate> one = {{51.5, -0.12}};
    EXPECT_THROW(client.calculate(one, "bike"), std::runtime_error);
}

// ============================================================================
// Test Suite: parseRouteResponse
// ============================================================================

TEST(OsrmResponse, ParsesFirstRoute) {
    CalculatedRoute r = OsrmRoutingClient::parseRouteResponse(200, kOkBody);
    EXPECT_DOUBLE_EQ(r.distance_m, 1234.5);
    EXPECT_DOUBLE_EQ(r.duration_s, 300.2);

    ASSERT_EQ(r.geometry.size(), 3u);
    EXPECT_DOUBLE_EQ(r.geometry[0].latitude, 51.5);
    EXPECT_DOUBLE_EQ(r.geometry[0].longitude, -0.12);
    EXPECT_DOUBLE_EQ(r.geometry[2].latitude, 51.51);
}

TEST(OsrmResponse, FlattensStepsIntoInstructions) {
    CalculatedRoute r = OsrmRoutingClient::parseRouteResponse(200, kOkBody);
    ASSERT_EQ(r.instructions.size(), 3u);
    EXPECT_EQ(r.instructions[0].type, "depart");
    EXPECT_EQ(r.instructions[0].text, "The Mall");
    EXPECT_EQ(r.instructions[1].text, "turn");
    EXPECT_EQ(r.instructions[1].modifier, "left");
    EXPECT_DOUBLE_EQ(r.instructions[1].distance, 634.5);
    EXPECT_EQ(r.instructions[2].text, "You have arrived");
}

TEST(OsrmResponse, ErrorCodeThrows) {
    const std::string body =
        R"({"code": "NoRoute", "message": "Impossible route between points"})";
    try {
        OsrmRoutingClient::parseRouteResponse(200, body);
        FAIL() << "expected throw";
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string(e.what()).find("NoRoute"), std::string::npos);
    }
}

TEST(OsrmResponse, EmptyRoutesThrows) {
    EXPECT_THROW(OsrmRoutingClient::parseRouteResponse(
                     200, R"({"code": "Ok", "routes": []})"),
                 std::runtime_error);
}

TEST(OsrmResponse, NonOkStatusThrows) {
    try {
        OsrmRoutingClient::parseRouteResponse(
            400, R"({"code": "InvalidQuery", "message": "Query string malformed"})");
        FAIL() << "expected throw";
    } catch (const std::runtime_error &e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("400"), std::string::npos);
        EXPECT_NE(msg.find("InvalidQuery"), std::string::npos);
    }
    EXPECT_THROW(OsrmRoutingClient::parseRouteResponse(502, "<html>bad gateway</html>"),
                 std::runtime_error);
}

TEST(OsrmResponse, InvalidJsonThrows) {
    EXPECT_THROW(OsrmRoutingClient::parseRouteResponse(200, "{not json"),
                 std::runtime_error);
}
