/*
 * Tests for display formatting and the navigation view model
 */

#include <gtest/gtest.h>
#include "core/Formatters.hpp"

using namespace fmt_utils;

// ============================================================================
// Test Suite: Distance / duration / speed strings
// ============================================================================

TEST(Formatters, DistanceBelowOneKilometre) {
    EXPECT_EQ(formatDistance(0.0), "0 m");
    EXPECT_EQ(formatDistance(999.0), "999 m");
    EXPECT_EQ(formatDistance(12.4), "12 m");
    EXPECT_EQ(formatDistance(12.6), "13 m");
}

TEST(Formatters, DistanceInKilometres) {
    EXPECT_EQ(formatDistance(1000.0), "1.0 km");
    EXPECT_EQ(formatDistance(1500.0), "1.5 km");
    EXPECT_EQ(formatDistance(42195.0), "42.2 km");
}

TEST(Formatters, Duration) {
    EXPECT_EQ(formatDuration(0.0), "0 min");
    EXPECT_EQ(formatDuration(45 * 60.0), "45 min");
    EXPECT_EQ(formatDuration(59.9), "0 min");
    EXPECT_EQ(formatDuration(90 * 60.0), "1h 30m");
    EXPECT_EQ(formatDuration(2 * 3600.0), "2h 0m");
}

TEST(Formatters, Speed) {
    EXPECT_DOUBLE_EQ(mpsToKmh(10.0), 36.0);
    EXPECT_EQ(formatSpeed(10.0), "36.0 km/h");
    EXPECT_EQ(formatSpeed(0.0), "0.0 km/h");
}

TEST(Formatters, TimeRemaining) {
    EXPECT_EQ(formatTimeRemaining(std::nullopt), "--:--");
    EXPECT_EQ(formatTimeRemaining(600.0), "10 min");
}

TEST(Formatters, EstimateNeedsMovement) {
    EXPECT_FALSE(estimateTimeRemaining(1000.0, 0.0).has_value());
    EXPECT_FALSE(estimateTimeRemaining(1000.0, 0.5).has_value());
    auto eta = estimateTimeRemaining(1000.0, 5.0);
    ASSERT_TRUE(eta.has_value());
    EXPECT_DOUBLE_EQ(*eta, 200.0);
    EXPECT_FALSE(estimateTimeRemaining(1000.0, 2.0, 3.0).has_value());
}

// ============================================================================
// Test Suite: NavigationViewModel
// ============================================================================

TEST(ViewModel, IdleSnapshot) {
    NavigationSnapshot s;
    NavigationViewModel vm = buildViewModel(s);
    EXPECT_FALSE(vm.is_navigating);
    EXPECT_FALSE(vm.is_paused);
    EXPECT_EQ(vm.time_remaining, "--:--");
    EXPECT_EQ(vm.speed, "0.0 km/h");
}

TEST(ViewModel, ActiveSnapshot) {
    NavigationSnapshot s;
    s.status = NavigationStatus::Active;
    s.route_name = "Loop";
    s.smoothed_speed = 5.0;
    s.distance_traveled = 250.0;
    s.distance_remaining = 2500.0;
    s.has_eta = true;
    s.eta_seconds = 500.0;
    s.progress_percent = 9.09;
    s.is_off_route = true;
    s.distance_from_route = 72.0;

    NavigationViewModel vm = buildViewModel(s);
    EXPECT_TRUE(vm.is_navigating);
    EXPECT_FALSE(vm.is_paused);
    EXPECT_TRUE(vm.is_off_route);
    EXPECT_EQ(vm.route_name, "Loop");
    EXPECT_DOUBLE_EQ(vm.speed_kmh, 18.0);
    EXPECT_EQ(vm.speed, "18.0 km/h");
    EXPECT_EQ(vm.distance_traveled, "250 m");
    EXPECT_EQ(vm.distance_remaining, "2.5 km");
    EXPECT_EQ(vm.time_remaining, "8 min");
    EXPECT_DOUBLE_EQ(vm.progress_percent, 9.09);
    EXPECT_DOUBLE_EQ(vm.distance_from_route, 72.0);
}

TEST(ViewModel, PausedIsStillNavigating) {
    NavigationSnapshot s;
    s.status = NavigationStatus::Paused;
    NavigationViewModel vm = buildViewModel(s);
    EXPECT_TRUE(vm.is_navigating);
    EXPECT_TRUE(vm.is_paused);
}
