/*
 * Unit tests for the bounded undo/redo history
 */

#include <gtest/gtest.h>
#include "core/RouteHistory.hpp"

static HistoryEntry entry_with(int n) {
    HistoryEntry e;
    for (int i = 0; i < n; ++i) {
        Waypoint w;
        w.id = "wp" + std::to_string(i);
        w.coord = {static_cast<double>(i), 0.0};
        e.waypoints.push_back(w);
    }
    e.timestamp_ms = n;
    return e;
}

// ============================================================================
// Test Suite: RouteHistory_Cursor
// ============================================================================

TEST(RouteHistory_Cursor, EmptyHistory) {
    RouteHistory h;
    EXPECT_EQ(h.cursor(), -1);
    EXPECT_EQ(h.size(), 0u);
    EXPECT_FALSE(h.canUndo());
    EXPECT_FALSE(h.canRedo());
    EXPECT_EQ(h.undo(), nullptr);
    EXPECT_EQ(h.redo(), nullptr);
}

TEST(RouteHistory_Cursor, SingleEntryCannotUndo) {
    RouteHistory h;
    h.push(entry_with(1));
    EXPECT_EQ(h.cursor(), 0);
    EXPECT_FALSE(h.canUndo());
    EXPECT_EQ(h.undo(), nullptr);
    EXPECT_EQ(h.cursor(), 0);
}

TEST(RouteHistory_Cursor, UndoRedoWalk) {
    RouteHistory h;
    h.push(entry_with(0));
    h.push(entry_with(1));
    h.push(entry_with(2));

    const HistoryEntry *e = h.undo();
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->waypoints.size(), 1u);
    EXPECT_TRUE(h.canRedo());

    e = h.undo();
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->waypoints.size(), 0u);
    EXPECT_FALSE(h.canUndo());

    e = h.redo();
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->waypoints.size(), 1u);
}

TEST(RouteHistory_Cursor, PushDropsRedoBranch) {
    RouteHistory h;
    h.push(entry_with(0));
    h.push(entry_with(1));
    h.push(entry_with(2));
    h.undo();
    h.undo();
    h.push(entry_with(5));
    EXPECT_EQ(h.size(), 2u);
    EXPECT_FALSE(h.canRedo());
    EXPECT_EQ(h.entries().back().waypoints.size(), 5u);
}

TEST(RouteHistory_Cursor, SeedReplacesEverything) {
    RouteHistory h;
    h.push(entry_with(0));
    h.push(entry_with(1));
    h.seed(entry_with(3));
    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(h.cursor(), 0);
    EXPECT_FALSE(h.canUndo());
}

// ============================================================================
// Test Suite: RouteHistory_Capacity
// ============================================================================

TEST(RouteHistory_Capacity, DefaultIsFifty) {
    RouteHistory h;
    for (int i = 0; i < 120; ++i)
        h.push(entry_with(i % 7));
    EXPECT_EQ(h.capacity(), 50u);
    EXPECT_EQ(h.size(), 50u);
    EXPECT_EQ(h.cursor(), 49);
}

TEST(RouteHistory_Capacity, EvictsOldestFirst) {
    RouteHistory h(3);
    for (int i = 0; i < 5; ++i)
        h.push(entry_with(i));
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h.entries()[0].timestamp_ms, 2);
    EXPECT_EQ(h.entries()[2].timestamp_ms, 4);
}

TEST(RouteHistory_Capacity, ZeroCapacityClampsToOne) {
    RouteHistory h(0);
    h.push(entry_with(1));
    h.push(entry_with(2));
    EXPECT_EQ(h.size(), 1u);
    EXPECT_EQ(h.cursor(), 0);
}
