/**
 * @file test_sequencer.cpp
 * @brief Unit tests for midpoint ordering keys and renormalization.
 */

#include "sequencer/sequencer.hpp"
#include "core/date.hpp"

#include <gtest/gtest.h>
#include <algorithm>

using namespace gantt_engine;

// ─── Helpers ─────────────────────────────────

static SequencedItem item(const std::string& id, double key, uint64_t created,
                          std::optional<Date> anchor = std::nullopt,
                          ItemKind kind = ItemKind::Task) {
    return SequencedItem{.id = id, .kind = kind, .sort_order = key,
                         .creation_index = created, .anchor_date = anchor};
}

static double key_of(const std::vector<SortKeyAssignment>& keys, const std::string& id) {
    auto it = std::ranges::find(keys, id, &SortKeyAssignment::id);
    return it == keys.end() ? -1.0 : it->sort_order;
}

// ─── Midpoint ────────────────────────────────

TEST(SequencerTest, MidpointBetweenNeighbours) {
    Sequencer sequencer;
    auto mid = sequencer.midpoint(1.0, 2.0);
    ASSERT_TRUE(mid.has_value());
    EXPECT_DOUBLE_EQ(*mid, 1.5);
}

TEST(SequencerTest, MidpointAtEitherEnd) {
    Sequencer sequencer;
    EXPECT_DOUBLE_EQ(*sequencer.midpoint(std::nullopt, 1.0), 0.5);
    EXPECT_DOUBLE_EQ(*sequencer.midpoint(3.0, std::nullopt), 3.5);
    EXPECT_DOUBLE_EQ(*sequencer.midpoint(std::nullopt, std::nullopt), 0.5);
}

TEST(SequencerTest, MidpointExhaustsAtStoredPrecision) {
    Sequencer sequencer;
    auto mid = sequencer.midpoint(1.0, 1.0000000001);
    ASSERT_FALSE(mid.has_value());
    EXPECT_EQ(mid.error().code, ErrorCode::SequencerPrecisionExhausted);

    Sequencer coarse(SequencerConfig{.renormalize_gap = 1.0, .precision_digits = 2});
    EXPECT_FALSE(coarse.midpoint(1.0, 1.01).has_value());
    EXPECT_TRUE(coarse.midpoint(1.0, 1.1).has_value());
}

TEST(SequencerTest, RoundKey) {
    Sequencer sequencer(SequencerConfig{.renormalize_gap = 1.0, .precision_digits = 3});
    EXPECT_DOUBLE_EQ(sequencer.round_key(1.23456), 1.235);
}

TEST(SequencerTest, RepeatedHalvingStaysStrictlyOrdered) {
    Sequencer sequencer;
    double low = 1.0;
    double high = 2.0;
    for (int i = 0; i < 20; ++i) {
        auto mid = sequencer.midpoint(low, high);
        ASSERT_TRUE(mid.has_value()) << "iteration " << i;
        EXPECT_LT(low, *mid);
        EXPECT_LT(*mid, high);
        high = *mid;
    }
}

// ─── Reorder ─────────────────────────────────

TEST(SequencerTest, ReorderBetweenNeighbours) {
    Sequencer sequencer;
    std::vector<SequencedItem> items{item("A", 1.0, 0), item("B", 2.0, 1), item("C", 3.0, 2)};

    auto result = sequencer.reorder(items, "C", std::string{"A"}, std::string{"B"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->item, "C");
    EXPECT_DOUBLE_EQ(result->sort_order, 1.5);
    EXPECT_TRUE(result->rekeyed.empty());
    EXPECT_FALSE(result->renormalized);
    EXPECT_FALSE(result->initialized);
}

TEST(SequencerTest, ReorderToTopAndBottom) {
    Sequencer sequencer;
    std::vector<SequencedItem> items{item("A", 1.0, 0), item("B", 2.0, 1), item("C", 3.0, 2)};

    auto top = sequencer.reorder(items, "C", std::nullopt, std::string{"A"});
    ASSERT_TRUE(top.has_value());
    EXPECT_LT(top->sort_order, 1.0);

    auto bottom = sequencer.reorder(items, "A", std::string{"C"}, std::nullopt);
    ASSERT_TRUE(bottom.has_value());
    EXPECT_GT(bottom->sort_order, 3.0);
}

TEST(SequencerTest, ExhaustedNeighboursTriggerRenormalization) {
    Sequencer sequencer;
    std::vector<SequencedItem> items{
        item("A", 1.0, 0), item("B", 1.0000000001, 1), item("C", 5.0, 2)};

    auto result = sequencer.reorder(items, "C", std::string{"A"}, std::string{"B"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->renormalized);
    EXPECT_DOUBLE_EQ(key_of(result->rekeyed, "A"), 1.0);
    EXPECT_DOUBLE_EQ(key_of(result->rekeyed, "B"), 2.0);
    EXPECT_DOUBLE_EQ(key_of(result->rekeyed, "C"), -1.0);   // moved item reported separately
    EXPECT_DOUBLE_EQ(result->sort_order, 1.5);
}

TEST(SequencerTest, SmallestAcceptedGapLeavesRoomAfterRenormalization) {
    Sequencer sequencer(SequencerConfig{.renormalize_gap = 2e-9, .precision_digits = 9});
    std::vector<SequencedItem> items{
        item("A", 1.0, 0), item("B", 1.0000000001, 1), item("C", 3.0, 2)};

    auto result = sequencer.reorder(items, "C", std::string{"A"}, std::string{"B"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->renormalized);
    EXPECT_NEAR(key_of(result->rekeyed, "A"), 2e-9, 1e-12);
    EXPECT_NEAR(key_of(result->rekeyed, "B"), 4e-9, 1e-12);
    EXPECT_NEAR(result->sort_order, 3e-9, 1e-12);
}

TEST(SequencerTest, FirstMoveAssignsInitialKeys) {
    Sequencer sequencer;
    const Date jan5 = *make_date(2026, 1, 5);
    const Date jan2 = *make_date(2026, 1, 2);
    std::vector<SequencedItem> items{
        item("A", 0.0, 0, jan5), item("B", 0.0, 1, jan2),
        item("M", 0.0, 2, jan5, ItemKind::Milestone), item("U", 0.0, 3)};

    auto result = sequencer.reorder(items, "U", std::nullopt, std::string{"B"});
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->initialized);
    EXPECT_DOUBLE_EQ(key_of(result->rekeyed, "B"), 1.0);
    EXPECT_DOUBLE_EQ(key_of(result->rekeyed, "A"), 2.0);
    EXPECT_DOUBLE_EQ(key_of(result->rekeyed, "M"), 3.0);
    EXPECT_DOUBLE_EQ(result->sort_order, 0.5);
}

TEST(SequencerTest, UnknownItemRejected) {
    Sequencer sequencer;
    std::vector<SequencedItem> items{item("A", 1.0, 0)};

    auto missing = sequencer.reorder(items, "Z", std::nullopt, std::nullopt);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::UnknownItem);

    auto bad_neighbour = sequencer.reorder(items, "A", std::string{"Z"}, std::nullopt);
    ASSERT_FALSE(bad_neighbour.has_value());
    EXPECT_EQ(bad_neighbour.error().code, ErrorCode::UnknownItem);
}

TEST(SequencerTest, InvalidNeighboursRejected) {
    Sequencer sequencer;
    std::vector<SequencedItem> items{item("A", 1.0, 0), item("B", 2.0, 1), item("C", 3.0, 2)};

    auto self = sequencer.reorder(items, "A", std::string{"A"}, std::nullopt);
    ASSERT_FALSE(self.has_value());
    EXPECT_EQ(self.error().code, ErrorCode::InvalidNeighbors);

    auto inverted = sequencer.reorder(items, "A", std::string{"C"}, std::string{"B"});
    ASSERT_FALSE(inverted.has_value());
    EXPECT_EQ(inverted.error().code, ErrorCode::InvalidNeighbors);
}

// ─── Ordering Helpers ────────────────────────

TEST(SequencerTest, CurrentOrderBreaksTiesByCreation) {
    auto ordered = Sequencer::current_order(
        {item("late", 1.0, 5), item("early", 1.0, 2), item("first", 0.5, 9)});
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0].id, "first");
    EXPECT_EQ(ordered[1].id, "early");
    EXPECT_EQ(ordered[2].id, "late");
}

TEST(SequencerTest, RenormalizeUsesConfiguredGap) {
    Sequencer sequencer(SequencerConfig{.renormalize_gap = 1000.0, .precision_digits = 9});
    auto keys = sequencer.renormalize({item("B", 0.7, 1), item("A", 0.2, 0)});
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], (SortKeyAssignment{"A", ItemKind::Task, 1000.0}));
    EXPECT_EQ(keys[1], (SortKeyAssignment{"B", ItemKind::Task, 2000.0}));
}

TEST(SequencerTest, InitialKeysOnlyWhenAllZero) {
    Sequencer sequencer;
    EXPECT_TRUE(sequencer.initial_keys({item("A", 1.0, 0), item("B", 0.0, 1)}).empty());
    EXPECT_EQ(sequencer.initial_keys({item("A", 0.0, 0), item("B", 0.0, 1)}).size(), 2u);
}

TEST(SequencerTest, ItemsFromSnapshotUseStartThenDue) {
    GraphSnapshot snapshot;
    snapshot.tasks = {Task{.id = "A", .name = "A", .due_date = make_date(2026, 2, 1)}};
    snapshot.milestones = {Milestone{.id = "M", .name = "M", .due_date = make_date(2026, 3, 1)}};

    auto items = items_from_snapshot(snapshot);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].anchor_date, make_date(2026, 2, 1));
    EXPECT_EQ(items[1].kind, ItemKind::Milestone);
}
