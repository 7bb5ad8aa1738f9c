/**
 * @file sequencer.hpp
 * @brief Dense real-valued display order for tasks and milestones.
 *
 * An item moved between two neighbours gets the midpoint of their keys, so a
 * reorder writes one row. Keys are stored rounded to a fixed number of
 * decimals; once a midpoint can no longer land strictly between its
 * neighbours every item is rekeyed at an even spacing and the insertion is
 * retried once.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/snapshot.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace gantt_engine {

enum class ItemKind : uint8_t {
    Task,
    Milestone
};

[[nodiscard]] constexpr std::string_view to_string(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::Task:      return "task";
        case ItemKind::Milestone: return "milestone";
    }
    return "unknown";
}

/**
 * @brief An entry of the shared task/milestone ordering space.
 */
struct SequencedItem {
    ItemId id;
    ItemKind kind = ItemKind::Task;
    double sort_order = 0.0;
    uint64_t creation_index = 0;
    std::optional<Date> anchor_date;   ///< Used only for first-time keys
};

struct SortKeyAssignment {
    ItemId id;
    ItemKind kind = ItemKind::Task;
    double sort_order = 0.0;

    bool operator==(const SortKeyAssignment&) const = default;
};

struct ReorderResult {
    ItemId item;
    double sort_order = 0.0;                  ///< New key of the moved item
    std::vector<SortKeyAssignment> rekeyed;   ///< Other items whose key changed
    bool renormalized = false;
    bool initialized = false;
};

/// Tasks and milestones of a snapshot as sequenced items.
[[nodiscard]] std::vector<SequencedItem> items_from_snapshot(const GraphSnapshot& snapshot);

class Sequencer {
public:
    explicit Sequencer(SequencerConfig config = {});

    /**
     * @brief Key halfway between two neighbours.
     *
     * A missing previous neighbour counts as 0, a missing next one as
     * previous + 1. Fails with SequencerPrecisionExhausted when the rounded
     * midpoint is not strictly between the rounded neighbours.
     */
    [[nodiscard]] Result<double> midpoint(std::optional<double> prev,
                                          std::optional<double> next) const;

    /**
     * @brief Move `item` between `prev_id` and `next_id` (either may be absent).
     *
     * Assigns first-time keys when every key is still 0, and renormalizes
     * once on precision exhaustion.
     *
     * Errors: UnknownItem, InvalidNeighbors.
     */
    [[nodiscard]] Result<ReorderResult> reorder(std::vector<SequencedItem> items,
                                                const ItemId& item,
                                                const std::optional<ItemId>& prev_id,
                                                const std::optional<ItemId>& next_id) const;

    /// Evenly spaced keys, gap apart, in current order.
    [[nodiscard]] std::vector<SortKeyAssignment> renormalize(const std::vector<SequencedItem>& items) const;

    /// Evenly spaced keys by date then creation, or empty unless every key is 0.
    [[nodiscard]] std::vector<SortKeyAssignment> initial_keys(const std::vector<SequencedItem>& items) const;

    /// Ascending key, ties by creation order.
    [[nodiscard]] static std::vector<SequencedItem> current_order(std::vector<SequencedItem> items);

    [[nodiscard]] double round_key(double key) const noexcept;

    [[nodiscard]] const SequencerConfig& config() const noexcept { return config_; }

private:
    SequencerConfig config_;
    double scale_;
};

}  // namespace gantt_engine
