/**
 * @file sequencer.cpp
 * @brief Midpoint keys, first-time keys and renormalization.
 */

#include "sequencer/sequencer.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace gantt_engine {

namespace {

std::vector<SortKeyAssignment> spaced(const std::vector<SequencedItem>& ordered, double gap) {
    std::vector<SortKeyAssignment> out;
    out.reserve(ordered.size());
    for (size_t i = 0; i < ordered.size(); ++i) {
        out.push_back({ordered[i].id, ordered[i].kind, static_cast<double>(i + 1) * gap});
    }
    return out;
}

void apply_keys(std::vector<SequencedItem>& items, const std::vector<SortKeyAssignment>& keys) {
    std::unordered_map<ItemId, double> by_id;
    for (const auto& key : keys) by_id[key.id] = key.sort_order;
    for (auto& item : items) {
        if (auto it = by_id.find(item.id); it != by_id.end()) item.sort_order = it->second;
    }
}

}  // anonymous namespace

std::vector<SequencedItem> items_from_snapshot(const GraphSnapshot& snapshot) {
    std::vector<SequencedItem> items;
    items.reserve(snapshot.tasks.size() + snapshot.milestones.size());
    for (const auto& task : snapshot.tasks) {
        items.push_back({task.id, ItemKind::Task, task.sort_order, task.creation_index,
                         task.start_date ? task.start_date : task.due_date});
    }
    for (const auto& milestone : snapshot.milestones) {
        items.push_back({milestone.id, ItemKind::Milestone, milestone.sort_order,
                         milestone.creation_index, milestone.due_date});
    }
    return items;
}

Sequencer::Sequencer(SequencerConfig config)
    : config_(config), scale_(std::pow(10.0, config.precision_digits)) {}

double Sequencer::round_key(double key) const noexcept {
    return std::round(key * scale_) / scale_;
}

Result<double> Sequencer::midpoint(std::optional<double> prev, std::optional<double> next) const {
    const double low = prev.value_or(0.0);
    const double high = next.value_or(low + 1.0);

    const double lo = round_key(low);
    const double hi = round_key(high);
    const double mid = round_key((low + high) / 2.0);

    if (!(lo < mid && mid < hi)) {
        return make_error<double>(ErrorCode::SequencerPrecisionExhausted,
                                  "No room for a key between neighbours");
    }
    return mid;
}

std::vector<SequencedItem> Sequencer::current_order(std::vector<SequencedItem> items) {
    std::stable_sort(items.begin(), items.end(), [](const SequencedItem& a, const SequencedItem& b) {
        if (a.sort_order != b.sort_order) return a.sort_order < b.sort_order;
        return a.creation_index < b.creation_index;
    });
    return items;
}

std::vector<SortKeyAssignment> Sequencer::renormalize(const std::vector<SequencedItem>& items) const {
    return spaced(current_order(items), config_.renormalize_gap);
}

std::vector<SortKeyAssignment> Sequencer::initial_keys(const std::vector<SequencedItem>& items) const {
    const bool all_zero = std::ranges::all_of(items, [](const SequencedItem& item) {
        return item.sort_order == 0.0;
    });
    if (!all_zero || items.empty()) return {};

    auto ordered = items;
    std::stable_sort(ordered.begin(), ordered.end(), [](const SequencedItem& a, const SequencedItem& b) {
        // Undated items go last.
        if (a.anchor_date != b.anchor_date) {
            if (!a.anchor_date) return false;
            if (!b.anchor_date) return true;
            return *a.anchor_date < *b.anchor_date;
        }
        return a.creation_index < b.creation_index;
    });
    return spaced(ordered, config_.renormalize_gap);
}

Result<ReorderResult> Sequencer::reorder(std::vector<SequencedItem> items,
                                         const ItemId& item,
                                         const std::optional<ItemId>& prev_id,
                                         const std::optional<ItemId>& next_id) const {
    auto index_of = [&](const ItemId& id) -> std::optional<size_t> {
        for (size_t i = 0; i < items.size(); ++i) {
            if (items[i].id == id) return i;
        }
        return std::nullopt;
    };

    for (const auto* id : {&item, prev_id ? &*prev_id : nullptr, next_id ? &*next_id : nullptr}) {
        if (id && !index_of(*id)) {
            return make_error<ReorderResult>(ErrorCode::UnknownItem, "Item " + *id + " not found");
        }
    }
    if ((prev_id && *prev_id == item) || (next_id && *next_id == item) ||
        (prev_id && next_id && *prev_id == *next_id)) {
        return make_error<ReorderResult>(ErrorCode::InvalidNeighbors,
                                         "An item cannot be its own neighbour");
    }

    ReorderResult result;
    result.item = item;

    if (auto keys = initial_keys(items); !keys.empty()) {
        apply_keys(items, keys);
        result.rekeyed = std::move(keys);
        result.initialized = true;
    }

    if (prev_id && next_id) {
        const auto ordered = current_order(items);
        auto position = [&](const ItemId& id) {
            return std::ranges::find(ordered, id, &SequencedItem::id) - ordered.begin();
        };
        if (position(*prev_id) > position(*next_id)) {
            return make_error<ReorderResult>(ErrorCode::InvalidNeighbors,
                "Item " + *prev_id + " is ordered after " + *next_id);
        }
    }

    auto key_of = [&](const std::optional<ItemId>& id) -> std::optional<double> {
        if (!id) return std::nullopt;
        return items[*index_of(*id)].sort_order;
    };

    auto mid = midpoint(key_of(prev_id), key_of(next_id));
    if (!mid && mid.error().code == ErrorCode::SequencerPrecisionExhausted) {
        auto keys = renormalize(items);
        apply_keys(items, keys);
        result.rekeyed = std::move(keys);
        result.renormalized = true;
        mid = midpoint(key_of(prev_id), key_of(next_id));
    }
    if (!mid) return mid.error();

    result.sort_order = *mid;
    std::erase_if(result.rekeyed, [&](const SortKeyAssignment& key) { return key.id == item; });
    return result;
}

}  // namespace gantt_engine
