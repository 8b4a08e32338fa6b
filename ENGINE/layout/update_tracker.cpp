#include "layout/update_tracker.hpp"

#include <algorithm>
#include <string>

#include "layout/layout_cache.hpp"
#include "layout/row_count_provider.hpp"
#include "utils/log.hpp"

namespace rowscroll::layout {
namespace {

constexpr std::string_view kLogTag = "UpdateTracker";

const char* action_name(UpdateAction action) {
    return action == UpdateAction::Insert ? "insert" : "delete";
}

}

UpdateTracker::UpdateTracker(LayoutCache& cache)
: cache_(cache) {}

void UpdateTracker::begin(const std::vector<UpdateItem>& items, const RowCountProvider* provider, float container_width) {
    if (state_ == State::Collecting) {
        rowscroll::log::warn(kLogTag, "Update batch began while another batch is open; appending to it.");
    }
    state_ = State::Collecting;
    if (!provider) {
        rowscroll::log::warn(kLogTag, "No row count provider attached; inserts will be recorded but not laid out.");
    }
    for (const UpdateItem& item : items) {
        apply(item, provider, container_width);
    }
}

void UpdateTracker::end() {
    inserted_items_.clear();
    removed_items_.clear();
    inserted_rows_.clear();
    removed_rows_.clear();
    state_ = State::Idle;
}

bool UpdateTracker::empty() const {
    return inserted_items_.empty() && removed_items_.empty() && inserted_rows_.empty() && removed_rows_.empty();
}

bool UpdateTracker::was_row_inserted(int row) const {
    return std::find(inserted_rows_.begin(), inserted_rows_.end(), row) != inserted_rows_.end();
}

bool UpdateTracker::was_row_removed(int row) const {
    return std::find(removed_rows_.begin(), removed_rows_.end(), row) != removed_rows_.end();
}

void UpdateTracker::apply(const UpdateItem& item, const RowCountProvider* provider, float container_width) {
    if (!item.row) {
        if (item.column) {
            rowscroll::log::warn(kLogTag, std::string{"Skipping "} + action_name(item.action) +
                                          " for column " + std::to_string(*item.column) + " without a row.");
        } else {
            rowscroll::log::warn(kLogTag, std::string{"Skipping unresolvable "} + action_name(item.action) + ".");
        }
        return;
    }

    const int row = *item.row;
    if (item.action == UpdateAction::Insert) {
        if (item.column) {
            insert_item(IndexPath{row, *item.column}, provider, container_width);
        } else {
            insert_row(row, provider, container_width);
        }
        return;
    }

    if (item.column) {
        removed_items_.push_back(IndexPath{row, *item.column});
    } else {
        removed_rows_.push_back(row);
    }
}

void UpdateTracker::insert_row(int row, const RowCountProvider* provider, float container_width) {
    inserted_rows_.push_back(row);
    if (!provider) {
        return;
    }
    const int count = provider->item_count(row);
    if (count <= 0) {
        rowscroll::log::debug(kLogTag, "Inserted row " + std::to_string(row) + " has no items; nothing to lay out.");
    }
    cache_.materialize_row(row, count, container_width);
}

void UpdateTracker::insert_item(IndexPath index, const RowCountProvider* provider, float container_width) {
    inserted_items_.push_back(index);
    if (!provider) {
        return;
    }
    const int count = provider->item_count(index.row);
    if (count <= 0) {
        rowscroll::log::warn(kLogTag, "Item inserted into row " + std::to_string(index.row) +
                                      " but the data source reports no items; row left empty.");
    }
    cache_.refresh_row(index.row, count, container_width);
}

}
