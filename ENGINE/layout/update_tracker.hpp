#pragma once

#include <optional>
#include <vector>

#include "layout/layout_types.hpp"

namespace rowscroll::layout {

class LayoutCache;
class RowCountProvider;

enum class UpdateAction {
    Insert,
    Delete,
};

// One host mutation. A missing column marks a whole-row update.
struct UpdateItem {
    UpdateAction       action = UpdateAction::Insert;
    std::optional<int> row;
    std::optional<int> column;

    static UpdateItem insert_row(int row) { return UpdateItem{UpdateAction::Insert, row, std::nullopt}; }
    static UpdateItem delete_row(int row) { return UpdateItem{UpdateAction::Delete, row, std::nullopt}; }
    static UpdateItem insert_item(int row, int column) { return UpdateItem{UpdateAction::Insert, row, column}; }
    static UpdateItem delete_item(int row, int column) { return UpdateItem{UpdateAction::Delete, row, column}; }
};

// Collects one batch of mutations between begin() and end(). Inserts are
// applied to the cache right away; deletes are only recorded and take effect at
// the next full recompute.
class UpdateTracker {
public:
    enum class State {
        Idle,
        Collecting,
    };

    explicit UpdateTracker(LayoutCache& cache);

    void begin(const std::vector<UpdateItem>& items, const RowCountProvider* provider, float container_width);
    void end();

    State state() const { return state_; }
    bool collecting() const { return state_ == State::Collecting; }
    bool empty() const;

    const std::vector<IndexPath>& inserted_items() const { return inserted_items_; }
    const std::vector<IndexPath>& removed_items() const { return removed_items_; }
    const std::vector<int>& inserted_rows() const { return inserted_rows_; }
    const std::vector<int>& removed_rows() const { return removed_rows_; }

    bool was_row_inserted(int row) const;
    bool was_row_removed(int row) const;

private:
    void apply(const UpdateItem& item, const RowCountProvider* provider, float container_width);
    void insert_row(int row, const RowCountProvider* provider, float container_width);
    void insert_item(IndexPath index, const RowCountProvider* provider, float container_width);

    LayoutCache& cache_;
    State state_ = State::Idle;

    std::vector<IndexPath> inserted_items_;
    std::vector<IndexPath> removed_items_;
    std::vector<int> inserted_rows_;
    std::vector<int> removed_rows_;
};

}
