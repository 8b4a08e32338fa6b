#include "layout/row_count_provider.hpp"

#include <algorithm>
#include <utility>

namespace rowscroll::layout {

StaticRowCountProvider::StaticRowCountProvider(std::vector<int> counts)
: counts_(std::move(counts)) {}

int StaticRowCountProvider::row_count() const {
    return static_cast<int>(counts_.size());
}

int StaticRowCountProvider::item_count(int row) const {
    if (row < 0 || row >= row_count()) {
        return 0;
    }
    return counts_[static_cast<std::size_t>(row)];
}

void StaticRowCountProvider::set_counts(std::vector<int> counts) {
    counts_ = std::move(counts);
}

void StaticRowCountProvider::insert_row(int row, int item_count) {
    const int at = std::clamp(row, 0, row_count());
    counts_.insert(counts_.begin() + at, item_count);
}

void StaticRowCountProvider::remove_row(int row) {
    if (row < 0 || row >= row_count()) {
        return;
    }
    counts_.erase(counts_.begin() + row);
}

void StaticRowCountProvider::set_item_count(int row, int item_count) {
    if (row < 0) {
        return;
    }
    if (row >= row_count()) {
        counts_.resize(static_cast<std::size_t>(row) + 1, 0);
    }
    counts_[static_cast<std::size_t>(row)] = item_count;
}

std::vector<int> collect_row_counts(const RowCountProvider& provider) {
    const int rows = std::max(0, provider.row_count());
    std::vector<int> counts;
    counts.reserve(static_cast<std::size_t>(rows));
    for (int row = 0; row < rows; ++row) {
        counts.push_back(provider.item_count(row));
    }
    return counts;
}

}
