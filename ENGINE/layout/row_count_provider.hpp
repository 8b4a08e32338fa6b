#pragma once

#include <vector>

namespace rowscroll::layout {

// Data-source capability the layout needs from its host.
class RowCountProvider {
public:
    virtual ~RowCountProvider() = default;

    virtual int row_count() const = 0;
    virtual int item_count(int row) const = 0;
};

// Vector-backed provider. Rows outside the stored range report zero items.
class StaticRowCountProvider : public RowCountProvider {
public:
    StaticRowCountProvider() = default;
    explicit StaticRowCountProvider(std::vector<int> counts);

    int row_count() const override;
    int item_count(int row) const override;

    void set_counts(std::vector<int> counts);
    const std::vector<int>& counts() const { return counts_; }

    void insert_row(int row, int item_count);
    void remove_row(int row);
    void set_item_count(int row, int item_count);

private:
    std::vector<int> counts_;
};

std::vector<int> collect_row_counts(const RowCountProvider& provider);

}
