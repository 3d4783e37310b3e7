#pragma once
/*
===============================================================================
INDEXING — Index domains for the wave model
===============================================================================

OVERVIEW
--------
The wave model iterates two kinds of index sets:

• dense catalogs: orders 0..numOrders-1 and aisles 0..numAisles-1,
  built with range(0, n);
• sparse domains: the items that actually occur in some order or aisle,
  collected into an IndexList in first-seen or ascending order.

IndexList keeps insertion order and does not deduplicate, so an index set
maps one-to-one onto the constraint or variable rows built from it.

    auto O = wavepick::range(0, instance.numOrders());
    for (int o : O) { ... }

    wavepick::IndexList items{4, 9, 12};
    items.push_back(17);

===============================================================================
*/

#include <cstddef>
#include <initializer_list>
#include <utility>
#include <vector>

namespace wavepick {

    /**
     * @class IndexList
     * @brief Finite ordered list of integer indices
     */
    class IndexList {
    private:
        std::vector<int> data_;

    public:
        IndexList() = default;

        IndexList(std::initializer_list<int> init)
            : data_(init)
        {
        }

        explicit IndexList(std::vector<int> v)
            : data_(std::move(v))
        {
        }

        void push_back(int v) { data_.push_back(v); }
        void reserve(std::size_t n) { data_.reserve(n); }

        auto begin() const noexcept { return data_.begin(); }
        auto end() const noexcept { return data_.end(); }

        int size() const noexcept { return static_cast<int>(data_.size()); }
        bool empty() const noexcept { return data_.empty(); }

        friend bool operator==(const IndexList&, const IndexList&) = default;
    };

    /**
     * @brief Half-open range [begin, end) as an IndexList
     * @note Returns an empty list when end <= begin
     */
    inline IndexList range(int begin, int end) {
        std::vector<int> v;
        if (end > begin) {
            v.reserve(static_cast<std::size_t>(end - begin));
            for (int i = begin; i < end; ++i) {
                v.push_back(i);
            }
        }
        return IndexList(std::move(v));
    }

} // namespace wavepick
