#pragma once
/*
===============================================================================
INSTANCE — Orders, aisles and wave bounds of one picking wave
===============================================================================

OVERVIEW
--------
An Instance is the read-only input of a solve:

    orders      order o requests quantity q of item i   (o -> {i -> q})
    aisles      aisle a stocks quantity q of item i     (a -> {i -> q})
    numItems    items are 0..numItems-1
    bounds      total picked units must lie in [lower, upper]

Both catalogs are sparse maps keyed by item; an item absent from a map means
zero units. Construction validates the data and precomputes, once, the total
units of every order and the list of items that occur anywhere. After that the
object never changes; the formulation, validator and evaluator take it by
const reference.

VALIDATION
----------
Construction throws ModelConstructionError when

    • numItems < 1
    • an item index is outside [0, numItems)
    • a quantity is negative
    • lower < 0 or lower > upper

Zero quantities are dropped (absent and zero mean the same thing).

===============================================================================
*/

#include <cstddef>
#include <format>
#include <iterator>
#include <map>
#include <numeric>
#include <stdexcept>
#include <utility>
#include <vector>

#include "errors.h"
#include "indexing.h"

namespace wavepick {

    /// @brief item -> units, sorted by item
    using ItemQuantities = std::map<int, int>;

    /**
     * @brief Administrative band on the total units of a wave
     */
    struct WaveBounds {
        int lower = 0;
        int upper = 0;

        bool contains(long long units) const noexcept {
            return units >= lower && units <= upper;
        }
    };

    class Instance {
    public:
        /**
         * @throws ModelConstructionError if the data violates the input contract
         */
        Instance(std::vector<ItemQuantities> orders,
                 std::vector<ItemQuantities> aisles,
                 int numItems,
                 WaveBounds bounds)
            : orders_(std::move(orders)),
              aisles_(std::move(aisles)),
              numItems_(numItems),
              bounds_(bounds)
        {
            if (numItems_ < 1) {
                throw ModelConstructionError(
                    std::format("instance: item count must be at least 1, got {}", numItems_));
            }
            if (bounds_.lower < 0 || bounds_.lower > bounds_.upper) {
                throw ModelConstructionError(
                    std::format("instance: invalid wave bounds [{}, {}]",
                        bounds_.lower, bounds_.upper));
            }

            normalize(orders_, "order");
            normalize(aisles_, "aisle");

            orderUnits_.reserve(orders_.size());
            for (const auto& order : orders_) {
                orderUnits_.push_back(std::accumulate(order.begin(), order.end(), 0LL,
                    [](long long acc, const auto& entry) { return acc + entry.second; }));
            }

            std::vector<bool> seen(static_cast<std::size_t>(numItems_), false);
            auto mark = [&](const std::vector<ItemQuantities>& catalog) {
                for (const auto& entries : catalog) {
                    for (const auto& [item, qty] : entries) {
                        seen[static_cast<std::size_t>(item)] = true;
                    }
                }
            };
            mark(orders_);
            mark(aisles_);
            for (int item = 0; item < numItems_; ++item) {
                if (seen[static_cast<std::size_t>(item)]) {
                    activeItems_.push_back(item);
                }
            }
        }

        int numOrders() const noexcept { return static_cast<int>(orders_.size()); }
        int numAisles() const noexcept { return static_cast<int>(aisles_.size()); }
        int numItems() const noexcept { return numItems_; }
        const WaveBounds& bounds() const noexcept { return bounds_; }

        /// @throws std::out_of_range for an unknown order
        const ItemQuantities& order(int o) const { return orders_.at(checked(o, orders_.size(), "order")); }

        /// @throws std::out_of_range for an unknown aisle
        const ItemQuantities& aisle(int a) const { return aisles_.at(checked(a, aisles_.size(), "aisle")); }

        const std::vector<ItemQuantities>& orders() const noexcept { return orders_; }
        const std::vector<ItemQuantities>& aisles() const noexcept { return aisles_; }

        /// @brief Sum of requested units of order o (precomputed)
        long long orderUnits(int o) const { return orderUnits_.at(checked(o, orders_.size(), "order")); }

        /// @brief Items requested by some order or stocked in some aisle, ascending
        const IndexList& activeItems() const noexcept { return activeItems_; }

        /// @brief Number of (order, item) plus (aisle, item) entries
        std::size_t entryCount() const noexcept {
            std::size_t n = 0;
            for (const auto& o : orders_) n += o.size();
            for (const auto& a : aisles_) n += a.size();
            return n;
        }

    private:
        void normalize(std::vector<ItemQuantities>& catalog, const char* kind) const {
            for (std::size_t k = 0; k < catalog.size(); ++k) {
                auto& entries = catalog[k];
                for (auto it = entries.begin(); it != entries.end(); ) {
                    const auto [item, qty] = *it;
                    if (item < 0 || item >= numItems_) {
                        throw ModelConstructionError(
                            std::format("instance: {} {} references item {} outside [0, {})",
                                kind, k, item, numItems_));
                    }
                    if (qty < 0) {
                        throw ModelConstructionError(
                            std::format("instance: {} {} has negative quantity {} for item {}",
                                kind, k, qty, item));
                    }
                    it = (qty == 0) ? entries.erase(it) : std::next(it);
                }
            }
        }

        static std::size_t checked(int index, std::size_t size, const char* kind) {
            if (index < 0 || static_cast<std::size_t>(index) >= size) {
                throw std::out_of_range(
                    std::format("instance: {} {} out of range [0, {})", kind, index, size));
            }
            return static_cast<std::size_t>(index);
        }

        std::vector<ItemQuantities> orders_;
        std::vector<ItemQuantities> aisles_;
        int numItems_;
        WaveBounds bounds_;

        std::vector<long long> orderUnits_;
        IndexList activeItems_;
    };

} // namespace wavepick
