#pragma once
/*
===============================================================================
SOLUTION — A candidate wave: selected orders and visited aisles
===============================================================================

A CandidateSolution is produced once, by the extractor or by reading a stored
wave, and is only read afterwards. Index sets are ordered so that reports and
solution files list indices ascending.

Nothing here checks the selection against an instance; that is the job of the
feasibility validator.

===============================================================================
*/

#include <ostream>
#include <set>
#include <utility>

namespace wavepick {

    class CandidateSolution {
    public:
        CandidateSolution() = default;

        CandidateSolution(std::set<int> orders, std::set<int> aisles)
            : orders_(std::move(orders)), aisles_(std::move(aisles)) {
        }

        const std::set<int>& orders() const noexcept { return orders_; }
        const std::set<int>& aisles() const noexcept { return aisles_; }

        /// @brief True if either side is empty (such a wave is never valid)
        bool empty() const noexcept { return orders_.empty() || aisles_.empty(); }

        friend bool operator==(const CandidateSolution&, const CandidateSolution&) = default;

    private:
        std::set<int> orders_;
        std::set<int> aisles_;
    };

    inline std::ostream& operator<<(std::ostream& os, const CandidateSolution& s)
    {
        auto print = [&](const std::set<int>& xs) {
            os << "{";
            bool first = true;
            for (int x : xs) {
                if (!first) os << ",";
                os << x;
                first = false;
            }
            os << "}";
        };
        os << "orders=";
        print(s.orders());
        os << " aisles=";
        print(s.aisles());
        return os;
    }

} // namespace wavepick
