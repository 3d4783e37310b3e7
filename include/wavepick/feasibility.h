#pragma once
/*
===============================================================================
FEASIBILITY — Independent re-check of a candidate wave
===============================================================================

OVERVIEW
--------
The MILP answer is trusted only after this check passes. The check re-derives
feasibility from the instance data alone, without looking at the model, so a
formulation defect or a solver tolerance issue cannot slip through.

A wave is feasible iff

    1. at least one order is selected and at least one aisle is visited,
    2. every index refers to an existing order or aisle,
    3. total picked units lie in [lower, upper],
    4. for every item, units picked <= units available in the visited aisles.

checkFeasibility() returns a FeasibilityReport that names the first rule that
failed (and for rule 4 the first offending item, in ascending item order).
isFeasible() is the boolean view. Both are pure: repeated calls on the same
arguments give the same answer.

COMPLEXITY
----------
O(numItems + entries of the selected orders and visited aisles).

===============================================================================
*/

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "instance.h"
#include "solution.h"

namespace wavepick {

    enum class FeasibilityIssue {
        None,
        NoOrders,
        NoAisles,
        UnknownOrder,
        UnknownAisle,
        BelowLowerBound,
        AboveUpperBound,
        ItemShortage
    };

    inline std::string_view feasibilityIssueName(FeasibilityIssue issue) {
        switch (issue) {
            case FeasibilityIssue::None:            return "none";
            case FeasibilityIssue::NoOrders:        return "no orders selected";
            case FeasibilityIssue::NoAisles:        return "no aisles visited";
            case FeasibilityIssue::UnknownOrder:    return "unknown order";
            case FeasibilityIssue::UnknownAisle:    return "unknown aisle";
            case FeasibilityIssue::BelowLowerBound: return "below wave lower bound";
            case FeasibilityIssue::AboveUpperBound: return "above wave upper bound";
            case FeasibilityIssue::ItemShortage:    return "item over-picked";
        }
        return "unknown";
    }

    /**
     * @brief Verdict of checkFeasibility with the first violation found
     *
     * @details index is the offending order/aisle for Unknown*, the item for
     *          ItemShortage, and -1 otherwise. picked/available are the item's
     *          totals for ItemShortage.
     */
    struct FeasibilityReport {
        bool feasible = false;
        FeasibilityIssue issue = FeasibilityIssue::None;
        long long totalUnits = 0;
        int index = -1;
        long long picked = 0;
        long long available = 0;

        std::string describe() const {
            switch (issue) {
                case FeasibilityIssue::None:
                    return std::format("feasible, {} units", totalUnits);
                case FeasibilityIssue::UnknownOrder:
                case FeasibilityIssue::UnknownAisle:
                    return std::format("{} {}", feasibilityIssueName(issue), index);
                case FeasibilityIssue::BelowLowerBound:
                case FeasibilityIssue::AboveUpperBound:
                    return std::format("{}: {} units", feasibilityIssueName(issue), totalUnits);
                case FeasibilityIssue::ItemShortage:
                    return std::format("{}: item {} picked {} of {} available",
                        feasibilityIssueName(issue), index, picked, available);
                default:
                    return std::string(feasibilityIssueName(issue));
            }
        }
    };

    /**
     * @brief Per-item units picked and available for one candidate wave
     */
    struct ItemBalance {
        std::vector<long long> picked;
        std::vector<long long> available;

        long long totalPicked() const {
            long long total = 0;
            for (long long p : picked) total += p;
            return total;
        }
    };

    /**
     * @brief Accumulate per-item totals over the selection
     * @pre every index of the solution refers to an existing order/aisle
     */
    inline ItemBalance computeItemBalance(const Instance& instance, const CandidateSolution& solution) {
        const auto n = static_cast<std::size_t>(instance.numItems());
        ItemBalance balance{ std::vector<long long>(n, 0), std::vector<long long>(n, 0) };

        for (int o : solution.orders()) {
            for (const auto& [item, qty] : instance.order(o)) {
                balance.picked[static_cast<std::size_t>(item)] += qty;
            }
        }
        for (int a : solution.aisles()) {
            for (const auto& [item, qty] : instance.aisle(a)) {
                balance.available[static_cast<std::size_t>(item)] += qty;
            }
        }
        return balance;
    }

    inline FeasibilityReport checkFeasibility(const Instance& instance, const CandidateSolution& solution) {
        FeasibilityReport report;

        if (solution.orders().empty()) {
            report.issue = FeasibilityIssue::NoOrders;
            return report;
        }
        if (solution.aisles().empty()) {
            report.issue = FeasibilityIssue::NoAisles;
            return report;
        }

        for (int o : solution.orders()) {
            if (o < 0 || o >= instance.numOrders()) {
                report.issue = FeasibilityIssue::UnknownOrder;
                report.index = o;
                return report;
            }
        }
        for (int a : solution.aisles()) {
            if (a < 0 || a >= instance.numAisles()) {
                report.issue = FeasibilityIssue::UnknownAisle;
                report.index = a;
                return report;
            }
        }

        const ItemBalance balance = computeItemBalance(instance, solution);
        report.totalUnits = balance.totalPicked();

        if (report.totalUnits < instance.bounds().lower) {
            report.issue = FeasibilityIssue::BelowLowerBound;
            return report;
        }
        if (report.totalUnits > instance.bounds().upper) {
            report.issue = FeasibilityIssue::AboveUpperBound;
            return report;
        }

        for (std::size_t item = 0; item < balance.picked.size(); ++item) {
            if (balance.picked[item] > balance.available[item]) {
                report.issue = FeasibilityIssue::ItemShortage;
                report.index = static_cast<int>(item);
                report.picked = balance.picked[item];
                report.available = balance.available[item];
                return report;
            }
        }

        report.feasible = true;
        return report;
    }

    inline bool isFeasible(const Instance& instance, const CandidateSolution& solution) {
        return checkFeasibility(instance, solution).feasible;
    }

} // namespace wavepick
