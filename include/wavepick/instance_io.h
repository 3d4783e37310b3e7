#pragma once
/*
===============================================================================
INSTANCE I/O — Challenge text formats for instances and waves
===============================================================================

Instance file
-------------
    <numOrders> <numItems> <numAisles>
    <k> <item> <qty> ... <item> <qty>      one line per order, k pairs
    <l> <item> <qty> ... <item> <qty>      one line per aisle, l pairs
    <lowerBound> <upperBound>

Solution file
-------------
    <number of selected orders>
    <order index>                          one per line, ascending
    <number of visited aisles>
    <aisle index>                          one per line, ascending

Errors
------
Text that cannot be parsed throws InstanceFormatError carrying the 1-based
line number; data that parses but violates the instance contract throws
ModelConstructionError from the Instance constructor.

===============================================================================
*/

#include <cstddef>
#include <format>
#include <fstream>
#include <istream>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "instance.h"
#include "solution.h"

namespace wavepick {

    namespace io_detail {

        /// Line-oriented reader that skips blank lines and tracks line numbers
        class LineReader {
        public:
            explicit LineReader(std::istream& in) : in_(in) {}

            /// @throws InstanceFormatError at end of input
            std::istringstream next(const char* what) {
                std::string line;
                while (std::getline(in_, line)) {
                    ++line_;
                    if (line.find_first_not_of(" \t\r") != std::string::npos) {
                        return std::istringstream(line);
                    }
                }
                throw InstanceFormatError(std::format("unexpected end of input, expected {}", what), line_ + 1);
            }

            int line() const noexcept { return line_; }

            template<typename T>
            T read(std::istringstream& fields, const char* what) const {
                T value{};
                if (!(fields >> value)) {
                    throw InstanceFormatError(std::format("expected {}", what), line_);
                }
                return value;
            }

            void expectEnd(std::istringstream& fields) const {
                std::string extra;
                if (fields >> extra) {
                    throw InstanceFormatError(std::format("unexpected token '{}'", extra), line_);
                }
            }

        private:
            std::istream& in_;
            int line_ = 0;
        };

        inline std::vector<ItemQuantities> readCatalog(LineReader& reader, int count, const char* kind) {
            std::vector<ItemQuantities> catalog;
            catalog.reserve(static_cast<std::size_t>(count));

            for (int k = 0; k < count; ++k) {
                auto fields = reader.next(kind);
                const int pairs = reader.read<int>(fields, "entry count");
                if (pairs < 0) {
                    throw InstanceFormatError(std::format("{} {}: negative entry count {}", kind, k, pairs), reader.line());
                }

                ItemQuantities entries;
                for (int p = 0; p < pairs; ++p) {
                    const int item = reader.read<int>(fields, "item index");
                    const int qty = reader.read<int>(fields, "quantity");
                    if (!entries.emplace(item, qty).second) {
                        throw InstanceFormatError(std::format("{} {}: item {} listed twice", kind, k, item), reader.line());
                    }
                }
                reader.expectEnd(fields);
                catalog.push_back(std::move(entries));
            }
            return catalog;
        }

        inline std::set<int> readIndexBlock(LineReader& reader, const char* kind) {
            auto header = reader.next(kind);
            const int count = reader.read<int>(header, "count");
            reader.expectEnd(header);
            if (count < 0) {
                throw InstanceFormatError(std::format("negative {} count {}", kind, count), reader.line());
            }

            std::set<int> indices;
            for (int k = 0; k < count; ++k) {
                auto fields = reader.next(kind);
                const int index = reader.read<int>(fields, "index");
                reader.expectEnd(fields);
                if (!indices.insert(index).second) {
                    throw InstanceFormatError(std::format("{} {} listed twice", kind, index), reader.line());
                }
            }
            return indices;
        }

    } // namespace io_detail

    /**
     * @throws InstanceFormatError on malformed text
     * @throws ModelConstructionError on invalid data
     */
    inline Instance readInstance(std::istream& in) {
        io_detail::LineReader reader(in);

        auto header = reader.next("header");
        const int numOrders = reader.read<int>(header, "order count");
        const int numItems = reader.read<int>(header, "item count");
        const int numAisles = reader.read<int>(header, "aisle count");
        reader.expectEnd(header);
        if (numOrders < 0 || numAisles < 0) {
            throw InstanceFormatError(
                std::format("negative catalog size ({} orders, {} aisles)", numOrders, numAisles), reader.line());
        }

        auto orders = io_detail::readCatalog(reader, numOrders, "order");
        auto aisles = io_detail::readCatalog(reader, numAisles, "aisle");

        auto boundsLine = reader.next("wave bounds");
        WaveBounds bounds;
        bounds.lower = reader.read<int>(boundsLine, "lower bound");
        bounds.upper = reader.read<int>(boundsLine, "upper bound");
        reader.expectEnd(boundsLine);

        return Instance(std::move(orders), std::move(aisles), numItems, bounds);
    }

    /// @throws InstanceFormatError if the file cannot be opened or parsed
    inline Instance loadInstance(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw InstanceFormatError(std::format("cannot open instance file '{}'", path));
        }
        return readInstance(in);
    }

    inline void writeSolution(std::ostream& out, const CandidateSolution& solution) {
        out << solution.orders().size() << '\n';
        for (int o : solution.orders()) {
            out << o << '\n';
        }
        out << solution.aisles().size() << '\n';
        for (int a : solution.aisles()) {
            out << a << '\n';
        }
    }

    /// @throws std::runtime_error if the file cannot be written
    inline void saveSolution(const std::string& path, const CandidateSolution& solution) {
        std::ofstream out(path);
        if (!out) {
            throw std::runtime_error(std::format("cannot open solution file '{}' for writing", path));
        }
        writeSolution(out, solution);
        out.flush();
        if (!out) {
            throw std::runtime_error(std::format("failed writing solution file '{}'", path));
        }
    }

    /// @throws InstanceFormatError on malformed text
    inline CandidateSolution readSolution(std::istream& in) {
        io_detail::LineReader reader(in);
        auto orders = io_detail::readIndexBlock(reader, "order");
        auto aisles = io_detail::readIndexBlock(reader, "aisle");
        return CandidateSolution(std::move(orders), std::move(aisles));
    }

    inline CandidateSolution loadSolution(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw InstanceFormatError(std::format("cannot open solution file '{}'", path));
        }
        return readSolution(in);
    }

} // namespace wavepick
