// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <tricount.hpp>

using tricount::opt_parse_t;
using tricount::opt_no;
using tricount::opt_inval;

constexpr std::string_view usage =
"usage: whitelist [-h] [-v] [--debug] [--union] [--cells CELLS] [--min-count MIN_COUNT] output whitelist [whitelist ...]\n";
constexpr std::string_view more_usage =
"\n"
"positional arguments:\n"
"  output                Path to write the merged whitelist\n"
"  whitelist             Per-chunk whitelist files written by identify\n"
"\n"
"options:\n"
"  -h, --help            show this help message and exit\n"
"  -v, --version         show the program version and exit\n"
"  --debug               Enable debug logging\n"
"  --union               Take the set union of the inputs and discard barcode frequencies,\n"
"                        e.g. to build one whitelist shared across samples\n"
"  --cells CELLS         Keep only the CELLS most frequent barcodes (default: keep all)\n"
"  --min-count MIN_COUNT\n"
"                        Drop barcodes observed fewer than MIN_COUNT times (default: 1)";

int main(int argc, char ** argv) {
    unsigned long long cells = 0;
    unsigned long long min_count = 1;
    bool union_mode = false;
    bool debug = false;
    opt_parse_t opt_parse_result;
    std::vector<std::string> args(argv, argv + argc);
    std::vector<std::string> posargs {}; // output whitelist...

    for (auto it = std::next(args.cbegin()); it != args.cend(); ++it) {
        const std::string& opt = *it;
        if (opt == "-h" || opt == "--help") {
            std::cout << usage << more_usage << "\n";
            return 0;
        } else if (opt == "-v" || opt == "--version") {
            std::cout << "whitelist (TriCount v" << TRICOUNT_VERSION_STR << ")" << std::endl;
            return 0;
        } else if (opt == "--debug") {
            debug = true;
        } else if (opt == "--union") {
            union_mode = true;
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--cells", cells, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--min-count", min_count, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if (tricount::is_flag(opt)) {
            std::cerr << usage << "\nERR: Unrecognized option: " << opt << "\n";
            return 1;
        } else {
            posargs.push_back(opt);
        }
    }
    if (posargs.size() < 2) {
        std::cerr << usage << "\nERR: Missing required argument: " << (posargs.empty() ? "output" : "whitelist") << "\n";
        return 1;
    }
    if (union_mode && (cells != 0 || min_count > 1)) {
        std::cerr << usage << "\nERR: --cells and --min-count need barcode frequencies and cannot be combined with --union\n";
        return 1;
    }

    boost::log::trivial::severity_level level = debug ? boost::log::trivial::debug : boost::log::trivial::info;
    boost::log::core::get()->set_filter (
        boost::log::trivial::severity >= level
    );

    std::vector<std::string> inputs(std::next(posargs.cbegin()), posargs.cend());
    try {
        tricount::Whitelist merged;
        if (union_mode) {
            for (std::string const& filename : inputs) {
                std::ifstream wlfile(filename);
                if (!wlfile) {
                    throw std::runtime_error("Unable to open whitelist " + filename);
                }
                merged.merge_union(tricount::Whitelist::load(wlfile, filename));
            }
            if (merged.empty()) {
                throw std::runtime_error("Whitelist is empty");
            }
        } else {
            merged = tricount::Whitelist::load(inputs);
        }
        std::size_t observed = merged.size();
        if (min_count > 1) {
            merged.filter_min_count(min_count);
        }
        if (cells != 0) {
            merged.top(cells);
        }
        if (merged.empty()) {
            throw std::runtime_error("No barcodes left after filtering");
        }
        merged.save(posargs.front());
        BOOST_LOG_TRIVIAL(info) << "Merged " << inputs.size() << " whitelists: kept " << merged.size() << " of " << observed << " barcodes";
    } catch (const std::exception& e) {
        std::cerr << "ERR: Whitelist merge failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
