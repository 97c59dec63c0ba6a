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
#include "CorrectWorker.hpp"

using tricount::opt_parse_t;
using tricount::opt_no;
using tricount::opt_inval;

constexpr std::string_view usage =
"usage: correct [-h] [-v] [--debug] [--metric {hamming,levenshtein}] [--max-distance MAX_DISTANCE] [--max-n MAX_N] reads whitelist prefix\n";
constexpr std::string_view more_usage =
"\n"
"positional arguments:\n"
"  reads                 Path to a fastq file of decoded reads written by identify\n"
"  whitelist             Merged whitelist written by the whitelist tool\n"
"  prefix                Output file prefix\n"
"\n"
"options:\n"
"  -h, --help            show this help message and exit\n"
"  -v, --version         show the program version and exit\n"
"  --debug               Enable debug logging\n"
"  --metric {hamming,levenshtein}\n"
"                        Distance between an observed barcode and the whitelist entries (default: hamming)\n"
"  --max-distance MAX_DISTANCE\n"
"                        Maximum distance for a barcode to be corrected (default: 1)\n"
"  --max-n MAX_N         Barcodes with more than this many N bases are not corrected (default: 1)";

int main(int argc, char ** argv) {
    tricount::CorrectConfig cfg {};
    std::string metric_s = tricount::DistanceMetricNames[cfg.metric];
    bool debug = false;
    opt_parse_t opt_parse_result;
    std::vector<std::string> args(argv, argv + argc);
    std::vector<std::string> posargs {}; // reads whitelist prefix

    for (auto it = std::next(args.cbegin()); it != args.cend(); ++it) {
        const std::string& opt = *it;
        if (opt == "-h" || opt == "--help") {
            std::cout << usage << more_usage << "\n";
            return 0;
        } else if (opt == "-v" || opt == "--version") {
            std::cout << "correct (TriCount v" << TRICOUNT_VERSION_STR << ")" << std::endl;
            return 0;
        } else if (opt == "--debug") {
            debug = true;
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--metric", metric_s, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--max-distance", cfg.max_distance, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--max-n", cfg.max_n, usage)) != opt_no) {
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
    if (posargs.size() < 3) {
        const std::string posarg_name[3] {
            "reads",
            "whitelist",
            "prefix"
        };
        std::cerr << usage << "\nERR: Missing required argument: " << posarg_name[posargs.size()] << "\n";
        return 1;
    } else if (posargs.size() > 3) {
        std::cerr << usage << "\nERR: Unrecognized positional argument (first one: " << posargs[3] << ")\n";
        return 1;
    }

    // Check for invalid argument values
    try {
        cfg.metric = tricount::parse_distance_metric(metric_s);
        tricount::PipelineConfig full {};
        full.correct = cfg;
        full.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << usage << "\nERR: " << e.what() << "\n";
        return 1;
    }
    if (cfg.max_distance > 2) {
        std::cerr << "WARN: Setting --max-distance above 2 makes ambiguous corrections likely\n";
    }

    boost::log::trivial::severity_level level = debug ? boost::log::trivial::debug : boost::log::trivial::info;
    boost::log::core::get()->set_filter (
        boost::log::trivial::severity >= level
    );

    // Do the thing
    const std::string& prefix = posargs.at(2);
    try {
        tricount::Whitelist whitelist = tricount::Whitelist::load(posargs.at(1));
        BOOST_LOG_TRIVIAL(info) << "Loaded " << whitelist.size() << " barcodes from " << posargs.at(1);
        CorrectWorker worker {whitelist, prefix, args, cfg};
        if (worker.run(posargs.at(0)) < 0) {
            std::cerr << "ERR: Barcode correction failed" << std::endl;
            return 1;
        }
        std::ofstream json (prefix + ".correct.json");
        if (!json) {
            throw std::runtime_error("Unable to open " + prefix + ".correct.json for writing");
        }
        worker.dump_stats(json);
    } catch (const std::exception& e) {
        std::cerr << "ERR: Barcode correction failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
