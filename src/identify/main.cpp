// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <tricount.hpp>
#include "IdentifyWorker.hpp"

using tricount::opt_parse_t;
using tricount::opt_no;
using tricount::opt_inval;

constexpr std::string_view usage =
"usage: identify [-h] [-v] [--debug] [--barcode-len BARCODE_LEN] [--umi-len UMI_LEN] [--redundancy REDUNDANCY] [--vote {majority,first}]\n"
"                [--min-polya-len MIN_POLYA_LEN] [--polya-mismatch POLYA_MISMATCH] [--search-window SEARCH_WINDOW] [--anchor {both,tail-only}]\n"
"                [--trailer-len TRAILER_LEN] [--whitelist-confidence WHITELIST_CONFIDENCE]\n"
"                reads prefix\n";
constexpr std::string_view more_usage =
"\n"
"positional arguments:\n"
"  reads                 Path to a fastq file (chunk of reads, optionally gzipped)\n"
"  prefix                Output file prefix\n"
"\n"
"options:\n"
"  -h, --help            show this help message and exit\n"
"  -v, --version         show the program version and exit\n"
"  --debug               Enable debug logging\n"
"  --barcode-len BARCODE_LEN\n"
"                        Number of symbols in the cell barcode (default: 12)\n"
"  --umi-len UMI_LEN     Number of symbols in the UMI (default: 8)\n"
"  --redundancy REDUNDANCY\n"
"                        Number of repeated bases encoding each symbol (default: 3)\n"
"  --vote {majority,first}\n"
"                        How each group of repeated bases is reduced to one symbol (default: majority)\n"
"  --min-polya-len MIN_POLYA_LEN\n"
"                        Seed length of the poly-A run (default: 10)\n"
"  --polya-mismatch POLYA_MISMATCH\n"
"                        Non-A bases tolerated within the poly-A seed (default: 1)\n"
"  --search-window SEARCH_WINDOW\n"
"                        Bases at either end of the read searched for the poly-A/poly-T seed (default: 200)\n"
"  --anchor {both,tail-only}\n"
"                        Search both ends of the read, or only the 3' end (default: both)\n"
"  --trailer-len TRAILER_LEN\n"
"                        Bases between the end of the UMI and the 3' end of the oriented read. The window is placed\n"
"                        this far from the 3' end, so barcodes starting with A are split from the poly-A (default: 0)\n"
"  --whitelist-confidence WHITELIST_CONFIDENCE\n"
"                        Minimum agreeing bases in every barcode group for the barcode to enter the whitelist;\n"
"                        set to the redundancy to keep only perfect trimers (default: 2)";

int main(int argc, char ** argv) {
    tricount::PipelineConfig cfg {};
    std::string vote_s = tricount::VotePolicyNames[cfg.decode.vote];
    std::string anchor_s = tricount::AnchorPolicyNames[cfg.orient.anchor];
    int wl_confidence = -1;
    bool debug = false;
    opt_parse_t opt_parse_result;
    std::vector<std::string> args(argv, argv + argc);
    std::vector<std::string> posargs {}; // reads prefix

    for (auto it = std::next(args.cbegin()); it != args.cend(); ++it) {
        const std::string& opt = *it;
        if (opt == "-h" || opt == "--help") {
            std::cout << usage << more_usage << "\n";
            return 0;
        } else if (opt == "-v" || opt == "--version") {
            std::cout << "identify (TriCount v" << TRICOUNT_VERSION_STR << ")" << std::endl;
            return 0;
        } else if (opt == "--debug") {
            debug = true;
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--barcode-len", cfg.decode.barcode_len, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--umi-len", cfg.decode.umi_len, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--redundancy", cfg.decode.redundancy, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--vote", vote_s, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--min-polya-len", cfg.orient.min_polya_len, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--polya-mismatch", cfg.orient.max_polya_mismatch, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--search-window", cfg.orient.search_window, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--anchor", anchor_s, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--trailer-len", cfg.decode.trailer_len, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, args.cend(), "--whitelist-confidence", wl_confidence, usage)) != opt_no) {
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
        const std::string posarg_name[2] {
            "reads",
            "prefix"
        };
        std::cerr << usage << "\nERR: Missing required argument: " << posarg_name[posargs.size()] << "\n";
        return 1;
    } else if (posargs.size() > 2) {
        std::cerr << usage << "\nERR: Unrecognized positional argument (first one: " << posargs[2] << ")\n";
        return 1;
    }

    // Check for invalid argument values
    if (wl_confidence < 0) {
        // Default is a two-vote majority, or every symbol when there is nothing to vote on
        wl_confidence = std::min(cfg.decode.whitelist_min_confidence, cfg.decode.redundancy);
    }
    cfg.decode.whitelist_min_confidence = wl_confidence;
    try {
        cfg.decode.vote = tricount::parse_vote_policy(vote_s);
        cfg.orient.anchor = tricount::parse_anchor_policy(anchor_s);
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << usage << "\nERR: " << e.what() << "\n";
        return 1;
    }
    if (cfg.decode.vote == tricount::FIRST_BASE && cfg.decode.whitelist_min_confidence > 1) {
        std::cerr << "WARN: with --vote first, barcodes whose first base disagrees with the rest of its group are left out of the whitelist\n";
    }

    boost::log::trivial::severity_level level = debug ? boost::log::trivial::debug : boost::log::trivial::info;
    boost::log::core::get()->set_filter (
        boost::log::trivial::severity >= level
    );

    // Do the thing
    const std::string& prefix = posargs.at(1);
    try {
        IdentifyWorker worker {prefix, args, cfg};
        if (worker.run(posargs.at(0)) < 0) {
            std::cerr << "ERR: Barcode identification failed" << std::endl;
            return 1;
        }
        std::ofstream json (prefix + ".identify.json");
        if (!json) {
            throw std::runtime_error("Unable to open " + prefix + ".identify.json for writing");
        }
        worker.dump_stats(json);
    } catch (const std::exception& e) {
        std::cerr << "ERR: Barcode identification failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
