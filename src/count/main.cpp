// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <filesystem>
#include <vector>
#include <string>
#include <iostream>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <tricount.hpp>
#include "CountWorker.hpp"

using tricount::opt_parse_t;
using tricount::opt_no;
using tricount::opt_inval;

constexpr std::string_view usage =
"usage: count [-h] [-v] [--debug] [--gtf GTF] [--levels {gene,transcript} [{gene,transcript} ...]]\n"
"             [--feature-tag TAG] [--policy {unique,greedy}] [--metric {hamming,levenshtein}]\n"
"             [--max-distance MAX_DISTANCE] [--threads THREADS]\n"
"             bamfile outdir\n";
constexpr std::string_view more_usage =
"\n"
"positional arguments:\n"
"  bamfile               Aligned reads tagged with CB, UB (or UR) and a feature tag\n"
"  outdir                Output directory\n"
"\n"
"options:\n"
"  -h, --help            show this help message and exit\n"
"  -v, --version         show the program version and exit\n"
"  --debug               Enable debug logging\n"
"  --gtf GTF             Annotation mapping transcripts to genes. Fixes the matrix columns to\n"
"                        the annotated features. Without it, feature tags are counted as they are\n"
"  --levels {gene,transcript} [{gene,transcript} ...]\n"
"                        Feature levels to build matrices for. More than one requires --gtf\n"
"                        (default: gene)\n"
"  --feature-tag TAG     BAM tag holding the feature of each alignment (default: XT)\n"
"  --policy {unique,greedy}\n"
"                        UMI collapse policy (default: greedy)\n"
"  --metric {hamming,levenshtein}\n"
"                        Distance between two UMIs (default: hamming)\n"
"  --max-distance MAX_DISTANCE\n"
"                        Maximum distance for greedy collapse (default: 1)\n"
"  --threads THREADS     Worker threads for UMI collapse (default: 1)";

int main(int argc, char ** argv) {
    tricount::CollapseConfig cfg {};
    std::string policy_s = tricount::CollapsePolicyNames[cfg.policy];
    std::string metric_s = tricount::DistanceMetricNames[cfg.metric];
    std::string gtf_in {};
    std::string feature_tag = "XT";
    std::vector<std::string> level_names {tricount::FeatureLevelNames[tricount::GENE]};
    unsigned long long threads = 1;
    bool debug = false;
    opt_parse_t opt_parse_result;

    std::vector<std::string> cli(argv, argv + argc);
    std::vector<std::string> posargs; // bamfile outdir

    for (auto it = std::next(cli.cbegin()); it != cli.cend(); ++it) {
        const std::string& opt = *it;
        if (opt == "-h" || opt == "--help") {
            std::cout << usage << more_usage << std::endl;
            return 0;
        } else if (opt == "-v" || opt == "--version") {
            std::cout << "count (TriCount v" << TRICOUNT_VERSION_STR << ")" << std::endl;
            return 0;
        } else if (opt == "--debug") {
            debug = true;
        } else if ((opt_parse_result = tricount::get_arg(it, cli.cend(), "--gtf", gtf_in, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_args(it, cli.cend(), "--levels", level_names, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, cli.cend(), "--feature-tag", feature_tag, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, cli.cend(), "--policy", policy_s, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, cli.cend(), "--metric", metric_s, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, cli.cend(), "--max-distance", cfg.max_distance, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if ((opt_parse_result = tricount::get_arg(it, cli.cend(), "--threads", threads, usage)) != opt_no) {
            if (opt_parse_result == opt_inval) {
                return 1;
            }
        } else if (tricount::is_flag(opt)) {
            std::cerr << usage << "\nERR: Unrecognized option flag: \"" << opt << "\"\n";
            return 1;
        } else {
            posargs.push_back(opt);
        }
    }

    if (posargs.size() < 2) {
        const std::string argnames[] {"bamfile", "outdir"};
        std::cerr << usage << "\nERR: Missing required positional opt: " << argnames[posargs.size()] << "\n";
        return 1;
    }
    if (posargs.size() > 2) {
        std::cerr << usage << "\nERR: Extra unrecognized positional opt (first one: " << posargs[2] << ")\n";
        return 1;
    }

    // Check for invalid argument values
    std::vector<tricount::FeatureLevel> levels;
    try {
        cfg.policy = tricount::parse_collapse_policy(policy_s);
        cfg.metric = tricount::parse_distance_metric(metric_s);
        for (std::string const& name : level_names) {
            levels.push_back(tricount::parse_feature_level(name));
        }
        tricount::PipelineConfig full {};
        full.collapse = cfg;
        full.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << usage << "\nERR: " << e.what() << "\n";
        return 1;
    }
    if (gtf_in.empty() && levels.size() > 1) {
        std::cerr << usage << "\nERR: Counting more than one feature level requires --gtf\n";
        return 1;
    }
    if (feature_tag.length() != 2) {
        std::cerr << usage << "\nERR: --feature-tag must be a two-character BAM tag\n";
        return 1;
    }
    if (threads < 1) {
        std::cerr << usage << "\nERR: Minimum allowed value for --threads is 1\n";
        return 1;
    }

    boost::log::trivial::severity_level level = debug ? boost::log::trivial::debug : boost::log::trivial::info;
    boost::log::core::get()->set_filter (
        boost::log::trivial::severity >= level
    );

    std::cerr << tricount::put_time() << " [INFO] Begin count workflow" << std::endl;
    try {
        tricount::FeatureSpace features = gtf_in.empty() ? tricount::FeatureSpace {} : tricount::FeatureSpace::from_gtf(gtf_in);
        CountWorker worker {features, levels, cli, cfg, threads};
        if (worker.run(posargs[0], feature_tag) != 0) {
            std::cerr << "ERR: Counting failed\n";
            return 1;
        }
        worker.save_output(posargs[1]);
        std::cerr << tricount::put_time() << " [INFO] Finished count workflow!" << std::endl;
    } catch (std::exception& e) {
        std::cerr << "ERR: Error counting molecules: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
