// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <iomanip>
#include <iostream>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <tricount.hpp>
#include "BarcodeCorrector.hpp"
#include "CorrectStats.hpp"

CorrectStatistics::CorrectStatistics(tricount::CorrectConfig const& cfg, std::size_t whitelist_size, std::vector<std::string> const& cli) :
    status_counts(CORRECTION_MAX),
    distance_counts(cfg.max_distance + 1),
    cfg(cfg),
    whitelist_size(whitelist_size),
    cli(cli)
{}

void CorrectStatistics::record_malformed() {
    ++total;
    ++malformed;
}

void CorrectStatistics::record(Correction const& correction) {
    ++total;
    ++status_counts.at(correction.status);
    if (correction.ok()) {
        ++distance_counts.at(correction.distance);
        ++cell_counts[correction.barcode];
    }
}

nlohmann::ordered_json CorrectStatistics::to_json() const {
    BOOST_LOG_TRIVIAL(debug) << "to_json() invoked";
    nlohmann::ordered_json data = {
        {"program", "correct"},
        {"version", TRICOUNT_VERSION_STR},
        {"command_line", tricount::shlexjoin(cli)},
        {"config", tricount::to_json(cfg)},
        {"whitelist_size", whitelist_size},
        {"read_count", total},
        {"malformed_names", malformed},
        {"status_counts", nlohmann::ordered_json::object()},
        {"distance_counts", distance_counts},
        {"cells_observed", cell_counts.size()},
    };
    for (int i = EXACT; i != CORRECTION_MAX; ++i) {
        data["status_counts"][CorrectionStatusNames[i]] = status_counts.at(i);
    }
    BOOST_LOG_TRIVIAL(debug) << "to_json() done";
    return data;
}

std::ostream &operator<<(std::ostream &strm, CorrectStatistics const &self) {
    strm << std::setw(4) << self.to_json() << std::flush;
    return strm;
}
