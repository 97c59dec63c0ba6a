// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_CORRECT_CORRECTSTATS_H
#define TRICOUNT_CORRECT_CORRECTSTATS_H

#include <string>
#include <vector>
#include <map>
#include <iostream>
#include <nlohmann/json.hpp>
#include <tricount/Config.hpp>
#include "BarcodeCorrector.hpp"

struct CorrectStatistics {
    unsigned long long total = 0;
    unsigned long long malformed = 0;   // read names without <id>_<barcode>_<umi>
    std::vector<unsigned long long> status_counts;
    std::vector<unsigned long long> distance_counts;   // corrected reads by distance
    std::map<std::string, unsigned long long> cell_counts;
    tricount::CorrectConfig const& cfg;
    std::size_t whitelist_size;
    std::vector<std::string> cli;

    CorrectStatistics(tricount::CorrectConfig const& cfg, std::size_t whitelist_size, std::vector<std::string> const& cli);
    void record_malformed();
    void record(Correction const& correction);
    nlohmann::ordered_json to_json() const;
    friend std::ostream &operator<<(std::ostream &strm, CorrectStatistics const &self);
};

#endif //TRICOUNT_CORRECT_CORRECTSTATS_H
