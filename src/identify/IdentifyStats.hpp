// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_IDENTIFY_IDENTIFYSTATS_H
#define TRICOUNT_IDENTIFY_IDENTIFYSTATS_H

#include <string>
#include <vector>
#include <iostream>
#include <nlohmann/json.hpp>
#include <tricount/Config.hpp>
#include "PolyAOrienter.hpp"
#include "TrimerDecoder.hpp"

enum IdentifyOutcome {
    PASS = 0,
    UNANCHORED_READ,
    TRUNCATED_WINDOW,
    AMBIGUOUS_ANCHOR,
    AMBIGUOUS_BARCODE,
    AMBIGUOUS_UMI,
    MAX,
};

static const std::string IdentifyOutcomeNames[IdentifyOutcome::MAX] {
    "PASS",
    "UNANCHORED_READ",
    "TRUNCATED_WINDOW",
    "AMBIGUOUS_ANCHOR",
    "AMBIGUOUS_BARCODE",
    "AMBIGUOUS_UMI",
};

IdentifyOutcome classify(OrientStatus orient, AnchorStatus anchor, DecodedTag const& tag);

struct IdentifyStatistics {
    unsigned long long total = 0;
    unsigned long long whitelisted = 0;
    std::vector<unsigned long long> outcome_counts;
    std::vector<unsigned long long> orient_counts;
    // [position][votes]: how many bases of each group agreed with the called symbol
    std::vector<std::vector<unsigned long long>> barcode_confidence;
    std::vector<std::vector<unsigned long long>> umi_confidence;
    std::vector<unsigned long long> ambiguous_positions;
    tricount::PipelineConfig const& cfg;
    std::vector<std::string> cli;

    IdentifyStatistics(tricount::PipelineConfig const& cfg, std::vector<std::string> const& cli);
    void record(OrientStatus orient, DecodedTag const& tag, IdentifyOutcome outcome, bool added_to_whitelist);
    nlohmann::ordered_json to_json() const;
    friend std::ostream &operator<<(std::ostream &strm, IdentifyStatistics const &self);
};

#endif //TRICOUNT_IDENTIFY_IDENTIFYSTATS_H
