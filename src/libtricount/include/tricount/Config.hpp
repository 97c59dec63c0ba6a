// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_CONFIG_H
#define TRICOUNT_CONFIG_H

#include <string>
#include <nlohmann/json.hpp>
#include <tricount/Distance.hpp>

namespace tricount {
    // Where to look for the poly-A anchor
    enum AnchorPolicy {
        BOTH_ENDS = 0,  // 3' poly-A, else 5' poly-T (reverse complement the read)
        TAIL_ONLY,      // 3' poly-A only, reads are assumed to be oriented already
    };

    static const std::string AnchorPolicyNames[] {
        "both",
        "tail-only",
    };

    // How each group of repeated bases is reduced to one symbol
    enum VotePolicy {
        MAJORITY = 0,
        FIRST_BASE,
    };

    static const std::string VotePolicyNames[] {
        "majority",
        "first",
    };

    enum CollapsePolicy {
        UNIQUE = 0,  // exact UMI duplicates only
        GREEDY,      // absorb neighbours of the best-supported UMI, repeat
    };

    static const std::string CollapsePolicyNames[] {
        "unique",
        "greedy",
    };

    AnchorPolicy parse_anchor_policy(std::string const& name);
    VotePolicy parse_vote_policy(std::string const& name);
    CollapsePolicy parse_collapse_policy(std::string const& name);

    struct OrientConfig {
        int min_polya_len = 10;       // seed length of the poly-A run
        int max_polya_mismatch = 1;   // non-A bases tolerated within the seed
        int search_window = 200;      // bases from either end searched for the seed
        AnchorPolicy anchor = BOTH_ENDS;
    };

    struct DecodeConfig {
        int barcode_len = 12;         // symbols, not bases
        int umi_len = 8;              // symbols, not bases
        int redundancy = 3;           // bases per symbol
        VotePolicy vote = MAJORITY;
        int whitelist_min_confidence = 2;  // 3 keeps only perfect trimers in the whitelist
        int trailer_len = 0;          // bases between the end of the UMI and the 3' end of the read

        int window_len() const {return (barcode_len + umi_len) * redundancy;}
    };

    struct CorrectConfig {
        DistanceMetric metric = HAMMING;
        int max_distance = 1;
        int max_n = 1;
    };

    struct CollapseConfig {
        CollapsePolicy policy = GREEDY;
        DistanceMetric metric = HAMMING;
        int max_distance = 1;
    };

    // Every knob the core exposes. Each tool fills in the sections it uses.
    struct PipelineConfig {
        OrientConfig orient {};
        DecodeConfig decode {};
        CorrectConfig correct {};
        CollapseConfig collapse {};

        // Throws std::invalid_argument naming the first offending value.
        void validate() const;
    };

    nlohmann::ordered_json to_json(OrientConfig const& cfg);
    nlohmann::ordered_json to_json(DecodeConfig const& cfg);
    nlohmann::ordered_json to_json(CorrectConfig const& cfg);
    nlohmann::ordered_json to_json(CollapseConfig const& cfg);
    nlohmann::ordered_json to_json(PipelineConfig const& cfg);
}

#endif //TRICOUNT_CONFIG_H
