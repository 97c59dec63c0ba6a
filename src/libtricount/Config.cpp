// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <tricount/Config.hpp>

namespace tricount {

template<typename EnumT, std::size_t N>
static EnumT parse_enum(std::string const (&names)[N], std::string const& name, const char *what) {
    for (std::size_t i = 0; i < N; ++i) {
        if (names[i] == name) {
            return static_cast<EnumT>(i);
        }
    }
    throw std::invalid_argument(std::string("unknown ") + what + ": " + name);
}

AnchorPolicy parse_anchor_policy(std::string const& name) {
    return parse_enum<AnchorPolicy>(AnchorPolicyNames, name, "anchor policy");
}

VotePolicy parse_vote_policy(std::string const& name) {
    return parse_enum<VotePolicy>(VotePolicyNames, name, "vote policy");
}

CollapsePolicy parse_collapse_policy(std::string const& name) {
    return parse_enum<CollapsePolicy>(CollapsePolicyNames, name, "collapse policy");
}

void PipelineConfig::validate() const {
    if (orient.min_polya_len < 1) {
        throw std::invalid_argument("minimum poly-A length must be at least 1");
    }
    if (orient.max_polya_mismatch < 0 || orient.max_polya_mismatch >= orient.min_polya_len) {
        throw std::invalid_argument("poly-A mismatch tolerance must be between 0 and " + std::to_string(orient.min_polya_len - 1));
    }
    if (orient.search_window < orient.min_polya_len) {
        throw std::invalid_argument("poly-A search window must be at least the minimum poly-A length");
    }
    if (decode.barcode_len < 1) {
        throw std::invalid_argument("barcode length must be at least 1");
    }
    if (decode.umi_len < 0) {
        throw std::invalid_argument("UMI length must not be negative");
    }
    if (decode.redundancy < 1) {
        throw std::invalid_argument("redundancy factor must be at least 1");
    }
    if (decode.whitelist_min_confidence < 1 || decode.whitelist_min_confidence > decode.redundancy) {
        throw std::invalid_argument("whitelist confidence must be between 1 and " + std::to_string(decode.redundancy));
    }
    if (decode.trailer_len < 0) {
        throw std::invalid_argument("trailer length must not be negative");
    }
    if (correct.max_distance < 0) {
        throw std::invalid_argument("barcode correction distance must not be negative");
    }
    if (correct.max_n < 0) {
        throw std::invalid_argument("maximum N count must not be negative");
    }
    if (collapse.max_distance < 0) {
        throw std::invalid_argument("UMI collapse distance must not be negative");
    }
}

nlohmann::ordered_json to_json(OrientConfig const& cfg) {
    return {
        {"min_polya_len", cfg.min_polya_len},
        {"max_polya_mismatch", cfg.max_polya_mismatch},
        {"search_window", cfg.search_window},
        {"anchor", AnchorPolicyNames[cfg.anchor]}
    };
}

nlohmann::ordered_json to_json(DecodeConfig const& cfg) {
    return {
        {"barcode_len", cfg.barcode_len},
        {"umi_len", cfg.umi_len},
        {"redundancy", cfg.redundancy},
        {"vote", VotePolicyNames[cfg.vote]},
        {"whitelist_min_confidence", cfg.whitelist_min_confidence},
        {"trailer_len", cfg.trailer_len}
    };
}

nlohmann::ordered_json to_json(CorrectConfig const& cfg) {
    return {
        {"metric", DistanceMetricNames[cfg.metric]},
        {"max_distance", cfg.max_distance},
        {"max_n", cfg.max_n}
    };
}

nlohmann::ordered_json to_json(CollapseConfig const& cfg) {
    return {
        {"policy", CollapsePolicyNames[cfg.policy]},
        {"metric", DistanceMetricNames[cfg.metric]},
        {"max_distance", cfg.max_distance}
    };
}

nlohmann::ordered_json to_json(PipelineConfig const& cfg) {
    return {
        {"orient", to_json(cfg.orient)},
        {"decode", to_json(cfg.decode)},
        {"correct", to_json(cfg.correct)},
        {"collapse", to_json(cfg.collapse)}
    };
}

}
