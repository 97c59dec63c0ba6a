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
#include "IdentifyStats.hpp"

IdentifyOutcome classify(OrientStatus orient, AnchorStatus anchor, DecodedTag const& tag) {
    if (orient == ORIENT_UNANCHORED) {
        return UNANCHORED_READ;
    }
    if (anchor == ANCHOR_TRUNCATED || tag.barcode.status == DECODE_TRUNCATED || tag.umi.status == DECODE_TRUNCATED) {
        return TRUNCATED_WINDOW;
    }
    if (anchor == ANCHOR_AMBIGUOUS) {
        return AMBIGUOUS_ANCHOR;
    }
    if (!tag.barcode.ok()) {
        return AMBIGUOUS_BARCODE;
    }
    if (!tag.umi.ok()) {
        return AMBIGUOUS_UMI;
    }
    return PASS;
}

IdentifyStatistics::IdentifyStatistics(tricount::PipelineConfig const& cfg, std::vector<std::string> const& cli) :
    outcome_counts(IdentifyOutcome::MAX),
    orient_counts(ORIENT_MAX),
    barcode_confidence(cfg.decode.barcode_len, std::vector<unsigned long long>(cfg.decode.redundancy + 1)),
    umi_confidence(cfg.decode.umi_len, std::vector<unsigned long long>(cfg.decode.redundancy + 1)),
    ambiguous_positions(cfg.decode.barcode_len + cfg.decode.umi_len),
    cfg(cfg),
    cli(cli)
{}

static void record_confidence(std::vector<std::vector<unsigned long long>>& hist, DecodedField const& field) {
    for (std::size_t i = 0; i < field.confidence.size() && i < hist.size(); ++i) {
        ++hist[i].at(field.confidence[i]);
    }
}

void IdentifyStatistics::record(OrientStatus orient, DecodedTag const& tag, IdentifyOutcome outcome, bool added_to_whitelist) {
    ++total;
    ++orient_counts.at(orient);
    ++outcome_counts.at(outcome);
    whitelisted += added_to_whitelist;
    if (outcome == UNANCHORED_READ || outcome == TRUNCATED_WINDOW || outcome == AMBIGUOUS_ANCHOR) {
        return;
    }
    record_confidence(barcode_confidence, tag.barcode);
    record_confidence(umi_confidence, tag.umi);
    if (tag.barcode.ambiguous_pos >= 0) {
        ++ambiguous_positions.at(tag.barcode.ambiguous_pos);
    }
    if (tag.umi.ambiguous_pos >= 0) {
        ++ambiguous_positions.at(cfg.decode.barcode_len + tag.umi.ambiguous_pos);
    }
}

nlohmann::ordered_json IdentifyStatistics::to_json() const {
    BOOST_LOG_TRIVIAL(debug) << "to_json() invoked";
    nlohmann::ordered_json data = {
        {"program", "identify"},
        {"version", TRICOUNT_VERSION_STR},
        {"command_line", tricount::shlexjoin(cli)},
        {"config", tricount::to_json(cfg)},
        {"read_count", total},
        {"whitelisted_reads", whitelisted},
        {"orientation_counts", nlohmann::ordered_json::object()},
        {"outcome_counts", nlohmann::ordered_json::object()},
        {"barcode_confidence", barcode_confidence},
        {"umi_confidence", umi_confidence},
        {"first_ambiguous_position", ambiguous_positions},
    };
    for (int i = ORIENT_FORWARD; i != ORIENT_MAX; ++i) {
        data["orientation_counts"][OrientStatusNames[i]] = orient_counts.at(i);
    }
    for (int i = IdentifyOutcome::PASS; i != IdentifyOutcome::MAX; ++i) {
        data["outcome_counts"][IdentifyOutcomeNames[i]] = outcome_counts.at(i);
    }
    BOOST_LOG_TRIVIAL(debug) << "to_json() done";
    return data;
}

std::ostream &operator<<(std::ostream &strm, IdentifyStatistics const &self) {
    strm << std::setw(4) << self.to_json() << std::flush;
    return strm;
}
