// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <tricount/Whitelist.hpp>
#include <tricount/Distance.hpp>
#include "BarcodeCorrector.hpp"
#include "SeqToMask.hpp"

BarcodeCorrector::BarcodeCorrector(tricount::Whitelist const& whitelist, tricount::CorrectConfig const& cfg) :
    whitelist(whitelist),
    cfg(cfg),
    bcseqs(whitelist.barcodes())
{
    if (bcseqs.empty()) {
        throw std::runtime_error("Cannot correct barcodes against an empty whitelist");
    }
    if (cfg.metric == tricount::HAMMING) {
        // Binarization
        bcmasks.reserve(bcseqs.size());
        for (std::string const& bc : bcseqs) {
            bcmasks.push_back(seq_to_mask(bc));
        }
    }
    BOOST_LOG_TRIVIAL(debug) << "Correcting against " << bcseqs.size() << " barcodes, " << tricount::DistanceMetricNames[cfg.metric] << " distance <= " << cfg.max_distance;
}

Correction BarcodeCorrector::search(std::string const& seq) const {
    Correction result {};
    if (std::count_if(seq.cbegin(), seq.cend(), [](char c){return c == 'N' || c == 'n';}) > cfg.max_n) {
        return result;
    }
    const unsigned max_distance = cfg.max_distance;
    unsigned best_score = tricount::DISTANCE_INFINITE;
    std::size_t best_idx = 0;
    unsigned nbest = 0;
    std::vector<unsigned char> mask;
    if (cfg.metric == tricount::HAMMING) {
        if (seq.length() != whitelist.barcode_length()) {
            return result;
        }
        mask = seq_to_mask(seq);
    }
    for (std::size_t i = 0; i < bcseqs.size(); ++i) {
        // Entries at the current best distance are still counted exactly, so ties are seen
        unsigned limit = std::min(best_score, max_distance);
        unsigned score = cfg.metric == tricount::HAMMING ?
            mask_mismatches(mask, bcmasks[i], limit) :
            tricount::levenshtein_distance(seq, bcseqs[i], limit);
        if (score > limit) {
            continue;
        }
        if (score < best_score) {
            best_score = score;
            best_idx = i;
            nbest = 1;
        } else {
            ++nbest;
        }
    }
    if (nbest == 0) {
        return result;
    }
    result.distance = best_score;
    result.nearest = nbest;
    if (nbest > 1) {
        result.status = AMBIGUOUS_CORRECTION;
        return result;
    }
    result.status = CORRECTED;
    result.barcode = bcseqs[best_idx];
    return result;
}

Correction const& BarcodeCorrector::correct(std::string const& seq) {
    auto it = memo.find(seq);
    if (it != memo.cend()) {
        return it->second;
    }
    Correction result {};
    if (whitelist.contains(seq)) {
        result.status = EXACT;
        result.barcode = seq;
        result.nearest = 1;
    } else {
        result = search(seq);
    }
    return memo.emplace(seq, std::move(result)).first->second;
}
