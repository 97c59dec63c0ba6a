// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_CORRECT_BARCODECORRECTOR_H
#define TRICOUNT_CORRECT_BARCODECORRECTOR_H

#include <string>
#include <vector>
#include <unordered_map>
#include <tricount/Whitelist.hpp>
#include <tricount/Config.hpp>

enum CorrectionStatus {
    EXACT = 0,
    CORRECTED,
    AMBIGUOUS_CORRECTION,
    NO_WHITELIST_MATCH,
    CORRECTION_MAX,
};

static const std::string CorrectionStatusNames[CORRECTION_MAX] {
    "EXACT",
    "CORRECTED",
    "AMBIGUOUS_CORRECTION",
    "NO_WHITELIST_MATCH",
};

struct Correction {
    CorrectionStatus status = NO_WHITELIST_MATCH;
    std::string barcode;     // whitelist entry, empty unless EXACT or CORRECTED
    unsigned distance = 0;   // to the nearest entry, valid unless NO_WHITELIST_MATCH
    unsigned nearest = 0;    // number of entries at that distance

    bool ok() const {return status == EXACT || status == CORRECTED;}
};

class BarcodeCorrector {
    tricount::Whitelist const& whitelist;
    tricount::CorrectConfig cfg;
    std::vector<std::string> bcseqs;
    std::vector<std::vector<unsigned char>> bcmasks;
    std::unordered_map<std::string, Correction> memo;

    Correction search(std::string const& seq) const;
public:
    // Constructor for the BarcodeCorrector
    //  Args:
    //    whitelist: Reference barcodes. Must outlive the corrector and stay unchanged.
    //    cfg: Distance metric, threshold and the maximum number of N bases in a query.
    //  Throws std::runtime_error if the whitelist is empty.
    BarcodeCorrector(tricount::Whitelist const& whitelist, tricount::CorrectConfig const& cfg);

    // Find the whitelist entry nearest to seq.
    //  Returns:
    //    EXACT if seq is on the whitelist.
    //    CORRECTED if exactly one entry is nearest and within max_distance. Under the Hamming metric an N
    //    in seq matches any base, so this includes distance 0 for queries with Ns.
    //    AMBIGUOUS_CORRECTION if several entries tie for nearest. Ties are never broken.
    //    NO_WHITELIST_MATCH if nothing is within max_distance, or seq has more than max_n Ns.
    Correction const& correct(std::string const& seq);

    std::size_t memo_size() const {return memo.size();}
};

#endif //TRICOUNT_CORRECT_BARCODECORRECTOR_H
