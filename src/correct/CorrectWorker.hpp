// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_CORRECT_CORRECTWORKER_H
#define TRICOUNT_CORRECT_CORRECTWORKER_H

#include <string>
#include <vector>
#include <iostream>
#include <tricount.hpp>
#include "BarcodeCorrector.hpp"
#include "CorrectStats.hpp"

// Corrects the barcodes of one chunk of decoded reads against the merged whitelist and writes
// the reads that resolve to a whitelist entry to <prefix>.fastq.gz, tagged CB/CR/UB/UR/BD.
class CorrectWorker {
    tricount::CorrectConfig cfg;
    BarcodeCorrector corrector;
    CorrectStatistics stat;
    tricount::FastqWriter outfq;
public:
    CorrectWorker(
        tricount::Whitelist const& whitelist,
        const std::string& prefix,
        const std::vector<std::string>& cli,
        const tricount::CorrectConfig& cfg = {}
    );
    int run(const std::string& fqname);

    // Correct one read in place. Returns false if the read is to be dropped.
    bool process(tricount::Read& read);

    void dump_stats(std::ostream& strm) const;
    CorrectStatistics const& get_stats() const {return stat;}
};

#endif //TRICOUNT_CORRECT_CORRECTWORKER_H
