// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_IDENTIFY_IDENTIFYWORKER_H
#define TRICOUNT_IDENTIFY_IDENTIFYWORKER_H

#include <string>
#include <vector>
#include <iostream>
#include <tricount.hpp>
#include "PolyAOrienter.hpp"
#include "TrimerDecoder.hpp"
#include "IdentifyStats.hpp"

// Orients and decodes one chunk of reads. Writes
//   <prefix>.fastq.gz              cDNA of decoded reads, named <id>_<barcode>_<umi>
//   <prefix>_uncorrected.fastq.gz  anchored reads whose window could not be decoded
//   <prefix>.whitelist.txt         barcodes observed in this chunk
class IdentifyWorker {
    tricount::PipelineConfig cfg;
    PolyAOrienter orienter;
    TrimerDecoder decoder;
    IdentifyStatistics stat;
    tricount::Whitelist whitelist;
    std::string prefix;
    tricount::FastqWriter decoded;
    tricount::FastqWriter uncorrected;
public:
    IdentifyWorker(
        const std::string& prefix,
        const std::vector<std::string>& cli,
        const tricount::PipelineConfig& cfg = {}
    );
    int run(const std::string& fqname);

    // Process one read. Returns the outcome that was tallied.
    IdentifyOutcome process(tricount::Read&& read);

    void dump_stats(std::ostream& strm) const;
    tricount::Whitelist const& get_whitelist() const {return whitelist;}
    IdentifyStatistics const& get_stats() const {return stat;}
};

#endif //TRICOUNT_IDENTIFY_IDENTIFYWORKER_H
