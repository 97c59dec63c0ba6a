// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_COUNT_SAMREADER_H
#define TRICOUNT_COUNT_SAMREADER_H

#include <string>
#include <bamtools/api/BamAlignment.h>
#include <bamtools/api/BamReader.h>
#include "CountStats.hpp"

// The tags of one alignment that matter for counting
struct TaggedAlignment {
    std::string name;
    std::string cell;     // CB
    std::string umi;      // UB, or UR if the UMI was never corrected
    std::string feature;  // raw value of the feature tag

    void reset() {
        name.clear();
        cell.clear();
        umi.clear();
        feature.clear();
    }
};

class SamReader : public BamTools::BamReader
{
    std::string feature_tag;
    BamTools::BamAlignment bam1;
    bool is_eof = false;
    bool is_error = false;
public:
    // Throws std::runtime_error if the BAM cannot be opened.
    SamReader(const std::string& filename, const std::string& feature_tag = "XT");

    // Read the next alignment into out.
    // Returns FAIL_EOF at end of file, FAIL_HTS_ERROR on a read error, PASSED if out carries a cell, a UMI
    // and a feature tag, and otherwise the reason the alignment does not count. Only primary alignments count.
    CountStat get_read(TaggedAlignment& out);
};

#endif //TRICOUNT_COUNT_SAMREADER_H
