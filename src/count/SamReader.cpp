// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <bamtools/api/BamAlignment.h>
#include <bamtools/api/BamReader.h>
#include "CountStats.hpp"
#include "SamReader.hpp"

static constexpr uint32_t BAM_FSUPPLEMENTARY = 0x800;

SamReader::SamReader(const std::string& filename, const std::string& feature_tag) : feature_tag(feature_tag) {
    if (!Open(filename)) {
        throw std::runtime_error("Unable to open BAM file " + filename + ": " + GetErrorString());
    }
}

CountStat SamReader::get_read(TaggedAlignment& out) {
    out.reset();
    if (is_eof) {
        return CountStat::FAIL_EOF;
    } else if (is_error) {
        return CountStat::FAIL_HTS_ERROR;
    }
    if (!GetNextAlignment(bam1)) {
        if (GetErrorString().empty()) {
            is_eof = true;
            return CountStat::FAIL_EOF;
        }
        is_error = true;
        BOOST_LOG_TRIVIAL(error) << "BAM read error: " << GetErrorString();
        return CountStat::FAIL_HTS_ERROR;
    }
    out.name = bam1.Name;
    if (!bam1.IsMapped()) {
        return CountStat::DISCARD_UNMAPPED;
    }
    if (!bam1.IsPrimaryAlignment() || (bam1.AlignmentFlag & BAM_FSUPPLEMENTARY)) {
        return CountStat::DISCARD_SECONDARY;
    }
    if (!bam1.GetTag<std::string>("CB", out.cell) || out.cell.empty()) {
        return CountStat::DISCARD_NO_CELL;
    }
    if ((!bam1.GetTag<std::string>("UB", out.umi) || out.umi.empty()) && (!bam1.GetTag<std::string>("UR", out.umi) || out.umi.empty())) {
        return CountStat::DISCARD_NO_UMI;
    }
    if (!bam1.GetTag<std::string>(feature_tag, out.feature) || out.feature.empty()) {
        return CountStat::MALFORMED_FEATURE_TAG;
    }
    return CountStat::PASSED;
}
