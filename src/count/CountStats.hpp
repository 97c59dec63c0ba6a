// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_COUNT_COUNTSTATS_H
#define TRICOUNT_COUNT_COUNTSTATS_H

#include <string>

enum CountStat {
    TOTAL_IN = 0,
    DISCARD_UNMAPPED,
    DISCARD_SECONDARY,
    DISCARD_NO_CELL,
    DISCARD_NO_UMI,
    MALFORMED_FEATURE_TAG,
    PASSED,
    MAX,

    FAIL_EOF = -1,
    FAIL_HTS_ERROR = -2
};

static const std::string CountStatNames[CountStat::MAX] {
    "TOTAL_IN",
    "DISCARD_UNMAPPED",
    "DISCARD_SECONDARY",
    "DISCARD_NO_CELL",
    "DISCARD_NO_UMI",
    "MALFORMED_FEATURE_TAG",
    "PASSED",
};

#endif //TRICOUNT_COUNT_COUNTSTATS_H
