// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_DISTANCE_H
#define TRICOUNT_DISTANCE_H

#include <string>
#include <vector>
#include <limits>

namespace tricount {
    enum DistanceMetric {
        HAMMING = 0,
        LEVENSHTEIN,
    };

    static const std::string DistanceMetricNames[] {
        "hamming",
        "levenshtein",
    };

    // Parse "hamming" or "levenshtein". Throws std::invalid_argument on anything else.
    DistanceMetric parse_distance_metric(std::string const& name);

    constexpr unsigned DISTANCE_INFINITE = std::numeric_limits<unsigned>::max();

    // Number of substitutions between two equal-length sequences.
    // Stops counting once the result exceeds limit, so anything above limit is a lower bound.
    // Sequences of different lengths are DISTANCE_INFINITE apart.
    unsigned hamming_distance(std::string const& a, std::string const& b, unsigned limit = DISTANCE_INFINITE);

    // Unit-cost edit distance (substitutions, insertions and deletions).
    // Gives up once every cell of a DP row exceeds limit, returning limit + 1.
    unsigned levenshtein_distance(std::string const& a, std::string const& b, unsigned limit = DISTANCE_INFINITE);

    unsigned distance(DistanceMetric metric, std::string const& a, std::string const& b, unsigned limit = DISTANCE_INFINITE);
}

#endif //TRICOUNT_DISTANCE_H
