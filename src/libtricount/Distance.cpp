// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <algorithm>  // std::min(initializer-list)
#include <stdexcept>
#include <tricount/Distance.hpp>

namespace tricount {

DistanceMetric parse_distance_metric(std::string const& name) {
    for (int i = HAMMING; i <= LEVENSHTEIN; ++i) {
        if (DistanceMetricNames[i] == name) {
            return static_cast<DistanceMetric>(i);
        }
    }
    throw std::invalid_argument("unknown distance metric: " + name);
}

unsigned hamming_distance(std::string const& a, std::string const& b, unsigned limit) {
    if (a.length() != b.length()) {
        return DISTANCE_INFINITE;
    }
    unsigned nmismatch = 0;
    for (std::size_t i = 0; i < a.length(); ++i) {
        if (a[i] != b[i] && ++nmismatch > limit) {
            break;
        }
    }
    return nmismatch;
}

unsigned levenshtein_distance(std::string const& a, std::string const& b, unsigned limit) {
    const std::size_t n = a.length(), m = b.length();
    const std::size_t length_diff = n > m ? n - m : m - n;
    if (limit != DISTANCE_INFINITE && length_diff > limit) {
        return limit + 1;
    }

    // Two rows of the DP matrix, swapped after each row of a.
    std::vector<unsigned> prev(m + 1), curr(m + 1);
    for (std::size_t j = 0; j <= m; ++j) {
        prev[j] = j;
    }
    for (std::size_t i = 1; i <= n; ++i) {
        curr[0] = i;
        unsigned row_min = curr[0];
        for (std::size_t j = 1; j <= m; ++j) {
            curr[j] = std::min({
                prev[j] + 1,
                curr[j - 1] + 1,
                prev[j - 1] + (a[i - 1] == b[j - 1] ? 0u : 1u)
            });
            row_min = std::min(row_min, curr[j]);
        }
        if (limit != DISTANCE_INFINITE && row_min > limit) {
            return limit + 1;
        }
        std::swap(prev, curr);
    }
    return prev[m];
}

unsigned distance(DistanceMetric metric, std::string const& a, std::string const& b, unsigned limit) {
    switch (metric) {
    case HAMMING:
        return hamming_distance(a, b, limit);
    case LEVENSHTEIN:
        return levenshtein_distance(a, b, limit);
    }
    throw std::invalid_argument("unknown distance metric");
}

}
