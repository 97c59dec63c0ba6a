// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <optional>
#include <tricount/Read.hpp>
#include <tricount/Config.hpp>
#include "PolyAOrienter.hpp"

static inline bool is_a(char c) {
    return c == 'A' || c == 'a';
}

PolyAOrienter::PolyAOrienter(tricount::OrientConfig const& cfg) : cfg(cfg)
{}

std::optional<PolyARun> PolyAOrienter::find_polya(std::string const& seq) const {
    const std::size_t seed = cfg.min_polya_len;
    const int max_mismatch = cfg.max_polya_mismatch;
    const std::size_t len = seq.length();
    if (len < seed) {
        return {};
    }
    const std::size_t region_start = len > static_cast<std::size_t>(cfg.search_window) ? len - cfg.search_window : 0;

    // Slide a seed-sized window over the region, tracking its non-A count
    int mismatches = 0;
    for (std::size_t i = region_start; i < region_start + seed; ++i) {
        mismatches += !is_a(seq[i]);
    }
    std::size_t start = region_start;
    while (!(mismatches <= max_mismatch && is_a(seq[start]))) {
        if (start + seed >= len) {
            return {};
        }
        mismatches += !is_a(seq[start + seed]) - !is_a(seq[start]);
        ++start;
    }

    // Grow the run while the next window still qualifies
    std::size_t last_ok = start;
    for (std::size_t i = start; i + seed < len; ++i) {
        mismatches += !is_a(seq[i + seed]) - !is_a(seq[i]);
        if (mismatches > max_mismatch) {
            break;
        }
        last_ok = i + 1;
    }
    std::size_t end = last_ok + seed;
    while (end > start && !is_a(seq[end - 1])) {
        --end;
    }
    return PolyARun {start, end};
}

AnchorStatus PolyAOrienter::place_window(OrientedRead& oriented, std::size_t window_len, std::size_t trailer_len) const {
    const std::size_t len = oriented.read.seq.length();
    PolyARun& run = oriented.polya;
    if (len < run.start + cfg.min_polya_len + window_len + trailer_len) {
        return ANCHOR_TRUNCATED;
    }
    const std::size_t window_start = len - trailer_len - window_len;
    if (window_start > run.end) {
        return ANCHOR_AMBIGUOUS;
    }
    // Nothing but tail where the barcode should be
    if (run.end - window_start >= window_len) {
        return ANCHOR_TRUNCATED;
    }
    run.end = window_start;
    return ANCHOR_OK;
}

OrientedRead PolyAOrienter::operator()(tricount::Read&& read) const {
    if (std::optional<PolyARun> run = find_polya(read.seq)) {
        return OrientedRead {std::move(read), ORIENT_FORWARD, *run};
    }
    if (cfg.anchor == tricount::BOTH_ENDS) {
        // A poly-T at the 5' head is a poly-A at the 3' tail of the reverse complement
        tricount::Read rc = read.reverse_complemented();
        if (std::optional<PolyARun> run = find_polya(rc.seq)) {
            return OrientedRead {std::move(rc), ORIENT_REVERSED, *run};
        }
    }
    return OrientedRead {std::move(read), ORIENT_UNANCHORED, {0, 0}};
}
