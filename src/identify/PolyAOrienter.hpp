// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_IDENTIFY_POLYAORIENTER_H
#define TRICOUNT_IDENTIFY_POLYAORIENTER_H

#include <string>
#include <optional>
#include <tricount/Read.hpp>
#include <tricount/Config.hpp>

enum OrientStatus {
    ORIENT_FORWARD = 0,
    ORIENT_REVERSED,
    ORIENT_UNANCHORED,
    ORIENT_MAX,
};

static const std::string OrientStatusNames[ORIENT_MAX] {
    "forward",
    "reversed",
    "unanchored",
};

enum AnchorStatus {
    ANCHOR_OK = 0,
    ANCHOR_TRUNCATED,   // read too short to hold the poly-A seed, the window and the trailer
    ANCHOR_AMBIGUOUS,   // non-A bases lie between the run and the window start
    ANCHOR_MAX,
};

static const std::string AnchorStatusNames[ANCHOR_MAX] {
    "ok",
    "truncated",
    "ambiguous",
};

// Half-open interval [start, end) of a poly-A run within a read
struct PolyARun {
    std::size_t start;
    std::size_t end;
};

struct OrientedRead {
    tricount::Read read;  // 3'-anchored: the poly-A run is followed by the barcode/UMI window
    OrientStatus status;
    PolyARun polya;       // valid unless status == ORIENT_UNANCHORED
};

class PolyAOrienter {
    tricount::OrientConfig cfg;
public:
    explicit PolyAOrienter(tricount::OrientConfig const& cfg);

    // Find the poly-A run in the 3' tail region of seq.
    //  Args:
    //    seq: DNA sequence to search
    //  Returns:
    //    The run, if a seed of min_polya_len bases with at most max_polya_mismatch non-A bases starts within the last search_window bases.
    //  Comment: The leftmost qualifying seed is taken. The run then grows 3'-ward for as long as consecutive seeds keep qualifying,
    //           so a sequencing error inside a long tail does not cut it short, and finally drops any trailing non-A bases.
    //           Leading A symbols of the barcode are still inside the run; place_window splits them off.
    std::optional<PolyARun> find_polya(std::string const& seq) const;

    // Place the barcode/UMI window of an anchored read.
    //  Args:
    //    oriented: read in canonical orientation, status other than ORIENT_UNANCHORED
    //    window_len: barcode plus UMI length in bases
    //    trailer_len: bases between the end of the window and the 3' end of the read
    //  Returns:
    //    ANCHOR_OK, with oriented.polya.end moved to the window start.
    //  Comment: The window start is fixed by the 3' end of the read. It must fall inside the run, leaving at least
    //           min_polya_len bases of tail before it, and the window must not lie wholly inside the run.
    //           A start past the end of the run is ANCHOR_AMBIGUOUS, anything else that does not fit is ANCHOR_TRUNCATED.
    //           On failure the run is left as found.
    AnchorStatus place_window(OrientedRead& oriented, std::size_t window_len, std::size_t trailer_len) const;

    // Put the read in canonical orientation. Takes ownership of the read.
    OrientedRead operator()(tricount::Read&& read) const;
};

#endif //TRICOUNT_IDENTIFY_POLYAORIENTER_H
