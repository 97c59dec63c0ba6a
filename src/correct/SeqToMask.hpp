// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_CORRECT_SEQTOMASK_H
#define TRICOUNT_CORRECT_SEQTOMASK_H

#include <string>
#include <vector>
#include <algorithm>
#include <bamtools/api/BamConstants.h>

// 4-bit IUPAC code of one base, one bit per canonical base
static inline unsigned char base_to_mask(char c) {
    switch (c) {
    case (BamTools::Constants::BAM_DNA_A):
    case 'a':
        return BamTools::Constants::BAM_BASECODE_A;
    case (BamTools::Constants::BAM_DNA_C):
    case 'c':
        return BamTools::Constants::BAM_BASECODE_C;
    case (BamTools::Constants::BAM_DNA_G):
    case 'g':
        return BamTools::Constants::BAM_BASECODE_G;
    case (BamTools::Constants::BAM_DNA_T):
    case 't':
        return BamTools::Constants::BAM_BASECODE_T;
    case (BamTools::Constants::BAM_DNA_M):
        return BamTools::Constants::BAM_BASECODE_M;
    case (BamTools::Constants::BAM_DNA_R):
        return BamTools::Constants::BAM_BASECODE_R;
    case (BamTools::Constants::BAM_DNA_S):
        return BamTools::Constants::BAM_BASECODE_S;
    case (BamTools::Constants::BAM_DNA_V):
        return BamTools::Constants::BAM_BASECODE_V;
    case (BamTools::Constants::BAM_DNA_W):
        return BamTools::Constants::BAM_BASECODE_W;
    case (BamTools::Constants::BAM_DNA_Y):
        return BamTools::Constants::BAM_BASECODE_Y;
    case (BamTools::Constants::BAM_DNA_H):
        return BamTools::Constants::BAM_BASECODE_H;
    case (BamTools::Constants::BAM_DNA_K):
        return BamTools::Constants::BAM_BASECODE_K;
    case (BamTools::Constants::BAM_DNA_D):
        return BamTools::Constants::BAM_BASECODE_D;
    case (BamTools::Constants::BAM_DNA_B):
        return BamTools::Constants::BAM_BASECODE_B;
    case (BamTools::Constants::BAM_DNA_N):
    default:
        return BamTools::Constants::BAM_BASECODE_N;
    }
}

// Binarize DNA string.
//  Args:
//    seq: DNA sequence, composed of base or ambiguity codes.
//  Returns:
//    One 4-bit mask per base. Two bases are compatible if their masks share a bit, so N is compatible with anything.
static inline std::vector<unsigned char> seq_to_mask(const std::string& seq) {
    std::vector<unsigned char> vec(seq.size());
    std::ranges::transform(seq, vec.begin(), base_to_mask);
    return vec;
}

// Substitutions between two equal-length binarized sequences, counting stops once limit is exceeded
static inline unsigned mask_mismatches(std::vector<unsigned char> const& mask, std::vector<unsigned char> const& refmask, unsigned limit) {
    unsigned nmismatch = 0;
    for (std::size_t i = 0; i < mask.size(); ++i) {
        if (!(mask[i] & refmask[i]) && ++nmismatch > limit) {
            break;
        }
    }
    return nmismatch;
}

#endif //TRICOUNT_CORRECT_SEQTOMASK_H
