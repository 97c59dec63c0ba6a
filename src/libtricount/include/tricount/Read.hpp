// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_READ_H
#define TRICOUNT_READ_H

#include <string>
#include <algorithm>
#include <stdexcept>

namespace tricount {
    static inline char complement(char c) {
        switch (c) {
        case 'A': return 'T';
        case 'C': return 'G';
        case 'G': return 'C';
        case 'T': return 'A';
        case 'a': return 't';
        case 'c': return 'g';
        case 'g': return 'c';
        case 't': return 'a';
        case 'R': return 'Y';
        case 'Y': return 'R';
        case 'K': return 'M';
        case 'M': return 'K';
        case 'B': return 'V';
        case 'V': return 'B';
        case 'D': return 'H';
        case 'H': return 'D';
        default: return c;  // N, S, W and gaps are self-complementary
        }
    }

    static inline std::string reverse_complement(std::string const& seq) {
        std::string result(seq.size(), 'N');
        std::transform(seq.crbegin(), seq.crend(), result.begin(), complement);
        return result;
    }

    // A single sequencing read as it travels between stages.
    struct Read {
        std::string name;
        std::string seq;
        std::string qual;
        std::string comment;
        bool reversed = false;  // true if seq is the reverse complement of the read as sequenced

        // Returns a new read on the opposite strand. Qualities are reversed, not complemented.
        Read reverse_complemented() const {
            Read rc {name, reverse_complement(seq), std::string(qual.crbegin(), qual.crend()), comment, !reversed};
            return rc;
        }

        // Bases [pos, pos + len) as a new read with the same name.
        Read slice(std::size_t pos, std::size_t len = std::string::npos) const {
            if (pos > seq.length()) {
                throw std::range_error("Read::slice");
            }
            return Read {name, seq.substr(pos, len), qual.empty() ? qual : qual.substr(pos, len), comment, reversed};
        }
    };
}

#endif //TRICOUNT_READ_H
