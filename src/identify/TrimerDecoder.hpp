// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_IDENTIFY_TRIMERDECODER_H
#define TRICOUNT_IDENTIFY_TRIMERDECODER_H

#include <string>
#include <string_view>
#include <vector>
#include <tricount/Config.hpp>

enum DecodeStatus {
    DECODE_OK = 0,
    DECODE_AMBIGUOUS,   // at least one group had no majority
    DECODE_TRUNCATED,   // not enough bases after the anchor
    DECODE_MAX,
};

static const std::string DecodeStatusNames[DECODE_MAX] {
    "ok",
    "ambiguous",
    "truncated",
};

// Outcome of voting on one group of repeated bases
struct TrimerVote {
    char symbol;          // '\0' if ambiguous
    unsigned char votes;  // number of bases in the group agreeing with symbol

    bool ambiguous() const {return symbol == '\0';}
};

struct DecodedField {
    std::string seq;                         // one symbol per group, empty unless status == DECODE_OK
    std::vector<unsigned char> confidence;   // votes per symbol
    DecodeStatus status = DECODE_TRUNCATED;
    int ambiguous_pos = -1;                  // first ambiguous group
    std::string raw;                         // the encoded bases as read

    bool ok() const {return status == DECODE_OK;}
    unsigned char min_confidence() const;
};

struct DecodedTag {
    DecodedField barcode;
    DecodedField umi;
};

class TrimerDecoder {
    tricount::DecodeConfig cfg;
public:
    explicit TrimerDecoder(tricount::DecodeConfig const& cfg);

    // Reduce one group of redundancy bases to a symbol.
    // Under MAJORITY the symbol is the unique most frequent base with at least two votes (one if redundancy is 1).
    // N and other non-ACGT characters never vote. Under FIRST_BASE the first base is taken as is.
    TrimerVote vote(std::string_view group) const;

    // Decode nsym consecutive groups from the start of encoded.
    DecodedField decode_field(std::string_view encoded, int nsym) const;

    // Decode barcode then UMI from the window starting at anchor.
    DecodedTag decode(std::string const& seq, std::size_t anchor) const;

    // Decode a bare barcode+UMI window.
    DecodedTag decode(std::string_view window) const;

    tricount::DecodeConfig const& config() const {return cfg;}
};

#endif //TRICOUNT_IDENTIFY_TRIMERDECODER_H
