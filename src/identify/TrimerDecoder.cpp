// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <string_view>
#include <array>
#include <algorithm>
#include <tricount/Config.hpp>
#include "TrimerDecoder.hpp"

static const std::string Bases = "ACGT";

static inline int base_index(char c) {
    switch (c) {
    case 'A': case 'a': return 0;
    case 'C': case 'c': return 1;
    case 'G': case 'g': return 2;
    case 'T': case 't': return 3;
    default: return -1;
    }
}

unsigned char DecodedField::min_confidence() const {
    if (confidence.empty()) {
        return 0;
    }
    return *std::min_element(confidence.cbegin(), confidence.cend());
}

TrimerDecoder::TrimerDecoder(tricount::DecodeConfig const& cfg) : cfg(cfg)
{}

TrimerVote TrimerDecoder::vote(std::string_view group) const {
    if (cfg.vote == tricount::FIRST_BASE) {
        int idx = group.empty() ? -1 : base_index(group.front());
        if (idx < 0) {
            return {'N', 0};
        }
        unsigned char votes = std::count_if(group.cbegin(), group.cend(), [idx](char c){return base_index(c) == idx;});
        return {Bases[idx], votes};
    }

    std::array<unsigned char, 4> counts {};
    for (char c : group) {
        int idx = base_index(c);
        if (idx >= 0) {
            ++counts[idx];
        }
    }
    auto best = std::max_element(counts.cbegin(), counts.cend());
    const unsigned char min_votes = group.length() == 1 ? 1 : 2;
    if (*best < min_votes || std::count(counts.cbegin(), counts.cend(), *best) != 1) {
        return {'\0', *best};
    }
    return {Bases[best - counts.cbegin()], *best};
}

DecodedField TrimerDecoder::decode_field(std::string_view encoded, int nsym) const {
    DecodedField field;
    const std::size_t width = static_cast<std::size_t>(nsym) * cfg.redundancy;
    field.raw = std::string(encoded.substr(0, width));
    if (encoded.length() < width) {
        field.status = DECODE_TRUNCATED;
        return field;
    }
    field.status = DECODE_OK;
    field.seq.reserve(nsym);
    field.confidence.reserve(nsym);
    for (int i = 0; i < nsym; ++i) {
        TrimerVote v = vote(encoded.substr(static_cast<std::size_t>(i) * cfg.redundancy, cfg.redundancy));
        field.confidence.push_back(v.votes);
        if (v.ambiguous()) {
            if (field.status == DECODE_OK) {
                field.status = DECODE_AMBIGUOUS;
                field.ambiguous_pos = i;
            }
            field.seq.push_back('N');
        } else {
            field.seq.push_back(v.symbol);
        }
    }
    if (field.status != DECODE_OK) {
        field.seq.clear();
    }
    return field;
}

DecodedTag TrimerDecoder::decode(std::string_view window) const {
    const std::size_t bc_width = static_cast<std::size_t>(cfg.barcode_len) * cfg.redundancy;
    if (window.length() < static_cast<std::size_t>(cfg.window_len())) {
        // Both fields are reported truncated even if the barcode alone would fit
        DecodedTag tag {};
        tag.barcode.raw = std::string(window.substr(0, bc_width));
        tag.umi.raw = bc_width < window.length() ? std::string(window.substr(bc_width)) : std::string();
        return tag;
    }
    return DecodedTag {
        decode_field(window.substr(0, bc_width), cfg.barcode_len),
        decode_field(window.substr(bc_width), cfg.umi_len),
    };
}

DecodedTag TrimerDecoder::decode(std::string const& seq, std::size_t anchor) const {
    std::string_view window {seq};
    window.remove_prefix(std::min(anchor, seq.length()));
    return decode(window.substr(0, cfg.window_len()));
}
