// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_COUNT_UMICOLLAPSER_H
#define TRICOUNT_COUNT_UMICOLLAPSER_H

#include <string>
#include <vector>
#include <map>
#include <tricount.hpp>

// One inferred molecule
struct Molecule {
    std::string umi;                    // representative
    std::vector<std::string> absorbed;  // other UMIs merged into it, in collapse order
    unsigned long long reads = 0;       // read support including the absorbed UMIs
};

// Every read of one cell that maps to one feature, keyed on UMI
struct MoleculeGroup {
    std::string cell;
    std::string feature;
    std::map<std::string, unsigned long long> umis;  // UMI -> read count

    void add(std::string const& umi, unsigned long long n = 1) {umis[umi] += n;}
};

struct CountEntry {
    std::string cell;
    std::string feature;
    unsigned long long molecules = 0;
};

class UmiCollapser {
    tricount::CollapseConfig cfg;
public:
    explicit UmiCollapser(tricount::CollapseConfig const& cfg = {}) : cfg(cfg) {}

    // Collapse the UMIs of one group into molecules.
    //   unique: every distinct UMI is a molecule.
    //   greedy: UMIs are ranked by (support desc, UMI asc). The first unabsorbed UMI becomes a
    //           representative and absorbs every unabsorbed UMI within max_distance of it.
    // Molecules are returned in representative rank order, so the result does not depend on
    // the order the reads were seen in.
    std::vector<Molecule> collapse(MoleculeGroup const& group) const;

    CountEntry operator()(MoleculeGroup const& group) const;

    tricount::CollapseConfig const& config() const {return cfg;}
};

#endif //TRICOUNT_COUNT_UMICOLLAPSER_H
