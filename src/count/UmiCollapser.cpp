// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <algorithm>
#include <utility>
#include <tricount.hpp>
#include "UmiCollapser.hpp"

std::vector<Molecule> UmiCollapser::collapse(MoleculeGroup const& group) const {
    std::vector<Molecule> result;
    if (cfg.policy == tricount::UNIQUE || cfg.max_distance == 0) {
        // std::map iterates in UMI order
        for (const auto& [umi, n] : group.umis) {
            result.push_back(Molecule {umi, {}, n});
        }
        return result;
    }

    using umi_count_t = std::pair<std::string, unsigned long long>;
    std::vector<umi_count_t> ranked(group.umis.cbegin(), group.umis.cend());
    std::stable_sort(ranked.begin(), ranked.end(), [](umi_count_t const& a, umi_count_t const& b) {
        return a.second > b.second;
    });
    std::vector<bool> absorbed(ranked.size(), false);
    const unsigned limit = cfg.max_distance;
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        if (absorbed[i]) {
            continue;
        }
        absorbed[i] = true;
        Molecule& mol = result.emplace_back(Molecule {ranked[i].first, {}, ranked[i].second});
        for (std::size_t j = i + 1; j < ranked.size(); ++j) {
            if (absorbed[j]) {
                continue;
            }
            if (tricount::distance(cfg.metric, mol.umi, ranked[j].first, limit) <= limit) {
                absorbed[j] = true;
                mol.absorbed.push_back(ranked[j].first);
                mol.reads += ranked[j].second;
            }
        }
    }
    return result;
}

CountEntry UmiCollapser::operator()(MoleculeGroup const& group) const {
    return CountEntry {group.cell, group.feature, collapse(group).size()};
}
