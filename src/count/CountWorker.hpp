// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_COUNT_COUNTWORKER_H
#define TRICOUNT_COUNT_COUNTWORKER_H

#include <string>
#include <vector>
#include <map>
#include <utility>
#include <iostream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <tricount.hpp>
#include "CountStats.hpp"
#include "SamReader.hpp"
#include "UmiCollapser.hpp"
#include "MatrixBuilder.hpp"

namespace fs = std::filesystem;

// Everything counted at one feature level
struct LevelCounts {
    tricount::FeatureLevel level;
    std::map<std::pair<std::string, std::string>, MoleculeGroup> groups; // (cell, feature) -> UMIs
    MatrixBuilder matrix;
    unsigned long long reads = 0;       // reads assigned to a feature at this level
    unsigned long long unresolved = 0;  // reads whose tag names no feature at this level
    unsigned long long molecules = 0;

    LevelCounts(tricount::FeatureLevel level, std::vector<std::string> const& labels) : level(level), matrix(labels) {}
};

class CountWorker {
    tricount::FeatureSpace const& features;
    UmiCollapser collapser;
    unsigned long long threads;
    std::vector<LevelCounts> levels;
    std::vector<unsigned long long> stats; // indexed by CountStat
    std::vector<std::string> cli;

    void assign(TaggedAlignment const& read);
    void collapse(LevelCounts& counts) const;
public:
    CountWorker(
        tricount::FeatureSpace const& features,
        std::vector<tricount::FeatureLevel> const& levels,
        std::vector<std::string> const& cli,
        tricount::CollapseConfig const& cfg = {},
        unsigned long long threads = 1
    );

    // Group the reads of bamfile, then collapse every group into molecules.
    // Returns 0 on success, -1 if the BAM could not be read to the end.
    int run(std::string const& bamfile, std::string const& feature_tag = "XT");

    // Writes <level>s.mtx, <level>s.barcodes.txt and <level>s.genes.txt for each level, and count_stats.json.
    void save_output(fs::path const& outdir) const;

    LevelCounts const& get_level(tricount::FeatureLevel level) const;
    std::vector<unsigned long long> const& get_stats() const {return stats;}
    nlohmann::ordered_json to_json() const;
};

#endif //TRICOUNT_COUNT_COUNTWORKER_H
