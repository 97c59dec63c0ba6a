// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <set>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <filesystem>
#include <boost/log/trivial.hpp>
#include <eigen3/Eigen/Sparse>
#include <eigen3/unsupported/Eigen/SparseExtra>
#include <tricount.hpp>
#include "UmiCollapser.hpp"
#include "MatrixBuilder.hpp"

namespace fs = std::filesystem;

void MatrixBuilder::add(CountEntry const& entry) {
    if (entry.molecules == 0) {
        return;
    }
    counts[std::make_pair(entry.cell, entry.feature)] += entry.molecules;
}

void MatrixBuilder::merge(MatrixBuilder const& other) {
    for (const auto& [key, n] : other.counts) {
        counts[key] += n;
    }
}

std::vector<std::string> MatrixBuilder::cell_labels() const {
    std::set<std::string> cells;
    for (const auto& [key, n] : counts) {
        cells.insert(key.first);
    }
    return {cells.cbegin(), cells.cend()};
}

std::vector<std::string> MatrixBuilder::feature_labels() const {
    if (!fixed_features.empty()) {
        return fixed_features;
    }
    std::set<std::string> features;
    for (const auto& [key, n] : counts) {
        features.insert(key.second);
    }
    return {features.cbegin(), features.cend()};
}

unsigned long long MatrixBuilder::total() const {
    unsigned long long result = 0;
    for (const auto& [key, n] : counts) {
        result += n;
    }
    return result;
}

count_mtx MatrixBuilder::build() const {
    const std::vector<std::string> cells = cell_labels(), features = feature_labels();
    std::unordered_map<std::string, long long> cell_index, feature_index;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        cell_index[cells[i]] = i;
    }
    for (std::size_t i = 0; i < features.size(); ++i) {
        feature_index[features[i]] = i;
    }

    std::vector<Eigen::Triplet<unsigned long long, long long>> triplets;
    triplets.reserve(counts.size());
    for (const auto& [key, n] : counts) {
        auto ft_it = feature_index.find(key.second);
        if (ft_it == feature_index.cend()) {
            throw std::out_of_range("feature " + key.second + " is not a column of this matrix");
        }
        triplets.emplace_back(cell_index.at(key.first), ft_it->second, n);
    }
    count_mtx result (cells.size(), features.size());
    result.setFromTriplets(triplets.cbegin(), triplets.cend());
    result.makeCompressed();
    return result;
}

static void dump_labels(fs::path const& fname, std::vector<std::string> const& labels) {
    std::ofstream out (fname);
    if (!out) {
        throw std::runtime_error("Unable to open " + fname.string() + " for writing");
    }
    for (std::string const& label : labels) {
        out << label << '\n';
    }
}

void MatrixBuilder::save(fs::path const& dir, std::string const& stem) const {
    fs::create_directories(dir);
    const fs::path mtx_fname = dir / (stem + ".mtx");
    if (!Eigen::saveMarket(build(), mtx_fname.string())) {
        throw std::runtime_error("Unable to write " + mtx_fname.string());
    }
    dump_labels(dir / (stem + ".barcodes.txt"), cell_labels());
    dump_labels(dir / (stem + ".genes.txt"), feature_labels());
    BOOST_LOG_TRIVIAL(debug) << "Wrote " << counts.size() << " nonzero entries to " << mtx_fname;
}
