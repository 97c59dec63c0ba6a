// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_COUNT_MATRIXBUILDER_H
#define TRICOUNT_COUNT_MATRIXBUILDER_H

#include <string>
#include <vector>
#include <unordered_map>
#include <filesystem>
#include <eigen3/Eigen/Sparse>
#include <eigen3/unsupported/Eigen/SparseExtra>
#include <tricount.hpp>
#include "UmiCollapser.hpp"

namespace fs = std::filesystem;

template<typename Scalar> using SparseMatrix = Eigen::SparseMatrix<Scalar, Eigen::ColMajor, long long>;

typedef SparseMatrix<unsigned long long> count_mtx;

// Accumulates CountEntries into a cell-by-feature matrix.
// Rows are cells in lexicographic order. Columns follow the fixed feature labels if any were
// given, otherwise the observed features in lexicographic order.
class MatrixBuilder {
    std::unordered_map<std::pair<std::string, std::string>, unsigned long long> counts; // (cell, feature) -> molecules
    std::vector<std::string> fixed_features;

    std::vector<std::string> cell_labels() const;
public:
    MatrixBuilder() = default;
    explicit MatrixBuilder(std::vector<std::string> const& feature_labels) : fixed_features(feature_labels) {}

    void add(CountEntry const& entry);
    void merge(MatrixBuilder const& other);

    std::vector<std::string> feature_labels() const;
    count_mtx build() const;

    // Writes <stem>.mtx, <stem>.barcodes.txt and <stem>.genes.txt under dir.
    // Throws std::runtime_error if any of them cannot be written.
    void save(fs::path const& dir, std::string const& stem) const;

    std::size_t size() const {return counts.size();}
    std::size_t cells() const {return cell_labels().size();}
    unsigned long long total() const;

    bool operator==(MatrixBuilder const& other) const {return counts == other.counts;}
};

#endif //TRICOUNT_COUNT_MATRIXBUILDER_H
