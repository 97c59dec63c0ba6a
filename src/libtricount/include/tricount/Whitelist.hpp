// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_WHITELIST_H
#define TRICOUNT_WHITELIST_H

#include <string>
#include <vector>
#include <map>
#include <iostream>

namespace tricount {
    // Set of observed cell barcodes with occurrence counts, kept in lexicographic order.
    //
    // Whitelists are built per read chunk and reduced with merge(), which is commutative and
    // associative, so chunks may be merged in any order or grouping. After the final merge the
    // whitelist is treated as frozen and shared by const reference between correction workers.
    class Whitelist {
        std::map<std::string, unsigned long long> counts;
        std::size_t bclen = 0;
        bool has_counts = true;

        void check_length(std::string const& barcode);
    public:
        using const_iterator = std::map<std::string, unsigned long long>::const_iterator;

        Whitelist() = default;

        // Record n observations of barcode. Throws std::invalid_argument if its length disagrees
        // with the barcodes already present.
        void add(std::string const& barcode, unsigned long long n = 1);

        // Frequency-preserving reduction: counts of shared barcodes are summed.
        Whitelist& merge(Whitelist const& other);

        // Set union for cross-sample whitelists. Frequencies are dropped.
        Whitelist& merge_union(Whitelist const& other);

        // Keep the n most frequent barcodes (ties broken lexicographically).
        Whitelist& top(std::size_t n);

        // Drop barcodes observed fewer than n times.
        Whitelist& filter_min_count(unsigned long long n);

        // Barcodes sorted by descending count, then lexicographically
        std::vector<std::pair<std::string, unsigned long long>> ranked() const;

        bool contains(std::string const& barcode) const {return counts.contains(barcode);}
        unsigned long long count(std::string const& barcode) const;
        std::size_t size() const {return counts.size();}
        bool empty() const {return counts.empty();}
        std::size_t barcode_length() const {return bclen;}
        bool has_frequencies() const {return has_counts;}
        std::vector<std::string> barcodes() const;
        const_iterator begin() const {return counts.cbegin();}
        const_iterator end() const {return counts.cend();}

        bool operator==(Whitelist const& other) const {
            return counts == other.counts && has_counts == other.has_counts;
        }

        // Parse "barcode[\tcount]" lines. A missing count counts as one observation. Duplicate
        // lines are summed, so concatenated chunk whitelists load as their merge.
        static Whitelist load(std::istream& strm, std::string const& source = "<stream>");

        // Load one or more whitelist files, merging them. Throws std::runtime_error if a file
        // cannot be read or the result is empty.
        static Whitelist load(std::vector<std::string> const& filenames);
        static Whitelist load(std::string const& filename);

        void save(std::ostream& strm) const;
        void save(std::string const& filename) const;
    };
}

#endif //TRICOUNT_WHITELIST_H
