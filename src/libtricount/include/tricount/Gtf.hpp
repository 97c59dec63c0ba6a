#ifndef LIBTRICOUNT_GTF_HPP
#define LIBTRICOUNT_GTF_HPP

// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <iostream>
#include <fstream>
#include <map>
#include <unordered_map>
#include <optional>
#include <variant>
#include <vector>
#include <ranges>

namespace tricount {
    // Represents a single record in a GTF file
    struct GtfRecord {
        std::string seqname;
        std::string source;
        std::string feature;
        long long start;
        long long end;
        double score;
        std::string strand;
        unsigned char frame;
        std::map<std::string, std::variant<std::string, double>> attr;

        GtfRecord() = default;

        // String-valued attribute, if present
        std::optional<std::string> attr_string(std::string const& key) const;

        friend std::istream& operator>>(std::istream& strm, GtfRecord& me);
        friend std::ostream& operator<<(std::ostream& strm, GtfRecord const& me);
    };

    // Specialized GTF reader
    class Gtf {
        std::ifstream ifstream;
    public:
        explicit Gtf(const std::string& filename) : ifstream(filename) {}
        Gtf(const Gtf& other) = delete;
        Gtf(Gtf&& other) : ifstream(std::move(other.ifstream)) {}

        bool is_open() const {return ifstream.is_open();}

        // Lazily yields the records whose feature column is feature or metafeature
        auto lazy_load(const std::string& feature, const std::string& metafeature) {
            auto is_view = std::ranges::istream_view<GtfRecord>(ifstream);
            auto filter_view = std::ranges::filter_view(is_view, [=](const GtfRecord& rec) -> bool {
                return rec.feature == feature || rec.feature == metafeature;
            });
            return filter_view;
        }
    };

    // Feature levels a count matrix can be keyed on
    enum FeatureLevel {
        TRANSCRIPT = 0,
        GENE,
    };

    static const std::string FeatureLevelNames[] {
        "transcript",
        "gene",
    };

    FeatureLevel parse_feature_level(std::string const& name);

    // The fixed feature id space of a run, and how a raw feature tag maps into it.
    //
    // Without an annotation every tag is its own feature at both levels, and labels are
    // whatever was observed. With an annotation, transcript ids map to their gene id, gene ids
    // map to themselves, and anything else is rejected.
    class FeatureSpace {
        std::vector<std::string> genes;
        std::vector<std::string> transcripts;
        std::unordered_map<std::string, std::string> transcript_to_gene;
        std::unordered_map<std::string, std::size_t> gene_index;
        bool is_annotated = false;

        void add_gene(std::string const& gene_id);
    public:
        FeatureSpace() = default;

        // Reads gene and transcript records. Throws std::runtime_error if the file cannot be read
        // or defines no features.
        static FeatureSpace from_gtf(std::string const& filename);

        bool annotated() const {return is_annotated;}

        // Feature id for a tag at the given level, or nothing if the tag is not a known feature.
        std::optional<std::string> key(FeatureLevel level, std::string const& tag) const;

        // Column labels in annotation order. Empty when unannotated.
        std::vector<std::string> const& labels(FeatureLevel level) const {
            return level == GENE ? genes : transcripts;
        }
    };
}

#endif //LIBTRICOUNT_GTF_HPP
