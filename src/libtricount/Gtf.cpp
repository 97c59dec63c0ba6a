
// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <sstream>
#include <iomanip>
#include <limits>
#include <array>
#include <cmath>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <tricount/Gtf.hpp>

namespace tricount {

std::optional<std::string> GtfRecord::attr_string(std::string const& key) const {
    auto it = attr.find(key);
    if (it == attr.cend() || !std::holds_alternative<std::string>(it->second)) {
        return {};
    }
    return std::get<std::string>(it->second);
}

std::istream& operator>>(std::istream& strm, GtfRecord& me) {
    std::string line {};
    std::array<std::string, 9> fields {};
    do {
        if (!std::getline(strm, line)) {
            return strm;
        }
    } while (line.empty() || line[0] == '#');
    line = line.substr(0, line.find('#'));
    std::stringstream line_ss (line);
    for (int i = 0; i < 9; ++i) {
        if (!std::getline(line_ss, fields[i], '\t') && i != 8) {
            throw std::out_of_range("invalid gtf entry");
        }
    }
    me.seqname = fields[0];
    me.source = fields[1];
    me.feature = fields[2];
    me.start = std::stoll(fields[3]) - 1;  // represent as 0-based internally
    me.end = std::stoll(fields[4]) - 1;  // represent as 0-based internally
    me.score = fields[5] == "." ? std::numeric_limits<double>::quiet_NaN() : std::stod(fields[5]);
    me.strand = fields[6] == "." ? "" : fields[6];
    me.frame = fields[7] == "." ? 0xFF : static_cast<unsigned char>(std::stoul(fields[7]));
    me.attr.clear();
    std::string attr_s;
    std::stringstream attr_ss(fields[8]);
    while (std::getline(attr_ss, attr_s, ';')) {
        std::string key;
        std::stringstream key_ss(attr_s);
        if (!(key_ss >> key)) {
            continue;  // trailing "; "
        }
        key_ss >> std::ws;
        if (key_ss.peek() == '"') {
            std::string value;
            key_ss >> std::quoted(value);
            me.attr[key] = value;
        } else {
            double value;
            key_ss >> value;
            me.attr[key] = value;
        }
    }
    return strm;
}

std::ostream& operator<<(std::ostream& strm, GtfRecord const& me) {
    strm << me.seqname << "\t" << me.source << "\t" << me.feature << "\t" << me.start + 1 << "\t" << me.end + 1 << "\t";
    if (std::isnan(me.score)) {
        strm << ".";
    } else {
        strm << me.score;
    }
    strm << "\t" << (me.strand.empty() ? "." : me.strand) << "\t";
    if (me.frame == 0xFF) {
        strm << ".";
    } else {
        strm << static_cast<int>(me.frame);
    }
    strm << "\t";
    for (const auto& [key, value] : me.attr) {
        if (std::holds_alternative<std::string>(value)) {
            strm << key << " " << std::quoted(std::get<std::string>(value)) << "; ";
        } else {
            strm << key << " " << std::get<double>(value) << "; ";
        }
    }
    return strm;
}

FeatureLevel parse_feature_level(std::string const& name) {
    for (int i = TRANSCRIPT; i <= GENE; ++i) {
        if (FeatureLevelNames[i] == name) {
            return static_cast<FeatureLevel>(i);
        }
    }
    throw std::invalid_argument("unknown feature level: " + name);
}

void FeatureSpace::add_gene(std::string const& gene_id) {
    if (gene_index.emplace(gene_id, genes.size()).second) {
        genes.push_back(gene_id);
    }
}

FeatureSpace FeatureSpace::from_gtf(std::string const& filename) {
    FeatureSpace result;
    Gtf gtf {filename};
    if (!gtf.is_open()) {
        throw std::runtime_error("Unable to open annotation " + filename);
    }
    unsigned long long nrecords = 0;
    for (GtfRecord const& record : gtf.lazy_load("gene", "transcript")) {
        ++nrecords;
        std::optional<std::string> gene_id = record.attr_string("gene_id");
        if (!gene_id) {
            std::stringstream ss;
            ss << "GTF record without gene_id: " << record;
            throw std::runtime_error(ss.str());
        }
        // Genes without a gene record still get a column, in order of first transcript
        result.add_gene(*gene_id);
        if (record.feature == "transcript") {
            std::optional<std::string> transcript_id = record.attr_string("transcript_id");
            if (!transcript_id) {
                std::stringstream ss;
                ss << "GTF transcript record without transcript_id: " << record;
                throw std::runtime_error(ss.str());
            }
            if (result.transcript_to_gene.emplace(*transcript_id, *gene_id).second) {
                result.transcripts.push_back(*transcript_id);
            }
        }
    }
    if (result.genes.empty()) {
        throw std::runtime_error("failed to load GTF features from " + filename);
    }
    BOOST_LOG_TRIVIAL(info) << "Read " << result.genes.size() << " genes and " << result.transcripts.size() << " transcripts from " << nrecords << " records of " << filename;
    result.is_annotated = true;
    return result;
}

std::optional<std::string> FeatureSpace::key(FeatureLevel level, std::string const& tag) const {
    if (tag.empty() || tag == "-" || tag == "*") {
        return {};
    }
    if (!is_annotated) {
        return tag;
    }
    auto tx_it = transcript_to_gene.find(tag);
    switch (level) {
    case TRANSCRIPT:
        if (tx_it == transcript_to_gene.cend()) {
            return {};
        }
        return tag;
    case GENE:
        if (tx_it != transcript_to_gene.cend()) {
            return tx_it->second;
        }
        if (gene_index.contains(tag)) {
            return tag;
        }
        return {};
    }
    return {};
}

}
