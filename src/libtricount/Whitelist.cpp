// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <tricount/Whitelist.hpp>

namespace tricount {

void Whitelist::check_length(std::string const& barcode) {
    if (barcode.empty()) {
        throw std::invalid_argument("empty barcode");
    }
    if (bclen == 0) {
        bclen = barcode.length();
    } else if (barcode.length() != bclen) {
        throw std::invalid_argument("barcode length disagree: " + barcode + " is not " + std::to_string(bclen) + " bases");
    }
}

void Whitelist::add(std::string const& barcode, unsigned long long n) {
    check_length(barcode);
    counts[barcode] += n;
}

unsigned long long Whitelist::count(std::string const& barcode) const {
    auto it = counts.find(barcode);
    return it == counts.cend() ? 0 : it->second;
}

Whitelist& Whitelist::merge(Whitelist const& other) {
    for (auto const& [barcode, n] : other.counts) {
        add(barcode, n);
    }
    has_counts = has_counts && other.has_counts;
    return *this;
}

Whitelist& Whitelist::merge_union(Whitelist const& other) {
    for (auto const& [barcode, n] : other.counts) {
        check_length(barcode);
        counts.emplace(barcode, 1);
    }
    for (auto& entry : counts) {
        entry.second = 1;
    }
    has_counts = false;
    return *this;
}

std::vector<std::pair<std::string, unsigned long long>> Whitelist::ranked() const {
    std::vector<std::pair<std::string, unsigned long long>> result(counts.cbegin(), counts.cend());
    // counts is already lexicographic, so a stable sort on count alone keeps ties in order
    std::stable_sort(result.begin(), result.end(), [](auto const& a, auto const& b) {
        return a.second > b.second;
    });
    return result;
}

Whitelist& Whitelist::top(std::size_t n) {
    if (n >= counts.size()) {
        return *this;
    }
    auto keep = ranked();
    keep.resize(n);
    counts = std::map<std::string, unsigned long long>(keep.cbegin(), keep.cend());
    return *this;
}

Whitelist& Whitelist::filter_min_count(unsigned long long n) {
    std::erase_if(counts, [n](auto const& entry) {
        return entry.second < n;
    });
    return *this;
}

std::vector<std::string> Whitelist::barcodes() const {
    std::vector<std::string> result;
    result.reserve(counts.size());
    for (auto const& entry : counts) {
        result.push_back(entry.first);
    }
    return result;
}

Whitelist Whitelist::load(std::istream& strm, std::string const& source) {
    Whitelist result;
    std::string line;
    unsigned long long lineno = 0;
    while (std::getline(strm, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        std::size_t tab1 = line.find('\t');
        std::string barcode = line.substr(0, tab1);
        unsigned long long n = 1;
        if (tab1 == std::string::npos) {
            result.has_counts = false;
        } else {
            std::size_t tab2 = line.find('\t', tab1 + 1);
            std::string count_s = line.substr(tab1 + 1, tab2 == std::string::npos ? tab2 : tab2 - tab1 - 1);
            try {
                std::size_t parsed;
                n = std::stoull(count_s, &parsed);
                if (parsed != count_s.length()) {
                    throw std::invalid_argument(count_s);
                }
            } catch (std::logic_error const&) {
                throw std::runtime_error(source + ":" + std::to_string(lineno) + ": invalid barcode count \"" + count_s + "\"");
            }
        }
        try {
            result.add(barcode, n);
        } catch (std::invalid_argument const& e) {
            throw std::runtime_error(source + ":" + std::to_string(lineno) + ": " + e.what());
        }
    }
    if (strm.bad()) {
        throw std::runtime_error(source + ": read error");
    }
    return result;
}

Whitelist Whitelist::load(std::vector<std::string> const& filenames) {
    Whitelist result;
    for (std::string const& filename : filenames) {
        std::ifstream wlfile(filename);
        if (!wlfile) {
            throw std::runtime_error("Unable to open whitelist " + filename);
        }
        Whitelist chunk = load(wlfile, filename);
        BOOST_LOG_TRIVIAL(debug) << "Loaded " << chunk.size() << " barcodes from " << filename;
        try {
            result.merge(chunk);
        } catch (std::invalid_argument const& e) {
            throw std::runtime_error(filename + ": " + e.what());
        }
    }
    if (result.empty()) {
        throw std::runtime_error("Whitelist is empty");
    }
    return result;
}

Whitelist Whitelist::load(std::string const& filename) {
    return load(std::vector<std::string> {filename});
}

void Whitelist::save(std::ostream& strm) const {
    for (auto const& [barcode, n] : counts) {
        strm << barcode;
        if (has_counts) {
            strm << '\t' << n;
        }
        strm << '\n';
    }
}

void Whitelist::save(std::string const& filename) const {
    std::ofstream outfile(filename);
    if (!outfile) {
        throw std::runtime_error("Unable to open " + filename + " for writing");
    }
    save(outfile);
    if (!outfile.flush()) {
        throw std::runtime_error("Write error on " + filename);
    }
}

}
