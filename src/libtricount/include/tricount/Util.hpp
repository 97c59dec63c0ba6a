// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_UTIL_H
#define TRICOUNT_UTIL_H

#include <string>
#include <vector>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <optional>

template <>
struct std::hash<std::pair<std::string, std::string>> {
    unsigned long long operator()(const std::pair<std::string, std::string>& x) const {
        const std::hash<std::string> hasher {};
        return (hasher(x.first) << 1) ^ hasher(x.second);
    }
};

namespace tricount {
    // Join a vector of strings with a space delimeter. Escapes double-quotes and backslashes. If a space exists in a substring, it will be double-quoted (unescaped).
    template<typename InputIt>
    std::string shlexjoin(InputIt begin, InputIt end) {
        std::stringstream result {};
        for (auto it = begin; it != end;) {
            const std::string& s = *it++;
            if (s.find(' ') != std::string::npos) {
                result << std::quoted(s);
            } else {
                result << s;
            }
            if (it != end) {
                result << ' ';
            }
        }
        return result.str();
    }

    static inline std::string shlexjoin(std::vector<std::string> const& v) {
        return shlexjoin(v.cbegin(), v.cend());
    }

    // Read names carry the cell barcode and UMI as "<id>_<barcode>_<umi>", the
    // layout umi_tools and the downstream aligner wrappers expect.
    static inline std::string tagged_name(std::string const& id, std::string const& barcode, std::string const& umi) {
        return id + '_' + barcode + '_' + umi;
    }

    struct TaggedName {
        std::string id;
        std::string barcode;
        std::string umi;
    };

    // Inverse of tagged_name. The id itself may contain underscores, so split from the right.
    static inline std::optional<TaggedName> parse_tagged_name(std::string const& name) {
        std::size_t umi_sep = name.rfind('_');
        if (umi_sep == std::string::npos || umi_sep == 0) {
            return {};
        }
        std::size_t bc_sep = name.rfind('_', umi_sep - 1);
        if (bc_sep == std::string::npos) {
            return {};
        }
        return TaggedName {
            name.substr(0, bc_sep),
            name.substr(bc_sep + 1, umi_sep - bc_sep - 1),
            name.substr(umi_sep + 1)
        };
    }

    // IOMANIP object to print the current local system time
    template<typename _CharT = char>
    std::_Put_time<_CharT> put_time() {
        const std::time_t t_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        return std::put_time(std::localtime(&t_c), "%F %T");
    }
}

#endif //TRICOUNT_UTIL_H
