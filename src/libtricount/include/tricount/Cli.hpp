// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_CLI_H
#define TRICOUNT_CLI_H

#include <string>
#include <string_view>
#include <vector>
#include <iostream>
#include <stdexcept>

// Command-line helpers shared by the tools. Each get_arg checks whether *it is optstr and, if so,
// consumes its value into out. On a bad or missing value the usage string and an error are
// printed to stderr.
namespace tricount {
    typedef int opt_parse_t;
    constexpr opt_parse_t opt_no = 0, opt_yes = 1, opt_inval = 2;

    using arg_iter = std::vector<std::string>::const_iterator;

    // An empty argument is a value, not a flag
    static inline bool is_flag(std::string const& arg) {
        return !arg.empty() && arg.front() == '-';
    }

    template<typename T> T parse_value(std::string const& s);

    template<> inline std::string parse_value<std::string>(std::string const& s) {return s;}

    template<> inline int parse_value<int>(std::string const& s) {
        std::size_t pos;
        int result = std::stoi(s, &pos);
        if (pos != s.length()) {
            throw std::invalid_argument("trailing characters in \"" + s + "\"");
        }
        return result;
    }

    template<> inline unsigned long long parse_value<unsigned long long>(std::string const& s) {
        std::size_t pos;
        unsigned long long result = std::stoull(s, &pos);
        if (pos != s.length()) {
            throw std::invalid_argument("trailing characters in \"" + s + "\"");
        }
        return result;
    }

    template<> inline double parse_value<double>(std::string const& s) {
        std::size_t pos;
        double result = std::stod(s, &pos);
        if (pos != s.length()) {
            throw std::invalid_argument("trailing characters in \"" + s + "\"");
        }
        return result;
    }

    template<typename T, typename Parser>
    opt_parse_t get_arg(arg_iter& it, const arg_iter& end, std::string const& optstr, T& out, std::string_view usage, Parser parse) {
        if (*it != optstr) {
            return opt_no;
        }
        if (++it == end || is_flag(*it)) {
            std::cerr << usage << "\nERR: missing value for " << optstr << std::endl;
            return opt_inval;
        }
        try {
            out = parse(*it);
        } catch (const std::exception& e) {
            std::cerr << usage << "\nERR: invalid value for " << optstr << ": " << e.what() << std::endl;
            return opt_inval;
        }
        return opt_yes;
    }

    template<typename T>
    opt_parse_t get_arg(arg_iter& it, const arg_iter& end, std::string const& optstr, T& out, std::string_view usage) {
        return get_arg(it, end, optstr, out, usage, parse_value<T>);
    }

    // Multi-valued option: consumes values up to the next option flag.
    static inline opt_parse_t get_args(arg_iter& it, const arg_iter& end, std::string const& optstr, std::vector<std::string>& out, std::string_view usage) {
        if (*it != optstr) {
            return opt_no;
        }
        if (++it == end || is_flag(*it)) {
            std::cerr << usage << "\nERR: missing value for " << optstr << std::endl;
            return opt_inval;
        }
        out.clear();
        do {
            out.push_back(*it++);
        } while (it != end && !is_flag(*it));
        --it;
        return opt_yes;
    }
}

#endif //TRICOUNT_CLI_H
