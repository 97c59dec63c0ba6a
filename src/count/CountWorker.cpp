// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <set>
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <exception>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <filesystem>
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <tricount.hpp>
#include "CountStats.hpp"
#include "SamReader.hpp"
#include "UmiCollapser.hpp"
#include "MatrixBuilder.hpp"
#include "CountWorker.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

CountWorker::CountWorker(
    tricount::FeatureSpace const& features,
    std::vector<tricount::FeatureLevel> const& levels,
    std::vector<std::string> const& cli,
    tricount::CollapseConfig const& cfg,
    unsigned long long threads
) :
    features(features),
    collapser(cfg),
    threads(threads == 0 ? 1 : threads),
    stats(CountStat::MAX, 0),
    cli(cli)
{
    if (levels.empty()) {
        throw std::invalid_argument("at least one feature level is required");
    }
    std::set<tricount::FeatureLevel> seen;
    for (tricount::FeatureLevel level : levels) {
        if (!seen.insert(level).second) {
            throw std::invalid_argument("feature level " + tricount::FeatureLevelNames[level] + " given twice");
        }
        this->levels.emplace_back(level, features.labels(level));
    }
}

LevelCounts const& CountWorker::get_level(tricount::FeatureLevel level) const {
    for (LevelCounts const& counts : levels) {
        if (counts.level == level) {
            return counts;
        }
    }
    throw std::out_of_range("feature level " + tricount::FeatureLevelNames[level] + " was not counted");
}

void CountWorker::assign(TaggedAlignment const& read) {
    bool any = false;
    for (LevelCounts& counts : levels) {
        std::optional<std::string> key = features.key(counts.level, read.feature);
        if (!key) {
            ++counts.unresolved;
            continue;
        }
        any = true;
        ++counts.reads;
        MoleculeGroup& group = counts.groups[std::make_pair(read.cell, *key)];
        if (group.cell.empty()) {
            group.cell = read.cell;
            group.feature = *key;
        }
        group.add(read.umi);
    }
    ++stats[any ? CountStat::PASSED : CountStat::MALFORMED_FEATURE_TAG];
}

void CountWorker::collapse(LevelCounts& counts) const {
    std::vector<MoleculeGroup const*> groups;
    groups.reserve(counts.groups.size());
    for (const auto& [key, group] : counts.groups) {
        groups.push_back(&group);
    }
    const std::size_t nthreads = std::max<std::size_t>(1, std::min<std::size_t>(threads, groups.size()));
    std::vector<MatrixBuilder> partials(nthreads, counts.matrix);
    std::vector<unsigned long long> molecules(nthreads, 0);
    std::vector<std::exception_ptr> errors(nthreads);

    // Thread i takes a contiguous slice of the (cell, feature)-ordered groups
    auto task = [&](std::size_t i) {
        try {
            const std::size_t begin = groups.size() * i / nthreads, end = groups.size() * (i + 1) / nthreads;
            for (std::size_t g = begin; g < end; ++g) {
                CountEntry entry = collapser(*groups[g]);
                molecules[i] += entry.molecules;
                partials[i].add(entry);
            }
        } catch (...) {
            errors[i] = std::current_exception();
        }
    };
    if (nthreads == 1) {
        task(0);
    } else {
        std::vector<std::thread> pool;
        for (std::size_t i = 0; i < nthreads; ++i) {
            pool.emplace_back(task, i);
        }
        for (std::thread& t : pool) {
            t.join();
        }
    }
    for (std::size_t i = 0; i < nthreads; ++i) {
        if (errors[i]) {
            std::rethrow_exception(errors[i]);
        }
        counts.matrix.merge(partials[i]);
        counts.molecules += molecules[i];
    }
}

int CountWorker::run(std::string const& bamfile, std::string const& feature_tag) {
    SamReader reader {bamfile, feature_tag};
    TaggedAlignment read;
    CountStat result;

    std::condition_variable printer_cv;
    std::mutex printer_mtx;
    bool printer_done = false;
    unsigned long long n_reads = 0;
    // Update stderr every 30 seconds until reading finishes
    std::thread time_printer ([&]() {
        std::unique_lock lck {printer_mtx};
        while (!printer_cv.wait_for(lck, 30s, [&]() {return printer_done;})) {
            std::cerr << tricount::put_time() << " [INFO] Processed " << n_reads << " alignments" << std::endl;
        }
    });

    std::cerr << tricount::put_time() << " [INFO] Reading alignments from " << bamfile << std::endl;
    while (result = reader.get_read(read), result != CountStat::FAIL_EOF && result != CountStat::FAIL_HTS_ERROR) {
        {
            std::lock_guard guard {printer_mtx};
            ++n_reads;
        }
        ++stats[CountStat::TOTAL_IN];
        if (result == CountStat::PASSED) {
            assign(read);
        } else {
            BOOST_LOG_TRIVIAL(debug) << read.name << ": " << CountStatNames[result];
            ++stats[result];
        }
    }
    {
        std::lock_guard guard {printer_mtx};
        printer_done = true;
    }
    printer_cv.notify_all();
    time_printer.join();

    if (result == CountStat::FAIL_HTS_ERROR) {
        std::cerr << tricount::put_time() << " [ERROR] Failed reading " << bamfile << " after " << n_reads << " alignments" << std::endl;
        return -1;
    }
    std::cerr << tricount::put_time() << " [INFO] Read " << n_reads << " alignments, " << stats[CountStat::PASSED] << " assigned to a feature" << std::endl;

    for (LevelCounts& counts : levels) {
        const std::string& name = tricount::FeatureLevelNames[counts.level];
        BOOST_LOG_TRIVIAL(info) << "Collapsing " << counts.groups.size() << " " << name << " groups on " << threads << " threads";
        collapse(counts);
        std::cerr << tricount::put_time() << " [INFO] Counted " << counts.molecules << " molecules from " << counts.reads << " reads at " << name << " level" << std::endl;
    }
    return 0;
}

nlohmann::ordered_json CountWorker::to_json() const {
    nlohmann::ordered_json data = {
        {"program", "count"},
        {"version", TRICOUNT_VERSION_STR},
        {"command_line", tricount::shlexjoin(cli)},
        {"config", tricount::to_json(collapser.config())},
        {"annotated", features.annotated()},
        {"alignment_counts", nlohmann::ordered_json::object()},
        {"levels", nlohmann::ordered_json::object()},
    };
    for (int i = CountStat::TOTAL_IN; i != CountStat::MAX; ++i) {
        data["alignment_counts"][CountStatNames[i]] = stats.at(i);
    }
    for (LevelCounts const& counts : levels) {
        data["levels"][tricount::FeatureLevelNames[counts.level]] = {
            {"reads", counts.reads},
            {"unresolved_reads", counts.unresolved},
            {"groups", counts.groups.size()},
            {"molecules", counts.molecules},
            {"cells", counts.matrix.cells()},
            {"features", counts.matrix.feature_labels().size()},
        };
    }
    return data;
}

void CountWorker::save_output(fs::path const& outdir) const {
    fs::create_directories(outdir);
    for (LevelCounts const& counts : levels) {
        counts.matrix.save(outdir, tricount::FeatureLevelNames[counts.level] + "s");
    }
    const fs::path json_fname = outdir / "count_stats.json";
    std::ofstream json (json_fname);
    if (!json) {
        throw std::runtime_error("Unable to open " + json_fname.string() + " for writing");
    }
    json << std::setw(4) << to_json() << std::endl;
}
