// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <boost/test/unit_test.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <fstream>
#include <filesystem>
#include <vector>
#include <string>
#include <unistd.h>
#include <kseq++/seqio.hpp>
#include <tricount.hpp>
#include "BarcodeCorrector.hpp"
#include "CorrectWorker.hpp"

namespace fs = std::filesystem;

static fs::path make_temp_path(const std::string& suffix) {
    static unsigned counter = 0;
    return fs::temp_directory_path() / ("tricount_correct_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + suffix);
}

static tricount::Whitelist make_whitelist(std::vector<std::string> const& barcodes) {
    tricount::Whitelist wl;
    for (std::string const& bc : barcodes) {
        wl.add(bc);
    }
    return wl;
}

BOOST_AUTO_TEST_CASE(test_tie_is_ambiguous) {
    tricount::Whitelist wl = make_whitelist({"ACGT", "ACGA"});
    BarcodeCorrector corrector {wl, tricount::CorrectConfig {}};

    Correction const& tie = corrector.correct("ACGC");
    BOOST_CHECK_EQUAL(tie.status, AMBIGUOUS_CORRECTION);
    BOOST_CHECK_EQUAL(tie.distance, 1u);
    BOOST_CHECK_EQUAL(tie.nearest, 2u);
    BOOST_CHECK(tie.barcode.empty());

    // Also one substitution from both entries
    BOOST_CHECK_EQUAL(corrector.correct("ACGG").status, AMBIGUOUS_CORRECTION);

    Correction const& unique = corrector.correct("ACTT");
    BOOST_CHECK_EQUAL(unique.status, CORRECTED);
    BOOST_CHECK_EQUAL(unique.barcode, "ACGT");
    BOOST_CHECK_EQUAL(unique.distance, 1u);

    Correction const& exact = corrector.correct("ACGA");
    BOOST_CHECK_EQUAL(exact.status, EXACT);
    BOOST_CHECK_EQUAL(exact.barcode, "ACGA");
    BOOST_CHECK_EQUAL(exact.distance, 0u);
}

BOOST_AUTO_TEST_CASE(test_unique_single_substitution) {
    const std::vector<std::string> barcodes {"AAAAAA", "CCCCCC", "GGGGGG", "TTTTTT"};
    tricount::Whitelist wl = make_whitelist(barcodes);
    BarcodeCorrector corrector {wl, tricount::CorrectConfig {}};
    for (std::string const& bc : barcodes) {
        for (std::size_t i = 0; i < bc.length(); ++i) {
            for (char base : std::string("ACGT")) {
                if (base == bc[i]) {
                    continue;
                }
                std::string query = bc;
                query[i] = base;
                Correction const& result = corrector.correct(query);
                BOOST_TEST_CONTEXT("query " << query) {
                    BOOST_CHECK_EQUAL(result.status, CORRECTED);
                    BOOST_CHECK_EQUAL(result.barcode, bc);
                    BOOST_CHECK_EQUAL(result.distance, 1u);
                }
            }
        }
    }
    BOOST_CHECK_EQUAL(corrector.correct("AACCGG").status, NO_WHITELIST_MATCH);
}

BOOST_AUTO_TEST_CASE(test_correction_idempotent) {
    tricount::Whitelist wl = make_whitelist({"ACGTAC", "ACGTTT", "GGCATA", "TTAGCC", "CATCAT"});
    tricount::CorrectConfig cfg {};
    cfg.max_distance = 2;
    BarcodeCorrector corrector {wl, cfg};
    const std::vector<std::string> queries {
        "ACGTAC", "ACGTAA", "ACGTAT", "GGCTTA", "TTAGGG", "CATCAA", "NATCAT", "AAAAAA", "ACGTNN", "GGCATT",
    };
    for (std::string const& query : queries) {
        Correction first = corrector.correct(query);
        if (!first.ok()) {
            continue;
        }
        Correction const& second = corrector.correct(first.barcode);
        BOOST_TEST_CONTEXT("query " << query) {
            BOOST_CHECK_EQUAL(second.status, EXACT);
            BOOST_CHECK_EQUAL(second.barcode, first.barcode);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_n_bases) {
    tricount::Whitelist wl = make_whitelist({"ACGT", "ACGA"});
    BarcodeCorrector corrector {wl, tricount::CorrectConfig {}};

    // N is compatible with any base
    Correction const& one_n = corrector.correct("ACNT");
    BOOST_CHECK_EQUAL(one_n.status, CORRECTED);
    BOOST_CHECK_EQUAL(one_n.barcode, "ACGT");
    BOOST_CHECK_EQUAL(one_n.distance, 0u);

    BOOST_CHECK_EQUAL(corrector.correct("ACGN").status, AMBIGUOUS_CORRECTION);
    BOOST_CHECK_EQUAL(corrector.correct("NCGN").status, NO_WHITELIST_MATCH);
    BOOST_CHECK_EQUAL(corrector.correct("TTTT").status, NO_WHITELIST_MATCH);
    BOOST_CHECK_EQUAL(corrector.correct("ACG").status, NO_WHITELIST_MATCH);
}

BOOST_AUTO_TEST_CASE(test_levenshtein) {
    tricount::Whitelist wl = make_whitelist({"ACGTAC", "TTTTTT"});
    tricount::CorrectConfig cfg {};
    BarcodeCorrector hamming {wl, cfg};
    BOOST_CHECK_EQUAL(hamming.correct("CGTACG").status, NO_WHITELIST_MATCH);

    cfg.metric = tricount::LEVENSHTEIN;
    BarcodeCorrector levenshtein {wl, cfg};
    Correction const& deletion = levenshtein.correct("CGTAC");
    BOOST_CHECK_EQUAL(deletion.status, CORRECTED);
    BOOST_CHECK_EQUAL(deletion.barcode, "ACGTAC");
    BOOST_CHECK_EQUAL(deletion.distance, 1u);
    BOOST_CHECK_EQUAL(levenshtein.correct("CGTACG").status, NO_WHITELIST_MATCH);
    BOOST_CHECK_EQUAL(levenshtein.correct("TTTTTT").status, EXACT);
}

BOOST_AUTO_TEST_CASE(test_memo) {
    tricount::Whitelist wl = make_whitelist({"ACGT", "ACGA"});
    BarcodeCorrector corrector {wl, tricount::CorrectConfig {}};
    Correction const& a = corrector.correct("ACTT");
    Correction const& b = corrector.correct("ACTT");
    BOOST_CHECK_EQUAL(&a, &b);
    BOOST_CHECK_EQUAL(corrector.memo_size(), 1u);
}

BOOST_AUTO_TEST_CASE(test_empty_whitelist_is_fatal) {
    tricount::Whitelist wl;
    BOOST_CHECK_THROW((BarcodeCorrector {wl, tricount::CorrectConfig {}}), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_correct_chunk) {
    boost::log::core::get()->set_filter (
        boost::log::trivial::severity >= boost::log::trivial::debug
    );
    fs::path fq_fn = make_temp_path(".fastq.gz");
    fs::path prefix = make_temp_path("");
    {
        klibpp::SeqStreamOut fqfp(fq_fn.c_str(), true);
        for (std::string name : {"r1_ACGT_GGCC", "r2_ACTT_GGCC", "r3_ACGC_TTAA", "r4_GGGG_AAAA", "plain"}) {
            fqfp << (klibpp::KSeq {name, "CR:Z:NNNN", "GCTAGCTAGC", "FFFFFFFFFF"});
        }
    }
    tricount::Whitelist wl = make_whitelist({"ACGT", "ACGA"});
    {
        CorrectWorker worker {wl, prefix.string(), {"correct", fq_fn.string(), "whitelist.txt", prefix.string()}};
        BOOST_REQUIRE_EQUAL(worker.run(fq_fn.string()), 0);
        CorrectStatistics const& stats = worker.get_stats();
        BOOST_CHECK_EQUAL(stats.total, 5u);
        BOOST_CHECK_EQUAL(stats.malformed, 1u);
        BOOST_CHECK_EQUAL(stats.status_counts.at(EXACT), 1u);
        BOOST_CHECK_EQUAL(stats.status_counts.at(CORRECTED), 1u);
        BOOST_CHECK_EQUAL(stats.status_counts.at(AMBIGUOUS_CORRECTION), 1u);
        BOOST_CHECK_EQUAL(stats.status_counts.at(NO_WHITELIST_MATCH), 1u);
        BOOST_CHECK_EQUAL(stats.distance_counts.at(0), 1u);
        BOOST_CHECK_EQUAL(stats.distance_counts.at(1), 1u);
        nlohmann::ordered_json j = stats.to_json();
        BOOST_CHECK_EQUAL(j["config"]["metric"], "hamming");
        BOOST_CHECK_EQUAL(j["status_counts"]["CORRECTED"], 1);
    }
    BOOST_TEST_PASSPOINT();

    tricount::FastqReader reader {prefix.string() + ".fastq.gz"};
    tricount::Read read;
    BOOST_TEST_REQUIRE(reader.next_read(read));
    BOOST_CHECK_EQUAL(read.name, "r1_ACGT_GGCC");
    BOOST_CHECK_EQUAL(read.comment, "CB:Z:ACGT\tCR:Z:ACGT\tUB:Z:GGCC\tUR:Z:GGCC\tBD:i:0");
    BOOST_TEST_REQUIRE(reader.next_read(read));
    BOOST_CHECK_EQUAL(read.name, "r2_ACGT_GGCC");
    BOOST_CHECK_EQUAL(read.comment, "CB:Z:ACGT\tCR:Z:ACTT\tUB:Z:GGCC\tUR:Z:GGCC\tBD:i:1");
    BOOST_CHECK_EQUAL(read.seq, "GCTAGCTAGC");
    BOOST_CHECK(!reader.next_read(read));

    fs::remove(fq_fn);
    fs::remove(prefix.string() + ".fastq.gz");
}
