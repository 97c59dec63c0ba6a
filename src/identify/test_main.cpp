// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <boost/test/unit_test.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <vector>
#include <string>
#include <set>
#include <unistd.h>
#include <kseq++/seqio.hpp>
#include <tricount.hpp>
#include "PolyAOrienter.hpp"
#include "TrimerDecoder.hpp"
#include "IdentifyWorker.hpp"

namespace fs = std::filesystem;

static fs::path make_temp_path(const std::string& suffix) {
    static unsigned counter = 0;
    return fs::temp_directory_path() / ("tricount_identify_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + suffix);
}

static const std::string cdna = "GCTAGCTTGCAGCTCG";
static const std::string polya (15, 'A');
static const std::string trail = "GTCAGT";

static tricount::DecodeConfig small_decode(int barcode_len = 3, int umi_len = 2) {
    tricount::DecodeConfig cfg {};
    cfg.barcode_len = barcode_len;
    cfg.umi_len = umi_len;
    return cfg;
}

static tricount::Read make_read(std::string const& name, std::string const& seq) {
    return tricount::Read {name, seq, std::string(seq.length(), 'F'), "", false};
}

BOOST_AUTO_TEST_CASE(test_vote_all_triplets) {
    TrimerDecoder decoder {small_decode()};
    const std::string bases = "ACGT";
    for (char a : bases) {
        for (char b : bases) {
            for (char c : bases) {
                std::string group {a, b, c};
                std::set<char> distinct {a, b, c};
                TrimerVote v = decoder.vote(group);
                BOOST_TEST_CONTEXT("group " << group) {
                    if (distinct.size() == 3) {
                        BOOST_CHECK(v.ambiguous());
                    } else {
                        char majority = (a == b || a == c) ? a : b;
                        BOOST_CHECK(!v.ambiguous());
                        BOOST_CHECK_EQUAL(v.symbol, majority);
                        BOOST_CHECK_EQUAL(static_cast<int>(v.votes), distinct.size() == 1 ? 3 : 2);
                    }
                }
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(test_vote_n_and_redundancy) {
    TrimerDecoder decoder {small_decode()};
    BOOST_CHECK_EQUAL(decoder.vote("CCN").symbol, 'C');
    BOOST_CHECK_EQUAL(static_cast<int>(decoder.vote("CCN").votes), 2);
    BOOST_CHECK(decoder.vote("CNN").ambiguous());
    BOOST_CHECK(decoder.vote("NNN").ambiguous());
    BOOST_CHECK_EQUAL(decoder.vote("ggt").symbol, 'G');

    tricount::DecodeConfig single = small_decode();
    single.redundancy = 1;
    TrimerDecoder single_decoder {single};
    BOOST_CHECK_EQUAL(single_decoder.vote("T").symbol, 'T');
    BOOST_CHECK(single_decoder.vote("N").ambiguous());

    tricount::DecodeConfig five = small_decode();
    five.redundancy = 5;
    TrimerDecoder five_decoder {five};
    BOOST_CHECK(five_decoder.vote("AACCG").ambiguous());
    BOOST_CHECK_EQUAL(five_decoder.vote("AAACC").symbol, 'A');
    BOOST_CHECK_EQUAL(static_cast<int>(five_decoder.vote("AAACC").votes), 3);

    tricount::DecodeConfig first = small_decode();
    first.vote = tricount::FIRST_BASE;
    TrimerDecoder first_decoder {first};
    BOOST_CHECK_EQUAL(first_decoder.vote("ACG").symbol, 'A');
    BOOST_CHECK_EQUAL(static_cast<int>(first_decoder.vote("ACG").votes), 1);
    BOOST_CHECK_EQUAL(static_cast<int>(first_decoder.vote("CCC").votes), 3);
}

BOOST_AUTO_TEST_CASE(test_decode_barcode_with_one_error) {
    TrimerDecoder decoder {small_decode(3, 0)};
    const std::vector<std::string> windows {
        "AAACCCGGG",
        "AAACGCGGG",
        "AAACCCGGG",
    };
    for (std::string const& window : windows) {
        DecodedTag tag = decoder.decode(std::string_view {window});
        BOOST_TEST_REQUIRE(tag.barcode.ok());
        BOOST_CHECK_EQUAL(tag.barcode.seq, "ACG");
        BOOST_CHECK(tag.umi.ok());
    }
    DecodedTag with_error = decoder.decode(std::string_view {windows[1]});
    BOOST_CHECK_EQUAL(static_cast<int>(with_error.barcode.min_confidence()), 2);
    BOOST_CHECK_EQUAL(static_cast<int>(with_error.barcode.confidence[1]), 2);

    DecodedTag ambiguous = decoder.decode(std::string_view {"ACGCCCGGG"});
    BOOST_CHECK_EQUAL(ambiguous.barcode.status, DECODE_AMBIGUOUS);
    BOOST_CHECK_EQUAL(ambiguous.barcode.ambiguous_pos, 0);
    BOOST_CHECK(ambiguous.barcode.seq.empty());
    BOOST_CHECK_EQUAL(ambiguous.barcode.raw, "ACGCCCGGG");
}

BOOST_AUTO_TEST_CASE(test_decode_fields_independent) {
    TrimerDecoder decoder {small_decode()};
    DecodedTag bad_umi = decoder.decode(std::string_view {"CCCGGGTTTCGATTT"});
    BOOST_CHECK(bad_umi.barcode.ok());
    BOOST_CHECK_EQUAL(bad_umi.barcode.seq, "CGT");
    BOOST_CHECK_EQUAL(bad_umi.umi.status, DECODE_AMBIGUOUS);

    DecodedTag bad_barcode = decoder.decode(std::string_view {"CCCGATTTTGGGAAA"});
    BOOST_CHECK_EQUAL(bad_barcode.barcode.status, DECODE_AMBIGUOUS);
    BOOST_CHECK_EQUAL(bad_barcode.barcode.ambiguous_pos, 1);
    BOOST_CHECK(bad_barcode.umi.ok());
    BOOST_CHECK_EQUAL(bad_barcode.umi.seq, "GA");
}

BOOST_AUTO_TEST_CASE(test_decode_truncated) {
    TrimerDecoder decoder {small_decode()};
    std::string seq = cdna + polya + "CCCGGGTTTGGGC";
    DecodedTag tag = decoder.decode(seq, cdna.length() + polya.length());
    BOOST_CHECK_EQUAL(tag.barcode.status, DECODE_TRUNCATED);
    BOOST_CHECK_EQUAL(tag.umi.status, DECODE_TRUNCATED);
    BOOST_CHECK_EQUAL(tag.barcode.raw, "CCCGGGTTT");
    BOOST_CHECK_EQUAL(tag.umi.raw, "GGGC");

    DecodedTag past_end = decoder.decode(seq, seq.length() + 10);
    BOOST_CHECK_EQUAL(past_end.barcode.status, DECODE_TRUNCATED);
}

BOOST_AUTO_TEST_CASE(test_orient_forward) {
    PolyAOrienter orienter {tricount::OrientConfig {}};
    std::string seq = cdna + polya + "CCCGGGTTTGGGCCC" + trail;
    OrientedRead result = orienter(make_read("r1", seq));
    BOOST_CHECK_EQUAL(result.status, ORIENT_FORWARD);
    BOOST_CHECK_EQUAL(result.polya.start, cdna.length());
    BOOST_CHECK_EQUAL(result.polya.end, cdna.length() + polya.length());
    BOOST_CHECK(!result.read.reversed);
    BOOST_CHECK_EQUAL(result.read.seq, seq);
}

BOOST_AUTO_TEST_CASE(test_orient_reversed) {
    PolyAOrienter orienter {tricount::OrientConfig {}};
    std::string seq = cdna + polya + "CCCGGGTTTGGGCCC" + trail;
    OrientedRead result = orienter(make_read("r1", tricount::reverse_complement(seq)));
    BOOST_CHECK_EQUAL(result.status, ORIENT_REVERSED);
    BOOST_CHECK(result.read.reversed);
    BOOST_CHECK_EQUAL(result.read.seq, seq);
    BOOST_CHECK_EQUAL(result.polya.end, cdna.length() + polya.length());

    tricount::OrientConfig tail_only {};
    tail_only.anchor = tricount::TAIL_ONLY;
    PolyAOrienter strict {tail_only};
    BOOST_CHECK_EQUAL(strict(make_read("r1", tricount::reverse_complement(seq))).status, ORIENT_UNANCHORED);
}

BOOST_AUTO_TEST_CASE(test_orient_tolerates_tail_error) {
    PolyAOrienter orienter {tricount::OrientConfig {}};
    std::string tail = std::string(12, 'A') + "G" + std::string(12, 'A');
    std::string seq = cdna + tail + "CCCGGGTTTGGGCCC" + trail;
    std::optional<PolyARun> run = orienter.find_polya(seq);
    BOOST_TEST_REQUIRE(run.has_value());
    BOOST_CHECK_EQUAL(run->start, cdna.length());
    BOOST_CHECK_EQUAL(run->end, cdna.length() + tail.length());

    // Two errors in a seed is not a poly-A
    BOOST_CHECK(!orienter.find_polya(cdna + "AAAAGAAGAA" + "CCCGGG").has_value());
}

BOOST_AUTO_TEST_CASE(test_orient_unanchored) {
    PolyAOrienter orienter {tricount::OrientConfig {}};
    OrientedRead result = orienter(make_read("r1", cdna + cdna));
    BOOST_CHECK_EQUAL(result.status, ORIENT_UNANCHORED);
    BOOST_CHECK_EQUAL(result.read.seq, cdna + cdna);

    // A poly-A outside the search window does not count
    std::string far;
    for (int i = 0; i < 70; ++i) {
        far += "GCT";
    }
    BOOST_CHECK(!orienter.find_polya(polya + far).has_value());
    BOOST_CHECK_EQUAL(orienter(make_read("r2", polya + far)).status, ORIENT_UNANCHORED);
}

BOOST_AUTO_TEST_CASE(test_place_window_splits_leading_a) {
    PolyAOrienter orienter {tricount::OrientConfig {}};
    TrimerDecoder decoder {small_decode()};
    const std::size_t window_len = small_decode().window_len();
    const std::vector<std::string> windows {
        "AAACCCGGG" "GGGCCC",
        "AAGCCCGGG" "GGGCCC",
        "AACCCCGGG" "GGGCCC",
    };
    for (std::string const& window : windows) {
        BOOST_TEST_CONTEXT("window " << window) {
            OrientedRead oriented = orienter(make_read("r1", cdna + polya + window + trail));
            BOOST_TEST_REQUIRE(oriented.status == ORIENT_FORWARD);
            // The run swallows the leading A bases of the barcode
            BOOST_CHECK_GT(oriented.polya.end, cdna.length() + polya.length());
            BOOST_TEST_REQUIRE(orienter.place_window(oriented, window_len, trail.length()) == ANCHOR_OK);
            BOOST_CHECK_EQUAL(oriented.polya.start, cdna.length());
            BOOST_CHECK_EQUAL(oriented.polya.end, cdna.length() + polya.length());
            DecodedTag tag = decoder.decode(oriented.read.seq, oriented.polya.end);
            BOOST_TEST_REQUIRE(tag.barcode.ok());
            BOOST_CHECK_EQUAL(tag.barcode.seq, "ACG");
            BOOST_CHECK_EQUAL(tag.umi.seq, "GC");
        }
    }
}

BOOST_AUTO_TEST_CASE(test_place_window_rejects) {
    PolyAOrienter orienter {tricount::OrientConfig {}};
    const std::size_t window_len = small_decode().window_len();

    // Extra bases between the tail and the window
    OrientedRead shifted = orienter(make_read("r1", cdna + polya + "CCCGGGTTT" + "GGGCCC" + trail));
    BOOST_CHECK_EQUAL(orienter.place_window(shifted, window_len, 0), ANCHOR_AMBIGUOUS);
    BOOST_CHECK_EQUAL(shifted.polya.end, cdna.length() + polya.length());

    // No room for the trailer
    OrientedRead short_read = orienter(make_read("r2", cdna + polya + "CCCGGG"));
    BOOST_CHECK_EQUAL(orienter.place_window(short_read, window_len, trail.length()), ANCHOR_TRUNCATED);

    // Only tail where the window should be
    OrientedRead all_tail = orienter(make_read("r3", cdna + std::string(30, 'A') + trail));
    BOOST_CHECK_EQUAL(orienter.place_window(all_tail, window_len, trail.length()), ANCHOR_TRUNCATED);
    BOOST_CHECK_EQUAL(all_tail.polya.end, cdna.length() + 30);
}

struct run_identify {
    tricount::PipelineConfig cfg;

    run_identify() {
        cfg.decode = small_decode();
        cfg.decode.trailer_len = trail.length();
    }

    fs::path operator()(std::vector<tricount::Read> const& reads, IdentifyStatistics& stats_out, tricount::Whitelist& whitelist_out) const {
        boost::log::core::get()->set_filter (
            boost::log::trivial::severity >= boost::log::trivial::debug
        );
        fs::path fq_fn = make_temp_path(".fastq.gz");
        fs::path prefix = make_temp_path("");
        {
            klibpp::SeqStreamOut fqfp(fq_fn.c_str(), true);
            for (tricount::Read const& read : reads) {
                fqfp << (klibpp::KSeq {read.name, "", read.seq, read.qual});
            }
        }
        std::vector<std::string> cli {"identify", fq_fn.string(), prefix.string()};
        {
            IdentifyWorker worker {prefix.string(), cli, cfg};
            BOOST_REQUIRE_EQUAL(worker.run(fq_fn.string()), 0);
            std::ofstream stats_file (prefix.string() + ".identify.json");
            worker.dump_stats(stats_file);
            stats_out.total = worker.get_stats().total;
            stats_out.whitelisted = worker.get_stats().whitelisted;
            stats_out.outcome_counts = worker.get_stats().outcome_counts;
            stats_out.orient_counts = worker.get_stats().orient_counts;
            whitelist_out = worker.get_whitelist();
        }
        BOOST_TEST_PASSPOINT();
        fs::remove(fq_fn);
        return prefix;
    }
};

static std::vector<tricount::Read> read_all(fs::path const& path) {
    std::vector<tricount::Read> result;
    tricount::FastqReader reader {path.string()};
    tricount::Read read;
    while (reader.next_read(read)) {
        result.push_back(read);
    }
    return result;
}

BOOST_AUTO_TEST_CASE(test_identify_chunk) {
    std::vector<tricount::Read> reads {
        make_read("r1", cdna + polya + "CCCGGGTTT" + "GGGCCC" + trail),
        make_read("r2", tricount::reverse_complement(cdna + polya + "CCCGGGTTT" + "GGGCTC" + trail)),
        make_read("r3", cdna + cdna),
        make_read("r4", cdna + polya + "CCCGGG"),
        make_read("r5", cdna + polya + "CGTGGGTTT" + "GGGCCC" + trail),
        make_read("r6", cdna + polya + "TTTCCCGGG" + "CGAAAT" + trail),
    };
    tricount::PipelineConfig cfg {};
    IdentifyStatistics stats {cfg, {}};
    tricount::Whitelist whitelist;
    fs::path prefix = run_identify{}(reads, stats, whitelist);

    BOOST_CHECK_EQUAL(stats.total, 6u);
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(PASS), 2u);
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(UNANCHORED_READ), 1u);
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(TRUNCATED_WINDOW), 1u);
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(AMBIGUOUS_BARCODE), 1u);
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(AMBIGUOUS_UMI), 1u);
    BOOST_CHECK_EQUAL(stats.orient_counts.at(ORIENT_FORWARD), 4u);
    BOOST_CHECK_EQUAL(stats.orient_counts.at(ORIENT_REVERSED), 1u);
    BOOST_CHECK_EQUAL(stats.orient_counts.at(ORIENT_UNANCHORED), 1u);
    BOOST_CHECK_EQUAL(stats.whitelisted, 3u);

    BOOST_CHECK_EQUAL(whitelist.size(), 2u);
    BOOST_CHECK_EQUAL(whitelist.count("CGT"), 2u);
    BOOST_CHECK_EQUAL(whitelist.count("TCG"), 1u);
    tricount::Whitelist saved = tricount::Whitelist::load(prefix.string() + ".whitelist.txt");
    BOOST_CHECK(saved == whitelist);

    std::vector<tricount::Read> decoded = read_all(prefix.string() + ".fastq.gz");
    BOOST_TEST_REQUIRE(decoded.size() == 2u);
    BOOST_CHECK_EQUAL(decoded[0].name, "r1_CGT_GC");
    BOOST_CHECK_EQUAL(decoded[0].comment, "CR:Z:CGT\tUR:Z:GC");
    BOOST_CHECK_EQUAL(decoded[0].seq, cdna);
    BOOST_CHECK_EQUAL(decoded[1].name, "r2_CGT_GC");
    BOOST_CHECK_EQUAL(decoded[1].seq, cdna);

    std::vector<tricount::Read> uncorrected = read_all(prefix.string() + "_uncorrected.fastq.gz");
    BOOST_TEST_REQUIRE(uncorrected.size() == 3u);
    BOOST_CHECK_EQUAL(uncorrected[0].name, "r4_CCCGGG_");
    BOOST_CHECK_EQUAL(uncorrected[1].name, "r5_CGTGGGTTT_GGGCCC");
    BOOST_CHECK_EQUAL(uncorrected[1].comment, "QC:Z:AMBIGUOUS_BARCODE");
    BOOST_CHECK_EQUAL(uncorrected[2].name, "r6_TTTCCCGGG_CGAAAT");

    BOOST_CHECK(fs::exists(prefix.string() + ".identify.json"));
    for (std::string suffix : {".fastq.gz", "_uncorrected.fastq.gz", ".whitelist.txt", ".identify.json"}) {
        fs::remove(prefix.string() + suffix);
    }
}

BOOST_AUTO_TEST_CASE(test_identify_leading_a_barcode) {
    std::vector<tricount::Read> reads {
        make_read("r1", cdna + polya + "AAACCCGGG" + "GGGCCC" + trail),
        make_read("r2", cdna + polya + "AAACGCGGG" + "GGGCTC" + trail),
        make_read("r3", cdna + polya + "AAACCCGGG" + "TTTCCC" + trail),
        make_read("r4", cdna + polya + "ACGCCCGGG" + "GGGCCC" + trail),
    };
    tricount::PipelineConfig cfg {};
    IdentifyStatistics stats {cfg, {}};
    tricount::Whitelist whitelist;
    fs::path prefix = run_identify{}(reads, stats, whitelist);

    BOOST_CHECK_EQUAL(stats.outcome_counts.at(PASS), 3u);
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(AMBIGUOUS_BARCODE), 1u);
    BOOST_CHECK_EQUAL(stats.whitelisted, 3u);
    BOOST_CHECK_EQUAL(whitelist.size(), 1u);
    BOOST_CHECK_EQUAL(whitelist.count("ACG"), 3u);

    std::vector<tricount::Read> decoded = read_all(prefix.string() + ".fastq.gz");
    BOOST_TEST_REQUIRE(decoded.size() == 3u);
    BOOST_CHECK_EQUAL(decoded[0].name, "r1_ACG_GC");
    BOOST_CHECK_EQUAL(decoded[1].name, "r2_ACG_GC");
    BOOST_CHECK_EQUAL(decoded[2].name, "r3_ACG_TC");
    for (tricount::Read const& read : decoded) {
        BOOST_CHECK_EQUAL(read.seq, cdna);
    }

    std::vector<tricount::Read> uncorrected = read_all(prefix.string() + "_uncorrected.fastq.gz");
    BOOST_TEST_REQUIRE(uncorrected.size() == 1u);
    BOOST_CHECK_EQUAL(uncorrected[0].name, "r4_ACGCCCGGG_GGGCCC");
    BOOST_CHECK_EQUAL(uncorrected[0].comment, "QC:Z:AMBIGUOUS_BARCODE");
    for (std::string suffix : {".fastq.gz", "_uncorrected.fastq.gz", ".whitelist.txt", ".identify.json"}) {
        fs::remove(prefix.string() + suffix);
    }
}

BOOST_AUTO_TEST_CASE(test_identify_ambiguous_anchor) {
    std::vector<tricount::Read> reads {
        make_read("r1", cdna + polya + "AAACCCGGG" + "GGGCCC" + trail),
        make_read("r2", cdna + polya + "AAACCCGGG" + "GGGCCC"),
    };
    run_identify runner {};
    runner.cfg.decode.trailer_len = 0;
    tricount::PipelineConfig cfg {};
    IdentifyStatistics stats {cfg, {}};
    tricount::Whitelist whitelist;
    fs::path prefix = runner(reads, stats, whitelist);

    // Unexpected bases after the window leave no way to tell where it starts
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(AMBIGUOUS_ANCHOR), 1u);
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(PASS), 1u);
    BOOST_CHECK_EQUAL(stats.whitelisted, 1u);
    BOOST_CHECK_EQUAL(whitelist.count("ACG"), 1u);

    std::vector<tricount::Read> uncorrected = read_all(prefix.string() + "_uncorrected.fastq.gz");
    BOOST_TEST_REQUIRE(uncorrected.size() == 1u);
    BOOST_CHECK_EQUAL(uncorrected[0].comment, "QC:Z:AMBIGUOUS_ANCHOR");
    for (std::string suffix : {".fastq.gz", "_uncorrected.fastq.gz", ".whitelist.txt", ".identify.json"}) {
        fs::remove(prefix.string() + suffix);
    }
}

BOOST_AUTO_TEST_CASE(test_identify_perfect_whitelist) {
    std::vector<tricount::Read> reads {
        make_read("r1", cdna + polya + "CCCGGGTTT" + "GGGCCC" + trail),
        make_read("r2", cdna + polya + "CCGGGGTTT" + "GGGCCC" + trail),
    };
    run_identify runner {};
    runner.cfg.decode.whitelist_min_confidence = 3;
    tricount::PipelineConfig cfg {};
    IdentifyStatistics stats {cfg, {}};
    tricount::Whitelist whitelist;
    fs::path prefix = runner(reads, stats, whitelist);

    // Both reads decode, only the perfect one is whitelisted
    BOOST_CHECK_EQUAL(stats.outcome_counts.at(PASS), 2u);
    BOOST_CHECK_EQUAL(stats.whitelisted, 1u);
    BOOST_CHECK_EQUAL(whitelist.count("CGT"), 1u);
    for (std::string suffix : {".fastq.gz", "_uncorrected.fastq.gz", ".whitelist.txt", ".identify.json"}) {
        fs::remove(prefix.string() + suffix);
    }
}

BOOST_AUTO_TEST_CASE(test_identify_missing_input) {
    tricount::PipelineConfig cfg {};
    fs::path prefix = make_temp_path("");
    IdentifyWorker worker {prefix.string(), {"identify"}, cfg};
    BOOST_CHECK_THROW(worker.run((prefix / "does_not_exist.fastq").string()), std::runtime_error);
    for (std::string suffix : {".fastq.gz", "_uncorrected.fastq.gz"}) {
        fs::remove(prefix.string() + suffix);
    }
}
