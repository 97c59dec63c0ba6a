// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <iostream>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <tricount.hpp>
#include "PolyAOrienter.hpp"
#include "TrimerDecoder.hpp"
#include "IdentifyStats.hpp"
#include "IdentifyWorker.hpp"

IdentifyWorker::IdentifyWorker(
    const std::string& prefix,
    const std::vector<std::string>& cli,
    const tricount::PipelineConfig& cfg
) :
    cfg(cfg),
    orienter(this->cfg.orient),
    decoder(this->cfg.decode),
    stat(this->cfg, cli),
    whitelist(),
    prefix(prefix),
    decoded(prefix + ".fastq.gz"),
    uncorrected(prefix + "_uncorrected.fastq.gz")
{
    this->cfg.validate();
}

IdentifyOutcome IdentifyWorker::process(tricount::Read&& read) {
    OrientedRead oriented = orienter(std::move(read));
    AnchorStatus anchor = ANCHOR_OK;
    DecodedTag tag {};
    if (oriented.status != ORIENT_UNANCHORED) {
        anchor = orienter.place_window(oriented, cfg.decode.window_len(), cfg.decode.trailer_len);
        // A misplaced window is still decoded from the end of the run so its bases can be reported
        tag = decoder.decode(oriented.read.seq, oriented.polya.end);
    }
    IdentifyOutcome outcome = classify(oriented.status, anchor, tag);

    // The barcode is usable for the whitelist even if the UMI is not
    bool whitelisted = false;
    if ((outcome == PASS || outcome == AMBIGUOUS_UMI) && tag.barcode.min_confidence() >= cfg.decode.whitelist_min_confidence) {
        whitelist.add(tag.barcode.seq);
        whitelisted = true;
    }
    stat.record(oriented.status, tag, outcome, whitelisted);

    if (outcome == UNANCHORED_READ) {
        return outcome;
    }
    tricount::Read cdna = oriented.read.slice(0, oriented.polya.start);
    if (outcome == PASS) {
        cdna.comment = "CR:Z:" + tag.barcode.seq + "\tUR:Z:" + tag.umi.seq;
        cdna.name = tricount::tagged_name(cdna.name, tag.barcode.seq, tag.umi.seq);
        decoded.write(cdna);
    } else {
        cdna.comment = "QC:Z:" + IdentifyOutcomeNames[outcome];
        cdna.name = tricount::tagged_name(cdna.name, tag.barcode.raw, tag.umi.raw);
        uncorrected.write(cdna);
    }
    return outcome;
}

int IdentifyWorker::run(const std::string& fqname) {
    tricount::FastqReader reader(fqname);
    tricount::Read read;
    std::cerr << tricount::put_time() << " [INFO] Begin\n";
    unsigned long long total_in = 0;
    while (reader.next_read(read)) {
        process(std::move(read));
        if ((++total_in % 1000000) == 0) {
            std::cerr << tricount::put_time() << " [INFO] Processed " << total_in << " reads...\n";
        }
    }
    whitelist.save(prefix + ".whitelist.txt");
    BOOST_LOG_TRIVIAL(info) << "Wrote " << decoded.count() << " decoded and " << uncorrected.count() << " undecodable reads, " << whitelist.size() << " distinct barcodes";
    std::cerr << tricount::put_time() << " [INFO] Finished! " << total_in << " reads processed\n";
    return 0;
}

void IdentifyWorker::dump_stats(std::ostream& strm) const {
    strm << stat;
}
