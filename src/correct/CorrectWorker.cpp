// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <vector>
#include <optional>
#include <iostream>
#include <boost/log/trivial.hpp>
#include <tricount.hpp>
#include "BarcodeCorrector.hpp"
#include "CorrectStats.hpp"
#include "CorrectWorker.hpp"

CorrectWorker::CorrectWorker(
    tricount::Whitelist const& whitelist,
    const std::string& prefix,
    const std::vector<std::string>& cli,
    const tricount::CorrectConfig& cfg
) :
    cfg(cfg),
    corrector(whitelist, this->cfg),
    stat(this->cfg, whitelist.size(), cli),
    outfq(prefix + ".fastq.gz")
{}

bool CorrectWorker::process(tricount::Read& read) {
    std::optional<tricount::TaggedName> tagged = tricount::parse_tagged_name(read.name);
    if (!tagged) {
        BOOST_LOG_TRIVIAL(debug) << "Read name without barcode and UMI: " << read.name;
        stat.record_malformed();
        return false;
    }
    Correction const& correction = corrector.correct(tagged->barcode);
    stat.record(correction);
    if (!correction.ok()) {
        return false;
    }
    read.name = tricount::tagged_name(tagged->id, correction.barcode, tagged->umi);
    read.comment = "CB:Z:" + correction.barcode +
                   "\tCR:Z:" + tagged->barcode +
                   "\tUB:Z:" + tagged->umi +
                   "\tUR:Z:" + tagged->umi +
                   "\tBD:i:" + std::to_string(correction.distance);
    return true;
}

int CorrectWorker::run(const std::string& fqname) {
    tricount::FastqReader reader(fqname);
    tricount::Read read;
    std::cerr << tricount::put_time() << " [INFO] Begin\n";
    unsigned long long total_in = 0;
    while (reader.next_read(read)) {
        if (process(read)) {
            outfq.write(read);
        }
        if ((++total_in % 1000000) == 0) {
            std::cerr << tricount::put_time() << " [INFO] Processed " << total_in << " reads...\n";
        }
    }
    BOOST_LOG_TRIVIAL(info) << "Wrote " << outfq.count() << " of " << total_in << " reads, " << corrector.memo_size() << " distinct barcodes queried";
    std::cerr << tricount::put_time() << " [INFO] Finished! " << total_in << " reads processed\n";
    return 0;
}

void CorrectWorker::dump_stats(std::ostream& strm) const {
    strm << stat;
}
