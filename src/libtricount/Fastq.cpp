// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#include <string>
#include <stdexcept>
#include <filesystem>
#include <kseq++/seqio.hpp>
#include <tricount/Read.hpp>
#include <tricount/Fastq.hpp>

namespace tricount {

FastqReader::FastqReader(const std::string &fqname) {
    if (!open(fqname)) {
        throw std::runtime_error("Unable to open FASTQ file for reading: " + fqname);
    }
}

bool FastqReader::open(const std::string &fqname) {
    if (!std::filesystem::exists(fqname)) {
        return false;
    }
    fastq = std::make_unique<klibpp::SeqStreamIn>(fqname.c_str());
    nread = 0;
    return !!*fastq;
}

bool FastqReader::next_read(Read& read) {
    if (!fastq) {
        throw std::logic_error("FastqReader::next_read called before open");
    }
    klibpp::KSeq rec;
    (*fastq) >> rec;
    if (rec.name.empty()) {
        return false;
    }
    if (!rec.qual.empty() && rec.qual.length() != rec.seq.length()) {
        throw std::runtime_error("Invalid fastq record " + rec.name + ": sequence and quality lengths differ (" + std::to_string(rec.seq.length()) + " != " + std::to_string(rec.qual.length()) + ")");
    }
    read.name = std::move(rec.name);
    read.comment = std::move(rec.comment);
    read.seq = std::move(rec.seq);
    read.qual = std::move(rec.qual);
    read.reversed = false;
    ++nread;
    return true;
}

FastqWriter::FastqWriter(const std::string &fqname) {
    if (!open(fqname)) {
        throw std::runtime_error("Unable to open FASTQ file for writing: " + fqname);
    }
}

bool FastqWriter::open(const std::string &fqname) {
    bool compressed = fqname.ends_with(".gz");
    fastq = std::make_unique<klibpp::SeqStreamOut>(fqname.c_str(), compressed);
    nwritten = 0;
    return !!*fastq;
}

void FastqWriter::write(const Read& read) {
    if (!fastq) {
        throw std::logic_error("FastqWriter::write called before open");
    }
    // Reads without qualities still go out as FASTQ
    std::string qual = read.qual.empty() ? std::string(read.seq.length(), 'I') : read.qual;
    (*fastq) << klibpp::KSeq {read.name, read.comment, read.seq, qual};
    ++nwritten;
}

}
