// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_FASTQ_H
#define TRICOUNT_FASTQ_H

#include <string>
#include <memory>
#include <kseq++/seqio.hpp>
#include <tricount/Read.hpp>

namespace tricount {
    // Single-end FASTQ reader. Plain and gzipped input are both accepted.
    class FastqReader {
        std::unique_ptr<klibpp::SeqStreamIn> fastq;
        unsigned long long nread = 0;

    public:
        FastqReader() = default;
        explicit FastqReader(const std::string &fqname);
        bool open(const std::string &fqname);
        bool next_read(Read& read);
        unsigned long long count() const {return nread;}
    };

    // FASTQ writer. Output is gzip-compressed if the file name ends in ".gz".
    class FastqWriter {
        std::unique_ptr<klibpp::SeqStreamOut> fastq;
        unsigned long long nwritten = 0;

    public:
        FastqWriter() = default;
        explicit FastqWriter(const std::string &fqname);
        bool open(const std::string &fqname);
        void write(const Read& read);
        unsigned long long count() const {return nwritten;}
    };
}

#endif //TRICOUNT_FASTQ_H
