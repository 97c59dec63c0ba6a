// Copyright © 2025 Merck & Co., Inc., Rahway, NJ, USA and its affiliates. All rights reserved.
// This file is part of TriCount.
//
// This source code is licensed under the MIT License found in the
// LICENSE file in the root directory of this source tree.

#ifndef TRICOUNT_H
#define TRICOUNT_H

#include <tricount/version.hpp>
#include <tricount/Util.hpp>
#include <tricount/Read.hpp>
#include <tricount/Fastq.hpp>
#include <tricount/Distance.hpp>
#include <tricount/Config.hpp>
#include <tricount/Whitelist.hpp>
#include <tricount/Gtf.hpp>
#include <tricount/Cli.hpp>

#endif //TRICOUNT_H
