// Copyright (c) 2017 The Bitcoin Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_FS_H
#define AGORA_FS_H

#include <stdio.h>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>

/** Filesystem operations and types */
namespace fs = boost::filesystem;

/** Bridge operations to C stdio */
namespace fsbridge {
    FILE *fopen(const fs::path& p, const char *mode);

    typedef fs::ifstream ifstream;
    typedef fs::ofstream ofstream;
};

#endif // AGORA_FS_H
