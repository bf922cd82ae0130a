// Copyright (c) 2011-2018 The Bitcoin Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE Agora Test Suite

#include <boost/test/unit_test.hpp>
