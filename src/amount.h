// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_AMOUNT_H
#define AGORA_AMOUNT_H

#include <stdint.h>

/** Amount in the smallest unit of the funding ledger (can be negative) */
typedef int64_t CAmount;

static const CAmount COIN = 100000000;

/** No amount larger than this is valid.
 *
 * Note that this constant is *not* the total money supply of the ledger,
 * it is a sanity bound on any single disbursement requested by a tender.
 */
static const CAmount MAX_MONEY = 21000000000 * COIN;
inline bool MoneyRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_MONEY); }

#endif //  AGORA_AMOUNT_H
