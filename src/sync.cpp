// Copyright (c) 2011-2018 The Bitcoin Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "sync.h"

#ifdef DEBUG_LOCKORDER

#include "logging.h"
#include "util/string.h"

#include <algorithm>
#include <cstdlib>
#include <vector>

//
// Early deadlock detection.
// Keeps the list of locks held by the current thread so that lock
// assertions can be checked at runtime.
//

struct CLockLocation {
    CLockLocation(const char* pszName, const char* pszFile, int nLine, bool fTryIn)
        : fTry(fTryIn), mutexName(pszName), sourceFile(pszFile), sourceLine(nLine) {}

    std::string ToString() const
    {
        return strprintf("%s %s:%s%s", mutexName, sourceFile, sourceLine, (fTry ? " (TRY)" : ""));
    }

private:
    bool fTry;
    std::string mutexName;
    std::string sourceFile;
    int sourceLine;
};

typedef std::vector<std::pair<void*, CLockLocation> > LockStack;

static thread_local LockStack g_lockstack;

void EnterCritical(const char* pszName, const char* pszFile, int nLine, void* cs, bool fTry)
{
    g_lockstack.emplace_back(cs, CLockLocation(pszName, pszFile, nLine, fTry));
}

void LeaveCritical(void* cs)
{
    // Recursive mutexes may be held more than once: drop the innermost entry.
    auto it = std::find_if(g_lockstack.rbegin(), g_lockstack.rend(),
                           [cs](const std::pair<void*, CLockLocation>& i) { return i.first == cs; });
    if (it != g_lockstack.rend()) {
        g_lockstack.erase(std::next(it).base());
    }
}

std::string LocksHeld()
{
    std::string result;
    for (const auto& i : g_lockstack)
        result += i.second.ToString() + std::string("\n");
    return result;
}

static bool LockHeld(void* cs)
{
    for (const auto& i : g_lockstack) {
        if (i.first == cs) return true;
    }
    return false;
}

void AssertLockHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs)
{
    if (LockHeld(cs)) return;
    LogPrintf("Assertion failed: lock %s not held in %s:%i; locks held:\n%s", pszName, pszFile, nLine, LocksHeld());
    abort();
}

void AssertLockNotHeldInternal(const char* pszName, const char* pszFile, int nLine, void* cs)
{
    if (!LockHeld(cs)) return;
    LogPrintf("Assertion failed: lock %s held in %s:%i; locks held:\n%s", pszName, pszFile, nLine, LocksHeld());
    abort();
}

#endif /* DEBUG_LOCKORDER */
