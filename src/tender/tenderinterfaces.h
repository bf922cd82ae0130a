// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_TENDER_TENDERINTERFACES_H
#define AGORA_TENDER_TENDERINTERFACES_H

#include "amount.h"
#include "tender/tender.h"

#include <string>

// Collaborators of a tender. They are owned by the embedding application and
// injected by reference into CTenderManager. Each call reports failure through
// its return value; a thrown std::exception is treated the same way.

enum class CompanyLookupResult {
    FOUND,
    UNKNOWN_COMPANY,
    FAILED,
};

/** Read-only registry of companies and their authorized representatives */
class CCompanyDirectory
{
public:
    virtual ~CCompanyDirectory() {}

    // Fills representativeRet when the company is known. UNKNOWN_COMPANY and
    // FAILED are distinct so that a missing entry is never mistaken for an
    // unreachable directory.
    virtual CompanyLookupResult LookupRepresentative(CompanyId nCompanyId, AccountId& representativeRet, std::string& strError) const = 0;
};

/** Custodian of the tender funds */
class CFundingLedger
{
public:
    virtual ~CFundingLedger() {}

    virtual bool Disburse(CAmount nAmount, const ProjectId& projectId, std::string& strError) = 0;
};

/** Creates the project record of an awarded tender */
class CProjectFactory
{
public:
    virtual ~CProjectFactory() {}

    virtual bool CreateProject(const std::string& strTenderId, CompanyId nCompanyId, ProjectId& projectIdRet, std::string& strError) = 0;

    // Undo a CreateProject whose award could not be completed.
    virtual bool DiscardProject(const ProjectId& projectId, std::string& strError) = 0;
};

#endif // AGORA_TENDER_TENDERINTERFACES_H
