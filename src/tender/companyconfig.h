// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2015-2021 The hemis Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef AGORA_TENDER_COMPANYCONFIG_H
#define AGORA_TENDER_COMPANYCONFIG_H

#include "fs.h"
#include "sync.h"
#include "tender/tenderinterfaces.h"

#include <string>
#include <vector>

extern const char * const AGORA_COMPANY_CONF_FILENAME;

class ArgsManager;

/** Path of the company directory file given by -companyconf */
fs::path GetCompanyConfigFile(const ArgsManager& args);

/**
 * Company directory backed by company.conf, one company per line:
 *
 *   companyid representative
 */
class CCompanyConfig : public CCompanyDirectory
{
public:
    class CCompanyEntry
    {
    private:
        CompanyId nCompanyId;
        AccountId representative;

    public:
        CCompanyEntry(CompanyId _nCompanyId, const AccountId& _representative) :
            nCompanyId(_nCompanyId),
            representative(_representative) {}

        CompanyId getCompanyId() const { return nCompanyId; }
        const AccountId& getRepresentative() const { return representative; }
    };

    explicit CCompanyConfig(const fs::path& pathIn) : pathCompanyConfigFile(pathIn) {}

    void clear();
    bool read(std::string& strErr);
    void add(CompanyId nCompanyId, const AccountId& representative);

    std::vector<CCompanyEntry> getEntries() const
    {
        LOCK(cs_entries);
        return entries;
    }

    int getCount() const
    {
        LOCK(cs_entries);
        return (int)entries.size();
    }

    CompanyLookupResult LookupRepresentative(CompanyId nCompanyId, AccountId& representativeRet, std::string& strError) const override;

private:
    const fs::path pathCompanyConfigFile;
    std::vector<CCompanyEntry> entries;
    mutable RecursiveMutex cs_entries;
};

#endif // AGORA_TENDER_COMPANYCONFIG_H
