// Copyright (c) 2014-2015 The Dash developers
// Copyright (c) 2015-2021 The hemis Core developers
// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "tender/companyconfig.h"

#include "logging.h"
#include "util/system.h"

#include <cstring>
#include <sstream>

const char * const AGORA_COMPANY_CONF_FILENAME = "company.conf";

fs::path GetCompanyConfigFile(const ArgsManager& args)
{
    return fs::absolute(args.GetArg("-companyconf", AGORA_COMPANY_CONF_FILENAME));
}

void CCompanyConfig::clear()
{
    LOCK(cs_entries);
    entries.clear();
}

void CCompanyConfig::add(CompanyId nCompanyId, const AccountId& representative)
{
    LOCK(cs_entries);
    entries.emplace_back(nCompanyId, representative);
}

bool CCompanyConfig::read(std::string& strErr)
{
    LOCK(cs_entries);
    int linenumber = 1;
    fsbridge::ifstream streamConfig(pathCompanyConfigFile);

    if (!streamConfig.good()) {
        FILE* configFile = fsbridge::fopen(pathCompanyConfigFile, "a");
        if (configFile != nullptr) {
            std::string strHeader = "# Company directory file\n"
                                    "# Format: companyid representative\n"
                                    "# Example: 1 acme-procurement\n"
                                    "#\n";
            fwrite(strHeader.c_str(), std::strlen(strHeader.c_str()), 1, configFile);
            fclose(configFile);
        }
        return true; // Nothing to read, so just return
    }

    std::vector<CCompanyEntry> vEntries;
    for (std::string line; std::getline(streamConfig, line); linenumber++) {
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string comment, strCompanyId, representative, extra;

        if (iss >> comment) {
            if (comment.at(0) == '#') continue;
            iss.str(line);
            iss.clear();
        } else {
            continue; // whitespace only
        }

        // only a comment may follow the representative
        if (!(iss >> strCompanyId >> representative) || (iss >> extra && extra.at(0) != '#')) {
            strErr = "Could not parse company.conf\n" +
                     strprintf("Line: %d", linenumber) + "\n\"" + line + "\"";
            streamConfig.close();
            return false;
        }

        uint64_t nCompanyId = 0;
        if (!ParseUInt64(strCompanyId, &nCompanyId)) {
            strErr = strprintf("Invalid company id %s in company.conf", strCompanyId) + "\n" +
                     strprintf("Line: %d", linenumber) + "\n\"" + line + "\"";
            streamConfig.close();
            return false;
        }

        for (const auto& e : vEntries) {
            if (e.getCompanyId() == nCompanyId) {
                strErr = strprintf("Duplicate company id %d in company.conf", nCompanyId) + "\n" +
                         strprintf("Line: %d", linenumber) + "\n\"" + line + "\"";
                streamConfig.close();
                return false;
            }
        }

        vEntries.emplace_back(nCompanyId, representative);
    }

    streamConfig.close();
    entries = vEntries;
    LogPrint(BCLog::CONFIG, "%s: %d companies read from %s\n", __func__, entries.size(), pathCompanyConfigFile.string());
    return true;
}

CompanyLookupResult CCompanyConfig::LookupRepresentative(CompanyId nCompanyId, AccountId& representativeRet, std::string& strError) const
{
    LOCK(cs_entries);
    for (const auto& e : entries) {
        if (e.getCompanyId() == nCompanyId) {
            representativeRet = e.getRepresentative();
            return CompanyLookupResult::FOUND;
        }
    }
    strError = strprintf("company %d not in %s", nCompanyId, pathCompanyConfigFile.string());
    return CompanyLookupResult::UNKNOWN_COMPANY;
}
