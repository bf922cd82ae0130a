// Copyright (c) 2026 The Agora Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php.

#include "test/test_agora.h"

#include "consensus/validation.h"
#include "tender/companyconfig.h"
#include "tender/tenderman.h"
#include "util/system.h"

#include <limits>

#include <boost/test/unit_test.hpp>

static void WriteCompanyConfig(const fs::path& path, const std::string& strContent)
{
    fsbridge::ofstream file(path);
    file << strContent;
}

BOOST_FIXTURE_TEST_SUITE(companyconfig_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(read_entries)
{
    const fs::path path = SetDataDir("companies") / AGORA_COMPANY_CONF_FILENAME;
    WriteCompanyConfig(path, "# Company directory file\n"
                             "1 acme-procurement\n"
                             "\n"
                             "   \n"
                             "  # indented comment\n"
                             "7 bridgeworks # trailing comment\n"
                             "18446744073709551615 last-company\n");

    CCompanyConfig companies(path);
    std::string strErr;
    BOOST_REQUIRE_MESSAGE(companies.read(strErr), strErr);
    BOOST_CHECK_EQUAL(companies.getCount(), 3);
    const std::vector<CCompanyConfig::CCompanyEntry> entries = companies.getEntries();
    BOOST_CHECK_EQUAL(entries[0].getCompanyId(), 1U);
    BOOST_CHECK_EQUAL(entries[0].getRepresentative(), "acme-procurement");
    BOOST_CHECK_EQUAL(entries[1].getCompanyId(), 7U);
    BOOST_CHECK_EQUAL(entries[1].getRepresentative(), "bridgeworks");
    BOOST_CHECK_EQUAL(entries[2].getCompanyId(), std::numeric_limits<CompanyId>::max());

    AccountId representative;
    std::string strError;
    BOOST_CHECK(companies.LookupRepresentative(7, representative, strError) == CompanyLookupResult::FOUND);
    BOOST_CHECK_EQUAL(representative, "bridgeworks");
    BOOST_CHECK(companies.LookupRepresentative(std::numeric_limits<CompanyId>::max(), representative, strError) == CompanyLookupResult::FOUND);
    BOOST_CHECK_EQUAL(representative, "last-company");
    BOOST_CHECK(companies.LookupRepresentative(2, representative, strError) == CompanyLookupResult::UNKNOWN_COMPANY);
    BOOST_CHECK(strError.find("company 2 not in") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(missing_file_created)
{
    const fs::path path = SetDataDir("fresh") / AGORA_COMPANY_CONF_FILENAME;
    BOOST_CHECK(!fs::exists(path));

    CCompanyConfig companies(path);
    std::string strErr;
    BOOST_CHECK(companies.read(strErr));
    BOOST_CHECK_EQUAL(companies.getCount(), 0);
    BOOST_CHECK(fs::exists(path));

    // the generated header reads back as an empty directory
    companies.add(3, "someone");
    BOOST_CHECK(companies.read(strErr));
    BOOST_CHECK_EQUAL(companies.getCount(), 0);
}

BOOST_AUTO_TEST_CASE(malformed_lines)
{
    const fs::path path = SetDataDir("broken") / AGORA_COMPANY_CONF_FILENAME;
    std::string strErr;

    WriteCompanyConfig(path, "1 acme\n2\n");
    CCompanyConfig companies(path);
    companies.add(9, "kept");
    BOOST_CHECK(!companies.read(strErr));
    BOOST_CHECK(strErr.find("Line: 2") != std::string::npos);
    // a failed read keeps the previous entries
    BOOST_CHECK_EQUAL(companies.getCount(), 1);

    WriteCompanyConfig(path, "acme 1\n");
    BOOST_CHECK(!companies.read(strErr));
    BOOST_CHECK(strErr.find("Invalid company id acme") != std::string::npos);

    WriteCompanyConfig(path, "-4 acme\n");
    BOOST_CHECK(!companies.read(strErr));
    BOOST_CHECK(strErr.find("Invalid company id -4") != std::string::npos);

    WriteCompanyConfig(path, "+4 acme\n");
    BOOST_CHECK(!companies.read(strErr));
    BOOST_CHECK(strErr.find("Invalid company id +4") != std::string::npos);

    WriteCompanyConfig(path, "18446744073709551616 acme\n");
    BOOST_CHECK(!companies.read(strErr));
    BOOST_CHECK(strErr.find("Invalid company id 18446744073709551616") != std::string::npos);

    // nothing but a comment may follow the representative
    WriteCompanyConfig(path, "1 acme extra\n");
    BOOST_CHECK(!companies.read(strErr));
    BOOST_CHECK(strErr.find("Could not parse") != std::string::npos);
    BOOST_CHECK(strErr.find("Line: 1") != std::string::npos);
    BOOST_CHECK_EQUAL(companies.getCount(), 1);

    WriteCompanyConfig(path, "1 acme\n# two entries\n1 other\n");
    BOOST_CHECK(!companies.read(strErr));
    BOOST_CHECK(strErr.find("Duplicate company id 1") != std::string::npos);
    BOOST_CHECK(strErr.find("Line: 3") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(config_file_argument)
{
    BOOST_CHECK_EQUAL(GetCompanyConfigFile(gArgs).filename().string(), AGORA_COMPANY_CONF_FILENAME);
    const fs::path path = m_path_root / "other.conf";
    gArgs.ForceSetArg("-companyconf", path.string());
    BOOST_CHECK(GetCompanyConfigFile(gArgs) == path);
}

BOOST_AUTO_TEST_CASE(tender_with_company_config)
{
    const fs::path path = SetDataDir("tender") / AGORA_COMPANY_CONF_FILENAME;
    WriteCompanyConfig(path, "1 acme\n2 bridgeworks\n");
    CCompanyConfig companies(path);
    std::string strErr;
    BOOST_REQUIRE(companies.read(strErr));

    CTestFundingLedger ledger;
    CTestProjectFactory factory;
    CTenderParams params;
    params.admin = TEST_ADMIN;
    CTenderManager tender(params, companies, ledger, factory);

    CValidationState state;
    BOOST_REQUIRE(tender.OverrideAndApprove(TEST_ADMIN, state));
    BOOST_REQUIRE(tender.OpenTenderForProposals(TEST_ADMIN, state));
    BOOST_CHECK(tender.SubmitProposal(2, "ipfs://bridge", "bridgeworks", state));
    BOOST_CHECK(!tender.SubmitProposal(1, "ipfs://acme", "bridgeworks", state));
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "tender-not-representative");
    CValidationState stateUnknown;
    BOOST_CHECK(!tender.SubmitProposal(3, "ipfs://nobody", "nobody", stateUnknown));
    BOOST_CHECK_EQUAL(stateUnknown.GetRejectReason(), "tender-unknown-company");
    BOOST_CHECK_EQUAL(tender.GetProposalCount(), 1U);
}

BOOST_AUTO_TEST_SUITE_END()
