// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for deposit stem selection: newest first ordering, stem
// bounds, germination, the low-stalk band and prior claims.
//

#include "test/test_pinto.h"

#include "consensus/validation.h"
#include "silo/silo_filter.h"
#include "silo/silo_plan.h"
#include "silo/silo_selector.h"

#include <boost/test/unit_test.hpp>

struct SelectorTestingSetup : public SiloTestingSetup {
    CStemSelection selection;
    CValidationState state;

    SelectorTestingSetup()
    {
        // 10,000 beans at stems 0 and 5
        ledger.AddDeposit(ALICE, BEAN_TOKEN, 0, 10000);
        ledger.AddDeposit(ALICE, BEAN_TOKEN, 5, 10000);
    }

    bool Select(CAmount nTarget, const FilterParams& filter, const CWithdrawalPlan* pExcludingPlan = nullptr)
    {
        return SelectDepositStems(ledger, ALICE, BEAN_TOKEN, nTarget, filter, pExcludingPlan, selection, state);
    }
};

BOOST_FIXTURE_TEST_SUITE(silo_selector_tests, SelectorTestingSetup)

BOOST_AUTO_TEST_CASE(newest_deposit_first)
{
    BOOST_CHECK(Select(15000, GetDefaultFilterParams()));
    BOOST_CHECK_EQUAL(selection.stems.size(), 2U);
    BOOST_CHECK_EQUAL(selection.stems[0], 5);
    BOOST_CHECK_EQUAL(selection.amounts[0], 10000);
    BOOST_CHECK_EQUAL(selection.stems[1], 0);
    BOOST_CHECK_EQUAL(selection.amounts[1], 5000);
    BOOST_CHECK_EQUAL(selection.totalSelected, 15000);
}

BOOST_AUTO_TEST_CASE(low_stalk_omitted)
{
    FilterParams filter = GetDefaultFilterParams();
    filter.maxStem = 3;
    filter.lowStalkDeposits = LowStalkDeposits::OMIT;

    BOOST_CHECK(Select(15000, filter));
    BOOST_CHECK_EQUAL(selection.stems.size(), 1U);
    BOOST_CHECK_EQUAL(selection.stems[0], 0);
    BOOST_CHECK_EQUAL(selection.amounts[0], 10000);
    // Under-filled, not an error
    BOOST_CHECK_EQUAL(selection.totalSelected, 10000);
    BOOST_CHECK(state.IsValid());
}

BOOST_AUTO_TEST_CASE(low_stalk_used_last)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 2, 1000);
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 7, 1000);

    FilterParams filter = GetDefaultFilterParams();
    filter.maxStem = 3;
    filter.lowStalkDeposits = LowStalkDeposits::USE_LAST;

    // Primary pass takes stems 2 and 0 in full, then the band is replayed from its highest stem
    BOOST_CHECK(Select(12500, filter));
    const std::vector<int64_t> expectedStems = {2, 0, 7, 5};
    const std::vector<CAmount> expectedAmounts = {1000, 10000, 1000, 500};
    BOOST_CHECK_EQUAL_COLLECTIONS(selection.stems.begin(), selection.stems.end(),
                                  expectedStems.begin(), expectedStems.end());
    BOOST_CHECK_EQUAL_COLLECTIONS(selection.amounts.begin(), selection.amounts.end(),
                                  expectedAmounts.begin(), expectedAmounts.end());
    BOOST_CHECK_EQUAL(selection.totalSelected, 12500);

    // Covered before the band is reached
    BOOST_CHECK(Select(3000, filter));
    BOOST_CHECK_EQUAL(selection.stems.size(), 2U);
    BOOST_CHECK_EQUAL(selection.stems[1], 0);

    // USE treats the band like any other deposit
    filter.lowStalkDeposits = LowStalkDeposits::USE;
    BOOST_CHECK(Select(12500, filter));
    const std::vector<int64_t> descending = {7, 5, 2, 0};
    BOOST_CHECK_EQUAL_COLLECTIONS(selection.stems.begin(), selection.stems.end(),
                                  descending.begin(), descending.end());
}

BOOST_AUTO_TEST_CASE(low_stalk_band_from_threshold)
{
    // tip 10, lowGrownStalkPerBdv 6 -> band above stem 4
    FilterParams filter = GetDefaultFilterParams();
    filter.lowGrownStalkPerBdv = 6;
    filter.lowStalkDeposits = LowStalkDeposits::OMIT;

    BOOST_CHECK(Select(15000, filter));
    BOOST_CHECK_EQUAL(selection.stems.size(), 1U);
    BOOST_CHECK_EQUAL(selection.stems[0], 0);
}

BOOST_AUTO_TEST_CASE(too_much_grown_stalk_skipped)
{
    // tip 10, at most 8 grown stalk -> stem 0 is too old
    BOOST_CHECK(Select(15000, GetDefaultFilterParams(8)));
    BOOST_CHECK_EQUAL(selection.stems.size(), 1U);
    BOOST_CHECK_EQUAL(selection.stems[0], 5);
    BOOST_CHECK_EQUAL(selection.totalSelected, 10000);

    FilterParams filter = GetDefaultFilterParams();
    filter.minStem = 6;
    BOOST_CHECK(Select(15000, filter));
    BOOST_CHECK(selection.IsNull());
    BOOST_CHECK_EQUAL(selection.totalSelected, 0);
}

BOOST_AUTO_TEST_CASE(germinating_deposits)
{
    ledger.SetGerminatingStem(BEAN_TOKEN, 5);

    FilterParams filter = GetDefaultFilterParams();
    BOOST_CHECK(Select(15000, filter));
    BOOST_CHECK_EQUAL(selection.totalSelected, 15000);

    filter.excludeGerminatingDeposits = true;
    BOOST_CHECK(Select(15000, filter));
    BOOST_CHECK_EQUAL(selection.stems.size(), 1U);
    BOOST_CHECK_EQUAL(selection.stems[0], 0);
    BOOST_CHECK_EQUAL(selection.totalSelected, 10000);
}

BOOST_AUTO_TEST_CASE(prior_claims_respected)
{
    CWithdrawalPlan prior;
    prior.AddSource(BEAN_TOKEN, {5}, {4000}, 4000);

    BOOST_CHECK(Select(15000, GetDefaultFilterParams(), &prior));
    BOOST_CHECK_EQUAL(selection.stems[0], 5);
    BOOST_CHECK_EQUAL(selection.amounts[0], 6000);
    BOOST_CHECK_EQUAL(selection.stems[1], 0);
    BOOST_CHECK_EQUAL(selection.amounts[1], 9000);

    // A fully claimed deposit is skipped
    prior.SetNull();
    prior.AddSource(BEAN_TOKEN, {5}, {10000}, 10000);
    BOOST_CHECK(Select(15000, GetDefaultFilterParams(), &prior));
    BOOST_CHECK_EQUAL(selection.stems.size(), 1U);
    BOOST_CHECK_EQUAL(selection.stems[0], 0);
    BOOST_CHECK_EQUAL(selection.totalSelected, 10000);

    // Claims on another token do not matter
    prior.SetNull();
    prior.AddSource(PINTO_WETH_WELL, {5}, {10000}, 10000);
    BOOST_CHECK(Select(15000, GetDefaultFilterParams(), &prior));
    BOOST_CHECK_EQUAL(selection.totalSelected, 15000);
}

BOOST_AUTO_TEST_CASE(no_deposits_and_bad_target)
{
    BOOST_CHECK(SelectDepositStems(ledger, BOB, BEAN_TOKEN, 100, GetDefaultFilterParams(), nullptr, selection, state));
    BOOST_CHECK(selection.IsNull());
    BOOST_CHECK_EQUAL(selection.totalSelected, 0);

    BOOST_CHECK(!Select(0, GetDefaultFilterParams()));
    BOOST_CHECK(state.GetError() == SiloError::INVALID_ARGUMENT);

    state = CValidationState();
    FilterParams filter = GetDefaultFilterParams();
    filter.minStem = 3;
    filter.maxStem = 2;
    BOOST_CHECK(!Select(100, filter));
    BOOST_CHECK(state.GetError() == SiloError::INVALID_ARGUMENT);
}

BOOST_AUTO_TEST_CASE(ordering_and_conservation)
{
    const int64_t stems[] = {-40, 3, 9, 1, 22, 17, 8};
    CAmount nDeposited = 20000;
    for (const int64_t nStem : stems) {
        ledger.AddDeposit(ALICE, BEAN_TOKEN, nStem, 700 + nStem * 10);
        nDeposited += 700 + nStem * 10;
    }

    FilterParams filter = GetDefaultFilterParams();
    filter.maxStem = 8;
    filter.lowStalkDeposits = LowStalkDeposits::USE_LAST;

    for (CAmount nTarget = 1; nTarget < nDeposited + 5000; nTarget += 1777) {
        BOOST_CHECK(Select(nTarget, filter));
        BOOST_CHECK(selection.totalSelected <= nTarget);
        BOOST_CHECK(selection.totalSelected <= nDeposited);

        CAmount nSum = 0;
        bool fInBand = false;
        for (size_t i = 0; i < selection.stems.size(); ++i) {
            nSum += selection.amounts[i];
            BOOST_CHECK(selection.amounts[i] > 0);
            const bool fLowStalk = selection.stems[i] > 8;
            // Band entries only after every primary entry
            if (fInBand) BOOST_CHECK(fLowStalk);
            fInBand = fInBand || fLowStalk;
            if (i > 0 && fLowStalk == (selection.stems[i - 1] > 8)) {
                BOOST_CHECK(selection.stems[i] < selection.stems[i - 1]);
            }
        }
        BOOST_CHECK_EQUAL(nSum, selection.totalSelected);
        if (nTarget <= nDeposited) {
            BOOST_CHECK_EQUAL(selection.totalSelected, nTarget);
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()
