// Copyright (c) 2025 The Pinto Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

//
// Unit tests for plan execution: delivery, all-or-nothing failure,
// price manipulation, removal slippage and sequential calls.
//

#include "test/test_pinto.h"

#include "consensus/validation.h"
#include "silo/silo_filter.h"
#include "silo/silo_plan.h"
#include "silo/silo_sources.h"
#include "silo/silo_withdraw.h"
#include "util/strprintf.h"

#include <boost/test/unit_test.hpp>

struct WithdrawTestingSetup : public SiloTestingSetup {
    CWithdrawalPlan plan;
    CValidationState state;
    CAmount nWithdrawn;
    int64_t nSlippageRatio;

    WithdrawTestingSetup() : nWithdrawn(0), nSlippageRatio(SLIPPAGE_PRECISION / 100) {}

    bool Build(const std::vector<uint8_t>& vIndices, CAmount nTarget)
    {
        return BuildWithdrawalPlan(ledger, ALICE, CSourceSelection::Explicit(vIndices), nTarget,
                                   GetDefaultFilterParams(), nullptr, plan, state);
    }

    bool Execute(TransferMode mode = TransferMode::EXTERNAL)
    {
        return ExecuteWithdrawalPlan(ledger, ALICE, plan, nSlippageRatio, BOB, mode, nWithdrawn, state);
    }

    CAmount BobBeans(TransferMode mode = TransferMode::EXTERNAL) const
    {
        return ledger.GetBalance(BOB, BEAN_TOKEN, mode);
    }
};

BOOST_FIXTURE_TEST_SUITE(silo_withdraw_tests, WithdrawTestingSetup)

BOOST_AUTO_TEST_CASE(execute_bean_plan)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 0, 10000);
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 5, 10000);

    BOOST_CHECK(Build({BEAN_INDEX}, 15000));
    BOOST_CHECK(Execute());
    BOOST_CHECK(state.IsValid());
    BOOST_CHECK_EQUAL(nWithdrawn, 15000);
    BOOST_CHECK_EQUAL(BobBeans(), 15000);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 5), 0);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 0), 5000);
    BOOST_CHECK_EQUAL(ledger.GetDeposits(ALICE, BEAN_TOKEN).size(), 1U);
}

BOOST_AUTO_TEST_CASE(execute_well_plan)
{
    ledger.AddDeposit(ALICE, PINTO_WETH_WELL, 3, 600);

    BOOST_CHECK(Build({WETH_WELL_INDEX}, 1000));
    BOOST_CHECK_EQUAL(plan.availableBeans[0], 1000);

    BOOST_CHECK(Execute(TransferMode::INTERNAL));
    // Never below the planned value
    BOOST_CHECK_EQUAL(nWithdrawn, 1001);
    BOOST_CHECK_EQUAL(BobBeans(TransferMode::INTERNAL), 1001);
    BOOST_CHECK_EQUAL(BobBeans(TransferMode::EXTERNAL), 0);

    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, PINTO_WETH_WELL, 3), 99);
    BOOST_CHECK_EQUAL(ledger.GetBalance(ALICE, PINTO_WETH_WELL, TransferMode::INTERNAL), 0);
    BOOST_CHECK_EQUAL(ledger.GetBalance(ALICE, BEAN_TOKEN, TransferMode::INTERNAL), 0);

    const CWellState well = GetWell(PINTO_WETH_WELL);
    BOOST_CHECK_EQUAL(well.reserves[0], 998999);
    BOOST_CHECK_EQUAL(well.nTotalSupply, 999499);
}

BOOST_AUTO_TEST_CASE(execute_mixed_plan)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 2, 600);
    ledger.AddDeposit(ALICE, PINTO_WETH_WELL, 3, 600);

    BOOST_CHECK(Build({BEAN_INDEX, WETH_WELL_INDEX}, 1000));
    BOOST_CHECK(Execute());
    BOOST_CHECK_EQUAL(nWithdrawn, 600 + 401);
    BOOST_CHECK_EQUAL(BobBeans(), 1001);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 2), 0);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, PINTO_WETH_WELL, 3), 399);
}

BOOST_AUTO_TEST_CASE(price_manipulation_aborts_everything)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 2, 600);
    ledger.AddDeposit(ALICE, PINTO_WETH_WELL, 3, 600);

    BOOST_CHECK(Build({BEAN_INDEX, WETH_WELL_INDEX}, 1000));

    // Someone dumps WETH into the well; the time-weighted reserves do not follow
    SetWellReserves(PINTO_WETH_WELL, 900000, 1111111, false);

    BOOST_CHECK(!Execute());
    BOOST_CHECK(state.GetError() == SiloError::PRICE_MANIPULATION);
    BOOST_CHECK_EQUAL(nWithdrawn, 0);

    // The bean source ran first but nothing is visible
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 2), 600);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, PINTO_WETH_WELL, 3), 600);
    BOOST_CHECK_EQUAL(BobBeans(), 0);
    BOOST_CHECK_EQUAL(GetWell(PINTO_WETH_WELL).reserves[0], 900000);

    // A wide enough tolerance lets it through
    state = CValidationState();
    nSlippageRatio = SLIPPAGE_PRECISION / 2;
    SetWellReserves(PINTO_WETH_WELL, 1111111, 1000000, false);
    BOOST_CHECK(Execute());
    BOOST_CHECK_EQUAL(nWithdrawn, 600 + 424);
}

BOOST_AUTO_TEST_CASE(removal_below_plan_aborts)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 2, 600);
    ledger.AddDeposit(ALICE, PINTO_WETH_WELL, 3, 600);

    BOOST_CHECK(Build({BEAN_INDEX, WETH_WELL_INDEX}, 1000));
    BOOST_CHECK_EQUAL(plan.availableBeans[1], 400);

    // Reserves move for real: the guard passes but 201 LP now redeem 381 beans
    SetWellReserves(PINTO_WETH_WELL, 900000, 1000000, true);

    BOOST_CHECK(!Execute());
    BOOST_CHECK(state.GetError() == SiloError::SLIPPAGE);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 2), 600);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, PINTO_WETH_WELL, 3), 600);
    BOOST_CHECK_EQUAL(ledger.GetBalance(ALICE, PINTO_WETH_WELL, TransferMode::INTERNAL), 0);
    BOOST_CHECK_EQUAL(BobBeans(), 0);

    // Replanning against the new state succeeds
    state = CValidationState();
    BOOST_CHECK(Build({BEAN_INDEX, WETH_WELL_INDEX}, 1000));
    BOOST_CHECK(Execute());
    BOOST_CHECK(nWithdrawn >= 1000);
}

BOOST_AUTO_TEST_CASE(stale_plan_fails_cleanly)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 0, 10000);

    // Two callers plan against the same snapshot
    BOOST_CHECK(Build({BEAN_INDEX}, 8000));
    const CWithdrawalPlan first = plan;
    BOOST_CHECK(Build({BEAN_INDEX}, 8000));
    const CWithdrawalPlan second = plan;

    plan = first;
    BOOST_CHECK(Execute());
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 0), 2000);

    plan = second;
    BOOST_CHECK(!Execute());
    BOOST_CHECK(state.GetError() == SiloError::LEDGER_INCONSISTENCY);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 0), 2000);
    BOOST_CHECK_EQUAL(BobBeans(), 8000);
}

BOOST_AUTO_TEST_CASE(sequential_calls_shrink_state)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 0, 6000);
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 4, 4000);

    const CSourceSelection sources = CSourceSelection::Explicit({BEAN_INDEX});
    for (int i = 0; i < 2; ++i) {
        BOOST_CHECK(WithdrawBeansFromSources(ledger, ALICE, sources, 5000, GetDefaultFilterParams(), nSlippageRatio,
                                             BOB, TransferMode::EXTERNAL, nullptr, plan, nWithdrawn, state));
        BOOST_CHECK_EQUAL(nWithdrawn, 5000);
    }
    BOOST_CHECK_EQUAL(BobBeans(), 10000);
    BOOST_CHECK(ledger.GetDeposits(ALICE, BEAN_TOKEN).empty());

    BOOST_CHECK(!WithdrawBeansFromSources(ledger, ALICE, sources, 5000, GetDefaultFilterParams(), nSlippageRatio,
                                          BOB, TransferMode::EXTERNAL, nullptr, plan, nWithdrawn, state));
    BOOST_CHECK(state.GetError() == SiloError::NO_LIQUIDITY);
}

BOOST_AUTO_TEST_CASE(withdraw_requires_full_coverage)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 0, 600);
    ledger.AddDeposit(ALICE, PINTO_WETH_WELL, 3, 200);

    BOOST_CHECK(!WithdrawBeansFromSources(ledger, ALICE, CSourceSelection::AscendingSeeds(), 1000,
                                          GetDefaultFilterParams(), nSlippageRatio, BOB, TransferMode::EXTERNAL,
                                          nullptr, plan, nWithdrawn, state));
    BOOST_CHECK(state.GetError() == SiloError::INSUFFICIENT_FUNDS);
    BOOST_CHECK_EQUAL(plan.totalAvailableBeans, 999);
    BOOST_CHECK_EQUAL(nWithdrawn, 0);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 0), 600);

    state = CValidationState();
    BOOST_CHECK(WithdrawBeansFromSources(ledger, ALICE, CSourceSelection::AscendingSeeds(), 999,
                                         GetDefaultFilterParams(), nSlippageRatio, BOB, TransferMode::EXTERNAL,
                                         nullptr, plan, nWithdrawn, state));
    BOOST_CHECK(nWithdrawn >= 999);
    BOOST_CHECK_EQUAL(BobBeans(), nWithdrawn);
}

BOOST_AUTO_TEST_CASE(withdraw_after_tip_plan)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 0, 1000);

    // An operator tip is planned first and must not be spent twice
    BOOST_CHECK(Build({BEAN_INDEX}, 300));
    const CWithdrawalPlan tip = plan;

    BOOST_CHECK(!WithdrawBeansFromSources(ledger, ALICE, CSourceSelection::Explicit({BEAN_INDEX}), 800,
                                          GetDefaultFilterParams(), nSlippageRatio, BOB, TransferMode::EXTERNAL,
                                          &tip, plan, nWithdrawn, state));
    BOOST_CHECK(state.GetError() == SiloError::INSUFFICIENT_FUNDS);

    state = CValidationState();
    BOOST_CHECK(WithdrawBeansFromSources(ledger, ALICE, CSourceSelection::Explicit({BEAN_INDEX}), 700,
                                         GetDefaultFilterParams(), nSlippageRatio, BOB, TransferMode::EXTERNAL,
                                         &tip, plan, nWithdrawn, state));
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 0), 300);

    plan = tip;
    BOOST_CHECK(Execute());
    BOOST_CHECK(ledger.GetDeposits(ALICE, BEAN_TOKEN).empty());
    BOOST_CHECK_EQUAL(BobBeans(), 1000);
}

BOOST_AUTO_TEST_CASE(tip_and_order_over_well_combined)
{
    ledger.AddDeposit(ALICE, PINTO_WETH_WELL, 3, 600000);

    BOOST_CHECK(Build({WETH_WELL_INDEX}, 300000));
    const CWithdrawalPlan tip = plan;
    BOOST_CHECK_EQUAL(tip.amounts[0][0], 163340);

    BOOST_CHECK(BuildWithdrawalPlan(ledger, ALICE, CSourceSelection::Explicit({WETH_WELL_INDEX}), 400000,
                                    GetDefaultFilterParams(), &tip, plan, state));
    BOOST_CHECK_EQUAL(plan.amounts[0][0], 288938);
    BOOST_CHECK_EQUAL(plan.availableBeans[0], 400000);
    const CWithdrawalPlan order = plan;

    BOOST_CHECK(CombineWithdrawalPlans(ledger, ALICE, {tip, order}, plan, state));
    BOOST_CHECK_EQUAL(plan.totalAvailableBeans, 700000);

    BOOST_CHECK(Execute());
    BOOST_CHECK(state.IsValid());
    BOOST_CHECK_EQUAL(nWithdrawn, 700000);
    BOOST_CHECK_EQUAL(BobBeans(), 700000);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, PINTO_WETH_WELL, 3), 600000 - 452278);

    const CWellState well = GetWell(PINTO_WETH_WELL);
    BOOST_CHECK_EQUAL(well.reserves[0], 300000);
    BOOST_CHECK_EQUAL(well.nTotalSupply, 1000000 - 452278);
}

BOOST_AUTO_TEST_CASE(tip_then_order_over_well)
{
    ledger.AddDeposit(ALICE, PINTO_WETH_WELL, 3, 600000);

    BOOST_CHECK(Build({WETH_WELL_INDEX}, 300000));
    const CWithdrawalPlan tip = plan;
    BOOST_CHECK(BuildWithdrawalPlan(ledger, ALICE, CSourceSelection::Explicit({WETH_WELL_INDEX}), 400000,
                                    GetDefaultFilterParams(), &tip, plan, state));
    const CWithdrawalPlan order = plan;

    plan = tip;
    BOOST_CHECK(Execute());
    BOOST_CHECK_EQUAL(nWithdrawn, 300000);
    BOOST_CHECK_EQUAL(GetWell(PINTO_WETH_WELL).reserves[0], 700000);

    // The tip moved the price a long way from the time-weighted one
    nSlippageRatio = SLIPPAGE_PRECISION;
    plan = order;
    BOOST_CHECK(Execute());
    BOOST_CHECK_EQUAL(nWithdrawn, 400000);
    BOOST_CHECK_EQUAL(BobBeans(), 700000);
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, PINTO_WETH_WELL, 3), 600000 - 163340 - 288938);
    BOOST_CHECK_EQUAL(GetWell(PINTO_WETH_WELL).reserves[0], 300000);
}

BOOST_AUTO_TEST_CASE(default_slippage_ratio)
{
    ledger.AddDeposit(ALICE, PINTO_WETH_WELL, 3, 600);

    // About 3% off the time-weighted price
    SetWellReserves(PINTO_WETH_WELL, 970000, 1000000, false);
    BOOST_CHECK(Build({WETH_WELL_INDEX}, 1000));

    BOOST_CHECK(!Execute());
    BOOST_CHECK(state.GetError() == SiloError::PRICE_MANIPULATION);

    // Regtest tolerates 5% by default
    state = CValidationState();
    nSlippageRatio = -1;
    BOOST_CHECK(Execute());
    BOOST_CHECK(nWithdrawn >= 1000);
    BOOST_CHECK_EQUAL(BobBeans(), nWithdrawn);
}

BOOST_AUTO_TEST_CASE(malformed_plan_not_executed)
{
    ledger.AddDeposit(ALICE, BEAN_TOKEN, 0, 1000);

    plan.AddSource(BEAN_TOKEN, {0}, {500}, 600);
    BOOST_CHECK(!Execute());
    BOOST_CHECK(state.GetError() == SiloError::INVALID_ARGUMENT);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "plan-bean-mismatch");

    plan.SetNull();
    plan.AddSource(BEAN_TOKEN, {0, 1}, {500}, 500);
    state = CValidationState();
    BOOST_CHECK(!Execute());
    BOOST_CHECK(state.GetError() == SiloError::INVALID_ARGUMENT);

    // Values summing past int64
    plan.SetNull();
    for (int i = 0; i < 10; ++i) {
        plan.sourceTokens.push_back(strprintf("T%d", i));
        plan.stems.push_back({0});
        plan.amounts.push_back({MAX_MONEY});
        plan.availableBeans.push_back(MAX_MONEY);
    }
    state = CValidationState();
    BOOST_CHECK(!Execute());
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "plan-bad-total");
    BOOST_CHECK_EQUAL(ledger.GetDepositAmount(ALICE, BEAN_TOKEN, 0), 1000);
    BOOST_CHECK_EQUAL(BobBeans(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
