#include "test_utils.hpp"
#include <solarb/model/solarb_amm_estimation.hpp>
#include <iostream>
#include <random>

using namespace solarb::model;
using namespace solarb::model::amm;
using namespace solarb::model::test;


// x*y=k with no fee: k never decreases, and never by more than one output unit
static void test_conservation_under_zero_fee()
{
    std::mt19937_64 rng(1);
    std::uniform_int_distribution<amount_t> reserves(1, AMOUNT_MAX);
    for (unsigned i = 0; i < 2000; ++i)
    {
        const amount_t ri = reserves(rng);
        const amount_t ro = reserves(rng);
        const amount_t ai = std::uniform_int_distribution<amount_t>(1, ri)(rng);
        const amount_t ao = amm_output(ri, ro, ai, 0);

        const bignum::uint256_t k = bignum::uint256_t(ri) * ro;
        const bignum::uint256_t after = (bignum::uint256_t(ri) + ai) * (ro - ao);
        const bignum::uint256_t one_less = (bignum::uint256_t(ri) + ai) * (ro - ao - 1);
        check(after >= k, strfmt("k can't decrease (%1%, %2%, %3%)", ri, ro, ai));
        check(one_less < k, strfmt("output rounding within 1 unit (%1%, %2%, %3%)", ri, ro, ai));
    }
}

static void test_monotonicity()
{
    // doubling the input always yields strictly more
    amount_t prev = 0;
    for (amount_t a = 16; a <= 1000000000000ull; a *= 2)
    {
        const auto out = amm_output(1000000000000ull, 1000000000000ull, a, 30);
        check(out > prev, strfmt("output strictly increasing at %1%", a));
        prev = out;
    }

    // unit steps never yield less
    std::mt19937_64 rng(2);
    for (unsigned i = 0; i < 2000; ++i)
    {
        const amount_t ri = std::uniform_int_distribution<amount_t>(1000, 1000000000000000ull)(rng);
        const amount_t ro = std::uniform_int_distribution<amount_t>(1000, 1000000000000000ull)(rng);
        const amount_t a = std::uniform_int_distribution<amount_t>(0, 1000000000000ull)(rng);
        const unsigned fee = std::uniform_int_distribution<unsigned>(0, 10000)(rng);
        check(amm_output(ri, ro, a+1, fee) >= amm_output(ri, ro, a, fee)
              , strfmt("output non decreasing at %1%", a));
    }
}

static void test_fee_monotonicity()
{
    amount_t prev = AMOUNT_MAX;
    for (unsigned fee = 0; fee <= 10000; fee += 25)
    {
        const auto out = amm_output(10000000000000ull, 2000000000000ull, 1000000000ull, fee);
        check(out <= prev, strfmt("output non increasing with fee %1%", fee));
        prev = out;
    }
    check_equal(amm_output(1000, 1000, 100, 10000), amount_t(0), "100% fee swap");
}

static void test_round_trip_is_never_profitable()
{
    std::mt19937_64 rng(3);
    std::uniform_int_distribution<amount_t> reserves(1000, 1000000000000000000ull);
    for (unsigned i = 0; i < 2000; ++i)
    {
        const amount_t ri = reserves(rng);
        const amount_t ro = reserves(rng);
        const amount_t a = std::uniform_int_distribution<amount_t>(1, ri)(rng);
        const unsigned fee = std::uniform_int_distribution<unsigned>(0, 100)(rng);
        const PoolReserves pool(ri, ro, fee);

        const auto there = swap_output(pool, a);
        const auto back = swap_output(pool.reversed(), there);
        check(back <= a, strfmt("A->B->A through the same reserves printed money (%1%)", pool));
    }
}

template<typename F>
static swap_error_e swap_error_kind(F f, const std::string &what)
{
    return expect_exception<swap_error>(f, what).kind;
}

static void test_errors()
{
    check_equal(swap_error_kind([]{ amm_output(0, 1000, 10, 30); }, "zero reserve in")
                , SWAP_INVALID_RESERVES, "zero reserve in kind");
    check_equal(swap_error_kind([]{ amm_output(1000, 0, 10, 30); }, "zero reserve out")
                , SWAP_INVALID_RESERVES, "zero reserve out kind");
    check_equal(swap_error_kind([]{ amm_output(1000, 1000, 10, 10001); }, "fee out of range")
                , SWAP_INVALID_RESERVES, "fee out of range kind");

    // pool checks come first, even for a no-op swap
    expect_exception<swap_error>([]{ amm_output(0, 1000, 0, 30); }, "zero reserve, zero amount");

    check_equal(amm_output(1000, 1000, 0, 30), amount_t(0), "zero amount in");

    // no overflow at the top of the range
    const auto out = amm_output(AMOUNT_MAX, AMOUNT_MAX, AMOUNT_MAX, 0);
    check_equal(out, AMOUNT_MAX / 2, "u64 max reserves and amount");
}

static void test_input_for_exact_output()
{
    std::mt19937_64 rng(4);
    for (unsigned i = 0; i < 2000; ++i)
    {
        const amount_t ri = std::uniform_int_distribution<amount_t>(1000, 1000000000000000ull)(rng);
        const amount_t ro = std::uniform_int_distribution<amount_t>(1000, 1000000000000000ull)(rng);
        const amount_t wanted = std::uniform_int_distribution<amount_t>(1, ro/2)(rng);
        const unsigned fee = std::uniform_int_distribution<unsigned>(0, 100)(rng);

        const auto needed = amm_input_for_exact_output(ri, ro, wanted, fee);
        check(amm_output(ri, ro, needed, fee) >= wanted
              , strfmt("input for %1% out of (%2%, %3%) falls short", wanted, ri, ro));
    }

    check_equal(amm_input_for_exact_output(1000, 1000, 0, 30), amount_t(0), "zero amount out");
    // 1000 * 500 / 500 = 1000, grossed up by 30bps and rounded up
    check_equal(amm_input_for_exact_output(1000, 1000, 500, 30), amount_t(1004), "exact input");

    check_equal(swap_error_kind([]{ amm_input_for_exact_output(1000, 1000, 1000, 30); }, "whole reserve out")
                , SWAP_INSUFFICIENT_LIQUIDITY, "whole reserve out kind");
    check_equal(swap_error_kind([]{ amm_input_for_exact_output(1000, 1000, 2000, 30); }, "more than the reserve out")
                , SWAP_INSUFFICIENT_LIQUIDITY, "more than the reserve out kind");
    check_equal(swap_error_kind([]{ amm_input_for_exact_output(1000, 1000, 10, 10000); }, "100% fee")
                , SWAP_INSUFFICIENT_LIQUIDITY, "100% fee kind");
    check_equal(swap_error_kind([]{ amm_input_for_exact_output(AMOUNT_MAX, 2, 1, 30); }, "input beyond 64 bits")
                , SWAP_INVALID_RESERVES, "input beyond 64 bits kind");
}

static void test_price_impact_and_slippage()
{
    const amount_t ri = 10000000000000ull;
    const amount_t ro = 2000000000000ull;
    check(price_impact(ri, ro, 0, 25) == 0, "no impact without a trade");
    check(slippage(ri, ro, 0, 25) == 0, "no slippage without a trade");

    double prev_impact = 0;
    double prev_slippage = 0;
    for (amount_t a = 1000000000ull; a <= 1000000000000ull; a *= 10)
    {
        const auto impact = price_impact(ri, ro, a, 25);
        const auto slip = slippage(ri, ro, a, 25);
        check(impact > prev_impact, strfmt("impact grows with trade size (%1%)", a));
        check(slip >= prev_slippage, strfmt("slippage grows with trade size (%1%)", a));
        check(slip >= 0, "slippage is never negative");
        prev_impact = impact;
        prev_slippage = slip;
    }
    // impact includes the fee: never below it
    check(price_impact(ri, ro, 1000000ull, 25) >= 0.25 - 1e-6, "impact includes the fee");
    // 10% of the reserve: about 9% slippage on x*y=k
    const auto big = slippage(1000000000000ull, 1000000000000ull, 100000000000ull, 0);
    check(big > 8.5 && big < 9.5, strfmt("slippage of a 10%% reserve trade is %1%", big));
}

static void test_pool_dispatch()
{
    const PoolReserves pool(10000000000000ull, 2000000000000ull, 25);
    check_equal(swap_output(pool, 1000000000ull)
                , amm_output(10000000000000ull, 2000000000000ull, 1000000000ull, 25)
                , "swap_output dispatch");
    check_equal(swap_input_for_output(pool, 1000000ull)
                , amm_input_for_exact_output(10000000000000ull, 2000000000000ull, 1000000ull, 25)
                , "swap_input_for_output dispatch");
}


int main()
{
    test_conservation_under_zero_fee();
    test_monotonicity();
    test_fee_monotonicity();
    test_round_trip_is_never_profitable();
    test_errors();
    test_input_for_exact_output();
    test_price_impact_and_slippage();
    test_pool_dispatch();
    std::cout << "amm math: ok" << std::endl;
    return 0;
}
