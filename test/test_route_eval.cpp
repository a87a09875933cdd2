#include "test_utils.hpp"
#include <solarb/model/solarb_amm_estimation.hpp>
#include <solarb/pathfinder/routes.hpp>
#include <iostream>

using namespace solarb::model;
using namespace solarb::pathfinder;
using namespace solarb::model::test;


static Route sol_usdc_round_trip()
{
    Route r;
    r.emplace_back(make_hop("SOL", "USDC", 10000000000000ull, 2000000000000ull, 25, "pool1", "raydium"));
    r.emplace_back(make_hop("USDC", "SOL", 1600000000000ull, 8000000000000ull, 30, "pool2", "orca"));
    return r;
}


static void test_chaining()
{
    const auto r = sol_usdc_round_trip();
    const auto res = evaluate_route(r, 1000000000ull);
    check(!res.failed, "evaluation succeeds");
    check_equal(res.amount_in, amount_t(1000000000ull), "amount in");
    check_equal(res.per_hop_outputs.size(), std::size_t(2), "one output per hop");
    check_equal(res.per_hop_outputs[0], amount_t(199480101ull), "hop 0 output");
    check_equal(res.per_hop_outputs[1], amount_t(994284709ull), "hop 1 output");
    check_equal(res.final_amount_out, res.per_hop_outputs.back(), "final is last hop output");
    check_equal(res.amount_before_hop(0), amount_t(1000000000ull), "input of hop 0");
    check_equal(res.amount_before_hop(1), res.per_hop_outputs[0], "input of hop 1");

    // each hop is exactly the amm formula on the previous output
    const auto direct = amm::amm_output(1600000000000ull, 8000000000000ull
                                        , amm::amm_output(10000000000000ull, 2000000000000ull, 1000000000ull, 25)
                                        , 30);
    check_equal(res.final_amount_out, direct, "same as chained amm_output");
    check(res.yield_ratio() < 1.0, "losing round trip");
}

static void test_zero_amount()
{
    const auto res = evaluate_route(sol_usdc_round_trip(), 0);
    check(!res.failed, "zero amount is not an error");
    check_equal(res.final_amount_out, amount_t(0), "nothing in, nothing out");
    check_equal(res.yield_ratio(), 0.0, "no yield on zero amount");
}

static void test_failure()
{
    Route r = sol_usdc_round_trip();
    r[1].pool.reserve_in = 0;
    auto res = evaluate_route(r, 1000000000ull);
    check(res.failed, "zero reserve fails");
    check_equal(res.error, EVAL_INVALID_RESERVES, "zero reserve error");
    check_equal(res.failed_hop, 1u, "failed at hop 1");
    check_equal(res.per_hop_outputs.size(), std::size_t(1), "outputs up to the failed hop");
    check_equal(res.final_amount_out, amount_t(0), "no output on failure");
    check(!res.error_message.empty(), "error message");
    check_equal(res.yield_ratio(), 0.0, "no yield on failure");

    // a nearly empty pool pays out nothing, which is not a failure
    r = sol_usdc_round_trip();
    r[1].pool.reserve_out = 1;
    res = evaluate_route(r, 1000000000ull);
    check(!res.failed, "nearly empty pool does not fail");
    check_equal(res.final_amount_out, amount_t(0), "nearly empty pool pays nothing");

    r = sol_usdc_round_trip();
    r[0].pool.fee_bps = 10001;
    res = evaluate_route(r, 1000000000ull);
    check(res.failed, "fee out of range fails");
    check_equal(res.error, EVAL_INVALID_RESERVES, "fee out of range error");
    check_equal(res.failed_hop, 0u, "failed at hop 0");
    check(res.per_hop_outputs.empty(), "no output before hop 0");
}

static void test_stress()
{
    const auto r = sol_usdc_round_trip();
    const auto res = evaluate_route(r, 1000000000ull);
    check_equal(hop_reserves_stress(r, res, 0), 1e9 / 1e13, "hop 0 stress");
    check_equal(hop_reserves_stress(r, res, 1), 199480101.0 / 1.6e12, "hop 1 stress");
    check_equal(max_reserves_stress(r, res), 199480101.0 / 1.6e12, "max stress");

    // hops after a failure are not accounted
    Route f = r;
    f[1].pool.reserve_in = 0;
    const auto failed = evaluate_route(f, 1000000000ull);
    check_equal(max_reserves_stress(f, failed), 1e9 / 1e13, "stress up to the failed hop");
}

static void test_infos()
{
    const auto res = evaluate_route(sol_usdc_round_trip(), 1000000000ull);
    check(res.infos().find("1000000000 -> 199480101 -> 994284709") == 0, "result description");
    check(strfmt("%1%", sol_usdc_round_trip()) == "2-hop route SOL-USDC-SOL", "route description");
}


int main()
{
    test_chaining();
    test_zero_amount();
    test_failure();
    test_stress();
    test_infos();
    std::cout << "route evaluation: ok" << std::endl;
    return 0;
}
