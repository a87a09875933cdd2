#include "test_utils.hpp"
#include <solarb/commons/solarb_log.hpp>
#include <solarb/scanner/opportunity_scanner.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

using namespace solarb::model;
using namespace solarb::model::test;
using namespace solarb::pathfinder;
using namespace solarb::scanner;

constexpr amount_t ONE_SOL = 1000000000ull;


/**
 * SOL trades at 200 USDC on raydium, at 180 USDC on orca
 */
static std::unique_ptr<PoolSnapshot> make_price_gap()
{
    auto snapshot = std::make_unique<PoolSnapshot>();
    snapshot->add_pool("poolA", "SOL", "USDC", 10000000000000ull, 2000000000000ull, 25, "raydium");
    snapshot->add_pool("poolB", "USDC", "SOL", 1800000000000ull, 10000000000000ull, 30, "orca");
    return snapshot;
}

static ScanContext sol_context(const PoolSnapshot *snapshot)
{
    ScanContext ctx;
    ctx.snapshot = snapshot;
    ctx.constraints.start_tokens = {"SOL"};
    ctx.constraints.trade_amounts["SOL"] = ONE_SOL;
    return ctx;
}

static bool has_diagnostic(const ScanReport &report, const std::string &what)
{
    return std::any_of(report.diagnostics.begin(), report.diagnostics.end(), [&](const std::string &d) {
        return d.find(what) != std::string::npos;
    });
}


static void test_direct_arbitrage()
{
    auto snapshot = make_price_gap();
    const auto report = scan_opportunities(sol_context(snapshot.get()));

    check(!report.config_error, "scan runs");
    check_equal(report.candidates, std::size_t(2), "both directions");
    check_equal(report.evaluated, std::size_t(2), "both evaluated");
    check_equal(report.unprofitable, std::size_t(1), "one direction loses");
    check_equal(report.opportunities.size(), std::size_t(1), "one opportunity");

    const auto &o = report.opportunities.front();
    check_equal(o.route.print_addr(), std::string("\"poolA\", \"poolB\""), "buy on A, sell on B");
    check_equal(o.route_id, o.route.id(), "route id");
    check_equal(o.start_token(), std::string("SOL"), "start token");
    check_equal(o.buy_dex, std::string("raydium"), "buy dex");
    check_equal(o.sell_dex, std::string("orca"), "sell dex");
    check_equal(o.amount_in, ONE_SOL, "amount in");
    check_equal(o.per_hop_outputs.size(), std::size_t(2), "hop outputs");
    check_equal(o.per_hop_outputs[0], amount_t(199480101ull), "USDC bought");
    check_equal(o.gross_amount_out, amount_t(1104776044ull), "SOL back");
    check_equal(o.gross_profit, amount_t(104776044ull), "gross profit");
    check_equal(o.total_cost.total_cost, amount_t(7797000ull), "costs");
    check_equal(o.net_profit, amount_t(96979044ull), "net profit");
    check_equal(o.net_profit_bps, amount_t(969), "net profit bps");
    check(o.profitable, "profitable");
    check_equal(o.verdict, profit::VERDICT_PROFITABLE, "verdict");
    check_equal(o.buy_price, 199480101.0 / 1e9, "buy price");
    check_equal(o.sell_price, 199480101.0 / 1104776044.0, "sell price");
    check(o.confidence_score > 0.99 && o.confidence_score < 1.0, "confidence of a small trade");
    check(o.timestamp.time_since_epoch().count() > 0, "timestamped");
    check(o.describe().find("buy on raydium") != std::string::npos, "description");
}

static void test_ranking_and_limits()
{
    auto snapshot = make_price_gap();
    ScanContext ctx;
    ctx.snapshot = snapshot.get();
    ctx.constraints.default_trade_amount = ONE_SOL;

    // SOL via raydium then orca: 969bps. USDC via orca then raydium: 959bps
    auto report = scan_opportunities(ctx);
    check_equal(report.candidates, std::size_t(4), "two directions per start token");
    check_equal(report.opportunities.size(), std::size_t(2), "one opportunity per start token");
    check_equal(report.opportunities[0].start_token(), std::string("SOL"), "best first");
    check_equal(report.opportunities[0].net_profit_bps, amount_t(969), "best bps");
    check_equal(report.opportunities[1].start_token(), std::string("USDC"), "second best");
    check_equal(report.opportunities[1].net_profit_bps, amount_t(959), "second best bps");

    ctx.constraints.match_limit = 1;
    report = scan_opportunities(ctx);
    check_equal(report.opportunities.size(), std::size_t(1), "match limit");
    check_equal(report.opportunities[0].start_token(), std::string("SOL"), "match limit keeps the best");

    ctx.constraints.match_limit = 0;
    ctx.constraints.limit = 1;
    report = scan_opportunities(ctx);
    check_equal(report.candidates, std::size_t(1), "loop limit");

    ctx.constraints.limit = 0;
    ctx.constraints.min_profit_bps = 965;
    report = scan_opportunities(ctx);
    check_equal(report.opportunities.size(), std::size_t(1), "threshold between the two");
    check_equal(report.unprofitable, std::size_t(3), "below threshold counted as unprofitable");
}

static void test_rank_ties()
{
    OpportunityList list(3);
    list[0].net_profit_bps = 10; list[0].net_profit = 100; list[0].route_id = 3;
    list[1].net_profit_bps = 10; list[1].net_profit = 200; list[1].route_id = 2;
    list[2].net_profit_bps = 10; list[2].net_profit = 100; list[2].route_id = 1;
    rank_opportunities(list);
    check_equal(list[0].route_id, std::size_t(2), "higher net profit first");
    check_equal(list[1].route_id, std::size_t(1), "then lower route id");
    check_equal(list[2].route_id, std::size_t(3), "last");
}

static void test_parallel_scan()
{
    auto snapshot = make_random_snapshot(12, 40, 1234);
    ScanContext ctx;
    ctx.snapshot = snapshot.get();
    ctx.constraints.default_trade_amount = ONE_SOL;
    ctx.constraints.min_profit_bps = 0;

    const auto sequential = scan_opportunities(ctx);
    ctx.constraints.threads = 4;
    const auto parallel = scan_opportunities(ctx);

    check(sequential.candidates > 0, "random snapshot has routes");
    check_equal(parallel.candidates, sequential.candidates, "same candidates");
    check_equal(parallel.evaluated, sequential.evaluated, "same evaluations");
    check_equal(parallel.rejected_by_guard, sequential.rejected_by_guard, "same guard rejections");
    check_equal(parallel.failed_evaluation, sequential.failed_evaluation, "same failures");
    check_equal(parallel.rejected_by_stress, sequential.rejected_by_stress, "same stress rejections");
    check_equal(parallel.unprofitable, sequential.unprofitable, "same losses");
    check(parallel.opportunities == sequential.opportunities, "same opportunities, same order");

    for (unsigned i = 1; i < sequential.opportunities.size(); ++i)
    {
        check(sequential.opportunities[i-1].net_profit_bps >= sequential.opportunities[i].net_profit_bps
              , "ranked by net profit bps");
    }
}

static void test_failures_are_skipped()
{
    PoolSnapshot snapshot;
    snapshot.add_pool("dry", "SOL", "USDC", 0, 2000000000000ull, 25, "raydium");
    snapshot.add_pool("poolB", "USDC", "SOL", 1800000000000ull, 10000000000000ull, 30, "orca");

    std::vector<std::string> messages;
    log_set_level(log_level_debug);
    log_register_sink([&messages](log_level, const char *msg) { messages.emplace_back(msg); });
    const auto report = scan_opportunities(sol_context(&snapshot));
    log_register_sink(log_sink_t());
    log_set_level(log_level_info);

    check(!report.config_error, "bad pools are not a configuration error");
    check_equal(report.candidates, std::size_t(2), "candidates");
    check_equal(report.failed_evaluation, std::size_t(2), "both fail on the dry pool");
    check(report.opportunities.empty(), "no opportunity");
    const auto logged = std::count_if(messages.begin(), messages.end(), [](const std::string &m) {
        return m.find("failed evaluation at hop") != std::string::npos;
    });
    check_equal(logged, 2, "each failure logged");
}

static void test_stress_limit()
{
    auto snapshot = make_price_gap();
    auto ctx = sol_context(snapshot.get());
    // half of the SOL reserves of either pool
    ctx.constraints.trade_amounts["SOL"] = 5000 * ONE_SOL;
    auto report = scan_opportunities(ctx);
    check_equal(report.rejected_by_stress, std::size_t(2), "too large for the pools");
    check(report.opportunities.empty(), "no opportunity");

    ctx.constraints.max_lp_reserves_stress = 0;
    report = scan_opportunities(ctx);
    check_equal(report.rejected_by_stress, std::size_t(0), "stress check disabled");
    check_equal(report.evaluated, std::size_t(2), "both evaluated");
}

static void test_optimized_amount()
{
    auto snapshot = make_price_gap();
    auto ctx = sol_context(snapshot.get());
    ctx.constraints.trade_amounts.clear();
    ctx.constraints.optimize_amount = true;
    ctx.constraints.trade_amount_min = ONE_SOL;
    ctx.constraints.trade_amount_max = 1000 * ONE_SOL;

    const auto report = scan_opportunities(ctx);
    check(!report.config_error, "search range is enough");
    check_equal(report.opportunities.size(), std::size_t(1), "one opportunity");
    const auto &o = report.opportunities.front();
    check_equal(o.amount_in
                , find_max_yield_amount(o.route, ONE_SOL, 1000 * ONE_SOL, ctx.constraints.costs)
                , "traded at the best amount");
    check(o.amount_in > ONE_SOL, "more than the minimum");
    check(o.net_profit > 96979044ull, "more than trading 1 SOL");
}

static void test_external_routes()
{
    Route good;
    good.emplace_back(make_hop("SOL", "USDC", 10000000000000ull, 2000000000000ull, 25, "poolA", "raydium"));
    good.emplace_back(make_hop("USDC", "SOL", 1800000000000ull, 10000000000000ull, 30, "poolB", "orca"));
    Route circular;
    circular.emplace_back(make_hop("SOL", "USDC", 10000000000000ull, 2000000000000ull, 25, "poolA"));
    circular.emplace_back(make_hop("USDC", "RAY", 10000000000000ull, 2000000000000ull, 25, "poolC"));
    circular.emplace_back(make_hop("RAY", "USDC", 10000000000000ull, 2000000000000ull, 25, "poolD"));
    circular.emplace_back(make_hop("USDC", "SOL", 1800000000000ull, 10000000000000ull, 30, "poolB"));
    Route from_usdc;
    from_usdc.emplace_back(make_hop("USDC", "SOL", 1800000000000ull, 10000000000000ull, 30, "poolB"));
    from_usdc.emplace_back(make_hop("SOL", "USDC", 10000000000000ull, 2000000000000ull, 25, "poolA"));

    ScanContext ctx;
    ctx.routes = {good, circular, from_usdc};
    ctx.constraints.trade_amounts["SOL"] = ONE_SOL;
    const auto report = scan_opportunities(ctx);

    check(!report.config_error, "routes without a snapshot");
    check_equal(report.candidates, std::size_t(3), "candidates as given");
    check_equal(report.rejected_by_guard, std::size_t(1), "circular route rejected");
    check_equal(report.skipped_no_amount, std::size_t(1), "no amount for USDC");
    check_equal(report.opportunities.size(), std::size_t(1), "good route found");
    check_equal(report.opportunities[0].route_id, good.id(), "good route id");
}

static void test_configuration_errors()
{
    auto snapshot = make_price_gap();

    auto ctx = sol_context(snapshot.get());
    ctx.constraints.min_profit_bps = -1;
    auto report = scan_opportunities(ctx);
    check(report.config_error, "min_profit_bps unset");
    check(report.opportunities.empty() && report.candidates == 0, "nothing scanned");
    check(has_diagnostic(report, "configuration error"), "diagnostic");

    ctx = sol_context(snapshot.get());
    ctx.constraints.trade_amounts.clear();
    check(scan_opportunities(ctx).config_error, "no trade amount");

    ctx = sol_context(snapshot.get());
    ctx.constraints.max_hops = 5;
    check(scan_opportunities(ctx).config_error, "routes too long");

    ctx = sol_context(snapshot.get());
    ctx.constraints.optimize_amount = true;
    ctx.constraints.trade_amount_min = 10;
    ctx.constraints.trade_amount_max = 5;
    check(scan_opportunities(ctx).config_error, "bad search range");

    ctx = sol_context(nullptr);
    report = scan_opportunities(ctx);
    check(report.config_error, "nothing to scan");
    check(has_diagnostic(report, "no snapshot"), "nothing to scan diagnostic");

    expect_exception<ConstraintConsistencyError>([]{
        ScanConstraints c;
        c.threads = 0;
        c.default_trade_amount = 1;
        c.check_consistency();
    }, "no threads");
}

static void test_missing_data()
{
    PoolSnapshot empty;
    auto report = scan_opportunities(sol_context(&empty));
    check(!report.config_error, "an empty snapshot is not a configuration error");
    check_equal(report.candidates, std::size_t(0), "no candidates");
    check(has_diagnostic(report, "no liquidity data in snapshot"), "empty snapshot diagnostic");

    auto snapshot = make_price_gap();
    auto ctx = sol_context(snapshot.get());
    ctx.constraints.start_tokens = {"BONK", "SOL"};
    report = scan_opportunities(ctx);
    check(has_diagnostic(report, "no liquidity data for start token BONK"), "unknown start token diagnostic");
    check_equal(report.opportunities.size(), std::size_t(1), "other start tokens still scanned");
}

static void test_deadline()
{
    auto snapshot = make_price_gap();
    for (unsigned threads: {1u, 4u})
    {
        auto ctx = sol_context(snapshot.get());
        ctx.constraints.threads = threads;
        ctx.set_deadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
        const auto report = scan_opportunities(ctx);
        check(report.deadline_hit, strfmt("deadline hit with %1% thread(s)", threads));
        check_equal(report.evaluated, std::size_t(0), "nothing evaluated");
        check(report.opportunities.empty(), "no opportunity");
        check(has_diagnostic(report, "deadline"), "deadline diagnostic");
    }

    auto ctx = sol_context(snapshot.get());
    ctx.set_timeout(std::chrono::minutes(10));
    const auto report = scan_opportunities(ctx);
    check(!report.deadline_hit, "generous timeout");
    check_equal(report.opportunities.size(), std::size_t(1), "opportunity within the timeout");
}

static void test_throwing_log_sink()
{
    auto snapshot = make_price_gap();
    auto ctx = sol_context(snapshot.get());
    ctx.constraints.threads = 4;

    log_register_sink([](log_level, const char *) {
        throw 42;
    });
    const auto report = scan_opportunities(ctx);
    log_register_sink(log_sink_t());

    check_equal(report.candidates, std::size_t(2), "scan completed with a broken sink");
    check_equal(report.opportunities.size(), std::size_t(1), "opportunity found with a broken sink");
}

static void test_confidence()
{
    Route r;
    r.emplace_back(make_hop("SOL", "USDC", 1000, 1000, 0));
    r.emplace_back(make_hop("USDC", "SOL", 1000, 1000, 0));
    const auto res = evaluate_route(r, 100);
    // 100 of 1000 on hop 0 is the worst: 0.1
    check_equal(max_reserves_stress(r, res), 0.1, "stress");
    check(std::abs(confidence_score(r, res, 0.2) - 0.5) < 1e-9, "half way to the reference stress");
    check(std::abs(confidence_score(r, res, 0) - 0.9) < 1e-9, "no reference: 1");
    check_equal(confidence_score(r, res, 0.05), 0.0, "beyond the reference stress");

    Route four = r;
    four.emplace_back(make_hop("SOL", "RAY", 1000000, 1000000, 0));
    four.emplace_back(make_hop("RAY", "SOL", 1000000, 1000000, 0));
    const auto res4 = evaluate_route(four, 100);
    check(std::abs(confidence_score(four, res4, 0.2) - 0.45) < 1e-9, "4 hops penalty");

    Route dry = r;
    dry[1].pool.reserve_in = 0;
    check_equal(confidence_score(dry, evaluate_route(dry, 100), 0.2), 0.0, "failed route");
}


int main()
{
    test_direct_arbitrage();
    test_ranking_and_limits();
    test_rank_ties();
    test_parallel_scan();
    test_failures_are_skipped();
    test_stress_limit();
    test_optimized_amount();
    test_external_routes();
    test_configuration_errors();
    test_missing_data();
    test_deadline();
    test_throwing_log_sink();
    test_confidence();
    std::cout << "scanner: ok" << std::endl;
    return 0;
}
