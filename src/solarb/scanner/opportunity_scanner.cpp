#include "opportunity_scanner.hpp"
#include "../commons/solarb_log.hpp"
#include <solarb/model/solarb_model.hpp>
#include <solarb/pathfinder/finder_routes.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace solarb {
namespace scanner {

using namespace model;
using pathfinder::RouteResult;


void ScanContext::set_deadline(std::chrono::steady_clock::time_point when)
{
    has_deadline = true;
    deadline = when;
}

void ScanContext::set_timeout(std::chrono::milliseconds timeout)
{
    set_deadline(std::chrono::steady_clock::now() + timeout);
}

bool ScanContext::deadline_reached() const
{
    return has_deadline && std::chrono::steady_clock::now() >= deadline;
}


std::string Opportunity::describe() const
{
    std::stringstream ss;
    ss << route.size() << "-hop opportunity " << route.get_symbols()
       << " (id " << route_id << ")" << std::endl;
    for (unsigned i = 0; i < route.size(); ++i)
    {
        const auto &hop = route.get(i);
        const auto sent = i == 0 ? amount_in : per_hop_outputs.at(i-1);
        ss << "  \\_ hop " << i << ": " << sent << " " << hop.from_token
           << " -> " << per_hop_outputs.at(i) << " " << hop.to_token
           << " on " << (hop.dex_name.empty() ? "?" : hop.dex_name)
           << " pool " << hop.pool_address
           << ", fee " << hop.pool.fee_bps << "bps" << std::endl;
    }
    if (route.size() == 2)
    {
        ss << "  \\_ buy on " << buy_dex << " at " << buy_price
           << ", sell on " << sell_dex << " at " << sell_price << std::endl;
    }
    ss << "  \\_ amount in is       " << amount_in << std::endl;
    ss << "  \\_ gross amount out is " << gross_amount_out << std::endl;
    ss << "  \\_ costs are          " << total_cost << std::endl;
    ss << "  \\_ net profit is      " << net_profit
       << " (" << net_profit_bps << "bps), "
       << profit::verdict_name(verdict) << std::endl;
    ss << "  \\_ confidence is      " << std::fixed << std::setprecision(3)
       << confidence_score << std::endl;
    return ss.str();
}

std::ostream& operator<< (std::ostream& stream, const Opportunity& o)
{
    stream << o.route << ": net " << o.net_profit
           << " (" << o.net_profit_bps << "bps)";
    return stream;
}


std::string ScanReport::summary() const
{
    return strfmt("%1% candidates, %2% evaluated, %3% opportunities"
                  " (guard %4%, no amount %5%, failed %6%, stress %7%, unprofitable %8%)%9%"
                  , candidates, evaluated, opportunities.size()
                  , rejected_by_guard, skipped_no_amount, failed_evaluation
                  , rejected_by_stress, unprofitable
                  , deadline_hit ? ", deadline hit" : "");
}


double confidence_score(const Route &route
                        , const RouteResult &result
                        , double reference_stress)
{
    if (result.failed)
    {
        return 0;
    }
    const double reference = reference_stress > 0 ? reference_stress : 1.0;
    const double worst = pathfinder::max_reserves_stress(route, result);
    double score = 1.0 - std::min(1.0, worst / reference);
    if (route.size() >= 4)
    {
        score *= 0.9;
    }
    return std::max(0.0, std::min(1.0, score));
}


void rank_opportunities(OpportunityList &list)
{
    std::stable_sort(list.begin(), list.end(), [](const Opportunity &a, const Opportunity &b) {
        if (a.net_profit_bps != b.net_profit_bps) return a.net_profit_bps > b.net_profit_bps;
        if (a.net_profit != b.net_profit) return a.net_profit > b.net_profit;
        return a.route_id < b.route_id;
    });
}


std::vector<Route> build_candidate_routes(const PoolSnapshot &snapshot
                                          , const ScanConstraints &c
                                          , std::vector<std::string> *diagnostics)
{
    std::vector<Route> res;
    const auto start_tokens = c.start_tokens.empty()
            ? snapshot.tokens()
            : c.start_tokens;

    pathfinder::Finder finder(&snapshot);
    for (auto &token: start_tokens)
    {
        if (!snapshot.has_token(token))
        {
            log_debug("start token %1% not in the snapshot: no liquidity data", token);
            if (diagnostics)
            {
                diagnostics->emplace_back(strfmt("no liquidity data for start token %1%", token));
            }
            continue;
        }
        if (!c.optimize_amount && c.trade_amount_for(token) == 0)
        {
            log_trace("no trade amount for start token %1%", token);
            continue;
        }
        finder.find_all_routes([&](const Route &r) { res.emplace_back(r); }
                               , token
                               , c.min_hops
                               , c.max_hops);
    }
    return res;
}


namespace {

typedef enum {
    CANDIDATE_PROFITABLE,
    CANDIDATE_UNPROFITABLE,
    CANDIDATE_REJECTED_GUARD,
    CANDIDATE_NO_AMOUNT,
    CANDIDATE_FAILED,
    CANDIDATE_REJECTED_STRESS,
    CANDIDATE_ABANDONED,
} candidate_outcome_e;

struct CandidateOutcome
{
    candidate_outcome_e outcome = CANDIDATE_ABANDONED;
    Opportunity opportunity;
};


// the whole evaluation pipeline of a candidate route.
// Reads its inputs only: safe to run concurrently on distinct candidates.
void m_process_candidate(const Route &route
                         , const ScanConstraints &c
                         , CandidateOutcome &out)
{
    const auto guard = pathfinder::check_route(route, c.max_same_token_repeats);
    if (guard != pathfinder::ROUTE_OK)
    {
        log_debug("discarded candidate %1%: %2%"
                  , route.get_symbols(), pathfinder::route_error_name(guard));
        out.outcome = CANDIDATE_REJECTED_GUARD;
        return;
    }

    amount_t amount = c.optimize_amount
            ? pathfinder::find_max_yield_amount(route
                                                , c.trade_amount_min
                                                , c.trade_amount_max
                                                , c.costs)
            : c.trade_amount_for(route.initial_token());
    if (amount == 0)
    {
        log_debug("discarded candidate %1%: no trade amount for %2%"
                  , route.get_symbols(), route.initial_token());
        out.outcome = CANDIDATE_NO_AMOUNT;
        return;
    }

    const auto result = pathfinder::evaluate_route(route, amount);
    if (result.failed)
    {
        log_debug("candidate %1% failed evaluation at hop %2%: %3% (%4%)"
                  , route.get_symbols()
                  , result.failed_hop
                  , pathfinder::eval_error_name(result.error)
                  , result.error_message);
        out.outcome = CANDIDATE_FAILED;
        return;
    }

    if (c.max_lp_reserves_stress > 0)
    {
        const auto stress = pathfinder::max_reserves_stress(route, result);
        if (stress > c.max_lp_reserves_stress)
        {
            log_debug("discarded candidate %1%: reserves stress %2% exceeds %3%"
                      , route.get_symbols(), stress, c.max_lp_reserves_stress);
            out.outcome = CANDIDATE_REJECTED_STRESS;
            return;
        }
    }

    const auto costs = fees::total_arbitrage_costs(amount, route, c.costs);
    const auto verdict = profit::assess_profitability(amount
                                                      , result.final_amount_out
                                                      , costs
                                                      , static_cast<amount_t>(c.min_profit_bps));

    auto &o = out.opportunity;
    o.route = route;
    o.route_id = route.id();
    o.amount_in = amount;
    o.gross_amount_out = result.final_amount_out;
    o.gross_profit = verdict.gross_profit;
    o.total_cost = costs;
    o.net_profit = verdict.net_profit;
    o.net_profit_bps = verdict.net_profit_bps;
    o.profitable = verdict.profitable;
    o.verdict = verdict.verdict;
    o.per_hop_outputs = result.per_hop_outputs;
    o.confidence_score = confidence_score(route, result, c.max_lp_reserves_stress);
    o.timestamp = std::chrono::system_clock::now();
    if (route.size() == 2)
    {
        o.buy_dex = route.get(0).dex_name;
        o.sell_dex = route.get(1).dex_name;
        o.buy_price = static_cast<double>(result.per_hop_outputs[0]) / static_cast<double>(amount);
        o.sell_price = result.final_amount_out > 0
                ? static_cast<double>(result.per_hop_outputs[0]) / static_cast<double>(result.final_amount_out)
                : 0;
    }

    if (!verdict.profitable)
    {
        log_trace("candidate %1%: %2%", route.get_symbols(), verdict);
        out.outcome = CANDIDATE_UNPROFITABLE;
        return;
    }
    log_info("opportunity %1%: +%2% (%3%bps) on %4% %5%"
             , route.get_symbols(), o.net_profit, o.net_profit_bps
             , amount, route.initial_token());
    out.outcome = CANDIDATE_PROFITABLE;
}


// process a candidate unless the deadline is reached.
// Errors other than the expected evaluation failures
// are reported against the candidate.
void m_run_candidate(const ScanContext &ctx
                     , const Route &route
                     , CandidateOutcome &out)
{
    if (ctx.deadline_reached())
    {
        out.outcome = CANDIDATE_ABANDONED;
        return;
    }
    try {
        m_process_candidate(route, ctx.constraints, out);
    } catch (const std::exception &e) {
        log_error("candidate %1% evaluation error: %2%", route.get_symbols(), e.what());
        out.outcome = CANDIDATE_FAILED;
    }
}


void m_log_constraints(const ScanContext &ctx)
{
    const auto &c = ctx.constraints;
    log_debug(" \\__ min_profit_bps is %1%", c.min_profit_bps);
    log_debug(" \\__ max_same_token_repeats is %1%", c.max_same_token_repeats);
    log_debug(" \\__ routes from %1% to %2% hops", c.min_hops, c.max_hops);
    log_debug(" \\__ costs: network %1%, priority %2%, margin %3%%%"
              , c.costs.network_base_fee, c.costs.priority_fee, c.costs.safety_margin_pct);
    if (c.optimize_amount)
    {
        log_debug(" \\__ trade amount searched in [%1%, %2%]", c.trade_amount_min, c.trade_amount_max);
    }
    if (c.max_lp_reserves_stress > 0)
    {
        log_debug(" \\__ max_lp_reserves_stress set at %1%", c.max_lp_reserves_stress);
    }
    if (c.match_limit)
    {
        log_debug(" \\__ match limit is set at %1%", c.match_limit);
    }
    if (c.limit)
    {
        log_debug(" \\__ loop limit is set at %1%", c.limit);
    }
    if (ctx.has_deadline)
    {
        log_debug(" \\__ deadline in %1% ms"
                  , std::chrono::duration_cast<std::chrono::milliseconds>(
                      ctx.deadline - std::chrono::steady_clock::now()).count());
    }
}

} // namespace


ScanReport scan_opportunities(const ScanContext &ctx)
{
    ScanReport report;
    const auto &c = ctx.constraints;

    try
    {
        c.check_consistency();
    }
    catch (const ConstraintConsistencyError &e)
    {
        log_error("scan not started, bad configuration: %1%", e.what());
        report.config_error = true;
        report.diagnostics.emplace_back(strfmt("configuration error: %1%", e.what()));
        return report;
    }
    if (ctx.snapshot == nullptr && ctx.routes.empty())
    {
        log_error("scan not started: neither a snapshot nor candidate routes were given");
        report.config_error = true;
        report.diagnostics.emplace_back("configuration error: no snapshot and no candidate routes");
        return report;
    }

    log_info("opportunity scan starting");
    m_log_constraints(ctx);

    std::vector<Route> candidates;
    if (ctx.snapshot != nullptr)
    {
        if (ctx.snapshot->pools_count() == 0)
        {
            log_info("snapshot carries no pools");
            report.diagnostics.emplace_back("no liquidity data in snapshot");
        }
        candidates = build_candidate_routes(*ctx.snapshot, c, &report.diagnostics);
    }
    candidates.insert(candidates.end(), ctx.routes.begin(), ctx.routes.end());
    if (c.limit > 0 && candidates.size() > c.limit)
    {
        log_debug("loop limit reached: %1% candidates out of %2% examined"
                  , c.limit, candidates.size());
        candidates.resize(c.limit);
    }
    report.candidates = candidates.size();

    // one slot per candidate: the order of completion doesn't matter
    std::vector<CandidateOutcome> outcomes(candidates.size());

    if (c.threads > 1 && candidates.size() > 1)
    {
        boost::asio::thread_pool pool(c.threads);
        for (std::size_t i = 0; i < candidates.size(); ++i)
        {
            boost::asio::post(pool, [&ctx, &candidates, &outcomes, i]() {
                m_run_candidate(ctx, candidates[i], outcomes[i]);
            });
        }
        pool.join();
    }
    else
    {
        for (std::size_t i = 0; i < candidates.size(); ++i)
        {
            if (ctx.deadline_reached())
            {
                break;
            }
            m_run_candidate(ctx, candidates[i], outcomes[i]);
        }
    }

    for (auto &o: outcomes)
    {
        switch (o.outcome) {
        case CANDIDATE_PROFITABLE:
            report.evaluated++;
            report.opportunities.emplace_back(std::move(o.opportunity));
            break;
        case CANDIDATE_UNPROFITABLE:
            report.evaluated++;
            report.unprofitable++;
            break;
        case CANDIDATE_REJECTED_GUARD:
            report.rejected_by_guard++;
            break;
        case CANDIDATE_NO_AMOUNT:
            report.skipped_no_amount++;
            break;
        case CANDIDATE_FAILED:
            report.evaluated++;
            report.failed_evaluation++;
            break;
        case CANDIDATE_REJECTED_STRESS:
            report.evaluated++;
            report.rejected_by_stress++;
            break;
        case CANDIDATE_ABANDONED:
            report.deadline_hit = true;
            break;
        }
    }
    if (report.deadline_hit)
    {
        log_warning("scan deadline reached, remaining candidates abandoned");
        report.diagnostics.emplace_back("deadline reached before all candidates were evaluated");
    }

    rank_opportunities(report.opportunities);
    if (c.match_limit > 0 && report.opportunities.size() > c.match_limit)
    {
        log_trace("match limit reached (%1%)", c.match_limit);
        report.opportunities.resize(c.match_limit);
    }

    log_info("opportunity scan done: %1%", report.summary());
    return report;
}


} // namespace scanner
} // namespace solarb
