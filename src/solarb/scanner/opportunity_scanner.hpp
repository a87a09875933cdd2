/**
 * @file opportunity_scanner.hpp
 * @brief Scan cycle: from a pool snapshot to ranked arbitrage opportunities
 *
 * One scan is a pure function of its ScanContext. Nothing is retained
 * between two scans.
 *
 * For each candidate route:
 *
 *  1. route guard (structural check)
 *  2. route simulation
 *  3. reserves stress check
 *  4. cost model
 *  5. profitability decision
 *
 * A candidate failing any step is logged and skipped. It never
 * aborts the scan. Survivors are ranked by net_profit_bps.
 */

#pragma once

#include <solarb/model/solarb_constraints.hpp>
#include <solarb/model/solarb_fees.hpp>
#include <solarb/model/solarb_model_fwd.hpp>
#include <solarb/model/solarb_profit.hpp>
#include <solarb/pathfinder/routes.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace solarb {
namespace scanner {

using amount_t = model::amount_t;
using token_t = model::token_t;
using Route = pathfinder::Route;
using ScanConstraints = model::ScanConstraints;


/**
 * @brief the decision artifact of a scan
 *
 * Carries everything an execution collaborator needs
 * to build the transaction.
 */
struct Opportunity
{
    Route route;
    std::size_t route_id = 0;

    // direct (2-hop) arbitrage only
    std::string buy_dex;
    std::string sell_dex;
    double buy_price = 0;       ///< intermediate tokens obtained per start token, 1st hop
    double sell_price = 0;      ///< intermediate tokens paid per start token, 2nd hop

    amount_t amount_in = 0;
    amount_t gross_amount_out = 0;
    amount_t gross_profit = 0;
    model::fees::CostBreakdown total_cost;
    amount_t net_profit = 0;
    amount_t net_profit_bps = 0;
    bool profitable = false;
    model::profit::verdict_e verdict = model::profit::VERDICT_NOT_PROFITABLE;
    std::vector<amount_t> per_hop_outputs;
    double confidence_score = 0;
    std::chrono::system_clock::time_point timestamp;

    const token_t &start_token() const { return route.initial_token(); }

    bool operator==(const Opportunity &o) const noexcept
    {
        return route_id == o.route_id && amount_in == o.amount_in;
    }

    /**
     * @brief multi-line human readable account of the opportunity
     */
    std::string describe() const;
};

typedef std::vector<Opportunity> OpportunityList;

std::ostream& operator<< (std::ostream& stream, const Opportunity& o);


/**
 * @brief inputs of one scan cycle
 */
struct ScanContext
{
    /**
     * @brief pools to build candidate routes from. Can be null
     *        if @p routes is provided
     */
    const model::PoolSnapshot *snapshot = nullptr;

    /**
     * @brief candidate routes supplied by the caller,
     *        scanned after those built from @p snapshot
     */
    std::vector<Route> routes;

    ScanConstraints constraints;

    /**
     * @brief remaining candidates are abandoned past this point in time
     */
    bool has_deadline = false;
    std::chrono::steady_clock::time_point deadline;

    void set_deadline(std::chrono::steady_clock::time_point when);
    void set_timeout(std::chrono::milliseconds timeout);
    bool deadline_reached() const;
};


/**
 * @brief outcome of a scan cycle
 *
 * A scan with no profitable opportunity is a success.
 * config_error tells a scan that could not start at all.
 */
struct ScanReport
{
    OpportunityList opportunities;

    std::size_t candidates = 0;          ///< routes considered
    std::size_t rejected_by_guard = 0;
    std::size_t skipped_no_amount = 0;   ///< no trade amount for the start token
    std::size_t failed_evaluation = 0;
    std::size_t rejected_by_stress = 0;
    std::size_t unprofitable = 0;
    std::size_t evaluated = 0;           ///< routes that reached simulation
    bool deadline_hit = false;
    bool config_error = false;

    std::vector<std::string> diagnostics;

    std::string summary() const;
};


/**
 * @brief runs one scan cycle
 *
 * Never throws on bad data: configuration errors produce an empty report
 * with config_error set and a diagnostic.
 */
ScanReport scan_opportunities(const ScanContext &ctx);

/**
 * @brief candidate routes of a snapshot, as built by a scan
 *
 * For each start token with a trade amount, all the routes from
 * min_hops to max_hops long.
 */
std::vector<Route> build_candidate_routes(const model::PoolSnapshot &snapshot
                                          , const ScanConstraints &constraints
                                          , std::vector<std::string> *diagnostics = nullptr);

/**
 * @brief sorts by net_profit_bps, then net_profit (both descending), then route id
 */
void rank_opportunities(OpportunityList &list);

/**
 * @brief liquidity-based quality weight of an evaluated route, in [0, 1]
 *
 * 1 for a trade negligible vs the pools it crosses, dropping to 0
 * as the most stressed hop approaches @p reference_stress.
 * 4-hop routes are penalized by 10%.
 */
double confidence_score(const Route &route
                        , const pathfinder::RouteResult &result
                        , double reference_stress);


} // namespace scanner
} // namespace solarb
