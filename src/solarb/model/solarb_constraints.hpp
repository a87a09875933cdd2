#pragma once

#include "solarb_common.hpp"
#include "solarb_types.hpp"
#include "solarb_fees.hpp"
#include <map>
#include <stdexcept>
#include <vector>

namespace solarb {
namespace model {

struct ConstraintConsistencyError: std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/**
 * @brief Constraints to be used in opportunity scans
 *
 * @note using a struct because they add up quickly,
 *       and nobody wants to pass them as a bunch of individual parameters.
 */
struct ScanConstraints {
    /**
     * @brief min_profit_bps
     *
     * minimum net profit, in basis points of the traded amount,
     * a route must yield to be reported as profitable.
     * The threshold is inclusive.
     *
     * A negative value means "not set", and fails check_consistency().
     *
     * @default 50 (0.5%)
     */
    long min_profit_bps = 50;

    /**
     * @brief max_same_token_repeats
     *
     * how many times a token may appear in a route.
     * The start token is allowed one extra appearance when the route
     * closes on it.
     *
     * @default 1
     */
    unsigned int max_same_token_repeats = 1;

    /**
     * @brief min_hops, max_hops
     *
     * length range of the routes built out of a snapshot.
     * 2 is direct (cross-DEX) arbitrage, 3 is triangular.
     *
     * @default 2, 3
     */
    unsigned int min_hops = 2;
    unsigned int max_hops = 3;

    /**
     * @brief fixed inputs of the cost model
     */
    fees::CostParameters costs;

    /**
     * @brief default_trade_amount
     *
     * amount of start token traded through each route, for start tokens
     * that have no entry in @p trade_amounts
     *
     * @default 0 (no default)
     */
    amount_t default_trade_amount = 0;

    /**
     * @brief trade_amounts
     *
     * per start-token trade amount, base units of that token
     */
    std::map<token_t, amount_t> trade_amounts;

    /**
     * @brief start_tokens
     *
     * tokens routes are allowed to start from.
     *
     * @default empty (every token of the snapshot)
     */
    std::vector<token_t> start_tokens;

    /**
     * @brief max_lp_reserves_stress
     *
     * specifies the maximum reserves stress that the route
     * can induce in each of the traversed pools.
     *
     * If any hop sends more than @p max_lp_reserves_stress of the
     * pool's input reserve, the route is discarded.
     *
     * @default 0.33 (about 1/3 of LP reserves). 0 disables the check
     */
    double max_lp_reserves_stress = 0.33;

    /**
     * @brief optimize_amount
     *
     * search the trade amount that yields the most, in the range
     * [@p trade_amount_min, @p trade_amount_max] instead of trading
     * the configured fixed amount
     *
     * @default false
     */
    bool optimize_amount = false;
    amount_t trade_amount_min = 0;
    amount_t trade_amount_max = 0;

    /**
     * @brief match limit
     *
     * limit to the amount of ranked opportunities returned
     * (applied after sorting, so it keeps the best ones)
     *
     * @default 0 (no constraint)
     */
    unsigned int match_limit = 0;

    /**
     * @brief routine loop limit
     *
     * limit to the amount of examined candidates
     * (does not sort for best or worst. It just stops the scan
     * after a certain amount of examined candidates)
     *
     * @default 0 (no constraint)
     */
    unsigned int limit = 0;

    /**
     * @brief threads
     *
     * number of worker threads evaluating candidates.
     * 1 evaluates in the calling thread
     *
     * @default 1
     */
    unsigned int threads = 1;

    /**
     * @brief trade amount for routes starting at @p token
     * @return 0 if none configured
     */
    amount_t trade_amount_for(const token_t &token) const;

    /**
     * @throws ConstraintConsistencyError
     */
    void check_consistency() const;
};


} // namespace model
} // namespace solarb
