#pragma once

#include <solarb/model/solarb_types.hpp>
#include <solarb/model/solarb_fees.hpp>
#include <functional>
#include <stdexcept>
#include <iostream>
#include <vector>

namespace solarb {
namespace pathfinder {

using Hop = model::Hop;
using amount_t = model::amount_t;
using token_t = model::token_t;


typedef enum {
    ROUTE_OK,
    ROUTE_TOO_SHORT,     ///< less than MIN_HOPS hops
    ROUTE_TOO_LONG,      ///< more than MAX_HOPS hops
    ROUTE_CIRCULAR,      ///< a token is visited more than allowed
    ROUTE_DISCONNECTED,  ///< hop chain broken, or not closing on the start token
} route_error_e;

const char *route_error_name(route_error_e kind);

struct RouteConsistencyError: std::runtime_error
{
    RouteConsistencyError(route_error_e kind_, const std::string &msg)
        : std::runtime_error(msg)
        , kind(kind_)
    {}

    const route_error_e kind;
};


constexpr unsigned MIN_HOPS = 2;
constexpr unsigned MAX_HOPS = 4;


/**
 * @brief The Route struct
 *
 * Describes a sequential chain of swaps, meant to close back
 * on its initial token.
 *
 * It extends std::vector<Hop> for improved usability. Hops are carried
 * by value, so a Route outlives the snapshot it was built from.
 */
struct Route: std::vector<Hop>
{
    typedef std::vector<Hop> base_t;

    using base_t::base_t;
    Route() = default;

    /**
     * @brief callback type
     *
     * Algos that discover Route objects don't simply add them to lists
     * to be passed around.
     * They invoke a callback functor upon discovery of a candidate route,
     * and whatever is at the other end gets the notification.
     */
    typedef std::function<void(const Route &)> listener_t;

    /**
     * @brief read element at position @p idx
     */
    const Hop &get(unsigned int idx) const { return at(idx); }

    /**
     * @brief identifier of a route
     *
     * This value is computed by hashing the start token and the addresses
     * of the crossed pools, in their appeareance order. Therefore it is
     * repeatable across different sessions.
     */
    std::size_t id() const;

    const token_t &initial_token() const;
    const token_t &final_token() const;

    /**
     * @brief true if the last hop sells into the first hop's token
     */
    bool is_closed() const noexcept;

    /**
     * @brief true if the route crosses more than one DEX
     */
    bool is_cross_exchange() const;

    std::string print_addr() const;
    std::string get_symbols() const;
};

std::ostream& operator<< (std::ostream& stream, const Route& o);


/**
 * @brief structural check of a route
 *
 * Checks, in this order: length, token repeats, chaining.
 *
 * Every token in the visit sequence [from_0, to_0, to_1, ... to_last] is
 * counted. No count may exceed @p max_same_token_repeats, but the start
 * token gets one extra slot when the route closes on it.
 */
route_error_e check_route(const Route &route, unsigned max_same_token_repeats);

/**
 * @brief structural check of a route
 * @throws RouteConsistencyError describing the first failed check
 */
void validate_route(const Route &route, unsigned max_same_token_repeats = 1);


typedef enum {
    EVAL_OK,
    EVAL_INVALID_RESERVES,
    EVAL_INSUFFICIENT_LIQUIDITY,
} eval_error_e;

const char *eval_error_name(eval_error_e kind);


/**
 * @brief outcome of a route simulation
 *
 * per_hop_outputs holds the output of each hop, up to the failing one
 * (excluded) if the simulation failed.
 */
struct RouteResult {
    amount_t amount_in = 0;
    std::vector<amount_t> per_hop_outputs;
    amount_t final_amount_out = 0;

    bool failed = false;
    eval_error_e error = EVAL_OK;
    unsigned failed_hop = 0;
    std::string error_message;

    /**
     * @brief amount sent into hop @p idx
     */
    amount_t amount_before_hop(unsigned idx) const;
    double yield_ratio() const;
    std::string infos() const;
};

std::ostream& operator<< (std::ostream& stream, const RouteResult& o);


/**
 * @brief walks the route, each hop's output being the next hop's input
 *
 * Pure simulation: no structural check, no profitability judgement.
 * Swap errors don't propagate, they mark the result as failed
 * and tell which hop failed.
 */
RouteResult evaluate_route(const Route &route, amount_t amount_in);

/**
 * @brief share of the input reserve that hop @p idx takes from its pool
 */
double hop_reserves_stress(const Route &route, const RouteResult &result, unsigned idx);

/**
 * @brief highest hop_reserves_stress() across the route
 */
double max_reserves_stress(const Route &route, const RouteResult &result);


constexpr unsigned MAX_YIELD_SEARCH_DEPTH = 12;

/**
 * @brief trade amount in [@p amount_min, @p amount_max] maximizing
 *        final_amount_out - amount_in - total_cost
 *
 * Recursive bracketing search: sample the edges and the midpoint
 * of the bracket, move towards the best one. Recursion stops at
 * @p max_depth or when the bracket is narrower than 1ppm of @p amount_min.
 */
amount_t find_max_yield_amount(const Route &route
                               , amount_t amount_min
                               , amount_t amount_max
                               , const model::fees::CostParameters &costs
                               , unsigned max_depth = MAX_YIELD_SEARCH_DEPTH);

/**
 * @brief evaluate_route() at the amount found by find_max_yield_amount()
 */
RouteResult evaluate_route_max_yield(const Route &route
                                     , amount_t amount_min
                                     , amount_t amount_max
                                     , const model::fees::CostParameters &costs
                                     , unsigned max_depth = MAX_YIELD_SEARCH_DEPTH);


} // namespace pathfinder
} // namespace solarb
