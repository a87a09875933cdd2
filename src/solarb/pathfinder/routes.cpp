#include "routes.hpp"
#include "../commons/solarb_log.hpp"
#include <solarb/model/solarb_amm_estimation.hpp>
#include <boost/functional/hash.hpp>
#include <algorithm>
#include <map>
#include <sstream>

namespace solarb {
namespace pathfinder {

using namespace model;


const char *route_error_name(route_error_e kind)
{
    switch (kind) {
    case ROUTE_OK:           return "Ok";
    case ROUTE_TOO_SHORT:    return "TooShort";
    case ROUTE_TOO_LONG:     return "TooLong";
    case ROUTE_CIRCULAR:     return "CircularRoute";
    case ROUTE_DISCONNECTED: return "Disconnected";
    }
    return "?";
}

const char *eval_error_name(eval_error_e kind)
{
    switch (kind) {
    case EVAL_OK:                     return "Ok";
    case EVAL_INVALID_RESERVES:       return "InvalidReserves";
    case EVAL_INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
    }
    return "?";
}


std::size_t Route::id() const
{
    std::size_t h = 0U;
    if (empty()) return h;
    boost::hash_combine(h, front().from_token);
    for (auto &hop: *this)
    {
        boost::hash_combine(h, hop.pool_address);
    }
    return h;
}

const token_t &Route::initial_token() const
{
    return at(0).from_token;
}

const token_t &Route::final_token() const
{
    return at(size()-1).to_token;
}

bool Route::is_closed() const noexcept
{
    return !empty() && back().to_token == front().from_token;
}

bool Route::is_cross_exchange() const
{
    for (unsigned i = 1; i < size(); ++i)
    {
        if (get(i).dex_name != get(0).dex_name)
        {
            return true;
        }
    }
    return false;
}

std::string Route::print_addr() const
{
    std::stringstream ss;
    for (unsigned i = 0; i < size(); ++i)
    {
        if (i > 0) ss << ", ";
        ss << "\"" << get(i).pool_address << "\"";
    }
    return ss.str();
}

std::string Route::get_symbols() const
{
    std::stringstream ss;
    for (unsigned i = 0; i < size(); ++i)
    {
        if (i > 0) ss << "-";
        ss << get(i).from_token;
    }
    if (!empty()) ss << "-" << back().to_token;
    return ss.str();
}

std::ostream& operator<< (std::ostream& stream, const Route& o)
{
    stream << o.size() << "-hop route " << o.get_symbols();
    return stream;
}


namespace {

// token -> number of appearances in the visit sequence
typedef std::map<token_t, unsigned> visits_t;

route_error_e m_check_route(const Route &route
                            , unsigned max_repeats
                            , std::string *offending)
{
    if (route.size() < MIN_HOPS)
    {
        return ROUTE_TOO_SHORT;
    }
    if (route.size() > MAX_HOPS)
    {
        return ROUTE_TOO_LONG;
    }

    visits_t visits;
    visits[route.get(0).from_token]++;
    for (auto &hop: route)
    {
        visits[hop.to_token]++;
    }
    const auto &start = route.initial_token();
    const bool closed = route.is_closed();
    for (auto &v: visits)
    {
        auto allowed = max_repeats;
        if (closed && v.first == start)
        {
            allowed++;
        }
        if (v.second > allowed)
        {
            if (offending) *offending = v.first;
            return ROUTE_CIRCULAR;
        }
    }

    for (unsigned i = 0; i+1 < route.size(); ++i)
    {
        if (route.get(i).to_token != route.get(i+1).from_token)
        {
            if (offending) *offending = std::to_string(i);
            return ROUTE_DISCONNECTED;
        }
    }
    if (!closed)
    {
        if (offending) *offending = route.final_token();
        return ROUTE_DISCONNECTED;
    }
    return ROUTE_OK;
}

} // namespace


route_error_e check_route(const Route &route, unsigned max_same_token_repeats)
{
    return m_check_route(route, max_same_token_repeats, nullptr);
}


void validate_route(const Route &route, unsigned max_same_token_repeats)
{
    std::string offending;
    const auto kind = m_check_route(route, max_same_token_repeats, &offending);
    switch (kind) {
    case ROUTE_OK:
        return;
    case ROUTE_TOO_SHORT:
        throw RouteConsistencyError(kind, strfmt("route too short: %1% hops, must be >= %2%"
                                                 , route.size(), MIN_HOPS));
    case ROUTE_TOO_LONG:
        throw RouteConsistencyError(kind, strfmt("route too long: %1% hops, must be <= %2%"
                                                 , route.size(), MAX_HOPS));
    case ROUTE_CIRCULAR:
        throw RouteConsistencyError(kind, strfmt("token %1% repeats more than %2% time(s) in %3%"
                                                 , offending, max_same_token_repeats
                                                 , route.get_symbols()));
    case ROUTE_DISCONNECTED:
        throw RouteConsistencyError(kind, strfmt("route %1% is broken or not circular (at %2%)"
                                                 , route.get_symbols(), offending));
    }
}


RouteResult evaluate_route(const Route &route, amount_t amount_in)
{
    RouteResult result;
    result.amount_in = amount_in;
    result.per_hop_outputs.reserve(route.size());

    amount_t current_amount = amount_in;
    unsigned i = 0;
    try
    {
        // walk the swap path:
        for (; i < route.size(); ++i)
        {
            current_amount = amm::swap_output(route.get(i).pool, current_amount);
            result.per_hop_outputs.emplace_back(current_amount);
        }
        result.final_amount_out = current_amount;
    }
    catch (const amm::swap_error &e)
    {
        result.failed = true;
        result.failed_hop = i;
        result.error = e.kind == amm::SWAP_INSUFFICIENT_LIQUIDITY
                ? EVAL_INSUFFICIENT_LIQUIDITY
                : EVAL_INVALID_RESERVES;
        result.error_message = e.what();
        result.final_amount_out = 0;
    }
    return result;
}


amount_t RouteResult::amount_before_hop(unsigned idx) const
{
    if (idx == 0) return amount_in;
    return per_hop_outputs.at(idx-1);
}

double RouteResult::yield_ratio() const
{
    if (failed || amount_in == 0) return 0;
    return static_cast<double>(final_amount_out) / static_cast<double>(amount_in);
}

std::string RouteResult::infos() const
{
    std::stringstream ss;
    if (failed)
    {
        ss << "evaluation failed at hop " << failed_hop
           << ": " << eval_error_name(error)
           << " (" << error_message << ")";
        return ss.str();
    }
    ss << amount_in;
    for (auto &i: per_hop_outputs)
    {
        ss << " -> " << i;
    }
    ss << " (yield " << yield_ratio() << ")";
    return ss.str();
}

std::ostream& operator<< (std::ostream& stream, const RouteResult& o)
{
    stream << o.infos();
    return stream;
}


double hop_reserves_stress(const Route &route, const RouteResult &result, unsigned idx)
{
    const auto &pool = route.get(idx).pool;
    if (pool.reserve_in == 0)
    {
        return 1.0;
    }
    return static_cast<double>(result.amount_before_hop(idx))
            / static_cast<double>(pool.reserve_in);
}

double max_reserves_stress(const Route &route, const RouteResult &result)
{
    double res = 0;
    const unsigned hops = result.failed
            ? result.failed_hop
            : static_cast<unsigned>(route.size());
    for (unsigned i = 0; i < hops; ++i)
    {
        res = std::max(res, hop_reserves_stress(route, result, i));
    }
    return res;
}


amount_t find_max_yield_amount(const Route &route
                               , amount_t amount_min
                               , amount_t amount_max
                               , const fees::CostParameters &costs
                               , unsigned max_depth)
{
    if (amount_max <= amount_min)
    {
        return amount_min;
    }
    const amount_t gap_min = std::max<amount_t>(1, amount_min / 1000000);

    // yield_result represents a gain or a loss with a certain trade amount.
    // amount_t is unsigned, so we resort to using this compound type
    // HERE and HERE ONLY in order to also express negative yields.
    struct yield_result
    {
        bool negative;
        amount_t val;
        bool operator<(const yield_result &o) const
        {
            if (!negative && !o.negative) return val<o.val;
            if (negative && !o.negative) return true;
            if (!negative && o.negative) return false;
            return val>o.val;
        }
    };

    // evaluate the route with a specific trade amount. return a yield_result
    auto yield_with = [&](amount_t amount) {
        const auto plan = evaluate_route(route, amount);
        if (plan.failed)
        {
            return yield_result{true, AMOUNT_MAX};
        }
        const auto cost = fees::total_arbitrage_costs(amount, route, costs);
        const wide_amount_t debit = wide_amount_t(amount) + cost.total_cost;
        const wide_amount_t credit = plan.final_amount_out;
        if (credit > debit)
        {
            // credit is an amount_t already, so is any part of it
            const wide_amount_t gain = credit - debit;
            return yield_result{false, gain.convert_to<amount_t>()};
        }
        amount_t val;
        if (!narrow_amount(debit - credit, val))
        {
            val = AMOUNT_MAX;
        }
        return yield_result{true, val};
    };

    // simplest compiler-optimizable form of the find-max-of-3 problem
    auto max_of_3 = [](const auto &a, const auto &b, const auto &c) {
        if (b < a && c < a) return 0;
        if (a < b && c < b) return 1;
        return 2;
    };

    // recursive bisection search (it calls itself), at most max_depth deep
    auto bisect_search = [&](amount_t min
                             , amount_t max
                             , unsigned depth
                             , auto subcall) -> amount_t
    {
        const amount_t mid = min + (max - min) / 2;
        if (max - min <= gap_min || depth >= max_depth)
        {
            // no sense in refining the search any further.
            return mid;
        }
        const auto y0 = yield_with(min);
        const auto y1 = yield_with(mid);
        const auto y2 = yield_with(max);

        switch (max_of_3(y0, y1, y2))
        {
        case 0:
            // best yield with min amount: look in [min, midpoint]
            return subcall(min, mid, depth+1, subcall);
        case 2:
            // best yield with max amount: look in [midpoint, max]
            return subcall(mid, max, depth+1, subcall);
        default:
            // best yield with midpoint amount:
            // - find the best yield in the bracket [min, midpoint] --> nmin
            // - find the best yield in the bracket [midpoint, max] --> nmax
            // - return the best-yielding of the two
            const auto nmin = subcall(min, mid, depth+1, subcall);
            const auto nmax = subcall(mid, max, depth+1, subcall);
            return yield_with(nmin) < yield_with(nmax) ? nmax : nmin;
        }
    };

    const auto ideal = bisect_search(amount_min, amount_max, 0, bisect_search);
    log_trace("max yield search on %1%: best amount in [%2%, %3%] is %4%"
              , route.get_symbols(), amount_min, amount_max, ideal);
    return ideal;
}

RouteResult evaluate_route_max_yield(const Route &route
                                     , amount_t amount_min
                                     , amount_t amount_max
                                     , const fees::CostParameters &costs
                                     , unsigned max_depth)
{
    return evaluate_route(route
                          , find_max_yield_amount(route, amount_min, amount_max, costs, max_depth));
}


} // namespace pathfinder
} // namespace solarb
