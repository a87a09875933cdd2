#include "finder_routes.hpp"
#include "../commons/solarb_log.hpp"
#include <solarb/model/solarb_model.hpp>
#include <algorithm>
#include <array>

namespace solarb {
namespace pathfinder {


unsigned Finder::find_all_routes(Route::listener_t callback
                                 , const token_t &start_token
                                 , unsigned min_hops
                                 , unsigned max_hops
                                 , unsigned max_count) const
{
    using namespace model;

    if (!callback)
    {
        throw std::invalid_argument("find_all_routes(): callback not set");
    }
    if (snapshot == nullptr)
    {
        throw std::invalid_argument("find_all_routes(): snapshot not set");
    }
    min_hops = std::max(min_hops, MIN_HOPS);
    max_hops = std::min(max_hops, MAX_HOPS);

    log_debug("find routes circular against token %1%, %2% to %3% hops"
              , start_token, min_hops, max_hops);

    std::array<const DirectedSwap *, MAX_HOPS> candidate;
    unsigned path_len = 0;
    unsigned count = 0;
    struct LimitReached {};

    auto already_in_path = [&](const PoolEntry *pool)
    {
        for (unsigned i = 0; i < path_len; ++i)
        {
            if (candidate[i]->pool == pool) return true;
        }
        return false;
    };

    auto emit = [&]()
    {
        Route route;
        route.reserve(path_len);
        for (unsigned i = 0; i < path_len; ++i)
        {
            route.emplace_back(candidate[i]->hop());
        }
        log_trace("found route: %1%", route.get_symbols());
        callback(route);
        ++count;
        if (max_count > 0 && count >= max_count)
        {
            throw LimitReached();
        }
    };

    // depth-first walk. Calls itself
    auto walk = [&](const token_t &token, auto subcall) -> void
    {
        for (auto swap: snapshot->swaps_from(token))
        {
            if (already_in_path(swap->pool))
            {
                continue;
            }
            candidate[path_len++] = swap;
            if (swap->tokenDest == start_token)
            {
                if (path_len >= min_hops)
                {
                    emit();
                }
            }
            else if (path_len < max_hops)
            {
                subcall(swap->tokenDest, subcall);
            }
            path_len--;
        }
    };

    try
    {
        walk(start_token, walk);
    }
    catch (LimitReached &)
    {
        log_trace("route count limit reached (%1%)", max_count);
    }

    log_debug("found %1% routes circular against token %2%", count, start_token);
    return count;
}


} // namespace pathfinder
} // namespace solarb
