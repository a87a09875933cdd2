#include "solarb_constraints.hpp"

namespace solarb {
namespace model {


amount_t ScanConstraints::trade_amount_for(const token_t &token) const
{
    auto i = trade_amounts.find(token);
    if (i != trade_amounts.end() && i->second > 0)
    {
        return i->second;
    }
    return default_trade_amount;
}


#define m_raise(...) throw ConstraintConsistencyError(strfmt(__VA_ARGS__))

void ScanConstraints::check_consistency() const
{
    if (min_profit_bps < 0)
    {
        m_raise("min_profit_bps not set (%1%)", min_profit_bps);
    }
    if (max_same_token_repeats < 1)
    {
        m_raise("max_same_token_repeats must be at least 1");
    }
    if (min_hops < 2 || max_hops > 4 || min_hops > max_hops)
    {
        m_raise("hop range [%1%, %2%] out of the allowed [2, 4]", min_hops, max_hops);
    }
    if (!(costs.safety_margin_pct >= 0))
    {
        m_raise("safety_margin_pct can't be negative (%1%)", costs.safety_margin_pct);
    }
    if (!(max_lp_reserves_stress >= 0))
    {
        m_raise("max_lp_reserves_stress can't be negative (%1%)", max_lp_reserves_stress);
    }
    if (threads < 1)
    {
        m_raise("threads must be at least 1");
    }
    if (optimize_amount)
    {
        if (trade_amount_min == 0 || trade_amount_max < trade_amount_min)
        {
            m_raise("bad trade amount search range [%1%, %2%]", trade_amount_min, trade_amount_max);
        }
        return;
    }
    bool any_amount = default_trade_amount > 0;
    for (auto &i: trade_amounts)
    {
        any_amount = any_amount || i.second > 0;
    }
    if (!any_amount)
    {
        m_raise("no trade amount configured");
    }
}

#undef m_raise


} // namespace model
} // namespace solarb
