#include "solarb_profit.hpp"
#include "../commons/solarb_log.hpp"

namespace solarb {
namespace model {
namespace profit {


const char *verdict_name(verdict_e v)
{
    switch (v) {
    case VERDICT_PROFITABLE:      return "profitable";
    case VERDICT_BELOW_THRESHOLD: return "below threshold";
    case VERDICT_NOT_PROFITABLE:  return "not profitable";
    }
    return "?";
}

std::ostream& operator<< (std::ostream& stream, const ProfitabilityVerdict& o)
{
    stream << verdict_name(o.verdict)
           << " (gross " << o.gross_profit
           << ", net " << o.net_profit
           << ", " << o.net_profit_bps << "bps)";
    return stream;
}


ProfitabilityVerdict assess_profitability(amount_t amount_in
                                          , amount_t gross_amount_out
                                          , const fees::CostBreakdown &costs
                                          , amount_t min_profit_bps)
{
    if (amount_in == 0)
    {
        log_error("assess_profitability() called with a zero amount_in");
        throw division_by_zero_error("assess_profitability(): amount_in is 0");
    }

    ProfitabilityVerdict res;
    res.gross_profit = saturating_sub(gross_amount_out, amount_in);
    res.net_profit = saturating_sub(res.gross_profit, costs.total_cost);

    // net_profit < amount_out <= 2^64, times 10000 needs the wide type,
    // the quotient fits again
    const wide_amount_t bps = wide_amount_t(res.net_profit) * BPS_DENOMINATOR / amount_in;
    if (!narrow_amount(bps, res.net_profit_bps))
    {
        res.net_profit_bps = AMOUNT_MAX;
    }

    if (res.net_profit == 0)
    {
        res.verdict = VERDICT_NOT_PROFITABLE;
    }
    else if (res.net_profit_bps >= min_profit_bps)
    {
        res.verdict = VERDICT_PROFITABLE;
    }
    else
    {
        res.verdict = VERDICT_BELOW_THRESHOLD;
    }
    res.profitable = res.verdict == VERDICT_PROFITABLE;
    return res;
}


} // namespace profit
} // namespace model
} // namespace solarb
