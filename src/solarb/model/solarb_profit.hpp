/**
 * @file solarb_profit.hpp
 * @brief Profitability decision of an evaluated route
 *
 * This is the single gate deciding whether an arbitrage attempt is worth it.
 * Pure integer math, saturating, no floating point involved.
 */

#pragma once

#include "solarb_types.hpp"
#include "solarb_fees.hpp"
#include <stdexcept>

namespace solarb {
namespace model {
namespace profit {


/**
 * @brief zero amount_in reached the profitability formula
 *
 * This is a programming defect: upstream code must never build
 * a zero-amount trade.
 */
struct division_by_zero_error: std::logic_error
{
    using std::logic_error::logic_error;
};


typedef enum {
    VERDICT_PROFITABLE,       ///< net profit > 0 and at or above the threshold
    VERDICT_BELOW_THRESHOLD,  ///< net profit > 0, but under min_profit_bps
    VERDICT_NOT_PROFITABLE,   ///< costs (or the swap curve) eat all the gain
} verdict_e;

const char *verdict_name(verdict_e v);


struct ProfitabilityVerdict
{
    amount_t gross_profit = 0;
    amount_t net_profit = 0;
    amount_t net_profit_bps = 0;
    bool profitable = false;
    verdict_e verdict = VERDICT_NOT_PROFITABLE;
};

std::ostream& operator<< (std::ostream& stream, const ProfitabilityVerdict& o);


/**
 * @brief profitability of trading @p amount_in into @p gross_amount_out
 *
 *  gross_profit = max(0, gross_amount_out - amount_in)
 *  net_profit = max(0, gross_profit - total_cost)
 *  net_profit_bps = net_profit * 10000 / amount_in
 *  profitable = net_profit > 0 && net_profit_bps >= min_profit_bps
 *
 * @throws division_by_zero_error if @p amount_in is 0
 */
ProfitabilityVerdict assess_profitability(amount_t amount_in
                                          , amount_t gross_amount_out
                                          , const fees::CostBreakdown &costs
                                          , amount_t min_profit_bps);

/**
 * @brief amount_t subtraction, clamped at 0
 */
inline amount_t saturating_sub(amount_t a, amount_t b) noexcept
{
    return a > b ? a - b : 0;
}


} // namespace profit
} // namespace model
} // namespace solarb
