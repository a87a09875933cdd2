/**
 * @file solarb_amm_estimation.hpp
 * @brief AMM (Automated Market Maker) estimator engine
 *
 * Two forms of computations are provided, to match the x*y=k pool model.
 *
 * - "How much tokenB would I get if I sent X amount of tokenA to swap?" is answered by amm_output()
 * - "How much tokenA do I need to swap in order to get X amount of tokenB?" is answered by amm_input_for_exact_output()
 *
 * All integer math runs on widened intermediates. Floating point is only
 * used by the display/risk helpers price_impact() and slippage().
 */

#pragma once

#include "solarb_types.hpp"
#include <stdexcept>

namespace solarb {
namespace model {
namespace amm {


typedef enum {
    SWAP_INVALID_RESERVES,        ///< zero reserve, implausible data or fee out of range
    SWAP_INSUFFICIENT_LIQUIDITY,  ///< the trade would drain (or exceed) the output reserve
} swap_error_e;

const char *swap_error_name(swap_error_e kind);

struct swap_error: std::runtime_error
{
    swap_error(swap_error_e kind_, const std::string &msg)
        : std::runtime_error(msg)
        , kind(kind_)
    {}

    const swap_error_e kind;
};


/**
 * @brief output amount of a constant product swap, fee deducted from the input
 *
 * amount_in_after_fee = amount_in * (10000 - fee_bps) / 10000
 * amount_out = reserve_out * amount_in_after_fee / (reserve_in + amount_in_after_fee)
 *
 * @return 0 if @p amount_in is 0
 * @throws swap_error SWAP_INVALID_RESERVES if any reserve is 0 or fee_bps > 10000
 * @throws swap_error SWAP_INSUFFICIENT_LIQUIDITY if the result would be >= reserve_out
 */
amount_t amm_output(amount_t reserve_in
                    , amount_t reserve_out
                    , amount_t amount_in
                    , unsigned fee_bps);

/**
 * @brief input amount required to receive exactly @p amount_out
 *
 * Inverse of amm_output(). Both divisions round up, so that
 * amm_output(amm_input_for_exact_output(x)) >= x
 *
 * @throws swap_error SWAP_INSUFFICIENT_LIQUIDITY if amount_out >= reserve_out, or fee_bps == 10000
 * @throws swap_error SWAP_INVALID_RESERVES if any reserve is 0, fee_bps > 10000,
 *         or the required input does not fit an amount_t
 */
amount_t amm_input_for_exact_output(amount_t reserve_in
                                    , amount_t reserve_out
                                    , amount_t amount_out
                                    , unsigned fee_bps);

/**
 * @brief percent change of the effective rate vs the spot rate, caused by the trade
 *
 * Display and risk scoring only. Includes the fee.
 */
double price_impact(amount_t reserve_in
                    , amount_t reserve_out
                    , amount_t amount_in
                    , unsigned fee_bps);

/**
 * @brief percent shortfall of the curve output vs a linear-price expectation
 *
 * Always >= 0.
 */
double slippage(amount_t reserve_in
                , amount_t reserve_out
                , amount_t amount_in
                , unsigned fee_bps);


/**
 * @defgroup pool_dispatch swap formulas selected by PoolKind
 * @{
 */
amount_t swap_output(const PoolReserves &pool, amount_t amount_in);
amount_t swap_input_for_output(const PoolReserves &pool, amount_t amount_out);
double swap_price_impact(const PoolReserves &pool, amount_t amount_in);
double swap_slippage(const PoolReserves &pool, amount_t amount_in);
/** @} */


} // namespace amm
} // namespace model
} // namespace solarb
