#include "solarb_amm_estimation.hpp"
#include <cmath>

namespace solarb {
namespace model {
namespace amm {


/**
 * Our own AMM x*y=k implementation
 *
 * As specified by "Formal Specification of Constant Product
 * (x × y = k) Market Maker Model and Implementation"
 * (c) Yi Zhang, Xiaohong Chen, and Daejun Park
 *
 * Fees are expressed in basis points and taken from the input side,
 * which is what Raydium/Orca constant product pools do.
 */


const char *swap_error_name(swap_error_e kind)
{
    switch (kind) {
    case SWAP_INVALID_RESERVES:       return "InvalidReserves";
    case SWAP_INSUFFICIENT_LIQUIDITY: return "InsufficientLiquidity";
    }
    return "?";
}


static void m_check_pool(amount_t reserve_in
                         , amount_t reserve_out
                         , unsigned fee_bps)
{
    if (reserve_in == 0 || reserve_out == 0)
    {
        throw swap_error(SWAP_INVALID_RESERVES
                         , strfmt("zero reserves (%1%, %2%)", reserve_in, reserve_out));
    }
    if (fee_bps > BPS_DENOMINATOR)
    {
        throw swap_error(SWAP_INVALID_RESERVES
                         , strfmt("fee out of range: %1% bps", fee_bps));
    }
}


amount_t amm_output(amount_t reserve_in
                    , amount_t reserve_out
                    , amount_t amount_in
                    , unsigned fee_bps)
{
    m_check_pool(reserve_in, reserve_out, fee_bps);
    if (amount_in == 0)
    {
        return 0;
    }

    const wide_amount_t amountInWithFee =
            wide_amount_t(amount_in) * (BPS_DENOMINATOR - fee_bps) / BPS_DENOMINATOR;
    const wide_amount_t numerator = amountInWithFee * reserve_out;
    const wide_amount_t denominator = wide_amount_t(reserve_in) + amountInWithFee;
    const wide_amount_t amountOut = numerator / denominator;

    if (amountOut >= reserve_out)
    {
        // x*y=k can't get here with non-zero reserves. The check stays
        // as the single policy point: draining swaps are rejected, never capped.
        throw swap_error(SWAP_INSUFFICIENT_LIQUIDITY
                         , strfmt("swap of %1% would drain reserve %2%", amount_in, reserve_out));
    }
    return amountOut.convert_to<amount_t>();
}


amount_t amm_input_for_exact_output(amount_t reserve_in
                                    , amount_t reserve_out
                                    , amount_t amount_out
                                    , unsigned fee_bps)
{
    m_check_pool(reserve_in, reserve_out, fee_bps);
    if (amount_out == 0)
    {
        return 0;
    }
    if (amount_out >= reserve_out)
    {
        throw swap_error(SWAP_INSUFFICIENT_LIQUIDITY
                         , strfmt("requested %1% out of reserve %2%", amount_out, reserve_out));
    }
    if (fee_bps == BPS_DENOMINATOR)
    {
        throw swap_error(SWAP_INSUFFICIENT_LIQUIDITY, "100% fee pool can't output anything");
    }

    using bignum::uint256_t;

    const wide_amount_t numerator = wide_amount_t(reserve_in) * amount_out;
    const wide_amount_t denominator = wide_amount_t(reserve_out - amount_out);
    const wide_amount_t amountInBeforeFee = (numerator + denominator - 1) / denominator;

    // the gross-up multiplies a 128 bit value by 10000: go 256 bits here
    const uint256_t grossNum = uint256_t(amountInBeforeFee) * BPS_DENOMINATOR;
    const uint256_t grossDen = BPS_DENOMINATOR - fee_bps;
    const uint256_t amountIn = (grossNum + grossDen - 1) / grossDen;

    if (amountIn > uint256_t(AMOUNT_MAX))
    {
        throw swap_error(SWAP_INVALID_RESERVES
                         , strfmt("required input for %1% out does not fit 64 bits", amount_out));
    }
    return amountIn.convert_to<amount_t>();
}


double price_impact(amount_t reserve_in
                    , amount_t reserve_out
                    , amount_t amount_in
                    , unsigned fee_bps)
{
    m_check_pool(reserve_in, reserve_out, fee_bps);
    if (amount_in == 0)
    {
        return 0;
    }
    const double price_before = static_cast<double>(reserve_out) / static_cast<double>(reserve_in);
    const double effective_price =
            static_cast<double>(amm_output(reserve_in, reserve_out, amount_in, fee_bps))
            / static_cast<double>(amount_in);
    return std::fabs(price_before - effective_price) / price_before * 100.0;
}


double slippage(amount_t reserve_in
                , amount_t reserve_out
                , amount_t amount_in
                , unsigned fee_bps)
{
    m_check_pool(reserve_in, reserve_out, fee_bps);
    if (amount_in == 0)
    {
        return 0;
    }
    const double after_fee = static_cast<double>(amount_in)
            * (BPS_DENOMINATOR - fee_bps) / BPS_DENOMINATOR;
    const double expected = after_fee * static_cast<double>(reserve_out)
            / static_cast<double>(reserve_in);
    if (expected <= 0)
    {
        return 0;
    }
    const double actual = static_cast<double>(amm_output(reserve_in, reserve_out, amount_in, fee_bps));
    const double res = (expected - actual) / expected * 100.0;
    return res > 0 ? res : 0;
}


amount_t swap_output(const PoolReserves &pool, amount_t amount_in)
{
    switch (pool.kind) {
    case POOL_CONSTANT_PRODUCT:
        return amm_output(pool.reserve_in, pool.reserve_out, amount_in, pool.fee_bps);
    }
    throw swap_error(SWAP_INVALID_RESERVES, "unknown pool kind");
}

amount_t swap_input_for_output(const PoolReserves &pool, amount_t amount_out)
{
    switch (pool.kind) {
    case POOL_CONSTANT_PRODUCT:
        return amm_input_for_exact_output(pool.reserve_in, pool.reserve_out, amount_out, pool.fee_bps);
    }
    throw swap_error(SWAP_INVALID_RESERVES, "unknown pool kind");
}

double swap_price_impact(const PoolReserves &pool, amount_t amount_in)
{
    switch (pool.kind) {
    case POOL_CONSTANT_PRODUCT:
        return price_impact(pool.reserve_in, pool.reserve_out, amount_in, pool.fee_bps);
    }
    throw swap_error(SWAP_INVALID_RESERVES, "unknown pool kind");
}

double swap_slippage(const PoolReserves &pool, amount_t amount_in)
{
    switch (pool.kind) {
    case POOL_CONSTANT_PRODUCT:
        return slippage(pool.reserve_in, pool.reserve_out, amount_in, pool.fee_bps);
    }
    throw swap_error(SWAP_INVALID_RESERVES, "unknown pool kind");
}


} // namespace amm
} // namespace model
} // namespace solarb
