#pragma GCC diagnostic ignored "-Wdeprecated-declarations" // Silencing GCC nagging about std::auto_ptr somewhere in boost legacy snippets

#include <boost/python.hpp>
#include <boost/python/suite/indexing/vector_indexing_suite.hpp>
#include <boost/python/suite/indexing/map_indexing_suite.hpp>
#include "solarb_model.hpp"
#include "solarb_amm_estimation.hpp"
#include "solarb_constraints.hpp"
#include "solarb_profit.hpp"
#include "../pathfinder/routes.hpp"
#include "../pathfinder/finder_routes.hpp"
#include "../scanner/opportunity_scanner.hpp"
#include "../commons/solarb_log.hpp"
#include <chrono>
#include <sstream>



using namespace boost::python;
using namespace solarb::model;
using namespace solarb::pathfinder;
using namespace solarb::scanner;


namespace {


/**
 * @brief releases the GIL for the lifetime of the object
 *
 * Scans may run on worker threads, which reach back into
 * Python through the log sink.
 */
struct gil_released
{
    gil_released() : m_state(PyEval_SaveThread()) {}
    ~gil_released() { PyEval_RestoreThread(m_state); }
    gil_released(const gil_released &) = delete;
    gil_released &operator=(const gil_released &) = delete;
private:
    PyThreadState *m_state;
};


// the Python log sink. Purposefully leaked: it must outlive
// the C++ static destructors, which run after interpreter shutdown.
object *m_py_log_sink = new object();

void m_py_log_dispatch(log_level lvl, const char *msg)
{
    PyGILState_STATE gstate = PyGILState_Ensure();
    try {
        (*m_py_log_sink)(lvl, msg);
    } catch (const error_already_set &) {
        // a broken sink must not leak into the C++ core.
        // Print what happened and clear the Python error indicator.
        PyErr_Print();
    }
    PyGILState_Release(gstate);
}

void py_log_register_sink(object cb)
{
    if (cb.is_none())
    {
        log_register_sink(log_sink_t());
        *m_py_log_sink = object();
        return;
    }
    *m_py_log_sink = cb;
    log_register_sink(&m_py_log_dispatch);
}


void translate_swap_error(const amm::swap_error &e)
{
    PyErr_SetString(PyExc_ValueError
                    , strfmt("%1%: %2%", amm::swap_error_name(e.kind), e.what()).c_str());
}

void translate_route_error(const RouteConsistencyError &e)
{
    PyErr_SetString(PyExc_ValueError
                    , strfmt("%1%: %2%", route_error_name(e.kind), e.what()).c_str());
}

void translate_constraint_error(const ConstraintConsistencyError &e)
{
    PyErr_SetString(PyExc_ValueError, e.what());
}

void translate_division_by_zero(const profit::division_by_zero_error &e)
{
    PyErr_SetString(PyExc_ZeroDivisionError, e.what());
}


ScanReport py_scan(const PoolSnapshot &snapshot
                   , const ScanConstraints &constraints
                   , unsigned timeout_ms)
{
    ScanContext ctx;
    ctx.snapshot = &snapshot;
    ctx.constraints = constraints;
    if (timeout_ms > 0)
    {
        ctx.set_timeout(std::chrono::milliseconds(timeout_ms));
    }
    gil_released nogil;
    return scan_opportunities(ctx);
}

ScanReport py_scan_routes(const std::vector<Route> &routes
                          , const ScanConstraints &constraints
                          , unsigned timeout_ms)
{
    ScanContext ctx;
    ctx.routes = routes;
    ctx.constraints = constraints;
    if (timeout_ms > 0)
    {
        ctx.set_timeout(std::chrono::milliseconds(timeout_ms));
    }
    gil_released nogil;
    return scan_opportunities(ctx);
}

std::vector<Route> py_find_routes(const PoolSnapshot &snapshot
                                  , const token_t &start_token
                                  , unsigned min_hops
                                  , unsigned max_hops)
{
    std::vector<Route> res;
    Finder(&snapshot).find_all_routes([&](const Route &r) { res.emplace_back(r); }
                                      , start_token, min_hops, max_hops);
    return res;
}

double py_opportunity_timestamp(const Opportunity &o)
{
    using namespace std::chrono;
    return duration_cast<duration<double>>(o.timestamp.time_since_epoch()).count();
}

fees::CostBreakdown py_total_arbitrage_costs(amount_t trade_amount
                                             , const Route &route
                                             , const fees::CostParameters &params)
{
    return fees::total_arbitrage_costs(trade_amount, route, params);
}

RouteResult py_evaluate_route_max_yield(const Route &route
                                        , amount_t amount_min
                                        , amount_t amount_max
                                        , const fees::CostParameters &params)
{
    return evaluate_route_max_yield(route, amount_min, amount_max, params);
}

void py_validate_route(const Route &route, unsigned max_same_token_repeats)
{
    validate_route(route, max_same_token_repeats);
}

std::string py_repr_hop(const Hop &o)
{
    std::stringstream ss;
    ss << o;
    return ss.str();
}

std::string py_repr_route(const Route &o)
{
    std::stringstream ss;
    ss << o;
    return ss.str();
}

} // namespace


/**
 * @brief Export C++ model to Python.
 *
 * This is what is seen by "import" of this CPython extension.
 */
BOOST_PYTHON_MODULE(solarb_model_ext)
{
    using dont_make_copies = boost::noncopyable;
    using dont_manage_returned_pointer = return_internal_reference<>;

    register_exception_translator<amm::swap_error>(&translate_swap_error);
    register_exception_translator<RouteConsistencyError>(&translate_route_error);
    register_exception_translator<ConstraintConsistencyError>(&translate_constraint_error);
    register_exception_translator<profit::division_by_zero_error>(&translate_division_by_zero);

    class_<std::vector<amount_t>>("AmountList")
            .def(vector_indexing_suite<std::vector<amount_t>, true>());
    class_<std::vector<std::string>>("StringList")
            .def(vector_indexing_suite<std::vector<std::string>, true>());
    class_<std::map<token_t, amount_t>>("TradeAmounts")
            .def(map_indexing_suite<std::map<token_t, amount_t>, true>());

    enum_<PoolKind>("PoolKind")
            .value("constant_product", POOL_CONSTANT_PRODUCT)
            ;

    class_<PoolReserves>("PoolReserves", init<amount_t, amount_t, unsigned, optional<PoolKind>>())
            .def_readwrite("reserve_in" , &PoolReserves::reserve_in)
            .def_readwrite("reserve_out", &PoolReserves::reserve_out)
            .def_readwrite("fee_bps"    , &PoolReserves::fee_bps)
            .def_readwrite("kind"       , &PoolReserves::kind)
            .def("usable"               , &PoolReserves::usable)
            .def("reversed"             , &PoolReserves::reversed)
            ;

    class_<Hop>("Hop", init<const token_t &, const token_t &, const PoolReserves &
                            , optional<const std::string &, const std::string &>>())
            .def_readwrite("from_token"  , &Hop::from_token)
            .def_readwrite("to_token"    , &Hop::to_token)
            .def_readwrite("pool"        , &Hop::pool)
            .def_readwrite("dex_name"    , &Hop::dex_name)
            .def_readwrite("pool_address", &Hop::pool_address)
            .def("__repr__"              , &py_repr_hop)
            ;

    class_<Route>("Route")
            .def(vector_indexing_suite<Route>())
            .def("id"                   , &Route::id)
            .def("initial_token"        , &Route::initial_token, return_value_policy<copy_const_reference>())
            .def("final_token"          , &Route::final_token  , return_value_policy<copy_const_reference>())
            .def("is_closed"            , &Route::is_closed)
            .def("is_cross_exchange"    , &Route::is_cross_exchange)
            .def("print_addr"           , &Route::print_addr)
            .def("get_symbols"          , &Route::get_symbols)
            .def("__repr__"             , &py_repr_route)
            ;
    class_<std::vector<Route>>("RouteList")
            .def(vector_indexing_suite<std::vector<Route>>());

    class_<PoolRecord>("PoolRecord")
            .def_readwrite("pool_address", &PoolRecord::pool_address)
            .def_readwrite("token_a"     , &PoolRecord::token_a)
            .def_readwrite("token_b"     , &PoolRecord::token_b)
            .def_readwrite("reserve_a"   , &PoolRecord::reserve_a)
            .def_readwrite("reserve_b"   , &PoolRecord::reserve_b)
            .def_readwrite("fee_bps"     , &PoolRecord::fee_bps)
            .def_readwrite("dex_name"    , &PoolRecord::dex_name)
            .def_readwrite("kind"        , &PoolRecord::kind)
            ;

    class_<PoolEntry, dont_make_copies>("PoolEntry", no_init)
            .def_readonly("tag"        , &PoolEntry::tag)
            .def_readonly("address"    , &PoolEntry::address)
            .def_readonly("token_a"    , &PoolEntry::token_a)
            .def_readonly("token_b"    , &PoolEntry::token_b)
            .def_readonly("reserve_a"  , &PoolEntry::reserve_a)
            .def_readonly("reserve_b"  , &PoolEntry::reserve_b)
            .def_readonly("dex_name"   , &PoolEntry::dex_name)
            .def("feesBPS"             , &PoolEntry::feesBPS)
            .def("hop_from"            , &PoolEntry::hop_from)
            .def("get_name"            , &PoolEntry::get_name)
            ;
    register_ptr_to_python<const PoolEntry*>();

    class_<std::vector<const PoolEntry*>>("PoolEntries")
            .def(vector_indexing_suite<std::vector<const PoolEntry*>>());

    class_<DirectedSwap, dont_make_copies>("DirectedSwap", no_init)
            .def_readonly("tokenSrc" , &DirectedSwap::tokenSrc)
            .def_readonly("tokenDest", &DirectedSwap::tokenDest)
            .add_property("pool"     , make_getter(&DirectedSwap::pool, dont_manage_returned_pointer()))
            .def("hop"               , &DirectedSwap::hop)
            ;
    register_ptr_to_python<const DirectedSwap*>();

    class_<std::vector<const DirectedSwap*>>("DirectedSwaps")
            .def(vector_indexing_suite<std::vector<const DirectedSwap*>>());

    const PoolEntry *(PoolSnapshot::*add_pool_record)(const PoolRecord &) = &PoolSnapshot::add_pool;
    const PoolEntry *(PoolSnapshot::*add_pool_fields)(const std::string &, const token_t &, const token_t &
                                                      , amount_t, amount_t, int, const std::string &) = &PoolSnapshot::add_pool;

    class_<PoolSnapshot, dont_make_copies>("PoolSnapshot")
            .def("set_dex_fee"     , &PoolSnapshot::set_dex_fee)
            .def("dex_fee"         , &PoolSnapshot::dex_fee)
            .def("add_pool"        , add_pool_record, dont_manage_returned_pointer())
            .def("add_pool"        , add_pool_fields, dont_manage_returned_pointer())
            .def("lookup_pool"     , static_cast<const PoolEntry *(PoolSnapshot::*)(const std::string &) const>(&PoolSnapshot::lookup_pool), dont_manage_returned_pointer())
            .def("lookup_pool"     , static_cast<const PoolEntry *(PoolSnapshot::*)(datatag_t) const>(&PoolSnapshot::lookup_pool)         , dont_manage_returned_pointer())
            .def("has_pool"        , &PoolSnapshot::has_pool)
            .def("has_token"       , &PoolSnapshot::has_token)
            .def("swaps_from"      , &PoolSnapshot::swaps_from, with_custodian_and_ward_postcall<0, 1>())
            .def("swaps_to"        , &PoolSnapshot::swaps_to  , with_custodian_and_ward_postcall<0, 1>())
            .def("lookup_swap"     , &PoolSnapshot::lookup_swap, with_custodian_and_ward_postcall<0, 1>())
            .def("pools"           , &PoolSnapshot::pools     , with_custodian_and_ward_postcall<0, 1>())
            .def("tokens"          , &PoolSnapshot::tokens)
            .def("pools_count"     , &PoolSnapshot::pools_count)
            .def("tokens_count"    , &PoolSnapshot::tokens_count)
            .def("swaps_count"     , &PoolSnapshot::swaps_count)
            ;

    class_<fees::CostParameters>("CostParameters")
            .def_readwrite("network_base_fee" , &fees::CostParameters::network_base_fee)
            .def_readwrite("priority_fee"     , &fees::CostParameters::priority_fee)
            .def_readwrite("safety_margin_pct", &fees::CostParameters::safety_margin_pct)
            ;

    class_<fees::CostBreakdown>("CostBreakdown")
            .def_readonly("network_base_fee" , &fees::CostBreakdown::network_base_fee)
            .def_readonly("priority_fee"     , &fees::CostBreakdown::priority_fee)
            .def_readonly("dex_fees_total"   , &fees::CostBreakdown::dex_fees_total)
            .def_readonly("slippage_cost"    , &fees::CostBreakdown::slippage_cost)
            .def_readonly("price_impact_cost", &fees::CostBreakdown::price_impact_cost)
            .def_readonly("safety_margin"    , &fees::CostBreakdown::safety_margin)
            .def_readonly("total_cost"       , &fees::CostBreakdown::total_cost)
            .def("infos"                     , &fees::CostBreakdown::infos)
            ;

    enum_<profit::verdict_e>("Verdict")
            .value("profitable"     , profit::VERDICT_PROFITABLE)
            .value("below_threshold", profit::VERDICT_BELOW_THRESHOLD)
            .value("not_profitable" , profit::VERDICT_NOT_PROFITABLE)
            ;

    class_<profit::ProfitabilityVerdict>("ProfitabilityVerdict")
            .def_readonly("gross_profit"  , &profit::ProfitabilityVerdict::gross_profit)
            .def_readonly("net_profit"    , &profit::ProfitabilityVerdict::net_profit)
            .def_readonly("net_profit_bps", &profit::ProfitabilityVerdict::net_profit_bps)
            .def_readonly("profitable"    , &profit::ProfitabilityVerdict::profitable)
            .def_readonly("verdict"       , &profit::ProfitabilityVerdict::verdict)
            ;

    enum_<eval_error_e>("EvalError")
            .value("ok"                    , EVAL_OK)
            .value("invalid_reserves"      , EVAL_INVALID_RESERVES)
            .value("insufficient_liquidity", EVAL_INSUFFICIENT_LIQUIDITY)
            ;

    enum_<route_error_e>("RouteError")
            .value("ok"          , ROUTE_OK)
            .value("too_short"   , ROUTE_TOO_SHORT)
            .value("too_long"    , ROUTE_TOO_LONG)
            .value("circular"    , ROUTE_CIRCULAR)
            .value("disconnected", ROUTE_DISCONNECTED)
            ;

    class_<RouteResult>("RouteResult")
            .def_readonly("amount_in"       , &RouteResult::amount_in)
            .def_readonly("per_hop_outputs" , &RouteResult::per_hop_outputs)
            .def_readonly("final_amount_out", &RouteResult::final_amount_out)
            .def_readonly("failed"          , &RouteResult::failed)
            .def_readonly("error"           , &RouteResult::error)
            .def_readonly("failed_hop"      , &RouteResult::failed_hop)
            .def_readonly("error_message"   , &RouteResult::error_message)
            .def("amount_before_hop"        , &RouteResult::amount_before_hop)
            .def("yield_ratio"              , &RouteResult::yield_ratio)
            .def("infos"                    , &RouteResult::infos)
            ;

    class_<ScanConstraints>("ScanConstraints")
            .def_readwrite("min_profit_bps"         , &ScanConstraints::min_profit_bps)
            .def_readwrite("max_same_token_repeats" , &ScanConstraints::max_same_token_repeats)
            .def_readwrite("min_hops"               , &ScanConstraints::min_hops)
            .def_readwrite("max_hops"               , &ScanConstraints::max_hops)
            .def_readwrite("costs"                  , &ScanConstraints::costs)
            .def_readwrite("default_trade_amount"   , &ScanConstraints::default_trade_amount)
            .def_readwrite("trade_amounts"          , &ScanConstraints::trade_amounts)
            .def_readwrite("start_tokens"           , &ScanConstraints::start_tokens)
            .def_readwrite("max_lp_reserves_stress" , &ScanConstraints::max_lp_reserves_stress)
            .def_readwrite("optimize_amount"        , &ScanConstraints::optimize_amount)
            .def_readwrite("trade_amount_min"       , &ScanConstraints::trade_amount_min)
            .def_readwrite("trade_amount_max"       , &ScanConstraints::trade_amount_max)
            .def_readwrite("match_limit"            , &ScanConstraints::match_limit)
            .def_readwrite("limit"                  , &ScanConstraints::limit)
            .def_readwrite("threads"                , &ScanConstraints::threads)
            .def("trade_amount_for"                 , &ScanConstraints::trade_amount_for)
            .def("check_consistency"                , &ScanConstraints::check_consistency)
            ;

    class_<Opportunity>("Opportunity")
            .def_readonly("route"           , &Opportunity::route)
            .def_readonly("route_id"        , &Opportunity::route_id)
            .def_readonly("buy_dex"         , &Opportunity::buy_dex)
            .def_readonly("sell_dex"        , &Opportunity::sell_dex)
            .def_readonly("buy_price"       , &Opportunity::buy_price)
            .def_readonly("sell_price"      , &Opportunity::sell_price)
            .def_readonly("amount_in"       , &Opportunity::amount_in)
            .def_readonly("gross_amount_out", &Opportunity::gross_amount_out)
            .def_readonly("gross_profit"    , &Opportunity::gross_profit)
            .def_readonly("total_cost"      , &Opportunity::total_cost)
            .def_readonly("net_profit"      , &Opportunity::net_profit)
            .def_readonly("net_profit_bps"  , &Opportunity::net_profit_bps)
            .def_readonly("profitable"      , &Opportunity::profitable)
            .def_readonly("verdict"         , &Opportunity::verdict)
            .def_readonly("per_hop_outputs" , &Opportunity::per_hop_outputs)
            .def_readonly("confidence_score", &Opportunity::confidence_score)
            .add_property("timestamp"       , &py_opportunity_timestamp)
            .def("describe"                 , &Opportunity::describe)
            ;
    class_<OpportunityList>("OpportunityList")
            .def(vector_indexing_suite<OpportunityList>());

    class_<ScanReport>("ScanReport")
            .def_readonly("opportunities"     , &ScanReport::opportunities)
            .def_readonly("candidates"        , &ScanReport::candidates)
            .def_readonly("rejected_by_guard" , &ScanReport::rejected_by_guard)
            .def_readonly("skipped_no_amount" , &ScanReport::skipped_no_amount)
            .def_readonly("failed_evaluation" , &ScanReport::failed_evaluation)
            .def_readonly("rejected_by_stress", &ScanReport::rejected_by_stress)
            .def_readonly("unprofitable"      , &ScanReport::unprofitable)
            .def_readonly("evaluated"         , &ScanReport::evaluated)
            .def_readonly("deadline_hit"      , &ScanReport::deadline_hit)
            .def_readonly("config_error"      , &ScanReport::config_error)
            .def_readonly("diagnostics"       , &ScanReport::diagnostics)
            .def("summary"                    , &ScanReport::summary)
            ;

    def("amm_output"                , &amm::amm_output);
    def("amm_input_for_exact_output", &amm::amm_input_for_exact_output);
    def("price_impact"              , &amm::price_impact);
    def("slippage"                  , &amm::slippage);
    def("total_arbitrage_costs"     , &py_total_arbitrage_costs);
    def("assess_profitability"      , &profit::assess_profitability);
    def("check_route"               , &check_route);
    def("validate_route"            , &py_validate_route);
    def("evaluate_route"            , &evaluate_route);
    def("evaluate_route_max_yield"  , &py_evaluate_route_max_yield);
    def("find_routes"               , &py_find_routes);
    def("scan"                      , &py_scan, (arg("snapshot"), arg("constraints"), arg("timeout_ms")=0));
    def("scan_routes"               , &py_scan_routes, (arg("routes"), arg("constraints"), arg("timeout_ms")=0));

    enum_<log_level>("log_level")
            .value("trace"  , log_level_trace  )
            .value("debug"  , log_level_debug  )
            .value("info"   , log_level_info   )
            .value("warning", log_level_warning)
            .value("error"  , log_level_error  )
            .export_values()
            ;
    def("log_get_level", log_get_level);
    def("log_set_level", log_set_level);
    def("log_register_sink", py_log_register_sink);
}
