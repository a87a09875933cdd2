#include "solarb_log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> m_current_level{log_level_info};

// guards sink replacement. Scans may log from worker threads
std::mutex m_sink_mutex;
log_sink_t m_sink;

void m_default_sink(log_level lvl, const char *msg)
{
    static std::mutex clog_mutex;
    std::lock_guard<std::mutex> lock(clog_mutex);
    std::clog << "[" << log_level_name(lvl) << "] " << msg << std::endl;
}

} // namespace


bool log_trigger(log_level lvl)
{
    return lvl >= m_current_level.load(std::memory_order_relaxed);
}

log_level log_get_level()
{
    return static_cast<log_level>(m_current_level.load());
}

void log_set_level(log_level lvl)
{
    switch (lvl) {
    case log_level_trace:
    case log_level_debug:
    case log_level_info:
    case log_level_warning:
    case log_level_error:
        m_current_level = lvl;
        break;
    default:
        break;
    }
}

const char *log_level_name(log_level lvl)
{
    switch (lvl) {
    case log_level_trace:   return "trace";
    case log_level_debug:   return "debug";
    case log_level_info:    return "info";
    case log_level_warning: return "warning";
    case log_level_error:   return "error";
    }
    return "?";
}


void log_register_sink(log_sink_t sink)
{
    std::lock_guard<std::mutex> lock(m_sink_mutex);
    m_sink = std::move(sink);
}


void log_emit_ll(log_level lvl, const std::string &msg)
{
    if (!log_trigger(lvl)) return;
    log_sink_t sink;
    {
        // the sink runs unlocked: it may need locks of its own (the GIL)
        std::lock_guard<std::mutex> lock(m_sink_mutex);
        sink = m_sink;
    }
    if (!sink)
    {
        m_default_sink(lvl, msg.c_str());
        return;
    }
    try {
        sink(lvl, msg.c_str());
    } catch (const std::exception &e) {
        std::clog << "[error] log sink failure: " << e.what() << std::endl;
    } catch (...) {
        std::clog << "[error] log sink failure: unknown exception" << std::endl;
    }
}
