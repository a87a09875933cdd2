#pragma once

#include <boost/format.hpp>
#include <cstdlib>
#include <cinttypes>
#include <utility>
#include <memory>
#include <string>

using std::string;


/**
 * @brief boost::format in a printf-like call
 *
 * strfmt("pool %1% has %2% reserves", addr, amount)
 */
template<typename ... Args>
std::string strfmt(const char *fmt, Args&& ... args)
{
    boost::format f(fmt);
    using expand = int[];
    (void)expand{0, ((void)(f % std::forward<Args>(args)), 0)...};
    return f.str();
}
