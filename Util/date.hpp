#ifndef UTIL_DATE_HPP
#define UTIL_DATE_HPP

#include<string>

namespace Util {

/** Util::date
 *
 * @brief Returns an ISO 8601 representation of the
 * given Unix Epoch time, in UTC with milliseconds,
 * e.g. `2024-05-01T13:45:07.250Z`.
 */
std::string date(double epoch);

}

#endif
