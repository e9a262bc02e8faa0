#ifndef RESCUE_LOG_HPP
#define RESCUE_LOG_HPP

#include"Rescue/Logger.hpp"

namespace Ev { template<typename a> class Io; }

namespace Rescue {

/* The message is formatted at the call; it is written
 * when the returned action is executed.  */
Ev::Io<void> log(Logger& logger, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* RESCUE_LOG_HPP */
