#include"Ev/Io.hpp"
#include"Rescue/log.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>

namespace Rescue {

Ev::Io<void> log(Logger& logger, LogLevel l, const char *fmt, ...) {
	if (!logger.enabled(l))
		return Ev::lift();

	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return Ev::Io<void>([&logger, l, msg]( std::function<void()> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
		logger.write(l, msg);
		pass();
	});
}

}
