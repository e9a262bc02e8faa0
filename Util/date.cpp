#include"Util/date.hpp"
#include<cstdint>
#include<inttypes.h>
#include<math.h>
#include<stdio.h>
#include<time.h>

namespace Util {

std::string date(double epoch) {
	auto seconds = time_t(floor(epoch));
	auto split = tm();

	(void) gmtime_r(&seconds, &split);

	char buffer[64];
	buffer[0] = '\0';
	(void) strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &split);

	auto subsecond = epoch - double(seconds);
	auto milliseconds = std::uint32_t(floor(subsecond * 1000));
	/* In case of roundoff error.  */
	if (milliseconds > 999)
		milliseconds = 999;

	char suffix[16];
	(void) snprintf( suffix, sizeof(suffix)
		       , ".%03" PRIu32 "Z", milliseconds
		       );

	return std::string(buffer) + suffix;
}

}
