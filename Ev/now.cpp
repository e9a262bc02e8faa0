#include"Ev/now.hpp"
#include<ev.h>

namespace Ev {

double now() {
	/* Wall-clock time, not the cached loop time, since
	 * log lines are also written outside the loop.  */
	return ev_time();
}

}
