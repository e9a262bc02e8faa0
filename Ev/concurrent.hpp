#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief starts the given action as a separate
 * greenthread and completes at once.
 *
 * @desc The new greenthread first runs when the
 * current one yields.
 * It must handle its own exceptions; any that escape
 * are reported on stderr and otherwise dropped.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* EV_CONCURRENT_HPP */
