#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief lets other greenthreads run before this one
 * continues.
 *
 * @desc Put one in every polling loop.
 * Anything shared with other greenthreads may have
 * changed by the time this completes.
 */
Ev::Io<void> yield();

}

#endif /* !defined(EV_YIELD_HPP) */
