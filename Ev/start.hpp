#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the given action on the default libev loop
 * until the action completes.
 *
 * @return the integer the action yields, or 254 if
 * the action failed with an exception, or 255 if
 * libev could not be initialized.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
