#ifndef EV_DETAIL_ON_IDLE_HPP
#define EV_DETAIL_ON_IDLE_HPP

#include<functional>

namespace Ev { namespace Detail {

/* Runs the function once, the next time the default
 * loop has nothing else to do.
 * The function must not throw.  */
void on_idle(std::function<void()> f);

}}

#endif /* !defined(EV_DETAIL_ON_IDLE_HPP) */
