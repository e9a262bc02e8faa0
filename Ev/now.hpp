#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/* Wall-clock seconds since the epoch, with sub-second
 * precision; usable with or without a running loop.  */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
