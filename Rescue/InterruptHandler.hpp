#ifndef RESCUE_INTERRUPTHANDLER_HPP
#define RESCUE_INTERRUPTHANDLER_HPP

#include<functional>
#include<memory>

namespace Rescue {

/** class Rescue::InterruptHandler
 *
 * @brief calls the given function, from the main
 * loop, on the first SIGINT or SIGTERM.
 *
 * @desc After that the default signal handling is
 * back, so a second Ctrl-C kills the program.
 */
class InterruptHandler {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	InterruptHandler() =delete;
	explicit
	InterruptHandler(std::function<void(int)> on_interrupt);
	~InterruptHandler();
	InterruptHandler(InterruptHandler const&) =delete;
	InterruptHandler(InterruptHandler&&) =delete;
};

}

#endif /* !defined(RESCUE_INTERRUPTHANDLER_HPP) */
