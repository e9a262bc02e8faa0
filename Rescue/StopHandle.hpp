#ifndef RESCUE_STOPHANDLE_HPP
#define RESCUE_STOPHANDLE_HPP

#include<memory>

namespace Ev { template<typename a> class Io; }

namespace Rescue {

/** class Rescue::StopHandle
 *
 * @brief one-way stop latch shared by the recovery
 * tasks and the main flow.
 *
 * @desc Once stopped it stays stopped.
 * Waiters and sleepers are resumed from inside the
 * `stop` call.
 */
class StopHandle {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	StopHandle();
	~StopHandle();
	StopHandle(StopHandle const&) =delete;
	StopHandle(StopHandle&&) =delete;

	/* Returns true only on the call that actually
	 * stopped.  */
	bool stop();
	bool is_stopped() const;

	/* Completes once stopped.  */
	Ev::Io<void> wait();
	/* Completes after the given number of seconds,
	 * or as soon as stopped, whichever is first.  */
	Ev::Io<void> sleep(double seconds);
};

}

#endif /* !defined(RESCUE_STOPHANDLE_HPP) */
