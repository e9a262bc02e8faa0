#ifndef RESCUE_PERIODICTASK_HPP
#define RESCUE_PERIODICTASK_HPP

#include<functional>
#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Rescue { class Logger; }
namespace Rescue { class StopHandle; }

namespace Rescue {

/** class Rescue::PeriodicTask
 *
 * @brief runs an action again and again, sleeping
 * between runs, until the stop handle is stopped.
 *
 * @desc Exceptions from the action are logged and
 * the action is simply run again at the next tick.
 * The stop handle is checked before each run and
 * after each run, so an action that is in flight when
 * stop is raised completes, but is not run again.
 */
class PeriodicTask {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	PeriodicTask() =delete;
	PeriodicTask( Logger& logger
		    , StopHandle& stop
		    , std::string name
		    , double interval
		    , std::function<Ev::Io<void>()> action
		    );
	PeriodicTask(PeriodicTask&&);
	~PeriodicTask();

	/* Starts the loop in a new greenthread.  Only
	 * the first call has any effect.  */
	Ev::Io<void> launch();
	/* Completes once the loop has exited, or at once
	 * if it never launched.  */
	Ev::Io<void> join();

	bool is_running() const;
	/* Completed runs, failed or not.  */
	std::size_t iterations() const;
	std::string const& name() const;
};

}

#endif /* !defined(RESCUE_PERIODICTASK_HPP) */
