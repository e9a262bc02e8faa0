#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"Rescue/PeriodicTask.hpp"
#include"Rescue/StopHandle.hpp"
#include"Rescue/log.hpp"
#include<stdexcept>
#include<vector>

namespace Rescue {

class PeriodicTask::Impl {
public:
	Logger& logger;
	StopHandle& stop;
	std::string name;
	double interval;
	std::function<Ev::Io<void>()> action;

	bool launched;
	bool running;
	std::size_t iterations;
	std::vector<std::function<void()>> joiners;

	Impl( Logger& logger_
	    , StopHandle& stop_
	    , std::string name_
	    , double interval_
	    , std::function<Ev::Io<void>()> action_
	    ) : logger(logger_)
	      , stop(stop_)
	      , name(std::move(name_))
	      , interval(interval_)
	      , action(std::move(action_))
	      , launched(false)
	      , running(false)
	      , iterations(0)
	      { }

	Ev::Io<void> run_once() {
		return Ev::lift().then([this]() {
			return action();
		}).catching<std::exception>([this](std::exception const& e) {
			return Rescue::log( logger, Error
					  , "%s task failed: %s"
					  , name.c_str(), e.what()
					  );
		}).then([this]() {
			++iterations;
			return Ev::lift();
		});
	}

	Ev::Io<void> loop() {
		return Ev::yield().then([this]() {
			if (stop.is_stopped())
				return finish();
			return run_once().then([this]() {
				if (stop.is_stopped())
					return finish();
				return stop.sleep(interval).then([this]() {
					return loop();
				});
			});
		});
	}

	Ev::Io<void> finish() {
		return Rescue::log( logger, Debug
				  , "%s task stopped"
				  , name.c_str()
				  ).then([this]() {
			running = false;
			auto joiners_copy = std::move(joiners);
			joiners.clear();
			for (auto& j : joiners_copy)
				j();
			return Ev::lift();
		});
	}

	Ev::Io<void> launch() {
		return Ev::lift().then([this]() {
			if (launched)
				return Ev::lift();
			launched = true;
			running = true;
			return Ev::concurrent(loop());
		});
	}

	Ev::Io<void> join() {
		return Ev::Io<void>([this]( std::function<void()> pass
					  , std::function<void(std::exception_ptr)> fail
					  ) {
			if (!running)
				return pass();
			joiners.push_back(std::move(pass));
		});
	}
};

PeriodicTask::PeriodicTask( Logger& logger
			  , StopHandle& stop
			  , std::string name
			  , double interval
			  , std::function<Ev::Io<void>()> action
			  ) : pimpl(std::make_unique<Impl>( logger
							  , stop
							  , std::move(name)
							  , interval
							  , std::move(action)
							  ))
			    { }
PeriodicTask::PeriodicTask(PeriodicTask&&) =default;
PeriodicTask::~PeriodicTask() =default;

Ev::Io<void> PeriodicTask::launch() {
	return pimpl->launch();
}
Ev::Io<void> PeriodicTask::join() {
	return pimpl->join();
}
bool PeriodicTask::is_running() const {
	return pimpl->running;
}
std::size_t PeriodicTask::iterations() const {
	return pimpl->iterations;
}
std::string const& PeriodicTask::name() const {
	return pimpl->name;
}

}
