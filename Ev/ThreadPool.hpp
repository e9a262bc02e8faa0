#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include<cstddef>
#include<functional>
#include<memory>
#include"Ev/Io.hpp"

namespace Ev {

/** class Ev::ThreadPool
 *
 * @brief runs blocking work off the main loop.
 *
 * @desc Disk access (the recovery state file, the
 * backup file) and key stretching block, so they run
 * in a worker thread while the calling greenthread is
 * suspended.
 * The result, or the exception thrown, is delivered
 * back on the main loop.
 *
 * Functions given to `background` must not touch
 * anything owned by the main loop, including the log.
 * Worker threads have all signals blocked.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* The job runs in a worker thread and returns the
	 * completion, which runs on the main loop.  */
	typedef std::function<std::function<void()>()> Job;
	void submit(Job);

public:
	explicit
	ThreadPool(std::size_t num_threads = 2);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		auto f = std::make_shared<std::function<a()>>(std::move(func));
		return Ev::Io<a>([ f
				 , this
				 ]( std::function<void(a)> pass
				  , std::function<void(std::exception_ptr)> fail
				  ) {
			submit([f, pass, fail]() -> std::function<void()> {
				try {
					auto res = std::make_shared<a>((*f)());
					return [pass, res]() {
						pass(std::move(*res));
					};
				} catch (...) {
					auto e = std::current_exception();
					return [fail, e]() { fail(e); };
				}
			});
		});
	}
	Ev::Io<void> background(std::function<void()> func);
};

}

#endif /* EV_THREADPOOL_HPP */
