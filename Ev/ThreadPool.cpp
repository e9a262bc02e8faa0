#include"Ev/ThreadPool.hpp"
#include"Util/BacktraceException.hpp"
#include<condition_variable>
#include<deque>
#include<ev.h>
#include<mutex>
#include<signal.h>
#include<stdexcept>
#include<string.h>
#include<system_error>
#include<thread>
#include<vector>

namespace {

/* Blocks every signal in the current thread while
 * alive, so that threads started meanwhile inherit an
 * all-blocked mask.  */
class SigBlocker {
private:
	sigset_t old_set;
public:
	SigBlocker(SigBlocker&&) =delete;
	SigBlocker(SigBlocker const&) =delete;

	SigBlocker() {
		auto all = sigset_t();
		sigfillset(&all);
		pthread_sigmask(SIG_SETMASK, &all, &old_set);
	}
	~SigBlocker() {
		pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
	}
};

}

namespace Ev {

class ThreadPool::Impl {
private:
	struct ev_loop* loop;

	/* Main thread only.  */
	std::vector<std::thread> workers;
	/* Submitted and not yet completed.  */
	std::size_t outstanding;
	ev_async wakeup;
	bool watching;

	/* Shared; hold mtx.  */
	std::mutex mtx;
	std::condition_variable cnd;
	bool shutdown;
	std::deque<Job> jobs;
	std::deque<std::function<void()>> completions;

	void work() {
		auto lock = std::unique_lock<std::mutex>(mtx);
		for (;;) {
			cnd.wait(lock, [this]() {
				return shutdown || !jobs.empty();
			});
			if (shutdown)
				return;
			auto job = std::move(jobs.front());
			jobs.pop_front();

			lock.unlock();
			auto completion = job();
			job = nullptr;
			lock.lock();

			completions.push_back(std::move(completion));
			ev_async_send(loop, &wakeup);
		}
	}

	/* Sends coalesce, so take everything ready.  */
	void on_wakeup() {
		auto ready = std::deque<std::function<void()>>();
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			ready.swap(completions);
		}
		outstanding -= ready.size();
		/* An idle pool must not keep the loop alive.  */
		if (outstanding == 0 && watching) {
			ev_async_stop(loop, &wakeup);
			watching = false;
		}
		for (auto& c : ready)
			c();
	}
	static
	void on_wakeup_static(EV_P_ ev_async* w, int) {
		static_cast<Impl*>(w->data)->on_wakeup();
	}

public:
	explicit
	Impl(std::size_t num_threads) : loop(EV_DEFAULT)
				      , outstanding(0)
				      , watching(false)
				      , shutdown(false) {
		ev_async_init(&wakeup, &on_wakeup_static);
		wakeup.data = this;

		if (num_threads == 0)
			num_threads = 1;
		auto blocker = SigBlocker();
		try {
			for (auto i = std::size_t(0); i < num_threads; ++i)
				workers.emplace_back([this]() { work(); });
		} catch (std::system_error const& e) {
			stop_workers();
			throw Util::BacktraceException<std::runtime_error>(
				std::string("Ev::ThreadPool: cannot start thread: ")
				+ e.what()
			);
		}
	}

	void submit(Job job) {
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			jobs.push_back(std::move(job));
		}
		cnd.notify_one();
		++outstanding;
		if (!watching) {
			ev_async_start(loop, &wakeup);
			watching = true;
		}
	}

	void stop_workers() {
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			shutdown = true;
		}
		cnd.notify_all();
		for (auto& t : workers)
			t.join();
		workers.clear();
	}

	~Impl() {
		if (watching)
			ev_async_stop(loop, &wakeup);
		stop_workers();
	}
};

ThreadPool::ThreadPool(std::size_t num_threads)
	: pimpl(std::make_unique<Impl>(num_threads)) { }
ThreadPool::~ThreadPool() =default;

void ThreadPool::submit(Job job) {
	pimpl->submit(std::move(job));
}

Ev::Io<void>
ThreadPool::background(std::function<void()> func) {
	auto f = std::make_shared<std::function<void()>>(std::move(func));
	return Ev::Io<void>([ f
			    , this
			    ]( std::function<void()> pass
			     , std::function<void(std::exception_ptr)> fail
			     ) {
		submit([f, pass, fail]() -> std::function<void()> {
			try {
				(*f)();
				return pass;
			} catch (...) {
				auto e = std::current_exception();
				return [fail, e]() { fail(e); };
			}
		});
	});
}

}
