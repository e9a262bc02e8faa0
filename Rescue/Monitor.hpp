#ifndef RESCUE_MONITOR_HPP
#define RESCUE_MONITOR_HPP

#include"Rescue/errors.hpp"
#include<cstddef>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace Node { class NodeIF; }
namespace Rescue { class Logger; }
namespace Rescue { class RecoveryState; }
namespace Rescue { class StopHandle; }
namespace Scb { struct Backup; }

namespace Rescue {

/* When to ask the node engine to force-close.  */
enum class ForceClosePolicy {
	/* Only while some channel is still Pending.  */
	Pending,
	/* On every run, including resumed ones.  */
	Always
};

struct MonitorConfig {
	std::string state_path;
	/* Seconds.  */
	double balance_interval = 3.0;
	double sync_interval = 4.0;
	double event_interval = 0.1;
	ForceClosePolicy force_close = ForceClosePolicy::Pending;
};

/* What happened during Rescue::Monitor::initialize.  */
struct InitReport {
	bool resumed = false;
	bool monitors_restored = false;
	bool force_close_invoked = false;
	/* Stopped before force-closing; channels untouched.  */
	bool interrupted = false;
	std::size_t peers_connected = 0;
	std::vector<PeerConnectionError> connection_failures;
};

/** class Rescue::Monitor
 *
 * @brief drives a recovery from a static channel
 * backup to the point where no funds are left
 * pending.
 *
 * @desc `initialize` restores the channel monitors
 * (first run only), starts the node engine, connects
 * to the peers and has the channels force-closed.
 * If the stop handle is stopped meanwhile, no more
 * peers are connected and nothing is force-closed.
 * `watch` then polls balances, syncs wallets and
 * drains node events until recovery completes or the
 * stop handle is stopped from outside, then stops the
 * node engine.
 *
 * The recovery state file is written only from here.
 */
class Monitor {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Monitor() =delete;
	Monitor( Node::NodeIF& node
	       , Logger& logger
	       , std::ostream& out
	       , Ev::ThreadPool& threadpool
	       , MonitorConfig config
	       );
	Monitor(Monitor&&);
	~Monitor();

	/* Throws Rescue::InvalidBackup.  */
	static void validate(Scb::Backup const&);

	Ev::Io<InitReport> initialize(Scb::Backup backup);
	Ev::Io<void> watch();
	/* initialize, then watch.  */
	Ev::Io<InitReport> run(Scb::Backup backup);

	StopHandle& stop_handle();
	/* The state as of the last save, or nullptr
	 * before initialize loads it.  */
	RecoveryState const* state() const;
};

}

#endif /* !defined(RESCUE_MONITOR_HPP) */
