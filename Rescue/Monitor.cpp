#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ln/NodeId.hpp"
#include"Node/NodeIF.hpp"
#include"Rescue/BalanceChecker.hpp"
#include"Rescue/EventDrainer.hpp"
#include"Rescue/Monitor.hpp"
#include"Rescue/PeriodicTask.hpp"
#include"Rescue/RecoveryState.hpp"
#include"Rescue/StopHandle.hpp"
#include"Rescue/WalletSyncer.hpp"
#include"Rescue/log.hpp"
#include"Scb/Backup.hpp"
#include<algorithm>
#include<iterator>
#include<map>
#include<set>
#include<utility>

namespace {

/* `host:port`, with IPv6 hosts in brackets.  */
bool valid_socket_address(std::string const& addr) {
	auto colon = addr.rfind(':');
	if (colon == std::string::npos || colon == 0)
		return false;
	auto host = addr.substr(0, colon);
	auto port = addr.substr(colon + 1);

	if (port.empty() || port.size() > 5)
		return false;
	for (auto c : port)
		if (c < '0' || c > '9')
			return false;
	auto n = std::stoul(port);
	if (n < 1 || n > 65535)
		return false;

	for (auto c : host)
		if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
			return false;
	if (host.front() == '[')
		return host.size() > 2 && host.back() == ']';
	return host.find(':') == std::string::npos;
}

std::set<std::string> difference( std::set<std::string> const& a
				, std::set<std::string> const& b
				) {
	auto ret = std::set<std::string>();
	std::set_difference( a.begin(), a.end()
			   , b.begin(), b.end()
			   , std::inserter(ret, ret.begin())
			   );
	return ret;
}

}

namespace Rescue {

class Monitor::Impl {
public:
	Node::NodeIF& node;
	Logger& logger;
	std::ostream& out;
	Ev::ThreadPool& threadpool;
	MonitorConfig config;

	StopHandle stop;
	std::unique_ptr<RecoveryState> rstate;

	BalanceChecker balance;
	WalletSyncer syncer;
	EventDrainer drainer;
	std::vector<std::unique_ptr<PeriodicTask>> tasks;

	typedef std::vector<std::pair<std::string, std::string>> PeerList;

	Impl( Node::NodeIF& node_
	    , Logger& logger_
	    , std::ostream& out_
	    , Ev::ThreadPool& threadpool_
	    , MonitorConfig config_
	    ) : node(node_)
	      , logger(logger_)
	      , out(out_)
	      , threadpool(threadpool_)
	      , config(std::move(config_))
	      , balance(node, logger, out, stop)
	      , syncer(node, logger)
	      , drainer(node, logger)
	      { }

	/* Writes a snapshot of the current state.  */
	Ev::Io<void> save() {
		auto copy = *rstate;
		auto path = config.state_path;
		return threadpool.background([copy, path]() {
			copy.save(path);
		});
	}

	Ev::Io<void> first_run( std::shared_ptr<Scb::Backup> backup
			      , std::shared_ptr<InitReport> report
			      ) {
		rstate = std::make_unique<RecoveryState>();
		for (auto const& c : backup->channels)
			rstate->set_channel_state( c.peer_id, c.channel_id
						 , ChannelState::Pending
						 );
		return Rescue::log( logger, Info
				  , "starting recovery of %zu channels"
				  , rstate->count(ChannelState::Pending)
				  ).then([this]() {
			return save();
		}).then([this, backup]() {
			return Rescue::log( logger, Info
					  , "restoring %zu channel monitors"
					  , backup->monitors.size()
					  );
		}).then([this, backup]() {
			return node.restore_encoded_channel_monitors(
				backup->monitors
			);
		}).then([report]() {
			report->monitors_restored = true;
			return Ev::lift();
		});
	}

	Ev::Io<void> resume( std::shared_ptr<Scb::Backup> backup
			   , std::shared_ptr<InitReport> report
			   ) {
		report->resumed = true;

		auto in_state = rstate->all_channel_ids();
		auto in_backup = backup->channel_ids();
		if (in_state != in_backup) {
			auto only_in_backup = difference(in_backup, in_state);
			auto only_in_state = difference(in_state, in_backup);
			return Rescue::log( logger, Error
					  , "static channel backup file has changed; "
					    "cannot proceed with the recovery "
					    "(%zu channels only in backup, "
					    "%zu only in recovery state)"
					  , only_in_backup.size()
					  , only_in_state.size()
					  ).then([ this
						 , only_in_backup
						 , only_in_state
						 ]() {
				out << "The recovery process has already been initiated with a different static channel backup file." << std::endl
				    << "Please specify the same backup file to resume recovery." << std::endl
				    << "To recover channels from a different backup file, restart the app with the --reset-recovery flag." << std::endl
				    << "WARNING: this will reset the recovery state and start the recovery process from scratch." << std::endl
				    ;
				throw StateMismatchError( only_in_backup
							, only_in_state
							);
				return Ev::lift();
			});
		}

		out << "Resuming recovery" << std::endl;
		auto act = Rescue::log( logger, Info
				      , "resuming recovery: %zu pending, "
					"%zu force-close initiated"
				      , rstate->count(ChannelState::Pending)
				      , rstate->count(ChannelState::ForceCloseInitiated)
				      );
		if (!rstate->has_unattributed())
			return act;

		auto peer_of = std::map<std::string, std::string>();
		for (auto const& c : backup->channels)
			peer_of.emplace(c.channel_id, c.peer_id);
		auto moved = rstate->attribute_peers(peer_of);
		return std::move(act)
		     + Rescue::log( logger, Info
				  , "attributed %zu channels from an older "
				    "recovery state file to their peers"
				  , moved
				  )
		     + save()
		     ;
	}

	Ev::Io<void> start_node() {
		return Rescue::log(logger, Info, "starting node").then([this]() {
			return node.start();
		}).then([this]() {
			out << "Synchronizing wallets..." << std::endl;
			return node.sync_wallets().catching<std::exception>([this](std::exception const& e) {
				return Rescue::log( logger, Warn
						  , "initial wallet synchronization "
						    "failed: %s"
						  , e.what()
						  );
			});
		});
	}

	Ev::Io<void> connect_peers( std::shared_ptr<PeerList> peers
				  , std::size_t i
				  , std::shared_ptr<std::set<std::string>> reachable
				  , std::shared_ptr<InitReport> report
				  ) {
		if (i >= peers->size() || stop.is_stopped())
			return Ev::lift();

		auto peer_id = (*peers)[i].first;
		auto address = (*peers)[i].second;
		return Ev::lift().then([this, peer_id, address]() {
			return node.connect(Ln::NodeId(peer_id), address, true);
		}).then([this, peer_id, address, reachable, report]() {
			reachable->insert(peer_id);
			++report->peers_connected;
			return Rescue::log( logger, Info
					  , "connected to peer %s %s"
					  , address.c_str(), peer_id.c_str()
					  );
		}).catching<std::exception>([ this
					    , peer_id
					    , address
					    , report
					    ](std::exception const& e) {
			report->connection_failures.push_back(PeerConnectionError{
				peer_id, address, e.what()
			});
			out << "Failed to connect to peer " << peer_id
			    << " at " << address << std::endl;
			return Rescue::log( logger, Error
					  , "failed to connect to peer %s: %s"
					  , peer_id.c_str(), e.what()
					  );
		}).then([this, peers, i, reachable, report]() {
			return connect_peers(peers, i + 1, reachable, report);
		});
	}

	Ev::Io<void> force_close( std::shared_ptr<std::set<std::string>> reachable
				, std::shared_ptr<InitReport> report
				) {
		auto invoke = config.force_close == ForceClosePolicy::Always
			   || rstate->has_pending_channels()
			    ;
		if (!invoke)
			return Rescue::log( logger, Info
					  , "all channels already force-closed"
					  );

		out << "Forcing close all channels..." << std::endl;
		return Rescue::log( logger, Info
				  , "force-closing all channels"
				  ).then([this]() {
			return node.force_close_all_channels_without_broadcasting_txn();
		}).then([this, reachable, report]() {
			report->force_close_invoked = true;

			auto closed = std::vector<std::pair<std::string, std::string>>();
			for (auto const& p : rstate->entries()) {
				if (reachable->count(p.first) == 0)
					continue;
				for (auto const& c : p.second)
					if (c.second == ChannelState::Pending)
						closed.emplace_back(p.first, c.first);
			}
			for (auto const& pc : closed)
				rstate->set_channel_state( pc.first, pc.second
							 , ChannelState::ForceCloseInitiated
							 );
			if (closed.empty())
				return Ev::lift();
			return Rescue::log( logger, Info
					  , "%zu channels now force-close initiated, "
					    "%zu still pending"
					  , closed.size()
					  , rstate->count(ChannelState::Pending)
					  ) + save();
		});
	}

	Ev::Io<InitReport> initialize(Scb::Backup b) {
		auto backup = std::make_shared<Scb::Backup>(std::move(b));
		auto report = std::make_shared<InitReport>();
		auto reachable = std::make_shared<std::set<std::string>>();
		return Ev::lift().then([this, backup]() {
			Monitor::validate(*backup);
			auto path = config.state_path;
			return threadpool.background<std::unique_ptr<RecoveryState>>([path]() {
				return RecoveryState::load(path);
			});
		}).then([this, backup, report](std::unique_ptr<RecoveryState> loaded) {
			if (!loaded || loaded->is_empty())
				return first_run(backup, report);
			rstate = std::move(loaded);
			return resume(backup, report);
		}).then([this]() {
			return start_node();
		}).then([this, backup, reachable, report]() {
			out << "Connecting to peers..." << std::endl;
			auto peers = std::make_shared<PeerList>();
			auto seen = std::set<std::string>();
			for (auto const& c : backup->channels)
				if (seen.insert(c.peer_id).second)
					peers->emplace_back( c.peer_id
							   , c.peer_socket_address
							   );
			return connect_peers(peers, 0, reachable, report);
		}).then([this, reachable, report]() {
			if (!stop.is_stopped())
				return force_close(reachable, report);
			/* Nothing irreversible once the user has
			 * asked us to stop.  */
			report->interrupted = true;
			out << "Interrupted; channels were not force-closed." << std::endl;
			return Rescue::log( logger, Info
					  , "interrupted before force-close, "
					    "%zu channels left pending"
					  , rstate->count(ChannelState::Pending)
					  );
		}).then([report]() {
			return Ev::lift(*report);
		});
	}

	Ev::Io<void> watch() {
		return Ev::lift().then([this]() {
			if (tasks.empty()) {
				tasks.push_back(std::make_unique<PeriodicTask>(
					logger, stop, "event", config.event_interval,
					[this]() { return drainer.drain(); }
				));
				tasks.push_back(std::make_unique<PeriodicTask>(
					logger, stop, "balance", config.balance_interval,
					[this]() { return balance.check(); }
				));
				tasks.push_back(std::make_unique<PeriodicTask>(
					logger, stop, "sync", config.sync_interval,
					[this]() { return syncer.sync(); }
				));
			}

			out << "Waiting for channel recovery to complete. This may take a while..." << std::endl
			    << "It is safe to interrupt this program by pressing Ctrl-C. You can resume it later to check recovery status." << std::endl
			    ;

			auto act = Ev::lift();
			for (auto& t : tasks)
				act += t->launch();
			return act;
		}).then([this]() {
			return stop.wait();
		}).then([this]() {
			out << "Stopping..." << std::endl;
			auto act = Ev::lift();
			for (auto& t : tasks)
				act += Rescue::log( logger, Info
						  , "waiting for %s task to finish"
						  , t->name().c_str()
						  )
				     + t->join()
				     ;
			return act;
		}).then([this]() {
			return Rescue::log(logger, Info, "stopping node");
		}).then([this]() {
			return node.stop();
		}).then([this]() {
			return Rescue::log(logger, Info, "done");
		});
	}
};

Monitor::Monitor( Node::NodeIF& node
		, Logger& logger
		, std::ostream& out
		, Ev::ThreadPool& threadpool
		, MonitorConfig config
		) : pimpl(std::make_unique<Impl>( node, logger, out
						, threadpool
						, std::move(config)
						))
		  { }
Monitor::Monitor(Monitor&&) =default;
Monitor::~Monitor() =default;

void Monitor::validate(Scb::Backup const& backup) {
	for (auto const& c : backup.channels) {
		if (c.channel_id.empty())
			throw InvalidBackup("empty channel ID");
		if (!Ln::NodeId::valid_string(c.peer_id))
			throw InvalidBackup("invalid peer ID: " + c.peer_id);
		if (!valid_socket_address(c.peer_socket_address))
			throw InvalidBackup( "invalid peer address "
					   + c.peer_socket_address
					   + " for peer " + c.peer_id
					   );
	}
}

Ev::Io<InitReport> Monitor::initialize(Scb::Backup backup) {
	return pimpl->initialize(std::move(backup));
}
Ev::Io<void> Monitor::watch() {
	return pimpl->watch();
}
Ev::Io<InitReport> Monitor::run(Scb::Backup backup) {
	return initialize(std::move(backup)).then([this](InitReport r) {
		auto report = std::make_shared<InitReport>(std::move(r));
		return watch().then([report]() {
			return Ev::lift(std::move(*report));
		});
	});
}

StopHandle& Monitor::stop_handle() {
	return pimpl->stop;
}
RecoveryState const* Monitor::state() const {
	return pimpl->rstate.get();
}

}
