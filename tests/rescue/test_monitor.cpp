#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ln/NodeId.hpp"
#include"Net/Fd.hpp"
#include"Node/NodeIF.hpp"
#include"Rescue/Logger.hpp"
#include"Rescue/Monitor.hpp"
#include"Rescue/RecoveryState.hpp"
#include"Rescue/StopHandle.hpp"
#include"Rescue/errors.hpp"
#include"Scb/Backup.hpp"
#include<algorithm>
#include<assert.h>
#include<deque>
#include<fstream>
#include<functional>
#include<set>
#include<sstream>
#include<stdexcept>
#include<unistd.h>

namespace {

auto const peer_a = std::string("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
auto const peer_b = std::string("02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5");

class FakeNode : public Node::NodeIF {
public:
	std::vector<std::string> calls;
	std::vector<Scb::EncodedMonitor> restored;
	std::set<std::string> unreachable;
	bool sync_fails = false;
	/* Number of list_balances calls that still report
	 * claimable funds on a closed channel.  */
	int polls_until_done = 1;
	std::deque<Node::Event> events;
	std::size_t handled = 0;
	/* Called with the peer id on each connect.  */
	std::function<void(std::string const&)> on_connect;

	std::size_t count(std::string const& m) const {
		return std::count(calls.begin(), calls.end(), m);
	}

	Ev::Io<void>
	restore_encoded_channel_monitors(std::vector<Scb::EncodedMonitor> ms) override {
		calls.push_back("restore");
		restored = std::move(ms);
		return Ev::lift();
	}
	Ev::Io<void> start() override {
		calls.push_back("start");
		return Ev::lift();
	}
	Ev::Io<void> stop() override {
		calls.push_back("stop");
		return Ev::lift();
	}
	Ev::Io<void> sync_wallets() override {
		return Ev::lift().then([this]() {
			calls.push_back("sync");
			if (sync_fails)
				throw std::runtime_error("esplora unreachable");
			return Ev::lift();
		});
	}
	Ev::Io<void> connect( Ln::NodeId const& peer
			    , std::string const& address
			    , bool persist
			    ) override {
		auto id = std::string(peer);
		return Ev::lift().then([this, id, persist]() {
			assert(persist);
			calls.push_back("connect " + id);
			if (on_connect)
				on_connect(id);
			if (unreachable.count(id) != 0)
				throw std::runtime_error("connection refused");
			return Ev::lift();
		});
	}
	Ev::Io<std::vector<Node::ChannelDetails>> list_channels() override {
		calls.push_back("list_channels");
		return Ev::lift(std::vector<Node::ChannelDetails>());
	}
	Ev::Io<Node::BalanceDetails> list_balances() override {
		calls.push_back("list_balances");
		auto b = Node::BalanceDetails();
		b.total_onchain_balance_sats = 50000;
		b.spendable_onchain_balance_sats = 40000;
		b.total_anchor_channels_reserve_sats = 10000;
		if (polls_until_done > 0) {
			--polls_until_done;
			b.lightning_balances.push_back(Node::LightningBalance{
				Node::LightningBalance::ClaimableAwaitingConfirmations,
				"c1", 1000
			});
		}
		return Ev::lift(std::move(b));
	}
	Ev::Io<void> force_close_all_channels_without_broadcasting_txn() override {
		calls.push_back("force_close");
		return Ev::lift();
	}
	Ev::Io<std::unique_ptr<Node::Event>> next_event() override {
		if (events.empty())
			return Ev::lift(std::unique_ptr<Node::Event>());
		return Ev::lift(std::make_unique<Node::Event>(events.front()));
	}
	Ev::Io<void> event_handled() override {
		events.pop_front();
		++handled;
		return Ev::lift();
	}
};

Scb::Backup two_channels() {
	auto b = Scb::Backup();
	b.channels.push_back(Scb::ChannelEntry{"c1", peer_a, "127.0.0.1:9735"});
	b.channels.push_back(Scb::ChannelEntry{"c2", peer_b, "[::1]:9736"});
	b.monitors.push_back(Scb::EncodedMonitor{"mon1", {0x01, 0x02}});
	b.monitors.push_back(Scb::EncodedMonitor{"mon2", {0x03}});
	return b;
}

Rescue::MonitorConfig config(std::string const& path) {
	auto c = Rescue::MonitorConfig();
	c.state_path = path;
	c.balance_interval = 0.01;
	c.sync_interval = 0.01;
	c.event_interval = 0.01;
	return c;
}

std::string read_file(std::string const& path) {
	auto is = std::ifstream(path);
	auto ss = std::ostringstream();
	ss << is.rdbuf();
	return ss.str();
}

bool contains(std::string const& haystack, std::string const& needle) {
	return haystack.find(needle) != std::string::npos;
}

Rescue::ChannelState
state_of( std::string const& path
	, std::string const& peer, std::string const& channel
	) {
	auto s = Rescue::RecoveryState::load(path);
	assert(s);
	auto c = s->get_channel_state(peer, channel);
	assert(c);
	return *c;
}

}

int main() {
	auto logger = Rescue::Logger(Net::Fd(), Rescue::Trace);
	auto threadpool = Ev::ThreadPool();
	auto path = std::string("test_monitor.tmp");
	unlink(path.c_str());

	/* Backups with unusable entries are rejected.  */
	{
		Rescue::Monitor::validate(two_channels());

		auto bad_id = two_channels();
		bad_id.channels[0].peer_id = "02abcdef";
		auto bad_addr = two_channels();
		bad_addr.channels[1].peer_socket_address = "127.0.0.1";
		auto bad_port = two_channels();
		bad_port.channels[1].peer_socket_address = "127.0.0.1:70000";
		auto empty_channel = two_channels();
		empty_channel.channels[0].channel_id = "";

		for (auto const& b : {bad_id, bad_addr, bad_port, empty_channel}) {
			auto thrown = false;
			try {
				Rescue::Monitor::validate(b);
			} catch (Rescue::InvalidBackup const&) {
				thrown = true;
			}
			assert(thrown);
		}
	}

	/* A validation failure surfaces from initialize,
	 * before the node engine or the state file are
	 * touched.  */
	{
		auto node = FakeNode();
		auto out = std::ostringstream();
		auto monitor = Rescue::Monitor( node, logger, out, threadpool
					      , config(path)
					      );
		auto bad = two_channels();
		bad.channels[1].peer_socket_address = "nowhere";
		auto code = monitor.initialize(bad).then([](Rescue::InitReport) {
			return Ev::lift(1);
		}).catching<Rescue::InvalidBackup>([](Rescue::InvalidBackup const&) {
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);
		assert(node.calls.empty());
		assert(!Rescue::RecoveryState::load(path));
	}

	/* First run: one peer reachable, one not.  */
	{
		auto node = FakeNode();
		node.unreachable.insert(peer_b);
		node.sync_fails = true;
		node.events.push_back(Node::Event{"ChannelClosed", "{\"channel_id\":\"c1\"}"});
		node.events.push_back(Node::Event{"ChannelClosed", "{\"channel_id\":\"c2\"}"});
		auto out = std::ostringstream();
		auto monitor = Rescue::Monitor( node, logger, out, threadpool
					      , config(path)
					      );
		assert(!monitor.state());

		auto report = Rescue::InitReport();
		auto code = monitor.run(two_channels()).then([&](Rescue::InitReport r) {
			report = std::move(r);
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);

		assert(!report.resumed);
		assert(report.monitors_restored);
		assert(report.force_close_invoked);
		assert(report.peers_connected == 1);
		assert(report.connection_failures.size() == 1);
		assert(report.connection_failures[0].peer_id == peer_b);
		assert(report.connection_failures[0].address == "[::1]:9736");
		assert(report.connection_failures[0].message == "connection refused");

		/* Monitors are handed over before the node engine
		 * starts, and the node engine is stopped last.  */
		assert(node.calls.size() >= 7);
		assert(node.calls[0] == "restore");
		assert(node.calls[1] == "start");
		assert(node.calls[2] == "sync");
		assert(node.calls[3] == "connect " + peer_a);
		assert(node.calls[4] == "connect " + peer_b);
		assert(node.calls[5] == "force_close");
		assert(node.calls.back() == "stop");
		assert(node.count("restore") == 1);
		assert(node.count("force_close") == 1);
		assert(node.count("stop") == 1);
		assert(node.count("list_balances") >= 2);
		assert(node.restored == two_channels().monitors);

		assert(node.handled == 2);
		assert(node.events.empty());

		/* Only the reachable peer's channel moved on.  */
		assert(state_of(path, peer_a, "c1") == Rescue::ChannelState::ForceCloseInitiated);
		assert(state_of(path, peer_b, "c2") == Rescue::ChannelState::Pending);
		assert(monitor.state());
		assert(*monitor.state() == *Rescue::RecoveryState::load(path));
		assert(monitor.stop_handle().is_stopped());

		auto text = out.str();
		assert(contains(text, "Failed to connect to peer " + peer_b + " at [::1]:9736"));
		assert(contains(text, "Forcing close all channels..."));
		assert(contains(text, "Recovery completed successfully"));
		assert(!contains(text, "Resuming recovery"));
		assert(text.find("Recovery completed successfully")
		     < text.find("Stopping..."));
	}

	/* Resume with the same backup: no second restore,
	 * and the remaining pending channel gets closed now
	 * that its peer answers.  */
	{
		auto node = FakeNode();
		node.polls_until_done = 0;
		auto out = std::ostringstream();
		auto monitor = Rescue::Monitor( node, logger, out, threadpool
					      , config(path)
					      );
		auto report = Rescue::InitReport();
		auto code = monitor.run(two_channels()).then([&](Rescue::InitReport r) {
			report = std::move(r);
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);

		assert(report.resumed);
		assert(!report.monitors_restored);
		assert(report.force_close_invoked);
		assert(report.peers_connected == 2);
		assert(report.connection_failures.empty());
		assert(node.count("restore") == 0);
		assert(node.count("force_close") == 1);
		assert(node.calls[0] == "start");
		assert(node.calls.back() == "stop");

		assert(state_of(path, peer_a, "c1") == Rescue::ChannelState::ForceCloseInitiated);
		assert(state_of(path, peer_b, "c2") == Rescue::ChannelState::ForceCloseInitiated);
		assert(contains(out.str(), "Resuming recovery"));
		assert(contains(out.str(), "Recovery completed successfully"));
	}

	/* Nothing pending any more: force-close is skipped
	 * by default, and the state file is left alone.  */
	{
		auto before = read_file(path);

		auto node = FakeNode();
		node.polls_until_done = 0;
		auto out = std::ostringstream();
		auto monitor = Rescue::Monitor( node, logger, out, threadpool
					      , config(path)
					      );
		auto report = Rescue::InitReport();
		auto code = monitor.initialize(two_channels()).then([&](Rescue::InitReport r) {
			report = std::move(r);
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);

		assert(report.resumed);
		assert(!report.force_close_invoked);
		assert(node.count("force_close") == 0);
		assert(node.count("restore") == 0);
		/* initialize alone leaves the node engine running.  */
		assert(node.count("stop") == 0);
		assert(!contains(out.str(), "Forcing close all channels..."));
		assert(read_file(path) == before);
	}

	/* ...but always invoked when asked to.  */
	{
		auto before = read_file(path);

		auto node = FakeNode();
		auto out = std::ostringstream();
		auto c = config(path);
		c.force_close = Rescue::ForceClosePolicy::Always;
		auto monitor = Rescue::Monitor(node, logger, out, threadpool, c);
		auto report = Rescue::InitReport();
		auto code = monitor.initialize(two_channels()).then([&](Rescue::InitReport r) {
			report = std::move(r);
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);

		assert(report.force_close_invoked);
		assert(node.count("force_close") == 1);
		assert(read_file(path) == before);
	}

	/* A different backup is refused without touching the
	 * node engine or the state file.  */
	{
		auto before = read_file(path);

		auto other = two_channels();
		other.channels[1].channel_id = "c3";

		auto node = FakeNode();
		auto out = std::ostringstream();
		auto monitor = Rescue::Monitor( node, logger, out, threadpool
					      , config(path)
					      );
		auto only_in_backup = std::set<std::string>();
		auto only_in_state = std::set<std::string>();
		auto code = monitor.run(other).then([](Rescue::InitReport) {
			return Ev::lift(1);
		}).catching<Rescue::StateMismatchError>([&](Rescue::StateMismatchError const& e) {
			only_in_backup = e.only_in_backup;
			only_in_state = e.only_in_state;
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);

		assert(only_in_backup == std::set<std::string>{"c3"});
		assert(only_in_state == std::set<std::string>{"c2"});
		assert(node.calls.empty());
		assert(read_file(path) == before);
		assert(contains(out.str(), "--reset-recovery"));
	}

	/* A state file from an older version that lists only
	 * force-closed channel ids is attributed to the
	 * backup's peers and rewritten.  */
	{
		{
			auto os = std::ofstream(path);
			os << "{\"force_closed\": [\"c1\", \"c2\"]}";
		}

		auto node = FakeNode();
		auto out = std::ostringstream();
		auto monitor = Rescue::Monitor( node, logger, out, threadpool
					      , config(path)
					      );
		auto report = Rescue::InitReport();
		auto code = monitor.initialize(two_channels()).then([&](Rescue::InitReport r) {
			report = std::move(r);
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);

		assert(report.resumed);
		assert(!report.force_close_invoked);
		assert(state_of(path, peer_a, "c1") == Rescue::ChannelState::ForceCloseInitiated);
		assert(state_of(path, peer_b, "c2") == Rescue::ChannelState::ForceCloseInitiated);
		assert(!Rescue::RecoveryState::load(path)->has_unattributed());
	}

	/* Stopping from outside ends watch even with funds
	 * still pending.  */
	{
		unlink(path.c_str());

		auto node = FakeNode();
		node.polls_until_done = 1000000;
		auto out = std::ostringstream();
		auto monitor = Rescue::Monitor( node, logger, out, threadpool
					      , config(path)
					      );
		auto code = monitor.initialize(two_channels()).then([&](Rescue::InitReport) {
			/* Interrupt once a few polls have run.  */
			return Ev::concurrent(Ev::lift().then([&]() {
				return monitor.stop_handle().sleep(0.05);
			}).then([&]() {
				monitor.stop_handle().stop();
				return Ev::lift();
			}));
		}).then([&]() {
			return monitor.watch();
		}).then([]() {
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);

		assert(monitor.stop_handle().is_stopped());
		assert(node.count("list_balances") >= 1);
		assert(node.count("stop") == 1);
		assert(node.calls.back() == "stop");
		assert(contains(out.str(), "Stopping..."));
		assert(!contains(out.str(), "Recovery completed successfully"));
		assert(state_of(path, peer_a, "c1") == Rescue::ChannelState::ForceCloseInitiated);
		assert(state_of(path, peer_b, "c2") == Rescue::ChannelState::ForceCloseInitiated);
	}

	/* Ctrl-C while peers are being connected: the
	 * channels are left alone and the node engine shut
	 * down.  */
	{
		unlink(path.c_str());

		auto node = FakeNode();
		auto out = std::ostringstream();
		auto monitor = Rescue::Monitor( node, logger, out, threadpool
					      , config(path)
					      );
		node.on_connect = [&](std::string const&) {
			monitor.stop_handle().stop();
		};
		auto report = Rescue::InitReport();
		auto code = monitor.run(two_channels()).then([&](Rescue::InitReport r) {
			report = std::move(r);
			return Ev::lift(0);
		});
		assert(Ev::start(code) == 0);

		assert(report.interrupted);
		assert(!report.force_close_invoked);
		assert(report.monitors_restored);
		assert(node.count("force_close") == 0);
		assert(node.count("connect " + peer_a) == 1);
		assert(node.count("connect " + peer_b) == 0);
		assert(node.count("list_balances") == 0);
		assert(node.count("stop") == 1);
		assert(node.calls.back() == "stop");
		assert(state_of(path, peer_a, "c1") == Rescue::ChannelState::Pending);
		assert(state_of(path, peer_b, "c2") == Rescue::ChannelState::Pending);
		assert(!contains(out.str(), "Forcing close all channels..."));
		assert(contains(out.str(), "Interrupted; channels were not force-closed."));
		assert(!contains(out.str(), "Recovery completed successfully"));
	}

	unlink(path.c_str());
	return 0;
}
