#include"Bip39/Mnemonic.hpp"
#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Net/Fd.hpp"
#include"Node/RpcNode.hpp"
#include"Rescue/InterruptHandler.hpp"
#include"Rescue/Main.hpp"
#include"Rescue/Monitor.hpp"
#include"Rescue/Options.hpp"
#include"Rescue/StopHandle.hpp"
#include"Rescue/log.hpp"
#include"Rescue/paths.hpp"
#include"Rescue/reset_recovery.hpp"
#include"Scb/Backup.hpp"
#include"Scb/load.hpp"
#include"Util/Str.hpp"
#include<assert.h>

namespace Rescue {

class Main::Impl {
private:
	std::istream& cin;
	std::ostream& cout;
	std::ostream& cerr;
	std::function< Net::Fd( std::string const&
			      , std::string const&
			      )
		     > open_rpc_socket;

	std::string argv0;
	Options options;
	std::string usage_error;

	std::string dir;
	std::unique_ptr<Logger> logger;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::unique_ptr<Bip39::Mnemonic> mnemonic;
	std::unique_ptr<Node::RpcNode> node;
	std::unique_ptr<Monitor> monitor;
	std::unique_ptr<InterruptHandler> interrupt;

	LogLevel threshold() const {
		switch (options.verbosity) {
		case 0: return Info;
		case 1: return Debug;
		default: return Trace;
		}
	}

	Ev::Io<void> prompt_mnemonic() {
		return Ev::lift().then([this]() {
			cout << "Enter seed phrase:" << std::endl;
			auto& in = cin;
			return threadpool->background<std::unique_ptr<std::string>>([&in]() {
				auto line = std::string();
				if (!std::getline(in, line))
					return std::unique_ptr<std::string>();
				return std::make_unique<std::string>(std::move(line));
			});
		}).then([this](std::unique_ptr<std::string> line) {
			if (!line)
				throw Util::BacktraceException<std::runtime_error>(
					"no seed phrase given"
				);
			try {
				mnemonic = std::make_unique<Bip39::Mnemonic>(*line);
			} catch (Bip39::InvalidMnemonic const& e) {
				cout << e.what() << std::endl;
				return Rescue::log( *logger, Error
						  , "failed to parse input, try again: %s"
						  , e.what()
						  ).then([this]() {
					return prompt_mnemonic();
				});
			}
			return Ev::lift();
		});
	}

	Ev::Io<void> get_mnemonic() {
		if (options.seed.empty())
			return prompt_mnemonic();
		return Ev::lift().then([this]() {
			mnemonic = std::make_unique<Bip39::Mnemonic>(options.seed);
			return Ev::lift();
		});
	}

	Ev::Io<InitReport> recover(Scb::Backup backup) {
		auto sock = split_path(resolve(dir, options.node_socket));
		auto fd = open_rpc_socket(sock.first, sock.second);

		auto node_config = Node::RpcNodeConfig();
		node_config.network = options.network;
		node_config.esplora_server = options.esplora_server;
		node_config.storage_dir = resolve(dir, node_data_dir);
		node_config.seed_phrase = mnemonic->phrase();
		node = std::make_unique<Node::RpcNode>( *logger
						      , std::move(fd)
						      , std::move(node_config)
						      );

		auto config = MonitorConfig();
		config.state_path = resolve(dir, state_file);
		config.force_close = options.force_close;
		monitor = std::make_unique<Monitor>( *node, *logger, cout
						   , *threadpool
						   , std::move(config)
						   );

		interrupt = std::make_unique<InterruptHandler>([this](int signum) {
			logger->write(Info, Util::Str::fmt(
				"received signal %d, stopping", signum
			));
			monitor->stop_handle().stop();
		});

		return monitor->run(std::move(backup));
	}

	Ev::Io<int> fail(std::string const& msg) {
		return Rescue::log( *logger, Error
				  , "recovery failed: %s", msg.c_str()
				  ).then([this, msg]() {
			cerr << "Recovery failed; error: " << msg
			     << " (see the " << log_file
			     << " file for details)"
			     << std::endl
			     ;
			return Ev::lift(1);
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::istream& cin_
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , std::function< Net::Fd( std::string const&
				    , std::string const&
				    )
			   > open_rpc_socket_
	    ) : cin(cin_)
	      , cout(cout_)
	      , cerr(cerr_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      {
		assert(argv.size() >= 1);
		argv0 = argv[0];
		try {
			options = Options::parse(argv);
		} catch (UsageError const& e) {
			usage_error = e.what();
		}
	}

	Ev::Io<int> run() {
		if (!usage_error.empty()) {
			cerr << argv0 << ": " << usage_error << std::endl
			     << "Try '" << argv0 << " --help' for more information."
			     << std::endl
			     ;
			return Ev::lift(2);
		} else if (options.version) {
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		} else if (options.help) {
			Options::print_help(cout, argv0);
			return Ev::lift(0);
		}

		try {
			dir = own_dir(argv0);
			logger = std::make_unique<Logger>(Logger::open(
				resolve(dir, log_file), threshold()
			));
		} catch (std::exception const& e) {
			cerr << "Failed to set up logging: " << e.what()
			     << std::endl;
			return Ev::lift(1);
		}

		if (options.reset_recovery) {
			try {
				reset_recovery(dir);
			} catch (std::exception const& e) {
				logger->write(Error, Util::Str::fmt(
					"failed to reset recovery state: %s",
					e.what()
				));
				cerr << "Failed to reset recovery state: " << e.what() << std::endl
				     << "To reset the recovery state manually, delete the following:" << std::endl
				     << "  " << resolve(dir, state_file) << std::endl
				     << "  " << resolve(dir, node_data_dir) << std::endl
				     ;
				return Ev::lift(1);
			}
			logger->write(Warn, "recovery state reset");
		}

		threadpool = std::make_unique<Ev::ThreadPool>();

		return Rescue::log( *logger, Info
				  , "%s starting in %s"
				  , PACKAGE_STRING, dir.c_str()
				  ).then([this]() {
			return get_mnemonic();
		}).then([this]() {
			auto path = resolve(dir, options.backup_file);
			auto m = *mnemonic;
			return threadpool->background<Scb::Backup>([path, m]() {
				return Scb::load_file(path, m);
			});
		}).then([this](Scb::Backup backup) {
			logger->write(Info, Util::Str::fmt(
				"loaded static channel backup: %zu channels, "
				"%zu monitors",
				backup.channels.size(), backup.monitors.size()
			));
			return recover(std::move(backup));
		}).then([this](InitReport report) {
			if (!report.connection_failures.empty())
				logger->write(Warn, Util::Str::fmt(
					"%zu peers could not be reached",
					report.connection_failures.size()
				));
			return Ev::lift(0);
		}).catching<std::exception>([this](std::exception const& e) {
			return fail(e.what());
		});
	}
};

Main::Main( std::vector<std::string> argv
	  , std::istream& cin
	  , std::ostream& cout
	  , std::ostream& cerr
	  , std::function< Net::Fd( std::string const&
				  , std::string const&
				  )
			 > open_rpc_socket
	  ) : pimpl(std::make_unique<Impl>( std::move(argv)
					  , cin
					  , cout
					  , cerr
					  , std::move(open_rpc_socket)
					  ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	assert(pimpl);
	return pimpl->run();
}

}
