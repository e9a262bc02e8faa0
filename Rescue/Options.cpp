#include"Rescue/Options.hpp"

namespace {

bool starts_with(std::string const& s, std::string const& prefix) {
	return s.size() >= prefix.size()
	    && s.compare(0, prefix.size(), prefix) == 0
	     ;
}

}

namespace Rescue {

Options Options::parse(std::vector<std::string> const& argv) {
	auto ret = Options();

	auto i = std::size_t(1);
	/* Gets the value of the current option, either inline
	 * or from the next argument.  */
	auto value = [&argv, &i]( std::string const& name
				, std::string const* inline_value
				) {
		if (inline_value)
			return *inline_value;
		if (i + 1 >= argv.size())
			throw UsageError("option " + name + " requires a value");
		++i;
		return argv[i];
	};

	for (; i < argv.size(); ++i) {
		auto const& arg = argv[i];

		auto name = arg;
		auto inline_store = std::string();
		auto inline_value = (std::string const*) nullptr;
		if (starts_with(arg, "--")) {
			auto eq = arg.find('=');
			if (eq != std::string::npos) {
				name = arg.substr(0, eq);
				inline_store = arg.substr(eq + 1);
				inline_value = &inline_store;
			}
		} else if (starts_with(arg, "-") && arg.size() > 2) {
			/* -vv, or a short option with its value attached.  */
			if (arg.find_first_not_of('v', 1) == std::string::npos) {
				ret.verbosity += arg.size() - 1;
				continue;
			}
			name = arg.substr(0, 2);
			inline_store = arg.substr(2);
			inline_value = &inline_store;
		}

		if (name == "-s" || name == "--seed")
			ret.seed = value(name, inline_value);
		else if (name == "-b" || name == "--backup-file")
			ret.backup_file = value(name, inline_value);
		else if (name == "-n" || name == "--network")
			ret.network = value(name, inline_value);
		else if (name == "--esplora-server")
			ret.esplora_server = value(name, inline_value);
		else if (name == "--node-socket")
			ret.node_socket = value(name, inline_value);
		else if (name == "--force-close") {
			auto v = value(name, inline_value);
			if (v == "pending")
				ret.force_close = ForceClosePolicy::Pending;
			else if (v == "always")
				ret.force_close = ForceClosePolicy::Always;
			else
				throw UsageError( "--force-close must be "
						  "'pending' or 'always', not '"
						+ v + "'"
						);
		} else if (name == "--reset-recovery" && !inline_value)
			ret.reset_recovery = true;
		else if (name == "-v" && !inline_value)
			++ret.verbosity;
		else if ((name == "-V" || name == "--version") && !inline_value)
			ret.version = true;
		else if ((name == "-h" || name == "--help") && !inline_value)
			ret.help = true;
		else
			throw UsageError("Unrecognized option: " + arg);
	}

	if ( ret.network != "bitcoin" && ret.network != "testnet"
	  && ret.network != "signet" && ret.network != "regtest"
	   )
		throw UsageError("unknown network '" + ret.network + "'");
	if ( !starts_with(ret.esplora_server, "http://")
	  && !starts_with(ret.esplora_server, "https://")
	   )
		throw UsageError( "--esplora-server must be an http or "
				  "https URL"
				);
	if (ret.backup_file.empty())
		throw UsageError("--backup-file must not be empty");
	if (ret.node_socket.empty())
		throw UsageError("--node-socket must not be empty");

	return ret;
}

void Options::print_help(std::ostream& os, std::string const& argv0) {
	os << "Usage: " << argv0 << " [options]" << std::endl
	   << std::endl
	   << "Recovers on-chain funds from the channels in a static" << std::endl
	   << "channel backup, using a node engine listening on a local" << std::endl
	   << "socket." << std::endl
	   << std::endl
	   << "Options:" << std::endl
	   << " -s, --seed PHRASE          Seed phrase. Prompted for if not given." << std::endl
	   << " -b, --backup-file FILE     Static channel backup file." << std::endl
	   << "                            Default: channel-backup.json" << std::endl
	   << " -n, --network NET          bitcoin, testnet, signet or regtest." << std::endl
	   << "                            Default: bitcoin" << std::endl
	   << " --esplora-server URL       Esplora server URL." << std::endl
	   << "                            Default: https://electrs.getalbypro.com" << std::endl
	   << " --node-socket FILE         Node engine RPC socket." << std::endl
	   << "                            Default: ldk-node.sock" << std::endl
	   << " --force-close WHEN         pending: force-close only while some" << std::endl
	   << "                            channel has not been force-closed yet;" << std::endl
	   << "                            always: on every run. Default: pending" << std::endl
	   << " --reset-recovery           Reset local recovery state." << std::endl
	   << "                            WARNING: the recovery process will start" << std::endl
	   << "                            from scratch. All the existing recovery" << std::endl
	   << "                            state will be lost." << std::endl
	   << " -v                         Verbose log. Twice for trace level." << std::endl
	   << " -V, --version              Show version." << std::endl
	   << " -h, --help                 Show this help." << std::endl
	   << std::endl
	   << "Relative paths are relative to the directory holding this" << std::endl
	   << "program." << std::endl
	   << std::endl
	   << "Send bug reports to: " << PACKAGE_BUGREPORT << std::endl
	   ;
}

}
