#ifndef RESCUE_OPTIONS_HPP
#define RESCUE_OPTIONS_HPP

#include"Rescue/Monitor.hpp"
#include"Util/BacktraceException.hpp"
#include<ostream>
#include<stdexcept>
#include<string>
#include<vector>

namespace Rescue {

/* Bad command line.  */
struct UsageError : public Util::BacktraceException<std::invalid_argument> {
	explicit
	UsageError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(msg) { }
};

/** struct Rescue::Options
 *
 * @brief command-line settings.
 *
 * @desc Long options take their value either as the
 * next argument or after `=`; short options as the
 * next argument or attached.
 * `-v` may be repeated, also as `-vv`.
 */
struct Options {
	/* Empty means prompt for it.  */
	std::string seed;
	std::string backup_file = "channel-backup.json";
	std::string network = "bitcoin";
	std::string esplora_server = "https://electrs.getalbypro.com";
	std::string node_socket = "ldk-node.sock";
	bool reset_recovery = false;
	ForceClosePolicy force_close = ForceClosePolicy::Pending;
	unsigned int verbosity = 0;
	bool version = false;
	bool help = false;

	/* argv[0] is skipped.  Throws Rescue::UsageError.  */
	static Options parse(std::vector<std::string> const& argv);

	static void print_help(std::ostream&, std::string const& argv0);
};

}

#endif /* !defined(RESCUE_OPTIONS_HPP) */
