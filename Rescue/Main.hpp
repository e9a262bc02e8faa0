#ifndef RESCUE_MAIN_HPP
#define RESCUE_MAIN_HPP

#include<functional>
#include<istream>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Net { class Fd; }

namespace Rescue {

/** class Rescue::Main
 *
 * @brief the chanrescue program.
 *
 * @desc Exit codes: 0 when recovery completed or
 * was interrupted, 1 on failure, 2 on a bad command
 * line.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Main() = delete;
	Main( std::vector<std::string> argv
	    , std::istream& cin
	    , std::ostream& cout
	    , std::ostream& cerr
	    , std::function< Net::Fd( std::string const&
				    , std::string const&
				    )
			   > open_rpc_socket
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(RESCUE_MAIN_HPP) */
