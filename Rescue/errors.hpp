#ifndef RESCUE_ERRORS_HPP
#define RESCUE_ERRORS_HPP

#include"Util/BacktraceException.hpp"
#include<set>
#include<stdexcept>
#include<string>

namespace Rescue {

/* The recovery state file could not be read, parsed or
 * written.  Fatal: losing track of force-close progress
 * risks repeating destructive actions.  */
struct PersistenceError : public Util::BacktraceException<std::runtime_error> {
	explicit
	PersistenceError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"recovery state: " + msg
		  ) { }
};

/* Attempt to move a channel back to an earlier state.  */
struct InvalidTransition : public Util::BacktraceException<std::logic_error> {
	explicit
	InvalidTransition(std::string const& msg)
		: Util::BacktraceException<std::logic_error>(msg) { }
};

/* The backup names a different set of channels than the
 * recovery state recorded on an earlier run.  */
struct StateMismatchError : public Util::BacktraceException<std::runtime_error> {
	/* Channel ids in the backup but not the state, and
	 * vice versa.  */
	std::set<std::string> only_in_backup;
	std::set<std::string> only_in_state;

	StateMismatchError( std::set<std::string> only_in_backup_
			  , std::set<std::string> only_in_state_
			  ) : Util::BacktraceException<std::runtime_error>(
				"static channel backup file does not match "
				"the stored recovery state"
			      )
			    , only_in_backup(std::move(only_in_backup_))
			    , only_in_state(std::move(only_in_state_))
			    { }
};

/* A backup entry whose peer id or address cannot be used.  */
struct InvalidBackup : public Util::BacktraceException<std::runtime_error> {
	explicit
	InvalidBackup(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"bad static channel backup: " + msg
		  ) { }
};

/* Recorded, never thrown: one peer could not be reached.  */
struct PeerConnectionError {
	std::string peer_id;
	std::string address;
	std::string message;
};

}

#endif /* !defined(RESCUE_ERRORS_HPP) */
