#ifndef RESCUE_RESET_RECOVERY_HPP
#define RESCUE_RESET_RECOVERY_HPP

#include<string>

namespace Rescue {

/** Rescue::reset_recovery
 *
 * @brief deletes the recovery state file and the node
 * engine data directory under the given directory.
 *
 * @desc Either being absent already is fine.
 * Throws std::runtime_error on any other failure.
 */
void reset_recovery(std::string const& dir);

}

#endif /* !defined(RESCUE_RESET_RECOVERY_HPP) */
