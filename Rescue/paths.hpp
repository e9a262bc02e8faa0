#ifndef RESCUE_PATHS_HPP
#define RESCUE_PATHS_HPP

#include<string>
#include<utility>

namespace Rescue {

/* Files kept beside the executable.  */
extern char const* const log_file;
extern char const* const state_file;
extern char const* const node_data_dir;

/* The directory holding the running executable.
 * Falls back to the directory part of argv0.
 * Throws std::runtime_error if neither works.  */
std::string own_dir(std::string const& argv0);

/* `path` if absolute, else `dir/path`.  */
std::string resolve(std::string const& dir, std::string const& path);

/* Splits at the last slash: ("a/b", "c") for "a/b/c",
 * (".", "c") for "c".  */
std::pair<std::string, std::string> split_path(std::string const& path);

}

#endif /* !defined(RESCUE_PATHS_HPP) */
