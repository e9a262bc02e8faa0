#ifndef UTIL_RW_HPP
#define UTIL_RW_HPP

#include<cstddef>
#include<string>

namespace Util { namespace Rw {

/* Blocking file descriptors only.
 * On false, errno says why.  */

bool write_all(int fd, void const* p, std::size_t size);

/* Appends everything up to end-of-file to `out`.
 * Whatever was read before an error stays in `out`.  */
bool read_to_eof(int fd, std::string& out);

}}

#endif /* UTIL_RW_HPP */
