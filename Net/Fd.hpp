#ifndef NET_FD_HPP
#define NET_FD_HPP

#include<cstddef>
#include<string>
#include<sys/types.h>

namespace Net {

/** class Net::Fd
 *
 * @brief owns a file descriptor: the RPC socket, the
 * backup and state files, the log file.
 *
 * @desc Closing on destruction ignores errors.
 * Call close() where a failed close matters, as when
 * a written file must reach the disk.
 */
class Fd {
private:
	int fd;

public:
	Fd(std::nullptr_t = nullptr) : fd(-1) { }
	explicit Fd(int fd_) : fd(fd_) { }
	Fd(Fd const&) =delete;
	Fd(Fd&& o) : fd(o.release()) { }
	Fd& operator=(Fd&& o);
	~Fd();

	/* Wraps open(2).  On failure the result is empty
	 * and errno is left as open set it.  */
	static Fd open(std::string const& path, int flags, mode_t mode = 0);

	int get() const { return fd; }
	int release() {
		auto ret = fd;
		fd = -1;
		return ret;
	}
	/* Closes now, ignoring errors.  */
	void reset();
	/* Closes now; false with errno set on failure.
	 * Empty afterwards either way.  */
	bool close();

	explicit operator bool() const { return fd >= 0; }
	bool operator!() const { return fd < 0; }
};

}

#endif /* !defined(NET_FD_HPP) */
