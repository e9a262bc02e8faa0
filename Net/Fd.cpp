#include"Net/Fd.hpp"
#include<errno.h>
#include<fcntl.h>
#include<unistd.h>

namespace Net {

Fd& Fd::operator=(Fd&& o) {
	if (&o != this) {
		reset();
		fd = o.release();
	}
	return *this;
}
Fd::~Fd() {
	reset();
}

Fd Fd::open(std::string const& path, int flags, mode_t mode) {
	return Fd(::open(path.c_str(), flags | O_CLOEXEC, mode));
}

void Fd::reset() {
	if (fd < 0)
		return;
	auto saved = errno;
	::close(release());
	errno = saved;
}
bool Fd::close() {
	if (fd < 0)
		return true;
	return ::close(release()) == 0;
}

}
