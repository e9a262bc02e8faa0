#include"Util/Rw.hpp"
#include<errno.h>
#include<unistd.h>

namespace Util { namespace Rw {

bool write_all(int fd, void const* p, std::size_t size) {
	auto cur = static_cast<char const*>(p);
	auto end = cur + size;
	while (cur < end) {
		auto res = write(fd, cur, std::size_t(end - cur));
		if (res < 0) {
			if (errno == EINTR)
				continue;
			return false;
		}
		cur += res;
	}
	return true;
}

bool read_to_eof(int fd, std::string& out) {
	char buf[4096];
	for (;;) {
		auto res = read(fd, buf, sizeof(buf));
		if (res < 0) {
			if (errno == EINTR)
				continue;
			return false;
		}
		if (res == 0)
			return true;
		out.append(buf, std::size_t(res));
	}
}

}}
