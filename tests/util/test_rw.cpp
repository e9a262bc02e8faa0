#undef NDEBUG
#include"Net/Fd.hpp"
#include"Util/Rw.hpp"
#include<assert.h>
#include<errno.h>
#include<fcntl.h>
#include<string>
#include<unistd.h>

int main() {
	auto const path = std::string("test_rw.tmp");
	unlink(path.c_str());

	/* Larger than one read buffer.  */
	auto text = std::string();
	for (auto i = 0; i < 3000; ++i)
		text += "0123456789"[i % 10];
	text += '\n';

	{
		auto fd = Net::Fd::open(path, O_WRONLY | O_CREAT | O_TRUNC, 0600);
		assert(fd);
		assert(Util::Rw::write_all(fd.get(), text.data(), text.size()));
		assert(Util::Rw::write_all(fd.get(), text.data(), text.size()));
		assert(fd.close());
		assert(!fd);
	}
	{
		auto fd = Net::Fd::open(path, O_RDONLY);
		assert(fd);
		auto out = std::string("prefix:");
		assert(Util::Rw::read_to_eof(fd.get(), out));
		assert(out == "prefix:" + text + text);
	}

	/* Errors are reported, not thrown.  */
	{
		auto fd = Net::Fd::open(path, O_RDONLY);
		assert(fd);
		assert(!Util::Rw::write_all(fd.get(), "x", 1));
		assert(errno == EBADF);
	}
	{
		auto fd = Net::Fd::open("no-such-dir/test_rw.tmp", O_RDONLY);
		assert(!fd);
		assert(errno == ENOENT);
	}

	unlink(path.c_str());
	return 0;
}
