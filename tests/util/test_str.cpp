#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>

int main() {
	assert(Util::Str::hexbyte(0x0a) == "0a");
	assert(Util::Str::hexdump(std::vector<std::uint8_t>{0xde, 0xad, 0x01}) == "dead01");

	auto bytes = Util::Str::hexread("00ff7F");
	assert(bytes.size() == 3);
	assert(bytes[0] == 0x00);
	assert(bytes[1] == 0xff);
	assert(bytes[2] == 0x7f);

	auto thrown = false;
	try {
		Util::Str::hexread("abc");
	} catch (Util::Str::HexParseFailure const&) {
		thrown = true;
	}
	assert(thrown);
	thrown = false;
	try {
		Util::Str::hexread("zz");
	} catch (Util::Str::HexParseFailure const&) {
		thrown = true;
	}
	assert(thrown);

	assert(Util::Str::ishex("0a1B"));
	assert(!Util::Str::ishex("0a1"));
	assert(!Util::Str::ishex("0g"));

	assert(Util::Str::trim("  x y \n") == "x y");
	assert(Util::Str::trim("   ") == "");

	auto fields = Util::Str::split("a-b--c", '-');
	assert(fields.size() == 4);
	assert(fields[2] == "");
	assert(Util::Str::split("", '-').size() == 1);

	auto ws = Util::Str::words("  limit\treward \n expect ");
	assert(ws.size() == 3);
	assert(ws[0] == "limit");
	assert(ws[2] == "expect");
	assert(Util::Str::join(ws, " ") == "limit reward expect");

	assert(Util::Str::lowercase("LiMiT") == "limit");

	assert(Util::Str::fmt("%s=%d", "port", 9735) == "port=9735");

	return 0;
}
