#undef NDEBUG
#include"Ln/NodeId.hpp"
#include<assert.h>
#include<sstream>

namespace {

auto const g = std::string("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
auto const two_g = std::string("02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5");

bool rejects(std::string const& s) {
	try {
		(void) Ln::NodeId(s);
	} catch (Ln::InvalidNodeId const&) {
		return true;
	}
	return false;
}

}

int main() {
	auto a = Ln::NodeId(g);
	auto b = Ln::NodeId(two_g);
	assert(a != b);
	assert(a < b);
	assert(std::string(a) == g);

	b = a;
	assert(a == b);

	auto ss = std::ostringstream();
	ss << Ln::NodeId("037e702144c4fa485d42f0f69864e943605823763866cf4bf619d2d2cf2eda420b");
	assert(ss.str() == "037e702144c4fa485d42f0f69864e943605823763866cf4bf619d2d2cf2eda420b");

	assert(Ln::NodeId::valid_string(g));
	assert(Ln::NodeId::valid_string("02F9308A019258C31049344F85F89D5229B531C845836F99B08601F113BCE036F9"));
	/* Wrong length.  */
	assert(!Ln::NodeId::valid_string(g.substr(0, 64)));
	/* Not hex.  */
	assert(!Ln::NodeId::valid_string("zz" + g.substr(2)));
	/* Uncompressed prefix.  */
	assert(!Ln::NodeId::valid_string("04" + g.substr(2)));
	/* Not on the curve.  */
	assert(!Ln::NodeId::valid_string("020000000000000000000000000000000000000000000000000000000000000000"));

	assert(rejects(""));
	assert(rejects("05" + g.substr(2)));

	return 0;
}
