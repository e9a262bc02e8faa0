#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include<assert.h>
#include<sstream>
#include<string>
#include<vector>

namespace {

std::string text(Jsmn::Object const& o) {
	auto os = std::ostringstream();
	os << o;
	return os.str();
}

}

int main() {
	auto vectors = std::vector<std::string>{
		R"JSON([0, 1, 2, 3])JSON",
		R"JSON(
		[ {"type": "ClaimableOnChannelClose", "amount_satoshis": 42}
		, {"nested": {"nested": {"leaf": 0}}}
		, [0, 1, 2, {}]
		, "x"
		]
		)JSON",
		R"JSON([])JSON",
	};
	for (auto const& v : vectors) {
		auto js = Jsmn::parse_document(v);

		auto i = std::size_t(0);
		for (auto entry : js) {
			assert(text(entry) == text(js[i]));
			++i;
		}
		assert(i == js.size());
		assert(js[i].is_null());
	}

	return 0;
}
