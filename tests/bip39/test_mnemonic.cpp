#undef NDEBUG
#include"Bip39/Mnemonic.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<string>

namespace {

std::string repeat(std::string const& w, int n) {
	auto ret = std::string();
	for (auto i = 0; i < n; ++i)
		ret += w + " ";
	return ret;
}

bool rejects(std::string const& phrase) {
	try {
		(void) Bip39::Mnemonic(phrase);
	} catch (Bip39::InvalidMnemonic const&) {
		return true;
	}
	return false;
}

}

int main() {
	auto abandon = repeat("abandon", 11) + "about";

	{
		auto m = Bip39::Mnemonic(abandon);
		assert(m.size() == 12);
		assert(m.phrase() == abandon);

		std::uint8_t seed[64];
		m.to_seed(seed, "TREZOR");
		assert(Util::Str::hexdump(seed, 64) == "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e53495531f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04");
	}

	/* Case and spacing are normalized.  */
	{
		auto m = Bip39::Mnemonic("  LIMIT reward\texpect search tissue call\n"
					 "visa fit thank cream brave   Jump ");
		assert(m.phrase() == "limit reward expect search tissue call visa fit thank cream brave jump");
		assert(m == Bip39::Mnemonic("limit reward expect search tissue call visa fit thank cream brave jump"));
		assert(m != Bip39::Mnemonic(abandon));
	}

	/* 24 words.  */
	{
		auto m = Bip39::Mnemonic(repeat("abandon", 23) + "art");
		assert(m.size() == 24);
	}

	/* Checksum mismatch.  */
	assert(rejects(repeat("abandon", 12)));
	/* Unknown word.  */
	assert(rejects(repeat("abandon", 11) + "bitcoinz"));
	/* Bad word counts.  */
	assert(rejects(""));
	assert(rejects(repeat("abandon", 10) + "about"));
	assert(rejects(repeat("abandon", 13) + "about"));

	/* The offending word is not echoed back.  */
	try {
		Bip39::Mnemonic(repeat("abandon", 11) + "hunter2");
		assert(false);
	} catch (Bip39::InvalidMnemonic const& e) {
		assert(std::string(e.what()).find("hunter2") == std::string::npos);
	}

	return 0;
}
