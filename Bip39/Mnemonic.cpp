#include"Bip39/Mnemonic.hpp"
#include"Bip39/wordlist.hpp"
#include"Sha512/pbkdf2.hpp"
#include"Util/Str.hpp"
#include<sodium/crypto_hash_sha256.h>
#include<sodium/utils.h>

namespace Bip39 {

Mnemonic::Mnemonic(std::string const& phrase) {
	words = Util::Str::words(Util::Str::lowercase(phrase));

	auto count = words.size();
	if (count < 12 || count > 24 || count % 3 != 0)
		throw InvalidMnemonic(
			"expected 12, 15, 18, 21 or 24 words, got "
			+ std::to_string(count)
		);

	/* Pack the 11-bit word indices, most significant
	 * bit first.  */
	auto bits = std::vector<bool>();
	bits.reserve(count * 11);
	for (auto i = std::size_t(0); i < count; ++i) {
		/* Do not echo the word itself; it would end
		 * up in the log.  */
		auto idx = word_index(words[i]);
		if (idx < 0)
			throw InvalidMnemonic(
				"word " + std::to_string(i + 1)
				+ " is not in the BIP-39 word list"
			);
		for (auto b = 10; b >= 0; --b)
			bits.push_back(((idx >> b) & 1) != 0);
	}

	/* ENT + CS = 11 * count, CS = ENT / 32.  */
	auto cs_bits = count / 3;
	auto ent_bits = count * 11 - cs_bits;
	auto entropy = std::vector<std::uint8_t>(ent_bits / 8, 0);
	for (auto i = std::size_t(0); i < ent_bits; ++i)
		if (bits[i])
			entropy[i / 8] |= std::uint8_t(0x80 >> (i % 8));

	std::uint8_t hash[crypto_hash_sha256_BYTES];
	crypto_hash_sha256(hash, entropy.data(), entropy.size());
	for (auto i = std::size_t(0); i < cs_bits; ++i) {
		auto expected = ((hash[i / 8] >> (7 - (i % 8))) & 1) != 0;
		if (bits[ent_bits + i] != expected) {
			sodium_memzero(entropy.data(), entropy.size());
			throw InvalidMnemonic("checksum mismatch");
		}
	}
	sodium_memzero(entropy.data(), entropy.size());
	sodium_memzero(hash, sizeof(hash));
}

Mnemonic::~Mnemonic() {
	for (auto& w : words)
		if (!w.empty())
			sodium_memzero(&w[0], w.size());
}

std::string Mnemonic::phrase() const {
	return Util::Str::join(words, " ");
}

void Mnemonic::to_seed( std::uint8_t seed[64]
		      , std::string const& passphrase
		      ) const {
	auto password = phrase();
	Sha512::pbkdf2( seed, 64
		      , password
		      , "mnemonic" + passphrase
		      , 2048
		      );
	sodium_memzero(&password[0], password.size());
}

}
