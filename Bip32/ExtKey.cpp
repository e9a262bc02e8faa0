#include"Bip32/ExtKey.hpp"
#include"Sha512/Hmac.hpp"
#include"Util/BacktraceException.hpp"
#include<algorithm>
#include<sodium/utils.h>
#include<stdexcept>
#include<string>

namespace Bip32 {

ExtKey::ExtKey(std::uint8_t const i[64])
	: key(Secp256k1::PrivKey::from_buffer(i)) {
	std::copy(i + 32, i + 64, chain);
}

ExtKey::ExtKey(ExtKey const& o) : key(o.key) {
	std::copy(o.chain, o.chain + 32, chain);
}
ExtKey& ExtKey::operator=(ExtKey const& o) {
	key = o.key;
	std::copy(o.chain, o.chain + 32, chain);
	return *this;
}
ExtKey::~ExtKey() {
	sodium_memzero(chain, sizeof(chain));
}

ExtKey ExtKey::master(std::uint8_t const* seed, std::size_t seed_size) {
	auto static const domain = std::string("Bitcoin seed");
	std::uint8_t i[64];
	Sha512::hmac(i, domain.data(), domain.size(), seed, seed_size);
	auto ret = ExtKey(i);
	sodium_memzero(i, sizeof(i));
	return ret;
}

ExtKey ExtKey::derive_hardened(std::uint32_t index) const {
	if (index >= hardened)
		throw Util::BacktraceException<std::invalid_argument>(
			"Bip32::ExtKey::derive_hardened: index "
			+ std::to_string(index) + " out of range"
		);
	index |= hardened;

	/* data = 0x00 || ser256(k) || ser32(i)  */
	std::uint8_t data[1 + 32 + 4];
	data[0] = 0;
	key.to_buffer(&data[1]);
	data[33] = std::uint8_t(index >> 24);
	data[34] = std::uint8_t(index >> 16);
	data[35] = std::uint8_t(index >> 8);
	data[36] = std::uint8_t(index);

	std::uint8_t i[64];
	Sha512::hmac(i, chain, sizeof(chain), data, sizeof(data));
	sodium_memzero(data, sizeof(data));

	/* k_i = parse256(I_L) + k (mod n)  */
	auto ret = ExtKey(i);
	ret.key += key;
	sodium_memzero(i, sizeof(i));
	return ret;
}

void ExtKey::chain_code(std::uint8_t out[32]) const {
	std::copy(chain, chain + 32, out);
}

}
