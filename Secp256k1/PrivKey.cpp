#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<secp256k1.h>
#include<sodium/utils.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

PrivKey::PrivKey(PrivKey const& o) {
	std::copy(o.key, o.key + 32, key);
}
PrivKey& PrivKey::operator=(PrivKey const& o) {
	std::copy(o.key, o.key + 32, key);
	return *this;
}
PrivKey::~PrivKey() {
	sodium_memzero(key, sizeof(key));
}

PrivKey PrivKey::from_buffer(std::uint8_t const buffer[32]) {
	if (!secp256k1_ec_seckey_verify(context(), buffer))
		throw InvalidPrivKey();
	auto ret = PrivKey();
	std::copy(buffer, buffer + 32, ret.key);
	return ret;
}
void PrivKey::to_buffer(std::uint8_t buffer[32]) const {
	std::copy(key, key + 32, buffer);
}

PrivKey& PrivKey::operator+=(PrivKey const& o) {
	if (!secp256k1_ec_seckey_tweak_add(context(), key, o.key))
		throw InvalidPrivKey();
	return *this;
}

bool PrivKey::operator==(PrivKey const& o) const {
	return sodium_memcmp(key, o.key, sizeof(key)) == 0;
}

PrivKey::operator std::string() const {
	return Util::Str::hexdump(key, sizeof(key));
}

}
