#include"Aead/Key.hpp"
#include"Bip32/ExtKey.hpp"
#include"Bip39/Mnemonic.hpp"
#include"Scb/derive_key.hpp"
#include<cstdint>
#include<sodium/utils.h>

namespace {

auto constexpr app_index = std::uint32_t(128029);
auto constexpr key_index = std::uint32_t(0);

}

namespace Scb {

Aead::Key derive_key(Bip39::Mnemonic const& mnemonic) {
	std::uint8_t seed[64];
	mnemonic.to_seed(seed);
	auto master = Bip32::ExtKey::master(seed, sizeof(seed));
	sodium_memzero(seed, sizeof(seed));

	auto node = master.derive_hardened(app_index)
			  .derive_hardened(key_index)
			  ;

	std::uint8_t buf[32];
	node.private_key().to_buffer(buf);
	auto ret = Aead::Key::from_buffer(buf);
	sodium_memzero(buf, sizeof(buf));
	return ret;
}

}
