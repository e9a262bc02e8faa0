#ifndef BIP32_EXTKEY_HPP
#define BIP32_EXTKEY_HPP

#include"Secp256k1/PrivKey.hpp"
#include<cstddef>
#include<cstdint>

namespace Bip32 {

/** class Bip32::ExtKey
 *
 * @brief a BIP-32 extended private key: a private
 * key plus its chain code.
 *
 * @desc Only hardened derivation is provided.
 * Invalid intermediate keys (probability below
 * 2^-127) throw Secp256k1::InvalidPrivKey rather
 * than skipping to the next index.
 */
class ExtKey {
private:
	Secp256k1::PrivKey key;
	std::uint8_t chain[32];

	ExtKey(std::uint8_t const i[64]);

public:
	static constexpr std::uint32_t hardened = 0x80000000;

	ExtKey() =delete;
	ExtKey(ExtKey const&);
	ExtKey& operator=(ExtKey const&);
	~ExtKey();

	/* HMAC-SHA512 of the seed keyed with "Bitcoin seed".  */
	static ExtKey master(std::uint8_t const* seed, std::size_t seed_size);

	/* Derives child `index'`; `index` must be below
	 * 2^31, the hardened offset is added here.
	 * Throws std::invalid_argument otherwise.  */
	ExtKey derive_hardened(std::uint32_t index) const;

	Secp256k1::PrivKey const& private_key() const { return key; }
	void chain_code(std::uint8_t out[32]) const;
};

}

#endif /* !defined(BIP32_EXTKEY_HPP) */
