#ifndef SECP256K1_PRIVKEY_HPP
#define SECP256K1_PRIVKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Secp256k1 {

/* A scalar that is zero or not below the group order.  */
class InvalidPrivKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPrivKey()
		: Util::BacktraceException<std::invalid_argument>("Invalid private key.") {}
};

/** class Secp256k1::PrivKey
 *
 * @brief a valid secp256k1 secret scalar, wiped from
 * memory on destruction.
 */
class PrivKey {
private:
	std::uint8_t key[32];

	PrivKey() =default;

public:
	PrivKey(PrivKey const&);
	PrivKey& operator=(PrivKey const&);
	~PrivKey();

	/* Big-endian.  Throws InvalidPrivKey.  */
	static PrivKey from_buffer(std::uint8_t const buffer[32]);
	void to_buffer(std::uint8_t buffer[32]) const;

	/* Modulo the group order.  Throws InvalidPrivKey
	 * if the sum is zero.  */
	PrivKey& operator+=(PrivKey const&);

	/* Constant-time.  */
	bool operator==(PrivKey const&) const;
	bool operator!=(PrivKey const& o) const {
		return !(*this == o);
	}

	/* Lowercase hex.  */
	explicit operator std::string() const;
};

}

#endif /* SECP256K1_PRIVKEY_HPP */
