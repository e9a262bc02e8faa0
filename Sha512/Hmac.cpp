#include"Sha512/Hmac.hpp"
#include<sodium/crypto_auth_hmacsha512.h>
#include<sodium/utils.h>

namespace Sha512 {

class Hmac::Impl {
private:
	crypto_auth_hmacsha512_state s;

public:
	Impl(void const* key, std::size_t key_size) {
		crypto_auth_hmacsha512_init( &s
					   , (unsigned char const*) key
					   , key_size
					   );
	}
	~Impl() {
		sodium_memzero(&s, sizeof(s));
	}
	Impl(Impl const&) =default;

	void feed(void const* p, std::size_t len) {
		crypto_auth_hmacsha512_update( &s
					     , (unsigned char const*) p
					     , len
					     );
	}
	void finalize(std::uint8_t out[64]) {
		crypto_auth_hmacsha512_final(&s, out);
	}
};

Hmac::Hmac( void const* key, std::size_t key_size
	  ) : pimpl(std::make_unique<Impl>(key, key_size)) { }
Hmac::Hmac(Hmac&&) =default;
Hmac::Hmac(Hmac const& o
	  ) : pimpl(o.pimpl ? std::make_unique<Impl>(*o.pimpl) : nullptr) { }
Hmac::~Hmac() =default;

Hmac::operator bool() const {
	return !!pimpl;
}

void Hmac::feed(void const* p, std::size_t len) {
	pimpl->feed(p, len);
}

void Hmac::finalize(std::uint8_t out[64])&& {
	pimpl->finalize(out);
	pimpl = nullptr;
}

void hmac( std::uint8_t out[64]
	 , void const* key, std::size_t key_size
	 , void const* data, std::size_t data_size
	 ) {
	auto h = Hmac(key, key_size);
	h.feed(data, data_size);
	std::move(h).finalize(out);
}

}
