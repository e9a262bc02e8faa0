#include"Sha512/Hmac.hpp"
#include"Sha512/pbkdf2.hpp"
#include<algorithm>
#include<sodium/utils.h>

namespace Sha512 {

void pbkdf2( std::uint8_t* out, std::size_t out_size
	   , std::string const& password
	   , std::string const& salt
	   , std::uint32_t iterations
	   ) {
	/* Keyed midstate, copied for every HMAC invocation.  */
	auto const keyed = Hmac(password.data(), password.size());

	std::uint8_t u[64];
	std::uint8_t t[64];

	auto block = std::uint32_t(1);
	for (auto offset = std::size_t(0); offset < out_size; ++block) {
		std::uint8_t be_block[4] = { std::uint8_t(block >> 24)
					   , std::uint8_t(block >> 16)
					   , std::uint8_t(block >> 8)
					   , std::uint8_t(block)
					   };
		/* U_1 = PRF(P, S || INT(i)) */
		auto h = keyed;
		h.feed(salt.data(), salt.size());
		h.feed(be_block, sizeof(be_block));
		std::move(h).finalize(u);
		std::copy(u, u + 64, t);

		/* U_j = PRF(P, U_{j-1}) */
		for (auto j = std::uint32_t(1); j < iterations; ++j) {
			auto hj = keyed;
			hj.feed(u, sizeof(u));
			std::move(hj).finalize(u);
			for (auto k = 0; k < 64; ++k)
				t[k] ^= u[k];
		}

		auto len = std::min(std::size_t(64), out_size - offset);
		std::copy(t, t + len, out + offset);
		offset += len;
	}

	sodium_memzero(u, sizeof(u));
	sodium_memzero(t, sizeof(t));
}

}
