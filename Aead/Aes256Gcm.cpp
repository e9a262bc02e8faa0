#include"Aead/Aes256Gcm.hpp"
#include"Aead/Key.hpp"
#include<memory>
#include<openssl/evp.h>
#include<sodium/core.h>
#include<sodium/randombytes.h>

namespace {

struct CtxDeleter {
	void operator()(EVP_CIPHER_CTX* ctx) const {
		EVP_CIPHER_CTX_free(ctx);
	}
};
typedef std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter> Ctx;

Ctx make_ctx() {
	auto ctx = Ctx(EVP_CIPHER_CTX_new());
	if (!ctx)
		throw Aead::CipherError("EVP_CIPHER_CTX_new failed");
	return ctx;
}

void check_nonce(std::vector<std::uint8_t> const& nonce) {
	if (nonce.size() != Aead::Aes256Gcm::nonce_size)
		throw Aead::InvalidNonce(nonce.size());
}

}

namespace Aead { namespace Aes256Gcm {

std::vector<std::uint8_t>
encrypt( Aead::Key const& key
       , std::vector<std::uint8_t> const& nonce
       , std::string const& plaintext
       ) {
	check_nonce(nonce);
	auto ctx = make_ctx();

	if (EVP_EncryptInit_ex( ctx.get(), EVP_aes_256_gcm()
			      , nullptr, nullptr, nullptr
			      ) != 1)
		throw CipherError("EVP_EncryptInit_ex failed");
	if (EVP_CIPHER_CTX_ctrl( ctx.get(), EVP_CTRL_GCM_SET_IVLEN
			       , int(nonce_size), nullptr
			       ) != 1)
		throw CipherError("cannot set nonce length");
	if (EVP_EncryptInit_ex( ctx.get(), nullptr, nullptr
			      , key.data(), nonce.data()
			      ) != 1)
		throw CipherError("cannot set key");

	auto ret = std::vector<std::uint8_t>(plaintext.size() + tag_size);
	auto len = int(0);
	if (EVP_EncryptUpdate( ctx.get(), ret.data(), &len
			     , (unsigned char const*) plaintext.data()
			     , int(plaintext.size())
			     ) != 1)
		throw CipherError("EVP_EncryptUpdate failed");
	auto total = std::size_t(len);
	if (EVP_EncryptFinal_ex(ctx.get(), ret.data() + total, &len) != 1)
		throw CipherError("EVP_EncryptFinal_ex failed");
	total += std::size_t(len);

	if (EVP_CIPHER_CTX_ctrl( ctx.get(), EVP_CTRL_GCM_GET_TAG
			       , int(tag_size), ret.data() + total
			       ) != 1)
		throw CipherError("cannot get tag");
	ret.resize(total + tag_size);
	return ret;
}

std::string
decrypt( Aead::Key const& key
       , std::vector<std::uint8_t> const& nonce
       , std::vector<std::uint8_t> const& ciphertext
       ) {
	check_nonce(nonce);
	if (ciphertext.size() < tag_size)
		throw AuthenticationFailed();
	auto body_size = ciphertext.size() - tag_size;

	auto ctx = make_ctx();
	if (EVP_DecryptInit_ex( ctx.get(), EVP_aes_256_gcm()
			      , nullptr, nullptr, nullptr
			      ) != 1)
		throw CipherError("EVP_DecryptInit_ex failed");
	if (EVP_CIPHER_CTX_ctrl( ctx.get(), EVP_CTRL_GCM_SET_IVLEN
			       , int(nonce_size), nullptr
			       ) != 1)
		throw CipherError("cannot set nonce length");
	if (EVP_DecryptInit_ex( ctx.get(), nullptr, nullptr
			      , key.data(), nonce.data()
			      ) != 1)
		throw CipherError("cannot set key");

	/* One extra byte so data() is never null.  */
	auto plain = std::string(body_size + 1, '\0');
	auto len = int(0);
	if (EVP_DecryptUpdate( ctx.get()
			     , (unsigned char*) &plain[0], &len
			     , ciphertext.data(), int(body_size)
			     ) != 1)
		throw CipherError("EVP_DecryptUpdate failed");
	auto total = std::size_t(len);

	/* OpenSSL wants a non-const tag buffer.  */
	auto tag = std::vector<std::uint8_t>( ciphertext.begin() + body_size
					    , ciphertext.end()
					    );
	if (EVP_CIPHER_CTX_ctrl( ctx.get(), EVP_CTRL_GCM_SET_TAG
			       , int(tag_size), tag.data()
			       ) != 1)
		throw CipherError("cannot set tag");
	if (EVP_DecryptFinal_ex( ctx.get()
			       , (unsigned char*) &plain[0] + total, &len
			       ) != 1)
		throw AuthenticationFailed();
	total += std::size_t(len);

	plain.resize(total);
	return plain;
}

std::vector<std::uint8_t> random_nonce() {
	if (sodium_init() < 0)
		throw CipherError("libsodium failed to initialize");
	auto ret = std::vector<std::uint8_t>(nonce_size);
	randombytes_buf(ret.data(), ret.size());
	return ret;
}

}}
