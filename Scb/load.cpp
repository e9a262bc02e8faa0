#include"Aead/Aes256Gcm.hpp"
#include"Aead/Key.hpp"
#include"Bip39/Mnemonic.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Jsmn/Parser.hpp"
#include"Net/Fd.hpp"
#include"Scb/DecodeError.hpp"
#include"Scb/derive_key.hpp"
#include"Scb/load.hpp"
#include"Util/Rw.hpp"
#include"Util/Str.hpp"
#include<errno.h>
#include<fcntl.h>
#include<functional>
#include<string.h>

namespace {

/* Structural check only; overlong forms are not rejected.  */
bool valid_utf8(std::string const& s) {
	auto i = std::size_t(0);
	while (i < s.size()) {
		auto c = (unsigned char) s[i];
		auto extra = std::size_t(0);
		if (c < 0x80)
			extra = 0;
		else if ((c & 0xE0) == 0xC0 && c >= 0xC2)
			extra = 1;
		else if ((c & 0xF0) == 0xE0)
			extra = 2;
		else if ((c & 0xF8) == 0xF0 && c <= 0xF4)
			extra = 3;
		else
			return false;
		if (i + extra >= s.size() && extra != 0)
			return false;
		for (auto j = std::size_t(1); j <= extra; ++j)
			if ((((unsigned char) s[i + j]) & 0xC0) != 0x80)
				return false;
		i += extra + 1;
	}
	return true;
}

Scb::Backup load_with( std::string const& contents
		     , std::function<Aead::Key()> get_key
		     ) {
	try {
		return Scb::parse_plaintext(contents);
	} catch (Scb::DecodeError const& plain_err) {
		try {
			return Scb::parse_encrypted(contents, get_key());
		} catch (Scb::DecodeError const& enc_err) {
			/* The encrypted error is the more likely
			 * real cause; keep its kind.  */
			throw Scb::DecodeError(
				enc_err.kind(),
				enc_err.detail()
				+ " (as plaintext: "
				+ plain_err.detail()
				+ ")"
			);
		}
	}
}

}

namespace Scb {

Backup parse_plaintext(std::string const& contents) {
	auto js = Jsmn::Object();
	try {
		js = Jsmn::parse_document(contents);
	} catch (Jsmn::ParseError const& e) {
		throw DecodeError(DecodeError::MalformedJson, e.what());
	}
	return Backup::from_json(js);
}

std::string decrypt(std::string const& contents, Aead::Key const& key) {
	auto parts = Util::Str::split(Util::Str::trim(contents), '-');
	if (parts.size() != 2)
		throw DecodeError( DecodeError::MalformedEncoding
				 , "expected <nonce>-<ciphertext>, got "
				 + std::to_string(parts.size())
				 + " dash-separated parts"
				 );

	auto nonce = std::vector<std::uint8_t>();
	auto ciphertext = std::vector<std::uint8_t>();
	try {
		nonce = Util::Str::hexread(parts[0]);
	} catch (Util::Str::HexParseFailure const& e) {
		throw DecodeError( DecodeError::MalformedEncoding
				 , std::string("nonce: ") + e.what()
				 );
	}
	try {
		ciphertext = Util::Str::hexread(parts[1]);
	} catch (Util::Str::HexParseFailure const& e) {
		throw DecodeError( DecodeError::MalformedEncoding
				 , std::string("ciphertext: ") + e.what()
				 );
	}

	try {
		return Aead::Aes256Gcm::decrypt(key, nonce, ciphertext);
	} catch (Aead::InvalidNonce const& e) {
		throw DecodeError(DecodeError::MalformedEncoding, e.what());
	} catch (Aead::AuthenticationFailed const&) {
		throw DecodeError( DecodeError::AuthenticationFailed
				 , "decryption failed; the backup was "
				   "modified or does not belong to this "
				   "seed phrase"
				 );
	}
}

Backup parse_encrypted(std::string const& contents, Aead::Key const& key) {
	auto plaintext = decrypt(contents, key);
	if (!valid_utf8(plaintext))
		throw DecodeError( DecodeError::MalformedJson
				 , "decrypted backup is not UTF-8"
				 );
	return parse_plaintext(plaintext);
}

Backup load(std::string const& contents, Aead::Key const& key) {
	return load_with(contents, [&key]() { return key; });
}
Backup load(std::string const& contents, Bip39::Mnemonic const& mnemonic) {
	return load_with(contents, [&mnemonic]() {
		return derive_key(mnemonic);
	});
}

Backup load_file(std::string const& path, Bip39::Mnemonic const& mnemonic) {
	auto fd = Net::Fd::open(path, O_RDONLY);
	if (!fd)
		throw DecodeError( DecodeError::Unreadable
				 , path + ": " + strerror(errno)
				 );
	auto contents = std::string();
	if (!Util::Rw::read_to_eof(fd.get(), contents))
		throw DecodeError( DecodeError::Unreadable
				 , path + ": " + strerror(errno)
				 );
	return load(contents, mnemonic);
}

}
