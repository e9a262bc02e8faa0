#include"Aead/Aes256Gcm.hpp"
#include"Aead/Key.hpp"
#include"Json/Out.hpp"
#include"Scb/Backup.hpp"
#include"Scb/derive_key.hpp"
#include"Scb/encode.hpp"
#include"Util/Str.hpp"

namespace Scb {

std::string encode_plaintext(Backup const& backup) {
	return backup.to_json().output() + "\n";
}

std::string encrypt( Backup const& backup
		   , Aead::Key const& key
		   , std::vector<std::uint8_t> const& nonce
		   ) {
	auto ciphertext = Aead::Aes256Gcm::encrypt( key, nonce
						  , encode_plaintext(backup)
						  );
	return Util::Str::hexdump(nonce)
	     + "-"
	     + Util::Str::hexdump(ciphertext)
	     ;
}

std::string encrypt( Backup const& backup
		   , Bip39::Mnemonic const& mnemonic
		   ) {
	return encrypt( backup
		      , derive_key(mnemonic)
		      , Aead::Aes256Gcm::random_nonce()
		      );
}

}
