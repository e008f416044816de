#ifndef BLK_KERNEL_WALLET_H
#define BLK_KERNEL_WALLET_H
#include "../policy/messages.h"

namespace blackcheck
{
	namespace ledger
	{
		struct wallet
		{
			algorithm::seckey_t secret_key;
			algorithm::pubkey_t public_key;
			algorithm::pubkeyhash_t public_key_hash;

			bool set_secret_key(const algorithm::seckey_t& value);
			void set_public_key_hash(const algorithm::pubkeyhash_t& value);
			bool verify_secret_key() const;
			bool verify_public_key() const;
			bool verify(const messages::authentic& message) const;
			bool recovers(const messages::authentic& message) const;
			bool sign(messages::authentic& message) const;
			bool has_secret_key() const;
			bool has_public_key() const;
			bool has_public_key_hash() const;
			string get_address() const;
			uptr<schema> as_schema() const;
			static wallet from_seed(const std::string_view& seed = std::string_view());
			static wallet from_secret_key(const algorithm::seckey_t& key);
			static wallet from_public_key_hash(const algorithm::pubkeyhash_t& key);
			static wallet from_identity(const std::string_view& identity);
		};
	}
}
#endif
