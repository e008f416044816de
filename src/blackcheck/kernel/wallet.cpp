#include "wallet.h"

namespace blackcheck
{
	namespace ledger
	{
		bool wallet::set_secret_key(const algorithm::seckey_t& value)
		{
			secret_key = value;
			public_key.clear();
			public_key_hash.clear();
			if (!has_secret_key())
				return false;

			if (!algorithm::signing::derive_public_key(secret_key, public_key))
				return false;

			algorithm::signing::derive_public_key_hash(public_key, public_key_hash);
			return true;
		}
		void wallet::set_public_key_hash(const algorithm::pubkeyhash_t& value)
		{
			secret_key.clear();
			public_key.clear();
			public_key_hash = value;
		}
		bool wallet::verify_secret_key() const
		{
			return has_secret_key() && algorithm::signing::verify_secret_key(secret_key);
		}
		bool wallet::verify_public_key() const
		{
			if (!verify_secret_key())
				return false;

			algorithm::pubkey_t copy;
			if (!algorithm::signing::derive_public_key(secret_key, copy) || public_key != copy)
				return false;

			return algorithm::signing::verify_public_key(public_key);
		}
		bool wallet::verify(const messages::authentic& message) const
		{
			return has_public_key() && message.verify(public_key);
		}
		bool wallet::recovers(const messages::authentic& message) const
		{
			algorithm::pubkeyhash_t recover_public_key_hash;
			return message.recover_hash(recover_public_key_hash) && recover_public_key_hash == public_key_hash;
		}
		bool wallet::sign(messages::authentic& message) const
		{
			return has_secret_key() && message.sign(secret_key);
		}
		bool wallet::has_secret_key() const
		{
			return !secret_key.empty();
		}
		bool wallet::has_public_key() const
		{
			return !public_key.empty();
		}
		bool wallet::has_public_key_hash() const
		{
			return !public_key_hash.empty();
		}
		string wallet::get_address() const
		{
			string value;
			if (!has_public_key_hash())
				return value;

			algorithm::signing::encode_address(public_key_hash, value);
			return value;
		}
		uptr<schema> wallet::as_schema() const
		{
			schema* data = var::set::object();
			data->set("public_key", algorithm::signing::serialize_public_key(public_key));
			data->set("public_key_hash", var::string(format::util::encode_0xhex(public_key_hash.view())));
			data->set("address", algorithm::signing::serialize_address(public_key_hash));
			return data;
		}
		wallet wallet::from_seed(const std::string_view& seed)
		{
			algorithm::seckey_t key;
			if (seed.empty())
				algorithm::signing::keygen(key);
			else
				algorithm::signing::derive_secret_key(seed, key);
			return from_secret_key(key);
		}
		wallet wallet::from_secret_key(const algorithm::seckey_t& key)
		{
			wallet result;
			result.set_secret_key(key);
			return result;
		}
		wallet wallet::from_public_key_hash(const algorithm::pubkeyhash_t& key)
		{
			wallet result;
			result.set_public_key_hash(key);
			return result;
		}
		wallet wallet::from_identity(const std::string_view& identity)
		{
			algorithm::pubkeyhash_t key;
			algorithm::signing::derive_public_key_hash(identity, key);
			return from_public_key_hash(key);
		}
	}
}
