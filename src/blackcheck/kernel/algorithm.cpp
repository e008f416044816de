#include "algorithm.h"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <sodium.h>

namespace blackcheck
{
	namespace algorithm
	{
		void signing::initialize()
		{
			if (!shared_context)
				shared_context = secp256k1_context_create(SECP256K1_CONTEXT_VERIFY | SECP256K1_CONTEXT_SIGN);
		}
		void signing::deinitialize()
		{
			if (shared_context != nullptr)
			{
				secp256k1_context_destroy(shared_context);
				shared_context = nullptr;
			}
		}
		uint256_t signing::message_hash(const std::string_view& signable_message)
		{
			format::wo_stream message;
			message.write_typeless(protocol::now().account.message_magic);
			message.write_typeless(signable_message.data(), signable_message.size());
			return message.hash();
		}
		void signing::keygen(seckey_t& secret_key)
		{
			while (true)
			{
				if (!crypto::fill_random_bytes(secret_key.data, sizeof(seckey_t)))
					break;
				else if (verify_secret_key(secret_key))
					break;
			}
		}
		bool signing::recover(const uint256_t& hash, pubkey_t& public_key, const hashsig_t& signature)
		{
			uint8_t recovery_id = 0;
			size_t recovery_offset = sizeof(hashsig_t) - sizeof(recovery_id);
			memcpy(&recovery_id, signature.data + recovery_offset, sizeof(recovery_id));
			if (recovery_id > 3)
				return false;

			secp256k1_context* context = get_context();
			secp256k1_ecdsa_recoverable_signature recoverable_signature;
			if (!secp256k1_ecdsa_recoverable_signature_parse_compact(context, &recoverable_signature, signature.data, recovery_id))
				return false;

			uint8_t data[32];
			hash.encode(data);

			secp256k1_pubkey recovered_public_key;
			if (secp256k1_ecdsa_recover(context, &recovered_public_key, &recoverable_signature, data) != 1)
				return false;

			size_t public_key_size = sizeof(pubkey_t);
			return secp256k1_ec_pubkey_serialize(context, public_key.data, &public_key_size, &recovered_public_key, SECP256K1_EC_COMPRESSED) == 1;
		}
		bool signing::recover_hash(const uint256_t& hash, pubkeyhash_t& public_key_hash, const hashsig_t& signature)
		{
			pubkey_t public_key;
			if (!recover(hash, public_key, signature))
				return false;

			derive_public_key_hash(public_key, public_key_hash);
			return true;
		}
		bool signing::sign(const uint256_t& hash, const seckey_t& secret_key, hashsig_t& signature)
		{
			uint8_t data[32];
			hash.encode(data);
			signature.clear();

			secp256k1_context* context = get_context();
			secp256k1_ecdsa_recoverable_signature recoverable_signature;
			if (secp256k1_ecdsa_sign_recoverable(context, &recoverable_signature, data, secret_key.data, secp256k1_nonce_function_rfc6979, nullptr) != 1)
				return false;

			int recovery_id = 0;
			if (secp256k1_ecdsa_recoverable_signature_serialize_compact(context, signature.data, &recovery_id, &recoverable_signature) != 1)
				return false;

			signature.data[sizeof(hashsig_t) - 1] = (uint8_t)recovery_id;
			return true;
		}
		bool signing::verify(const uint256_t& hash, const pubkey_t& public_key, const hashsig_t& signature)
		{
			secp256k1_context* context = get_context();
			secp256k1_ecdsa_signature compact_signature;
			if (secp256k1_ecdsa_signature_parse_compact(context, &compact_signature, signature.data) != 1)
				return false;

			secp256k1_pubkey derived_public_key;
			if (secp256k1_ec_pubkey_parse(context, &derived_public_key, public_key.data, sizeof(pubkey_t)) != 1)
				return false;

			uint8_t data[32];
			secp256k1_ecdsa_signature normalized_signature;
			secp256k1_ecdsa_signature_normalize(context, &normalized_signature, &compact_signature);
			hash.encode(data);
			return secp256k1_ecdsa_verify(context, &normalized_signature, data, &derived_public_key) == 1;
		}
		bool signing::verify_secret_key(const seckey_t& secret_key)
		{
			secp256k1_context* context = get_context();
			return secp256k1_ec_seckey_verify(context, secret_key.data) == 1;
		}
		bool signing::verify_public_key(const pubkey_t& public_key)
		{
			secp256k1_pubkey derived_public_key;
			secp256k1_context* context = get_context();
			return secp256k1_ec_pubkey_parse(context, &derived_public_key, public_key.data, sizeof(pubkey_t)) == 1;
		}
		bool signing::verify_address(const std::string_view& address)
		{
			pubkeyhash_t public_key_hash;
			return decode_address(address, public_key_hash);
		}
		void signing::derive_secret_key(const uint256_t& entropy, seckey_t& secret_key)
		{
			auto hash = entropy;
			while (true)
			{
				hash.encode(secret_key.data);
				if (verify_secret_key(secret_key))
					break;

				hash = hashing::hash256i(secret_key.data, sizeof(seckey_t));
			}
		}
		void signing::derive_secret_key(const std::string_view& seed, seckey_t& secret_key)
		{
			derive_secret_key(hashing::hash256i(hashing::hash512((uint8_t*)seed.data(), seed.size())), secret_key);
		}
		bool signing::derive_public_key(const seckey_t& secret_key, pubkey_t& public_key)
		{
			secp256k1_pubkey derived_public_key;
			secp256k1_context* context = get_context();
			public_key.clear();
			if (secp256k1_ec_pubkey_create(context, &derived_public_key, secret_key.data) != 1)
				return false;

			size_t public_key_size = sizeof(pubkey_t);
			return secp256k1_ec_pubkey_serialize(context, public_key.data, &public_key_size, &derived_public_key, SECP256K1_EC_COMPRESSED) == 1;
		}
		void signing::derive_public_key_hash(const pubkey_t& public_key, pubkeyhash_t& public_key_hash)
		{
			hashing::hash160(public_key.data, sizeof(pubkey_t), public_key_hash.data);
		}
		void signing::derive_public_key_hash(const std::string_view& identity, pubkeyhash_t& public_key_hash)
		{
			hashing::hash160((uint8_t*)identity.data(), identity.size(), public_key_hash.data);
		}
		bool signing::decode_address(const std::string_view& address, pubkeyhash_t& public_key_hash)
		{
			auto& prefix = protocol::now().account.address_prefix;
			if (address.size() != prefix.size() + 1 + 2 + sizeof(pubkeyhash_t) * 2)
				return false;
			else if (!stringify::starts_with(address, prefix) || address[prefix.size()] != ':')
				return false;

			auto text = address.substr(prefix.size() + 1);
			if (!format::util::is_hex_encoding(text) || !stringify::starts_with(text, "0x"))
				return false;

			auto data = format::util::decode_0xhex(text);
			if (data.size() != sizeof(pubkeyhash_t))
				return false;

			memcpy(public_key_hash.data, data.data(), data.size());
			return true;
		}
		bool signing::encode_address(const pubkeyhash_t& public_key_hash, string& address)
		{
			auto& prefix = protocol::now().account.address_prefix;
			if (prefix.empty())
				return false;

			address = prefix;
			address.append(1, ':');
			address.append(format::util::encode_0xhex(public_key_hash.view()));
			return true;
		}
		string signing::encode_address(const pubkeyhash_t& public_key_hash)
		{
			string address;
			if (!encode_address(public_key_hash, address))
				return string();

			return address;
		}
		schema* signing::serialize_public_key(const pubkey_t& public_key)
		{
			if (public_key.empty())
				return var::set::null();

			return var::set::string(format::util::encode_0xhex(public_key.view()));
		}
		schema* signing::serialize_address(const pubkeyhash_t& public_key_hash)
		{
			if (public_key_hash.empty())
				return var::set::null();

			string data;
			if (!encode_address(public_key_hash, data))
				return var::set::null();

			return var::set::string(data);
		}
		secp256k1_context* signing::get_context()
		{
			VI_ASSERT(shared_context != nullptr, "secp256k1 context is not initialized");
			return shared_context;
		}
		secp256k1_context* signing::shared_context = nullptr;

		bool encoding::decode_bytes(const std::string_view& value, uint8_t* data, size_t data_size)
		{
			VI_ASSERT(data != nullptr, "data should be set");
			if (value.size() < data_size)
				memset(data, 0, data_size);
			else if (value.size() > data_size)
				return false;

			memcpy(data, value.data(), value.size());
			return true;
		}
		string encoding::encode_0xhex256(const uint256_t& value)
		{
			uint8_t data[32];
			value.encode(data);
			return "0x" + codec::hex_encode(std::string_view((char*)data, sizeof(data)));
		}
		uint256_t encoding::decode_0xhex256(const std::string_view& data)
		{
			if (data.size() < 2)
				return uint256_t(0);

			return uint256_t(data[0] == '0' && data[1] == 'x' ? data.substr(2) : data, 16);
		}
		uint32_t encoding::type_of(const std::string_view& name)
		{
			return hashing::hash32d(name);
		}
		schema* encoding::serialize_uint256(const uint256_t& value, bool always16)
		{
			if (!always16 && value <= std::numeric_limits<int64_t>::max())
				return var::set::integer((uint64_t)value);

			uint8_t data[32];
			value.encode(data);

			size_t size = value.bytes();
			return var::set::string(format::util::encode_0xhex(std::string_view((char*)data + (sizeof(data) - size), size)));
		}

		uint32_t hashing::hash32d(const uint8_t* buffer, size_t size)
		{
			auto hash = crypto::hash(digests::sha1(), std::string_view((char*)buffer, size));
			if (!hash || hash->size() < sizeof(uint32_t))
				return 0;

			uint32_t result;
			memcpy(&result, hash->data(), sizeof(result));
			return os::hw::to_endianness(os::hw::endian::little, result);
		}
		uint32_t hashing::hash32d(const std::string_view& buffer)
		{
			return hash32d((uint8_t*)buffer.data(), buffer.size());
		}
		void hashing::hash160(const uint8_t* buffer, size_t size, uint8_t out_buffer[20])
		{
			crypto_generichash_blake2b(out_buffer, 20, buffer, (unsigned long long)size, nullptr, 0);
		}
		string hashing::hash160(const uint8_t* buffer, size_t size)
		{
			uint8_t hash[20];
			hash160(buffer, size, hash);
			return string((char*)hash, sizeof(hash));
		}
		void hashing::hash256(const uint8_t* buffer, size_t size, uint8_t out_buffer[32])
		{
			crypto_generichash_blake2b(out_buffer, 32, buffer, (unsigned long long)size, nullptr, 0);
		}
		string hashing::hash256(const uint8_t* buffer, size_t size)
		{
			uint8_t hash[32];
			hash256(buffer, size, hash);
			return string((char*)hash, sizeof(hash));
		}
		void hashing::hash512(const uint8_t* buffer, size_t size, uint8_t out_buffer[64])
		{
			crypto_hash_sha512(out_buffer, buffer, (unsigned long long)size);
		}
		string hashing::hash512(const uint8_t* buffer, size_t size)
		{
			uint8_t hash[crypto_hash_sha512_BYTES];
			hash512(buffer, size, hash);
			return string((char*)hash, sizeof(hash));
		}
		uint256_t hashing::hash256i(const uint8_t* buffer, size_t size)
		{
			uint8_t hash[32];
			hash256(buffer, size, hash);

			uint256_t value;
			value.decode(hash);
			return value;
		}
		uint256_t hashing::hash256i(const std::string_view& data)
		{
			return hash256i((uint8_t*)data.data(), data.size());
		}

		uint256_t rank::amount_for(uint8_t value)
		{
			VI_ASSERT(is_valid(value), "rank should be in range");
			if (value >= max_rank())
				return max_supply();

			uint256_t multiplier = (uint64_t)1 << value;
			return multiplier * unit() / uint256_t(protocol::now().policy.rank_divisor);
		}
		bool rank::is_valid(uint8_t value)
		{
			return value <= max_rank();
		}
		uint256_t rank::unit()
		{
			uint256_t result = 1;
			for (uint8_t i = 0; i < protocol::now().policy.token_decimals; i++)
				result *= 10;
			return result;
		}
		uint256_t rank::max_supply()
		{
			return unit();
		}
		uint8_t rank::max_rank()
		{
			return protocol::now().policy.max_rank;
		}
		uint8_t rank::aggregate_rank()
		{
			return protocol::now().policy.aggregate_rank;
		}
		uint32_t rank::aggregate_size()
		{
			return protocol::now().policy.aggregate_size;
		}
		decimal rank::to_decimal(const uint256_t& amount)
		{
			size_t decimals = (size_t)protocol::now().policy.token_decimals;
			string digits = amount.to_string();
			if (digits.size() <= decimals)
				digits.insert(digits.begin(), decimals + 1 - digits.size(), '0');

			digits.insert(digits.size() - decimals, 1, '.');
			return decimal(digits);
		}
	}
}
