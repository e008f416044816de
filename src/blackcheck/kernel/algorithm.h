#ifndef BLK_KERNEL_ALGORITHM_H
#define BLK_KERNEL_ALGORITHM_H
#include "../layer/format.h"

typedef struct secp256k1_context_struct secp256k1_context;

namespace blackcheck
{
	namespace algorithm
	{
		template <typename t, size_t s>
		struct storage_type
		{
			t data[s] = { 0 };

			storage_type() = default;
			storage_type(std::nullptr_t) = delete;
			storage_type(const t* new_data, size_t new_size)
			{
				if (new_data != nullptr)
					memcpy(data, new_data, std::min(new_size, sizeof(data)));
			}
			storage_type(const std::string_view& new_data)
			{
				memcpy(data, new_data.data(), std::min(new_data.size(), sizeof(data)));
			}
			storage_type(const storage_type&) = default;
			storage_type(storage_type&&) noexcept = default;
			storage_type& operator=(const storage_type&) = default;
			storage_type& operator=(storage_type&&) noexcept = default;
			void clear()
			{
				memset(data, 0, sizeof(data));
			}
			bool equals(const storage_type& other) const
			{
				return !memcmp(other.data, data, sizeof(data));
			}
			bool empty() const
			{
				t null[s] = { 0 };
				return !memcmp(data, null, sizeof(null));
			}
			std::string_view view() const
			{
				return std::string_view((char*)data, sizeof(data));
			}
			std::string_view optimized_view() const
			{
				size_t size = s;
				auto* ptr = data + size;
				while (size > 0 && !*(--ptr))
					--size;

				return std::string_view((char*)data, size);
			}
			bool operator== (const storage_type& other) const
			{
				return equals(other);
			}
			bool operator!= (const storage_type& other) const
			{
				return !equals(other);
			}
			bool operator< (const storage_type& other) const
			{
				return memcmp(data, other.data, sizeof(data)) < 0;
			}
		};

		using item_id = uint256_t;
		using hashsig_t = storage_type<uint8_t, 65>;
		using seckey_t = storage_type<uint8_t, 32>;
		using pubkey_t = storage_type<uint8_t, 33>;
		using pubkeyhash_t = storage_type<uint8_t, 20>;

		class signing
		{
		private:
			static secp256k1_context* shared_context;

		public:
			static void initialize();
			static void deinitialize();
			static uint256_t message_hash(const std::string_view& signable_message);
			static void keygen(seckey_t& secret_key);
			static bool recover(const uint256_t& hash, pubkey_t& public_key, const hashsig_t& signature);
			static bool recover_hash(const uint256_t& hash, pubkeyhash_t& public_key_hash, const hashsig_t& signature);
			static bool sign(const uint256_t& hash, const seckey_t& secret_key, hashsig_t& signature);
			static bool verify(const uint256_t& hash, const pubkey_t& public_key, const hashsig_t& signature);
			static bool verify_secret_key(const seckey_t& secret_key);
			static bool verify_public_key(const pubkey_t& public_key);
			static bool verify_address(const std::string_view& address);
			static void derive_secret_key(const uint256_t& entropy, seckey_t& secret_key);
			static void derive_secret_key(const std::string_view& seed, seckey_t& secret_key);
			static bool derive_public_key(const seckey_t& secret_key, pubkey_t& public_key);
			static void derive_public_key_hash(const pubkey_t& public_key, pubkeyhash_t& public_key_hash);
			static void derive_public_key_hash(const std::string_view& identity, pubkeyhash_t& public_key_hash);
			static bool decode_address(const std::string_view& address, pubkeyhash_t& public_key_hash);
			static bool encode_address(const pubkeyhash_t& public_key_hash, string& address);
			static string encode_address(const pubkeyhash_t& public_key_hash);
			static schema* serialize_public_key(const pubkey_t& public_key);
			static schema* serialize_address(const pubkeyhash_t& public_key_hash);
			static secp256k1_context* get_context();
		};

		class encoding
		{
		public:
			static bool decode_bytes(const std::string_view& value, uint8_t* data, size_t data_size);
			static string encode_0xhex256(const uint256_t& data);
			static uint256_t decode_0xhex256(const std::string_view& data);
			static uint32_t type_of(const std::string_view& name);
			static schema* serialize_uint256(const uint256_t& data, bool always16 = false);
		};

		class hashing
		{
		public:
			static uint32_t hash32d(const uint8_t* buffer, size_t size);
			static uint32_t hash32d(const std::string_view& buffer);
			static void hash160(const uint8_t* buffer, size_t size, uint8_t out_buffer[20]);
			static string hash160(const uint8_t* buffer, size_t size);
			static void hash256(const uint8_t* buffer, size_t size, uint8_t out_buffer[32]);
			static string hash256(const uint8_t* buffer, size_t size);
			static void hash512(const uint8_t* buffer, size_t size, uint8_t out_buffer[64]);
			static string hash512(const uint8_t* buffer, size_t size);
			static uint256_t hash256i(const uint8_t* buffer, size_t size);
			static uint256_t hash256i(const std::string_view& data);
		};

		/* Conversion amounts double per rank; the maximal rank is worth the whole supply */
		class rank
		{
		public:
			static uint256_t amount_for(uint8_t value);
			static bool is_valid(uint8_t value);
			static uint256_t unit();
			static uint256_t max_supply();
			static uint8_t max_rank();
			static uint8_t aggregate_rank();
			static uint32_t aggregate_size();
			static decimal to_decimal(const uint256_t& amount);
		};
	}
}

namespace vitex
{
	namespace core
	{
		template <>
		struct key_hasher<blackcheck::algorithm::pubkeyhash_t>
		{
			typedef int argument_type;
			typedef size_t result_type;
			using is_transparent = void;

			inline result_type operator()(const blackcheck::algorithm::pubkeyhash_t& value) const noexcept
			{
				return key_hasher<std::string_view>()(value.view());
			}
		};
	}
}
#endif
