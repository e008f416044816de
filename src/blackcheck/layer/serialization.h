#ifndef BLK_LAYER_SERIALIZATION_H
#define BLK_LAYER_SERIALIZATION_H
#include "../kernel/chain.h"

namespace blackcheck
{
	namespace format
	{
		struct ro_stream;

		enum class viewable : uint8_t
		{
			true_type,
			false_type,
			uint_min,
			uint_max = uint_min + sizeof(uint256_t),
			string_any,
			string_min,
			string_max = string_min + 104,
			invalid = 255
		};

		struct wo_stream
		{
			string data;
			uint256_t checksum;

			wo_stream();
			explicit wo_stream(const std::string_view& new_data);
			wo_stream(const wo_stream&) = default;
			wo_stream(wo_stream&&) noexcept = default;
			wo_stream& operator= (const wo_stream&) = default;
			wo_stream& operator= (wo_stream&&) noexcept = default;
			wo_stream& clear();
			wo_stream& write_string(const std::string_view& value);
			wo_stream& write_integer(const uint256_t& value);
			wo_stream& write_boolean(bool value);
			wo_stream& write_typeless(const uint256_t& value);
			wo_stream& write_typeless(const void* data, size_t size);
			string encode() const;
			uint256_t hash(bool renew = false) const;
			ro_stream ro() const;

		private:
			void write(const void* value, size_t size);
		};

		struct ro_stream
		{
			std::string_view data;
			size_t seek;

			ro_stream();
			explicit ro_stream(const std::string_view& new_data);
			ro_stream(const ro_stream&) = default;
			ro_stream(ro_stream&&) noexcept = default;
			ro_stream& operator= (const ro_stream&) = default;
			ro_stream& operator= (ro_stream&&) noexcept = default;
			ro_stream& rewind(size_t offset = 0);
			viewable read_type();
			bool read_type(viewable* value);
			bool read_string(viewable type, string* value);
			bool read_integer(viewable type, uint8_t* value);
			bool read_integer(viewable type, uint16_t* value);
			bool read_integer(viewable type, uint32_t* value);
			bool read_integer(viewable type, uint64_t* value);
			bool read_integer(viewable type, uint256_t* value);
			bool read_boolean(viewable type, bool* value);
			bool is_eof() const;

		private:
			size_t read(void* value, size_t size);
		};

		class util
		{
		public:
			static string encode_0xhex(const std::string_view& data);
			static string decode_0xhex(const std::string_view& data);
			static string assign_0xhex(const std::string_view& data);
			static string clear_0xhex(const std::string_view& data, bool uppercase = false);
			static bool is_hex_encoding(const std::string_view& data);
			static bool is_integer(viewable type);
			static bool is_string(viewable type);
			static uint8_t get_integer_size(viewable type);
			static viewable get_integer_type(const uint256_t& data);
			static uint8_t get_string_size(viewable type);
			static viewable get_string_type(const std::string_view& data);
			static size_t get_max_string_size();
		};
	}
}

namespace vitex
{
	namespace core
	{
		template <>
		struct key_hasher<uint256_t>
		{
			typedef float argument_type;
			typedef size_t result_type;
			using is_transparent = void;

			inline result_type operator()(const uint256_t& value) const noexcept
			{
				return key_hasher<std::string_view>()(std::string_view((char*)&value, sizeof(value)));
			}
		};
	}
}
#endif
