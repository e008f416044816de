#ifndef BLK_LAYER_FORMAT_H
#define BLK_LAYER_FORMAT_H
#include "serialization.h"

namespace blackcheck
{
	namespace format
	{
		typedef vector<struct variable> variables;

		struct variable
		{
		private:
			string text;
			uint256_t integer;
			viewable type;

		public:
			variable() noexcept;
			explicit variable(const char* value) noexcept;
			explicit variable(const std::string_view& value) noexcept;
			explicit variable(const string& value) noexcept;
			explicit variable(uint8_t value) noexcept;
			explicit variable(uint32_t value) noexcept;
			explicit variable(uint64_t value) noexcept;
			explicit variable(const uint256_t& value) noexcept;
			explicit variable(bool value) noexcept;
			variable(const variable&) = default;
			variable(variable&&) noexcept = default;
			variable& operator= (const variable&) = default;
			variable& operator= (variable&&) noexcept = default;
			uptr<schema> as_schema() const;
			std::string_view as_string() const;
			uint8_t as_uint8() const;
			uint64_t as_uint64() const;
			uint256_t as_uint256() const;
			bool as_boolean() const;
			bool is_string() const;
			bool is_integer() const;
			viewable type_of() const;
			bool operator== (const variable& other) const;
			bool operator!= (const variable& other) const;
		};

		class variables_util
		{
		public:
			static bool is_ascii_encoding(const std::string_view& data);
			static bool deserialize_from(ro_stream& stream, variables* result);
			static bool serialize_into(const variables& data, wo_stream* result);
			static schema* serialize(const variables& data);
		};
	}
}
#endif
