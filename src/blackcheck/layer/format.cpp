#include "format.h"
#include "../kernel/algorithm.h"

namespace blackcheck
{
	namespace format
	{
		variable::variable() noexcept : integer(0), type(viewable::invalid)
		{
		}
		variable::variable(const char* new_value) noexcept : variable(std::string_view(new_value))
		{
		}
		variable::variable(const std::string_view& new_value) noexcept : text(new_value), integer(0), type(viewable::string_any)
		{
		}
		variable::variable(const string& new_value) noexcept : variable(std::string_view(new_value))
		{
		}
		variable::variable(uint8_t new_value) noexcept : variable(uint256_t(new_value))
		{
		}
		variable::variable(uint32_t new_value) noexcept : variable(uint256_t(new_value))
		{
		}
		variable::variable(uint64_t new_value) noexcept : variable(uint256_t(new_value))
		{
		}
		variable::variable(const uint256_t& new_value) noexcept : integer(new_value), type(viewable::uint_min)
		{
		}
		variable::variable(bool new_value) noexcept : integer(0), type(new_value ? viewable::true_type : viewable::false_type)
		{
		}
		uptr<schema> variable::as_schema() const
		{
			switch (type)
			{
				case viewable::string_any:
				{
					if (!variables_util::is_ascii_encoding(text))
						return var::set::string(util::encode_0xhex(text));

					return var::set::string(text);
				}
				case viewable::uint_min:
					return algorithm::encoding::serialize_uint256(integer);
				case viewable::true_type:
				case viewable::false_type:
					return var::set::boolean(type == viewable::true_type);
				case viewable::invalid:
				default:
					return var::set::null();
			}
		}
		std::string_view variable::as_string() const
		{
			return type == viewable::string_any ? std::string_view(text) : std::string_view("", 0);
		}
		uint8_t variable::as_uint8() const
		{
			auto value = as_uint256();
			return value > std::numeric_limits<uint8_t>::max() ? 0 : (uint8_t)value;
		}
		uint64_t variable::as_uint64() const
		{
			auto value = as_uint256();
			return value > std::numeric_limits<uint64_t>::max() ? 0 : (uint64_t)value;
		}
		uint256_t variable::as_uint256() const
		{
			switch (type)
			{
				case viewable::string_any:
					return util::is_hex_encoding(text) ? uint256_t(util::clear_0xhex(text), 16) : uint256_t(text, 10);
				case viewable::uint_min:
					return integer;
				case viewable::true_type:
					return 1;
				case viewable::false_type:
				case viewable::invalid:
				default:
					return 0;
			}
		}
		bool variable::as_boolean() const
		{
			switch (type)
			{
				case viewable::string_any:
					return !text.empty();
				case viewable::uint_min:
					return integer > 0;
				case viewable::true_type:
					return true;
				case viewable::false_type:
				case viewable::invalid:
				default:
					return false;
			}
		}
		bool variable::is_string() const
		{
			return type == viewable::string_any;
		}
		bool variable::is_integer() const
		{
			return type == viewable::uint_min;
		}
		viewable variable::type_of() const
		{
			return type;
		}
		bool variable::operator== (const variable& other) const
		{
			if (type != other.type)
				return false;

			switch (type)
			{
				case viewable::string_any:
					return text == other.text;
				case viewable::uint_min:
					return integer == other.integer;
				default:
					return true;
			}
		}
		bool variable::operator!= (const variable& other) const
		{
			return !(*this == other);
		}

		bool variables_util::is_ascii_encoding(const std::string_view& data)
		{
			return !std::any_of(data.begin(), data.end(), [](char v) { return static_cast<unsigned char>(v) < 32 || static_cast<unsigned char>(v) > 127; });
		}
		bool variables_util::deserialize_from(ro_stream& stream, variables* result)
		{
			VI_ASSERT(result != nullptr, "result should be set");
			uint16_t size;
			if (!stream.read_integer(stream.read_type(), &size))
				return false;

			result->reserve(result->size() + size);
			while (size-- != 0)
			{
				auto type = stream.read_type();
				if (type == viewable::true_type || type == viewable::false_type)
				{
					bool value;
					if (!stream.read_boolean(type, &value))
						return false;

					result->emplace_back(value);
				}
				else if (type == viewable::string_any || util::is_string(type))
				{
					string value;
					if (!stream.read_string(type, &value))
						return false;

					result->emplace_back(std::string_view(value));
				}
				else if (util::is_integer(type))
				{
					uint256_t value;
					if (!stream.read_integer(type, &value))
						return false;

					result->emplace_back(value);
				}
				else
					return false;
			}
			return true;
		}
		bool variables_util::serialize_into(const variables& data, wo_stream* result)
		{
			VI_ASSERT(result != nullptr, "result should be set");
			if (data.size() > std::numeric_limits<uint16_t>::max())
				return false;

			result->write_integer(data.size());
			for (auto& item : data)
			{
				switch (item.type_of())
				{
					case viewable::string_any:
						result->write_string(item.as_string());
						break;
					case viewable::uint_min:
						result->write_integer(item.as_uint256());
						break;
					case viewable::true_type:
					case viewable::false_type:
						result->write_boolean(item.as_boolean());
						break;
					default:
						return false;
				}
			}
			return true;
		}
		schema* variables_util::serialize(const variables& value)
		{
			schema* data = var::set::array();
			for (auto& item : value)
				data->push(item.as_schema().reset());
			return data;
		}
	}
}
