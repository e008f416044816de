#include "serialization.h"
#include "../kernel/algorithm.h"

namespace blackcheck
{
	namespace format
	{
		wo_stream::wo_stream() : checksum(0)
		{
		}
		wo_stream::wo_stream(const std::string_view& new_data) : data(new_data), checksum(0)
		{
		}
		wo_stream& wo_stream::clear()
		{
			data.clear();
			checksum = 0;
			return *this;
		}
		void wo_stream::write(const void* value, size_t size)
		{
			if (size > 0 && value != nullptr)
			{
				size_t index = data.size();
				data.resize(data.size() + size);
				memcpy((char*)data.data() + index, value, size);
				checksum = 0;
			}
		}
		wo_stream& wo_stream::write_string(const std::string_view& value)
		{
			uint8_t type = (uint8_t)util::get_string_type(value);
			if (value.size() > util::get_max_string_size())
			{
				uint32_t size = std::min<uint32_t>(protocol::now().message.max_message_size, (uint32_t)value.size());
				write(&type, sizeof(uint8_t));
				write_integer(size);
				write(value.data(), size);
			}
			else
			{
				uint8_t size = util::get_string_size((viewable)type);
				write(&type, sizeof(uint8_t));
				write(value.data(), size);
			}
			return *this;
		}
		wo_stream& wo_stream::write_integer(const uint256_t& value)
		{
			uint8_t type = (uint8_t)util::get_integer_type(value);
			write(&type, sizeof(uint8_t));
			return write_typeless(value);
		}
		wo_stream& wo_stream::write_boolean(bool value)
		{
			uint8_t type = (uint8_t)(value ? viewable::true_type : viewable::false_type);
			write(&type, sizeof(uint8_t));
			return *this;
		}
		wo_stream& wo_stream::write_typeless(const uint256_t& value)
		{
			uint8_t size = util::get_integer_size(util::get_integer_type(value));
			uint64_t array[4] =
			{
				os::hw::to_endianness(os::hw::endian::little, value.low().low()),
				os::hw::to_endianness(os::hw::endian::little, value.low().high()),
				os::hw::to_endianness(os::hw::endian::little, value.high().low()),
				os::hw::to_endianness(os::hw::endian::little, value.high().high())
			};
			write(array, size);
			return *this;
		}
		wo_stream& wo_stream::write_typeless(const void* value, size_t size)
		{
			write(value, size);
			return *this;
		}
		string wo_stream::encode() const
		{
			return util::encode_0xhex(data);
		}
		uint256_t wo_stream::hash(bool renew) const
		{
			if (renew || !checksum)
				((wo_stream*)this)->checksum = algorithm::hashing::hash256i(data);
			return checksum;
		}
		ro_stream wo_stream::ro() const
		{
			return ro_stream(data);
		}

		ro_stream::ro_stream() : seek(0)
		{
		}
		ro_stream::ro_stream(const std::string_view& new_data) : data(new_data), seek(0)
		{
		}
		ro_stream& ro_stream::rewind(size_t offset)
		{
			seek = (offset <= data.size() ? offset : data.size());
			return *this;
		}
		size_t ro_stream::read(void* value, size_t size)
		{
			if (!value || !size || size + seek > data.size())
				return 0;

			memcpy(value, data.data() + seek, size);
			seek += size;
			return size;
		}
		viewable ro_stream::read_type()
		{
			viewable type = viewable::invalid;
			return read_type(&type) ? type : viewable::invalid;
		}
		bool ro_stream::read_type(viewable* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			return read(value, sizeof(uint8_t)) == sizeof(uint8_t);
		}
		bool ro_stream::read_string(viewable type, string* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			if (type != viewable::string_any)
			{
				if (!util::is_string(type))
					return false;

				char buffer[256];
				uint8_t size = util::get_string_size(type);
				if (size > 0 && read(buffer, size) != size)
					return false;

				value->assign(buffer, (size_t)size);
				return true;
			}

			uint32_t size = 0;
			if (!read_integer(read_type(), &size) || size > protocol::now().message.max_message_size)
				return false;

			value->resize((size_t)size);
			return read((void*)value->data(), size) == size;
		}
		bool ro_stream::read_integer(viewable type, uint8_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			uint256_t base;
			if (!read_integer(type, &base) || base > std::numeric_limits<uint8_t>::max())
				return false;

			*value = (uint8_t)base;
			return true;
		}
		bool ro_stream::read_integer(viewable type, uint16_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			uint256_t base;
			if (!read_integer(type, &base) || base > std::numeric_limits<uint16_t>::max())
				return false;

			*value = (uint16_t)base;
			return true;
		}
		bool ro_stream::read_integer(viewable type, uint32_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			uint256_t base;
			if (!read_integer(type, &base) || base > std::numeric_limits<uint32_t>::max())
				return false;

			*value = (uint32_t)base;
			return true;
		}
		bool ro_stream::read_integer(viewable type, uint64_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			uint256_t base;
			if (!read_integer(type, &base) || base > std::numeric_limits<uint64_t>::max())
				return false;

			*value = (uint64_t)base;
			return true;
		}
		bool ro_stream::read_integer(viewable type, uint256_t* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			if (!util::is_integer(type))
				return false;

			uint64_t array[4] = { 0 };
			uint8_t size = util::get_integer_size(type);
			if (size > 0 && read(array, size) != size)
				return false;

			auto& bits0 = value->low().low();
			auto& bits1 = value->low().high();
			auto& bits2 = value->high().low();
			auto& bits3 = value->high().high();
			array[0] = os::hw::to_endianness(os::hw::endian::little, array[0]);
			array[1] = os::hw::to_endianness(os::hw::endian::little, array[1]);
			array[2] = os::hw::to_endianness(os::hw::endian::little, array[2]);
			array[3] = os::hw::to_endianness(os::hw::endian::little, array[3]);
			memcpy((uint64_t*)&bits0, &array[0], sizeof(uint64_t));
			memcpy((uint64_t*)&bits1, &array[1], sizeof(uint64_t));
			memcpy((uint64_t*)&bits2, &array[2], sizeof(uint64_t));
			memcpy((uint64_t*)&bits3, &array[3], sizeof(uint64_t));
			return true;
		}
		bool ro_stream::read_boolean(viewable type, bool* value)
		{
			VI_ASSERT(value != nullptr, "value should be set");
			if (type != viewable::true_type && type != viewable::false_type)
				return false;

			*value = (type == viewable::true_type);
			return true;
		}
		bool ro_stream::is_eof() const
		{
			return seek >= data.size();
		}

		string util::encode_0xhex(const std::string_view& data)
		{
			return assign_0xhex(codec::hex_encode(data));
		}
		string util::decode_0xhex(const std::string_view& data)
		{
			return codec::hex_decode(stringify::starts_with(data, "0x") ? data.substr(2) : data);
		}
		string util::assign_0xhex(const std::string_view& data)
		{
			string result = stringify::starts_with(data, "0x") ? string() : string(data.empty() ? "0x0" : "0x");
			return result.append(data);
		}
		string util::clear_0xhex(const std::string_view& data, bool uppercase)
		{
			string result = string(stringify::starts_with(data, "0x") ? data.substr(2) : data);
			return uppercase ? stringify::to_upper(result) : stringify::to_lower(result);
		}
		bool util::is_hex_encoding(const std::string_view& data)
		{
			static std::string_view alphabet = "0123456789abcdefABCDEF";
			auto text = (data.size() < 2 || data[0] != '0' || data[1] != 'x' ? data : data.substr(2));
			if (text.empty() || text.size() % 2 != 0)
				return false;

			return text.find_first_not_of(alphabet) == std::string::npos;
		}
		bool util::is_integer(viewable type)
		{
			return (uint8_t)type >= (uint8_t)viewable::uint_min && (uint8_t)type <= (uint8_t)viewable::uint_max;
		}
		bool util::is_string(viewable type)
		{
			return (uint8_t)type >= (uint8_t)viewable::string_min && (uint8_t)type <= (uint8_t)viewable::string_max;
		}
		uint8_t util::get_integer_size(viewable type)
		{
			if (!is_integer(type))
				return 0;

			return (uint8_t)type - (uint8_t)viewable::uint_min;
		}
		viewable util::get_integer_type(const uint256_t& data)
		{
			uint64_t array[4] =
			{
				os::hw::to_endianness(os::hw::endian::little, data.low().low()),
				os::hw::to_endianness(os::hw::endian::little, data.low().high()),
				os::hw::to_endianness(os::hw::endian::little, data.high().low()),
				os::hw::to_endianness(os::hw::endian::little, data.high().high())
			};
			uint8_t bytes = sizeof(array);
			char* inline_data = (char*)array;
			while (bytes > 0 && !inline_data[bytes - 1])
				--bytes;
			return (viewable)((uint8_t)viewable::uint_min + bytes);
		}
		uint8_t util::get_string_size(viewable type)
		{
			if (!is_string(type))
				return 0;

			return (uint8_t)type - (uint8_t)viewable::string_min;
		}
		viewable util::get_string_type(const std::string_view& data)
		{
			auto limit = get_max_string_size();
			if (data.size() > limit)
				return viewable::string_any;

			return (viewable)((uint8_t)viewable::string_min + (uint8_t)data.size());
		}
		size_t util::get_max_string_size()
		{
			return (size_t)viewable::string_max - (size_t)viewable::string_min;
		}
	}
}
