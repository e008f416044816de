#include "messages.h"

namespace blackcheck
{
	namespace messages
	{
		uniform::uniform() : checksum(0)
		{
		}
		bool uniform::store(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(as_type());
			return store_payload(stream);
		}
		bool uniform::load(format::ro_stream& stream)
		{
			uint32_t type;
			if (!stream.read_integer(stream.read_type(), &type) || type != as_type())
				return false;

			checksum = 0;
			return load_payload(stream);
		}
		uint256_t uniform::as_hash(bool renew) const
		{
			if (!renew && checksum != 0)
				return checksum;

			format::wo_stream message;
			((uniform*)this)->checksum = store(&message) ? message.hash() : uint256_t(0);
			return checksum;
		}
		format::wo_stream uniform::as_message() const
		{
			format::wo_stream message;
			if (!store(&message))
				message.clear();
			return message;
		}
		format::wo_stream uniform::as_signable() const
		{
			format::wo_stream message;
			message.write_integer(as_type());
			if (!store_payload(&message))
				message.clear();
			return message;
		}

		bool authentic::store(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(as_type());
			stream->write_string(signature.optimized_view());
			return store_payload(stream);
		}
		bool authentic::load(format::ro_stream& stream)
		{
			uint32_t type;
			if (!stream.read_integer(stream.read_type(), &type) || type != as_type())
				return false;

			string signature_assembly;
			if (!stream.read_string(stream.read_type(), &signature_assembly) || !algorithm::encoding::decode_bytes(signature_assembly, signature.data, sizeof(signature.data)))
				return false;

			checksum = 0;
			return load_payload(stream);
		}
		bool authentic::sign(const algorithm::seckey_t& secret_key)
		{
			checksum = 0;
			return algorithm::signing::sign(as_signable_hash(), secret_key, signature);
		}
		bool authentic::verify(const algorithm::pubkey_t& public_key) const
		{
			return algorithm::signing::verify(as_signable_hash(), public_key, signature);
		}
		bool authentic::recover(algorithm::pubkey_t& public_key) const
		{
			return algorithm::signing::recover(as_signable_hash(), public_key, signature);
		}
		bool authentic::recover_hash(algorithm::pubkeyhash_t& public_key_hash) const
		{
			return algorithm::signing::recover_hash(as_signable_hash(), public_key_hash, signature);
		}
		bool authentic::is_signed() const
		{
			return !signature.empty();
		}
		uint256_t authentic::as_signable_hash() const
		{
			auto message = as_signable();
			return algorithm::signing::message_hash(message.data);
		}
	}
}
