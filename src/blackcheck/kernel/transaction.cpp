#include "transaction.h"
#include "ledger.h"

namespace blackcheck
{
	namespace ledger
	{
		expects_lr<void> transaction::validate() const
		{
			if (nonce >= std::numeric_limits<uint64_t>::max() - 1)
				return layer_exception(error_code::invalid_request, "invalid nonce");

			if (!is_signed())
				return layer_exception(error_code::invalid_request, "invalid signature");

			return expectation::met;
		}
		expects_lr<void> transaction::execute(transaction_context* context) const
		{
			return context->verify_account_nonce();
		}
		bool transaction::store_payload(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(nonce);
			return store_body(stream);
		}
		bool transaction::load_payload(format::ro_stream& stream)
		{
			if (!stream.read_integer(stream.read_type(), &nonce))
				return false;

			return load_body(stream);
		}
		bool transaction::sign(const algorithm::seckey_t& secret_key)
		{
			return authentic::sign(secret_key);
		}
		bool transaction::sign(const algorithm::seckey_t& secret_key, uint64_t new_nonce)
		{
			nonce = new_nonce;
			return sign(secret_key);
		}
		uptr<schema> transaction::as_schema() const
		{
			schema* data = var::set::object();
			data->set("hash", var::string(algorithm::encoding::encode_0xhex256(as_hash())));
			data->set("signature", signature.empty() ? var::null() : var::string(format::util::encode_0xhex(signature.view())));
			data->set("type", var::string(as_typename()));
			data->set("nonce", var::integer(nonce));
			return data;
		}

		bool receipt::store_payload(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(transaction_hash);
			stream->write_integer(sequence);
			stream->write_boolean(successful);
			stream->write_string(from.optimized_view());
			stream->write_integer((uint16_t)events.size());
			for (auto& item : events)
			{
				stream->write_integer(item.first);
				if (!format::variables_util::serialize_into(item.second, stream))
					return false;
			}
			return true;
		}
		bool receipt::load_payload(format::ro_stream& stream)
		{
			if (!stream.read_integer(stream.read_type(), &transaction_hash))
				return false;

			if (!stream.read_integer(stream.read_type(), &sequence))
				return false;

			if (!stream.read_boolean(stream.read_type(), &successful))
				return false;

			string from_assembly;
			if (!stream.read_string(stream.read_type(), &from_assembly) || !algorithm::encoding::decode_bytes(from_assembly, from.data, sizeof(from.data)))
				return false;

			uint16_t size;
			if (!stream.read_integer(stream.read_type(), &size))
				return false;

			events.clear();
			events.reserve((size_t)size);
			for (uint16_t i = 0; i < size; i++)
			{
				uint32_t type;
				if (!stream.read_integer(stream.read_type(), &type))
					return false;

				format::variables values;
				if (!format::variables_util::deserialize_from(stream, &values))
					return false;

				events.emplace_back(std::make_pair(type, std::move(values)));
			}

			return true;
		}
		void receipt::emit_event(uint32_t type, format::variables&& values)
		{
			events.emplace_back(std::make_pair(type, std::move(values)));
		}
		const format::variables* receipt::find_event(uint32_t type, size_t offset) const
		{
			for (auto& item : events)
			{
				if (item.first == type && !offset--)
					return &item.second;
			}
			return nullptr;
		}
		const format::variables* receipt::reverse_find_event(uint32_t type, size_t offset) const
		{
			for (auto it = events.rbegin(); it != events.rend(); ++it)
			{
				auto& item = *it;
				if (item.first == type && !offset--)
					return &item.second;
			}
			return nullptr;
		}
		uptr<schema> receipt::as_schema() const
		{
			schema* data = var::set::object();
			data->set("hash", var::string(algorithm::encoding::encode_0xhex256(as_hash())));
			data->set("transaction_hash", transaction_hash > 0 ? var::string(algorithm::encoding::encode_0xhex256(transaction_hash)) : var::null());
			data->set("from", algorithm::signing::serialize_address(from));
			data->set("sequence", algorithm::encoding::serialize_uint256(sequence));
			data->set("successful", var::boolean(successful));
			auto* events_data = data->set("events", var::set::array());
			for (auto& item : events)
			{
				auto* event_data = events_data->push(var::set::object());
				event_data->set("event", var::integer(item.first));
				event_data->set("args", format::variables_util::serialize(item.second));
			}
			return data;
		}
		uint32_t receipt::as_type() const
		{
			return as_instance_type();
		}
		std::string_view receipt::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t receipt::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view receipt::as_instance_typename()
		{
			return "receipt";
		}

		state::state(uint64_t new_sequence) : sequence(new_sequence)
		{
		}
		bool state::store(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(as_type());
			stream->write_integer(sequence);
			return store_payload(stream);
		}
		bool state::load(format::ro_stream& stream)
		{
			uint32_t type;
			if (!stream.read_integer(stream.read_type(), &type) || type != as_type())
				return false;

			if (!stream.read_integer(stream.read_type(), &sequence))
				return false;

			checksum = 0;
			return load_payload(stream);
		}
		bool state::store_payload(format::wo_stream* stream) const
		{
			if (!store_index(stream))
				return false;

			return store_data(stream);
		}
		bool state::load_payload(format::ro_stream& stream)
		{
			if (!load_index(stream))
				return false;

			return load_data(stream);
		}
		uptr<schema> state::as_schema() const
		{
			schema* data = var::set::object();
			data->set("hash", var::string(algorithm::encoding::encode_0xhex256(as_hash())));
			data->set("type", var::string(as_typename()));
			data->set("sequence", algorithm::encoding::serialize_uint256(sequence));
			data->set("index", var::string(format::util::encode_0xhex(as_index())));
			return data;
		}
		string state::as_index() const
		{
			format::wo_stream message;
			store_index(&message);
			return message.data;
		}
	}
}
