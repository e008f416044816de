#include "transactions.h"

namespace blackcheck
{
	namespace transactions
	{
		static void store_ids(format::wo_stream* stream, const vector<algorithm::item_id>& ids)
		{
			stream->write_integer((uint16_t)ids.size());
			for (auto& id : ids)
				stream->write_integer(id);
		}
		static bool load_ids(format::ro_stream& stream, vector<algorithm::item_id>& ids)
		{
			uint16_t size;
			if (!stream.read_integer(stream.read_type(), &size))
				return false;

			ids.clear();
			ids.reserve((size_t)size);
			for (uint16_t i = 0; i < size; i++)
			{
				algorithm::item_id id;
				if (!stream.read_integer(stream.read_type(), &id))
					return false;

				ids.push_back(id);
			}
			return true;
		}
		static schema* serialize_ids(const vector<algorithm::item_id>& ids)
		{
			schema* data = var::set::array();
			for (auto& id : ids)
				data->push(algorithm::encoding::serialize_uint256(id));
			return data;
		}

		expects_lr<void> deposit::validate() const
		{
			if (ids.empty())
				return layer_exception(error_code::invalid_request, "no items");
			else if (ids.size() > protocol::now().policy.deposit_max_per_request)
				return layer_exception(error_code::invalid_request, "too many items (received: " + to_string((uint64_t)ids.size()) + ", max: " + to_string(protocol::now().policy.deposit_max_per_request) + ")");

			return ledger::transaction::validate();
		}
		expects_lr<void> deposit::execute(ledger::transaction_context* context) const
		{
			auto validation = transaction::execute(context);
			if (!validation)
				return validation.error();

			for (auto& id : ids)
			{
				auto target = context->custody->get_registry()->get_item(id);
				if (!target)
					return target.error();
				else if (!algorithm::rank::is_valid(target->rank))
					return layer_exception(error_code::invalid_request, "invalid item rank");

				auto amount = algorithm::rank::amount_for(target->rank);
				auto issuance = context->verify_issuance(amount);
				if (!issuance)
					return issuance.error();

				auto previous = context->custody->acquire(context->get_caller(), id);
				if (!previous)
					return previous.error();

				auto credit = context->apply_credit(previous->owner, amount);
				if (!credit)
					return credit.error();

				auto supply = context->apply_issuance(amount);
				if (!supply)
					return supply.error();

				auto event = context->emit_event<deposit>({ format::variable(previous->owner.view()), format::variable(id), format::variable(previous->rank), format::variable(amount) });
				if (!event)
					return event.error();
			}

			return expectation::met;
		}
		bool deposit::store_body(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			store_ids(stream, ids);
			return true;
		}
		bool deposit::load_body(format::ro_stream& stream)
		{
			return load_ids(stream, ids);
		}
		uptr<schema> deposit::as_schema() const
		{
			schema* data = ledger::transaction::as_schema().reset();
			data->set("ids", serialize_ids(ids));
			return data;
		}
		uint32_t deposit::as_type() const
		{
			return as_instance_type();
		}
		std::string_view deposit::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t deposit::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view deposit::as_instance_typename()
		{
			return "deposit";
		}

		expects_lr<void> redeem::execute(ledger::transaction_context* context) const
		{
			auto validation = transaction::execute(context);
			if (!validation)
				return validation.error();

			auto target = context->custody->verify_held(id);
			if (!target)
				return target.error();

			auto amount = algorithm::rank::amount_for(target->rank);
			auto debit = context->apply_debit(context->get_caller(), amount);
			if (!debit)
				return debit.error();

			auto release = context->custody->release(context->get_caller(), id);
			if (!release)
				return release.error();

			auto supply = context->apply_retirement(amount);
			if (!supply)
				return supply.error();

			return context->emit_event<redeem>({ format::variable(context->get_caller().view()), format::variable(id), format::variable(target->rank), format::variable(amount) });
		}
		bool redeem::store_body(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(id);
			return true;
		}
		bool redeem::load_body(format::ro_stream& stream)
		{
			return stream.read_integer(stream.read_type(), &id);
		}
		uptr<schema> redeem::as_schema() const
		{
			schema* data = ledger::transaction::as_schema().reset();
			data->set("id", algorithm::encoding::serialize_uint256(id));
			return data;
		}
		uint32_t redeem::as_type() const
		{
			return as_instance_type();
		}
		std::string_view redeem::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t redeem::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view redeem::as_instance_typename()
		{
			return "redeem";
		}

		expects_lr<void> composite::validate() const
		{
			if (keep_id >= burn_id)
				return layer_exception(error_code::invalid_order, "kept item must precede burned item (keep: " + keep_id.to_string() + ", burn: " + burn_id.to_string() + ")");

			return ledger::transaction::validate();
		}
		expects_lr<void> composite::execute(ledger::transaction_context* context) const
		{
			auto validation = transaction::execute(context);
			if (!validation)
				return validation.error();

			auto keep = context->custody->verify_held(keep_id);
			if (!keep)
				return keep.error();

			auto burn = context->custody->verify_held(burn_id);
			if (!burn)
				return burn.error();

			auto* registry = context->custody->get_registry();
			auto merge = registry->merge_pair(context->custody->get_holder(), keep_id, burn_id, false);
			if (!merge)
				return merge.error();

			auto result = registry->get_item(keep_id);
			if (!result)
				return result.error();

			return context->emit_event<composite>({ format::variable(keep_id), format::variable(burn_id), format::variable(result->rank) });
		}
		bool composite::store_body(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(keep_id);
			stream->write_integer(burn_id);
			return true;
		}
		bool composite::load_body(format::ro_stream& stream)
		{
			if (!stream.read_integer(stream.read_type(), &keep_id))
				return false;

			return stream.read_integer(stream.read_type(), &burn_id);
		}
		uptr<schema> composite::as_schema() const
		{
			schema* data = ledger::transaction::as_schema().reset();
			data->set("keep_id", algorithm::encoding::serialize_uint256(keep_id));
			data->set("burn_id", algorithm::encoding::serialize_uint256(burn_id));
			return data;
		}
		uint32_t composite::as_type() const
		{
			return as_instance_type();
		}
		std::string_view composite::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t composite::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view composite::as_instance_typename()
		{
			return "composite";
		}

		expects_lr<void> aggregate::validate() const
		{
			if (ids.size() != (size_t)algorithm::rank::aggregate_size())
				return layer_exception(error_code::invalid_request, "invalid aggregate size (received: " + to_string((uint64_t)ids.size()) + ", required: " + to_string(algorithm::rank::aggregate_size()) + ")");

			auto& first = ids.front();
			for (size_t i = 1; i < ids.size(); i++)
			{
				if (ids[i] <= first)
					return layer_exception(error_code::invalid_order, "first item must be the smallest (first: " + first.to_string() + ", found: " + ids[i].to_string() + ")");
			}

			return ledger::transaction::validate();
		}
		expects_lr<void> aggregate::execute(ledger::transaction_context* context) const
		{
			auto validation = transaction::execute(context);
			if (!validation)
				return validation.error();

			for (auto& id : ids)
			{
				auto target = context->custody->verify_held(id);
				if (!target)
					return target.error();
			}

			auto merge = context->custody->get_registry()->merge_aggregate(context->custody->get_holder(), ids);
			if (!merge)
				return merge.error();

			return context->emit_event<aggregate>({ format::variable(ids.front()), format::variable((uint64_t)ids.size() - 1) });
		}
		bool aggregate::store_body(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			store_ids(stream, ids);
			return true;
		}
		bool aggregate::load_body(format::ro_stream& stream)
		{
			return load_ids(stream, ids);
		}
		uptr<schema> aggregate::as_schema() const
		{
			schema* data = ledger::transaction::as_schema().reset();
			data->set("ids", serialize_ids(ids));
			return data;
		}
		uint32_t aggregate::as_type() const
		{
			return as_instance_type();
		}
		std::string_view aggregate::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t aggregate::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view aggregate::as_instance_typename()
		{
			return "aggregate";
		}

		expects_lr<void> transfer::validate() const
		{
			if (to.empty())
				return layer_exception(error_code::invalid_request, "invalid receiver");
			else if (value == 0)
				return layer_exception(error_code::invalid_request, "invalid value");

			return ledger::transaction::validate();
		}
		expects_lr<void> transfer::execute(ledger::transaction_context* context) const
		{
			auto validation = transaction::execute(context);
			if (!validation)
				return validation.error();

			auto payment = context->apply_payment(context->get_caller(), to, value);
			if (!payment)
				return payment.error();

			return expectation::met;
		}
		bool transfer::store_body(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_string(to.optimized_view());
			stream->write_integer(value);
			return true;
		}
		bool transfer::load_body(format::ro_stream& stream)
		{
			string to_assembly;
			if (!stream.read_string(stream.read_type(), &to_assembly) || !algorithm::encoding::decode_bytes(to_assembly, to.data, sizeof(to.data)))
				return false;

			return stream.read_integer(stream.read_type(), &value);
		}
		uptr<schema> transfer::as_schema() const
		{
			schema* data = ledger::transaction::as_schema().reset();
			data->set("to", algorithm::signing::serialize_address(to));
			data->set("value", var::decimal(algorithm::rank::to_decimal(value)));
			return data;
		}
		uint32_t transfer::as_type() const
		{
			return as_instance_type();
		}
		std::string_view transfer::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t transfer::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view transfer::as_instance_typename()
		{
			return "transfer";
		}

		ledger::transaction* resolver::from_stream(format::ro_stream& stream)
		{
			uint32_t type; size_t seek = stream.seek;
			if (!stream.read_integer(stream.read_type(), &type))
				return nullptr;

			stream.rewind(seek);
			return from_type(type);
		}
		ledger::transaction* resolver::from_type(uint32_t hash)
		{
			if (hash == deposit::as_instance_type())
				return memory::init<deposit>();
			else if (hash == redeem::as_instance_type())
				return memory::init<redeem>();
			else if (hash == composite::as_instance_type())
				return memory::init<composite>();
			else if (hash == aggregate::as_instance_type())
				return memory::init<aggregate>();
			else if (hash == transfer::as_instance_type())
				return memory::init<transfer>();
			return nullptr;
		}
		expects_lr<uptr<ledger::transaction>> resolver::decode(const std::string_view& message)
		{
			if (message.empty() || message.size() > protocol::now().message.max_message_size)
				return layer_exception(error_code::invalid_request, "invalid message size");

			format::ro_stream stream = format::ro_stream(message);
			uptr<ledger::transaction> candidate = from_stream(stream);
			if (!candidate)
				return layer_exception(error_code::invalid_request, "invalid message type");

			if (!candidate->load(stream) || !stream.is_eof())
				return layer_exception(error_code::invalid_request, "invalid message encoding (type: " + string(candidate->as_typename()) + ")");

			return expects_lr<uptr<ledger::transaction>>(std::move(candidate));
		}
	}
}
