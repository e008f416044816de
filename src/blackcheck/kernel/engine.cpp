#include "engine.h"
#include "../policy/transactions.h"

namespace blackcheck
{
	namespace ledger
	{
		engine::engine(item_registry* new_registry) : custody(new_registry, wallet::from_identity(protocol::now().policy.engine_identity).public_key_hash), registry(new_registry), identity(custody.get_holder()), sequence(0), executing(false)
		{
			VI_ASSERT(registry != nullptr, "registry should be set");
		}
		expects_lr<receipt> engine::submit(const ledger::transaction& request)
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (executing)
			{
				VI_WARN("[engine] %s request rejected: nested entry", request.as_typename().data());
				return layer_exception(error_code::reentrancy_rejected, "nested entry while a request is executing");
			}

			algorithm::pubkeyhash_t owner;
			auto validation = transaction_context::validate_tx(&request, owner);
			if (!validation)
			{
				VI_WARN("[engine] %s request rejected: %s", request.as_typename().data(), validation.error().what());
				return validation.error();
			}

			executing = true;
			registry->checkpoint();
			auto execution = transaction_context::execute_tx(&journal, &custody, &request, owner, sequence + 1);
			executing = false;
			if (!execution)
			{
				registry->revert();
				journal.revert();
				VI_WARN("[engine] %s request from %s rejected: %s", request.as_typename().data(), algorithm::signing::encode_address(owner).c_str(), execution.error().what());
				return execution.error();
			}

			registry->commit();
			journal.commit();
			++sequence;
			if (protocol::now().user.engine.logging)
				VI_INFO("[engine] %s request from %s accepted (sequence: %" PRIu64 ", events: %i)", request.as_typename().data(), algorithm::signing::encode_address(owner).c_str(), sequence, (int)execution->receipt.events.size());

			return std::move(execution->receipt);
		}
		expects_lr<receipt> engine::submit(const std::string_view& message)
		{
			auto request = transactions::resolver::decode(message);
			if (!request)
			{
				VI_WARN("[engine] message rejected: %s", request.error().what());
				return request.error();
			}

			ledger::transaction* candidate = **request;
			return submit(*candidate);
		}
		expects_lr<void> engine::on_item_received(const algorithm::pubkeyhash_t& caller, const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::item_id& id, const std::string_view& data)
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (caller != registry->address())
			{
				VI_WARN("[engine] item %s receipt rejected: caller %s is not the registry", id.to_string().c_str(), algorithm::signing::encode_address(caller).c_str());
				return layer_exception(error_code::not_registry, "only the registry may notify item receipt");
			}
			else if (executing)
			{
				VI_WARN("[engine] item %s receipt rejected: nested entry", id.to_string().c_str());
				return layer_exception(error_code::reentrancy_rejected, "nested entry while a request is executing");
			}

			executing = true;
			ledger::receipt new_receipt;
			new_receipt.sequence = sequence + 1;
			new_receipt.from = from;

			auto context = transaction_context(&journal, &custody, nullptr, std::move(new_receipt));
			auto execution = [&]() -> expects_lr<void>
			{
				auto target = custody.verify_held(id);
				if (!target)
					return target.error();
				else if (!algorithm::rank::is_valid(target->rank))
					return layer_exception(error_code::invalid_request, "invalid item rank");

				auto amount = algorithm::rank::amount_for(target->rank);
				auto issuance = context.verify_issuance(amount);
				if (!issuance)
					return issuance.error();

				auto credit = context.apply_credit(from, amount);
				if (!credit)
					return credit.error();

				auto supply = context.apply_issuance(amount);
				if (!supply)
					return supply.error();

				return context.emit_event<transactions::deposit>({ format::variable(from.view()), format::variable(id), format::variable(target->rank), format::variable(amount) });
			}();
			executing = false;
			if (!execution)
			{
				journal.revert();
				VI_WARN("[engine] item %s receipt from %s rejected: %s", id.to_string().c_str(), algorithm::signing::encode_address(from).c_str(), execution.error().what());
				return execution.error();
			}

			journal.commit();
			++sequence;
			if (protocol::now().user.engine.logging)
				VI_INFO("[engine] item %s received from %s through %s (sequence: %" PRIu64 ")", id.to_string().c_str(), algorithm::signing::encode_address(from).c_str(), algorithm::signing::encode_address(initiator).c_str(), sequence);

			return expectation::met;
		}
		expects_lr<void> engine::accept_value(const algorithm::pubkeyhash_t& from, const uint256_t& value, const std::string_view& data)
		{
			umutex<std::recursive_mutex> unique(mutex);
			if (executing)
			{
				VI_WARN("[engine] value from %s rejected: nested entry", algorithm::signing::encode_address(from).c_str());
				return layer_exception(error_code::reentrancy_rejected, "nested entry while a request is executing");
			}

			VI_WARN("[engine] value %s from %s rejected (data: %i bytes)", value.to_string().c_str(), algorithm::signing::encode_address(from).c_str(), (int)data.size());
			return layer_exception(error_code::unsolicited_value_rejected, "engine does not accept value");
		}
		expects_lr<void> engine::verify_invariants() const
		{
			umutex<std::recursive_mutex> unique(mutex);
			uint256_t balances = 0;
			for (auto* item : journal.list(states::account_balance::as_instance_type()))
				balances += ((const states::account_balance*)item)->balance;

			auto supply = as_view().get_token_supply();
			if (balances != supply.total)
				return layer_exception("balances do not match issued supply (balances: " + algorithm::rank::to_decimal(balances).to_string() + ", issued: " + algorithm::rank::to_decimal(supply.total).to_string() + ")");
			else if (supply.total > algorithm::rank::max_supply())
				return layer_exception(error_code::supply_ceiling_exceeded, "issued supply is above the ceiling");

			return expectation::met;
		}
		uint256_t engine::max_supply() const
		{
			return algorithm::rank::max_supply();
		}
		uint256_t engine::total_issued() const
		{
			umutex<std::recursive_mutex> unique(mutex);
			return as_view().get_token_supply().total;
		}
		uint256_t engine::balance_of(const algorithm::pubkeyhash_t& owner) const
		{
			umutex<std::recursive_mutex> unique(mutex);
			return as_view().get_account_balance(owner).balance;
		}
		uint64_t engine::nonce_of(const algorithm::pubkeyhash_t& owner) const
		{
			umutex<std::recursive_mutex> unique(mutex);
			return as_view().get_account_nonce(owner).nonce;
		}
		uint64_t engine::get_sequence() const
		{
			umutex<std::recursive_mutex> unique(mutex);
			return sequence;
		}
		std::string_view engine::name() const
		{
			return protocol::now().policy.token_name;
		}
		std::string_view engine::symbol() const
		{
			return protocol::now().policy.token_symbol;
		}
		uint8_t engine::decimals() const
		{
			return protocol::now().policy.token_decimals;
		}
		const algorithm::pubkeyhash_t& engine::address() const
		{
			return identity;
		}
		item_registry* engine::get_registry() const
		{
			return registry;
		}
		uptr<schema> engine::as_schema() const
		{
			umutex<std::recursive_mutex> unique(mutex);
			schema* data = var::set::object();
			data->set("address", algorithm::signing::serialize_address(identity));
			data->set("registry", algorithm::signing::serialize_address(registry->address()));
			data->set("name", var::string(name()));
			data->set("symbol", var::string(symbol()));
			data->set("decimals", var::integer(decimals()));
			data->set("sequence", algorithm::encoding::serialize_uint256(sequence));
			data->set("max_supply", var::decimal(algorithm::rank::to_decimal(max_supply())));
			data->set("total_issued", var::decimal(algorithm::rank::to_decimal(total_issued())));
			return data;
		}
		transaction_context engine::as_view() const
		{
			return transaction_context((changelog*)&journal, (ledger::custody*)&custody, nullptr, ledger::receipt());
		}
	}
}
