#include "states.h"

namespace blackcheck
{
	namespace states
	{
		account_nonce::account_nonce(const algorithm::pubkeyhash_t& new_owner, uint64_t new_sequence) : ledger::state(new_sequence), owner(new_owner), nonce(0)
		{
		}
		expects_lr<void> account_nonce::transition(const ledger::transaction_context* context, const ledger::state* prev_state)
		{
			if (owner.empty())
				return layer_exception("invalid state owner");

			auto* prev = (account_nonce*)prev_state;
			uint64_t expected = (prev ? prev->nonce : 0) + 1;
			if (nonce != expected)
				return layer_exception(error_code::invalid_request, "invalid nonce (received: " + to_string(nonce) + ", expected: " + to_string(expected) + ")");

			return expectation::met;
		}
		bool account_nonce::store_index(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_string(owner.optimized_view());
			return true;
		}
		bool account_nonce::load_index(format::ro_stream& stream)
		{
			string owner_assembly;
			if (!stream.read_string(stream.read_type(), &owner_assembly) || !algorithm::encoding::decode_bytes(owner_assembly, owner.data, sizeof(owner)))
				return false;

			return true;
		}
		bool account_nonce::store_data(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(nonce);
			return true;
		}
		bool account_nonce::load_data(format::ro_stream& stream)
		{
			if (!stream.read_integer(stream.read_type(), &nonce))
				return false;

			return true;
		}
		uptr<schema> account_nonce::as_schema() const
		{
			schema* data = ledger::state::as_schema().reset();
			data->set("owner", algorithm::signing::serialize_address(owner));
			data->set("nonce", algorithm::encoding::serialize_uint256(nonce));
			return data;
		}
		uint32_t account_nonce::as_type() const
		{
			return as_instance_type();
		}
		std::string_view account_nonce::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t account_nonce::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view account_nonce::as_instance_typename()
		{
			return "account_nonce";
		}
		string account_nonce::as_instance_index(const algorithm::pubkeyhash_t& owner)
		{
			format::wo_stream message;
			account_nonce(owner, 0).store_index(&message);
			return message.data;
		}

		account_balance::account_balance(const algorithm::pubkeyhash_t& new_owner, uint64_t new_sequence) : ledger::state(new_sequence), owner(new_owner)
		{
		}
		expects_lr<void> account_balance::transition(const ledger::transaction_context* context, const ledger::state* prev_state)
		{
			if (owner.empty())
				return layer_exception("invalid state owner");

			auto* prev = (account_balance*)prev_state;
			uint256_t base = prev ? prev->balance : balance;
			if (base + increase < decrease)
				return layer_exception(error_code::insufficient_balance, "insufficient balance (balance: " + algorithm::rank::to_decimal(base + increase).to_string() + ", required: " + algorithm::rank::to_decimal(decrease).to_string() + ")");

			balance = base + increase - decrease;
			increase = 0;
			decrease = 0;
			return expectation::met;
		}
		bool account_balance::store_index(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_string(owner.optimized_view());
			return true;
		}
		bool account_balance::load_index(format::ro_stream& stream)
		{
			string owner_assembly;
			if (!stream.read_string(stream.read_type(), &owner_assembly) || !algorithm::encoding::decode_bytes(owner_assembly, owner.data, sizeof(owner)))
				return false;

			return true;
		}
		bool account_balance::store_data(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(balance);
			return true;
		}
		bool account_balance::load_data(format::ro_stream& stream)
		{
			increase = 0;
			decrease = 0;
			if (!stream.read_integer(stream.read_type(), &balance))
				return false;

			return true;
		}
		uptr<schema> account_balance::as_schema() const
		{
			schema* data = ledger::state::as_schema().reset();
			data->set("owner", algorithm::signing::serialize_address(owner));
			data->set("balance", algorithm::encoding::serialize_uint256(balance));
			data->set("value", var::decimal(algorithm::rank::to_decimal(balance)));
			return data;
		}
		uint32_t account_balance::as_type() const
		{
			return as_instance_type();
		}
		std::string_view account_balance::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t account_balance::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view account_balance::as_instance_typename()
		{
			return "account_balance";
		}
		string account_balance::as_instance_index(const algorithm::pubkeyhash_t& owner)
		{
			format::wo_stream message;
			account_balance(owner, 0).store_index(&message);
			return message.data;
		}

		token_supply::token_supply(uint64_t new_sequence) : ledger::state(new_sequence)
		{
		}
		expects_lr<void> token_supply::transition(const ledger::transaction_context* context, const ledger::state* prev_state)
		{
			auto* prev = (token_supply*)prev_state;
			uint256_t base = prev ? prev->total : total;
			if (base + minted < burned)
				return layer_exception(error_code::insufficient_balance, "ran out of issued supply");

			uint256_t next = base + minted - burned;
			if (minted > 0 && next > algorithm::rank::max_supply())
				return layer_exception(error_code::supply_ceiling_exceeded, "supply ceiling exceeded (issued: " + algorithm::rank::to_decimal(base).to_string() + ", requested: " + algorithm::rank::to_decimal(minted).to_string() + ")");

			total = next;
			minted = 0;
			burned = 0;
			return expectation::met;
		}
		bool token_supply::store_index(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_string(protocol::now().policy.token_symbol);
			return true;
		}
		bool token_supply::load_index(format::ro_stream& stream)
		{
			string symbol;
			if (!stream.read_string(stream.read_type(), &symbol) || symbol != protocol::now().policy.token_symbol)
				return false;

			return true;
		}
		bool token_supply::store_data(format::wo_stream* stream) const
		{
			VI_ASSERT(stream != nullptr, "stream should be set");
			stream->write_integer(total);
			return true;
		}
		bool token_supply::load_data(format::ro_stream& stream)
		{
			minted = 0;
			burned = 0;
			if (!stream.read_integer(stream.read_type(), &total))
				return false;

			return true;
		}
		uptr<schema> token_supply::as_schema() const
		{
			schema* data = ledger::state::as_schema().reset();
			data->set("symbol", var::string(protocol::now().policy.token_symbol));
			data->set("total", algorithm::encoding::serialize_uint256(total));
			data->set("value", var::decimal(algorithm::rank::to_decimal(total)));
			return data;
		}
		uint32_t token_supply::as_type() const
		{
			return as_instance_type();
		}
		std::string_view token_supply::as_typename() const
		{
			return as_instance_typename();
		}
		uint32_t token_supply::as_instance_type()
		{
			static uint32_t hash = algorithm::encoding::type_of(as_instance_typename());
			return hash;
		}
		std::string_view token_supply::as_instance_typename()
		{
			return "token_supply";
		}
		string token_supply::as_instance_index()
		{
			format::wo_stream message;
			token_supply(0).store_index(&message);
			return message.data;
		}

		ledger::state* resolver::from_type(uint32_t hash)
		{
			if (hash == account_nonce::as_instance_type())
				return memory::init<account_nonce>(algorithm::pubkeyhash_t(), 0);
			else if (hash == account_balance::as_instance_type())
				return memory::init<account_balance>(algorithm::pubkeyhash_t(), 0);
			else if (hash == token_supply::as_instance_type())
				return memory::init<token_supply>(0);
			return nullptr;
		}
		ledger::state* resolver::from_copy(const ledger::state* base)
		{
			VI_ASSERT(base != nullptr, "base should be set");
			uint32_t hash = base->as_type();
			auto* result = from_type(hash);
			if (result)
				value_copy(hash, base, result);
			return result;
		}
		void resolver::value_copy(uint32_t hash, const ledger::state* from, ledger::state* to)
		{
			VI_ASSERT(to != nullptr, "to should be set");
			if (hash == account_nonce::as_instance_type())
				*(account_nonce*)to = from ? account_nonce(*(const account_nonce*)from) : account_nonce(algorithm::pubkeyhash_t(), 0);
			else if (hash == account_balance::as_instance_type())
				*(account_balance*)to = from ? account_balance(*(const account_balance*)from) : account_balance(algorithm::pubkeyhash_t(), 0);
			else if (hash == token_supply::as_instance_type())
				*(token_supply*)to = from ? token_supply(*(const token_supply*)from) : token_supply(0);
		}
	}
}
