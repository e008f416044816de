#include "ledger.h"

namespace blackcheck
{
	namespace ledger
	{
		changelog::state_change::state_change(uptr<ledger::state>&& new_state) noexcept : state(std::move(new_state))
		{
		}
		changelog::state_change::state_change(const state_change& other) noexcept : state(other.state ? states::resolver::from_copy(*other.state) : nullptr)
		{
		}
		changelog::state_change::state_change(state_change&& other) noexcept : state(std::move(other.state))
		{
		}
		changelog::state_change& changelog::state_change::operator=(const state_change& other) noexcept
		{
			if (this == &other)
				return *this;

			state = other.state ? states::resolver::from_copy(*other.state) : nullptr;
			return *this;
		}
		changelog::state_change& changelog::state_change::operator=(state_change&& other) noexcept
		{
			if (this == &other)
				return *this;

			state = std::move(other.state);
			return *this;
		}
		bool changelog::state_change::empty() const
		{
			return !state;
		}

		changelog::changelog(const changelog& other)
		{
			for (auto& [index, change] : other.finalized)
				finalized[index] = change;
			for (auto& [index, change] : other.pending)
				pending[index] = change;
		}
		changelog& changelog::operator= (const changelog& other)
		{
			if (&other == this)
				return *this;

			finalized.clear();
			pending.clear();
			for (auto& [index, change] : other.finalized)
				finalized[index] = change;
			for (auto& [index, change] : other.pending)
				pending[index] = change;
			return *this;
		}
		uptr<state> changelog::find(uint32_t type, const std::string_view& index) const
		{
			auto location = index_of(type, index);
			auto it = pending.find(location);
			if (it != pending.end())
				return it->second.empty() ? nullptr : states::resolver::from_copy(*it->second.state);

			it = finalized.find(location);
			if (it != finalized.end())
				return it->second.empty() ? nullptr : states::resolver::from_copy(*it->second.state);

			return nullptr;
		}
		bool changelog::emplace(uptr<state>&& value)
		{
			VI_ASSERT(value, "value should be set");
			auto location = index_of(*value);
			pending[location].state = std::move(value);
			return true;
		}
		string changelog::index_of(const state* value) const
		{
			VI_ASSERT(value != nullptr, "value should be set");
			return index_of(value->as_type(), value->as_index());
		}
		string changelog::index_of(uint32_t type, const std::string_view& index) const
		{
			format::wo_stream message;
			message.write_typeless(type);
			message.write_typeless(index.data(), index.size());
			return message.data;
		}
		vector<const state*> changelog::list(uint32_t type) const
		{
			vector<const state*> result;
			for (auto& [index, change] : finalized)
			{
				if (!change.empty() && change.state->as_type() == type)
					result.push_back(*change.state);
			}
			return result;
		}
		void changelog::revert(bool fully)
		{
			pending.clear();
			if (fully)
				finalized.clear();
		}
		void changelog::commit()
		{
			for (auto& [index, change] : pending)
				finalized[index] = std::move(change);
			pending.clear();
		}

		transaction_context::transaction_context() : transaction(nullptr), journal(nullptr), custody(nullptr)
		{
		}
		transaction_context::transaction_context(ledger::changelog* new_journal, ledger::custody* new_custody, const ledger::transaction* new_transaction, ledger::receipt&& new_receipt) : transaction(new_transaction), journal(new_journal), custody(new_custody), receipt(std::move(new_receipt))
		{
		}
		expects_lr<void> transaction_context::store(state* next)
		{
			if (!next)
				return layer_exception("invalid state");
			else if (!journal)
				return layer_exception("invalid state journal");

			next->checksum = 0;
			next->sequence = receipt.sequence;

			auto type = next->as_type();
			auto prev = journal->find(type, next->as_index());
			auto status = next->transition(this, *prev);
			if (!status)
				return status;

			if (!prev)
				prev = states::resolver::from_type(type);
			if (!prev)
				return layer_exception("invalid state type");

			states::resolver::value_copy(type, next, *prev);
			journal->emplace(std::move(prev));
			return expectation::met;
		}
		expects_lr<void> transaction_context::emit_event(uint32_t type, format::variables&& values)
		{
			if (!type)
				return layer_exception("invalid event");

			receipt.emit_event(type, std::move(values));
			return expectation::met;
		}
		expects_lr<void> transaction_context::verify_account_nonce() const
		{
			if (!transaction)
				return expectation::met;

			auto current = get_account_nonce(receipt.from);
			if (transaction->nonce != current.nonce)
				return layer_exception(error_code::invalid_request, "invalid account nonce (received: " + to_string(transaction->nonce) + ", expected: " + to_string(current.nonce) + ")");

			return expectation::met;
		}
		expects_lr<void> transaction_context::verify_issuance(const uint256_t& amount) const
		{
			auto supply = get_token_supply();
			auto ceiling = algorithm::rank::max_supply();
			if (amount > ceiling || supply.total > ceiling - amount)
				return layer_exception(error_code::supply_ceiling_exceeded, "supply ceiling exceeded (issued: " + algorithm::rank::to_decimal(supply.total).to_string() + ", requested: " + algorithm::rank::to_decimal(amount).to_string() + ")");

			return expectation::met;
		}
		expects_lr<states::account_nonce> transaction_context::apply_account_nonce(const algorithm::pubkeyhash_t& owner, uint64_t nonce)
		{
			states::account_nonce new_state = states::account_nonce(owner, receipt.sequence);
			new_state.nonce = nonce;

			auto status = store(&new_state);
			if (!status)
				return status.error();

			return new_state;
		}
		expects_lr<states::account_balance> transaction_context::apply_credit(const algorithm::pubkeyhash_t& owner, const uint256_t& amount)
		{
			states::account_balance new_state = states::account_balance(owner, receipt.sequence);
			new_state.increase = amount;

			auto status = store(&new_state);
			if (!status)
				return status.error();

			status = emit_event<states::account_balance>({ format::variable(owner.view()), format::variable(new_state.balance) });
			if (!status)
				return status.error();

			return new_state;
		}
		expects_lr<states::account_balance> transaction_context::apply_debit(const algorithm::pubkeyhash_t& owner, const uint256_t& amount)
		{
			states::account_balance new_state = states::account_balance(owner, receipt.sequence);
			new_state.decrease = amount;

			auto status = store(&new_state);
			if (!status)
				return status.error();

			status = emit_event<states::account_balance>({ format::variable(owner.view()), format::variable(new_state.balance) });
			if (!status)
				return status.error();

			return new_state;
		}
		expects_lr<states::account_balance> transaction_context::apply_payment(const algorithm::pubkeyhash_t& from, const algorithm::pubkeyhash_t& to, const uint256_t& amount)
		{
			if (from == to)
				return layer_exception(error_code::invalid_request, "payment to self");

			auto debit = apply_debit(from, amount);
			if (!debit)
				return debit.error();

			auto credit = apply_credit(to, amount);
			if (!credit)
				return credit.error();

			return debit;
		}
		expects_lr<states::token_supply> transaction_context::apply_issuance(const uint256_t& amount)
		{
			states::token_supply new_state = states::token_supply(receipt.sequence);
			new_state.minted = amount;

			auto status = store(&new_state);
			if (!status)
				return status.error();

			status = emit_event<states::token_supply>({ format::variable(new_state.total) });
			if (!status)
				return status.error();

			return new_state;
		}
		expects_lr<states::token_supply> transaction_context::apply_retirement(const uint256_t& amount)
		{
			states::token_supply new_state = states::token_supply(receipt.sequence);
			new_state.burned = amount;

			auto status = store(&new_state);
			if (!status)
				return status.error();

			status = emit_event<states::token_supply>({ format::variable(new_state.total) });
			if (!status)
				return status.error();

			return new_state;
		}
		states::account_nonce transaction_context::get_account_nonce(const algorithm::pubkeyhash_t& owner) const
		{
			auto value = journal ? journal->find(states::account_nonce::as_instance_type(), states::account_nonce::as_instance_index(owner)) : uptr<state>();
			if (!value)
				return states::account_nonce(owner, 0);

			return *(states::account_nonce*)*value;
		}
		states::account_balance transaction_context::get_account_balance(const algorithm::pubkeyhash_t& owner) const
		{
			auto value = journal ? journal->find(states::account_balance::as_instance_type(), states::account_balance::as_instance_index(owner)) : uptr<state>();
			if (!value)
				return states::account_balance(owner, 0);

			return *(states::account_balance*)*value;
		}
		states::token_supply transaction_context::get_token_supply() const
		{
			auto value = journal ? journal->find(states::token_supply::as_instance_type(), states::token_supply::as_instance_index()) : uptr<state>();
			if (!value)
				return states::token_supply(0);

			return *(states::token_supply*)*value;
		}
		const algorithm::pubkeyhash_t& transaction_context::get_caller() const
		{
			return receipt.from;
		}
		expects_lr<void> transaction_context::validate_tx(const ledger::transaction* new_transaction, algorithm::pubkeyhash_t& owner)
		{
			VI_ASSERT(new_transaction != nullptr, "transaction should be set");
			auto validation = new_transaction->validate();
			if (!validation)
				return validation;

			if (!new_transaction->recover_hash(owner) || owner.empty())
				return layer_exception(error_code::invalid_request, "invalid signature");

			return expectation::met;
		}
		expects_lr<transaction_context> transaction_context::execute_tx(ledger::changelog* journal, ledger::custody* custody, const ledger::transaction* new_transaction, const algorithm::pubkeyhash_t& owner, uint64_t sequence)
		{
			VI_ASSERT(journal && custody && new_transaction, "journal, custody, transaction should be set");
			ledger::receipt new_receipt;
			new_receipt.transaction_hash = new_transaction->as_hash();
			new_receipt.sequence = sequence;
			new_receipt.from = owner;

			auto context = transaction_context(journal, custody, new_transaction, std::move(new_receipt));
			auto execution = context.transaction->execute(&context);
			context.receipt.successful = !!execution;
			if (!context.receipt.successful)
			{
				context.journal->revert();
				return execution.error();
			}

			auto change = context.apply_account_nonce(context.receipt.from, context.transaction->nonce + 1);
			if (!change)
			{
				context.journal->revert();
				return change.error();
			}

			return expects_lr<transaction_context>(std::move(context));
		}
	}
}
