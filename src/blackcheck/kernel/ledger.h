#ifndef BLK_KERNEL_LEDGER_H
#define BLK_KERNEL_LEDGER_H
#include "custody.h"
#include "../policy/states.h"

namespace blackcheck
{
	namespace ledger
	{
		struct changelog
		{
			struct state_change
			{
				uptr<ledger::state> state;

				state_change() noexcept = default;
				state_change(uptr<ledger::state>&& new_state) noexcept;
				state_change(const state_change& other) noexcept;
				state_change(state_change&& other) noexcept;
				state_change& operator=(const state_change& other) noexcept;
				state_change& operator=(state_change&& other) noexcept;
				bool empty() const;
			};

			ordered_map<string, state_change> finalized;
			ordered_map<string, state_change> pending;

			changelog() = default;
			changelog(const changelog& other);
			changelog(changelog&&) noexcept = default;
			changelog& operator= (const changelog& other);
			changelog& operator= (changelog&&) noexcept = default;
			uptr<state> find(uint32_t type, const std::string_view& index) const;
			bool emplace(uptr<state>&& value);
			string index_of(const state* value) const;
			string index_of(uint32_t type, const std::string_view& index) const;
			vector<const state*> list(uint32_t type) const;
			void revert(bool fully = false);
			void commit();
		};

		struct transaction_context
		{
		public:
			const ledger::transaction* transaction;
			ledger::changelog* journal;
			ledger::custody* custody;
			ledger::receipt receipt;

		public:
			transaction_context();
			transaction_context(ledger::changelog* new_journal, ledger::custody* new_custody, const ledger::transaction* new_transaction, ledger::receipt&& new_receipt);
			transaction_context(const transaction_context&) = default;
			transaction_context(transaction_context&&) = default;
			transaction_context& operator=(const transaction_context&) = default;
			transaction_context& operator=(transaction_context&&) = default;
			expects_lr<void> store(state* value);
			expects_lr<void> emit_event(uint32_t type, format::variables&& values);
			expects_lr<void> verify_account_nonce() const;
			expects_lr<void> verify_issuance(const uint256_t& amount) const;
			expects_lr<states::account_nonce> apply_account_nonce(const algorithm::pubkeyhash_t& owner, uint64_t nonce);
			expects_lr<states::account_balance> apply_credit(const algorithm::pubkeyhash_t& owner, const uint256_t& amount);
			expects_lr<states::account_balance> apply_debit(const algorithm::pubkeyhash_t& owner, const uint256_t& amount);
			expects_lr<states::account_balance> apply_payment(const algorithm::pubkeyhash_t& from, const algorithm::pubkeyhash_t& to, const uint256_t& amount);
			expects_lr<states::token_supply> apply_issuance(const uint256_t& amount);
			expects_lr<states::token_supply> apply_retirement(const uint256_t& amount);
			states::account_nonce get_account_nonce(const algorithm::pubkeyhash_t& owner) const;
			states::account_balance get_account_balance(const algorithm::pubkeyhash_t& owner) const;
			states::token_supply get_token_supply() const;
			const algorithm::pubkeyhash_t& get_caller() const;

		public:
			template <typename t>
			expects_lr<void> emit_event(format::variables&& values)
			{
				return emit_event(t::as_instance_type(), std::move(values));
			}

		public:
			static expects_lr<void> validate_tx(const ledger::transaction* new_transaction, algorithm::pubkeyhash_t& owner);
			static expects_lr<transaction_context> execute_tx(ledger::changelog* journal, ledger::custody* custody, const ledger::transaction* new_transaction, const algorithm::pubkeyhash_t& owner, uint64_t sequence);
		};
	}
}
#endif
