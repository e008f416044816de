#ifndef BLK_POLICY_STATES_H
#define BLK_POLICY_STATES_H
#include "../kernel/transaction.h"

namespace blackcheck
{
	namespace states
	{
		struct account_nonce final : ledger::state
		{
			algorithm::pubkeyhash_t owner;
			uint64_t nonce = 0;

			account_nonce(const algorithm::pubkeyhash_t& new_owner, uint64_t new_sequence);
			expects_lr<void> transition(const ledger::transaction_context* context, const ledger::state* prev_state) override;
			bool store_index(format::wo_stream* stream) const override;
			bool load_index(format::ro_stream& stream) override;
			bool store_data(format::wo_stream* stream) const override;
			bool load_data(format::ro_stream& stream) override;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
			static string as_instance_index(const algorithm::pubkeyhash_t& owner);
		};

		/* Deltas are consumed by transition and never stored */
		struct account_balance final : ledger::state
		{
			algorithm::pubkeyhash_t owner;
			uint256_t balance = 0;
			uint256_t increase = 0;
			uint256_t decrease = 0;

			account_balance(const algorithm::pubkeyhash_t& new_owner, uint64_t new_sequence);
			expects_lr<void> transition(const ledger::transaction_context* context, const ledger::state* prev_state) override;
			bool store_index(format::wo_stream* stream) const override;
			bool load_index(format::ro_stream& stream) override;
			bool store_data(format::wo_stream* stream) const override;
			bool load_data(format::ro_stream& stream) override;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
			static string as_instance_index(const algorithm::pubkeyhash_t& owner);
		};

		struct token_supply final : ledger::state
		{
			uint256_t total = 0;
			uint256_t minted = 0;
			uint256_t burned = 0;

			token_supply(uint64_t new_sequence);
			expects_lr<void> transition(const ledger::transaction_context* context, const ledger::state* prev_state) override;
			bool store_index(format::wo_stream* stream) const override;
			bool load_index(format::ro_stream& stream) override;
			bool store_data(format::wo_stream* stream) const override;
			bool load_data(format::ro_stream& stream) override;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
			static string as_instance_index();
		};

		class resolver
		{
		public:
			static ledger::state* from_type(uint32_t hash);
			static ledger::state* from_copy(const ledger::state* base);
			static void value_copy(uint32_t hash, const ledger::state* from, ledger::state* to);
		};
	}
}
#endif
