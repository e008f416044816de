#ifndef BLK_POLICY_TRANSACTIONS_H
#define BLK_POLICY_TRANSACTIONS_H
#include "../kernel/ledger.h"

namespace blackcheck
{
	namespace transactions
	{
		struct deposit final : ledger::transaction
		{
			vector<algorithm::item_id> ids;

			expects_lr<void> validate() const override;
			expects_lr<void> execute(ledger::transaction_context* context) const override;
			bool store_body(format::wo_stream* stream) const override;
			bool load_body(format::ro_stream& stream) override;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
		};

		struct redeem final : ledger::transaction
		{
			algorithm::item_id id = 0;

			expects_lr<void> execute(ledger::transaction_context* context) const override;
			bool store_body(format::wo_stream* stream) const override;
			bool load_body(format::ro_stream& stream) override;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
		};

		struct composite final : ledger::transaction
		{
			algorithm::item_id keep_id = 0;
			algorithm::item_id burn_id = 0;

			expects_lr<void> validate() const override;
			expects_lr<void> execute(ledger::transaction_context* context) const override;
			bool store_body(format::wo_stream* stream) const override;
			bool load_body(format::ro_stream& stream) override;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
		};

		/* The first id survives at the maximal rank, the rest are consumed */
		struct aggregate final : ledger::transaction
		{
			vector<algorithm::item_id> ids;

			expects_lr<void> validate() const override;
			expects_lr<void> execute(ledger::transaction_context* context) const override;
			bool store_body(format::wo_stream* stream) const override;
			bool load_body(format::ro_stream& stream) override;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
		};

		struct transfer final : ledger::transaction
		{
			algorithm::pubkeyhash_t to;
			uint256_t value = 0;

			expects_lr<void> validate() const override;
			expects_lr<void> execute(ledger::transaction_context* context) const override;
			bool store_body(format::wo_stream* stream) const override;
			bool load_body(format::ro_stream& stream) override;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
		};

		class resolver
		{
		public:
			static ledger::transaction* from_stream(format::ro_stream& stream);
			static ledger::transaction* from_type(uint32_t hash);
			static expects_lr<uptr<ledger::transaction>> decode(const std::string_view& message);
		};
	}
}
#endif
