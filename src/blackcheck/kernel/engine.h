#ifndef BLK_KERNEL_ENGINE_H
#define BLK_KERNEL_ENGINE_H
#include "ledger.h"

namespace blackcheck
{
	namespace ledger
	{
		class engine final : public item_receiver
		{
		private:
			mutable std::recursive_mutex mutex;
			ledger::changelog journal;
			ledger::custody custody;
			item_registry* registry;
			algorithm::pubkeyhash_t identity;
			uint64_t sequence;
			bool executing;

		public:
			engine(item_registry* new_registry);
			engine(const engine&) = delete;
			engine(engine&&) = delete;
			~engine() override = default;
			engine& operator= (const engine&) = delete;
			engine& operator= (engine&&) = delete;
			expects_lr<receipt> submit(const ledger::transaction& request);
			expects_lr<receipt> submit(const std::string_view& message);
			expects_lr<void> on_item_received(const algorithm::pubkeyhash_t& caller, const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::item_id& id, const std::string_view& data) override;
			expects_lr<void> accept_value(const algorithm::pubkeyhash_t& from, const uint256_t& value, const std::string_view& data);
			expects_lr<void> verify_invariants() const;
			uint256_t max_supply() const;
			uint256_t total_issued() const;
			uint256_t balance_of(const algorithm::pubkeyhash_t& owner) const;
			uint64_t nonce_of(const algorithm::pubkeyhash_t& owner) const;
			uint64_t get_sequence() const;
			std::string_view name() const;
			std::string_view symbol() const;
			uint8_t decimals() const;
			const algorithm::pubkeyhash_t& address() const;
			item_registry* get_registry() const;
			uptr<schema> as_schema() const;

		private:
			transaction_context as_view() const;
		};
	}
}
#endif
