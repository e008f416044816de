#ifndef BLK_KERNEL_REGISTRY_H
#define BLK_KERNEL_REGISTRY_H
#include "wallet.h"

namespace blackcheck
{
	namespace ledger
	{
		struct item
		{
			algorithm::item_id id = 0;
			uint256_t seed = 0;
			algorithm::pubkeyhash_t owner;
			algorithm::pubkeyhash_t approved;
			uint8_t rank = 0;
			bool exists = false;

			uptr<schema> as_schema() const;
		};

		class item_receiver
		{
		public:
			virtual ~item_receiver() = default;
			virtual expects_lr<void> on_item_received(const algorithm::pubkeyhash_t& caller, const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::item_id& id, const std::string_view& data) = 0;
		};

		class item_registry
		{
		public:
			virtual ~item_registry() = default;
			virtual expects_lr<item> get_item(const algorithm::item_id& id) const = 0;
			virtual expects_lr<algorithm::pubkeyhash_t> owner_of(const algorithm::item_id& id) const = 0;
			virtual expects_lr<algorithm::pubkeyhash_t> get_approved(const algorithm::item_id& id) const = 0;
			virtual bool is_approved_for_all(const algorithm::pubkeyhash_t& owner, const algorithm::pubkeyhash_t& initiator) const = 0;
			virtual const algorithm::pubkeyhash_t& address() const = 0;
			virtual expects_lr<void> transfer(const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::pubkeyhash_t& to, const algorithm::item_id& id) = 0;
			virtual expects_lr<void> safe_transfer(const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::pubkeyhash_t& to, const algorithm::item_id& id, const std::string_view& data = std::string_view()) = 0;
			virtual expects_lr<void> merge_pair(const algorithm::pubkeyhash_t& initiator, const algorithm::item_id& keep_id, const algorithm::item_id& burn_id, bool swap) = 0;
			virtual expects_lr<void> merge_aggregate(const algorithm::pubkeyhash_t& initiator, const vector<algorithm::item_id>& ids) = 0;
			virtual void checkpoint() = 0;
			virtual void commit() = 0;
			virtual void revert() = 0;
		};

		class memory_registry final : public item_registry
		{
		private:
			struct snapshot
			{
				ordered_map<algorithm::item_id, item> items;
				ordered_map<algorithm::pubkeyhash_t, ordered_set<algorithm::pubkeyhash_t>> operators;
				algorithm::item_id next_id = 0;
			};

		private:
			ordered_map<algorithm::pubkeyhash_t, item_receiver*> receivers;
			vector<snapshot> checkpoints;
			snapshot current;
			algorithm::pubkeyhash_t identity;

		public:
			memory_registry(const std::string_view& new_identity = "checks:registry");
			~memory_registry() override = default;
			expects_lr<item> get_item(const algorithm::item_id& id) const override;
			expects_lr<algorithm::pubkeyhash_t> owner_of(const algorithm::item_id& id) const override;
			expects_lr<algorithm::pubkeyhash_t> get_approved(const algorithm::item_id& id) const override;
			bool is_approved_for_all(const algorithm::pubkeyhash_t& owner, const algorithm::pubkeyhash_t& initiator) const override;
			const algorithm::pubkeyhash_t& address() const override;
			expects_lr<void> transfer(const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::pubkeyhash_t& to, const algorithm::item_id& id) override;
			expects_lr<void> safe_transfer(const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::pubkeyhash_t& to, const algorithm::item_id& id, const std::string_view& data = std::string_view()) override;
			expects_lr<void> merge_pair(const algorithm::pubkeyhash_t& initiator, const algorithm::item_id& keep_id, const algorithm::item_id& burn_id, bool swap) override;
			expects_lr<void> merge_aggregate(const algorithm::pubkeyhash_t& initiator, const vector<algorithm::item_id>& ids) override;
			void checkpoint() override;
			void commit() override;
			void revert() override;
			expects_lr<algorithm::item_id> mint(const algorithm::pubkeyhash_t& owner, uint8_t rank);
			expects_lr<void> approve(const algorithm::pubkeyhash_t& caller, const algorithm::pubkeyhash_t& to, const algorithm::item_id& id);
			void set_approval_for_all(const algorithm::pubkeyhash_t& caller, const algorithm::pubkeyhash_t& initiator, bool approved);
			void bind_receiver(const algorithm::pubkeyhash_t& target, item_receiver* receiver);
			size_t size() const;
			size_t depth() const;

		private:
			expects_lr<item*> find_live(const algorithm::item_id& id);
			bool is_authorized(const item& target, const algorithm::pubkeyhash_t& initiator) const;
		};
	}
}
#endif
