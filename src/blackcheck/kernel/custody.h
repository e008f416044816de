#ifndef BLK_KERNEL_CUSTODY_H
#define BLK_KERNEL_CUSTODY_H
#include "registry.h"

namespace blackcheck
{
	namespace ledger
	{
		class transfer_permission
		{
		public:
			virtual ~transfer_permission() = default;
			virtual bool allows(const item_registry* registry, const algorithm::pubkeyhash_t& caller, const item& target) const = 0;
			virtual std::string_view as_typename() const = 0;
		};

		class owner_permission final : public transfer_permission
		{
		public:
			bool allows(const item_registry* registry, const algorithm::pubkeyhash_t& caller, const item& target) const override;
			std::string_view as_typename() const override;
		};

		class item_permission final : public transfer_permission
		{
		public:
			bool allows(const item_registry* registry, const algorithm::pubkeyhash_t& caller, const item& target) const override;
			std::string_view as_typename() const override;
		};

		class blanket_permission final : public transfer_permission
		{
		public:
			bool allows(const item_registry* registry, const algorithm::pubkeyhash_t& caller, const item& target) const override;
			std::string_view as_typename() const override;
		};

		class custody
		{
		private:
			vector<uptr<transfer_permission>> permissions;
			item_registry* registry;
			algorithm::pubkeyhash_t holder;

		public:
			custody(item_registry* new_registry, const algorithm::pubkeyhash_t& new_holder);
			custody(const custody&) = delete;
			custody(custody&&) = default;
			custody& operator= (const custody&) = delete;
			custody& operator= (custody&&) = default;
			expects_lr<item> acquire(const algorithm::pubkeyhash_t& caller, const algorithm::item_id& id);
			expects_lr<item> release(const algorithm::pubkeyhash_t& to, const algorithm::item_id& id);
			expects_lr<item> verify_held(const algorithm::item_id& id) const;
			expects_lr<void> verify_transfer(const algorithm::pubkeyhash_t& caller, const item& target) const;
			item_registry* get_registry() const;
			const algorithm::pubkeyhash_t& get_holder() const;
		};
	}
}
#endif
