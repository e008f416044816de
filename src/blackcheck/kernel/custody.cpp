#include "custody.h"

namespace blackcheck
{
	namespace ledger
	{
		bool owner_permission::allows(const item_registry* registry, const algorithm::pubkeyhash_t& caller, const item& target) const
		{
			auto owner = registry->owner_of(target.id);
			return owner && *owner == caller;
		}
		std::string_view owner_permission::as_typename() const
		{
			return "owner";
		}

		bool item_permission::allows(const item_registry* registry, const algorithm::pubkeyhash_t& caller, const item& target) const
		{
			auto approved = registry->get_approved(target.id);
			return approved && !approved->empty() && *approved == caller;
		}
		std::string_view item_permission::as_typename() const
		{
			return "item";
		}

		bool blanket_permission::allows(const item_registry* registry, const algorithm::pubkeyhash_t& caller, const item& target) const
		{
			auto owner = registry->owner_of(target.id);
			return owner && registry->is_approved_for_all(*owner, caller);
		}
		std::string_view blanket_permission::as_typename() const
		{
			return "blanket";
		}

		custody::custody(item_registry* new_registry, const algorithm::pubkeyhash_t& new_holder) : registry(new_registry), holder(new_holder)
		{
			VI_ASSERT(registry != nullptr, "registry should be set");
			permissions.emplace_back(memory::init<owner_permission>());
			permissions.emplace_back(memory::init<item_permission>());
			permissions.emplace_back(memory::init<blanket_permission>());
		}
		expects_lr<item> custody::acquire(const algorithm::pubkeyhash_t& caller, const algorithm::item_id& id)
		{
			auto target = registry->get_item(id);
			if (!target)
				return target.error();

			auto permission = verify_transfer(caller, *target);
			if (!permission)
				return permission.error();

			auto status = registry->transfer(caller, target->owner, holder, id);
			if (!status)
				return status.error();

			return target;
		}
		expects_lr<item> custody::release(const algorithm::pubkeyhash_t& to, const algorithm::item_id& id)
		{
			auto target = verify_held(id);
			if (!target)
				return target.error();

			auto status = registry->safe_transfer(holder, holder, to, id);
			if (!status)
				return status.error();

			return target;
		}
		expects_lr<item> custody::verify_held(const algorithm::item_id& id) const
		{
			auto target = registry->get_item(id);
			if (!target)
				return target.error();
			else if (target->owner != holder)
				return layer_exception(error_code::not_in_custody, "item " + id.to_string() + " is not in custody");

			return target;
		}
		expects_lr<void> custody::verify_transfer(const algorithm::pubkeyhash_t& caller, const item& target) const
		{
			for (auto& permission : permissions)
			{
				if (!permission->allows(registry, caller, target))
					continue;

				VI_DEBUG("[engine] item %s transfer permitted by %s grant", target.id.to_string().c_str(), permission->as_typename().data());
				return expectation::met;
			}

			return layer_exception(error_code::not_authorized, "item " + target.id.to_string() + " transfer is not permitted for " + algorithm::signing::encode_address(caller));
		}
		item_registry* custody::get_registry() const
		{
			return registry;
		}
		const algorithm::pubkeyhash_t& custody::get_holder() const
		{
			return holder;
		}
	}
}
