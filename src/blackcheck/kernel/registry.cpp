#include "registry.h"

namespace blackcheck
{
	namespace ledger
	{
		uptr<schema> item::as_schema() const
		{
			schema* data = var::set::object();
			data->set("id", algorithm::encoding::serialize_uint256(id));
			data->set("rank", var::integer(rank));
			data->set("seed", var::string(algorithm::encoding::encode_0xhex256(seed)));
			data->set("owner", algorithm::signing::serialize_address(owner));
			data->set("approved", algorithm::signing::serialize_address(approved));
			data->set("exists", var::boolean(exists));
			return data;
		}

		memory_registry::memory_registry(const std::string_view& new_identity) : identity(wallet::from_identity(new_identity).public_key_hash)
		{
		}
		expects_lr<item> memory_registry::get_item(const algorithm::item_id& id) const
		{
			auto it = current.items.find(id);
			if (it == current.items.end() || !it->second.exists)
				return layer_exception(error_code::item_not_found, "item " + id.to_string() + " does not exist");

			return it->second;
		}
		expects_lr<algorithm::pubkeyhash_t> memory_registry::owner_of(const algorithm::item_id& id) const
		{
			auto target = get_item(id);
			if (!target)
				return target.error();

			return target->owner;
		}
		expects_lr<algorithm::pubkeyhash_t> memory_registry::get_approved(const algorithm::item_id& id) const
		{
			auto target = get_item(id);
			if (!target)
				return target.error();

			return target->approved;
		}
		bool memory_registry::is_approved_for_all(const algorithm::pubkeyhash_t& owner, const algorithm::pubkeyhash_t& initiator) const
		{
			auto it = current.operators.find(owner);
			return it != current.operators.end() && it->second.find(initiator) != it->second.end();
		}
		const algorithm::pubkeyhash_t& memory_registry::address() const
		{
			return identity;
		}
		expects_lr<void> memory_registry::transfer(const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::pubkeyhash_t& to, const algorithm::item_id& id)
		{
			auto target = find_live(id);
			if (!target)
				return target.error();

			auto* value = *target;
			if (value->owner != from)
				return layer_exception(error_code::registry_rejected, "item " + id.to_string() + " is not owned by sender");
			else if (to.empty())
				return layer_exception(error_code::registry_rejected, "item " + id.to_string() + " transfer to empty address");
			else if (!is_authorized(*value, initiator))
				return layer_exception(error_code::not_authorized, "item " + id.to_string() + " transfer is not approved");

			value->owner = to;
			value->approved.clear();
			if (protocol::now().user.registry.logging)
				VI_INFO("[registry] item %s moved to %s", id.to_string().c_str(), algorithm::signing::encode_address(to).c_str());

			return expectation::met;
		}
		expects_lr<void> memory_registry::safe_transfer(const algorithm::pubkeyhash_t& initiator, const algorithm::pubkeyhash_t& from, const algorithm::pubkeyhash_t& to, const algorithm::item_id& id, const std::string_view& data)
		{
			checkpoint();
			auto status = transfer(initiator, from, to, id);
			if (!status)
			{
				revert();
				return status;
			}

			auto it = receivers.find(to);
			if (it == receivers.end() || !it->second)
			{
				commit();
				return expectation::met;
			}

			status = it->second->on_item_received(identity, initiator, from, id, data);
			if (!status)
			{
				revert();
				return layer_exception(error_code::registry_rejected, "item " + id.to_string() + " rejected by receiver: " + string(status.what()));
			}

			commit();
			return expectation::met;
		}
		expects_lr<void> memory_registry::merge_pair(const algorithm::pubkeyhash_t& initiator, const algorithm::item_id& keep_id, const algorithm::item_id& burn_id, bool swap)
		{
			if (keep_id == burn_id)
				return layer_exception(error_code::registry_rejected, "item cannot be merged with itself");

			auto keep = find_live(keep_id);
			if (!keep)
				return keep.error();

			auto burn = find_live(burn_id);
			if (!burn)
				return burn.error();

			auto* keep_value = *keep;
			auto* burn_value = *burn;
			if (!is_authorized(*keep_value, initiator) || !is_authorized(*burn_value, initiator))
				return layer_exception(error_code::registry_rejected, "items " + keep_id.to_string() + " and " + burn_id.to_string() + " are not held by merge initiator");
			else if (keep_value->rank != burn_value->rank)
				return layer_exception(error_code::registry_rejected, "items " + keep_id.to_string() + " and " + burn_id.to_string() + " differ in rank");
			else if (keep_value->rank >= algorithm::rank::aggregate_rank())
				return layer_exception(error_code::registry_rejected, "items of rank " + to_string((uint32_t)keep_value->rank) + " can only be aggregated");

			++keep_value->rank;
			if (swap)
				keep_value->seed = burn_value->seed;
			keep_value->approved.clear();
			burn_value->approved.clear();
			burn_value->exists = false;
			if (protocol::now().user.registry.logging)
				VI_INFO("[registry] item %s merged into %s (rank: %i)", burn_id.to_string().c_str(), keep_id.to_string().c_str(), (int)keep_value->rank);

			return expectation::met;
		}
		expects_lr<void> memory_registry::merge_aggregate(const algorithm::pubkeyhash_t& initiator, const vector<algorithm::item_id>& ids)
		{
			if (ids.size() != (size_t)algorithm::rank::aggregate_size())
				return layer_exception(error_code::registry_rejected, "aggregate requires " + to_string(algorithm::rank::aggregate_size()) + " items");

			ordered_set<algorithm::item_id> unique;
			vector<item*> targets;
			targets.reserve(ids.size());
			for (auto& id : ids)
			{
				if (!unique.insert(id).second)
					return layer_exception(error_code::registry_rejected, "item " + id.to_string() + " is repeated");

				auto target = find_live(id);
				if (!target)
					return target.error();

				auto* value = *target;
				if (!is_authorized(*value, initiator))
					return layer_exception(error_code::registry_rejected, "item " + id.to_string() + " is not held by aggregate initiator");
				else if (value->rank != algorithm::rank::aggregate_rank())
					return layer_exception(error_code::registry_rejected, "item " + id.to_string() + " is not of rank " + to_string((uint32_t)algorithm::rank::aggregate_rank()));

				targets.push_back(value);
			}

			auto* survivor = targets.front();
			survivor->rank = algorithm::rank::max_rank();
			survivor->approved.clear();
			for (size_t i = 1; i < targets.size(); i++)
			{
				targets[i]->approved.clear();
				targets[i]->exists = false;
			}

			if (protocol::now().user.registry.logging)
				VI_INFO("[registry] item %s aggregated from %i items", survivor->id.to_string().c_str(), (int)targets.size());

			return expectation::met;
		}
		void memory_registry::checkpoint()
		{
			checkpoints.push_back(current);
		}
		void memory_registry::commit()
		{
			VI_ASSERT(!checkpoints.empty(), "checkpoint should be set");
			checkpoints.pop_back();
		}
		void memory_registry::revert()
		{
			VI_ASSERT(!checkpoints.empty(), "checkpoint should be set");
			current = std::move(checkpoints.back());
			checkpoints.pop_back();
		}
		expects_lr<algorithm::item_id> memory_registry::mint(const algorithm::pubkeyhash_t& owner, uint8_t rank)
		{
			if (owner.empty())
				return layer_exception(error_code::registry_rejected, "mint to empty address");
			else if (!algorithm::rank::is_valid(rank))
				return layer_exception(error_code::registry_rejected, "rank " + to_string((uint32_t)rank) + " is out of range");

			item value;
			value.id = ++current.next_id;
			value.seed = algorithm::hashing::hash256i(algorithm::encoding::encode_0xhex256(value.id));
			value.owner = owner;
			value.rank = rank;
			value.exists = true;
			current.items[value.id] = value;
			if (protocol::now().user.registry.logging)
				VI_INFO("[registry] item %s minted (rank: %i)", value.id.to_string().c_str(), (int)rank);

			return value.id;
		}
		expects_lr<void> memory_registry::approve(const algorithm::pubkeyhash_t& caller, const algorithm::pubkeyhash_t& to, const algorithm::item_id& id)
		{
			auto target = find_live(id);
			if (!target)
				return target.error();

			auto* value = *target;
			if (value->owner != caller && !is_approved_for_all(value->owner, caller))
				return layer_exception(error_code::not_authorized, "item " + id.to_string() + " approval by non-owner");

			value->approved = to;
			return expectation::met;
		}
		void memory_registry::set_approval_for_all(const algorithm::pubkeyhash_t& caller, const algorithm::pubkeyhash_t& initiator, bool approved)
		{
			auto& group = current.operators[caller];
			if (approved)
				group.insert(initiator);
			else
				group.erase(initiator);
		}
		void memory_registry::bind_receiver(const algorithm::pubkeyhash_t& target, item_receiver* receiver)
		{
			if (receiver != nullptr)
				receivers[target] = receiver;
			else
				receivers.erase(target);
		}
		size_t memory_registry::size() const
		{
			size_t count = 0;
			for (auto& [id, value] : current.items)
				count += value.exists ? 1 : 0;
			return count;
		}
		size_t memory_registry::depth() const
		{
			return checkpoints.size();
		}
		expects_lr<item*> memory_registry::find_live(const algorithm::item_id& id)
		{
			auto it = current.items.find(id);
			if (it == current.items.end() || !it->second.exists)
				return layer_exception(error_code::item_not_found, "item " + id.to_string() + " does not exist");

			return &it->second;
		}
		bool memory_registry::is_authorized(const item& target, const algorithm::pubkeyhash_t& initiator) const
		{
			return target.owner == initiator || (!target.approved.empty() && target.approved == initiator) || is_approved_for_all(target.owner, initiator);
		}
	}
}
