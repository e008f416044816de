#ifndef BLK_KERNEL_TRANSACTION_H
#define BLK_KERNEL_TRANSACTION_H
#include "wallet.h"

namespace blackcheck
{
	namespace ledger
	{
		struct state;
		struct transaction_context;
		struct receipt;

		struct transaction : messages::authentic
		{
			uint64_t nonce = 0;

			virtual expects_lr<void> validate() const;
			virtual expects_lr<void> execute(transaction_context* context) const;
			virtual bool store_payload(format::wo_stream* stream) const override;
			virtual bool load_payload(format::ro_stream& stream) override;
			virtual bool store_body(format::wo_stream* stream) const = 0;
			virtual bool load_body(format::ro_stream& stream) = 0;
			virtual bool sign(const algorithm::seckey_t& secret_key) override;
			virtual bool sign(const algorithm::seckey_t& secret_key, uint64_t new_nonce);
			virtual uptr<schema> as_schema() const override;
			virtual uint32_t as_type() const override = 0;
			virtual std::string_view as_typename() const override = 0;
		};

		struct receipt final : messages::uniform
		{
			vector<std::pair<uint32_t, format::variables>> events;
			algorithm::pubkeyhash_t from;
			uint256_t transaction_hash = 0;
			uint64_t sequence = 0;
			bool successful = false;

			bool store_payload(format::wo_stream* stream) const override;
			bool load_payload(format::ro_stream& stream) override;
			void emit_event(uint32_t type, format::variables&& values);
			const format::variables* find_event(uint32_t type, size_t offset = 0) const;
			const format::variables* reverse_find_event(uint32_t type, size_t offset = 0) const;
			uptr<schema> as_schema() const override;
			uint32_t as_type() const override;
			std::string_view as_typename() const override;
			static uint32_t as_instance_type();
			static std::string_view as_instance_typename();
			template <typename t>
			void emit_event(format::variables&& values)
			{
				emit_event(t::as_instance_type(), std::move(values));
			}
			template <typename t>
			vector<const format::variables*> find_events(size_t offset = 0) const
			{
				vector<const format::variables*> result;
				while (true)
				{
					auto* event = find_event(t::as_instance_type(), offset++);
					if (!event)
						break;

					result.push_back(event);
				}
				return result;
			}
			template <typename t>
			const format::variables* find_event(size_t offset = 0) const
			{
				return find_event(t::as_instance_type(), offset);
			}
			template <typename t>
			const format::variables* reverse_find_event(size_t offset = 0) const
			{
				return reverse_find_event(t::as_instance_type(), offset);
			}
		};

		struct state : messages::uniform
		{
			uint64_t sequence = 0;

			state(uint64_t new_sequence);
			virtual ~state() = default;
			virtual expects_lr<void> transition(const transaction_context* context, const state* prev_state) = 0;
			virtual bool store(format::wo_stream* stream) const override;
			virtual bool load(format::ro_stream& stream) override;
			virtual bool store_payload(format::wo_stream* stream) const override;
			virtual bool load_payload(format::ro_stream& stream) override;
			virtual bool store_index(format::wo_stream* stream) const = 0;
			virtual bool load_index(format::ro_stream& stream) = 0;
			virtual bool store_data(format::wo_stream* stream) const = 0;
			virtual bool load_data(format::ro_stream& stream) = 0;
			virtual uptr<schema> as_schema() const override;
			virtual uint32_t as_type() const override = 0;
			virtual std::string_view as_typename() const override = 0;
			virtual string as_index() const;
		};
	}
}
#endif
