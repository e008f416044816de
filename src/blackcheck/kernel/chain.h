#ifndef BLK_KERNEL_CHAIN_H
#define BLK_KERNEL_CHAIN_H
#include <vitex/compute.h>
#include <vitex/layer.h>
#include <vitex/vitex.h>
#include <set>

namespace blackcheck
{
	using namespace vitex::core;
	using namespace vitex::compute;
	using namespace vitex::layer;

	template <typename k, typename comparator = typename std::set<k>::key_compare>
	using ordered_set = std::set<k, comparator, typename allocation_type<typename std::set<k>::value_type>::type>;

	enum class network_type
	{
		regtest,
		testnet,
		mainnet
	};

	enum class error_code : uint8_t
	{
		none,
		supply_ceiling_exceeded,
		insufficient_balance,
		invalid_order,
		not_authorized,
		item_not_found,
		registry_rejected,
		unsolicited_value_rejected,
		not_in_custody,
		not_registry,
		reentrancy_rejected,
		invalid_request
	};

	class layer_exception : public std::exception
	{
	private:
		string error_message;
		error_code error_kind;

	public:
		layer_exception();
		layer_exception(string&& text);
		layer_exception(error_code kind, string&& text);
		const char* what() const noexcept override;
		string&& message() noexcept;
		error_code code() const noexcept;
		bool is(error_code kind) const noexcept;
		static std::string_view code_name(error_code kind) noexcept;
	};

	template <typename v>
	using expects_lr = expects<v, layer_exception>;

	class protocol
	{
	private:
		static protocol* instance;

	public:
		struct logger
		{
			std::recursive_mutex mutex;
			uptr<stream> resource;
			int64_t repack_time = 0;

			void output(const std::string_view& message);
		};

	public:
		struct user_dynamic_config
		{
			struct
			{
				bool logging = true;
			} engine;
			struct
			{
				bool logging = false;
			} registry;
			struct
			{
				string info_path;
				string error_path;
				uint64_t archive_size = 8 * 1024 * 1024;
				uint64_t archive_repack_interval = 1800;
			} logs;
			network_type network = network_type::mainnet;
		} user;
		struct protocol_message_config
		{
			uint32_t max_message_size = 0xffffff;
			uint32_t decimal_precision = 18;
		} message;
		struct protocol_account_config
		{
			string address_prefix = "blk";
			uint64_t message_magic = 0x2b1a7c0e5d93f461;
		} account;
		struct protocol_policy_config
		{
			string token_name = "Black Check";
			string token_symbol = "$BLKCHK";
			string engine_identity = "blackcheck:engine";
			uint8_t token_decimals = 18;
			uint8_t max_rank = 7;
			uint8_t aggregate_rank = 6;
			uint32_t aggregate_size = 64;
			uint32_t rank_divisor = 4096;
			uint32_t deposit_max_per_request = 256;
		} policy;

	private:
		struct
		{
			logger info;
			logger error;
		} logs;
		string path;

	public:
		protocol(const inline_args& environment);
		virtual ~protocol();
		bool is(network_type type) const;

	public:
		static bool bound();
		static protocol& change();
		static const protocol& now();
	};
}
#endif
