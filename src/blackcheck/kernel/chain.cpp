#include "chain.h"
#include "algorithm.h"

namespace blackcheck
{
	layer_exception::layer_exception() : std::exception(), error_kind(error_code::none)
	{
	}
	layer_exception::layer_exception(string&& text) : std::exception(), error_message(std::move(text)), error_kind(error_code::none)
	{
	}
	layer_exception::layer_exception(error_code kind, string&& text) : std::exception(), error_message(std::move(text)), error_kind(kind)
	{
	}
	const char* layer_exception::what() const noexcept
	{
		return error_message.c_str();
	}
	string&& layer_exception::message() noexcept
	{
		return std::move(error_message);
	}
	error_code layer_exception::code() const noexcept
	{
		return error_kind;
	}
	bool layer_exception::is(error_code kind) const noexcept
	{
		return error_kind == kind;
	}
	std::string_view layer_exception::code_name(error_code kind) noexcept
	{
		switch (kind)
		{
			case error_code::supply_ceiling_exceeded:
				return "supply_ceiling_exceeded";
			case error_code::insufficient_balance:
				return "insufficient_balance";
			case error_code::invalid_order:
				return "invalid_order";
			case error_code::not_authorized:
				return "not_authorized";
			case error_code::item_not_found:
				return "item_not_found";
			case error_code::registry_rejected:
				return "registry_rejected";
			case error_code::unsolicited_value_rejected:
				return "unsolicited_value_rejected";
			case error_code::not_in_custody:
				return "not_in_custody";
			case error_code::not_registry:
				return "not_registry";
			case error_code::reentrancy_rejected:
				return "reentrancy_rejected";
			case error_code::invalid_request:
				return "invalid_request";
			case error_code::none:
			default:
				return "none";
		}
	}

	void protocol::logger::output(const std::string_view& message)
	{
		if (!resource || message.empty())
			return;

		time_t time = ::time(nullptr);
		umutex<std::recursive_mutex> unique(mutex);
		resource->write((uint8_t*)message.data(), message.size());
		if (message.back() != '\r' && message.back() != '\n')
			resource->write((uint8_t*)"\n", 1);

		if (!protocol::bound() || time - repack_time < (int64_t)protocol::now().user.logs.archive_repack_interval)
			return;

		auto state = os::file::get_properties(resource->virtual_name());
		size_t current_size = state ? state->size : 0;
		repack_time = time;
		if (current_size <= protocol::now().user.logs.archive_size)
			return;

		string path = string(resource->virtual_name());
		resource = os::file::open_archive(path, protocol::now().user.logs.archive_size).or_else(nullptr);
	}

	protocol::protocol(const inline_args& environment)
	{
		if (!environment.params.empty())
			path = environment.params.back();

		auto working = os::directory::get_working();
		if (!path.empty())
			path = os::path::resolve(path, *working, true).or_else(string(path));

		error_handling::set_flag(log_option::pretty, true);
		error_handling::set_flag(log_option::dated, true);
		error_handling::set_flag(log_option::active, true);

		auto config = uptr<schema>(path.empty() ? (schema*)nullptr : schema::from_json(os::file::read_as_string(path).or_else(string())).or_else((schema*)nullptr));
		if (!environment.args.empty())
		{
			if (!config)
				config = var::set::object();
			for (auto& [key, value] : environment.args)
			{
				if (key == "test")
					continue;

				auto parent = *config;
				for (auto& name : stringify::split(key, '.'))
				{
					auto child = parent->get(name);
					parent = (child ? child : parent->set(name, var::set::object()));
				}
				parent->value = var::any(value);
			}
		}
		if (config)
		{
			auto* value = config->get("network");
			if (value != nullptr && value->value.is(var_type::string))
			{
				auto type = value->value.get_blob();
				if (type == "mainnet")
					user.network = network_type::mainnet;
				else if (type == "testnet")
					user.network = network_type::testnet;
				else if (type == "regtest")
					user.network = network_type::regtest;
			}

			value = config->fetch("engine.logging");
			if (value != nullptr && value->value.is(var_type::boolean))
				user.engine.logging = value->value.get_boolean();

			value = config->fetch("registry.logging");
			if (value != nullptr && value->value.is(var_type::boolean))
				user.registry.logging = value->value.get_boolean();

			value = config->fetch("logs.info_path");
			if (value != nullptr && value->value.is(var_type::string))
				user.logs.info_path = value->value.get_blob();

			value = config->fetch("logs.error_path");
			if (value != nullptr && value->value.is(var_type::string))
				user.logs.error_path = value->value.get_blob();

			value = config->fetch("logs.archive_size");
			if (value != nullptr && value->value.is(var_type::integer))
				user.logs.archive_size = value->value.get_integer();

			value = config->fetch("logs.archive_repack_interval");
			if (value != nullptr && value->value.is(var_type::integer))
				user.logs.archive_repack_interval = value->value.get_integer();
		}

		if (!user.logs.info_path.empty())
		{
			auto log_path = os::path::resolve(user.logs.info_path, *working, true).or_else(user.logs.info_path);
			os::directory::patch(os::path::get_directory(log_path));
			logs.info.resource = os::file::open_archive(log_path, user.logs.archive_size).or_else(nullptr);
		}

		if (!user.logs.error_path.empty())
		{
			auto log_path = os::path::resolve(user.logs.error_path, *working, true).or_else(user.logs.error_path);
			os::directory::patch(os::path::get_directory(log_path));
			logs.error.resource = os::file::open_archive(log_path, user.logs.archive_size).or_else(nullptr);
		}

		if (logs.info.resource || logs.error.resource)
		{
			error_handling::set_callback([this](error_handling::details& data)
			{
				if (data.type.level == log_level::error || data.type.level == log_level::warning || data.type.fatal)
				{
					if (logs.error.resource)
						logs.error.output(error_handling::get_message_text(data));
				}
				else if (logs.info.resource)
					logs.info.output(error_handling::get_message_text(data));
			});
		}

		switch (user.network)
		{
			case blackcheck::network_type::regtest:
				account.address_prefix = "blkrt";
				account.message_magic = 0x51c9e0a7b36d2f18;
				break;
			case blackcheck::network_type::testnet:
				account.address_prefix = "blkt";
				account.message_magic = 0x7d04f3b2e1a96c55;
				break;
			case blackcheck::network_type::mainnet:
				break;
			default:
				VI_PANIC(false, "bad network type");
				break;
		}

		instance = this;
		algorithm::signing::initialize();
	}
	protocol::~protocol()
	{
		algorithm::signing::deinitialize();
		error_handling::set_callback(nullptr);
		if (instance == this)
			instance = nullptr;
	}
	bool protocol::is(network_type type) const
	{
		return user.network == type;
	}
	bool protocol::bound()
	{
		return instance != nullptr;
	}
	protocol& protocol::change()
	{
		VI_ASSERT(instance != nullptr, "protocol parameters are not set!");
		return *instance;
	}
	const protocol& protocol::now()
	{
		VI_ASSERT(instance != nullptr, "protocol parameters are not set!");
		return *instance;
	}
	protocol* protocol::instance = nullptr;
}
