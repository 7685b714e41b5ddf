#include "ClientConfig.h"
#include "Log.h"

#include <fstream>
#include <string>
#include <iterator>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace X32Sync
{
	static bool readMilliseconds(const json &config, const char *key, std::chrono::milliseconds &target)
	{
		if (!config.contains(key))
			return true;
		if (!config[key].is_number_integer())
		{
			X32SYNC_LOG_ERROR("ClientConfig: '%s' must be an integer", key);
			return false;
		}
		target = std::chrono::milliseconds(config[key].get<int64_t>());
		return true;
	}

	bool ClientConfig::loadFromFile(const std::string &configFile)
	{
		std::ifstream file(configFile);
		if (!file.is_open())
		{
			X32SYNC_LOG_ERROR("ClientConfig: Failed to open configuration file: %s", configFile.c_str());
			return false;
		}

		std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
		if (!loadFromJsonString(text))
		{
			X32SYNC_LOG_ERROR("ClientConfig: Rejected configuration file %s", configFile.c_str());
			return false;
		}

		X32SYNC_LOG_INFO("ClientConfig: Configured from file %s (device %s:%d, local port %d)",
						 configFile.c_str(), deviceHost.c_str(), devicePort, localPort);
		return true;
	}

	bool ClientConfig::loadFromJsonString(const std::string &jsonText)
	{
		try
		{
			json config = json::parse(jsonText);
			if (!config.is_object())
			{
				X32SYNC_LOG_ERROR("ClientConfig: Configuration must be a JSON object");
				return false;
			}

			if (config.contains("deviceHost"))
			{
				deviceHost = config["deviceHost"].get<std::string>();
			}
			if (config.contains("devicePort"))
			{
				devicePort = config["devicePort"].get<int>();
			}
			if (config.contains("localPort"))
			{
				localPort = config["localPort"].get<int>();
			}
			if (config.contains("keepAlivePath"))
			{
				keepAlivePath = config["keepAlivePath"].get<std::string>();
			}
			if (config.contains("queueCapacity"))
			{
				queueCapacity = config["queueCapacity"].get<size_t>();
			}
			if (config.contains("verifyWrites"))
			{
				verifyWrites = config["verifyWrites"].get<bool>();
			}
			if (config.contains("decimalDigits"))
			{
				decimalDigits = config["decimalDigits"].get<int>();
			}
			if (config.contains("verbose"))
			{
				verbose = config["verbose"].get<bool>();
			}

			return readMilliseconds(config, "timeoutMs", timeout) &&
				   readMilliseconds(config, "resendIntervalMs", resendInterval) &&
				   readMilliseconds(config, "keepAliveIntervalMs", keepAliveInterval) &&
				   readMilliseconds(config, "sendPacingMs", sendPacing);
		}
		catch (const json::exception &e)
		{
			X32SYNC_LOG_ERROR("ClientConfig: JSON parsing error: %s", e.what());
			return false;
		}
	}

	bool ClientConfig::validate(std::string *error) const
	{
		auto fail = [error](const std::string &message)
		{
			if (error)
			{
				*error = message;
			}
			return false;
		};

		if (devicePort <= 0 || devicePort > 65535)
			return fail("devicePort must be within 1-65535");
		if (localPort < 0 || localPort > 65535)
			return fail("localPort must be within 0-65535");
		if (timeout.count() <= 0)
			return fail("timeout must be positive");
		if (resendInterval.count() <= 0)
			return fail("resendInterval must be positive");
		if (keepAliveInterval.count() <= 0)
			return fail("keepAliveInterval must be positive");
		if (sendPacing.count() < 0)
			return fail("sendPacing must not be negative");
		if (keepAlivePath.empty() || keepAlivePath[0] != '/')
			return fail("keepAlivePath must start with '/'");
		if (decimalDigits < 0 || decimalDigits > 9)
			return fail("decimalDigits must be within 0-9");
		return true;
	}

	bool DiscoveryConfig::validate(std::string *error) const
	{
		auto fail = [error](const std::string &message)
		{
			if (error)
			{
				*error = message;
			}
			return false;
		};

		if (ports.empty())
			return fail("at least one port is required");
		for (int port : ports)
		{
			if (port <= 0 || port > 65535)
				return fail("port " + std::to_string(port) + " is not within 1-65535");
		}
		if (firstHost < 1 || firstHost > 254)
			return fail("firstHost must be within 1-254");
		if (lastHost < firstHost || lastHost > 254)
			return fail("lastHost must be within firstHost-254");
		if (probeTimeout.count() <= 0)
			return fail("probeTimeout must be positive");
		if (maxPasses < 0)
			return fail("maxPasses must not be negative");
		if (probePath.empty() || probePath[0] != '/')
			return fail("probePath must start with '/'");
		return true;
	}

} // namespace X32Sync
