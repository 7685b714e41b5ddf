#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace X32Sync
{
	/**
	 * @brief Well-known device ports (X32 family and XAir family)
	 */
	constexpr int kX32Port = 10023;
	constexpr int kXAirPort = 10024;

	/**
	 * @brief Settings for one MixerClient instance
	 */
	struct ClientConfig
	{
		/// Device IP address; empty means the address must be discovered.
		std::string deviceHost;
		/// Device OSC port.
		int devicePort = kX32Port;
		/// Local UDP port used for both sending and receiving.
		int localPort = 10300;

		/// Budget for an address-matched request or a verified write.
		std::chrono::milliseconds timeout{10000};
		/// Re-send period while waiting for a matching reply.
		std::chrono::milliseconds resendInterval{250};

		/// Subscription message and its period.
		std::string keepAlivePath = "/xremote";
		std::chrono::milliseconds keepAliveInterval{7000};

		/// Delay after each datagram in the send worker.
		std::chrono::milliseconds sendPacing{1};

		/// Inbound queue bound, 0 for unbounded.
		size_t queueCapacity = 0;

		/// Read back every write and retry until it matches.
		bool verifyWrites = true;
		/// Decimal digits kept when comparing numeric read-backs.
		int decimalDigits = 4;

		bool verbose = false;

		/**
		 * @brief Overlay values from a JSON configuration file
		 *
		 * Missing keys keep their current values, unknown keys are ignored.
		 *
		 * @param configFile Path to the configuration file
		 * @return true if the file was read and every known key had the right type
		 */
		bool loadFromFile(const std::string &configFile);

		/**
		 * @brief Overlay values from a JSON string
		 */
		bool loadFromJsonString(const std::string &jsonText);

		/**
		 * @brief Validate configuration values
		 *
		 * @param error Optional output string describing the first validation error.
		 * @return true if the configuration is valid.
		 */
		bool validate(std::string *error = nullptr) const;
	};

	/**
	 * @brief Settings for locating the device on the local subnet
	 */
	struct DiscoveryConfig
	{
		/// Ports probed on every host, in order.
		std::vector<int> ports{kX32Port, kXAirPort};
		/// Host suffix range on the local /24.
		int firstHost = 1;
		int lastHost = 254;
		/// Per-probe reply timeout.
		std::chrono::milliseconds probeTimeout{500};
		/// Liveness request sent by each probe.
		std::string probePath = "/info";
		/// Give up after this many passes, 0 to retry forever.
		int maxPasses = 0;
		/// Subnet prefix such as "192.168.1."; empty derives it from the local address.
		std::string subnetPrefix;

		/**
		 * @brief Validate ports, host range, timeout and probe path
		 *
		 * @param error Optional output string describing the first validation error.
		 */
		bool validate(std::string *error = nullptr) const;
	};

} // namespace X32Sync
