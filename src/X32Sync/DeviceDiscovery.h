#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "ClientConfig.h"
#include "OscTypes.h"

namespace X32Sync
{
	/**
	 * @brief Single-assignment result shared by concurrent probes
	 *
	 * The first claim wins; later claims fail and leave the value untouched.
	 */
	class FoundSlot
	{
	public:
		/**
		 * @return true if this call stored the endpoint
		 */
		bool claim(const Endpoint &endpoint);

		std::optional<Endpoint> get() const;

		bool isClaimed() const { return m_state.load(std::memory_order_acquire) == kPublished; }

	private:
		static constexpr int kEmpty = 0;
		static constexpr int kWriting = 1;
		static constexpr int kPublished = 2;

		std::atomic<int> m_state{kEmpty};
		Endpoint m_endpoint;
	};

	/**
	 * @brief Locates the console by probing every host of the local /24
	 *
	 * Each probe is independent and short-lived: it sends the liveness
	 * request from its own socket and waits for one reply. When several
	 * devices answer, which one wins is not deterministic.
	 */
	class DeviceDiscovery
	{
	public:
		using Prober = std::function<std::optional<InboundMessage>(const Endpoint &, const std::string &,
																   std::chrono::milliseconds)>;

		/**
		 * @param prober Probe implementation, LoProbe::probe when empty
		 * @throws std::invalid_argument if the configuration is invalid
		 */
		explicit DeviceDiscovery(DiscoveryConfig config, Prober prober = nullptr);

		/**
		 * @brief Scan pass after pass until a device answers
		 *
		 * @throws DiscoveryException after maxPasses passes (when non-zero)
		 */
		Endpoint discover();

		/**
		 * @brief Probe every host of prefix on one port concurrently
		 *
		 * Waits twice the probe timeout, then joins the probes.
		 */
		void scanPort(const std::string &prefix, int port, FoundSlot &slot);

		/**
		 * @brief One pass over all configured ports
		 */
		std::optional<Endpoint> scanOnce(const std::string &prefix);

		/**
		 * @brief IPv4 address of the interface holding the default route
		 *
		 * Uses a connected UDP socket, which sends nothing. Falls back to
		 * 127.0.0.1.
		 */
		static std::string localAddress();

		/**
		 * @brief "192.168.1.20" -> "192.168.1."
		 */
		static std::string subnetPrefix(const std::string &address);

		uint64_t probesLaunched() const { return m_probesLaunched; }

	private:
		DiscoveryConfig m_config;
		Prober m_prober;
		std::atomic<uint64_t> m_probesLaunched;
	};

} // namespace X32Sync
