#include "DeviceDiscovery.h"
#include "Exceptions.h"
#include "Log.h"
#include "OscTransport.h"

#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace X32Sync
{
	bool FoundSlot::claim(const Endpoint &endpoint)
	{
		int expected = kEmpty;
		if (!m_state.compare_exchange_strong(expected, kWriting, std::memory_order_acq_rel))
		{
			return false;
		}

		m_endpoint = endpoint;
		m_state.store(kPublished, std::memory_order_release);
		return true;
	}

	std::optional<Endpoint> FoundSlot::get() const
	{
		if (!isClaimed())
		{
			return std::nullopt;
		}
		return m_endpoint;
	}

	DeviceDiscovery::DeviceDiscovery(DiscoveryConfig config, Prober prober)
		: m_config(std::move(config)), m_prober(std::move(prober)), m_probesLaunched(0)
	{
		std::string error;
		if (!m_config.validate(&error))
		{
			throw std::invalid_argument("DeviceDiscovery: " + error);
		}
		if (!m_prober)
		{
			m_prober = &LoProbe::probe;
		}
	}

	std::string DeviceDiscovery::localAddress()
	{
		const std::string fallback = "127.0.0.1";

		int sock = socket(AF_INET, SOCK_DGRAM, 0);
		if (sock < 0)
		{
			return fallback;
		}

		// Connecting a UDP socket only selects a route; nothing is sent
		sockaddr_in remote{};
		remote.sin_family = AF_INET;
		remote.sin_port = htons(1);
		inet_pton(AF_INET, "10.255.255.255", &remote.sin_addr);

		std::string result = fallback;
		if (connect(sock, reinterpret_cast<sockaddr *>(&remote), sizeof(remote)) == 0)
		{
			sockaddr_in local{};
			socklen_t length = sizeof(local);
			char buffer[INET_ADDRSTRLEN] = {0};
			if (getsockname(sock, reinterpret_cast<sockaddr *>(&local), &length) == 0 &&
				inet_ntop(AF_INET, &local.sin_addr, buffer, sizeof(buffer)) != nullptr)
			{
				result = buffer;
			}
		}
		else
		{
			X32SYNC_LOG_DEBUG("DeviceDiscovery: No route for local address: %s", std::strerror(errno));
		}

		close(sock);
		return result;
	}

	std::string DeviceDiscovery::subnetPrefix(const std::string &address)
	{
		size_t pos = address.rfind('.');
		if (pos == std::string::npos)
		{
			return address + ".";
		}
		return address.substr(0, pos + 1);
	}

	void DeviceDiscovery::scanPort(const std::string &prefix, int port, FoundSlot &slot)
	{
		std::vector<std::thread> probes;
		probes.reserve(static_cast<size_t>(m_config.lastHost - m_config.firstHost + 1));

		for (int host = m_config.firstHost; host <= m_config.lastHost; host++)
		{
			Endpoint candidate{prefix + std::to_string(host), port};
			try
			{
				probes.emplace_back([this, candidate, &slot]()
									{
					try
					{
						auto reply = m_prober(candidate, m_config.probePath, m_config.probeTimeout);
						if (reply && slot.claim(candidate))
						{
							X32SYNC_LOG_INFO("DeviceDiscovery: Found device at %s", candidate.toString().c_str());
						}
					}
					catch (const std::exception &e)
					{
						X32SYNC_LOG_DEBUG("DeviceDiscovery: Probe %s failed: %s", candidate.toString().c_str(), e.what());
					} });
				m_probesLaunched++;
			}
			catch (const std::system_error &e)
			{
				X32SYNC_LOG_WARNING("DeviceDiscovery: Could not start probe for %s: %s",
									candidate.toString().c_str(), e.what());
				break;
			}
		}

		std::this_thread::sleep_for(m_config.probeTimeout * 2);

		for (auto &probe : probes)
		{
			probe.join();
		}
	}

	std::optional<Endpoint> DeviceDiscovery::scanOnce(const std::string &prefix)
	{
		FoundSlot slot;
		for (int port : m_config.ports)
		{
			scanPort(prefix, port, slot);
			if (slot.isClaimed())
			{
				return slot.get();
			}
		}
		return std::nullopt;
	}

	Endpoint DeviceDiscovery::discover()
	{
		std::string prefix = m_config.subnetPrefix.empty() ? subnetPrefix(localAddress()) : m_config.subnetPrefix;
		X32SYNC_LOG_INFO("DeviceDiscovery: Scanning %s%d-%d", prefix.c_str(), m_config.firstHost, m_config.lastHost);

		for (int pass = 1;; pass++)
		{
			auto found = scanOnce(prefix);
			if (found)
			{
				return *found;
			}

			if (m_config.maxPasses > 0 && pass >= m_config.maxPasses)
			{
				throw DiscoveryException("No device answered on " + prefix + "* after " +
										 std::to_string(pass) + " passes");
			}

			X32SYNC_LOG_INFO("DeviceDiscovery: No device found in pass %d, retrying", pass);
		}
	}

} // namespace X32Sync
