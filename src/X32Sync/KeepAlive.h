#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace X32Sync
{
	/**
	 * @brief Periodically re-asserts the device's notification subscription
	 *
	 * The device drops notification mode after a period of silence. The
	 * driver fires the subscription message once on start and then every
	 * interval until stopped. Send failures are logged and otherwise ignored.
	 */
	class KeepAliveDriver
	{
	public:
		using PingFunction = std::function<bool()>;

		KeepAliveDriver(PingFunction ping, std::chrono::milliseconds interval);
		~KeepAliveDriver();

		KeepAliveDriver(const KeepAliveDriver &) = delete;
		KeepAliveDriver &operator=(const KeepAliveDriver &) = delete;

		bool start();
		void stop();

		bool isRunning() const { return m_running; }
		uint64_t pingCount() const { return m_pings; }

	private:
		void pingThread();

		PingFunction m_ping;
		std::chrono::milliseconds m_interval;
		std::mutex m_mutex;
		std::condition_variable m_cv;
		std::thread m_thread;
		std::atomic<bool> m_running;
		std::atomic<uint64_t> m_pings;
	};

} // namespace X32Sync
