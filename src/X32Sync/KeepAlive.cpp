#include "KeepAlive.h"
#include "Log.h"

namespace X32Sync
{
	KeepAliveDriver::KeepAliveDriver(PingFunction ping, std::chrono::milliseconds interval)
		: m_ping(std::move(ping)), m_interval(interval), m_running(false), m_pings(0)
	{
	}

	KeepAliveDriver::~KeepAliveDriver()
	{
		stop();
	}

	bool KeepAliveDriver::start()
	{
		if (m_running)
		{
			return false;
		}

		m_running = true;
		m_thread = std::thread(&KeepAliveDriver::pingThread, this);
		return true;
	}

	void KeepAliveDriver::stop()
	{
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			if (!m_running)
				return;
			m_running = false;
		}
		m_cv.notify_all();

		if (m_thread.joinable())
		{
			m_thread.join();
		}
	}

	void KeepAliveDriver::pingThread()
	{
		std::unique_lock<std::mutex> lock(m_mutex);
		while (m_running)
		{
			lock.unlock();
			bool ok = false;
			try
			{
				ok = m_ping();
			}
			catch (const std::exception &e)
			{
				X32SYNC_LOG_DEBUG("KeepAlive: Ping threw: %s", e.what());
			}
			m_pings++;
			if (!ok)
			{
				X32SYNC_LOG_DEBUG("KeepAlive: Ping not sent");
			}
			lock.lock();

			m_cv.wait_for(lock, m_interval, [this]
						  { return !m_running; });
		}
	}

} // namespace X32Sync
