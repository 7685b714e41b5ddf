#include "OutboundSender.h"
#include "Log.h"

namespace X32Sync
{
	OutboundSender::OutboundSender(SendFunction sendFunction, std::chrono::milliseconds pacing)
		: m_sendFunction(std::move(sendFunction)), m_pacing(pacing), m_running(false), m_failed(0)
	{
	}

	OutboundSender::~OutboundSender()
	{
		stop();
	}

	bool OutboundSender::start()
	{
		if (m_running)
		{
			return false;
		}

		m_running = true;
		m_thread = std::thread(&OutboundSender::sendThread, this);
		return true;
	}

	void OutboundSender::stop()
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

		std::lock_guard<std::mutex> lock(m_mutex);
		if (!m_queue.empty())
		{
			X32SYNC_LOG_DEBUG("OutboundSender: Discarding %zu queued messages", m_queue.size());
			m_queue.clear();
		}
	}

	bool OutboundSender::enqueue(const std::string &path, const OscArgs &args)
	{
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			if (!m_running)
			{
				return false;
			}
			m_queue.push_back({path, args});
		}
		m_cv.notify_one();
		return true;
	}

	size_t OutboundSender::pending() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_queue.size();
	}

	void OutboundSender::sendThread()
	{
		X32SYNC_LOG_DEBUG("OutboundSender: Send thread started");

		while (true)
		{
			Outbound outbound;
			{
				std::unique_lock<std::mutex> lock(m_mutex);
				m_cv.wait(lock, [this]
						  { return !m_running || !m_queue.empty(); });
				if (!m_running)
					break;

				outbound = std::move(m_queue.front());
				m_queue.pop_front();
			}

			if (!m_sendFunction(outbound.path, outbound.args))
			{
				m_failed++;
				X32SYNC_LOG_WARNING("OutboundSender: Failed to send %s", outbound.path.c_str());
			}

			if (m_pacing.count() > 0)
			{
				std::this_thread::sleep_for(m_pacing);
			}
		}

		X32SYNC_LOG_DEBUG("OutboundSender: Send thread stopped");
	}

} // namespace X32Sync
