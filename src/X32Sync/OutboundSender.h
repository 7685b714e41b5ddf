#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "OscTypes.h"

namespace X32Sync
{
	/**
	 * @brief Single worker draining outbound messages to the transport
	 *
	 * Callers never write to the socket concurrently; the worker sleeps for
	 * the configured pacing after each datagram so the device's receive
	 * buffer is not overrun.
	 */
	class OutboundSender
	{
	public:
		using SendFunction = std::function<bool(const std::string &, const OscArgs &)>;

		OutboundSender(SendFunction sendFunction, std::chrono::milliseconds pacing);
		~OutboundSender();

		OutboundSender(const OutboundSender &) = delete;
		OutboundSender &operator=(const OutboundSender &) = delete;

		/**
		 * @brief Start the worker thread
		 *
		 * @return false if already running
		 */
		bool start();

		/**
		 * @brief Stop the worker; messages still queued are discarded
		 */
		void stop();

		/**
		 * @brief Queue a message for sending
		 *
		 * @return false if the worker is not running
		 */
		bool enqueue(const std::string &path, const OscArgs &args);

		size_t pending() const;
		uint64_t failedCount() const { return m_failed; }

	private:
		struct Outbound
		{
			std::string path;
			OscArgs args;
		};

		void sendThread();

		SendFunction m_sendFunction;
		std::chrono::milliseconds m_pacing;
		std::deque<Outbound> m_queue;
		mutable std::mutex m_mutex;
		std::condition_variable m_cv;
		std::thread m_thread;
		std::atomic<bool> m_running;
		std::atomic<uint64_t> m_failed;
	};

} // namespace X32Sync
