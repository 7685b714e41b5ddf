#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "ClientConfig.h"
#include "KeepAlive.h"
#include "OscMessageQueue.h"
#include "OscTransport.h"
#include "OscTypes.h"
#include "OutboundSender.h"
#include "ParameterRegistry.h"

namespace X32Sync
{
	/**
	 * @brief Synchronization client for one remote mixing console
	 *
	 * Owns the transport endpoint, the inbound dispatcher sink, the send
	 * worker and the keep-alive driver for its whole lifetime. Every inbound
	 * message is pushed to a single-consumer queue used by the synchronous
	 * request methods, recorded in a passive cache, and fanned out to the
	 * registered callbacks.
	 *
	 * Synchronous requests must be serialized by the caller: each one purges
	 * the inbound queue before sending, and replies are matched by path only.
	 * Two outstanding requests for the same path cannot be told apart.
	 */
	class MixerClient
	{
	public:
		using ParameterCallback = std::function<void(const std::string &, const std::any &)>;

		/**
		 * @brief Last value seen for a path, solicited or not
		 */
		struct CachedValue
		{
			OscArgs args;
			std::chrono::steady_clock::time_point lastSeen;
		};

		/**
		 * @brief Construct a client talking to config.deviceHost over liblo
		 *
		 * @param registry Parameter catalog; must outlive the client
		 * @throws std::invalid_argument if the configuration is invalid
		 */
		MixerClient(const ClientConfig &config, const ParameterRegistry &registry);

		/**
		 * @brief Construct a client on a caller supplied transport
		 */
		MixerClient(const ClientConfig &config, const ParameterRegistry &registry,
					std::unique_ptr<IOscTransport> transport);

		/**
		 * @brief Stops background activity and closes the transport
		 */
		~MixerClient();

		MixerClient(const MixerClient &) = delete;
		MixerClient &operator=(const MixerClient &) = delete;

		/**
		 * @brief Open the transport and start the send worker and keep-alive
		 *
		 * @throws NetworkException if the transport cannot be opened
		 */
		void start();

		void stop();

		bool isRunning() const { return m_running; }

		/**
		 * @brief Send a message and return the very next inbound message
		 *
		 * No address matching; meant for bootstrapping probes where no other
		 * traffic is expected.
		 *
		 * @throws TimeoutException if nothing arrives within the timeout
		 */
		InboundMessage request(const std::string &path, const OscArgs &args = {});

		/**
		 * @brief Send a message and wait for a reply on the same path
		 *
		 * Messages for other paths are discarded; the request is re-sent every
		 * resend interval.
		 *
		 * @return Arguments of the matching reply
		 * @throws TimeoutException if no matching reply arrives within the timeout
		 */
		OscArgs requestMatching(const std::string &path, const OscArgs &args = {});

		/**
		 * @brief Write a value and read it back until the device reports it
		 *
		 * @throws TimeoutException naming the sent and last observed values
		 */
		void writeVerified(const std::string &path, const OscArgs &args);

		/**
		 * @brief Read a registered parameter from the device
		 *
		 * @throws UnknownParameterException before any I/O for unregistered paths
		 * @throws TimeoutException if the device does not answer
		 */
		std::any getValue(const std::string &path);

		/**
		 * @brief Read a registered parameter, served from the cache if fresh
		 *
		 * @param maxAge Cached values younger than this are returned without I/O
		 */
		std::any getValue(const std::string &path, std::chrono::milliseconds maxAge);

		/**
		 * @brief Validate, encode and write a registered parameter
		 *
		 * Uses read-back verification unless verifyWrites is disabled.
		 *
		 * @throws UnknownParameterException, InvalidValueException before any I/O
		 */
		void setValue(const std::string &path, const std::any &value);

		/**
		 * @brief Validate, encode and queue a write without verification
		 */
		void sendValue(const std::string &path, const std::any &value);

		/**
		 * @brief Queue a raw message for sending
		 *
		 * @throws NetworkException if the client is not running
		 */
		void send(const std::string &path, const OscArgs &args = {});

		/**
		 * @brief Register a callback for decoded notifications on registered paths
		 *
		 * @return int Callback ID for later removal
		 */
		int addCallback(ParameterCallback callback);

		void removeCallback(int callbackId);

		std::optional<CachedValue> cachedValue(const std::string &path) const;

		const ClientConfig &config() const { return m_config; }
		const ParameterRegistry &registry() const { return m_registry; }

		/**
		 * @brief Messages dropped by a bounded inbound queue
		 */
		size_t droppedMessages() const { return m_queue.droppedCount(); }

	private:
		void handleInbound(const InboundMessage &message);

		/**
		 * @brief Send query and wait for a reply on path until deadline
		 */
		std::optional<OscArgs> awaitReply(const std::string &path, const OscArgs &query,
										  std::chrono::steady_clock::time_point deadline);

		ClientConfig m_config;
		const ParameterRegistry &m_registry;
		std::unique_ptr<IOscTransport> m_transport;
		OscMessageQueue m_queue;
		OutboundSender m_sender;
		KeepAliveDriver m_keepAlive;
		std::atomic<bool> m_running;

		mutable std::mutex m_cacheMutex;
		std::map<std::string, CachedValue> m_cache;

		std::mutex m_callbackMutex;
		std::map<int, ParameterCallback> m_callbacks;
		int m_nextCallbackId;
	};

} // namespace X32Sync
