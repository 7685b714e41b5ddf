#include "MixerClient.h"
#include "Exceptions.h"
#include "Log.h"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <vector>

namespace X32Sync
{
	namespace
	{
		ClientConfig checkedConfig(const ClientConfig &config)
		{
			std::string error;
			if (!config.validate(&error))
			{
				throw std::invalid_argument("MixerClient: " + error);
			}
			return config;
		}

		std::chrono::milliseconds ceilMilliseconds(std::chrono::steady_clock::duration duration)
		{
			auto ms = std::chrono::ceil<std::chrono::milliseconds>(duration);
			return ms.count() < 1 ? std::chrono::milliseconds(1) : ms;
		}
	}

	MixerClient::MixerClient(const ClientConfig &config, const ParameterRegistry &registry)
		: MixerClient(config, registry,
					  std::make_unique<LoOscTransport>(Endpoint{config.deviceHost, config.devicePort}, config.localPort))
	{
		if (config.deviceHost.empty())
		{
			throw std::invalid_argument("MixerClient: deviceHost is empty, discover the device first");
		}
	}

	MixerClient::MixerClient(const ClientConfig &config, const ParameterRegistry &registry,
							 std::unique_ptr<IOscTransport> transport)
		: m_config(checkedConfig(config)),
		  m_registry(registry),
		  m_transport(std::move(transport)),
		  m_queue(m_config.queueCapacity),
		  m_sender([this](const std::string &path, const OscArgs &args)
				   { return m_transport->send(path, args); },
				   m_config.sendPacing),
		  m_keepAlive([this]()
					  { return m_sender.enqueue(m_config.keepAlivePath, {}); },
					  m_config.keepAliveInterval),
		  m_running(false),
		  m_nextCallbackId(1)
	{
		if (!m_transport)
		{
			throw std::invalid_argument("MixerClient: transport is null");
		}
	}

	MixerClient::~MixerClient()
	{
		stop();
	}

	void MixerClient::start()
	{
		if (m_running)
		{
			return;
		}

		m_transport->open([this](const InboundMessage &message)
						  { handleInbound(message); });
		m_sender.start();
		m_running = true;
		m_keepAlive.start();

		X32SYNC_LOG_INFO("MixerClient: Started (timeout %lld ms, keep-alive %s every %lld ms)",
						 static_cast<long long>(m_config.timeout.count()), m_config.keepAlivePath.c_str(),
						 static_cast<long long>(m_config.keepAliveInterval.count()));
	}

	void MixerClient::stop()
	{
		if (!m_running.exchange(false))
		{
			return;
		}

		m_keepAlive.stop();
		m_sender.stop();
		m_transport->close();

		X32SYNC_LOG_INFO("MixerClient: Stopped");
	}

	void MixerClient::send(const std::string &path, const OscArgs &args)
	{
		if (!m_running || !m_sender.enqueue(path, args))
		{
			throw NetworkException("MixerClient: not running, cannot send " + path);
		}
	}

	InboundMessage MixerClient::request(const std::string &path, const OscArgs &args)
	{
		m_queue.clear();
		send(path, args);

		InboundMessage message;
		if (!m_queue.dequeue(message, m_config.timeout))
		{
			throw TimeoutException(path, m_config.timeout);
		}
		return message;
	}

	std::optional<OscArgs> MixerClient::awaitReply(const std::string &path, const OscArgs &query,
												   std::chrono::steady_clock::time_point deadline)
	{
		send(path, query);
		auto lastSend = std::chrono::steady_clock::now();

		while (true)
		{
			auto now = std::chrono::steady_clock::now();
			if (now >= deadline)
			{
				return std::nullopt;
			}

			auto nextResend = lastSend + m_config.resendInterval;
			if (now >= nextResend)
			{
				send(path, query);
				lastSend = now;
				continue;
			}

			InboundMessage message;
			if (m_queue.dequeue(message, ceilMilliseconds(std::min(deadline, nextResend) - now)))
			{
				if (message.path == path)
				{
					return message.args;
				}
				X32SYNC_LOG_DEBUG("MixerClient: Discarding %s while waiting for %s",
								  message.path.c_str(), path.c_str());
			}
		}
	}

	OscArgs MixerClient::requestMatching(const std::string &path, const OscArgs &args)
	{
		m_queue.clear();

		auto reply = awaitReply(path, args, std::chrono::steady_clock::now() + m_config.timeout);
		if (!reply)
		{
			throw TimeoutException(path, m_config.timeout);
		}
		return *reply;
	}

	void MixerClient::writeVerified(const std::string &path, const OscArgs &args)
	{
		m_queue.clear();

		auto deadline = std::chrono::steady_clock::now() + m_config.timeout;
		OscArgs observed;

		while (true)
		{
			send(path, args);

			auto sliceEnd = std::min(deadline, std::chrono::steady_clock::now() + m_config.resendInterval);
			auto reply = awaitReply(path, {}, sliceEnd);
			if (reply)
			{
				observed = *reply;
				if (argsMatch(args, observed, m_config.decimalDigits))
				{
					return;
				}
				X32SYNC_LOG_DEBUG("MixerClient: %s reads back %s, expected %s", path.c_str(),
								  argsToString(observed).c_str(), argsToString(args).c_str());

				// Retry the write at most once per resend interval
				std::this_thread::sleep_until(sliceEnd);
			}

			if (std::chrono::steady_clock::now() >= deadline)
			{
				throw TimeoutException(path, m_config.timeout, args, observed);
			}
		}
	}

	std::any MixerClient::getValue(const std::string &path)
	{
		const Parameter &parameter = m_registry.get(path);
		return parameter.deserialize(requestMatching(path));
	}

	std::any MixerClient::getValue(const std::string &path, std::chrono::milliseconds maxAge)
	{
		const Parameter &parameter = m_registry.get(path);

		auto cached = cachedValue(path);
		if (cached && std::chrono::steady_clock::now() - cached->lastSeen < maxAge)
		{
			return parameter.deserialize(cached->args);
		}

		return parameter.deserialize(requestMatching(path));
	}

	void MixerClient::setValue(const std::string &path, const std::any &value)
	{
		OscArgs args = m_registry.serialize(path, value);
		if (m_config.verifyWrites)
		{
			writeVerified(path, args);
		}
		else
		{
			send(path, args);
		}
	}

	void MixerClient::sendValue(const std::string &path, const std::any &value)
	{
		send(path, m_registry.serialize(path, value));
	}

	int MixerClient::addCallback(ParameterCallback callback)
	{
		std::lock_guard<std::mutex> lock(m_callbackMutex);
		int callbackId = m_nextCallbackId++;
		m_callbacks[callbackId] = std::move(callback);
		return callbackId;
	}

	void MixerClient::removeCallback(int callbackId)
	{
		std::lock_guard<std::mutex> lock(m_callbackMutex);
		m_callbacks.erase(callbackId);
	}

	std::optional<MixerClient::CachedValue> MixerClient::cachedValue(const std::string &path) const
	{
		std::lock_guard<std::mutex> lock(m_cacheMutex);
		auto it = m_cache.find(path);
		if (it == m_cache.end())
		{
			return std::nullopt;
		}
		return it->second;
	}

	void MixerClient::handleInbound(const InboundMessage &message)
	{
		X32SYNC_LOG_DEBUG("Got message %s %s from %s", message.path.c_str(),
						  argsToString(message.args).c_str(), message.source.toString().c_str());

		{
			std::lock_guard<std::mutex> lock(m_cacheMutex);
			CachedValue &entry = m_cache[message.path];
			// Keep the timestamp monotonic per path
			if (message.receivedAt >= entry.lastSeen)
			{
				entry.args = message.args;
				entry.lastSeen = message.receivedAt;
			}
		}

		if (m_queue.enqueue(message))
		{
			X32SYNC_LOG_DEBUG("MixerClient: Inbound queue full, dropped oldest message");
		}

		std::vector<ParameterCallback> callbacks;
		{
			std::lock_guard<std::mutex> lock(m_callbackMutex);
			for (const auto &[id, callback] : m_callbacks)
			{
				callbacks.push_back(callback);
			}
		}

		if (callbacks.empty() || !m_registry.has(message.path))
		{
			return;
		}

		std::any value;
		try
		{
			value = m_registry.deserialize(message.path, message.args);
		}
		catch (const SyncException &e)
		{
			X32SYNC_LOG_WARNING("MixerClient: Cannot decode %s: %s", message.path.c_str(), e.what());
			return;
		}

		X32SYNC_LOG_DEBUG("Handling callback %s", message.path.c_str());
		for (const auto &callback : callbacks)
		{
			try
			{
				callback(message.path, value);
			}
			catch (const std::exception &e)
			{
				X32SYNC_LOG_ERROR("MixerClient: Callback failed for %s: %s", message.path.c_str(), e.what());
			}
		}
	}

} // namespace X32Sync
