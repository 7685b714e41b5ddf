#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include <lo/lo.h>

#include "OscTypes.h"

namespace X32Sync
{
	/**
	 * @brief Datagram endpoint shared by sends and the inbound dispatcher
	 *
	 * The device pushes notifications back to whichever port last contacted
	 * it, so sends and receives must go through the same local socket.
	 */
	class IOscTransport
	{
	public:
		using MessageHandler = std::function<void(const InboundMessage &)>;

		virtual ~IOscTransport() = default;

		/**
		 * @brief Bind the local endpoint and start dispatching inbound messages
		 *
		 * @param handler Called on the dispatcher thread for every datagram
		 * @throws NetworkException if the endpoint cannot be opened
		 */
		virtual void open(MessageHandler handler) = 0;

		/**
		 * @brief Stop the dispatcher and release the endpoint
		 */
		virtual void close() = 0;

		/**
		 * @brief Send one message to the device
		 *
		 * @return true if the datagram was handed to the socket
		 */
		virtual bool send(const std::string &path, const OscArgs &args) = 0;

		virtual bool isOpen() const = 0;
	};

	/**
	 * @brief liblo implementation: one lo_server_thread bound to the local port
	 */
	class LoOscTransport : public IOscTransport
	{
	public:
		/**
		 * @param device Remote device address
		 * @param localPort Local UDP port (0 lets the system choose)
		 */
		LoOscTransport(const Endpoint &device, int localPort);
		~LoOscTransport() override;

		LoOscTransport(const LoOscTransport &) = delete;
		LoOscTransport &operator=(const LoOscTransport &) = delete;

		void open(MessageHandler handler) override;
		void close() override;
		bool send(const std::string &path, const OscArgs &args) override;
		bool isOpen() const override;

		/**
		 * @brief Port actually bound, 0 while closed
		 */
		int localPort() const;

		const Endpoint &device() const { return m_device; }

	private:
		static int handleOscMessageStatic(const char *path, const char *types,
										  lo_arg **argv, int argc, lo_message msg, void *user_data);
		int handleOscMessage(const char *path, const char *types,
							 lo_arg **argv, int argc, lo_message msg);

		Endpoint m_device;
		int m_localPort;
		lo_address m_oscAddress;
		lo_server_thread m_oscServer;
		MessageHandler m_handler;
		mutable std::mutex m_mutex;
	};

	/**
	 * @brief Probe-only transport used by discovery
	 *
	 * Sends one request from an ephemeral socket and waits for the very next
	 * datagram, without any dispatcher or keep-alive thread.
	 */
	class LoProbe
	{
	public:
		/**
		 * @return The first reply, or nullopt on timeout or send failure
		 */
		static std::optional<InboundMessage> probe(const Endpoint &candidate, const std::string &path,
												   std::chrono::milliseconds timeout);
	};

	/**
	 * @brief Build a liblo message from argument values
	 *
	 * @return New message owned by the caller, nullptr for unsupported types
	 */
	lo_message encodeArguments(const OscArgs &args);

	/**
	 * @brief Convert liblo arguments to argument values
	 */
	OscArgs decodeArguments(const char *types, lo_arg **argv, int argc);

	/**
	 * @brief Build an InboundMessage from a liblo callback
	 */
	InboundMessage decodeMessage(const char *path, const char *types,
								 lo_arg **argv, int argc, lo_message msg);

} // namespace X32Sync
