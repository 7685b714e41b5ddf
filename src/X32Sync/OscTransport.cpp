#include "OscTransport.h"
#include "Exceptions.h"
#include "Log.h"

#include <cstdlib>
#include <string>

namespace X32Sync
{
	static void loErrorHandler(int num, const char *msg, const char *path)
	{
		X32SYNC_LOG_WARNING("OSC error %d: %s (%s)", num, msg ? msg : "", path ? path : "null");
	}

	// Probes are expected to fail for most candidates
	static void loQuietErrorHandler(int num, const char *msg, const char *path)
	{
		X32SYNC_LOG_DEBUG("OSC probe error %d: %s (%s)", num, msg ? msg : "", path ? path : "null");
	}

	lo_message encodeArguments(const OscArgs &args)
	{
		lo_message msg = lo_message_new();
		if (!msg)
			return nullptr;

		for (const auto &arg : args)
		{
			int result = 0;
			switch (typeTagOf(arg))
			{
			case LO_INT32:
				result = lo_message_add_int32(msg, std::any_cast<int32_t>(arg));
				break;
			case LO_FLOAT:
				result = lo_message_add_float(msg, std::any_cast<float>(arg));
				break;
			case LO_STRING:
				result = lo_message_add_string(msg, std::any_cast<std::string>(arg).c_str());
				break;
			case LO_BLOB:
			{
				const Blob &data = std::any_cast<const Blob &>(arg);
				lo_blob blob = lo_blob_new(static_cast<int32_t>(data.size()), data.data());
				if (!blob)
				{
					lo_message_free(msg);
					return nullptr;
				}
				// The blob is copied into the message
				result = lo_message_add_blob(msg, blob);
				lo_blob_free(blob);
				break;
			}
			case LO_INT64:
				result = lo_message_add_int64(msg, std::any_cast<int64_t>(arg));
				break;
			case LO_DOUBLE:
				result = lo_message_add_double(msg, std::any_cast<double>(arg));
				break;
			case LO_TRUE:
				result = lo_message_add_true(msg);
				break;
			case LO_FALSE:
				result = lo_message_add_false(msg);
				break;
			default:
				X32SYNC_LOG_WARNING("OscTransport: Unsupported argument type %s", arg.type().name());
				lo_message_free(msg);
				return nullptr;
			}

			if (result < 0)
			{
				lo_message_free(msg);
				return nullptr;
			}
		}

		return msg;
	}

	OscArgs decodeArguments(const char *types, lo_arg **argv, int argc)
	{
		OscArgs args;
		for (int i = 0; i < argc; i++)
		{
			if (!types || !argv || !argv[i])
				continue;

			switch (types[i])
			{
			case LO_INT32:
				args.push_back(std::any(static_cast<int32_t>(argv[i]->i)));
				break;
			case LO_FLOAT:
				args.push_back(std::any(argv[i]->f));
				break;
			case LO_STRING:
			case LO_SYMBOL:
				args.push_back(std::any(std::string(&(argv[i]->s))));
				break;
			case LO_BLOB:
			{
				lo_blob blob = reinterpret_cast<lo_blob>(argv[i]);
				const uint8_t *data = static_cast<const uint8_t *>(lo_blob_dataptr(blob));
				args.push_back(std::any(Blob(data, data + lo_blob_datasize(blob))));
				break;
			}
			case LO_INT64:
				args.push_back(std::any(static_cast<int64_t>(argv[i]->h)));
				break;
			case LO_DOUBLE:
				args.push_back(std::any(argv[i]->d));
				break;
			case LO_TRUE:
				args.push_back(std::any(true));
				break;
			case LO_FALSE:
				args.push_back(std::any(false));
				break;
			default:
				X32SYNC_LOG_DEBUG("OscTransport: Skipping argument with type tag '%c'", types[i]);
				break;
			}
		}
		return args;
	}

	InboundMessage decodeMessage(const char *path, const char *types,
								 lo_arg **argv, int argc, lo_message msg)
	{
		InboundMessage message;
		message.receivedAt = std::chrono::steady_clock::now();
		message.path = path ? path : "";
		message.args = decodeArguments(types, argv, argc);
		message.types = typeTagsOf(message.args);

		lo_address source = msg ? lo_message_get_source(msg) : nullptr;
		if (source)
		{
			const char *host = lo_address_get_hostname(source);
			const char *port = lo_address_get_port(source);
			message.source.host = host ? host : "";
			message.source.port = port ? std::atoi(port) : 0;
		}

		return message;
	}

	LoOscTransport::LoOscTransport(const Endpoint &device, int localPort)
		: m_device(device), m_localPort(localPort), m_oscAddress(nullptr), m_oscServer(nullptr)
	{
	}

	LoOscTransport::~LoOscTransport()
	{
		close();
	}

	void LoOscTransport::open(MessageHandler handler)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_oscServer)
		{
			throw NetworkException("OscTransport: already open");
		}

		m_handler = std::move(handler);

		m_oscAddress = lo_address_new(m_device.host.c_str(), std::to_string(m_device.port).c_str());
		if (!m_oscAddress)
		{
			throw NetworkException("OscTransport: Failed to create OSC address for " + m_device.toString());
		}

		std::string port = std::to_string(m_localPort);
		m_oscServer = lo_server_thread_new(m_localPort > 0 ? port.c_str() : nullptr, loErrorHandler);
		if (!m_oscServer)
		{
			lo_address_free(m_oscAddress);
			m_oscAddress = nullptr;
			throw NetworkException("OscTransport: Failed to create OSC server on port " + port);
		}

		// Generic handler for every path and type signature
		lo_server_thread_add_method(m_oscServer, nullptr, nullptr,
									LoOscTransport::handleOscMessageStatic, this);

		if (lo_server_thread_start(m_oscServer) < 0)
		{
			lo_server_thread_free(m_oscServer);
			m_oscServer = nullptr;
			lo_address_free(m_oscAddress);
			m_oscAddress = nullptr;
			throw NetworkException("OscTransport: Failed to start OSC server thread");
		}

		X32SYNC_LOG_INFO("OscTransport: Listening on port %d, device %s",
						 lo_server_thread_get_port(m_oscServer), m_device.toString().c_str());
	}

	void LoOscTransport::close()
	{
		lo_server_thread server = nullptr;
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			server = m_oscServer;
			m_oscServer = nullptr;
		}

		// Stopping joins the dispatcher thread, which may be inside send()
		if (server)
		{
			lo_server_thread_stop(server);
			lo_server_thread_free(server);
			X32SYNC_LOG_INFO("OscTransport: Closed");
		}

		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_oscAddress)
		{
			lo_address_free(m_oscAddress);
			m_oscAddress = nullptr;
		}
	}

	bool LoOscTransport::isOpen() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_oscServer != nullptr;
	}

	int LoOscTransport::localPort() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_oscServer ? lo_server_thread_get_port(m_oscServer) : 0;
	}

	bool LoOscTransport::send(const std::string &path, const OscArgs &args)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (!m_oscServer || !m_oscAddress)
		{
			return false;
		}

		lo_message msg = encodeArguments(args);
		if (!msg)
		{
			X32SYNC_LOG_ERROR("OscTransport: Failed to encode %s %s", path.c_str(), argsToString(args).c_str());
			return false;
		}

		// Send from the server socket so replies come back to our port
		int result = lo_send_message_from(m_oscAddress, lo_server_thread_get_server(m_oscServer),
										  path.c_str(), msg);
		lo_message_free(msg);

		if (result < 0)
		{
			X32SYNC_LOG_WARNING("OscTransport: Failed to send %s: %s", path.c_str(),
								lo_address_errstr(m_oscAddress));
			return false;
		}

		return true;
	}

	int LoOscTransport::handleOscMessageStatic(const char *path, const char *types,
											   lo_arg **argv, int argc, lo_message msg, void *user_data)
	{
		LoOscTransport *transport = static_cast<LoOscTransport *>(user_data);
		if (transport)
		{
			return transport->handleOscMessage(path, types, argv, argc, msg);
		}
		return 1;
	}

	int LoOscTransport::handleOscMessage(const char *path, const char *types,
										 lo_arg **argv, int argc, lo_message msg)
	{
		InboundMessage message = decodeMessage(path, types, argv, argc, msg);

		if (m_handler)
		{
			try
			{
				m_handler(message);
			}
			catch (const std::exception &e)
			{
				X32SYNC_LOG_ERROR("OscTransport: Handler failed for %s: %s", message.path.c_str(), e.what());
			}
		}

		// Message handled, do not try other methods
		return 0;
	}

	namespace
	{
		struct ProbeReply
		{
			bool received = false;
			InboundMessage message;
		};

		int probeHandler(const char *path, const char *types, lo_arg **argv, int argc,
						 lo_message msg, void *user_data)
		{
			ProbeReply *reply = static_cast<ProbeReply *>(user_data);
			if (!reply->received)
			{
				reply->message = decodeMessage(path, types, argv, argc, msg);
				reply->received = true;
			}
			return 0;
		}
	}

	std::optional<InboundMessage> LoProbe::probe(const Endpoint &candidate, const std::string &path,
												 std::chrono::milliseconds timeout)
	{
		lo_address address = lo_address_new(candidate.host.c_str(), std::to_string(candidate.port).c_str());
		if (!address)
		{
			return std::nullopt;
		}

		lo_server server = lo_server_new(nullptr, loQuietErrorHandler);
		if (!server)
		{
			lo_address_free(address);
			return std::nullopt;
		}

		ProbeReply reply;
		lo_server_add_method(server, nullptr, nullptr, probeHandler, &reply);

		lo_message msg = lo_message_new();
		int sent = msg ? lo_send_message_from(address, server, path.c_str(), msg) : -1;
		if (msg)
		{
			lo_message_free(msg);
		}

		if (sent >= 0)
		{
			auto deadline = std::chrono::steady_clock::now() + timeout;
			while (!reply.received)
			{
				auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
					deadline - std::chrono::steady_clock::now());
				if (remaining.count() <= 0)
					break;
				lo_server_recv_noblock(server, static_cast<int>(remaining.count()));
			}
		}

		lo_server_free(server);
		lo_address_free(address);

		if (!reply.received)
		{
			return std::nullopt;
		}
		return reply.message;
	}

} // namespace X32Sync
