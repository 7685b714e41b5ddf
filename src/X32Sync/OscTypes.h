#pragma once

#include <any>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace X32Sync
{
	/**
	 * @brief OSC argument list as carried on the wire
	 *
	 * Each element holds one of: int32_t, float, std::string, Blob,
	 * int64_t, double or bool (for the T/F tags).
	 */
	using OscArgs = std::vector<std::any>;

	/**
	 * @brief Raw OSC blob payload
	 */
	using Blob = std::vector<uint8_t>;

	/**
	 * @brief Host/port pair for the local endpoint or the remote device
	 */
	struct Endpoint
	{
		std::string host;
		int port = 0;

		std::string toString() const { return host + ":" + std::to_string(port); }

		bool operator==(const Endpoint &other) const { return host == other.host && port == other.port; }
		bool operator!=(const Endpoint &other) const { return !(*this == other); }
	};

	/**
	 * @brief One decoded datagram as produced by the inbound dispatcher
	 */
	struct InboundMessage
	{
		std::string path;
		std::string types;
		OscArgs args;
		Endpoint source;
		std::chrono::steady_clock::time_point receivedAt;
	};

	/**
	 * @brief OSC type tag for a single argument ('?' for unsupported types)
	 */
	char typeTagOf(const std::any &arg);

	/**
	 * @brief Type tag string for an argument list, without the leading comma
	 */
	std::string typeTagsOf(const OscArgs &args);

	/**
	 * @brief Human readable rendering, e.g. [0.75, 1, "Kick"]
	 */
	std::string argsToString(const OscArgs &args);

	/**
	 * @brief Convert a numeric argument to double
	 *
	 * @return false if the argument is not numeric
	 */
	bool scalarToDouble(const std::any &arg, double &out);

	/**
	 * @brief Byte-for-byte comparison of two argument lists
	 *
	 * Types must match element by element; floating values compare by
	 * their bit pattern.
	 */
	bool argsIdentical(const OscArgs &a, const OscArgs &b);

	/**
	 * @brief Equality rule used by read-back verification
	 *
	 * True when the lists are identical, or both are a single numeric scalar
	 * equal after rounding to decimalDigits, or both are a single floating
	 * value that is NaN.
	 */
	bool argsMatch(const OscArgs &sent, const OscArgs &observed, int decimalDigits = 4);

} // namespace X32Sync
