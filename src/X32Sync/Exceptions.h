#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>
#include <any>

namespace X32Sync
{
	/**
	 * @brief Base exception class for all synchronization errors
	 */
	class SyncException : public std::runtime_error
	{
	public:
		/**
		 * @brief Error codes for synchronization exceptions
		 */
		enum class ErrorCode
		{
			None = 0,
			Timeout,			///< No matching reply within the configured timeout
			UnknownParameter,	///< Path is not part of the parameter registry
			InvalidValue,		///< Value rejected by the parameter's validator
			NetworkError,		///< Transport could not be opened or used
			UnexpectedReply,	///< Reply shape does not fit the parameter
			DiscoveryExhausted, ///< Discovery gave up after its pass limit
			DocumentError		///< Snapshot document could not be read or written
		};

		/**
		 * @brief Construct a new SyncException
		 * @param message Error message
		 * @param code Error code
		 */
		SyncException(const std::string &message, ErrorCode code = ErrorCode::None)
			: std::runtime_error(message), m_code(code) {}

		/**
		 * @brief Get the error code
		 * @return ErrorCode
		 */
		ErrorCode code() const { return m_code; }

		/**
		 * @brief Get a description for an error code
		 * @param code The error code
		 * @return std::string The description
		 */
		static std::string getErrorDescription(ErrorCode code);

	private:
		ErrorCode m_code;
	};

	/**
	 * @brief Raised when a request or a verified write runs out of time
	 *
	 * For writes, sentValue() holds the arguments that were written and
	 * observedValue() the last reply seen for the path (empty if none).
	 */
	class TimeoutException : public SyncException
	{
	public:
		TimeoutException(const std::string &path, std::chrono::milliseconds timeout);

		TimeoutException(const std::string &path, std::chrono::milliseconds timeout,
						 const std::vector<std::any> &sent, const std::vector<std::any> &observed);

		const std::string &path() const { return m_path; }
		std::chrono::milliseconds timeout() const { return m_timeout; }
		const std::vector<std::any> &sentValue() const { return m_sent; }
		const std::vector<std::any> &observedValue() const { return m_observed; }
		bool isWrite() const { return m_isWrite; }

	private:
		std::string m_path;
		std::chrono::milliseconds m_timeout;
		std::vector<std::any> m_sent;
		std::vector<std::any> m_observed;
		bool m_isWrite;
	};

	/**
	 * @brief Raised before any I/O when a path is not in the registry
	 */
	class UnknownParameterException : public SyncException
	{
	public:
		explicit UnknownParameterException(const std::string &path)
			: SyncException("Unknown setting " + path, ErrorCode::UnknownParameter), m_path(path) {}

		const std::string &path() const { return m_path; }

	private:
		std::string m_path;
	};

	/**
	 * @brief Raised before any I/O when a value fails validation
	 */
	class InvalidValueException : public SyncException
	{
	public:
		InvalidValueException(const std::string &path, const std::string &value)
			: SyncException(value + " is not a valid value for " + path, ErrorCode::InvalidValue), m_path(path) {}

		const std::string &path() const { return m_path; }

	private:
		std::string m_path;
	};

	class NetworkException : public SyncException
	{
	public:
		explicit NetworkException(const std::string &message)
			: SyncException(message, ErrorCode::NetworkError) {}
	};

	class UnexpectedReplyException : public SyncException
	{
	public:
		explicit UnexpectedReplyException(const std::string &message)
			: SyncException(message, ErrorCode::UnexpectedReply) {}
	};

	class DiscoveryException : public SyncException
	{
	public:
		explicit DiscoveryException(const std::string &message)
			: SyncException(message, ErrorCode::DiscoveryExhausted) {}
	};

	class DocumentException : public SyncException
	{
	public:
		explicit DocumentException(const std::string &message)
			: SyncException(message, ErrorCode::DocumentError) {}
	};

} // namespace X32Sync
