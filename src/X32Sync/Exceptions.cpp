#include "Exceptions.h"
#include "OscTypes.h"

#include <unordered_map>

namespace X32Sync
{
	std::string SyncException::getErrorDescription(ErrorCode code)
	{
		static const std::unordered_map<ErrorCode, std::string> descriptions = {
			{ErrorCode::None, "No error"},
			{ErrorCode::Timeout, "Timed out waiting for the device"},
			{ErrorCode::UnknownParameter, "Unknown parameter path"},
			{ErrorCode::InvalidValue, "Invalid parameter value"},
			{ErrorCode::NetworkError, "Network error"},
			{ErrorCode::UnexpectedReply, "Unexpected reply from the device"},
			{ErrorCode::DiscoveryExhausted, "No device found on the local network"},
			{ErrorCode::DocumentError, "Snapshot document error"}};

		auto it = descriptions.find(code);
		if (it != descriptions.end())
		{
			return it->second;
		}

		return "Unknown error";
	}

	TimeoutException::TimeoutException(const std::string &path, std::chrono::milliseconds timeout)
		: SyncException("Timeout after " + std::to_string(timeout.count()) + " ms waiting for " + path,
						ErrorCode::Timeout),
		  m_path(path), m_timeout(timeout), m_isWrite(false)
	{
	}

	TimeoutException::TimeoutException(const std::string &path, std::chrono::milliseconds timeout,
									   const std::vector<std::any> &sent, const std::vector<std::any> &observed)
		: SyncException("Timeout after " + std::to_string(timeout.count()) + " ms setting " + path +
							" to " + argsToString(sent) + ", last observed " + argsToString(observed),
						ErrorCode::Timeout),
		  m_path(path), m_timeout(timeout), m_sent(sent), m_observed(observed), m_isWrite(true)
	{
	}

} // namespace X32Sync
