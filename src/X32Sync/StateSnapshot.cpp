#include "StateSnapshot.h"
#include "OscTypes.h"

#include <stdexcept>

namespace X32Sync
{
	void StateSnapshot::setParameter(const std::string &path, const std::any &value)
	{
		m_parameters[path] = value;
	}

	bool StateSnapshot::hasParameter(const std::string &path) const
	{
		return m_parameters.find(path) != m_parameters.end();
	}

	const std::any &StateSnapshot::getParameter(const std::string &path) const
	{
		auto it = m_parameters.find(path);
		if (it == m_parameters.end())
		{
			throw std::out_of_range("No value for " + path + " in snapshot");
		}
		return it->second;
	}

	bool StateSnapshot::removeParameter(const std::string &path)
	{
		return m_parameters.erase(path) > 0;
	}

	std::vector<std::string> StateSnapshot::getParameterPaths() const
	{
		std::vector<std::string> paths;
		paths.reserve(m_parameters.size());
		for (const auto &[path, value] : m_parameters)
		{
			paths.push_back(path);
		}
		return paths;
	}

	bool StateSnapshot::operator==(const StateSnapshot &other) const
	{
		if (m_parameters.size() != other.m_parameters.size())
			return false;

		auto it = other.m_parameters.begin();
		for (const auto &[path, value] : m_parameters)
		{
			if (path != it->first || !argsIdentical({value}, {it->second}))
				return false;
			++it;
		}
		return true;
	}

} // namespace X32Sync
