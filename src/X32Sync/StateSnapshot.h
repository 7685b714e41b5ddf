#pragma once

#include <any>
#include <map>
#include <string>
#include <vector>

namespace X32Sync
{
	/**
	 * @brief Full path to value capture of the device state
	 *
	 * Values are std::any holding float, int32_t or std::string, keyed and
	 * iterated in sorted path order.
	 */
	class StateSnapshot
	{
	public:
		/**
		 * @brief Set a parameter value, replacing any previous value
		 *
		 * @param path Parameter path
		 * @param value Parameter value
		 */
		void setParameter(const std::string &path, const std::any &value);

		/**
		 * @brief Check if a parameter exists
		 *
		 * @param path Parameter path
		 * @return true if parameter exists
		 */
		bool hasParameter(const std::string &path) const;

		/**
		 * @brief Get a parameter value
		 *
		 * @throws std::out_of_range if the path is not in the snapshot
		 */
		const std::any &getParameter(const std::string &path) const;

		/**
		 * @brief Get a parameter value as a specific type
		 *
		 * @throws std::bad_any_cast if the stored type differs
		 */
		template <typename T>
		T getParameterAs(const std::string &path) const
		{
			return std::any_cast<T>(getParameter(path));
		}

		/**
		 * @brief Remove a parameter
		 *
		 * @return true if parameter was removed
		 */
		bool removeParameter(const std::string &path);

		/**
		 * @brief Get all parameter paths in sorted order
		 */
		std::vector<std::string> getParameterPaths() const;

		const std::map<std::string, std::any> &parameters() const { return m_parameters; }

		size_t size() const { return m_parameters.size(); }
		bool empty() const { return m_parameters.empty(); }

		/**
		 * @brief Same paths with byte-identical values
		 */
		bool operator==(const StateSnapshot &other) const;
		bool operator!=(const StateSnapshot &other) const { return !(*this == other); }

	private:
		std::map<std::string, std::any> m_parameters;
	};

} // namespace X32Sync
