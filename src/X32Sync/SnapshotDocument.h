#pragma once

#include <iosfwd>
#include <string>

#include "StateSnapshot.h"

namespace X32Sync
{
	/**
	 * @brief JSON persistence for state snapshots
	 *
	 * Document shape: {"x32_state": {"/ch/01/mix/fader": 0.75, ...}}.
	 * Integers, floats and strings keep their type across a round trip.
	 * Non-finite floats are written as {"float": "nan" | "inf" | "-inf"}.
	 */
	class SnapshotDocument
	{
	public:
		static constexpr const char *kRootKey = "x32_state";

		/**
		 * @throws DocumentException for values that have no JSON form
		 */
		static void save(std::ostream &out, const StateSnapshot &snapshot);

		/**
		 * @throws DocumentException for malformed JSON or an unexpected shape
		 */
		static StateSnapshot load(std::istream &in);

		static std::string toJsonString(const StateSnapshot &snapshot);
		static StateSnapshot fromJsonString(const std::string &jsonText);

		static void saveToFile(const std::string &filePath, const StateSnapshot &snapshot);
		static StateSnapshot loadFromFile(const std::string &filePath);
	};

} // namespace X32Sync
