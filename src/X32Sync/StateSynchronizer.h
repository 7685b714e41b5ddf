#pragma once

#include <any>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "StateSnapshot.h"

namespace X32Sync
{
	class MixerClient;
	class ParameterRegistry;

	/**
	 * @brief One write of a restore plan
	 */
	struct RestoreStep
	{
		std::string path;
		std::any value;
	};

	/**
	 * @brief Full parameter-set capture and restore over a MixerClient
	 *
	 * Reads and writes are strictly sequential. On restore every fader is
	 * parked at its neutral value first, all other parameters are written
	 * next and faders get their captured value last, so no intermediate
	 * routing or gain state is audible.
	 */
	class StateSynchronizer
	{
	public:
		/**
		 * @brief Progress notification (done, total); observational only
		 */
		using ProgressCallback = std::function<void(size_t, size_t)>;

		/**
		 * @param client Running client; must outlive the synchronizer
		 * @param progressInterval Report progress every N parameters
		 */
		explicit StateSynchronizer(MixerClient &client, size_t progressInterval = 50);

		void setProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }

		/**
		 * @brief Read every registry path in registry order
		 *
		 * @throws TimeoutException if a parameter does not answer
		 * @throws UnexpectedReplyException unless exactly one scalar comes back
		 */
		StateSnapshot captureAll();

		/**
		 * @brief Write a snapshot back with verified writes
		 *
		 * Paths unknown to the registry are skipped, not erased.
		 */
		void restoreAll(const StateSnapshot &snapshot);

		/**
		 * @brief Compute the write order used by restoreAll
		 */
		static std::vector<RestoreStep> planRestore(const StateSnapshot &snapshot,
													const ParameterRegistry &registry);

	private:
		void reportProgress(size_t done, size_t total) const;

		MixerClient &m_client;
		size_t m_progressInterval;
		ProgressCallback m_progress;
	};

} // namespace X32Sync
