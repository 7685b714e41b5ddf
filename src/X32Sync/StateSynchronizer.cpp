#include "StateSynchronizer.h"
#include "Exceptions.h"
#include "Log.h"
#include "MixerClient.h"
#include "ParameterRegistry.h"

namespace X32Sync
{
	StateSynchronizer::StateSynchronizer(MixerClient &client, size_t progressInterval)
		: m_client(client), m_progressInterval(progressInterval > 0 ? progressInterval : 1)
	{
	}

	void StateSynchronizer::reportProgress(size_t done, size_t total) const
	{
		if (done % m_progressInterval != 0 && done != total)
			return;

		X32SYNC_LOG_INFO("StateSynchronizer: %zu/%zu parameters", done, total);
		if (m_progress)
		{
			m_progress(done, total);
		}
	}

	StateSnapshot StateSynchronizer::captureAll()
	{
		const ParameterRegistry &registry = m_client.registry();
		const auto &paths = registry.paths();

		StateSnapshot snapshot;
		size_t done = 0;
		for (const auto &path : paths)
		{
			OscArgs args = m_client.requestMatching(path);
			if (args.size() != 1)
			{
				throw UnexpectedReplyException("Expected exactly one value for " + path + ", got " +
											   argsToString(args));
			}

			snapshot.setParameter(path, registry.deserialize(path, args));
			reportProgress(++done, paths.size());
		}

		return snapshot;
	}

	std::vector<RestoreStep> StateSynchronizer::planRestore(const StateSnapshot &snapshot,
															const ParameterRegistry &registry)
	{
		std::vector<RestoreStep> faders;
		std::vector<RestoreStep> others;

		// Snapshot iteration is already sorted by path
		for (const auto &[path, value] : snapshot.parameters())
		{
			if (!registry.has(path))
			{
				continue;
			}

			if (ParameterRegistry::isFader(path))
			{
				faders.push_back({path, value});
			}
			else
			{
				others.push_back({path, value});
			}
		}

		std::vector<RestoreStep> plan;
		plan.reserve(faders.size() * 2 + others.size());
		for (const auto &step : faders)
		{
			plan.push_back({step.path, registry.get(step.path).neutralValue()});
		}
		plan.insert(plan.end(), others.begin(), others.end());
		plan.insert(plan.end(), faders.begin(), faders.end());
		return plan;
	}

	void StateSynchronizer::restoreAll(const StateSnapshot &snapshot)
	{
		const ParameterRegistry &registry = m_client.registry();
		for (const auto &path : snapshot.getParameterPaths())
		{
			if (!registry.has(path))
			{
				X32SYNC_LOG_WARNING("StateSynchronizer: Ignoring unknown setting %s", path.c_str());
			}
		}

		std::vector<RestoreStep> plan = planRestore(snapshot, registry);
		size_t done = 0;
		for (const auto &step : plan)
		{
			m_client.setValue(step.path, step.value);
			reportProgress(++done, plan.size());
		}
	}

} // namespace X32Sync
