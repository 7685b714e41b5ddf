#include "MixerMath.h"

#include <algorithm>
#include <cmath>

namespace X32Sync
{
	float freqToFloat(double hz, double max)
	{
		return static_cast<float>(std::round(std::log(hz / 20.0) / std::log(max / 20.0) * 200.0) / 200.0);
	}

	double floatToFreq(float value, double max)
	{
		return 20.0 * std::pow(max / 20.0, static_cast<double>(value));
	}

	float qToFloat(double q)
	{
		return static_cast<float>(1.0 - std::round(std::log(q / 0.3) / std::log(10.0 / 0.3) * 71.0) / 71.0);
	}

	double floatToQ(float value)
	{
		return 0.3 * std::pow(10.0 / 0.3, 1.0 - static_cast<double>(value));
	}

	int faderSteps(FaderKind kind)
	{
		return kind == FaderKind::Bus ? 161 : 1024;
	}

	double faderToDb(float value)
	{
		double f = std::clamp(static_cast<double>(value), 0.0, 1.0);
		if (f >= 0.5)
			return f * 40.0 - 30.0;
		if (f >= 0.25)
			return f * 80.0 - 50.0;
		if (f >= 0.0625)
			return f * 160.0 - 70.0;
		return f * 480.0 - 90.0;
	}

	float dbToFader(double db, FaderKind kind)
	{
		double d = std::clamp(db, -90.0, 10.0);
		double f = 0.0;
		if (d < -60.0)
			f = (d + 90.0) / 480.0;
		else if (d < -30.0)
			f = (d + 70.0) / 160.0;
		else if (d < -10.0)
			f = (d + 50.0) / 80.0;
		else
			f = (d + 30.0) / 40.0;

		double steps = faderSteps(kind) - 1;
		return static_cast<float>(std::round(f * steps) / steps);
	}

} // namespace X32Sync
