#pragma once

namespace X32Sync
{
	/**
	 * @brief Fader resolution class
	 *
	 * Channel faders have 1024 steps, bus-style send levels 161.
	 */
	enum class FaderKind
	{
		Channel,
		Bus
	};

	/**
	 * @brief Frequency in Hz to the device's normalized float
	 *
	 * Logarithmic between 20 Hz and max, rounded to 1/200.
	 */
	float freqToFloat(double hz, double max = 20000.0);

	double floatToFreq(float value, double max = 20000.0);

	/**
	 * @brief EQ Q factor (0.3 .. 10) to normalized float, inverted and rounded to 1/71
	 */
	float qToFloat(double q);

	double floatToQ(float value);

	/**
	 * @brief Normalized fader position to dB on the four segment fader law
	 *
	 * 0.0 maps to -90 dB, which the console treats as -inf.
	 */
	double faderToDb(float value);

	/**
	 * @brief dB (clamped to -90 .. +10) to a quantized fader position
	 */
	float dbToFader(double db, FaderKind kind = FaderKind::Channel);

	int faderSteps(FaderKind kind);

} // namespace X32Sync
