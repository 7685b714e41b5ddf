#pragma once

#include <any>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "OscTypes.h"

namespace X32Sync
{
	/**
	 * @brief Encoder, decoder and validator for one device parameter
	 *
	 * User values are std::any holding float, int32_t or std::string.
	 */
	class Parameter
	{
	public:
		virtual ~Parameter() = default;

		/**
		 * @brief Check a user value against the parameter's range/shape
		 */
		virtual bool validate(const std::any &value) const = 0;

		/**
		 * @brief Encode a validated user value as OSC arguments
		 */
		virtual OscArgs serialize(const std::any &value) const = 0;

		/**
		 * @brief Decode OSC arguments received from the device
		 *
		 * @throws UnexpectedReplyException if the arguments do not fit
		 */
		virtual std::any deserialize(const OscArgs &args) const = 0;

		/**
		 * @brief Value used to park the parameter in a safe position
		 */
		virtual std::any neutralValue() const = 0;
	};

	/**
	 * @brief Normalized device float (faders, pans, EQ frequency/gain/Q)
	 */
	class FloatParameter : public Parameter
	{
	public:
		FloatParameter(float minimum = 0.0f, float maximum = 1.0f)
			: m_minimum(minimum), m_maximum(maximum) {}

		bool validate(const std::any &value) const override;
		OscArgs serialize(const std::any &value) const override;
		std::any deserialize(const OscArgs &args) const override;
		std::any neutralValue() const override { return m_minimum; }

		float minimum() const { return m_minimum; }
		float maximum() const { return m_maximum; }

	private:
		float m_minimum;
		float m_maximum;
	};

	/**
	 * @brief Integer parameter (on/off switches and enumerations)
	 */
	class IntParameter : public Parameter
	{
	public:
		IntParameter(int32_t minimum, int32_t maximum)
			: m_minimum(minimum), m_maximum(maximum) {}

		bool validate(const std::any &value) const override;
		OscArgs serialize(const std::any &value) const override;
		std::any deserialize(const OscArgs &args) const override;
		std::any neutralValue() const override { return m_minimum; }

		int32_t minimum() const { return m_minimum; }
		int32_t maximum() const { return m_maximum; }

	private:
		int32_t m_minimum;
		int32_t m_maximum;
	};

	class StringParameter : public Parameter
	{
	public:
		explicit StringParameter(size_t maxLength) : m_maxLength(maxLength) {}

		bool validate(const std::any &value) const override;
		OscArgs serialize(const std::any &value) const override;
		std::any deserialize(const OscArgs &args) const override;
		std::any neutralValue() const override { return std::string(); }

		size_t maxLength() const { return m_maxLength; }

	private:
		size_t m_maxLength;
	};

	/**
	 * @brief Static catalog of addressable parameters keyed by path
	 *
	 * Filled once at startup and read-only afterwards, so lookups need no
	 * locking. Iteration follows insertion order.
	 */
	class ParameterRegistry
	{
	public:
		/**
		 * @brief Register a parameter
		 *
		 * @throws std::invalid_argument if the path is already registered
		 */
		void add(const std::string &path, std::shared_ptr<const Parameter> parameter);

		bool has(const std::string &path) const;

		/**
		 * @throws UnknownParameterException if the path is not registered
		 */
		const Parameter &get(const std::string &path) const;

		bool validate(const std::string &path, const std::any &value) const;
		OscArgs serialize(const std::string &path, const std::any &value) const;
		std::any deserialize(const std::string &path, const OscArgs &args) const;

		const std::vector<std::string> &paths() const { return m_order; }
		size_t size() const { return m_order.size(); }

		/**
		 * @brief True for parameters that gate audio output level
		 */
		static bool isFader(const std::string &path);

		/**
		 * @brief Catalog of the X32 console
		 */
		static ParameterRegistry x32();

	private:
		std::map<std::string, std::shared_ptr<const Parameter>> m_parameters;
		std::vector<std::string> m_order;
	};

} // namespace X32Sync
