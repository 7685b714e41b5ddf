#include "ParameterRegistry.h"
#include "Exceptions.h"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace X32Sync
{
	namespace
	{
		const char *const kFaderSuffix = "/fader";

		bool toInteger(const std::any &value, int64_t &out)
		{
			switch (typeTagOf(value))
			{
			case 'i':
				out = std::any_cast<int32_t>(value);
				return true;
			case 'h':
				out = std::any_cast<int64_t>(value);
				return true;
			case 'T':
			case 'F':
				out = std::any_cast<bool>(value) ? 1 : 0;
				return true;
			case 'f':
			case 'd':
			{
				double number = 0.0;
				scalarToDouble(value, number);
				if (std::isfinite(number) && std::floor(number) == number)
				{
					out = static_cast<int64_t>(number);
					return true;
				}
				return false;
			}
			default:
				return false;
			}
		}

		std::string twoDigits(int n)
		{
			char buffer[8];
			std::snprintf(buffer, sizeof(buffer), "%02d", n);
			return buffer;
		}
	}

	bool FloatParameter::validate(const std::any &value) const
	{
		double number = 0.0;
		if (!scalarToDouble(value, number))
			return false;
		return number >= m_minimum && number <= m_maximum;
	}

	OscArgs FloatParameter::serialize(const std::any &value) const
	{
		double number = 0.0;
		scalarToDouble(value, number);
		return {static_cast<float>(number)};
	}

	std::any FloatParameter::deserialize(const OscArgs &args) const
	{
		double number = 0.0;
		if (args.size() != 1 || !scalarToDouble(args[0], number))
		{
			throw UnexpectedReplyException("Expected one number, got " + argsToString(args));
		}
		return static_cast<float>(number);
	}

	bool IntParameter::validate(const std::any &value) const
	{
		int64_t number = 0;
		if (!toInteger(value, number))
			return false;
		return number >= m_minimum && number <= m_maximum;
	}

	OscArgs IntParameter::serialize(const std::any &value) const
	{
		int64_t number = 0;
		toInteger(value, number);
		return {static_cast<int32_t>(number)};
	}

	std::any IntParameter::deserialize(const OscArgs &args) const
	{
		int64_t number = 0;
		if (args.size() != 1 || !toInteger(args[0], number))
		{
			throw UnexpectedReplyException("Expected one integer, got " + argsToString(args));
		}
		return static_cast<int32_t>(number);
	}

	bool StringParameter::validate(const std::any &value) const
	{
		if (value.type() != typeid(std::string))
			return false;
		return std::any_cast<const std::string &>(value).size() <= m_maxLength;
	}

	OscArgs StringParameter::serialize(const std::any &value) const
	{
		return {std::any_cast<std::string>(value)};
	}

	std::any StringParameter::deserialize(const OscArgs &args) const
	{
		if (args.size() != 1 || args[0].type() != typeid(std::string))
		{
			throw UnexpectedReplyException("Expected one string, got " + argsToString(args));
		}
		return args[0];
	}

	void ParameterRegistry::add(const std::string &path, std::shared_ptr<const Parameter> parameter)
	{
		if (!parameter)
		{
			throw std::invalid_argument("Null parameter for " + path);
		}
		if (!m_parameters.emplace(path, std::move(parameter)).second)
		{
			throw std::invalid_argument("Duplicate parameter " + path);
		}
		m_order.push_back(path);
	}

	bool ParameterRegistry::has(const std::string &path) const
	{
		return m_parameters.count(path) > 0;
	}

	const Parameter &ParameterRegistry::get(const std::string &path) const
	{
		auto it = m_parameters.find(path);
		if (it == m_parameters.end())
		{
			throw UnknownParameterException(path);
		}
		return *it->second;
	}

	bool ParameterRegistry::validate(const std::string &path, const std::any &value) const
	{
		return get(path).validate(value);
	}

	OscArgs ParameterRegistry::serialize(const std::string &path, const std::any &value) const
	{
		const Parameter &parameter = get(path);
		if (!parameter.validate(value))
		{
			throw InvalidValueException(path, argsToString({value}));
		}
		return parameter.serialize(value);
	}

	std::any ParameterRegistry::deserialize(const std::string &path, const OscArgs &args) const
	{
		return get(path).deserialize(args);
	}

	bool ParameterRegistry::isFader(const std::string &path)
	{
		const std::string suffix(kFaderSuffix);
		return path.size() >= suffix.size() &&
			   path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0;
	}

	ParameterRegistry ParameterRegistry::x32()
	{
		ParameterRegistry registry;

		auto level = std::make_shared<FloatParameter>(0.0f, 1.0f);
		auto onOff = std::make_shared<IntParameter>(0, 1);
		auto name = std::make_shared<StringParameter>(12);
		auto eqType = std::make_shared<IntParameter>(0, 5);

		// Input channels
		for (int ch = 1; ch <= 32; ch++)
		{
			std::string base = "/ch/" + twoDigits(ch);
			registry.add(base + "/config/name", name);
			registry.add(base + "/preamp/trim", level);
			registry.add(base + "/eq/on", onOff);
			for (int band = 1; band <= 4; band++)
			{
				std::string eq = base + "/eq/" + std::to_string(band);
				registry.add(eq + "/type", eqType);
				registry.add(eq + "/f", level);
				registry.add(eq + "/g", level);
				registry.add(eq + "/q", level);
			}
			registry.add(base + "/mix/on", onOff);
			registry.add(base + "/mix/fader", level);
			registry.add(base + "/mix/pan", level);
		}

		// Mix buses
		for (int bus = 1; bus <= 16; bus++)
		{
			std::string base = "/bus/" + twoDigits(bus);
			registry.add(base + "/config/name", name);
			registry.add(base + "/mix/on", onOff);
			registry.add(base + "/mix/fader", level);
			registry.add(base + "/mix/pan", level);
		}

		for (int mtx = 1; mtx <= 6; mtx++)
		{
			std::string base = "/mtx/" + twoDigits(mtx);
			registry.add(base + "/config/name", name);
			registry.add(base + "/mix/on", onOff);
			registry.add(base + "/mix/fader", level);
		}

		for (int dca = 1; dca <= 8; dca++)
		{
			std::string base = "/dca/" + std::to_string(dca);
			registry.add(base + "/config/name", name);
			registry.add(base + "/on", onOff);
			registry.add(base + "/fader", level);
		}

		registry.add("/main/st/config/name", name);
		registry.add("/main/st/mix/on", onOff);
		registry.add("/main/st/mix/fader", level);
		registry.add("/main/st/mix/pan", level);

		return registry;
	}

} // namespace X32Sync
