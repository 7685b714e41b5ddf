#include "SnapshotDocument.h"
#include "Exceptions.h"
#include "Log.h"

#include <cmath>
#include <fstream>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace X32Sync
{
	namespace
	{
		const char *const kNonFiniteKey = "float";

		json valueToJson(const std::string &path, const std::any &value)
		{
			if (value.type() == typeid(float))
			{
				float number = std::any_cast<float>(value);
				if (!std::isfinite(number))
				{
					// JSON has no NaN or infinity; the device reports NaN for some floats
					std::string text = std::isnan(number) ? "nan" : (number > 0 ? "inf" : "-inf");
					return json{{kNonFiniteKey, text}};
				}
				return number;
			}
			else if (value.type() == typeid(int32_t))
			{
				return std::any_cast<int32_t>(value);
			}
			else if (value.type() == typeid(std::string))
			{
				return std::any_cast<std::string>(value);
			}
			throw DocumentException("Cannot store value of type " + std::string(value.type().name()) +
									" for " + path);
		}

		std::any jsonToValue(const std::string &path, const json &value)
		{
			if (value.is_number_integer())
			{
				int64_t number = value.get<int64_t>();
				if (number < std::numeric_limits<int32_t>::min() || number > std::numeric_limits<int32_t>::max())
				{
					throw DocumentException("Integer out of range for " + path);
				}
				return static_cast<int32_t>(number);
			}
			else if (value.is_number_float())
			{
				return value.get<float>();
			}
			else if (value.is_string())
			{
				return value.get<std::string>();
			}
			else if (value.is_boolean())
			{
				return static_cast<int32_t>(value.get<bool>() ? 1 : 0);
			}
			else if (value.is_object() && value.size() == 1 && value.contains(kNonFiniteKey) &&
					 value.at(kNonFiniteKey).is_string())
			{
				const std::string text = value.at(kNonFiniteKey).get<std::string>();
				if (text == "nan")
					return std::numeric_limits<float>::quiet_NaN();
				if (text == "inf")
					return std::numeric_limits<float>::infinity();
				if (text == "-inf")
					return -std::numeric_limits<float>::infinity();
			}
			throw DocumentException("Unsupported value for " + path + ": " + value.dump());
		}
	}

	std::string SnapshotDocument::toJsonString(const StateSnapshot &snapshot)
	{
		json state = json::object();
		for (const auto &[path, value] : snapshot.parameters())
		{
			state[path] = valueToJson(path, value);
		}

		json document;
		document[kRootKey] = state;
		return document.dump(4);
	}

	StateSnapshot SnapshotDocument::fromJsonString(const std::string &jsonText)
	{
		json document;
		try
		{
			document = json::parse(jsonText);
		}
		catch (const json::exception &e)
		{
			throw DocumentException(std::string("JSON parsing error: ") + e.what());
		}

		if (!document.is_object() || document.size() != 1 || !document.contains(kRootKey) ||
			!document[kRootKey].is_object())
		{
			throw DocumentException(std::string("Expected a single '") + kRootKey + "' object at top level");
		}

		StateSnapshot snapshot;
		for (const auto &item : document[kRootKey].items())
		{
			snapshot.setParameter(item.key(), jsonToValue(item.key(), item.value()));
		}
		return snapshot;
	}

	void SnapshotDocument::save(std::ostream &out, const StateSnapshot &snapshot)
	{
		out << toJsonString(snapshot) << std::endl;
		if (!out)
		{
			throw DocumentException("Failed to write snapshot document");
		}
	}

	StateSnapshot SnapshotDocument::load(std::istream &in)
	{
		std::stringstream buffer;
		buffer << in.rdbuf();
		return fromJsonString(buffer.str());
	}

	void SnapshotDocument::saveToFile(const std::string &filePath, const StateSnapshot &snapshot)
	{
		std::ofstream file(filePath);
		if (!file.is_open())
		{
			throw DocumentException("Failed to open " + filePath + " for writing");
		}
		save(file, snapshot);
		X32SYNC_LOG_INFO("SnapshotDocument: Saved %zu parameters to %s", snapshot.size(), filePath.c_str());
	}

	StateSnapshot SnapshotDocument::loadFromFile(const std::string &filePath)
	{
		std::ifstream file(filePath);
		if (!file.is_open())
		{
			throw DocumentException("Failed to open " + filePath);
		}
		StateSnapshot snapshot = load(file);
		X32SYNC_LOG_INFO("SnapshotDocument: Loaded %zu parameters from %s", snapshot.size(), filePath.c_str());
		return snapshot;
	}

} // namespace X32Sync
