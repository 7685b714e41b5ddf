#include "OscTypes.h"

#include <cmath>
#include <cstring>
#include <sstream>

namespace X32Sync
{
	char typeTagOf(const std::any &arg)
	{
		const std::type_info &type = arg.type();
		if (type == typeid(int32_t))
			return 'i';
		if (type == typeid(float))
			return 'f';
		if (type == typeid(std::string))
			return 's';
		if (type == typeid(Blob))
			return 'b';
		if (type == typeid(int64_t))
			return 'h';
		if (type == typeid(double))
			return 'd';
		if (type == typeid(bool))
			return std::any_cast<bool>(arg) ? 'T' : 'F';
		return '?';
	}

	std::string typeTagsOf(const OscArgs &args)
	{
		std::string tags;
		tags.reserve(args.size());
		for (const auto &arg : args)
		{
			tags.push_back(typeTagOf(arg));
		}
		return tags;
	}

	std::string argsToString(const OscArgs &args)
	{
		std::ostringstream out;
		out << "[";
		for (size_t i = 0; i < args.size(); i++)
		{
			if (i > 0)
				out << ", ";

			const std::any &arg = args[i];
			switch (typeTagOf(arg))
			{
			case 'i':
				out << std::any_cast<int32_t>(arg);
				break;
			case 'f':
				out << std::any_cast<float>(arg);
				break;
			case 's':
				out << '"' << std::any_cast<std::string>(arg) << '"';
				break;
			case 'b':
				out << "<blob " << std::any_cast<Blob>(arg).size() << " bytes>";
				break;
			case 'h':
				out << std::any_cast<int64_t>(arg);
				break;
			case 'd':
				out << std::any_cast<double>(arg);
				break;
			case 'T':
				out << "true";
				break;
			case 'F':
				out << "false";
				break;
			default:
				out << "<?>";
				break;
			}
		}
		out << "]";
		return out.str();
	}

	bool scalarToDouble(const std::any &arg, double &out)
	{
		switch (typeTagOf(arg))
		{
		case 'i':
			out = std::any_cast<int32_t>(arg);
			return true;
		case 'f':
			out = std::any_cast<float>(arg);
			return true;
		case 'h':
			out = static_cast<double>(std::any_cast<int64_t>(arg));
			return true;
		case 'd':
			out = std::any_cast<double>(arg);
			return true;
		default:
			return false;
		}
	}

	static bool argIdentical(const std::any &a, const std::any &b)
	{
		char tag = typeTagOf(a);
		if (tag != typeTagOf(b))
			return false;

		switch (tag)
		{
		case 'i':
			return std::any_cast<int32_t>(a) == std::any_cast<int32_t>(b);
		case 'f':
		{
			float fa = std::any_cast<float>(a);
			float fb = std::any_cast<float>(b);
			return std::memcmp(&fa, &fb, sizeof(float)) == 0;
		}
		case 's':
			return std::any_cast<std::string>(a) == std::any_cast<std::string>(b);
		case 'b':
			return std::any_cast<Blob>(a) == std::any_cast<Blob>(b);
		case 'h':
			return std::any_cast<int64_t>(a) == std::any_cast<int64_t>(b);
		case 'd':
		{
			double da = std::any_cast<double>(a);
			double db = std::any_cast<double>(b);
			return std::memcmp(&da, &db, sizeof(double)) == 0;
		}
		case 'T':
		case 'F':
			return true;
		default:
			return false;
		}
	}

	bool argsIdentical(const OscArgs &a, const OscArgs &b)
	{
		if (a.size() != b.size())
			return false;

		for (size_t i = 0; i < a.size(); i++)
		{
			if (!argIdentical(a[i], b[i]))
				return false;
		}
		return true;
	}

	static bool isFloating(const std::any &arg)
	{
		char tag = typeTagOf(arg);
		return tag == 'f' || tag == 'd';
	}

	bool argsMatch(const OscArgs &sent, const OscArgs &observed, int decimalDigits)
	{
		if (argsIdentical(sent, observed))
			return true;

		if (sent.size() != 1 || observed.size() != 1)
			return false;

		double a = 0.0;
		double b = 0.0;
		if (!scalarToDouble(sent[0], a) || !scalarToDouble(observed[0], b))
			return false;

		// The device answers NaN for a NaN float write
		if (isFloating(sent[0]) && isFloating(observed[0]) && std::isnan(a) && std::isnan(b))
			return true;

		double scale = std::pow(10.0, decimalDigits);
		return std::round(a * scale) == std::round(b * scale);
	}

} // namespace X32Sync
