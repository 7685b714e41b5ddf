#include "Log.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <vector>

namespace X32Sync
{
	namespace
	{
		std::mutex g_logMutex;
		LogLevel g_level = LogLevel::Warning;
		std::ofstream g_logFile;
		LogCallback g_callback;

		const char *levelName(LogLevel level)
		{
			switch (level)
			{
			case LogLevel::Error:
				return "ERROR";
			case LogLevel::Warning:
				return "WARNING";
			case LogLevel::Info:
				return "INFO";
			case LogLevel::Debug:
				return "DEBUG";
			}
			return "?";
		}

		std::string timestamp()
		{
			std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
			std::tm local{};
			localtime_r(&now, &local);
			char buffer[32];
			std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
			return buffer;
		}
	}

	bool logInit(const std::string &filename, bool verbose, bool debug)
	{
		std::lock_guard<std::mutex> lock(g_logMutex);

		g_level = debug ? LogLevel::Debug : (verbose ? LogLevel::Info : LogLevel::Warning);

		if (g_logFile.is_open())
		{
			g_logFile.close();
		}

		if (!filename.empty())
		{
			g_logFile.open(filename, std::ios::out | std::ios::app);
			if (!g_logFile.is_open())
			{
				std::cerr << "Log: Failed to open log file " << filename << std::endl;
				return false;
			}
		}

		return true;
	}

	void logCleanup()
	{
		std::lock_guard<std::mutex> lock(g_logMutex);
		if (g_logFile.is_open())
		{
			g_logFile.close();
		}
		g_callback = nullptr;
	}

	void logSetLevel(LogLevel level)
	{
		std::lock_guard<std::mutex> lock(g_logMutex);
		g_level = level;
	}

	LogLevel logGetLevel()
	{
		std::lock_guard<std::mutex> lock(g_logMutex);
		return g_level;
	}

	void logSetCallback(LogCallback callback)
	{
		std::lock_guard<std::mutex> lock(g_logMutex);
		g_callback = std::move(callback);
	}

	void logMessage(LogLevel level, const char *fmt, ...)
	{
		va_list args;
		va_start(args, fmt);
		logMessageV(level, fmt, args);
		va_end(args);
	}

	void logMessageV(LogLevel level, const char *fmt, va_list args)
	{
		// Errors and warnings are always logged
		if (level > LogLevel::Warning && level > logGetLevel())
			return;

		va_list copy;
		va_copy(copy, args);
		int length = std::vsnprintf(nullptr, 0, fmt, copy);
		va_end(copy);
		if (length < 0)
			return;

		std::vector<char> buffer(static_cast<size_t>(length) + 1);
		std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
		std::string message(buffer.data(), static_cast<size_t>(length));

		LogCallback callback;
		{
			std::lock_guard<std::mutex> lock(g_logMutex);
			std::string line = timestamp() + " [" + levelName(level) + "] " + message;
			std::cerr << line << std::endl;
			if (g_logFile.is_open())
			{
				g_logFile << line << std::endl;
			}
			callback = g_callback;
		}

		if (callback)
		{
			callback(level, message);
		}
	}

} // namespace X32Sync
