#include "ClientConfig.h"
#include "DeviceDiscovery.h"
#include "Exceptions.h"
#include "Log.h"
#include "MixerClient.h"
#include "ParameterRegistry.h"
#include "SnapshotDocument.h"
#include "StateSynchronizer.h"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace X32Sync;

namespace
{
	enum class Mode
	{
		None,
		Get,
		Set
	};

	struct CommandLine
	{
		Mode mode = Mode::None;
		std::string address;
		std::string file;
		std::string configFile;
		int devicePort = 0;
		int localPort = 0;
		double timeoutSeconds = 0.0;
		bool verbose = false;
	};

	void printUsage(const char *program)
	{
		std::cerr << "Usage: " << program
				  << " [--address HOST] [--device-port N] [--port N] (--get | --set) --file PATH\n"
				  << "       [--timeout SECONDS] [--config FILE] [--verbose]\n\n"
				  << "  --get            Read the full mixer state into PATH\n"
				  << "  --set            Write the state stored in PATH to the mixer\n"
				  << "  --address HOST   Mixer IP address (scans the local subnet when omitted)\n"
				  << "  --device-port N  Mixer OSC port (default " << kX32Port << ")\n"
				  << "  --port N         Local UDP port (default 10300)\n"
				  << "  --timeout S      Per-parameter timeout in seconds (default 10)\n"
				  << "  --config FILE    JSON client configuration\n"
				  << "  --verbose        Log every step\n";
	}

	bool parseInt(const std::string &text, int &value)
	{
		try
		{
			size_t used = 0;
			value = std::stoi(text, &used);
			return used == text.size();
		}
		catch (const std::logic_error &)
		{
			return false;
		}
	}

	bool parseDouble(const std::string &text, double &value)
	{
		try
		{
			size_t used = 0;
			value = std::stod(text, &used);
			return used == text.size() && value > 0.0;
		}
		catch (const std::logic_error &)
		{
			return false;
		}
	}

	/**
	 * @return false on any usage error
	 */
	bool parseCommandLine(int argc, char *argv[], CommandLine &cmd)
	{
		bool sawGet = false;
		bool sawSet = false;

		for (int i = 1; i < argc; i++)
		{
			std::string arg = argv[i];
			bool hasValue = i + 1 < argc;

			if (arg == "--get")
			{
				sawGet = true;
			}
			else if (arg == "--set")
			{
				sawSet = true;
			}
			else if (arg == "--verbose" || arg == "-v")
			{
				cmd.verbose = true;
			}
			else if (arg == "--address" && hasValue)
			{
				cmd.address = argv[++i];
			}
			else if (arg == "--file" && hasValue)
			{
				cmd.file = argv[++i];
			}
			else if (arg == "--config" && hasValue)
			{
				cmd.configFile = argv[++i];
			}
			else if (arg == "--device-port" && hasValue)
			{
				if (!parseInt(argv[++i], cmd.devicePort))
				{
					std::cerr << "Invalid device port: " << argv[i] << "\n";
					return false;
				}
			}
			else if (arg == "--port" && hasValue)
			{
				if (!parseInt(argv[++i], cmd.localPort))
				{
					std::cerr << "Invalid local port: " << argv[i] << "\n";
					return false;
				}
			}
			else if (arg == "--timeout" && hasValue)
			{
				if (!parseDouble(argv[++i], cmd.timeoutSeconds))
				{
					std::cerr << "Invalid timeout: " << argv[i] << "\n";
					return false;
				}
			}
			else
			{
				std::cerr << "Unknown or incomplete option: " << arg << "\n";
				return false;
			}
		}

		if (sawGet == sawSet)
		{
			std::cerr << "Exactly one of --get or --set is required\n";
			return false;
		}
		if (cmd.file.empty())
		{
			std::cerr << "--file is required\n";
			return false;
		}

		cmd.mode = sawGet ? Mode::Get : Mode::Set;
		return true;
	}
}

/**
 * @brief Entry point for the x32sync command-line tool
 *
 * @return 0 on success, 1 on usage errors, 2 on device or file errors
 */
int main(int argc, char *argv[])
{
	CommandLine cmd;
	if (!parseCommandLine(argc, argv, cmd))
	{
		printUsage(argv[0]);
		return 1;
	}

	logInit("", cmd.verbose);

	ClientConfig config;
	if (!cmd.configFile.empty() && !config.loadFromFile(cmd.configFile))
	{
		std::cerr << "Failed to load configuration from " << cmd.configFile << "\n";
		return 1;
	}

	// Command-line options override the configuration file
	if (!cmd.address.empty())
		config.deviceHost = cmd.address;
	if (cmd.devicePort > 0)
		config.devicePort = cmd.devicePort;
	if (cmd.localPort > 0)
		config.localPort = cmd.localPort;
	if (cmd.timeoutSeconds > 0.0)
		config.timeout = std::chrono::milliseconds(static_cast<long long>(cmd.timeoutSeconds * 1000.0));
	if (cmd.verbose)
		config.verbose = true;

	if (config.verbose)
	{
		logSetLevel(LogLevel::Info);
	}

	try
	{
		if (config.deviceHost.empty())
		{
			std::cerr << "No address given, searching the local network...\n";
			DeviceDiscovery discovery{DiscoveryConfig()};
			Endpoint found = discovery.discover();
			config.deviceHost = found.host;
			config.devicePort = found.port;
			std::cerr << "Found mixer at " << found.toString() << "\n";
		}

		std::string error;
		if (!config.validate(&error))
		{
			std::cerr << "Invalid configuration: " << error << "\n";
			return 1;
		}

		ParameterRegistry registry = ParameterRegistry::x32();
		MixerClient client(config, registry);
		client.start();

		StateSynchronizer synchronizer(client);
		synchronizer.setProgressCallback([](size_t done, size_t total)
										 { std::cerr << "\r" << done << "/" << total << std::flush; });

		if (cmd.mode == Mode::Get)
		{
			StateSnapshot snapshot = synchronizer.captureAll();
			std::cerr << "\n";
			SnapshotDocument::saveToFile(cmd.file, snapshot);
			std::cerr << "Saved " << snapshot.size() << " parameters to " << cmd.file << "\n";
		}
		else
		{
			StateSnapshot snapshot = SnapshotDocument::loadFromFile(cmd.file);
			synchronizer.restoreAll(snapshot);
			std::cerr << "\n";
			std::cerr << "Restored " << snapshot.size() << " parameters from " << cmd.file << "\n";
		}

		client.stop();
	}
	catch (const SyncException &e)
	{
		std::cerr << "\nError (" << SyncException::getErrorDescription(e.code()) << "): " << e.what() << "\n";
		logCleanup();
		return 2;
	}
	catch (const std::exception &e)
	{
		std::cerr << "\nError: " << e.what() << "\n";
		logCleanup();
		return 2;
	}

	logCleanup();
	return 0;
}
