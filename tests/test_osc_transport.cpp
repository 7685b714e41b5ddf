#include <gtest/gtest.h>

#include <lo/lo.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>

#include "Exceptions.h"
#include "MixerClient.h"
#include "OscMessageQueue.h"
#include "OscTransport.h"
#include "ParameterRegistry.h"

using namespace X32Sync;
using namespace std::chrono_literals;

namespace {

// Minimal console on the loopback interface: answers queries with the stored
// value, stores float writes and answers /info like the real device.
class LoopbackConsole {
   public:
    LoopbackConsole() {
        m_server = lo_server_thread_new(nullptr, nullptr);
        if (m_server) {
            lo_server_thread_add_method(m_server, nullptr, nullptr, &LoopbackConsole::handle, this);
            lo_server_thread_start(m_server);
        }
    }

    ~LoopbackConsole() {
        if (m_server) {
            lo_server_thread_stop(m_server);
            lo_server_thread_free(m_server);
        }
    }

    bool valid() const { return m_server != nullptr; }
    int port() const { return lo_server_thread_get_port(m_server); }

    void set(const std::string& path, float value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_values[path] = value;
    }

    float get(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_values[path];
    }

   private:
    static int handle(const char* path, const char* types, lo_arg** argv, int argc, lo_message msg,
                      void* user_data) {
        auto* console = static_cast<LoopbackConsole*>(user_data);
        lo_address source = lo_message_get_source(msg);
        lo_server server = lo_server_thread_get_server(console->m_server);
        std::string address(path);

        if (address == "/info") {
            lo_send_from(source, server, LO_TT_IMMEDIATE, "/info", "ssss", "V2.07", "osc-server", "X32",
                         "4.06");
            return 0;
        }

        std::lock_guard<std::mutex> lock(console->m_mutex);
        if (argc == 1 && types[0] == LO_FLOAT) {
            console->m_values[address] = argv[0]->f;
        } else if (argc == 0) {
            auto it = console->m_values.find(address);
            if (it != console->m_values.end()) {
                lo_send_from(source, server, LO_TT_IMMEDIATE, path, "f", it->second);
            }
        }
        return 0;
    }

    lo_server_thread m_server = nullptr;
    std::mutex m_mutex;
    std::map<std::string, float> m_values;
};

}  // namespace

TEST(OscTransport, ArgumentsSurviveLiblo) {
    OscArgs args{int32_t(-3), 0.75f, std::string("Kick"), Blob{1, 2, 3}, int64_t(1) << 40, 2.5, true, false};

    lo_message msg = encodeArguments(args);
    ASSERT_NE(msg, nullptr);
    EXPECT_STREQ(lo_message_get_types(msg), "ifsbhdTF");

    OscArgs decoded = decodeArguments(lo_message_get_types(msg), lo_message_get_argv(msg),
                                      lo_message_get_argc(msg));
    EXPECT_TRUE(argsIdentical(decoded, args));
    lo_message_free(msg);

    EXPECT_EQ(encodeArguments({std::any('c')}), nullptr);
}

TEST(OscTransport, RepliesArriveOnSendingPort) {
    LoopbackConsole console;
    ASSERT_TRUE(console.valid());
    console.set("/ch/01/mix/fader", 0.5f);

    OscMessageQueue inbound;
    LoOscTransport transport(Endpoint{"127.0.0.1", console.port()}, 0);
    transport.open([&inbound](const InboundMessage& message) { inbound.enqueue(message); });
    ASSERT_TRUE(transport.isOpen());
    EXPECT_GT(transport.localPort(), 0);
    EXPECT_THROW(transport.open(nullptr), NetworkException);

    ASSERT_TRUE(transport.send("/ch/01/mix/fader", {}));

    InboundMessage reply;
    ASSERT_TRUE(inbound.dequeue(reply, 2000ms));
    EXPECT_EQ(reply.path, "/ch/01/mix/fader");
    EXPECT_EQ(reply.types, "f");
    ASSERT_EQ(reply.args.size(), 1u);
    EXPECT_FLOAT_EQ(std::any_cast<float>(reply.args[0]), 0.5f);
    EXPECT_EQ(reply.source.port, console.port());

    transport.close();
    EXPECT_FALSE(transport.isOpen());
    EXPECT_EQ(transport.localPort(), 0);
    EXPECT_FALSE(transport.send("/ch/01/mix/fader", {}));
}

TEST(OscTransport, ProbeFindsConsole) {
    LoopbackConsole console;
    ASSERT_TRUE(console.valid());

    auto reply = LoProbe::probe(Endpoint{"127.0.0.1", console.port()}, "/info", 1000ms);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->path, "/info");
    ASSERT_EQ(reply->args.size(), 4u);
    EXPECT_EQ(std::any_cast<std::string>(reply->args[2]), "X32");
}

TEST(OscTransport, ProbeTimesOutWithoutDevice) {
    // Grab a free port, then release it so nothing answers there
    lo_server placeholder = lo_server_new(nullptr, nullptr);
    ASSERT_NE(placeholder, nullptr);
    int port = lo_server_get_port(placeholder);
    lo_server_free(placeholder);

    auto start = std::chrono::steady_clock::now();
    auto reply = LoProbe::probe(Endpoint{"127.0.0.1", port}, "/info", 100ms);
    EXPECT_FALSE(reply.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
}

TEST(OscTransport, ClientOverLoopback) {
    LoopbackConsole console;
    ASSERT_TRUE(console.valid());
    console.set("/ch/02/mix/fader", 0.25f);

    ClientConfig config;
    config.deviceHost = "127.0.0.1";
    config.devicePort = console.port();
    config.localPort = 0;
    config.timeout = 2000ms;
    config.resendInterval = 100ms;

    ParameterRegistry registry = ParameterRegistry::x32();
    MixerClient client(config, registry);
    client.start();

    EXPECT_FLOAT_EQ(std::any_cast<float>(client.getValue("/ch/02/mix/fader")), 0.25f);

    client.setValue("/ch/02/mix/fader", 0.8f);
    EXPECT_FLOAT_EQ(console.get("/ch/02/mix/fader"), 0.8f);

    InboundMessage info = client.request("/info");
    EXPECT_EQ(info.path, "/info");

    client.stop();
}
