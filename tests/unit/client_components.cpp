#include <algorithm>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "miniadb/client/config.hpp"
#include "miniadb/client/connection.hpp"
#include "miniadb/client/connection_state.hpp"
#include "miniadb/client/key_store.hpp"
#include "miniadb/client/logger.hpp"
#include "miniadb/client/stream_multiplexer.hpp"
#include "miniadb/crypto.hpp"
#include "miniadb/errors.hpp"
#include "mock_device.hpp"

using namespace std::chrono_literals;
using namespace miniadb;
using namespace miniadb::client;
using miniadb::protocol::Command;
using miniadb::protocol::Message;
using miniadb::testing::FakeAdbd;
using miniadb::testing::MockDevice;
using miniadb::testing::make_message;

namespace
{

    ClientConfig test_config()
    {
        ClientConfig config;
        config.banner = "unit-test";
        config.handshake_timeout = 2s;
        config.auth_timeout = 2s;
        config.stream_timeout = 2s;
        return config;
    }

    std::shared_ptr<const crypto::Signer> make_signer(const std::string &comment)
    {
        return std::make_shared<crypto::SodiumSigner>(crypto::SodiumSigner::generate(comment));
    }

    template <typename Error, typename Fn>
    std::optional<decltype(std::declval<Error>().kind())> error_kind(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const Error &ex)
        {
            return ex.kind();
        }
        return std::nullopt;
    }

    bool wait_until_disconnected(const Connection &connection)
    {
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (connection.state() == ConnectionState::Disconnected)
            {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    // Captures what the multiplexer puts on the wire.
    class Recorder
    {
    public:
        void operator()(const Message &message)
        {
            {
                std::lock_guard lock(mutex_);
                sent_.push_back(message);
            }
            changed_.notify_all();
        }

        std::size_t count(Command command) const
        {
            std::lock_guard lock(mutex_);
            return static_cast<std::size_t>(std::count_if(sent_.begin(), sent_.end(), [command](const Message &m)
                                                          { return m.command == command; }));
        }

        bool wait_for(Command command, std::size_t count)
        {
            std::unique_lock lock(mutex_);
            return changed_.wait_for(lock, 2s, [&]
                                     { return std::count_if(sent_.begin(), sent_.end(), [command](const Message &m)
                                                            { return m.command == command; }) >=
                                              static_cast<std::ptrdiff_t>(count); });
        }

        std::vector<Message> of(Command command) const
        {
            std::lock_guard lock(mutex_);
            std::vector<Message> out;
            for (const auto &message : sent_)
            {
                if (message.command == command)
                {
                    out.push_back(message);
                }
            }
            return out;
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable changed_;
        std::vector<Message> sent_;
    };

    StreamMultiplexer::SendFunction send_to(Recorder &recorder)
    {
        return [&recorder](const Message &message)
        { recorder(message); };
    }

    StreamHandle open_stream(StreamMultiplexer &multiplexer, Recorder &recorder, const std::string &destination,
                             std::uint32_t remote_id)
    {
        const auto opens_before = recorder.count(Command::Open);
        auto opened = std::async(std::launch::async, [&]
                                 { return multiplexer.open(destination, deadline_after(2s)); });
        assert(recorder.wait_for(Command::Open, opens_before + 1));
        const auto local_id = recorder.of(Command::Open).back().arg0;
        multiplexer.dispatch(make_message(Command::Okay, remote_id, local_id));
        const auto handle = opened.get();
        assert(handle.local_id == local_id);
        return handle;
    }

    void test_config_defaults_and_json()
    {
        const ClientConfig defaults;
        assert(defaults.max_payload == protocol::kLegacyMaxPayload);
        assert(defaults.handshake_timeout == 10s);
        assert(defaults.auth_timeout == 30s);
        assert(defaults.stream_timeout == 30s);
        assert(defaults.accept_unauthenticated);
        assert(!defaults.log_path);
        assert(!default_banner().empty());

        ClientConfig custom;
        custom.banner = "ci-runner";
        custom.max_payload = 256 * 1024;
        custom.handshake_timeout = 1500ms;
        custom.accept_unauthenticated = false;
        custom.log_path = std::filesystem::path("/tmp/miniadb.log");
        const auto decoded = config_from_json(nlohmann::json(custom));
        assert(decoded.banner == custom.banner);
        assert(decoded.max_payload == custom.max_payload);
        assert(decoded.handshake_timeout == 1500ms);
        assert(decoded.auth_timeout == custom.auth_timeout);
        assert(!decoded.accept_unauthenticated);
        assert(decoded.log_path == custom.log_path);

        const auto partial = config_from_json(nlohmann::json{{"stream_timeout_ms", 250}, {"unknown", 1}});
        assert(partial.stream_timeout == 250ms);
        assert(partial.max_payload == protocol::kLegacyMaxPayload);

        const auto rejects = [](const nlohmann::json &json)
        {
            try
            {
                config_from_json(json);
            }
            catch (const std::invalid_argument &)
            {
                return true;
            }
            return false;
        };
        assert(rejects(nlohmann::json{{"max_payload", "big"}}));
        assert(rejects(nlohmann::json{{"max_payload", 16}}));
        assert(rejects(nlohmann::json{{"max_payload", 2 * 1024 * 1024}}));
        assert(rejects(nlohmann::json{{"handshake_timeout_ms", 0}}));
        assert(rejects(nlohmann::json::array()));

        const auto path = std::filesystem::temp_directory_path() / "miniadb_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"banner": "from-file", "max_payload": 65536})";
        }
        const auto loaded = load_config(path);
        assert(loaded.banner == "from-file");
        assert(loaded.max_payload == 65536);
        std::filesystem::remove(path);
    }

    void test_banner_parsing()
    {
        const auto info = parse_banner("device::ro.product.name=walleye;ro.product.model=Pixel 2;features=cmd,shell_v2");
        assert(info.state == "device");
        assert(info.properties.at("ro.product.name") == "walleye");
        assert(info.properties.at("ro.product.model") == "Pixel 2");
        assert((info.features == std::vector<std::string>{"cmd", "shell_v2"}));

        const auto recovery = parse_banner("recovery::");
        assert(recovery.state == "recovery");
        assert(recovery.properties.empty());

        const auto bare = parse_banner("sideload");
        assert(bare.state == "sideload");
        assert(bare.features.empty());
    }

    void test_key_store()
    {
        KeyStore keys;
        assert(keys.empty());
        auto signer = make_signer("first");
        keys.add(signer);
        keys.add(signer);
        keys.add(make_signer("second"));
        assert(keys.size() == 2);

        bool threw = false;
        try
        {
            keys.add(nullptr);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            keys.at(5);
        }
        catch (const std::out_of_range &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_state_machine_negotiation()
    {
        ConnectionStateMachine machine(HandshakeOptions{.banner = "box", .max_payload = 4096}, KeyStore{}, Logger{});
        assert(machine.state() == ConnectionState::Disconnected);

        const auto hello = machine.start();
        assert(hello.command == Command::Cnxn);
        assert(hello.arg0 == protocol::kVersion);
        assert(hello.arg1 == 4096);
        assert(hello.payload == protocol::to_cstring_bytes("host::box"));
        assert(machine.state() == ConnectionState::AwaitingAuth);

        const auto reply = machine.on_message(protocol::Message{
            .command = Command::Cnxn,
            .arg0 = protocol::kVersion,
            .arg1 = 1024 * 1024,
            .payload = protocol::to_cstring_bytes("device::features=cmd"),
        });
        assert(!reply);
        assert(machine.state() == ConnectionState::Connected);
        assert(machine.max_payload() == 4096);
        assert(machine.banner() == "device::features=cmd");

        // Stray handshake traffic after connecting changes nothing.
        assert(!machine.on_message(make_message(Command::Cnxn, protocol::kVersion, 256)));
        assert(machine.max_payload() == 4096);

        machine.reset();
        assert(machine.state() == ConnectionState::Disconnected);
    }

    void test_state_machine_errors()
    {
        ConnectionStateMachine strict(HandshakeOptions{.banner = "box", .accept_unauthenticated = false}, KeyStore{},
                                      Logger{});
        strict.start();
        assert(error_kind<ConnectionError>([&]
                                           { strict.on_message(make_message(Command::Cnxn, protocol::kVersion, 4096)); }) ==
               ConnectionFault::AuthPolicyViolation);

        ConnectionStateMachine keyless(HandshakeOptions{.banner = "box"}, KeyStore{}, Logger{});
        keyless.start();
        assert(error_kind<ConnectionError>([&]
                                           { keyless.on_message(make_message(Command::Auth, 1, 0, "token")); }) ==
               ConnectionFault::AuthRequired);

        KeyStore keys;
        keys.add(make_signer("k"));
        ConnectionStateMachine odd(HandshakeOptions{.banner = "box"}, keys, Logger{});
        odd.start();
        assert(error_kind<ConnectionError>([&]
                                           { odd.on_message(make_message(Command::Auth, 7, 0, "???")); }) ==
               ConnectionFault::UnexpectedResponse);

        assert(!odd.on_message(make_message(Command::Okay, 1, 1)));
        assert(odd.state() == ConnectionState::AwaitingAuth);
    }

    void test_auth_cycle_offers_key_once()
    {
        const auto key = make_signer("only");
        KeyStore keys;
        keys.add(key);
        ConnectionStateMachine machine(HandshakeOptions{.banner = "box"}, keys, Logger{});
        machine.start();

        std::size_t offers = 0;
        std::size_t signatures = 0;
        for (int round = 0; round < 6; ++round)
        {
            const auto reply = machine.on_message(make_message(Command::Auth, 1, 0, "challenge"));
            assert(reply);
            if (reply->arg0 == static_cast<std::uint32_t>(protocol::AuthType::RsaPublicKey))
            {
                ++offers;
                auto expected = key->public_key();
                expected.push_back(0);
                assert(reply->payload == expected);
            }
            else
            {
                assert(reply->arg0 == static_cast<std::uint32_t>(protocol::AuthType::Signature));
                ++signatures;
            }
        }
        assert(offers == 1);
        assert(signatures == 5);
        assert(machine.auth_key_offered());
        assert(machine.state() == ConnectionState::AwaitingSignature);
    }

    // Device that trusts a fixed set of keys and learns any key it is offered.
    struct AuthenticatingDevice
    {
        std::vector<protocol::Bytes> trusted;
        bool learn_offered_keys{true};
        std::size_t tokens{0};
        std::size_t offers{0};

        MockDevice::Handler handler()
        {
            return [this](MockDevice &device, const Message &message)
            {
                const auto token = protocol::to_bytes("challenge-" + std::to_string(tokens));
                if (message.command == Command::Cnxn)
                {
                    ++tokens;
                    device.emit(protocol::Message{.command = Command::Auth, .arg0 = 1, .arg1 = 0, .payload = token});
                    return;
                }
                if (message.command != Command::Auth)
                {
                    return;
                }
                if (message.arg0 == static_cast<std::uint32_t>(protocol::AuthType::Signature))
                {
                    const auto challenge = protocol::to_bytes("challenge-" + std::to_string(tokens - 1));
                    for (const auto &key : trusted)
                    {
                        if (crypto::verify_signature(challenge, message.payload, key))
                        {
                            device.emit(protocol::Message{
                                .command = Command::Cnxn,
                                .arg0 = protocol::kVersion,
                                .arg1 = 1024 * 1024,
                                .payload = protocol::to_cstring_bytes("device::ro.product.name=authed"),
                            });
                            return;
                        }
                    }
                    ++tokens;
                    device.emit(protocol::Message{.command = Command::Auth, .arg0 = 1, .arg1 = 0, .payload = token});
                    return;
                }
                if (message.arg0 == static_cast<std::uint32_t>(protocol::AuthType::RsaPublicKey))
                {
                    ++offers;
                    if (!learn_offered_keys)
                    {
                        return;
                    }
                    if (auto key = crypto::parse_public_key(message.payload))
                    {
                        trusted.push_back(*key);
                    }
                    ++tokens;
                    device.emit(protocol::Message{.command = Command::Auth, .arg0 = 1, .arg1 = 0, .payload = token});
                }
            };
        }
    };

    void test_auth_second_key_accepted()
    {
        const auto rejected = std::make_shared<crypto::SodiumSigner>(crypto::SodiumSigner::generate("old"));
        const auto accepted = std::make_shared<crypto::SodiumSigner>(crypto::SodiumSigner::generate("new"));
        AuthenticatingDevice script;
        const auto raw = accepted->raw_public_key();
        script.trusted.emplace_back(raw.begin(), raw.end());

        KeyStore keys;
        keys.add(rejected);
        keys.add(accepted);
        auto device = std::make_shared<MockDevice>(script.handler());
        Connection connection(device, test_config(), keys, Logger{});
        connection.connect();

        assert(connection.state() == ConnectionState::Connected);
        assert(connection.signatures_sent() == 2);
        assert(!connection.auth_key_offered());
        assert(device->count_sent(Command::Auth) == 2);
        assert(connection.max_payload() == 4096);
        assert(connection.device_info().properties.at("ro.product.name") == "authed");
        connection.close();
        assert(connection.state() == ConnectionState::Disconnected);
    }

    void test_auth_after_public_key_offer()
    {
        AuthenticatingDevice script;
        KeyStore keys;
        keys.add(make_signer("unknown-to-device"));
        auto device = std::make_shared<MockDevice>(script.handler());
        Connection connection(device, test_config(), keys, Logger{});
        connection.connect();

        assert(connection.state() == ConnectionState::Connected);
        assert(connection.signatures_sent() == 2);
        assert(connection.auth_key_offered());
        assert(script.offers == 1);
    }

    void test_auth_offer_unanswered_times_out()
    {
        AuthenticatingDevice script;
        script.learn_offered_keys = false;
        KeyStore keys;
        keys.add(make_signer("ignored"));
        auto device = std::make_shared<MockDevice>(script.handler());
        auto config = test_config();
        config.handshake_timeout = 100ms;
        config.auth_timeout = 300ms;
        Connection connection(device, config, keys, Logger{});

        const auto started = std::chrono::steady_clock::now();
        assert(error_kind<ConnectionError>([&]
                                           { connection.connect(); }) == ConnectionFault::Timeout);
        // The key offer extends the wait beyond the plain handshake timeout.
        assert(std::chrono::steady_clock::now() - started >= 250ms);
        assert(script.offers == 1);
        assert(connection.state() == ConnectionState::Disconnected);
    }

    void test_auth_without_keys()
    {
        AuthenticatingDevice script;
        auto device = std::make_shared<MockDevice>(script.handler());
        Connection connection(device, test_config(), KeyStore{}, Logger{});
        assert(error_kind<ConnectionError>([&]
                                           { connection.connect(); }) == ConnectionFault::AuthRequired);
        assert(connection.state() == ConnectionState::Disconnected);
    }

    void test_unauthenticated_policy()
    {
        FakeAdbd adbd;
        auto device = std::make_shared<MockDevice>(adbd.handler());
        auto config = test_config();
        config.accept_unauthenticated = false;
        Connection connection(device, config, KeyStore{}, Logger{});
        assert(error_kind<ConnectionError>([&]
                                           { connection.connect(); }) == ConnectionFault::AuthPolicyViolation);
        assert(connection.state() == ConnectionState::Disconnected);
    }

    void test_handshake_timeout_and_cancel()
    {
        auto silent = std::make_shared<MockDevice>();
        Connection timed(silent, test_config(), KeyStore{}, Logger{});
        assert(error_kind<ConnectionError>([&]
                                           { timed.connect(100ms); }) == ConnectionFault::Timeout);
        assert(silent->count_sent(Command::Cnxn) == 1);

        auto other = std::make_shared<MockDevice>();
        Connection cancelled(other, test_config(), KeyStore{}, Logger{});
        std::stop_source stop;
        std::thread canceller([&]
                              {
                                  std::this_thread::sleep_for(50ms);
                                  stop.request_stop(); });
        assert(error_kind<ConnectionError>([&]
                                           { cancelled.connect(stop.get_token()); }) == ConnectionFault::Cancelled);
        canceller.join();
    }

    void test_connect_and_shell()
    {
        FakeAdbd adbd;
        adbd.set_shell_output("echo hi", "hi\n");
        auto device = std::make_shared<MockDevice>(adbd.handler());
        Connection connection(device, test_config(), KeyStore{}, Logger{});

        assert(error_kind<ConnectionError>([&]
                                           { connection.open("shell:echo hi"); }) == ConnectionFault::NotConnected);

        connection.connect();
        assert(connection.state() == ConnectionState::Connected);
        assert(connection.max_payload() == 4096);
        const auto info = connection.device_info();
        assert(info.state == "device");
        assert(info.properties.at("ro.product.model") == "Mock");
        assert((info.features == std::vector<std::string>{"shell_v2", "cmd"}));

        const auto hello = device->sent().front();
        assert(hello.command == Command::Cnxn);
        assert(hello.payload == protocol::to_cstring_bytes("host::unit-test"));

        auto stream = connection.open("shell:echo hi");
        const auto output = stream.read_until_close(deadline_after(2s));
        assert(std::string(output.begin(), output.end()) == "hi\n");
        stream.close();

        assert(error_kind<StreamError>([&]
                                       { connection.open("jdwp:1234"); }) == StreamFault::Rejected);
        assert(connection.open_streams() == 0);
    }

    void test_transport_loss()
    {
        FakeAdbd adbd;
        auto device = std::make_shared<MockDevice>(adbd.handler());
        Connection connection(device, test_config(), KeyStore{}, Logger{});
        connection.connect();

        auto stream = connection.open("hold:logs");
        auto pending = std::async(std::launch::async, [&]
                                  { return stream.read(deadline_after(5s)); });
        std::this_thread::sleep_for(20ms);
        device->disconnect();

        try
        {
            pending.get();
            assert(false && "read survived transport loss");
        }
        catch (const ConnectionError &ex)
        {
            assert(ex.kind() == ConnectionFault::TransportLost);
        }
        assert(wait_until_disconnected(connection));
        assert(error_kind<ConnectionError>([&]
                                           { stream.read(); }) == ConnectionFault::TransportLost);
        assert(error_kind<ConnectionError>([&]
                                           { connection.open("shell:ls"); }) == ConnectionFault::NotConnected);

        // A Disconnected connection starts over on a fresh transport.
        connection.replace_transport(std::make_shared<MockDevice>(adbd.handler()));
        connection.connect();
        assert(connection.state() == ConnectionState::Connected);
        assert(connection.open_streams() == 0);
    }

    void test_oversized_payload_ends_connection()
    {
        FakeAdbd adbd;
        auto device = std::make_shared<MockDevice>(adbd.handler());
        Connection connection(device, test_config(), KeyStore{}, Logger{});
        connection.connect();

        auto stream = connection.open("hold:big");
        const std::vector<std::uint8_t> big(connection.max_payload() + 1, 0x33);
        device->emit_raw(protocol::encode_message(Command::Wrte, 100, stream.local_id(), big));

        try
        {
            stream.read(deadline_after(2s));
            assert(false && "oversized WRTE delivered");
        }
        catch (const ProtocolError &ex)
        {
            assert(ex.kind() == ProtocolFault::OversizedPayload);
            assert(ex.layer() == "protocol");
            assert(ex.command() == static_cast<std::uint32_t>(Command::Wrte));
        }
        assert(wait_until_disconnected(connection));
    }

    void test_corrupted_frame_reaches_every_stream()
    {
        FakeAdbd adbd;
        auto device = std::make_shared<MockDevice>(adbd.handler());
        Connection connection(device, test_config(), KeyStore{}, Logger{});
        connection.connect();

        auto target = connection.open("hold:a");
        auto bystander = connection.open("hold:b");
        auto bystander_read = std::async(std::launch::async, [&]
                                         { return bystander.read(deadline_after(2s)); });

        const std::vector<std::uint8_t> payload{'a', 'b', 'c'};
        auto frame = protocol::encode_message(Command::Wrte, 100, target.local_id(), payload);
        frame[protocol::kHeaderSize + 1] ^= 0x01;
        device->emit_raw(frame);

        assert(error_kind<ProtocolError>([&]
                                         { target.read(deadline_after(2s)); }) == ProtocolFault::ChecksumMismatch);
        assert(error_kind<ProtocolError>([&]
                                         { bystander_read.get(); }) == ProtocolFault::ChecksumMismatch);
        assert(wait_until_disconnected(connection));
        assert(error_kind<ConnectionError>([&]
                                           { connection.open("shell:ls"); }) == ConnectionFault::NotConnected);
    }

    void test_multiplexer_open_outcomes()
    {
        Recorder recorder;
        StreamMultiplexer multiplexer(send_to(recorder), Logger{});
        multiplexer.reset(4096);

        const auto handle = open_stream(multiplexer, recorder, "shell:ls", 77);
        assert(multiplexer.remote_id(handle) == 77);
        assert(multiplexer.destination(handle) == "shell:ls");
        assert(recorder.of(Command::Open).back().payload == protocol::to_cstring_bytes("shell:ls"));

        auto refused = std::async(std::launch::async, [&]
                                  { return multiplexer.open("forward:tcp:1", deadline_after(2s)); });
        assert(recorder.wait_for(Command::Open, 2));
        const auto refused_id = recorder.of(Command::Open).back().arg0;
        assert(refused_id != handle.local_id);
        multiplexer.dispatch(make_message(Command::Clse, 0, refused_id));
        try
        {
            refused.get();
            assert(false && "refused open succeeded");
        }
        catch (const StreamError &ex)
        {
            assert(ex.kind() == StreamFault::Rejected);
        }

        // Timed out open: a late OKAY is answered with CLSE.
        assert(error_kind<StreamError>([&]
                                       { multiplexer.open("slow:", deadline_after(30ms)); }) == StreamFault::Timeout);
        const auto slow_id = recorder.of(Command::Open).back().arg0;
        assert(multiplexer.stream_count() == 1);
        multiplexer.dispatch(make_message(Command::Okay, 600, slow_id));
        const auto closes = recorder.of(Command::Clse);
        assert(!closes.empty());
        assert(closes.back().arg0 == slow_id);
        assert(closes.back().arg1 == 600);

        std::stop_source stop;
        auto cancelled = std::async(std::launch::async, [&]
                                    { return multiplexer.open("cancel:", deadline_after(2s), stop.get_token()); });
        assert(recorder.wait_for(Command::Open, 4));
        stop.request_stop();
        try
        {
            cancelled.get();
            assert(false && "cancelled open succeeded");
        }
        catch (const StreamError &ex)
        {
            assert(ex.kind() == StreamFault::Cancelled);
        }

        // Device-initiated OPEN is refused.
        multiplexer.dispatch(make_message(Command::Open, 55, 0, "tcp:5037"));
        const auto refusal = recorder.of(Command::Clse).back();
        assert(refusal.arg0 == 0);
        assert(refusal.arg1 == 55);
    }

    void test_multiplexer_flow_control()
    {
        Recorder recorder;
        StreamMultiplexer multiplexer(send_to(recorder), Logger{});
        multiplexer.reset(4096);
        const auto handle = open_stream(multiplexer, recorder, "sync:", 900);

        const std::vector<std::uint8_t> data(3 * 4096 + 100, 0x42);
        auto writer = std::async(std::launch::async, [&]
                                 { multiplexer.write(handle, data, deadline_after(5s)); });

        const std::size_t expected_chunks = (data.size() + 4095) / 4096;
        for (std::size_t acked = 0; acked < expected_chunks; ++acked)
        {
            assert(recorder.wait_for(Command::Wrte, acked + 1));
            std::this_thread::sleep_for(5ms);
            // Never more than one unacknowledged WRTE.
            assert(recorder.count(Command::Wrte) == acked + 1);
            assert(writer.wait_for(0ms) == std::future_status::timeout);
            multiplexer.dispatch(make_message(Command::Okay, 900, handle.local_id));
        }
        writer.get();

        const auto writes = recorder.of(Command::Wrte);
        assert(writes.size() == expected_chunks);
        assert(writes[0].payload.size() == 4096);
        assert(writes[3].payload.size() == 100);
        assert(writes[0].arg0 == handle.local_id);
        assert(writes[0].arg1 == 900);

        // An OKAY from the wrong remote id does not open the window.
        auto stalled = std::async(std::launch::async, [&]
                                  { multiplexer.write(handle, std::vector<std::uint8_t>(10, 1), deadline_after(2s)); });
        assert(recorder.wait_for(Command::Wrte, expected_chunks + 1));
        multiplexer.dispatch(make_message(Command::Okay, 901, handle.local_id));
        assert(stalled.wait_for(30ms) == std::future_status::timeout);
        multiplexer.dispatch(make_message(Command::Okay, 900, handle.local_id));
        stalled.get();
    }

    void test_multiplexer_isolation()
    {
        Recorder recorder;
        StreamMultiplexer multiplexer(send_to(recorder), Logger{});
        multiplexer.reset(4096);
        const auto a = open_stream(multiplexer, recorder, "shell:a", 501);
        const auto b = open_stream(multiplexer, recorder, "shell:b", 502);

        auto pending_b = std::async(std::launch::async, [&]
                                    { return multiplexer.read(b, deadline_after(2s)); });
        multiplexer.close(a);
        multiplexer.close(a);
        const auto closes = recorder.of(Command::Clse);
        assert(closes.size() == 1);
        assert(closes[0].arg0 == a.local_id);
        assert(closes[0].arg1 == 501);

        // Late data for the closed stream is dropped without an OKAY.
        multiplexer.dispatch(make_message(Command::Wrte, 501, a.local_id, "late"));
        multiplexer.dispatch(make_message(Command::Wrte, 502, b.local_id, "for b"));
        const auto data = pending_b.get();
        assert(std::string(data.begin(), data.end()) == "for b");
        const auto okays = recorder.of(Command::Okay);
        assert(okays.size() == 1);
        assert(okays[0].arg0 == b.local_id);
        assert(okays[0].arg1 == 502);

        assert(error_kind<StreamError>([&]
                                       { multiplexer.read(a, deadline_after(10ms)); }) == StreamFault::Closed);
        assert(!multiplexer.is_closed(b));
        assert(multiplexer.stream_count() == 1);
    }

    void test_multiplexer_device_close_and_timeouts()
    {
        Recorder recorder;
        StreamMultiplexer multiplexer(send_to(recorder), Logger{});
        multiplexer.reset(4096);
        const auto handle = open_stream(multiplexer, recorder, "shell:cat", 40);

        multiplexer.dispatch(make_message(Command::Wrte, 40, handle.local_id, "tail"));
        multiplexer.dispatch(make_message(Command::Clse, 40, handle.local_id));
        assert(multiplexer.is_closed(handle));
        const auto queued = multiplexer.read(handle, deadline_after(1s));
        assert(std::string(queued.begin(), queued.end()) == "tail");
        assert(error_kind<StreamError>([&]
                                       { multiplexer.read(handle, deadline_after(1s)); }) == StreamFault::Closed);
        assert(error_kind<StreamError>([&]
                                       { multiplexer.write(handle, protocol::to_bytes("x"), deadline_after(1s)); }) ==
               StreamFault::Closed);
        multiplexer.close(handle);
        assert(recorder.count(Command::Clse) == 0);

        const auto idle = open_stream(multiplexer, recorder, "shell:sleep", 41);
        assert(error_kind<StreamError>([&]
                                       { multiplexer.read(idle, deadline_after(20ms)); }) == StreamFault::Timeout);
        const auto close = recorder.of(Command::Clse);
        assert(close.size() == 1);
        assert(close[0].arg0 == idle.local_id);
        assert(close[0].arg1 == 41);
        assert(multiplexer.stream_count() == 0);
    }

    void test_multiplexer_forgets_oldest_unanswered_opens()
    {
        Recorder recorder;
        StreamMultiplexer multiplexer(send_to(recorder), Logger{});
        multiplexer.reset(4096);

        std::vector<std::uint32_t> ids;
        for (std::size_t i = 0; i <= StreamMultiplexer::kMaxAbandonedOpens; ++i)
        {
            assert(error_kind<StreamError>([&]
                                           { multiplexer.open("silent:", deadline_after(0ms)); }) ==
                   StreamFault::Timeout);
            ids.push_back(recorder.of(Command::Open).back().arg0);
        }
        assert(multiplexer.stream_count() == 0);

        // The oldest entry was dropped, so its late OKAY is ignored.
        multiplexer.dispatch(make_message(Command::Okay, 900, ids.front()));
        assert(recorder.count(Command::Clse) == 0);

        multiplexer.dispatch(make_message(Command::Okay, 901, ids.back()));
        const auto closes = recorder.of(Command::Clse);
        assert(closes.size() == 1);
        assert(closes[0].arg0 == ids.back());
        assert(closes[0].arg1 == 901);
    }

    void test_multiplexer_failure()
    {
        Recorder recorder;
        StreamMultiplexer multiplexer(send_to(recorder), Logger{});
        multiplexer.reset(4096);
        const auto handle = open_stream(multiplexer, recorder, "shell:top", 12);

        auto pending = std::async(std::launch::async, [&]
                                  { return multiplexer.read(handle, deadline_after(2s)); });
        std::this_thread::sleep_for(10ms);
        multiplexer.fail_all("usb unplugged");
        try
        {
            pending.get();
            assert(false && "read survived failure");
        }
        catch (const ConnectionError &ex)
        {
            assert(ex.kind() == ConnectionFault::TransportLost);
            assert(std::string(ex.what()).find("usb unplugged") != std::string::npos);
        }
        assert(error_kind<ConnectionError>([&]
                                           { multiplexer.open("shell:ls", deadline_after(1s)); }) ==
               ConnectionFault::TransportLost);

        multiplexer.reset(4096);
        assert(multiplexer.stream_count() == 0);
        const auto fresh = open_stream(multiplexer, recorder, "shell:ls", 13);
        assert(fresh.local_id != 0);
    }

} // namespace

void run_client_component_tests()
{
    test_config_defaults_and_json();
    test_banner_parsing();
    test_key_store();
    test_state_machine_negotiation();
    test_state_machine_errors();
    test_auth_cycle_offers_key_once();
    test_auth_second_key_accepted();
    test_auth_after_public_key_offer();
    test_auth_offer_unanswered_times_out();
    test_auth_without_keys();
    test_unauthenticated_policy();
    test_handshake_timeout_and_cancel();
    test_connect_and_shell();
    test_transport_loss();
    test_oversized_payload_ends_connection();
    test_corrupted_frame_reaches_every_stream();
    test_multiplexer_open_outcomes();
    test_multiplexer_flow_control();
    test_multiplexer_isolation();
    test_multiplexer_device_close_and_timeouts();
    test_multiplexer_forgets_oldest_unanswered_opens();
    test_multiplexer_failure();
}
