#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "components/engine/discovery_engine.hpp"
#include "test_support.hpp"

#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace netmapper;
using netmapper::components::CredentialStore;
using netmapper::components::DiscoveryEngine;
using netmapper::components::RunControl;
using netmapper::components::SeedDevice;

using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::Sequence;
using ::testing::Throw;

namespace {

const char* const kCdp = "show cdp neighbors detail";
const char* const kLldp = "show lldp neighbors detail";

// Reads one neighbor per line: name,address,local interface,remote interface[,platform]
class LineRecordParser : public IOutputParser {
public:
    explicit LineRecordParser(size_t templates = 1) : templates_(templates) {}

    std::vector<ParsedRecord> parse(const std::string& raw_text, const std::string&) const override {
        std::vector<ParsedRecord> records;
        std::istringstream stream(raw_text);
        std::string line;
        while (std::getline(stream, line)) {
            if (line.empty()) {
                continue;
            }
            std::vector<std::string> fields;
            std::stringstream line_stream(line);
            std::string field;
            while (std::getline(line_stream, field, ',')) {
                fields.push_back(field);
            }
            fields.resize(5);

            ParsedRecord record;
            record.values["NEIGHBOR_NAME"] = fields[0];
            record.values["MGMT_ADDRESS"] = fields[1];
            record.values["LOCAL_INTERFACE"] = fields[2];
            record.values["NEIGHBOR_INTERFACE"] = fields[3];
            record.values["PLATFORM"] = fields[4];
            records.push_back(record);
        }
        return records;
    }

    size_t template_count() const override { return templates_; }

private:
    size_t templates_;
};

class FakeProbe : public IReachabilityProbe {
public:
    bool check(const std::string& address, std::chrono::milliseconds) override {
        checked.push_back(address);
        return reachable.count(address) > 0;
    }

    std::vector<std::string> resolve(const std::string& hostname) override {
        auto it = dns.find(hostname);
        if (it == dns.end()) {
            return {};
        }
        return it->second;
    }

    std::set<std::string> reachable;
    std::map<std::string, std::vector<std::string>> dns;
    std::vector<std::string> checked;
};

struct FakeDevice {
    std::string hostname;
    std::map<std::string, std::string> outputs;     // command -> raw output
    std::set<std::string> accepted_usernames;       // empty accepts everyone
    bool commands_fail = false;
};

class FakeClient : public IConnectionClient {
public:
    ConnectResult connect(const std::string& address, const Credential& credential,
                          std::chrono::milliseconds) override {
        ++connects[address];
        ports.push_back(credential.port);
        ConnectResult result;
        auto it = devices.find(address);
        if (it == devices.end()) {
            result.error = ErrorKind::CONNECT_FAILED;
            result.message = "connection refused";
            return result;
        }
        const auto& accepted = it->second.accepted_usernames;
        if (!accepted.empty() && accepted.count(credential.username) == 0) {
            result.error = ErrorKind::AUTH_EXHAUSTED;
            result.message = "authentication failed";
            return result;
        }

        auto session = std::make_unique<Session>();
        session->address = address;
        session->credential_id = credential.id;
        session->hostname = it->second.hostname;
        session->prompt = it->second.hostname + "#";
        result.success = true;
        result.session = std::move(session);
        return result;
    }

    CommandResult execute_command(Session& session, const std::string& command,
                                  std::chrono::milliseconds) override {
        CommandResult result;
        const auto& device = devices.at(session.address);
        if (device.commands_fail) {
            result.error = ErrorKind::COMMAND_TIMEOUT;
            result.message = "timed out waiting for prompt";
            return result;
        }
        result.success = true;
        auto it = device.outputs.find(command);
        if (it != device.outputs.end()) {
            result.output = it->second;
        }
        return result;
    }

    void disconnect(Session& session) override {
        ++disconnects[session.address];
    }

    std::map<std::string, FakeDevice> devices;      // by address
    std::map<std::string, int> connects;
    std::map<std::string, int> disconnects;
    std::vector<uint16_t> ports;                    // port of every connect attempt
};

class MockConnectionClient : public IConnectionClient {
public:
    MOCK_METHOD(ConnectResult, connect,
                (const std::string& address, const Credential& credential, std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(CommandResult, execute_command,
                (Session& session, const std::string& command, std::chrono::milliseconds timeout),
                (override));
    MOCK_METHOD(void, disconnect, (Session& session), (override));
};

Credential make_credential(const std::string& username) {
    Credential credential;
    credential.id = username;
    credential.username = username;
    credential.secret = "secret-" + username;
    return credential;
}

ConnectResult accept_connection(const std::string& address, const Credential& credential,
                                std::chrono::milliseconds) {
    ConnectResult result;
    result.success = true;
    result.session = std::make_unique<Session>();
    result.session->address = address;
    result.session->credential_id = credential.id;
    return result;
}

ConnectResult reject_connection(const std::string&, const Credential&, std::chrono::milliseconds) {
    ConnectResult result;
    result.error = ErrorKind::AUTH_EXHAUSTED;
    result.message = "authentication failed";
    return result;
}

CommandResult empty_output(Session&, const std::string&, std::chrono::milliseconds) {
    CommandResult result;
    result.success = true;
    return result;
}

class DiscoveryEngineTest : public ::testing::Test {
protected:
    void add_device(const std::string& address, const std::string& hostname,
                    const std::string& cdp_output, const std::string& lldp_output = "") {
        probe_.reachable.insert(address);
        FakeDevice device;
        device.hostname = hostname;
        device.outputs[kCdp] = cdp_output;
        device.outputs[kLldp] = lldp_output;
        client_.devices[address] = device;
    }

    DiscoveryResult crawl(const std::vector<SeedDevice>& seeds, uint32_t max_hops,
                          const std::vector<std::string>& commands = {kCdp},
                          const RunControl& control = RunControl()) {
        DiscoveryEngine engine(probe_, client_, parser_);
        engine.configure(config_);
        return engine.run(seeds, credentials_, max_hops, commands, control);
    }

    FakeProbe probe_;
    FakeClient client_;
    LineRecordParser parser_;
    CredentialStore credentials_{{make_credential("netops")}};
    std::map<std::string, std::string> config_;
};

} // namespace

TEST_F(DiscoveryEngineTest, UnreachableSeedIsRecordedWithoutConnecting) {
    auto result = crawl({{"10.0.0.1", "core"}}, 4);

    ASSERT_EQ(result.devices.size(), 1u);
    const auto& seed = result.devices.at("10.0.0.1");
    EXPECT_EQ(seed.status, DeviceStatus::UNREACHABLE);
    EXPECT_EQ(seed.last_error, ErrorKind::UNREACHABLE_HOST);
    EXPECT_EQ(seed.discovered_via, "seed");
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ErrorKind::UNREACHABLE_HOST);
    EXPECT_TRUE(client_.connects.empty());
    EXPECT_EQ(result.mapped_device_count(), 0u);
    EXPECT_TRUE(result.edges.empty());
}

TEST_F(DiscoveryEngineTest, CredentialsAreTriedInOrderUntilOneSucceeds) {
    probe_.reachable.insert("10.0.0.1");
    MockConnectionClient client;
    CredentialStore credentials({make_credential("a"), make_credential("b"), make_credential("c")});

    EXPECT_CALL(client, connect(_, Field(&Credential::id, "c"), _)).Times(0);
    Sequence order;
    EXPECT_CALL(client, connect("10.0.0.1", Field(&Credential::id, "a"), _))
        .InSequence(order)
        .WillOnce(Invoke(reject_connection));
    EXPECT_CALL(client, connect("10.0.0.1", Field(&Credential::id, "b"), _))
        .InSequence(order)
        .WillOnce(Invoke(accept_connection));
    EXPECT_CALL(client, execute_command(_, kCdp, _)).WillOnce(Invoke(empty_output));
    EXPECT_CALL(client, disconnect(_)).Times(1);

    DiscoveryEngine engine(probe_, client, parser_);
    auto result = engine.run({{"10.0.0.1", ""}}, credentials, 4, {kCdp});

    const auto& device = result.devices.at("10.0.0.1");
    EXPECT_EQ(device.status, DeviceStatus::VISITED);
    EXPECT_EQ(device.successful_credential, "b");
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(DiscoveryEngineTest, EveryCredentialRejectedIsAuthExhausted) {
    add_device("10.0.0.1", "core", "");
    client_.devices["10.0.0.1"].accepted_usernames = {"nobody"};
    credentials_ = CredentialStore({make_credential("netops"), make_credential("backup")});

    auto result = crawl({{"10.0.0.1", ""}}, 4);

    const auto& device = result.devices.at("10.0.0.1");
    EXPECT_EQ(device.status, DeviceStatus::FAILED);
    EXPECT_EQ(device.last_error, ErrorKind::AUTH_EXHAUSTED);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_NE(result.failures[0].reason.find("all 2 credential(s) failed"), std::string::npos);
    EXPECT_EQ(client_.connects["10.0.0.1"], 2);
    EXPECT_EQ(client_.disconnects.count("10.0.0.1"), 0u);
}

TEST_F(DiscoveryEngineTest, CredentialsWithoutPortUseConfiguredSshPort) {
    config_["ssh_port"] = "2222";
    add_device("10.0.0.1", "core", "");
    client_.devices["10.0.0.1"].accepted_usernames = {"override"};
    Credential inherited = make_credential("inherit");
    Credential explicit_port = make_credential("override");
    explicit_port.port = 2200;
    credentials_ = CredentialStore({inherited, explicit_port});

    auto result = crawl({{"10.0.0.1", ""}}, 0);

    EXPECT_EQ(result.devices.at("10.0.0.1").status, DeviceStatus::VISITED);
    EXPECT_EQ(client_.ports, (std::vector<uint16_t>{2222, 2200}));
}

TEST_F(DiscoveryEngineTest, SessionIsReleasedOnceWhenEveryCommandFails) {
    add_device("10.0.0.1", "core", "");
    client_.devices["10.0.0.1"].commands_fail = true;

    auto result = crawl({{"10.0.0.1", ""}}, 4, {kCdp, kLldp});

    const auto& device = result.devices.at("10.0.0.1");
    EXPECT_EQ(device.status, DeviceStatus::FAILED);
    EXPECT_EQ(device.last_error, ErrorKind::COMMAND_TIMEOUT);
    EXPECT_EQ(client_.disconnects["10.0.0.1"], 1);
}

TEST_F(DiscoveryEngineTest, SessionIsReleasedAfterSuccessfulVisit) {
    add_device("10.0.0.1", "core", "r2,10.0.0.2,Gi0/1,Gi0/2\n");

    auto result = crawl({{"10.0.0.1", ""}}, 0, {kCdp, kLldp});

    EXPECT_EQ(result.devices.at("10.0.0.1").status, DeviceStatus::VISITED);
    EXPECT_EQ(client_.connects["10.0.0.1"], 1);
    EXPECT_EQ(client_.disconnects["10.0.0.1"], 1);
}

TEST_F(DiscoveryEngineTest, ThrowingClientIsContainedToOneDevice) {
    probe_.reachable.insert("10.0.0.1");
    probe_.reachable.insert("10.0.0.2");
    MockConnectionClient client;

    EXPECT_CALL(client, connect("10.0.0.1", _, _)).WillOnce(Throw(std::runtime_error("socket exploded")));
    EXPECT_CALL(client, connect("10.0.0.2", _, _)).WillOnce(Invoke(accept_connection));
    EXPECT_CALL(client, execute_command(_, _, _)).WillOnce(Invoke(empty_output));
    EXPECT_CALL(client, disconnect(_)).Times(1);

    DiscoveryEngine engine(probe_, client, parser_);
    auto result = engine.run({{"10.0.0.1", ""}, {"10.0.0.2", ""}}, credentials_, 4, {kCdp});

    EXPECT_EQ(result.devices.at("10.0.0.1").status, DeviceStatus::FAILED);
    EXPECT_EQ(result.devices.at("10.0.0.1").last_error, ErrorKind::INTERNAL_ERROR);
    EXPECT_EQ(result.devices.at("10.0.0.2").status, DeviceStatus::VISITED);
}

TEST_F(DiscoveryEngineTest, CdpAndLldpReportingOneLinkYieldOneEdge) {
    add_device("10.0.0.1", "r1",
               "r2.example.com,10.0.0.2,GigabitEthernet0/1,GigabitEthernet0/2\n",
               "r2,10.0.0.2,Gi0/1,Gi0/2\n");

    auto result = crawl({{"10.0.0.1", "r1"}}, 0, {kCdp, kLldp});

    ASSERT_EQ(result.edges.size(), 1u);
    EXPECT_EQ(result.edges[0].local_device_id, "10.0.0.1");
    EXPECT_EQ(result.edges[0].local_interface, "Gi0/1");
    EXPECT_EQ(result.edges[0].remote_device_id, "10.0.0.2");
    EXPECT_EQ(result.edges[0].remote_interface, "Gi0/2");
    EXPECT_EQ(result.edges[0].protocol, "CDP");

    // Beyond max_hops: present in edges only
    EXPECT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(result.devices.at("10.0.0.1").productive_commands.size(), 2u);
}

TEST_F(DiscoveryEngineTest, BothEndsOfOneLinkYieldOneEdge) {
    add_device("10.0.0.1", "r1", "r2,10.0.0.2,Gi0/1,Gi0/2\n");
    add_device("10.0.0.2", "r2", "r1,10.0.0.1,Gi0/2,Gi0/1\n");

    auto result = crawl({{"10.0.0.1", "r1"}}, 1);

    ASSERT_EQ(result.devices.size(), 2u);
    EXPECT_EQ(result.devices.at("10.0.0.2").status, DeviceStatus::VISITED);
    EXPECT_EQ(result.devices.at("10.0.0.2").hop_distance, 1u);
    EXPECT_EQ(result.devices.at("10.0.0.2").discovered_via, "10.0.0.1");
    EXPECT_EQ(result.edges.size(), 1u);
}

TEST_F(DiscoveryEngineTest, PromptHostnameJoinsNeighborIdentity) {
    add_device("10.0.0.1", "r1", "r2,10.0.0.2,Gi0/1,Gi0/2\n");
    add_device("10.0.0.2", "r2", "r1.example.com,,Gi0/2,Gi0/1\n");

    auto result = crawl({{"10.0.0.1", ""}}, 2);

    EXPECT_EQ(result.devices.size(), 2u);
    EXPECT_EQ(result.devices.at("10.0.0.1").hostname, "r1");
    EXPECT_EQ(result.devices.count("r1.example.com"), 0u);
    EXPECT_EQ(result.edges.size(), 1u);
}

TEST_F(DiscoveryEngineTest, HopLimitBoundsExploration) {
    add_device("10.0.0.1", "r1", "r2,10.0.0.2,Gi0/1,Gi0/1\n");
    add_device("10.0.0.2", "r2", "r1,10.0.0.1,Gi0/1,Gi0/1\nr3,10.0.0.3,Gi0/2,Gi0/1\n");
    add_device("10.0.0.3", "r3", "r2,10.0.0.2,Gi0/1,Gi0/2\nr4,10.0.0.4,Gi0/2,Gi0/1\n");
    add_device("10.0.0.4", "r4", "r3,10.0.0.3,Gi0/1,Gi0/2\n");

    auto result = crawl({{"10.0.0.1", "r1"}}, 2);

    EXPECT_EQ(result.devices.size(), 3u);
    EXPECT_EQ(result.devices.at("10.0.0.3").hop_distance, 2u);
    EXPECT_EQ(result.devices.count("10.0.0.4"), 0u);
    EXPECT_EQ(client_.connects.count("10.0.0.4"), 0u);
    EXPECT_EQ(result.mapped_device_count(), 3u);
    EXPECT_EQ(result.edges.size(), 3u);
    for (const auto& [id, device] : result.devices) {
        EXPECT_LE(device.hop_distance, 2u) << id;
    }
}

TEST_F(DiscoveryEngineTest, CycleVisitsEachDeviceOnce) {
    add_device("10.0.0.1", "r1", "r2,10.0.0.2,Gi0/1,Gi0/1\nr3,10.0.0.3,Gi0/2,Gi0/1\n");
    add_device("10.0.0.2", "r2", "r1,10.0.0.1,Gi0/1,Gi0/1\nr3,10.0.0.3,Gi0/2,Gi0/2\n");
    add_device("10.0.0.3", "r3", "r1,10.0.0.1,Gi0/1,Gi0/2\nr2,10.0.0.2,Gi0/2,Gi0/2\n");

    std::vector<std::string> visited;
    RunControl control;
    control.on_progress = [&visited](const ProgressEvent& event) { visited.push_back(event.device_id); };

    auto result = crawl({{"10.0.0.1", "r1"}}, 4, {kCdp}, control);

    EXPECT_EQ(result.mapped_device_count(), 3u);
    EXPECT_EQ(result.edges.size(), 3u);
    for (const auto& address : {"10.0.0.1", "10.0.0.2", "10.0.0.3"}) {
        EXPECT_EQ(client_.connects[address], 1) << address;
    }
    EXPECT_EQ(visited, (std::vector<std::string>{"10.0.0.1", "10.0.0.2", "10.0.0.3"}));
    EXPECT_EQ(result.devices.at("10.0.0.3").hop_distance, 1u);
}

TEST_F(DiscoveryEngineTest, OneFailedDeviceDoesNotStopTheCrawl) {
    add_device("10.0.0.1", "r1", "r2,10.0.0.2,Gi0/1,Gi0/1\nr3,10.0.0.3,Gi0/2,Gi0/1\n");
    add_device("10.0.0.3", "r3", "");

    auto result = crawl({{"10.0.0.1", "r1"}}, 4);

    EXPECT_EQ(result.devices.at("10.0.0.2").status, DeviceStatus::UNREACHABLE);
    EXPECT_EQ(result.devices.at("10.0.0.3").status, DeviceStatus::VISITED);
    EXPECT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.edges.size(), 2u);
}

TEST_F(DiscoveryEngineTest, CancellationLeavesQueuedDevicesPending) {
    add_device("10.0.0.1", "r1", "r2,10.0.0.2,Gi0/1,Gi0/1\n");
    add_device("10.0.0.2", "r2", "");

    bool stop = false;
    RunControl control;
    control.on_progress = [&stop](const ProgressEvent&) { stop = true; };
    control.should_stop = [&stop] { return stop; };

    auto result = crawl({{"10.0.0.1", "r1"}}, 4, {kCdp}, control);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.devices.at("10.0.0.1").status, DeviceStatus::VISITED);
    EXPECT_EQ(result.devices.at("10.0.0.2").status, DeviceStatus::PENDING);
    EXPECT_EQ(client_.connects.count("10.0.0.2"), 0u);
}

TEST_F(DiscoveryEngineTest, ExcludedNeighborIsLinkedButNotCrawled) {
    config_["exclusions"] = "SEP,phone";
    add_device("10.0.0.1", "r1", "SEP001122334455,10.0.10.50,Gi1/0/10,Port 1\n");
    add_device("10.0.10.50", "SEP001122334455", "");

    auto result = crawl({{"10.0.0.1", "r1"}}, 4);

    EXPECT_EQ(result.devices.size(), 1u);
    ASSERT_EQ(result.edges.size(), 1u);
    EXPECT_EQ(result.edges[0].remote_device_id, "10.0.10.50");
    EXPECT_EQ(client_.connects.count("10.0.10.50"), 0u);
}

TEST_F(DiscoveryEngineTest, ResolvedAddressUsedWhenManagementAddressIsDead) {
    add_device("10.0.0.1", "r1", "r9,10.9.9.9,Gi0/5,Gi0/1\n");
    add_device("10.0.0.9", "r9", "");
    probe_.dns["r9"] = {"10.0.0.9"};

    auto result = crawl({{"10.0.0.1", "r1"}}, 4);

    const auto& device = result.devices.at("10.9.9.9");
    EXPECT_EQ(device.status, DeviceStatus::VISITED);
    EXPECT_EQ(device.resolved_address, "10.0.0.9");
    EXPECT_EQ(client_.connects["10.0.0.9"], 1);
}

TEST_F(DiscoveryEngineTest, ConflictingRemotePortsFollowPolicy) {
    add_device("10.0.0.1", "r1", "r2,10.0.0.2,Gi0/1,Gi0/2\n", "r2,10.0.0.2,Gi0/1,Gi0/3\n");

    auto first_reported = crawl({{"10.0.0.1", "r1"}}, 0, {kCdp, kLldp});
    ASSERT_EQ(first_reported.edges.size(), 1u);
    EXPECT_EQ(first_reported.edges[0].remote_interface, "Gi0/2");

    config_["link_conflict_policy"] = "keep_all";
    auto keep_all = crawl({{"10.0.0.1", "r1"}}, 0, {kCdp, kLldp});
    EXPECT_EQ(keep_all.edges.size(), 2u);
}

TEST_F(DiscoveryEngineTest, DeviceInfoCommandsFillIdentity) {
    config_["device_info_commands"] = "show version;show running-config | include hostname";
    add_device("10.0.0.1", "", "r2,10.0.0.2,Gi0/1,Gi0/2\n");
    client_.devices["10.0.0.1"].outputs["show version"] = netmapper::test::fixture("cisco_ios_show_version.txt");
    client_.devices["10.0.0.1"].outputs["show running-config | include hostname"] = "hostname core-sw1\n";
    add_device("10.0.0.2", "r2", "core-sw1,,Gi0/2,Gi0/1\n");

    auto result = crawl({{"10.0.0.1", ""}}, 1);

    const auto& core = result.devices.at("10.0.0.1");
    EXPECT_EQ(core.hostname, "core-sw1");
    EXPECT_EQ(core.serial_number, "FOC1234X0AB");
    EXPECT_EQ(core.model, "WS-C3850-24T");
    EXPECT_EQ(core.software_version, "16.09.04");
    // Info output is never read for neighbors
    EXPECT_EQ(core.productive_commands, std::vector<std::string>{kCdp});

    // The hostname learned from the device joins r2's report to it
    EXPECT_EQ(result.devices.size(), 2u);
    EXPECT_EQ(result.edges.size(), 1u);
}

TEST_F(DiscoveryEngineTest, FailingDeviceInfoCommandDoesNotFailDevice) {
    config_["device_info_commands"] = "show version";
    MockConnectionClient client;
    probe_.reachable.insert("10.0.0.1");
    EXPECT_CALL(client, connect(_, _, _)).WillOnce(Invoke(accept_connection));
    EXPECT_CALL(client, execute_command(_, "show version", _))
        .WillOnce(Invoke([](Session&, const std::string&, std::chrono::milliseconds) {
            CommandResult result;
            result.error = ErrorKind::COMMAND_ERROR;
            result.message = "device rejected 'show version': ^";
            return result;
        }));
    EXPECT_CALL(client, execute_command(_, kCdp, _)).WillOnce(Invoke(empty_output));
    EXPECT_CALL(client, disconnect(_)).Times(1);

    DiscoveryEngine engine(probe_, client, parser_);
    engine.configure(config_);
    auto result = engine.run({{"10.0.0.1", ""}}, credentials_, 0, {kCdp});

    EXPECT_EQ(result.devices.at("10.0.0.1").status, DeviceStatus::VISITED);
    EXPECT_TRUE(result.failures.empty());
}

TEST_F(DiscoveryEngineTest, RecordsWithoutIdentityAreDropped) {
    add_device("10.0.0.1", "r1", ",,Gi0/1,Gi0/2\nr5,,Gi0/3,Gi0/1\n");

    auto result = crawl({{"10.0.0.1", "r1"}}, 0);

    ASSERT_EQ(result.edges.size(), 1u);
    EXPECT_EQ(result.edges[0].remote_device_id, "r5");
    EXPECT_EQ(result.devices.at("10.0.0.1").neighbor_count, 1u);
}

TEST_F(DiscoveryEngineTest, RefusesToStartWithoutTemplates) {
    LineRecordParser no_templates(0);
    DiscoveryEngine engine(probe_, client_, no_templates);
    EXPECT_THROW(engine.run({{"10.0.0.1", ""}}, credentials_), TemplateLoadError);
    EXPECT_TRUE(probe_.checked.empty());
}

TEST_F(DiscoveryEngineTest, ConfigureValidatesValues) {
    DiscoveryEngine engine(probe_, client_, parser_);

    EXPECT_THROW(engine.configure({{"max_hops", "-1"}}), ConfigError);
    EXPECT_THROW(engine.configure({{"max_hops", "many"}}), ConfigError);
    EXPECT_THROW(engine.configure({{"ssh_port", "0"}}), ConfigError);
    EXPECT_THROW(engine.configure({{"ssh_port", "70000"}}), ConfigError);
    EXPECT_THROW(engine.configure({{"link_conflict_policy", "newest"}}), ConfigError);
    EXPECT_THROW(engine.configure({{"normalize_interfaces", "maybe"}}), ConfigError);
    EXPECT_THROW(engine.configure({{"commands", " ; "}}), ConfigError);
    EXPECT_THROW(engine.configure({{"max_hops", "2"}, {"ssh_port", "0"}}), ConfigError);
    EXPECT_EQ(engine.options().max_hops, 4u);

    EXPECT_TRUE(engine.configure({{"max_hops", "2"}, {"ssh_port", "2222"}, {"commands", kCdp},
                                  {"exclusions", "SEP, phone"}}));
    EXPECT_EQ(engine.options().max_hops, 2u);
    EXPECT_EQ(engine.options().ssh_port, 2222);
    EXPECT_EQ(engine.options().command_set, std::vector<std::string>{kCdp});
    EXPECT_EQ(engine.options().exclusions, (std::vector<std::string>{"SEP", "phone"}));
    EXPECT_EQ(engine.get_configuration_schema().count("max_hops"), 1u);
}

TEST(DiscoveryEngineHelpers, NormalizeDeviceName) {
    EXPECT_EQ(DiscoveryEngine::normalize_device_name("Core-SW1.example.com"), "core-sw1");
    EXPECT_EQ(DiscoveryEngine::normalize_device_name("access-sw2(FOC1234X0AB)"), "access-sw2");
    EXPECT_EQ(DiscoveryEngine::normalize_device_name(" 10.0.0.1 "), "10.0.0.1");
    EXPECT_EQ(DiscoveryEngine::normalize_device_name(""), "");
}

TEST(DiscoveryEngineHelpers, NonAsciiNameBytesPassThrough) {
    EXPECT_EQ(DiscoveryEngine::normalize_device_name("Caf\xC9-SW.example.com"), "caf\xc9-sw");
    EXPECT_EQ(DiscoveryEngine::normalize_device_name("K\xC3\xB6ln-Core"), "k\xc3\xb6ln-core");
}

TEST(DiscoveryEngineHelpers, ParseSeedList) {
    auto seeds = DiscoveryEngine::parse_seed_list("core,10.0.0.1; 10.0.0.2 ;");
    ASSERT_EQ(seeds.size(), 2u);
    EXPECT_EQ(seeds[0].hostname, "core");
    EXPECT_EQ(seeds[0].address, "10.0.0.1");
    EXPECT_EQ(seeds[1].hostname, "");
    EXPECT_EQ(seeds[1].address, "10.0.0.2");

    EXPECT_TRUE(DiscoveryEngine::parse_seed_list("").empty());
    EXPECT_THROW(DiscoveryEngine::parse_seed_list("a,b,c"), ConfigError);
}

TEST(DiscoveryEngineHelpers, Exclusions) {
    std::vector<std::string> exclusions = {"SEP", "phone"};
    EXPECT_TRUE(DiscoveryEngine::is_excluded("sep001122334455", exclusions));
    EXPECT_TRUE(DiscoveryEngine::is_excluded("lobby-PHONE-1", exclusions));
    EXPECT_FALSE(DiscoveryEngine::is_excluded("core-sw1", exclusions));
    EXPECT_FALSE(DiscoveryEngine::is_excluded("", exclusions));
}

TEST(DiscoveryEngineHelpers, NeighborRecordAcceptsFieldAliases) {
    ParsedRecord record;
    record.values["device_id"] = " r2.example.com ";
    record.values["management_ip"] = "10.0.0.2";
    record.values["local_port"] = "Gi0/1";
    record.values["port_id"] = "Gi0/2";
    record.lists["CAPABILITIES"] = {"", "Router"};

    auto neighbor = DiscoveryEngine::to_neighbor_record(record);
    EXPECT_EQ(neighbor.neighbor_name, "r2.example.com");
    EXPECT_EQ(neighbor.management_address, "10.0.0.2");
    EXPECT_EQ(neighbor.local_interface, "Gi0/1");
    EXPECT_EQ(neighbor.remote_interface, "Gi0/2");
    EXPECT_EQ(neighbor.capabilities, "Router");
}

TEST(DiscoveryEngineHelpers, DeviceInfoKeepsExistingValues) {
    DiscoveredDevice device;
    device.hostname = "from-neighbor";
    device.model = "C9300-48P";

    auto hostname = DiscoveryEngine::apply_device_info(device, "show running-config | include hostname",
                                                       "Building configuration...\r\nhostname edge-rtr1\r\n");
    EXPECT_EQ(hostname, "edge-rtr1");
    EXPECT_EQ(device.hostname, "from-neighbor");

    DiscoveryEngine::apply_device_info(device, "show version",
                                       "Arista DCS-7050SX3-48YC8\nSoftware image version: 4.28.3M\n"
                                       "Serial number: JPE12345678\nModel number: ignored\n");
    EXPECT_EQ(device.serial_number, "JPE12345678");
    EXPECT_EQ(device.model, "C9300-48P");
    EXPECT_EQ(device.software_version, "4.28.3M");

    // Only hostname queries are read for a hostname
    EXPECT_EQ(DiscoveryEngine::apply_device_info(device, "show version", "hostname other\n"), "");
}

TEST(DiscoveryEngineHelpers, ValidIpAddress) {
    EXPECT_TRUE(DiscoveryEngine::is_valid_ip_address("10.0.0.1"));
    EXPECT_FALSE(DiscoveryEngine::is_valid_ip_address("10.0.0"));
    EXPECT_FALSE(DiscoveryEngine::is_valid_ip_address("core-sw1"));
    EXPECT_FALSE(DiscoveryEngine::is_valid_ip_address(""));
}

TEST(NeighborEdge, NormalizedKeyIgnoresDirection) {
    NeighborEdge forward{"a", "Gi0/1", "b", "Gi0/2", "CDP"};
    NeighborEdge reverse{"b", "Gi0/2", "a", "Gi0/1", "LLDP"};
    NeighborEdge other{"a", "Gi0/1", "b", "Gi0/3", "CDP"};
    EXPECT_EQ(forward.normalized_key(), reverse.normalized_key());
    EXPECT_NE(forward.normalized_key(), other.normalized_key());
}
