#undef NDEBUG
#include <cassert>
#include <chrono>
#include <iostream>
#include "application/ScanOrchestrator.hpp"
#include "test/FakeNetwork.hpp"

using namespace bacnetinventory;
using domain::ObjectId;

namespace {

using Clock = std::chrono::steady_clock;

// Long enough that no test below is cut short by the round deadline.
constexpr std::chrono::milliseconds kWideRound{30000};

long long ElapsedMs(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

domain::DeviceTarget Target(const std::string& key, const std::string& ip, std::optional<std::uint32_t> instance) {
    domain::DeviceTarget target;
    target.deviceKey = key;
    target.ip = ip;
    target.deviceInstance = instance;
    return target;
}

application::PropertyReaderFactory FactoryFor(const std::shared_ptr<test::FakeNetwork>& network) {
    return [network]() -> std::unique_ptr<domain::PropertyReader> {
        return std::make_unique<test::FakeReader>(network);
    };
}

void AddSinglePointDevice(test::FakeNetwork& network, const std::string& ip, std::uint32_t instance) {
    network.setObjectList(ip, instance, {ObjectId{0, 1}});
    network.setPoint(ip, ObjectId{0, 1}, "Temp " + ip, "");
    network.set(ip, ObjectId{0, 1}, domain::PropertyId::Units, std::nullopt, {domain::EnumeratedValue{62}});
}

} // namespace

static void TestFailuresAreIsolated() {
    std::cout << "[Test] Failing devices never affect the others..." << std::endl;
    auto network = std::make_shared<test::FakeNetwork>();
    auto resolver = std::make_shared<test::FakeResolver>();

    AddSinglePointDevice(*network, "10.0.0.1", 100);        // healthy
    /* 10.0.0.2 answers nothing: object list unavailable */
    /* 10.0.0.3 never answers Who-Is */
    AddSinglePointDevice(*network, "10.0.0.4", 400);
    network->setThrowing("10.0.0.4");                       // reader raises
    AddSinglePointDevice(*network, "10.0.0.5", 500);
    resolver->add("10.0.0.5", 500);                         // resolved on demand

    application::ScanOrchestrator orchestrator(resolver, FactoryFor(network));
    domain::CancellationToken token;
    auto batch = orchestrator.harvestMany({Target("D1", "10.0.0.1", 100u), Target("D2", "10.0.0.2", 200u),
                                           Target("D3", "10.0.0.3", std::nullopt), Target("D4", "10.0.0.4", 400u),
                                           Target("D5", "10.0.0.5", std::nullopt)},
                                          4, token, std::chrono::milliseconds(50));

    assert(batch.points.size() == 2);
    assert(batch.points.at("D1").size() == 1);
    assert(batch.points.at("D1")[0].name == "Temp 10.0.0.1");
    assert(batch.points.at("D5").size() == 1);
    assert(batch.reports.at("D5").deviceInstance == 500);

    assert(batch.failures.size() == 3);
    assert(batch.failures.at("D2") == 1);
    assert(batch.failures.at("D3") == 1);
    assert(batch.failures.at("D4") == 1);
    assert(batch.failures.count("D1") == 0);
    assert(batch.totalFailures() == 3);

    assert(batch.reports.at("D2").status == application::HarvestStatus::DirectoryUnavailable);
    assert(batch.reports.count("D3") == 0);
    assert(batch.reports.count("D4") == 0);
    assert(resolver->calls() == 2);
}

static void TestDuplicateTargets() {
    std::cout << "[Test] A device listed twice is harvested once..." << std::endl;
    auto network = std::make_shared<test::FakeNetwork>();
    auto resolver = std::make_shared<test::FakeResolver>();
    AddSinglePointDevice(*network, "10.0.0.1", 100);

    application::ScanOrchestrator orchestrator(resolver, FactoryFor(network));
    domain::CancellationToken token;
    auto batch = orchestrator.harvestMany({Target("D1", "10.0.0.1", 100u), Target("D1", "10.0.0.1", 100u)}, 10, token);

    assert(batch.points.size() == 1);
    assert(batch.totalFailures() == 0);
    const ObjectId device{domain::kDeviceObjectType, 100};
    assert(network->countReads("10.0.0.1", device, domain::PropertyId::ObjectList) == 2);   // count + entry 1
}

static void TestScanRange() {
    std::cout << "[Test] Range scan keeps one entry per device id..." << std::endl;
    auto resolver = std::make_shared<test::FakeResolver>();
    resolver->add("10.0.0.3", 30);
    resolver->add("10.0.0.1", 10);
    resolver->add("10.0.0.9", 10);
    resolver->add("10.0.0.17", 5);
    resolver->setThrowing("10.0.0.12");
    resolver->setDelay(std::chrono::milliseconds(10));

    application::ScanOrchestrator orchestrator(resolver, nullptr);
    domain::CancellationToken token;
    std::vector<std::string> hosts;
    for (int i = 1; i <= 20; ++i) hosts.push_back("10.0.0." + std::to_string(i));

    auto devices = orchestrator.scanRange(hosts, 4, std::chrono::milliseconds(200), kWideRound, token);
    assert(devices.size() == 3);
    assert(devices[0].deviceId == 5);
    assert(devices[1].deviceId == 10);
    assert(devices[2].deviceId == 30 && devices[2].ip == "10.0.0.3");
    assert(resolver->calls() == 20);
    assert(resolver->maxInFlight() >= 1 && resolver->maxInFlight() <= 4);
}

static void TestParallelismIsClamped() {
    std::cout << "[Test] Requested parallelism is clamped..." << std::endl;
    auto resolver = std::make_shared<test::FakeResolver>();
    resolver->setDelay(std::chrono::milliseconds(20));
    application::ScanOrchestrator orchestrator(resolver, nullptr);
    domain::CancellationToken token;

    std::vector<std::string> hosts;
    for (int i = 1; i <= 120; ++i) hosts.push_back("10.1.0." + std::to_string(i));
    orchestrator.scanRange(hosts, 500, std::chrono::milliseconds(100), kWideRound, token);
    assert(resolver->maxInFlight() <= domain::kMaxParallelism);

    auto serial = std::make_shared<test::FakeResolver>();
    serial->setDelay(std::chrono::milliseconds(5));
    application::ScanOrchestrator serialOrchestrator(serial, nullptr);
    serialOrchestrator.scanRange({"10.2.0.1", "10.2.0.2", "10.2.0.3"}, 0, std::chrono::milliseconds(100), kWideRound, token);
    assert(serial->maxInFlight() == 1);
    assert(serial->calls() == 3);
}

static void TestRoundDeadline() {
    std::cout << "[Test] The round timeout bounds a range scan..." << std::endl;
    auto resolver = std::make_shared<test::FakeResolver>();
    resolver->add("10.3.0.1", 1);
    resolver->setDelay(std::chrono::milliseconds(100));
    application::ScanOrchestrator orchestrator(resolver, nullptr);
    domain::CancellationToken token;

    std::vector<std::string> hosts;
    for (int i = 1; i <= 40; ++i) hosts.push_back("10.3.0." + std::to_string(i));

    const auto round = std::chrono::milliseconds(350);
    const auto start = Clock::now();
    auto devices = orchestrator.scanRange(hosts, 2, std::chrono::milliseconds(1000), round, token);
    const auto elapsed = ElapsedMs(start);

    // 40 hosts at 100 ms through 2 slots would need 2 s; the round stops at 350 ms.
    assert(elapsed < round.count() + 300);
    assert(resolver->calls() < 40);
    assert(resolver->maxWaitGranted() <= round);
    assert(devices.size() == 1 && devices[0].deviceId == 1);
}

static void TestBatchDeadline() {
    std::cout << "[Test] The batch deadline cuts off slow devices as failures..." << std::endl;
    auto network = std::make_shared<test::FakeNetwork>();
    auto resolver = std::make_shared<test::FakeResolver>();

    AddSinglePointDevice(*network, "10.0.0.1", 100);
    std::vector<std::optional<ObjectId>> many;
    for (std::uint32_t i = 1; i <= 60; ++i) {
        many.push_back(ObjectId{0, i});
        network->setPoint("10.0.0.2", ObjectId{0, i}, "Sensor " + std::to_string(i), "");
    }
    network->setObjectList("10.0.0.2", 200, many);
    network->setReadDelay("10.0.0.2", std::chrono::milliseconds(20));
    AddSinglePointDevice(*network, "10.0.0.3", 300);
    network->setReadDelay("10.0.0.3", std::chrono::milliseconds(20));

    application::ScanOrchestrator orchestrator(resolver, FactoryFor(network));
    domain::CancellationToken token;
    const auto batchTimeout = std::chrono::milliseconds(300);
    const auto start = Clock::now();
    // Parallelism 1: D2 occupies the only slot until the deadline, so D3 never starts.
    auto batch = orchestrator.harvestMany({Target("D1", "10.0.0.1", 100u), Target("D2", "10.0.0.2", 200u),
                                           Target("D3", "10.0.0.3", 300u)},
                                          1, token, std::chrono::milliseconds(50), batchTimeout);
    const auto elapsed = ElapsedMs(start);

    // About 240 reads at 20 ms each would take nearly 5 s without the deadline.
    assert(elapsed < batchTimeout.count() + 500);
    assert(!token.isCancelled());

    assert(batch.points.size() == 1 && batch.points.count("D1") == 1);
    assert(batch.reports.at("D1").status == application::HarvestStatus::Completed);

    assert(batch.failures.at("D2") == 1);
    assert(batch.reports.at("D2").status == application::HarvestStatus::TimedOut);
    assert(batch.reports.at("D2").points.empty());
    assert(batch.failures.at("D3") == 1);
    assert(batch.reports.at("D3").status == application::HarvestStatus::TimedOut);
    assert(batch.totalFailures() == 2);
    assert(application::HarvestStatusToString(application::HarvestStatus::TimedOut) == "TimedOut");

    // A batch that finishes in time reports nothing extra.
    auto quick = orchestrator.harvestMany({Target("D1", "10.0.0.1", 100u)}, 1, token,
                                          std::chrono::milliseconds(50), std::chrono::milliseconds(5000));
    assert(quick.points.size() == 1 && quick.totalFailures() == 0);
}

static void TestCancelledBeforeStart() {
    std::cout << "[Test] Cancelled scans submit no work..." << std::endl;
    auto resolver = std::make_shared<test::FakeResolver>();
    resolver->add("10.0.0.1", 1);
    application::ScanOrchestrator orchestrator(resolver, nullptr);
    domain::CancellationToken token;
    token.cancel();

    assert(orchestrator.scanRange({"10.0.0.1"}, 4, std::chrono::milliseconds(100), kWideRound, token).empty());
    auto batch = orchestrator.harvestMany({Target("D1", "10.0.0.1", std::nullopt)}, 4, token);
    assert(batch.points.empty() && batch.totalFailures() == 0);
    assert(resolver->calls() == 0);
}

static void TestRequiresResolver() {
    std::cout << "[Test] Construction without a resolver throws..." << std::endl;
    bool threw = false;
    try {
        application::ScanOrchestrator orchestrator(nullptr, nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    std::cout << "[Test] ScanOrchestrator" << std::endl;
    TestFailuresAreIsolated();
    TestDuplicateTargets();
    TestScanRange();
    TestParallelismIsClamped();
    TestRoundDeadline();
    TestBatchDeadline();
    TestCancelledBeforeStart();
    TestRequiresResolver();
    std::cout << "[PASS] ScanOrchestrator" << std::endl;
    return 0;
}
