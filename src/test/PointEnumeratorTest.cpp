#undef NDEBUG
#include <cassert>
#include <iostream>
#include "application/PointEnumerator.hpp"
#include "test/FakeNetwork.hpp"

using namespace bacnetinventory;
using domain::ObjectId;
namespace PropertyId = domain::PropertyId;

namespace {

const std::string kIp = "10.0.0.1";
constexpr std::uint32_t kInstance = 100;

std::shared_ptr<test::FakeNetwork> MixedDevice() {
    auto network = std::make_shared<test::FakeNetwork>();
    network->setObjectList(kIp, kInstance, {
        ObjectId{0, 1},                                 // AI-1
        ObjectId{5, 2},                                 // BV-2
        ObjectId{domain::kDeviceObjectType, kInstance}, // not a point kind
        ObjectId{19, 3},                                // MSV-3
        std::nullopt                                    // entry 5 unreadable
    });

    network->setPoint(kIp, ObjectId{0, 1}, "  Supply Temp\x01", "Supply air");
    network->set(kIp, ObjectId{0, 1}, PropertyId::Units, std::nullopt, {domain::EnumeratedValue{62}});

    network->setPoint(kIp, ObjectId{5, 2}, "Fan", "Fan command");

    network->set(kIp, ObjectId{19, 3}, PropertyId::ObjectName, std::nullopt, {domain::TextValue{"Mode"}});
    network->set(kIp, ObjectId{19, 3}, PropertyId::StateText, std::nullopt,
                 {domain::TextValue{"Off"}, domain::TextValue{"Auto"}, domain::TextValue{"Manual"}});
    return network;
}

} // namespace

static void TestMixedDevice() {
    std::cout << "[Test] Harvest of a mixed object list..." << std::endl;
    auto network = MixedDevice();
    test::FakeReader reader(network);
    application::PointEnumerator enumerator(reader);
    domain::CancellationToken token;

    auto report = enumerator.harvest(domain::DeviceAddress{kIp, 47808}, kInstance, token);
    assert(report.status == application::HarvestStatus::Completed);
    assert(report.objectCount == 5);
    assert(report.skippedUnsupported == 1);
    assert(report.readFailures == 2);     // entry 5 and the MSV description
    assert(report.points.size() == 3);

    const auto& ai = report.points[0];
    assert(ai.syntheticId == "AI-1");
    assert(ai.name == "Supply Temp");
    assert(ai.description == "Supply air");
    assert(ai.unitSymbol == "\xE2\x84\x83");
    assert(ai.decimalFlag);
    assert(ai.stateTexts.empty());

    const auto& bv = report.points[1];
    assert(bv.syntheticId == "BV-2");
    assert(bv.kind == domain::ObjectKind::BV);
    assert(!bv.decimalFlag);
    assert(bv.unitSymbol.empty());
    assert(bv.stateTexts.empty());
    assert(network->countReads(kIp, ObjectId{5, 2}, PropertyId::Units) == 0);
    assert(network->countReads(kIp, ObjectId{5, 2}, PropertyId::StateText) == 0);

    const auto& msv = report.points[2];
    assert(msv.syntheticId == "MSV-3");
    assert(msv.name == "Mode");
    assert(msv.description.empty());
    assert(msv.stateTexts.size() == domain::kStateTextSlots);
    assert(msv.stateTexts[0] == "Off" && msv.stateTexts[2] == "Manual");
    assert(msv.stateTexts[3].empty() && msv.stateTexts[9].empty());
    assert(network->countReads(kIp, ObjectId{19, 3}, PropertyId::Units) == 0);

    assert(report.index.size() == 3);
    assert(report.index.at("MSV-3") == (ObjectId{19, 3}));
}

static void TestLongStateTextIsTruncated() {
    std::cout << "[Test] State texts beyond ten slots are dropped..." << std::endl;
    auto network = std::make_shared<test::FakeNetwork>();
    network->setObjectList(kIp, kInstance, {ObjectId{13, 1}});
    network->setPoint(kIp, ObjectId{13, 1}, "Stage", "Heating stage");
    std::vector<domain::PropertyValue> states;
    for (int i = 1; i <= 12; ++i) states.push_back(domain::TextValue{"S" + std::to_string(i)});
    network->set(kIp, ObjectId{13, 1}, PropertyId::StateText, std::nullopt, states);

    test::FakeReader reader(network);
    application::PointEnumerator enumerator(reader);
    domain::CancellationToken token;
    auto report = enumerator.harvest(domain::DeviceAddress{kIp, 47808}, kInstance, token);

    assert(report.points.size() == 1);
    assert(report.points[0].stateTexts.size() == domain::kStateTextSlots);
    assert(report.points[0].stateTexts[9] == "S10");
    assert(report.readFailures == 0);
}

static void TestDirectoryOutcomes() {
    std::cout << "[Test] Object list count outcomes..." << std::endl;
    domain::CancellationToken token;
    const domain::ObjectId device{domain::kDeviceObjectType, kInstance};

    {
        auto network = std::make_shared<test::FakeNetwork>();
        network->setObjectList(kIp, kInstance, {});
        test::FakeReader reader(network);
        auto report = application::PointEnumerator(reader).harvest(domain::DeviceAddress{kIp, 47808}, kInstance, token);
        assert(report.status == application::HarvestStatus::Completed);
        assert(report.points.empty() && report.objectCount == 0);
    }
    {
        auto network = std::make_shared<test::FakeNetwork>();
        test::FakeReader reader(network);
        auto report = application::PointEnumerator(reader).harvest(domain::DeviceAddress{kIp, 47808}, kInstance, token);
        assert(report.status == application::HarvestStatus::DirectoryUnavailable);
        assert(report.points.empty());
        assert(network->countReads(kIp) == 1);
    }
    {
        auto network = std::make_shared<test::FakeNetwork>();
        network->set(kIp, device, PropertyId::ObjectList, 0u, {domain::TextValue{"five"}});
        test::FakeReader reader(network);
        auto report = application::PointEnumerator(reader).harvest(domain::DeviceAddress{kIp, 47808}, kInstance, token);
        assert(report.status == application::HarvestStatus::DirectoryUnavailable);
    }
}

static void TestImplausibleObjectCount() {
    std::cout << "[Test] Garbled object list counts are rejected..." << std::endl;
    domain::CancellationToken token;
    const domain::ObjectId device{domain::kDeviceObjectType, kInstance};

    const double garbled[] = {1e12, 4294967295.0, 4294967296.0, 4194304.0};
    for (double count : garbled) {
        auto network = std::make_shared<test::FakeNetwork>();
        network->set(kIp, device, PropertyId::ObjectList, 0u, {domain::NumberValue{count}});
        test::FakeReader reader(network);
        auto report = application::PointEnumerator(reader).harvest(domain::DeviceAddress{kIp, 47808}, kInstance, token);
        assert(report.status == application::HarvestStatus::DirectoryUnavailable);
        assert(report.objectCount == 0);
        assert(network->countReads(kIp) == 1);
    }

    // An out-of-range numeric unit code yields no symbol instead of a wrapped code.
    auto network = std::make_shared<test::FakeNetwork>();
    network->setObjectList(kIp, kInstance, {ObjectId{0, 7}});
    network->setPoint(kIp, ObjectId{0, 7}, "Flow", "");
    network->set(kIp, ObjectId{0, 7}, PropertyId::Units, std::nullopt, {domain::NumberValue{5e9}});
    test::FakeReader reader(network);
    auto report = application::PointEnumerator(reader).harvest(domain::DeviceAddress{kIp, 47808}, kInstance, token);
    assert(report.status == application::HarvestStatus::Completed);
    assert(report.points.size() == 1);
    assert(report.points[0].unitSymbol.empty());
}

static void TestCancellation() {
    std::cout << "[Test] Cancelled harvest stops walking..." << std::endl;
    auto network = MixedDevice();
    test::FakeReader reader(network);
    domain::CancellationToken token;
    token.cancel();

    auto report = application::PointEnumerator(reader).harvest(domain::DeviceAddress{kIp, 47808}, kInstance, token);
    assert(report.status == application::HarvestStatus::Cancelled);
    assert(report.points.empty());
    assert(network->countReads(kIp) == 1);
    assert(application::HarvestStatusToString(report.status) == "Cancelled");
}

int main() {
    std::cout << "[Test] PointEnumerator" << std::endl;
    TestMixedDevice();
    TestLongStateTextIsTruncated();
    TestDirectoryOutcomes();
    TestImplausibleObjectCount();
    TestCancellation();
    std::cout << "[PASS] PointEnumerator" << std::endl;
    return 0;
}
