/**
 * @file PointEnumerator.cpp
 * @brief Implementation of PointEnumerator.
 */

#include "application/PointEnumerator.hpp"
#include <cmath>
#include "domain/PointText.hpp"
#include "infrastructure/Log.hpp"

namespace bacnetinventory::application {

using infrastructure::Log;

namespace {

constexpr const char* kTag = "PointEnumerator";

// Object instances are 22 bits wide, so no device can list more objects.
constexpr double kMaxObjectListLength = 0x3FFFFF;

std::string Where(const domain::DeviceAddress& address, std::uint32_t deviceInstance) {
    return address.ip + " (device " + std::to_string(deviceInstance) + ")";
}

} // namespace

std::string HarvestStatusToString(HarvestStatus status) {
    switch (status) {
        case HarvestStatus::Completed: return "Completed";
        case HarvestStatus::DirectoryUnavailable: return "DirectoryUnavailable";
        case HarvestStatus::Cancelled: return "Cancelled";
        case HarvestStatus::TimedOut: return "TimedOut";
    }
    return "Unknown";
}

PointEnumerator::PointEnumerator(domain::PropertyReader& reader)
    : m_reader(reader) {}

HarvestReport PointEnumerator::harvest(const domain::DiscoveredDevice& device, domain::CancellationToken& cancelToken) {
    return harvest(domain::DeviceAddress{device.ip, device.port}, device.deviceId, cancelToken);
}

HarvestReport PointEnumerator::harvest(const domain::DeviceAddress& address,
                                       std::uint32_t deviceInstance,
                                       domain::CancellationToken& cancelToken) {
    HarvestReport report;
    report.address = address;
    report.deviceInstance = deviceInstance;

    const domain::ObjectId deviceObject{domain::kDeviceObjectType, deviceInstance};

    auto countValues = m_reader.readProperty(address, deviceObject, domain::PropertyId::ObjectList, 0u);
    const domain::NumberValue* count = nullptr;
    if (countValues && !countValues->empty()) {
        count = std::get_if<domain::NumberValue>(&countValues->front());
    }
    if (!count || count->number < 0 || std::floor(count->number) != count->number) {
        Log::Warn(kTag, "Object list of " + Where(address, deviceInstance) + " is unavailable");
        report.status = HarvestStatus::DirectoryUnavailable;
        return report;
    }
    if (count->number > kMaxObjectListLength) {
        Log::Warn(kTag, "Object list of " + Where(address, deviceInstance) + " claims " +
                        std::to_string(count->number) + " entries; treated as unavailable");
        report.status = HarvestStatus::DirectoryUnavailable;
        return report;
    }

    report.objectCount = static_cast<std::uint32_t>(count->number);
    Log::Info(kTag, Where(address, deviceInstance) + " lists " + std::to_string(report.objectCount) + " object(s)");

    for (std::uint32_t i = 1; i <= report.objectCount; ++i) {
        if (cancelToken.isCancelled()) {
            report.status = HarvestStatus::Cancelled;
            return report;
        }

        auto entry = m_reader.readProperty(address, deviceObject, domain::PropertyId::ObjectList, i);
        const domain::ObjectIdValue* oid = nullptr;
        if (entry && !entry->empty()) {
            oid = std::get_if<domain::ObjectIdValue>(&entry->front());
        }
        if (!oid) {
            ++report.readFailures;
            Log::Warn(kTag, "Object list entry " + std::to_string(i) + " of " + Where(address, deviceInstance) + " failed");
            continue;
        }

        auto kind = domain::KindFromObjectType(oid->id.type);
        if (!kind) {
            ++report.skippedUnsupported;
            continue;
        }

        domain::HarvestedPoint point;
        point.kind = *kind;
        point.instance = oid->id.instance;
        point.syntheticId = domain::FormatSyntheticId(*kind, oid->id.instance);
        point.decimalFlag = domain::IsAnalog(*kind);
        point.name = readText(address, oid->id, domain::PropertyId::ObjectName, report);
        point.description = readText(address, oid->id, domain::PropertyId::Description, report);
        if (domain::IsAnalog(*kind)) {
            point.unitSymbol = readUnit(address, oid->id, report);
        }
        if (domain::IsMultiState(*kind)) {
            point.stateTexts = readStateTexts(address, oid->id, report);
        }

        report.index.emplace(point.syntheticId, oid->id);
        report.points.push_back(std::move(point));
    }

    Log::Info(kTag, Where(address, deviceInstance) + ": " + std::to_string(report.points.size()) + " point(s), " +
                    std::to_string(report.skippedUnsupported) + " unsupported, " +
                    std::to_string(report.readFailures) + " read failure(s)");
    return report;
}

std::string PointEnumerator::readText(const domain::DeviceAddress& address, const domain::ObjectId& object,
                                      std::uint32_t property, HarvestReport& report) {
    auto values = m_reader.readProperty(address, object, property);
    if (!values || values->empty()) {
        ++report.readFailures;
        Log::Warn(kTag, "Property " + std::to_string(property) + " of " + domain::ValueToString(domain::ObjectIdValue{object}) +
                        " at " + address.ip + " failed");
        return "";
    }
    return domain::PointText::Sanitize(domain::ValueToString(values->front()));
}

std::string PointEnumerator::readUnit(const domain::DeviceAddress& address, const domain::ObjectId& object,
                                      HarvestReport& report) {
    auto values = m_reader.readProperty(address, object, domain::PropertyId::Units);
    if (!values || values->empty()) {
        ++report.readFailures;
        Log::Warn(kTag, "Units of " + domain::ValueToString(domain::ObjectIdValue{object}) + " at " + address.ip + " failed");
        return "";
    }

    std::optional<std::uint32_t> code;
    if (auto e = std::get_if<domain::EnumeratedValue>(&values->front())) {
        code = e->code;
    } else if (auto n = std::get_if<domain::NumberValue>(&values->front())) {
        if (n->number >= 0 && n->number <= 0xFFFFFFFFu) code = static_cast<std::uint32_t>(n->number);
    }
    return domain::PointText::UnitSymbol(code);
}

std::vector<std::string> PointEnumerator::readStateTexts(const domain::DeviceAddress& address, const domain::ObjectId& object,
                                                         HarvestReport& report) {
    std::vector<std::string> texts;
    auto values = m_reader.readProperty(address, object, domain::PropertyId::StateText);
    if (!values) {
        ++report.readFailures;
        Log::Warn(kTag, "State text of " + domain::ValueToString(domain::ObjectIdValue{object}) + " at " + address.ip + " failed");
    } else {
        for (const auto& value : *values) {
            if (texts.size() == domain::kStateTextSlots) break;
            texts.push_back(domain::PointText::Sanitize(domain::ValueToString(value)));
        }
    }
    texts.resize(domain::kStateTextSlots);
    return texts;
}

} // namespace bacnetinventory::application
