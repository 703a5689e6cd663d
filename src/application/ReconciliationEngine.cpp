/**
 * @file ReconciliationEngine.cpp
 * @brief Implementation of ReconciliationEngine.
 */

#include "application/ReconciliationEngine.hpp"
#include <algorithm>
#include <initializer_list>
#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include "infrastructure/Log.hpp"

namespace bacnetinventory::application {

using infrastructure::Log;

namespace {

constexpr const char* kTag = "ReconciliationEngine";

const char* const kColName = "OBJ_NAME";
const char* const kColDesc = "OBJ_DESC";
const char* const kColUnit = "OBJ_UNIT";
const char* const kColDecimal = "OBJ_DECIMAL";
const char* const kColType = "OBJ_TYPE";

std::string DecimalText(bool flag) {
    return flag ? "1" : "0";
}

/** Tracked column values of a harvested point, in TrackedColumns() order. */
std::vector<std::string> ColumnValues(const domain::HarvestedPoint& p) {
    return {p.name, p.description, p.unitSymbol, DecimalText(p.decimalFlag),
            std::to_string(domain::KindToTypeCode(p.kind))};
}

std::vector<std::string> ColumnValues(const domain::CatalogRow& r) {
    return {r.name, r.description, r.unitSymbol, DecimalText(r.decimalFlag), std::to_string(r.typeCode)};
}

std::string SqlLiteral(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out += "''";
        else out.push_back(c);
    }
    out += "'";
    return out;
}

/** OBJ_DECIMAL and OBJ_TYPE are numeric columns and stay unquoted. */
std::string SqlValue(const std::string& column, const std::string& value) {
    if (column == kColDecimal || column == kColType) return value;
    return SqlLiteral(value);
}

std::string CsvField(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += "\"\"";
        else if (c == '\r' || c == '\n') out.push_back(' ');
        else out.push_back(c);
    }
    out += "\"";
    return out;
}

std::string KeyFilter(const std::string& deviceKey, const std::string& syntheticId) {
    return "DEVICE_SEQ = " + SqlLiteral(deviceKey) + " AND SYSTEM_PT_ID = " + SqlLiteral(syntheticId);
}

std::string StateTextAt(const domain::HarvestedPoint& p, std::size_t i) {
    return i < p.stateTexts.size() ? p.stateTexts[i] : "";
}

std::string SiRow(const domain::HarvestedPoint& p, const std::string& deviceKey,
                  std::uint32_t deviceInstance, const std::string& timestamp) {
    std::ostringstream row;
    row << p.syntheticId << ','
        << CsvField(p.name) << ','
        << CsvField(p.description) << ','
        << domain::KindToTypeCode(p.kind) << ','
        << deviceKey << ','
        << deviceInstance << ','
        << DecimalText(p.decimalFlag) << ','
        << CsvField(p.unitSymbol);
    for (std::size_t i = 0; i < domain::kStateTextSlots; ++i) {
        row << ',' << CsvField(StateTextAt(p, i));
    }
    row << ',' << timestamp << '\n';
    return row.str();
}

std::set<std::string> ToSet(const std::vector<std::string>& ids) {
    return std::set<std::string>(ids.begin(), ids.end());
}

void VerifyPartition(const std::set<std::string>& catalogIds,
                     const std::set<std::string>& harvestedIds,
                     const domain::ReconciliationResult& result) {
    std::vector<std::string> addedIds;
    for (const auto& a : result.additions) addedIds.push_back(a.point.syntheticId);

    const auto changed = result.changedIds();
    std::set<std::string> seen;
    std::size_t total = 0;
    const std::initializer_list<const std::vector<std::string>*> groups = {
        &addedIds, &changed, &result.removals, &result.unchangedIds};
    for (const auto* group : groups) {
        for (const auto& id : *group) {
            ++total;
            seen.insert(id);
        }
    }
    if (seen.size() != total) {
        throw std::logic_error("reconciliation: synthetic id classified more than once");
    }

    std::set<std::string> both;
    std::set<std::string> catalogOnly;
    std::set<std::string> harvestOnly;
    for (const auto& id : catalogIds) {
        (harvestedIds.count(id) ? both : catalogOnly).insert(id);
    }
    for (const auto& id : harvestedIds) {
        if (!catalogIds.count(id)) harvestOnly.insert(id);
    }

    std::set<std::string> matched = ToSet(result.unchangedIds);
    for (const auto& id : changed) matched.insert(id);

    if (matched != both || ToSet(result.removals) != catalogOnly || ToSet(addedIds) != harvestOnly) {
        throw std::logic_error("reconciliation: result does not partition catalog and harvest for device " +
                               result.deviceKey);
    }
}

} // namespace

const std::vector<std::string>& ReconciliationEngine::TrackedColumns() {
    static const std::vector<std::string> columns = {kColName, kColDesc, kColUnit, kColDecimal, kColType};
    return columns;
}

domain::ReconciliationResult ReconciliationEngine::reconcile(const std::string& deviceKey,
                                                             std::uint32_t deviceInstance,
                                                             const std::vector<domain::CatalogRow>& catalogRows,
                                                             const std::vector<domain::HarvestedPoint>& harvested,
                                                             const domain::CatalogIdentifiers& defaults) const {
    domain::ReconciliationResult result;
    result.deviceKey = deviceKey;
    result.deviceInstance = deviceInstance;

    const domain::CatalogIdentifiers inherited = catalogRows.empty() ? defaults : catalogRows.front().identifiers;

    std::map<std::string, const domain::CatalogRow*> lookup;
    std::vector<std::string> catalogOrder;
    for (const auto& row : catalogRows) {
        if (lookup.emplace(row.syntheticId, &row).second) {
            catalogOrder.push_back(row.syntheticId);
        } else {
            Log::Warn(kTag, "Device " + deviceKey + ": duplicate catalog row " + row.syntheticId + " ignored");
        }
    }
    const std::set<std::string> catalogIds(catalogOrder.begin(), catalogOrder.end());

    std::set<std::string> harvestedIds;
    const auto& columns = TrackedColumns();
    for (const auto& point : harvested) {
        if (!harvestedIds.insert(point.syntheticId).second) {
            Log::Warn(kTag, "Device " + deviceKey + ": duplicate harvested point " + point.syntheticId + " ignored");
            continue;
        }

        auto it = lookup.find(point.syntheticId);
        if (it == lookup.end()) {
            result.additions.push_back(domain::PointAddition{point, inherited});
            continue;
        }

        const auto newValues = ColumnValues(point);
        const auto oldValues = ColumnValues(*it->second);
        bool changed = false;
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (oldValues[c] != newValues[c]) {
                result.changes.push_back(domain::FieldChange{point.syntheticId, columns[c], oldValues[c], newValues[c]});
                changed = true;
            }
        }
        if (!changed) {
            result.unchangedIds.push_back(point.syntheticId);
            Log::Debug(kTag, "Device " + deviceKey + ": " + point.syntheticId + " unchanged");
        }
        lookup.erase(it);
    }

    for (const auto& id : catalogOrder) {
        if (lookup.count(id)) {
            result.removals.push_back(id);
        }
    }

    VerifyPartition(catalogIds, harvestedIds, result);
    return result;
}

std::string ReconciliationEngine::BuildMutationScript(const domain::ReconciliationResult& result, const std::string& timestamp) {
    std::ostringstream sql;
    sql << "-- Catalog reconciliation for device " << result.deviceKey
        << " (instance " << result.deviceInstance << "), generated " << timestamp << "\n";
    sql << "-- " << result.additions.size() << " insert(s), " << result.changedIds().size()
        << " updated point(s), " << result.removals.size() << " removal(s)\n";
    sql << "BEGIN TRANSACTION;\n";

    for (const auto& addition : result.additions) {
        const auto& p = addition.point;
        const auto& ids = addition.identifiers;
        sql << "\nINSERT INTO " << kCatalogTable
            << " (SERVER_ID, SYSTEM_ID, ORDER_ID, DEVICE_SEQ, SYSTEM_PT_ID, OBJ_NAME, OBJ_DESC, OBJ_UNIT, OBJ_DECIMAL, OBJ_TYPE";
        for (std::size_t i = 1; i <= domain::kStateTextSlots; ++i) sql << ", OBJ_STATUS" << i;
        sql << ", REG_DATE)\n";
        sql << "SELECT " << SqlLiteral(ids.serverId) << ", " << SqlLiteral(ids.systemId) << ", "
            << SqlLiteral(ids.orderId) << ", " << SqlLiteral(result.deviceKey) << ", "
            << SqlLiteral(p.syntheticId) << ", " << SqlLiteral(p.name) << ", " << SqlLiteral(p.description) << ", "
            << SqlLiteral(p.unitSymbol) << ", " << DecimalText(p.decimalFlag) << ", "
            << domain::KindToTypeCode(p.kind);
        for (std::size_t i = 0; i < domain::kStateTextSlots; ++i) sql << ", " << SqlLiteral(StateTextAt(p, i));
        sql << ", " << SqlLiteral(timestamp) << "\n";
        sql << "WHERE NOT EXISTS (SELECT 1 FROM " << kCatalogTable << " WHERE "
            << KeyFilter(result.deviceKey, p.syntheticId) << ");\n";
    }

    if (!result.changes.empty()) sql << "\n";
    for (const auto& change : result.changes) {
        sql << "UPDATE " << kCatalogTable << " SET " << change.columnName << " = "
            << SqlValue(change.columnName, change.newValue)
            << " WHERE " << KeyFilter(result.deviceKey, change.syntheticId) << ";"
            << " -- previous: " << SqlValue(change.columnName, change.oldValue) << "\n";
    }

    for (const auto& id : result.removals) {
        sql << "\n-- WARNING: DESTRUCTIVE: " << id << " is no longer reported by device "
            << result.deviceKey << "; its catalog row is deleted\n";
        sql << "DELETE FROM " << kCatalogTable << " WHERE " << KeyFilter(result.deviceKey, id) << ";\n";
    }

    sql << "\nCOMMIT;\n";
    return sql.str();
}

std::string ReconciliationEngine::CsvHeader(domain::ArtifactKind kind) {
    switch (kind) {
        case domain::ArtifactKind::History:
            return "DATETIME,DEVICE_SEQ,SYSTEM_PT_ID,ACTION,COLUMN,OLD_VALUE,NEW_VALUE";
        case domain::ArtifactKind::Snapshot:
        case domain::ArtifactKind::Delta: {
            std::string header = "SYSTEM_PT_ID,OBJ_NAME,OBJ_DESC,OBJ_TYPE,DEVICE_SEQ,DEVICE_ID,OBJ_DECIMAL,OBJ_UNIT";
            for (std::size_t i = 1; i <= domain::kStateTextSlots; ++i) header += ",OBJ_STATUS" + std::to_string(i);
            return header + ",DATETIME";
        }
        case domain::ArtifactKind::Script:
            return "";
    }
    return "";
}

std::string ReconciliationEngine::BuildHistoryRows(const domain::ReconciliationResult& result, const std::string& timestamp) {
    std::ostringstream csv;
    csv << CsvHeader(domain::ArtifactKind::History) << "\n";
    const std::string prefix = timestamp + "," + result.deviceKey + ",";

    for (const auto& addition : result.additions) {
        csv << prefix << addition.point.syntheticId << ",ADD,," << CsvField("") << ','
            << CsvField(addition.point.name) << "\n";
    }
    for (const auto& change : result.changes) {
        csv << prefix << change.syntheticId << ",UPDATE," << change.columnName << ','
            << CsvField(change.oldValue) << ',' << CsvField(change.newValue) << "\n";
    }
    for (const auto& id : result.removals) {
        csv << prefix << id << ",DELETE,," << CsvField("") << ',' << CsvField("") << "\n";
    }
    return csv.str();
}

std::string ReconciliationEngine::BuildDeltaRows(const domain::ReconciliationResult& result, const std::string& timestamp) {
    std::string csv = CsvHeader(domain::ArtifactKind::Delta) + "\n";
    for (const auto& addition : result.additions) {
        csv += SiRow(addition.point, result.deviceKey, result.deviceInstance, timestamp);
    }
    return csv;
}

std::string ReconciliationEngine::BuildSnapshotRows(const std::string& deviceKey,
                                                    std::uint32_t deviceInstance,
                                                    const std::vector<domain::HarvestedPoint>& points,
                                                    const std::string& timestamp) {
    std::string csv = CsvHeader(domain::ArtifactKind::Snapshot) + "\n";
    for (const auto& point : points) {
        csv += SiRow(point, deviceKey, deviceInstance, timestamp);
    }
    return csv;
}

std::string ReconciliationEngine::MergeDailyArtifacts(const std::vector<domain::ArtifactFile>& files, domain::ArtifactKind kind) {
    const std::string kindPrefix = domain::ArtifactKindToString(kind) + "_";
    const std::string summaryPrefix = kSummaryPrefix;

    std::vector<const domain::ArtifactFile*> selected;
    for (const auto& file : files) {
        if (file.name.compare(0, summaryPrefix.size(), summaryPrefix) == 0) continue;
        if (file.name.compare(0, kindPrefix.size(), kindPrefix) != 0) continue;
        selected.push_back(&file);
    }
    std::sort(selected.begin(), selected.end(),
              [](const domain::ArtifactFile* a, const domain::ArtifactFile* b) { return a->name < b->name; });

    const std::string header = CsvHeader(kind);
    std::string merged;
    if (!header.empty()) {
        merged = header + "\n";
    }

    for (const auto* file : selected) {
        std::string body = file->content;
        if (!header.empty()) {
            auto eol = body.find('\n');
            std::string firstLine = body.substr(0, eol);
            if (!firstLine.empty() && firstLine.back() == '\r') firstLine.pop_back();
            if (firstLine == header) {
                body = (eol == std::string::npos) ? "" : body.substr(eol + 1);
            }
        } else {
            merged += "-- ---- " + file->name + "\n";
        }
        merged += body;
        if (!body.empty() && body.back() != '\n') merged += "\n";
    }
    return merged;
}

} // namespace bacnetinventory::application
