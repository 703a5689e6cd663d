#undef NDEBUG
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include "application/ReconciliationEngine.hpp"
#include "infrastructure/FileArtifactWriter.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace bacnetinventory;
namespace fs = std::filesystem;

namespace {

fs::path MakeTempRoot(const std::string& name) {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path root = fs::temp_directory_path() / ("bacnet_inventory_" + name + "_" + std::to_string(ticks));
    fs::create_directories(root);
    return root;
}

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::unique_ptr<infrastructure::FileArtifactWriter> MakeWriter(const fs::path& root,
                                                               std::shared_ptr<infrastructure::PersistenceService> persistence) {
    return std::make_unique<infrastructure::FileArtifactWriter>(root, persistence,
                                                                &application::ReconciliationEngine::MergeDailyArtifacts);
}

} // namespace

static void TestPersistence(const fs::path& root) {
    std::cout << "[Test] Atomic writes..." << std::endl;
    infrastructure::PersistenceService persistence;

    const fs::path nested = root / "a" / "b" / "file.txt";
    assert(persistence.saveText(nested.string(), "first"));
    assert(ReadFile(nested) == "first");
    assert(persistence.saveText(nested.string(), "second"));
    assert(ReadFile(nested) == "second");

    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        assert(entry.path().extension() != ".tmp");
    }

    persistence.stop();
    assert(!persistence.saveText((root / "after_stop.txt").string(), "x"));
    assert(!fs::exists(root / "after_stop.txt"));
}

static void TestNamesNeverCollide(const fs::path& root) {
    std::cout << "[Test] Repeated writes never overwrite..." << std::endl;
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto writer = MakeWriter(root, persistence);

    auto first = writer->write(domain::ArtifactKind::History, "DEV/1", "20240131_101500", "one");
    auto second = writer->write(domain::ArtifactKind::History, "DEV/1", "20240131_101500", "two");
    assert(!first.empty() && !second.empty() && first != second);
    assert(fs::path(first) == root / "2024-01-31" / "HISTORY_DEV-1_20240131_101500.csv");
    assert(fs::path(second) == root / "2024-01-31" / "HISTORY_DEV-1_20240131_101500_1.csv");
    assert(ReadFile(first) == "one");
    assert(ReadFile(second) == "two");

    auto script = writer->write(domain::ArtifactKind::Script, "DEV/1", "20240131_101500", "BEGIN TRANSACTION;\nCOMMIT;\n");
    assert(fs::path(script).extension() == ".sql");

    // A fresh writer over the same directory still sees the files on disk.
    auto again = MakeWriter(root, persistence);
    auto third = again->write(domain::ArtifactKind::History, "DEV/1", "20240131_101500", "three");
    assert(fs::path(third).filename() == "HISTORY_DEV-1_20240131_101500_2.csv");
}

static void TestRunStamps() {
    std::cout << "[Test] Run stamp to day folder..." << std::endl;
    using infrastructure::FileArtifactWriter;
    assert(FileArtifactWriter::DayFromRunStamp("20240131_101500") == "2024-01-31");
    assert(FileArtifactWriter::DayFromRunStamp("2024013").empty());
    assert(FileArtifactWriter::DayFromRunStamp("2024x131_101500").empty());
    assert(FileArtifactWriter::Extension(domain::ArtifactKind::Script) == ".sql");
    assert(FileArtifactWriter::Extension(domain::ArtifactKind::Snapshot) == ".csv");
    assert(FileArtifactWriter::Extension(domain::ArtifactKind::Delta) == ".csv");
}

static void TestDailyMerge(const fs::path& root) {
    std::cout << "[Test] Daily summaries..." << std::endl;
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto writer = MakeWriter(root, persistence);
    const std::string header = application::ReconciliationEngine::CsvHeader(domain::ArtifactKind::History);

    assert(!writer->write(domain::ArtifactKind::History, "DEV2", "20240131_101500", header + "\nrow-2\n").empty());
    assert(!writer->write(domain::ArtifactKind::History, "DEV1", "20240131_101500", header + "\nrow-1\n").empty());
    assert(!writer->write(domain::ArtifactKind::Script, "DEV1", "20240131_101500", "COMMIT;\n").empty());
    assert(!writer->write(domain::ArtifactKind::Snapshot, "DEV1", "20240131_101500", "snapshot\n").empty());

    auto written = writer->mergeDaily("2024-01-31");
    assert(written.size() == 2);
    const fs::path historyTotal = root / "2024-01-31" / "TOTAL_HISTORY_20240131.csv";
    const fs::path scriptTotal = root / "2024-01-31" / "TOTAL_SCRIPT_20240131.sql";
    assert(fs::exists(historyTotal) && fs::exists(scriptTotal));
    assert(!fs::exists(root / "2024-01-31" / "TOTAL_DELTA_20240131.csv"));

    const std::string merged = ReadFile(historyTotal);
    assert(merged == header + "\nrow-1\nrow-2\n");

    // Summaries are not merged into themselves.
    assert(writer->mergeDaily("2024-01-31").size() == 2);
    assert(ReadFile(historyTotal) == merged);

    assert(writer->mergeDaily("2024-02-01").empty());
}

static void TestUnwritableRoot(const fs::path& root) {
    std::cout << "[Test] Unwritable artifact root..." << std::endl;
    const fs::path blocker = root / "not_a_directory";
    std::ofstream(blocker) << "x";

    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto writer = MakeWriter(blocker, persistence);
    assert(writer->write(domain::ArtifactKind::Delta, "DEV1", "20240131_101500", "x").empty());
}

static void TestConstruction() {
    std::cout << "[Test] Writer needs its collaborators..." << std::endl;
    bool threw = false;
    try {
        infrastructure::FileArtifactWriter writer("/tmp", nullptr, &application::ReconciliationEngine::MergeDailyArtifacts);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        infrastructure::FileArtifactWriter writer("/tmp", std::make_shared<infrastructure::PersistenceService>(), nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    std::cout << "[Test] Artifact storage" << std::endl;
    const fs::path root = MakeTempRoot("artifacts");

    TestPersistence(root / "persistence");
    TestNamesNeverCollide(root / "names");
    TestRunStamps();
    TestDailyMerge(root / "merge");
    TestUnwritableRoot(root);
    TestConstruction();

    fs::remove_all(root);
    std::cout << "[PASS] Artifact storage" << std::endl;
    return 0;
}
