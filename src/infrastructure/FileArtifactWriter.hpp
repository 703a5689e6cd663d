/**
 * @file FileArtifactWriter.hpp
 * @brief ArtifactSink that writes dated artifact files under one root directory.
 */

#pragma once
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "domain/ArtifactSink.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace bacnetinventory::infrastructure {

/**
 * @class FileArtifactWriter
 * @brief Lays artifacts out as <root>/<yyyy-MM-dd>/<KIND>_<deviceKey>_<runStamp>.<ext>.
 *
 * An existing name gets a numeric suffix ("_1", "_2", ...), so a file is
 * never overwritten. Daily summaries are named TOTAL_<KIND>_<yyyyMMdd>.<ext>
 * and are rewritten on every merge.
 */
class FileArtifactWriter : public domain::ArtifactSink {
public:
    using MergeFunction = std::function<std::string(const std::vector<domain::ArtifactFile>&, domain::ArtifactKind)>;

    FileArtifactWriter(std::filesystem::path root,
                       std::shared_ptr<PersistenceService> persistence,
                       MergeFunction merge);

    std::string write(domain::ArtifactKind kind,
                      const std::string& deviceKey,
                      const std::string& runStamp,
                      const std::string& content) override;

    std::vector<std::string> mergeDaily(const std::string& day) override;

    const std::filesystem::path& root() const { return m_root; }

    /** @brief ".sql" for scripts, ".csv" for every other kind. */
    static std::string Extension(domain::ArtifactKind kind);

    /** @brief "20240131_101500" -> "2024-01-31"; empty if the stamp is malformed. */
    static std::string DayFromRunStamp(const std::string& runStamp);

private:
    std::filesystem::path reserveName(const std::filesystem::path& dir, const std::string& stem, const std::string& ext);
    std::vector<domain::ArtifactFile> readDay(const std::filesystem::path& dir) const;

    std::filesystem::path m_root;
    std::shared_ptr<PersistenceService> m_persistence;
    MergeFunction m_merge;

    std::mutex m_mutex;
    std::set<std::string> m_reserved;   ///< Paths handed out but possibly not yet on disk.
};

} // namespace bacnetinventory::infrastructure
