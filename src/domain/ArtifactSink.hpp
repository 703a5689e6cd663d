/**
 * @file ArtifactSink.hpp
 * @brief Interface for persisting per-device run artifacts.
 */

#pragma once
#include <string>
#include <vector>

namespace bacnetinventory::domain {

/**
 * @enum ArtifactKind
 * @brief Logical file kinds written per device per run.
 */
enum class ArtifactKind {
    Snapshot,   ///< Raw harvested point table.
    Delta,      ///< Addition candidates only.
    History,    ///< Human-readable change/removal rows.
    Script      ///< Mutation statements paired with History.
};

inline std::string ArtifactKindToString(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Snapshot: return "SNAPSHOT";
        case ArtifactKind::Delta: return "DELTA";
        case ArtifactKind::History: return "HISTORY";
        case ArtifactKind::Script: return "SCRIPT";
    }
    return "UNKNOWN";
}

/**
 * @struct ArtifactFile
 * @brief A named artifact already read into memory.
 */
struct ArtifactFile {
    std::string name;       ///< File name without directory.
    std::string content;
};

/**
 * @class ArtifactSink
 * @brief Stores artifacts so repeated runs never overwrite earlier evidence.
 */
class ArtifactSink {
public:
    virtual ~ArtifactSink() = default;

    /**
     * @brief Persists one artifact.
     * @param kind Artifact kind.
     * @param deviceKey Device the artifact belongs to (embedded in the name).
     * @param runStamp Run timestamp "yyyyMMdd_HHmmss" (embedded in the name).
     * @param content Full file content.
     * @return Path written, or empty string if the write failed.
     */
    virtual std::string write(ArtifactKind kind,
                              const std::string& deviceKey,
                              const std::string& runStamp,
                              const std::string& content) = 0;

    /**
     * @brief Merges the day's per-device History and Script files into daily summaries.
     * @param day Date as "yyyy-MM-dd".
     * @return Paths of the summaries written.
     */
    virtual std::vector<std::string> mergeDaily(const std::string& day) = 0;
};

} // namespace bacnetinventory::domain
