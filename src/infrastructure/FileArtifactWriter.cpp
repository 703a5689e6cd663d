/**
 * @file FileArtifactWriter.cpp
 * @brief Implementation of FileArtifactWriter.
 */

#include "infrastructure/FileArtifactWriter.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include "domain/TimeFormat.hpp"
#include "infrastructure/Log.hpp"

namespace bacnetinventory::infrastructure {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "ArtifactWriter";
constexpr const char* kSummaryPrefix = "TOTAL_";

/** Keeps device keys usable as a file name component. */
std::string SafeComponent(const std::string& text) {
    std::string out;
    for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '.') {
            out.push_back(c);
        } else {
            out.push_back('-');
        }
    }
    return out.empty() ? "unknown" : out;
}

} // namespace

FileArtifactWriter::FileArtifactWriter(fs::path root,
                                       std::shared_ptr<PersistenceService> persistence,
                                       MergeFunction merge)
    : m_root(std::move(root)), m_persistence(std::move(persistence)), m_merge(std::move(merge)) {
    if (!m_persistence) {
        throw std::invalid_argument("FileArtifactWriter requires a PersistenceService");
    }
    if (!m_merge) {
        throw std::invalid_argument("FileArtifactWriter requires a merge function");
    }
}

std::string FileArtifactWriter::Extension(domain::ArtifactKind kind) {
    return kind == domain::ArtifactKind::Script ? ".sql" : ".csv";
}

std::string FileArtifactWriter::DayFromRunStamp(const std::string& runStamp) {
    if (runStamp.size() < 8) return "";
    for (size_t i = 0; i < 8; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(runStamp[i]))) return "";
    }
    return runStamp.substr(0, 4) + "-" + runStamp.substr(4, 2) + "-" + runStamp.substr(6, 2);
}

fs::path FileArtifactWriter::reserveName(const fs::path& dir, const std::string& stem, const std::string& ext) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (int suffix = 0;; ++suffix) {
        std::string name = stem;
        if (suffix > 0) name += "_" + std::to_string(suffix);
        fs::path candidate = dir / (name + ext);

        std::error_code ec;
        bool onDisk = fs::exists(candidate, ec);
        if (!onDisk && m_reserved.count(candidate.string()) == 0) {
            m_reserved.insert(candidate.string());
            return candidate;
        }
    }
}

std::string FileArtifactWriter::write(domain::ArtifactKind kind,
                                      const std::string& deviceKey,
                                      const std::string& runStamp,
                                      const std::string& content) {
    std::string day = DayFromRunStamp(runStamp);
    if (day.empty()) {
        Log::Warn(kTag, "Malformed run stamp '" + runStamp + "', filing under today");
        day = domain::FormatDay(std::time(nullptr));
    }

    const fs::path dir = m_root / day;
    const std::string stem = domain::ArtifactKindToString(kind) + "_" + SafeComponent(deviceKey) + "_" + runStamp;
    const fs::path target = reserveName(dir, stem, Extension(kind));

    if (!m_persistence->saveText(target.string(), content)) {
        Log::Error(kTag, "Failed to write " + target.string());
        std::lock_guard<std::mutex> lock(m_mutex);
        m_reserved.erase(target.string());
        return "";
    }

    Log::Debug(kTag, "Wrote " + target.string());
    return target.string();
}

std::vector<domain::ArtifactFile> FileArtifactWriter::readDay(const fs::path& dir) const {
    std::vector<domain::ArtifactFile> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return files;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        const std::string name = it->path().filename().string();
        const std::string ext = it->path().extension().string();
        if (ext != ".csv" && ext != ".sql") continue;

        std::ifstream in(it->path(), std::ios::binary);
        if (!in.is_open()) {
            Log::Warn(kTag, "Cannot read " + it->path().string() + ", left out of the daily merge");
            continue;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        files.push_back({name, buffer.str()});
    }
    if (ec) {
        Log::Warn(kTag, "Error listing " + dir.string() + ": " + ec.message());
    }
    return files;
}

std::vector<std::string> FileArtifactWriter::mergeDaily(const std::string& day) {
    std::vector<std::string> written;
    const fs::path dir = m_root / day;
    const auto files = readDay(dir);
    if (files.empty()) {
        Log::Info(kTag, "Nothing to merge for " + day);
        return written;
    }

    std::string compactDay;
    for (char c : day) {
        if (c != '-') compactDay.push_back(c);
    }

    const domain::ArtifactKind kinds[] = {
        domain::ArtifactKind::Delta, domain::ArtifactKind::History, domain::ArtifactKind::Script
    };
    for (auto kind : kinds) {
        const std::string kindPrefix = domain::ArtifactKindToString(kind) + "_";
        bool any = false;
        for (const auto& file : files) {
            if (file.name.compare(0, kindPrefix.size(), kindPrefix) == 0) {
                any = true;
                break;
            }
        }
        if (!any) continue;

        const fs::path target = dir / (std::string(kSummaryPrefix) + domain::ArtifactKindToString(kind) + "_" +
                                       compactDay + Extension(kind));
        if (m_persistence->saveText(target.string(), m_merge(files, kind))) {
            written.push_back(target.string());
        } else {
            Log::Error(kTag, "Failed to write summary " + target.string());
        }
    }

    Log::Info(kTag, "Merged " + std::to_string(written.size()) + " daily summaries for " + day);
    return written;
}

} // namespace bacnetinventory::infrastructure
