#pragma once

#include <filesystem>
#include <map>
#include <string>

#include "hourglass/core/error.hpp"
#include "hourglass/cron/job.hpp"

namespace hourglass::cron {

/// Jobs keyed by id. Ordered so that saved files diff cleanly.
using JobMap = std::map<std::string, Job>;

/// File-backed job store.
///
/// Holds no scheduling logic: it only reads and writes the whole job set.
/// Writes go to `<path>.tmp` first and are renamed over the backing file,
/// so a crash never leaves a partially written store under the final name.
class JobStore {
public:
    /// Current on-disk layout version.
    static constexpr int kVersion = 2;

    explicit JobStore(std::filesystem::path path);

    /// Read the backing file.
    ///
    /// A missing file yields an empty map. An unreadable or malformed file
    /// fails with ErrorCode::StoreCorrupt; nothing is discarded silently.
    auto load() const -> Result<JobMap>;

    /// Atomically replace the backing file with `jobs`.
    auto save(const JobMap& jobs) const -> VoidResult;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace hourglass::cron
