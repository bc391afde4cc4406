#include "hourglass/cron/store.hpp"
#include "hourglass/core/logger.hpp"

#include <fstream>
#include <stdexcept>

namespace hourglass::cron {

namespace {

auto corrupt(const std::filesystem::path& path, std::string detail) -> Error {
    return make_error(ErrorCode::StoreCorrupt,
                      "Job store is corrupt: " + path.string(),
                      std::move(detail));
}

} // anonymous namespace

JobStore::JobStore(std::filesystem::path path)
    : path_(std::move(path))
{
}

auto JobStore::load() const -> Result<JobMap> {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LOG_INFO("Job store {} not found, starting empty", path_.string());
        return JobMap{};
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        return std::unexpected(corrupt(path_, "cannot open file"));
    }

    JobMap jobs;
    try {
        json root = json::parse(in);
        if (!root.is_object()) {
            return std::unexpected(corrupt(path_, "top level must be an object"));
        }

        auto it = root.find("jobs");
        if (it == root.end() || it->is_null()) {
            LOG_INFO("Job store {} has no jobs", path_.string());
            return jobs;
        }

        if (it->is_array()) {
            // Original layout: a list of records carrying their own ids.
            for (const auto& record : *it) {
                auto job = record.get<Job>();
                if (job.id.empty()) {
                    return std::unexpected(corrupt(path_, "job record without id"));
                }
                if (jobs.contains(job.id)) {
                    return std::unexpected(corrupt(path_, "duplicate job id " + job.id));
                }
                auto id = job.id;
                jobs.emplace(std::move(id), std::move(job));
            }
        } else if (it->is_object()) {
            for (const auto& [id, record] : it->items()) {
                auto job = record.get<Job>();
                job.id = id;
                jobs.emplace(id, std::move(job));
            }
        } else {
            return std::unexpected(corrupt(path_, "\"jobs\" must be an object or array"));
        }
    } catch (const json::exception& e) {
        return std::unexpected(corrupt(path_, e.what()));
    } catch (const std::invalid_argument& e) {
        return std::unexpected(corrupt(path_, e.what()));
    }

    LOG_INFO("Loaded {} job(s) from {}", jobs.size(), path_.string());
    return jobs;
}

auto JobStore::save(const JobMap& jobs) const -> VoidResult {
    auto tmp_path = std::filesystem::path(path_.string() + ".tmp");

    try {
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path());
        }

        json records = json::object();
        for (const auto& [id, job] : jobs) {
            records[id] = job;
        }
        json root = {
            {"version", kVersion},
            {"jobs", std::move(records)},
        };

        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(make_error(
                ErrorCode::IoError,
                "Failed to open temp file for job store",
                tmp_path.string()));
        }
        out << root.dump(2);
        out.close();
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            return std::unexpected(make_error(
                ErrorCode::IoError,
                "Failed to write job store",
                tmp_path.string()));
        }

        // Atomic rename
        std::filesystem::rename(tmp_path, path_);
    } catch (const std::exception& e) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        return std::unexpected(make_error(
            ErrorCode::IoError,
            "Failed to save job store",
            e.what()));
    }

    LOG_DEBUG("Saved {} job(s) to {}", jobs.size(), path_.string());
    return {};
}

} // namespace hourglass::cron
