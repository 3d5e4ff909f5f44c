#pragma once

#include <faultline/core/types.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace faultline::report {

// One titled table of rows (JSON objects) in a report
struct ReportSeries {
    std::string title;
    nlohmann::json rows;
};

struct SavedReport {
    std::filesystem::path markdown;
    std::filesystem::path json;
};

class IReportSink {
public:
    virtual ~IReportSink() = default;

    /**
     * @brief Persist a report as {prefix}_{timestamp}.md plus a JSON twin.
     *
     * @param summary flat object rendered as a bullet list
     * @param series tables rendered in order after the summary
     * @param details raw payload written to the JSON file
     */
    virtual Result<SavedReport> save(const std::string& prefix, const std::string& timestamp,
                                     const nlohmann::json& summary,
                                     const std::vector<ReportSeries>& series,
                                     const nlohmann::json& details) = 0;
};

/**
 * @brief Writes reports into a directory and serves them back.
 */
class FileReportSink final : public IReportSink {
public:
    explicit FileReportSink(std::filesystem::path directory);

    Result<SavedReport> save(const std::string& prefix, const std::string& timestamp,
                             const nlohmann::json& summary, const std::vector<ReportSeries>& series,
                             const nlohmann::json& details) override;

    // File names, newest name first
    Result<std::vector<std::string>> list() const;

    // Most recently modified report file
    Result<std::filesystem::path> latest() const;

    // NotFound for missing files and for names that escape the directory
    Result<std::string> read(const std::string& fileName) const;

    const std::filesystem::path& directory() const { return directory_; }

    static std::string renderMarkdown(const std::string& timestamp, const nlohmann::json& summary,
                                      const std::vector<ReportSeries>& series);

private:
    Result<void> ensureDirectory() const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

} // namespace faultline::report
