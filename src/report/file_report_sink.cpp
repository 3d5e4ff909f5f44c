#include <faultline/report/report_sink.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace faultline::report {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

std::string renderValue(const json& v) {
    if (v.is_string())
        return v.get<std::string>();
    if (v.is_number_float())
        return fmt::format("{:.4f}", v.get<double>());
    return v.dump();
}

bool isPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    return name.find('/') == std::string::npos && name.find('\\') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

Result<void> writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return Error{ErrorCode::WriteError, "cannot open " + path.string() + " for writing"};
    out << content;
    out.flush();
    if (!out)
        return Error{ErrorCode::WriteError, "failed writing " + path.string()};
    return Result<void>();
}

} // namespace

FileReportSink::FileReportSink(fs::path directory) : directory_(std::move(directory)) {}

Result<void> FileReportSink::ensureDirectory() const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return Error{ErrorCode::WriteError,
                     "cannot create report directory " + directory_.string() + ": " + ec.message()};
    }
    return Result<void>();
}

std::string FileReportSink::renderMarkdown(const std::string& timestamp, const json& summary,
                                           const std::vector<ReportSeries>& series) {
    std::ostringstream md;
    md << "# Performance Report (" << timestamp << ")\n\n";
    md << "## Summary\n";
    if (summary.is_object()) {
        for (auto it = summary.begin(); it != summary.end(); ++it)
            md << "- **" << it.key() << "**: " << renderValue(it.value()) << "\n";
    }
    for (const auto& s : series) {
        md << "\n## " << s.title << "\n";
        if (!s.rows.is_array())
            continue;
        for (const auto& row : s.rows) {
            if (!row.is_object()) {
                md << "- " << renderValue(row) << "\n";
                continue;
            }
            std::string line;
            for (auto it = row.begin(); it != row.end(); ++it) {
                if (!line.empty())
                    line += " | ";
                line += it.key() + ": " + renderValue(it.value());
            }
            md << "- " << line << "\n";
        }
    }
    return md.str();
}

Result<SavedReport> FileReportSink::save(const std::string& prefix, const std::string& timestamp,
                                         const json& summary,
                                         const std::vector<ReportSeries>& series,
                                         const json& details) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (auto r = ensureDirectory(); !r)
        return r.error();

    // Reports saved within the same second get a numeric suffix
    std::string stem = prefix + "_" + timestamp;
    std::error_code ec;
    for (int n = 2; fs::exists(directory_ / (stem + ".md"), ec) ||
                    fs::exists(directory_ / (stem + ".json"), ec);
         ++n) {
        stem = prefix + "_" + timestamp + "_" + std::to_string(n);
    }

    SavedReport saved;
    saved.markdown = directory_ / (stem + ".md");
    saved.json = directory_ / (stem + ".json");

    if (auto r = writeFile(saved.markdown, renderMarkdown(timestamp, summary, series)); !r)
        return r.error();
    spdlog::info("[FileReportSink] Markdown report saved at {}", saved.markdown.string());

    if (auto r = writeFile(saved.json, details.dump(2)); !r)
        return r.error();
    spdlog::info("[FileReportSink] JSON report saved at {}", saved.json.string());
    return saved;
}

Result<std::vector<std::string>> FileReportSink::list() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::exists(directory_, ec))
        return names;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec))
            names.push_back(it->path().filename().string());
    }
    if (ec)
        return Error{ErrorCode::InternalError, "listing reports: " + ec.message()};
    std::sort(names.begin(), names.end(), std::greater<>());
    return names;
}

Result<fs::path> FileReportSink::latest() const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::error_code ec;
    std::optional<fs::path> best;
    fs::file_time_type bestTime{};
    if (fs::exists(directory_, ec)) {
        for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_regular_file(ec))
                continue;
            auto t = it->last_write_time(ec);
            if (ec)
                break;
            if (!best || t > bestTime || (t == bestTime && it->path() > *best)) {
                best = it->path();
                bestTime = t;
            }
        }
    }
    if (ec)
        return Error{ErrorCode::InternalError, "scanning reports: " + ec.message()};
    if (!best)
        return Error{ErrorCode::NotFound, "No reports found."};
    return *best;
}

Result<std::string> FileReportSink::read(const std::string& fileName) const {
    if (!isPlainFileName(fileName))
        return Error{ErrorCode::NotFound, "Report not found"};
    std::lock_guard<std::mutex> lk(mutex_);
    const auto path = directory_ / fileName;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return Error{ErrorCode::NotFound, "Report not found"};
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Error{ErrorCode::NotFound, "Report not found"};
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

} // namespace faultline::report
