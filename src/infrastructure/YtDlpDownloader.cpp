#include "infrastructure/YtDlpDownloader.hpp"
#include "infrastructure/ProcessUtils.hpp"
#include "domain/Errors.hpp"

#include <deque>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

namespace lyricflow::infrastructure {

namespace {

constexpr const char* kProgressTag = "lyricflow-progress";
constexpr size_t kErrorTailLines = 5;

std::optional<double> ParseNumber(const std::string& token) {
    if (token.empty() || token == "NA" || token == "None") return std::nullopt;
    try {
        size_t consumed = 0;
        double value = std::stod(token, &consumed);
        if (consumed != token.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string JoinTail(const std::deque<std::string>& lines) {
    std::string out;
    for (const auto& l : lines) {
        if (!out.empty()) out += " | ";
        out += l;
    }
    return out;
}

} // namespace

YtDlpDownloader::YtDlpDownloader(const std::string& executable)
    : m_executable(executable) {}

std::optional<domain::DownloadProgress> YtDlpDownloader::ParseProgressLine(const std::string& line) {
    std::istringstream ss(line);
    std::string tag;
    std::string status;
    std::string downloaded;
    std::string total;
    std::string estimate;
    std::string eta;
    if (!(ss >> tag >> status) || tag != kProgressTag) {
        return std::nullopt;
    }
    ss >> downloaded >> total >> estimate >> eta;

    domain::DownloadProgress progress;
    progress.finished = status == "finished";
    if (auto d = ParseNumber(downloaded)) {
        progress.downloadedBytes = static_cast<unsigned long long>(*d);
    }
    if (auto t = ParseNumber(total)) {
        progress.totalBytes = static_cast<unsigned long long>(*t);
    } else if (auto e = ParseNumber(estimate)) {
        progress.totalBytes = static_cast<unsigned long long>(*e);
    }
    progress.etaSeconds = ParseNumber(eta);
    return progress;
}

domain::MediaInfo YtDlpDownloader::fetchInfo(const std::string& url) {
    std::string cmd = ProcessUtils::ShellQuote(m_executable) +
                      " --no-warnings --no-playlist --skip-download"
                      " --print '%(title)s' --print '%(duration)s' -- " +
                      ProcessUtils::ShellQuote(url) + " 2>/dev/null";

    std::vector<std::string> lines;
    int status = ProcessUtils::ExecReadLines(cmd, [&lines](const std::string& line) {
        lines.push_back(line);
    });
    if (status != 0 || lines.empty()) {
        throw domain::AcquisitionError("yt-dlp could not resolve " + url + " (exit " + std::to_string(status) + ")");
    }

    domain::MediaInfo info;
    if (!lines[0].empty() && lines[0] != "NA") {
        info.title = lines[0];
    }
    if (lines.size() > 1) {
        info.durationSeconds = ParseNumber(lines[1]).value_or(0.0);
    }
    return info;
}

void YtDlpDownloader::download(const std::string& url, const std::string& directory, ProgressHook hook) {
    const std::string outputTemplate = (std::filesystem::path(directory) / "%(title)s.%(ext)s").string();
    const std::string progressTemplate = std::string("download:") + kProgressTag +
        " %(progress.status)s %(progress.downloaded_bytes)s %(progress.total_bytes)s"
        " %(progress.total_bytes_estimate)s %(progress.eta)s";

    std::string cmd = ProcessUtils::ShellQuote(m_executable) +
                      " --no-warnings --no-playlist --newline"
                      " -f 'bestaudio/best' -x --audio-format mp3 --audio-quality 192K"
                      " --progress-template " + ProcessUtils::ShellQuote(progressTemplate) +
                      " -o " + ProcessUtils::ShellQuote(outputTemplate) + " -- " +
                      ProcessUtils::ShellQuote(url) + " 2>&1";

    std::cout << "[YtDlpDownloader] Downloading " << url << " into " << directory << std::endl;

    std::deque<std::string> tail;
    int status = ProcessUtils::ExecReadLines(cmd, [&](const std::string& line) {
        if (auto progress = ParseProgressLine(line)) {
            if (hook) hook(*progress);
            return;
        }
        tail.push_back(line);
        if (tail.size() > kErrorTailLines) tail.pop_front();
    });

    if (status != 0) {
        throw domain::AcquisitionError("yt-dlp failed (exit " + std::to_string(status) + "): " + JoinTail(tail));
    }
}

} // namespace lyricflow::infrastructure
