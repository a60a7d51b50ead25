/**
 * @file JsonResultRepository.cpp
 * @brief Implementation of JsonResultRepository.
 */

#include "infrastructure/JsonResultRepository.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/ResultSerializer.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace codegrader::infrastructure {

namespace {

constexpr size_t kMaxNameLength = 20;
constexpr size_t kMaxTagLength = 15;

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string FormatLocal(const std::tm& tm, const char* format) {
    char buf[32];
    std::strftime(buf, sizeof(buf), format, &tm);
    return buf;
}

std::string Trim(const std::string& s) {
    const char* whitespace = " \t\r\n";
    size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    return s.substr(first, s.find_last_not_of(whitespace) - first + 1);
}

domain::StoredRecord RecordFromJson(const json& j) {
    domain::StoredRecord record;
    record.id = j.value("id", 0L);
    record.studentId = j.value("student_id", std::string("anonymous"));
    record.studentName = j.value("student_name", std::string("Unknown"));
    if (j.contains("assignment_code") && j["assignment_code"].is_string()) {
        record.assignmentCode = j["assignment_code"].get<std::string>();
    }
    record.filename = j.value("filename", std::string());
    if (j.contains("total_score") && j["total_score"].is_number()) {
        record.totalScore = j["total_score"].get<int>();
    }
    record.status = j.value("status", std::string("PENDING"));
    record.submittedAt = j.value("submitted_at", std::string());
    return record;
}

} // namespace

JsonResultRepository::JsonResultRepository(fs::path root) : m_root(std::move(root)) {
    std::error_code ec;
    fs::create_directories(m_root, ec);
    if (ec) {
        std::cerr << "[JsonResultRepository] Cannot create " << m_root << ": " << ec.message() << std::endl;
    }
    m_counter = countExistingRecords();
    std::cout << "[JsonResultRepository] Storage ready at " << m_root << " (" << m_counter << " records)" << std::endl;
}

std::pair<std::string, std::string> JsonResultRepository::ParseStudentInfo(const std::string& filename) {
    std::string studentId = "anonymous";
    std::string studentName = "Unknown";

    const size_t bar = filename.find(" | ");
    if (bar != std::string::npos) {
        const std::string info = filename.substr(0, bar);
        const size_t dash = info.find(" - ");
        if (dash != std::string::npos) {
            studentId = info.substr(0, dash);
            studentName = info.substr(dash + 3);
        } else {
            studentName = info;
        }
    }
    return {Trim(studentId), Trim(studentName)};
}

std::vector<long> JsonResultRepository::saveBatch(const std::vector<domain::GradedResult>& results,
                                                  const std::optional<std::string>& assignmentCode) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const std::tm now = ToLocalTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    const fs::path dateDir = m_root / FormatLocal(now, "%Y-%m-%d");
    const std::string submittedAt = FormatLocal(now, "%Y-%m-%d %H:%M:%S");
    const std::string tag = PathUtils::SanitizeFileComponent(assignmentCode.value_or("general"), kMaxTagLength);

    std::vector<long> ids;
    ids.reserve(results.size());
    for (const auto& result : results) {
        const long recordId = m_counter + 1;
        auto [studentId, studentName] = ParseStudentInfo(result.name);

        json record = ResultSerializer::ToJson(result);
        record["id"] = recordId;
        record["student_id"] = studentId;
        record["student_name"] = studentName;
        record["assignment_code"] = assignmentCode ? json(*assignmentCode) : json(nullptr);
        record["submitted_at"] = submittedAt;

        char prefix[16];
        std::snprintf(prefix, sizeof(prefix), "%03ld", recordId);
        const std::string fileName = std::string(prefix) + "_" +
                                     PathUtils::SanitizeFileComponent(studentName, kMaxNameLength) + "_" + tag + ".json";

        try {
            performAtomicWrite(dateDir / fileName, record.dump(2, ' ', false, json::error_handler_t::replace));
        } catch (const std::exception& e) {
            std::cerr << "[JsonResultRepository] Skipping " << result.name << ": " << e.what() << std::endl;
            continue;
        }
        m_counter = recordId;
        ids.push_back(recordId);
    }
    return ids;
}

void JsonResultRepository::performAtomicWrite(const fs::path& finalPath, const std::string& content) const {
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path());
    }

    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            throw std::runtime_error("Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ec;
            fs::remove(tempPath, ec);
            throw std::runtime_error("Write failed: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw std::runtime_error("Rename failed for " + finalPath.string() + ": " + ec.message());
    }
}

long JsonResultRepository::countExistingRecords() const {
    long count = 0;
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) return 0;
    for (const auto& dateDir : fs::directory_iterator(m_root, ec)) {
        if (!dateDir.is_directory()) continue;
        for (const auto& entry : fs::directory_iterator(dateDir.path(), ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") ++count;
        }
    }
    return count;
}

std::vector<domain::StoredRecord> JsonResultRepository::loadAll() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) return {};
    for (const auto& dateDir : fs::directory_iterator(m_root, ec)) {
        if (!dateDir.is_directory()) continue;
        for (const auto& entry : fs::directory_iterator(dateDir.path(), ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                files.push_back(entry.path());
            }
        }
    }
    std::sort(files.begin(), files.end());

    std::vector<domain::StoredRecord> records;
    records.reserve(files.size());
    for (const auto& file : files) {
        try {
            std::ifstream f(file);
            json j;
            f >> j;
            records.push_back(RecordFromJson(j));
        } catch (const std::exception& e) {
            std::cerr << "[JsonResultRepository] Skip corrupt file " << file.filename() << ": " << e.what() << std::endl;
        }
    }
    return records;
}

std::vector<domain::StoredRecord> JsonResultRepository::studentScores(const std::string& studentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::StoredRecord> out;
    for (auto& record : loadAll()) {
        if (record.studentId == studentId) out.push_back(std::move(record));
    }
    return out;
}

std::vector<domain::StoredRecord> JsonResultRepository::assignmentScores(const std::string& assignmentCode) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::StoredRecord> out;
    for (auto& record : loadAll()) {
        if (record.assignmentCode && *record.assignmentCode == assignmentCode) out.push_back(std::move(record));
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.totalScore > b.totalScore;
    });
    return out;
}

domain::ScoreStats JsonResultRepository::stats(const std::optional<std::string>& assignmentCode) {
    std::lock_guard<std::mutex> lock(m_mutex);
    domain::ScoreStats stats;

    long sum = 0;
    for (const auto& record : loadAll()) {
        if (assignmentCode && record.assignmentCode != assignmentCode) continue;

        if (stats.totalSubmissions == 0) {
            stats.maxScore = record.totalScore;
            stats.minScore = record.totalScore;
        } else {
            stats.maxScore = std::max(stats.maxScore, record.totalScore);
            stats.minScore = std::min(stats.minScore, record.totalScore);
        }
        ++stats.totalSubmissions;
        sum += record.totalScore;

        if (record.status == "PASS") ++stats.passed;
        else if (record.status == "FAIL") ++stats.failed;
        else if (record.status == "FLAG") ++stats.flagged;
    }

    if (stats.totalSubmissions > 0) {
        stats.avgScore = std::round(static_cast<double>(sum) / stats.totalSubmissions * 10.0) / 10.0;
    }
    return stats;
}

} // namespace codegrader::infrastructure
