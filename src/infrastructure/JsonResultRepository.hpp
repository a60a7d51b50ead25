/**
 * @file JsonResultRepository.hpp
 * @brief ResultRepository storing one JSON file per graded result.
 */

#pragma once
#include <filesystem>
#include <mutex>
#include <utility>
#include "domain/ResultRepository.hpp"

namespace codegrader::infrastructure {

/**
 * @class JsonResultRepository
 * @brief Layout: <root>/<YYYY-MM-DD>/<NNN>_<student>_<assignment>.json
 *
 * Files are written atomically (temp file + rename). Record ids continue from
 * the number of records already on disk.
 */
class JsonResultRepository : public domain::ResultRepository {
public:
    explicit JsonResultRepository(std::filesystem::path root);

    std::vector<long> saveBatch(const std::vector<domain::GradedResult>& results,
                                const std::optional<std::string>& assignmentCode) override;
    std::vector<domain::StoredRecord> studentScores(const std::string& studentId) override;
    std::vector<domain::StoredRecord> assignmentScores(const std::string& assignmentCode) override;
    domain::ScoreStats stats(const std::optional<std::string>& assignmentCode) override;

    /**
     * @brief Splits "<id> - <name> | file" or "<name> | file".
     * @return {studentId, studentName}; defaults are "anonymous" and "Unknown".
     */
    static std::pair<std::string, std::string> ParseStudentInfo(const std::string& filename);

    const std::filesystem::path& root() const { return m_root; }

private:
    long countExistingRecords() const;
    std::vector<domain::StoredRecord> loadAll() const;
    void performAtomicWrite(const std::filesystem::path& finalPath, const std::string& content) const;

    std::filesystem::path m_root;
    long m_counter = 0;
    mutable std::mutex m_mutex;
};

} // namespace codegrader::infrastructure
