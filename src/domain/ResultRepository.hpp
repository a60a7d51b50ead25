/**
 * @file ResultRepository.hpp
 * @brief Durable storage for graded results.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "domain/AnalysisResult.hpp"

namespace codegrader::domain {

/**
 * @struct StoredRecord
 * @brief A persisted grading record as read back from storage.
 */
struct StoredRecord {
    long id = 0;
    std::string studentId;
    std::string studentName;
    std::optional<std::string> assignmentCode;
    std::string filename;
    int totalScore = 0;
    std::string status;
    std::string submittedAt;
};

/**
 * @struct ScoreStats
 * @brief Distribution summary over stored records.
 */
struct ScoreStats {
    size_t totalSubmissions = 0;
    double avgScore = 0.0;
    int maxScore = 0;
    int minScore = 0;
    size_t passed = 0;
    size_t failed = 0;
    size_t flagged = 0;
};

/**
 * @class ResultRepository
 * @brief Abstract interface for persistence of finished grading records.
 */
class ResultRepository {
public:
    virtual ~ResultRepository() = default;

    /**
     * @brief Saves a batch of results.
     *
     * A record that cannot be written is skipped and the rest of the batch is still saved.
     * @param results Graded results (fingerprints already stripped).
     * @param assignmentCode Optional assignment the batch belongs to.
     * @return Identifiers of the records actually written, in input order.
     * @throws std::exception if the store is unusable.
     */
    virtual std::vector<long> saveBatch(const std::vector<GradedResult>& results,
                                        const std::optional<std::string>& assignmentCode) = 0;

    /** @brief All records of one student. */
    virtual std::vector<StoredRecord> studentScores(const std::string& studentId) = 0;

    /** @brief All records of one assignment, best score first. */
    virtual std::vector<StoredRecord> assignmentScores(const std::string& assignmentCode) = 0;

    /** @brief Score distribution, optionally restricted to one assignment. */
    virtual ScoreStats stats(const std::optional<std::string>& assignmentCode) = 0;
};

} // namespace codegrader::domain
