/**
 * @file JobStore.hpp
 * @brief Concurrent in-memory job table with time-to-live expiry.
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "domain/Job.hpp"

namespace codegrader::application {

/**
 * @class JobStore
 * @brief Maps job id to Job. Sharded: each shard has its own mutex.
 *
 * A job created at T is visible through find() until T + ttl inclusive and never
 * after, whether or not sweepExpired() has run yet. Readers receive copies.
 */
class JobStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using IdGenerator = std::function<std::string()>;

    /**
     * @param ttl Lifetime of a job record.
     * @param shardCount Number of independently locked partitions.
     * @param clock Time source; system_clock::now when empty.
     * @param idGenerator Job id source; libuuid v4 when empty.
     */
    explicit JobStore(std::chrono::seconds ttl,
                      size_t shardCount = 16,
                      Clock clock = nullptr,
                      IdGenerator idGenerator = nullptr);

    /** @brief Creates a pending job and returns a snapshot of it. */
    domain::Job create(const std::string& studentName);

    /**
     * @brief Applies a whole-record update under the shard lock.
     * @return false when the job does not exist or has expired.
     */
    bool update(const std::string& id, const std::function<void(domain::Job&)>& mutator);

    /** @brief Snapshot of a live job. */
    std::optional<domain::Job> find(const std::string& id) const;

    /** @brief Removes every expired record. @return Number removed. */
    size_t sweepExpired();

    /** @brief Records currently held, including expired ones not yet swept. */
    size_t size() const;

    std::chrono::seconds ttl() const { return m_ttl; }

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, domain::Job> jobs;
    };

    Shard& shardFor(const std::string& id) const;
    bool isExpired(const domain::Job& job, std::chrono::system_clock::time_point now) const;

    std::chrono::seconds m_ttl;
    Clock m_clock;
    IdGenerator m_idGenerator;
    std::vector<std::unique_ptr<Shard>> m_shards;
};

} // namespace codegrader::application
