/**
 * @file JobStore.cpp
 * @brief Implementation of JobStore.
 */

#include "application/JobStore.hpp"
#include "infrastructure/UuidGenerator.hpp"
#include <iostream>

namespace codegrader::application {

JobStore::JobStore(std::chrono::seconds ttl, size_t shardCount, Clock clock, IdGenerator idGenerator)
    : m_ttl(ttl), m_clock(std::move(clock)), m_idGenerator(std::move(idGenerator)) {
    if (!m_clock) m_clock = [] { return std::chrono::system_clock::now(); };
    if (!m_idGenerator) m_idGenerator = [] { return infrastructure::UuidGenerator::Generate(); };
    if (shardCount == 0) shardCount = 1;
    for (size_t i = 0; i < shardCount; ++i) {
        m_shards.push_back(std::make_unique<Shard>());
    }
}

JobStore::Shard& JobStore::shardFor(const std::string& id) const {
    return *m_shards[std::hash<std::string>{}(id) % m_shards.size()];
}

bool JobStore::isExpired(const domain::Job& job, std::chrono::system_clock::time_point now) const {
    return now - job.createdAt > m_ttl;
}

domain::Job JobStore::create(const std::string& studentName) {
    domain::Job job;
    job.id = m_idGenerator();
    job.status = domain::JobStatus::Pending;
    job.studentName = studentName;
    job.createdAt = m_clock();

    Shard& shard = shardFor(job.id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    shard.jobs[job.id] = job;
    return job;
}

bool JobStore::update(const std::string& id, const std::function<void(domain::Job&)>& mutator) {
    Shard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.jobs.find(id);
    if (it == shard.jobs.end() || isExpired(it->second, m_clock())) return false;

    domain::Job updated = it->second;
    mutator(updated);
    it->second = std::move(updated);
    return true;
}

std::optional<domain::Job> JobStore::find(const std::string& id) const {
    Shard& shard = shardFor(id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.jobs.find(id);
    if (it == shard.jobs.end() || isExpired(it->second, m_clock())) return std::nullopt;
    return it->second;
}

size_t JobStore::sweepExpired() {
    const auto now = m_clock();
    size_t removed = 0;
    for (auto& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto it = shard->jobs.begin(); it != shard->jobs.end();) {
            if (isExpired(it->second, now)) {
                it = shard->jobs.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        std::cout << "[JobStore] Cleaned up " << removed << " expired job(s)." << std::endl;
    }
    return removed;
}

size_t JobStore::size() const {
    size_t total = 0;
    for (const auto& shard : m_shards) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->jobs.size();
    }
    return total;
}

} // namespace codegrader::application
