#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/NotificationDispatcher.hpp"

using namespace codegrader;
using namespace codegrader::application;
using json = nlohmann::json;

// Mock transport answering from a script of status codes (-1 means connection failure)
class ScriptedTransport : public domain::CallbackTransport {
public:
    explicit ScriptedTransport(std::vector<int> script) : m_script(std::move(script)) {}

    int post(const std::string& url, const std::string& jsonBody) override {
        urls.push_back(url);
        bodies.push_back(jsonBody);
        int status = m_script.empty() ? 200 : m_script[std::min(urls.size(), m_script.size()) - 1];
        if (status < 0) throw std::runtime_error("connection refused");
        return status;
    }

    std::vector<std::string> urls;
    std::vector<std::string> bodies;

private:
    std::vector<int> m_script;
};

namespace {

domain::Job CompletedJob() {
    domain::Job job;
    job.id = "2f1c-job";
    job.status = domain::JobStatus::Completed;
    job.studentName = "Dana";

    domain::GradedResult result;
    result.name = "Dana | sort.py";
    result.valid = true;
    result.totalScore = 72;
    result.status = domain::GradeStatus::Pass;
    job.results = std::vector<domain::GradedResult>{result};

    domain::JobSummary summary;
    summary.fileCount = 1;
    summary.avgScore = 72.0;
    summary.elapsedSeconds = 1.23;
    summary.persistedCount = 1;
    job.summary = summary;
    return job;
}

} // namespace

int main() {
    std::cout << "[Test] Starting NotificationDispatcher Test..." << std::endl;

    std::vector<std::chrono::milliseconds> waits;
    auto recordWait = [&waits](std::chrono::milliseconds wait) { waits.push_back(wait); };
    DeliveryPolicy policy;
    policy.backoffUnit = std::chrono::milliseconds(1000);

    // --- Payload ---
    json payload = NotificationDispatcher::BuildPayload(CompletedJob());
    assert(payload["event"] == "grading_completed");
    assert(payload["job_id"] == "2f1c-job");
    assert(payload["results"].size() == 1);
    assert(payload["results"][0]["filename"] == "Dana | sort.py");
    assert(payload["results"][0]["total_score"] == 72);
    assert(payload["summary"]["total_files"] == 1);
    assert(!payload["results"][0].contains("fingerprint"));
    std::cout << "[PASS] Payload shape." << std::endl;

    // --- First attempt succeeds ---
    auto ok = std::make_shared<ScriptedTransport>(std::vector<int>{204});
    assert(NotificationDispatcher(ok, policy, recordWait).deliver("http://hook/done", CompletedJob()));
    assert(ok->urls.size() == 1 && ok->urls[0] == "http://hook/done");
    assert(json::parse(ok->bodies[0]) == payload);
    assert(waits.empty());

    // --- Two failures then success: waits of 2 and 4 units ---
    auto flaky = std::make_shared<ScriptedTransport>(std::vector<int>{500, -1, 200});
    assert(NotificationDispatcher(flaky, policy, recordWait).deliver("http://hook/done", CompletedJob()));
    assert(flaky->urls.size() == 3);
    assert(waits.size() == 2);
    assert(waits[0] == std::chrono::milliseconds(2000));
    assert(waits[1] == std::chrono::milliseconds(4000));
    std::cout << "[PASS] Retries back off exponentially." << std::endl;

    // --- Permanent failure: three attempts, no wait after the last ---
    waits.clear();
    auto down = std::make_shared<ScriptedTransport>(std::vector<int>{-1});
    assert(!NotificationDispatcher(down, policy, recordWait).deliver("http://hook/done", CompletedJob()));
    assert(down->urls.size() == 3);
    assert(waits.size() == 2);

    waits.clear();
    auto rejecting = std::make_shared<ScriptedTransport>(std::vector<int>{404});
    assert(!NotificationDispatcher(rejecting, policy, recordWait).deliverPayload("http://hook/x", "{}"));
    assert(rejecting->urls.size() == 3);
    std::cout << "[PASS] Delivery gives up after the attempt budget." << std::endl;

    // --- File names that are not valid UTF-8 are replaced, not fatal ---
    waits.clear();
    domain::Job latin1 = CompletedJob();
    (*latin1.results)[0].name = "Anonymous | b\xe0i_t\xe2p.py";
    auto accepting = std::make_shared<ScriptedTransport>(std::vector<int>{200});
    assert(NotificationDispatcher(accepting, policy, recordWait).deliver("http://hook/done", latin1));
    assert(accepting->urls.size() == 1);
    assert(accepting->bodies[0].find("\xEF\xBF\xBD") != std::string::npos);
    json parsed = json::parse(accepting->bodies[0]);
    assert(parsed["results"][0]["filename"].get<std::string>().rfind("Anonymous | b", 0) == 0);
    std::cout << "[PASS] Invalid UTF-8 in names delivered with replacement characters." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
