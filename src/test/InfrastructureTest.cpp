#include <cassert>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpCallbackTransport.hpp"
#include "infrastructure/HttpEndpoint.hpp"
#include "infrastructure/JsonResultRepository.hpp"
#include "infrastructure/OllamaClient.hpp"
#include "infrastructure/OllamaReviewer.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/QuestionBankClient.hpp"
#include "infrastructure/ResultSerializer.hpp"
#include "infrastructure/UuidGenerator.hpp"

using namespace codegrader;
using namespace codegrader::infrastructure;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

domain::GradedResult Result(const std::string& name, int score, domain::GradeStatus status) {
    domain::GradedResult result;
    result.name = name;
    result.valid = true;
    result.totalScore = score;
    result.status = status;
    result.runtime = "3ms";
    return result;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Infrastructure Test..." << std::endl;

    const fs::path testRoot = "test_project_root_codegrader";
    fs::remove_all(testRoot);
    fs::create_directories(testRoot);

    // --- ConfigLoader ---
    unsetenv("CODEGRADER_AI_MODEL");
    unsetenv("CODEGRADER_OLLAMA_HOST");
    unsetenv("CODEGRADER_QUESTION_BANK_URL");
    unsetenv("CODEGRADER_API_KEY");

    GraderConfig defaults = ConfigLoader::Load(testRoot.string());
    assert(defaults.plagiarismThreshold == 0.85);
    assert(defaults.passScoreThreshold == 50);
    assert(defaults.maxConcurrentReviews == 50);
    assert(defaults.jobTtlSeconds == 3600);
    assert(defaults.webhookMaxAttempts == 3);
    assert(defaults.aiModel == "qwen2.5-coder:7b");

    {
        std::ofstream f(testRoot / "settings.json");
        f << R"({"pass_score_threshold": 60, "ai_model": "codellama:7b", "webhook_backoff_ms": "fast"})";
    }
    GraderConfig partial = ConfigLoader::Load(testRoot.string());
    assert(partial.passScoreThreshold == 60);
    assert(partial.aiModel == "codellama:7b");
    assert(partial.webhookBackoffMs == 1000); // wrong type keeps the default
    assert(partial.questionBankUrl == "http://localhost:8000");

    setenv("CODEGRADER_AI_MODEL", "llama3:8b", 1);
    setenv("CODEGRADER_API_KEY", "secret", 1);
    GraderConfig overridden = ConfigLoader::Load(testRoot.string());
    assert(overridden.aiModel == "llama3:8b");
    assert(overridden.apiKey == "secret");
    unsetenv("CODEGRADER_AI_MODEL");
    unsetenv("CODEGRADER_API_KEY");

    partial.maxConcurrentReviews = 8;
    partial.dataDir = "/tmp/scores";
    ConfigLoader::Save(testRoot.string(), partial);
    GraderConfig reloaded = ConfigLoader::Load(testRoot.string());
    assert(reloaded.maxConcurrentReviews == 8);
    assert(reloaded.dataDir == "/tmp/scores");
    assert(reloaded.passScoreThreshold == 60);

    {
        std::ofstream f(testRoot / "settings.json");
        f << "{ not json";
    }
    assert(ConfigLoader::Load(testRoot.string()).passScoreThreshold == 50);
    std::cout << "[PASS] ConfigLoader defaults, file values and overrides." << std::endl;

    // --- Paths and URLs ---
    assert(PathUtils::ResolveUnder("/data", "scores") == fs::path("/data/scores"));
    assert(PathUtils::ResolveUnder("/data", "/abs/scores") == fs::path("/abs/scores"));
    assert(PathUtils::SanitizeFileComponent("Nguyen Van A/B", 20) == "NguyenVanA_B");
    assert(PathUtils::SanitizeFileComponent("averyveryverylongassignment", 15).size() == 15);

    HttpEndpoint endpoint = HttpEndpoint::Parse("http://bank.local:8000/api/v1");
    assert(endpoint.base == "http://bank.local:8000");
    assert(endpoint.path == "/api/v1");
    assert(HttpEndpoint::Parse("https://hooks.example.com").path == "/");
    bool rejected = false;
    try {
        HttpEndpoint::Parse("not a url");
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    assert(rejected);
    assert(HttpEndpoint::EncodePathSegment("two sum/2") == "two%20sum%2F2");

    const std::string uuid = UuidGenerator::Generate();
    assert(uuid.size() == 36 && uuid[8] == '-' && uuid != UuidGenerator::Generate());
    std::cout << "[PASS] Path, URL and id helpers." << std::endl;

    // --- Question bank client ---
    assert(QuestionBankClient::NormalizeProblemId(" two_sum.py ") == "two_sum");
    assert(QuestionBankClient::NormalizeProblemId("binary_search") == "binary_search");
    assert(QuestionBankClient::NormalizeProblemId(".py").empty());

    auto problem = QuestionBankClient::ParseProblem("two_sum",
        R"({"title": "Two Sum", "rubric": {"logic": 40, "style": 10}, "requirements": "Return indices."})");
    assert(problem && problem->title == "Two Sum");
    assert(problem->rubric && json::parse(*problem->rubric)["logic"] == 40);
    assert(problem->requirements && *problem->requirements == "Return indices.");
    assert(problem->hasCriteria());

    auto bare = QuestionBankClient::ParseProblem("x", R"({"title": "X"})");
    assert(bare && !bare->hasCriteria());
    assert(!QuestionBankClient::ParseProblem("x", "<html>"));

    // Nothing listens on the discard port: lookup degrades to "no rubric"
    QuestionBankClient offlineBank("http://127.0.0.1:9", "key", 1);
    assert(!offlineBank.fetch("two_sum.py"));
    std::cout << "[PASS] Question bank parsing and offline behaviour." << std::endl;

    // --- Ollama helpers ---
    assert(OllamaClient::ExtractResponse(R"({"response": "{\"a\":1}", "done": true})") == std::string("{\"a\":1}"));
    assert(!OllamaClient::ExtractResponse("garbage"));
    auto models = OllamaClient::ExtractModelNames(R"({"models": [{"name": "llama3:8b"}, {"name": "deepseek-coder:6.7b"}]})");
    assert(models.size() == 2);
    assert(OllamaReviewer::SelectModel(models, "qwen2.5-coder:7b") == "deepseek-coder:6.7b");
    assert(OllamaReviewer::SelectModel({"mistral:7b"}, "qwen2.5-coder:7b") == "qwen2.5-coder:7b");
    assert(OllamaReviewer::SelectModel({"qwen2.5:14b", "qwen2.5-coder:1.5b"}, "x") == "qwen2.5-coder:1.5b");

    // Unreachable server keeps the configured model and reports no answer
    OllamaReviewer offlineReviewer("127.0.0.1", 9, "qwen2.5-coder:7b", 1);
    assert(offlineReviewer.getCurrentModel() == "qwen2.5-coder:7b");
    assert(!offlineReviewer.requestReview("hello"));
    std::cout << "[PASS] Reviewer model selection." << std::endl;

    // --- Webhook transport ---
    HttpCallbackTransport transport(1);
    bool threw = false;
    try {
        transport.post("http://127.0.0.1:9/hook", "{}");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Transport failure raises." << std::endl;

    // --- JSON result repository ---
    const fs::path scores = testRoot / "scores";
    {
        JsonResultRepository repository(scores);
        assert(JsonResultRepository::ParseStudentInfo("21520001 - Nguyen An | a.py") ==
               std::make_pair(std::string("21520001"), std::string("Nguyen An")));
        assert(JsonResultRepository::ParseStudentInfo("Binh | b.py") ==
               std::make_pair(std::string("anonymous"), std::string("Binh")));
        assert(JsonResultRepository::ParseStudentInfo("plain.py") ==
               std::make_pair(std::string("anonymous"), std::string("Unknown")));

        auto ids = repository.saveBatch({Result("21520001 - Nguyen An | a.py", 70, domain::GradeStatus::Pass),
                                         Result("21520002 - Tran Binh | a.py", 95, domain::GradeStatus::Pass),
                                         Result("21520003 - Le Chi | a.py", 20, domain::GradeStatus::Fail)},
                                        std::string("HW1"));
        assert((ids == std::vector<long>{1, 2, 3}));
        repository.saveBatch({Result("21520001 - Nguyen An | b.py", 40, domain::GradeStatus::Flag)}, std::nullopt);

        auto ranking = repository.assignmentScores("HW1");
        assert(ranking.size() == 3);
        assert(ranking[0].totalScore == 95 && ranking[0].studentName == "Tran Binh");
        assert(ranking[2].totalScore == 20);

        auto student = repository.studentScores("21520001");
        assert(student.size() == 2);

        auto hw1 = repository.stats(std::string("HW1"));
        assert(hw1.totalSubmissions == 3);
        assert(hw1.avgScore == 61.7);
        assert(hw1.maxScore == 95 && hw1.minScore == 20);
        assert(hw1.passed == 2 && hw1.failed == 1 && hw1.flagged == 0);

        auto all = repository.stats(std::nullopt);
        assert(all.totalSubmissions == 4 && all.flagged == 1);
        assert(repository.stats(std::string("none")).totalSubmissions == 0);
    }

    // Files land in a dated folder with readable names and no leftovers
    size_t files = 0;
    std::set<std::string> names;
    for (const auto& entry : fs::recursive_directory_iterator(scores)) {
        if (!entry.is_regular_file()) continue;
        assert(entry.path().extension() == ".json");
        names.insert(entry.path().filename().string());
        ++files;
    }
    assert(files == 4);
    assert(names.count("001_NguyenAn_HW1.json"));
    assert(names.count("004_NguyenAn_general.json"));

    // A reopened repository continues the numbering
    {
        JsonResultRepository reopened(scores);
        auto ids = reopened.saveBatch({Result("Dao | c.py", 55, domain::GradeStatus::Pass)}, std::nullopt);
        assert(ids.size() == 1 && ids[0] == 5);
        assert(reopened.studentScores("anonymous").size() == 1);
    }
    std::cout << "[PASS] JSON repository writes, ranks and aggregates." << std::endl;

    // --- A record that cannot be written does not sink the rest of the batch ---
    {
        const fs::path partial = testRoot / "partial";
        JsonResultRepository repository(partial);

        // A directory squatting on the second record's file name makes its rename fail
        std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local = {};
        localtime_r(&tt, &local);
        char today[16];
        std::strftime(today, sizeof(today), "%Y-%m-%d", &local);
        fs::create_directories(partial / today / "002_Binh_HW2.json");

        auto ids = repository.saveBatch({Result("1 - An | a.py", 60, domain::GradeStatus::Pass),
                                         Result("2 - Binh | a.py", 70, domain::GradeStatus::Pass),
                                         Result("3 - Chi | a.py", 80, domain::GradeStatus::Pass)},
                                        std::string("HW2"));
        assert((ids == std::vector<long>{1, 2}));
        assert(fs::is_regular_file(partial / today / "001_An_HW2.json"));
        assert(fs::is_regular_file(partial / today / "002_Chi_HW2.json"));
        assert(repository.assignmentScores("HW2").size() == 2);

        // Names that are not valid UTF-8 are stored with replacement characters
        auto latin1 = repository.saveBatch({Result("Anonymous | b\xe0i_t\xe2p.py", 50, domain::GradeStatus::Pass)},
                                           std::nullopt);
        assert(latin1.size() == 1 && latin1[0] == 3);
        auto stored = repository.studentScores("anonymous");
        assert(stored.size() == 1);
        assert(stored[0].filename.find("\xEF\xBF\xBD") != std::string::npos);
    }
    std::cout << "[PASS] Partial batch failures and non-UTF-8 names." << std::endl;

    // --- Serializer ---
    domain::Job job;
    job.id = "abc";
    job.status = domain::JobStatus::Processing;
    job.studentName = "Anonymous";
    job.createdAt = std::chrono::system_clock::time_point(std::chrono::seconds(0));
    json view = ResultSerializer::ToJson(job);
    assert(view["job_id"] == "abc");
    assert(view["status"] == "processing");
    assert(view["created_at"] == "1970-01-01T00:00:00Z");
    assert(!view.contains("results") || view["results"].is_null());

    domain::GradedResult pending = Result("x.py", 0, domain::GradeStatus::Pending);
    pending.totalScore.reset();
    json pendingView = ResultSerializer::ToJson(pending);
    assert(pendingView["total_score"].is_null());
    assert(pendingView["status"] == "PENDING");
    std::cout << "[PASS] JSON views." << std::endl;

    fs::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
