/**
 * @file CodeGraderApp.cpp
 * @brief Implementation of the CodeGraderApp class.
 */

#include "app/CodeGraderApp.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "application/ReviewAdapter.hpp"
#include "application/StaticAnalyzer.hpp"
#include "application/SubmissionGrader.hpp"
#include "infrastructure/HttpCallbackTransport.hpp"
#include "infrastructure/JsonResultRepository.hpp"
#include "infrastructure/OllamaReviewer.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PythonParser.hpp"
#include "infrastructure/QuestionBankClient.hpp"
#include "infrastructure/ResultSerializer.hpp"

namespace codegrader::app {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<std::string> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

CodeGraderApp::~CodeGraderApp() {
    Shutdown();
}

std::string CodeGraderApp::Usage() {
    return "Usage: codegrader [options] <file.py>...\n"
           "  --topic NAME         problem key for the rubric lookup\n"
           "  --student NAME       student label (default: Anonymous)\n"
           "  --assignment CODE    assignment code stored with the results\n"
           "  --callback URL       webhook notified when the job completes\n"
           "  --config DIR         directory containing settings.json\n"
           "  --stats              print stored score statistics and exit\n"
           "  --help               show this message\n";
}

std::optional<CommandLineOptions> CodeGraderApp::ParseArguments(const std::vector<std::string>& args) {
    CommandLineOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto takeValue = [&](std::string& out) {
            if (i + 1 >= args.size()) {
                std::cerr << "[CodeGraderApp] Missing value for " << arg << std::endl;
                return false;
            }
            out = args[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--stats") {
            options.statsOnly = true;
        } else if (arg == "--topic") {
            if (!takeValue(value)) return std::nullopt;
            options.topic = value;
        } else if (arg == "--student") {
            if (!takeValue(value)) return std::nullopt;
            options.studentName = value;
        } else if (arg == "--assignment") {
            if (!takeValue(value)) return std::nullopt;
            options.assignmentCode = value;
        } else if (arg == "--callback") {
            if (!takeValue(value)) return std::nullopt;
            options.callbackUrl = value;
        } else if (arg == "--config") {
            if (!takeValue(value)) return std::nullopt;
            options.configDir = value;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "[CodeGraderApp] Unknown option: " << arg << std::endl;
            return std::nullopt;
        } else {
            options.files.push_back(arg);
        }
    }
    return options;
}

bool CodeGraderApp::Init(const std::optional<std::string>& configDir) {
    const fs::path configRoot = configDir ? fs::path(*configDir) : infrastructure::PathUtils::GetConfigHome();
    m_config = infrastructure::ConfigLoader::Load(configRoot.string());

    if (m_config.maxConcurrentReviews <= 0 || m_config.backgroundWorkers <= 0 || m_config.jobTtlSeconds <= 0 ||
        m_config.reapIntervalSeconds <= 0) {
        std::cerr << "[CodeGraderApp] Invalid settings in " << (configRoot / "settings.json")
                  << ": limits, TTL and reap interval must be positive" << std::endl;
        return false;
    }

    // Dependency Injection / Composition Root
    auto parser = std::make_shared<infrastructure::PythonParser>();
    auto analyzer = std::make_shared<application::StaticAnalyzer>(parser);
    auto rubrics = std::make_shared<infrastructure::QuestionBankClient>(
        m_config.questionBankUrl, m_config.apiKey, m_config.rubricTimeoutSeconds);
    auto reviewer = std::make_shared<infrastructure::OllamaReviewer>(
        m_config.ollamaHost, m_config.ollamaPort, m_config.aiModel, m_config.reviewerTimeoutSeconds);
    auto reviews = std::make_shared<application::ReviewAdapter>(reviewer);
    auto grader = std::make_shared<application::SubmissionGrader>(
        analyzer, rubrics, reviews, m_config.passScoreThreshold);

    application::DeliveryPolicy policy;
    policy.maxAttempts = m_config.webhookMaxAttempts;
    policy.backoffUnit = std::chrono::milliseconds(m_config.webhookBackoffMs);
    auto notifier = std::make_shared<application::NotificationDispatcher>(
        std::make_shared<infrastructure::HttpCallbackTransport>(m_config.webhookTimeoutSeconds), policy);

    const fs::path dataDir = infrastructure::PathUtils::ResolveUnder(
        infrastructure::PathUtils::GetDataHome(), m_config.dataDir);

    m_services.jobStore = std::make_unique<application::JobStore>(
        std::chrono::seconds(m_config.jobTtlSeconds));
    m_services.taskManager = std::make_shared<application::AsyncTaskManager>(
        static_cast<size_t>(m_config.backgroundWorkers));
    m_services.repository = std::make_shared<infrastructure::JsonResultRepository>(dataDir);
    m_services.orchestrator = std::make_unique<application::GradingOrchestrator>(
        grader,
        *m_services.jobStore,
        std::make_shared<application::ConcurrencyLimiter>(static_cast<size_t>(m_config.maxConcurrentReviews)),
        m_services.taskManager,
        m_services.repository,
        notifier,
        application::SimilarityDetector(m_config.plagiarismThreshold));
    m_services.reaper = std::make_unique<application::JobReaper>(
        *m_services.jobStore, std::chrono::seconds(m_config.reapIntervalSeconds));
    m_services.reaper->start();

    m_initialized = true;
    std::cout << "[CodeGraderApp] Ready (reviewer model: " << reviewer->getCurrentModel() << ")" << std::endl;
    return true;
}

int CodeGraderApp::Run(const CommandLineOptions& options) {
    if (!m_initialized) {
        std::cerr << "[CodeGraderApp] Run called before Init" << std::endl;
        return 1;
    }
    if (options.statsOnly) {
        return printStats(options.assignmentCode);
    }

    application::SubmissionRequest request;
    request.topic = options.topic;
    request.studentName = options.studentName;
    request.assignmentCode = options.assignmentCode;
    request.callbackUrl = options.callbackUrl;

    for (const auto& file : options.files) {
        fs::path path(file);
        auto text = ReadFile(path);
        if (!text) {
            std::cerr << "[CodeGraderApp] Skipping unreadable file: " << file << std::endl;
            continue;
        }
        if (path.extension() != ".py") {
            std::cerr << "[CodeGraderApp] Skipping non-Python file: " << file << std::endl;
            continue;
        }
        request.units.push_back(domain::SourceUnit{path.filename().string(), std::move(*text)});
    }

    const std::string jobId = m_services.orchestrator->submit(std::move(request));
    m_services.orchestrator->drain();

    auto job = m_services.orchestrator->getJob(jobId);
    if (!job) {
        std::cerr << "[CodeGraderApp] Job " << jobId << " disappeared before completion" << std::endl;
        return 1;
    }
    std::cout << infrastructure::ResultSerializer::ToJson(*job).dump(2, ' ', false, json::error_handler_t::replace)
              << std::endl;
    if (m_services.taskManager->FailedTaskCount() > 0) {
        std::cerr << "[CodeGraderApp] " << m_services.taskManager->FailedTaskCount()
                  << " background task(s) failed; see log above" << std::endl;
    }
    return job->status == domain::JobStatus::Completed ? 0 : 2;
}

int CodeGraderApp::printStats(const std::optional<std::string>& assignmentCode) {
    domain::ScoreStats stats = m_services.repository->stats(assignmentCode);
    json j = {
        {"total_submissions", stats.totalSubmissions},
        {"avg_score", stats.avgScore},
        {"max_score", stats.maxScore},
        {"min_score", stats.minScore},
        {"passed", stats.passed},
        {"failed", stats.failed},
        {"flagged", stats.flagged}
    };
    if (assignmentCode) {
        json ranking = json::array();
        for (const auto& record : m_services.repository->assignmentScores(*assignmentCode)) {
            ranking.push_back({
                {"id", record.id},
                {"student_id", record.studentId},
                {"student_name", record.studentName},
                {"filename", record.filename},
                {"total_score", record.totalScore},
                {"status", record.status},
                {"submitted_at", record.submittedAt}
            });
        }
        j["assignment_code"] = *assignmentCode;
        j["ranking"] = ranking;
    }
    std::cout << j.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
    return 0;
}

void CodeGraderApp::Shutdown() {
    if (!m_initialized) return;
    m_initialized = false;

    if (m_services.reaper) m_services.reaper->stop();
    if (m_services.taskManager) m_services.taskManager->Shutdown();
    std::cout << "[CodeGraderApp] Shutdown complete." << std::endl;
}

} // namespace codegrader::app
