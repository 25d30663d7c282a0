#include <cassert>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <thread>

#include "application/WorkerPool.hpp"
#include "infrastructure/AudioUtils.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FfmpegMediaExtractor.hpp"
#include "infrastructure/FileArtifactStore.hpp"
#include "infrastructure/FileCreditLedger.hpp"
#include "infrastructure/JobLogStore.hpp"
#include "infrastructure/JsonPlanDirectory.hpp"
#include "infrastructure/LruCache.hpp"
#include "infrastructure/MarkdownText.hpp"
#include "infrastructure/OllamaNotesGenerator.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/RateLimiter.hpp"
#include "test/TestMocks.hpp"

using namespace timenotes;
using namespace timenotes::infrastructure;
namespace fs = std::filesystem;

static void TestLruCache() {
    std::cout << "[Test] LRU cache evicts the least recently used entry..." << std::endl;
    LruCache<std::string, int> cache(2);
    cache.Put("a", 1);
    cache.Put("b", 2);
    assert(cache.Get("a") == 1);   // a is now most recent
    cache.Put("c", 3);             // evicts b
    assert(!cache.Contains("b"));
    assert(cache.Contains("a") && cache.Contains("c"));
    assert(cache.Size() == 2);
    cache.Put("a", 10);
    assert(cache.Get("a") == 10);
    assert(cache.Size() == 2);
    assert(!cache.Get("missing").has_value());

    LruCache<int, int> tiny(0);
    assert(tiny.Capacity() == 1);
    std::cout << "[PASS]" << std::endl;
}

static void TestRateLimiter() {
    std::cout << "[Test] rate limiter spaces consecutive calls..." << std::endl;
    RateLimiter limiter(std::chrono::milliseconds(50));
    auto start = std::chrono::steady_clock::now();
    limiter.Acquire();
    limiter.Acquire();
    limiter.Acquire();
    auto elapsed = std::chrono::steady_clock::now() - start;
    assert(elapsed >= std::chrono::milliseconds(100));

    RateLimiter unlimited(std::chrono::milliseconds(0));
    start = std::chrono::steady_clock::now();
    for (int i = 0; i < 10; ++i) unlimited.Acquire();
    assert(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(50));
    std::cout << "[PASS]" << std::endl;
}

static void TestMarkdownText() {
    std::cout << "[Test] markdown to plain text..." << std::endl;
    std::string plain = MarkdownText::ToPlainText(
        "# Title\n\nSome **bold** and *italic* and `code`.\n\n\n\n- item one\n* item two\n---\n"
        "See [the docs](http://example.com).\n```\nint x;\n```\nEnd __strong__ _em_.");
    assert(plain.find('#') == std::string::npos);
    assert(plain.rfind("Title", 0) == 0);
    assert(plain.find("Some bold and italic and code.") != std::string::npos);
    assert(plain.find("\xE2\x80\xA2 item one") != std::string::npos);
    assert(plain.find("\xE2\x80\xA2 item two") != std::string::npos);
    assert(plain.find("See the docs.") != std::string::npos);
    assert(plain.find("int x;") == std::string::npos);
    assert(plain.find("End strong em.") != std::string::npos);
    assert(plain.find("\n\n\n") == std::string::npos);
    std::cout << "[PASS]" << std::endl;
}

static void TestPathUtils() {
    std::cout << "[Test] file token validation..." << std::endl;
    assert(PathUtils::IsSafeFileToken("0f8fad5b-d9cb-469f-a165-70867728950e"));
    assert(PathUtils::IsSafeFileToken("job_1"));
    assert(!PathUtils::IsSafeFileToken(""));
    assert(!PathUtils::IsSafeFileToken("../etc/passwd"));
    assert(!PathUtils::IsSafeFileToken("a b"));
    assert(!PathUtils::IsSafeFileToken(std::string(129, 'a')));
    std::cout << "[PASS]" << std::endl;
}

static void TestFileArtifactStore() {
    std::cout << "[Test] file artifact store..." << std::endl;
    fs::path dir = test::MakeScratchDir("timenotes_artifacts");
    FileArtifactStore store(dir / "outputs");
    const std::string id = "job-123";

    assert(!store.hasAny(id));
    assert(store.write(id, domain::ArtifactKind::Srt, "1\n00:00:00,000 --> 00:00:01,000\nA\n\n"));
    assert(store.exists(id, domain::ArtifactKind::Srt));
    assert(!store.exists(id, domain::ArtifactKind::Vtt));
    assert(store.hasAny(id));
    assert(fs::exists(dir / "outputs" / "job-123_notes.srt"));
    assert(store.read(id, domain::ArtifactKind::Srt)->rfind("1\n", 0) == 0);
    assert(!store.read(id, domain::ArtifactKind::Vtt).has_value());

    assert(!store.write("../escape", domain::ArtifactKind::NotesMarkdown, "x"));
    assert(!store.hasAny("../escape"));

    fs::remove_all(dir);
    std::cout << "[PASS]" << std::endl;
}

static void TestFileCreditLedger() {
    std::cout << "[Test] file credit ledger..." << std::endl;
    fs::path dir = test::MakeScratchDir("timenotes_ledger");
    fs::path file = dir / "credits.json";
    {
        FileCreditLedger ledger(file, 2);
        auto check = ledger.check("dana", domain::ActionType::VideoUpload);
        assert(check.allowed && check.currentCredits == 2 && check.creditsNeeded == 1);
        assert(!fs::exists(file));

        assert(ledger.deduct("dana", domain::ActionType::VideoUpload).allowed);
        assert(ledger.deduct("dana", domain::ActionType::PdfUpload).currentCredits == 0);
        auto refused = ledger.deduct("dana", domain::ActionType::VideoUpload);
        assert(!refused.allowed);
        assert(!ledger.check("dana", domain::ActionType::VideoUpload).allowed);

        auto anonymous = ledger.deduct("", domain::ActionType::VideoUpload);
        assert(anonymous.allowed && anonymous.creditsNeeded == 0);
    }
    {
        FileCreditLedger reopened(file, 2);
        assert(reopened.Balance("dana") == 0);
        reopened.Grant("dana", 5);
        assert(reopened.Balance("dana") == 5);
        assert(reopened.Balance("newcomer") == 2);
    }

    test::WriteFile(file, "{ not json");
    FileCreditLedger corrupt(file);
    bool threw = false;
    try {
        corrupt.check("dana", domain::ActionType::VideoUpload);
    } catch (const domain::LedgerError&) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(dir);
    std::cout << "[PASS]" << std::endl;
}

static void TestJsonPlanDirectory() {
    std::cout << "[Test] plan directory..." << std::endl;
    fs::path dir = test::MakeScratchDir("timenotes_plans");
    fs::path file = test::WriteFile(dir / "plans.json",
        R"({"erin": "researcher", "frank": "platinum", "gail": 3})");
    JsonPlanDirectory plans(file);
    assert(plans.planFor("erin") == domain::PlanType::Researcher);
    assert(plans.planFor("frank") == domain::PlanType::Free);
    assert(plans.planFor("gail") == domain::PlanType::Free);
    assert(plans.planFor("nobody") == domain::PlanType::Free);

    JsonPlanDirectory missing(dir / "absent.json");
    assert(missing.planFor("erin") == domain::PlanType::Free);

    auto check = domain::CheckDuration(domain::PlanType::Researcher, 90 * 60.0);
    assert(check.valid && check.allowedMinutes == 120);
    check = domain::CheckDuration(domain::PlanType::Expert, 400 * 60.0);
    assert(!check.valid);
    assert(check.message.find("Consider upgrading") == std::string::npos);

    fs::remove_all(dir);
    std::cout << "[PASS]" << std::endl;
}

static void TestConfigLoader() {
    std::cout << "[Test] config loading..." << std::endl;
    fs::path dir = test::MakeScratchDir("timenotes_config");

    PipelineConfig defaults = ConfigLoader::Load(dir / "missing.json");
    assert(defaults.outputDir == dir / "outputs");
    assert(defaults.jobsLog == dir / "jobs.ndjson");
    assert(defaults.cleanupTempFiles);

    fs::path settings = test::WriteFile(dir / "settings.json", R"({
        "output_dir": "out",
        "max_workers": 0,
        "ollama_model": "mistral",
        "ollama_port": 9999,
        "cleanup_temp_files": false,
        "notes_min_interval_seconds": 2.5,
        "whisper_model_path": "/opt/models/ggml-small.bin"
    })");
    PipelineConfig config = ConfigLoader::Load(settings);
    assert(config.outputDir == dir / "out");
    assert(config.maxWorkers == 2);
    assert(config.ollamaModel == "mistral");
    assert(config.ollamaPort == 9999);
    assert(!config.cleanupTempFiles);
    assert(config.notesMinIntervalSeconds == 2.5);
    assert(config.whisperModelPath == fs::path("/opt/models/ggml-small.bin"));

    test::WriteFile(settings, "{ broken");
    PipelineConfig fallback = ConfigLoader::Load(settings);
    assert(fallback.outputDir == dir / "outputs");

    setenv("TIMENOTES_MAX_WORKERS", "5", 1);
    setenv("OLLAMA_MODEL", "phi3", 1);
    PipelineConfig env = ConfigLoader::Load(dir / "missing.json");
    assert(env.maxWorkers == 5);
    assert(env.ollamaModel == "phi3");
    setenv("TIMENOTES_MAX_WORKERS", "zero", 1);
    env = ConfigLoader::Load(dir / "missing.json");
    assert(env.maxWorkers == 2);
    unsetenv("TIMENOTES_MAX_WORKERS");
    unsetenv("OLLAMA_MODEL");

    fs::remove_all(dir);
    std::cout << "[PASS]" << std::endl;
}

static void TestJobLogStore() {
    std::cout << "[Test] job log replay and compaction..." << std::endl;
    fs::path dir = test::MakeScratchDir("timenotes_log");
    fs::path log = dir / "jobs.ndjson";

    domain::Job job;
    job.id = "job-a";
    job.owner = std::string("hana");
    job.actionType = domain::ActionType::VideoUpload;
    job.progress = "Job created...";
    job.createdAt = std::chrono::system_clock::now();
    job.updatedAt = job.createdAt;

    {
        JobLogStore store(log);
        assert(store.loadAll().empty());
        store.append(job);
        job.status = domain::JobStatus::Completed;
        job.creditsDeducted = true;
        job.result = {{"has_notes", true}};
        store.append(job);

        domain::Job other;
        other.id = "job-b";
        other.status = domain::JobStatus::Error;
        other.error = std::string("engine crashed");
        store.append(other);
    }
    {
        std::ofstream out(log, std::ios::app);
        out << "this is not json\n";
    }

    JobLogStore store(log);
    auto jobs = store.loadAll();
    assert(jobs.size() == 2);
    assert(jobs[0].id == "job-a");
    assert(jobs[0].status == domain::JobStatus::Completed);
    assert(jobs[0].creditsDeducted);
    assert(jobs[0].owner && *jobs[0].owner == "hana");
    assert(jobs[0].result["has_notes"] == true);
    assert(jobs[1].error && *jobs[1].error == "engine crashed");
    assert(!jobs[1].owner.has_value());

    store.compact(jobs);
    assert(store.loadAll().size() == 2);

    auto tp = JobLogStore::ParseTimestamp("2024-03-01T12:34:56Z");
    assert(JobLogStore::FormatTimestamp(tp) == "2024-03-01T12:34:56Z");

    fs::remove_all(dir);
    std::cout << "[PASS]" << std::endl;
}

static void TestWorkerPool() {
    std::cout << "[Test] worker pool runs tasks and propagates exceptions..." << std::endl;
    application::WorkerPool pool(3);
    assert(pool.WorkerCount() == 3);

    std::vector<std::future<int>> results;
    for (int i = 0; i < 20; ++i) {
        results.push_back(pool.Submit([i]() { return i * i; }));
    }
    int sum = 0;
    for (auto& f : results) sum += f.get();
    assert(sum == 2470);

    auto failing = pool.Submit([]() -> int { throw std::runtime_error("boom"); });
    bool threw = false;
    try {
        failing.get();
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "boom";
    }
    assert(threw);

    pool.Shutdown();
    bool rejected = false;
    try {
        pool.Submit([]() { return 1; });
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);

    application::WorkerPool single(0);
    assert(single.WorkerCount() == 1);
    std::cout << "[PASS]" << std::endl;
}

static void TestMediaHelpers() {
    std::cout << "[Test] ffprobe parsing and command helpers..." << std::endl;
    auto d = FfmpegMediaExtractor::ParseProbeOutput(R"({"format": {"duration": "125.500000"}})");
    assert(d && *d == 125.5);
    assert(!FfmpegMediaExtractor::ParseProbeOutput(R"({"format": {}})").has_value());
    assert(!FfmpegMediaExtractor::ParseProbeOutput("garbage").has_value());

    assert(AudioUtils::ShellQuote("it's") == "'it'\\''s'");
    CommandResult echo = AudioUtils::RunCommand({"echo", "hello world"}, 5);
    assert(echo.exitCode == 0);
    assert(echo.output == "hello world\n");
    assert(!echo.timedOut);
    std::cout << "[PASS]" << std::endl;
}

static void TestContentSplitting() {
    std::cout << "[Test] long inputs split at sentence boundaries..." << std::endl;
    auto one = OllamaNotesGenerator::SplitContent("Short text. Still short.", 100);
    assert(one.size() == 1);

    std::string text;
    for (int i = 0; i < 10; ++i) {
        text += "Sentence number " + std::to_string(i) + " is here. ";
    }
    auto chunks = OllamaNotesGenerator::SplitContent(text, 80);
    assert(chunks.size() > 1);
    for (const auto& chunk : chunks) {
        assert(chunk.size() <= 80);
        assert(chunk.back() == '.');
    }
    std::cout << "[PASS]" << std::endl;
}

int main() {
    std::cout << "[Test] Starting infrastructure tests..." << std::endl;
    TestLruCache();
    TestRateLimiter();
    TestMarkdownText();
    TestPathUtils();
    TestFileArtifactStore();
    TestFileCreditLedger();
    TestJsonPlanDirectory();
    TestConfigLoader();
    TestJobLogStore();
    TestWorkerPool();
    TestMediaHelpers();
    TestContentSplitting();
    std::cout << "[Test] All infrastructure tests passed." << std::endl;
    return 0;
}
