#include <cassert>
#include <iostream>
#include <string>
#include <set>
#include <thread>
#include <vector>

#include "application/JobRegistry.hpp"
#include "test/TestMocks.hpp"

using namespace timenotes;
using application::JobRegistry;
using domain::JobStatus;

static void TestCreateThenUpdate() {
    std::cout << "[Test] create/get/update_status..." << std::endl;
    auto repo = std::make_shared<test::InMemoryJobRepository>();
    auto artifacts = std::make_shared<test::InMemoryArtifactStore>();
    JobRegistry registry(repo, artifacts);

    std::string id = registry.Create(std::string("alice"), domain::ActionType::VideoUpload);
    auto job = registry.Get(id);
    assert(job.has_value());
    assert(job->status == JobStatus::Created);
    assert(!job->creditsDeducted);
    assert(job->owner && *job->owner == "alice");

    assert(registry.UpdateStatus(id, JobStatus::Processing, std::string("Extracting audio...")));
    job = registry.Get(id);
    assert(job->status == JobStatus::Processing);
    assert(job->progress == "Extracting audio...");
    std::cout << "[PASS]" << std::endl;
}

static void TestStatusNeverRegresses() {
    std::cout << "[Test] status is monotonic and terminal states are final..." << std::endl;
    auto repo = std::make_shared<test::InMemoryJobRepository>();
    JobRegistry registry(repo, nullptr);

    std::string id = registry.Create();
    assert(registry.UpdateStatus(id, JobStatus::Processing, std::string("working")));
    assert(!registry.UpdateStatus(id, JobStatus::Created, std::string("back")));
    assert(registry.Complete(id, {{"has_notes", true}, {"credits_deducted", true}}));
    assert(!registry.Fail(id, "late failure"));
    assert(!registry.UpdateStatus(id, JobStatus::Processing, std::string("again")));

    auto job = registry.Get(id);
    assert(job->status == JobStatus::Completed);
    assert(job->creditsDeducted);
    assert(job->result["has_notes"] == true);
    assert(job->progress == "Processing completed successfully!");
    std::cout << "[PASS]" << std::endl;
}

static void TestFailClearsCharge() {
    std::cout << "[Test] failed jobs are never marked charged..." << std::endl;
    JobRegistry registry(std::make_shared<test::InMemoryJobRepository>(), nullptr);

    std::string id = registry.Create(std::string("bob"));
    registry.UpdateStatus(id, JobStatus::Processing, std::string("Transcribing audio..."));
    assert(registry.Fail(id, "engine crashed"));
    assert(!registry.MarkCreditsDeducted(id, true));

    auto job = registry.Get(id);
    assert(job->status == JobStatus::Error);
    assert(job->error && *job->error == "engine crashed");
    assert(!job->creditsDeducted);

    auto status = JobRegistry::ToStatusJson(*job);
    assert(status["status"] == "error");
    assert(status["error"] == "engine crashed");
    assert(status["credits_deducted"] == false);
    std::cout << "[PASS]" << std::endl;
}

static void TestUnknownId() {
    std::cout << "[Test] unknown id without artifacts is not found..." << std::endl;
    JobRegistry registry(std::make_shared<test::InMemoryJobRepository>(),
                         std::make_shared<test::InMemoryArtifactStore>());
    assert(!registry.Get("does-not-exist").has_value());
    assert(!registry.Exists("does-not-exist"));
    assert(!registry.UpdateProgress("does-not-exist", "x"));
    assert(registry.Size() == 0);
    std::cout << "[PASS]" << std::endl;
}

static void TestReplayAfterRestart() {
    std::cout << "[Test] jobs survive a registry restart..." << std::endl;
    auto repo = std::make_shared<test::InMemoryJobRepository>();
    std::string done;
    std::string running;
    {
        JobRegistry registry(repo, nullptr);
        done = registry.Create(std::string("carol"), domain::ActionType::PdfUpload);
        registry.UpdateStatus(done, JobStatus::Processing, std::string("Saving results..."));
        registry.Complete(done, {{"has_notes", true}, {"credits_deducted", true}});
        running = registry.Create(std::string("carol"));
        registry.UpdateStatus(running, JobStatus::Processing, std::string("Transcribing audio..."));
    }
    assert(repo->LogSize() == 5);

    JobRegistry restarted(repo, nullptr);
    assert(restarted.Size() == 2);
    assert(repo->LogSize() == 2);

    auto job = restarted.Get(done);
    assert(job && job->status == JobStatus::Completed && job->creditsDeducted);
    assert(job->actionType && *job->actionType == domain::ActionType::PdfUpload);
    job = restarted.Get(running);
    assert(job && job->status == JobStatus::Processing);
    assert(job->progress == "Transcribing audio...");
    assert(restarted.ListForOwner("carol").size() == 2);
    std::cout << "[PASS]" << std::endl;
}

static void TestLogIsCompactedWhileRunning() {
    std::cout << "[Test] a long-running registry keeps its job log bounded..." << std::endl;
    auto repo = std::make_shared<test::InMemoryJobRepository>();
    JobRegistry registry(repo, nullptr);
    std::string id = registry.Create(std::string("erin"));
    registry.UpdateStatus(id, JobStatus::Processing, std::string("Transcribing audio..."));
    for (int i = 0; i < 500; ++i) {
        assert(registry.UpdateProgress(id, "Chunk " + std::to_string(i)));
    }

    assert(repo->compactions >= 1);
    assert(repo->LogSize() <= JobRegistry::kMinCompactionAppends);

    JobRegistry restarted(repo, nullptr);
    auto job = restarted.Get(id);
    assert(job && job->status == JobStatus::Processing);
    assert(job->progress == "Chunk 499");
    std::cout << "[PASS]" << std::endl;
}

static void TestUnreadableStorageStartsEmpty() {
    std::cout << "[Test] unreadable storage yields an empty registry..." << std::endl;
    auto repo = std::make_shared<test::InMemoryJobRepository>();
    repo->failLoad = true;
    JobRegistry registry(repo, nullptr);
    assert(registry.Size() == 0);
    std::string id = registry.Create();
    assert(registry.Exists(id));
    std::cout << "[PASS]" << std::endl;
}

static void TestRecoveryFromArtifacts() {
    std::cout << "[Test] reconciliation rebuilds lost jobs from artifacts..." << std::endl;
    auto repo = std::make_shared<test::InMemoryJobRepository>();
    auto artifacts = std::make_shared<test::InMemoryArtifactStore>();
    const std::string lost = "0f8fad5b-d9cb-469f-a165-70867728950e";
    artifacts->write(lost, domain::ArtifactKind::NotesMarkdown, "## Title\nBody text.");

    JobRegistry registry(repo, artifacts);
    assert(registry.Size() == 0);
    assert(registry.Exists(lost));

    auto job = registry.Get(lost);
    assert(job.has_value());
    assert(job->status == JobStatus::Completed);
    assert(job->creditsDeducted);
    assert(job->recovered);
    assert(!job->owner.has_value());
    assert(job->result["has_notes"] == true);
    assert(job->result["has_timestamped_notes"] == false);
    assert(JobRegistry::ToStatusJson(*job)["recovered"] == true);

    // The recovered entry is persisted like any other.
    JobRegistry restarted(repo, nullptr);
    auto replayed = restarted.Get(lost);
    assert(replayed && replayed->recovered);
    std::cout << "[PASS]" << std::endl;
}

static void TestConcurrentUpdates() {
    std::cout << "[Test] concurrent creates and updates..." << std::endl;
    auto repo = std::make_shared<test::InMemoryJobRepository>();
    JobRegistry registry(repo, nullptr);

    const int kThreads = 8;
    const int kJobsPerThread = 25;
    std::vector<std::thread> threads;
    std::vector<std::vector<std::string>> ids(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&registry, &ids, t]() {
            for (int i = 0; i < kJobsPerThread; ++i) {
                std::string id = registry.Create(std::string("user") + std::to_string(t));
                registry.UpdateStatus(id, JobStatus::Processing, std::string("working"));
                registry.UpdateProgress(id, "step " + std::to_string(i));
                registry.Complete(id, {{"credits_deducted", false}});
                ids[t].push_back(id);
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<std::string> unique;
    for (const auto& list : ids) unique.insert(list.begin(), list.end());
    assert(unique.size() == static_cast<size_t>(kThreads * kJobsPerThread));
    assert(registry.Size() == unique.size());
    for (const auto& id : unique) {
        assert(registry.Get(id)->status == JobStatus::Completed);
    }
    std::cout << "[PASS]" << std::endl;
}

static void TestGeneratedIdsAreFileSafe() {
    std::cout << "[Test] generated ids look like v4 UUIDs..." << std::endl;
    std::string id = JobRegistry::GenerateJobId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(JobRegistry::GenerateJobId() != id);
    std::cout << "[PASS]" << std::endl;
}

int main() {
    std::cout << "[Test] Starting JobRegistry tests..." << std::endl;
    TestCreateThenUpdate();
    TestStatusNeverRegresses();
    TestFailClearsCharge();
    TestUnknownId();
    TestReplayAfterRestart();
    TestLogIsCompactedWhileRunning();
    TestUnreadableStorageStartsEmpty();
    TestRecoveryFromArtifacts();
    TestConcurrentUpdates();
    TestGeneratedIdsAreFileSafe();
    std::cout << "[Test] All JobRegistry tests passed." << std::endl;
    return 0;
}
