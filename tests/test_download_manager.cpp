#include <catch2/catch.hpp>

#include "FakeTransferEngine.hpp"
#include "TestHelpers.hpp"

#include "core/EventBus.hpp"
#include "core/downloader/DownloadManager.hpp"
#include "utils/FileUtils.hpp"
#include "utils/StringUtils.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

using namespace hauler::core;
using namespace hauler::core::downloader;
using hauler::test::FakeTransferEngine;
using hauler::test::TempDir;

namespace {

class RecordingPipeline : public ArtifactPipeline {
public:
    struct Call {
        std::filesystem::path path;
        std::string downloadId;
        std::string content;
    };

    MaybeError handleArtifact(const std::filesystem::path& path,
                              const DownloadSnapshot& download,
                              const UnpackProgressFn& reportProgress) override {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_calls.push_back({path, download.id, hauler::utils::FileUtils::readFile(path).value_or("")});
        }
        reportProgress(0.5);
        reportProgress(0.25);
        reportProgress(1.0);

        if (!failWith.empty()) {
            return DownloadError::pipelineFailed(failWith);
        }
        return std::nullopt;
    }

    std::vector<Call> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    std::string failWith;

private:
    mutable std::mutex m_mutex;
    std::vector<Call> m_calls;
};

class RecordingFeedback : public FailureFeedback {
public:
    void operationFailed(const std::string& downloadId, const DownloadError& error) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failures.emplace_back(downloadId, error);
    }

    std::vector<std::pair<std::string, DownloadError>> failures() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_failures;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, DownloadError>> m_failures;
};

struct ManagerFixture {
    TempDir work{"hauler_work_"};
    TempDir scratch{"hauler_scratch_"};

    EventBus events;
    std::shared_ptr<FakeTransferEngine> engine = std::make_shared<FakeTransferEngine>();
    std::shared_ptr<RecordingPipeline> pipeline = std::make_shared<RecordingPipeline>();
    std::shared_ptr<RecordingFeedback> feedback = std::make_shared<RecordingFeedback>();
    std::unique_ptr<DownloadManager> manager;

    std::mutex eventMutex;
    std::vector<std::pair<std::string, json>> published;

    ManagerFixture() {
        events.subscribe("*", [this](const std::string& event, const json& payload) {
            std::lock_guard<std::mutex> lock(eventMutex);
            published.emplace_back(event, payload);
        });

        DownloadSettings settings;
        settings.workDirectory = work.path();
        settings.manualMarker = "ManualMarker";

        manager = std::make_unique<DownloadManager>(engine, settings, events, pipeline, feedback);
        manager->initialize();
        manager->waitForIdle();
        clearEvents();
    }

    ~ManagerFixture() {
        manager.reset();
    }

    std::filesystem::path writeArtifact(const std::string& name, const std::string& content) {
        auto path = scratch / name;
        hauler::test::writeText(path, content);
        return path;
    }

    std::vector<json> eventsNamed(const std::string& name) {
        std::lock_guard<std::mutex> lock(eventMutex);
        std::vector<json> result;
        for (const auto& [event, payload] : published) {
            if (event == name) result.push_back(payload);
        }
        return result;
    }

    void clearEvents() {
        std::lock_guard<std::mutex> lock(eventMutex);
        published.clear();
    }

    void settle() { manager->waitForIdle(); }
};

} // namespace

TEST_CASE("DownloadManager requires an engine", "[DownloadManager]") {
    EventBus events;
    REQUIRE_THROWS_AS(DownloadManager(nullptr, DownloadSettings{}, events), std::invalid_argument);
}

TEST_CASE_METHOD(ManagerFixture, "Starting a download creates a running record", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/files/App.ipa");
    settle();

    REQUIRE(hauler::utils::StringUtils::isValidUUID(snapshot.id));
    REQUIRE(snapshot.fileName == "App.ipa");
    REQUIRE(snapshot.hasActiveTask);
    REQUIRE(manager->size() == 1);

    auto task = engine->lastTask();
    REQUIRE(task);
    REQUIRE(task->state() == TransferState::Running);
    REQUIRE(task->resumeCalls() == 1);

    auto added = eventsNamed(kEventDownloadAdded);
    REQUIRE(added.size() == 1);
    REQUIRE(added[0]["id"] == snapshot.id);
}

TEST_CASE_METHOD(ManagerFixture, "Starting the same url twice reuses the record", "[DownloadManager]") {
    auto first = manager->startDownload("https://example.com/a.zip");
    auto second = manager->startDownload("https://example.com/a.zip");
    settle();

    REQUIRE(first.id == second.id);
    REQUIRE(manager->size() == 1);
    REQUIRE(engine->taskCount() == 1);
    REQUIRE(eventsNamed(kEventDownloadAdded).size() == 1);

    SECTION("a different url gets its own record") {
        manager->startDownload("https://example.com/b.zip");
        REQUIRE(manager->size() == 2);
    }
}

TEST_CASE_METHOD(ManagerFixture, "A requested id that is taken is replaced", "[DownloadManager]") {
    auto first = manager->startDownload("https://example.com/a.zip", "fixed");
    auto second = manager->startDownload("https://example.com/b.zip", "fixed");

    REQUIRE(first.id == "fixed");
    REQUIRE(second.id != "fixed");
    REQUIRE(hauler::utils::StringUtils::isValidUUID(second.id));
    REQUIRE(manager->size() == 2);
}

TEST_CASE_METHOD(ManagerFixture, "A refused transfer leaves no record", "[DownloadManager]") {
    engine->refuseNewTasks = true;

    manager->startDownload("https://example.com/a.zip");
    settle();

    REQUIRE(manager->size() == 0);
    auto failed = eventsNamed(kEventDownloadFailed);
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0]["error"] == "TransferFailed");
}

SCENARIO("Progress events update the owning record", "[DownloadManager]") {
    ManagerFixture f;

    GIVEN("a running download") {
        auto snapshot = f.manager->startDownload("https://example.com/big.bin");
        auto task = f.engine->lastTask();

        WHEN("the engine reports half of the bytes") {
            f.engine->progress(task, 500, 1000, 2000);
            f.settle();

            THEN("the record shows half of the download phase") {
                auto current = f.manager->getDownload(snapshot.id);
                REQUIRE(current);
                REQUIRE(current->downloadProgress == Approx(0.5));
                REQUIRE(current->bytesDownloaded == 1000);
                REQUIRE(current->totalBytes == 2000);
                REQUIRE(current->overallProgress() == Approx(0.35));
            }

            AND_WHEN("the engine reports the rest") {
                f.engine->progress(task, 1000, 2000, 2000);
                f.settle();

                THEN("the download phase is complete") {
                    auto current = f.manager->getDownload(snapshot.id);
                    REQUIRE(current->downloadProgress == Approx(1.0));
                    REQUIRE(current->overallProgress() == Approx(0.7));
                    REQUIRE(f.eventsNamed(kEventDownloadUpdated).size() == 2);
                }
            }
        }
    }
}

TEST_CASE_METHOD(ManagerFixture, "Cancelling drops the record and ignores late events", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/a.zip");
    auto task = engine->lastTask();

    REQUIRE(manager->cancelDownload(snapshot.id));
    REQUIRE(manager->size() == 0);
    REQUIRE(task->wasCancelled());

    engine->progress(task, 10, 10, 100);
    auto artifact = writeArtifact("late.part", "late bytes");
    engine->finish(task, artifact);
    settle();

    REQUIRE(manager->size() == 0);
    REQUIRE(pipeline->calls().empty());
    REQUIRE_FALSE(hauler::utils::FileUtils::fileExists(artifact));
    REQUIRE(eventsNamed(kEventDownloadRemoved).size() == 1);
    REQUIRE_FALSE(manager->cancelDownload(snapshot.id));
}

TEST_CASE_METHOD(ManagerFixture, "A finished transfer is relocated and handed to the pipeline", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/dl/App.ipa");
    auto task = engine->lastTask();
    auto temp = writeArtifact("engine-1.part", "payload");

    SECTION("named after the url") {
        engine->finish(task, temp);
        settle();

        auto calls = pipeline->calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].downloadId == snapshot.id);
        REQUIRE(calls[0].path == work.path() / snapshot.id / "App.ipa");
        REQUIRE(calls[0].content == "payload");
    }

    SECTION("named after the server's suggestion") {
        engine->finish(task, temp, "Suggested.ipa");
        settle();

        auto calls = pipeline->calls();
        REQUIRE(calls.size() == 1);
        REQUIRE(calls[0].path.filename() == "Suggested.ipa");
    }

    REQUIRE_FALSE(hauler::utils::FileUtils::fileExists(temp));
    REQUIRE(manager->size() == 0);
    REQUIRE(feedback->failures().empty());

    auto removed = eventsNamed(kEventDownloadRemoved);
    REQUIRE(removed.size() == 1);
    REQUIRE(removed[0]["id"] == snapshot.id);

    // Unpack progress reported by the pipeline never decreases
    double lastUnpack = 0.0;
    for (const auto& update : eventsNamed(kEventDownloadUpdated)) {
        double unpack = update["unpackProgress"].get<double>();
        REQUIRE(unpack >= lastUnpack);
        lastUnpack = unpack;
    }
    REQUIRE(lastUnpack == Approx(1.0));
}

TEST_CASE_METHOD(ManagerFixture, "A pipeline failure is reported once", "[DownloadManager]") {
    pipeline->failWith = "broken archive";

    auto snapshot = manager->startDownload("https://example.com/App.ipa");
    engine->finish(engine->lastTask(), writeArtifact("engine-2.part", "junk"));
    settle();

    auto failures = feedback->failures();
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].first == snapshot.id);
    REQUIRE(failures[0].second.code == DownloadErrorCode::PipelineFailed);
    REQUIRE(failures[0].second.reason == "broken archive");

    REQUIRE(manager->size() == 0);
    auto failed = eventsNamed(kEventDownloadFailed);
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0]["error"] == "PipelineFailed");
}

TEST_CASE_METHOD(ManagerFixture, "A relocation failure keeps the record", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/App.ipa");
    engine->finish(engine->lastTask(), scratch / "does-not-exist.part");
    settle();

    REQUIRE(manager->size() == 1);
    REQUIRE(manager->getDownload(snapshot.id));
    REQUIRE(pipeline->calls().empty());
    REQUIRE(feedback->failures().empty());
}

TEST_CASE_METHOD(ManagerFixture, "Without a pipeline the record is dropped after relocation", "[DownloadManager]") {
    DownloadManager bare(engine, manager->settings(), events);
    bare.initialize();

    auto snapshot = bare.startDownload("https://example.com/plain.bin");
    engine->finish(engine->lastTask(), writeArtifact("engine-3.part", "data"));
    bare.waitForIdle();

    REQUIRE(bare.size() == 0);
    REQUIRE(hauler::utils::FileUtils::readFile(work.path() / snapshot.id / "plain.bin") == std::string("data"));
}

TEST_CASE_METHOD(ManagerFixture, "A transfer failure removes the record", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/a.zip");
    engine->fail(engine->lastTask(), "connection reset");
    settle();

    REQUIRE(manager->size() == 0);
    REQUIRE(feedback->failures().empty());

    auto failed = eventsNamed(kEventDownloadFailed);
    REQUIRE(failed.size() == 1);
    REQUIRE(failed[0]["error"] == "TransferFailed");
    REQUIRE(failed[0]["reason"] == "connection reset");
    REQUIRE(failed[0]["download"]["id"] == snapshot.id);
}

SCENARIO("Pausing and resuming a download", "[DownloadManager]") {
    ManagerFixture f;

    GIVEN("a download with some bytes received") {
        auto snapshot = f.manager->startDownload("https://example.com/a.zip");
        auto task = f.engine->lastTask();
        f.engine->progress(task, 300, 300, 1000);
        f.settle();

        WHEN("it is paused") {
            REQUIRE_FALSE(f.manager->pauseDownload(snapshot.id));
            f.settle();

            THEN("the record is kept with continuation data and no handle") {
                auto current = f.manager->getDownload(snapshot.id);
                REQUIRE(current);
                REQUIRE(current->hasResumeData);
                REQUIRE_FALSE(current->hasActiveTask);
                REQUIRE(task->wasCancelled());
            }

            AND_WHEN("it is resumed") {
                REQUIRE_FALSE(f.manager->resumeDownload(snapshot.id));

                THEN("a task is created from the continuation data") {
                    auto consumed = f.engine->consumedResumeData();
                    REQUIRE(consumed.size() == 1);
                    REQUIRE(consumed[0] == "https://example.com/a.zip|300");

                    auto resumed = f.engine->lastTask();
                    REQUIRE(resumed->fromResumeData());
                    REQUIRE(resumed->state() == TransferState::Running);

                    auto current = f.manager->getDownload(snapshot.id);
                    REQUIRE(current->hasActiveTask);
                    REQUIRE_FALSE(current->hasResumeData);
                }
            }

            AND_WHEN("the engine rejects the continuation data") {
                f.engine->acceptResumeData = false;
                REQUIRE_FALSE(f.manager->resumeDownload(snapshot.id));

                THEN("the original request is issued again") {
                    auto fresh = f.engine->lastTask();
                    REQUIRE_FALSE(fresh->fromResumeData());
                    REQUIRE(fresh->originalUrl() == "https://example.com/a.zip");
                    REQUIRE(fresh->state() == TransferState::Running);
                    REQUIRE(f.manager->getDownload(snapshot.id)->downloadProgress == 0.0);
                }
            }
        }

        WHEN("pausing twice") {
            REQUIRE_FALSE(f.manager->pauseDownload(snapshot.id));
            f.settle();
            auto error = f.manager->pauseDownload(snapshot.id);

            THEN("the second pause has nothing to stop") {
                REQUIRE(error);
                REQUIRE(error->code == DownloadErrorCode::NoResumeDataAvailable);
            }
        }
    }
}

SCENARIO("Resuming while a pause is still completing", "[DownloadManager]") {
    ManagerFixture f;
    f.engine->deferPauses = true;

    GIVEN("a download that is being paused") {
        auto snapshot = f.manager->startDownload("https://example.com/a.zip");
        auto task = f.engine->lastTask();
        f.engine->progress(task, 600, 600, 1000);
        f.settle();

        REQUIRE_FALSE(f.manager->pauseDownload(snapshot.id));
        REQUIRE(task->state() == TransferState::Canceling);

        WHEN("it is resumed before the engine hands back its data") {
            REQUIRE_FALSE(f.manager->resumeDownload(snapshot.id));
            f.settle();

            THEN("no new request is issued yet") {
                REQUIRE(f.engine->taskCount() == 1);
                REQUIRE(f.manager->getDownload(snapshot.id)->downloadProgress == Approx(0.6));
            }

            AND_WHEN("the data arrives") {
                REQUIRE(task->completePause());
                f.settle();

                THEN("the transfer continues from it") {
                    auto consumed = f.engine->consumedResumeData();
                    REQUIRE(consumed.size() == 1);
                    REQUIRE(consumed[0] == "https://example.com/a.zip|600");
                    REQUIRE(f.engine->taskCount() == 2);

                    auto resumed = f.engine->lastTask();
                    REQUIRE(resumed->fromResumeData());
                    REQUIRE(resumed->state() == TransferState::Running);

                    auto current = f.manager->getDownload(snapshot.id);
                    REQUIRE(current->hasActiveTask);
                    REQUIRE_FALSE(current->hasResumeData);
                    REQUIRE(current->downloadProgress == Approx(0.6));
                    REQUIRE(f.manager->getDownloadByTask(resumed->identifier())->id == snapshot.id);
                    REQUIRE(f.engine->discardedResumeData().empty());
                }
            }
        }

        WHEN("the data arrives without a resume") {
            REQUIRE(task->completePause());
            f.settle();

            THEN("the record keeps it for later") {
                auto current = f.manager->getDownload(snapshot.id);
                REQUIRE(current->hasResumeData);
                REQUIRE_FALSE(current->hasActiveTask);
                REQUIRE(f.engine->taskCount() == 1);
                REQUIRE(f.engine->discardedResumeData().empty());
            }
        }

        WHEN("it is cancelled before the engine hands back its data") {
            REQUIRE(f.manager->cancelDownload(snapshot.id));
            REQUIRE(task->completePause());
            f.settle();

            THEN("the data is released through the engine") {
                auto discarded = f.engine->discardedResumeData();
                REQUIRE(discarded.size() == 1);
                REQUIRE(discarded[0] == "https://example.com/a.zip|600");
                REQUIRE(f.engine->consumedResumeData().empty());
                REQUIRE(f.manager->size() == 0);
            }
        }
    }
}

TEST_CASE_METHOD(ManagerFixture, "A transfer restarted by the server starts its progress over", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/a.zip");
    auto task = engine->lastTask();
    engine->progress(task, 900, 900, 1000);
    settle();
    REQUIRE(manager->getDownload(snapshot.id)->downloadProgress == Approx(0.9));

    SECTION("without a restart, progress never moves back") {
        engine->progress(task, 100, 100, 1000);
        settle();
        REQUIRE(manager->getDownload(snapshot.id)->downloadProgress == Approx(0.9));
    }

    SECTION("a restart resets the download phase") {
        clearEvents();
        engine->progress(task, 0, 0, 1000, true);
        engine->progress(task, 100, 100, 1000);
        settle();

        auto current = manager->getDownload(snapshot.id);
        REQUIRE(current->downloadProgress == Approx(0.1));
        REQUIRE(current->bytesDownloaded == 100);
        REQUIRE(current->totalBytes == 1000);

        auto updates = eventsNamed(kEventDownloadUpdated);
        REQUIRE(updates.size() == 2);
        REQUIRE(updates[0]["downloadProgress"].get<double>() == Approx(0.0));
        REQUIRE(updates[1]["downloadProgress"].get<double>() == Approx(0.1));
    }
}

TEST_CASE_METHOD(ManagerFixture, "Resuming prefers a suspended handle over a new request", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/a.zip");
    auto task = engine->lastTask();

    task->suspend();
    REQUIRE(task->state() == TransferState::Suspended);

    REQUIRE_FALSE(manager->resumeDownload(snapshot.id));
    REQUIRE(task->state() == TransferState::Running);
    REQUIRE(engine->taskCount() == 1);

    SECTION("a running handle is left alone") {
        int calls = task->resumeCalls();
        REQUIRE_FALSE(manager->resumeDownload(snapshot.id));
        REQUIRE(task->resumeCalls() == calls);
        REQUIRE(engine->taskCount() == 1);
    }
}

TEST_CASE_METHOD(ManagerFixture, "Resuming a record whose handle is gone re-issues it", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/a.zip");
    engine->lastTask()->setState(TransferState::Completed);

    REQUIRE_FALSE(manager->resumeDownload(snapshot.id));
    REQUIRE(engine->taskCount() == 2);
    REQUIRE(engine->lastTask()->state() == TransferState::Running);
    REQUIRE(manager->getDownloadByTask(engine->lastTask()->identifier())->id == snapshot.id);
}

TEST_CASE_METHOD(ManagerFixture, "Resuming what cannot be resumed", "[DownloadManager]") {
    SECTION("unknown id") {
        auto error = manager->resumeDownload("nope");
        REQUIRE(error);
        REQUIRE(error->code == DownloadErrorCode::NoResumeDataAvailable);
    }

    SECTION("archive-only unit") {
        auto unit = manager->startArchive("/tmp/Bundle.zip");
        auto error = manager->resumeDownload(unit.id);
        REQUIRE(error);
        REQUIRE(error->code == DownloadErrorCode::NoResumeDataAvailable);
    }
}

TEST_CASE_METHOD(ManagerFixture, "An engine-side cancellation keeps the record resumable", "[DownloadManager]") {
    auto snapshot = manager->startDownload("https://example.com/a.zip");
    auto task = engine->lastTask();

    task->setCounters(64, 128);
    engine->emit(TransferEvent::failed(task, DownloadError::cancelled(), ResumeData{"https://example.com/a.zip|64"}));
    settle();

    auto current = manager->getDownload(snapshot.id);
    REQUIRE(current);
    REQUIRE(current->hasResumeData);
    REQUIRE_FALSE(current->hasActiveTask);
    REQUIRE(eventsNamed(kEventDownloadFailed).empty());
}

TEST_CASE_METHOD(ManagerFixture, "Pausing and resuming every transfer", "[DownloadManager]") {
    manager->startDownload("https://example.com/a.zip");
    manager->startDownload("https://example.com/b.zip");
    auto unit = manager->startArchive("/tmp/c.zip");

    manager->pauseAll();
    REQUIRE(engine->task(0)->state() == TransferState::Suspended);
    REQUIRE(engine->task(1)->state() == TransferState::Suspended);
    REQUIRE(manager->size() == 3);

    manager->resumeAll();
    REQUIRE(engine->task(0)->state() == TransferState::Running);
    REQUIRE(engine->task(1)->state() == TransferState::Running);
    REQUIRE(engine->taskCount() == 2);
}

SCENARIO("Reconciling with the engine", "[DownloadManager]") {
    ManagerFixture f;

    GIVEN("an engine with tasks from a previous process") {
        auto running = f.engine->addOrphan("https://example.com/left.zip", TransferState::Running, 500, 1000);
        auto suspended = f.engine->addOrphan("https://example.com/paused.zip", TransferState::Suspended);
        f.engine->addOrphan("https://example.com/done.zip", TransferState::Completed);

        WHEN("the manager reconciles") {
            f.manager->reconcile();
            f.settle();

            THEN("every live task is adopted") {
                REQUIRE(f.manager->size() == 2);

                auto adopted = f.manager->getDownloadByTask(running->identifier());
                REQUIRE(adopted);
                REQUIRE(adopted->url == "https://example.com/left.zip");
                REQUIRE(adopted->downloadProgress == Approx(0.5));
                REQUIRE(f.manager->getDownloadByTask(suspended->identifier()));

                auto reconciled = f.eventsNamed(kEventDownloadsReconciled);
                REQUIRE(reconciled.size() == 1);
                REQUIRE(reconciled[0]["adopted"] == 2);
            }

            AND_WHEN("it reconciles again") {
                running->setCounters(900, 1000);
                f.manager->reconcile();
                f.settle();

                THEN("nothing is adopted twice and counters are refreshed") {
                    REQUIRE(f.manager->size() == 2);
                    REQUIRE(f.manager->getDownloadByTask(running->identifier())->downloadProgress == Approx(0.9));

                    auto reconciled = f.eventsNamed(kEventDownloadsReconciled);
                    REQUIRE(reconciled.size() == 2);
                    REQUIRE(reconciled[1]["adopted"] == 0);
                    REQUIRE(reconciled[1]["refreshed"] == 1);
                }
            }

            AND_WHEN("the adopted transfer finishes") {
                f.engine->finish(running, f.writeArtifact("adopted.part", "left"));
                f.settle();

                THEN("it goes through the normal hand-off") {
                    REQUIRE(f.pipeline->calls().size() == 1);
                    REQUIRE(f.manager->size() == 1);
                }
            }
        }
    }
}

TEST_CASE_METHOD(ManagerFixture, "The background completion handler runs once", "[DownloadManager]") {
    std::atomic<int> runs{0};
    manager->setBackgroundCompletionHandler([&runs] { ++runs; });

    engine->deliverEvents();
    settle();
    REQUIRE(runs.load() == 1);

    engine->deliverEvents();
    settle();
    REQUIRE(runs.load() == 1);

    REQUIRE(manager->isBackgroundDownloadSupported());
}

TEST_CASE("Events queued while detached are delivered on attach", "[DownloadManager]") {
    TempDir work("hauler_work_");
    EventBus events;
    auto engine = std::make_shared<FakeTransferEngine>();

    DownloadSettings settings;
    settings.workDirectory = work.path();

    auto orphan = engine->addOrphan("https://example.com/a.zip", TransferState::Running);
    engine->fail(orphan, "gone");

    std::atomic<int> runs{0};
    DownloadManager manager(engine, settings, events);
    manager.setBackgroundCompletionHandler([&runs] { ++runs; });
    manager.initialize();
    manager.waitForIdle();

    REQUIRE(runs.load() == 1);
    REQUIRE(manager.size() == 0);
}

TEST_CASE_METHOD(ManagerFixture, "Manual downloads are recognised by their id", "[DownloadManager]") {
    auto manual = manager->startDownload("https://example.com/a.zip", "user-ManualMarker-1");
    manager->startDownload("https://example.com/b.zip");

    REQUIRE(manager->isManualDownload(manual.id));
    REQUIRE_FALSE(manager->isManualDownload("plain"));

    auto manuals = manager->manualDownloads();
    REQUIRE(manuals.size() == 1);
    REQUIRE(manuals[0].id == manual.id);
}

TEST_CASE_METHOD(ManagerFixture, "Archive-only units", "[DownloadManager]") {
    auto unit = manager->startArchive("/tmp/local/Bundle.zip");

    REQUIRE(unit.archiveOnly);
    REQUIRE_FALSE(unit.hasActiveTask);
    REQUIRE(engine->taskCount() == 0);

    SECTION("unpack progress is clamped and never decreases") {
        REQUIRE(manager->setUnpackProgress(unit.id, 0.5));
        REQUIRE(manager->setUnpackProgress(unit.id, 0.3));
        REQUIRE(manager->getDownload(unit.id)->overallProgress() == Approx(0.5));

        manager->setUnpackProgress(unit.id, 2.0);
        REQUIRE(manager->getDownload(unit.id)->overallProgress() == Approx(1.0));
    }

    SECTION("a download of the same url is a separate record") {
        auto download = manager->startDownload("/tmp/local/Bundle.zip");
        REQUIRE(download.id != unit.id);
        REQUIRE(manager->size() == 2);
    }

    SECTION("removing finishes the unit") {
        REQUIRE(manager->removeDownload(unit.id));
        REQUIRE_FALSE(manager->removeDownload(unit.id));
        REQUIRE_FALSE(manager->setUnpackProgress(unit.id, 1.0));
        REQUIRE(manager->size() == 0);
    }
}

TEST_CASE_METHOD(ManagerFixture, "Records are found by id, position and task", "[DownloadManager]") {
    auto a = manager->startDownload("https://example.com/a.zip");
    auto b = manager->startDownload("https://example.com/b.zip");
    auto taskB = engine->task(1);

    REQUIRE(manager->getDownloadIndex(a.id) == 0u);
    REQUIRE(manager->getDownloadIndex(b.id) == 1u);
    REQUIRE_FALSE(manager->getDownloadIndex("missing"));

    auto byTask = manager->getDownloadByTask(taskB->identifier());
    REQUIRE(byTask);
    REQUIRE(byTask->id == b.id);
    REQUIRE_FALSE(manager->getDownloadByTask(999999));

    manager->removeDownload(a.id);
    REQUIRE(manager->getDownloadIndex(b.id) == 0u);

    auto all = manager->downloads();
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].id == b.id);
}

TEST_CASE_METHOD(ManagerFixture, "Artifacts of untracked transfers are discarded", "[DownloadManager]") {
    auto orphan = engine->addOrphan("https://example.com/ghost.zip", TransferState::Running);
    auto artifact = writeArtifact("ghost.part", "boo");

    engine->finish(orphan, artifact);
    settle();

    REQUIRE_FALSE(hauler::utils::FileUtils::fileExists(artifact));
    REQUIRE(pipeline->calls().empty());
    REQUIRE(manager->size() == 0);
}

TEST_CASE_METHOD(ManagerFixture, "A transfer that finished before a restart is adopted", "[DownloadManager]") {
    auto orphan = engine->addOrphan("https://example.com/files/late.zip", TransferState::Completed, 4, 4);
    auto artifact = writeArtifact("late.part", "late");

    engine->finish(orphan, artifact, "", true);
    settle();

    auto added = eventsNamed(kEventDownloadAdded);
    REQUIRE(added.size() == 1);
    REQUIRE(added[0]["url"] == "https://example.com/files/late.zip");

    auto calls = pipeline->calls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].content == "late");
    REQUIRE(calls[0].path.filename() == "late.zip");
    REQUIRE(calls[0].downloadId == added[0]["id"].get<std::string>());
    REQUIRE(manager->size() == 0);
}
