#undef NDEBUG
#include <cassert>
#include <atomic>
#include <future>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "application/AsyncTaskManager.hpp"

using namespace moveslot::application;

static void TestDuplicateTriggerJoinsRunningTask() {
    std::cout << "[Test] A second trigger of a running type joins it..." << std::endl;
    AsyncTaskManager tasks;
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> runs{0};

    auto first = tasks.SubmitTask(TaskType::AutopilotRun, "Nightly",
        [gate, &runs](std::shared_ptr<TaskStatus>) {
            ++runs;
            gate.wait();
        });
    auto second = tasks.SubmitTask(TaskType::AutopilotRun, "App active",
        [&runs](std::shared_ptr<TaskStatus>) { ++runs; });

    assert(first == second);
    assert(first->description == "Nightly");
    assert(first->joinedTriggers == 1);
    assert(tasks.IsRunning(TaskType::AutopilotRun));
    assert(tasks.GetActiveTasks().size() == 1);

    // Other types run alongside.
    auto other = tasks.SubmitTask(TaskType::StreakUpdate, "Streak",
        [](std::shared_ptr<TaskStatus>) {});
    assert(other != first);

    release.set_value();
    tasks.WaitForAll();
    assert(runs == 1);
    assert(first->isCompleted);
    assert(first->progress == 1.0f);
    assert(!tasks.IsRunning(TaskType::AutopilotRun));
    assert(tasks.GetActiveTasks().empty());

    // Once finished, the type can start again.
    auto third = tasks.SubmitTask(TaskType::AutopilotRun, "Manual",
        [&runs](std::shared_ptr<TaskStatus>) { ++runs; });
    tasks.WaitForAll();
    assert(third != first);
    assert(runs == 2);
    std::cout << "[PASS] Duplicate triggers join" << std::endl;
}

static void TestFailuresAreKept() {
    std::cout << "[Test] Failed tasks are recorded after they finish..." << std::endl;
    AsyncTaskManager tasks(2);
    tasks.SubmitTask(TaskType::CalendarSync, "Sync",
        [](std::shared_ptr<TaskStatus>) { throw std::runtime_error("calendar offline"); });
    tasks.WaitForAll();

    const int mark = tasks.LastTaskId();
    auto failures = tasks.FailuresSince(0);
    assert(failures.size() == 1);
    assert(failures[0].type == TaskType::CalendarSync);
    assert(failures[0].errorMessage == "calendar offline");
    assert(tasks.FailuresSince(mark).empty());

    auto ok = tasks.SubmitTask(TaskType::PlanGeneration, "Plan",
        [](std::shared_ptr<TaskStatus>) {});
    tasks.WaitForAll();
    assert(!ok->failed);
    assert(tasks.FailuresSince(mark).empty());

    for (int i = 0; i < 3; ++i) {
        tasks.SubmitTask(TaskType::PatternLearning, "Learn",
            [](std::shared_ptr<TaskStatus>) { throw std::runtime_error("no history"); });
        tasks.WaitForAll();
    }
    // History is capped.
    failures = tasks.FailuresSince(0);
    assert(failures.size() == 2);
    assert(failures[0].type == TaskType::PatternLearning);
    assert(tasks.FailuresSince(mark).size() == 2);
    std::cout << "[PASS] Failures kept" << std::endl;
}

int main() {
    TestDuplicateTriggerJoinsRunningTask();
    TestFailuresAreKept();
    std::cout << "[Test] All task manager tests passed." << std::endl;
    return 0;
}
