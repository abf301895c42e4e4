#include "catch2_custom.hpp"

#include <codekata/classified_error.hpp>
#include <codekata/engine.hpp>
#include <codekata/execution_result.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/grading/solution_evaluator.hpp>
#include <codekata/progress/events.hpp>
#include <codekata/progress/in_memory_stores.hpp>
#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_orchestrator.hpp>
#include <codekata/progress/progress_state.hpp>
#include <codekata/progress/progress_stats.hpp>
#include <codekata/progress/stores.hpp>
#include <codekata/sandbox/safety_gate.hpp>
#include <codekata/sandbox/sandbox.hpp>

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace codekata;

namespace {

const auto COMPLETION_TIME = std::chrono::system_clock::time_point{} + 500'000h;

constexpr std::string_view HELLO = R"(IO.puts("Hello, World!"))";
constexpr std::string_view SUM = "Enum.sum([1, 2, 3])";

/// Counts how often code actually reaches the sandbox
class CountingRunner : public CodeRunner
{
public:
    explicit CountingRunner(CodeRunner& inner)
        : inner_{&inner} {}

    ExecutionResult run(std::string_view source, const SandboxOptions& options) override {
        ++runs;
        return inner_->run(source, options);
    }

    std::atomic<int> runs = 0;

private:
    CodeRunner* inner_;
};

TestCase expect_result(std::string literal) {
    TestCase spec;
    spec.expectations.emplace(TestCase::EXPECTED_RESULT, std::move(literal));
    return spec;
}

std::vector<Lesson> course() {
    return {
        {.id = 101, .title = "Hello", .order_index = 1, .grading_spec = ExpectedOutput{"Hello, World!"}},
        {.id = 102,
         .title = "Sums",
         .order_index = 2,
         .grading_spec = expect_result("6"),
         .difficulty = Difficulty::Intermediate},
        {.id = 103, .title = "Free form", .order_index = 3, .grading_spec = NoCheck{}, .difficulty = Difficulty::Advanced},
    };
}

struct Fixture
{
    explicit Fixture(std::vector<Lesson> lessons_in = course())
        : lessons{std::move(lessons_in)} {}

    SafetyGate gate;
    Sandbox sandbox;
    CountingRunner runner{sandbox};
    Engine engine{gate, runner};

    FeedbackGenerator feedback{42};
    SolutionEvaluator evaluator{feedback};

    InMemoryLessonStore lessons;
    InMemoryProgressStore progress;
    RecordingEventSink events;

    ProgressOrchestrator orchestrator{{lessons, progress, events, engine, evaluator},
                                      SandboxOptions{.timeout = 2s},
                                      [] { return COMPLETION_TIME; }};
};

} // namespace

TEST_CASE("Completing the first lesson") {
    Fixture fx;

    auto submission = fx.orchestrator.submit_solution(1, 101, HELLO);
    REQUIRE(submission.has_value());

    const auto& sub = submission.value();
    REQUIRE(sub.verdict.passed);
    REQUIRE(sub.newly_completed);
    REQUIRE(sub.progress.status == ProgressStatus::Completed);
    REQUIRE(sub.progress.attempts == 1);
    REQUIRE(sub.progress.completed_at == COMPLETION_TIME);
    REQUIRE(sub.progress.last_submitted_code == HELLO);
    REQUIRE(sub.unlocked_lesson.has_value());
    REQUIRE(sub.unlocked_lesson->id == 102);

    REQUIRE(fx.runner.runs.load() == 1);
    REQUIRE(fx.progress.write_count() == 1);

    SECTION("Events are published in order") {
        auto events = fx.events.events();
        REQUIRE(events.size() == 6);

        REQUIRE(events[0] == RecordingEventSink::Record{"user_progress:1", LessonCompleted{1, 101, "Hello"}});
        REQUIRE(events[1] == RecordingEventSink::Record{"global_progress", LessonCompleted{1, 101, "Hello"}});
        REQUIRE(events[2] == RecordingEventSink::Record{"user_progress:1", LessonUnlocked{1, 102, "Sums"}});

        REQUIRE(events[3].topic == "progress_stats");
        const auto* stats = std::get_if<StatsUpdated>(&events[3].event);
        REQUIRE(stats != nullptr);
        REQUIRE(stats->user_id == 1);
        REQUIRE(stats->stats.total_lessons == 3);
        REQUIRE(stats->stats.completed == 1);
        REQUIRE(stats->stats.completion_percentage == 33.3);

        REQUIRE(events[4].topic == "progress_stats");
        REQUIRE(events[4].event == ProgressEvent{GlobalStatsUpdated{GlobalStats{
                                       .total_lessons = 3,
                                       .total_users = 1,
                                       .lesson_completion_stats = {{.lesson_id = 101,
                                                                    .lesson_title = "Hello",
                                                                    .order_index = 1,
                                                                    .completed_count = 1,
                                                                    .in_progress_count = 0,
                                                                    .total_attempts = 1}},
                                       .overall_completion_rate = 33.3}}});

        REQUIRE(events[5].topic == "progress_stats");
        REQUIRE(events[5].event == ProgressEvent{LessonStatsUpdated{LessonStats{.lesson_id = 101,
                                                                                .total_users = 1,
                                                                                .completed_count = 1,
                                                                                .in_progress_count = 0,
                                                                                .completion_rate = 100.0,
                                                                                .total_attempts = 1,
                                                                                .average_attempts = 1.0}}});
    }

    SECTION("Resubmitting is recorded but changes nothing else") {
        fx.events.clear();

        auto again = fx.orchestrator.submit_solution(1, 101, "IO.puts(\"Hello, World!\")\n:again");
        REQUIRE(again.has_value());
        REQUIRE(again.value().verdict.passed);
        REQUIRE_FALSE(again.value().newly_completed);
        REQUIRE_FALSE(again.value().unlocked_lesson.has_value());
        REQUIRE(again.value().progress.attempts == 1);
        REQUIRE(again.value().progress.completed_at == COMPLETION_TIME);

        REQUIRE(fx.events.events().empty());
        REQUIRE(fx.progress.write_count() == 2);
        REQUIRE(fx.progress.get_progress(1, 101)->last_submitted_code == "IO.puts(\"Hello, World!\")\n:again");
    }

    SECTION("A failing resubmission does not undo the completion") {
        auto worse = fx.orchestrator.submit_solution(1, 101, "1 / 0");
        REQUIRE(worse.has_value());
        REQUIRE_FALSE(worse.value().verdict.passed);
        REQUIRE(worse.value().progress.status == ProgressStatus::Completed);
        REQUIRE(worse.value().progress.attempts == 1);
        REQUIRE(fx.orchestrator.can_access(1, 102));
    }
}

TEST_CASE("Failed attempts are counted") {
    Fixture fx;

    auto first = fx.orchestrator.submit_solution(1, 101, "IO.puts(\"Hello\")");
    REQUIRE(first.has_value());
    REQUIRE_FALSE(first.value().verdict.passed);
    REQUIRE(first.value().verdict.feedback == "Not quite right. Expected: Hello, World!\nGot: Hello");
    REQUIRE(first.value().progress.status == ProgressStatus::InProgress);
    REQUIRE(first.value().progress.attempts == 1);
    REQUIRE_FALSE(first.value().newly_completed);
    REQUIRE(fx.events.events().empty());

    auto second = fx.orchestrator.submit_solution(1, 101, "1 +");
    REQUIRE(second.has_value());
    REQUIRE(second.value().verdict.error.has_value());
    REQUIRE(second.value().progress.attempts == 2);

    auto third = fx.orchestrator.submit_solution(1, 101, HELLO);
    REQUIRE(third.value().newly_completed);
    REQUIRE(third.value().progress.attempts == 3);
}

TEST_CASE("Locked lessons never run code") {
    Fixture fx;

    REQUIRE(fx.orchestrator.submit_solution(1, 102, SUM) == SubmissionError::AccessDenied);
    REQUIRE(fx.orchestrator.submit_solution(1, 103, "1") == SubmissionError::AccessDenied);
    REQUIRE(fx.orchestrator.submit_solution(1, 999, "1") == SubmissionError::LessonNotFound);

    REQUIRE(fx.runner.runs.load() == 0);
    REQUIRE(fx.progress.write_count() == 0);
    REQUIRE(fx.events.events().empty());

    SECTION("Completing a lesson unlocks only the next one") {
        REQUIRE(fx.orchestrator.submit_solution(1, 101, HELLO).has_value());

        auto sums = fx.orchestrator.submit_solution(1, 102, SUM);
        REQUIRE(sums.has_value());
        REQUIRE(sums.value().verdict.passed);
        REQUIRE(sums.value().unlocked_lesson->id == 103);

        REQUIRE(fx.runner.runs.load() == 2);
    }

    SECTION("Progress is per user") {
        REQUIRE(fx.orchestrator.submit_solution(1, 101, HELLO).has_value());
        REQUIRE(fx.orchestrator.submit_solution(2, 102, SUM) == SubmissionError::AccessDenied);
        REQUIRE(fx.orchestrator.can_access(1, 102));
        REQUIRE_FALSE(fx.orchestrator.can_access(2, 102));
    }
}

TEST_CASE("Rejected code is neither run nor recorded") {
    Fixture fx;

    REQUIRE(fx.orchestrator.submit_solution(1, 101, "File.read(\"/etc/passwd\")") == SubmissionError::Rejected);

    REQUIRE(fx.runner.runs.load() == 0);
    REQUIRE(fx.progress.write_count() == 0);
    REQUIRE(fx.progress.get_progress(1, 101) == std::nullopt);
    REQUIRE(fx.events.events().empty());
}

TEST_CASE("Store failures propagate and leave no trace") {
    Fixture fx;

    fx.progress.fail_next_writes(1);
    REQUIRE_THROWS_AS(fx.orchestrator.submit_solution(1, 101, HELLO), StoreError);

    REQUIRE(fx.progress.get_progress(1, 101) == std::nullopt);
    REQUIRE(fx.events.events().empty());

    auto retry = fx.orchestrator.submit_solution(1, 101, HELLO);
    REQUIRE(retry.has_value());
    REQUIRE(retry.value().newly_completed);
    REQUIRE(retry.value().progress.attempts == 1);
    REQUIRE(fx.events.events().size() == 4);
}

TEST_CASE("Checking a solution has no side effects") {
    Fixture fx;

    auto verdict = fx.orchestrator.check_solution(102, SUM);
    REQUIRE(verdict.has_value());
    REQUIRE(verdict.value().passed);
    REQUIRE(verdict.value().actual_output == "6");
    REQUIRE(verdict.value().expected_output == "6");

    REQUIRE(fx.orchestrator.check_solution(999, SUM) == SubmissionError::LessonNotFound);

    SECTION("Rejected code fails without running") {
        auto rejected = fx.orchestrator.check_solution(101, "System.halt()");
        REQUIRE(rejected.has_value());
        REQUIRE_FALSE(rejected.value().passed);
        REQUIRE(rejected.value().error ==
                ClassifiedError{ErrorCategory::DangerousCode,
                                "Code contains a restricted operation: System. (process or OS access)"});
        REQUIRE(fx.runner.runs.load() == 1);
    }

    REQUIRE(fx.progress.write_count() == 0);
    REQUIRE(fx.events.events().empty());
}

TEST_CASE("Lesson availability") {
    Fixture fx;

    auto availability = [&fx](UserId user) {
        std::vector<LessonAvailability> result;
        for (const auto& status : fx.orchestrator.available_lessons(user)) {
            result.push_back(status.availability);
        }
        return result;
    };

    using enum LessonAvailability;

    REQUIRE(availability(1) == std::vector{Available, Locked, Locked});
    REQUIRE(fx.orchestrator.next_lesson(1)->id == 101);

    REQUIRE(fx.orchestrator.submit_solution(1, 101, HELLO).has_value());
    REQUIRE(availability(1) == std::vector{Completed, Available, Locked});
    REQUIRE(fx.orchestrator.next_lesson(1)->id == 102);

    REQUIRE(fx.orchestrator.submit_solution(1, 102, SUM).has_value());
    REQUIRE(fx.orchestrator.submit_solution(1, 103, "nil").has_value());
    REQUIRE(availability(1) == std::vector{Completed, Completed, Completed});
    REQUIRE(fx.orchestrator.next_lesson(1) == std::nullopt);

    REQUIRE(availability(2) == std::vector{Available, Locked, Locked});
    REQUIRE_FALSE(fx.orchestrator.can_access(1, 999));
}

TEST_CASE("Gaps in the course order lock what follows") {
    Fixture fx{{
        {.id = 1, .title = "One", .order_index = 1, .grading_spec = NoCheck{}},
        {.id = 3, .title = "Three", .order_index = 3, .grading_spec = NoCheck{}},
    }};

    auto first = fx.orchestrator.submit_solution(1, 1, "1");
    REQUIRE(first.has_value());
    REQUIRE(first.value().newly_completed);
    REQUIRE_FALSE(first.value().unlocked_lesson.has_value());

    REQUIRE_FALSE(fx.orchestrator.can_access(1, 3));
    REQUIRE(fx.orchestrator.next_lesson(1) == std::nullopt);

    // Completed twice, no unlock, then user, course and lesson stats
    REQUIRE(fx.events.events().size() == 5);
}

TEST_CASE("Course and lesson statistics span every user") {
    Fixture fx;

    REQUIRE(fx.orchestrator.submit_solution(2, 101, "IO.puts(\"Hi\")").has_value());
    REQUIRE(fx.orchestrator.submit_solution(3, 101, "1").has_value());
    REQUIRE(fx.events.events().empty());

    REQUIRE(fx.orchestrator.submit_solution(1, 101, HELLO).has_value());

    auto events = fx.events.events();
    REQUIRE(events.size() == 6);

    const auto* global = std::get_if<GlobalStatsUpdated>(&events[4].event);
    REQUIRE(global != nullptr);
    REQUIRE(global->stats.total_lessons == 3);
    REQUIRE(global->stats.total_users == 3);
    REQUIRE(global->stats.lesson_completion_stats.size() == 1);
    REQUIRE(global->stats.lesson_completion_stats[0].completed_count == 1);
    REQUIRE(global->stats.lesson_completion_stats[0].in_progress_count == 2);
    REQUIRE(global->stats.lesson_completion_stats[0].total_attempts == 3);
    // One completion out of 3 lessons for 3 users
    REQUIRE(global->stats.overall_completion_rate == 11.1);

    const auto* lesson = std::get_if<LessonStatsUpdated>(&events[5].event);
    REQUIRE(lesson != nullptr);
    REQUIRE(lesson->stats.lesson_id == 101);
    REQUIRE(lesson->stats.total_users == 3);
    REQUIRE(lesson->stats.completed_count == 1);
    REQUIRE(lesson->stats.in_progress_count == 2);
    REQUIRE(lesson->stats.completion_rate == 33.3);
    REQUIRE(lesson->stats.total_attempts == 3);
    REQUIRE(lesson->stats.average_attempts == 3.0);
}

TEST_CASE("Concurrent submissions from one user are serialized") {
    Fixture fx;
    constexpr int NUM_SUBMISSIONS = 4;
    std::atomic<int> accepted = 0;

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < NUM_SUBMISSIONS; ++i) {
            threads.emplace_back([&fx, &accepted] {
                if (fx.orchestrator.submit_solution(1, 101, "IO.puts(\"nope\")").has_value()) {
                    ++accepted;
                }
            });
        }
    }

    REQUIRE(accepted.load() == NUM_SUBMISSIONS);

    auto state = fx.progress.get_progress(1, 101);
    REQUIRE(state.has_value());
    REQUIRE(state->attempts == NUM_SUBMISSIONS);
    REQUIRE(state->status == ProgressStatus::InProgress);
    REQUIRE(fx.runner.runs.load() == NUM_SUBMISSIONS);
}
