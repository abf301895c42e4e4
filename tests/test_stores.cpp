#include "catch2_custom.hpp"

#include <codekata/grading/grading_spec.hpp>
#include <codekata/progress/events.hpp>
#include <codekata/progress/in_memory_stores.hpp>
#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_state.hpp>
#include <codekata/progress/progress_stats.hpp>
#include <codekata/progress/stores.hpp>

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace std::chrono_literals;
using namespace codekata;

namespace {

const auto T0 = std::chrono::system_clock::time_point{} + 1000h;

Lesson lesson(LessonId id, int order) {
    return {.id = id, .title = "Lesson " + std::to_string(order), .order_index = order, .grading_spec = NoCheck{}};
}

ProgressState state(LessonId lesson, ProgressStatus status, int attempts) {
    ProgressState result{.user_id = 1, .lesson_id = lesson, .status = status, .attempts = attempts};
    if (status == ProgressStatus::Completed) {
        result.completed_at = T0;
    }
    return result;
}

} // namespace

TEST_CASE("Applying submissions to a record") {
    SECTION("First failure starts the lesson") {
        auto after = apply_submission(std::nullopt, 1, 10, "x = 1", false, T0);
        REQUIRE(after.status == ProgressStatus::InProgress);
        REQUIRE(after.attempts == 1);
        REQUIRE(after.last_submitted_code == "x = 1");
        REQUIRE(after.completed_at == std::nullopt);
    }

    SECTION("The passing submission counts as an attempt") {
        auto failed = apply_submission(std::nullopt, 1, 10, "bad", false, T0);
        auto passed = apply_submission(failed, 1, 10, "good", true, T0 + 5s);

        REQUIRE(passed.status == ProgressStatus::Completed);
        REQUIRE(passed.attempts == 2);
        REQUIRE(passed.completed_at == T0 + 5s);
    }

    SECTION("A completed record only remembers the latest code") {
        auto done = apply_submission(std::nullopt, 1, 10, "good", true, T0);

        auto again = apply_submission(done, 1, 10, "worse", false, T0 + 1h);
        REQUIRE(again.status == ProgressStatus::Completed);
        REQUIRE(again.attempts == 1);
        REQUIRE(again.completed_at == T0);
        REQUIRE(again.last_submitted_code == "worse");
    }
}

TEST_CASE("Transitions know when a lesson was newly completed") {
    auto in_progress = state(10, ProgressStatus::InProgress, 1);
    auto completed = state(10, ProgressStatus::Completed, 2);

    REQUIRE(ProgressTransition{std::nullopt, completed}.newly_completed());
    REQUIRE(ProgressTransition{in_progress, completed}.newly_completed());
    REQUIRE_FALSE(ProgressTransition{completed, completed}.newly_completed());
    REQUIRE_FALSE(ProgressTransition{std::nullopt, in_progress}.newly_completed());
}

TEST_CASE("Progress statistics") {
    SECTION("No progress at all") {
        auto stats = compute_stats(4, {});
        REQUIRE(stats == ProgressStats{.total_lessons = 4, .not_started = 4});
    }

    SECTION("Mixed progress") {
        std::vector<ProgressState> progress{
            state(1, ProgressStatus::Completed, 1),
            state(2, ProgressStatus::Completed, 4),
            state(3, ProgressStatus::InProgress, 2),
        };

        auto stats = compute_stats(7, progress);
        REQUIRE(stats.completed == 2);
        REQUIRE(stats.in_progress == 1);
        REQUIRE(stats.not_started == 4);
        REQUIRE(stats.completion_percentage == 28.6);
        REQUIRE(stats.total_attempts == 7);
        REQUIRE(stats.average_attempts_per_lesson == 2.3);
    }

    SECTION("No lessons") {
        auto stats = compute_stats(0, {});
        REQUIRE(stats.completion_percentage == 0.0);
        REQUIRE(stats.average_attempts_per_lesson == 0.0);
    }
}

TEST_CASE("Course-wide statistics") {
    std::vector<Lesson> lessons{lesson(10, 1), lesson(20, 2), lesson(30, 3), lesson(40, 4)};

    auto record = [](UserId user, LessonId lesson_id, ProgressStatus status, int attempts) {
        auto result = state(lesson_id, status, attempts);
        result.user_id = user;
        return result;
    };

    std::vector<ProgressState> all{
        record(1, 10, ProgressStatus::Completed, 1), record(1, 20, ProgressStatus::Completed, 3),
        record(2, 10, ProgressStatus::Completed, 2), record(2, 20, ProgressStatus::InProgress, 4),
        record(3, 10, ProgressStatus::InProgress, 1),
        // Not part of the course
        record(3, 99, ProgressStatus::Completed, 1),
    };

    SECTION("Global") {
        auto stats = compute_global_stats(lessons, all);
        REQUIRE(stats.total_lessons == 4);
        REQUIRE(stats.total_users == 3);

        REQUIRE(stats.lesson_completion_stats.size() == 2);
        REQUIRE(stats.lesson_completion_stats[0] == LessonCompletion{.lesson_id = 10,
                                                                     .lesson_title = "Lesson 1",
                                                                     .order_index = 1,
                                                                     .completed_count = 2,
                                                                     .in_progress_count = 1,
                                                                     .total_attempts = 4});
        REQUIRE(stats.lesson_completion_stats[1].lesson_id == 20);
        REQUIRE(stats.lesson_completion_stats[1].completed_count == 1);
        REQUIRE(stats.lesson_completion_stats[1].total_attempts == 7);

        // 3 completions out of 4 lessons for 3 users
        REQUIRE(stats.overall_completion_rate == 25.0);
    }

    SECTION("Per lesson") {
        std::vector<ProgressState> lesson_10{all[0], all[2], all[4]};

        auto stats = compute_lesson_stats(10, count_users(all), lesson_10);
        REQUIRE(stats == LessonStats{.lesson_id = 10,
                                     .total_users = 3,
                                     .completed_count = 2,
                                     .in_progress_count = 1,
                                     .completion_rate = 66.7,
                                     .total_attempts = 4,
                                     .average_attempts = 2.0});
    }

    SECTION("Nothing recorded") {
        REQUIRE(compute_global_stats(lessons, {}) == GlobalStats{.total_lessons = 4});
        REQUIRE(compute_lesson_stats(10, 0, {}) == LessonStats{.lesson_id = 10});
    }
}

TEST_CASE("In-memory lesson store") {
    InMemoryLessonStore store{{lesson(30, 3), lesson(10, 1), lesson(20, 2)}};

    REQUIRE(store.count() == 3);
    REQUIRE(store.get_lesson(20) == lesson(20, 2));
    REQUIRE(store.get_lesson(99) == std::nullopt);
    REQUIRE(store.get_lesson_by_order(3) == lesson(30, 3));
    REQUIRE(store.get_lesson_by_order(4) == std::nullopt);

    auto all = store.list_lessons();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].order_index == 1);
    REQUIRE(all[1].order_index == 2);
    REQUIRE(all[2].order_index == 3);

    REQUIRE_THROWS_AS(store.add_lesson(lesson(10, 9)), std::invalid_argument);
    REQUIRE_THROWS_AS(store.add_lesson(lesson(40, 2)), std::invalid_argument);
    REQUIRE(store.count() == 3);

    store.add_lesson(lesson(40, 4));
    REQUIRE(store.list_lessons().back().id == 40);
}

TEST_CASE("In-memory progress store") {
    InMemoryProgressStore store;

    REQUIRE(store.get_progress(1, 10) == std::nullopt);

    auto first = store.upsert_attempt(1, 10, "bad");
    REQUIRE(first.before == std::nullopt);
    REQUIRE(first.after.attempts == 1);

    auto second = store.upsert_completion(1, 10, "good", T0);
    REQUIRE(second.before == first.after);
    REQUIRE(second.newly_completed());
    REQUIRE(store.get_progress(1, 10) == second.after);

    auto third = store.upsert_completion(1, 10, "good again", T0 + 1h);
    REQUIRE_FALSE(third.newly_completed());
    REQUIRE(third.after.attempts == 2);
    REQUIRE(third.after.completed_at == T0);

    store.upsert_attempt(1, 20, "other lesson");
    store.upsert_attempt(2, 10, "other user");

    auto mine = store.list_progress(1);
    REQUIRE(mine.size() == 2);
    REQUIRE(mine[0].lesson_id == 10);
    REQUIRE(mine[1].lesson_id == 20);
    REQUIRE(store.list_progress(3).empty());

    REQUIRE(store.write_count() == 5);

    auto lesson_10 = store.list_lesson_progress(10);
    REQUIRE(lesson_10.size() == 2);
    REQUIRE(lesson_10[0].user_id == 1);
    REQUIRE(lesson_10[1].user_id == 2);
    REQUIRE(store.list_lesson_progress(30).empty());
    REQUIRE(store.list_all_progress().size() == 3);

    SECTION("Injected failures change nothing") {
        store.fail_next_writes(1);
        REQUIRE_THROWS_AS(store.upsert_attempt(1, 20, "lost"), StoreError);
        REQUIRE(store.get_progress(1, 20)->last_submitted_code == "other lesson");
        REQUIRE(store.write_count() == 5);

        store.upsert_attempt(1, 20, "kept");
        REQUIRE(store.get_progress(1, 20)->last_submitted_code == "kept");
    }
}

TEST_CASE("Recorded events") {
    RecordingEventSink sink;

    sink.publish(topics::user_progress(7), LessonCompleted{7, 10, "Hello"});
    sink.publish(topics::GLOBAL_PROGRESS, LessonUnlocked{7, 20, "Next"});

    auto events = sink.events();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0] == RecordingEventSink::Record{"user_progress:7", LessonCompleted{7, 10, "Hello"}});
    REQUIRE(events[1].topic == "global_progress");
    REQUIRE(std::holds_alternative<LessonUnlocked>(events[1].event));

    sink.clear();
    REQUIRE(sink.events().empty());
}
