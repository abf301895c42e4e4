#pragma once

#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_state.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace codekata {

struct ProgressStats
{
    std::size_t total_lessons = 0;
    std::size_t completed = 0;
    std::size_t in_progress = 0;
    std::size_t not_started = 0;
    double completion_percentage = 0.0; ///< rounded to one decimal
    long total_attempts = 0;            // NOLINT(google-runtime-int)
    /// Rounded to one decimal; only lessons with at least one attempt count
    double average_attempts_per_lesson = 0.0;

    bool operator==(const ProgressStats&) const = default;
};

/// Summarizes one user's records. Lessons without a record count as not started.
ProgressStats compute_stats(std::size_t total_lessons, std::span<const ProgressState> progress);

/// One row of the course-wide table; only lessons somebody has submitted to appear
struct LessonCompletion
{
    LessonId lesson_id;
    std::string lesson_title;
    int order_index;
    std::size_t completed_count = 0;
    std::size_t in_progress_count = 0;
    long total_attempts = 0; // NOLINT(google-runtime-int)

    bool operator==(const LessonCompletion&) const = default;
};

struct GlobalStats
{
    std::size_t total_lessons = 0;
    std::size_t total_users = 0; ///< users with at least one progress record
    std::vector<LessonCompletion> lesson_completion_stats; ///< in course order
    /// Completed records over ``total_lessons * total_users``, percent, one decimal
    double overall_completion_rate = 0.0;

    bool operator==(const GlobalStats&) const = default;
};

struct LessonStats
{
    LessonId lesson_id;
    std::size_t total_users = 0; ///< users with progress on any lesson
    std::size_t completed_count = 0;
    std::size_t in_progress_count = 0;
    double completion_rate = 0.0;  ///< completed over ``total_users``, percent, one decimal
    long total_attempts = 0;       // NOLINT(google-runtime-int)
    double average_attempts = 0.0; ///< attempts per completion, one decimal

    bool operator==(const LessonStats&) const = default;
};

/// Course-wide summary over every user's records. Records for unknown lessons are ignored.
GlobalStats compute_global_stats(std::span<const Lesson> lessons, std::span<const ProgressState> all_progress);

/// ``lesson_progress`` holds the records of ``lesson`` only
LessonStats compute_lesson_stats(LessonId lesson, std::size_t total_users,
                                 std::span<const ProgressState> lesson_progress);

/// Distinct users among ``progress``
std::size_t count_users(std::span<const ProgressState> progress);

} // namespace codekata
