#include <codekata/progress/progress_stats.hpp>

#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_state.hpp>

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/view/transform.hpp>

#include <cmath>
#include <cstddef>
#include <span>
#include <unordered_set>
#include <utility>
#include <vector>

namespace codekata {

namespace {

double round_one_decimal(double val) {
    return std::round(val * 10.0) / 10.0;
}

double percent(std::size_t part, std::size_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return round_one_decimal(static_cast<double>(part) / static_cast<double>(whole) * 100.0);
}

std::size_t count_status(std::span<const ProgressState> progress, ProgressStatus status) {
    return static_cast<std::size_t>(
        ranges::count_if(progress, [status](const ProgressState& state) { return state.status == status; }));
}

long sum_attempts(std::span<const ProgressState> progress) { // NOLINT(google-runtime-int)
    return ranges::accumulate(
        progress | ranges::views::transform([](const ProgressState& state) { return long{state.attempts}; }), 0L);
}

} // namespace

ProgressStats compute_stats(std::size_t total_lessons, std::span<const ProgressState> progress) {
    ProgressStats stats{.total_lessons = total_lessons};

    stats.completed = count_status(progress, ProgressStatus::Completed);
    stats.in_progress = count_status(progress, ProgressStatus::InProgress);

    std::size_t started = stats.completed + stats.in_progress;
    stats.not_started = total_lessons > started ? total_lessons - started : 0;

    stats.completion_percentage = percent(stats.completed, total_lessons);
    stats.total_attempts = sum_attempts(progress);

    auto attempted = static_cast<std::size_t>(
        ranges::count_if(progress, [](const ProgressState& state) { return state.attempts > 0; }));

    if (attempted > 0) {
        stats.average_attempts_per_lesson =
            round_one_decimal(static_cast<double>(stats.total_attempts) / static_cast<double>(attempted));
    }

    return stats;
}

std::size_t count_users(std::span<const ProgressState> progress) {
    std::unordered_set<UserId> users;
    for (const auto& state : progress) {
        users.insert(state.user_id);
    }
    return users.size();
}

GlobalStats compute_global_stats(std::span<const Lesson> lessons, std::span<const ProgressState> all_progress) {
    GlobalStats stats{.total_lessons = lessons.size(), .total_users = count_users(all_progress)};

    std::size_t completions = 0;

    for (const auto& lesson : lessons) {
        LessonCompletion row{.lesson_id = lesson.id, .lesson_title = lesson.title, .order_index = lesson.order_index};
        bool seen = false;

        for (const auto& state : all_progress) {
            if (state.lesson_id != lesson.id) {
                continue;
            }
            seen = true;
            row.total_attempts += state.attempts;
            if (state.status == ProgressStatus::Completed) {
                ++row.completed_count;
            } else if (state.status == ProgressStatus::InProgress) {
                ++row.in_progress_count;
            }
        }

        if (seen) {
            completions += row.completed_count;
            stats.lesson_completion_stats.push_back(std::move(row));
        }
    }

    stats.overall_completion_rate = percent(completions, stats.total_lessons * stats.total_users);

    return stats;
}

LessonStats compute_lesson_stats(LessonId lesson, std::size_t total_users,
                                 std::span<const ProgressState> lesson_progress) {
    LessonStats stats{.lesson_id = lesson, .total_users = total_users};

    stats.completed_count = count_status(lesson_progress, ProgressStatus::Completed);
    stats.in_progress_count = count_status(lesson_progress, ProgressStatus::InProgress);
    stats.completion_rate = percent(stats.completed_count, total_users);
    stats.total_attempts = sum_attempts(lesson_progress);

    if (stats.completed_count > 0) {
        stats.average_attempts =
            round_one_decimal(static_cast<double>(stats.total_attempts) / static_cast<double>(stats.completed_count));
    }

    return stats;
}

} // namespace codekata
