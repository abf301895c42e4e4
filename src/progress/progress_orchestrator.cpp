#include <codekata/progress/progress_orchestrator.hpp>

#include <codekata/common/expected.hpp>
#include <codekata/engine.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/logging.hpp>
#include <codekata/progress/events.hpp>
#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_state.hpp>
#include <codekata/progress/progress_stats.hpp>
#include <codekata/progress/stores.hpp>

#include <range/v3/algorithm/find_if.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codekata {

ProgressOrchestrator::ProgressOrchestrator(Collaborators collaborators, SandboxOptions options, Clock clock)
    : deps_{collaborators}
    , options_{options}
    , clock_{std::move(clock)} {}

Expected<Submission, SubmissionError> ProgressOrchestrator::submit_solution(UserId user, LessonId lesson_id,
                                                                            std::string_view source) {
    std::lock_guard user_guard{user_lock(user)};

    auto lesson = deps_.lessons.get_lesson(lesson_id);
    if (!lesson) {
        return SubmissionError::LessonNotFound;
    }

    if (!can_access(user, *lesson)) {
        LOG_DEBUG("User {} may not submit to lesson {} yet", user, lesson_id);
        return SubmissionError::AccessDenied;
    }

    auto result = deps_.engine.try_execute(source, options_);
    if (!result) {
        return SubmissionError::Rejected;
    }

    Verdict verdict = deps_.evaluator.evaluate(lesson->grading_spec, result.value(), lesson->difficulty);

    // The single write for this submission
    ProgressTransition transition = verdict.passed
                                        ? deps_.progress.upsert_completion(user, lesson_id, source, clock_())
                                        : deps_.progress.upsert_attempt(user, lesson_id, source);

    bool newly_completed = transition.newly_completed();
    std::optional<Lesson> unlocked;

    if (newly_completed) {
        unlocked = deps_.lessons.get_lesson_by_order(lesson->order_index + 1);
        LOG_INFO("User {} completed lesson {} ({:?}) after {} attempt(s)", user, lesson_id, lesson->title,
                 transition.after.attempts);
        announce_completion(user, *lesson, unlocked);
    } else {
        LOG_DEBUG("User {} submitted to lesson {}: {} (attempts: {})", user, lesson_id,
                  verdict.passed ? "passed" : "failed", transition.after.attempts);
    }

    return Submission{.verdict = std::move(verdict),
                      .progress = std::move(transition.after),
                      .newly_completed = newly_completed,
                      .unlocked_lesson = std::move(unlocked)};
}

Expected<Verdict, SubmissionError> ProgressOrchestrator::check_solution(LessonId lesson_id,
                                                                        std::string_view source) const {
    auto lesson = deps_.lessons.get_lesson(lesson_id);
    if (!lesson) {
        return SubmissionError::LessonNotFound;
    }

    auto result = deps_.engine.execute(source, options_);
    return deps_.evaluator.evaluate(lesson->grading_spec, result, lesson->difficulty);
}

std::vector<LessonStatus> ProgressOrchestrator::available_lessons(UserId user) const {
    auto lessons = deps_.lessons.list_lessons();
    auto progress = deps_.progress.list_progress(user);

    auto is_completed = [&](const Lesson& lesson) {
        return ranges::find_if(progress, [&](const ProgressState& state) {
                   return state.lesson_id == lesson.id && state.completed();
               }) != progress.end();
    };

    std::vector<LessonStatus> statuses;
    statuses.reserve(lessons.size());

    const Lesson* previous = nullptr;
    bool previous_completed = false;

    for (auto& lesson : lessons) {
        bool completed = is_completed(lesson);
        bool reachable = lesson.order_index == 1 ||
                         (previous != nullptr && previous->order_index == lesson.order_index - 1 && previous_completed);

        LessonAvailability availability = LessonAvailability::Locked;
        if (completed) {
            availability = LessonAvailability::Completed;
        } else if (reachable) {
            availability = LessonAvailability::Available;
        }

        previous = &lesson;
        previous_completed = completed;
        statuses.push_back({.lesson = lesson, .availability = availability});
    }

    return statuses;
}

std::optional<Lesson> ProgressOrchestrator::next_lesson(UserId user) const {
    auto statuses = available_lessons(user);

    auto iter = ranges::find_if(
        statuses, [](const LessonStatus& status) { return status.availability == LessonAvailability::Available; });
    if (iter == statuses.end()) {
        return std::nullopt;
    }
    return iter->lesson;
}

bool ProgressOrchestrator::can_access(UserId user, LessonId lesson_id) const {
    auto lesson = deps_.lessons.get_lesson(lesson_id);
    return lesson && can_access(user, *lesson);
}

bool ProgressOrchestrator::can_access(UserId user, const Lesson& lesson) const {
    if (lesson.order_index == 1) {
        return true;
    }

    auto previous = deps_.lessons.get_lesson_by_order(lesson.order_index - 1);
    if (!previous) {
        return false;
    }

    auto progress = deps_.progress.get_progress(user, previous->id);
    return progress && progress->completed();
}

std::mutex& ProgressOrchestrator::user_lock(UserId user) {
    std::lock_guard lock{user_locks_mutex_};

    auto& slot = user_locks_[user];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

void ProgressOrchestrator::announce_completion(UserId user, const Lesson& lesson,
                                               const std::optional<Lesson>& unlocked) {
    // All store reads come before the first publish
    auto lessons = deps_.lessons.list_lessons();
    auto global = compute_global_stats(lessons, deps_.progress.list_all_progress());
    auto lesson_stats =
        compute_lesson_stats(lesson.id, global.total_users, deps_.progress.list_lesson_progress(lesson.id));
    auto user_stats = compute_stats(lessons.size(), deps_.progress.list_progress(user));

    std::string user_topic = topics::user_progress(user);

    LessonCompleted completed{.user_id = user, .lesson_id = lesson.id, .lesson_title = lesson.title};
    deps_.events.publish(user_topic, completed);
    deps_.events.publish(topics::GLOBAL_PROGRESS, completed);

    if (unlocked) {
        deps_.events.publish(user_topic,
                             LessonUnlocked{.user_id = user, .lesson_id = unlocked->id, .lesson_title = unlocked->title});
    }

    deps_.events.publish(topics::PROGRESS_STATS, StatsUpdated{.user_id = user, .stats = user_stats});
    deps_.events.publish(topics::PROGRESS_STATS, GlobalStatsUpdated{.stats = std::move(global)});
    deps_.events.publish(topics::PROGRESS_STATS, LessonStatsUpdated{.stats = lesson_stats});
}

} // namespace codekata
