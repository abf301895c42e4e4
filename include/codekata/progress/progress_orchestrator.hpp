#pragma once

#include <codekata/common/class_traits.hpp>
#include <codekata/common/expected.hpp>
#include <codekata/common/formatters/macros.hpp>
#include <codekata/engine.hpp>
#include <codekata/grading/grading_spec.hpp>
#include <codekata/grading/solution_evaluator.hpp>
#include <codekata/progress/events.hpp>
#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_state.hpp>
#include <codekata/progress/stores.hpp>
#include <codekata/sandbox/sandbox_options.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codekata {

enum class SubmissionError {
    LessonNotFound, ///< No lesson with that id
    AccessDenied,   ///< The previous lesson is not completed yet
    Rejected,       ///< The safety gate refused the source
};

struct Submission
{
    Verdict verdict;
    ProgressState progress; ///< after this submission
    bool newly_completed;
    std::optional<Lesson> unlocked_lesson; ///< set only on a fresh completion with a following lesson
};

enum class LessonAvailability { Completed, Available, Locked };

struct LessonStatus
{
    Lesson lesson;
    LessonAvailability availability;

    bool operator==(const LessonStatus&) const = default;
};

/// Turns verdicts into progress: records attempts, marks completions, unlocks the next
/// lesson and announces all of it.
///
/// A submission performs at most one progress write, after evaluation. Events are published only
/// once that write succeeded. Store failures (StoreError) propagate to the caller.
/// Submissions of one user are handled one at a time in arrival order; different users
/// proceed concurrently.
class ProgressOrchestrator : NonMovable
{
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    struct Collaborators
    {
        LessonStore& lessons;
        ProgressStore& progress;
        EventSink& events;
        const Engine& engine;
        const SolutionEvaluator& evaluator;
    };

    explicit ProgressOrchestrator(Collaborators collaborators, SandboxOptions options = {},
                                  Clock clock = std::chrono::system_clock::now);

    Expected<Submission, SubmissionError> submit_solution(UserId user, LessonId lesson_id, std::string_view source);

    /// Evaluates without touching progress or publishing anything
    Expected<Verdict, SubmissionError> check_solution(LessonId lesson_id, std::string_view source) const;

    /// Every lesson, in course order
    std::vector<LessonStatus> available_lessons(UserId user) const;

    /// The first available lesson that is not completed; nullopt once everything is done
    std::optional<Lesson> next_lesson(UserId user) const;

    /// The first lesson is always reachable; any other only once its predecessor is completed.
    /// Unknown lessons are not reachable.
    bool can_access(UserId user, LessonId lesson_id) const;

private:
    bool can_access(UserId user, const Lesson& lesson) const;

    std::mutex& user_lock(UserId user);

    void announce_completion(UserId user, const Lesson& lesson, const std::optional<Lesson>& unlocked);

    Collaborators deps_;
    SandboxOptions options_;
    Clock clock_;

    std::mutex user_locks_mutex_;
    std::unordered_map<UserId, std::unique_ptr<std::mutex>> user_locks_;
};

} // namespace codekata

FMT_SERIALIZE_ENUM(::codekata::SubmissionError, LessonNotFound, AccessDenied, Rejected);
FMT_SERIALIZE_ENUM(::codekata::LessonAvailability, Completed, Available, Locked);
