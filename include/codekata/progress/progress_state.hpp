#pragma once

#include <codekata/common/formatters/macros.hpp>
#include <codekata/progress/lesson.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace codekata {

enum class ProgressStatus { NotStarted, InProgress, Completed };

/// One user's record for one lesson.
///
/// Invariants: a completed record has ``completed_at``; ``attempts`` never decreases;
/// a completed record never goes back to in progress.
struct ProgressState
{
    UserId user_id;
    LessonId lesson_id;
    ProgressStatus status = ProgressStatus::NotStarted;
    int attempts = 0;
    std::string last_submitted_code;
    std::optional<std::chrono::system_clock::time_point> completed_at;

    bool completed() const { return status == ProgressStatus::Completed; }

    bool operator==(const ProgressState&) const = default;
};

/// What an upsert changed, observed atomically
struct ProgressTransition
{
    std::optional<ProgressState> before;
    ProgressState after;

    /// Completed now, but was not before this write
    bool newly_completed() const { return after.completed() && !(before && before->completed()); }
};

/// Applies one evaluated submission to a record.
///
/// Until the lesson is completed every submission counts as an attempt, including the
/// passing one. Afterwards only ``last_submitted_code`` changes.
ProgressState apply_submission(const std::optional<ProgressState>& before, UserId user, LessonId lesson,
                               std::string code, bool passed, std::chrono::system_clock::time_point now);

} // namespace codekata

FMT_SERIALIZE_ENUM(::codekata::ProgressStatus, NotStarted, InProgress, Completed);
