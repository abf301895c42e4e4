#include <codekata/progress/progress_state.hpp>

#include <codekata/progress/lesson.hpp>

#include <libassert/assert.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace codekata {

ProgressState apply_submission(const std::optional<ProgressState>& before, UserId user, LessonId lesson,
                               std::string code, bool passed, std::chrono::system_clock::time_point now) {
    ProgressState state = before.value_or(ProgressState{.user_id = user, .lesson_id = lesson});
    DEBUG_ASSERT(state.user_id == user && state.lesson_id == lesson);

    state.last_submitted_code = std::move(code);

    if (state.completed()) {
        return state;
    }

    ++state.attempts;

    if (passed) {
        state.status = ProgressStatus::Completed;
        state.completed_at = now;
    } else {
        state.status = ProgressStatus::InProgress;
    }

    return state;
}

} // namespace codekata
