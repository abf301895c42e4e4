#pragma once

#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_state.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace codekata {

/// Infrastructure failure of a store. The only exception that crosses the orchestrator.
class StoreError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class LessonStore
{
public:
    virtual ~LessonStore() = default;

    virtual std::optional<Lesson> get_lesson(LessonId id) const = 0;

    virtual std::optional<Lesson> get_lesson_by_order(int order_index) const = 0;

    /// Ordered by ``order_index``
    virtual std::vector<Lesson> list_lessons() const = 0;

    virtual std::size_t count() const = 0;

protected:
    LessonStore() = default;
    LessonStore(const LessonStore&) = default;
    LessonStore(LessonStore&&) = default;
    LessonStore& operator=(const LessonStore&) = default;
    LessonStore& operator=(LessonStore&&) = default;
};

/// Per (user, lesson) progress records.
///
/// Each upsert is one atomic read-modify-write per key, following ``apply_submission``.
class ProgressStore
{
public:
    virtual ~ProgressStore() = default;

    virtual std::optional<ProgressState> get_progress(UserId user, LessonId lesson) const = 0;

    /// Records a failed submission
    virtual ProgressTransition upsert_attempt(UserId user, LessonId lesson, std::string_view code) = 0;

    /// Records a passing submission
    virtual ProgressTransition upsert_completion(UserId user, LessonId lesson, std::string_view code,
                                                 std::chrono::system_clock::time_point at) = 0;

    virtual std::vector<ProgressState> list_progress(UserId user) const = 0;

    /// Every user's record for ``lesson``
    virtual std::vector<ProgressState> list_lesson_progress(LessonId lesson) const = 0;

    /// Every record of every user
    virtual std::vector<ProgressState> list_all_progress() const = 0;

protected:
    ProgressStore() = default;
    ProgressStore(const ProgressStore&) = default;
    ProgressStore(ProgressStore&&) = default;
    ProgressStore& operator=(const ProgressStore&) = default;
    ProgressStore& operator=(ProgressStore&&) = default;
};

} // namespace codekata
