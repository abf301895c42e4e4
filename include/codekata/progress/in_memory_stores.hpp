#pragma once

#include <codekata/common/class_traits.hpp>
#include <codekata/progress/events.hpp>
#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_state.hpp>
#include <codekata/progress/stores.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codekata {

class InMemoryLessonStore : public LessonStore
{
public:
    InMemoryLessonStore() = default;

    /// Throws std::invalid_argument on a duplicate id or order index
    explicit InMemoryLessonStore(std::vector<Lesson> lessons);

    /// Throws std::invalid_argument on a duplicate id or order index
    void add_lesson(Lesson lesson);

    std::optional<Lesson> get_lesson(LessonId id) const override;
    std::optional<Lesson> get_lesson_by_order(int order_index) const override;
    std::vector<Lesson> list_lessons() const override;
    std::size_t count() const override;

private:
    mutable std::mutex mutex_;
    std::vector<Lesson> lessons_; // sorted by order_index
};

class InMemoryProgressStore : public ProgressStore, NonMovable
{
public:
    std::optional<ProgressState> get_progress(UserId user, LessonId lesson) const override;
    ProgressTransition upsert_attempt(UserId user, LessonId lesson, std::string_view code) override;
    ProgressTransition upsert_completion(UserId user, LessonId lesson, std::string_view code,
                                         std::chrono::system_clock::time_point at) override;
    std::vector<ProgressState> list_progress(UserId user) const override;
    std::vector<ProgressState> list_lesson_progress(LessonId lesson) const override;
    std::vector<ProgressState> list_all_progress() const override;

    /// The next ``count`` upserts throw StoreError without changing anything
    void fail_next_writes(std::size_t count);

    /// Successful upserts so far
    std::size_t write_count() const;

private:
    ProgressTransition upsert(UserId user, LessonId lesson, std::string_view code, bool passed,
                              std::chrono::system_clock::time_point at);

    mutable std::mutex mutex_;
    std::map<std::pair<UserId, LessonId>, ProgressState> records_;
    std::size_t failures_pending_ = 0;
    std::size_t writes_ = 0;
};

/// Keeps every published event, in order
class RecordingEventSink : public EventSink, NonMovable
{
public:
    struct Record
    {
        std::string topic;
        ProgressEvent event;

        bool operator==(const Record&) const = default;
    };

    void publish(std::string_view topic, const ProgressEvent& event) override;

    std::vector<Record> events() const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Record> events_;
};

} // namespace codekata
