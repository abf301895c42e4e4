#include <codekata/progress/in_memory_stores.hpp>

#include <codekata/progress/events.hpp>
#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_state.hpp>
#include <codekata/progress/stores.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/algorithm/lower_bound.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codekata {

std::string topics::user_progress(UserId user) {
    return fmt::format("user_progress:{}", user);
}

InMemoryLessonStore::InMemoryLessonStore(std::vector<Lesson> lessons) {
    for (auto& lesson : lessons) {
        add_lesson(std::move(lesson));
    }
}

void InMemoryLessonStore::add_lesson(Lesson lesson) {
    std::lock_guard lock{mutex_};

    if (ranges::find_if(lessons_, [&](const Lesson& other) {
            return other.id == lesson.id || other.order_index == lesson.order_index;
        }) != lessons_.end()) {
        throw std::invalid_argument{
            fmt::format("lesson {} (order {}) clashes with an existing lesson", lesson.id, lesson.order_index)};
    }

    auto pos = ranges::lower_bound(lessons_, lesson.order_index, std::less<>{}, &Lesson::order_index);
    lessons_.insert(pos, std::move(lesson));
}

std::optional<Lesson> InMemoryLessonStore::get_lesson(LessonId id) const {
    std::lock_guard lock{mutex_};

    auto iter = ranges::find_if(lessons_, [id](const Lesson& lesson) { return lesson.id == id; });
    if (iter == lessons_.end()) {
        return std::nullopt;
    }
    return *iter;
}

std::optional<Lesson> InMemoryLessonStore::get_lesson_by_order(int order_index) const {
    std::lock_guard lock{mutex_};

    auto iter =
        ranges::find_if(lessons_, [order_index](const Lesson& lesson) { return lesson.order_index == order_index; });
    if (iter == lessons_.end()) {
        return std::nullopt;
    }
    return *iter;
}

std::vector<Lesson> InMemoryLessonStore::list_lessons() const {
    std::lock_guard lock{mutex_};
    return lessons_;
}

std::size_t InMemoryLessonStore::count() const {
    std::lock_guard lock{mutex_};
    return lessons_.size();
}

std::optional<ProgressState> InMemoryProgressStore::get_progress(UserId user, LessonId lesson) const {
    std::lock_guard lock{mutex_};

    auto iter = records_.find({user, lesson});
    if (iter == records_.end()) {
        return std::nullopt;
    }
    return iter->second;
}

ProgressTransition InMemoryProgressStore::upsert_attempt(UserId user, LessonId lesson, std::string_view code) {
    return upsert(user, lesson, code, /*passed=*/false, {});
}

ProgressTransition InMemoryProgressStore::upsert_completion(UserId user, LessonId lesson, std::string_view code,
                                                            std::chrono::system_clock::time_point at) {
    return upsert(user, lesson, code, /*passed=*/true, at);
}

ProgressTransition InMemoryProgressStore::upsert(UserId user, LessonId lesson, std::string_view code, bool passed,
                                                 std::chrono::system_clock::time_point at) {
    std::lock_guard lock{mutex_};

    if (failures_pending_ > 0) {
        --failures_pending_;
        throw StoreError{fmt::format("injected write failure for user {} lesson {}", user, lesson)};
    }

    std::optional<ProgressState> before;
    if (auto iter = records_.find({user, lesson}); iter != records_.end()) {
        before = iter->second;
    }

    ProgressState after = apply_submission(before, user, lesson, std::string{code}, passed, at);
    records_.insert_or_assign({user, lesson}, after);
    ++writes_;

    return {.before = std::move(before), .after = std::move(after)};
}

std::vector<ProgressState> InMemoryProgressStore::list_progress(UserId user) const {
    std::lock_guard lock{mutex_};

    std::vector<ProgressState> result;
    for (auto iter = records_.lower_bound({user, std::numeric_limits<LessonId>::min()});
         iter != records_.end() && iter->first.first == user; ++iter) {
        result.push_back(iter->second);
    }
    return result;
}

std::vector<ProgressState> InMemoryProgressStore::list_lesson_progress(LessonId lesson) const {
    std::lock_guard lock{mutex_};

    std::vector<ProgressState> result;
    for (const auto& [key, state] : records_) {
        if (key.second == lesson) {
            result.push_back(state);
        }
    }
    return result;
}

std::vector<ProgressState> InMemoryProgressStore::list_all_progress() const {
    std::lock_guard lock{mutex_};

    std::vector<ProgressState> result;
    result.reserve(records_.size());
    for (const auto& [key, state] : records_) {
        result.push_back(state);
    }
    return result;
}

void InMemoryProgressStore::fail_next_writes(std::size_t count) {
    std::lock_guard lock{mutex_};
    failures_pending_ = count;
}

std::size_t InMemoryProgressStore::write_count() const {
    std::lock_guard lock{mutex_};
    return writes_;
}

void RecordingEventSink::publish(std::string_view topic, const ProgressEvent& event) {
    std::lock_guard lock{mutex_};
    events_.push_back({std::string{topic}, event});
}

std::vector<RecordingEventSink::Record> RecordingEventSink::events() const {
    std::lock_guard lock{mutex_};
    return events_;
}

void RecordingEventSink::clear() {
    std::lock_guard lock{mutex_};
    events_.clear();
}

} // namespace codekata
