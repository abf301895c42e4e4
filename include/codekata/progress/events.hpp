#pragma once

#include <codekata/progress/lesson.hpp>
#include <codekata/progress/progress_stats.hpp>

#include <string>
#include <string_view>
#include <variant>

namespace codekata {

struct LessonCompleted
{
    UserId user_id;
    LessonId lesson_id;
    std::string lesson_title;

    bool operator==(const LessonCompleted&) const = default;
};

struct LessonUnlocked
{
    UserId user_id;
    LessonId lesson_id;
    std::string lesson_title;

    bool operator==(const LessonUnlocked&) const = default;
};

struct StatsUpdated
{
    UserId user_id;
    ProgressStats stats;

    bool operator==(const StatsUpdated&) const = default;
};

struct GlobalStatsUpdated
{
    GlobalStats stats;

    bool operator==(const GlobalStatsUpdated&) const = default;
};

struct LessonStatsUpdated
{
    LessonStats stats;

    bool operator==(const LessonStatsUpdated&) const = default;
};

/// Events never carry submitted source code
using ProgressEvent =
    std::variant<LessonCompleted, LessonUnlocked, StatsUpdated, GlobalStatsUpdated, LessonStatsUpdated>;

namespace topics {

/// "user_progress:<user>"
std::string user_progress(UserId user);

inline constexpr std::string_view GLOBAL_PROGRESS = "global_progress";
inline constexpr std::string_view PROGRESS_STATS = "progress_stats";

} // namespace topics

class EventSink
{
public:
    virtual ~EventSink() = default;

    virtual void publish(std::string_view topic, const ProgressEvent& event) = 0;

protected:
    EventSink() = default;
    EventSink(const EventSink&) = default;
    EventSink(EventSink&&) = default;
    EventSink& operator=(const EventSink&) = default;
    EventSink& operator=(EventSink&&) = default;
};

} // namespace codekata
