#pragma once

#include <codekata/grading/grading_spec.hpp>

#include <cstdint>
#include <string>

namespace codekata {

using UserId = std::int64_t;
using LessonId = std::int64_t;

struct Lesson
{
    LessonId id;
    std::string title;
    int order_index; ///< 1-based position in the course; unique
    GradingSpec grading_spec;
    Difficulty difficulty = Difficulty::Unspecified;

    bool operator==(const Lesson&) const = default;
};

} // namespace codekata
