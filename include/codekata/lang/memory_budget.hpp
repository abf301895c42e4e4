#pragma once

#include <codekata/common/class_traits.hpp>

#include <cstddef>
#include <new>

namespace codekata::lang {

/// Thrown when a reservation would push a budget past its ceiling.
/// Derives from std::bad_alloc so that it is handled exactly like a real allocation failure.
class ResourceLimitError : public std::bad_alloc
{
public:
    const char* what() const noexcept override { return "memory budget exceeded"; }
};

/// Live-byte accounting for the values of one interpreter.
///
/// Every heap-backed value holds a ``Reservation`` for its approximate footprint,
/// released when the value dies. Not thread safe; an interpreter is single threaded.
class MemoryBudget : NonMovable
{
public:
    class Reservation;

    explicit MemoryBudget(std::size_t ceiling);

    /// Reserves ``bytes`` or throws ResourceLimitError
    Reservation reserve(std::size_t bytes);

    /// Throws ResourceLimitError if ``bytes`` more could not be reserved right now.
    /// Used before building something large, so the real allocation never happens.
    void ensure_available(std::size_t bytes) const;

    std::size_t used() const { return used_; }

    std::size_t peak() const { return peak_; }

    std::size_t ceiling() const { return ceiling_; }

private:
    void release(std::size_t bytes) noexcept;

    std::size_t ceiling_;
    std::size_t used_ = 0;
    std::size_t peak_ = 0;
};

class MemoryBudget::Reservation : NonCopyable
{
public:
    Reservation() = default;

    Reservation(Reservation&& other) noexcept;
    Reservation& operator=(Reservation&& rhs) noexcept;

    ~Reservation();

    std::size_t size() const { return bytes_; }

private:
    friend class MemoryBudget;

    Reservation(MemoryBudget* budget, std::size_t bytes)
        : budget_{budget}
        , bytes_{bytes} {}

    MemoryBudget* budget_ = nullptr;
    std::size_t bytes_ = 0;
};

/// Reserve against ``budget`` if there is one; an absent budget is unlimited
MemoryBudget::Reservation reserve_in(MemoryBudget* budget, std::size_t bytes);

} // namespace codekata::lang
