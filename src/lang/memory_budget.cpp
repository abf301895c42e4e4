#include <codekata/lang/memory_budget.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace codekata::lang {

MemoryBudget::MemoryBudget(std::size_t ceiling)
    : ceiling_{ceiling} {}

MemoryBudget::Reservation MemoryBudget::reserve(std::size_t bytes) {
    ensure_available(bytes);

    used_ += bytes;
    peak_ = std::max(peak_, used_);

    return {this, bytes};
}

void MemoryBudget::ensure_available(std::size_t bytes) const {
    if (bytes > ceiling_ || used_ > ceiling_ - bytes) {
        throw ResourceLimitError{};
    }
}

void MemoryBudget::release(std::size_t bytes) noexcept {
    used_ -= std::min(used_, bytes);
}

MemoryBudget::Reservation::Reservation(Reservation&& other) noexcept
    : NonCopyable{}
    , budget_{std::exchange(other.budget_, nullptr)}
    , bytes_{std::exchange(other.bytes_, 0)} {}

MemoryBudget::Reservation& MemoryBudget::Reservation::operator=(Reservation&& rhs) noexcept {
    if (this != &rhs) {
        if (budget_ != nullptr) {
            budget_->release(bytes_);
        }
        budget_ = std::exchange(rhs.budget_, nullptr);
        bytes_ = std::exchange(rhs.bytes_, 0);
    }
    return *this;
}

MemoryBudget::Reservation::~Reservation() {
    if (budget_ != nullptr) {
        budget_->release(bytes_);
    }
}

MemoryBudget::Reservation reserve_in(MemoryBudget* budget, std::size_t bytes) {
    if (budget == nullptr) {
        return {};
    }
    return budget->reserve(bytes);
}

} // namespace codekata::lang
