#include <execbox/sandbox/admission_gate.hpp>

#include <execbox/logging.hpp>

#include <libassert/assert.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>

namespace execbox {

AdmissionGate::Slot::Slot(Slot&& other) noexcept
    : gate_{std::exchange(other.gate_, nullptr)} {}

AdmissionGate::Slot& AdmissionGate::Slot::operator=(Slot&& rhs) noexcept {
    if (this != &rhs) {
        if (gate_ != nullptr) {
            gate_->release();
        }
        gate_ = std::exchange(rhs.gate_, nullptr);
    }

    return *this;
}

AdmissionGate::Slot::~Slot() {
    // nullptr if moved from
    if (gate_ != nullptr) {
        gate_->release();
    }
}

AdmissionGate::AdmissionGate(std::size_t capacity)
    : capacity_{capacity} {
    ASSERT(capacity > 0, "An admission gate needs at least one slot");
}

AdmissionGate::Slot AdmissionGate::acquire() {
    std::unique_lock lock{mutex_};

    if (in_use_ == capacity_) {
        LOG_DEBUG("All {} execution slots are taken; waiting", capacity_);
    }

    slot_freed_.wait(lock, [this] { return in_use_ < capacity_; });
    ++in_use_;

    return Slot{*this};
}

std::optional<AdmissionGate::Slot> AdmissionGate::try_acquire() {
    std::scoped_lock lock{mutex_};

    if (in_use_ == capacity_) {
        return std::nullopt;
    }

    ++in_use_;

    return Slot{*this};
}

std::size_t AdmissionGate::in_use() const {
    std::scoped_lock lock{mutex_};
    return in_use_;
}

void AdmissionGate::release() {
    {
        std::scoped_lock lock{mutex_};
        DEBUG_ASSERT(in_use_ > 0);
        --in_use_;
    }

    slot_freed_.notify_one();
}

} // namespace execbox
