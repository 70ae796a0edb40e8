#pragma once

#include <execbox/common/class_traits.hpp>

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

namespace execbox {

/// Counting admission gate bounding how many executions may run on the host at once.
///
/// A slot is acquired before a process is spawned and released when the returned
/// ``Slot`` is destroyed, i.e., after the run has been torn down.
class AdmissionGate : NonMovable
{
public:
    class Slot : NonCopyable
    {
    public:
        Slot(Slot&& other) noexcept;
        Slot& operator=(Slot&& rhs) noexcept;
        ~Slot();

    private:
        friend class AdmissionGate;

        explicit Slot(AdmissionGate& gate)
            : gate_{&gate} {}

        AdmissionGate* gate_;
    };

    explicit AdmissionGate(std::size_t capacity);

    /// Blocks until a slot is free
    [[nodiscard]] Slot acquire();

    /// Returns std::nullopt instead of blocking when every slot is taken
    [[nodiscard]] std::optional<Slot> try_acquire();

    std::size_t capacity() const { return capacity_; }

    std::size_t in_use() const;

private:
    void release();

    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable slot_freed_;
    std::size_t in_use_{};
};

} // namespace execbox
