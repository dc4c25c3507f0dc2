#pragma once

#include "../Model/Interaction.h"
#include <juce_core/juce_core.h>
#include <atomic>
#include <cstdint>

namespace nebula {

// ============================================================
// InteractionCell — single-slot, last-write-wins hand-off between
// the landmark thread (writer) and the animation tick (reader).
// Whole-struct write / whole-struct read under one SpinLock.
// ============================================================
class InteractionCell {
public:
    InteractionCell() = default;

    void write(const InteractionSample& sample)
    {
        {
            juce::SpinLock::ScopedLockType lock(lock_);
            sample_ = sample;
        }
        writeCount_.fetch_add(1, std::memory_order_relaxed);
    }

    InteractionSample read() const
    {
        juce::SpinLock::ScopedLockType lock(lock_);
        return sample_;
    }

    void reset() { write(InteractionSample::neutral()); }

    uint64_t getWriteCount() const { return writeCount_.load(std::memory_order_relaxed); }

private:
    InteractionSample sample_;
    mutable juce::SpinLock lock_;
    std::atomic<uint64_t> writeCount_ {0};

    JUCE_DECLARE_NON_COPYABLE(InteractionCell)
};

} // namespace nebula
