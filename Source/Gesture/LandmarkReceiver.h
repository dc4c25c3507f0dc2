#pragma once

#include "HandLandmarks.h"
#include "../Core/InteractionCell.h"
#include <juce_core/juce_core.h>
#include <atomic>
#include <memory>

namespace nebula {

// ============================================================
// LandmarkReceiver — UDP/OSC landmark source on its own thread.
// Each valid datagram is run through the GestureSignalExtractor
// and written to the interaction cell. If the detector goes
// quiet for trackingTimeoutMs, a neutral sample is written once.
// ============================================================
class LandmarkReceiver : private juce::Thread {
public:
    explicit LandmarkReceiver(InteractionCell& cell);
    ~LandmarkReceiver() override;

    // Bind the port and start the thread. Returns false if the port
    // could not be bound; the cell is left untouched in that case.
    bool start(int port, int trackingTimeoutMs = 500);
    void stop();

    bool isRunning() const { return isThreadRunning(); }

    // Hands that passed validation in the latest frame (0 when lost)
    int getTrackedHands() const { return trackedHands_.load(std::memory_order_acquire); }

    uint64_t getFramesAccepted() const { return framesAccepted_.load(std::memory_order_relaxed); }
    uint64_t getFramesRejected() const { return framesRejected_.load(std::memory_order_relaxed); }

    // Datagram and timeout handling, callable without a socket
    bool handleDatagram(const uint8_t* data, int length, double nowMs);
    void checkTimeout(double nowMs);

    void setTrackingTimeoutMs(int ms) { trackingTimeoutMs_ = ms; }

private:
    void run() override;

    InteractionCell& cell_;
    std::unique_ptr<juce::DatagramSocket> socket_;
    int trackingTimeoutMs_ = 500;

    double lastFrameMs_ = 0.0;
    bool timedOut_ = true;

    std::atomic<int> trackedHands_ {0};
    std::atomic<uint64_t> framesAccepted_ {0};
    std::atomic<uint64_t> framesRejected_ {0};

    JUCE_DECLARE_NON_COPYABLE(LandmarkReceiver)
};

} // namespace nebula
