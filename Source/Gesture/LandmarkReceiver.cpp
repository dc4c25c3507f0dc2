#include "LandmarkReceiver.h"
#include "LandmarkStream.h"
#include "GestureSignalExtractor.h"
#include <algorithm>
#include <vector>

namespace nebula {

static constexpr int PollIntervalMs = 50;

LandmarkReceiver::LandmarkReceiver(InteractionCell& cell)
    : juce::Thread("Landmark receiver"), cell_(cell)
{
}

LandmarkReceiver::~LandmarkReceiver()
{
    stop();
}

bool LandmarkReceiver::start(int port, int trackingTimeoutMs)
{
    if (isThreadRunning()) return true;

    socket_ = std::make_unique<juce::DatagramSocket>(false);
    if (!socket_->bindToPort(port)) {
        DBG("[receiver] Could not bind UDP port " + juce::String(port)
            + ", gestures disabled");
        socket_.reset();
        return false;
    }

    trackingTimeoutMs_ = trackingTimeoutMs;
    timedOut_ = true;
    trackedHands_.store(0, std::memory_order_release);

    startThread();
    DBG("[receiver] Listening for landmarks on UDP " + juce::String(port));
    return true;
}

void LandmarkReceiver::stop()
{
    if (!isThreadRunning() && !socket_) return;

    signalThreadShouldExit();
    if (socket_)
        socket_->shutdown();
    stopThread(2000);
    socket_.reset();
    trackedHands_.store(0, std::memory_order_release);
    DBG("[receiver] Stopped");
}

bool LandmarkReceiver::handleDatagram(const uint8_t* data, int length, double nowMs)
{
    std::vector<Hand> hands;
    if (!LandmarkStream::parse(data, length, hands)) {
        framesRejected_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    auto usable = GestureSignalExtractor::usableHands(hands);
    cell_.write(GestureSignalExtractor::extract(usable));

    int count = (int)std::min<size_t>(usable.size(), 2);
    int prev = trackedHands_.exchange(count, std::memory_order_acq_rel);
    if (prev == 0 && count > 0)
        DBG("[receiver] Tracking " + juce::String(count) + " hand(s)");

    lastFrameMs_ = nowMs;
    timedOut_ = false;
    framesAccepted_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

void LandmarkReceiver::checkTimeout(double nowMs)
{
    if (timedOut_ || trackingTimeoutMs_ <= 0) return;
    if (nowMs - lastFrameMs_ < (double)trackingTimeoutMs_) return;

    timedOut_ = true;
    trackedHands_.store(0, std::memory_order_release);
    cell_.reset();
    DBG("[receiver] No landmarks for " + juce::String(trackingTimeoutMs_) + " ms, tracking lost");
}

void LandmarkReceiver::run()
{
    std::vector<uint8_t> buffer((size_t)LandmarkStream::MaxDatagramBytes);

    while (!threadShouldExit()) {
        int ready = socket_->waitUntilReady(true, PollIntervalMs);
        if (threadShouldExit()) break;

        if (ready < 0) {
            DBG("[receiver] Socket error, receiver exiting");
            cell_.reset();
            break;
        }

        if (ready > 0) {
            int n = socket_->read(buffer.data(), LandmarkStream::MaxDatagramBytes, false);
            if (n > 0)
                handleDatagram(buffer.data(), n, juce::Time::getMillisecondCounterHiRes());
        }

        checkTimeout(juce::Time::getMillisecondCounterHiRes());
    }

    trackedHands_.store(0, std::memory_order_release);
}

} // namespace nebula
