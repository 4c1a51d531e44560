#pragma once

#include <atomic>

// Tray state shared by menu actions: at most one folder launch in flight and at
// most one modal dialog open. Open actions are usable only while neither is active.
class ActionGate {
public:
    bool tryBeginDetection();
    void endDetection();
    bool tryOpenDialog();
    void closeDialog();

    bool detectionRunning() const { return detection_.load(std::memory_order_acquire); }
    bool dialogOpen() const { return dialog_.load(std::memory_order_acquire); }

    bool canOpen() const { return !detectionRunning() && !dialogOpen(); }
    bool canConfigure() const { return !dialogOpen(); }

private:
    std::atomic_bool detection_{false};
    std::atomic_bool dialog_{false};
};
