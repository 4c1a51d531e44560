#include "core/ActionGate.h"

bool ActionGate::tryBeginDetection() {
    bool expected = false;
    return detection_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void ActionGate::endDetection() {
    detection_.store(false, std::memory_order_release);
}

bool ActionGate::tryOpenDialog() {
    bool expected = false;
    return dialog_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
}

void ActionGate::closeDialog() {
    dialog_.store(false, std::memory_order_release);
}
