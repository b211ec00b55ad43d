/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

void LogHub::init(int queueLen) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queueLen <= 0 || queueLen > (int)Limits::LogQueueLen) queueLen = Limits::LogQueueLen;
    len_ = queueLen;
    head_ = 0;
    count_ = 0;
    dropped_ = 0;
}

bool LogHub::enqueue(const LogEntry& e) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (len_ == 0) return false;
    if (count_ >= len_) {
        ++dropped_;
        return false;
    }
    ring_[(head_ + count_) % len_] = e;
    ++count_;
    return true;
}

bool LogHub::dequeue(LogEntry& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (count_ == 0) return false;
    out = ring_[head_];
    head_ = (head_ + 1) % len_;
    --count_;
    return true;
}

uint32_t LogHub::dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
}
