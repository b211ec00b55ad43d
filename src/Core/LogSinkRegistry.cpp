/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    std::lock_guard<std::mutex> lock(mtx_);
    for (int i = 0; i < n_; ++i) {
        if (sinks_[i].write == sink.write && sinks_[i].ctx == sink.ctx) return false;
    }
    if (n_ >= (int)Limits::MaxLogSinks) return false;
    sinks_[n_++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return n_;
}

int LogSinkRegistry::deliver(const LogEntry& e) const {
    LogSinkService snapshot[Limits::MaxLogSinks];
    int n = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        n = n_;
        for (int i = 0; i < n; ++i) snapshot[i] = sinks_[i];
    }
    // written unlocked: a sink may register another sink from write()
    for (int i = 0; i < n; ++i) {
        snapshot[i].write(snapshot[i].ctx, e);
    }
    return n;
}
