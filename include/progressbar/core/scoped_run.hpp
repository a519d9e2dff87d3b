#pragma once

#include "progress_bar.hpp"

namespace progressbar {
namespace core {

// Times a block of work: restarts the clock on construction and closes the
// bar on destruction, including while an exception is unwinding the stack.
class ScopedRun {
public:
    explicit ScopedRun(ProgressBar& bar) : bar_(bar) { bar_.enter(); }
    ~ScopedRun() { bar_.exit(); }

    ScopedRun(const ScopedRun&) = delete;
    ScopedRun& operator=(const ScopedRun&) = delete;

private:
    ProgressBar& bar_;
};

}}
