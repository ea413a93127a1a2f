#ifndef CAPTURE_HPP
#define CAPTURE_HPP

#include "USBAdapter.hpp"
#include "Config.hpp"
#include <memory>

// Opens the camera, arms FileIO and Frame, reads one config payload and
// options.frame_count frame payloads and dumps them. Returns the exit code.
int run_capture(std::unique_ptr<USBAdapter> adapter, const RunOptions &options);

#endif
