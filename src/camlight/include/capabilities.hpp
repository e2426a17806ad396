#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "color.hpp"
#include "frame.hpp"

// Camera. Only AcquisitionLoop calls capture(), never concurrently.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    // Fills frame.image/format; the caller assigns the sequence number.
    virtual bool capture(Frame& frame, std::string& err) = 0;
};

// RGB light. Calls are serialized by DeviceController.
class OutputDevice {
public:
    virtual ~OutputDevice() = default;
    virtual bool write(const Rgb& color, std::string& err) = 0;
};

struct Notification {
    std::string title;
    std::string message;
    bool auto_mode = false;               // lets the recipient tell auto from manual changes
    std::vector<unsigned char> attachment; // JPEG, may be empty
};

// Push notification transport. Must give up after `timeout`.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual bool send(const Notification& n, std::chrono::milliseconds timeout, std::string& err) = 0;
};
