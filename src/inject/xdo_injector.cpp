#include "inject/xdo_injector.hpp"
#include "core/log.hpp"

extern "C" {
#include <xdo.h>
}

#include <stdexcept>

// Constructor
XdoTextInjector::XdoTextInjector(unsigned int keyDelayUs) : keyDelayUs_(keyDelayUs) {
    xdo_ = xdo_new(nullptr);
    if (!xdo_) throw std::runtime_error("Failed to create xdo handle (is DISPLAY set?)");
}

// Destructor
XdoTextInjector::~XdoTextInjector() {
    if (xdo_) xdo_free(xdo_);
}

bool XdoTextInjector::inject(const std::string& text) {
    if (text.empty()) return true;

    std::lock_guard<std::mutex> lock(mutex_);
    const int rc = xdo_enter_text_window(xdo_, CURRENTWINDOW, text.c_str(), keyDelayUs_);
    if (rc != XDO_SUCCESS) {
        logError("Injector", "xdo_enter_text_window failed");
        return false;
    }
    return true;
}

WindowHandle XdoTextInjector::activeWindow() {
    std::lock_guard<std::mutex> lock(mutex_);
    Window window = 0;
    if (xdo_get_active_window(xdo_, &window) != XDO_SUCCESS) {
        logWarn("Injector", "Could not get active window");
        return 0;
    }
    return (WindowHandle)window;
}

bool XdoTextInjector::focusWindow(WindowHandle window) {
    if (window == 0) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (xdo_activate_window(xdo_, (Window)window) != XDO_SUCCESS) {
        logWarn("Injector", "xdo_activate_window failed");
        return false;
    }
    if (xdo_wait_for_window_active(xdo_, (Window)window, 1) != XDO_SUCCESS) {
        logWarn("Injector", "Window did not become active");
        return false;
    }
    return true;
}
