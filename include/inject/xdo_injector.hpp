#ifndef XDO_INJECTOR_HPP
#define XDO_INJECTOR_HPP

#include "inject/text_injector.hpp"

#include <mutex>

struct xdo;

// Types text into X11 windows through libxdo.
class XdoTextInjector : public TextInjector {
public:
    // Throws std::runtime_error when no X display is available.
    explicit XdoTextInjector(unsigned int keyDelayUs = 12000);
    ~XdoTextInjector() override;

    XdoTextInjector(const XdoTextInjector&) = delete;
    XdoTextInjector& operator=(const XdoTextInjector&) = delete;

    bool inject(const std::string& text) override;
    WindowHandle activeWindow() override;
    bool focusWindow(WindowHandle window) override;

private:
    std::mutex mutex_;
    xdo* xdo_ = nullptr;
    unsigned int keyDelayUs_;
};

#endif
