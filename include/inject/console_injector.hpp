#ifndef CONSOLE_INJECTOR_HPP
#define CONSOLE_INJECTOR_HPP

#include "inject/text_injector.hpp"

#include <iosfwd>
#include <mutex>

// Prints transcripts instead of typing them. Used headless and in tests.
class ConsoleTextInjector : public TextInjector {
public:
    explicit ConsoleTextInjector(std::ostream& out);

    bool inject(const std::string& text) override;
    WindowHandle activeWindow() override { return 0; }
    bool focusWindow(WindowHandle /*window*/) override { return false; }

private:
    std::mutex mutex_;
    std::ostream& out_;
};

#endif
