#ifndef TEXT_INJECTOR_HPP
#define TEXT_INJECTOR_HPP

#include <string>

// Native window id; 0 means unknown.
using WindowHandle = unsigned long;

// Delivers recognised text to the user's application.
class TextInjector {
public:
    virtual ~TextInjector() = default;

    virtual bool inject(const std::string& text) = 0;
    virtual WindowHandle activeWindow() = 0;
    virtual bool focusWindow(WindowHandle window) = 0;
};

#endif
