#include "inject/console_injector.hpp"

#include <ostream>

// Constructor
ConsoleTextInjector::ConsoleTextInjector(std::ostream& out) : out_(out) {}

bool ConsoleTextInjector::inject(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "\n----- Transcription -----\n" << text << "\n-------------------------\n" << std::endl;
    return (bool)out_;
}
