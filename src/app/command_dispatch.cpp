#include "app/command_dispatch.hpp"

std::string statusReply(Controller::State state) {
    return std::string("{\"type\":\"status\",\"state\":\"") + controllerStateName(state) + "\"}";
}

std::string dispatchCommand(Controller& controller, const std::string& command, bool& quit) {
    if (command == "r" || command == "toggle_recording") controller.toggleRecording();
    else if (command == "l" || command == "toggle_listening") controller.toggleListening();
    else if (command == "start_recording") controller.startRecording();
    else if (command == "stop_recording") controller.stopRecording();
    else if (command == "start_listening") controller.startListening();
    else if (command == "stop_listening") controller.stopListening();
    else if (command == "stop") controller.stop();
    else if (command == "q" || command == "quit") quit = true;
    else if (command != "s" && command != "status") {
        return "{\"type\":\"error\",\"message\":\"unknown command\"}";
    }
    return statusReply(controller.state());
}
