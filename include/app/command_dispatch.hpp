#ifndef COMMAND_DISPATCH_HPP
#define COMMAND_DISPATCH_HPP

#include "app/controller.hpp"

#include <string>

// Maps one text command (menu key or control datagram) onto the Controller
// and returns the status reply, e.g. {"type":"status","state":"listening"}.
// Sets `quit` for "q" / "quit". Unknown commands get an error reply.
std::string dispatchCommand(Controller& controller, const std::string& command, bool& quit);

std::string statusReply(Controller::State state);

#endif
