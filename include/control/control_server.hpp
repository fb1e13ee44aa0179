#ifndef CONTROL_SERVER_HPP
#define CONTROL_SERVER_HPP

#include <functional>
#include <string>
#include <thread>
#include <atomic>
#include <cstdint>
#include <mutex>

#ifdef _WIN32
  #include <winsock2.h>
  using socket_t = SOCKET;
  static constexpr socket_t kInvalidSocket = INVALID_SOCKET;
#else
  using socket_t = int;
  static constexpr socket_t kInvalidSocket = -1;
#endif

// UDP command endpoint for hotkey daemons and scripts, e.g.
//   echo toggle_listening | nc -u -w1 127.0.0.1 3939
// Each datagram is one command; the handler's reply goes back to the sender.
class ControlServer {
public:
    using Handler = std::function<std::string(const std::string& command)>;

    ControlServer(std::string bind_ip, int port, Handler handler);
    ~ControlServer();

    // Binds on the calling thread so errors surface here. Throws std::runtime_error.
    void start();
    void stop();

    bool running() const { return running_.load(); }
    uint16_t boundPort() const { return bound_port_; }

    bool sendTo(const std::string& ip, uint16_t port, const std::string& payload);

private:
    void run();

    std::string bind_ip_;
    int port_;
    Handler handler_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex sock_mutex_;
    socket_t sock_{kInvalidSocket};
    uint16_t bound_port_{0};
};

// Strips whitespace and lower-cases a raw datagram.
std::string normalizeCommand(const std::string& raw);

#endif
