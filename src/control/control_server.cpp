#include "control/control_server.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <utility>

#ifdef _WIN32
  #include <ws2tcpip.h>
#else
  #include <cerrno>
  #include <arpa/inet.h>
  #include <sys/socket.h>
  #include <netinet/in.h>
  #include <unistd.h>
#endif

#ifdef _WIN32
static void closesock(socket_t s) { ::closesocket(s); }
static std::string lastSocketError() { return std::to_string(WSAGetLastError()); }
#else
static void closesock(socket_t s) { ::close(s); }
static std::string lastSocketError() { return std::strerror(errno); }
#endif

static const char* kComponent = "Control";

std::string normalizeCommand(const std::string& raw) {
    std::string out;
    for (char c : raw) {
        if (!std::isspace((unsigned char)c)) out.push_back((char)std::tolower((unsigned char)c));
    }
    return out;
}

// Constructor
ControlServer::ControlServer(std::string bind_ip, int port, Handler handler)
    : bind_ip_(std::move(bind_ip)), port_(port), handler_(std::move(handler)) {}

// Destructor
ControlServer::~ControlServer() { stop(); }

// Opens the socket and starts the receive thread
void ControlServer::start() {
    if (running_.load()) return;

#ifdef _WIN32
    WSADATA wsa{};
    if (WSAStartup(MAKEWORD(2, 2), &wsa) != 0) throw std::runtime_error("WSAStartup failed");
#endif

    socket_t s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s == kInvalidSocket) throw std::runtime_error("control socket() failed: " + lastSocketError());

    int reuse = 1;
#ifdef _WIN32
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, (const char*)&reuse, sizeof(reuse));
#else
    ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));

    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        closesock(s);
        throw std::runtime_error("control server: invalid bind ip: " + bind_ip_);
    }

    if (::bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string err = lastSocketError();
        closesock(s);
        throw std::runtime_error("control bind() failed: " + err);
    }

    sockaddr_in bound{};
#ifdef _WIN32
    int blen = sizeof(bound);
#else
    socklen_t blen = sizeof(bound);
#endif
    if (::getsockname(s, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) bound_port_ = ntohs(bound.sin_port);

    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        sock_ = s;
    }
    running_ = true;
    thread_ = std::thread(&ControlServer::run, this);

    logInfo(kComponent, "Listening for commands on udp://" + bind_ip_ + ":" + std::to_string(bound_port_));
}

// Stops the receive thread
void ControlServer::stop() {
    if (!running_.exchange(false)) return;

    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        if (sock_ != kInvalidSocket) {
#ifdef _WIN32
            ::shutdown(sock_, SD_BOTH);
#else
            ::shutdown(sock_, SHUT_RDWR);
#endif
        }
    }

    if (thread_.joinable()) thread_.join();

    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        if (sock_ != kInvalidSocket) {
            closesock(sock_);
            sock_ = kInvalidSocket;
        }
    }

#ifdef _WIN32
    WSACleanup();
#endif
}

// Sends a payload to an ip and port
bool ControlServer::sendTo(const std::string& ip, uint16_t port, const std::string& payload) {
    std::lock_guard<std::mutex> lock(sock_mutex_);
    if (sock_ == kInvalidSocket) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        return false;
    }

#ifdef _WIN32
    int n = ::sendto(sock_, payload.data(), (int)payload.size(), 0,
                     reinterpret_cast<sockaddr*>(&addr), (int)sizeof(addr));
    return n == (int)payload.size();
#else
    ssize_t n = ::sendto(sock_, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    return n == (ssize_t)payload.size();
#endif
}

// Thread function that receives commands and answers each sender
void ControlServer::run() {
    socket_t s;
    {
        std::lock_guard<std::mutex> lock(sock_mutex_);
        s = sock_;
    }

    while (running_.load()) {
        char buff[2048];
        sockaddr_in src{};
#ifdef _WIN32
        int slen = sizeof(src);
        const int n = ::recvfrom(s, buff, (int)sizeof(buff) - 1, 0,
                                reinterpret_cast<sockaddr*>(&src), &slen);
#else
        socklen_t slen = sizeof(src);
        const ssize_t n = ::recvfrom(s, buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
#endif

        if (n <= 0) break;
        buff[n] = '\0';

        char ipstr[INET_ADDRSTRLEN]{};
        const char* ok = ::inet_ntop(AF_INET, &src.sin_addr, ipstr, sizeof(ipstr));
        const std::string senderIp = ok ? std::string(ipstr) : std::string("127.0.0.1");
        const uint16_t senderPort = ntohs(src.sin_port);

        const std::string command = normalizeCommand(std::string(buff));
        logDebug(kComponent, "Command '" + command + "' from " + senderIp + ":" + std::to_string(senderPort));

        std::string reply;
        try {
            if (handler_) reply = handler_(command);
        } catch (const std::exception& e) {
            logError(kComponent, std::string("Command handler threw: ") + e.what());
            reply = "{\"type\":\"error\",\"message\":\"internal error\"}";
        }

        if (!reply.empty() && !sendTo(senderIp, senderPort, reply)) {
            logWarn(kComponent, "Could not send reply to " + senderIp);
        }
    }
}
