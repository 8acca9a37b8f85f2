#include "socket_util.hpp"

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <netinet/tcp.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error) {
    init_networking();

    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == SHUTTLE_INVALID_SOCKET) {
        error = "Failed to create socket";
        return SHUTTLE_INVALID_SOCKET;
    }

    set_nonblocking(sock);

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        struct addrinfo hints;
        std::memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo* info = nullptr;
        if (getaddrinfo(host.c_str(), nullptr, &hints, &info) != 0 || !info) {
            close_socket(sock);
            error = "Failed to resolve host: " + host;
            return SHUTTLE_INVALID_SOCKET;
        }
        addr.sin_addr = reinterpret_cast<struct sockaddr_in*>(info->ai_addr)->sin_addr;
        freeaddrinfo(info);
    }

    int ret = connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        error = "Failed to connect: " + std::string(strerror(errno));
        close_socket(sock);
        return SHUTTLE_INVALID_SOCKET;
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(sock);
            error = "Connection timed out: " + host;
            return SHUTTLE_INVALID_SOCKET;
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            error = "Connection failed: " + std::string(strerror(sock_err));
            return SHUTTLE_INVALID_SOCKET;
        }
    }

    return sock;
}

void enable_tcp_keepalive(socket_t sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, reinterpret_cast<const char*>(&tcp_keepalive), sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, reinterpret_cast<const char*>(&keepidle), sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    int keepintvl = 15;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, reinterpret_cast<const char*>(&keepintvl), sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    int keepcnt = 4;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, reinterpret_cast<const char*>(&keepcnt), sizeof(keepcnt));
#endif
}

} // namespace platform
