#include "platform/linux/sway_window_manager.hpp"

#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

SwayWindowManager::SwayWindowManager(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

SwayWindowManager::~SwayWindowManager() {
    if (query_fd_ >= 0) ::close(query_fd_);
}

bool SwayWindowManager::available(const HostProbe& probe) const {
    return !probe.env("SWAYSOCK").empty();
}

std::optional<WindowInfo> SwayWindowManager::focused_window() {
    std::string reply;
    if (!request(MSG_GET_TREE, "", reply)) return std::nullopt;

    try {
        auto info = find_focused(nlohmann::json::parse(reply));
        if (info.window_id.empty()) return std::nullopt;
        return info;
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "sway: bad GET_TREE reply: {}", e.what());
        return std::nullopt;
    }
}

bool SwayWindowManager::focus(const WindowInfo& window) {
    if (window.window_id.empty()) return false;

    std::string reply;
    if (!request(MSG_RUN_COMMAND, "[con_id=" + window.window_id + "] focus", reply)) {
        return false;
    }

    try {
        auto j = nlohmann::json::parse(reply);
        return j.is_array() && !j.empty() && j[0].value("success", false);
    } catch (const nlohmann::json::exception& e) {
        std::println(stderr, "sway: bad RUN_COMMAND reply: {}", e.what());
        return false;
    }
}

bool SwayWindowManager::connect() {
    if (query_fd_ >= 0) return true;

    if (socket_path_.empty()) {
        std::println(stderr, "sway: $SWAYSOCK not set");
        return false;
    }

    query_fd_ = connect_socket(socket_path_);
    return query_fd_ >= 0;
}

bool SwayWindowManager::request(uint32_t type, const std::string& payload, std::string& reply) {
    if (!connect()) return false;

    uint32_t reply_type;
    if (!send_message(query_fd_, type, payload) || !recv_message(query_fd_, reply_type, reply)) {
        ::close(query_fd_);
        query_fd_ = -1;
        return false;
    }
    return reply_type == type;
}

int SwayWindowManager::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "sway: connect failed: {}", std::strerror(errno));
        ::close(fd);
        return -1;
    }

    // A wedged compositor must not hold up delivery
    timeval tv{.tv_sec = 2, .tv_usec = 0};
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    return fd;
}

bool SwayWindowManager::send_message(int fd, uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayWindowManager::recv_message(int fd, uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd, header + read_total, 14 - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd, payload.data() + read_total, len - read_total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}

WindowInfo SwayWindowManager::find_focused(const nlohmann::json& node) {
    if (node.value("focused", false)) {
        WindowInfo info;
        if (node.contains("id") && node["id"].is_number_integer()) {
            info.window_id = std::to_string(node["id"].get<int64_t>());
        }
        if (node.contains("app_id") && node["app_id"].is_string()) {
            info.app_id = node["app_id"].get<std::string>();
        }
        if (node.contains("window_properties")) {
            info.window_class = node["window_properties"].value("class", "");
        }
        if (node.contains("name") && node["name"].is_string()) {
            info.title = node["name"].get<std::string>();
        }
        info.pid = node.value("pid", 0);
        return info;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key)) continue;
        for (auto& child : node[key]) {
            auto info = find_focused(child);
            if (!info.empty()) return info;
        }
    }
    return {};
}
