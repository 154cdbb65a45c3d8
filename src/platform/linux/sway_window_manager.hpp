#pragma once

#include "platform/window_manager.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

// Focus tracking over the sway IPC socket. The socket path comes from the
// host probe's $SWAYSOCK when the candidate list is built.
class SwayWindowManager : public WindowManager {
public:
    explicit SwayWindowManager(std::string socket_path);
    ~SwayWindowManager() override;

    SwayWindowManager(const SwayWindowManager&) = delete;
    SwayWindowManager& operator=(const SwayWindowManager&) = delete;

    const char* name() const override { return "sway"; }
    bool available(const HostProbe& probe) const override;
    std::optional<WindowInfo> focused_window() override;
    bool focus(const WindowInfo& window) override;

    // Depth-first search of a GET_TREE reply for the focused node.
    static WindowInfo find_focused(const nlohmann::json& node);

private:
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_RUN_COMMAND = 0;
    static constexpr uint32_t MSG_GET_TREE = 4;

    bool connect();
    bool request(uint32_t type, const std::string& payload, std::string& reply);
    bool send_message(int fd, uint32_t type, const std::string& payload = "");
    bool recv_message(int fd, uint32_t& type, std::string& payload);
    int connect_socket(const std::string& path);

    std::string socket_path_;
    int query_fd_ = -1;
};
