#include "platform/linux/pipewire_probe.hpp"

#include <pipewire/pipewire.h>
#include <print>

namespace platform {

bool pipewire_reachable() {
    pw_init(nullptr, nullptr);

    pw_main_loop* loop = pw_main_loop_new(nullptr);
    if (!loop) {
        std::println(stderr, "pipewire: failed to create main loop");
        pw_deinit();
        return false;
    }

    pw_context* context = pw_context_new(pw_main_loop_get_loop(loop), nullptr, 0);
    pw_core* core = nullptr;
    if (context) {
        core = pw_context_connect(context, nullptr, 0);
    }

    bool reachable = core != nullptr;

    if (core) pw_core_disconnect(core);
    if (context) pw_context_destroy(context);
    pw_main_loop_destroy(loop);
    pw_deinit();

    return reachable;
}

} // namespace platform
