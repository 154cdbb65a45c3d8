#pragma once

namespace platform {

// Connects to the PipeWire core and disconnects again.
// Returns false if no PipeWire daemon accepts the connection.
bool pipewire_reachable();

} // namespace platform
