#pragma once

namespace platform {

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Non-blocking existence probe: kill(pid, 0). A process we may not signal
// (EPERM) still exists. pid <= 0 never exists.
bool process_exists(int pid);

// Pid of the process that spawned us.
int parent_pid();

} // namespace platform
