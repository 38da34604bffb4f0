#pragma once

#include <functional>

namespace dispatch {

using Task = std::function<void()>;

// Schedules a task on the control (UI) thread. Must be callable from any thread.
using Dispatcher = std::function<void(Task)>;

} // namespace dispatch
