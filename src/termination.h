#pragma once

namespace sous {

// Install SIGINT/SIGTERM handlers (SetConsoleCtrlHandler on Windows). The first
// signal only records a request, observable through termination_requested(); a
// second signal exits immediately with code 130.
void termination_handler_install();

bool termination_requested();

}  // namespace sous
