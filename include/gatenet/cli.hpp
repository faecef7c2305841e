#pragma once

#include <ostream>
#include <string>
#include <vector>

constexpr const char* GATENET_VERSION = "0.1.0";

// args excludes the program name. Returns the process exit status.
int run_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

// Set from a signal handler; a running train/resume command stops after the
// current epoch and writes its checkpoint.
void request_interrupt();
bool interrupt_requested();
void reset_interrupt();
