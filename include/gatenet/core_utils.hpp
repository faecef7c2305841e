#pragma once

#include <cstddef>
#include <string>
#include <vector>

void multiplication_overflow_check(std::size_t a, std::size_t b, const char* error_msg);

// current UTC time as YYYY-MM-DDTHH:MM:SSZ
std::string utc_timestamp_iso8601();

std::string format_architecture(const std::vector<std::size_t>& architecture);
