#include "gatenet/core_utils.hpp"

#include <ctime>
#include <limits>
#include <sstream>
#include <stdexcept>

using std::numeric_limits;
using std::ostringstream;
using std::runtime_error;
using std::size_t;
using std::string;
using std::vector;

void multiplication_overflow_check(const size_t a, const size_t b, const char* error_msg)
{
    if (a != 0 && b > numeric_limits<size_t>::max() / a) {
        throw runtime_error(error_msg);
    }
}

// std::gmtime shares a static buffer, so use the reentrant platform variant
static bool to_utc(std::time_t t, std::tm& out)
{
#ifdef _WIN32
    return gmtime_s(&out, &t) == 0;
#else
    return gmtime_r(&t, &out) != nullptr;
#endif
}

string utc_timestamp_iso8601()
{
    const std::time_t now = std::time(nullptr);
    std::tm utc{};
    if (!to_utc(now, utc)) {
        throw runtime_error("utc_timestamp_iso8601: failed to convert current time");
    }

    char buffer[32];
    const size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    if (written == 0) {
        throw runtime_error("utc_timestamp_iso8601: failed to format current time");
    }

    return string(buffer, written);
}

string format_architecture(const vector<size_t>& architecture)
{
    ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < architecture.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << architecture[i];
    }
    oss << ']';
    return oss.str();
}
