#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace message_output {

// "512 bytes", "1.5 KB", "2.25 MB", "1 GB"
std::string toSizeString(uint64_t bytes);

// "1 message", "3 messages"
std::string messageCountString(uint64_t count);

// "1h 2m 3s 4ms"; zero units are omitted except milliseconds
std::string elapsedTimeString(std::chrono::milliseconds elapsed);

} // namespace message_output
