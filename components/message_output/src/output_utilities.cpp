#include "message_output/output_utilities.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace message_output {

namespace {

// Two decimals at most, trailing zeros dropped
std::string formatScaled(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << std::round(value * 100.0) / 100.0;

    std::string text = out.str();
    text.erase(text.find_last_not_of('0') + 1);
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text;
}

} // namespace

std::string toSizeString(uint64_t bytes) {
    constexpr double kb = 1024.0;
    constexpr double mb = kb * 1024.0;
    constexpr double gb = mb * 1024.0;

    const double size = static_cast<double>(bytes);
    if (size >= gb) {
        return formatScaled(size / gb) + " GB";
    }
    if (size >= mb) {
        return formatScaled(size / mb) + " MB";
    }
    if (size >= kb) {
        return formatScaled(size / kb) + " KB";
    }
    return std::to_string(bytes) + " bytes";
}

std::string messageCountString(uint64_t count) {
    return std::to_string(count) + (count == 1 ? " message" : " messages");
}

std::string elapsedTimeString(std::chrono::milliseconds elapsed) {
    using namespace std::chrono;

    auto remaining = elapsed < milliseconds::zero() ? milliseconds::zero() : elapsed;

    const auto days = duration_cast<hours>(remaining).count() / 24;
    remaining -= hours(days * 24);
    const auto hrs = duration_cast<hours>(remaining);
    remaining -= hrs;
    const auto mins = duration_cast<minutes>(remaining);
    remaining -= mins;
    const auto secs = duration_cast<seconds>(remaining);
    remaining -= secs;

    std::ostringstream out;
    if (days > 0) out << days << "d ";
    if (hrs.count() > 0) out << hrs.count() << "h ";
    if (mins.count() > 0) out << mins.count() << "m ";
    if (secs.count() > 0) out << secs.count() << "s ";
    out << remaining.count() << "ms";
    return out.str();
}

} // namespace message_output
