#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>

namespace util {

void setup_logging(const std::string& level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("pagewatch", console_sink);
    spdlog::set_default_logger(logger);

    // from_str maps unknown names to off
    auto parsed = spdlog::level::from_str(level);
    if (parsed == spdlog::level::off && level != "off") {
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::flush_on(spdlog::level::info);
}

std::string get_env_var(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : default_value;
}

std::string read_secret(const std::string& file_env, const std::string& value_env,
                        const std::string& default_value) {
    const char* file_path = std::getenv(file_env.c_str());
    if (file_path) {
        std::ifstream file(file_path);
        if (file.is_open()) {
            std::string content;
            std::getline(file, content);
            return trim(content);
        }
        spdlog::warn("{} points to unreadable file '{}', ignoring it", file_env, file_path);
    }

    const char* value = std::getenv(value_env.c_str());
    if (value) {
        return std::string(value);
    }

    return default_value;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    auto end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string base64_encode(const std::string& data) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        unsigned int chunk = (static_cast<unsigned char>(data[i]) << 16) |
                             (static_cast<unsigned char>(data[i + 1]) << 8) |
                             static_cast<unsigned char>(data[i + 2]);
        encoded += alphabet[(chunk >> 18) & 0x3F];
        encoded += alphabet[(chunk >> 12) & 0x3F];
        encoded += alphabet[(chunk >> 6) & 0x3F];
        encoded += alphabet[chunk & 0x3F];
    }

    size_t remaining = data.size() - i;
    if (remaining > 0) {
        unsigned int chunk = static_cast<unsigned char>(data[i]) << 16;
        if (remaining == 2) {
            chunk |= static_cast<unsigned char>(data[i + 1]) << 8;
        }
        encoded += alphabet[(chunk >> 18) & 0x3F];
        encoded += alphabet[(chunk >> 12) & 0x3F];
        encoded += remaining == 2 ? alphabet[(chunk >> 6) & 0x3F] : '=';
        encoded += '=';
    }
    return encoded;
}

std::string format_rfc5322_date(const std::chrono::system_clock::time_point& tp) {
    // Day and month names must not follow the user locale
    static const char* const days[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = *std::gmtime(&time_t);

    std::stringstream ss;
    ss << days[tm.tm_wday] << ", "
       << std::setfill('0') << std::setw(2) << tm.tm_mday << ' '
       << months[tm.tm_mon] << ' '
       << (tm.tm_year + 1900) << ' '
       << std::setw(2) << tm.tm_hour << ':'
       << std::setw(2) << tm.tm_min << ':'
       << std::setw(2) << tm.tm_sec << " +0000";
    return ss.str();
}

std::string executable_dir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && exe.has_parent_path()) {
        return exe.parent_path().string();
    }

    spdlog::debug("Could not resolve executable path ({}), using working directory", ec.message());
    return std::filesystem::current_path().string();
}

bool interruptible_sleep(std::chrono::seconds duration, const std::atomic<bool>& stop_flag) {
    auto wake_up_time = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < wake_up_time) {
        if (stop_flag) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return !stop_flag;
}

} // namespace util
