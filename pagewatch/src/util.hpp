#pragma once
#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace util {

// Logging
void setup_logging(const std::string& level);

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// Reads the first line of the file named by file_env, else the value of value_env.
// Returns default_value when neither is set.
std::string read_secret(const std::string& file_env, const std::string& value_env,
                        const std::string& default_value);

// String utilities
std::string join(const std::vector<std::string>& parts, const std::string& separator);
std::string trim(const std::string& str);
std::string base64_encode(const std::string& data);

// Time utilities
std::string format_rfc5322_date(const std::chrono::system_clock::time_point& tp);

// Directory containing the running executable, falls back to the working directory
std::string executable_dir();

// Sleeps in short slices; returns false if stop_flag was raised before the full duration elapsed
bool interruptible_sleep(std::chrono::seconds duration, const std::atomic<bool>& stop_flag);

} // namespace util
