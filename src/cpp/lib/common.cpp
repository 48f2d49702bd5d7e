#include "common.hpp"
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sbm {

std::string format_fixed12(double value) {
    char buf[64];
    int len = std::snprintf(buf, sizeof(buf), "%.12f", value);
    if (len < 0 || static_cast<size_t>(len) >= sizeof(buf)) {
        // Magnitudes beyond 1e50 do not fit the stack buffer
        std::ostringstream oss;
        oss.setf(std::ios::fixed);
        oss.precision(12);
        oss << value;
        return oss.str();
    }
    return std::string(buf, static_cast<size_t>(len));
}

std::string format_shortest(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }

    std::string sign;
    if (std::signbit(value)) {
        sign = "-";
        value = -value;
    }
    if (value == 0.0) {
        return sign + "0.0";
    }

    // Shortest scientific form: d[.ddd]e[+-]XX
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    if (res.ec != std::errc()) {
        throw std::runtime_error("Failed to format floating point value");
    }
    std::string sci(buf, res.ptr);

    size_t e_pos = sci.find('e');
    std::string mantissa = sci.substr(0, e_pos);
    int exponent = std::atoi(sci.c_str() + e_pos + 1);

    std::string digits;
    for (char c : mantissa) {
        if (c != '.') {
            digits += c;
        }
    }

    std::string out;
    if (exponent >= -4 && exponent <= 15) {
        int decpt = exponent + 1;  // digits before the decimal point
        int ndigits = static_cast<int>(digits.size());
        if (decpt <= 0) {
            out = "0." + std::string(static_cast<size_t>(-decpt), '0') + digits;
        } else if (decpt >= ndigits) {
            out = digits + std::string(static_cast<size_t>(decpt - ndigits), '0') + ".0";
        } else {
            out = digits.substr(0, decpt) + "." + digits.substr(decpt);
        }
    } else {
        out = digits.substr(0, 1);
        if (digits.size() > 1) {
            out += "." + digits.substr(1);
        }
        char exp_buf[16];
        std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
        out += exp_buf;
    }
    return sign + out;
}

double round_fixed12(double value) {
    return std::strtod(format_fixed12(value).c_str(), nullptr);
}

std::filesystem::path ensure_unique_outdir(const std::filesystem::path& base) {
    namespace fs = std::filesystem;

    if (!fs::exists(base)) {
        return base;
    }
    if (!fs::is_directory(base)) {
        throw std::runtime_error("Output path exists and is not a directory: " + base.string());
    }
    if (fs::is_empty(base)) {
        return base;
    }

    for (size_t i = 1;; ++i) {
        fs::path candidate = base.string() + "_R" + std::to_string(i);
        if (!fs::exists(candidate)) {
            return candidate;
        }
    }
}

// Timer implementation
struct Timer::Impl {
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point stop_time;
    bool running = false;
};

Timer::Timer() : impl_(std::make_unique<Impl>()) {}

Timer::~Timer() = default;

void Timer::start() {
    impl_->start_time = std::chrono::steady_clock::now();
    impl_->running = true;
}

void Timer::stop() {
    impl_->stop_time = std::chrono::steady_clock::now();
    impl_->running = false;
}

double Timer::elapsed_seconds() const {
    auto end = impl_->running ? std::chrono::steady_clock::now() : impl_->stop_time;
    return std::chrono::duration<double>(end - impl_->start_time).count();
}

double get_peak_memory_mb() {
#ifdef __linux__
    // VmHWM is the peak resident set size
    std::ifstream status_file("/proc/self/status");
    if (!status_file.is_open()) {
        return 0.0;
    }

    std::string line;
    while (std::getline(status_file, line)) {
        if (line.rfind("VmHWM:", 0) == 0) {
            std::istringstream iss(line);
            std::string label;
            double value = 0.0;
            std::string unit;
            iss >> label >> value >> unit;
            return unit == "kB" ? value / 1024.0 : value;
        }
    }
    return 0.0;
#else
    return 0.0;
#endif
}

} // namespace sbm
