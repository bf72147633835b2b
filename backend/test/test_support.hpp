#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <random>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// Minimal harness: each test is a void() function; CHECK records a failure and
// keeps going, run_tests() returns non-zero if anything failed.

inline int& test_failures() {
    static int n = 0;
    return n;
}

#define CHECK(cond)                                                                   \
    do {                                                                              \
        if (!(cond)) {                                                                \
            std::cerr << "FAIL " << __FILE__ << ":" << __LINE__ << ": " #cond << std::endl; \
            ++test_failures();                                                        \
        }                                                                             \
    } while (0)

#define CHECK_EQ(a, b)                                                                \
    do {                                                                              \
        const auto va_ = (a);                                                         \
        const auto vb_ = (b);                                                         \
        if (!(va_ == vb_)) {                                                          \
            std::cerr << "FAIL " << __FILE__ << ":" << __LINE__ << ": " #a " == " #b  \
                      << " (got " << va_ << " vs " << vb_ << ")" << std::endl;        \
            ++test_failures();                                                        \
        }                                                                             \
    } while (0)

#define CHECK_NEAR(a, b, eps)                                                         \
    do {                                                                              \
        const double va_ = (a);                                                       \
        const double vb_ = (b);                                                       \
        if (std::abs(va_ - vb_) > (eps)) {                                            \
            std::cerr << "FAIL " << __FILE__ << ":" << __LINE__ << ": " #a " ~ " #b   \
                      << " (got " << va_ << " vs " << vb_ << ")" << std::endl;        \
            ++test_failures();                                                        \
        }                                                                             \
    } while (0)

using TestCase = std::pair<const char*, std::function<void()>>;

inline int run_tests(std::initializer_list<TestCase> tests) {
    for (const auto& [name, fn] : tests) {
        const int before = test_failures();
        try {
            fn();
        } catch (const std::exception& e) {
            std::cerr << "FAIL " << name << ": unexpected exception: " << e.what() << std::endl;
            ++test_failures();
        }
        std::cout << (test_failures() == before ? "[ OK ] " : "[FAIL] ") << name << std::endl;
    }
    std::cout << (test_failures() ? "FAILED" : "PASSED") << " (" << test_failures() << " failures)" << std::endl;
    return test_failures() ? 1 : 0;
}

// Polls `pred` until it holds or `timeout` passes.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device rd;
        std::ostringstream os;
        os << "optchain_" << tag << "_" << std::hex << rd() << rd();
        path_ = std::filesystem::temp_directory_path() / os.str();
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::vector<std::string> files() const {
        std::vector<std::string> out;
        for (const auto& e : std::filesystem::directory_iterator(path_)) out.push_back(e.path().filename().string());
        std::sort(out.begin(), out.end());
        return out;
    }

private:
    std::filesystem::path path_;
};

inline std::vector<std::string> read_lines(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

inline void write_file(const std::filesystem::path& p, const std::string& content) {
    std::ofstream out(p);
    out << content;
}

// Microseconds since epoch for a UTC wall time.
inline std::int64_t utc_micros(int y, int mo, int d, int h = 0, int mi = 0, int s = 0) {
    // days_from_civil
    y -= mo <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (mo + (mo > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    const std::int64_t days = static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
    return ((days * 24 + h) * 60 + mi) * 60 * std::int64_t{1000000} + std::int64_t{s} * 1000000;
}
