#pragma once

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace searchnet {
namespace util {

inline std::string toupper(const std::string& str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'a' && c <= 'z')
            c -= 32;
    return s;
}

inline std::string tolower(std::string_view str) {
    std::string s(str);
    for (char& c : s)
        if (c >= 'A' && c <= 'Z')
            c += 32;
    return s;
}

inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        char x = a[i], y = b[i];
        if (x >= 'A' && x <= 'Z') x += 32;
        if (y >= 'A' && y <= 'Z') y += 32;
        if (x != y)
            return false;
    }
    return true;
}

/**
 * Percent-encode everything outside the RFC 3986 unreserved set.
 */
inline std::string urlEncode(std::string_view str) {
    static const char hex_chars[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex_chars[(c >> 4) & 0x0F];
            out += hex_chars[c & 0x0F];
        }
    }
    return out;
}

// application/x-www-form-urlencoded / query string
inline std::string encodeForm(const std::map<std::string, std::string>& fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty())
            out += '&';
        out += urlEncode(key);
        out += '=';
        out += urlEncode(value);
    }
    return out;
}

} // namespace util

class BoundedSemaphore {
public:
    explicit BoundedSemaphore(size_t initial_count, size_t max_count)
        : count_(initial_count), max_count_(max_count) {
        assert(initial_count <= max_count && "initial_count must lower than max_count");
    }

    // non-copyable
    BoundedSemaphore(const BoundedSemaphore&) = delete;
    BoundedSemaphore& operator=(const BoundedSemaphore&) = delete;

    // Acquire the semaphore (P operation, blocking)
    void acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]() { return count_ > 0; });
        --count_;
    }

    // Acquire the semaphore (Non-blocking)
    bool try_acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (count_ >= 1) {
            --count_;
            return true;
        }
        return false;
    }

    // Acquire the semaphore, giving up after timeout
    template <class Rep, class Period>
    bool try_acquire_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&]() { return count_ > 0; }))
            return false;
        --count_;
        return true;
    }

    // Release the semaphore (V operation)
    void release() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (count_ < max_count_) {
            ++count_;
        }
        cv_.notify_one();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    unsigned int count_;
    const unsigned int max_count_;
};

/**
 * Holds one permit of a BoundedSemaphore until destroyed.
 */
class SemaphorePermit {
public:
    SemaphorePermit() = default;
    explicit SemaphorePermit(BoundedSemaphore& sema) : sema_(&sema) {}
    ~SemaphorePermit() {
        if (this->sema_)
            this->sema_->release();
    }

    SemaphorePermit(const SemaphorePermit&) = delete;
    SemaphorePermit& operator=(const SemaphorePermit&) = delete;

private:
    BoundedSemaphore* sema_ = nullptr;
};

} // namespace searchnet
