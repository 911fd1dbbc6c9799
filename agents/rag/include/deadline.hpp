#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// Expiry plus a cancellation flag shared by every copy.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    static Deadline none();
    static Deadline after(std::chrono::milliseconds d);

    void cancel() const;
    bool cancelled() const;
    bool expired() const;

    // Milliseconds left, capped at `cap`. Returns `cap` when there is no expiry.
    long remaining_ms(long cap) const;

    // Throws DeadlineExceeded naming `what` when expired or cancelled.
    void check(const std::string& what) const;

private:
    Deadline();

    std::optional<clock::time_point> at_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};
