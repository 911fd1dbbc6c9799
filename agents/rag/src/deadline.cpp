#include "../include/deadline.hpp"
#include "../include/errors.hpp"
#include <algorithm>

Deadline::Deadline() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

Deadline Deadline::none() {
    return Deadline();
}

Deadline Deadline::after(std::chrono::milliseconds d) {
    Deadline dl;
    dl.at_ = clock::now() + d;
    return dl;
}

void Deadline::cancel() const {
    cancelled_->store(true);
}

bool Deadline::cancelled() const {
    return cancelled_->load();
}

bool Deadline::expired() const {
    if (cancelled()) return true;
    return at_ && clock::now() >= *at_;
}

long Deadline::remaining_ms(long cap) const {
    if (!at_) return cap;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*at_ - clock::now()).count();
    return std::max<long>(0, std::min<long>(cap, static_cast<long>(left)));
}

void Deadline::check(const std::string& what) const {
    if (cancelled()) throw DeadlineExceeded(what + ": cancelled");
    if (expired()) throw DeadlineExceeded(what + ": deadline exceeded");
}
