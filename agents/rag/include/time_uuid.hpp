#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

// Version-1 UUID. Ordered by (timestamp, clock sequence, node), so comparing
// two ids compares their creation instants first.
class TimeUuid {
public:
    using Bytes = std::array<std::uint8_t, 16>;
    using Node = std::array<std::uint8_t, 6>;
    using time_point = std::chrono::system_clock::time_point;

    TimeUuid() = default;

    static TimeUuid make(std::uint64_t ticks, std::uint16_t clock_seq, const Node& node);
    static TimeUuid from_time(time_point t, std::uint16_t clock_seq, const Node& node);
    static TimeUuid parse(const std::string& text); // throws ValidationError
    static TimeUuid from_key(const Bytes& key);

    // Smallest and largest ids carrying instant `t`; inclusive range bounds.
    static TimeUuid min_for(time_point t);
    static TimeUuid max_for(time_point t);

    // 100 ns intervals since 1582-10-15 00:00 UTC.
    std::uint64_t ticks() const;
    std::uint16_t clock_seq() const;
    time_point time() const;

    std::string to_string() const;
    const Bytes& bytes() const { return bytes_; }

    // 16-byte big-endian (ticks, clock_seq, node); memcmp order == id order.
    Bytes key() const;

    bool operator==(const TimeUuid& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const TimeUuid& o) const { return bytes_ != o.bytes_; }
    bool operator<(const TimeUuid& o) const { return key() < o.key(); }
    bool operator>(const TimeUuid& o) const { return o < *this; }
    bool operator<=(const TimeUuid& o) const { return !(o < *this); }
    bool operator>=(const TimeUuid& o) const { return !(*this < o); }

private:
    Bytes bytes_{};
};

std::uint64_t ticks_from_time(TimeUuid::time_point t);
TimeUuid::time_point time_from_ticks(std::uint64_t ticks);

// Random clock sequence and node for every call.
TimeUuid uuid_from_time(TimeUuid::time_point t);

// Per-writer generator. Ids are strictly increasing even when the clock
// stalls or steps backwards.
class TimeUuidGenerator {
public:
    using Clock = std::function<TimeUuid::time_point()>;

    TimeUuidGenerator();
    explicit TimeUuidGenerator(Clock clock);

    TimeUuid next();

private:
    std::mutex mtx_;
    Clock clock_;
    std::uint16_t clock_seq_{0};
    TimeUuid::Node node_{};
    std::uint64_t last_ticks_{0};
};
