#include "../include/time_uuid.hpp"
#include "../include/errors.hpp"
#include <cctype>
#include <cstdio>
#include <random>
#include <utility>

// 100 ns intervals between 1582-10-15 and 1970-01-01.
static constexpr std::uint64_t kGregorianOffset = 0x01B21DD213814000ULL;
static constexpr std::uint64_t kMaxTicks = (1ULL << 60) - 1;

static std::uint64_t random_u64() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<std::uint64_t> dist;
    return dist(rng);
}

static std::uint16_t random_clock_seq() {
    return static_cast<std::uint16_t>(random_u64() & 0x3FFF);
}

static TimeUuid::Node random_node() {
    std::uint64_t bits = random_u64();
    TimeUuid::Node node{};
    for (size_t i = 0; i < node.size(); ++i) node[i] = static_cast<std::uint8_t>(bits >> (8 * i));
    node[0] |= 0x01; // multicast bit marks a non-MAC node id
    return node;
}

std::uint64_t ticks_from_time(TimeUuid::time_point t) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    long long ticks = static_cast<long long>(kGregorianOffset) + ns / 100;
    if (ticks < 0) throw InvalidArgument("instant precedes the UUID epoch (1582-10-15)");
    if (static_cast<std::uint64_t>(ticks) > kMaxTicks) throw InvalidArgument("instant beyond the UUID time range");
    return static_cast<std::uint64_t>(ticks);
}

TimeUuid::time_point time_from_ticks(std::uint64_t ticks) {
    long long since_epoch = static_cast<long long>(ticks) - static_cast<long long>(kGregorianOffset);
    return TimeUuid::time_point(std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::nanoseconds(since_epoch * 100)));
}

TimeUuid TimeUuid::make(std::uint64_t ticks, std::uint16_t clock_seq, const Node& node) {
    TimeUuid u;
    std::uint32_t time_low = static_cast<std::uint32_t>(ticks & 0xFFFFFFFFULL);
    std::uint16_t time_mid = static_cast<std::uint16_t>((ticks >> 32) & 0xFFFF);
    std::uint16_t time_hi = static_cast<std::uint16_t>(((ticks >> 48) & 0x0FFF) | 0x1000);
    u.bytes_[0] = static_cast<std::uint8_t>(time_low >> 24);
    u.bytes_[1] = static_cast<std::uint8_t>(time_low >> 16);
    u.bytes_[2] = static_cast<std::uint8_t>(time_low >> 8);
    u.bytes_[3] = static_cast<std::uint8_t>(time_low);
    u.bytes_[4] = static_cast<std::uint8_t>(time_mid >> 8);
    u.bytes_[5] = static_cast<std::uint8_t>(time_mid);
    u.bytes_[6] = static_cast<std::uint8_t>(time_hi >> 8);
    u.bytes_[7] = static_cast<std::uint8_t>(time_hi);
    u.bytes_[8] = static_cast<std::uint8_t>(((clock_seq >> 8) & 0x3F) | 0x80);
    u.bytes_[9] = static_cast<std::uint8_t>(clock_seq & 0xFF);
    for (size_t i = 0; i < node.size(); ++i) u.bytes_[10 + i] = node[i];
    return u;
}

TimeUuid TimeUuid::from_time(time_point t, std::uint16_t clock_seq, const Node& node) {
    return make(ticks_from_time(t), clock_seq, node);
}

TimeUuid TimeUuid::min_for(time_point t) {
    return make(ticks_from_time(t), 0, Node{});
}

TimeUuid TimeUuid::max_for(time_point t) {
    Node all{};
    all.fill(0xFF);
    return make(ticks_from_time(t), 0x3FFF, all);
}

TimeUuid TimeUuid::from_key(const Bytes& key) {
    std::uint64_t ticks = 0;
    for (int i = 0; i < 8; ++i) ticks = (ticks << 8) | key[i];
    std::uint16_t clock_seq = static_cast<std::uint16_t>((key[8] << 8) | key[9]);
    Node node{};
    for (size_t i = 0; i < node.size(); ++i) node[i] = key[10 + i];
    return make(ticks, clock_seq, node);
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = (char)std::tolower((unsigned char)c);
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

TimeUuid TimeUuid::parse(const std::string& text) {
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
        throw ValidationError("malformed uuid: '" + text + "'");
    }
    TimeUuid u;
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (text[i] == '-') { ++i; continue; }
        int hi = hex_value(text[i]);
        int lo = i + 1 < text.size() ? hex_value(text[i + 1]) : -1;
        if (hi < 0 || lo < 0) throw ValidationError("malformed uuid: '" + text + "'");
        u.bytes_[out++] = static_cast<std::uint8_t>((hi << 4) | lo);
        i += 2;
    }
    if ((u.bytes_[6] >> 4) != 1) {
        throw ValidationError("uuid is not time based (version 1): '" + text + "'");
    }
    return u;
}

std::uint64_t TimeUuid::ticks() const {
    std::uint64_t time_low = (std::uint64_t(bytes_[0]) << 24) | (std::uint64_t(bytes_[1]) << 16) |
                             (std::uint64_t(bytes_[2]) << 8) | std::uint64_t(bytes_[3]);
    std::uint64_t time_mid = (std::uint64_t(bytes_[4]) << 8) | std::uint64_t(bytes_[5]);
    std::uint64_t time_hi = ((std::uint64_t(bytes_[6]) << 8) | std::uint64_t(bytes_[7])) & 0x0FFF;
    return (time_hi << 48) | (time_mid << 32) | time_low;
}

std::uint16_t TimeUuid::clock_seq() const {
    return static_cast<std::uint16_t>(((bytes_[8] & 0x3F) << 8) | bytes_[9]);
}

TimeUuid::time_point TimeUuid::time() const {
    return time_from_ticks(ticks());
}

TimeUuid::Bytes TimeUuid::key() const {
    Bytes k{};
    std::uint64_t t = ticks();
    for (int i = 7; i >= 0; --i) { k[i] = static_cast<std::uint8_t>(t & 0xFF); t >>= 8; }
    std::uint16_t cs = clock_seq();
    k[8] = static_cast<std::uint8_t>(cs >> 8);
    k[9] = static_cast<std::uint8_t>(cs & 0xFF);
    for (int i = 10; i < 16; ++i) k[i] = bytes_[i];
    return k;
}

std::string TimeUuid::to_string() const {
    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5], bytes_[6], bytes_[7],
                  bytes_[8], bytes_[9], bytes_[10], bytes_[11], bytes_[12], bytes_[13], bytes_[14], bytes_[15]);
    return std::string(buf);
}

TimeUuid uuid_from_time(TimeUuid::time_point t) {
    return TimeUuid::from_time(t, random_clock_seq(), random_node());
}

TimeUuidGenerator::TimeUuidGenerator()
    : TimeUuidGenerator([]{ return std::chrono::system_clock::now(); }) {}

TimeUuidGenerator::TimeUuidGenerator(Clock clock)
    : clock_(std::move(clock)), clock_seq_(random_clock_seq()), node_(random_node()) {}

TimeUuid TimeUuidGenerator::next() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::uint64_t ticks = ticks_from_time(clock_());
    if (ticks <= last_ticks_) ticks = last_ticks_ + 1;
    last_ticks_ = ticks;
    return TimeUuid::make(ticks, clock_seq_, node_);
}
