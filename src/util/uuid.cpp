#include <tid/uuid.hpp>
#include <tid/log.hpp>
#include <chrono>
#include <fstream>
#include <mutex>
#include <random>

namespace tid {

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    log::debug("/dev/urandom unavailable, falling back to std::random_device");
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

static uint64_t now_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---- UUID v7 ----
// Layout: 48-bit unix_ts_ms | ver(4)=7 | rand_a(12) | var(2)=10 | rand_b(62)
// rand_a doubles as a per-millisecond counter, seeded randomly in its lower
// half so the counter has headroom before it overflows.

namespace {

struct V7State {
    std::mutex mu;
    uint64_t last_ms = 0;
    uint16_t counter = 0;
};

V7State& v7_state() {
    static V7State state;
    return state;
}

} // namespace

Uuid Uuid::v7() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), 16);

    uint64_t ms = now_ms();
    uint16_t counter = 0;
    {
        V7State& st = v7_state();
        std::lock_guard<std::mutex> lock(st.mu);
        if (ms > st.last_ms) {
            st.last_ms = ms;
            st.counter = static_cast<uint16_t>(((u.bytes[6] << 8) | u.bytes[7]) & 0x07FF);
        } else {
            // Clock stalled or went backwards: stay on the last timestamp
            ms = st.last_ms;
            if (st.counter >= 0x0FFF) {
                log::trace("uuid v7 counter exhausted at %llu ms, advancing clock",
                           static_cast<unsigned long long>(ms));
                ++st.last_ms;
                ms = st.last_ms;
                st.counter = 0;
            } else {
                ++st.counter;
            }
        }
        counter = st.counter;
    }

    for (int i = 0; i < 6; ++i) {
        u.bytes[i] = static_cast<uint8_t>(ms >> (8 * (5 - i)));
    }
    u.bytes[6] = static_cast<uint8_t>(0x70 | ((counter >> 8) & 0x0F));
    u.bytes[7] = static_cast<uint8_t>(counter & 0xFF);
    // Set variant: bytes[8] top two bits = 10
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    return u;
}

Uuid Uuid::nil() {
    Uuid u;
    u.bytes.fill(0x00);
    return u;
}

Uuid Uuid::max() {
    Uuid u;
    u.bytes.fill(0xFF);
    return u;
}

uint64_t Uuid::timestamp_ms() const {
    uint64_t ms = 0;
    for (int i = 0; i < 6; ++i) {
        ms = (ms << 8) | bytes[i];
    }
    return ms;
}

int Uuid::version() const {
    return bytes[6] >> 4;
}

// ---- to_string: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != 36) {
        return TidError(TidError::Parse,
            "UUID string must be 36 characters, got " + std::to_string(s.size()),
            "expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return TidError(TidError::Parse,
            "UUID string has invalid dash positions",
            "expected dashes at positions 8, 13, 18, 23");
    }

    Uuid u;
    size_t byte_idx = 0;
    for (size_t i = 0; i < s.size(); ) {
        if (i == 8 || i == 13 || i == 18 || i == 23) { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            return TidError(TidError::Parse,
                "UUID string contains invalid hex character",
                "invalid char '" + std::string(1, s[bad]) + "' at position " + std::to_string(bad));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

bool Uuid::operator<(const Uuid& other) const {
    return bytes < other.bytes;
}

} // namespace tid
