#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace pairtalk::session {

// Connection ids: "conn-" + 26-char ULID in Crockford base32.
// 48-bit millisecond timestamp followed by 80 random bits; within one
// millisecond the random part is incremented so ids still sort by creation.
class IDGenerator {
public:
    static constexpr const char* kPrefix = "conn";
    static constexpr std::size_t kUlidLength = 26;

    IDGenerator()
        : rng_(std::random_device{}()) {}

    std::string next() {
        std::uint64_t ts = now_ms();
        std::uint16_t hi;
        std::uint64_t lo;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts == last_ts_) {
                // 80-bit increment across the two words
                if (++rand_lo_ == 0) ++rand_hi_;
            } else {
                last_ts_ = ts;
                rand_hi_ = static_cast<std::uint16_t>(rng_() >> 48);
                rand_lo_ = rng_();
            }
            hi = rand_hi_;
            lo = rand_lo_;
        }
        return std::string(kPrefix) + "-" + encode(ts, hi, lo);
    }

private:
    static std::uint64_t now_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    // 128 bits laid out as [ts:48][hi:16][lo:64], emitted 5 bits at a time
    // from the least significant end. The top char carries only 3 bits.
    static std::string encode(std::uint64_t ts, std::uint16_t hi, std::uint64_t lo) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

        std::uint64_t upper = ((ts & 0xFFFFFFFFFFFFull) << 16) | hi;
        std::uint64_t lower = lo;

        std::string out(kUlidLength, '0');
        for (std::size_t i = kUlidLength; i-- > 0;) {
            out[i] = alphabet[lower & 0x1F];
            lower = (lower >> 5) | (upper << 59);
            upper >>= 5;
        }
        return out;
    }

    std::mutex mu_;
    std::mt19937_64 rng_;
    std::uint64_t last_ts_ = 0;
    std::uint16_t rand_hi_ = 0;
    std::uint64_t rand_lo_ = 0;
};

} // namespace pairtalk::session
