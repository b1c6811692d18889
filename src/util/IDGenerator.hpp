#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>

namespace coedit::util {

// Prefixed ULIDs: "session-01HZX...", 26 Crockford base32 chars after the dash.
// Monotonic within one millisecond; safe to share between threads.
class IDGenerator {
public:
    enum class Kind { Session, Operation, Client };

    IDGenerator() : rng_(seed()) {}

    std::string make(Kind kind) {
        return std::string(prefix_of(kind)) + "-" + next_ulid();
    }

    std::string sessionID()   { return make(Kind::Session); }
    std::string operationID() { return make(Kind::Operation); }
    std::string clientID()    { return make(Kind::Client); }

private:
    using u128 = unsigned __int128;
    using Bytes = std::array<std::uint8_t, 16>;

    static const char* prefix_of(Kind kind) {
        switch (kind) {
            case Kind::Session:   return "session";
            case Kind::Operation: return "op";
            case Kind::Client:    return "client";
        }
        return "id";
    }

    std::string next_ulid() {
        const std::uint64_t ts = now_ms();
        Bytes bytes{};
        for (int i = 0; i < 6; ++i) {
            bytes[static_cast<std::size_t>(i)] =
                static_cast<std::uint8_t>((ts >> (8 * (5 - i))) & 0xFF);
        }

        u128 rand80 = 0;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (ts != last_ts_) {
                const std::uint64_t hi = dist_(rng_);
                const std::uint64_t lo = dist_(rng_);
                rand80 = (static_cast<u128>(hi) << 16) | (lo >> 48);
                last_ts_ = ts;
            } else {
                rand80 = last_rand_ + 1;
            }
            rand80 &= (static_cast<u128>(1) << 80) - 1;
            last_rand_ = rand80;
        }
        for (int i = 15; i >= 6; --i) {
            bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(rand80 & 0xFF);
            rand80 >>= 8;
        }
        return encode(bytes);
    }

    // 128 bits -> 26 chars, the last one carrying two padding bits.
    static std::string encode(const Bytes& bytes) {
        static constexpr char alphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
        std::string out;
        out.reserve(26);

        std::uint32_t buffer = 0;
        int bits = 0;
        for (std::uint8_t byte : bytes) {
            buffer = (buffer << 8) | byte;
            bits += 8;
            while (bits >= 5) {
                bits -= 5;
                out.push_back(alphabet[(buffer >> bits) & 0x1F]);
                buffer &= (1u << bits) - 1u;
            }
        }
        if (bits > 0) out.push_back(alphabet[(buffer << (5 - bits)) & 0x1F]);
        return out;
    }

    static std::uint64_t now_ms() {
        using namespace std::chrono;
        return static_cast<std::uint64_t>(
            duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
    }

    static std::mt19937_64 seed() {
        std::random_device rd;
        std::seed_seq seq{
            rd(), rd(), rd(), rd(),
            static_cast<unsigned>(std::chrono::high_resolution_clock::now().time_since_epoch().count())
        };
        return std::mt19937_64(seq);
    }

    std::mt19937_64 rng_;
    std::uniform_int_distribution<std::uint64_t> dist_{0, ~std::uint64_t(0)};

    std::mutex mu_;
    std::uint64_t last_ts_ = 0;
    u128 last_rand_ = 0;
};

} // namespace coedit::util
