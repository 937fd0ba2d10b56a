#pragma once

#include "core/types.hpp"
#include <array>
#include <random>

namespace duel {

// ==============================================================================
// Hit-Roll Dice
// xoshiro256++ PRNG, one instance per worker; never shared between threads
// ==============================================================================

class DiceRoller {
public:
    explicit DiceRoller(u64 seed) {
        init_state(seed);
    }

    // Seed from the system entropy source (unseeded runs)
    static DiceRoller from_entropy() {
        return DiceRoller(entropy_seed());
    }

    void seed(u64 s) { init_state(s); }

    // Uniform pick from the six faces. Each 64-bit output is split into
    // eight byte lanes; lanes >= 252 are rejected so every face has
    // probability exactly 42/252 = 1/6.
    RollFace roll_face() {
        for (;;) {
            if (lanes_left_ == 0) {
                lanes_ = next();
                lanes_left_ = 8;
            }
            u32 lane = static_cast<u32>(lanes_ & 0xFF);
            lanes_ >>= 8;
            --lanes_left_;
            if (lane < ACCEPT_LIMIT) {
                return static_cast<RollFace>(lane % FACE_COUNT);
            }
        }
    }

    // Advance the state by 2^128 draws. Successive jumps from one seed give
    // non-overlapping sub-streams for parallel workers.
    void jump() {
        static constexpr std::array<u64, 4> JUMP = {
            0x180ec6d33cfd0abaULL, 0xd5a61266f0c9392cULL,
            0xa9582618e03fc9aaULL, 0x39abdc4529b1661cULL
        };

        std::array<u64, 4> s{};
        for (u64 word : JUMP) {
            for (int b = 0; b < 64; ++b) {
                if (word & (u64(1) << b)) {
                    s[0] ^= state[0];
                    s[1] ^= state[1];
                    s[2] ^= state[2];
                    s[3] ^= state[3];
                }
                next();
            }
        }
        state = s;
        lanes_left_ = 0;
    }

    // Generate raw 64-bit value
    u64 next() {
        const u64 result = rotl(state[0] + state[3], 23) + state[0];

        const u64 t = state[1] << 17;

        state[2] ^= state[0];
        state[3] ^= state[1];
        state[1] ^= state[2];
        state[0] ^= state[3];

        state[2] ^= t;
        state[3] = rotl(state[3], 45);

        return result;
    }

private:
    static constexpr u32 ACCEPT_LIMIT = 252;  // Largest multiple of 6 <= 256

    std::array<u64, 4> state;
    u64 lanes_ = 0;
    u8 lanes_left_ = 0;

    void init_state(u64 seed) {
        // splitmix64 expands the seed into the 256-bit state
        u64 z = seed;
        for (int i = 0; i < 4; ++i) {
            z += 0x9e3779b97f4a7c15ULL;
            u64 x = z;
            x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
            x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
            state[i] = x ^ (x >> 31);
        }
        lanes_ = 0;
        lanes_left_ = 0;
    }

    static u64 entropy_seed() {
        std::random_device rd;
        return (static_cast<u64>(rd()) << 32) ^ static_cast<u64>(rd());
    }

    static u64 rotl(u64 x, int k) {
        return (x << k) | (x >> (64 - k));
    }
};

} // namespace duel
