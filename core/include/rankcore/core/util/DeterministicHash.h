#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rankcore::core::util {

// 32-bit FNV-1a over the UTF-16 code units of the UTF-8 string `payload`.
std::uint32_t Fnv1a32(const std::string& payload);

// Hash used to order otherwise tied competitors: eventId::role::playerId.
std::uint32_t TieBreakHash(const std::string& event_id,
                           const std::string& role,
                           const std::string& player_id);

class Mulberry32 {
public:
    explicit Mulberry32(std::uint32_t seed) : state_(seed) {}

    // Uniform in [0, 1).
    double Next();

private:
    std::uint32_t state_;
};

// Fisher-Yates shuffle driven by Mulberry32 seeded from Fnv1a32("rr::" + seed).
void DeterministicShuffle(std::vector<std::string>& values, const std::string& seed);

}  // namespace rankcore::core::util
