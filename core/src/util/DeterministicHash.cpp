#include "rankcore/core/util/DeterministicHash.h"

#include <utility>

namespace rankcore::core::util {

namespace {

constexpr std::uint32_t kReplacement = 0xFFFDu;

// Decodes one code point starting at `i` and advances past it; malformed input yields U+FFFD.
std::uint32_t NextCodePoint(const std::string& text, size_t& i) {
    const auto lead = static_cast<unsigned char>(text[i++]);
    if (lead < 0x80) {
        return lead;
    }
    size_t extra = 0;
    std::uint32_t code = 0;
    std::uint32_t minimum = 0;
    if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        code = lead & 0x1F;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        code = lead & 0x0F;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        code = lead & 0x07;
        minimum = 0x10000;
    } else {
        return kReplacement;
    }
    for (size_t k = 0; k < extra; ++k) {
        if (i >= text.size() || (static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            return kReplacement;
        }
        code = (code << 6) | (static_cast<unsigned char>(text[i++]) & 0x3F);
    }
    if (code < minimum || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        return kReplacement;
    }
    return code;
}

}  // namespace

std::uint32_t Fnv1a32(const std::string& payload) {
    constexpr std::uint32_t kOffset = 0x811c9dc5u;
    constexpr std::uint32_t kPrime = 16777619u;
    std::uint32_t hash = kOffset;
    const auto mix = [&hash](std::uint32_t unit) {
        hash ^= unit;
        hash *= kPrime;
    };
    for (size_t i = 0; i < payload.size();) {
        const std::uint32_t code = NextCodePoint(payload, i);
        if (code >= 0x10000) {
            mix(0xD800u + ((code - 0x10000u) >> 10));
            mix(0xDC00u + ((code - 0x10000u) & 0x3FFu));
        } else {
            mix(code);
        }
    }
    return hash;
}

std::uint32_t TieBreakHash(const std::string& event_id,
                           const std::string& role,
                           const std::string& player_id) {
    return Fnv1a32(event_id + "::" + role + "::" + player_id);
}

double Mulberry32::Next() {
    state_ += 0x6D2B79F5u;
    std::uint32_t r = (state_ ^ (state_ >> 15)) * (1u | state_);
    r ^= r + (r ^ (r >> 7)) * (61u | r);
    return static_cast<double>(r ^ (r >> 14)) / 4294967296.0;
}

void DeterministicShuffle(std::vector<std::string>& values, const std::string& seed) {
    if (values.size() < 2) {
        return;
    }
    Mulberry32 rng(Fnv1a32("rr::" + seed));
    for (size_t i = values.size() - 1; i > 0; --i) {
        const auto j = static_cast<size_t>(rng.Next() * static_cast<double>(i + 1));
        std::swap(values[i], values[j]);
    }
}

}  // namespace rankcore::core::util
