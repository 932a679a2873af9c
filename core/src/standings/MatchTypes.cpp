#include "rankcore/core/standings/MatchTypes.h"

#include <algorithm>
#include <cctype>

namespace rankcore::core::standings {

bool IsWinResult(MatchResult result) {
    return result == MatchResult::Win || result == MatchResult::ForfeitWin;
}

bool IsLossResult(MatchResult result) {
    return result == MatchResult::Loss || result == MatchResult::ForfeitLoss;
}

MatchResult FlipResult(MatchResult result) {
    switch (result) {
        case MatchResult::Win:
            return MatchResult::Loss;
        case MatchResult::Loss:
            return MatchResult::Win;
        case MatchResult::ForfeitWin:
            return MatchResult::ForfeitLoss;
        case MatchResult::ForfeitLoss:
            return MatchResult::ForfeitWin;
        case MatchResult::Draw:
        case MatchResult::Bye:
            break;
    }
    return result;
}

std::string ResultToString(MatchResult result) {
    switch (result) {
        case MatchResult::Win:
            return "W";
        case MatchResult::Loss:
            return "L";
        case MatchResult::Draw:
            return "D";
        case MatchResult::Bye:
            return "BYE";
        case MatchResult::ForfeitWin:
            return "FORFEIT_W";
        case MatchResult::ForfeitLoss:
            return "FORFEIT_L";
    }
    return "L";
}

bool ParseResult(const std::string& value, MatchResult& result) {
    std::string key = value;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    std::replace(key.begin(), key.end(), '-', '_');

    if (key == "W" || key == "WIN") {
        result = MatchResult::Win;
    } else if (key == "L" || key == "LOSS") {
        result = MatchResult::Loss;
    } else if (key == "D" || key == "DRAW") {
        result = MatchResult::Draw;
    } else if (key == "BYE") {
        result = MatchResult::Bye;
    } else if (key == "FORFEIT_W" || key == "FORFEIT_WIN") {
        result = MatchResult::ForfeitWin;
    } else if (key == "FORFEIT_L" || key == "FORFEIT_LOSS") {
        result = MatchResult::ForfeitLoss;
    } else {
        return false;
    }
    return true;
}

}  // namespace rankcore::core::standings
