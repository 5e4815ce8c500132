#pragma once

#include <string>
#include <vector>

namespace Integra {

struct RiskAssessment {
    int  score = 0;                     // clamped to [0,100]
    int  raw_score = 0;                 // before clamping
    bool blocked = false;               // score >= threshold
    std::vector<std::string> reasons;   // rule-evaluation order
};

} // namespace Integra
