#pragma once

#include <string>

namespace retreat_placer {

// Ratcliff/Obershelp similarity in [0, 1]: 2 * M / (|a| + |b|), where M is the
// number of characters in the matching blocks found by repeatedly taking the
// longest common substring (leftmost in `a`, then leftmost in `b`) and
// recursing on both sides of it. Two empty strings score 1.
double SimilarityRatio(const std::string& a, const std::string& b);

}  // namespace retreat_placer
