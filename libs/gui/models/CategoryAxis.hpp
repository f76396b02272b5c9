#pragma once
#include <cstddef>
#include <vector>

namespace Vantage {

// Category (time) axis label thinning: every max(1, count / target)-th index,
// plus the final index so the latest point is always labelled.
class CategoryAxis {
public:
    static std::vector<std::size_t> selectLabelIndices(std::size_t count, std::size_t target = 10);
};

} // namespace Vantage
