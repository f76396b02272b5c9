#include "CategoryAxis.hpp"
#include <algorithm>

namespace Vantage {

std::vector<std::size_t> CategoryAxis::selectLabelIndices(std::size_t count, std::size_t target) {
    std::vector<std::size_t> indices;
    if (count == 0) return indices;

    const std::size_t step = std::max<std::size_t>(1, count / std::max<std::size_t>(1, target));
    for (std::size_t i = 0; i < count; ++i) {
        if (i % step == 0 || i == count - 1) {
            indices.push_back(i);
        }
    }
    return indices;
}

} // namespace Vantage
