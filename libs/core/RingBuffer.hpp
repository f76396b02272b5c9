/*
Vantage — RingBuffer
Role: Fixed-capacity window over the most recent candles (or any value type).
Inputs/Outputs: Seeded from a vector, then fed one item at a time; snapshot() returns oldest→newest.
Threading: Not synchronised; owned by a single watcher loop.
Performance: O(1) push, O(n) snapshot.
Integration: Used by the CLI to bound the candle window handed to ChartRenderer.
Observability: No internal logging.
Related: EngineConfig (chart.candle_window).
Assumptions: Capacity is fixed at construction and is never zero.
*/
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Vantage {

template <typename T>
class RingBuffer {
public:
    /// Capacity equals items.size(). Throws std::invalid_argument when items is empty.
    static RingBuffer fromVector(std::vector<T> items) {
        if (items.empty()) {
            throw std::invalid_argument("RingBuffer::fromVector requires at least one item");
        }
        return RingBuffer(std::move(items));
    }

    /// Keeps the last `capacity` items. Requires capacity > 0 and items.size() >= capacity.
    static RingBuffer withCapacity(std::size_t capacity, const std::vector<T>& items) {
        if (capacity == 0) {
            throw std::invalid_argument("RingBuffer::withCapacity requires capacity > 0");
        }
        if (items.size() < capacity) {
            throw std::invalid_argument("RingBuffer::withCapacity needs at least " + std::to_string(capacity) +
                                        " items, got " + std::to_string(items.size()));
        }
        return RingBuffer(std::vector<T>(items.end() - static_cast<std::ptrdiff_t>(capacity), items.end()));
    }

    void push(T val) {
        m_data[m_head] = std::move(val);
        m_head = (m_head + 1) % m_data.size();
    }

    [[nodiscard]] std::vector<T> snapshot() const {
        std::vector<T> ordered;
        ordered.reserve(m_data.size());
        ordered.insert(ordered.end(), m_data.begin() + static_cast<std::ptrdiff_t>(m_head), m_data.end());
        ordered.insert(ordered.end(), m_data.begin(), m_data.begin() + static_cast<std::ptrdiff_t>(m_head));
        return ordered;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return m_data.size();
    }

private:
    explicit RingBuffer(std::vector<T> data) : m_data(std::move(data)) {}

    std::vector<T> m_data;
    std::size_t    m_head{0};
};

} // namespace Vantage
