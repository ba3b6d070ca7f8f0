/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LIFESPAN_HPP
#define LIFESPAN_HPP

#include <cstdint>
#include <limits>
#include <string>

namespace GridForge {

/**
 * @brief Remaining generations an entity lives for
 *
 * Immortal entities live until removed. Ephemeral entities are aged by one
 * at the end of every commit they survive and are retired by the
 * environment once nothing remains.
 */
class Lifespan {
public:
    static constexpr Lifespan immortal() { return Lifespan{true, 0}; }
    static constexpr Lifespan ephemeral(uint32_t generations) { return Lifespan{false, generations}; }

    constexpr Lifespan() = default;

    constexpr bool isImmortal() const { return m_immortal; }
    constexpr bool isEphemeral() const { return !m_immortal; }
    constexpr bool isAlive() const { return m_immortal || m_remaining > 0; }

    // Generations left; meaningless for immortal lifespans
    constexpr uint32_t remaining() const { return m_immortal ? 0 : m_remaining; }

    // Saturates at zero; no effect on immortal lifespans
    constexpr void shorten(uint32_t generations = 1) {
        if (m_immortal) {
            return;
        }
        m_remaining = generations >= m_remaining ? 0 : m_remaining - generations;
    }

    // Saturates at the maximum span; no effect on immortal lifespans
    constexpr void lengthen(uint32_t generations = 1) {
        if (m_immortal) {
            return;
        }
        const uint32_t headroom = std::numeric_limits<uint32_t>::max() - m_remaining;
        m_remaining = generations >= headroom ? std::numeric_limits<uint32_t>::max()
                                              : m_remaining + generations;
    }

    // Exhausts the lifespan; an immortal lifespan becomes an empty ephemeral one
    constexpr void clear() {
        m_immortal = false;
        m_remaining = 0;
    }

    constexpr bool operator==(const Lifespan&) const = default;

    std::string toString() const {
        return m_immortal ? std::string("immortal")
                          : "ephemeral(" + std::to_string(m_remaining) + ")";
    }

private:
    constexpr Lifespan(bool immortal, uint32_t remaining)
        : m_immortal(immortal), m_remaining(remaining) {}

    bool m_immortal{true};
    uint32_t m_remaining{0};
};

} // namespace GridForge

#endif // LIFESPAN_HPP
