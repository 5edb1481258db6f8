/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTACT_BUFFER_HPP
#define CONTACT_BUFFER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "collisions/Contact.hpp"

namespace BumperEngine {

// Which object of a pair is stored first
enum class ContactOrder : uint8_t {
    LargerTagFirst,  // displacement contacts
    SmallerTagFirst  // trigger contacts
};

/**
 * @brief Per-tick contact storage that keeps every pair in canonical order
 *
 * Game handlers can then match on (tagA, tagB) once instead of twice.
 * Equal tags fall back to handle order (lower handle first) so the order
 * never depends on how the pair was discovered.
 */
template<TagType Tag>
class ContactBuffer {
public:
    explicit ContactBuffer(ContactOrder order) : m_order(order) { m_contacts.reserve(64); }

    /**
     * @brief Stores the pair, swapping sides (and amounts) when needed
     */
    void push(const ObjectHandle& h1, const Tag& t1, const ObjectHandle& h2, const Tag& t2,
              const Vector2D& amount1, const Vector2D& amount2) {
        if (placesFirst(m_order, h1, t1, h2, t2)) {
            m_contacts.push_back(Contact<Tag>{h1, t1, h2, t2, amount1, amount2});
        } else {
            m_contacts.push_back(Contact<Tag>{h2, t2, h1, t1, amount2, amount1});
        }
    }

    // True when (h1, t1) belongs in front of (h2, t2)
    static bool placesFirst(ContactOrder order, const ObjectHandle& h1, const Tag& t1,
                            const ObjectHandle& h2, const Tag& t2) {
        if (t1 == t2) {
            return h1 < h2;
        }
        return order == ContactOrder::LargerTagFirst ? t2 < t1 : t1 < t2;
    }

    // Deepest overlap first; ties in pair order
    void sortByPenetration() {
        std::stable_sort(m_contacts.begin(), m_contacts.end(),
                         [](const Contact<Tag>& x, const Contact<Tag>& y) {
                             float dx = x.amount.lengthSquared();
                             float dy = y.amount.lengthSquared();
                             if (dx != dy) return dx > dy;
                             if (x.a != y.a) return x.a < y.a;
                             return x.b < y.b;
                         });
    }

    std::span<const Contact<Tag>> view() const { return m_contacts; }

    const Contact<Tag>& operator[](size_t i) const { return m_contacts[i]; }
    auto begin() const { return m_contacts.begin(); }
    auto end() const { return m_contacts.end(); }

    size_t size() const { return m_contacts.size(); }
    bool empty() const { return m_contacts.empty(); }
    void clear() { m_contacts.clear(); }
    ContactOrder order() const { return m_order; }

private:
    ContactOrder m_order;
    std::vector<Contact<Tag>> m_contacts;
};

} // namespace BumperEngine

#endif // CONTACT_BUFFER_HPP
