/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TAG_TYPE_HPP
#define TAG_TYPE_HPP

#include <concepts>
#include <string>
#include <type_traits>

namespace BumperEngine {

// Game-supplied object kind. The engine only ever compares tags.
template<typename T>
concept TagType = std::totally_ordered<T> && std::copyable<T>;

// Best-effort text for log and exception messages
template<TagType Tag>
std::string describeTag(const Tag& tag) {
    if constexpr (std::is_enum_v<Tag>) {
        return "tag#" + std::to_string(static_cast<long long>(
                            static_cast<std::underlying_type_t<Tag>>(tag)));
    } else if constexpr (std::is_arithmetic_v<Tag>) {
        return "tag#" + std::to_string(tag);
    } else if constexpr (std::is_convertible_v<Tag, std::string>) {
        return std::string(tag);
    } else {
        return "tag";
    }
}

} // namespace BumperEngine

#endif // TAG_TYPE_HPP
