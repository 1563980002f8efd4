//
// Created by Giuseppe Francione on 05/10/26.
//

/**
 * @file tag_registry.hpp
 * @brief Ordered set of active tags used to gate log output.
 */

#ifndef TAGLOG_TAG_REGISTRY_HPP
#define TAGLOG_TAG_REGISTRY_HPP

#include "log_settings.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace taglog {

/// Non-owning view over the tags attached to one log call.
using TagList = std::span<const std::string_view>;

/**
 * @brief Checks whether a tag is empty or contains only whitespace.
 */
[[nodiscard]] bool is_blank(std::string_view tag);

/**
 * @brief Ordered set of the currently active tags.
 *
 * @details Tags keep their activation order. Blank tags are never stored.
 * The FORCE tag (MainTag::FORCE) is inserted by reset() and cannot be
 * removed with deactivate().
 *
 * The registry is not synchronized; the owning Logger serializes access.
 */
class TagRegistry {
public:
    /**
     * @brief Append a tag to the active set.
     * No-op for blank tags and for tags already active.
     */
    void activate(std::string_view tag);

    /**
     * @brief Remove a tag from the active set.
     * No-op for blank tags and for the FORCE tag.
     */
    void deactivate(std::string_view tag);

    /**
     * @brief Membership test. Always false for blank tags.
     */
    [[nodiscard]] bool is_active(std::string_view tag) const;

    /**
     * @brief True if at least one of the given tags is active.
     * An empty list yields false; the Logger decides what an untagged
     * message means.
     */
    [[nodiscard]] bool has_any(TagList tags) const;

    /**
     * @brief Copy of the active tags in activation order.
     */
    [[nodiscard]] std::vector<std::string> snapshot() const { return tags_; }

    /**
     * @brief Replace the active set with the settings' default tags.
     *
     * Blank and duplicate entries are dropped (first occurrence wins), then
     * the FORCE tag is inserted at the front if it is missing.
     */
    void reset(const LogSettings& settings);

    [[nodiscard]] bool empty() const noexcept { return tags_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return tags_.size(); }

private:
    std::vector<std::string> tags_;
};

} // namespace taglog

#endif // TAGLOG_TAG_REGISTRY_HPP
