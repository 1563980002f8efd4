//
// Created by Giuseppe Francione on 05/10/26.
//

#ifndef TAGLOG_MAIN_TAGS_HPP
#define TAGLOG_MAIN_TAGS_HPP

#include <string_view>

/**
 * @brief A few ready-made tags.
 *
 * Any non-blank string is a valid tag; these constants only cover common
 * cases. Projects usually keep their own list of tags next to this one.
 */
namespace taglog::MainTag {

    /// Reserved tag: always active, cannot be disabled.
    inline constexpr std::string_view FORCE = "F";

    inline constexpr std::string_view INFO = "INFO";
    inline constexpr std::string_view WARNING = "WARN";
    inline constexpr std::string_view IMPORTANT = "IMP";
    inline constexpr std::string_view ANALYTIC = "ANALYTIC";
    inline constexpr std::string_view PLAYER = "PLAYER";
    inline constexpr std::string_view UI = "UI";

} // namespace taglog::MainTag

#endif // TAGLOG_MAIN_TAGS_HPP
