#pragma once

#include <optional>
#include <string>
#include <vector>

namespace termbar {
namespace bar {

// Render families for the meter segment.
//   TQDM, TQDM_ASCII, FILL_UP  block-style, sub-character resolution
//   CLASSIC, FIRA_CODE         solid blocks
//   ARROW                      solid blocks with a '>' tip
enum class Animation {
    TQDM,
    TQDM_ASCII,
    FILL_UP,
    CLASSIC,
    ARROW,
    FIRA_CODE
};

enum class MeterFamily {
    BLOCK,
    SOLID,
    SOLID_ARROW
};

MeterFamily familyOf(Animation animation);

std::optional<Animation> parseAnimation(const std::string& name);
const char* animationName(Animation animation);

namespace charsets {
    // Index 0 is the empty glyph, the last entry is the full block.
    const std::vector<std::string>& tqdm();
    const std::vector<std::string>& ascii();
    const std::vector<std::string>& fillUp();

    const std::vector<std::string>& classicSpinner();
    const std::vector<std::string>& firaCodeSpinner();

    constexpr const char* CLASSIC_BLOCK = "#";
    constexpr const char* CLASSIC_FILL = ".";
    constexpr const char* ARROW_BLOCK = "=";
    constexpr const char* ARROW_TIP = ">";

    constexpr const char* FIRA_CODE_BLOCK = "\uEE04";
    constexpr const char* FIRA_CODE_FILL = "\uEE01";
    constexpr const char* FIRA_CODE_OPEN = "\uEE03";
    constexpr const char* FIRA_CODE_CLOSE = "\uEE02";
    constexpr const char* FIRA_CODE_CLOSE_DONE = "\uEE05";
}

// Resolved glyphs for one indicator.
struct Style {
    Animation animation = Animation::TQDM;
    std::vector<std::string> glyphs;
    std::string fill = " ";
    std::vector<std::string> spinner;
};

// Picks glyphs, fill and spinner for the animation. A non-empty custom
// charset always wins and keeps the block-style family.
Style resolveStyle(Animation animation, bool ascii, const std::string& fill,
                   const std::vector<std::string>& custom_charset);

}}
