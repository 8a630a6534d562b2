#include "termbar/bar/styles.hpp"
#include <algorithm>
#include <cctype>

namespace termbar {
namespace bar {

MeterFamily familyOf(Animation animation) {
    switch (animation) {
        case Animation::TQDM:
        case Animation::TQDM_ASCII:
        case Animation::FILL_UP:
            return MeterFamily::BLOCK;
        case Animation::ARROW:
            return MeterFamily::SOLID_ARROW;
        case Animation::CLASSIC:
        case Animation::FIRA_CODE:
        default:
            return MeterFamily::SOLID;
    }
}

std::optional<Animation> parseAnimation(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    lower.erase(std::remove(lower.begin(), lower.end(), '_'), lower.end());
    lower.erase(std::remove(lower.begin(), lower.end(), '-'), lower.end());

    if (lower == "tqdm") return Animation::TQDM;
    if (lower == "tqdmascii" || lower == "ascii") return Animation::TQDM_ASCII;
    if (lower == "fillup") return Animation::FILL_UP;
    if (lower == "classic") return Animation::CLASSIC;
    if (lower == "arrow") return Animation::ARROW;
    if (lower == "firacode") return Animation::FIRA_CODE;
    return std::nullopt;
}

const char* animationName(Animation animation) {
    switch (animation) {
        case Animation::TQDM: return "tqdm";
        case Animation::TQDM_ASCII: return "tqdm_ascii";
        case Animation::FILL_UP: return "fillup";
        case Animation::CLASSIC: return "classic";
        case Animation::ARROW: return "arrow";
        case Animation::FIRA_CODE: return "firacode";
        default: return "tqdm";
    }
}

namespace charsets {

const std::vector<std::string>& tqdm() {
    static const std::vector<std::string> glyphs = {
        " ", "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█"
    };
    return glyphs;
}

const std::vector<std::string>& ascii() {
    static const std::vector<std::string> glyphs = {
        " ", "1", "2", "3", "4", "5", "6", "7", "8", "9", "#"
    };
    return glyphs;
}

const std::vector<std::string>& fillUp() {
    static const std::vector<std::string> glyphs = {
        " ", "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█"
    };
    return glyphs;
}

const std::vector<std::string>& classicSpinner() {
    static const std::vector<std::string> glyphs = {"\\", "|", "/", "-"};
    return glyphs;
}

const std::vector<std::string>& firaCodeSpinner() {
    static const std::vector<std::string> glyphs = {
        "\uEE06", "\uEE07", "\uEE08", "\uEE09", "\uEE0A", "\uEE0B"
    };
    return glyphs;
}

}

Style resolveStyle(Animation animation, bool ascii, const std::string& fill,
                   const std::vector<std::string>& custom_charset) {
    Style style;
    style.animation = animation;
    style.fill = fill;
    style.spinner = charsets::classicSpinner();

    if (!custom_charset.empty()) {
        if (familyOf(animation) != MeterFamily::BLOCK) {
            style.animation = Animation::TQDM;
        }
        style.glyphs = custom_charset;
        return style;
    }

    if (ascii) {
        if (familyOf(animation) != MeterFamily::BLOCK) {
            style.animation = Animation::TQDM_ASCII;
        }
        style.glyphs = charsets::ascii();
        return style;
    }

    switch (animation) {
        case Animation::TQDM:
            style.glyphs = charsets::tqdm();
            break;
        case Animation::TQDM_ASCII:
            style.glyphs = charsets::ascii();
            break;
        case Animation::FILL_UP:
            style.glyphs = charsets::fillUp();
            break;
        case Animation::CLASSIC:
            style.glyphs = {charsets::CLASSIC_BLOCK};
            style.fill = charsets::CLASSIC_FILL;
            break;
        case Animation::ARROW:
            style.glyphs = {charsets::ARROW_BLOCK};
            break;
        case Animation::FIRA_CODE:
            style.glyphs = {charsets::FIRA_CODE_BLOCK};
            style.fill = charsets::FIRA_CODE_FILL;
            style.spinner = charsets::firaCodeSpinner();
            break;
    }
    return style;
}

}}
