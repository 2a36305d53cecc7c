#include "rateline/format/theme.hpp"
#include "rateline/format/format_utils.hpp"
#include "rateline/core/error_codes.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace rateline {
namespace format {

Theme::Theme() : Theme(ascii()) {}

Theme::Theme(Glyphs glyphs) : glyphs_(std::move(glyphs)) {}

Theme Theme::ascii() {
    return Theme(Glyphs{" ", ".", ":", "-", "=", "≡", "#", "█", "█"});
}

Theme Theme::basic() {
    return Theme(Glyphs{" ", " ", " ", " ", " ", " ", " ", " ", "#"});
}

Theme Theme::blocks() {
    return Theme(Glyphs{" ", "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█"});
}

Theme Theme::fromGlyphs(const std::vector<std::string>& glyphs) {
    if (glyphs.size() != constants::themes::GLYPH_COUNT) {
        common::ErrorContext ctx;
        ctx.component = "Theme";
        ctx.details["glyph_count"] = std::to_string(glyphs.size());
        throw core::EngineError(core::CoreErrorCode::INVALID_THEME, ctx);
    }
    
    Glyphs result;
    std::copy(glyphs.begin(), glyphs.end(), result.begin());
    return Theme(std::move(result));
}

Theme Theme::fromString(const std::string& utf8_glyphs) {
    return fromGlyphs(splitGlyphs(utf8_glyphs));
}

Theme Theme::resolve(const std::string& name_or_glyphs) {
    if (name_or_glyphs == constants::themes::ASCII) return ascii();
    if (name_or_glyphs == constants::themes::BASIC) return basic();
    if (name_or_glyphs == constants::themes::BLOCKS) return blocks();
    
    if (splitGlyphs(name_or_glyphs).size() == constants::themes::GLYPH_COUNT) {
        return fromString(name_or_glyphs);
    }
    
    common::ErrorContext ctx;
    ctx.component = "Theme";
    ctx.details["theme"] = name_or_glyphs;
    throw core::EngineError(core::CoreErrorCode::UNKNOWN_THEME, ctx);
}

const std::string& Theme::partial(double fraction) const {
    if (!std::isfinite(fraction) || fraction <= 0.0) {
        return glyphs_.front();
    }
    
    auto last_partial = static_cast<double>(constants::themes::GLYPH_COUNT - 1);
    auto index = static_cast<size_t>(std::min(last_partial * fraction, last_partial - 1.0));
    return glyphs_[index];
}

}
}
