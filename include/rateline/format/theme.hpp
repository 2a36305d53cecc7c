#pragma once

#include "../common/constants.hpp"
#include <array>
#include <string>
#include <vector>

namespace rateline {
namespace format {

// Nine glyphs ordered from empty to full. Entries 1..7 draw the partially
// filled cell; entry 8 draws a full cell.
class Theme {
public:
    using Glyphs = std::array<std::string, constants::themes::GLYPH_COUNT>;
    
    Theme();
    
    static Theme ascii();
    static Theme basic();
    static Theme blocks();
    
    // Throws core::EngineError(INVALID_THEME) unless exactly nine glyphs are given.
    static Theme fromGlyphs(const std::vector<std::string>& glyphs);
    static Theme fromString(const std::string& utf8_glyphs);
    
    // Built-in name, or a string of nine glyphs.
    static Theme resolve(const std::string& name_or_glyphs);
    
    const std::string& glyph(size_t index) const { return glyphs_.at(index); }
    const std::string& empty() const { return glyphs_.front(); }
    const std::string& full() const { return glyphs_.back(); }
    
    // Glyph for a cell filled by fraction in [0, 1).
    const std::string& partial(double fraction) const;
    
    const Glyphs& glyphs() const { return glyphs_; }

private:
    explicit Theme(Glyphs glyphs);
    Glyphs glyphs_;
};

}
}
