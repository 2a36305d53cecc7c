#pragma once

#include "../common/types.hpp"
#include "theme.hpp"
#include <string>
#include <cstddef>

namespace rateline {
namespace format {

// Output side of a progress bar. The engine never writes anything itself;
// it hands snapshots to one of these.
class Renderer {
public:
    virtual ~Renderer() = default;
    
    // Draws the snapshot and returns the display width of what was written.
    virtual size_t draw(const common::Snapshot& snapshot) = 0;
    
    // Called once after the final snapshot.
    virtual void finishLine() = 0;
    
    // Prints text on its own line, clearing a bar of previous_width columns.
    virtual void printLine(const std::string& text, size_t previous_width) = 0;
    
    // Only glyph-based renderers have a theme.
    virtual void setTheme(const Theme&) {}
};

}
}
