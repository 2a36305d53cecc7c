#pragma once

#include "rateline/format/renderer.hpp"
#include <string>
#include <utility>
#include <vector>

namespace rateline {
namespace testing {

struct RenderLog {
    std::vector<common::Snapshot> drawn;
    std::vector<std::pair<std::string, size_t>> printed;
    std::vector<std::string> themes;
    int finished_lines = 0;
};

// Keeps everything it is asked to draw. The log outlives the renderer so the
// bar can own the renderer.
class RecordingRenderer : public format::Renderer {
public:
    RecordingRenderer(RenderLog& log, size_t width = 42) : log_(log), width_(width) {}
    
    size_t draw(const common::Snapshot& snapshot) override {
        log_.drawn.push_back(snapshot);
        return width_;
    }
    
    void finishLine() override { ++log_.finished_lines; }
    
    void printLine(const std::string& text, size_t previous_width) override {
        log_.printed.emplace_back(text, previous_width);
    }
    
    void setTheme(const format::Theme& theme) override {
        log_.themes.push_back(theme.full());
    }

private:
    RenderLog& log_;
    size_t width_;
};

}}
