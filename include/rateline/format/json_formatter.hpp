#pragma once

#include "renderer.hpp"
#include "../common/types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>

namespace rateline {
namespace format {

class JsonFormatter {
public:
    static nlohmann::json format(const common::Snapshot& snapshot);
};

// One JSON object per line, for piping progress into other tools.
class JsonLinesRenderer : public Renderer {
public:
    explicit JsonLinesRenderer(std::ostream& out);
    
    size_t draw(const common::Snapshot& snapshot) override;
    void finishLine() override;
    void printLine(const std::string& text, size_t previous_width) override;

private:
    std::ostream& out_;
};

}}
