#include "rateline/format/json_formatter.hpp"
#include <cmath>

namespace rateline {
namespace format {

namespace {

// nlohmann::json serializes NaN and infinity as null; keep the field numeric.
double finiteOrZero(double value) {
    return std::isfinite(value) ? value : 0.0;
}

}

nlohmann::json JsonFormatter::format(const common::Snapshot& snapshot) {
    nlohmann::json json;
    
    json["state"] = common::to_string(snapshot.state);
    json["current"] = snapshot.current;
    
    if (snapshot.total > 0) {
        json["total"] = snapshot.total;
    } else {
        json["total"] = nullptr;
    }
    
    json["percent"] = finiteOrZero(snapshot.percent);
    json["fill_fraction"] = finiteOrZero(snapshot.fill_fraction);
    json["elapsed_seconds"] = finiteOrZero(snapshot.elapsed_seconds);
    json["remaining_seconds"] = finiteOrZero(snapshot.remaining_seconds);
    json["rate"] = finiteOrZero(snapshot.rate);
    
    if (!snapshot.label.empty()) {
        json["label"] = snapshot.label;
    } else {
        json["label"] = nullptr;
    }
    
    return json;
}

JsonLinesRenderer::JsonLinesRenderer(std::ostream& out) : out_(out) {}

size_t JsonLinesRenderer::draw(const common::Snapshot& snapshot) {
    out_ << JsonFormatter::format(snapshot).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n" << std::flush;
    return 0;
}

void JsonLinesRenderer::finishLine() {
    out_ << std::flush;
}

void JsonLinesRenderer::printLine(const std::string& text, size_t) {
    nlohmann::json json;
    json["message"] = text;
    out_ << json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n" << std::flush;
}

}}
