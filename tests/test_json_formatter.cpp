#include <gtest/gtest.h>

#include "rateline/format/json_formatter.hpp"

#include <limits>
#include <sstream>
#include <string>

using rateline::common::EngineState;
using rateline::common::Snapshot;
using rateline::format::JsonFormatter;
using rateline::format::JsonLinesRenderer;

TEST(JsonFormatter, KnownTotalSnapshot) {
    Snapshot snapshot;
    snapshot.current = 30;
    snapshot.total = 120;
    snapshot.percent = 25.0;
    snapshot.fill_fraction = 0.25;
    snapshot.rate = 15.0;
    snapshot.remaining_seconds = 6.0;
    snapshot.label = "upload";
    snapshot.state = EngineState::WARMING;
    
    auto json = JsonFormatter::format(snapshot);
    
    EXPECT_EQ("WARMING", json["state"]);
    EXPECT_EQ(30, json["current"]);
    EXPECT_EQ(120, json["total"]);
    EXPECT_DOUBLE_EQ(25.0, json["percent"].get<double>());
    EXPECT_DOUBLE_EQ(15.0, json["rate"].get<double>());
    EXPECT_DOUBLE_EQ(6.0, json["remaining_seconds"].get<double>());
    EXPECT_EQ("upload", json["label"]);
}

TEST(JsonFormatter, UnknownTotalAndEmptyLabelAreNull) {
    Snapshot snapshot;
    snapshot.current = 7;
    snapshot.total = -1;
    
    auto json = JsonFormatter::format(snapshot);
    
    EXPECT_TRUE(json["total"].is_null());
    EXPECT_TRUE(json["label"].is_null());
    EXPECT_EQ("FRESH", json["state"]);
}

TEST(JsonFormatter, NonFiniteNumbersBecomeZero) {
    Snapshot snapshot;
    snapshot.rate = std::numeric_limits<double>::infinity();
    snapshot.remaining_seconds = std::numeric_limits<double>::quiet_NaN();
    
    auto json = JsonFormatter::format(snapshot);
    
    EXPECT_TRUE(json["rate"].is_number());
    EXPECT_DOUBLE_EQ(0.0, json["rate"].get<double>());
    EXPECT_DOUBLE_EQ(0.0, json["remaining_seconds"].get<double>());
}

TEST(JsonLinesRenderer, WritesOneObjectPerLine) {
    std::ostringstream out;
    JsonLinesRenderer renderer(out);
    
    Snapshot first;
    first.current = 1;
    first.total = 2;
    Snapshot second;
    second.current = 2;
    second.total = 2;
    second.state = EngineState::FINISHED;
    
    EXPECT_EQ(0u, renderer.draw(first));
    renderer.draw(second);
    renderer.finishLine();
    
    std::istringstream lines(out.str());
    std::string line;
    
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ(1, nlohmann::json::parse(line)["current"]);
    ASSERT_TRUE(std::getline(lines, line));
    EXPECT_EQ("FINISHED", nlohmann::json::parse(line)["state"]);
    EXPECT_FALSE(std::getline(lines, line));
}

TEST(JsonLinesRenderer, PrintLineEmitsMessage) {
    std::ostringstream out;
    JsonLinesRenderer renderer(out);
    
    renderer.printLine("halfway", 80);
    
    auto json = nlohmann::json::parse(out.str());
    EXPECT_EQ("halfway", json["message"]);
}

TEST(JsonLinesRenderer, InvalidUtf8LabelIsReplaced) {
    std::ostringstream out;
    JsonLinesRenderer renderer(out);
    
    Snapshot snapshot;
    snapshot.label = "bad\xff";
    
    EXPECT_NO_THROW(renderer.draw(snapshot));
    EXPECT_NO_THROW(nlohmann::json::parse(out.str()));
}
