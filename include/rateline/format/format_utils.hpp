#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace rateline {
namespace format {

// Splits UTF-8 text into code points. Malformed bytes become U+FFFD.
std::vector<std::string> splitGlyphs(const std::string& text);

// Terminal columns taken by text: one per code point, ANSI CSI sequences
// excluded.
size_t displayWidth(const std::string& text);

std::string repeatString(const std::string& str, size_t count);

// 1234567 -> "1,234,567"
std::string formatCount(int64_t value);

// "12.50it/s" at or above one unit per second, "3.20s/it" below.
std::string formatRate(double units_per_second);

std::string formatSeconds(double seconds);

// Control characters would break the single-line redraw.
std::string sanitizeLabel(const std::string& text);

bool isControlCharacter(unsigned char c);

}
}
