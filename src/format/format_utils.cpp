#include "rateline/format/format_utils.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace rateline {
namespace format {

namespace {

size_t utf8SequenceLength(unsigned char lead) {
    if ((lead & 0x80) == 0) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

}

std::vector<std::string> splitGlyphs(const std::string& text) {
    std::vector<std::string> glyphs;
    
    for (size_t i = 0; i < text.length();) {
        size_t utf8_len = utf8SequenceLength(static_cast<unsigned char>(text[i]));
        
        bool valid = utf8_len > 0 && i + utf8_len <= text.length();
        for (size_t j = 1; valid && j < utf8_len; ++j) {
            if ((static_cast<unsigned char>(text[i + j]) & 0xC0) != 0x80) {
                valid = false;
            }
        }
        
        if (valid) {
            glyphs.push_back(text.substr(i, utf8_len));
            i += utf8_len;
        } else {
            glyphs.push_back("\uFFFD");
            ++i;
        }
    }
    
    return glyphs;
}

size_t displayWidth(const std::string& text) {
    size_t width = 0;
    bool in_escape = false;
    
    for (size_t i = 0; i < text.length(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        
        if (c == 0x1B) {
            in_escape = true;
        } else if (in_escape) {
            if (c >= 0x40 && c <= 0x7E && c != '[') {
                in_escape = false;
            }
        } else if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    
    return width;
}

std::string repeatString(const std::string& str, size_t count) {
    std::string result;
    result.reserve(str.length() * count);
    for (size_t i = 0; i < count; ++i) {
        result += str;
    }
    return result;
}

std::string formatCount(int64_t value) {
    uint64_t magnitude = value < 0 ? uint64_t{0} - static_cast<uint64_t>(value) : static_cast<uint64_t>(value);
    std::string digits = std::to_string(magnitude);
    
    std::string result;
    result.reserve(digits.size() + digits.size() / 3 + 1);
    
    size_t lead = digits.size() % 3;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (i - lead) % 3 == 0) {
            result += ',';
        }
        result += digits[i];
    }
    
    return value < 0 ? "-" + result : result;
}

std::string formatRate(double units_per_second) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    
    if (!std::isfinite(units_per_second) || units_per_second <= 0.0) {
        oss << "?it/s";
    } else if (units_per_second < 1.0) {
        oss << (1.0 / units_per_second) << "s/it";
    } else {
        oss << units_per_second << "it/s";
    }
    
    return oss.str();
}

std::string formatSeconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return "?s";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << seconds << "s";
    return oss.str();
}

bool isControlCharacter(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

std::string sanitizeLabel(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        result += isControlCharacter(c) ? ' ' : ch;
    }
    
    return result;
}

}
}
