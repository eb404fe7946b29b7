#include "voice_gateway/utils/text.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <unordered_set>

namespace voice_gateway::utils {

namespace {

bool is_emoji_codepoint(uint32_t codepoint) {
    return (codepoint >= 0x1F600 && codepoint <= 0x1F64F) ||
           (codepoint >= 0x1F300 && codepoint <= 0x1F5FF) ||
           (codepoint >= 0x1F680 && codepoint <= 0x1F6FF) ||
           (codepoint >= 0x1F700 && codepoint <= 0x1F77F) ||
           (codepoint >= 0x1F780 && codepoint <= 0x1F7FF) ||
           (codepoint >= 0x1F800 && codepoint <= 0x1F8FF) ||
           (codepoint >= 0x1F900 && codepoint <= 0x1F9FF) ||
           (codepoint >= 0x1FA00 && codepoint <= 0x1FA6F) ||
           (codepoint >= 0x1FA70 && codepoint <= 0x1FAFF) ||
           (codepoint >= 0x2702 && codepoint <= 0x27B0) ||
           (codepoint >= 0x24C2 && codepoint <= 0x1F251);
}

bool decode_utf8(const std::string& text, size_t index, uint32_t& codepoint, size_t& length) {
    const auto byte = static_cast<unsigned char>(text[index]);
    if (byte < 0x80) {
        codepoint = byte;
        length = 1;
        return true;
    }
    if ((byte & 0xE0) == 0xC0 && index + 1 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        if ((b1 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x1F) << 6) | (b1 & 0x3F);
        length = 2;
        return codepoint >= 0x80;
    }
    if ((byte & 0xF0) == 0xE0 && index + 2 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
        length = 3;
        return codepoint >= 0x800;
    }
    if ((byte & 0xF8) == 0xF0 && index + 3 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        const auto b3 = static_cast<unsigned char>(text[index + 3]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x07) << 18) |
                    ((b1 & 0x3F) << 12) |
                    ((b2 & 0x3F) << 6) |
                    (b3 & 0x3F);
        length = 4;
        return codepoint >= 0x10000 && codepoint <= 0x10FFFF;
    }
    return false;
}

const std::unordered_set<std::string>& abbreviations() {
    static const std::unordered_set<std::string> values = {
        "mr", "mrs", "ms", "dr", "prof", "sr", "jr", "vs", "etc", "inc", "ltd",
        "co", "corp", "st", "ave", "blvd", "rd", "apt", "dept", "est", "vol",
        "rev", "gen", "col", "lt", "sgt", "capt", "cmdr", "adm", "gov", "pres",
        "sen", "rep", "hon", "jan", "feb", "mar", "apr", "jun", "jul", "aug",
        "sep", "oct", "nov", "dec", "mon", "tue", "wed", "thu", "fri", "sat", "sun",
        "i.e", "e.g", "cf", "al", "approx", "govt", "univ", "assn"};
    return values;
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

// Word ending at the period at index `dot`, without the period itself.
std::string word_before(const std::string& text, size_t dot) {
    size_t begin = dot;
    while (begin > 0) {
        const auto ch = static_cast<unsigned char>(text[begin - 1]);
        if (!std::isalpha(ch) && ch != '.') {
            break;
        }
        --begin;
    }
    return text.substr(begin, dot - begin);
}

bool is_boundary(const std::string& text, size_t index) {
    const char ch = text[index];
    if (ch != '.' && ch != '!' && ch != '?') {
        return false;
    }
    size_t next = index + 1;
    if (next >= text.size() || !std::isspace(static_cast<unsigned char>(text[next]))) {
        return false;
    }
    while (next < text.size() && std::isspace(static_cast<unsigned char>(text[next]))) {
        ++next;
    }
    if (next >= text.size() || !std::isupper(static_cast<unsigned char>(text[next]))) {
        return false;
    }
    if (ch != '.') {
        return true;
    }
    if (index > 0 && text[index - 1] == '.') {
        return false;
    }
    return abbreviations().count(to_lower(word_before(text, index))) == 0;
}

}

std::string remove_emojis(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        uint32_t codepoint = 0;
        size_t length = 1;
        if (!decode_utf8(text, i, codepoint, length)) {
            result.push_back(text[i]);
            ++i;
            continue;
        }
        if (!is_emoji_codepoint(codepoint)) {
            result.append(text, i, length);
        }
        i += length;
    }
    return result;
}

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string strip_markdown(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool line_start = true;
    for (size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '*' || ch == '`') {
            continue;
        }
        if (line_start && (ch == '#' || ch == '>')) {
            continue;
        }
        if (line_start && (ch == '-' || ch == '+') && i + 1 < text.size() && text[i + 1] == ' ') {
            ++i;
            continue;
        }
        if (ch == '\n') {
            line_start = true;
            result.push_back(' ');
            continue;
        }
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            line_start = false;
        }
        result.push_back(ch);
    }
    return trim(result);
}

std::vector<std::string> split_sentences(const std::string& text, size_t min_chunk_length) {
    const auto input = trim(text);
    std::vector<std::string> sentences;
    size_t start = 0;
    for (size_t i = 0; i < input.size(); ++i) {
        if (!is_boundary(input, i)) {
            continue;
        }
        auto sentence = trim(input.substr(start, i + 1 - start));
        if (!sentence.empty()) {
            sentences.push_back(std::move(sentence));
        }
        start = i + 1;
    }
    auto tail = trim(input.substr(std::min(start, input.size())));
    if (!tail.empty()) {
        sentences.push_back(std::move(tail));
    }

    std::vector<std::string> merged;
    std::string buffer;
    for (const auto& sentence : sentences) {
        buffer = buffer.empty() ? sentence : buffer + " " + sentence;
        if (buffer.size() >= min_chunk_length) {
            merged.push_back(std::move(buffer));
            buffer.clear();
        }
    }
    if (!buffer.empty()) {
        if (merged.empty()) {
            merged.push_back(std::move(buffer));
        } else {
            merged.back() += " " + buffer;
        }
    }
    return merged;
}

bool is_silence_marker(const std::string& text) {
    const auto trimmed = trim(text);
    if (trimmed.empty()) {
        return true;
    }
    const char open = trimmed.front();
    const char close = trimmed.back();
    const bool bracketed = (open == '[' && close == ']') || (open == '(' && close == ')') ||
                           (open == '*' && close == '*');
    if (!bracketed) {
        return false;
    }
    return trimmed.size() > 1 && trimmed.find(close, 1) == trimmed.size() - 1;
}

}
