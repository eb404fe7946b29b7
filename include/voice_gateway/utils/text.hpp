#pragma once

#include <string>
#include <vector>

namespace voice_gateway::utils {

std::string remove_emojis(const std::string& text);
std::string trim(const std::string& text);

// Drops markdown emphasis, headings and code fences so they are not read aloud.
std::string strip_markdown(const std::string& text);

// Splits on sentence punctuation followed by whitespace and an upper-case letter.
// Abbreviations, decimals and ellipses never split. Chunks shorter than
// min_chunk_length are merged into the following one.
std::vector<std::string> split_sentences(const std::string& text, size_t min_chunk_length = 15);

// True for recognizer output that carries no speech, e.g. "[BLANK_AUDIO]" or "(music)".
bool is_silence_marker(const std::string& text);

}
