#include "reader/chunker.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace reader {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_terminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool is_closer(char c) {
    return c == '"' || c == '\'' || c == ')' || c == ']';
}

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && is_space(s[a])) ++a;
    while (b > a && is_space(s[b - 1])) --b;
    return s.substr(a, b - a);
}

struct Fence {
    char marker = 0;
    size_t length = 0;
    size_t info_begin = 0;   // first char after the marker run
    size_t line_end = 0;     // offset of the newline ending the opening line (or range end)
};

// Opening fence (``` or ~~~, three or more) at the first non-blank character of [start, end)
std::optional<Fence> parse_opening_fence(const std::string& text, size_t start, size_t end) {
    size_t i = start;
    while (i < end && is_space(text[i])) ++i;
    if (i >= end || (text[i] != '`' && text[i] != '~')) return std::nullopt;

    Fence f;
    f.marker = text[i];
    size_t run = i;
    while (run < end && text[run] == f.marker) ++run;
    f.length = run - i;
    if (f.length < 3) return std::nullopt;

    f.info_begin = run;
    f.line_end = run;
    while (f.line_end < end && text[f.line_end] != '\n') ++f.line_end;
    return f;
}

// Splits [a, b) into pieces no longer than max_chars, preferring whitespace cut points
void split_long(const std::string& text, size_t a, size_t b, size_t max_chars,
                std::vector<std::pair<size_t, size_t>>& pieces) {
    while (b - a > max_chars) {
        size_t cut = a + max_chars;
        size_t k = cut;
        while (k > a && !is_space(text[k])) --k;
        if (k == a) {
            // One enormous word; cut it, but never inside a UTF-8 sequence
            k = cut;
            while (k > a && is_continuation_byte(text[k])) --k;
            if (k == a) k = cut;
        }
        size_t piece_end = k;
        while (piece_end > a && is_space(text[piece_end - 1])) --piece_end;
        if (piece_end > a) pieces.emplace_back(a, piece_end);
        a = k;
        while (a < b && is_space(text[a])) ++a;
    }
    if (b > a) pieces.emplace_back(a, b);
}

} // namespace

std::string Chunker::placeholder_text(const std::optional<std::string>& language) {
    if (language && !language->empty()) {
        return "[" + *language + " code]";
    }
    return "[code]";
}

std::optional<std::string> Chunker::section_language(const Document& document, const ContentSection& section) {
    if (section.language) {
        std::string lang = to_lower(trim(*section.language));
        if (!lang.empty()) return lang;
    }

    const std::string& text = document.plain_text;
    size_t end = std::min(section.end_index, text.size());
    auto fence = parse_opening_fence(text, section.start_index, end);
    if (!fence) return std::nullopt;

    std::string info = trim(text.substr(fence->info_begin, fence->line_end - fence->info_begin));
    size_t token_end = 0;
    while (token_end < info.size() && !is_space(info[token_end])) ++token_end;
    std::string lang = to_lower(info.substr(0, token_end));
    if (lang.empty()) return std::nullopt;
    return lang;
}

size_t Chunker::fenced_block_end(const std::string& text, size_t start, size_t end) {
    end = std::min(end, text.size());
    auto fence = parse_opening_fence(text, start, end);
    if (!fence) return end;

    size_t line = fence->line_end;
    while (line < end) {
        size_t i = line + 1;   // skip the newline
        size_t line_stop = i;
        while (line_stop < end && text[line_stop] != '\n') ++line_stop;

        while (i < line_stop && (text[i] == ' ' || text[i] == '\t')) ++i;
        size_t run = i;
        while (run < line_stop && text[run] == fence->marker) ++run;
        if (run - i >= fence->length) {
            size_t rest = run;
            while (rest < line_stop && is_space(text[rest])) ++rest;
            if (rest == line_stop) return end;
        }
        line = line_stop;
    }
    return text.size();
}

size_t Chunker::align_to_word_start(const Document& document, size_t position) {
    const std::string& text = document.plain_text;
    position = std::min(position, text.size());
    for (const auto& section : document.sections) {
        if (!section.contains(position)) continue;
        if (section.skippable) return position;
        while (position > section.start_index && !is_space(text[position - 1]) && !is_space(text[position])) {
            --position;
        }
        return position;
    }
    return position;
}

ChunkBatch Chunker::next_chunks(const Document& document, size_t from_position, size_t max_utterances) const {
    ChunkBatch batch;
    const std::string& text = document.plain_text;
    const auto& sections = document.sections;

    size_t position = std::min(from_position, text.size());
    size_t idx = 0;
    while (idx < sections.size() && sections[idx].end_index <= position) ++idx;

    while (idx < sections.size() && batch.utterances.size() < max_utterances) {
        const ContentSection& section = sections[idx];
        size_t start = std::max(position, section.start_index);
        size_t end = std::min(section.end_index, text.size());
        if (start >= end) {
            ++idx;
            continue;
        }

        if (section.skippable) {
            size_t block_end = std::max(end, fenced_block_end(text, section.start_index, end));
            if (!config_.skip_technical_sections) {
                batch.utterances.push_back(make_placeholder(document, idx, start, block_end));
            }
            position = block_end;
            while (idx < sections.size() && sections[idx].end_index <= position) ++idx;
            continue;
        }

        size_t budget = max_utterances - batch.utterances.size();
        if (!chunk_prose(document, idx, start, end, budget, batch.utterances, position)) {
            break;
        }
        position = end;
        ++idx;
    }

    batch.next_position = position;
    batch.reached_end = idx >= sections.size();
    return batch;
}

Utterance Chunker::make_placeholder(const Document& document, size_t section_index, size_t start, size_t end) const {
    const ContentSection& section = document.sections[section_index];
    auto language = section_language(document, section);

    Utterance u;
    u.text = placeholder_text(language);
    u.start_position = start;
    u.end_position = end;
    u.section_index = static_cast<int>(section_index);
    u.metadata.content_kind = section.kind;
    u.metadata.language = language;
    u.metadata.is_skippable = true;
    u.metadata.pending_announcements.push_back(
        InterjectionEvent::code_block_start(language, static_cast<int>(section_index)));
    u.metadata.pending_announcements.push_back(
        InterjectionEvent::code_block_end(static_cast<int>(section_index)));
    return u;
}

bool Chunker::chunk_prose(const Document& document, size_t section_index, size_t start, size_t end,
                          size_t budget, std::vector<Utterance>& out, size_t& position) const {
    const std::string& text = document.plain_text;
    const ContentSection& section = document.sections[section_index];
    const size_t max_chars = std::max<size_t>(config_.max_chars, 1);
    const size_t target = std::min(std::max<size_t>(config_.target_chars, 1), max_chars);
    const bool newline_breaks = section.kind == SectionKind::List;

    // The cursor is taken as-is; a cut inside an over-long word resumes right after the cut
    const size_t s = start;

    // Sentence spans, trailing whitespace trimmed
    std::vector<std::pair<size_t, size_t>> pieces;
    size_t i = s;
    while (i < end) {
        while (i < end && is_space(text[i])) ++i;
        if (i >= end) break;
        size_t a = i;
        size_t b = end;
        while (i < end) {
            char c = text[i];
            if (is_terminator(c)) {
                size_t j = i + 1;
                while (j < end && is_terminator(text[j])) ++j;
                while (j < end && is_closer(text[j])) ++j;
                if (j >= end || is_space(text[j])) {
                    b = j;
                    i = j;
                    break;
                }
                i = j;
                continue;
            }
            if (newline_breaks && c == '\n') {
                b = i;
                ++i;
                break;
            }
            ++i;
        }
        while (b > a && is_space(text[b - 1])) --b;
        if (b > a) split_long(text, a, b, max_chars, pieces);
    }

    size_t emitted = 0;
    bool open = false;
    size_t group_start = 0;
    size_t group_end = 0;

    auto flush = [&]() {
        Utterance u;
        u.text = text.substr(group_start, group_end - group_start);
        u.start_position = group_start;
        u.end_position = group_end;
        u.section_index = static_cast<int>(section_index);
        u.metadata.content_kind = section.kind;
        u.metadata.language = section.language;
        u.metadata.is_skippable = section.skippable;
        out.push_back(std::move(u));
        ++emitted;
        open = false;
        position = group_end;
    };

    for (const auto& piece : pieces) {
        if (open && piece.second - group_start > max_chars) {
            flush();
            if (emitted >= budget) break;
        }
        if (!open) {
            group_start = piece.first;
            open = true;
        }
        group_end = piece.second;
        if (group_end - group_start >= target) {
            flush();
            if (emitted >= budget) break;
        }
    }
    if (open) {
        flush();
    }

    // Done if nothing but whitespace is left in the section
    size_t rest = emitted > 0 ? position : s;
    while (rest < end && is_space(text[rest])) ++rest;
    if (rest < end) {
        return false;
    }
    position = end;
    return true;
}

} // namespace reader
