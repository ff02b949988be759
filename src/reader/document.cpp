#include "reader/document.hpp"

#include <algorithm>
#include <cctype>

namespace reader {

const char* to_string(SectionKind kind) {
    switch (kind) {
        case SectionKind::Header: return "header";
        case SectionKind::Paragraph: return "paragraph";
        case SectionKind::CodeBlock: return "code_block";
        case SectionKind::List: return "list";
        case SectionKind::Blockquote: return "blockquote";
    }
    return "unknown";
}

bool Document::empty() const {
    if (sections.empty()) return true;
    return std::all_of(plain_text.begin(), plain_text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

void Document::normalize() {
    std::stable_sort(sections.begin(), sections.end(),
                     [](const ContentSection& a, const ContentSection& b) {
                         return a.start_index < b.start_index;
                     });
    const size_t len = plain_text.size();
    for (auto& s : sections) {
        s.start_index = std::min(s.start_index, len);
        s.end_index = std::min(std::max(s.end_index, s.start_index), len);
    }
}

std::optional<size_t> Document::section_index_at(size_t position) const {
    if (sections.empty()) return std::nullopt;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (position < sections[i].end_index) {
            return i;
        }
    }
    return sections.size() - 1;
}

DocumentBuilder::DocumentBuilder(std::string separator) : separator_(std::move(separator)) {}

DocumentBuilder& DocumentBuilder::header(const std::string& text, int level) {
    return section(text, SectionKind::Header, false, level);
}

DocumentBuilder& DocumentBuilder::paragraph(const std::string& text) {
    return section(text, SectionKind::Paragraph, false);
}

DocumentBuilder& DocumentBuilder::list(const std::string& text) {
    return section(text, SectionKind::List, false);
}

DocumentBuilder& DocumentBuilder::blockquote(const std::string& text) {
    return section(text, SectionKind::Blockquote, false);
}

DocumentBuilder& DocumentBuilder::code_block(const std::string& code, const std::string& language,
                                             bool record_language) {
    std::string fenced = "```" + language + "\n" + code;
    if (!code.empty() && code.back() != '\n') fenced += "\n";
    fenced += "```";
    std::optional<std::string> lang;
    if (record_language && !language.empty()) lang = language;
    return section(fenced, SectionKind::CodeBlock, true, std::nullopt, lang);
}

DocumentBuilder& DocumentBuilder::section(const std::string& text, SectionKind kind, bool skippable,
                                          std::optional<int> level,
                                          std::optional<std::string> language) {
    if (!doc_.plain_text.empty()) {
        doc_.plain_text += separator_;
    }
    ContentSection s;
    s.start_index = doc_.plain_text.size();
    doc_.plain_text += text;
    s.end_index = doc_.plain_text.size();
    s.kind = kind;
    s.level = level;
    s.skippable = skippable;
    s.language = std::move(language);
    doc_.sections.push_back(s);
    return *this;
}

} // namespace reader
