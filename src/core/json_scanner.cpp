#include "domore/core/json_scanner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace domore::core {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_label_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '_' || c == '#';
}

// A balanced {...} span and the fence it was found in
struct Span {
    size_t start = 0;
    size_t end = 0;  // Offset of the closing brace
    int fence = -1;  // Index into labels, -1 outside any fence
};

struct Open {
    size_t offset;
    int fence;
};

}  // namespace

std::vector<JsonCandidate> find_json_objects(std::string_view text) {
    std::vector<JsonCandidate> found;
    if (text.empty()) {
        return found;
    }

    std::vector<Span> spans;
    std::vector<Open> open;
    std::vector<std::string> labels;
    int fence = -1;
    bool in_fence = false;
    bool in_string = false;
    bool escaped = false;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];

        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            } else if (c == '\n') {
                // JSON strings never hold a raw newline
                in_string = false;
            }
            continue;
        }

        if (c == '`' && text.compare(i, 3, "```") == 0) {
            // Objects never span a fence delimiter
            if (!open.empty()) {
                spdlog::debug("JSON scanner: {} unclosed brace(s) before fence at offset {}", open.size(), i);
                open.clear();
            }
            i += 2;
            if (in_fence) {
                in_fence = false;
                fence = -1;
            } else {
                size_t label_end = i + 1;
                while (label_end < text.size() && is_label_char(text[label_end])) {
                    ++label_end;
                }
                labels.push_back(to_lower(text.substr(i + 1, label_end - i - 1)));
                fence = static_cast<int>(labels.size()) - 1;
                in_fence = true;
                i = label_end - 1;
            }
            continue;
        }

        if (c == '{') {
            open.push_back({i, fence});
        } else if (c == '}') {
            if (!open.empty()) {
                spans.push_back({open.back().offset, i, open.back().fence});
                open.pop_back();
            }
        } else if (c == '"' && !open.empty()) {
            in_string = true;
        }
    }

    // Outermost parseable object wins; an unparseable span yields to the
    // spans nested inside it
    std::sort(spans.begin(), spans.end(),
              [](const Span& a, const Span& b) { return a.start < b.start; });

    size_t next_free = 0;
    for (const auto& span : spans) {
        if (span.start < next_free) {
            continue;
        }

        std::string_view raw = text.substr(span.start, span.end - span.start + 1);
        Json value = Json::parse(raw, nullptr, false);
        if (value.is_discarded() || !value.is_object()) {
            spdlog::debug("JSON scanner: unparseable span at offset {}", span.start);
            continue;
        }

        JsonCandidate candidate;
        candidate.offset = span.start;
        candidate.length = raw.size();
        candidate.text = std::string(raw);
        candidate.value = std::move(value);
        if (span.fence >= 0) {
            candidate.fenced = true;
            candidate.fence_label = labels[static_cast<size_t>(span.fence)];
        }

        found.push_back(std::move(candidate));
        next_free = span.end + 1;
    }

    return found;
}

}  // namespace domore::core
