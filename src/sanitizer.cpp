#include "sanitizer.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <vector>

namespace {

const std::map<std::string, std::set<std::string>, std::less<>> ALLOWED_TAGS = {
    {"a", {"href", "rel", "target"}},
    {"abbr", {}}, {"b", {}}, {"blockquote", {"cite"}}, {"br", {}}, {"code", {}},
    {"dd", {}}, {"del", {}}, {"div", {}}, {"dl", {}}, {"dt", {}}, {"em", {}},
    {"h1", {}}, {"h2", {}}, {"h3", {}}, {"h4", {}}, {"h5", {}}, {"h6", {}},
    {"hr", {}}, {"i", {}},
    {"img", {"src", "alt", "width", "height"}},
    {"li", {}}, {"ol", {"start"}}, {"p", {}}, {"pre", {}}, {"s", {}},
    {"span", {}}, {"strong", {}}, {"sub", {}}, {"sup", {}},
    {"table", {}}, {"tbody", {}}, {"thead", {}}, {"tr", {}},
    {"td", {"colspan", "rowspan"}}, {"th", {"colspan", "rowspan"}},
    {"u", {}}, {"ul", {}},
};

const std::set<std::string, std::less<>> GLOBAL_ATTRIBUTES = {"class", "title"};

const std::set<std::string, std::less<>> URL_ATTRIBUTES = {"href", "src", "cite"};

// Removed together with everything up to their closing tag.
const std::set<std::string, std::less<>> DROPPED_ELEMENTS = {
    "script", "style", "iframe", "object", "embed", "applet", "form",
    "textarea", "select", "noscript", "template", "svg", "math",
};

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// "&amp;", "&#39;", "&#x2F;"
bool is_entity_at(std::string_view s, size_t pos) {
    size_t i = pos + 1;
    if (i < s.size() && s[i] == '#') {
        ++i;
        if (i < s.size() && (s[i] == 'x' || s[i] == 'X')) ++i;
    }
    const size_t start = i;
    while (i < s.size() && is_name_char(s[i])) ++i;
    return i > start && i < s.size() && s[i] == ';' && i - start <= 32;
}

void append_escaped(std::string& out, std::string_view text) {
    for (size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        switch (c) {
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '&': out += is_entity_at(text, i) ? "&" : "&amp;"; break;
            default: out += c;
        }
    }
}

int digit_value(char c, int base) {
    if (c >= '0' && c <= '9') return c - '0';
    if (base == 16) {
        const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    }
    return -1;
}

// Named references that can spell out a scheme or its delimiters.
const std::map<std::string, char, std::less<>> SCHEME_REFERENCES = {
    {"colon", ':'}, {"sol", '/'}, {"quest", '?'}, {"num", '#'}, {"amp", '&'},
    {"tab", '\t'}, {"newline", '\n'}, {"period", '.'}, {"lpar", '('}, {"rpar", ')'},
};

// Decodes character references the way a browser reads an attribute value.
// Non-ASCII code points become 0x80 so they can never form a delimiter.
std::string decode_references(std::string_view value) {
    std::string out;
    size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '&') {
            out += value[i++];
            continue;
        }
        size_t j = i + 1;
        if (j < value.size() && value[j] == '#') {
            ++j;
            int base = 10;
            if (j < value.size() && (value[j] == 'x' || value[j] == 'X')) {
                base = 16;
                ++j;
            }
            const size_t digits = j;
            unsigned long code = 0;
            int digit = 0;
            while (j < value.size() && (digit = digit_value(value[j], base)) >= 0) {
                code = std::min(code * base + digit, 0x110000UL);
                ++j;
            }
            if (j > digits) {
                if (j < value.size() && value[j] == ';') ++j;
                out += code < 0x80 ? static_cast<char>(code) : '\x80';
                i = j;
                continue;
            }
        } else {
            while (j < value.size() && is_name_char(value[j])) ++j;
            if (j < value.size() && value[j] == ';') {
                auto named = SCHEME_REFERENCES.find(to_lower(value.substr(i + 1, j - i - 1)));
                if (named != SCHEME_REFERENCES.end()) {
                    out += named->second;
                    i = j + 1;
                    continue;
                }
            }
        }
        out += value[i++];
    }
    return out;
}

bool is_safe_url(std::string_view value) {
    // Browsers ignore control characters and whitespace inside schemes.
    std::string compact;
    for (char c : decode_references(value)) {
        if (!is_space(c) && static_cast<unsigned char>(c) >= 0x20 && c != 0x7f) compact += c;
    }
    compact = to_lower(compact);

    const size_t colon = compact.find(':');
    const size_t delimiter = compact.find_first_of("/?#");
    if (colon == std::string::npos || (delimiter != std::string::npos && delimiter < colon)) {
        // Still-encoded text before the first delimiter may hide a scheme.
        const size_t end = delimiter == std::string::npos ? compact.size() : delimiter;
        return compact.find('&') >= end;
    }
    const std::string scheme = compact.substr(0, colon);
    return scheme == "http" || scheme == "https" || scheme == "mailto";
}

struct Attribute {
    std::string name;
    std::string value;
};

// Parses attributes of a tag body (text between the tag name and '>').
std::vector<Attribute> parse_attributes(std::string_view body) {
    std::vector<Attribute> attributes;
    size_t i = 0;
    while (i < body.size()) {
        while (i < body.size() && (is_space(body[i]) || body[i] == '/')) ++i;
        const size_t name_start = i;
        while (i < body.size() && !is_space(body[i]) && body[i] != '=' && body[i] != '/') ++i;
        if (i == name_start) break;
        Attribute attr{to_lower(body.substr(name_start, i - name_start)), ""};
        while (i < body.size() && is_space(body[i])) ++i;
        if (i < body.size() && body[i] == '=') {
            ++i;
            while (i < body.size() && is_space(body[i])) ++i;
            if (i < body.size() && (body[i] == '"' || body[i] == '\'')) {
                const char quote = body[i++];
                const size_t value_start = i;
                while (i < body.size() && body[i] != quote) ++i;
                attr.value = std::string(body.substr(value_start, i - value_start));
                if (i < body.size()) ++i;
            } else {
                const size_t value_start = i;
                while (i < body.size() && !is_space(body[i])) ++i;
                attr.value = std::string(body.substr(value_start, i - value_start));
            }
        }
        attributes.push_back(std::move(attr));
    }
    return attributes;
}

// Position of the '>' closing a tag that starts at `pos`, honoring quotes.
size_t find_tag_end(std::string_view s, size_t pos) {
    char quote = 0;
    for (size_t i = pos; i < s.size(); ++i) {
        if (quote) {
            if (s[i] == quote) quote = 0;
        } else if (s[i] == '"' || s[i] == '\'') {
            quote = s[i];
        } else if (s[i] == '>') {
            return i;
        }
    }
    return std::string_view::npos;
}

// Position just past "</name ... >", or npos.
size_t find_closing_tag(std::string_view s, size_t pos, std::string_view name) {
    const std::string lowered = to_lower(s);
    const std::string needle = "</" + std::string(name);
    size_t at = pos;
    while ((at = lowered.find(needle, at)) != std::string::npos) {
        const size_t after = at + needle.size();
        if (after >= s.size() || !is_name_char(s[after])) {
            const size_t end = s.find('>', after);
            return end == std::string_view::npos ? std::string_view::npos : end + 1;
        }
        at = after;
    }
    return std::string_view::npos;
}

std::string rebuild_tag(const std::string& name, const std::set<std::string>& allowed, std::string_view body, bool self_closing) {
    std::string out = "<" + name;
    for (const auto& attr : parse_attributes(body)) {
        if (!allowed.contains(attr.name) && !GLOBAL_ATTRIBUTES.contains(attr.name)) continue;
        if (attr.name.starts_with("on")) continue;
        if (URL_ATTRIBUTES.contains(attr.name) && !is_safe_url(attr.value)) continue;
        out += " " + attr.name + "=\"";
        append_escaped(out, attr.value);
        out += "\"";
    }
    out += self_closing ? " />" : ">";
    return out;
}

} // anonymous namespace

std::string AllowlistSanitizer::sanitize(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());

    size_t i = 0;
    while (i < raw.size()) {
        const char c = raw[i];
        if (c == '&') {
            out += is_entity_at(raw, i) ? "&" : "&amp;";
            ++i;
            continue;
        }
        if (c == '>') {
            out += "&gt;";
            ++i;
            continue;
        }
        if (c != '<') {
            out += c;
            ++i;
            continue;
        }

        if (raw.substr(i).starts_with("<!--")) {
            const size_t end = raw.find("-->", i + 4);
            i = (end == std::string_view::npos) ? raw.size() : end + 3;
            continue;
        }

        size_t j = i + 1;
        const bool closing = j < raw.size() && raw[j] == '/';
        if (closing) ++j;
        const size_t name_start = j;
        while (j < raw.size() && is_name_char(raw[j])) ++j;
        const size_t tag_end = find_tag_end(raw, j);
        if (j == name_start || tag_end == std::string_view::npos) {
            out += "&lt;";
            ++i;
            continue;
        }

        const std::string name = to_lower(raw.substr(name_start, j - name_start));
        std::string_view body = raw.substr(j, tag_end - j);
        const bool self_closing = !body.empty() && body.back() == '/';
        if (self_closing) body.remove_suffix(1);
        i = tag_end + 1;

        if (DROPPED_ELEMENTS.contains(name)) {
            if (!closing && !self_closing) {
                const size_t after = find_closing_tag(raw, i, name);
                i = (after == std::string_view::npos) ? raw.size() : after;
            }
            continue;
        }

        auto allowed = ALLOWED_TAGS.find(name);
        if (allowed == ALLOWED_TAGS.end()) {
            continue;
        }
        if (closing) {
            out += "</" + name + ">";
        } else {
            out += rebuild_tag(name, allowed->second, body, self_closing);
        }
    }
    return out;
}
