#include "net/login_page.hpp"

#include <algorithm>
#include <cctype>
#include <map>

namespace {
const char* ERROR_MARKERS[] = {"pf-c-alert__title", "kc-feedback-text"};

std::string to_lower_copy(const std::string& s) {
    std::string r = s;
    std::transform(r.begin(), r.end(), r.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return r;
}

struct html_tag {
    std::map<std::string, std::string> attributes;
    size_t end; // position after '>'
};

// Parses the tag starting at `pos` (which points at '<'). Attribute names are
// lower-cased; values have entities decoded.
html_tag parse_tag(const std::string& html, size_t pos) {
    html_tag tag;
    size_t i = pos + 1;
    while (i < html.size() && !std::isspace(static_cast<unsigned char>(html[i])) &&
           html[i] != '>' && html[i] != '/')
        ++i;

    while (i < html.size()) {
        while (i < html.size() &&
               (std::isspace(static_cast<unsigned char>(html[i])) || html[i] == '/'))
            ++i;
        if (i >= html.size() || html[i] == '>')
            break;

        size_t name_start = i;
        while (i < html.size() && html[i] != '=' && html[i] != '>' &&
               !std::isspace(static_cast<unsigned char>(html[i])) && html[i] != '/')
            ++i;
        std::string name = to_lower_copy(html.substr(name_start, i - name_start));

        while (i < html.size() && std::isspace(static_cast<unsigned char>(html[i])))
            ++i;
        std::string value;
        if (i < html.size() && html[i] == '=') {
            ++i;
            while (i < html.size() && std::isspace(static_cast<unsigned char>(html[i])))
                ++i;
            if (i < html.size() && (html[i] == '"' || html[i] == '\'')) {
                char quote = html[i++];
                size_t close = html.find(quote, i);
                if (close == std::string::npos)
                    close = html.size();
                value = html.substr(i, close - i);
                i = close + 1;
            } else {
                size_t value_start = i;
                while (i < html.size() && html[i] != '>' &&
                       !std::isspace(static_cast<unsigned char>(html[i])))
                    ++i;
                value = html.substr(value_start, i - value_start);
            }
        }
        if (!name.empty())
            tag.attributes[name] = login_page::decode_entities(value);
    }
    tag.end = i < html.size() ? i + 1 : html.size();
    return tag;
}

// Next "<name" opening tag at or after `from`, case-insensitive.
size_t find_tag(const std::string& lower_html, const std::string& name, size_t from) {
    std::string needle = "<" + name;
    while (true) {
        size_t pos = lower_html.find(needle, from);
        if (pos == std::string::npos)
            return pos;
        size_t after = pos + needle.size();
        if (after >= lower_html.size())
            return std::string::npos;
        char c = lower_html[after];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '>' || c == '/')
            return pos;
        from = after;
    }
}

std::string attribute(const html_tag& tag, const std::string& name) {
    auto it = tag.attributes.find(name);
    return it == tag.attributes.end() ? std::string() : it->second;
}

std::string collapse_whitespace(const std::string& text) {
    std::string out;
    bool in_space = false;
    for (unsigned char ch : text) {
        if (std::isspace(ch)) {
            in_space = !out.empty();
        } else {
            if (in_space)
                out.push_back(' ');
            out.push_back(static_cast<char>(ch));
            in_space = false;
        }
    }
    return out;
}

std::string strip_tags(const std::string& html) {
    std::string out;
    bool in_tag = false;
    for (char c : html) {
        if (c == '<') {
            in_tag = true;
        } else if (c == '>') {
            in_tag = false;
        } else if (!in_tag) {
            out.push_back(c);
        }
    }
    return out;
}
} // namespace

namespace login_page {

std::string decode_entities(const std::string& text) {
    static const std::pair<const char*, char> named[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&#39;", '\''},
        {"&apos;", '\''}, {"&#x27;", '\''}, {"&#x2F;", '/'}, {"&#47;", '/'}, {"&#61;", '='},
    };
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& entity : named) {
                size_t len = std::char_traits<char>::length(entity.first);
                if (text.compare(i, len, entity.first) == 0) {
                    out.push_back(entity.second);
                    i += len;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced)
            out.push_back(text[i++]);
    }
    return out;
}

std::optional<login_form> find_login_form(const std::string& html, const std::string& form_id) {
    std::string lower = to_lower_copy(html);
    size_t pos = find_tag(lower, "form", 0);
    while (pos != std::string::npos) {
        html_tag form_tag = parse_tag(html, pos);
        if (attribute(form_tag, "id") == form_id) {
            size_t form_end = lower.find("</form", form_tag.end);
            if (form_end == std::string::npos)
                form_end = html.size();

            login_form form;
            form.action = attribute(form_tag, "action");
            size_t input_pos = find_tag(lower, "input", form_tag.end);
            while (input_pos != std::string::npos && input_pos < form_end) {
                html_tag input = parse_tag(html, input_pos);
                std::string name = attribute(input, "name");
                if (to_lower_copy(attribute(input, "type")) == "hidden" && !name.empty()) {
                    form.hidden_fields.emplace_back(name, attribute(input, "value"));
                }
                input_pos = find_tag(lower, "input", input.end);
            }
            return form;
        }
        pos = find_tag(lower, "form", form_tag.end);
    }
    return std::nullopt;
}

std::optional<std::string> find_login_error(const std::string& html) {
    bool marked = false;
    for (const char* marker : ERROR_MARKERS) {
        if (html.find(marker) != std::string::npos) {
            marked = true;
            break;
        }
    }
    if (!marked)
        return std::nullopt;

    // Prefer the alert title, then the feedback text, as the message.
    std::string lower = to_lower_copy(html);
    for (const char* marker : ERROR_MARKERS) {
        size_t pos = find_tag(lower, "span", 0);
        while (pos != std::string::npos) {
            html_tag span = parse_tag(html, pos);
            if (attribute(span, "class").find(marker) != std::string::npos) {
                size_t close = lower.find("</span", span.end);
                if (close == std::string::npos)
                    close = html.size();
                std::string text =
                    collapse_whitespace(decode_entities(strip_tags(html.substr(span.end, close - span.end))));
                if (!text.empty())
                    return text;
            }
            pos = find_tag(lower, "span", span.end);
        }
    }
    return std::string("login rejected");
}

} // namespace login_page
