#include <ddrsync/remote/XmlDocument.hpp>

#include <cctype>
#include <charconv>
#include <cstdint>

namespace DS::Remote {

namespace {

bool is_name_start(char ch) {
    auto c = static_cast<unsigned char>(ch);
    return std::isalpha(c) != 0 || ch == '_' || ch == ':' || c >= 0x80;
}

bool is_name_char(char ch) {
    auto c = static_cast<unsigned char>(ch);
    return is_name_start(ch) || std::isdigit(c) != 0 || ch == '-' || ch == '.';
}

void append_utf8(std::string& out, std::uint32_t code_point) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

class XmlParser {
public:
    explicit XmlParser(std::string_view input)
        : input_(input) {}

    auto parse_root() -> DS::Expected<XmlElement> {
        if (auto skipped = skip_misc(); !skipped) {
            return std::unexpected(skipped.error());
        }
        if (at_end() || input_[pos_] != '<') {
            return fail("document has no root element");
        }

        std::vector<XmlElement> open;
        std::optional<XmlElement> root;

        while (!root) {
            if (at_end()) {
                return fail("unexpected end of document inside <" + (open.empty() ? std::string{} : open.back().name) + ">");
            }
            if (input_[pos_] != '<') {
                if (open.empty()) {
                    return fail("character data outside the root element");
                }
                auto end = input_.find('<', pos_);
                if (end == std::string_view::npos) {
                    end = input_.size();
                }
                auto decoded = decode(input_.substr(pos_, end - pos_));
                if (!decoded) {
                    return std::unexpected(decoded.error());
                }
                open.back().text.append(*decoded);
                pos_ = end;
                continue;
            }
            if (starts_with("<!--")) {
                if (auto skipped = skip_until("-->"); !skipped) {
                    return std::unexpected(skipped.error());
                }
                continue;
            }
            if (starts_with("<![CDATA[")) {
                if (open.empty()) {
                    return fail("CDATA outside the root element");
                }
                auto start = pos_ + 9;
                auto end   = input_.find("]]>", start);
                if (end == std::string_view::npos) {
                    return fail("unterminated CDATA section");
                }
                open.back().text.append(input_.substr(start, end - start));
                pos_ = end + 3;
                continue;
            }
            if (starts_with("<?")) {
                if (auto skipped = skip_until("?>"); !skipped) {
                    return std::unexpected(skipped.error());
                }
                continue;
            }
            if (starts_with("</")) {
                pos_ += 2;
                auto name = read_name();
                skip_whitespace();
                if (name.empty() || at_end() || input_[pos_] != '>') {
                    return fail("malformed closing tag");
                }
                ++pos_;
                if (open.empty() || open.back().name != name) {
                    return fail("mismatched closing tag </" + name + ">");
                }
                XmlElement closed = std::move(open.back());
                open.pop_back();
                if (open.empty()) {
                    root = std::move(closed);
                } else {
                    open.back().children.push_back(std::move(closed));
                }
                continue;
            }

            ++pos_;
            XmlElement element;
            bool       self_closing = false;
            if (auto status = read_start_tag(element, self_closing); !status) {
                return std::unexpected(status.error());
            }
            if (!self_closing) {
                open.push_back(std::move(element));
            } else if (open.empty()) {
                root = std::move(element);
            } else {
                open.back().children.push_back(std::move(element));
            }
        }

        if (auto skipped = skip_misc(); !skipped) {
            return std::unexpected(skipped.error());
        }
        if (!at_end()) {
            return fail("content after the root element");
        }
        return std::move(*root);
    }

private:
    auto fail(std::string message) const -> std::unexpected<DS::Error> {
        return std::unexpected(DS::Error{DS::Error::Code::ParseFailure,
                                         "xml: " + message + " at offset " + std::to_string(pos_)});
    }

    bool at_end() const { return pos_ >= input_.size(); }

    bool starts_with(std::string_view prefix) const { return input_.substr(pos_).starts_with(prefix); }

    void skip_whitespace() {
        while (!at_end() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
            ++pos_;
        }
    }

    auto skip_until(std::string_view terminator) -> DS::Expected<void> {
        auto end = input_.find(terminator, pos_);
        if (end == std::string_view::npos) {
            return fail("unterminated markup");
        }
        pos_ = end + terminator.size();
        return {};
    }

    auto skip_doctype() -> DS::Expected<void> {
        int depth = 0;
        while (!at_end()) {
            char ch = input_[pos_++];
            if (ch == '[') {
                ++depth;
            } else if (ch == ']') {
                --depth;
            } else if (ch == '>' && depth <= 0) {
                return {};
            }
        }
        return fail("unterminated DOCTYPE");
    }

    auto skip_misc() -> DS::Expected<void> {
        while (true) {
            skip_whitespace();
            if (starts_with("<?")) {
                if (auto skipped = skip_until("?>"); !skipped) {
                    return skipped;
                }
            } else if (starts_with("<!--")) {
                if (auto skipped = skip_until("-->"); !skipped) {
                    return skipped;
                }
            } else if (starts_with("<!DOCTYPE") || starts_with("<!doctype")) {
                if (auto skipped = skip_doctype(); !skipped) {
                    return skipped;
                }
            } else {
                return {};
            }
        }
    }

    auto read_name() -> std::string {
        auto start = pos_;
        if (at_end() || !is_name_start(input_[pos_])) {
            return {};
        }
        while (!at_end() && is_name_char(input_[pos_])) {
            ++pos_;
        }
        return std::string{input_.substr(start, pos_ - start)};
    }

    auto read_start_tag(XmlElement& element, bool& self_closing) -> DS::Expected<void> {
        element.name = read_name();
        if (element.name.empty()) {
            return fail("malformed element name");
        }
        while (true) {
            skip_whitespace();
            if (at_end()) {
                return fail("unterminated start tag <" + element.name + ">");
            }
            if (starts_with("/>")) {
                pos_ += 2;
                self_closing = true;
                return {};
            }
            if (input_[pos_] == '>') {
                ++pos_;
                self_closing = false;
                return {};
            }
            auto key = read_name();
            if (key.empty()) {
                return fail("malformed attribute in <" + element.name + ">");
            }
            skip_whitespace();
            if (at_end() || input_[pos_] != '=') {
                return fail("attribute '" + key + "' has no value");
            }
            ++pos_;
            skip_whitespace();
            if (at_end() || (input_[pos_] != '"' && input_[pos_] != '\'')) {
                return fail("attribute '" + key + "' value is not quoted");
            }
            char quote = input_[pos_++];
            auto end   = input_.find(quote, pos_);
            if (end == std::string_view::npos) {
                return fail("unterminated value for attribute '" + key + "'");
            }
            auto decoded = decode(input_.substr(pos_, end - pos_));
            if (!decoded) {
                return std::unexpected(decoded.error());
            }
            pos_ = end + 1;
            element.attributes.emplace_back(std::move(key), std::move(*decoded));
        }
    }

    auto decode(std::string_view raw) const -> DS::Expected<std::string> {
        std::string out;
        out.reserve(raw.size());
        std::size_t i = 0;
        while (i < raw.size()) {
            if (raw[i] == '<') {
                return fail("'<' inside attribute value");
            }
            if (raw[i] != '&') {
                out.push_back(raw[i++]);
                continue;
            }
            auto semicolon = raw.find(';', i);
            if (semicolon == std::string_view::npos) {
                return fail("unterminated entity reference");
            }
            auto entity = raw.substr(i + 1, semicolon - i - 1);
            if (entity == "lt") {
                out.push_back('<');
            } else if (entity == "gt") {
                out.push_back('>');
            } else if (entity == "amp") {
                out.push_back('&');
            } else if (entity == "quot") {
                out.push_back('"');
            } else if (entity == "apos") {
                out.push_back('\'');
            } else if (entity.size() > 1 && entity.front() == '#') {
                auto          digits = entity.substr(1);
                int           base   = 10;
                if (!digits.empty() && (digits.front() == 'x' || digits.front() == 'X')) {
                    digits.remove_prefix(1);
                    base = 16;
                }
                std::uint32_t code_point = 0;
                auto          result = std::from_chars(digits.data(), digits.data() + digits.size(), code_point, base);
                if (digits.empty() || result.ec != std::errc{} || result.ptr != digits.data() + digits.size()
                    || code_point > 0x10FFFF) {
                    return fail("invalid character reference");
                }
                append_utf8(out, code_point);
            } else {
                return fail("unknown entity &" + std::string{entity} + ";");
            }
            i = semicolon + 1;
        }
        return out;
    }

    std::string_view input_;
    std::size_t      pos_{0};
};

} // namespace

XmlElement::XmlElement(XmlElement const&)                         = default;
XmlElement::XmlElement(XmlElement&&) noexcept                     = default;
auto XmlElement::operator=(XmlElement const&) -> XmlElement&      = default;
auto XmlElement::operator=(XmlElement&&) noexcept -> XmlElement&  = default;

XmlElement::~XmlElement() {
    if (children.empty()) {
        return;
    }
    std::vector<XmlElement> pending = std::move(children);
    while (!pending.empty()) {
        XmlElement element = std::move(pending.back());
        pending.pop_back();
        for (auto& child : element.children) {
            pending.push_back(std::move(child));
        }
        element.children.clear();
    }
}

auto XmlElement::attribute(std::string_view key) const -> std::optional<std::string> {
    for (auto const& [name, value] : attributes) {
        if (name == key) {
            return value;
        }
    }
    return std::nullopt;
}

auto XmlDocument::parse(std::string_view text) -> DS::Expected<XmlDocument> {
    XmlParser parser{text};
    auto      root = parser.parse_root();
    if (!root) {
        return std::unexpected(root.error());
    }
    XmlDocument document;
    document.root_ = std::move(*root);
    return document;
}

auto XmlDocument::find_first(std::function<bool(XmlElement const&)> const& predicate) const -> XmlElement const* {
    std::vector<XmlElement const*> stack{&root_};
    while (!stack.empty()) {
        auto const* element = stack.back();
        stack.pop_back();
        if (predicate(*element)) {
            return element;
        }
        for (auto it = element->children.rbegin(); it != element->children.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
    return nullptr;
}

void XmlDocument::for_each(std::function<void(XmlElement const&)> const& visitor) const {
    std::vector<XmlElement const*> stack{&root_};
    while (!stack.empty()) {
        auto const* element = stack.back();
        stack.pop_back();
        visitor(*element);
        for (auto it = element->children.rbegin(); it != element->children.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
}

} // namespace DS::Remote
