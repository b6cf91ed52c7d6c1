#pragma once

#include <ddrsync/core/Error.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace DS::Remote {

struct XmlElement {
    XmlElement() = default;
    XmlElement(XmlElement const&);
    XmlElement(XmlElement&&) noexcept;
    auto operator=(XmlElement const&) -> XmlElement&;
    auto operator=(XmlElement&&) noexcept -> XmlElement&;
    // Releases descendants without recursing, so nesting depth is unbounded.
    ~XmlElement();

    std::string                                      name;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::vector<XmlElement>                          children;
    std::string                                      text;

    auto attribute(std::string_view key) const -> std::optional<std::string>;
};

// Minimal reader for the playback device's dictionary documents: elements,
// attributes, character data, CDATA and the predefined/numeric entities.
// Comments, processing instructions and DOCTYPE are skipped.
class XmlDocument {
public:
    static auto parse(std::string_view text) -> DS::Expected<XmlDocument>;

    auto root() const -> XmlElement const& { return root_; }

    // Pre-order search including the root element.
    auto find_first(std::function<bool(XmlElement const&)> const& predicate) const -> XmlElement const*;
    void for_each(std::function<void(XmlElement const&)> const& visitor) const;

private:
    XmlElement root_;
};

} // namespace DS::Remote
