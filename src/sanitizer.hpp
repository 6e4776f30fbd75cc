#pragma once

#include <string>
#include <string_view>

class HtmlSanitizer {
public:
    virtual ~HtmlSanitizer() = default;

    virtual std::string sanitize(std::string_view raw) = 0;
};

// Keeps a fixed set of formatting tags and attributes. Script-like elements are
// dropped with their content, other tags are dropped but their text is kept,
// URLs are limited to http(s), mailto and relative references.
class AllowlistSanitizer : public HtmlSanitizer {
public:
    std::string sanitize(std::string_view raw) override;
};
