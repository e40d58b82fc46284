#undef NDEBUG
#include "store/sanitizer.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace elrelay::store;
using json = nlohmann::json;

json valid_raw() {
    return {
        {"id", "el-1"},
        {"timestamp", 1700000000000LL},
        {"url", "https://example.com/page"},
        {"selector", "#main > button.submit"},
        {"html", "<button class=\"submit\">Send</button>"},
        {"text", "Send"},
        {"attributes", {{"class", "submit"}}},
        {"bounds", {{"x", 10}, {"y", 20}, {"width", 100}, {"height", 30}}},
        {"computed", {{"display", "block"}}},
        {"context", {{"parent", "#main"}, {"siblings", 2}, {"children", 0}}},
        {"screenshot", "iVBORw0KGgo="}
    };
}

void test_accepts_valid_record() {
    std::cout << "Testing valid record..." << std::endl;

    auto result = sanitize(valid_raw());
    assert(result.success);
    assert(result.error.empty());

    const Element& e = result.element;
    assert(e.id == "el-1");
    assert(e.captured_at == 1700000000000LL);
    assert(e.source_ref == "https://example.com/page");
    assert(e.label == "#main > button.submit");
    assert(e.excerpt == "Send");
    assert(e.attributes.at("class") == "submit");
    assert(e.auxiliary["bounds"]["width"] == 100);
    assert(e.auxiliary["context"]["siblings"] == 2);
    assert(e.media == "iVBORw0KGgo=");
    assert(!e.media_truncated);

    std::cout << "  PASS" << std::endl;
}

void test_rejects_missing_and_mistyped_fields() {
    std::cout << "Testing validation failures..." << std::endl;

    for (const char* field : {"id", "timestamp", "url", "selector", "html", "text"}) {
        json raw = valid_raw();
        raw.erase(field);
        auto result = sanitize(raw);
        assert(!result.success);
        assert(result.error.find(field) != std::string::npos);
    }

    json raw = valid_raw();
    raw["timestamp"] = 0;
    assert(!sanitize(raw).success);

    raw = valid_raw();
    raw["timestamp"] = -5;
    assert(!sanitize(raw).success);

    raw = valid_raw();
    raw["timestamp"] = "1700000000000";
    assert(!sanitize(raw).success);

    raw = valid_raw();
    raw["id"] = "";
    assert(!sanitize(raw).success);

    raw = valid_raw();
    raw["id"] = 42;
    assert(!sanitize(raw).success);

    raw = valid_raw();
    raw["selector"] = "";
    assert(!sanitize(raw).success);

    raw = valid_raw();
    raw["html"] = json::array();
    assert(!sanitize(raw).success);

    raw = valid_raw();
    raw["attributes"] = "class=submit";
    assert(!sanitize(raw).success);

    raw = valid_raw();
    raw["attributes"] = {{"tabindex", 3}};
    assert(!sanitize(raw).success);

    assert(!sanitize(json::array()).success);
    assert(!sanitize(json("element")).success);

    std::cout << "  PASS" << std::endl;
}

void test_url_scheme_check() {
    std::cout << "Testing url scheme check..." << std::endl;

    json raw = valid_raw();
    raw["url"] = "http://localhost:3000/";
    assert(sanitize(raw).success);

    raw["url"] = "HTTPS://EXAMPLE.COM";
    assert(sanitize(raw).success);

    raw["url"] = "file:///etc/passwd";
    assert(!sanitize(raw).success);

    raw["url"] = "javascript:alert(1)";
    assert(!sanitize(raw).success);

    raw["url"] = "";
    assert(!sanitize(raw).success);

    std::cout << "  PASS" << std::endl;
}

void test_float_timestamp_accepted() {
    std::cout << "Testing float timestamp..." << std::endl;

    json raw = valid_raw();
    raw["timestamp"] = 1700000000123.0;
    auto result = sanitize(raw);
    assert(result.success);
    assert(result.element.captured_at == 1700000000123LL);

    // Sub-millisecond but positive: accepted, clamped to 1 ms
    raw["timestamp"] = 0.5;
    result = sanitize(raw);
    assert(result.success);
    assert(result.element.captured_at == 1);

    raw["timestamp"] = -0.5;
    assert(!sanitize(raw).success);

    raw["timestamp"] = 0.0;
    assert(!sanitize(raw).success);

    std::cout << "  PASS" << std::endl;
}

void test_body_truncation() {
    std::cout << "Testing body truncation..." << std::endl;

    json raw = valid_raw();
    raw["html"] = std::string(60000, 'a');
    auto result = sanitize(raw);
    assert(result.success);

    const std::string& body = result.element.body;
    std::string marker = kTruncationMarker;
    assert(body.size() == 50000 + marker.size());
    assert(body.compare(0, 50000, std::string(50000, 'a')) == 0);
    assert(body.compare(50000, std::string::npos, marker) == 0);

    // Exactly at the ceiling: untouched
    raw["html"] = std::string(50000, 'b');
    result = sanitize(raw);
    assert(result.element.body == std::string(50000, 'b'));

    std::cout << "  PASS" << std::endl;
}

void test_excerpt_truncation() {
    std::cout << "Testing excerpt truncation..." << std::endl;

    json raw = valid_raw();
    raw["text"] = std::string(10001, 'x');
    auto result = sanitize(raw);
    assert(result.success);
    assert(result.element.excerpt == std::string(10000, 'x') + kTruncationMarker);

    std::cout << "  PASS" << std::endl;
}

void test_truncation_respects_utf8() {
    std::cout << "Testing UTF-8 safe truncation..." << std::endl;

    // "é" is two bytes; a 5-byte cut would split the third one
    std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9";
    assert(cap_text(text, 5) == std::string("\xC3\xA9\xC3\xA9") + kTruncationMarker);
    assert(cap_text(text, 6) == text);

    std::cout << "  PASS" << std::endl;
}

void test_media_all_or_nothing() {
    std::cout << "Testing media ceiling..." << std::endl;

    SanitizerLimits limits;
    limits.max_media_bytes = 16;

    json raw = valid_raw();
    raw["screenshot"] = std::string(16, 'A');
    auto result = sanitize(raw, limits);
    assert(result.element.media == std::string(16, 'A'));
    assert(!result.element.media_truncated);

    raw["screenshot"] = std::string(17, 'A');
    result = sanitize(raw, limits);
    assert(result.success);
    assert(result.element.media.empty());
    assert(result.element.media_truncated);
    assert(result.element.to_json()["_screenshotTruncated"] == true);

    raw["screenshot"] = nullptr;
    result = sanitize(raw, limits);
    assert(result.success);
    assert(!result.element.has_media());

    std::cout << "  PASS" << std::endl;
}

void test_attribute_redaction() {
    std::cout << "Testing attribute redaction..." << std::endl;

    json raw = valid_raw();
    raw["attributes"] = {
        {"data-Token", "abc123"},
        {"PASSWORD", "hunter2"},
        {"x-api-key", "k"},
        {"data-secret-id", "s"},
        {"aria-authority", "a"},
        {"class", "btn"},
        {"href", "/next"}
    };
    auto result = sanitize(raw);
    assert(result.success);

    const auto& attrs = result.element.attributes;
    assert(attrs.at("data-Token") == kRedactionToken);
    assert(attrs.at("PASSWORD") == kRedactionToken);
    assert(attrs.at("x-api-key") == kRedactionToken);
    assert(attrs.at("data-secret-id") == kRedactionToken);
    assert(attrs.at("aria-authority") == kRedactionToken);
    assert(attrs.at("class") == "btn");
    assert(attrs.at("href") == "/next");

    // Input is not modified
    assert(raw["attributes"]["data-Token"] == "abc123");

    std::cout << "  PASS" << std::endl;
}

void test_markup_scrubbing() {
    std::cout << "Testing markup scrubbing..." << std::endl;

    assert(scrub_markup("<div><script>alert(1)</script>ok</div>") == "<div>ok</div>");
    assert(scrub_markup("<SCRIPT type=\"text/javascript\">x()</Script>after") == "after");
    assert(scrub_markup("a<script>1</script>b<script src=x></script>c") == "abc");
    assert(scrub_markup("<scripts>keep</scripts>") == "<scripts>keep</scripts>");
    assert(scrub_markup("<script>never closed") == "<script>never closed");

    assert(scrub_markup("<img src=\"a.png\" onerror=\"steal()\">") == "<img src=\"a.png\">");
    assert(scrub_markup("<a href=\"#\" onClick=\"go()\" class=\"x\">") == "<a href=\"#\" class=\"x\">");
    assert(scrub_markup("<p>once upon a time</p>") == "<p>once upon a time</p>");
    assert(scrub_markup("<div data-on=\"1\">") == "<div data-on=\"1\">");

    json raw = valid_raw();
    raw["html"] = "<button onclick=\"pwn()\">Go</button><script>evil()</script>";
    auto result = sanitize(raw);
    assert(result.element.body == "<button>Go</button>");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Sanitizer Tests ===" << std::endl;

    test_accepts_valid_record();
    test_rejects_missing_and_mistyped_fields();
    test_url_scheme_check();
    test_float_timestamp_accepted();
    test_body_truncation();
    test_excerpt_truncation();
    test_truncation_respects_utf8();
    test_media_all_or_nothing();
    test_attribute_redaction();
    test_markup_scrubbing();

    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
