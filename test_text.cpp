#include <cassert>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iostream>
#include <vector>
#include <iomanip>
#include <sstream>

// Include the C++ files we're testing
#include "components/g2_glasses_ble/text_layout.h"
#include "components/g2_glasses_ble/notification.h"
#include "components/g2_glasses_ble/checksum.h"
#include "components/g2_glasses_ble/protocol.h"

using namespace esphome::g2_glasses_ble;

static const uint64_t TEST_TIME = 1700000000ULL;  // 2023-11-14 22:13:20 UTC

// Helper function to convert hex string to bytes
std::vector<uint8_t> hex_to_bytes(const std::string& hex) {
    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < hex.length(); i += 2) {
        while (i < hex.length() && hex[i] == ' ') {
          i++;
        }
        if (i >= hex.length()) break;
        std::string byte_str = hex.substr(i, 2);
        uint8_t byte = static_cast<uint8_t>(std::stoul(byte_str, nullptr, 16));
        bytes.push_back(byte);
    }
    return bytes;
}

// Helper function to print bytes as hex
std::string bytes_to_hex(const uint8_t* data, size_t len) {
    std::ostringstream oss;
    for (size_t i = 0; i < len; i++) {
        oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::vector<std::string> split_whitespace(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream iss(text);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string repeat(const std::string& unit, size_t count) {
    std::string result;
    for (size_t i = 0; i < count; i++) {
        result += unit;
    }
    return result;
}

Session short_authenticated(Endpoint endpoint) {
    Session session(endpoint);
    std::vector<Packet> packets;
    ErrorCode error = build_auth_packets(session, AuthMode::SHORT, TEST_TIME, packets);
    assert(error == ErrorCode::NONE);
    return session;
}

// Test UTF-8 helpers
void test_utf8() {
    std::cout << "Testing UTF-8 helpers...\n";

    // Test 1: Code point counting
    {
        assert(utf8_length("") == 0);
        assert(utf8_length("hello") == 5);
        assert(utf8_length("日本語") == 3);
        assert(utf8_length("caf\xC3\xA9") == 4);

        std::cout << "  ✓ Code point length\n";
    }

    // Test 2: Removing the last code point
    {
        std::string text = "a日";
        assert(utf8_pop_back(text));
        assert(text == "a");
        assert(utf8_pop_back(text));
        assert(text.empty());
        assert(!utf8_pop_back(text));

        std::cout << "  ✓ Pop back\n";
    }

    // Test 3: Prefix never splits a code point
    {
        assert(utf8_prefix("日本語", 4) == "日");
        assert(utf8_prefix("日本語", 6) == "日本");
        assert(utf8_prefix("日本語", 2) == "");
        assert(utf8_prefix("abc", 10) == "abc");

        std::cout << "  ✓ Prefix\n";
    }

    std::cout << "All UTF-8 tests passed!\n\n";
}

// Test line wrapping
void test_wrap() {
    std::cout << "Testing wrapping...\n";

    // Test 1: Greedy word packing
    {
        auto lines = wrap_text("Hello world this is a test of wrapping", 25, 10);
        assert(lines.size() == 10);
        assert(lines[0] == "Hello world this is a");
        assert(lines[1] == "test of wrapping");
        for (size_t i = 2; i < lines.size(); i++) {
            assert(lines[i] == " ");
        }

        std::cout << "  ✓ Greedy packing\n";
    }

    // Test 2: Literal and escaped newlines, blank lines kept
    {
        auto lines = wrap_text("Line one\\nLine two\n\nEnd", 25, 10);
        assert(lines[0] == "Line one");
        assert(lines[1] == "Line two");
        assert(lines[2] == "");
        assert(lines[3] == "End");
        assert(lines[4] == " ");

        assert(count_source_lines("Line one\\nLine two\n\nEnd") == 4);
        assert(count_source_lines("") == 1);

        std::cout << "  ✓ Newlines\n";
    }

    // Test 3: Overlong words are never broken
    {
        auto lines = wrap_text("supercalifragilisticexpialidocious word", 25, 10);
        assert(lines[0] == "supercalifragilisticexpialidocious");
        assert(lines[1] == "word");

        std::cout << "  ✓ Overlong word\n";
    }

    // Test 4: CJK widths count code points
    {
        auto lines = wrap_text("日本語のテキスト 日本語のテキスト", chars_per_line(LanguageProfile::CJK), 10);
        assert(lines[0] == "日本語のテキスト");
        assert(lines[1] == "日本語のテキスト");

        std::cout << "  ✓ CJK width\n";
    }

    // Test 5: Word sequence survives wrapping
    {
        std::string text = "The quick brown fox jumps over the lazy dog.\n  Pack my box with\tfive dozen liquor jugs!\n\n"
                           "Sphinx of black quartz, judge my vow. A-very-long-hyphenated-token-that-exceeds-the-line";
        auto lines = wrap_text(text, 25, 10);
        std::string joined;
        for (const auto& line : lines) {
            assert(utf8_length(line) <= 25 || split_whitespace(line).size() == 1);
            joined += line + " ";
        }
        assert(split_whitespace(joined) == split_whitespace(text));

        std::cout << "  ✓ Lossless word sequence\n";
    }

    std::cout << "All wrapping tests passed!\n\n";
}

// Test pagination
void test_paginate() {
    std::cout << "Testing pagination...\n";

    // Test 1: Short text is padded to the minimum page count
    {
        TextLayoutConfig config;
        std::vector<std::string> pages;
        assert(layout_text("Hello world this is a test of wrapping", config, pages) == ErrorCode::NONE);
        assert(pages.size() == 14);
        assert(pages[0] == "Hello world this is a\ntest of wrapping\n \n \n \n \n \n \n \n  \n");
        for (size_t i = 1; i < pages.size(); i++) {
            assert(pages[i] == " \n \n \n \n \n \n \n \n \n  \n");
        }

        std::cout << "  ✓ Minimum pages\n";
    }

    // Test 2: Lines are grouped ten per page
    {
        std::string text;
        for (int i = 0; i < 60; i++) {
            text += (i ? " word" : "word") + std::to_string(i);
        }
        TextLayoutConfig config;
        std::vector<std::string> pages;
        assert(layout_text(text, config, pages) == ErrorCode::NONE);
        assert(pages.size() == 14);
        assert(pages[0] ==
               "word0 word1 word2 word3\nword4 word5 word6 word7\nword8 word9 word10\nword11 word12 word13\n"
               "word14 word15 word16\nword17 word18 word19\nword20 word21 word22\nword23 word24 word25\n"
               "word26 word27 word28\nword29 word30 word31 \n");
        assert(pages[1] ==
               "word32 word33 word34\nword35 word36 word37\nword38 word39 word40\nword41 word42 word43\n"
               "word44 word45 word46\nword47 word48 word49\nword50 word51 word52\nword53 word54 word55\n"
               "word56 word57 word58\nword59 \n");

        std::cout << "  ✓ Page grouping\n";
    }

    // Test 3: Every page has exactly lines_per_page lines
    {
        std::vector<std::string> lines(23, "x");
        TextLayoutConfig config;
        config.lines_per_page = 4;
        config.min_pages = 3;
        std::vector<TextPage> pages;
        assert(paginate(lines, config, pages) == ErrorCode::NONE);
        assert(pages.size() == 6);
        for (const auto& page : pages) {
            assert(page.lines.size() == 4);
        }
        assert(pages[5].lines[3] == " ");

        std::cout << "  ✓ Fixed page size\n";
    }

    // Test 4: Byte budget shortens the last long lines first
    {
        std::string text;
        for (int i = 0; i < 10; i++) {
            text += (i ? "\n" : "") + std::string("abcdefghijabcdefghij");
        }
        TextLayoutConfig config;
        config.max_page_text_bytes = 100;
        std::vector<std::string> pages;
        assert(layout_text(text, config, pages) == ErrorCode::NONE);
        assert(pages[0] ==
               "abcdefghijabcdefghij\nabcdefghijabcdefghij\nabcdefghijabcdefghij\nabcdefghijabcdefghij\n"
               "abc\na\na\na\na\na \n");
        assert(pages[0].size() + 1 == 100);

        std::cout << "  ✓ Byte budget\n";
    }

    // Test 5: Budget on multi-byte text keeps valid UTF-8
    {
        TextLayoutConfig config;
        config.profile = LanguageProfile::CJK;
        config.max_page_text_bytes = 60;
        std::vector<std::string> pages;
        assert(layout_text("日本語のテキスト 日本語のテキスト 日本語のテキスト", config, pages) == ErrorCode::NONE);
        assert(pages[0] == "日本語のテキスト\n日本語の\n日\n \n \n \n \n \n \n  \n");
        assert(pages[0].size() + 1 == 58);

        std::cout << "  ✓ Multi-byte budget\n";
    }

    // Test 6: Impossible budget and bad configuration
    {
        TextLayoutConfig config;
        config.max_page_text_bytes = 5;
        std::vector<std::string> pages;
        assert(layout_text("hello", config, pages) == ErrorCode::TEXT_BUDGET_EXCEEDED);
        assert(pages.empty());

        TextLayoutConfig empty_pages;
        empty_pages.lines_per_page = 0;
        assert(layout_text("hello", empty_pages, pages) == ErrorCode::INVALID_ARGUMENT);
        assert(pages.empty());

        std::cout << "  ✓ Budget errors\n";
    }

    std::cout << "All pagination tests passed!\n\n";
}

// Test display truncation
void test_truncation() {
    std::cout << "Testing truncation...\n";

    // Test 1: AI card budgets
    {
        assert(truncate_for_display("short", 150) == "short");

        std::string result = truncate_for_display(std::string(300, 'a'), 200);
        assert(result.size() == 200);
        assert(result.substr(197) == "...");

        result = truncate_for_display(repeat("日", 100), 150);
        assert(result == repeat("日", 49) + "...");

        // Budgets too small for the ellipsis keep a plain prefix
        assert(truncate_for_display("abcdef", 3) == "...");
        assert(truncate_for_display("abcdef", 2) == "ab");
        assert(truncate_for_display("日本", 2).empty());
        assert(truncate_for_display("abcdef", 0).empty());

        std::cout << "  ✓ Display truncation\n";
    }

    // Test 2: Field truncation
    {
        assert(truncate_with_ellipsis("abcdef", 6) == "abcdef");
        assert(truncate_with_ellipsis("abcdef", 5) == "ab...");
        assert(truncate_with_ellipsis("abcdef", 3) == "abc");
        assert(truncate_with_ellipsis("abcdef", 0) == "");
        assert(truncate_with_ellipsis(repeat("é", 20), 30) == repeat("é", 13) + "...");

        std::cout << "  ✓ Field truncation\n";
    }

    std::cout << "All truncation tests passed!\n\n";
}

// Test notification record and truncation
void test_notification_record() {
    std::cout << "Testing notification record...\n";

    NotificationOptions options;

    // Test 1: Compact JSON layout
    {
        assert(notification_msg_id(TEST_TIME) == 10000);
        assert(notification_msg_id(1700001234ULL) == 11234);
        assert(format_notification_date(TEST_TIME) == "20231114T221320");

        std::string json = serialize_notification(NotificationContent("Hi", "Bob", "Lunch?"), options, TEST_TIME);
        assert(json ==
               "{\"android_notification\":{\"msg_id\":10000,\"action\":0,\"app_identifier\":\"com.google.android.gm\","
               "\"title\":\"Hi\",\"subtitle\":\"Bob\",\"message\":\"Lunch?\",\"time_s\":1700000000,"
               "\"date\":\"20231114T221320\",\"display_name\":\"Gmail\"}}");
        assert(json.size() == 210);

        std::string empty = serialize_notification(NotificationContent(), options, TEST_TIME);
        assert(empty.size() == 199);

        std::cout << "  ✓ JSON layout\n";
    }

    // Test 2: Non-ASCII text is written as raw UTF-8, control characters are escaped
    {
        std::string json =
            serialize_notification(NotificationContent("Café", "日本", "a\"b\nc"), options, TEST_TIME);
        assert(json.find("\"title\":\"Caf\xC3\xA9\",") != std::string::npos);
        assert(json.find("\"subtitle\":\"\xE6\x97\xA5\xE6\x9C\xAC\",") != std::string::npos);
        assert(json.find("\"message\":\"a\\\"b\\nc\",") != std::string::npos);
        assert(json.find("\\u") == std::string::npos);
        // 5 + 6 UTF-8 bytes plus 7 for the escaped message
        assert(json.size() == 199 + 5 + 6 + 7);

        std::cout << "  ✓ UTF-8 passthrough\n";
    }

    // Test 3: Content that fits is untouched
    {
        bool truncated = true;
        NotificationContent content("Hi", "Bob", "Lunch?");
        NotificationContent result = truncate_notification(content, options, TEST_TIME, &truncated);
        assert(!truncated);
        assert(result.title == "Hi" && result.subtitle == "Bob" && result.message == "Lunch?");

        std::cout << "  ✓ No truncation\n";
    }

    // Test 4: Long message is truncated first
    {
        bool truncated = false;
        NotificationContent result = truncate_notification(
            NotificationContent("Short", "Sub", std::string(1000, 'x')), options, TEST_TIME, &truncated);
        assert(truncated);
        assert(result.title == "Short");
        assert(result.subtitle == "Sub");
        assert(result.message == std::string(24, 'x') + "...");
        assert(serialize_notification(result, options, TEST_TIME).size() == 234);

        result = truncate_notification(NotificationContent("Python", "Test Notification", "Hello from Python!"),
                                       options, TEST_TIME);
        assert(result.message == "Hello fro...");

        std::cout << "  ✓ Message first\n";
    }

    // Test 5: Subtitle goes next, title last
    {
        NotificationContent result = truncate_notification(
            NotificationContent(std::string(20, 'T'), std::string(40, 'S'), "M"), options, TEST_TIME);
        assert(result.title == std::string(20, 'T'));
        assert(result.subtitle == std::string(12, 'S') + "...");
        assert(result.message.empty());

        result = truncate_notification(NotificationContent(std::string(300, 'T'), "S", "M"), options, TEST_TIME);
        assert(result.title == std::string(32, 'T') + "...");
        assert(result.subtitle.empty());
        assert(result.message.empty());
        assert(serialize_notification(result, options, TEST_TIME).size() <= 234);

        std::cout << "  ✓ Subtitle, then title\n";
    }

    // Test 6: Multi-byte and escaped characters still fit
    {
        NotificationContent result =
            truncate_notification(NotificationContent("Hi", "Bob", repeat("é", 200)), options, TEST_TIME);
        assert(result.message == repeat("é", 13) + "...");
        assert(serialize_notification(result, options, TEST_TIME).size() <= 234);

        result = truncate_notification(NotificationContent("Q", "\"quoted\"", std::string(100, '"')), options,
                                       TEST_TIME);
        assert(serialize_notification(result, options, TEST_TIME).size() <= 234);
        assert(result.title == "Q");

        std::cout << "  ✓ Multi-byte and escaped content\n";
    }

    std::cout << "All notification record tests passed!\n\n";
}

// Test FILE_CHECK header and notification transfer
void test_notification_transfer() {
    std::cout << "Testing notification transfer...\n";

    NotificationOptions options;
    const std::string json = serialize_notification(NotificationContent("Hi", "Bob", "Lunch?"), options, TEST_TIME);
    const uint8_t* json_data = reinterpret_cast<const uint8_t*>(json.data());

    // Test 1: FILE_CHECK bit packing
    {
        assert(crc32c(json_data, json.size()) == 0x1D81856E);

        FileCheckHeader header = FileCheckHeader::for_data(json_data, json.size(), options.filename);
        assert(header.magic == 0x100);
        assert(header.size == 210 * 256);
        assert(header.crc32c_shifted == 0x81856E00);
        assert(header.crc_extra_byte == 0x1D);

        std::vector<uint8_t> payload;
        assert(header.serialize(payload) == ErrorCode::NONE);
        assert(payload.size() == FILE_CHECK_PAYLOAD_SIZE);
        assert(bytes_to_hex(payload.data(), 13) == "0001000000D20000006E85811D");
        assert(memcmp(payload.data() + 13, "user/notify_whitelist.json", 26) == 0);
        for (size_t i = 13 + 26; i < payload.size(); i++) {
            assert(payload[i] == 0);
        }

        header.filename = std::string(81, 'f');
        payload.clear();
        assert(header.serialize(payload) == ErrorCode::INVALID_ARGUMENT);
        assert(payload.empty());

        std::cout << "  ✓ FILE_CHECK header\n";
    }

    // Test 2: Full transfer after short handshakes on both endpoints
    {
        Session right = short_authenticated(Endpoint::RIGHT);
        Session left = short_authenticated(Endpoint::LEFT);

        NotificationBatch batch;
        assert(build_notification(right, left, NotificationContent("Hi", "Bob", "Lunch?"), options, TEST_TIME,
                                  batch) == ErrorCode::NONE);
        assert(!batch.truncated);
        assert(batch.json == json);
        assert(batch.primary.size() == 4);

        const Packet& check = batch.primary[0];
        assert(check.sequence() == 4);
        assert(check.service() == SERVICE_FILE_CONTROL);
        assert(check.payload_len() == FILE_CHECK_PAYLOAD_SIZE);
        assert(check.delay_after_ms() == FILE_CHECK_DELAY_MS);

        assert(bytes_to_hex(batch.primary[1].data(), batch.primary[1].size()) == "AA2105030101C40001D1F1");
        assert(batch.primary[1].delay_after_ms() == FILE_START_DELAY_MS);

        const Packet& data = batch.primary[2];
        assert(data.sequence() == 6);
        assert(data.service() == SERVICE_FILE_DATA);
        assert(std::string(reinterpret_cast<const char*>(data.payload()), data.payload_len()) == json);
        assert(data.delay_after_ms() == FILE_DATA_DELAY_MS);

        assert(bytes_to_hex(batch.primary[3].data(), batch.primary[3].size()) == "AA2107030101C40002B2C1");
        assert(batch.primary[3].delay_after_ms() == FILE_END_DELAY_MS);

        for (const auto& packet : batch.primary) {
            assert(packet.characteristic() == Characteristic::FILE_WRITE);
        }

        assert(bytes_to_hex(batch.heartbeat.data(), batch.heartbeat.size()) == "AA210E0601018020080E106B6A00E174");
        assert(batch.heartbeat.characteristic() == Characteristic::CONTROL_WRITE);

        // Companion counters are not consumed
        assert(left.sequence() == 3);
        assert(right.sequence() == 7);

        std::cout << "  ✓ Transfer sequence\n";
    }

    // Test 3: Both endpoints must be authenticated
    {
        Session right = short_authenticated(Endpoint::RIGHT);
        Session left(Endpoint::LEFT);
        NotificationBatch batch;
        assert(build_notification(right, left, NotificationContent("Hi", "Bob", "Lunch?"), options, TEST_TIME,
                                  batch) == ErrorCode::NOT_AUTHENTICATED);
        assert(right.sequence() == 3);
        assert(batch.primary.empty());

        std::cout << "  ✓ Not authenticated\n";
    }

    // Test 4: Larger records are fragmented when allowed
    {
        Session right = short_authenticated(Endpoint::RIGHT);
        Session left = short_authenticated(Endpoint::LEFT);
        NotificationOptions large;
        large.max_size = 1000;

        NotificationBatch batch;
        assert(build_notification(right, left, NotificationContent("Hi", "Bob", std::string(400, 'm')), large,
                                  TEST_TIME, batch) == ErrorCode::NONE);
        assert(batch.json.size() == 604);
        assert(batch.primary.size() == 2 + 3 + 1);
        for (size_t i = 2; i < 5; i++) {
            assert(batch.primary[i].sequence() == 6);
            assert(batch.primary[i].total_count() == 3);
            assert(batch.primary[i].packet_index() == i - 1);
        }
        assert(batch.primary[5].sequence() == 7);

        FileCheckHeader header = FileCheckHeader::for_data(
            reinterpret_cast<const uint8_t*>(batch.json.data()), batch.json.size(), large.filename);
        assert(memcmp(batch.primary[0].payload() + 4, "\x00\x5C\x02\x00", 4) == 0);  // 604 * 256
        assert(header.size == 604 * 256);

        std::cout << "  ✓ Fragmented DATA\n";
    }

    std::cout << "All notification transfer tests passed!\n\n";
}

int main() {
    std::cout << "=== C++ Text Layout Tester ===\n\n";

    // Notification dates are rendered in local time
    setenv("TZ", "UTC", 1);
    tzset();

    try {
        test_utf8();
        test_wrap();
        test_paginate();
        test_truncation();
        test_notification_record();
        test_notification_transfer();

        std::cout << "=== All tests passed! ===\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "Test failed with unknown exception\n";
        return 1;
    }
}
