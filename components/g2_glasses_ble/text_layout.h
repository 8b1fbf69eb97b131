#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "errors.h"

namespace esphome {
namespace g2_glasses_ble {

// Character widths of one display line
enum class LanguageProfile : uint8_t {
  LATIN = 0,
  CJK = 1,
};

static constexpr size_t LATIN_CHARS_PER_LINE = 25;
static constexpr size_t CJK_CHARS_PER_LINE = 12;

static constexpr size_t DEFAULT_LINES_PER_PAGE = 10;
// The device keeps a fixed page table; shorter documents are padded
static constexpr size_t DEFAULT_MIN_PAGES = 14;

// Filler for padding lines and padding pages
static constexpr const char *PAD_LINE = " ";

inline size_t chars_per_line(LanguageProfile profile) {
  return profile == LanguageProfile::CJK ? CJK_CHARS_PER_LINE : LATIN_CHARS_PER_LINE;
}

struct TextLayoutConfig {
  LanguageProfile profile;
  size_t lines_per_page;
  size_t min_pages;
  // Byte budget of "\n" + rendered page, 0 = unlimited
  size_t max_page_text_bytes;

  TextLayoutConfig()
    : profile(LanguageProfile::LATIN),
      lines_per_page(DEFAULT_LINES_PER_PAGE),
      min_pages(DEFAULT_MIN_PAGES),
      max_page_text_bytes(0) {}
};

// One content screen: exactly lines_per_page lines
struct TextPage {
  std::vector<std::string> lines;

  // Lines joined with '\n' followed by " \n"
  std::string render() const;
};

// ============================================================================
// UTF-8 helpers (widths are counted in code points)
// ============================================================================

size_t utf8_length(const std::string &text);

// Drop the last code point, false if the string was empty
bool utf8_pop_back(std::string &text);

// Longest prefix of at most max_bytes that ends on a code point boundary
std::string utf8_prefix(const std::string &text, size_t max_bytes);

// ============================================================================
// Wrapping and pagination
// ============================================================================

// Replace escaped "\n" sequences with real newlines
std::string expand_escaped_newlines(const std::string &text);

// Number of source lines after escaped newlines are expanded
size_t count_source_lines(const std::string &text);

/**
 * Greedily wrap text into display lines.
 *
 * Splits on newlines (literal and escaped), keeps blank lines as empty
 * strings and packs whitespace-separated words while the line stays within
 * chars_per_line. A word longer than a line is never broken. The result is
 * padded with PAD_LINE entries up to lines_per_page.
 */
std::vector<std::string> wrap_text(const std::string &text, size_t chars_per_line, size_t lines_per_page);

/**
 * Group wrapped lines into pages.
 *
 * The last page is padded with PAD_LINE and the page list is padded up to
 * config.min_pages. With a byte budget set, the last line longer than one
 * character of an oversized page is shortened one code point at a time
 * until the page fits.
 * @return INVALID_ARGUMENT for zero lines_per_page, TEXT_BUDGET_EXCEEDED if a
 *         page cannot be shrunk enough; out is untouched on error
 */
ErrorCode paginate(const std::vector<std::string> &lines, const TextLayoutConfig &config,
                   std::vector<TextPage> &out);

// wrap_text() + paginate() + render(), using the profile's line width
ErrorCode layout_text(const std::string &text, const TextLayoutConfig &config, std::vector<std::string> &pages);

// ============================================================================
// Byte budget truncation
// ============================================================================

/**
 * Fit text into max_bytes for an AI card. Oversized text is shortened code
 * point by code point to max_bytes - 3 and "..." is appended.
 */
std::string truncate_for_display(const std::string &text, size_t max_bytes);

/**
 * Fit a notification field into max_bytes. Oversized text keeps a prefix and
 * ends in "..." when the budget leaves room for it, else it is cut hard.
 */
std::string truncate_with_ellipsis(const std::string &text, size_t max_bytes);

}  // namespace g2_glasses_ble
}  // namespace esphome
