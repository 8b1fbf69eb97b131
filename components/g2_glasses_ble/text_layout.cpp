#include "text_layout.h"
#include "g2_glasses_log.h"

namespace esphome {
namespace g2_glasses_ble {

static const char *const TAG = "g2_glasses_ble.text";

static const char ELLIPSIS[] = "...";
static constexpr size_t ELLIPSIS_SIZE = sizeof(ELLIPSIS) - 1;

std::string TextPage::render() const {
  std::string text;
  for (size_t i = 0; i < lines.size(); i++) {
    if (i > 0) {
      text += '\n';
    }
    text += lines[i];
  }
  text += " \n";
  return text;
}

// ============================================================================
// UTF-8 helpers
// ============================================================================

static bool is_continuation_byte(uint8_t byte) { return (byte & 0xC0) == 0x80; }

size_t utf8_length(const std::string &text) {
  size_t count = 0;
  for (char c : text) {
    if (!is_continuation_byte(static_cast<uint8_t>(c))) {
      count++;
    }
  }
  return count;
}

bool utf8_pop_back(std::string &text) {
  if (text.empty()) {
    return false;
  }
  size_t end = text.size() - 1;
  while (end > 0 && is_continuation_byte(static_cast<uint8_t>(text[end]))) {
    end--;
  }
  text.erase(end);
  return true;
}

std::string utf8_prefix(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  size_t end = max_bytes;
  while (end > 0 && is_continuation_byte(static_cast<uint8_t>(text[end]))) {
    end--;
  }
  return text.substr(0, end);
}

// ============================================================================
// Wrapping and pagination
// ============================================================================

static bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v'; }

static std::vector<std::string> split_words(const std::string &line) {
  std::vector<std::string> words;
  size_t i = 0;
  while (i < line.size()) {
    while (i < line.size() && is_space(line[i])) {
      i++;
    }
    size_t start = i;
    while (i < line.size() && !is_space(line[i])) {
      i++;
    }
    if (i > start) {
      words.push_back(line.substr(start, i - start));
    }
  }
  return words;
}

static std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t pos = text.find('\n', start);
    if (pos == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

std::string expand_escaped_newlines(const std::string &text) {
  std::string result;
  result.reserve(text.size());
  for (size_t i = 0; i < text.size(); i++) {
    if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == 'n') {
      result += '\n';
      i++;
    } else {
      result += text[i];
    }
  }
  return result;
}

size_t count_source_lines(const std::string &text) { return split_lines(expand_escaped_newlines(text)).size(); }

std::vector<std::string> wrap_text(const std::string &text, size_t chars_per_line, size_t lines_per_page) {
  std::vector<std::string> wrapped;

  for (const std::string &line : split_lines(expand_escaped_newlines(text))) {
    std::vector<std::string> words = split_words(line);
    if (words.empty()) {
      wrapped.push_back("");
      continue;
    }

    // current holds the words so far, each followed by one space
    std::string current;
    size_t current_len = 0;
    for (const std::string &word : words) {
      size_t word_len = utf8_length(word);
      if (current_len + word_len + 1 > chars_per_line) {
        if (!current.empty()) {
          current.pop_back();
          wrapped.push_back(current);
        }
        current = word + " ";
        current_len = word_len + 1;
      } else {
        current += word + " ";
        current_len += word_len + 1;
      }
    }
    current.pop_back();
    wrapped.push_back(current);
  }

  while (wrapped.size() < lines_per_page) {
    wrapped.push_back(PAD_LINE);
  }
  return wrapped;
}

static size_t page_text_bytes(const TextPage &page) { return 1 + page.render().size(); }

// Shorten the page until it fits; false if no line can give up a character
static bool fit_page(TextPage &page, size_t max_bytes) {
  while (page_text_bytes(page) > max_bytes) {
    bool shortened = false;
    for (size_t k = page.lines.size(); k > 0; k--) {
      std::string &line = page.lines[k - 1];
      if (utf8_length(line) > 1) {
        utf8_pop_back(line);
        shortened = true;
        break;
      }
    }
    if (!shortened) {
      return false;
    }
  }
  return true;
}

ErrorCode paginate(const std::vector<std::string> &lines, const TextLayoutConfig &config,
                   std::vector<TextPage> &out) {
  if (config.lines_per_page == 0) {
    ESP_LOGE(TAG, "lines_per_page must be positive");
    return ErrorCode::INVALID_ARGUMENT;
  }

  std::vector<TextPage> pages;
  for (size_t i = 0; i < lines.size(); i += config.lines_per_page) {
    TextPage page;
    for (size_t j = 0; j < config.lines_per_page; j++) {
      page.lines.push_back(i + j < lines.size() ? lines[i + j] : PAD_LINE);
    }
    pages.push_back(page);
  }
  while (pages.size() < config.min_pages) {
    TextPage page;
    page.lines.assign(config.lines_per_page, PAD_LINE);
    pages.push_back(page);
  }

  if (config.max_page_text_bytes > 0) {
    for (size_t i = 0; i < pages.size(); i++) {
      size_t before = page_text_bytes(pages[i]);
      if (!fit_page(pages[i], config.max_page_text_bytes)) {
        ESP_LOGE(TAG, "Page %zu cannot fit %zu bytes", i, config.max_page_text_bytes);
        return ErrorCode::TEXT_BUDGET_EXCEEDED;
      }
      if (page_text_bytes(pages[i]) != before) {
        ESP_LOGW(TAG, "Page %zu truncated from %zu to %zu bytes", i, before, page_text_bytes(pages[i]));
      }
    }
  }

  out.insert(out.end(), pages.begin(), pages.end());
  return ErrorCode::NONE;
}

ErrorCode layout_text(const std::string &text, const TextLayoutConfig &config, std::vector<std::string> &pages) {
  std::vector<TextPage> layout;
  ErrorCode error =
      paginate(wrap_text(text, chars_per_line(config.profile), config.lines_per_page), config, layout);
  if (error != ErrorCode::NONE) {
    return error;
  }
  for (const TextPage &page : layout) {
    pages.push_back(page.render());
  }
  return ErrorCode::NONE;
}

// ============================================================================
// Byte budget truncation
// ============================================================================

std::string truncate_for_display(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  if (max_bytes < ELLIPSIS_SIZE) {
    return utf8_prefix(text, max_bytes);
  }
  size_t target = max_bytes - ELLIPSIS_SIZE;
  std::string result = text;
  while (result.size() > target) {
    utf8_pop_back(result);
  }
  ESP_LOGW(TAG, "Text truncated from %zu to %zu bytes", text.size(), result.size() + ELLIPSIS_SIZE);
  return result + ELLIPSIS;
}

std::string truncate_with_ellipsis(const std::string &text, size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  if (max_bytes <= ELLIPSIS_SIZE) {
    return utf8_prefix(text, max_bytes);
  }
  return utf8_prefix(text, max_bytes - ELLIPSIS_SIZE) + ELLIPSIS;
}

}  // namespace g2_glasses_ble
}  // namespace esphome
