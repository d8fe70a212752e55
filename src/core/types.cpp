#include "claire/core/types.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace claire {

std::string to_string(AssistantMode mode) {
  switch (mode) {
    case AssistantMode::General:
      return "general";
    case AssistantMode::Writing:
      return "writing";
    case AssistantMode::Research:
      return "research";
    case AssistantMode::Coding:
      return "coding";
    case AssistantMode::Pdf:
      return "pdf";
    case AssistantMode::Web:
      return "web";
  }
  return "general";
}

AssistantMode assistant_mode_from_string(const std::string &str) {
  if (str == "writing") return AssistantMode::Writing;
  if (str == "research") return AssistantMode::Research;
  if (str == "coding") return AssistantMode::Coding;
  if (str == "pdf") return AssistantMode::Pdf;
  if (str == "web") return AssistantMode::Web;
  return AssistantMode::General;
}

std::string sanitize_utf8(const std::string &input) {
  std::string output;
  output.reserve(input.size());

  auto is_cont = [&input](size_t idx) {
    return idx < input.size() && (static_cast<unsigned char>(input[idx]) & 0xC0) == 0x80;
  };

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);
    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;

    if (c <= 0x7F) {
      output.push_back(static_cast<char>(c));
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp = c & 0x1F;
      min_cp = 0x80;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp = c & 0x0F;
      min_cp = 0x800;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp = c & 0x07;
      min_cp = 0x10000;
    } else {
      // Invalid leading byte
      output.append("\xEF\xBF\xBD");
      i++;
      continue;
    }

    bool complete = true;
    for (size_t k = 1; k < len; ++k) {
      if (!is_cont(i + k)) {
        complete = false;
        break;
      }
      cp = (cp << 6) | (static_cast<unsigned char>(input[i + k]) & 0x3F);
    }

    if (!complete) {
      output.append("\xEF\xBF\xBD");
      i++;
      continue;
    }

    // Overlong encodings, surrogates and out-of-range code points
    if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
      output.append("\xEF\xBF\xBD");
    } else {
      output.append(input, i, len);
    }
    i += len;
  }

  return output;
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

std::string trim(const std::string &str) {
  const char *ws = " \t\r\n\f\v";
  auto first = str.find_first_not_of(ws);
  if (first == std::string::npos) {
    return "";
  }
  auto last = str.find_last_not_of(ws);
  return str.substr(first, last - first + 1);
}

std::optional<int> parse_positive_int(const std::string &str) {
  if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }
  char *end = nullptr;
  errno = 0;
  long n = std::strtol(str.c_str(), &end, 10);
  if (errno == ERANGE || *end != '\0' || n <= 0 || n > INT_MAX) {
    return std::nullopt;
  }
  return static_cast<int>(n);
}

}  // namespace claire
