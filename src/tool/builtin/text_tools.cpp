#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <sstream>

#include "claire/tool/builtin/builtins.hpp"

namespace claire::tools {

namespace {

const std::set<std::string>& stopwords() {
  static const std::set<std::string> words = {
      "a",     "about", "after", "all",   "also",  "an",    "and",   "any",   "are",   "as",    "at",    "be",    "been",
      "but",   "by",    "can",   "could", "did",   "do",    "does",  "for",   "from",  "had",   "has",   "have",  "he",
      "her",   "his",   "how",   "i",     "if",    "in",    "into",  "is",    "it",    "its",   "just",  "more",  "most",
      "no",    "not",   "of",    "on",    "one",   "or",    "other", "our",   "out",   "she",   "so",    "some",  "such",
      "than",  "that",  "the",   "their", "them",  "then",  "there", "these", "they",  "this",  "those", "to",    "up",
      "was",   "we",    "were",  "what",  "when",  "which", "while", "who",   "will",  "with",  "would", "you",   "your",
  };
  return words;
}

const std::set<std::string>& positive_words() {
  static const std::set<std::string> words = {
      "good",    "great",   "excellent", "amazing", "wonderful", "love",    "like",    "happy",     "best",     "fantastic",
      "nice",    "awesome", "positive",  "helpful", "enjoy",     "pleased", "success", "beautiful", "improve",  "brilliant",
      "perfect", "glad",    "easy",      "fast",    "effective", "benefit", "win",     "favorite",  "recommend", "impressive",
  };
  return words;
}

const std::set<std::string>& negative_words() {
  static const std::set<std::string> words = {
      "bad",   "terrible", "awful",    "poor",    "hate",   "dislike", "sad",    "worst",   "horrible", "negative",
      "angry", "broken",   "fail",     "failure", "slow",   "difficult", "wrong", "problem", "ugly",     "annoying",
      "hard",  "painful",  "useless",  "error",   "worse",  "disappointing", "lose", "bug",  "crash",    "confusing",
  };
  return words;
}

std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> words;
  std::string current;
  for (unsigned char c : text) {
    if (std::isalnum(c) || c == '\'') {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      words.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(current);
  }
  return words;
}

std::vector<std::string> split_sentences(const std::string& text) {
  std::vector<std::string> sentences;
  std::string current;
  for (char c : text) {
    current.push_back(c);
    if (c == '.' || c == '!' || c == '?' || c == '\n') {
      auto sentence = trim(current);
      if (!sentence.empty() && sentence.find_first_not_of(".!?") != std::string::npos) {
        sentences.push_back(sentence);
      }
      current.clear();
    }
  }
  auto tail = trim(current);
  if (!tail.empty()) {
    sentences.push_back(tail);
  }
  return sentences;
}

size_t count_paragraphs(const std::string& text) {
  size_t paragraphs = 0;
  bool in_paragraph = false;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (trim(line).empty()) {
      in_paragraph = false;
    } else if (!in_paragraph) {
      in_paragraph = true;
      paragraphs++;
    }
  }
  return paragraphs;
}

// Vowel-group heuristic, at least one per word
int count_syllables(const std::string& word) {
  auto is_vowel = [](char c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u' || c == 'y';
  };
  int count = 0;
  bool previous_vowel = false;
  for (char c : word) {
    bool vowel = is_vowel(c);
    if (vowel && !previous_vowel) count++;
    previous_vowel = vowel;
  }
  if (word.size() > 2 && word.back() == 'e' && !is_vowel(word[word.size() - 2]) && count > 1) {
    count--;
  }
  return std::max(count, 1);
}

std::map<std::string, int> content_frequencies(const std::vector<std::string>& words) {
  std::map<std::string, int> freq;
  for (const auto& word : words) {
    if (word.size() < 3 || stopwords().count(word)) continue;
    freq[word]++;
  }
  return freq;
}

double round2(double value) {
  return std::round(value * 100.0) / 100.0;
}

json sentiment(const std::vector<std::string>& words) {
  int positive = 0;
  int negative = 0;
  for (const auto& word : words) {
    if (positive_words().count(word)) positive++;
    if (negative_words().count(word)) negative++;
  }

  double score = (positive + negative) == 0 ? 0.0 : static_cast<double>(positive - negative) / (positive + negative);
  std::string label = "neutral";
  if (score > 0.1) label = "positive";
  if (score < -0.1) label = "negative";

  return json{{"type", "sentiment"}, {"sentiment", label}, {"score", round2(score)}, {"positive_words", positive}, {"negative_words", negative}};
}

json keywords(const std::vector<std::string>& words) {
  auto freq = content_frequencies(words);

  // Rank by count, ties by first appearance
  std::vector<std::string> ranked;
  for (const auto& word : words) {
    if (freq.count(word) && std::find(ranked.begin(), ranked.end(), word) == ranked.end()) {
      ranked.push_back(word);
    }
  }
  std::stable_sort(ranked.begin(), ranked.end(), [&freq](const std::string& a, const std::string& b) {
    return freq[a] > freq[b];
  });
  if (ranked.size() > 10) ranked.resize(10);

  json list = json::array();
  for (const auto& word : ranked) {
    list.push_back({{"word", word}, {"count", freq[word]}});
  }
  return json{{"type", "keywords"}, {"keywords", list}};
}

json readability(const std::vector<std::string>& words, const std::vector<std::string>& sentences) {
  size_t sentence_count = std::max<size_t>(sentences.size(), 1);
  size_t word_count = std::max<size_t>(words.size(), 1);

  int syllables = 0;
  size_t letters = 0;
  for (const auto& word : words) {
    syllables += count_syllables(word);
    letters += word.size();
  }

  double words_per_sentence = static_cast<double>(words.size()) / sentence_count;
  double syllables_per_word = static_cast<double>(syllables) / word_count;
  double flesch = 206.835 - 1.015 * words_per_sentence - 84.6 * syllables_per_word;

  std::string level = "very difficult";
  if (flesch >= 90) level = "very easy";
  else if (flesch >= 70) level = "easy";
  else if (flesch >= 60) level = "standard";
  else if (flesch >= 50) level = "fairly difficult";
  else if (flesch >= 30) level = "difficult";

  return json{{"type", "readability"},
              {"flesch_reading_ease", round2(flesch)},
              {"level", level},
              {"average_sentence_length", round2(words_per_sentence)},
              {"average_word_length", round2(static_cast<double>(letters) / word_count)}};
}

json structure(const std::string& text, const std::vector<std::string>& words, const std::vector<std::string>& sentences) {
  size_t headings = 0;
  size_t list_items = 0;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    auto t = trim(line);
    if (t.empty()) continue;
    if (t[0] == '#') headings++;
    if (t.rfind("- ", 0) == 0 || t.rfind("* ", 0) == 0) list_items++;
  }

  return json{{"type", "structure"},
              {"characters", text.size()},
              {"words", words.size()},
              {"sentences", sentences.size()},
              {"paragraphs", count_paragraphs(text)},
              {"headings", headings},
              {"list_items", list_items}};
}

size_t sentences_for_length(const std::string& length) {
  if (length == "brief") return 2;
  if (length == "medium") return 4;
  if (length == "detailed") return 8;
  throw ToolError("Unknown summary length: " + length + ". Use brief, medium, or detailed");
}

bool has_digit(const std::string& s) {
  return std::any_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c);
  });
}

}  // namespace

std::string string_arg(const json& args, const std::string& key, const std::string& fallback) {
  if (!args.is_object()) {
    return fallback;
  }
  auto it = args.find(key);
  if (it == args.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ToolError("Parameter '" + key + "' must be a string");
  }
  auto value = it->get<std::string>();
  return value.empty() ? fallback : value;
}

json analyze_text(const std::string& text, const std::string& type) {
  if (trim(text).empty()) {
    throw ToolError("Parameter 'text' is required");
  }

  auto words = split_words(text);
  auto sentences = split_sentences(text);

  if (type == "sentiment") return sentiment(words);
  if (type == "keywords") return keywords(words);
  if (type == "readability") return readability(words, sentences);
  if (type == "structure") return structure(text, words, sentences);

  throw ToolError("Unknown analysis type: " + type + ". Use sentiment, keywords, readability, or structure");
}

json summarize_content(const std::string& content, const std::string& focus, const std::string& length) {
  if (trim(content).empty()) {
    throw ToolError("Parameter 'content' is required");
  }
  if (focus != "key_points" && focus != "technical" && focus != "executive" && focus != "detailed") {
    throw ToolError("Unknown summary focus: " + focus + ". Use key_points, technical, executive, or detailed");
  }

  size_t limit = sentences_for_length(length);
  if (focus == "detailed") limit *= 2;

  auto sentences = split_sentences(content);
  auto freq = content_frequencies(split_words(content));

  // Score each sentence by the average frequency of its content words
  std::vector<std::pair<double, size_t>> scored;
  for (size_t i = 0; i < sentences.size(); ++i) {
    auto words = split_words(sentences[i]);
    double score = 0.0;
    for (const auto& word : words) {
      auto it = freq.find(word);
      if (it != freq.end()) score += it->second;
    }
    if (!words.empty()) score /= static_cast<double>(words.size());
    if (focus == "technical" && has_digit(sentences[i])) score *= 1.5;
    if (focus == "executive" && i == 0) score *= 1.5;
    scored.emplace_back(score, i);
  }

  std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
    return a.first > b.first;
  });
  if (scored.size() > limit) scored.resize(limit);

  // Back to document order
  std::vector<size_t> picked;
  for (const auto& [score, index] : scored) {
    picked.push_back(index);
  }
  std::sort(picked.begin(), picked.end());

  json key_points = json::array();
  std::string summary;
  for (size_t index : picked) {
    key_points.push_back(sentences[index]);
    if (!summary.empty()) summary += " ";
    summary += sentences[index];
  }

  json result{{"focus", focus}, {"length", length}, {"summary", summary}, {"original_sentences", sentences.size()}};
  if (focus == "key_points") {
    result["key_points"] = key_points;
  }
  return result;
}

// ============================================================================
// AnalyzeTextTool
// ============================================================================

AnalyzeTextTool::AnalyzeTextTool() : SimpleTool("analyze_text", "Analyze text for sentiment, keywords, readability, or structure", "analysis") {}

std::vector<ParameterSchema> AnalyzeTextTool::parameters() const {
  return {{"text", "string", "Text to analyze", true}, {"type", "string", "Analysis type: sentiment, keywords, readability, structure", true}};
}

std::future<json> AnalyzeTextTool::execute(const json& args) {
  return std::async(std::launch::async, [args]() -> json {
    return analyze_text(string_arg(args, "text"), string_arg(args, "type"));
  });
}

// ============================================================================
// SummarizeContentTool
// ============================================================================

SummarizeContentTool::SummarizeContentTool()
    : SimpleTool("summarize_content", "Create summaries of long content with different focus areas", "content") {}

std::vector<ParameterSchema> SummarizeContentTool::parameters() const {
  return {{"content", "string", "Content to summarize", true},
          {"focus", "string", "Summary focus: key_points, technical, executive, detailed", false},
          {"length", "string", "Summary length: brief, medium, detailed", false}};
}

std::future<json> SummarizeContentTool::execute(const json& args) {
  return std::async(std::launch::async, [args]() -> json {
    return summarize_content(string_arg(args, "content"), string_arg(args, "focus", "key_points"), string_arg(args, "length", "medium"));
  });
}

}  // namespace claire::tools
