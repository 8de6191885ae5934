#include "OutputClassifier.hpp"

namespace cpa {
namespace {
vector<string> lowered(const vector<string>& phrases) {
  vector<string> retval;
  retval.reserve(phrases.size());
  for (const auto& phrase : phrases) {
    retval.push_back(toLowerAscii(phrase));
  }
  return retval;
}

// Characters that commonly close a URL printed inside prose.
const string URL_TRAILING_PUNCTUATION = ").,;:";

inline bool isUrlCharacter(unsigned char c) {
  if (c < 0x20 || c == 0x7F || c == ' ') {
    return false;
  }
  switch (c) {
    case '<':
    case '>':
    case '"':
    case '\'':
    case '`':
      return false;
    default:
      return true;
  }
}

// Length of "http://" or "https://" at `start` of lowercased text, else 0.
size_t schemeLength(const string& lowerText, size_t start) {
  if (lowerText.compare(start, 7, "http://") == 0) {
    return 7;
  }
  if (lowerText.compare(start, 8, "https://") == 0) {
    return 8;
  }
  return 0;
}
}  // namespace

ClassifierRules ClassifierRules::defaults() {
  ClassifierRules rules;
  rules.successMarkers = {
      "Antigravity authentication successful!",
      "Gemini authentication successful!",
      "Codex authentication successful!",
      "Claude authentication successful!",
      "Qwen authentication successful!",
      "iFlow authentication successful!",
      "Authentication successful!",
      "Authentication saved",
      "saved to",
      "认证成功",
  };
  // The project prompt prints both "Enter project ID" and "or ALL:", the
  // latter is reported.
  rules.promptMarkers = {
      "or ALL:",
      "paste the callback URL",
      "Enter choice",
      "Enter your choice",
      "Enter project ID",
      "Press Enter to",
      "(y/n)",
      "[y/N]",
      "请输入",
      "请粘贴",
  };
  rules.urlDomainFragments = {
      "accounts.google.com", "console.anthropic.com", "claude.ai",
      "auth.openai.com",     "chat.qwen.ai",          "iflow.cn",
      "oauth",
  };
  rules.promptWindow = 1000;
  return rules;
}

OutputClassifier::OutputClassifier(ClassifierRules _rules)
    : rules(std::move(_rules)),
      lowerSuccessMarkers(lowered(rules.successMarkers)),
      lowerPromptMarkers(lowered(rules.promptMarkers)),
      lowerDomainFragments(lowered(rules.urlDomainFragments))) {}

Classification OutputClassifier::classify(const string& cleanedOutput,
                                          size_t promptSearchStart,
                                          const string& currentUrl) const {
  Classification result;
  if (findSuccessMarker(cleanedOutput)) {
    result.success = true;
    return result;
  }

  size_t windowStart = 0;
  if (cleanedOutput.length() > rules.promptWindow) {
    windowStart = cleanedOutput.length() - rules.promptWindow;
  }
  windowStart = max(windowStart, promptSearchStart);
  if (windowStart < cleanedOutput.length()) {
    result.promptMarker = findPromptMarker(
        utf8Tail(cleanedOutput, cleanedOutput.length() - windowStart));
    if (result.promptMarker) {
      return result;
    }
  }

  auto url = findLongestUrl(cleanedOutput);
  if (url && url->length() > currentUrl.length()) {
    result.url = url;
  }
  return result;
}

optional<string> OutputClassifier::findSuccessMarker(
    const string& cleanedOutput) const {
  const string lowerOutput = toLowerAscii(cleanedOutput);
  for (size_t a = 0; a < lowerSuccessMarkers.size(); a++) {
    if (lowerOutput.find(lowerSuccessMarkers[a]) != string::npos) {
      return rules.successMarkers[a];
    }
  }
  return nullopt;
}

optional<string> OutputClassifier::findPromptMarker(
    const string& recentOutput) const {
  const string lowerOutput = toLowerAscii(recentOutput);
  for (size_t a = 0; a < lowerPromptMarkers.size(); a++) {
    if (lowerOutput.find(lowerPromptMarkers[a]) != string::npos) {
      return rules.promptMarkers[a];
    }
  }
  return nullopt;
}

optional<string> OutputClassifier::findLongestUrl(
    const string& cleanedOutput) const {
  const string lowerOutput = toLowerAscii(cleanedOutput);
  optional<string> longest;
  size_t pos = 0;
  while ((pos = lowerOutput.find("http", pos)) != string::npos) {
    size_t prefix = schemeLength(lowerOutput, pos);
    if (prefix == 0) {
      pos += 4;
      continue;
    }
    size_t end = pos + prefix;
    while (end < cleanedOutput.length() &&
           isUrlCharacter((unsigned char)cleanedOutput[end])) {
      end++;
    }
    if (end == pos + prefix) {
      pos = end;
      continue;
    }
    size_t candidateEnd = end;
    while (candidateEnd > pos + prefix &&
           URL_TRAILING_PUNCTUATION.find(cleanedOutput[candidateEnd - 1]) !=
               string::npos) {
      candidateEnd--;
    }
    const size_t candidateLength = candidateEnd - pos;
    if (!longest || candidateLength > longest->length()) {
      const string lowerCandidate = lowerOutput.substr(pos, candidateLength);
      for (const auto& fragment : lowerDomainFragments) {
        if (lowerCandidate.find(fragment) != string::npos) {
          longest = cleanedOutput.substr(pos, candidateLength);
          break;
        }
      }
    }
    pos = end;
  }
  return longest;
}
}  // namespace cpa
