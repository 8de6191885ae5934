#ifndef __CPA_OUTPUT_CLASSIFIER__
#define __CPA_OUTPUT_CLASSIFIER__

#include "Headers.hpp"

namespace cpa {
/**
 * @brief Ordered phrase tables that drive classification. All matching is
 * ASCII case-insensitive.
 */
struct ClassifierRules {
  /** @brief Any of these anywhere in the output means the login succeeded. */
  vector<string> successMarkers;
  /** @brief First match (in order) in the recent window means input is needed. */
  vector<string> promptMarkers;
  /** @brief A URL is only kept if it contains one of these. */
  vector<string> urlDomainFragments;
  /** @brief Bytes of recent output searched for prompt markers. */
  size_t promptWindow = 1000;

  /** @brief Rules for the provider CLIs in the provider table. */
  static ClassifierRules defaults();
};

/** @brief What one evaluation of the rules found. */
struct Classification {
  bool success = false;
  /** @brief The prompt marker that matched, as written in the rule table. */
  optional<string> promptMarker;
  /** @brief Set only when a URL longer than the current one was found. */
  optional<string> url;
};

/**
 * @brief Stateless rule engine over accumulated, already cleaned output.
 *
 * Priority: success, then prompt (recent window only), then URL (whole
 * output). A lower priority rule is not evaluated once a higher one fired.
 */
class OutputClassifier {
 public:
  explicit OutputClassifier(ClassifierRules _rules = ClassifierRules::defaults());

  /**
   * @param cleanedOutput All cleaned output since the session started.
   * @param promptSearchStart Output before this offset is never searched for
   * prompts (it was already answered).
   * @param currentUrl The URL recorded so far, empty if none.
   */
  Classification classify(const string& cleanedOutput, size_t promptSearchStart,
                          const string& currentUrl) const;

  optional<string> findSuccessMarker(const string& cleanedOutput) const;

  optional<string> findPromptMarker(const string& recentOutput) const;

  /** @brief Longest URL in the output that mentions an OAuth domain. */
  optional<string> findLongestUrl(const string& cleanedOutput) const;

  const ClassifierRules& getRules() const { return rules; }

 protected:
  ClassifierRules rules;
  vector<string> lowerSuccessMarkers;
  vector<string> lowerPromptMarkers;
  vector<string> lowerDomainFragments;
};
}  // namespace cpa

#endif  // __CPA_OUTPUT_CLASSIFIER__
