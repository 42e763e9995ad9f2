#ifndef VECSYNC_QUERY_QUERY_OPTIMIZER_H_
#define VECSYNC_QUERY_QUERY_OPTIMIZER_H_

#include <string>
#include <vector>

namespace vecsync {
namespace query {

/**
 * @brief Rewrites a user query into the text that gets embedded
 *
 * Contract: never throws; on any failure returns the query unchanged.
 */
class QueryOptimizer {
public:
    virtual ~QueryOptimizer() = default;
    virtual std::string optimize(const std::string& query) const = 0;
};

/**
 * @brief Strips conversational filler from a query
 *
 * "give me the document that talks about Review and Evaluation of Clinical
 * Data" becomes "Review and Evaluation of Clinical Data". Leading request
 * phrases and trailing "give it to me"-style tails are removed, then
 * leading filler words. If nothing would remain the original is returned.
 */
class KeywordQueryOptimizer : public QueryOptimizer {
public:
    KeywordQueryOptimizer();

    std::string optimize(const std::string& query) const override;

private:
    std::vector<std::string> lead_phrases_;
    std::vector<std::string> tail_phrases_;
    std::vector<std::string> filler_words_;
};

} // namespace query
} // namespace vecsync

#endif // VECSYNC_QUERY_QUERY_OPTIMIZER_H_
