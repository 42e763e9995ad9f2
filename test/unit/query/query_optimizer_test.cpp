#include <gtest/gtest.h>

#include "vecsync/query/query_optimizer.h"

using namespace vecsync::query;

class KeywordQueryOptimizerTest : public ::testing::Test {
protected:
    KeywordQueryOptimizer optimizer_;
};

TEST_F(KeywordQueryOptimizerTest, StripsConversationalLead) {
    EXPECT_EQ(optimizer_.optimize(
                  "give me the document that talks about Review and Evaluation of Clinical Data"),
              "Review and Evaluation of Clinical Data");
    EXPECT_EQ(optimizer_.optimize("I need to find information about solar panels"),
              "solar panels");
}

TEST_F(KeywordQueryOptimizerTest, StripsTailsAndPunctuation) {
    EXPECT_EQ(optimizer_.optimize("find budget reports in my files please"), "budget reports");
    EXPECT_EQ(optimizer_.optimize("There is a document that talks about tax law, give it to me"),
              "tax law");
    EXPECT_EQ(optimizer_.optimize("quarterly budget?"), "quarterly budget");
}

TEST_F(KeywordQueryOptimizerTest, StripsLeadingFillerWords) {
    EXPECT_EQ(optimizer_.optimize("Find the quarterly report"), "quarterly report");
    EXPECT_EQ(optimizer_.optimize("show me some photos of cats"), "photos of cats");
}

TEST_F(KeywordQueryOptimizerTest, MatchesWholeWordsOnly) {
    EXPECT_EQ(optimizer_.optimize("finding nemo"), "finding nemo");
    EXPECT_EQ(optimizer_.optimize("theory of everything"), "theory of everything");
}

TEST_F(KeywordQueryOptimizerTest, PlainQueryUnchanged) {
    EXPECT_EQ(optimizer_.optimize("clinical data"), "clinical data");
}

TEST_F(KeywordQueryOptimizerTest, ReturnsOriginalWhenNothingRemains) {
    EXPECT_EQ(optimizer_.optimize("please"), "please");
    EXPECT_EQ(optimizer_.optimize("give me"), "give me");
    EXPECT_EQ(optimizer_.optimize("   "), "   ");
    EXPECT_EQ(optimizer_.optimize(""), "");
}
