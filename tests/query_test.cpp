#include "../core/errors.hpp"
#include "../model/query.hpp"

#include <gtest/gtest.h>

using usl::Model;
using usl::Query;
using usl::QueryType;

TEST(QueryTest, NamesRoundTrip)
{
    for (auto t : {QueryType::throughputAtConcurrency,
                   QueryType::latencyAtConcurrency,
                   QueryType::concurrencyAtThroughput,
                   QueryType::latencyAtThroughput,
                   QueryType::concurrencyAtLatency,
                   QueryType::throughputAtLatency})
    {
        auto parsed = usl::parseQueryType(usl::queryTypeName(t));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, t);
    }
}

TEST(QueryTest, ParseIsCaseInsensitive)
{
    auto parsed = usl::parseQueryType("ThroughputAtLatency");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, QueryType::throughputAtLatency);
    EXPECT_FALSE(usl::parseQueryType("peakthroughput").has_value());
}

TEST(QueryTest, EvaluateDispatches)
{
    const Model model = Model::of(0.06, 0.06, 40);
    EXPECT_DOUBLE_EQ(
        usl::evaluate(model, Query{QueryType::throughputAtConcurrency, 3}),
        model.throughputAtConcurrency(3));
    EXPECT_DOUBLE_EQ(
        usl::evaluate(model, Query{QueryType::latencyAtConcurrency, 3}),
        model.latencyAtConcurrency(3));
    EXPECT_DOUBLE_EQ(
        usl::evaluate(model, Query{QueryType::concurrencyAtThroughput, 400}),
        model.concurrencyAtThroughput(400));
    EXPECT_DOUBLE_EQ(
        usl::evaluate(model, Query{QueryType::latencyAtThroughput, 400}),
        model.latencyAtThroughput(400));
    EXPECT_DOUBLE_EQ(
        usl::evaluate(model, Query{QueryType::concurrencyAtLatency, 0.03}),
        model.concurrencyAtLatency(0.03));
    EXPECT_DOUBLE_EQ(
        usl::evaluate(model, Query{QueryType::throughputAtLatency, 0.03}),
        model.throughputAtLatency(0.03));
}

TEST(QueryTest, EvaluatePropagatesModelErrors)
{
    const Model model = Model::of(0.06, 0.06, 40);
    EXPECT_THROW(
        usl::evaluate(model, Query{QueryType::latencyAtThroughput, 700}),
        usl::UnreachableThroughput);
    EXPECT_THROW(
        usl::evaluate(model, Query{QueryType::concurrencyAtLatency, 0.001}),
        usl::UnreachableLatency);
}
