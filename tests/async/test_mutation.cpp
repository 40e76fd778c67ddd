#include "weave/async/mutation.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace weave::async;

namespace {
struct Transfer {
    std::string to;
    int amount{0};
};
}  // namespace

class MutationTest : public ::testing::Test {
protected:
    MutationOptions<std::string, Transfer> recordingOptions() {
        MutationOptions<std::string, Transfer> options;
        options.onSuccess = [this](const std::string& receipt,
                                   const Transfer&) {
            events.push_back("success:" + receipt);
        };
        options.onError = [this](const std::exception_ptr& error,
                                 const Transfer& vars) {
            events.push_back("error:" + vars.to + ":" +
                             weave::error::describe(error));
        };
        options.onSettled = [this](const std::optional<std::string>& receipt,
                                   const std::exception_ptr& error,
                                   const Transfer&) {
            events.push_back(receipt ? "settled:ok"
                                     : (error ? "settled:error" : "settled"));
        };
        return options;
    }

    static std::string send(const Transfer& transfer) {
        if (transfer.amount <= 0) {
            throw std::invalid_argument("amount must be positive");
        }
        return transfer.to + "/" + std::to_string(transfer.amount);
    }

    std::vector<std::string> events;
};

TEST_F(MutationTest, StartsIdle) {
    Mutation<std::string, Transfer> mutation(send);
    EXPECT_TRUE(mutation.state().isIdle());
}

TEST_F(MutationTest, SuccessUpdatesStateAndCallbacks) {
    Mutation<std::string, Transfer> mutation(send, recordingOptions());
    EXPECT_EQ(mutation.mutate({"alice", 5}), "alice/5");

    auto state = mutation.state();
    EXPECT_TRUE(state.isSuccess());
    EXPECT_EQ(state.data, "alice/5");
    EXPECT_EQ(events,
              (std::vector<std::string>{"success:alice/5", "settled:ok"}));
}

TEST_F(MutationTest, FailureIsRecordedAndRethrown) {
    Mutation<std::string, Transfer> mutation(send, recordingOptions());
    EXPECT_THROW(mutation.mutate({"bob", 0}), std::invalid_argument);

    auto state = mutation.state();
    EXPECT_TRUE(state.isError());
    EXPECT_FALSE(state.data.has_value());
    EXPECT_EQ(events, (std::vector<std::string>{
                          "error:bob:amount must be positive",
                          "settled:error"}));
}

TEST_F(MutationTest, ResetReturnsToIdle) {
    Mutation<std::string, Transfer> mutation(send);
    mutation.mutate({"carol", 1});
    mutation.reset();
    auto state = mutation.state();
    EXPECT_TRUE(state.isIdle());
    EXPECT_FALSE(state.data.has_value());
}
