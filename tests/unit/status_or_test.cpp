#include "common/status_or.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using labgate::common::Status;
using labgate::common::StatusCode;
using labgate::common::StatusOr;

TEST(StatusOrTest, HoldsValue) {
    StatusOr<std::string> result(std::string("s1"));
    ASSERT_TRUE(result.IsOk());
    EXPECT_EQ(result.Code(), StatusCode::kOk);
    EXPECT_EQ(result.Value(), "s1");
    EXPECT_FALSE(result.IsNotFound());
    EXPECT_FALSE(result.IsCollaboratorFailure());
}

// NotFound 与协作方故障要分开处理
TEST(StatusOrTest, ClassifiesFailures) {
    StatusOr<std::string> missing(Status::NotFound("no such student"));
    EXPECT_TRUE(missing.IsNotFound());
    EXPECT_FALSE(missing.IsCollaboratorFailure());

    StatusOr<std::string> down(Status::Unavailable("database down"));
    EXPECT_FALSE(down.IsNotFound());
    EXPECT_TRUE(down.IsCollaboratorFailure());

    StatusOr<std::string> broken(Status::Internal("query failed"));
    EXPECT_TRUE(broken.IsCollaboratorFailure());

    StatusOr<std::string> rejected(Status::Unauthenticated("Invalid code"));
    EXPECT_FALSE(rejected.IsCollaboratorFailure());
    EXPECT_EQ(rejected.Code(), StatusCode::kUnauthenticated);
}

TEST(StatusOrTest, ValueOrFallsBackOnError) {
    StatusOr<int> ok(7);
    EXPECT_EQ(ok.ValueOr(0), 7);

    StatusOr<int> failed(Status::Unavailable("database down"));
    EXPECT_EQ(failed.ValueOr(-1), -1);

    // 右值版本移出所持有的值
    StatusOr<std::unique_ptr<int>> owned(std::make_unique<int>(5));
    auto taken = std::move(owned).ValueOr(nullptr);
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(*taken, 5);
}
