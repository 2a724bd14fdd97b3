/**
 * @file test_pagination.cpp
 * @brief Tests for page query parsing, pagination headers and API errors
 */

#include <gtest/gtest.h>
#include "exceptions.h"
#include "../src/common/api_error.h"
#include "../src/common/pagination.h"

using common::ApiError;
using common::PageRequest;

class PaginationTest : public ::testing::Test {
protected:
    std::string header(const common::HeaderList& headers, const std::string& name) {
        for (const auto& h : headers) {
            if (h.first == name) return h.second;
        }
        return "<missing>";
    }

    void expectBadRequest(const std::string& page, const std::string& size) {
        try {
            common::parsePageRequest(page, size);
            FAIL() << "Expected ApiError for page=" << page << " size=" << size;
        } catch (const ApiError& e) {
            EXPECT_EQ(e.code(), 400);
            EXPECT_TRUE(e.description().has_value());
        }
    }
};

// --- Query parsing ---

TEST_F(PaginationTest, Parse_NoParameters) {
    EXPECT_FALSE(common::parsePageRequest("", "").has_value());
}

TEST_F(PaginationTest, Parse_Valid) {
    auto request = common::parsePageRequest("2", "25");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->page, 2u);
    EXPECT_EQ(request->size, 25u);
    EXPECT_EQ(request->limit(), 25);
    EXPECT_EQ(request->offset(), 50);
}

TEST_F(PaginationTest, Parse_Invalid) {
    expectBadRequest("1", "");
    expectBadRequest("", "10");
    expectBadRequest("-1", "10");
    expectBadRequest("one", "10");
    expectBadRequest("0", "0");
    expectBadRequest("0", "ten");
}

TEST_F(PaginationTest, Parse_OffsetOverflow) {
    expectBadRequest("1844674407370955162", "10");
    expectBadRequest("0", "9999999999999999999");
    expectBadRequest("2", "4611686018427387904");

    auto request = common::parsePageRequest("922337203685477580", "10");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->offset(), 9223372036854775800LL);

    request = common::parsePageRequest("0", "9223372036854775807");
    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->limit(), 9223372036854775807LL);
}

// --- Headers ---

TEST_F(PaginationTest, PageCount) {
    EXPECT_EQ(common::pageCount(0, 10), 0u);
    EXPECT_EQ(common::pageCount(10, 10), 1u);
    EXPECT_EQ(common::pageCount(11, 10), 2u);
}

TEST_F(PaginationTest, Headers_MiddlePage) {
    auto headers = common::pageHeaders("/api/v1/rides", 45, PageRequest{2, 10});
    EXPECT_EQ(header(headers, "X-Total-Items"), "45");
    EXPECT_EQ(header(headers, "X-Page"), "2");
    EXPECT_EQ(header(headers, "X-Page-Size"), "10");
    EXPECT_EQ(header(headers, "X-Total-pages"), "5");
    EXPECT_EQ(header(headers, "Link"),
              "</api/v1/rides?page=2&size=10>; rel=\"self\", "
              "</api/v1/rides?page=0&size=10>; rel=\"first\", "
              "</api/v1/rides?page=4&size=10>; rel=\"last\", "
              "</api/v1/rides?page=1&size=10>; rel=\"prev\", "
              "</api/v1/rides?page=3&size=10>; rel=\"next\"");
}

TEST_F(PaginationTest, Headers_FirstPageHasNoPrev) {
    std::string link = header(common::pageHeaders("/api/v1/tags", 30, PageRequest{0, 10}), "Link");
    EXPECT_EQ(link.find("rel=\"prev\""), std::string::npos);
    EXPECT_NE(link.find("</api/v1/tags?page=1&size=10>; rel=\"next\""), std::string::npos);
}

TEST_F(PaginationTest, Headers_LastPageHasNoNext) {
    std::string link = header(common::pageHeaders("/api/v1/tags", 30, PageRequest{2, 10}), "Link");
    EXPECT_EQ(link.find("rel=\"next\""), std::string::npos);
    EXPECT_NE(link.find("</api/v1/tags?page=1&size=10>; rel=\"prev\""), std::string::npos);
}

TEST_F(PaginationTest, Headers_PastLastPagePointsPrevToLast) {
    std::string link = header(common::pageHeaders("/api/v1/tags", 30, PageRequest{7, 10}), "Link");
    EXPECT_NE(link.find("</api/v1/tags?page=2&size=10>; rel=\"prev\""), std::string::npos);
    EXPECT_EQ(link.find("rel=\"next\""), std::string::npos);
}

TEST_F(PaginationTest, Headers_Empty) {
    auto headers = common::pageHeaders("/api/v1/rides", 0, PageRequest{0, 10});
    EXPECT_EQ(header(headers, "X-Total-pages"), "0");
    EXPECT_NE(header(headers, "Link").find("</api/v1/rides?page=0&size=10>; rel=\"last\""),
              std::string::npos);
}

TEST_F(PaginationTest, Headers_Complete) {
    auto headers = common::completeHeaders(12);
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(header(headers, "X-Total-Items"), "12");
}

// --- ApiError ---

TEST_F(PaginationTest, ApiError_Json) {
    Json::Value body = ApiError::badRequest("Invalid tag type").toJson();
    EXPECT_EQ(body["error"]["code"].asInt(), 400);
    EXPECT_EQ(body["error"]["reason"].asString(), "Bad Request");
    EXPECT_EQ(body["error"]["description"].asString(), "Invalid tag type");

    Json::Value notFound = ApiError::notFound().toJson();
    EXPECT_EQ(notFound["error"]["reason"].asString(), "Not found");
    EXPECT_TRUE(notFound["error"]["description"].isNull());
}

TEST_F(PaginationTest, ApiError_Reasons) {
    EXPECT_EQ(ApiError::reasonFor(401), "Unauthorized");
    EXPECT_EQ(ApiError::reasonFor(500), "Internal Server Error");
}

TEST_F(PaginationTest, ApiError_FromException) {
    EXPECT_EQ(ApiError::fromException(common::NotFoundException()).code(), 404);
    EXPECT_FALSE(ApiError::fromException(common::NotFoundException()).description().has_value());

    auto bad = ApiError::fromException(common::DeserializationException("Missing field 'order'"));
    EXPECT_EQ(bad.code(), 400);
    EXPECT_EQ(bad.description(), std::optional<std::string>("Missing field 'order'"));

    EXPECT_EQ(ApiError::fromException(common::TokenException("Token expired")).code(), 401);
    EXPECT_EQ(ApiError::fromException(common::InternalException("broken")).code(), 500);
    EXPECT_EQ(ApiError::fromException(std::runtime_error("boom")).code(), 500);
    EXPECT_EQ(ApiError::fromException(ApiError::unauthorized("x")).code(), 401);
}
