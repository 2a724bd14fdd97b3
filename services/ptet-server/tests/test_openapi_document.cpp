/**
 * @file test_openapi_document.cpp
 * @brief Sanity checks for the generated OpenAPI document
 */

#include <gtest/gtest.h>
#include "../src/handlers/openapi_document.h"

class OpenApiDocumentTest : public ::testing::Test {
protected:
    Json::Value doc = handlers::buildOpenApiDocument("1.2.3");
};

TEST_F(OpenApiDocumentTest, Header) {
    EXPECT_EQ(doc["openapi"].asString(), "3.0.0");
    EXPECT_EQ(doc["info"]["version"].asString(), "1.2.3");
    EXPECT_EQ(doc["servers"][0]["url"].asString(), "/api/v1");
    EXPECT_EQ(doc["components"]["securitySchemes"]["bearer"]["scheme"].asString(), "bearer");
}

TEST_F(OpenApiDocumentTest, AllRoutesDescribed) {
    const Json::Value& paths = doc["paths"];
    EXPECT_EQ(paths.size(), 10u);
    for (const char* method : {"get", "put", "delete"}) {
        EXPECT_TRUE(paths["/ride/{id}"].isMember(method)) << method;
        EXPECT_TRUE(paths["/tag/{id}"].isMember(method)) << method;
        EXPECT_TRUE(paths["/tag_option/{id}"].isMember(method)) << method;
        EXPECT_TRUE(paths["/ride_tag/{link_id}"].isMember(method)) << method;
    }
    EXPECT_TRUE(paths["/ride/{ride_id}/ride_tags/{tag_id}"].isMember("post"));
}

TEST_F(OpenApiDocumentTest, SchemaReferencesResolve) {
    const Json::Value& schemas = doc["components"]["schemas"];
    for (const char* name : {"User", "Ride", "Tag", "TagOption", "RideTagLink", "RideTagGetReturn"}) {
        EXPECT_TRUE(schemas.isMember(name)) << name;
    }
}
