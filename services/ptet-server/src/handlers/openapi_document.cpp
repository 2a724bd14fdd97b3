/**
 * @file openapi_document.cpp
 * @brief Hand-maintained OpenAPI 3 document
 *
 * Keep in step with the routes registered by the handlers.
 */

#include "openapi_document.h"
#include <initializer_list>
#include <utility>

namespace handlers {

namespace {

Json::Value ref(const std::string& schema) {
    Json::Value v;
    v["$ref"] = "#/components/schemas/" + schema;
    return v;
}

Json::Value typed(const char* type, const char* format = nullptr, bool nullable = false) {
    Json::Value v;
    v["type"] = type;
    if (format) {
        v["format"] = format;
    }
    if (nullable) {
        v["nullable"] = true;
    }
    return v;
}

Json::Value arrayOf(const Json::Value& items) {
    Json::Value v;
    v["type"] = "array";
    v["items"] = items;
    return v;
}

Json::Value object(std::initializer_list<std::pair<const char*, Json::Value>> properties,
                   std::initializer_list<const char*> required) {
    Json::Value v;
    v["type"] = "object";
    for (const auto& [name, schema] : properties) {
        v["properties"][name] = schema;
    }
    Json::Value req(Json::arrayValue);
    for (const char* name : required) {
        req.append(name);
    }
    v["required"] = req;
    return v;
}

Json::Value jsonContent(const Json::Value& schema) {
    Json::Value v;
    v["application/json"]["schema"] = schema;
    return v;
}

Json::Value pathParam(const char* name) {
    Json::Value p;
    p["name"] = name;
    p["in"] = "path";
    p["required"] = true;
    p["schema"] = typed("integer", "uint32");
    return p;
}

Json::Value queryParam(const char* name, const char* description) {
    Json::Value p;
    p["name"] = name;
    p["in"] = "query";
    p["required"] = false;
    p["description"] = description;
    p["schema"] = typed("integer", "uint64");
    return p;
}

struct OperationSpec {
    const char* tag;
    const char* summary;
    std::initializer_list<const char*> pathParams;
    const char* requestSchema;     ///< nullptr: no body
    Json::Value okResponse;        ///< null: 204
    bool paged;
    bool write;
};

Json::Value errorResponses(const OperationSpec& spec) {
    Json::Value responses;
    auto error = [](const char* description) {
        Json::Value r;
        r["description"] = description;
        r["content"] = jsonContent(ref("ApiError"));
        return r;
    };
    responses["401"] = error(spec.write ? "Missing, invalid or read-only token" : "Missing or invalid token");
    responses["404"] = error("Resource not found or not owned by the caller");
    if (spec.requestSchema || spec.paged) {
        responses["400"] = error("Invalid request");
    }
    responses["500"] = error("Internal Server Error");
    return responses;
}

Json::Value operation(const OperationSpec& spec) {
    Json::Value op;
    op["tags"].append(spec.tag);
    op["summary"] = spec.summary;

    Json::Value security;
    security["bearer"] = Json::Value(Json::arrayValue);
    op["security"].append(security);

    Json::Value params(Json::arrayValue);
    for (const char* name : spec.pathParams) {
        params.append(pathParam(name));
    }
    if (spec.paged) {
        params.append(queryParam("page", "0-based page number (requires size)"));
        params.append(queryParam("size", "Items per page (requires page)"));
    }
    if (!params.empty()) {
        op["parameters"] = params;
    }

    if (spec.requestSchema) {
        op["requestBody"]["required"] = true;
        op["requestBody"]["content"] = jsonContent(ref(spec.requestSchema));
    }

    Json::Value responses = errorResponses(spec);
    if (spec.okResponse.isNull()) {
        responses["204"]["description"] = "No Content";
    } else {
        responses["200"]["description"] = "OK";
        responses["200"]["content"] = jsonContent(spec.okResponse);
        if (spec.paged) {
            for (const char* header : {"X-Total-Items", "X-Page", "X-Page-Size", "X-Total-pages"}) {
                responses["200"]["headers"][header]["schema"] = typed("integer");
            }
            responses["200"]["headers"]["Link"]["schema"] = typed("string");
        }
    }
    op["responses"] = responses;
    return op;
}

Json::Value schemas() {
    Json::Value s;

    s["ApiError"] = object({
        {"error", object({
            {"code", typed("integer", "uint16")},
            {"reason", typed("string")},
            {"description", typed("string", nullptr, true)},
        }, {"code", "reason"})},
    }, {"error"});

    s["User"] = object({
        {"id", typed("integer", "uint32")},
        {"jwt_issuer", typed("string")},
        {"jwt_subject", typed("string")},
        {"name", typed("string", nullptr, true)},
    }, {"id", "jwt_issuer", "jwt_subject"});

    s["UserUpdate"] = object({
        {"name", typed("string", nullptr, true)},
    }, {});

    Json::Value valueType = typed("string");
    for (const char* t : {"Integer", "Float", "String", "DateTime", "EnumOption"}) {
        valueType["enum"].append(t);
    }
    Json::Value valueValue;
    valueValue["description"] = "integer, number, string, RFC 3339 date-time or option id, by type";
    s["RideTagValue"] = object({
        {"type", valueType},
        {"value", valueValue},
    }, {"type", "value"});

    s["RideTagLink"] = object({
        {"id", typed("integer", "uint32")},
        {"ride_id", typed("integer", "uint32")},
        {"tag_id", typed("integer", "uint32")},
        {"order", typed("integer", "uint32")},
        {"value", ref("RideTagValue")},
        {"remarks", typed("string", nullptr, true)},
    }, {"order", "value"});

    s["Ride"] = object({
        {"id", typed("integer", "uint32")},
        {"journey_departure", typed("string", "date-time")},
        {"journey_arrival", typed("string", "date-time", true)},
        {"location_from", typed("string")},
        {"location_to", typed("string")},
        {"remarks", typed("string", nullptr, true)},
        {"is_template", typed("boolean")},
        {"tags", arrayOf(ref("RideTagLink"))},
    }, {"journey_departure", "location_from", "location_to", "is_template"});

    s["TagOption"] = object({
        {"id", typed("integer", "uint32")},
        {"tag_id", typed("integer", "uint32")},
        {"order", typed("integer", "uint32")},
        {"value", typed("string")},
        {"uuid", typed("string", "uuid")},
        {"name", typed("string", nullptr, true)},
        {"display_name", typed("string")},
    }, {"order", "value"});

    Json::Value tagType = typed("string");
    for (const char* t : {"integer", "float", "string", "enum", "date_time"}) {
        tagType["enum"].append(t);
    }
    Json::Value options = arrayOf(ref("TagOption"));
    options["nullable"] = true;
    s["Tag"] = object({
        {"id", typed("integer", "uint32")},
        {"tag_type", tagType},
        {"tag_key", typed("string")},
        {"tag_name", typed("string", nullptr, true)},
        {"tag_display_name", typed("string")},
        {"uuid", typed("string", "uuid")},
        {"unit", typed("string", nullptr, true)},
        {"remarks", typed("string", nullptr, true)},
        {"options", options},
    }, {"tag_type", "tag_key"});

    s["RideTagGetReturn"] = object({
        {"link", ref("RideTagLink")},
        {"tag", ref("Tag")},
    }, {"link", "tag"});

    return s;
}

} // namespace

Json::Value buildOpenApiDocument(const std::string& version) {
    Json::Value doc;
    doc["openapi"] = "3.0.0";
    doc["info"]["title"] = "Public Transport Expense Tracker";
    doc["info"]["version"] = version;

    Json::Value server;
    server["url"] = "/api/v1";
    doc["servers"].append(server);

    doc["components"]["schemas"] = schemas();
    doc["components"]["securitySchemes"]["bearer"]["type"] = "http";
    doc["components"]["securitySchemes"]["bearer"]["scheme"] = "bearer";
    doc["components"]["securitySchemes"]["bearer"]["bearerFormat"] = "JWT";

    const Json::Value none;
    Json::Value& paths = doc["paths"];

    paths["/user"]["get"] = operation({"User", "Current user", {}, nullptr, ref("User"), false, false});
    paths["/user"]["put"] = operation({"User", "Set the display name", {}, "UserUpdate", none, false, true});

    paths["/ride"]["get"] = operation({"Ride", "List rides", {}, nullptr, arrayOf(ref("Ride")), true, false});
    paths["/ride"]["post"] = operation({"Ride", "Create ride", {}, "Ride", ref("Ride"), false, true});
    paths["/ride/{id}"]["get"] = operation({"Ride", "Get ride", {"id"}, nullptr, ref("Ride"), false, false});
    paths["/ride/{id}"]["put"] = operation({"Ride", "Update ride", {"id"}, "Ride", none, false, true});
    paths["/ride/{id}"]["delete"] = operation({"Ride", "Delete ride", {"id"}, nullptr, none, false, true});

    paths["/ride/{ride_id}/ride_tags"]["get"] = operation(
        {"Ride", "List tag values of a ride", {"ride_id"}, nullptr, arrayOf(ref("RideTagGetReturn")), true, false});
    paths["/ride/{ride_id}/ride_tags/{tag_id}"]["get"] = operation(
        {"Ride", "Get the value of a tag on a ride", {"ride_id", "tag_id"}, nullptr, ref("RideTagGetReturn"), false, false});
    paths["/ride/{ride_id}/ride_tags/{tag_id}"]["post"] = operation(
        {"Ride", "Attach a tag value to a ride", {"ride_id", "tag_id"}, "RideTagLink", ref("RideTagLink"), false, true});
    paths["/ride_tag/{link_id}"]["get"] = operation(
        {"Ride", "Get tag value by link id", {"link_id"}, nullptr, ref("RideTagGetReturn"), false, false});
    paths["/ride_tag/{link_id}"]["put"] = operation(
        {"Ride", "Update tag value", {"link_id"}, "RideTagLink", none, false, true});
    paths["/ride_tag/{link_id}"]["delete"] = operation(
        {"Ride", "Remove tag value", {"link_id"}, nullptr, none, false, true});

    paths["/tag"]["get"] = operation({"Tag", "List tags", {}, nullptr, arrayOf(ref("Tag")), true, false});
    paths["/tag"]["post"] = operation({"Tag", "Create tag", {}, "Tag", ref("Tag"), false, true});
    paths["/tag/{id}"]["get"] = operation({"Tag", "Get tag", {"id"}, nullptr, ref("Tag"), false, false});
    paths["/tag/{id}"]["put"] = operation({"Tag", "Update tag", {"id"}, "Tag", none, false, true});
    paths["/tag/{id}"]["delete"] = operation({"Tag", "Delete tag", {"id"}, nullptr, none, false, true});

    paths["/tag/{tag_id}/tag_option"]["get"] = operation(
        {"Tag", "List options of an enum tag", {"tag_id"}, nullptr, arrayOf(ref("TagOption")), true, false});
    paths["/tag/{tag_id}/tag_option"]["post"] = operation(
        {"Tag", "Create option", {"tag_id"}, "TagOption", ref("TagOption"), false, true});
    paths["/tag_option/{id}"]["get"] = operation({"Tag", "Get option", {"id"}, nullptr, ref("TagOption"), false, false});
    paths["/tag_option/{id}"]["put"] = operation({"Tag", "Update option", {"id"}, "TagOption", none, false, true});
    paths["/tag_option/{id}"]["delete"] = operation({"Tag", "Delete option", {"id"}, nullptr, none, false, true});

    return doc;
}

} // namespace handlers
