/**
 * @file migrations.cpp
 * @brief DDL of the expense tracker schema
 *
 * Timestamps are RFC 3339 UTC text. Soft-deleted rows keep their data and
 * carry a non-NULL deleted_at.
 */

#include "migrations.h"

namespace infrastructure {

std::vector<common::Migration> ptetMigrations() {
    return {
        {"m20250323_195423_ride", R"SQL(
CREATE TABLE IF NOT EXISTS "user" (
    id          INTEGER PRIMARY KEY AUTOINCREMENT,
    jwt_issuer  TEXT NOT NULL,
    jwt_subject TEXT NOT NULL,
    name        TEXT NULL,
    UNIQUE (jwt_issuer, jwt_subject)
);

CREATE TABLE IF NOT EXISTS ride (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    created_at        TEXT NOT NULL,
    updated_at        TEXT NOT NULL,
    deleted_at        TEXT NULL,
    user_id           INTEGER NOT NULL
                      REFERENCES "user" (id) ON DELETE RESTRICT ON UPDATE RESTRICT,
    journey_departure TEXT NOT NULL,
    journey_arrival   TEXT NULL,
    location_from     TEXT NOT NULL,
    location_to       TEXT NOT NULL,
    remarks           TEXT NULL,
    is_template       BOOLEAN NOT NULL DEFAULT 0
);

CREATE INDEX IF NOT EXISTS idx_ride_user ON ride (user_id, deleted_at);
)SQL"},

        {"m20250323_220823_tag_descriptor", R"SQL(
CREATE TABLE IF NOT EXISTS tag_descriptor (
    id         INTEGER PRIMARY KEY AUTOINCREMENT,
    created_at TEXT NOT NULL,
    updated_at TEXT NOT NULL,
    deleted_at TEXT NULL,
    user_id    INTEGER NOT NULL
               REFERENCES "user" (id) ON DELETE RESTRICT ON UPDATE RESTRICT,
    tag_type   TEXT NOT NULL,
    tag_key    TEXT NOT NULL,
    tag_name   TEXT NULL,
    uuid       TEXT NOT NULL,
    unit       TEXT NULL,
    remarks    TEXT NULL
);

CREATE INDEX IF NOT EXISTS idx_tag_descriptor_user ON tag_descriptor (user_id, deleted_at);
)SQL"},

        {"m20250323_224215_ride_tag", R"SQL(
CREATE TABLE IF NOT EXISTS ride_tag (
    id                   INTEGER PRIMARY KEY AUTOINCREMENT,
    created_at           TEXT NOT NULL,
    updated_at           TEXT NOT NULL,
    deleted_at           TEXT NULL,
    ride_id              INTEGER NOT NULL
                         REFERENCES ride (id) ON DELETE CASCADE ON UPDATE CASCADE,
    tag_descriptor_id    INTEGER NOT NULL
                         REFERENCES tag_descriptor (id) ON DELETE CASCADE ON UPDATE CASCADE,
    "order"              INTEGER NOT NULL DEFAULT 0,
    value_integer        INTEGER NULL,
    value_float          REAL NULL,
    value_string         TEXT NULL,
    value_date_time      TEXT NULL,
    value_enum_option_id INTEGER NULL
                         REFERENCES tag_enum_option (id) ON DELETE RESTRICT ON UPDATE RESTRICT,
    remarks              TEXT NULL
);

CREATE INDEX IF NOT EXISTS idx_ride_tag_ride ON ride_tag (ride_id, deleted_at);
)SQL"},

        {"m20250323_230053_tag_enum_option", R"SQL(
CREATE TABLE IF NOT EXISTS tag_enum_option (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    created_at        TEXT NOT NULL,
    updated_at        TEXT NOT NULL,
    deleted_at        TEXT NULL,
    tag_descriptor_id INTEGER NOT NULL
                      REFERENCES tag_descriptor (id) ON DELETE CASCADE ON UPDATE CASCADE,
    "order"           INTEGER NOT NULL DEFAULT 0,
    value             TEXT NOT NULL,
    uuid              TEXT NOT NULL,
    name              TEXT NULL
);

CREATE INDEX IF NOT EXISTS idx_tag_enum_option_tag ON tag_enum_option (tag_descriptor_id, deleted_at);
)SQL"},
    };
}

} // namespace infrastructure
