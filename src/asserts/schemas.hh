/* ========================================================================== *
 *
 * @file asserts/schemas.hh
 *
 * @brief SQL Schemas to initialize an assertions database.
 *
 *
 * -------------------------------------------------------------------------- */

#pragma once

/* -------------------------------------------------------------------------- */

namespace seedkit::asserts {

/* -------------------------------------------------------------------------- */

/* Holds metadata information about schema versions. */
static const char * sql_versions = R"SQL(
CREATE TABLE IF NOT EXISTS DbVersions (
  name     TEXT NOT NULL PRIMARY KEY
, version  TEXT NOT NULL
)
)SQL";


/* -------------------------------------------------------------------------- */

/* `primaryKey' is the JSON list of primary key header values. */
static const char * sql_assertions = R"SQL(
CREATE TABLE IF NOT EXISTS Assertions (
  type         TEXT NOT NULL
, primaryKey   JSON NOT NULL
, authorityId  TEXT NOT NULL
, headers      JSON NOT NULL
, CONSTRAINT UC_Assertions UNIQUE ( type, primaryKey )
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_Assertions
  ON Assertions ( type, primaryKey );

CREATE TRIGGER IF NOT EXISTS IT_SnapRevisions AFTER INSERT ON Assertions
  WHEN ( NEW.type = 'snap-revision' ) AND
       ( ( SELECT COUNT( primaryKey ) FROM Assertions
           WHERE ( type = 'snap-declaration' )
             AND ( json_extract( primaryKey, '$[0]' )
                   = json_extract( NEW.headers, '$."snap-id"' ) )
         ) < 1
       )
  BEGIN
    SELECT RAISE( ABORT, 'No snap-declaration for snap-revision.' );
  END
)SQL";


/* -------------------------------------------------------------------------- */

}  // namespace seedkit::asserts


/* -------------------------------------------------------------------------- *
 *
 *
 *
 * ========================================================================== */
