#pragma once

#include <array>

namespace progress::db::sql {

/*
  Bootstrap DDL per backend. Every statement is idempotent.

  Both backends share table and column names so the repositories
  differ only in placeholder syntax and type casts.
*/

static constexpr std::array<const char*, 17> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS items ("
    " id TEXT PRIMARY KEY, project_id TEXT NOT NULL, item_type TEXT NOT NULL, identity_key TEXT NOT NULL,"
    " budgeted_hours REAL NOT NULL CHECK(budgeted_hours >= 0), percent_complete REAL NOT NULL, earned_hours REAL NOT NULL,"
    " milestones TEXT NOT NULL, template_default_version INTEGER NOT NULL, template_override_version INTEGER NOT NULL,"
    " area_id TEXT NOT NULL DEFAULT '', system_id TEXT NOT NULL DEFAULT '', test_package_id TEXT NOT NULL DEFAULT '',"
    " drawing_id TEXT NOT NULL DEFAULT '', welder_id TEXT NOT NULL DEFAULT '',"
    " retired INTEGER NOT NULL DEFAULT 0, retire_reason TEXT NOT NULL DEFAULT '',"
    " created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, updated_by TEXT NOT NULL DEFAULT '',"
    " UNIQUE(project_id, item_type, identity_key));",

    "CREATE INDEX IF NOT EXISTS items_project_type ON items(project_id, item_type);",

    // rollup groups and dimension-scoped event scans start from these
    "CREATE INDEX IF NOT EXISTS items_project_area ON items(project_id, area_id);",
    "CREATE INDEX IF NOT EXISTS items_project_system ON items(project_id, system_id);",
    "CREATE INDEX IF NOT EXISTS items_project_test_package ON items(project_id, test_package_id);",
    "CREATE INDEX IF NOT EXISTS items_project_welder ON items(project_id, welder_id);",

    "CREATE TABLE IF NOT EXISTS milestone_templates ("
    " project_id TEXT, item_type TEXT NOT NULL, milestone_name TEXT NOT NULL,"
    " weight REAL NOT NULL CHECK(weight >= 0 AND weight <= 100), kind TEXT NOT NULL, category TEXT NOT NULL,"
    " sort_order INTEGER NOT NULL, version INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, updated_by TEXT NOT NULL DEFAULT '');",

    "CREATE UNIQUE INDEX IF NOT EXISTS milestone_templates_key"
    " ON milestone_templates(COALESCE(project_id, ''), item_type, lower(milestone_name));",

    "CREATE TABLE IF NOT EXISTS template_changes ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT, change_id TEXT NOT NULL UNIQUE, project_id TEXT, item_type TEXT NOT NULL,"
    " old_entries TEXT NOT NULL, new_entries TEXT NOT NULL, actor TEXT NOT NULL, changed_at_ms INTEGER NOT NULL,"
    " recalculated_items INTEGER NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS milestone_events ("
    " seq INTEGER PRIMARY KEY AUTOINCREMENT, event_id TEXT NOT NULL UNIQUE, project_id TEXT NOT NULL,"
    " item_id TEXT NOT NULL REFERENCES items(id), milestone_name TEXT NOT NULL,"
    " previous_value REAL NOT NULL, new_value REAL NOT NULL, actor TEXT NOT NULL, created_at_ms INTEGER NOT NULL,"
    " kind TEXT NOT NULL, corrects_seq INTEGER, reason TEXT NOT NULL DEFAULT '');",

    "CREATE INDEX IF NOT EXISTS milestone_events_item ON milestone_events(item_id, milestone_name, created_at_ms);",

    "CREATE INDEX IF NOT EXISTS milestone_events_project_time ON milestone_events(project_id, created_at_ms);",

    "CREATE INDEX IF NOT EXISTS milestone_events_item_time ON milestone_events(item_id, created_at_ms);",

    "CREATE TRIGGER IF NOT EXISTS milestone_events_no_update BEFORE UPDATE ON milestone_events"
    " BEGIN SELECT RAISE(ABORT, 'milestone_events is append-only'); END;",

    "CREATE TRIGGER IF NOT EXISTS milestone_events_no_delete BEFORE DELETE ON milestone_events"
    " BEGIN SELECT RAISE(ABORT, 'milestone_events is append-only'); END;",

    "CREATE TABLE IF NOT EXISTS dimension_rollups ("
    " project_id TEXT NOT NULL, dimension TEXT NOT NULL, dimension_value TEXT NOT NULL,"
    " item_count INTEGER NOT NULL, budgeted_hours REAL NOT NULL, earned_hours REAL NOT NULL,"
    " receive_budget REAL NOT NULL, install_budget REAL NOT NULL, punch_budget REAL NOT NULL,"
    " test_budget REAL NOT NULL, restore_budget REAL NOT NULL,"
    " receive_earned REAL NOT NULL, install_earned REAL NOT NULL, punch_earned REAL NOT NULL,"
    " test_earned REAL NOT NULL, restore_earned REAL NOT NULL, refreshed_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY(project_id, dimension, dimension_value));",

    "CREATE TABLE IF NOT EXISTS dimensions ("
    " project_id TEXT NOT NULL, dimension TEXT NOT NULL, id TEXT NOT NULL, name TEXT NOT NULL,"
    " updated_at_ms INTEGER NOT NULL, PRIMARY KEY(project_id, dimension, id));",
};

static constexpr std::array<const char*, 18> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS items ("
    " id TEXT PRIMARY KEY, project_id TEXT NOT NULL, item_type TEXT NOT NULL, identity_key TEXT NOT NULL,"
    " budgeted_hours DOUBLE PRECISION NOT NULL CHECK(budgeted_hours >= 0), percent_complete DOUBLE PRECISION NOT NULL,"
    " earned_hours DOUBLE PRECISION NOT NULL, milestones JSONB NOT NULL,"
    " template_default_version BIGINT NOT NULL, template_override_version BIGINT NOT NULL,"
    " area_id TEXT NOT NULL DEFAULT '', system_id TEXT NOT NULL DEFAULT '', test_package_id TEXT NOT NULL DEFAULT '',"
    " drawing_id TEXT NOT NULL DEFAULT '', welder_id TEXT NOT NULL DEFAULT '',"
    " retired BOOLEAN NOT NULL DEFAULT FALSE, retire_reason TEXT NOT NULL DEFAULT '',"
    " created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, updated_by TEXT NOT NULL DEFAULT '',"
    " UNIQUE(project_id, item_type, identity_key));",

    "CREATE INDEX IF NOT EXISTS items_project_type ON items(project_id, item_type);",

    // rollup groups and dimension-scoped event scans start from these
    "CREATE INDEX IF NOT EXISTS items_project_area ON items(project_id, area_id);",
    "CREATE INDEX IF NOT EXISTS items_project_system ON items(project_id, system_id);",
    "CREATE INDEX IF NOT EXISTS items_project_test_package ON items(project_id, test_package_id);",
    "CREATE INDEX IF NOT EXISTS items_project_welder ON items(project_id, welder_id);",

    "CREATE TABLE IF NOT EXISTS milestone_templates ("
    " project_id TEXT, item_type TEXT NOT NULL, milestone_name TEXT NOT NULL,"
    " weight DOUBLE PRECISION NOT NULL CHECK(weight >= 0 AND weight <= 100), kind TEXT NOT NULL, category TEXT NOT NULL,"
    " sort_order INTEGER NOT NULL, version BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, updated_by TEXT NOT NULL DEFAULT '');",

    "CREATE UNIQUE INDEX IF NOT EXISTS milestone_templates_key"
    " ON milestone_templates(COALESCE(project_id, ''), item_type, lower(milestone_name));",

    "CREATE TABLE IF NOT EXISTS template_changes ("
    " seq BIGSERIAL PRIMARY KEY, change_id TEXT NOT NULL UNIQUE, project_id TEXT, item_type TEXT NOT NULL,"
    " old_entries JSONB NOT NULL, new_entries JSONB NOT NULL, actor TEXT NOT NULL, changed_at_ms BIGINT NOT NULL,"
    " recalculated_items BIGINT NOT NULL DEFAULT 0);",

    "CREATE TABLE IF NOT EXISTS milestone_events ("
    " seq BIGSERIAL PRIMARY KEY, event_id TEXT NOT NULL UNIQUE, project_id TEXT NOT NULL,"
    " item_id TEXT NOT NULL REFERENCES items(id), milestone_name TEXT NOT NULL,"
    " previous_value DOUBLE PRECISION NOT NULL, new_value DOUBLE PRECISION NOT NULL, actor TEXT NOT NULL,"
    " created_at_ms BIGINT NOT NULL, kind TEXT NOT NULL, corrects_seq BIGINT, reason TEXT NOT NULL DEFAULT '');",

    "CREATE INDEX IF NOT EXISTS milestone_events_item ON milestone_events(item_id, milestone_name, created_at_ms);",

    "CREATE INDEX IF NOT EXISTS milestone_events_project_time ON milestone_events(project_id, created_at_ms);",

    "CREATE INDEX IF NOT EXISTS milestone_events_item_time ON milestone_events(item_id, created_at_ms);",

    "CREATE OR REPLACE FUNCTION progress_reject_event_mutation() RETURNS trigger LANGUAGE plpgsql AS"
    " $$ BEGIN RAISE EXCEPTION 'milestone_events is append-only'; END $$;",

    "DROP TRIGGER IF EXISTS milestone_events_append_only ON milestone_events;",

    "CREATE TRIGGER milestone_events_append_only BEFORE UPDATE OR DELETE ON milestone_events"
    " FOR EACH ROW EXECUTE FUNCTION progress_reject_event_mutation();",

    "CREATE TABLE IF NOT EXISTS dimension_rollups ("
    " project_id TEXT NOT NULL, dimension TEXT NOT NULL, dimension_value TEXT NOT NULL,"
    " item_count BIGINT NOT NULL, budgeted_hours DOUBLE PRECISION NOT NULL, earned_hours DOUBLE PRECISION NOT NULL,"
    " receive_budget DOUBLE PRECISION NOT NULL, install_budget DOUBLE PRECISION NOT NULL, punch_budget DOUBLE PRECISION NOT NULL,"
    " test_budget DOUBLE PRECISION NOT NULL, restore_budget DOUBLE PRECISION NOT NULL,"
    " receive_earned DOUBLE PRECISION NOT NULL, install_earned DOUBLE PRECISION NOT NULL, punch_earned DOUBLE PRECISION NOT NULL,"
    " test_earned DOUBLE PRECISION NOT NULL, restore_earned DOUBLE PRECISION NOT NULL, refreshed_at_ms BIGINT NOT NULL,"
    " PRIMARY KEY(project_id, dimension, dimension_value));",

    "CREATE TABLE IF NOT EXISTS dimensions ("
    " project_id TEXT NOT NULL, dimension TEXT NOT NULL, id TEXT NOT NULL, name TEXT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL, PRIMARY KEY(project_id, dimension, id));",
};

} // namespace progress::db::sql
