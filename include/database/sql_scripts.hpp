#pragma once

#include <string>

namespace DatabaseScripts
{
    // Relational summary store
    const std::string CREATE_DETECTION_RESULTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS detection_results (
            reference_key TEXT PRIMARY KEY,
            upload_reference TEXT NOT NULL,
            is_ai_generated INTEGER NOT NULL,
            confidence_score REAL NOT NULL,
            algorithm_version TEXT NOT NULL,
            processing_time_ms REAL NOT NULL DEFAULT 0,
            result_summary TEXT,
            created_at TEXT NOT NULL
        )
    )";

    const std::string CREATE_METHOD_RESULTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS method_results (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            reference_key TEXT NOT NULL REFERENCES detection_results(reference_key),
            method_name TEXT NOT NULL,
            status TEXT NOT NULL,
            score REAL,
            reason TEXT,
            processing_time_ms REAL NOT NULL DEFAULT 0
        )
    )";

    const std::string CREATE_SUMMARY_INDEXES = R"(
        CREATE INDEX IF NOT EXISTS idx_detection_results_upload ON detection_results(upload_reference, created_at);
        CREATE INDEX IF NOT EXISTS idx_method_results_reference ON method_results(reference_key);
    )";

    // Document store holding nested per-method detail
    const std::string CREATE_DETECTION_DOCUMENTS_TABLE = R"(
        CREATE TABLE IF NOT EXISTS detection_documents (
            reference_key TEXT PRIMARY KEY,
            document TEXT NOT NULL,
            written_at TEXT NOT NULL
        )
    )";
}
