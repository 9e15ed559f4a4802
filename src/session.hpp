#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

// ---------------------------------------------------------------------------
// Flat, ordered key/value record of everything needed to reproduce a frame:
// active fractal, its parameters, quality settings and the viewport target.
// ---------------------------------------------------------------------------
using SessionValue = std::variant<double, bool, std::string>;

struct SessionSnapshot {
    std::vector<std::pair<std::string, SessionValue>> entries;

    // Replaces an existing key in place, otherwise appends.
    void set(const std::string& key, SessionValue v);

    const SessionValue* find(const std::string& key) const;

    // Typed lookups; false when the key is missing or holds another type.
    bool get(const std::string& key, double& out) const;
    bool get(const std::string& key, bool& out) const;
    bool get(const std::string& key, std::string& out) const;
};

// JSON object text, keys in snapshot order.
std::string session_to_json(const SessionSnapshot& snap, int indent = 2);

// Returns "" on success, otherwise an error message. Keys whose values are
// not numbers, booleans or strings are skipped.
std::string session_from_json(const std::string& text, SessionSnapshot& out);

// Both return "" on success, otherwise an error message.
std::string write_session_file(const std::string& path, const SessionSnapshot& snap);
std::string read_session_file(const std::string& path, SessionSnapshot& out);

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
std::string utc_timestamp();

// Local time as "YYYYMMDD_HHMMSS", for file names.
std::string file_timestamp();
